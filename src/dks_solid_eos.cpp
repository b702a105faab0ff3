#include "dks_solid_eos.hpp"
#include "eos_errors.hpp"
#include "finite_strain.hpp"
#include "thermal_term.hpp"

#include <cmath>
#include <iostream>
#include <limits>
#include <stdexcept>
#include <utility>

std::string solveStatusToString(SolveStatus status) {
  switch (status) {
  case SolveStatus::OK:
    return "OK";
  case SolveStatus::ROOT_NOT_BRACKETED:
    return "ROOT_NOT_BRACKETED";
  case SolveStatus::NON_CONVERGENCE:
    return "NON_CONVERGENCE";
  case SolveStatus::DOMAIN_ERROR:
    return "DOMAIN_ERROR";
  case SolveStatus::MISSING_PARAMETER:
    return "MISSING_PARAMETER";
  default:
    throw std::invalid_argument("Unknown solve status");
  }
}

DKSSolidEOS::DKSSolidEOS(ParameterSet params, SolverSettings settings)
    : params_(std::move(params)), settings_(settings) {
  validateParameters(params_);
  validateSolverSettings(settings_);
}

double DKSSolidEOS::pressure(double temperature, double volume) const {
  return compressivePressure(volume, params_) + params_.get("Cv") * (temperature - params_.get("T_0")) *
                                                    grueneisenParameter(0.0, temperature, volume) / volume;
}

RootResult DKSSolidEOS::invertPressure(double pressure, double temperature, int &bracket_steps) const {
  checkTemperatureDomain(temperature, params_.get("T_0"));

  auto delta_pressure = [this, pressure, temperature](double x) {
    return pressure - this->pressure(temperature, x);
  };

  const double V_0 = params_.get("V_0");

  // Start from the reference volume with a conservative step
  Bracket bracket;
  try {
    bracket = bracketRoot(delta_pressure, V_0, kBracketStepFraction * V_0, settings_);
  } catch (const RootNotBracketedError &e) {
    throw RootNotBracketedError("Cannot find a volume, perhaps you are outside of the range of "
                                "validity for the equation of state? (P = " +
                                std::to_string(pressure) + " Pa, T = " + std::to_string(temperature) +
                                " K: " + e.what() + ")");
  }
  bracket_steps = bracket.iterations;

  if (settings_.debug_mode) {
    std::cout << "[volume] P = " << pressure << " Pa, T = " << temperature << " K, bracket [" << bracket.a
              << ", " << bracket.b << "] after " << bracket.iterations << " steps" << std::endl;
  }

  return brentRoot(delta_pressure, bracket, settings_);
}

double DKSSolidEOS::volume(double pressure, double temperature) const {
  int bracket_steps = 0;
  return invertPressure(pressure, temperature, bracket_steps).root;
}

VolumeSolution DKSSolidEOS::solveVolume(double pressure, double temperature) const {
  VolumeSolution solution;
  solution.volume = std::numeric_limits<double>::quiet_NaN();

  int bracket_steps = 0;
  try {
    RootResult root = invertPressure(pressure, temperature, bracket_steps);
    solution.volume = root.root;
    solution.iterations = bracket_steps + root.iterations;
    solution.status = SolveStatus::OK;
  } catch (const RootNotBracketedError &e) {
    solution.status = SolveStatus::ROOT_NOT_BRACKETED;
    solution.message = e.what();
  } catch (const NonConvergenceError &e) {
    solution.status = SolveStatus::NON_CONVERGENCE;
    solution.iterations = bracket_steps + e.iterations();
    solution.message = e.what();
  } catch (const DomainError &e) {
    solution.status = SolveStatus::DOMAIN_ERROR;
    solution.message = e.what();
  } catch (const MissingParameterError &e) {
    solution.status = SolveStatus::MISSING_PARAMETER;
    solution.message = e.what();
  }

  return solution;
}

double DKSSolidEOS::grueneisenParameter([[maybe_unused]] double pressure,
                                        [[maybe_unused]] double temperature, double volume) const {
  return ::grueneisenParameter(volume, params_);
}

double DKSSolidEOS::isothermalBulkModulus(double, double, double) const { return 0.; }

double DKSSolidEOS::adiabaticBulkModulus(double, double, double) const { return 0.; }

double DKSSolidEOS::shearModulus(double, double, double) const { return 0.; }

double DKSSolidEOS::heatCapacityV(double, double, double) const { return params_.get("Cv"); }

double DKSSolidEOS::heatCapacityP(double, double, double) const { return 0.; }

double DKSSolidEOS::thermalExpansivity(double, double, double) const { return 0.; }

double DKSSolidEOS::entropy([[maybe_unused]] double pressure, double temperature, double volume) const {
  return thermalEntropy(temperature, volume, params_);
}

double DKSSolidEOS::helmholtzFreeEnergy([[maybe_unused]] double pressure, double temperature,
                                        double volume) const {
  return params_.get("E_0") - params_.get("T_0") * params_.get("S_0") +
         compressiveFreeEnergy(volume, params_) + thermalFreeEnergy(temperature, volume, params_);
}

double DKSSolidEOS::gibbsFreeEnergy(double pressure, double temperature, double volume) const {
  return helmholtzFreeEnergy(pressure, temperature, volume) + pressure * volume;
}

double DKSSolidEOS::internalEnergy(double pressure, double temperature, double volume) const {
  return helmholtzFreeEnergy(pressure, temperature, volume) +
         temperature * entropy(pressure, temperature, volume);
}

double DKSSolidEOS::enthalpy(double pressure, double temperature, double volume) const {
  return helmholtzFreeEnergy(pressure, temperature, volume) +
         temperature * entropy(pressure, temperature, volume) +
         pressure * this->volume(pressure, temperature);
}

bool DKSSolidEOS::isSupported(Property property) const {
  switch (property) {
  case Property::ISOTHERMAL_BULK_MODULUS:
  case Property::ADIABATIC_BULK_MODULUS:
  case Property::SHEAR_MODULUS:
  case Property::HEAT_CAPACITY_P:
  case Property::THERMAL_EXPANSIVITY:
    return false;
  default:
    return true;
  }
}
