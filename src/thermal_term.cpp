#include "thermal_term.hpp"
#include "eos_errors.hpp"

#include <cmath>
#include <sstream>

void checkTemperatureDomain(double temperature, double T_0) {
  if (!(temperature > 0.0) || !(T_0 > 0.0)) {
    std::ostringstream msg;
    msg << "Temperature must be positive (T = " << temperature << " K, T_0 = " << T_0 << " K)";
    throw DomainError(msg.str());
  }
}

double grueneisenParameter(double volume, const ParameterSet &params) {
  return params.get("grueneisen_0") * std::pow(volume / params.get("V_0"), params.get("q_0"));
}

double thermalPressureIntegral(double volume, const ParameterSet &params) {
  const double Cv = params.get("Cv");
  const double gamma_0 = params.get("grueneisen_0");
  const double q_0 = params.get("q_0");
  const double x = volume / params.get("V_0");

  if (q_0 == 0.0) {
    return Cv * gamma_0 * std::log(x);
  }
  return Cv * gamma_0 / q_0 * (std::pow(x, q_0) - 1.0);
}

double thermalFreeEnergy(double temperature, double volume, const ParameterSet &params) {
  const double T_0 = params.get("T_0");
  checkTemperatureDomain(temperature, T_0);

  const double dT = temperature - T_0;
  const double Cv = params.get("Cv");

  return -params.get("S_0") * dT - Cv * (temperature * std::log(temperature / T_0) - dT) -
         thermalPressureIntegral(volume, params) * dT;
}

double thermalEntropy(double temperature, double volume, const ParameterSet &params) {
  const double T_0 = params.get("T_0");
  checkTemperatureDomain(temperature, T_0);

  return params.get("S_0") + thermalPressureIntegral(volume, params) +
         params.get("Cv") * std::log(temperature / T_0);
}
