/**
 * @file dks_solid_eos.hpp
 * @brief Finite-strain solid equation of state of de Koker & Stixrude (2013)
 *
 * The Helmholtz free energy of the solid is the sum of a fourth-order
 * Eulerian finite-strain compressive term and a thermal term with constant
 * heat capacity and a power-law Grueneisen parameter:
 * \f[
 * F(V, T) = E_0 - T_0 S_0 + F_{cmp}(V) + F_{th}(V, T)
 * \f]
 * Pressure is its negative volume derivative in closed form; volume at a
 * given pressure is obtained by numerical inversion (bracket search followed
 * by Brent refinement).
 *
 * Reference: de Koker, N. & Stixrude, L. (2013), supplementary materials.
 *
 * @example Basic Usage
 * ```cpp
 * ParameterSet params = readParameterFile("data/example_solid.csv");
 * DKSSolidEOS eos(params);
 *
 * double V = eos.volume(25e9, 2000.0);           // m^3/mol
 * double G = eos.gibbsFreeEnergy(25e9, 2000.0, V); // J/mol
 * ```
 *
 * @example Error Handling
 * ```cpp
 * VolumeSolution sol = eos.solveVolume(1e15, 300.0);
 * if (sol.status == SolveStatus::ROOT_NOT_BRACKETED) {
 *     // pressure outside the range of validity, skip this point
 * }
 * ```
 *
 * @note Bulk and shear moduli, thermal expansivity and C_P are not derived
 *       in this model. Their getters return 0 and isSupported() reports false.
 *
 * @date 2025-06-02
 */

#ifndef DKS_SOLID_EOS_HPP
#define DKS_SOLID_EOS_HPP

#include "eos_parameters.hpp"
#include "equation_of_state.hpp"
#include "root_finder.hpp"

#include <string>

/**
 * @brief Outcome of a non-throwing volume solve
 */
enum class SolveStatus {
  OK,                 ///< Root found within tolerance
  ROOT_NOT_BRACKETED, ///< Pressure outside the range of validity
  NON_CONVERGENCE,    ///< Brent iteration cap exhausted
  DOMAIN_ERROR,       ///< Numeric domain failure (e.g. T <= 0)
  MISSING_PARAMETER   ///< Parameter set lacks a required key
};

/**
 * @brief Result of DKSSolidEOS::solveVolume
 */
struct VolumeSolution {
  SolveStatus status = SolveStatus::OK;
  double volume = 0.0;   ///< m^3/mol, NaN unless status is OK
  int iterations = 0;    ///< Bracket steps plus Brent iterations
  std::string message;   ///< Error text, empty on success

  bool ok() const { return status == SolveStatus::OK; }
};

/**
 * @brief Convert a solve status to a string, e.g. "ROOT_NOT_BRACKETED"
 */
std::string solveStatusToString(SolveStatus status);

/**
 * @brief Finite-strain solid EOS bound to one validated parameter set
 */
class DKSSolidEOS : public EquationOfState {
public:
  /**
   * @brief Construct and validate
   * @param params Calibration constants; all eleven required keys must exist
   * @param settings Volume solver configuration
   * @throw MissingParameterError if a required key is absent
   * @throw std::invalid_argument if the solver settings are inconsistent
   */
  explicit DKSSolidEOS(ParameterSet params, SolverSettings settings = SolverSettings());

  /**
   * @brief Pressure at temperature T and volume V
   *
   * \f[ P = 3K_0(1+2f)^{5/2}\left(f + \frac{a_3 f^2}{2} + \frac{a_4 f^3}{6}\right)
   *        + C_V (T - T_0)\frac{\gamma(V)}{V} \f]
   */
  double pressure(double temperature, double volume) const override;

  /**
   * @brief Volume at pressure P and temperature T by numerical inversion
   *
   * Solves P - pressure(T, V) = 0 starting from V_0 with an initial bracket
   * step of 1e-2 V_0.
   *
   * @throw RootNotBracketedError if P is outside the range of validity
   * @throw NonConvergenceError if Brent refinement runs out of iterations
   * @throw DomainError if T <= 0, or on other numeric domain failures
   */
  double volume(double pressure, double temperature) const override;

  /**
   * @brief Non-throwing variant of volume()
   */
  VolumeSolution solveVolume(double pressure, double temperature) const;

  /** @brief gamma_0 (V/V_0)^q_0; pressure and temperature are not used */
  double grueneisenParameter(double pressure, double temperature, double volume) const override;

  /** @brief Not derived in this model, returns 0 */
  double isothermalBulkModulus(double pressure, double temperature, double volume) const override;

  /** @brief Not derived in this model, returns 0 */
  double adiabaticBulkModulus(double pressure, double temperature, double volume) const override;

  /** @brief Not derived in this model, returns 0 */
  double shearModulus(double pressure, double temperature, double volume) const override;

  /** @brief Constant C_V */
  double heatCapacityV(double pressure, double temperature, double volume) const override;

  /** @brief Not derived in this model, returns 0 */
  double heatCapacityP(double pressure, double temperature, double volume) const override;

  /** @brief Not derived in this model, returns 0 */
  double thermalExpansivity(double pressure, double temperature, double volume) const override;

  /** @brief S_0 + I(V) + C_V ln(T/T_0) */
  double entropy(double pressure, double temperature, double volume) const override;

  /** @brief E_0 - T_0 S_0 + F_cmp(V) + F_th(T, V) */
  double helmholtzFreeEnergy(double pressure, double temperature, double volume) const override;

  /** @brief F + PV */
  double gibbsFreeEnergy(double pressure, double temperature, double volume) const override;

  /** @brief F + TS */
  double internalEnergy(double pressure, double temperature, double volume) const override;

  /**
   * @brief F + TS + PV(P, T)
   *
   * The PV term uses volume(P, T), so each call runs a volume inversion.
   */
  double enthalpy(double pressure, double temperature, double volume) const override;

  bool isSupported(Property property) const override;

  std::string getType() const override { return "DKS solid"; }

  const ParameterSet &parameters() const { return params_; }
  const SolverSettings &settings() const { return settings_; }

private:
  ParameterSet params_;
  SolverSettings settings_;

  /** @internal @brief Bracket step relative to V_0 for the volume search */
  static constexpr double kBracketStepFraction = 1.e-2;

  /** @internal @brief Bracket and refine P - pressure(T, V) */
  RootResult invertPressure(double pressure, double temperature, int &bracket_steps) const;
};

#endif // DKS_SOLID_EOS_HPP
