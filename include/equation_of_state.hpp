/**
 * @file equation_of_state.hpp
 * @brief Abstract interface of a solid-phase equation of state
 *
 * A mineral collaborator holds an EquationOfState and forwards pressure and
 * temperature queries to it. Every method takes the full state point
 * explicitly and none of them mutate the object, so one instance can be
 * queried from many threads at once.
 *
 * Units: SI throughout (Pa, K, m^3/mol, J/mol, J/K/mol).
 *
 * @date 2025-06-02
 */

#ifndef EQUATION_OF_STATE_HPP
#define EQUATION_OF_STATE_HPP

#include <string>
#include <vector>

/**
 * @brief Thermodynamic and elastic properties an EOS can report
 */
enum class Property {
  VOLUME,
  PRESSURE,
  GRUENEISEN_PARAMETER,
  HEAT_CAPACITY_V,
  HEAT_CAPACITY_P,
  ENTROPY,
  HELMHOLTZ_FREE_ENERGY,
  GIBBS_FREE_ENERGY,
  INTERNAL_ENERGY,
  ENTHALPY,
  ISOTHERMAL_BULK_MODULUS,
  ADIABATIC_BULK_MODULUS,
  SHEAR_MODULUS,
  THERMAL_EXPANSIVITY
};

/**
 * @brief Interface that all equation of state models implement
 */
class EquationOfState {
public:
  virtual ~EquationOfState() = default;

  /** @brief Pressure at (T, V) in Pa */
  virtual double pressure(double temperature, double volume) const = 0;

  /** @brief Volume at (P, T) in m^3/mol */
  virtual double volume(double pressure, double temperature) const = 0;

  virtual double grueneisenParameter(double pressure, double temperature, double volume) const = 0;
  virtual double isothermalBulkModulus(double pressure, double temperature, double volume) const = 0;
  virtual double adiabaticBulkModulus(double pressure, double temperature, double volume) const = 0;
  virtual double shearModulus(double pressure, double temperature, double volume) const = 0;
  virtual double heatCapacityV(double pressure, double temperature, double volume) const = 0;
  virtual double heatCapacityP(double pressure, double temperature, double volume) const = 0;
  virtual double thermalExpansivity(double pressure, double temperature, double volume) const = 0;
  virtual double entropy(double pressure, double temperature, double volume) const = 0;
  virtual double helmholtzFreeEnergy(double pressure, double temperature, double volume) const = 0;
  virtual double gibbsFreeEnergy(double pressure, double temperature, double volume) const = 0;
  virtual double internalEnergy(double pressure, double temperature, double volume) const = 0;
  virtual double enthalpy(double pressure, double temperature, double volume) const = 0;

  /**
   * @brief Whether the model computes a property or reports a placeholder
   *
   * Unsupported properties still return a value (0) from their getter.
   */
  virtual bool isSupported(Property property) const = 0;

  /** @brief Short model name */
  virtual std::string getType() const = 0;

  /**
   * @brief Evaluate any property at a state point
   *
   * VOLUME returns the given volume and PRESSURE recomputes pressure from
   * (T, V), so a caller can build a table from a list of properties.
   */
  double evaluate(Property property, double pressure, double temperature, double volume) const;
};

/**
 * @brief Convert a property to its column name, e.g. "gibbs_free_energy"
 */
std::string propertyToString(Property property);

/**
 * @brief Convert a column name back to a property
 * @throw std::invalid_argument if the name is not recognized
 */
Property stringToProperty(const std::string &str);

/**
 * @brief All properties in declaration order
 */
std::vector<Property> allProperties();

#endif // EQUATION_OF_STATE_HPP
