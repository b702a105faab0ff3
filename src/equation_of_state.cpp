#include "equation_of_state.hpp"

#include <stdexcept>
#include <utility>

namespace {
const std::vector<std::pair<Property, std::string>> &propertyNames() {
  static const std::vector<std::pair<Property, std::string>> names = {
      {Property::VOLUME, "volume"},
      {Property::PRESSURE, "pressure"},
      {Property::GRUENEISEN_PARAMETER, "grueneisen_parameter"},
      {Property::HEAT_CAPACITY_V, "heat_capacity_v"},
      {Property::HEAT_CAPACITY_P, "heat_capacity_p"},
      {Property::ENTROPY, "entropy"},
      {Property::HELMHOLTZ_FREE_ENERGY, "helmholtz_free_energy"},
      {Property::GIBBS_FREE_ENERGY, "gibbs_free_energy"},
      {Property::INTERNAL_ENERGY, "internal_energy"},
      {Property::ENTHALPY, "enthalpy"},
      {Property::ISOTHERMAL_BULK_MODULUS, "isothermal_bulk_modulus"},
      {Property::ADIABATIC_BULK_MODULUS, "adiabatic_bulk_modulus"},
      {Property::SHEAR_MODULUS, "shear_modulus"},
      {Property::THERMAL_EXPANSIVITY, "thermal_expansivity"}};
  return names;
}
} // namespace

double EquationOfState::evaluate(Property property, double pressure, double temperature,
                                 double volume) const {
  switch (property) {
  case Property::VOLUME:
    return volume;
  case Property::PRESSURE:
    return this->pressure(temperature, volume);
  case Property::GRUENEISEN_PARAMETER:
    return grueneisenParameter(pressure, temperature, volume);
  case Property::HEAT_CAPACITY_V:
    return heatCapacityV(pressure, temperature, volume);
  case Property::HEAT_CAPACITY_P:
    return heatCapacityP(pressure, temperature, volume);
  case Property::ENTROPY:
    return entropy(pressure, temperature, volume);
  case Property::HELMHOLTZ_FREE_ENERGY:
    return helmholtzFreeEnergy(pressure, temperature, volume);
  case Property::GIBBS_FREE_ENERGY:
    return gibbsFreeEnergy(pressure, temperature, volume);
  case Property::INTERNAL_ENERGY:
    return internalEnergy(pressure, temperature, volume);
  case Property::ENTHALPY:
    return enthalpy(pressure, temperature, volume);
  case Property::ISOTHERMAL_BULK_MODULUS:
    return isothermalBulkModulus(pressure, temperature, volume);
  case Property::ADIABATIC_BULK_MODULUS:
    return adiabaticBulkModulus(pressure, temperature, volume);
  case Property::SHEAR_MODULUS:
    return shearModulus(pressure, temperature, volume);
  case Property::THERMAL_EXPANSIVITY:
    return thermalExpansivity(pressure, temperature, volume);
  default:
    throw std::invalid_argument("Unknown property");
  }
}

std::string propertyToString(Property property) {
  for (const auto &[p, name] : propertyNames()) {
    if (p == property) {
      return name;
    }
  }
  throw std::invalid_argument("Unknown property");
}

Property stringToProperty(const std::string &str) {
  for (const auto &[p, name] : propertyNames()) {
    if (name == str) {
      return p;
    }
  }
  throw std::invalid_argument("Unknown property string: " + str);
}

std::vector<Property> allProperties() {
  std::vector<Property> result;
  for (const auto &entry : propertyNames()) {
    result.push_back(entry.first);
  }
  return result;
}
