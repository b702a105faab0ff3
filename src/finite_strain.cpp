#include "finite_strain.hpp"

#include <cmath>

double finiteStrain(double volume, const ParameterSet &params) {
  return 0.5 * (std::pow(params.get("V_0") / volume, 2.0 / 3.0) - 1.0);
}

StrainCoefficients strainCoefficients(const ParameterSet &params) {
  const double K_0 = params.get("K_0");
  const double Kprime_0 = params.get("Kprime_0");
  const double Kdprime_0 = params.get("Kdprime_0");

  StrainCoefficients coeffs;
  coeffs.a3 = 3.0 * (Kprime_0 - 4.0);
  coeffs.a4 = 9.0 * (K_0 * Kdprime_0 + Kprime_0 * (Kprime_0 - 7.0)) + 143.0;
  return coeffs;
}

double compressiveFreeEnergy(double volume, const ParameterSet &params) {
  const double f = finiteStrain(volume, params);
  const StrainCoefficients c = strainCoefficients(params);

  return 9.0 * params.get("K_0") * params.get("V_0") *
         (f * f / 2.0 + c.a3 * f * f * f / 6.0 + c.a4 * f * f * f * f / 24.0);
}

double compressivePressure(double volume, const ParameterSet &params) {
  const double f = finiteStrain(volume, params);
  const StrainCoefficients c = strainCoefficients(params);

  return 3.0 * params.get("K_0") * std::pow(1.0 + 2.0 * f, 2.5) *
         (f + c.a3 * f * f / 2.0 + c.a4 / 6.0 * f * f * f);
}
