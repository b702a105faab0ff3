/**
 * @file finite_strain.hpp
 * @brief Eulerian finite strain and the compressive free energy
 *
 * @details
 * The compressive part of the Helmholtz free energy is expanded to fourth
 * order in the Eulerian finite strain
 * \f[
 * f = \frac{1}{2}\left[\left(\frac{V_0}{V}\right)^{2/3} - 1\right]
 * \f]
 * as (de Koker & Stixrude 2013, supplementary eq. S3):
 * \f[
 * F_{cmp} = 9 K_0 V_0 \left(\frac{f^2}{2} + \frac{a_3 f^3}{6} + \frac{a_4 f^4}{24}\right)
 * \f]
 * with the fixed coefficients
 * \f{eqnarray*}{
 * a_3 &=& 3(K_0' - 4) \\
 * a_4 &=& 9\left[K_0 K_0'' + K_0'(K_0' - 7)\right] + 143
 * \f}
 *
 * The truncation order is fixed. \f$a_3\f$ and \f$a_4\f$ are derived from
 * \f$K_0, K_0', K_0''\f$ and are not free parameters.
 *
 * @note V <= 0 is not checked. The power operation yields NaN, which is
 *       propagated to the caller unchanged.
 *
 * @date 2025-06-02
 */

#ifndef FINITE_STRAIN_HPP
#define FINITE_STRAIN_HPP

#include "eos_parameters.hpp"

/**
 * @brief Expansion coefficients of the fourth-order finite-strain free energy
 */
struct StrainCoefficients {
  double a3; ///< 3(K0' - 4)
  double a4; ///< 9[K0 K0'' + K0'(K0' - 7)] + 143
};

/**
 * @brief Eulerian finite strain f(V)
 * @param volume Molar volume in m^3/mol
 * @param params Parameter set providing V_0
 * @return Dimensionless strain, zero at V = V_0 and positive under compression
 */
double finiteStrain(double volume, const ParameterSet &params);

/**
 * @brief Coefficients a3 and a4 from K_0, Kprime_0 and Kdprime_0
 */
StrainCoefficients strainCoefficients(const ParameterSet &params);

/**
 * @brief Compressive free energy F_cmp(V) in J/mol
 */
double compressiveFreeEnergy(double volume, const ParameterSet &params);

/**
 * @brief Cold-compression pressure -dF_cmp/dV in Pa
 *
 * \f[ P_{cmp} = 3 K_0 (1+2f)^{5/2}\left(f + \frac{a_3 f^2}{2} + \frac{a_4 f^3}{6}\right) \f]
 */
double compressivePressure(double volume, const ParameterSet &params);

#endif // FINITE_STRAIN_HPP
