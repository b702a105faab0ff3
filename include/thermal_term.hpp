/**
 * @file thermal_term.hpp
 * @brief Thermal contribution to the free energy of the finite-strain solid
 *
 * @details
 * The Grueneisen parameter is a power law in volume,
 * \f$ \gamma(V) = \gamma_0 (V/V_0)^{q_0} \f$, and the heat capacity at
 * constant volume is a constant \f$C_V\f$. Under those assumptions the
 * integral of \f$\alpha K_T(V, T_0)\f$ from \f$V_0\f$ to \f$V\f$ has the closed form
 * \f[
 * I(V) = \frac{C_V \gamma_0}{q_0}\left[\left(\frac{V}{V_0}\right)^{q_0} - 1\right]
 * \f]
 * and the thermal free energy is
 * \f[
 * F_{th} = -S_0 (T - T_0) - C_V\left[T\ln\frac{T}{T_0} - (T - T_0)\right] - I(V)(T - T_0)
 * \f]
 *
 * For \f$q_0 = 0\f$ the closed form is replaced by its limit
 * \f$ I(V) = C_V \gamma_0 \ln(V/V_0) \f$.
 *
 * @date 2025-06-02
 */

#ifndef THERMAL_TERM_HPP
#define THERMAL_TERM_HPP

#include "eos_parameters.hpp"

/**
 * @brief Reject states where ln(T/T_0) is undefined
 * @throw DomainError if temperature <= 0 or T_0 <= 0 (NaN included)
 */
void checkTemperatureDomain(double temperature, double T_0);

/**
 * @brief Grueneisen parameter gamma_0 (V/V_0)^q_0
 */
double grueneisenParameter(double volume, const ParameterSet &params);

/**
 * @brief Analytic integral of alpha*K_T(V, T_0) dV from V_0 to V, in J/K/mol
 */
double thermalPressureIntegral(double volume, const ParameterSet &params);

/**
 * @brief Thermal free energy F_th(T, V) in J/mol
 * @throw DomainError if temperature <= 0 or T_0 <= 0
 */
double thermalFreeEnergy(double temperature, double volume, const ParameterSet &params);

/**
 * @brief Entropy S_0 + I(V) + C_V ln(T/T_0) in J/K/mol
 * @throw DomainError if temperature <= 0 or T_0 <= 0
 */
double thermalEntropy(double temperature, double volume, const ParameterSet &params);

#endif // THERMAL_TERM_HPP
