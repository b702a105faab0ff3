/**
 * @file main_dks_solid.cpp
 * @brief Example usage of the finite-strain solid EOS
 *
 * Builds a parameter set in code, prints the state along a few isotherms
 * and shows how an out-of-range pressure is reported without aborting the
 * sweep.
 *
 * @date 2025-06-05
 */

#include "dks_solid_eos.hpp"
#include "eos_errors.hpp"
#include "eos_table.hpp"

#include <gsl/gsl_errno.h>
#include <iomanip>
#include <iostream>
#include <vector>

ParameterSet exampleParameters() {
    return ParameterSet{{"V_0", 1.0e-5},
                        {"T_0", 300.0},
                        {"E_0", 0.0},
                        {"S_0", 0.0},
                        {"K_0", 250e9},
                        {"Kprime_0", 4.0},
                        {"Kdprime_0", -0.02e-9},
                        {"n", 1.0},
                        {"Cv", 100.0},
                        {"grueneisen_0", 1.5},
                        {"q_0", 1.0}};
}

void demonstrateBasicUsage(const DKSSolidEOS& eos) {
    std::cout << "\n=== Basic Usage Demonstration ===" << std::endl;

    const double T = 2000.0;
    const double P = 50e9;

    double V = eos.volume(P, T);

    std::cout << "\nState at P = " << std::scientific << std::setprecision(4) << P
              << " Pa, T = " << std::fixed << std::setprecision(1) << T << " K:" << std::endl;
    std::cout << std::scientific << std::setprecision(6);
    std::cout << "  V     = " << V << " m^3/mol" << std::endl;
    std::cout << "  gamma = " << eos.grueneisenParameter(P, T, V) << std::endl;
    std::cout << "  S     = " << eos.entropy(P, T, V) << " J/K/mol" << std::endl;
    std::cout << "  F     = " << eos.helmholtzFreeEnergy(P, T, V) << " J/mol" << std::endl;
    std::cout << "  G     = " << eos.gibbsFreeEnergy(P, T, V) << " J/mol" << std::endl;
    std::cout << "  E     = " << eos.internalEnergy(P, T, V) << " J/mol" << std::endl;
    std::cout << "  H     = " << eos.enthalpy(P, T, V) << " J/mol" << std::endl;
    std::cout << "  Check: pressure(T, V) = " << eos.pressure(T, V) << " Pa" << std::endl;
}

void compareIsotherms(const DKSSolidEOS& eos) {
    std::cout << "\n=== Compression Along Isotherms ===" << std::endl;

    std::vector<double> pressures = createPressureGrid(0.0, 100e9, 6, false);
    std::vector<double> temperatures = {300.0, 1500.0, 3000.0};

    std::cout << std::string(60, '-') << std::endl;
    std::cout << std::left << std::setw(15) << "P [GPa]";
    for (double T : temperatures) {
        std::cout << std::setw(15) << ("V/V0 @ " + std::to_string(static_cast<int>(T)) + "K");
    }
    std::cout << std::endl;
    std::cout << std::string(60, '-') << std::endl;

    const double V_0 = eos.parameters().get("V_0");
    for (double P : pressures) {
        std::cout << std::setw(15) << std::fixed << std::setprecision(1) << P / 1e9;
        for (double T : temperatures) {
            VolumeSolution sol = eos.solveVolume(P, T);
            if (sol.ok()) {
                std::cout << std::setw(15) << std::setprecision(5) << sol.volume / V_0;
            } else {
                std::cout << std::setw(15) << solveStatusToString(sol.status);
            }
        }
        std::cout << std::endl;
    }
}

void demonstrateErrorHandling(const DKSSolidEOS& eos) {
    std::cout << "\n=== Error Handling Demonstration ===" << std::endl;

    try {
        eos.volume(1e20, 300.0);
    } catch (const RootNotBracketedError& e) {
        std::cout << "✓ Out-of-range pressure rejected: " << e.what() << std::endl;
    }

    try {
        DKSSolidEOS broken(exampleParameters().without("K_0"));
    } catch (const MissingParameterError& e) {
        std::cout << "✓ Missing parameter detected: " << e.key() << std::endl;
    }

    std::cout << "\nModel limitations:" << std::endl;
    for (const auto& property : allProperties()) {
        if (!eos.isSupported(property)) {
            std::cout << "  " << propertyToString(property) << " is not derived (reported as 0)" << std::endl;
        }
    }
}

int main() {
    gsl_set_error_handler_off();

    std::cout << "Finite-Strain Solid EOS Example" << std::endl;
    std::cout << "===============================" << std::endl;

    try {
        DKSSolidEOS eos(exampleParameters());

        demonstrateBasicUsage(eos);
        compareIsotherms(eos);
        demonstrateErrorHandling(eos);

        std::cout << "\n=== Example completed successfully! ===" << std::endl;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
