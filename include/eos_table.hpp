/**
 * @file eos_table.hpp
 * @brief Elementwise evaluation of the solid EOS over pressure-temperature points
 *
 * This is the array-facing side of the EOS used by comparison and plotting
 * code: it solves for volume at every (P, T) pair, keeps going when a point
 * fails, and writes property tables as CSV.
 *
 * Points are independent, so the sweep runs in parallel when the library is
 * built with OpenMP.
 *
 * @example Generate EOS Table
 * ```cpp
 * DKSSolidEOS eos(readParameterFile("data/example_solid.csv"));
 *
 * EOSTableParameters params;
 * params.p_min = 0.0;
 * params.p_max = 135e9;
 * params.temperature = 2500.0;
 * params.num_points = 200;
 * params.output_file = "example_2500K.csv";
 *
 * bool success = generateEOSTable(eos, params);
 * ```
 *
 * @date 2025-06-04
 */

#ifndef EOS_TABLE_HPP
#define EOS_TABLE_HPP

#include "dks_solid_eos.hpp"
#include "equation_of_state.hpp"

#include <string>
#include <vector>

/**
 * @brief One solved state point of a sweep
 */
struct StatePoint {
  double pressure;    ///< Pa
  double temperature; ///< K
  double volume;      ///< m^3/mol, NaN if the solve failed
  SolveStatus status; ///< Outcome of the volume solve
  std::string message; ///< Error text of a failed solve
};

/**
 * @brief Parameters for generating EOS tables
 */
struct EOSTableParameters {
  double p_min;                    ///< Minimum pressure (Pa)
  double p_max;                    ///< Maximum pressure (Pa)
  double temperature;              ///< Isotherm temperature (K)
  int num_points;                  ///< Number of points in the table
  std::string output_file;         ///< Output file path
  bool use_log_spacing;            ///< Use logarithmic spacing for the pressure grid
  std::vector<Property> properties; ///< Property columns after P, T, V

  /**
   * @brief Constructor with default values
   *
   * 0 to 100 GPa at 300 K on 100 linearly spaced points, with the
   * Grueneisen parameter, entropy and the four energy columns.
   */
  EOSTableParameters()
      : p_min(0.0), p_max(100e9), temperature(300.0), num_points(100),
        output_file("dks_solid_eos.csv"), use_log_spacing(false),
        properties({Property::GRUENEISEN_PARAMETER, Property::ENTROPY,
                    Property::HELMHOLTZ_FREE_ENERGY, Property::GIBBS_FREE_ENERGY,
                    Property::INTERNAL_ENERGY, Property::ENTHALPY}) {}
};

/**
 * @brief Solve for volume at every (pressures[i], temperatures[i])
 *
 * A failing point records its status and NaN volume. The remaining points
 * are still solved.
 *
 * @throw std::invalid_argument if the two arrays differ in size
 */
std::vector<StatePoint> evaluatePoints(const DKSSolidEOS &eos, const std::vector<double> &pressures,
                                       const std::vector<double> &temperatures);

/**
 * @brief Solve for volume along an isotherm
 */
std::vector<StatePoint> evaluateIsotherm(const DKSSolidEOS &eos, const std::vector<double> &pressures,
                                         double temperature);

/**
 * @brief Evaluate one property at every solved point
 *
 * Failed points, and points where the property itself hits a domain error,
 * yield NaN.
 */
std::vector<double> evaluateProperty(const DKSSolidEOS &eos, const std::vector<StatePoint> &points,
                                     Property property);

/**
 * @brief Create a pressure grid
 *
 * @throw std::invalid_argument if p_min >= p_max, num_points < 2, or log
 *        spacing is requested with p_min <= 0
 */
std::vector<double> createPressureGrid(double p_min, double p_max, int num_points, bool use_log_spacing);

/**
 * @brief Write solved points and property columns to a CSV file
 * @return true if successful, false otherwise
 */
bool writeEOSTable(const std::string &filename, const DKSSolidEOS &eos,
                   const std::vector<StatePoint> &points, const std::vector<Property> &properties);

/**
 * @brief Solve an isotherm and write it as a table
 * @return true if successful, false otherwise (errors are logged to stderr)
 */
bool generateEOSTable(const DKSSolidEOS &eos, const EOSTableParameters &params);

#endif // EOS_TABLE_HPP
