#include "eos_table.hpp"
#include "eos_errors.hpp"

#include <chrono>
#include <cmath>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <limits>
#include <stdexcept>
#ifdef _OPENMP
#include <omp.h>
#endif

std::vector<StatePoint> evaluatePoints(const DKSSolidEOS &eos, const std::vector<double> &pressures,
                                       const std::vector<double> &temperatures) {
  if (pressures.size() != temperatures.size()) {
    throw std::invalid_argument("pressures and temperatures must have the same size");
  }

  const int num_points = static_cast<int>(pressures.size());
  std::vector<StatePoint> results(pressures.size());
  int num_failed = 0;

#ifdef _OPENMP
  double t0 = omp_get_wtime();
#else
  auto t0 = std::chrono::high_resolution_clock::now();
#endif

#pragma omp parallel for schedule(dynamic, 4) reduction(+ : num_failed)
  for (int i = 0; i < num_points; ++i) {
    VolumeSolution sol = eos.solveVolume(pressures[i], temperatures[i]);

    StatePoint &point = results[i];
    point.pressure = pressures[i];
    point.temperature = temperatures[i];
    point.volume = sol.volume;
    point.status = sol.status;
    point.message = sol.message;

    if (!sol.ok()) {
      num_failed += 1;
    }
  }

#ifdef _OPENMP
  double elapsed = omp_get_wtime() - t0;
#else
  double elapsed = std::chrono::duration<double>(std::chrono::high_resolution_clock::now() - t0).count();
#endif

  if (eos.settings().debug_mode) {
    std::cout << "[timing] evaluatePoints took " << elapsed << " s for " << num_points << " points";
#ifdef _OPENMP
    std::cout << " with " << omp_get_max_threads() << " threads";
#endif
    std::cout << "\n";
  }
  if (num_failed > 0) {
    std::cerr << "[sweep] " << num_failed << " of " << num_points
              << " points could not be solved; their volumes are NaN" << std::endl;
  }

  return results;
}

std::vector<StatePoint> evaluateIsotherm(const DKSSolidEOS &eos, const std::vector<double> &pressures,
                                         double temperature) {
  return evaluatePoints(eos, pressures, std::vector<double>(pressures.size(), temperature));
}

std::vector<double> evaluateProperty(const DKSSolidEOS &eos, const std::vector<StatePoint> &points,
                                     Property property) {
  std::vector<double> values;
  values.reserve(points.size());

  for (const auto &point : points) {
    if (point.status != SolveStatus::OK) {
      values.push_back(std::numeric_limits<double>::quiet_NaN());
      continue;
    }
    try {
      values.push_back(eos.evaluate(property, point.pressure, point.temperature, point.volume));
    } catch (const EOSError &e) {
      std::cerr << "[sweep] " << propertyToString(property) << " undefined at P = " << point.pressure
                << " Pa, T = " << point.temperature << " K: " << e.what() << std::endl;
      values.push_back(std::numeric_limits<double>::quiet_NaN());
    }
  }

  return values;
}

std::vector<double> createPressureGrid(double p_min, double p_max, int num_points, bool use_log_spacing) {
  if (p_min >= p_max) {
    throw std::invalid_argument("p_min must be less than p_max");
  }
  if (num_points < 2) {
    throw std::invalid_argument("num_points must be at least 2");
  }
  if (use_log_spacing && p_min <= 0.0) {
    throw std::invalid_argument("p_min must be positive for logarithmic spacing");
  }

  std::vector<double> pressures;
  pressures.reserve(num_points);

  if (use_log_spacing) {
    double log_p_min = std::log10(p_min);
    double log_p_max = std::log10(p_max);
    double log_step = (log_p_max - log_p_min) / (num_points - 1);

    for (int i = 0; i < num_points; ++i) {
      pressures.push_back(std::pow(10.0, log_p_min + i * log_step));
    }
  } else {
    double step = (p_max - p_min) / (num_points - 1);

    for (int i = 0; i < num_points; ++i) {
      pressures.push_back(p_min + i * step);
    }
  }

  return pressures;
}

bool writeEOSTable(const std::string &filename, const DKSSolidEOS &eos,
                   const std::vector<StatePoint> &points, const std::vector<Property> &properties) {
  std::ofstream outfile(filename);
  if (!outfile.is_open()) {
    std::cerr << "Error: Could not open file " << filename << " for writing" << std::endl;
    return false;
  }

  std::vector<std::vector<double>> columns;
  columns.reserve(properties.size());
  for (const auto &property : properties) {
    columns.push_back(evaluateProperty(eos, points, property));
  }

  // Header with metadata
  outfile << "# Finite-strain solid EOS: " << eos.getType() << '\n';
  outfile << std::setprecision(std::numeric_limits<double>::max_digits10);
  for (const auto &[key, value] : eos.parameters().values()) {
    outfile << "# " << key << " = " << value << '\n';
  }
  for (const auto &property : properties) {
    if (!eos.isSupported(property)) {
      outfile << "# " << propertyToString(property) << " is not derived by this model (written as 0)"
              << '\n';
    }
  }
  outfile << "#" << '\n';

  outfile << "P[Pa],T[K],V[m^3/mol]";
  for (const auto &property : properties) {
    outfile << "," << propertyToString(property);
  }
  outfile << ",status" << '\n';

  outfile << std::scientific << std::setprecision(10);
  for (std::size_t i = 0; i < points.size(); ++i) {
    outfile << points[i].pressure << "," << points[i].temperature << "," << points[i].volume;
    for (const auto &column : columns) {
      outfile << "," << column[i];
    }
    outfile << "," << solveStatusToString(points[i].status) << '\n';
  }

  outfile.close();
  return static_cast<bool>(outfile);
}

bool generateEOSTable(const DKSSolidEOS &eos, const EOSTableParameters &params) {
  try {
    std::cout << "Generating " << eos.getType() << " EOS table" << std::endl;
    std::cout << "  P range: " << std::scientific << std::setprecision(4) << params.p_min << " to "
              << params.p_max << " Pa" << std::endl;
    std::cout << "  T = " << std::fixed << std::setprecision(2) << params.temperature << " K" << std::endl;
    std::cout << "  Number of points: " << params.num_points << std::endl;
    std::cout.unsetf(std::ios::floatfield);

    std::vector<double> pressures =
        createPressureGrid(params.p_min, params.p_max, params.num_points, params.use_log_spacing);

    std::vector<StatePoint> points = evaluateIsotherm(eos, pressures, params.temperature);

    bool success = writeEOSTable(params.output_file, eos, points, params.properties);
    if (success) {
      std::cout << "Successfully wrote EOS table to: " << params.output_file << std::endl;
    }
    return success;

  } catch (const std::exception &e) {
    std::cerr << "Error generating EOS table: " << e.what() << std::endl;
    return false;
  }
}
