#include "dks_solid_eos.hpp"
#include "eos_parameters.hpp"
#include "eos_table.hpp"

#include <gsl/gsl_errno.h>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

namespace {
void printUsage(const char *program) {
  std::cout << "Usage: " << program << " <PARAMETER_FILE> [options]" << std::endl;
  std::cout << "       " << program << " --list-properties" << std::endl;
  std::cout << std::endl;
  std::cout << "Options:" << std::endl;
  std::cout << "  --T <value>             Isotherm temperature (K)" << std::endl;
  std::cout << "  --p-min <value>         Minimum pressure (Pa)" << std::endl;
  std::cout << "  --p-max <value>         Maximum pressure (Pa)" << std::endl;
  std::cout << "  --num-points <value>    Number of points" << std::endl;
  std::cout << "  --output <filename>     Output file" << std::endl;
  std::cout << "  --log-spacing           Use log instead of linear pressure spacing" << std::endl;
  std::cout << "  --properties <a,b,...>  Property columns (see --list-properties)" << std::endl;
  std::cout << "  --max-bracket-iter <n>  Bracket search iteration cap" << std::endl;
  std::cout << "  --max-root-iter <n>     Brent iteration cap" << std::endl;
  std::cout << "  --rel-tol <value>       Relative volume tolerance" << std::endl;
  std::cout << "  --debug                 Print solver progress" << std::endl;
}

std::vector<Property> parseProperties(const std::string &list) {
  std::vector<Property> properties;
  std::stringstream ss(list);
  std::string token;
  while (std::getline(ss, token, ',')) {
    if (!token.empty()) {
      properties.push_back(stringToProperty(token));
    }
  }
  return properties;
}
} // namespace

int main(int argc, char *argv[]) {
  gsl_set_error_handler_off();

  try {
    if (argc < 2) {
      printUsage(argv[0]);
      return 1;
    }

    std::string first = argv[1];

    if (first == "--list-properties") {
      std::cout << "Available properties:" << std::endl;
      std::cout << std::string(50, '-') << std::endl;
      for (const auto &property : allProperties()) {
        std::cout << "  " << propertyToString(property) << std::endl;
      }
      return 0;
    }

    if (first == "--help" || first == "-h") {
      printUsage(argv[0]);
      return 0;
    }

    EOSTableParameters params;
    SolverSettings settings;

    for (int i = 2; i < argc; i++) {
      std::string arg = argv[i];

      if (arg == "--T" && i + 1 < argc) {
        params.temperature = std::stod(argv[++i]);
      } else if (arg == "--p-min" && i + 1 < argc) {
        params.p_min = std::stod(argv[++i]);
      } else if (arg == "--p-max" && i + 1 < argc) {
        params.p_max = std::stod(argv[++i]);
      } else if (arg == "--num-points" && i + 1 < argc) {
        params.num_points = std::stoi(argv[++i]);
      } else if (arg == "--output" && i + 1 < argc) {
        params.output_file = argv[++i];
      } else if (arg == "--log-spacing") {
        params.use_log_spacing = true;
      } else if (arg == "--properties" && i + 1 < argc) {
        params.properties = parseProperties(argv[++i]);
      } else if (arg == "--max-bracket-iter" && i + 1 < argc) {
        settings.max_bracket_iterations = std::stoi(argv[++i]);
      } else if (arg == "--max-root-iter" && i + 1 < argc) {
        settings.max_root_iterations = std::stoi(argv[++i]);
      } else if (arg == "--rel-tol" && i + 1 < argc) {
        settings.root_rel_tolerance = std::stod(argv[++i]);
      } else if (arg == "--debug") {
        settings.debug_mode = true;
      } else {
        std::cerr << "Unknown option: " << arg << std::endl;
        return 1;
      }
    }

    ParameterSet parameters = readParameterFile(first);
    DKSSolidEOS eos(parameters, settings);

    std::cout << "Loaded " << parameters.size() << " parameters from " << first << std::endl;
    std::cout << "  V_0 = " << std::scientific << std::setprecision(4) << parameters.get("V_0")
              << " m^3/mol, K_0 = " << parameters.get("K_0") << " Pa" << std::endl;
    std::cout.unsetf(std::ios::floatfield);

    return generateEOSTable(eos, params) ? 0 : 1;

  } catch (const std::exception &e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }
}
