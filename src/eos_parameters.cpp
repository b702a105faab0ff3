#include "eos_parameters.hpp"
#include "eos_errors.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <limits>
#include <sstream>

namespace {
std::string trim(const std::string &s) {
  auto first = std::find_if_not(s.begin(), s.end(), [](unsigned char ch) { return std::isspace(ch); });
  auto last = std::find_if_not(s.rbegin(), s.rend(), [](unsigned char ch) { return std::isspace(ch); })
                  .base();
  return (first < last) ? std::string(first, last) : std::string();
}

std::string lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(), [](unsigned char ch) { return std::tolower(ch); });
  return s;
}
} // namespace

ParameterSet::ParameterSet(std::map<std::string, double> values) : values_(std::move(values)) {}

ParameterSet::ParameterSet(std::initializer_list<std::pair<const std::string, double>> values)
    : values_(values) {}

double ParameterSet::get(const std::string &key) const {
  auto it = values_.find(key);
  if (it == values_.end()) {
    throw MissingParameterError(key);
  }
  return it->second;
}

bool ParameterSet::contains(const std::string &key) const { return values_.count(key) > 0; }

std::vector<std::string> ParameterSet::keys() const {
  std::vector<std::string> result;
  result.reserve(values_.size());
  for (const auto &[key, value] : values_) {
    result.push_back(key);
  }
  return result;
}

ParameterSet ParameterSet::with(const std::string &key, double value) const {
  std::map<std::string, double> copy = values_;
  copy[key] = value;
  return ParameterSet(std::move(copy));
}

ParameterSet ParameterSet::without(const std::string &key) const {
  std::map<std::string, double> copy = values_;
  copy.erase(key);
  return ParameterSet(std::move(copy));
}

const std::vector<std::string> &requiredParameterKeys() {
  static const std::vector<std::string> keys = {"V_0",       "T_0", "E_0", "S_0",          "K_0", "Kprime_0",
                                                "Kdprime_0", "n",   "Cv",  "grueneisen_0", "q_0"};
  return keys;
}

void validateParameters(const ParameterSet &params) {
  for (const auto &key : requiredParameterKeys()) {
    if (!params.contains(key)) {
      throw MissingParameterError(key);
    }
  }
}

ParameterSet readParameterFile(const std::string &filename) {
  std::ifstream file(filename);
  if (!file.is_open()) {
    throw ParameterFileError("Could not open parameter file " + filename);
  }

  std::map<std::string, double> values;
  std::string line;
  int line_number = 0;

  while (std::getline(file, line)) {
    line_number++;
    std::string stripped = trim(line);
    if (stripped.empty() || stripped[0] == '#') {
      continue;
    }

    auto comma = stripped.find(',');
    if (comma == std::string::npos) {
      throw ParameterFileError(filename + ":" + std::to_string(line_number) +
                               ": expected 'key,value' but got '" + stripped + "'");
    }

    std::string key = trim(stripped.substr(0, comma));
    std::string value_str = trim(stripped.substr(comma + 1));

    // Header row
    if (lower(key) == "key" && lower(value_str) == "value") {
      continue;
    }
    if (key.empty()) {
      throw ParameterFileError(filename + ":" + std::to_string(line_number) + ": empty key");
    }

    double value = 0.0;
    std::size_t consumed = 0;
    try {
      value = std::stod(value_str, &consumed);
    } catch (const std::exception &) {
      throw ParameterFileError(filename + ":" + std::to_string(line_number) + ": value of '" + key +
                               "' is not a number: '" + value_str + "'");
    }
    if (consumed != value_str.size()) {
      throw ParameterFileError(filename + ":" + std::to_string(line_number) + ": value of '" + key +
                               "' is not a number: '" + value_str + "'");
    }

    if (!values.emplace(key, value).second) {
      throw ParameterFileError(filename + ":" + std::to_string(line_number) + ": duplicate key '" +
                               key + "'");
    }
  }

  return ParameterSet(std::move(values));
}

bool writeParameterFile(const std::string &filename, const ParameterSet &params) {
  std::ofstream outfile(filename);
  if (!outfile.is_open()) {
    std::cerr << "Error: Could not open file " << filename << " for writing" << std::endl;
    return false;
  }

  outfile << "# Finite-strain solid EOS parameters (SI units)" << '\n';
  outfile << "key,value" << '\n';
  outfile << std::setprecision(std::numeric_limits<double>::max_digits10);
  for (const auto &[key, value] : params.values()) {
    outfile << key << "," << value << '\n';
  }

  return static_cast<bool>(outfile);
}
