/**
 * @file eos_parameters.hpp
 * @brief Calibration constants of one mineral phase
 *
 * A ParameterSet is a read-only mapping of named constants (SI units) that is
 * built once, validated once and then shared by any number of evaluations.
 * The key names follow the mineral database convention:
 *
 * | key          | meaning                                   | unit      |
 * |--------------|-------------------------------------------|-----------|
 * | V_0          | reference volume                          | m^3/mol   |
 * | T_0          | reference temperature                     | K         |
 * | E_0          | reference internal energy                 | J/mol     |
 * | S_0          | reference entropy                         | J/K/mol   |
 * | K_0          | reference isothermal bulk modulus         | Pa        |
 * | Kprime_0     | dK/dP at the reference state              | -         |
 * | Kdprime_0    | d2K/dP2 at the reference state            | 1/Pa      |
 * | n            | number of atoms per formula unit          | -         |
 * | Cv           | constant-volume heat capacity             | J/K/mol   |
 * | grueneisen_0 | reference Grueneisen parameter            | -         |
 * | q_0          | volume exponent of grueneisen_0           | -         |
 *
 * @example Parameter file
 * ```
 * # example solid phase
 * key,value
 * V_0,1.0e-5
 * T_0,300
 * ...
 * ```
 *
 * @date 2025-06-02
 */

#ifndef EOS_PARAMETERS_HPP
#define EOS_PARAMETERS_HPP

#include <initializer_list>
#include <map>
#include <string>
#include <utility>
#include <vector>

/**
 * @brief Immutable set of named calibration constants
 *
 * Lookups of absent keys throw MissingParameterError, so a formula that
 * dereferences a missing field fails with the key name even if the set was
 * never validated.
 */
class ParameterSet {
public:
  ParameterSet() = default;
  explicit ParameterSet(std::map<std::string, double> values);
  ParameterSet(std::initializer_list<std::pair<const std::string, double>> values);

  /**
   * @brief Value of a key
   * @throw MissingParameterError if the key is absent
   */
  double get(const std::string &key) const;

  bool contains(const std::string &key) const;
  std::size_t size() const { return values_.size(); }
  std::vector<std::string> keys() const;

  /**
   * @brief Copy of this set with one key added or replaced
   */
  ParameterSet with(const std::string &key, double value) const;

  /**
   * @brief Copy of this set with one key removed
   */
  ParameterSet without(const std::string &key) const;

  const std::map<std::string, double> &values() const { return values_; }

private:
  std::map<std::string, double> values_;
};

/**
 * @brief The eleven keys the finite-strain solid EOS requires, in check order
 */
const std::vector<std::string> &requiredParameterKeys();

/**
 * @brief Check that every required key is present
 *
 * Only presence is checked. No bounds are enforced on the values.
 *
 * @throw MissingParameterError naming the first absent key
 */
void validateParameters(const ParameterSet &params);

/**
 * @brief Load a parameter set from a `key,value` CSV file
 *
 * Blank lines, lines starting with '#' and a `key,value` header are skipped.
 *
 * @throw ParameterFileError if the file cannot be opened, a line is malformed,
 *        a value is not numeric or a key appears twice
 */
ParameterSet readParameterFile(const std::string &filename);

/**
 * @brief Write a parameter set in the format read by readParameterFile
 * @return true if the file was written
 */
bool writeParameterFile(const std::string &filename, const ParameterSet &params);

#endif // EOS_PARAMETERS_HPP
