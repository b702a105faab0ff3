/**
 * @file eos_errors.hpp
 * @brief Exception types raised by the finite-strain equation of state
 *
 * Every failure that a caller may want to recover from (for example a sweep
 * over many pressure-temperature points that should skip one bad point) is
 * reported as a distinct exception type deriving from EOSError, so callers
 * can branch on the type instead of matching message strings.
 *
 * @date 2025-06-02
 */

#ifndef EOS_ERRORS_HPP
#define EOS_ERRORS_HPP

#include <stdexcept>
#include <string>

/**
 * @brief Base class of all equation of state errors
 */
class EOSError : public std::runtime_error {
public:
  explicit EOSError(const std::string &what) : std::runtime_error(what) {}
};

/**
 * @brief A required calibration constant is absent from a parameter set
 */
class MissingParameterError : public EOSError {
public:
  explicit MissingParameterError(const std::string &key)
      : EOSError("params object missing parameter : " + key), key_(key) {}

  /** @brief Name of the missing key, e.g. "K_0" */
  const std::string &key() const { return key_; }

private:
  std::string key_;
};

/**
 * @brief Input outside the mathematical domain of a formula
 *
 * Raised for non-positive temperatures feeding a logarithm and for numeric
 * failures reported by GSL during root refinement.
 */
class DomainError : public EOSError {
public:
  explicit DomainError(const std::string &what) : EOSError(what) {}
};

/**
 * @brief No sign change of the pressure residual could be found
 *
 * The requested pressure lies outside the range of validity of the equation
 * of state reachable from the initial volume guess.
 */
class RootNotBracketedError : public EOSError {
public:
  explicit RootNotBracketedError(const std::string &what) : EOSError(what) {}
};

/**
 * @brief Root refinement exhausted its iteration budget
 */
class NonConvergenceError : public EOSError {
public:
  NonConvergenceError(const std::string &what, int iterations)
      : EOSError(what), iterations_(iterations) {}

  int iterations() const { return iterations_; }

private:
  int iterations_;
};

/**
 * @brief A parameter file could not be read or parsed
 */
class ParameterFileError : public EOSError {
public:
  explicit ParameterFileError(const std::string &what) : EOSError(what) {}
};

#endif // EOS_ERRORS_HPP
