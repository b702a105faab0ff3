/**
 * @file root_finder.hpp
 * @brief Bracket search and Brent refinement for scalar roots
 *
 * @details
 * Volume inversion of the equation of state is a two stage process:
 *
 * 1. bracketRoot() starts from a point x0 and a step dx and walks downhill
 *    (in the direction in which |f| decreases) with a geometrically growing
 *    step until f changes sign.
 * 2. brentRoot() refines the bracket with GSL's Brent solver
 *    (gsl_root_fsolver_brent) until the bracket width meets the tolerance.
 *
 * Both stages are bounded by iteration caps taken from SolverSettings and
 * report failure with typed exceptions (RootNotBracketedError,
 * NonConvergenceError, DomainError).
 *
 * @code{.cpp}
 * SolverSettings settings;
 * auto f = [](double x) { return x * x - 2.0; };
 * Bracket b = bracketRoot(f, 1.0, 0.1, settings);
 * RootResult r = brentRoot(f, b, settings); // r.root ~ 1.41421356
 * @endcode
 *
 * @note The GSL error handler is switched off process wide the first time
 *       brentRoot() runs, so GSL failures come back as status codes instead
 *       of aborting.
 *
 * @date 2025-06-02
 */

#ifndef ROOT_FINDER_HPP
#define ROOT_FINDER_HPP

#include <functional>
#include <string>

/**
 * @brief Iteration caps and tolerances of the volume solver
 */
struct SolverSettings {
  double bracket_search_factor; ///< Step growth (and shrink) ratio per bracket iteration, > 1
  int max_bracket_iterations;   ///< Maximum steps of each bracket search phase
  double root_abs_tolerance;    ///< Absolute bracket width at convergence
  double root_rel_tolerance;    ///< Relative bracket width at convergence
  int max_root_iterations;      ///< Maximum Brent iterations
  bool debug_mode;              ///< Print solver progress to stdout

  /**
   * @brief Constructor with default values
   *
   * - growth ratio 1.618 (golden ratio), 100 bracket steps
   * - Brent: absolute tolerance 0, relative tolerance 1e-12, 100 iterations
   */
  SolverSettings()
      : bracket_search_factor(1.618), max_bracket_iterations(100), root_abs_tolerance(0.0),
        root_rel_tolerance(1e-12), max_root_iterations(100), debug_mode(false) {}
};

/**
 * @brief Interval [a, b] over which the function changes sign
 *
 * a and b are not ordered; a is the last point before the sign change.
 */
struct Bracket {
  double a;
  double b;
  double fa;
  double fb;
  int iterations; ///< Walking steps taken to find the sign change
};

/**
 * @brief Result of a Brent refinement
 */
struct RootResult {
  double root = 0.0;
  int iterations = 0;
  bool converged = false;
};

using ScalarFunction = std::function<double(double)>;

/**
 * @brief Check settings for consistency
 * @throw std::invalid_argument if the factor is not > 1, a cap is not
 *        positive or a tolerance is negative
 */
void validateSolverSettings(const SolverSettings &settings);

/**
 * @brief Search for an interval containing a sign change of fn
 *
 * Evaluates fn at x0 - dx and x0 + dx. If the function is not monotonic across these
 * points the step is shrunk by the factor until it is. The walk then proceeds
 * downhill from x0, multiplying the step by the factor after every step,
 * until fn(a) * fn(b) <= 0.
 *
 * A step that lands where fn is not finite, or where |fn| has grown without
 * a sign change (the step jumped over an extremum), is discarded. The walk
 * goes back to the point before the last accepted one and continues with a
 * restart step that is reduced by the factor on every such rejection.
 * Rejected steps count towards max_bracket_iterations.
 *
 * @param fn Function whose root is sought
 * @param x0 Starting point
 * @param dx Initial step (sign ignored)
 * @param settings Growth factor and iteration cap
 * @return Bracket with fn(a) * fn(b) <= 0
 * @throw RootNotBracketedError if no sign change is found within the cap or
 *        the function is not finite at x0 or x0 +/- dx
 */
Bracket bracketRoot(const ScalarFunction &fn, double x0, double dx, const SolverSettings &settings);

/**
 * @brief Refine a bracketed root with Brent's method
 *
 * An endpoint where fn is exactly zero is returned without iterating.
 *
 * @throw NonConvergenceError if max_root_iterations is exhausted
 * @throw DomainError if GSL reports a failure (e.g. non-finite function value)
 * @throw std::invalid_argument if the bracket does not straddle zero
 */
RootResult brentRoot(const ScalarFunction &fn, const Bracket &bracket, const SolverSettings &settings);

#endif // ROOT_FINDER_HPP
