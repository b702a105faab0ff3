#include "root_finder.hpp"
#include "eos_errors.hpp"

#include <algorithm>
#include <cmath>
#include <exception>
#include <gsl/gsl_errno.h>
#include <gsl/gsl_roots.h>
#include <iostream>
#include <limits>
#include <memory>
#include <mutex>
#include <sstream>
#include <stdexcept>

namespace {
// Carries the callable through GSL's void* parameter and parks any exception
// it throws, so the exception never unwinds through GSL's C frames.
struct ScalarContext {
  const ScalarFunction *fn;
  std::exception_ptr error;
};

double evaluateScalar(double x, void *p) {
  auto *ctx = static_cast<ScalarContext *>(p);
  try {
    return (*ctx->fn)(x);
  } catch (...) {
    ctx->error = std::current_exception();
    return std::numeric_limits<double>::quiet_NaN();
  }
}

void disableGslAbort() {
  static std::once_flag flag;
  std::call_once(flag, [] { gsl_set_error_handler_off(); });
}

double checkedEvaluate(const ScalarFunction &fn, double x) {
  const double value = fn(x);
  if (!std::isfinite(value)) {
    std::ostringstream msg;
    msg << "Cannot find zero: function is not finite at x = " << x;
    throw RootNotBracketedError(msg.str());
  }
  return value;
}

using FsolverPtr = std::unique_ptr<gsl_root_fsolver, decltype(&gsl_root_fsolver_free)>;
} // namespace

void validateSolverSettings(const SolverSettings &settings) {
  if (!(settings.bracket_search_factor > 1.0)) {
    throw std::invalid_argument("bracket_search_factor must be greater than 1");
  }
  if (settings.max_bracket_iterations <= 0) {
    throw std::invalid_argument("max_bracket_iterations must be positive");
  }
  if (settings.max_root_iterations <= 0) {
    throw std::invalid_argument("max_root_iterations must be positive");
  }
  if (settings.root_abs_tolerance < 0.0 || settings.root_rel_tolerance < 0.0) {
    throw std::invalid_argument("root tolerances must be non-negative");
  }
  if (settings.root_abs_tolerance == 0.0 && settings.root_rel_tolerance == 0.0) {
    throw std::invalid_argument("at least one root tolerance must be positive");
  }
}

Bracket bracketRoot(const ScalarFunction &fn, double x0, double dx, const SolverSettings &settings) {
  validateSolverSettings(settings);

  const double ratio = settings.bracket_search_factor;
  const int max_iter = settings.max_bracket_iterations;
  int niter = 0;
  dx = std::abs(dx);

  double f0 = checkedEvaluate(fn, x0);
  double x_left = x0 - dx;
  double x_right = x0 + dx;
  double f_left = checkedEvaluate(fn, x_left);
  double f_right = checkedEvaluate(fn, x_right);

  // Overshot an extremum: shrink the step until the slope agrees on both sides
  if ((f0 - f_left) * (f_right - f0) < 0.0) {
    while ((f0 - f_left) * (f_right - f0) < 0.0 && dx > std::numeric_limits<double>::epsilon() &&
           niter < max_iter) {
      dx /= ratio;
      x_left = x0 - dx;
      x_right = x0 + dx;
      f_left = checkedEvaluate(fn, x_left);
      f_right = checkedEvaluate(fn, x_right);
      niter++;
    }
    if (niter == max_iter) {
      throw RootNotBracketedError("Cannot find zero: function is not monotonic around the start point");
    }
  }

  niter = 0;
  const double slope = f_right - f0;
  double x1;
  double f1;
  if ((slope > 0.0 && f0 <= 0.0) || (slope < 0.0 && f0 > 0.0)) {
    // Walk right
    x1 = x_right;
    f1 = f_right;
  } else {
    // Walk left
    dx = -dx;
    x1 = x_left;
    f1 = f_left;
  }

  double restart_step = std::abs(dx);

  while (f0 * f1 > 0.0 && niter < max_iter) {
    dx *= ratio;
    const double x_new = x1 + dx;
    const double f_new = fn(x_new);
    niter++;

    // Left the domain, or |f| grew again so the step jumped over an extremum:
    // go back one point and walk on with a smaller step
    if (!std::isfinite(f_new) || (f_new * f1 > 0.0 && std::abs(f_new) > std::abs(f1))) {
      if (settings.debug_mode) {
        std::cout << "[bracket] step " << niter << ": rejected x = " << x_new << ", f = " << f_new
                  << ", restarting from " << x0 << std::endl;
      }
      restart_step /= ratio;
      x1 = x0;
      f1 = f0;
      dx = std::copysign(restart_step, dx) / ratio;
      continue;
    }

    x0 = x1;
    f0 = f1;
    x1 = x_new;
    f1 = f_new;

    if (settings.debug_mode && niter % 10 == 0) {
      std::cout << "[bracket] step " << niter << ": [" << x0 << ", " << x1 << "], f = (" << f0 << ", "
                << f1 << ")" << std::endl;
    }
  }

  if (f0 * f1 > 0.0) {
    std::ostringstream msg;
    msg << "Cannot find zero after " << niter << " bracket steps (last interval [" << x0 << ", " << x1
        << "])";
    throw RootNotBracketedError(msg.str());
  }

  Bracket bracket;
  bracket.a = x0;
  bracket.b = x1;
  bracket.fa = f0;
  bracket.fb = f1;
  bracket.iterations = niter;
  return bracket;
}

RootResult brentRoot(const ScalarFunction &fn, const Bracket &bracket, const SolverSettings &settings) {
  validateSolverSettings(settings);
  disableGslAbort();

  RootResult result;
  if (bracket.fa == 0.0) {
    result.root = bracket.a;
    result.converged = true;
    return result;
  }
  if (bracket.fb == 0.0) {
    result.root = bracket.b;
    result.converged = true;
    return result;
  }
  if (bracket.fa * bracket.fb > 0.0) {
    throw std::invalid_argument("brentRoot: bracket endpoints do not straddle zero");
  }

  ScalarContext ctx{&fn, nullptr};
  gsl_function F;
  F.function = &evaluateScalar;
  F.params = &ctx;

  FsolverPtr s(gsl_root_fsolver_alloc(gsl_root_fsolver_brent), &gsl_root_fsolver_free);
  if (!s) {
    throw std::runtime_error("brentRoot: could not allocate GSL root solver");
  }

  double x_lo = std::min(bracket.a, bracket.b);
  double x_hi = std::max(bracket.a, bracket.b);

  int status = gsl_root_fsolver_set(s.get(), &F, x_lo, x_hi);
  if (ctx.error) {
    std::rethrow_exception(ctx.error);
  }
  if (status != GSL_SUCCESS) {
    throw DomainError(std::string("GSL root solver setup failed: ") + gsl_strerror(status));
  }

  int iter = 0;
  do {
    iter++;
    status = gsl_root_fsolver_iterate(s.get());
    if (ctx.error) {
      std::rethrow_exception(ctx.error);
    }
    if (status != GSL_SUCCESS) {
      throw DomainError(std::string("GSL root solver failed: ") + gsl_strerror(status));
    }

    result.root = gsl_root_fsolver_root(s.get());
    x_lo = gsl_root_fsolver_x_lower(s.get());
    x_hi = gsl_root_fsolver_x_upper(s.get());
    status = gsl_root_test_interval(x_lo, x_hi, settings.root_abs_tolerance, settings.root_rel_tolerance);

    if (settings.debug_mode) {
      std::cout << "[brent] iter " << iter << ": x = " << result.root << ", interval [" << x_lo << ", "
                << x_hi << "]" << std::endl;
    }
  } while (status == GSL_CONTINUE && iter < settings.max_root_iterations);

  result.iterations = iter;
  if (status != GSL_SUCCESS) {
    std::ostringstream msg;
    msg << "Root refinement did not converge after " << iter << " iterations (interval [" << x_lo << ", "
        << x_hi << "])";
    throw NonConvergenceError(msg.str(), iter);
  }

  result.converged = true;
  return result;
}
