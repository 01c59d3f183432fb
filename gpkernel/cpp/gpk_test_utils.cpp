/*!
  \file gpk_test_utils.cpp
  \rst
  Implementations of utilities useful for unit testing.
\endrst*/

#include "gpk_test_utils.hpp"

#include <cmath>
#include <cstdint>
#include <cstdio>

#include <limits>
#include <vector>

#include "gpk_common.hpp"
#include "gpk_logging.hpp"

// Define GPK_PING_TEST_DEBUG_PRINT to make PingDerivative() very verbose, printing details about every
// (input, output) pair it checks.
#ifdef GPK_PING_TEST_DEBUG_PRINT
#define GPK_PING_TEST_DEBUG_PRINTF(...) std::printf(__VA_ARGS__)
#else
#define GPK_PING_TEST_DEBUG_PRINTF(...) (void)0
#endif

namespace gpkernel {

bool CheckIntEquals(int64_t value, int64_t truth) noexcept {
  bool passed = value == truth;

  if (passed == false) {
    GPK_ERROR_PRINTF("value = %lld, truth = %lld, diff = %lld\n", static_cast<long long>(value),
                     static_cast<long long>(truth), static_cast<long long>(truth - value));
  }
  return passed;
}

bool CheckDoubleWithin(double value, double truth, double tolerance) noexcept {
  double diff = std::fabs(value - truth);
  bool passed = diff <= tolerance;

  if (passed != true) {
    GPK_ERROR_PRINTF("value = %.18E, truth = %.18E, diff = %.18E, tol = %.18E\n", value, truth, diff, tolerance);
  }
  return passed;
}

bool CheckDoubleWithinRelativeWithThreshold(double value, double truth, double tolerance, double threshold) noexcept {
  double denom = std::fabs(truth);
  if (denom < threshold) {
    denom = 1.0;  // don't divide by 0
  }
  double diff = std::fabs((value - truth)/denom);
  bool passed = diff <= tolerance;
  if (passed != true) {
    GPK_ERROR_PRINTF("value = %.18E, truth = %.18E, diff = %.18E, tol = %.18E\n", value, truth, diff, tolerance);
  }
  return passed;
}

bool CheckDoubleWithinRelative(double value, double truth, double tolerance) noexcept {
  return CheckDoubleWithinRelativeWithThreshold(value, truth, tolerance, std::numeric_limits<double>::min());
}

namespace {

/*!\rst
  ``(f(x + h) - f(x - h))/(2h)``, second order accurate approximation of ``f'(x)``.
\endrst*/
GPK_CONST_FUNCTION GPK_WARN_UNUSED_RESULT double CenteredFiniteDifference(double function_p, double function_m, double epsilon) noexcept {
  return (function_p - function_m)/2.0/epsilon;
}

/*!\rst
  Finite difference data for one input entry ``X[i_cols][i_rows]`` at both step sizes.
  ``*_p`` means "plus" (``x + h`` or ``f(x + h)``), ``*_m`` means "minus."
\endrst*/
struct PingSample {
  explicit PingSample(int num_outputs)
      : function_p(2*num_outputs), function_m(2*num_outputs), error(2*num_outputs) {
  }

  //! ``f(X + h_e)``, indexed ``[e][k]``
  std::vector<double> function_p;
  //! ``f(X - h_e)``, indexed ``[e][k]``
  std::vector<double> function_m;
  //! ``|analytic - finite difference|``, indexed ``[k][e]``
  std::vector<double> error;
  //! the steps actually taken, ``fl(-x + fl(x + h))``
  double epsilon_actual[2];
};

/*!\rst
  Evaluates ``f`` around ``X`` for a single perturbed entry, ``index``, at both step sizes, and the error of the
  finite difference gradient against the analytic gradient for every output.

  The floating point value ``fl(x + h)`` is not exactly ``x + h``; we estimate the step actually taken as
  ``h' = fl(-x + fl(x + h))``, which is accurate to about ``h`` times machine precision when ``h << x``.
\endrst*/
void ComputePingSample(const PingableMatrixInputVectorOutputInterface& function_and_derivative_evaluator,
                       double const * restrict points, double const epsilon[2], int i_rows, int i_cols, int num_rows,
                       int num_outputs, std::vector<double> * points_p, std::vector<double> * points_m,
                       PingSample * sample) {
  const int index = i_cols*num_rows + i_rows;
  for (int i_epsilon = 0; i_epsilon < 2; ++i_epsilon) {
    // only ONE entry of X is varied at a time
    points_p->assign(points, points + points_p->size());
    points_m->assign(points, points + points_m->size());

    (*points_p)[index] += epsilon[i_epsilon];
    (*points_m)[index] -= epsilon[i_epsilon];
    sample->epsilon_actual[i_epsilon] = (*points_p)[index] - points[index];

    double * function_p = sample->function_p.data() + i_epsilon*num_outputs;
    double * function_m = sample->function_m.data() + i_epsilon*num_outputs;
    function_and_derivative_evaluator.EvaluateFunction(points_p->data(), function_p);
    function_and_derivative_evaluator.EvaluateFunction(points_m->data(), function_m);

    for (int k = 0; k < num_outputs; ++k) {
      const double grad_function_f = CenteredFiniteDifference(function_p[k], function_m[k], sample->epsilon_actual[i_epsilon]);
      const double grad_function_a = function_and_derivative_evaluator.GetAnalyticGradient(i_rows, i_cols, k);
      sample->error[k*2 + i_epsilon] = std::fabs(grad_function_a - grad_function_f);
    }
  }
}

}  // end unnamed namespace

/*!\rst
  For each input entry ``x = X[i_cols][i_rows]`` and each output ``k``, we compute the errors ``e_1, e_2`` of centered
  differences at steps ``h_1, h_2`` against the analytic gradient.  For a correct gradient,
  ``e = O(h^2)``, so the observed rate ``log(e_1/e_2)/log(h_1/h_2)`` should be near 2.

  The rate is meaningless when there is not enough precision to resolve ``f(x + h) - f(x - h)``.  We skip or relax
  the check when:

  1. both errors are tiny relative to ``f`` (the result is "too accurate" to measure a rate) or to ``x``;
  2. the analytic gradient is small relative to ``f``: the tolerance ramps linearly from ``rate_tolerance_fine`` to
     ``rate_tolerance_relaxed`` as ``|grad|/|f|`` falls below 1.0e-2;
  3. the rate is wrong but the errors are small in absolute terms for tiny ``|grad|/|f|`` or tiny ``|f|``.

  Better than expected convergence (rates in ``(2.4, 6)``) is accepted.

  .. WARNING:: these bypasses lose some true positives.  A wrong implementation can be constructed that passes.
    Define GPK_PING_TEST_DEBUG_PRINT to see every rate computed.
\endrst*/
int PingDerivative(const PingableMatrixInputVectorOutputInterface& function_and_derivative_evaluator, double const * restrict points, double epsilon[2], double rate_tolerance_fine, double rate_tolerance_relaxed, double input_output_ratio) {
  int num_rows, num_cols;
  function_and_derivative_evaluator.GetInputSizes(&num_rows, &num_cols);
  const int num_outputs = function_and_derivative_evaluator.GetOutputSize();

  std::vector<double> points_p(num_rows*num_cols);
  std::vector<double> points_m(num_rows*num_cols);
  PingSample sample(num_outputs);

  const double rate_exact = 2.0;
  int ping_failures = 0;
  for (int i_cols = 0; i_cols < num_cols; ++i_cols) {
    for (int i_rows = 0; i_rows < num_rows; ++i_rows) {
      ComputePingSample(function_and_derivative_evaluator, points, epsilon, i_rows, i_cols, num_rows, num_outputs,
                        &points_p, &points_m, &sample);
      const double input_magnitude = std::fabs(points[i_cols*num_rows + i_rows]);

      for (int k = 0; k < num_outputs; ++k) {
        const double error_coarse = sample.error[k*2 + 0];
        const double error_fine = sample.error[k*2 + 1];
        // magnitude of the values differenced at the fine step; + min() prevents division by 0
        const double function_value_norm = std::sqrt(Square(sample.function_p[num_outputs + k]) +
                                                     Square(sample.function_m[num_outputs + k])) +
            std::numeric_limits<double>::min();
        const double grad_function_a = function_and_derivative_evaluator.GetAnalyticGradient(i_rows, i_cols, k);
        const double grad_to_value = std::fabs(grad_function_a)/function_value_norm;

        if (error_coarse/function_value_norm < 1.0e-20 && error_fine/function_value_norm < 1.0e-20) {
          continue;
        }
        if (error_coarse/input_magnitude < input_output_ratio && error_fine/input_magnitude < input_output_ratio) {
          continue;
        }

        const double rate = std::log10(error_coarse/error_fine)/std::log10(sample.epsilon_actual[0]/sample.epsilon_actual[1]);
        const double rate_error = std::fabs(rate_exact - rate);
        GPK_PING_TEST_DEBUG_PRINTF("k=%d, rate = %.18E, |2 - rate| = %.18E\n", k, rate, rate_error);

        double rate_tolerance = rate_tolerance_fine;
        if (grad_to_value < 1.0e-2) {
          rate_tolerance = rate_tolerance_relaxed + grad_to_value/1.0e-2*(rate_tolerance_fine - rate_tolerance_relaxed);
          GPK_PING_TEST_DEBUG_PRINTF("rate_tolerance = %.18E\n", rate_tolerance);
        }

        // NaN probably means epsilon[0] == epsilon[1]
        if (rate_error <= rate_tolerance && !std::isnan(rate)) {
          continue;
        }
        if (rate > 1.2*rate_exact && rate < 3*rate_exact) {
          continue;
        }
        GPK_PING_TEST_DEBUG_PRINTF("analytic/value: %.18E, error/value: %.18E\n", grad_to_value, error_fine/function_value_norm);
        if (grad_to_value < 1.0e-5 && error_fine/function_value_norm < 1.0e-11) {
          continue;
        }
        if (function_value_norm < 1.0e-8 && error_fine/function_value_norm < 1.0e-12) {
          continue;
        }

        ++ping_failures;
        GPK_ERROR_PRINTF("point[%d,%d] = %.18E\n", i_rows, i_cols, points[i_cols*num_rows + i_rows]);
        for (int i_epsilon = 0; i_epsilon < 2; ++i_epsilon) {
          const double function_p = sample.function_p[i_epsilon*num_outputs + k];
          const double function_m = sample.function_m[i_epsilon*num_outputs + k];
          const double grad_function_f = CenteredFiniteDifference(function_p, function_m, sample.epsilon_actual[i_epsilon]);
          GPK_ERROR_PRINTF("i_rows = %d, i_cols = %d, k = %d, epsilon = %.6E\n", i_rows, i_cols, k, sample.epsilon_actual[i_epsilon]);
          GPK_ERROR_PRINTF("fcn_p[k] = %.18E, fcn_m[k] = %.18E\n", function_p, function_m);
          GPK_ERROR_PRINTF("analytic: %.18E\n", grad_function_a);
          GPK_ERROR_PRINTF("finite  : %.18E\n", grad_function_f);
          GPK_ERROR_PRINTF("diff    : %.18E\n", sample.error[k*2 + i_epsilon]);
        }
        GPK_ERROR_PRINTF("ERROR PING FAILED on i_rows = %d, i_cols = %d, k = %d\n", i_rows, i_cols, k);
        GPK_ERROR_PRINTF("k=%d, rate = %.18E, |2 - rate| = %.18E\n", k, rate, rate_error);
      }
    }
  }

  if (ping_failures != 0) {
    GPK_ERROR_PRINTF("points:\n");
    PrintMatrix(points, num_rows, num_cols);
  }

  return ping_failures;
}

}  // end namespace gpkernel
