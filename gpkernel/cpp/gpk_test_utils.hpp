/*!
  \file gpk_test_utils.hpp
  \rst
  Functions and classes that are useful for unit testing: absolute/relative precision checks and ping testing.

  The "big stuff" in this file is the interface for a pingable function,

  ``PingableMatrixInputVectorOutputInterface``

  and ``PingDerivative()``, which checks the analytic gradient of any implementer of that interface against
  centered finite differences.
\endrst*/

#ifndef GPKERNEL_CPP_GPK_TEST_UTILS_HPP_
#define GPKERNEL_CPP_GPK_TEST_UTILS_HPP_

#include <cstdint>

#include "gpk_common.hpp"

namespace gpkernel {

/*!\rst
  A function ``f: R^{num_rows x num_cols} -> R^{num_outputs}`` together with its analytic gradient
  ``gradf[d][i][k] = \partial f_k/\partial X_{d,i}``, in a form PingDerivative() can check.

  For kernel derivatives ``X`` is a batch of points (``d`` over spatial dimensions, ``i`` over points) and ``f_k`` is
  a derivative of order ``|n|``; its gradient is then the same derivative with one more order in dimension ``d``.

  Call EvaluateAndStoreAnalyticGradient() once at the base point, then GetAnalyticGradient() per entry.
  PingDerivative() compares those entries against ``(f(X + h) - f(X - h))/(2h)`` built from EvaluateFunction().
\endrst*/
class PingableMatrixInputVectorOutputInterface {
 public:
  //! Shape of the input ``X``.
  virtual void GetInputSizes(int * num_rows, int * num_cols) const noexcept GPK_NONNULL_POINTERS = 0;

  //! Number of outputs of ``f``.
  virtual int GetOutputSize() const noexcept GPK_PURE_FUNCTION GPK_WARN_UNUSED_RESULT = 0;

  /*!\rst
    \return
      MUST be ``num_rows*num_cols*GetOutputSize()``; invalid memory read/writes may occur otherwise
  \endrst*/
  virtual int GetGradientsSize() const noexcept GPK_PURE_FUNCTION GPK_WARN_UNUSED_RESULT = 0;

  /*!\rst
    Computes and keeps ``gradf`` at ``input_matrix``; required before GetAnalyticGradient().

    \param
      :input_matrix[num_rows][num_cols]: base point ``X``
    \output
      :gradients[num_rows][num_cols][num_outputs]: copy of the stored gradient unless nullptr (optional to support)
  \endrst*/
  virtual void EvaluateAndStoreAnalyticGradient(double const * restrict input_matrix, double * restrict gradients) GPK_NONNULL_POINTERS_LIST(2) = 0;

  //! Stored ``gradf[row_index][column_index][output_index]``.
  virtual double GetAnalyticGradient(int row_index, int column_index, int output_index) const GPK_PURE_FUNCTION GPK_WARN_UNUSED_RESULT = 0;

  //! ``function_values[num_outputs] = f(input_matrix)``.
  virtual void EvaluateFunction(double const * restrict input_matrix, double * restrict function_values) const GPK_NONNULL_POINTERS = 0;

  GPK_DISALLOW_COPY_AND_ASSIGN(PingableMatrixInputVectorOutputInterface);

 protected:
  PingableMatrixInputVectorOutputInterface() = default;

  virtual ~PingableMatrixInputVectorOutputInterface() = default;
};

//! ``value == truth``
bool CheckIntEquals(int64_t value, int64_t truth) noexcept GPK_PURE_FUNCTION GPK_WARN_UNUSED_RESULT;

//! ``|value - truth| <= tolerance``
bool CheckDoubleWithin(double value, double truth, double tolerance) noexcept GPK_PURE_FUNCTION GPK_WARN_UNUSED_RESULT;

/*!\rst
  ``|value - truth| <= tolerance*|truth|``; falls back to CheckDoubleWithin() when ``truth == 0.0``.
\endrst*/
bool CheckDoubleWithinRelative(double value, double truth, double tolerance) noexcept GPK_PURE_FUNCTION GPK_WARN_UNUSED_RESULT;

/*!\rst
  As CheckDoubleWithinRelative(), but the absolute check is used whenever ``|truth| < threshold``.  Closed-form
  derivatives such as ``(y - n + 1) e^{-y}`` cross 0, where relative error is meaningless.
\endrst*/
bool CheckDoubleWithinRelativeWithThreshold(double value, double truth, double tolerance, double threshold) noexcept GPK_PURE_FUNCTION GPK_WARN_UNUSED_RESULT;

/*!\rst
  Checks the correctness of analytic gradient calculations using finite differences.

  We compute centered differences at two step sizes and check that the error decreases at the expected second-order
  rate.  When the analytic derivative is near 0 or the function values are small, the rate cannot be computed
  reliably; those entries are skipped or tested at relaxed tolerances (see the implementation).  This heavily favors
  eliminating false positives, so test at many (random) points.

  .. WARNING:: this function generates ~10 lines of output (to stdout) PER FAILURE.

  \param
    :function_and_derivative_evaluator: an object implementing PingableMatrixInputVectorOutputInterface
    :points[num_cols][num_rows]: num_cols points, each with dimension num_rows.  Coordinate magnitudes are assumed
      to be "around 1.0": say [1.0e-3, 1.0e1].
    :epsilon[2]: ``array[h1, h2]`` of step sizes to use for finite differencing; 1.0e-2, 1.0e-3 are suggested
      starting values
    :rate_tolerance_fine: desired amount of deviation from the exact rate
    :rate_tolerance_relaxed: maximum allowable amount of deviation from the exact rate
    :input_output_ratio: for ``||error||/||input|| < input_output_ratio``, ping testing is not performed.
      Suggest values around 1.0e-15 to 1.0e-18 (around machine precision).
  \return
    The number of gradient entries that failed pinging.  Expected to be 0.
\endrst*/
int PingDerivative(const PingableMatrixInputVectorOutputInterface& function_and_derivative_evaluator, double const * restrict points, double epsilon[2], double rate_tolerance_fine, double rate_tolerance_relaxed, double input_output_ratio) GPK_WARN_UNUSED_RESULT;

}  // end namespace gpkernel

#endif  // GPKERNEL_CPP_GPK_TEST_UTILS_HPP_
