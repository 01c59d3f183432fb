/*!
  \file gpk_numerical_differentiation.hpp
  \rst
  Arbitrary-precision numerical differentiation of scalar functions of one or more variables.

  This is used where closed forms for derivatives break down: at the origin, the Matern envelope ``x^nu K_nu(x)`` and
  the radial distance ``sqrt(2 nu sum tau_i^2/l_i^2)`` are not smooth (or their closed forms divide by zero), but
  their one-sided derivatives are still well-defined (or, for mixed radial derivatives, large and finite when
  sampled at a finite step).

  **Method**

  We compute a one-sided (forward) tensor-product difference with step ``h = 2^-63``::

    D^n f(x) ~= h^-n * sum_{k_0 = 0..n_0} ... sum_{k_{d-1} = 0..n_{d-1}}
                    prod_d (-1)^(n_d - k_d) binom(n_d, k_d) * f(x_0 + (k_0 + 1/2)h, ..., x_{d-1} + (k_{d-1} + 1/2)h)

  where coordinates with ``n_d = 0`` are held fixed at ``x_d`` (and do not contribute a sum).  The half-step offset
  keeps every sample strictly on the positive side of ``x``, so ``f`` is never evaluated at a singular point.

  The ``h^-n`` factor amplifies rounding error by ``2^(63 n)``, so the sum is carried out with
  ``(53 + 20)(n + 1)`` or more bits of precision.  We use three fixed-width boost::multiprecision::cpp_bin_float tiers
  (512, 1024, 2048 bits) and pick the smallest that suffices; orders beyond the 2048-bit tier are rejected.

  **Functors**

  Functions are passed as functors with a templated call operator, evaluated at the tier's number type::

    struct Square {
      template <typename Real>
      Real operator()(const std::vector<Real>& x) const {
        return x[0]*x[0];
      }
    };

  Use ``ldexp``, ``pow``, ``sqrt``, etc. unqualified (or from boost::math) so that ADL finds the multiprecision
  overloads.
\endrst*/

#ifndef GPKERNEL_CPP_GPK_NUMERICAL_DIFFERENTIATION_HPP_
#define GPKERNEL_CPP_GPK_NUMERICAL_DIFFERENTIATION_HPP_

#include <vector>

#include <boost/multiprecision/cpp_bin_float.hpp>  // NOLINT(build/include_order)

#include "gpk_common.hpp"
#include "gpk_exception.hpp"

namespace gpkernel {

//! precision tiers for the numerical differentiator
using MultiprecisionFloat512 = boost::multiprecision::number<
  boost::multiprecision::cpp_bin_float<512, boost::multiprecision::digit_base_2>, boost::multiprecision::et_off>;
using MultiprecisionFloat1024 = boost::multiprecision::number<
  boost::multiprecision::cpp_bin_float<1024, boost::multiprecision::digit_base_2>, boost::multiprecision::et_off>;
using MultiprecisionFloat2048 = boost::multiprecision::number<
  boost::multiprecision::cpp_bin_float<2048, boost::multiprecision::digit_base_2>, boost::multiprecision::et_off>;

//! finite difference step is ``2^-kDifferentiationStepExponent``
static constexpr int kDifferentiationStepExponent = 53 + 10;
//! bits of precision required per unit of total derivative order (plus one)
static constexpr int kDifferentiationBitsPerOrder = 53 + 20;
//! largest total derivative order that fits in the widest precision tier
static constexpr int kMaxDifferentiationOrder = 27;

/*!\rst
  Round values that are numerically zero down to exactly zero.

  \param
    :value: number to chop
  \return
    0.0 if ``|value| < 2^-52`` (double precision epsilon); value otherwise
\endrst*/
double Chop(double value) noexcept GPK_CONST_FUNCTION GPK_WARN_UNUSED_RESULT;

/*!\rst
  \param
    :total_order: sum of the per-coordinate derivative orders, ``>= 0``
  \return
    number of bits of precision needed to differentiate to ``total_order`` with step ``2^-63``
\endrst*/
int RequiredPrecisionBits(int total_order) noexcept GPK_CONST_FUNCTION GPK_WARN_UNUSED_RESULT;

/*!\rst
  Weight of the ``k``-th sample in an ``n``-th order forward difference: ``(-1)^(n - k) binom(n, k)``.
  Exact for all ``n <= kMaxDifferentiationOrder``.

  \param
    :order: derivative order n
    :index: sample index k, ``0 <= k <= n``
  \return
    ``(-1)^(n - k) binom(n, k)``
\endrst*/
long long ForwardDifferenceWeight(int order, int index) noexcept GPK_CONST_FUNCTION GPK_WARN_UNUSED_RESULT;

/*!\rst
  Forward difference in a fixed precision.  Generally you want NumericalDerivative(), which chooses the precision.

  \param
    :function: functor with a ``template <typename Real> Real operator()(const std::vector<Real>&) const``
    :point: coordinates x at which to differentiate
    :orders[point.size()]: derivative order per coordinate
    :singular: true if function may not be evaluated at point itself (only matters when all orders are 0)
  \return
    the mixed partial derivative, in precision Real
\endrst*/
template <typename Real, typename Function>
Real NumericalDerivativeInPrecision(const Function& function, const std::vector<double>& point,
                                    const std::vector<int>& orders, bool singular) {
  const int dim = point.size();
  const Real step = ldexp(Real(1), -kDifferentiationStepExponent);
  int total_order = 0;
  for (const auto order : orders) {
    total_order += order;
  }

  std::vector<Real> sample(dim);
  if (total_order == 0) {
    for (int d = 0; d < dim; ++d) {
      sample[d] = singular ? Real(point[d]) + step/2 : Real(point[d]);
    }
    return function(sample);
  }

  // odometer over the tensor grid of sample indices; coordinates with order 0 never advance
  std::vector<int> index(dim, 0);
  Real sum(0);
  while (true) {
    long long weight = 1;
    for (int d = 0; d < dim; ++d) {
      if (orders[d] > 0) {
        sample[d] = Real(point[d]) + (index[d] + Real(0.5))*step;
        weight *= ForwardDifferenceWeight(orders[d], index[d]);
      } else {
        sample[d] = Real(point[d]);
      }
    }
    sum += Real(weight)*function(sample);

    int d = 0;
    while (d < dim && index[d] == orders[d]) {
      index[d] = 0;
      ++d;
    }
    if (d == dim) {
      break;
    }
    ++index[d];
  }

  // divide by h^n
  return ldexp(sum, kDifferentiationStepExponent*total_order);
}

/*!\rst
  Numerically differentiate ``function`` at ``point``, approaching from the positive side of every coordinate.

  Selects the smallest precision tier with at least RequiredPrecisionBits() bits.  This is slow (especially with
  Bessel functions in the integrand); callers should only use it where no closed form exists.

  \param
    :function: functor with a ``template <typename Real> Real operator()(const std::vector<Real>&) const``
    :point: coordinates x at which to differentiate
    :orders[point.size()]: derivative order per coordinate, each ``>= 0``
    :singular: true if function may not be evaluated at point itself (only matters when all orders are 0)
  \return
    the mixed partial derivative, rounded to double
\endrst*/
template <typename Function>
double NumericalDerivative(const Function& function, const std::vector<double>& point,
                           const std::vector<int>& orders, bool singular) {
  if (unlikely(point.size() != orders.size())) {
    GPK_THROW_EXCEPTION(InvalidValueException<int>, "Derivative orders must match the number of coordinates.",
                        static_cast<int>(orders.size()), static_cast<int>(point.size()));
  }
  int total_order = 0;
  for (const auto order : orders) {
    if (unlikely(order < 0)) {
      GPK_THROW_EXCEPTION(LowerBoundException<int>, "Derivative orders must be non-negative.", order, 0);
    }
    total_order += order;
  }
  if (unlikely(total_order > kMaxDifferentiationOrder)) {
    GPK_THROW_EXCEPTION(UpperBoundException<int>, "Total derivative order exceeds the widest precision tier.",
                        total_order, kMaxDifferentiationOrder);
  }

  const int precision_bits = RequiredPrecisionBits(total_order);
  if (precision_bits <= 512) {
    return static_cast<double>(NumericalDerivativeInPrecision<MultiprecisionFloat512>(function, point, orders, singular));
  } else if (precision_bits <= 1024) {
    return static_cast<double>(NumericalDerivativeInPrecision<MultiprecisionFloat1024>(function, point, orders, singular));
  } else {
    return static_cast<double>(NumericalDerivativeInPrecision<MultiprecisionFloat2048>(function, point, orders, singular));
  }
}

}  // end namespace gpkernel

#endif  // GPKERNEL_CPP_GPK_NUMERICAL_DIFFERENTIATION_HPP_
