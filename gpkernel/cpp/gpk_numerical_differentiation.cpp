/*!
  \file gpk_numerical_differentiation.cpp
  \rst
  Non-template helpers for the forward-difference differentiator in gpk_numerical_differentiation.hpp.
\endrst*/

#include "gpk_numerical_differentiation.hpp"

#include <cmath>

#include <limits>

#include "gpk_common.hpp"

namespace gpkernel {

double Chop(double value) noexcept {
  return std::fabs(value) < std::numeric_limits<double>::epsilon() ? 0.0 : value;
}

int RequiredPrecisionBits(int total_order) noexcept {
  return kDifferentiationBitsPerOrder*(total_order + 1);
}

/*!\rst
  Computes ``binom(n, k)`` with the multiplicative formula, staying in integers: after step ``i``, ``result`` is
  ``binom(n - k + i, i)``, so every division is exact.
\endrst*/
long long ForwardDifferenceWeight(int order, int index) noexcept {
  const int k = index < order - index ? index : order - index;
  long long result = 1;
  for (int i = 1; i <= k; ++i) {
    result = result*(order - k + i)/i;
  }
  return (order - index) % 2 == 0 ? result : -result;
}

}  // end namespace gpkernel
