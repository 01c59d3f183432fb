/*!
  \file gpk_covariance.cpp
  \rst
  This file contains function definitions for the ChainRuleCovariance chain-rule machinery and the MaternKernel
  primitives (value, outer derivatives, inner derivatives) declared in gpk_covariance.hpp.

  The numerical fallbacks at the origin instantiate the multiprecision differentiator (and hence the multiprecision
  Bessel functions) for the functors in the unnamed namespace below.  This is the only translation unit that does so.
\endrst*/

#include "gpk_covariance.hpp"

#include <cmath>

#include <algorithm>
#include <functional>
#include <limits>
#include <map>
#include <utility>
#include <vector>

#include <boost/math/special_functions/bessel.hpp>  // NOLINT(build/include_order)
#include <boost/math/special_functions/binomial.hpp>  // NOLINT(build/include_order)
#include <boost/math/special_functions/factorials.hpp>  // NOLINT(build/include_order)
#include <boost/math/special_functions/gamma.hpp>  // NOLINT(build/include_order)

#include "gpk_common.hpp"
#include "gpk_exception.hpp"
#include "gpk_logging.hpp"
#include "gpk_numerical_differentiation.hpp"
#include "gpk_set_partition.hpp"

namespace gpkernel {

namespace {

/*!\rst
  Validate hyperparameters for a MaternKernel in ``dim`` dimensions.  Throws on failure:

  * ``dim <= 0``: LowerBoundException<int>
  * ``lengths.size() != dim``: InvalidValueException<int>
  * ``sigma, nu, lengths[i] <= 0``: LowerBoundException<double>
\endrst*/
void ValidateMaternHyperparameters(int dim, const MaternHyperparameters& hyperparameters) {
  if (unlikely(dim <= 0)) {
    GPK_THROW_EXCEPTION(LowerBoundException<int>, "Non-positive spatial dimension.", dim, 1);
  }

  if (static_cast<unsigned>(dim) != hyperparameters.lengths.size()) {
    GPK_THROW_EXCEPTION(InvalidValueException<int>, "dim (truth) and length vector size do not match.",
                        static_cast<int>(hyperparameters.lengths.size()), dim);
  }

  if (hyperparameters.sigma <= 0.0) {
    GPK_THROW_EXCEPTION(LowerBoundException<double>, "Invalid hyperparameter (sigma).", hyperparameters.sigma,
                        std::numeric_limits<double>::min());
  }

  if (hyperparameters.nu <= 0.0) {
    GPK_THROW_EXCEPTION(LowerBoundException<double>, "Invalid hyperparameter (nu).", hyperparameters.nu,
                        std::numeric_limits<double>::min());
  }

  for (const auto length : hyperparameters.lengths) {
    if (unlikely(length <= 0.0)) {
      GPK_THROW_EXCEPTION(LowerBoundException<double>, "Invalid hyperparameter (length).", length,
                          std::numeric_limits<double>::min());
    }
  }
}

/*!\rst
  ``x^\nu K_\nu(x)``, the Matern envelope without its normalization.  Functor for NumericalDerivative().
\endrst*/
class MaternEnvelope {
 public:
  explicit MaternEnvelope(double nu) : nu_(nu) {
  }

  template <typename Real>
  Real operator()(const std::vector<Real>& x) const {
    const Real nu(nu_);
    return pow(x[0], nu)*boost::math::cyl_bessel_k(nu, x[0]);
  }

 private:
  double nu_;
};

/*!\rst
  ``y(tau) = \sqrt{2\nu \sum_i \tau_i^2/l_i^2}``.  Functor for NumericalDerivative().
\endrst*/
class RadialArgument {
 public:
  RadialArgument(double nu, const std::vector<double>& lengths_sq) : nu_(nu), lengths_sq_(lengths_sq) {
  }

  template <typename Real>
  Real operator()(const std::vector<Real>& tau) const {
    Real r2l2(0);
    for (typename std::vector<Real>::size_type i = 0; i < tau.size(); ++i) {
      r2l2 += tau[i]*tau[i]/lengths_sq_[i];
    }
    return sqrt(Real(2.0*nu_)*r2l2);
  }

 private:
  double nu_;
  const std::vector<double>& lengths_sq_;
};

/*!\rst
  ``j``-th derivative of ``K_\nu`` at ``y``::

    K_\nu^{(j)}(y) = (-1)^j 2^{-j} \sum_{i=0}^j \binom{j}{i} K_{\nu - j + 2i}(y)

  using ``K_{-v} = K_v``.
\endrst*/
double BesselKDerivative(double nu, int j, double y) {
  double sum = 0.0;
  for (int i = 0; i <= j; ++i) {
    sum += boost::math::binomial_coefficient<double>(j, i)*boost::math::cyl_bessel_k(std::fabs(nu - j + 2*i), y);
  }
  sum = std::ldexp(sum, -j);
  return j % 2 == 0 ? sum : -sum;
}

}  // end unnamed namespace

void ChainRuleCovariance::ComputeDkDtau(double const * restrict tau, int const * restrict derivative_orders,
                                        int num_points, double * restrict dk_dtau) const {
  std::vector<int> multi_index;
  for (int d = 0; d < dim_; ++d) {
    if (unlikely(derivative_orders[d] < 0)) {
      GPK_THROW_EXCEPTION(LowerBoundException<int>, "Negative derivative order.", derivative_orders[d], 0);
    }
    multi_index.insert(multi_index.end(), derivative_orders[d], d);
  }

  if (multi_index.empty()) {
    ComputeK(tau, num_points, dk_dtau);
    return;
  }

  std::vector<double> y(num_points);
  std::vector<double> r2l2(num_points);
  ComputeY(tau, num_points, y.data(), r2l2.data());

  // f^{(m)}(y) depends only on the block count m: one ComputeDkDy() per m serves every partition
  const int order = multi_index.size();
  std::vector<double> dk_dy((order + 1)*num_points);
  for (int m = 1; m <= order; ++m) {
    ComputeDkDy(y.data(), num_points, m, dk_dy.data() + m*num_points);
  }

  std::vector<double> term(num_points);
  std::vector<double> dy_dtau(num_points);
  std::fill(dk_dtau, dk_dtau + num_points, 0.0);
  for (const auto& partition : GenerateSetPartitions(multi_index)) {
    const double * restrict dk_dy_partition = dk_dy.data() + partition.size()*num_points;
    std::copy(dk_dy_partition, dk_dy_partition + num_points, term.begin());
    for (const auto& block : partition) {
      ComputeDyDtau(tau, block, r2l2.data(), num_points, dy_dtau.data());
      for (int i = 0; i < num_points; ++i) {
        term[i] *= dy_dtau[i];
      }
    }
    for (int i = 0; i < num_points; ++i) {
      dk_dtau[i] += term[i];
    }
  }
}

/*!\rst
  Rows are grouped by their combined derivative orders ``n_1 + n_2`` so that each distinct derivative is assembled
  (set partitions enumerated, numerical fallbacks run) once per call.
\endrst*/
void ChainRuleCovariance::Evaluate(double const * restrict point_one_batch, double const * restrict point_two_batch,
                                   int const * restrict orders_one_batch, int const * restrict orders_two_batch,
                                   int num_points, double * restrict result) const {
  std::map<std::vector<int>, std::vector<int> > rows_by_orders;
  std::vector<int> combined_orders(dim_);
  for (int i = 0; i < num_points; ++i) {
    for (int d = 0; d < dim_; ++d) {
      combined_orders[d] = orders_one_batch[i*dim_ + d] + orders_two_batch[i*dim_ + d];
    }
    rows_by_orders[combined_orders].push_back(i);
  }

  const double sigma_sq = Square(sigma());
  for (const auto& group : rows_by_orders) {
    const std::vector<int>& rows = group.second;
    const int num_rows = rows.size();

    std::vector<double> tau(dim_*num_rows);
    for (int r = 0; r < num_rows; ++r) {
      for (int d = 0; d < dim_; ++d) {
        tau[r*dim_ + d] = point_one_batch[rows[r]*dim_ + d] - point_two_batch[rows[r]*dim_ + d];
      }
    }

    std::vector<double> dk_dtau(num_rows);
    ComputeDkDtau(tau.data(), group.first.data(), num_rows, dk_dtau.data());

    for (int r = 0; r < num_rows; ++r) {
      int order_two = 0;
      for (int d = 0; d < dim_; ++d) {
        order_two += orders_two_batch[rows[r]*dim_ + d];
      }
      // dtau/dx_2 = -1
      result[rows[r]] = (order_two % 2 == 0 ? sigma_sq : -sigma_sq)*dk_dtau[r];
    }
  }
}

double ChainRuleCovariance::Covariance(double const * restrict point_one, double const * restrict point_two) const {
  std::vector<double> tau(dim_);
  for (int d = 0; d < dim_; ++d) {
    tau[d] = point_one[d] - point_two[d];
  }

  double k;
  ComputeK(tau.data(), 1, &k);
  return Square(sigma())*k;
}

void ChainRuleCovariance::GradCovariance(double const * restrict point_one, double const * restrict point_two,
                                         double * restrict grad_cov) const {
  std::vector<double> tau(dim_);
  for (int d = 0; d < dim_; ++d) {
    tau[d] = point_one[d] - point_two[d];
  }

  const double sigma_sq = Square(sigma());
  std::vector<int> derivative_orders(dim_, 0);
  for (int d = 0; d < dim_; ++d) {
    derivative_orders[d] = 1;
    ComputeDkDtau(tau.data(), derivative_orders.data(), 1, grad_cov + d);
    grad_cov[d] *= sigma_sq;
    derivative_orders[d] = 0;
  }
}

void MaternKernel::Initialize() {
  ValidateMaternHyperparameters(dim(), hyperparameters_);

  lengths_sq_.resize(dim());
  for (int i = 0; i < dim(); ++i) {
    lengths_sq_[i] = Square(hyperparameters_.lengths[i]);
  }
  outer_scale_ = std::pow(2.0, 1.0 - hyperparameters_.nu)/boost::math::tgamma(hyperparameters_.nu);
}

MaternKernel::MaternKernel(int dim, const MaternHyperparameters& hyperparameters)
    : ChainRuleCovariance(dim), hyperparameters_(hyperparameters), lengths_sq_(), outer_scale_(0.0) {
  Initialize();
}

MaternKernel::MaternKernel(int dim, double sigma, double nu, std::vector<double> lengths)
    : MaternKernel(dim, MaternHyperparameters{sigma, nu, std::move(lengths)}) {
}

MaternKernel::MaternKernel(int dim, double sigma, double nu, double const * restrict lengths)
    : MaternKernel(dim, sigma, nu, std::vector<double>(lengths, lengths + dim)) {
}

MaternKernel::MaternKernel(int dim, double sigma, double nu, double length)
    : MaternKernel(dim, sigma, nu, std::vector<double>(dim, length)) {
}

MaternKernel::MaternKernel(const MaternKernel& GPK_UNUSED(source)) = default;

void MaternKernel::CheckMultiIndex(const std::vector<int>& multi_index) const {
  for (const auto d : multi_index) {
    if (unlikely(d < 0 || d >= dim())) {
      GPK_THROW_EXCEPTION(BoundsException<int>, "Derivative dimension index out of range.", d, 0, dim() - 1);
    }
  }
}

void MaternKernel::ComputeY(double const * restrict tau, int num_points, double * restrict y,
                            double * restrict r2l2) const noexcept {
  const double two_nu = 2.0*hyperparameters_.nu;
  for (int i = 0; i < num_points; ++i) {
    r2l2[i] = 0.0;
    for (int d = 0; d < dim(); ++d) {
      r2l2[i] += Square(tau[d])/lengths_sq_[d];
    }
    y[i] = std::sqrt(two_nu*r2l2[i]);
    tau += dim();
  }
}

void MaternKernel::ComputeK(double const * restrict tau, int num_points, double * restrict k) const {
  std::vector<double> y(num_points);
  std::vector<double> r2l2(num_points);
  ComputeY(tau, num_points, y.data(), r2l2.data());

  const double nu = hyperparameters_.nu;
  for (int i = 0; i < num_points; ++i) {
    if (r2l2[i] == 0.0) {
      k[i] = 1.0;
    } else {
      k[i] = outer_scale_*std::pow(y[i], nu)*boost::math::cyl_bessel_k(nu, y[i]);
    }
  }
}

void MaternKernel::ComputeDkDy(double const * restrict y, int num_points, int n, double * restrict dk_dy) const {
  if (unlikely(n < 0)) {
    GPK_THROW_EXCEPTION(LowerBoundException<int>, "Negative derivative order.", n, 0);
  }

  const double nu = hyperparameters_.nu;
  if (n >= 2.0*nu) {
    GPK_WARNING_PRINTF("n >= 2*nu can yield inaccurate results (n = %d, nu = %.18E).\n", n, nu);
  }

  bool has_zero = false;
  for (int i = 0; i < num_points; ++i) {
    if (y[i] == 0.0) {
      has_zero = true;
      continue;
    }

    // Leibniz rule on y^nu * K_nu(y); the k-th derivative of y^nu is falling_factorial(nu, k) * y^(nu - k)
    double sum = 0.0;
    for (int k = 0; k <= n; ++k) {
      sum += boost::math::binomial_coefficient<double>(n, k)*boost::math::falling_factorial(nu, k)*
          std::pow(y[i], nu - k)*BesselKDerivative(nu, n - k, y[i]);
    }
    dk_dy[i] = outer_scale_*sum;
  }

  if (!has_zero) {
    return;
  }

  double limit;
  if (n < 2.0*nu) {
    if (n % 2 == 1) {
      limit = 0.0;
    } else {
      const int m = n/2;
      limit = (m % 2 == 0 ? 1.0 : -1.0)*std::pow(2.0, nu - 1.0 - n)*boost::math::tgamma(nu - m)*
          boost::math::factorial<double>(n)/boost::math::factorial<double>(m);
    }
  } else {
    GPK_VERBOSE_PRINTF("numerically differentiating the Matern envelope at 0 (n = %d)\n", n);
    limit = Chop(NumericalDerivative(MaternEnvelope(nu), std::vector<double>(1, 0.0), std::vector<int>(1, n), true));
  }

  for (int i = 0; i < num_points; ++i) {
    if (y[i] == 0.0) {
      dk_dy[i] = outer_scale_*limit;
    }
  }
}

void MaternKernel::ComputeDyDtau(double const * restrict tau, const std::vector<int>& b, double const * restrict r2l2,
                                 int num_points, double * restrict dy_dtau) const {
  CheckMultiIndex(b);

  const bool has_origin = std::find(r2l2, r2l2 + num_points, 0.0) != r2l2 + num_points;
  const int order = b.size();
  if (unlikely(has_origin && order > kMaxDifferentiationOrder)) {
    GPK_THROW_EXCEPTION(UpperBoundException<int>, "Derivative order at the origin exceeds the widest precision tier.",
                        order, kMaxDifferentiationOrder);
  }

  std::fill(dy_dtau, dy_dtau + num_points, 0.0);
  std::vector<double> term(num_points);
  for (const auto& partition : GenerateSetPartitions(b)) {
    ComputeDyDtauOnPartition(tau, partition, r2l2, num_points, term.data());
    for (int i = 0; i < num_points; ++i) {
      if (r2l2[i] != 0.0) {
        dy_dtau[i] += term[i];
      }
    }
  }

  if (!has_origin) {
    return;
  }

  double origin_value = 0.0;
  if (!b.empty()) {
    std::vector<int> derivative_orders(dim(), 0);
    for (const auto d : b) {
      ++derivative_orders[d];
    }
    GPK_VERBOSE_PRINTF("numerically differentiating y at the origin, orders: ");
#ifdef GPK_VERBOSE_PRINT
    PrintMultiIndex(derivative_orders);
#endif
    origin_value = Chop(NumericalDerivative(RadialArgument(hyperparameters_.nu, lengths_sq_),
                                            std::vector<double>(dim(), 0.0), derivative_orders, true));
  }

  for (int i = 0; i < num_points; ++i) {
    if (r2l2[i] == 0.0) {
      dy_dtau[i] = origin_value;
    }
  }
}

void MaternKernel::ComputeDyDtauOnPartition(double const * restrict tau, const SetPartition& partition,
                                            double const * restrict r2l2, int num_points,
                                            double * restrict dy_dtau) const {
  const int num_blocks = partition.size();
  const double prefactor = std::sqrt(2.0*hyperparameters_.nu)*boost::math::falling_factorial(0.5, num_blocks);
  for (int i = 0; i < num_points; ++i) {
    dy_dtau[i] = prefactor*std::pow(r2l2[i], 0.5 - num_blocks);
  }

  std::vector<double> dT_dtau(num_points);
  for (const auto& block : partition) {
    ComputeDTDtau(tau, block, num_points, dT_dtau.data());
    for (int i = 0; i < num_points; ++i) {
      dy_dtau[i] *= dT_dtau[i];
    }
  }
}

void MaternKernel::ComputeDTDtau(double const * restrict tau, const PartitionBlock& block, int num_points,
                                 double * restrict dT_dtau) const {
  CheckMultiIndex(block);

  // the zeroth derivative is T itself
  if (block.empty()) {
    for (int i = 0; i < num_points; ++i) {
      dT_dtau[i] = 0.0;
      for (int d = 0; d < dim(); ++d) {
        dT_dtau[i] += Square(tau[d])/lengths_sq_[d];
      }
      tau += dim();
    }
    return;
  }

  // derivatives of order 3 and up are zero, mixed derivatives are zero
  const bool is_mixed = std::adjacent_find(block.begin(), block.end(), std::not_equal_to<int>()) != block.end();
  if (block.size() >= 3 || is_mixed) {
    std::fill(dT_dtau, dT_dtau + num_points, 0.0);
    return;
  }

  const int d = block[0];
  if (block.size() == 1) {
    for (int i = 0; i < num_points; ++i) {
      dT_dtau[i] = 2.0*tau[d]/lengths_sq_[d];
      tau += dim();
    }
  } else {
    std::fill(dT_dtau, dT_dtau + num_points, 2.0/lengths_sq_[d]);
  }
}

void MaternKernel::SetHyperparameters(double const * restrict hyperparameters) {
  MaternHyperparameters hyperparameters_new{hyperparameters[0], hyperparameters[1],
        std::vector<double>(hyperparameters + 2, hyperparameters + 2 + dim())};
  ValidateMaternHyperparameters(dim(), hyperparameters_new);

  hyperparameters_ = std::move(hyperparameters_new);
  Initialize();
}

ChainRuleCovariance * MaternKernel::Clone() const {
  return new MaternKernel(*this);
}

}  // end namespace gpkernel
