/*!
  \file gpk_covariance.hpp
  \rst
  This file specifies ChainRuleCovariance, the base class for stationary covariance functions whose arbitrary-order
  derivatives are assembled with the chain rule, and MaternKernel, the anisotropic Matern covariance built on it.
  We denote a generic covariance function as: ``k(x,x')``

  Stationary covariance functions depend only on the difference ``tau = x - x'``.  Those handled here further factor as
  ``k(tau) = \sigma^2 f(y(tau))``: an "outer" envelope ``f`` of a scalar "inner" argument ``y``.  Then every mixed
  partial of ``k`` with respect to ``tau`` follows from derivatives of ``f`` wrt ``y`` and derivatives of ``y`` wrt
  ``tau`` via Faa di Bruno's formula::

    \partial^n k / \partial tau_{b_1} ... \partial tau_{b_n}
        = \sum_{P \in partitions(b)} f^{(|P|)}(y) \prod_{B \in P} \partial^{|B|} y / \partial tau_B

  where ``b`` is the derivative multi-index (one dimension index per differentiation; see gpk_common.hpp item 3)
  and ``|P|`` is the number of blocks in partition ``P`` (see gpk_set_partition.hpp).

  Subclasses supply ``y``, ``f``, ``f^{(n)}``, and the derivatives of ``y``; ChainRuleCovariance does the rest.

  **Matern**

  The Matern covariance is::

    k(tau) = \sigma^2 \frac{2^{1-\nu}}{\Gamma(\nu)} y^{\nu} K_{\nu}(y),    y = \sqrt{2\nu \sum_i \tau_i^2 / l_i^2}

  where ``K_{\nu}`` is the modified Bessel function of the second kind, ``\nu > 0`` is the order (smoothness) and
  the ``l_i`` are per-dimension length scales.  ``\nu = 1/2`` is the exponential kernel and ``\nu -> \infty`` tends to
  the square exponential.  The sample paths of a GP with Matern covariance are ``ceil(\nu) - 1`` times differentiable,
  so derivatives of order ``n >= 2\nu`` do not exist at the origin; requesting them produces a warning and a large
  (but finite) best-effort value.

  At the origin (``y = 0``) the closed forms are indeterminate: ``0^\nu \cdot \infty`` for ``f`` and ``0/0`` for the
  derivatives of ``y``.  MaternKernel substitutes the limits where they are known in closed form and otherwise falls
  back to arbitrary-precision numerical differentiation (gpk_numerical_differentiation.hpp), which is slow.

  **Batches**

  Batch functions take ``num_points`` difference vectors ``tau[dim][num_points]`` (point-major; see gpk_common.hpp
  item 2) and write one value per point into caller-allocated output.

  For more details, see:
  http://en.wikipedia.org/wiki/Mat%C3%A9rn_covariance_function
  Rasmussen & Williams Chapter 4
\endrst*/

#ifndef GPKERNEL_CPP_GPK_COVARIANCE_HPP_
#define GPKERNEL_CPP_GPK_COVARIANCE_HPP_

#include <vector>

#include "gpk_common.hpp"
#include "gpk_set_partition.hpp"

namespace gpkernel {

/*!\rst
  Named hyperparameters of the Matern covariance.  The flattened form (GetHyperparameters(), SetHyperparameters())
  is ``[sigma, nu, lengths[0], ..., lengths[dim-1]]``.
\endrst*/
struct MaternHyperparameters {
  //! prefactor; covariances are scaled by ``sigma^2``
  double sigma;
  //! order of the kernel, ``nu > 0``; need not be an integer
  double nu;
  //! length scales, one per dimension
  std::vector<double> lengths;
};

/*!\rst
  Abstract base for covariance functions of the form ``\sigma^2 f(y(tau))``.  Implements arbitrary-order derivatives
  wrt ``tau`` (and hence wrt either input point) given subclass implementations of ComputeY(), ComputeK(),
  ComputeDkDy() and ComputeDyDtau().

  Covariance operators, ``cov(x_1, x_2)`` are symmetric, but their derivatives are not: differentiating wrt ``x_2``
  flips the sign of odd-order terms since ``\partial tau/\partial x_2 = -1``.  Evaluate() accounts for this.

  Hyperparameters are stored as class member data by subclasses.
\endrst*/
class ChainRuleCovariance {
 public:
  virtual ~ChainRuleCovariance() = default;

  //! number of spatial dimensions
  int dim() const noexcept GPK_PURE_FUNCTION GPK_WARN_UNUSED_RESULT {
    return dim_;
  }

  //! prefactor ``\sigma``; covariances are scaled by ``\sigma^2``
  virtual double sigma() const noexcept GPK_PURE_FUNCTION GPK_WARN_UNUSED_RESULT = 0;

  /*!\rst
    Computes the inner argument ``y`` and the anisotropically scaled squared distance ``r2l2`` for each point.

    \param
      :tau[dim][num_points]: difference vectors
      :num_points: number of difference vectors
    \output
      :y[num_points]: inner argument at each point
      :r2l2[num_points]: ``\sum_i \tau_i^2/l_i^2`` at each point
  \endrst*/
  virtual void ComputeY(double const * restrict tau, int num_points, double * restrict y,
                        double * restrict r2l2) const noexcept GPK_NONNULL_POINTERS = 0;

  /*!\rst
    Computes the covariance value (without the ``\sigma^2`` prefactor) at each point.

    \param
      :tau[dim][num_points]: difference vectors
      :num_points: number of difference vectors
    \output
      :k[num_points]: ``f(y(tau))``
  \endrst*/
  virtual void ComputeK(double const * restrict tau, int num_points, double * restrict k) const GPK_NONNULL_POINTERS = 0;

  /*!\rst
    Computes the ``n``-th derivative of the outer envelope ``f`` wrt ``y`` at each point.

    \param
      :y[num_points]: inner argument values
      :num_points: number of values
      :n: derivative order, ``n >= 0``
    \output
      :dk_dy[num_points]: ``f^{(n)}(y)``
  \endrst*/
  virtual void ComputeDkDy(double const * restrict y, int num_points, int n,
                           double * restrict dk_dy) const GPK_NONNULL_POINTERS = 0;

  /*!\rst
    Computes the mixed partial of ``y`` wrt the dimensions named in ``b`` at each point.

    \param
      :tau[dim][num_points]: difference vectors
      :b: derivative multi-index; entries in ``[0, dim)``
      :r2l2[num_points]: output of ComputeY() for these tau
      :num_points: number of difference vectors
    \output
      :dy_dtau[num_points]: ``\partial^{|b|} y / \partial tau_b``
  \endrst*/
  virtual void ComputeDyDtau(double const * restrict tau, const std::vector<int>& b, double const * restrict r2l2,
                             int num_points, double * restrict dy_dtau) const GPK_NONNULL_POINTERS = 0;

  /*!\rst
    Computes the mixed partial derivative of the covariance value (without the ``\sigma^2`` prefactor) wrt ``tau``,
    taking ``derivative_orders[d]`` derivatives wrt ``tau_d``.  All points share the same derivative orders.

    ComputeDkDy() is called once for each block count ``1..n`` (``n = \sum_d derivative_orders[d]``) and shared by
    all ``B(n)`` set partitions.  Preconditions of ComputeDkDy() and ComputeDyDtau() on ``n`` apply.

    \param
      :tau[dim][num_points]: difference vectors
      :derivative_orders[dim]: number of derivatives to take wrt each dimension, each ``>= 0``
      :num_points: number of difference vectors
    \output
      :dk_dtau[num_points]: requested derivative at each point
  \endrst*/
  void ComputeDkDtau(double const * restrict tau, int const * restrict derivative_orders, int num_points,
                     double * restrict dk_dtau) const GPK_NONNULL_POINTERS;

  /*!\rst
    Computes ``\partial^{n_1 + n_2} cov(x_1, x_2) / \partial x_1^{n_1} \partial x_2^{n_2}`` for pairs of points, each pair
    with its own derivative orders.  Rows with equal combined orders ``n_1 + n_2`` are batched together.

    Since ``tau = x_1 - x_2``, the result is ``(-1)^{|n_2|} \sigma^2 \partial^{n_1 + n_2} f(y(tau)) / \partial tau^{n_1 + n_2}``.

    \param
      :point_one_batch[dim][num_points]: first points, ``x_1``
      :point_two_batch[dim][num_points]: second points, ``x_2``
      :orders_one_batch[dim][num_points]: derivative orders wrt each coordinate of ``x_1``
      :orders_two_batch[dim][num_points]: derivative orders wrt each coordinate of ``x_2``
      :num_points: number of point pairs
    \output
      :result[num_points]: requested covariance derivatives
  \endrst*/
  void Evaluate(double const * restrict point_one_batch, double const * restrict point_two_batch,
                int const * restrict orders_one_batch, int const * restrict orders_two_batch, int num_points,
                double * restrict result) const GPK_NONNULL_POINTERS;

  /*!\rst
    Computes the covariance function of two points, cov(``point_one``, ``point_two``).  Points must be arrays with length dim.

    \param
      :point_one[dim]: first spatial coordinate
      :point_two[dim]: second spatial coordinate
    \return
      value of covariance between the input points
  \endrst*/
  double Covariance(double const * restrict point_one, double const * restrict point_two) const GPK_NONNULL_POINTERS GPK_WARN_UNUSED_RESULT;

  /*!\rst
    Computes the gradient of this.Covariance(point_one, point_two) with respect to the FIRST argument, point_one.

    \param
      :point_one[dim]: first spatial coordinate
      :point_two[dim]: second spatial coordinate
    \output
      :grad_cov[dim]: i-th entry is ``\pderiv{cov(x_1, x_2)}{x_1_i}``
  \endrst*/
  void GradCovariance(double const * restrict point_one, double const * restrict point_two,
                      double * restrict grad_cov) const GPK_NONNULL_POINTERS;

  /*!\rst
    \return
      number of hyperparameters, i.e., the length of the arrays in Get/SetHyperparameters()
  \endrst*/
  virtual int GetNumberOfHyperparameters() const noexcept GPK_PURE_FUNCTION GPK_WARN_UNUSED_RESULT = 0;

  /*!\rst
    \output
      :hyperparameters[GetNumberOfHyperparameters()]: the hyperparameters of this covariance
  \endrst*/
  virtual void GetHyperparameters(double * restrict hyperparameters) const noexcept GPK_NONNULL_POINTERS = 0;

  /*!\rst
    Validates and sets the hyperparameters.  The object is unchanged if validation throws.

    \param
      :hyperparameters[GetNumberOfHyperparameters()]: the new hyperparameters
  \endrst*/
  virtual void SetHyperparameters(double const * restrict hyperparameters) GPK_NONNULL_POINTERS = 0;

  /*!\rst
    For implementing the virtual (copy) constructor idiom.

    \return
      :Pointer to a constructed object that is a subclass of ChainRuleCovariance
  \endrst*/
  virtual ChainRuleCovariance * Clone() const GPK_WARN_UNUSED_RESULT = 0;

  GPK_DISALLOW_DEFAULT_AND_ASSIGN(ChainRuleCovariance);

 protected:
  explicit ChainRuleCovariance(int dim) : dim_(dim) {
  }

  ChainRuleCovariance(const ChainRuleCovariance& source) = default;

 private:
  //! dimension of the problem
  int dim_;
};

/*!\rst
  Implements the anisotropic Matern covariance with arbitrary order ``\nu``:
  ``cov(tau) = \sigma^2 \frac{2^{1-\nu}}{\Gamma(\nu)} y^{\nu} K_{\nu}(y)``, ``y = \sqrt{2\nu \sum_i \tau_i^2/l_i^2}``.

  Derivatives of every order and every combination of dimensions are supported.  Away from the origin all
  derivatives are in closed form; at the origin some require numerical differentiation (see ComputeDkDy() and
  ComputeDyDtau()).

  This covariance object has ``dim+2`` hyperparameters: ``\sigma, \nu, lengths_i``

  See ChainRuleCovariance for descriptions of the virtual functions.
\endrst*/
class MaternKernel final : public ChainRuleCovariance {
 public:
  /*!\rst
    Constructs a MaternKernel object with constant length-scale across all dimensions.

    \param
      :dim: the number of spatial dimensions
      :sigma: the prefactor ``\sigma``
      :nu: the order ``\nu``
      :length: the constant length scale to use for all hyperparameter length scales
  \endrst*/
  MaternKernel(int dim, double sigma, double nu, double length);

  /*!\rst
    Constructs a MaternKernel object with the specified hyperparameters.

    \param
      :dim: the number of spatial dimensions
      :sigma: the prefactor ``\sigma``
      :nu: the order ``\nu``
      :lengths[dim]: the hyperparameter length scales, one per spatial dimension
  \endrst*/
  MaternKernel(int dim, double sigma, double nu, double const * restrict lengths) GPK_NONNULL_POINTERS;

  /*!\rst
    Constructs a MaternKernel object with the specified hyperparameters.

    \param
      :dim: the number of spatial dimensions
      :sigma: the prefactor ``\sigma``
      :nu: the order ``\nu``
      :lengths: the hyperparameter length scales, one per spatial dimension
  \endrst*/
  MaternKernel(int dim, double sigma, double nu, std::vector<double> lengths);

  MaternKernel(int dim, const MaternHyperparameters& hyperparameters);

  virtual double sigma() const noexcept override GPK_PURE_FUNCTION GPK_WARN_UNUSED_RESULT {
    return hyperparameters_.sigma;
  }

  //! order of the kernel
  double nu() const noexcept GPK_PURE_FUNCTION GPK_WARN_UNUSED_RESULT {
    return hyperparameters_.nu;
  }

  //! length scale of dimension ``i``; ``i`` is not range-checked
  double length(int i) const noexcept GPK_PURE_FUNCTION GPK_WARN_UNUSED_RESULT {
    return hyperparameters_.lengths[i];
  }

  const MaternHyperparameters& hyperparameters() const noexcept GPK_WARN_UNUSED_RESULT {
    return hyperparameters_;
  }

  virtual void ComputeY(double const * restrict tau, int num_points, double * restrict y,
                        double * restrict r2l2) const noexcept override GPK_NONNULL_POINTERS;

  /*!\rst
    Rows with ``r2l2 == 0`` are set to exactly 1, the limit of ``f`` at the origin.
  \endrst*/
  virtual void ComputeK(double const * restrict tau, int num_points, double * restrict k) const override GPK_NONNULL_POINTERS;

  /*!\rst
    Away from ``y = 0``, uses the Leibniz rule on ``y^\nu K_\nu(y)``::

      f^{(n)}(y) = \frac{2^{1-\nu}}{\Gamma(\nu)} \sum_{k=0}^n \binom{n}{k} \nu^{\underline{k}} y^{\nu-k} K_{\nu}^{(n-k)}(y)

    At ``y = 0``, for ``n < 2\nu`` the (one-sided) limit is 0 for odd ``n`` and, with ``m = n/2``,
    ``\frac{2^{1-\nu}}{\Gamma(\nu)} (-1)^m 2^{\nu-1-n} \Gamma(\nu-m) n!/m!`` for even ``n``.  For ``n >= 2\nu`` the
    derivative does not exist; we warn and differentiate ``x^\nu K_\nu(x)`` numerically at ``0^+``.

    \param
      :n: derivative order, ``n >= 0``.  If any ``y`` is 0 and ``n >= 2\nu``, also ``n <= kMaxDifferentiationOrder``
        (the widest multiprecision tier); larger orders throw UpperBoundException<int>.  Rows with ``y > 0`` have no cap.
  \endrst*/
  virtual void ComputeDkDy(double const * restrict y, int num_points, int n,
                           double * restrict dk_dy) const override GPK_NONNULL_POINTERS;

  /*!\rst
    Away from the origin, sums ComputeDyDtauOnPartition() over all set partitions of ``b``.  At the origin,
    differentiates ``y(tau)`` numerically from the positive side of every dimension (slow).  Mixed derivatives at the
    origin do not exist; the numerical result is large but finite.

    Precondition: if any row has ``r2l2 == 0``, ``|b| <= kMaxDifferentiationOrder``; otherwise UpperBoundException<int>
    is thrown.
  \endrst*/
  virtual void ComputeDyDtau(double const * restrict tau, const std::vector<int>& b, double const * restrict r2l2,
                             int num_points, double * restrict dy_dtau) const override GPK_NONNULL_POINTERS;

  /*!\rst
    One term of Faa di Bruno's formula for ``y = \sqrt{2\nu} T^{1/2}``, ``T = r2l2``::

      \sqrt{2\nu} (1/2)^{\underline{|P|}} T^{1/2 - |P|} \prod_{B \in P} \partial^{|B|} T / \partial tau_B

    Only valid where ``r2l2 != 0``.

    \param
      :tau[dim][num_points]: difference vectors
      :partition: a set partition of the derivative multi-index
      :r2l2[num_points]: output of ComputeY() for these tau
      :num_points: number of difference vectors
    \output
      :dy_dtau[num_points]: the partition's term at each point
  \endrst*/
  void ComputeDyDtauOnPartition(double const * restrict tau, const SetPartition& partition,
                                double const * restrict r2l2, int num_points,
                                double * restrict dy_dtau) const GPK_NONNULL_POINTERS;

  /*!\rst
    Derivative of ``T = \sum_i \tau_i^2/l_i^2`` wrt the dimensions in ``block``.  ``T`` is a sum of separable
    quadratics, so only ``\partial T/\partial tau_d = 2 tau_d/l_d^2`` and ``\partial^2 T/\partial tau_d^2 = 2/l_d^2``
    are nonzero.

    \param
      :tau[dim][num_points]: difference vectors
      :block: one block of a partition; entries in ``[0, dim)``
      :num_points: number of difference vectors
    \output
      :dT_dtau[num_points]: derivative of T at each point
  \endrst*/
  void ComputeDTDtau(double const * restrict tau, const PartitionBlock& block, int num_points,
                     double * restrict dT_dtau) const GPK_NONNULL_POINTERS;

  virtual int GetNumberOfHyperparameters() const noexcept override GPK_PURE_FUNCTION GPK_WARN_UNUSED_RESULT {
    return dim() + 2;
  }

  virtual void GetHyperparameters(double * restrict hyperparameters) const noexcept override GPK_NONNULL_POINTERS {
    hyperparameters[0] = hyperparameters_.sigma;
    hyperparameters[1] = hyperparameters_.nu;
    hyperparameters += 2;
    for (int i = 0; i < dim(); ++i) {
      hyperparameters[i] = hyperparameters_.lengths[i];
    }
  }

  virtual void SetHyperparameters(double const * restrict hyperparameters) override GPK_NONNULL_POINTERS;

  virtual ChainRuleCovariance * Clone() const override GPK_WARN_UNUSED_RESULT;

  explicit MaternKernel(const MaternKernel& source);

  GPK_DISALLOW_DEFAULT_AND_ASSIGN(MaternKernel);

 private:
  /*!\rst
    Validate and initialize class data members.
  \endrst*/
  void Initialize();

  //! throws BoundsException<int> unless every entry of multi_index lies in ``[0, dim)``
  void CheckMultiIndex(const std::vector<int>& multi_index) const;

  //! ``\sigma, \nu, l_i``
  MaternHyperparameters hyperparameters_;
  //! square of the length scales, one per dimension
  std::vector<double> lengths_sq_;
  //! ``2^{1-\nu}/\Gamma(\nu)``
  double outer_scale_;
};

}  // end namespace gpkernel

#endif  // GPKERNEL_CPP_GPK_COVARIANCE_HPP_
