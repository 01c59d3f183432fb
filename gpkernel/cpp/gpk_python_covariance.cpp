/*!
  \file gpk_python_covariance.cpp
  \rst
  This file has the logic to construct a MaternKernel (C++ object) from Python and invoke its member functions.
  The data flow follows the basic 4 step from gpk_python_common.hpp.

  .. Note:: several internal functions of this source file are only called from ``Export*()`` functions,
    so their description, inputs, outputs, etc. comments have been moved. These comments exist in
    ``Export*()`` as Python docstrings, so we saw no need to repeat ourselves.
\endrst*/

// This include violates the Google Style Guide by placing an "other" system header ahead of C and C++ system headers.  However,
// it needs to be at the top, otherwise compilation fails on some systems with some versions of python.
// Putting this include first prevents pyport from doing something illegal in C++; reference: http://bugs.python.org/issue10910
#include "Python.h"  // NOLINT(build/include)

#include "gpk_python_covariance.hpp"

#include <vector>  // NOLINT(build/include_order)

#include <boost/python/class.hpp>  // NOLINT(build/include_order)
#include <boost/python/def.hpp>  // NOLINT(build/include_order)
#include <boost/python/list.hpp>  // NOLINT(build/include_order)
#include <boost/python/make_constructor.hpp>  // NOLINT(build/include_order)
#include <boost/python/tuple.hpp>  // NOLINT(build/include_order)

#include "gpk_common.hpp"
#include "gpk_covariance.hpp"
#include "gpk_python_common.hpp"
#include "gpk_set_partition.hpp"

namespace gpkernel {

namespace {

/*!\rst
  Surrogate "constructor" for MaternKernel intended only for use by boost::python.  This aliases the normal C++
  constructor, replacing ``double const * restrict`` arguments with ``const boost::python::list&`` arguments.
\endrst*/
MaternKernel * make_matern_kernel(int dim, double sigma, double nu, const boost::python::list& lengths) {
  std::vector<double> lengths_vector;
  CopyPylistToVector(lengths, dim, lengths_vector);
  return new MaternKernel(dim, sigma, nu, lengths_vector);
}

int GetDimWrapper(const MaternKernel& covariance) {
  return covariance.dim();
}

boost::python::list ComputeKWrapper(const MaternKernel& covariance, const boost::python::list& tau, int num_points) {
  std::vector<double> tau_vector;
  CopyPylistToVector(tau, covariance.dim()*num_points, tau_vector);
  std::vector<double> k(num_points);
  covariance.ComputeK(tau_vector.data(), num_points, k.data());
  return VectorToPylist(k);
}

boost::python::tuple ComputeYWrapper(const MaternKernel& covariance, const boost::python::list& tau, int num_points) {
  std::vector<double> tau_vector;
  CopyPylistToVector(tau, covariance.dim()*num_points, tau_vector);
  std::vector<double> y(num_points);
  std::vector<double> r2l2(num_points);
  covariance.ComputeY(tau_vector.data(), num_points, y.data(), r2l2.data());
  return boost::python::make_tuple(VectorToPylist(y), VectorToPylist(r2l2));
}

boost::python::list ComputeDkDyWrapper(const MaternKernel& covariance, const boost::python::list& y, int num_points,
                                       int n) {
  std::vector<double> y_vector;
  CopyPylistToVector(y, num_points, y_vector);
  std::vector<double> dk_dy(num_points);
  covariance.ComputeDkDy(y_vector.data(), num_points, n, dk_dy.data());
  return VectorToPylist(dk_dy);
}

boost::python::list ComputeDyDtauWrapper(const MaternKernel& covariance, const boost::python::list& tau,
                                         const boost::python::list& b, int num_points) {
  std::vector<double> tau_vector;
  CopyPylistToVector(tau, covariance.dim()*num_points, tau_vector);
  std::vector<int> b_vector;
  CopyPylistToIntVector(b, boost::python::len(b), b_vector);

  std::vector<double> y(num_points);
  std::vector<double> r2l2(num_points);
  covariance.ComputeY(tau_vector.data(), num_points, y.data(), r2l2.data());
  std::vector<double> dy_dtau(num_points);
  covariance.ComputeDyDtau(tau_vector.data(), b_vector, r2l2.data(), num_points, dy_dtau.data());
  return VectorToPylist(dy_dtau);
}

boost::python::list ComputeDTDtauWrapper(const MaternKernel& covariance, const boost::python::list& tau,
                                         const boost::python::list& block, int num_points) {
  std::vector<double> tau_vector;
  CopyPylistToVector(tau, covariance.dim()*num_points, tau_vector);
  PartitionBlock block_vector;
  CopyPylistToIntVector(block, boost::python::len(block), block_vector);

  std::vector<double> dT_dtau(num_points);
  covariance.ComputeDTDtau(tau_vector.data(), block_vector, num_points, dT_dtau.data());
  return VectorToPylist(dT_dtau);
}

boost::python::list ComputeDkDtauWrapper(const MaternKernel& covariance, const boost::python::list& tau,
                                         const boost::python::list& derivative_orders, int num_points) {
  std::vector<double> tau_vector;
  CopyPylistToVector(tau, covariance.dim()*num_points, tau_vector);
  std::vector<int> derivative_orders_vector;
  CopyPylistToIntVector(derivative_orders, covariance.dim(), derivative_orders_vector);

  std::vector<double> dk_dtau(num_points);
  covariance.ComputeDkDtau(tau_vector.data(), derivative_orders_vector.data(), num_points, dk_dtau.data());
  return VectorToPylist(dk_dtau);
}

boost::python::list EvaluateWrapper(const MaternKernel& covariance, const boost::python::list& point_one_batch,
                                    const boost::python::list& point_two_batch,
                                    const boost::python::list& orders_one_batch,
                                    const boost::python::list& orders_two_batch, int num_points) {
  const int size = covariance.dim()*num_points;
  std::vector<double> point_one_vector, point_two_vector;
  CopyPylistToVector(point_one_batch, size, point_one_vector);
  CopyPylistToVector(point_two_batch, size, point_two_vector);
  std::vector<int> orders_one_vector, orders_two_vector;
  CopyPylistToIntVector(orders_one_batch, size, orders_one_vector);
  CopyPylistToIntVector(orders_two_batch, size, orders_two_vector);

  std::vector<double> result(num_points);
  covariance.Evaluate(point_one_vector.data(), point_two_vector.data(), orders_one_vector.data(),
                      orders_two_vector.data(), num_points, result.data());
  return VectorToPylist(result);
}

double CovarianceWrapper(const MaternKernel& covariance, const boost::python::list& point_one,
                         const boost::python::list& point_two) {
  std::vector<double> point_one_vector, point_two_vector;
  CopyPylistToVector(point_one, covariance.dim(), point_one_vector);
  CopyPylistToVector(point_two, covariance.dim(), point_two_vector);
  return covariance.Covariance(point_one_vector.data(), point_two_vector.data());
}

boost::python::list GradCovarianceWrapper(const MaternKernel& covariance, const boost::python::list& point_one,
                                          const boost::python::list& point_two) {
  std::vector<double> point_one_vector, point_two_vector;
  CopyPylistToVector(point_one, covariance.dim(), point_one_vector);
  CopyPylistToVector(point_two, covariance.dim(), point_two_vector);
  std::vector<double> grad_cov(covariance.dim());
  covariance.GradCovariance(point_one_vector.data(), point_two_vector.data(), grad_cov.data());
  return VectorToPylist(grad_cov);
}

boost::python::list GetHyperparametersWrapper(const MaternKernel& covariance) {
  std::vector<double> hyperparameters(covariance.GetNumberOfHyperparameters());
  covariance.GetHyperparameters(hyperparameters.data());
  return VectorToPylist(hyperparameters);
}

void SetHyperparametersWrapper(MaternKernel * covariance, const boost::python::list& hyperparameters) {
  std::vector<double> hyperparameters_vector;
  CopyPylistToVector(hyperparameters, covariance->GetNumberOfHyperparameters(), hyperparameters_vector);
  covariance->SetHyperparameters(hyperparameters_vector.data());
}

boost::python::list GenerateSetPartitionsWrapper(const boost::python::list& multiset) {
  std::vector<int> multiset_vector;
  CopyPylistToIntVector(multiset, boost::python::len(multiset), multiset_vector);

  boost::python::list result;
  for (const auto& partition : GenerateSetPartitions(multiset_vector)) {
    boost::python::list partition_list;
    for (const auto& block : partition) {
      partition_list.append(IntVectorToPylist(block));
    }
    result.append(partition_list);
  }
  return result;
}

}  // end unnamed namespace

void ExportMaternKernelFunctions() {
  boost::python::class_<MaternKernel, boost::noncopyable>("MaternKernel", boost::python::no_init)
      .def("__init__", boost::python::make_constructor(&make_matern_kernel), R"%%(
    Constructor for a ``GPK.MaternKernel`` object, ``k(tau) = sigma^2 2^{1-nu}/Gamma(nu) y^nu K_nu(y)`` with
    ``y = sqrt(2 nu sum_i tau_i^2/l_i^2)``.

    :param dim: the spatial dimension
    :type dim: int > 0
    :param sigma: prefactor; covariances are scaled by sigma^2
    :type sigma: float64 > 0
    :param nu: order of the kernel
    :type nu: float64 > 0
    :param lengths: length scales, one per dimension
    :type lengths: list of float64 > 0 with shape (dim, )
          )%%")
      .add_property("dim", &GetDimWrapper, "Return the number of spatial dimensions.")
      .add_property("nu", &MaternKernel::nu, "Return the order of the kernel.")
      .add_property("sigma", &MaternKernel::sigma, "Return the prefactor sigma.")
      .def("compute_k", ComputeKWrapper, R"%%(
    Compute the covariance value, without the sigma^2 prefactor, at each difference vector.  Exactly 1 at the origin.

    :param tau: difference vectors
    :type tau: list of float64 with shape (num_points, dim)
    :param num_points: number of difference vectors
    :type num_points: int > 0
    :return: covariance values
    :rtype: list of float64 with shape (num_points, )
          )%%")
      .def("compute_y", ComputeYWrapper, R"%%(
    Compute the inner argument ``y`` and the scaled squared distance ``r2l2 = sum_i tau_i^2/l_i^2``.

    :param tau: difference vectors
    :type tau: list of float64 with shape (num_points, dim)
    :param num_points: number of difference vectors
    :type num_points: int > 0
    :return: (y, r2l2)
    :rtype: tuple of two lists of float64 with shape (num_points, )
          )%%")
      .def("compute_dk_dy", ComputeDkDyWrapper, R"%%(
    Compute the n-th derivative of the Matern envelope wrt y.  Warns if n >= 2 nu; at y = 0 such derivatives do not
    exist and a slow numerical one-sided estimate is returned.

    :param y: inner argument values
    :type y: list of float64 >= 0 with shape (num_points, )
    :param num_points: number of values
    :type num_points: int > 0
    :param n: derivative order
    :type n: int >= 0
    :return: derivatives
    :rtype: list of float64 with shape (num_points, )
          )%%")
      .def("compute_dy_dtau", ComputeDyDtauWrapper, R"%%(
    Compute the mixed partial of y wrt the dimensions listed in b (one entry per differentiation).

    :param tau: difference vectors
    :type tau: list of float64 with shape (num_points, dim)
    :param b: derivative multi-index
    :type b: list of int in [0, dim)
    :param num_points: number of difference vectors
    :type num_points: int > 0
    :return: derivatives
    :rtype: list of float64 with shape (num_points, )
          )%%")
      .def("compute_dt_dtau", ComputeDTDtauWrapper, R"%%(
    Compute the derivative of ``T = sum_i tau_i^2/l_i^2`` wrt the dimensions in block.

    :param tau: difference vectors
    :type tau: list of float64 with shape (num_points, dim)
    :param block: derivative multi-index; empty returns T itself
    :type block: list of int in [0, dim)
    :param num_points: number of difference vectors
    :type num_points: int > 0
    :return: derivatives
    :rtype: list of float64 with shape (num_points, )
          )%%")
      .def("compute_dk_dtau", ComputeDkDtauWrapper, R"%%(
    Compute the mixed partial of the covariance value (without sigma^2) wrt tau.

    :param tau: difference vectors
    :type tau: list of float64 with shape (num_points, dim)
    :param derivative_orders: number of derivatives wrt each dimension
    :type derivative_orders: list of int >= 0 with shape (dim, )
    :param num_points: number of difference vectors
    :type num_points: int > 0
    :return: derivatives
    :rtype: list of float64 with shape (num_points, )
          )%%")
      .def("evaluate", EvaluateWrapper, R"%%(
    Compute ``d^{n1 + n2} cov(x1, x2) / dx1^{n1} dx2^{n2}`` for pairs of points, each with its own orders.

    :param point_one_batch: first points
    :type point_one_batch: list of float64 with shape (num_points, dim)
    :param point_two_batch: second points
    :type point_two_batch: list of float64 with shape (num_points, dim)
    :param orders_one_batch: derivative orders wrt the first points
    :type orders_one_batch: list of int >= 0 with shape (num_points, dim)
    :param orders_two_batch: derivative orders wrt the second points
    :type orders_two_batch: list of int >= 0 with shape (num_points, dim)
    :param num_points: number of point pairs
    :type num_points: int > 0
    :return: covariance derivatives
    :rtype: list of float64 with shape (num_points, )
          )%%")
      .def("covariance", CovarianceWrapper, R"%%(
    Compute cov(point_one, point_two).

    :param point_one: first point
    :type point_one: list of float64 with shape (dim, )
    :param point_two: second point
    :type point_two: list of float64 with shape (dim, )
    :return: covariance
    :rtype: float64
          )%%")
      .def("grad_covariance", GradCovarianceWrapper, R"%%(
    Compute the gradient of cov(point_one, point_two) wrt point_one.

    :param point_one: first point
    :type point_one: list of float64 with shape (dim, )
    :param point_two: second point
    :type point_two: list of float64 with shape (dim, )
    :return: gradient
    :rtype: list of float64 with shape (dim, )
          )%%")
      .def("get_hyperparameters", GetHyperparametersWrapper, R"%%(
    :return: hyperparameters ``[sigma, nu, lengths[0], ..., lengths[dim-1]]``
    :rtype: list of float64 with shape (dim + 2, )
          )%%")
      .def("set_hyperparameters", SetHyperparametersWrapper, R"%%(
    Validate and set hyperparameters; the kernel is unchanged if validation fails.

    :param hyperparameters: ``[sigma, nu, lengths[0], ..., lengths[dim-1]]``
    :type hyperparameters: list of float64 > 0 with shape (dim + 2, )
          )%%")
      ;  // NOLINT, this is boost style
}

void ExportSetPartitionFunctions() {
  boost::python::def("generate_set_partitions", GenerateSetPartitionsWrapper, R"%%(
    Generate every set partition of the positions of multiset.  Repeated entries are distinct positions.

    :param multiset: derivative multi-index
    :type multiset: list of int
    :return: partitions; each partition is a list of blocks and each block is a list of multiset values
    :rtype: list of list of list of int
    )%%");

  boost::python::def("bell_number", BellNumber, R"%%(
    Compute the Bell number B(n), the number of set partitions of n elements.

    :param n: number of elements
    :type n: int in [0, 25]
    :rtype: int
    )%%");
}

}  // end namespace gpkernel
