/*!
  \file gpk_python_covariance.hpp
  \rst
  This file registers the Python interface to MaternKernel and to the set partition enumerator.
\endrst*/

#ifndef GPKERNEL_CPP_GPK_PYTHON_COVARIANCE_HPP_
#define GPKERNEL_CPP_GPK_PYTHON_COVARIANCE_HPP_

#include "gpk_common.hpp"

namespace gpkernel {

/*!\rst
  Exposes MaternKernel (as ``GPK.MaternKernel``) and its value, derivative and hyperparameter member functions.
\endrst*/
void ExportMaternKernelFunctions();

/*!\rst
  Exposes ``generate_set_partitions()`` and ``bell_number()``.
\endrst*/
void ExportSetPartitionFunctions();

}  // end namespace gpkernel

#endif  // GPKERNEL_CPP_GPK_PYTHON_COVARIANCE_HPP_
