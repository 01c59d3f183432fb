/*!
  \file gpk_python_common.hpp
  \rst
  Utilities that are useful throughout the gpk_python_* interface code: copying between std::vector and
  boost::python::list.

  Functions callable from Python generally have the following form:

  1. Copy vector inputs from references of Python structures to C++ (e.g., boost::python::list to std::vector).
  2. Construct any temporary objects needed by C++.
  3. Compute the desired result with C++ calls.
  4. Copy/return the desired result from C++ container back into a boost::python::list (or return directly for primitive types)

  General notes about the Python interface:

  1. We use raw strings (C++11) to pass multiline string literals to boost to specify python docstrings.  Our delimiter
     is: ``%%``.  The format is: ``R"%%(put anything here, no need to escape chars)%%"``.
  2. ALL ARRAYS/LISTS MUST BE FLATTENED!  Matrices are described as ``A[dim1][dim2]...[dimN]`` and laid out C-style
     (rightmost index varies the most rapidly).  So a batch of difference vectors ``tau[num_points][dim]`` is passed
     as the flat list ``[tau_0[0], ..., tau_0[dim-1], tau_1[0], ...]``.
\endrst*/

#ifndef GPKERNEL_CPP_GPK_PYTHON_COMMON_HPP_
#define GPKERNEL_CPP_GPK_PYTHON_COMMON_HPP_

#include <vector>

#include <boost/python/list.hpp>  // NOLINT(build/include_order)

#include "gpk_common.hpp"

namespace gpkernel {

/*!\rst
  Copies the first size elements of a python list into a std::vector<double>; resizes output to size.

  \param
    :input: python list to copy from
    :size: number of elements to copy
  \output
    :output[size]: vector with the first size elements of input
\endrst*/
void CopyPylistToVector(const boost::python::list& input, int size, std::vector<double>& output);

/*!\rst
  Copies the first size elements of a python list of ints (e.g., derivative orders) into a std::vector<int>;
  resizes output to size.

  \param
    :input: python list to copy from
    :size: number of elements to copy
  \output
    :output[size]: vector with the first size elements of input
\endrst*/
void CopyPylistToIntVector(const boost::python::list& input, int size, std::vector<int>& output);

/*!\rst
  Produces a PyList containing the elements of input.
\endrst*/
boost::python::list VectorToPylist(const std::vector<double>& input) GPK_WARN_UNUSED_RESULT;

/*!\rst
  Produces a PyList containing the elements of input.
\endrst*/
boost::python::list IntVectorToPylist(const std::vector<int>& input) GPK_WARN_UNUSED_RESULT;

}  // end namespace gpkernel

#endif  // GPKERNEL_CPP_GPK_PYTHON_COMMON_HPP_
