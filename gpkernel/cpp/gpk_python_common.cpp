/*!
  \file gpk_python_common.cpp
  \rst
  This file contains definitions of the list conversion utilities declared in gpk_python_common.hpp.
\endrst*/

// This include violates the Google Style Guide by placing an "other" system header ahead of C and C++ system headers.  However,
// it needs to be at the top, otherwise compilation fails on some systems with some versions of python.
// Putting this include first prevents pyport from doing something illegal in C++; reference: http://bugs.python.org/issue10910
#include "Python.h"  // NOLINT(build/include)

#include "gpk_python_common.hpp"

#include <vector>  // NOLINT(build/include_order)

#include <boost/python/extract.hpp>  // NOLINT(build/include_order)
#include <boost/python/list.hpp>  // NOLINT(build/include_order)

#include "gpk_common.hpp"

namespace gpkernel {

void CopyPylistToVector(const boost::python::list& input, int size, std::vector<double>& output) {
  output.resize(size);
  for (int i = 0; i < size; ++i) {
    output[i] = boost::python::extract<double>(input[i]);
  }
}

void CopyPylistToIntVector(const boost::python::list& input, int size, std::vector<int>& output) {
  output.resize(size);
  for (int i = 0; i < size; ++i) {
    output[i] = boost::python::extract<int>(input[i]);
  }
}

boost::python::list VectorToPylist(const std::vector<double>& input) {
  boost::python::list result;
  for (const auto& entry : input) {
    result.append(entry);
  }
  return result;
}

boost::python::list IntVectorToPylist(const std::vector<int>& input) {
  boost::python::list result;
  for (const auto& entry : input) {
    result.append(entry);
  }
  return result;
}

}  // end namespace gpkernel
