/*!
  \file gpk_python_test.cpp
  \rst
  This file exports the wrapper that calls all ``C++`` unit tests (see gpk_run_cpp_tests.hpp) to Python.
\endrst*/

// This include violates the Google Style Guide by placing an "other" system header ahead of C and C++ system headers.  However,
// it needs to be at the top, otherwise compilation fails on some systems with some versions of python.
// Putting this include first prevents pyport from doing something illegal in C++; reference: http://bugs.python.org/issue10910
#include "Python.h"  // NOLINT(build/include)

#include "gpk_python_test.hpp"

#include <boost/python/def.hpp>  // NOLINT(build/include_order)

#include "gpk_common.hpp"
#include "gpk_run_cpp_tests.hpp"

namespace gpkernel {

void ExportCppTestFunctions() {
  boost::python::def("run_cpp_tests", RunCppTests, R"%%(
    Runs all current C++ unit tests and reports failures.

    :return: number of test failures. expected to be 0.
    :rtype: int >= 0
    )%%");
}

}  // end namespace gpkernel
