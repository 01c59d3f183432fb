/*!
  \file gpk_python_test.hpp
  \rst
  This file registers a Python function that invokes all of the C++ tests.
\endrst*/

#ifndef GPKERNEL_CPP_GPK_PYTHON_TEST_HPP_
#define GPKERNEL_CPP_GPK_PYTHON_TEST_HPP_

#include "gpk_common.hpp"

namespace gpkernel {

/*!\rst
  Exports ``run_cpp_tests()``, which runs all C++ unit tests.
\endrst*/
void ExportCppTestFunctions();

}  // end namespace gpkernel

#endif  // GPKERNEL_CPP_GPK_PYTHON_TEST_HPP_
