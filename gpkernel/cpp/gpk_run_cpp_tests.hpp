/*!
  \file gpk_run_cpp_tests.hpp
  \rst
  A single entry point for every C++ unit test in gpkernel.  Called by the ``gpk_test`` executable and exported to
  Python as ``GPK.run_cpp_tests()``.
\endrst*/

#ifndef GPKERNEL_CPP_GPK_RUN_CPP_TESTS_HPP_
#define GPKERNEL_CPP_GPK_RUN_CPP_TESTS_HPP_

#include "gpk_common.hpp"

namespace gpkernel {

/*!\rst
  Runs all C++ unit tests, printing SUCCESS/FAILURE for each battery.

  \return
    number of test failures. expected to be 0.
\endrst*/
GPK_WARN_UNUSED_RESULT int RunCppTests();

}  // end namespace gpkernel

#endif  // GPKERNEL_CPP_GPK_RUN_CPP_TESTS_HPP_
