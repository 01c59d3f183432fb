/*!
  \file gpk_run_cpp_tests.cpp
  \rst
  This file contains a wrapper that calls all ``C++`` unit tests.  The wrapper prints messages indicating which
  test(s) failed.
\endrst*/

#include "gpk_run_cpp_tests.hpp"

#include "gpk_common.hpp"
#include "gpk_covariance_test.hpp"
#include "gpk_logging.hpp"
#include "gpk_numerical_differentiation_test.hpp"
#include "gpk_random_test.hpp"
#include "gpk_set_partition_test.hpp"
#include "gpk_test_utils_test.hpp"

namespace gpkernel {

int RunCppTests() {
  int total_errors = 0;
  int error = 0;

  error = TestUtilsTests();
  if (error != 0) {
    GPK_FAILURE_PRINTF("test utils\n");
  } else {
    GPK_SUCCESS_PRINTF("test utils\n");
  }
  total_errors += error;

  error = RunRandomTests();
  if (error != 0) {
    GPK_FAILURE_PRINTF("random number generator tests failed\n");
  } else {
    GPK_SUCCESS_PRINTF("random number generator tests\n");
  }
  total_errors += error;

  error = RunSetPartitionTests();
  if (error != 0) {
    GPK_FAILURE_PRINTF("set partition tests failed\n");
  } else {
    GPK_SUCCESS_PRINTF("set partition tests\n");
  }
  total_errors += error;

  error = RunNumericalDifferentiationTests();
  if (error != 0) {
    GPK_FAILURE_PRINTF("numerical differentiation tests failed\n");
  } else {
    GPK_SUCCESS_PRINTF("numerical differentiation tests\n");
  }
  total_errors += error;

  error = RunCovarianceTests();
  if (error != 0) {
    GPK_FAILURE_PRINTF("covariance tests failed\n");
  } else {
    GPK_SUCCESS_PRINTF("covariance tests\n");
  }
  total_errors += error;

  return total_errors;
}

}  // end namespace gpkernel
