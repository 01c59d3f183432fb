/*!
  \file gpk_test_main.cpp
  \rst
  ``gpk_test``: runs every C++ unit test (see gpk_run_cpp_tests.hpp).  Exits with status 0 if all tests pass.
\endrst*/

#include <cstdio>

#include "gpk_logging.hpp"
#include "gpk_run_cpp_tests.hpp"

int main() {
  const int total_errors = gpkernel::RunCppTests();
  if (total_errors != 0) {
    GPK_FAILURE_PRINTF("%d C++ unit test failures\n", total_errors);
    return 1;
  }
  GPK_SUCCESS_PRINTF("all C++ unit tests passed\n");
  return 0;
}
