/*!
  \file gpk_test_utils_test.hpp
  \rst
  Tests for the testing utilities in gpk_test_utils.hpp.  PingDerivative() is the arbiter for every derivative test in
  this library, so it is checked here against functions whose gradients are known to be right (and known to be wrong).
\endrst*/

#ifndef GPKERNEL_CPP_GPK_TEST_UTILS_TEST_HPP_
#define GPKERNEL_CPP_GPK_TEST_UTILS_TEST_HPP_

#include "gpk_common.hpp"

namespace gpkernel {

/*!\rst
  Checks that PingDerivative() accepts correct gradients and flags incorrect ones, and that the Check*() helpers
  honor their tolerances.

  \return
    number of test failures: 0 if the test utilities are working properly
\endrst*/
GPK_WARN_UNUSED_RESULT int TestUtilsTests();

}  // end namespace gpkernel

#endif  // GPKERNEL_CPP_GPK_TEST_UTILS_TEST_HPP_
