/*!
  \file gpk_random_test.hpp
  \rst
  Tests for gpk_random.hpp: the PRNG container and the random difference-vector generator used by the ping tests.
\endrst*/

#ifndef GPKERNEL_CPP_GPK_RANDOM_TEST_HPP_
#define GPKERNEL_CPP_GPK_RANDOM_TEST_HPP_

#include "gpk_common.hpp"

namespace gpkernel {

/*!\rst
  Tests that UniformRandomGenerator reseeding reproduces its draws and that FillRandomDifferenceVectors() produces
  coordinates with magnitudes in range and both signs.

  \return
    number of test failures: 0 if the random generators are working properly
\endrst*/
GPK_WARN_UNUSED_RESULT int RunRandomTests();

}  // end namespace gpkernel

#endif  // GPKERNEL_CPP_GPK_RANDOM_TEST_HPP_
