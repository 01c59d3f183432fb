/*!
  \file gpk_set_partition_test.hpp
  \rst
  Unit tests for the set partition enumerator in gpk_set_partition.hpp: counts against Bell numbers, validity of each
  partition (every element used exactly once, no empty blocks), and the absence of duplicates.
\endrst*/

#ifndef GPKERNEL_CPP_GPK_SET_PARTITION_TEST_HPP_
#define GPKERNEL_CPP_GPK_SET_PARTITION_TEST_HPP_

#include "gpk_common.hpp"

namespace gpkernel {

/*!\rst
  Runs the set partition unit tests.

  \return
    number of test failures: 0 if set partitions are working properly
\endrst*/
GPK_WARN_UNUSED_RESULT int RunSetPartitionTests();

}  // end namespace gpkernel

#endif  // GPKERNEL_CPP_GPK_SET_PARTITION_TEST_HPP_
