/*!
  \file gpk_set_partition_test.cpp
  \rst
  Tests for GenerateSetPartitions() and BellNumber().  Partitions of ``{0, ..., n-1}`` are checked for validity and
  uniqueness (after sorting into a canonical form) and counted against Bell numbers.  Multi-indices with repeated
  entries are partitioned by position, so their counts are Bell numbers too.
\endrst*/

#include "gpk_set_partition_test.hpp"

#include <algorithm>
#include <numeric>
#include <set>
#include <vector>

#include "gpk_common.hpp"
#include "gpk_exception.hpp"
#include "gpk_logging.hpp"
#include "gpk_set_partition.hpp"
#include "gpk_test_utils.hpp"

namespace gpkernel {

namespace {

/*!\rst
  Checks BellNumber() against tabulated values and checks that indices outside ``[0, 25]`` throw.

  \return
    number of test failures
\endrst*/
GPK_WARN_UNUSED_RESULT int BellNumberTest() {
  const long long bell_numbers_truth[] = {1, 1, 2, 5, 15, 52, 203, 877, 4140, 21147, 115975};
  int total_errors = 0;

  for (int n = 0; n < static_cast<int>(sizeof(bell_numbers_truth)/sizeof(bell_numbers_truth[0])); ++n) {
    if (!CheckIntEquals(BellNumber(n), bell_numbers_truth[n])) {
      ++total_errors;
    }
  }

  if (!CheckIntEquals(BellNumber(25), 4638590332229999353LL)) {
    ++total_errors;
  }

  const int invalid_indices[] = {-1, 26};
  for (const auto n : invalid_indices) {
    try {
      // increment errors: we must catch an exception to decrement
      ++total_errors;
      const long long GPK_UNUSED(bell) = BellNumber(n);
    } catch (const BoundsException<int>& exception) {
      --total_errors;
    }
  }

  if (total_errors != 0) {
    GPK_PARTIAL_FAILURE_PRINTF("BellNumber failed with %d errors\n", total_errors);
  } else {
    GPK_PARTIAL_SUCCESS_PRINTF("BellNumber passed\n");
  }
  return total_errors;
}

/*!\rst
  Checks that every partition of ``{0, ..., n-1}`` covers each element exactly once with non-empty blocks, that no
  partition appears twice, and that there are ``B(n)`` of them.

  \return
    number of test failures
\endrst*/
GPK_WARN_UNUSED_RESULT int DistinctElementPartitionTest() {
  const int max_size = 7;
  int total_errors = 0;

  for (int size = 0; size <= max_size; ++size) {
    std::vector<int> elements(size);
    std::iota(elements.begin(), elements.end(), 0);

    const std::vector<SetPartition> partitions = GenerateSetPartitions(elements);
    if (!CheckIntEquals(partitions.size(), BellNumber(size))) {
      GPK_ERROR_PRINTF("wrong number of partitions for size %d\n", size);
      ++total_errors;
    }

    std::set<SetPartition> canonical_partitions;
    for (const auto& partition : partitions) {
      std::vector<int> covered;
      SetPartition canonical;
      for (const auto& block : partition) {
        if (block.empty()) {
          GPK_ERROR_PRINTF("empty block in a partition of size %d\n", size);
          ++total_errors;
        }
        covered.insert(covered.end(), block.begin(), block.end());
        canonical.push_back(block);
        std::sort(canonical.back().begin(), canonical.back().end());
      }
      std::sort(covered.begin(), covered.end());
      if (covered != elements) {
        GPK_ERROR_PRINTF("partition of size %d does not cover every element exactly once\n", size);
        ++total_errors;
      }
      std::sort(canonical.begin(), canonical.end());
      canonical_partitions.insert(canonical);
    }

    if (!CheckIntEquals(canonical_partitions.size(), partitions.size())) {
      GPK_ERROR_PRINTF("duplicate partitions for size %d\n", size);
      ++total_errors;
    }

    // lexicographic RGS order: one block first, all singletons last
    if (size > 0) {
      if (!CheckIntEquals(partitions.front().size(), 1) ||
          !CheckIntEquals(partitions.back().size(), size)) {
        ++total_errors;
      }
    }
  }

  if (total_errors != 0) {
    GPK_PARTIAL_FAILURE_PRINTF("distinct element set partitions failed with %d errors\n", total_errors);
  } else {
    GPK_PARTIAL_SUCCESS_PRINTF("distinct element set partitions passed\n");
  }
  return total_errors;
}

/*!\rst
  Repeated entries are distinct positions: ``{0, 0}`` has the partitions ``{{0, 0}}`` and ``{{0}, {0}}``.  The empty
  multi-index has exactly one partition, with zero blocks.

  \return
    number of test failures
\endrst*/
GPK_WARN_UNUSED_RESULT int RepeatedEntryPartitionTest() {
  int total_errors = 0;

  const std::vector<SetPartition> empty_partitions = GenerateSetPartitions(std::vector<int>());
  if (!CheckIntEquals(empty_partitions.size(), 1) || !CheckIntEquals(empty_partitions[0].size(), 0)) {
    ++total_errors;
  }

  const std::vector<SetPartition> pair_partitions = GenerateSetPartitions(std::vector<int>(2, 0));
  const std::vector<SetPartition> pair_partitions_truth = {{{0, 0}}, {{0}, {0}}};
  if (pair_partitions != pair_partitions_truth) {
    GPK_ERROR_PRINTF("partitions of {0, 0} are wrong\n");
    ++total_errors;
  }

  // b = {1, 1, 0}: 5 partitions; blocks keep values in position order
  const std::vector<SetPartition> triple_partitions = GenerateSetPartitions({1, 1, 0});
  const std::vector<SetPartition> triple_partitions_truth = {
    {{1, 1, 0}},
    {{1, 1}, {0}},
    {{1, 0}, {1}},
    {{1}, {1, 0}},
    {{1}, {1}, {0}},
  };
  if (triple_partitions != triple_partitions_truth) {
    GPK_ERROR_PRINTF("partitions of {1, 1, 0} are wrong\n");
    ++total_errors;
  }

  for (int size = 1; size <= 6; ++size) {
    if (!CheckIntEquals(GenerateSetPartitions(std::vector<int>(size, 3)).size(), BellNumber(size))) {
      ++total_errors;
    }
  }

  if (total_errors != 0) {
    GPK_PARTIAL_FAILURE_PRINTF("repeated entry set partitions failed with %d errors\n", total_errors);
  } else {
    GPK_PARTIAL_SUCCESS_PRINTF("repeated entry set partitions passed\n");
  }
  return total_errors;
}

}  // end unnamed namespace

int RunSetPartitionTests() {
  int total_errors = 0;

  total_errors += BellNumberTest();
  total_errors += DistinctElementPartitionTest();
  total_errors += RepeatedEntryPartitionTest();

  return total_errors;
}

}  // end namespace gpkernel
