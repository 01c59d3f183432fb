/*!
  \file gpk_set_partition.cpp
  \rst
  Restricted growth string enumeration of set partitions; see gpk_set_partition.hpp.
\endrst*/

#include "gpk_set_partition.hpp"

#include <algorithm>
#include <utility>
#include <vector>

#include "gpk_common.hpp"
#include "gpk_exception.hpp"

namespace gpkernel {

namespace {

//! largest n for which all partitions are reserved up front
constexpr int kMaxReserveSize = 10;

}  // end unnamed namespace

/*!\rst
  ``growth`` is the current RGS and ``prefix_max[i] = max(growth[0], ..., growth[i])``.  The lexicographic successor
  increments the rightmost position ``i > 0`` with ``growth[i] <= prefix_max[i-1]`` and zeroes everything after it.
  When no such position exists, ``growth`` is ``0, 1, 2, ..., n-1`` (all singletons) and we are done.
\endrst*/
std::vector<SetPartition> GenerateSetPartitions(const std::vector<int>& multiset) {
  const int size = multiset.size();
  std::vector<SetPartition> partitions;
  if (size == 0) {
    partitions.emplace_back();
    return partitions;
  }
  if (size <= kMaxReserveSize) {
    partitions.reserve(BellNumber(size));
  }

  std::vector<int> growth(size, 0);
  std::vector<int> prefix_max(size, 0);
  while (true) {
    SetPartition partition(prefix_max[size - 1] + 1);
    for (int i = 0; i < size; ++i) {
      partition[growth[i]].push_back(multiset[i]);
    }
    partitions.push_back(std::move(partition));

    int i = size - 1;
    while (i > 0 && growth[i] > prefix_max[i - 1]) {
      --i;
    }
    if (i == 0) {
      break;
    }

    ++growth[i];
    prefix_max[i] = std::max(prefix_max[i - 1], growth[i]);
    for (int j = i + 1; j < size; ++j) {
      growth[j] = 0;
      prefix_max[j] = prefix_max[i];
    }
  }
  return partitions;
}

/*!\rst
  Bell triangle: each row starts with the last entry of the previous row, and each later entry is the sum of its
  left neighbor and the entry above that neighbor.  Row ``k`` ends in ``B(k+1)``, so ``B(n)`` is the last entry of row
  ``n-1``; stopping there keeps every intermediate below ``B(n)``.
\endrst*/
long long BellNumber(int n) {
  constexpr int kMaxExactBellIndex = 25;
  if (unlikely(n < 0 || n > kMaxExactBellIndex)) {
    GPK_THROW_EXCEPTION(BoundsException<int>, "Bell number index out of exactly representable range.", n, 0,
                        kMaxExactBellIndex);
  }
  if (n == 0) {
    return 1;
  }

  std::vector<long long> row(1, 1);
  for (int k = 1; k < n; ++k) {
    std::vector<long long> next_row(k + 1);
    next_row[0] = row.back();
    for (int j = 1; j <= k; ++j) {
      next_row[j] = next_row[j - 1] + row[j - 1];
    }
    row.swap(next_row);
  }
  return row.back();
}

}  // end namespace gpkernel
