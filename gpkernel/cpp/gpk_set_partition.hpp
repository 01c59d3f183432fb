/*!
  \file gpk_set_partition.hpp
  \rst
  Enumeration of the set partitions of a derivative multi-index.

  Faa di Bruno's formula for the ``n``-th mixed partial of a composition ``k(y(tau))`` sums over all partitions of the
  ``n`` differentiations into non-empty blocks.  Each block becomes one derivative of the inner function and the
  number of blocks selects the derivative of the outer function.  The multi-index is partitioned by *position*:
  repeated dimension indices are distinct elements, so ``{0, 0}`` has the two partitions ``{{0, 0}}`` and
  ``{{0}, {0}}``.

  Partitions are generated from restricted growth strings (RGS).  An RGS ``a[n]`` satisfies ``a[0] = 0`` and
  ``a[i] <= 1 + max(a[0], ..., a[i-1])``; position ``i`` goes into block ``a[i]``.  RGS are in bijection with set
  partitions, and iterating them in lexicographic order visits each partition exactly once.  The number of
  partitions of ``n`` elements is the Bell number ``B(n)``: 1, 1, 2, 5, 15, 52, 203, ...
\endrst*/

#ifndef GPKERNEL_CPP_GPK_SET_PARTITION_HPP_
#define GPKERNEL_CPP_GPK_SET_PARTITION_HPP_

#include <vector>

#include "gpk_common.hpp"

namespace gpkernel {

//! one block of a partition: the multi-index values at the positions it covers
using PartitionBlock = std::vector<int>;
//! a set partition: disjoint, non-empty blocks covering every position
using SetPartition = std::vector<PartitionBlock>;

/*!\rst
  Generates every set partition of the positions of ``multiset``, in lexicographic RGS order.
  Blocks hold the *values* of ``multiset`` at their positions, in increasing position order; blocks are ordered by
  their smallest position.

  The empty multiset has exactly one partition, the empty partition (with zero blocks).

  \param
    :multiset: derivative multi-index (dimension indices, repeats allowed)
  \return
    all ``B(multiset.size())`` partitions of multiset
\endrst*/
std::vector<SetPartition> GenerateSetPartitions(const std::vector<int>& multiset) GPK_WARN_UNUSED_RESULT;

/*!\rst
  Computes the Bell number ``B(n)``, the number of set partitions of ``n`` elements, with the Bell triangle.
  Exact for ``n <= 25`` (``B(25)`` is about ``4.6e18``, just under ``2^63``).

  \param
    :n: number of elements, ``n >= 0``
  \return
    ``B(n)``
\endrst*/
long long BellNumber(int n) GPK_WARN_UNUSED_RESULT;

}  // end namespace gpkernel

#endif  // GPKERNEL_CPP_GPK_SET_PARTITION_HPP_
