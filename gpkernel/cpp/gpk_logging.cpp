/*!
  \file gpk_logging.cpp
  \rst
  Printers for commonly used structures.  Printing code lives here to hide ``std::printf()`` calls.
\endrst*/

#include "gpk_logging.hpp"

#include <cstdio>

#include <vector>

#include "gpk_common.hpp"

namespace gpkernel {

/*!\rst
  Matrices are stored column-major and screens print by rows, so we access the matrix in transposed order.
\endrst*/
void PrintMatrix(double const * restrict matrix, int num_rows, int num_cols) noexcept {
  for (int i = 0; i < num_rows; ++i) {
    for (int j = 0; j < num_cols; ++j) {
      std::printf("%.18E ", matrix[j*num_rows + i]);
    }
    std::printf("\n");
  }
}

void PrintMatrixTrans(double const * restrict matrix, int num_rows, int num_cols) noexcept {
  for (int j = 0; j < num_cols; ++j) {
    for (int i = 0; i < num_rows; ++i) {
      std::printf("%.18E ", matrix[i]);
    }
    std::printf("\n");
    matrix += num_rows;
  }
}

void PrintMultiIndex(const std::vector<int>& multi_index) noexcept {
  std::printf("[");
  for (std::vector<int>::size_type i = 0; i < multi_index.size(); ++i) {
    std::printf(i == 0 ? "%d" : ", %d", multi_index[i]);
  }
  std::printf("]\n");
}

}  // end namespace gpkernel
