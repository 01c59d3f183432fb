/*!
  \file gpk_logging.hpp
  \rst
  Macros wrapping std::printf().  The "log file" is stdout and the verbosity level is chosen at compile-time, with
  separate macros for debug, verbose, warning, and error messages.

  Also has printers for structures used throughout the library: column-major matrices (batches of points) and
  derivative multi-indexes.
\endrst*/

#ifndef GPKERNEL_CPP_GPK_LOGGING_HPP_
#define GPKERNEL_CPP_GPK_LOGGING_HPP_

#include <cstdio>

#include <vector>

#include "gpk_common.hpp"

namespace gpkernel {

/*!\rst
  Macro wrapper for printf, enabled by the compiler option GPK_DEBUG_PRINT.
  Extra details about internal workings/state of code.
\endrst*/
#ifdef GPK_DEBUG_PRINT
#define GPK_DEBUG_PRINTF(...) std::printf(__VA_ARGS__)
#else
#define GPK_DEBUG_PRINTF(...) (void)0
#endif

/*!\rst
  Macro wrapper for printf, enabled by the compiler option GPK_VERBOSE_PRINT.
  Extra information about which evaluation paths (closed form vs numerical fallback) were taken.
\endrst*/
#ifdef GPK_VERBOSE_PRINT
#define GPK_VERBOSE_PRINTF(...) std::printf(__VA_ARGS__)
#else
#define GPK_VERBOSE_PRINTF(...) (void)0
#endif

#if defined(GPK_VERBOSE_PRINT) || defined(GPK_DEBUG_PRINT)
#ifndef GPK_WARNING_PRINT
#define GPK_WARNING_PRINT
#endif
#endif

/*!\rst
  Macro wrapper for printf, enabled by the compiler option GPK_WARNING_PRINT.
  Something is questionable (e.g., a result may be inaccurate) but not severe enough to stop.
\endrst*/
#ifdef GPK_WARNING_PRINT
#define GPK_WARNING_PRINTF(...) std::printf(__VA_ARGS__)
#else
#define GPK_WARNING_PRINTF(...) (void)0
#endif

#ifdef GPK_WARNING_PRINT
#ifndef GPK_ERROR_PRINT
#define GPK_ERROR_PRINT
#endif
#endif

/*!\rst
  Macro wrapper for printf, enabled by the compiler option GPK_ERROR_PRINT.
  Something went wrong.
\endrst*/
#ifdef GPK_ERROR_PRINT
#define GPK_ERROR_PRINTF(...) std::printf(__VA_ARGS__)
#else
#define GPK_ERROR_PRINTF(...) (void)0
#endif

/*!\rst
  Macros for printf'ing in color.  Insert before a string component of printf()'s format; the color persists
  until reset::

    printf(GPK_ANSI_COLOR_GREEN "Hi I am %d" GPK_ANSI_COLOR_RESET " and you are %d\n", 2, 3);
\endrst*/
#define GPK_ANSI_COLOR_RESET   "\x1b[0m"
#define GPK_ANSI_COLOR_RED     "\x1b[31m"
#define GPK_ANSI_COLOR_GREEN   "\x1b[32m"
#define GPK_ANSI_COLOR_YELLOW  "\x1b[33m"
#define GPK_ANSI_COLOR_BOLDRED     "\033[1m\033[31m"
#define GPK_ANSI_COLOR_BOLDGREEN   "\033[1m\033[32m"

// for top-level tests
#define GPK_SUCCESS_PRINTF(...) std::printf(GPK_ANSI_COLOR_BOLDGREEN "SUCCESS: " GPK_ANSI_COLOR_RESET __VA_ARGS__)
#define GPK_FAILURE_PRINTF(...) std::printf(GPK_ANSI_COLOR_BOLDRED "FAILURE: " GPK_ANSI_COLOR_RESET __VA_ARGS__)
// for test sub-components
#define GPK_PARTIAL_SUCCESS_PRINTF(...) std::printf(GPK_ANSI_COLOR_GREEN "ok: " GPK_ANSI_COLOR_RESET __VA_ARGS__)
#define GPK_PARTIAL_FAILURE_PRINTF(...) std::printf(GPK_ANSI_COLOR_RED "fail: " GPK_ANSI_COLOR_RESET __VA_ARGS__)

/*!\rst
  Print a 2D matrix (formatted) to stdout, one row per line.  Uses ``%.18E`` descriptors to printf.

  For example, the input: ``A[3][4] = [4 53 81 32 12 2 5 8 93 2 1 0]``

  would be printed as (with decimal points removed)::

    4  32  5  2
    53 12  8  1
    81  2  93 0

  A batch of points ``tau[dim][num_points]`` prints with one point per *column*; use PrintMatrixTrans()
  for one point per line.

  \param
    :matrix[num_rows][num_cols]: matrix to be printed
    :num_rows: number of rows
    :num_cols: number of columns
\endrst*/
void PrintMatrix(double const * restrict matrix, int num_rows, int num_cols) noexcept GPK_NONNULL_POINTERS;

/*!\rst
  Print the TRANSPOSE of a 2D matrix (formatted) to stdout.  Uses ``%.18E`` descriptors to printf.
  Equivalent to PrintMatrix() on the transposed matrix.

  \param
    :matrix[num_rows][num_cols]: matrix to be printed
    :num_rows: number of rows
    :num_cols: number of columns
\endrst*/
void PrintMatrixTrans(double const * restrict matrix, int num_rows, int num_cols) noexcept GPK_NONNULL_POINTERS;

/*!\rst
  Print a derivative multi-index as ``[d_0, d_1, ...]`` followed by a newline.

  \param
    :multi_index: dimension indices, one per differentiation
\endrst*/
void PrintMultiIndex(const std::vector<int>& multi_index) noexcept;

}  // end namespace gpkernel

#endif  // GPKERNEL_CPP_GPK_LOGGING_HPP_
