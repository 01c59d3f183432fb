/*!
  \file gpk_common.hpp
  \rst
  Compiler macros, a few constants, and notes on the conventions used throughout the gpkernel library.

  **IMPLEMENTATION NOTES**

  1. No function in this library allocates memory that the caller must free.
     Array outputs are allocated by the caller and passed in as ``double * restrict``.  Class members are
     never plain owning pointers; use std::vector or std::unique_ptr.
     ``new`` appears only in ``Clone()`` and as the argument of a std::unique_ptr ctor.

  2. Batches of points are stored as flattened arrays, point-major.  A batch of ``num_points`` difference vectors
     in ``dim`` dimensions is described as ``tau[dim][num_points]``: ``dim`` is the most rapidly varying index, so
     the ``i``-th point starts at ``tau + i*dim``.  This is column-major storage with one column per point.

     Loops over such batches advance the pointer rather than recomputing offsets::

       for (int i = 0; i < num_points; ++i) {
         for (int d = 0; d < dim; ++d) {
           r2l2[i] += Square(tau[d])/lengths_sq[d];
         }
         tau += dim;
       }

  3. Derivative requests come in two forms:

     a. multi-index ``b``: a std::vector<int> of dimension indices, one entry per differentiation (repeats allowed).
        ``b = {0, 0, 2}`` means "twice wrt dimension 0, once wrt dimension 2."
     b. per-dimension orders ``n[dim]``: ``n = {2, 0, 1}`` is the same request as the multi-index above.

     Chain-rule composition works with (b); callers usually find (a) more natural.

  4. Keywords: mark pointers ``const`` and ``restrict`` whenever appropriate; mark member functions ``const`` whenever
     they do not modify the object (this should be nearly all of them).  The gcc attributes below
     (``GPK_NONNULL_POINTERS``, ``GPK_WARN_UNUSED_RESULT``, ``GPK_PURE_FUNCTION``, ...) document and check intent.

  5. Explicit [template] instantiation: templates over a closed set of types are defined in cpp files and instantiated
     there (``template class Foo<Bar>;``), with matching ``extern template`` declarations in the header.  Templates
     whose arguments come from callers (e.g., the functors handed to the numerical differentiator) live in headers;
     keep their instantiations in as few translation units as possible, since the multiprecision Bessel functions
     are expensive to compile.

  6. RAII and exception safety.  All resources are owned by objects whose dtors release them.  All library components
     provide the basic exception guarantee; kernel evaluation never modifies the kernel object, so evaluations
     provide the strong guarantee.

  Function comment style: comments go above the declaration or definition they describe.  Declaration comments
  describe all inputs/outputs/returns in RST::

    BEGIN_COMMENT!\rst
    Compute all the stuff.

    \param
      :size: number of variables
      :x[size]: vector of input variables
    \output
      :y[size]: vector of computed results
    \return
      confidence score of the results, y
    \endrstEND_COMMENT
    double ComputeStuff(int size, double const * restrict x, double * restrict y);
\endrst*/

#ifndef GPKERNEL_CPP_GPK_COMMON_HPP_
#define GPKERNEL_CPP_GPK_COMMON_HPP_

namespace gpkernel {

/*!\rst
  Macros to delete the default ctor, copy ctor and/or assignment operator of a class.
  Place in the public segment of a class so that misuse produces a readable error.
\endrst*/
#define GPK_DISALLOW_DEFAULT_CONSTRUCTOR(TypeName) \
  TypeName() = delete

#define GPK_DISALLOW_COPY(TypeName) \
  TypeName(const TypeName&) = delete

#define GPK_DISALLOW_ASSIGN(TypeName) \
  void operator=(const TypeName&) = delete

#define GPK_DISALLOW_COPY_AND_ASSIGN(TypeName) \
  GPK_DISALLOW_COPY(TypeName);                 \
  GPK_DISALLOW_ASSIGN(TypeName)

#define GPK_DISALLOW_DEFAULT_AND_COPY_AND_ASSIGN(TypeName) \
  GPK_DISALLOW_DEFAULT_CONSTRUCTOR(TypeName); \
  GPK_DISALLOW_COPY_AND_ASSIGN(TypeName)

#define GPK_DISALLOW_DEFAULT_AND_ASSIGN(TypeName) \
  GPK_DISALLOW_DEFAULT_CONSTRUCTOR(TypeName); \
  GPK_DISALLOW_ASSIGN(TypeName)

/*!\rst
  Name of the function immediately containing the macro.  ``__PRETTY_FUNCTION__`` (gcc, clang, icc) includes
  template parameters and argument types, which makes exception messages far more useful.
\endrst*/
#ifdef __GNUC__
#define GPK_CURRENT_FUNCTION_NAME __PRETTY_FUNCTION__
#else
#define GPK_CURRENT_FUNCTION_NAME __func__
#endif

/*!\rst
  Branch prediction hints via ``__builtin_expect()``.  Only use these for branches that almost never happen
  (e.g., errors) or that must run as fast as possible::

    if (unlikely(length <= 0.0)) {
      GPK_THROW_EXCEPTION(...);
    }
\endrst*/
#ifndef unlikely
#define unlikely(expr) __builtin_expect((expr), 0)
#endif

#ifndef likely
#define likely(expr) __builtin_expect((expr), 1)
#endif

/*!\rst
  ``restrict`` is a C99 keyword, not part of C++, but gcc/clang/icc accept ``__restrict__``.  A ``restrict``'d pointer
  promises that values WRITTEN through it will never be read through another pointer (and vice versa), which frees
  the compiler to vectorize loops over batches.  Read-only pointers may alias each other freely.

  The compiler does NOT check this promise; violating it is undefined behavior.
\endrst*/
#ifdef __cplusplus
#define restrict __restrict__
#endif

/*!\rst
  Label function parameters as unused, suppressing warnings.  ``GPK_UNUSED(foo)`` expands to ``UNUSED_foo``.
\endrst*/
#ifdef __GNUC__
#define GPK_UNUSED(x) UNUSED_ ## x __attribute__((__unused__))
#else
#define GPK_UNUSED(x) UNUSED_ ## x
#endif

/*!\rst
  Promise the compiler that no pointer argument is ``nullptr``.  Not checked at runtime.

  ``GPK_NONNULL_POINTERS_LIST`` indexes arguments from 1 for free functions and from 2 for member functions
  (``this`` is implicitly argument 1).
\endrst*/
#ifdef __GNUC__
#define GPK_NONNULL_POINTERS __attribute__((__nonnull__))
#define GPK_NONNULL_POINTERS_LIST(...) __attribute__((__nonnull__ (__VA_ARGS__)))
#else
#define GPK_NONNULL_POINTERS
#define GPK_NONNULL_POINTERS_LIST(...)
#endif

/*!\rst
  Warn if the return value of a function is ignored.
\endrst*/
#ifdef __GNUC__
#define GPK_WARN_UNUSED_RESULT __attribute__((__warn_unused_result__))
#else
#define GPK_WARN_UNUSED_RESULT
#endif

/*!\rst
  "const" functions have no side effects and read no memory other than their (by-value) arguments.
\endrst*/
#ifdef __GNUC__
#define GPK_CONST_FUNCTION __attribute__((__const__))
#else
#define GPK_CONST_FUNCTION
#endif

/*!\rst
  "pure" functions have no side effects but may READ global memory and dereference pointers.
\endrst*/
#ifdef __GNUC__
#define GPK_PURE_FUNCTION __attribute__((__pure__))
#else
#define GPK_PURE_FUNCTION
#endif

/*!\rst
  Functions that never return (e.g., always throw).
\endrst*/
#ifdef __GNUC__
#define GPK_NORETURN __attribute__((__noreturn__))
#else
#define GPK_NORETURN
#endif

/*!\rst
  Square a value.  Pass-by-value and ``constexpr``; only meant for arithmetic types.

  \param
    :value: value to be squared
  \return
    the product: value * value
\endrst*/
template <typename T>
constexpr GPK_WARN_UNUSED_RESULT GPK_CONST_FUNCTION T Square(T value) {
  return value*value;
}

/*!\rst
  A few useful mathematical constants.
\endrst*/
static constexpr double kSqrt2 = 1.4142135623730950488017;
static constexpr double kSqrt3 = 1.7320508075688772935274;
static constexpr double kSqrt5 = 2.2360679774997896964092;

}  // end namespace gpkernel

#endif  // GPKERNEL_CPP_GPK_COMMON_HPP_
