/*!
  \file gpk_exception.hpp
  \rst
  Exception objects along with helper functions and macros for exceptions.  This library never calls throw
  directly.  Instead we write::

    GPK_THROW_EXCEPTION(MyException, ...);  // preferred
    gpkernel::ThrowException(MyException(...));  // uncommon

  analogous to BOOST_THROW_EXCEPTION and boost::throw_exception().

  ALL exception objects MUST inherit publicly from std::exception.  Here the root is GpKernelException;
  each subclass documents the format of its ``what()`` message in its class comments.

  To use GPK_THROW_EXCEPTION, the first two arguments of MyException's ctor must be ``char const *``
  (file/line info and function name).  Every ctor below takes these plus an optional ``custom_message``:

  * ``line_info``: ``"(FILE: LINE)"``, from GPK_STRINGIFY_FILE_AND_LINE
  * ``func_info``: function name from GPK_CURRENT_FUNCTION_NAME, or nullptr
  * ``custom_message``: extra text for the reader, or nullptr

  Kernel code reports bad hyperparameters (``nu <= 0``, a length scale ``<= 0``) with LowerBoundException, dimension
  indexes outside ``[0, dim)`` with BoundsException, orders beyond the multiprecision tiers with UpperBoundException
  and size mismatches with InvalidValueException.

  Users may define GPK_NO_EXCEPTIONS to *disable* exceptions; then this library never calls throw and
  users must implement gpkernel::ThrowException() themselves.
\endrst*/

#include <exception>
#include <limits>
#include <string>
#include <type_traits>

#include "gpk_common.hpp"

#ifndef GPKERNEL_CPP_GPK_EXCEPTION_HPP_
#define GPKERNEL_CPP_GPK_EXCEPTION_HPP_

namespace gpkernel {

/*!\rst
  Stringify the expansion of a macro: ``GPK_STRINGIFY_EXPANSION(__LINE__) --> "53"`` whereas ``#__LINE__ --> "__LINE__"``.
  The inner macro is needed for the expansion to happen; see the bottom of
  http://gcc.gnu.org/onlinedocs/cpp/Stringification.html
\endrst*/
#define GPK_STRINGIFY_EXPANSION_INNER(x) #x
#define GPK_STRINGIFY_EXPANSION(x) GPK_STRINGIFY_EXPANSION_INNER(x)

/*!\rst
  Compile-time string with the current file and line, e.g., ``(gpk_covariance.cpp: 893)``
\endrst*/
#define GPK_STRINGIFY_FILE_AND_LINE "(" __FILE__ ": " GPK_STRINGIFY_EXPANSION(__LINE__) ")"

#ifdef GPK_NO_EXCEPTIONS
/*!\rst
  With exceptions disabled, the user implements ThrowException().  Callers assume this function NEVER returns;
  if the user's implementation does, behavior is UNDEFINED.

  ``throw`` may still be called indirectly through Boost; define BOOST_NO_EXCEPTIONS and provide
  ``boost::throw_exception`` as well.

  \param
    :exception: an exception object publicly deriving from std::exception
  \return
    **NEVER RETURNS**
\endrst*/
GPK_NORETURN void ThrowException(const std::exception& exception);
#else
/*!\rst
  Throws ``except``, which must publicly derive from std::exception (checked at compile time).

  \param
    :except: exception object to throw
  \return
    **NEVER RETURNS**
\endrst*/
template <typename ExceptionType>
GPK_NORETURN inline void ThrowException(const ExceptionType& except) {
  static_assert(std::is_base_of<std::exception, ExceptionType>::value, "ExceptionType must be derived from std::exception.");
  throw except;
}
#endif

/*!\rst
  Throw ExceptionType, adding file/line and function name information.  ExceptionType's ctor argument list MUST
  start with two ``char const *`` (line info, function info) followed by ``Args...``.

  Instead of::

    ThrowException(BoundsException<int>(GPK_STRINGIFY_FILE_AND_LINE, GPK_CURRENT_FUNCTION_NAME, "Invalid dimension index.", value, min, max));

  write::

    GPK_THROW_EXCEPTION(BoundsException<int>, "Invalid dimension index.", value, min, max);
\endrst*/
#define GPK_THROW_EXCEPTION(ExceptionType, Args...) ThrowException(ExceptionType(GPK_STRINGIFY_FILE_AND_LINE, GPK_CURRENT_FUNCTION_NAME, Args))

/*!\rst
  **Overview**

  General runtime errors that do not fit other exception types.  Superclass of all other exceptions in the
  ``gpkernel`` library.  Essentially std::runtime_error with a ctor that formats the message.

  **Message Format**

  The ``what()`` message is formatted in the class ctor (capitals indicate variable information)::

    R"%%(
    GpKernelException: CUSTOM_MESSAGE FUNCTION_NAME FILE_LINE_INFO
    )%%"
\endrst*/
class GpKernelException : public std::exception {
 public:
  //! String name of this exception for logging.
  constexpr static char const * kName = "GpKernelException";

  //! Message: ``GpKernelException: CUSTOM_MESSAGE FUNCTION_NAME FILE_LINE_INFO``.
  GpKernelException(char const * line_info, char const * func_info, char const * custom_message);

  virtual const char* what() const noexcept override GPK_WARN_UNUSED_RESULT {
    return message_.c_str();
  }

  GpKernelException() = delete;

 protected:
  //! Starts ``message_`` with a subclass's ``kName``.
  explicit GpKernelException(char const * name);

  //! Appends ``custom_message``, ``func_info`` and ``line_info``, in that order, to ``message_``.
  void AppendCustomMessageAndDebugInfo(char const * line_info, char const * func_info,
                                       char const * custom_message);

  //! the message produced by ``what()``
  std::string message_;
};

/*!\rst
  **Overview**

  A value outside its admissible closed range ``[min, max]``, e.g., a dimension index in a derivative multi-index
  that is negative or ``>= dim``.  Python sees ``value``, ``min`` and ``max`` as attributes.

  **Message Format**

  ::

    R"%%(
    BoundsException: VALUE is not in range [MIN, MAX].
    CUSTOM_MESSAGE FUNCTION_NAME FILE_LINE_INFO
    )%%"
\endrst*/
template <typename ValueType>
class BoundsException : public GpKernelException {
 public:
  //! String name of this exception for logging.
  constexpr static char const * kName = "BoundsException";

  //! ``value_in`` lies outside ``[min_in, max_in]``.
  BoundsException(char const * line_info, char const * func_info,
                  char const * custom_message, ValueType value_in,
                  ValueType min_in, ValueType max_in);

  ValueType value() const noexcept GPK_PURE_FUNCTION GPK_WARN_UNUSED_RESULT {
    return value_;
  }

  ValueType max() const noexcept GPK_PURE_FUNCTION GPK_WARN_UNUSED_RESULT {
    return max_;
  }

  ValueType min() const noexcept GPK_PURE_FUNCTION GPK_WARN_UNUSED_RESULT {
    return min_;
  }

  GPK_DISALLOW_DEFAULT_AND_ASSIGN(BoundsException);

 protected:
  BoundsException(char const * name_in, char const * line_info,
                  char const * func_info, char const * custom_message,
                  ValueType value_in, ValueType min_in, ValueType max_in);

 private:
  ValueType value_;
  //! ``[min_, max_]`` is the admissible range
  ValueType min_, max_;
};

// template explicit instantiation declarations, see gpk_common.hpp header comments, item 5
extern template class BoundsException<int>;
extern template class BoundsException<double>;

/*!\rst
  Only a lower bound applies (hyperparameters, derivative orders); ``max()`` is ``std::numeric_limits<ValueType>::max()``.
\endrst*/
template <typename ValueType>
class LowerBoundException : public BoundsException<ValueType> {
 public:
  //! String name of this exception for logging.
  constexpr static char const * kName = "LowerBoundException";

  LowerBoundException(char const * line_info, char const * func_info,
                      char const * custom_message, ValueType value_in,
                      ValueType min_in)
      : BoundsException<ValueType>(kName, line_info, func_info, custom_message, value_in,
                                   min_in, std::numeric_limits<ValueType>::max()) {
  }

  GPK_DISALLOW_DEFAULT_AND_ASSIGN(LowerBoundException);
};

/*!\rst
  Only an upper bound applies (e.g., the total differentiation order); ``min()`` is
  ``std::numeric_limits<ValueType>::lowest()``.
\endrst*/
template <typename ValueType>
class UpperBoundException : public BoundsException<ValueType> {
 public:
  //! String name of this exception for logging.
  constexpr static char const * kName = "UpperBoundException";

  UpperBoundException(char const * line_info, char const * func_info,
                      char const * custom_message, ValueType value_in,
                      ValueType max_in)
      : BoundsException<ValueType>(kName, line_info, func_info, custom_message, value_in,
                                   std::numeric_limits<ValueType>::lowest(), max_in) {
  }

  GPK_DISALLOW_DEFAULT_AND_ASSIGN(UpperBoundException);
};

/*!\rst
  **Overview**

  A value that must equal a known truth (e.g., the number of length scales vs. ``dim``), optionally within a
  tolerance.  The tolerance ctor is only enabled for floating point types.

  **Message Format**

  ::

    R"%%(
    InvalidValueException: VALUE != TRUTH (value != truth).
    CUSTOM_MESSAGE FUNCTION_NAME FILE_LINE_INFO
    )%%"

  OR ::

    R"%%(
    InvalidValueException: VALUE != TRUTH ± TOLERANCE (value != truth ± tolerance).
    CUSTOM_MESSAGE FUNCTION_NAME FILE_LINE_INFO
    )%%"
\endrst*/
template <typename ValueType>
class InvalidValueException : public GpKernelException {
 public:
  //! String name of this exception for logging.
  constexpr static char const * kName = "InvalidValueException";

  //! ``value_in`` should have been exactly ``truth_in``.
  InvalidValueException(char const * line_info, char const * func_info,
                        char const * custom_message, ValueType value_in, ValueType truth_in);

  /*!\rst
    As above, with a tolerance: the maximum acceptable error in ``|value - truth|``.
  \endrst*/
  template <typename ValueTypeIn = ValueType, class = typename std::enable_if<std::is_floating_point<ValueType>::value, ValueTypeIn>::type>
  InvalidValueException(char const * line_info, char const * func_info,
                        char const * custom_message, ValueType value_in,
                        ValueType truth_in, ValueType tolerance_in);

  ValueType value() const noexcept GPK_PURE_FUNCTION GPK_WARN_UNUSED_RESULT {
    return value_;
  }

  ValueType truth() const noexcept GPK_PURE_FUNCTION GPK_WARN_UNUSED_RESULT {
    return truth_;
  }

  ValueType tolerance() const noexcept GPK_PURE_FUNCTION GPK_WARN_UNUSED_RESULT {
    return tolerance_;
  }

  GPK_DISALLOW_DEFAULT_AND_ASSIGN(InvalidValueException);

 private:
  ValueType value_;
  ValueType truth_;
  //! 0 unless built with the tolerance ctor
  ValueType tolerance_;
};

// template explicit instantiation declarations, see gpk_common.hpp header comments, item 5
extern template class InvalidValueException<int>;
extern template class InvalidValueException<double>;
extern template InvalidValueException<double>::InvalidValueException(
    char const * line_info, char const * func_info, char const * custom_message,
    double value_in, double truth_in, double tolerance_in);

}  // end namespace gpkernel

#endif  // GPKERNEL_CPP_GPK_EXCEPTION_HPP_
