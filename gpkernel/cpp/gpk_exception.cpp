/*!
  \file gpk_exception.cpp
  \rst
  Ctors for the exception classes in gpk_exception.hpp.  These set ``message_`` with what went wrong and where.

  Numbers are converted with boost::lexical_cast<std::string>; std::to_string's floating point formatting loses
  too much precision to be useful when a length scale or order is rejected.
\endrst*/

// No internationalization here; numbers are never read like "329,387.38971".
#define BOOST_LEXICAL_CAST_ASSUME_C_LOCALE

#include "gpk_exception.hpp"

#include <string>

#include <boost/lexical_cast.hpp>  // NOLINT(build/include_order)

#include "gpk_common.hpp"

namespace gpkernel {

void GpKernelException::AppendCustomMessageAndDebugInfo(char const * line_info, char const * func_info,
                                                        char const * custom_message) {
  if (custom_message) {
    message_ += custom_message;
    message_ += " ";
  }
  if (func_info) {
    message_ += func_info;
    message_ += " ";
  }
  message_ += line_info;
}

GpKernelException::GpKernelException(char const * line_info, char const * func_info,
                                     char const * custom_message) : message_(kName) {
  message_ += ": ";
  AppendCustomMessageAndDebugInfo(line_info, func_info, custom_message);
}

GpKernelException::GpKernelException(char const * name) : message_(name) {
}

template <typename ValueType>
BoundsException<ValueType>::BoundsException(char const * name_in, char const * line_info,
                                            char const * func_info, char const * custom_message,
                                            ValueType value_in, ValueType min_in, ValueType max_in)
    : GpKernelException(name_in),
      value_(value_in),
      min_(min_in),
      max_(max_in) {
  message_ += ": value: " + boost::lexical_cast<std::string>(value_) + " is not in range [" +
      boost::lexical_cast<std::string>(min_) + ", " + boost::lexical_cast<std::string>(max_) + "]\n";
  AppendCustomMessageAndDebugInfo(line_info, func_info, custom_message);
}

template <typename ValueType>
BoundsException<ValueType>::BoundsException(char const * line_info, char const * func_info,
                                            char const * custom_message, ValueType value_in,
                                            ValueType min_in, ValueType max_in)
    : BoundsException(kName, line_info, func_info, custom_message, value_in, min_in, max_in) {
}

// template explicit instantiation definitions, see gpk_common.hpp header comments, item 5
template class BoundsException<int>;
template class BoundsException<double>;

template <typename ValueType>
InvalidValueException<ValueType>::InvalidValueException(char const * line_info, char const * func_info,
                                                        char const * custom_message, ValueType value_in,
                                                        ValueType truth_in)
    : GpKernelException(kName), value_(value_in), truth_(truth_in), tolerance_(0) {
  message_ += ": " + boost::lexical_cast<std::string>(value_) + " != " +
      boost::lexical_cast<std::string>(truth_) + " (value != truth)\n";
  AppendCustomMessageAndDebugInfo(line_info, func_info, custom_message);
}

template <typename ValueType>
template <typename ValueTypeIn, typename>
InvalidValueException<ValueType>::InvalidValueException(char const * line_info, char const * func_info,
                                                        char const * custom_message, ValueType value_in,
                                                        ValueType truth_in, ValueType tolerance_in)
    : GpKernelException(kName), value_(value_in), truth_(truth_in), tolerance_(tolerance_in) {
  message_ += ": " + boost::lexical_cast<std::string>(value_) + " != " + boost::lexical_cast<std::string>(truth_) +
      " ± " + boost::lexical_cast<std::string>(tolerance_) + " (value != truth ± tolerance)\n";
  AppendCustomMessageAndDebugInfo(line_info, func_info, custom_message);
}

// template explicit instantiation definitions, see gpk_common.hpp header comments, item 5
template class InvalidValueException<int>;
template class InvalidValueException<double>;
template InvalidValueException<double>::InvalidValueException(
    char const * line_info, char const * func_info, char const * custom_message, double value_in,
    double truth_in, double tolerance_in);

}  // end namespace gpkernel
