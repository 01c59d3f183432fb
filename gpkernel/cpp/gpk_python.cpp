/*!
  \file gpk_python.cpp
  \rst
  This file contains the "call" to ``BOOST_PYTHON_MODULE``; think of that as the ``main()`` function for the interface.
  It includes the full docstring for the Python module. That call wraps ``Export.*()`` functions from ``gpk_python_.*``
  helper files, which contain the pieces of ``C++`` functionality that we are exporting to Python (the Matern kernel
  and its derivatives, the set partition enumerator, and the C++ unit tests).

  This file also includes the logic for translating C++ exceptions to Python exceptions.
\endrst*/
// This include violates the Google Style Guide by placing an "other" system header ahead of C and C++ system headers.  However,
// it needs to be at the top, otherwise compilation fails on some systems with some versions of python.
// Putting this include first prevents pyport from doing something illegal in C++; reference: http://bugs.python.org/issue10910
#include "Python.h"  // NOLINT(build/include)

// NOLINT-ing the C, C++ header includes as well; otherwise cpplint gets confused
#include <exception>  // NOLINT(build/include_order)
#include <string>  // NOLINT(build/include_order)
#include <type_traits>  // NOLINT(build/include_order)

#include <boost/python/handle.hpp>  // NOLINT(build/include_order)
#include <boost/python/docstring_options.hpp>  // NOLINT(build/include_order)
#include <boost/python/errors.hpp>  // NOLINT(build/include_order)
#include <boost/python/exception_translator.hpp>  // NOLINT(build/include_order)
#include <boost/python/extract.hpp>  // NOLINT(build/include_order)
#include <boost/python/module.hpp>  // NOLINT(build/include_order)
#include <boost/python/object.hpp>  // NOLINT(build/include_order)
#include <boost/python/scope.hpp>  // NOLINT(build/include_order)

#include "gpk_common.hpp"
#include "gpk_exception.hpp"
#include "gpk_python_covariance.hpp"
#include "gpk_python_test.hpp"

namespace gpkernel {

namespace {  // unnamed namespace for exception translation (for BOOST_PYTHON_MODULE(GPK))

/*!\rst
  Builds a Python exception type object called ``name`` within ``scope``, subclassing ``base_type``
  (or ``Exception`` if ``base_type`` is nullptr).

  Afterward, ``scope`` has a new callable called ``name``; e.g., with ``name = "BoundsException"``::

    >>> import GPK
    >>> raise GPK.BoundsException("my message")

  .. WARNING:: ONLY call this function from within a ``BOOST_PYTHON_MODULE`` block; ``scope`` has no meaning
    after module construction.

  \param
    :name[]: name of the new Python exception type
    :docstring[]: docstring for the new Python exception type
    :base_type[1]: nullptr or the Python type object serving as the base class
    :scope[1]: the scope to add the new exception type to
  \output
    :scope[1]: the input scope with the new exception type added
  \return
    PyObject pointer to the (callable) type object that was created
\endrst*/
GPK_WARN_UNUSED_RESULT PyObject * CreatePyExceptionClass(const char * name, const char * docstring,
                                                         PyObject * base_type, boost::python::scope * scope) {
  std::string scope_name = boost::python::extract<std::string>(scope->attr("__name__"));
  std::string qualified_name = scope_name + "." + name;

  // PyErr_NewExceptionWithDoc returns a new reference; type objects are never released, so we keep it.
  PyObject * type_object = PyErr_NewExceptionWithDoc(qualified_name.c_str(), docstring, base_type, nullptr);
  if (!type_object) {
    boost::python::throw_error_already_set();
  }
  scope->attr(name) = boost::python::object(boost::python::handle<>(boost::python::borrowed(type_object)));

  return type_object;
}

/*!\rst
  Monostate holding the Python type objects that C++ exceptions are translated into.

  .. NOTE:: this class follows the Monostate pattern, implying GLOBAL STATE.

  Python type objects must outlive every instance of that type, so once created we hold them until the module
  dies. Initialize() is idempotent so that repeated imports do not define several "identical" types.

  .. NOTE:: the PyObject pointers cannot be pointer-to-const since Python C-API calls modify the objects. They are
    conceptually const: DO NOT change them outside of Python calls.
\endrst*/
class PyExceptionClassContainer {
 public:
  /*!\rst
    Defines the Python exception types in ``scope``. Does nothing if already initialized (and not Reset()).
    Until this is called, translated exceptions are of type ``default_exception_type_object_``.

    .. WARNING:: NOT THREAD SAFE.

    \param
      :scope[1]: the scope to add the new exception types to
    \output
      :scope[1]: the input scope with the new exception types added
  \endrst*/
  void Initialize(boost::python::scope * scope) GPK_NONNULL_POINTERS {
    if (!initialized_) {
      scope_ = scope;

      static char const * gpkernel_exception_docstring = "Base exception class for errors raised from the (C++) ``gpkernel`` library.";
      gpkernel_exception_type_object_ = CreatePyExceptionClass(GpKernelException::kName, gpkernel_exception_docstring, nullptr, scope_);

      static char const * bounds_exception_docstring = "value not in range [min, max].";
      bounds_exception_type_object_ = CreatePyExceptionClass(BoundsException<double>::kName, bounds_exception_docstring, gpkernel_exception_type_object_, scope_);

      static char const * invalid_value_exception_docstring = "value != truth (+/- tolerance)";
      invalid_value_exception_type_object_ = CreatePyExceptionClass(InvalidValueException<double>::kName, invalid_value_exception_docstring, gpkernel_exception_type_object_, scope_);

      initialized_ = true;
    }
  }

  /*!\rst
    Reset the state back to default; translated exceptions become ``default_exception_type_object_`` until the
    next Initialize().

    .. WARNING:: NOT THREAD SAFE. The existing type objects become unreachable from C++ but are not DECREF'd.
  \endrst*/
  void Reset() {
    initialized_ = false;
    scope_ = nullptr;
    gpkernel_exception_type_object_ = default_exception_type_object_;
    bounds_exception_type_object_ = default_exception_type_object_;
    invalid_value_exception_type_object_ = default_exception_type_object_;
  }

  PyObject * gpkernel_exception_type_object() const noexcept GPK_PURE_FUNCTION GPK_WARN_UNUSED_RESULT {
    return gpkernel_exception_type_object_;
  }

  PyObject * bounds_exception_type_object() const noexcept GPK_PURE_FUNCTION GPK_WARN_UNUSED_RESULT {
    return bounds_exception_type_object_;
  }

  PyObject * invalid_value_exception_type_object() const noexcept GPK_PURE_FUNCTION GPK_WARN_UNUSED_RESULT {
    return invalid_value_exception_type_object_;
  }

 private:
  // Fall back to this type object if something has not been initialized.
  static PyObject * const default_exception_type_object_;

  static PyObject * gpkernel_exception_type_object_;
  static PyObject * bounds_exception_type_object_;
  static PyObject * invalid_value_exception_type_object_;

  static boost::python::scope * scope_;

  static bool initialized_;
};

PyObject * const PyExceptionClassContainer::default_exception_type_object_ = PyExc_RuntimeError;
PyObject * PyExceptionClassContainer::gpkernel_exception_type_object_ = PyExceptionClassContainer::default_exception_type_object_;
PyObject * PyExceptionClassContainer::bounds_exception_type_object_ = PyExceptionClassContainer::default_exception_type_object_;
PyObject * PyExceptionClassContainer::invalid_value_exception_type_object_ = PyExceptionClassContainer::default_exception_type_object_;
boost::python::scope * PyExceptionClassContainer::scope_ = nullptr;
bool PyExceptionClassContainer::initialized_ = false;

/*!\rst
  Instantiates the Python exception ``exception_type`` with message ``what``. Callers may attach fields to the
  instance before RaisePyException().
\endrst*/
boost::python::object BuildPyException(PyObject * exception_type, const char * what) {
  boost::python::object except_type(boost::python::handle<>(boost::python::borrowed(exception_type)));
  return except_type(what);  // analogue of PyObject_CallObject(except_type.ptr(), args)
}

/*!\rst
  Sets ``instance`` as the active Python error and hands control back to boost python.

  \return
    **NEVER RETURNS**
\endrst*/
GPK_NORETURN void RaisePyException(const boost::python::object& instance) {
  // SetObject INCREFs both the type object and the instance; they are DECREF'd when exception handling completes.
  PyErr_SetObject(reinterpret_cast<PyObject *>(Py_TYPE(instance.ptr())), instance.ptr());
  boost::python::throw_error_already_set();
  throw;  // throw_error_already_set() never returns but isn't marked noreturn: https://svn.boost.org/trac/boost/ticket/1482
}

/*!\rst
  Translate std::exception (including GpKernelException) to the base Python exception.
  This translator can capture *any* std::exception, so make sure it does not mask your other translators.

  \param
    :except: C++ exception to translate
    :py_exception_type_objects: PyExceptionClassContainer with the Python type objects
  \return
    **NEVER RETURNS**
\endrst*/
GPK_NORETURN void TranslateStdException(const std::exception& except, const PyExceptionClassContainer& py_exception_type_objects) {
  RaisePyException(BuildPyException(py_exception_type_objects.gpkernel_exception_type_object(), except.what()));
}

/*!\rst
  Translate BoundsException (and its Lower/Upper subclasses) to a Python exception with ``value``, ``min``, ``max``.

  \param
    :except: C++ exception to translate
    :py_exception_type_objects: PyExceptionClassContainer with the Python type objects
  \return
    **NEVER RETURNS**
\endrst*/
template <typename ValueType>
GPK_NORETURN void TranslateBoundsException(const BoundsException<ValueType>& except, const PyExceptionClassContainer& py_exception_type_objects) {
  boost::python::object instance = BuildPyException(py_exception_type_objects.bounds_exception_type_object(), except.what());

  instance.attr("value") = except.value();
  instance.attr("min") = except.min();
  instance.attr("max") = except.max();

  RaisePyException(instance);
}

/*!\rst
  Translate InvalidValueException to a Python exception with ``value``, ``truth``, ``tolerance``.

  \param
    :except: C++ exception to translate
    :py_exception_type_objects: PyExceptionClassContainer with the Python type objects
  \return
    **NEVER RETURNS**
\endrst*/
template <typename ValueType>
GPK_NORETURN void TranslateInvalidValueException(const InvalidValueException<ValueType>& except, const PyExceptionClassContainer& py_exception_type_objects) {
  boost::python::object instance = BuildPyException(py_exception_type_objects.invalid_value_exception_type_object(), except.what());

  instance.attr("value") = except.value();
  instance.attr("truth") = except.truth();
  instance.attr("tolerance") = except.tolerance();

  RaisePyException(instance);
}

/*!\rst
  Register an exception translator (C++ to Python) with boost python for ExceptionType, using the callable translate.
  Boost python expects unary translators, so a lambda captures the type object container alongside ``translate``.

  TEMPLATE PARAMETERS:

  * ExceptionType: the type of the exception to register
  * Translator: a CopyConstructible type such that ``translate(except, py_exception_type_objects)`` is well-formed

  \param
    :py_exception_type_objects: PyExceptionClassContainer with the Python type objects
    :translate: an instance of Translator
\endrst*/
template <typename ExceptionType, typename Translator>
void RegisterExceptionTranslatorWithPayload(const PyExceptionClassContainer& py_exception_type_objects, Translator translate) {
  static_assert(std::is_copy_constructible<Translator>::value, "Exception translator must be copy constructible.");
  // both captured by value; we don't want a dangling reference
  auto translate_exception =
      [py_exception_type_objects, translate](const ExceptionType& except) {
    translate(except, py_exception_type_objects);
  };

  // nullptr suppresses a superfluous compiler warning b/c boost::python::register_exception_translator
  // defaults a (dummy) pointer argument to 0.
  boost::python::register_exception_translator<ExceptionType>(translate_exception, nullptr);
}

/*!\rst
  Registers translators for gpkernel's exceptions.

  .. NOTE:: PyExceptionClassContainer must be initialized first! Otherwise every exception is translated to
    ``PyExc_RuntimeError``.
\endrst*/
void RegisterGpKernelExceptions() {
  PyExceptionClassContainer py_exception_type_objects;

  // boost python keeps translators in a LIFO stack: the most recently registered translator gets the first shot.
  // TranslateStdException MUST be registered first; otherwise it masks everything registered before it.
  RegisterExceptionTranslatorWithPayload<std::exception>(py_exception_type_objects, &TranslateStdException);
  RegisterExceptionTranslatorWithPayload<InvalidValueException<int>>(py_exception_type_objects, &TranslateInvalidValueException<int>);
  RegisterExceptionTranslatorWithPayload<InvalidValueException<double>>(py_exception_type_objects, &TranslateInvalidValueException<double>);
  RegisterExceptionTranslatorWithPayload<BoundsException<int>>(py_exception_type_objects, &TranslateBoundsException<int>);
  RegisterExceptionTranslatorWithPayload<BoundsException<double>>(py_exception_type_objects, &TranslateBoundsException<double>);
}

}  // end unnamed namespace

namespace {  // unnamed namespace for BOOST_PYTHON_MODULE(GPK) definition

BOOST_PYTHON_MODULE(GPK) {
  boost::python::scope current_scope;

  // initialize PyExceptionClassContainer monostate class and set its scope to this module (GPK)
  PyExceptionClassContainer py_exception_type_objects;
  py_exception_type_objects.Initialize(&current_scope);

  // See RegisterGpKernelExceptions() for ordering constraints if adding translators.
  RegisterGpKernelExceptions();

  bool show_user_defined = true;
  bool show_py_signatures = true;
  bool show_cpp_signatures = true;
  // enable full docstrings for the functions, ctors, etc. provided in this module.
  boost::python::docstring_options doc_options(show_user_defined, show_py_signatures, show_cpp_signatures);

  current_scope.attr("__doc__") = R"%%(
    This module is the python interface to gpkernel, a C++ library for the anisotropic Matern covariance kernel and
    its derivatives of arbitrary order.

    **OVERVIEW**

    For difference vectors ``tau = x_1 - x_2``, the kernel is::

      k(tau) = sigma^2 2^{1-nu}/Gamma(nu) y^nu K_nu(y),   y = sqrt(2 nu sum_i tau_i^2/l_i^2)

    where ``K_nu`` is the modified Bessel function of the second kind. Mixed partial derivatives wrt either input point
    are assembled by the chain rule (Faa di Bruno's formula over set partitions of the derivative multi-index) from
    derivatives of the envelope ``f(y) = 2^{1-nu}/Gamma(nu) y^nu K_nu(y)`` wrt ``y`` and derivatives of ``y`` wrt ``tau``.
    At ``tau = 0`` several of these derivatives have no closed form (or do not exist); the library then falls back to
    arbitrary precision numerical differentiation, which is slow and may warn.

    **DETAILS**

    For further details, see the file documents for the C++ hpp and cpp files. gpk_covariance.hpp is a good
    starting point.

    * Exceptions:
      We expose Python definitions for the exception classes in gpk_exception.hpp (GpKernelException,
      BoundsException, InvalidValueException). C++ exceptions are caught and rethrown as their Python counterparts;
      bounds and invalid value exceptions carry their data fields as attributes.

    * Objects:

      * MaternKernel: the kernel for fixed hyperparameters ``(sigma, nu, lengths)``. Exposes the value, the
        envelope/inner/chain rule derivatives, pairwise covariance derivatives (evaluate), and hyperparameter access.

    * Combinatorics:

      * generate_set_partitions: all set partitions of a derivative multi-index
      * bell_number: number of set partitions of n elements

    * Testing:

      * run_cpp_tests: run the C++ unit tests
    )%%";

  ExportCppTestFunctions();
  ExportMaternKernelFunctions();
  ExportSetPartitionFunctions();
}  // end BOOST_PYTHON_MODULE(GPK) definition

}  // end unnamed namespace

}  // end namespace gpkernel
