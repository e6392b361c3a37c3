// This Source Code Form is licensed MPL-2.0: http://mozilla.org/MPL/2.0
#ifndef __TETHER_ERRORS_HH__
#define __TETHER_ERRORS_HH__

#include <tether/defs.hh>
#include <stdexcept>

namespace Tether {

/// Base class of all errors raised by the runtime, `kind()` names the error class seen by peers.
class Exception : public std::runtime_error {
  String kind_;
protected:
  explicit      Exception (const String &message, const char *kind);
public:
  explicit      Exception (const String &message);
  const String& kind      () const noexcept { return kind_; }
};

#define TETHER_DECLARE_EXCEPTION(Name, Base)                                    \
  class Name : public Base {                                                    \
  protected:                                                                    \
    explicit Name (const String &message, const char *kind) : Base (message, kind) {} \
  public:                                                                       \
    explicit Name (const String &message) : Base (message, #Name) {}            \
  }

/// Errors of the runtime itself, like unresolvable names or invalid operations.
TETHER_DECLARE_EXCEPTION (Error, Exception);
/// Values of the wrong type were passed to an operation.
TETHER_DECLARE_EXCEPTION (TypeError, Error);
/// A callable was invoked with too few or too many arguments.
TETHER_DECLARE_EXCEPTION (ArgumentCountError, TypeError);
/// A value has the right type but is unsuitable for the operation.
TETHER_DECLARE_EXCEPTION (ValueError, Error);
/// Integer division or modulo by zero.
TETHER_DECLARE_EXCEPTION (DivisionByZeroError, Error);
/// An object has no (accessible) property of the requested name.
TETHER_DECLARE_EXCEPTION (AttributeError, Error);
/// A runtime warning promoted to an exception.
TETHER_DECLARE_EXCEPTION (ErrorException, Exception);
/// A value cannot be represented on the wire.
TETHER_DECLARE_EXCEPTION (EncodingError, Exception);
/// A wire value or request is malformed.
TETHER_DECLARE_EXCEPTION (DecodingError, Exception);
/// A wire handle does not name a stored object or resource.
TETHER_DECLARE_EXCEPTION (HandleNotFoundError, Exception);
/// Reading or writing the transport failed.
TETHER_DECLARE_EXCEPTION (ConnectionLost, Exception);

/// Thrown by `exit` and `die` to end the session, deliberately not a std::exception.
struct SessionExit {
  int status = 0;
};

String exception_kind (const std::exception &exc);

} // Tether

#endif // __TETHER_ERRORS_HH__
