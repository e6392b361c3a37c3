// This Source Code Form is licensed MPL-2.0: http://mozilla.org/MPL/2.0
#include "errors.hh"
#include "strings.hh"
#include "internal.hh"

namespace Tether {

Exception::Exception (const String &message, const char *kind) :
  std::runtime_error (message), kind_ (kind)
{}

Exception::Exception (const String &message) :
  Exception (message, "Exception")
{}

/// Yield the error class name of `exc`, C++ exceptions outside the runtime use their type name.
String
exception_kind (const std::exception &exc)
{
  if (const Exception *e = dynamic_cast<const Exception*> (&exc))
    return e->kind();
  return typeid_name (exc);
}

} // Tether

#include "testing.hh"

namespace { // Anon
using namespace Tether;

TEST_INTEGRITY (errors_tests);
static void
errors_tests()
{
  TCMP (exception_kind (ArgumentCountError ("x")), ==, "ArgumentCountError");
  TCMP (exception_kind (Exception ("x")), ==, "Exception");
  TCMP (exception_kind (std::out_of_range ("x")), ==, "std::out_of_range");
  TTHROWS (throw AttributeError ("missing"), Error);
  TTHROWS (throw ArgumentCountError ("few"), TypeError);
  try {
    throw HandleNotFoundError ("Unknown handle 7");
  } catch (const std::exception &exc) {
    TCMP (String (exc.what()), ==, "Unknown handle 7");
    TCMP (exception_kind (exc), ==, "HandleNotFoundError");
  }
}

} // Anon
