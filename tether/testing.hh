// This Source Code Form is licensed MPL-2.0: http://mozilla.org/MPL/2.0
#ifndef __TETHER_TESTING_HH__
#define __TETHER_TESTING_HH__

#include <tether/utils.hh>
#include <tether/internal.hh>
#include <sstream>

namespace Tether {
namespace Test {

/// Run all registered integrity tests whose name matches one of `filters` (all if empty), returns number of tests run.
int  run                (const StringS &filters = {});
/// Report a failing test condition and abort.
void test_failed        (const String &msg, const char *file, int line, const char *func) TETHER_NORETURN;

/// Stringify `v` for test failure messages.
template<class V> String
stringify_arg (const V &v)
{
  if constexpr (std::is_same<V, bool>::value)
    return v ? "true" : "false";
  else if constexpr (std::is_arithmetic<V>::value || std::is_same<V, String>::value ||
                     std::is_same<typename std::decay<V>::type, const char*>::value)
    {
      std::ostringstream os;
      os << v;
      return os.str();
    }
  else if constexpr (std::is_convertible<V, const char*>::value)
    return String (v);
  else
    return "<" + typeid_name<V>() + ">";
}

} // Test
} // Tether

/// Abort the test run if `cond` is not met.
#define TASSERT(cond)           do { if (TETHER_ISLIKELY (cond)) break;                    \
    ::Tether::Test::test_failed (#cond, __FILE__, __LINE__, __func__); } while (0)

/// Compare `a` and `b` with operator `cmp`, abort with both values printed if the comparison fails.
#define TCMP(a, cmp, b)         do { auto &&__ta = (a); auto &&__tb = (b);                  \
    if (TETHER_ISLIKELY (__ta cmp __tb)) break;                                             \
    ::Tether::Test::test_failed (::Tether::string_format ("%s %s %s: (%s) %s (%s)", #a, #cmp, #b, \
                                 ::Tether::Test::stringify_arg (__ta), #cmp,                \
                                 ::Tether::Test::stringify_arg (__tb)),                     \
                                 __FILE__, __LINE__, __func__); } while (0)

/// Abort the test run unless evaluating `expr` throws an exception of type `Exc`.
#define TTHROWS(expr, Exc)      do { bool __tt = false;                                     \
    try { (void) (expr); } catch (const Exc&) { __tt = true; }                              \
    if (TETHER_ISLIKELY (__tt)) break;                                                      \
    ::Tether::Test::test_failed (#expr " did not throw " #Exc, __FILE__, __LINE__, __func__); } while (0)

#endif // __TETHER_TESTING_HH__
