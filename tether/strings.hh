// This Source Code Form is licensed MPL-2.0: http://mozilla.org/MPL/2.0
#ifndef __TETHER_STRINGS_HH__
#define __TETHER_STRINGS_HH__

#include <tether/cxxaux.hh>
#include <type_traits>

namespace Tether {

// == C-style formatting ==
String  string_vprintf          (const char *format, ...) TETHER_PRINTF (1, 2);

namespace Internal {
/// Turn `String` arguments into `const char*` for printf-style formatting, pass all else through.
template<class A> inline auto
format_arg (const A &a)
{
  if constexpr (std::is_same<A, String>::value)
    return a.c_str();
  else if constexpr (std::is_enum<A>::value)
    return int64 (a);
  else
    return a;
}
} // Internal

/// Format `args` according to the printf-style `format`, using the POSIX/C locale.
template<class... Args> inline String
string_format (const char *format, const Args &...args)
{
  if constexpr (sizeof... (Args) == 0)
    return string_vprintf ("%s", format);
  else
    return string_vprintf (format, Internal::format_arg (args)...);
}

// == Conversions ==
String  string_from_int         (int64 value);
String  string_from_double      (double value);
bool    string_to_int           (const String &string, int64 *result, bool canonical = false);
bool    string_to_double        (const String &string, double *result);
String  string_from_errno       (int errno_val);
String  string_tolower          (const String &str);

// == Searching and splitting ==
StringS string_split            (const String &string, const String &splitter = "", size_t maxn = size_t (-1));
String  string_join             (const String &junctor, const StringS &strvec);
String  string_strip            (const String &input);
String  string_replace          (const String &input, const String &marker, const String &replacement);
bool    string_is_utf8          (const String &string);

} // Tether

#endif // __TETHER_STRINGS_HH__
