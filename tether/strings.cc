// This Source Code Form is licensed MPL-2.0: http://mozilla.org/MPL/2.0
#include "strings.hh"
#include "internal.hh"
#include <cstdarg>
#include <cstring>
#include <cerrno>
#include <cmath>
#include <clocale>
#include <locale.h>

namespace Tether {

static locale_t
posix_c_locale()
{
  static locale_t c_locale = newlocale (LC_ALL_MASK, "C", NULL);
  return c_locale;
}

/// Format a string with vsnprintf() in the POSIX/C locale, the result has no length limit.
String
string_vprintf (const char *format, ...)
{
  va_list vargs;
  locale_t saved_locale = uselocale (posix_c_locale());
  char buffer[1024];
  va_start (vargs, format);
  const int l = vsnprintf (buffer, sizeof (buffer), format, vargs);
  va_end (vargs);
  String result;
  if (l < 0)
    result = format;
  else if (size_t (l) < sizeof (buffer))
    result.assign (buffer, l);
  else
    {
      result.resize (l + 1);
      va_start (vargs, format);
      vsnprintf (&result[0], result.size(), format, vargs);
      va_end (vargs);
      result.resize (l);
    }
  uselocale (saved_locale);
  return result;
}

String
string_from_int (int64 value)
{
  return string_format ("%lld", (long long) value);
}

/// Produce the shortest decimal representation that reads back as `value`.
String
string_from_double (double value)
{
  if (std::isnan (value))
    return "NAN";
  if (std::isinf (value))
    return value > 0 ? "INF" : "-INF";
  String s;
  for (int precision = 1; precision <= 17; precision++)
    {
      s = string_format ("%.*g", precision, value);
      double r = 0;
      if (string_to_double (s, &r) && r == value)
        break;
    }
  return s;
}

/// Parse a decimal integer, with `canonical` leading zeros, '+' and whitespace are rejected.
bool
string_to_int (const String &string, int64 *result, bool canonical)
{
  const char *const c = string.c_str();
  if (!c[0])
    return false;
  if (canonical)
    {
      const char *d = c[0] == '-' ? c + 1 : c;
      if (d[0] < '0' || d[0] > '9' || (d[0] == '0' && (d[1] || d != c)))
        return false;
    }
  char *end = nullptr;
  errno = 0;
  const long long v = strtoll (c, &end, 10);
  if (errno || end == c || *end != 0)
    return false;
  if (result)
    *result = v;
  return true;
}

/// Parse a floating point number in the POSIX/C locale, the whole string must be consumed.
bool
string_to_double (const String &string, double *result)
{
  const char *const c = string.c_str();
  char *end = nullptr;
  const double d = strtod_l (c, &end, posix_c_locale());
  if (end == c || *end != 0)
    return false;
  if (result)
    *result = d;
  return true;
}

String
string_from_errno (int errno_val)
{
  char buffer[1024] = { 0, };
  const char *msg = strerror_r (errno_val, buffer, sizeof (buffer));
  return msg ? msg : buffer;
}

/// Convert ASCII letters to lower case.
String
string_tolower (const String &str)
{
  String s = str;
  for (auto &c : s)
    if (c >= 'A' && c <= 'Z')
      c = c - 'A' + 'a';
  return s;
}

/// Split a string at `splitter` (or into characters if empty), yielding at most `maxn` parts.
StringS
string_split (const String &string, const String &splitter, size_t maxn)
{
  StringS sv;
  if (splitter.empty())
    {
      for (size_t i = 0; i < string.size(); i++)
        sv.push_back (string.substr (i, 1));
      return sv;
    }
  size_t i, l = 0;
  while (sv.size() + 1 < maxn && (i = string.find (splitter, l)) != String::npos)
    {
      sv.push_back (string.substr (l, i - l));
      l = i + splitter.size();
    }
  sv.push_back (string.substr (l));
  return sv;
}

String
string_join (const String &junctor, const StringS &strvec)
{
  String s;
  for (size_t i = 0; i < strvec.size(); i++)
    s += (i ? junctor : "") + strvec[i];
  return s;
}

/// Remove leading and trailing ASCII whitespace.
String
string_strip (const String &input)
{
  const char *const ws = " \t\n\v\f\r";
  const size_t a = input.find_first_not_of (ws);
  if (a == String::npos)
    return "";
  const size_t b = input.find_last_not_of (ws);
  return input.substr (a, b - a + 1);
}

String
string_replace (const String &input, const String &marker, const String &replacement)
{
  return_unless (!marker.empty(), input);
  String s;
  size_t l = 0, i;
  while ((i = input.find (marker, l)) != String::npos)
    {
      s += input.substr (l, i - l) + replacement;
      l = i + marker.size();
    }
  return s + input.substr (l);
}

/// Check that `string` is well formed UTF-8, rejecting overlong forms and surrogates.
bool
string_is_utf8 (const String &string)
{
  const unsigned char *p = (const unsigned char*) string.data(), *const e = p + string.size();
  while (p < e)
    {
      const unsigned c = *p++;
      if (c < 0x80)
        continue;
      int n;
      unsigned cp;
      if ((c & 0xe0) == 0xc0)      { n = 1; cp = c & 0x1f; }
      else if ((c & 0xf0) == 0xe0) { n = 2; cp = c & 0x0f; }
      else if ((c & 0xf8) == 0xf0) { n = 3; cp = c & 0x07; }
      else
        return false;
      if (e - p < n)
        return false;
      for (int i = 0; i < n; i++)
        {
          if ((p[i] & 0xc0) != 0x80)
            return false;
          cp = (cp << 6) | (p[i] & 0x3f);
        }
      p += n;
      if ((n == 1 && cp < 0x80) || (n == 2 && cp < 0x800) || (n == 3 && cp < 0x10000) ||
          cp > 0x10ffff || (cp >= 0xd800 && cp <= 0xdfff))
        return false;
    }
  return true;
}

} // Tether

#include "testing.hh"

namespace { // Anon
using namespace Tether;

TEST_INTEGRITY (strings_tests);
static void
strings_tests()
{
  TCMP (string_format ("%s=%d", String ("x"), 7), ==, "x=7");
  TCMP (string_from_double (0.1), ==, "0.1");
  TCMP (string_from_double (2), ==, "2");
  TCMP (string_from_double (1.0 / 3), ==, "0.3333333333333333");
  TCMP (string_from_double (-INFINITY), ==, "-INF");
  int64 i = 0;
  TASSERT (string_to_int ("-17", &i, true) && i == -17);
  TASSERT (!string_to_int ("017", &i, true));
  TASSERT (!string_to_int ("-0", &i, true));
  TASSERT (!string_to_int ("+5", &i, true));
  TASSERT (!string_to_int ("99999999999999999999", &i));
  TASSERT (string_to_int ("0", &i, true) && i == 0);
  TCMP (string_join (",", string_split ("a:b:c", ":")), ==, "a,b,c");
  TCMP (string_split ("a:b:c", ":", 2).size(), ==, 2u);
  TCMP (string_replace ("A\\B\\C", "\\", "."), ==, "A.B.C");
  TCMP (string_strip ("  x y \n"), ==, "x y");
  TASSERT (string_is_utf8 ("gr\xc3\xbc\xc3\x9f"));
  TASSERT (!string_is_utf8 ("\xc3"));
  TASSERT (!string_is_utf8 ("\xc0\xaf"));
}

} // Anon
