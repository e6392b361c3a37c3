// This Source Code Form is licensed MPL-2.0: http://mozilla.org/MPL/2.0
#include "cxxaux.hh"
#include "internal.hh"
#include <cxxabi.h>             // abi::__cxa_demangle
#include <unistd.h>
#include <cstring>
#include <cstdlib>
#include <cstdio>
#include <memory>

namespace Tether {

VirtualBase::~VirtualBase() noexcept
{}

/// Demangle a `typeid().name()` string, the mangled form is returned if demangling fails.
String
string_demangle_cxx (const char *mangled_identifier) noexcept
{
  int status = 0;
  std::unique_ptr<char, decltype (&free)> demangled (abi::__cxa_demangle (mangled_identifier, nullptr, nullptr, &status), &free);
  return demangled && status == 0 ? String (demangled.get()) : String (mangled_identifier);
}

/// Check for a colon separated `key` in $TETHER_DEBUG.
static bool
debug_env_has (const char *key)
{
  const char *const keys = getenv ("TETHER_DEBUG");
  return_unless (keys, false);
  const size_t l = strlen (key);
  for (const char *d = strstr (keys, key); d; d = strstr (d + 1, key))
    if ((d == keys || d[-1] == ':') && (d[l] == 0 || d[l] == ':'))
      return true;
  return false;
}

static String
source_location (const char *file, int line, const char *func)
{
  String where = file ? file : "";
  if (file && line > 0)
    where += ":" + std::to_string (line);
  if (func)
    where += where.empty() ? String (func) : ":" + String (func);
  return where.empty() ? where : where + ": ";
}

bool assertion_failed_fatal = false;

/// Report a failed assertion on stderr, "breakpoint" and "fatal-warnings" in $TETHER_DEBUG make it trap or abort.
void
assertion_failed (const char *msg, const char *file, int line, const char *func) noexcept
{
  String m = source_location (file, line, func);
  if (!msg || !msg[0])
    m += "assertion unreachable";
  else
    m += (line >= 0 ? "assertion failed: " : "") + String (msg);
  if (m.back() != '\n')
    m += "\n";
  fflush (stdout);
  fputs (m.c_str(), stderr);
  fflush (stderr);
  if (debug_env_has ("fatal-warnings"))
    assertion_failed_fatal = true;
  if (debug_env_has ("breakpoint"))
    __builtin_trap();
  if (assertion_failed_fatal)
    abort();
}

} // Tether
