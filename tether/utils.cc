// This Source Code Form is licensed MPL-2.0: http://mozilla.org/MPL/2.0
#include "utils.hh"
#include "platform.hh"
#include "internal.hh"
#include <signal.h>
#include <sys/time.h>
#include <unistd.h>
#include <cstring>
#include <cerrno>
#include <cstdlib>

namespace Tether {

// == Debugging ==
bool tether_debugging_enabled = true;
static bool tether_fatal_warnings = false;
static int  tether_diag_fd = STDERR_FILENO;

/// Check if `conditional` is enabled by $TETHER_DEBUG.
bool
debug_key_enabled (const char *conditional)
{
  const std::string value = debug_key_value (conditional);
  return !value.empty() && (strchr ("123456789yYtT", value[0]) || strncasecmp (value.c_str(), "on", 2) == 0);
}

/// Check if `conditional` is enabled by $TETHER_DEBUG.
bool
debug_key_enabled (const ::std::string &conditional)
{
  return debug_key_enabled (conditional.c_str());
}

/// Retrieve the value assigned to debug key `conditional` in $TETHER_DEBUG.
::std::string
debug_key_value (const char *conditional)
{
  // cache $TETHER_DEBUG and setup tether_debugging_enabled
  static const std::string debug_flags = [] () {
    const char *f = getenv ("TETHER_DEBUG");
    const std::string flags = !f ? "" : ":" + std::string (f) + ":";
    tether_debugging_enabled = !flags.empty() && flags != ":none:";
    const ssize_t fw = flags.rfind (":fatal-warnings:");
    const ssize_t nf = flags.rfind (":no-fatal-warnings:");
    if (fw >= 0 && nf <= fw)
      tether_fatal_warnings = true;
    return flags;
  } ();
  // find key in colon-separated debug flags
  const ::std::string key = conditional ? conditional : "";
  static const std::string all = ":all:", none = ":none:";
  const std::string condr = ":no-" + key + ":";
  const std::string condc = ":" + key + ":";
  const std::string conde = ":" + key + "=";
  const ssize_t pa = debug_flags.rfind (all);
  const ssize_t pn = debug_flags.rfind (none);
  const ssize_t pr = debug_flags.rfind (condr);
  const ssize_t pc = debug_flags.rfind (condc);
  const ssize_t pe = debug_flags.rfind (conde);
  const ssize_t pmax = std::max (pr, std::max (std::max (pa, pn), std::max (pc, pe)));
  if (pn == pmax || pr == pmax)
    return "false";     // found no key or ':none:' or ':no-key:'
  if (pa == pmax || pc == pmax)
    return "true";      // last setting is ':key:' or ':all:'
  // pe == pmax, assignment via equal sign
  const ssize_t pv = pe + conde.size();
  const ssize_t pw = debug_flags.find (":", pv);
  const std::string value = debug_flags.substr (pv, pw < 0 ? pw : pw - pv);
  return value;
}

/// Print a debug message, called from ::Tether::debug().
void
debug_message (const char *cond, const std::string &message)
{
  return_unless (cond && debug_key_enabled (cond));
  struct timeval tv = { 0, };
  gettimeofday (&tv, NULL);
  const char *const newline = !message.empty() && message.data()[message.size() - 1] == '\n' ? "" : "\n";
  using namespace AnsiColors;
  const std::string col = color (FG_CYAN, BOLD), reset = color (RESET);
  const std::string ul = cond ? color (UNDERLINE) : "", nl = cond ? color (UNDERLINE_OFF) : "";
  std::string sout;
  sout += string_format ("%s%u.%06u ", col, unsigned (tv.tv_sec), unsigned (tv.tv_usec)); // cyan timestamp
  sout += string_format ("%s%s%s:", ul, cond ? cond : executable_name().c_str(), nl); // underlined cond
  sout += string_format ("%s %s", reset, message); // normal print message
  printerr ("%s%s", sout, newline);
}

/// Send diagnostics (printerr, warnings, debug messages) to `fd`, or discard them if `fd < 0`.
void
diag_redirect (int fd)
{
  tether_diag_fd = fd;
}

/// File descriptor that receives diagnostics, -1 if they are discarded.
int
diag_output_fd()
{
  return tether_diag_fd;
}

/// Turn warnings into fatal errors, like `fatal-warnings` in $TETHER_DEBUG.
void
diag_fatal_warnings (bool fatal)
{
  tether_fatal_warnings = fatal;
}

static void
write_all (int fd, const std::string &msg)
{
  size_t n = 0;
  while (n < msg.size())
    {
      const ssize_t l = ::write (fd, msg.data() + n, msg.size() - n);
      if (l < 0 && errno == EINTR)
        continue;
      if (l <= 0)
        return;         // diagnostics are best effort
      n += l;
    }
}

/// Handle various diagnostics and stdout/stderr printing.
void
diag_message (uint8 code, const std::string &message)
{
  const int output = code == 'o' ? STDOUT_FILENO : tether_diag_fd;
  String msg = message;
  if (code == 'W' || code == 'F')
    {
      using namespace AnsiColors;
      String prefix;
      if (code == 'W')
        prefix = color (FG_YELLOW) + "warning:" + color (RESET);
      else
        prefix = color (BG_RED, FG_WHITE, BOLD) + "error:" + color (RESET);
      msg = prefix + ' ' + msg;
      const std::string executable = executable_name();
      if (!executable.empty())
        msg = executable + ": " + msg;
      if (msg.size() && msg[msg.size() - 1] != '\n')
        msg += '\n';
    }
  fflush (stdout); // preserve ordering
  if (output >= 0)
    write_all (output, msg);
  if (code == 'F' || (code == 'W' && tether_fatal_warnings))
    {
      if (output < 0)
        write_all (STDERR_FILENO, msg);
      ::raise (SIGQUIT);        // evade apport
      ::abort();                // default action for SIGABRT is core dump
      ::_exit (-1);             // ensure noreturn
    }
}

} // Tether

#include "testing.hh"

namespace { // Anon
using namespace Tether;

TEST_INTEGRITY (utils_tests);
static void
utils_tests()
{
  TASSERT (!debug_key_enabled ("tether-test-key-that-is-never-set"));
  const int saved = diag_output_fd();
  diag_redirect (-1);
  TCMP (diag_output_fd(), ==, -1);
  printerr ("discarded %d\n", 1);       // must not reach any stream
  diag_redirect (saved);
  TCMP (diag_output_fd(), ==, saved);
}

} // Anon
