// This Source Code Form is licensed MPL-2.0: http://mozilla.org/MPL/2.0
#include "platform.hh"
#include "utils.hh"
#include "internal.hh"
#include <unistd.h>
#include <climits>
#include <cstdlib>

#ifndef TETHER_VERSION
#define TETHER_VERSION  "0.0.0"
#endif

namespace Tether {

namespace AnsiColors {

/// Return ANSI code for the specified color if stderr is a tty.
const char*
color_code (Colors acolor)
{
  switch (acolor)
    {
    default: ;
    case NONE:             return "";
    case RESET:            return "\033[0m";
    case BOLD:             return "\033[1m";
    case BOLD_OFF:         return "\033[22m";
    case UNDERLINE:        return "\033[4m";
    case UNDERLINE_OFF:    return "\033[24m";
    case INVERSE:          return "\033[7m";
    case INVERSE_OFF:      return "\033[27m";
    case FG_BLACK:         return "\033[30m";
    case FG_RED:           return "\033[31m";
    case FG_GREEN:         return "\033[32m";
    case FG_YELLOW:        return "\033[33m";
    case FG_BLUE:          return "\033[34m";
    case FG_MAGENTA:       return "\033[35m";
    case FG_CYAN:          return "\033[36m";
    case FG_WHITE:         return "\033[37m";
    case FG_DEFAULT:       return "\033[39m";
    case BG_BLACK:         return "\033[40m";
    case BG_RED:           return "\033[41m";
    case BG_GREEN:         return "\033[42m";
    case BG_YELLOW:        return "\033[43m";
    case BG_BLUE:          return "\033[44m";
    case BG_MAGENTA:       return "\033[45m";
    case BG_CYAN:          return "\033[46m";
    case BG_WHITE:         return "\033[47m";
    case BG_DEFAULT:       return "\033[49m";
    }
}

/// Combine color codes, yields the empty string unless colorization is enabled for stderr.
std::string
color (Colors acolor, Colors c1, Colors c2, Colors c3)
{
  return_unless (colorize_tty(), "");
  std::string out = color_code (acolor);
  out += color_code (c1);
  out += color_code (c2);
  out += color_code (c3);
  return out;
}

/// Check whether `fd` (stderr by default) should receive colored output.
bool
colorize_tty (int fd)
{
  const char *ev = getenv ("TETHER_COLOR");
  if (ev)
    {
      const String s = string_tolower (ev);
      if (s == "never" || s == "no" || s == "0")
        return false;
      if (s == "always" || s == "yes" || s == "1")
        return true;
    }
  const char *term = getenv ("TERM");
  if (!term || String (term) == "dumb")
    return false;
  return isatty (fd >= 0 ? fd : diag_output_fd());
}

} // AnsiColors

std::string
executable_path()
{
  static const std::string self = [] () {
    char buffer[PATH_MAX + 1] = { 0, };
    const ssize_t l = readlink ("/proc/self/exe", buffer, PATH_MAX);
    return l > 0 ? std::string (buffer, l) : std::string();
  } ();
  return self;
}

std::string
executable_name()
{
  static const std::string name = [] () {
    const std::string path = executable_path();
    const size_t sep = path.rfind ('/');
    return sep == std::string::npos ? path : path.substr (sep + 1);
  } ();
  return name;
}

const char*
tether_version()
{
  return TETHER_VERSION;
}

} // Tether
