// This Source Code Form is licensed MPL-2.0: http://mozilla.org/MPL/2.0
#ifndef __TETHER_PLATFORM_HH__
#define __TETHER_PLATFORM_HH__

#include <tether/defs.hh>

namespace Tether {

// == AnsiColors ==
/// The AnsiColors namespace contains utility functions for colored terminal output
namespace AnsiColors {
/// ANSI color symbols.
enum Colors {
  NONE,
  RESET,                ///< Reset combines BOLD_OFF, UNDERLINE_OFF, INVERSE_OFF.
  BOLD, BOLD_OFF,
  UNDERLINE, UNDERLINE_OFF,
  INVERSE, INVERSE_OFF,
  FG_BLACK, FG_RED, FG_GREEN, FG_YELLOW, FG_BLUE, FG_MAGENTA, FG_CYAN, FG_WHITE,
  FG_DEFAULT,
  BG_BLACK, BG_RED, BG_GREEN, BG_YELLOW, BG_BLUE, BG_MAGENTA, BG_CYAN, BG_WHITE,
  BG_DEFAULT,
};
const char*     color_code      (Colors acolor);
std::string     color           (Colors acolor, Colors c1 = Colors::NONE, Colors c2 = Colors::NONE, Colors c3 = Colors::NONE);
bool            colorize_tty    (int fd = -1);
} // AnsiColors

// == process names ==
std::string executable_name       () TETHER_PURE;       ///< Retrieve the name part of executable_path().
std::string executable_path       () TETHER_PURE;       ///< Retrieve the path to the currently running executable.
const char* tether_version        ();                   ///< Provide a string containing the package version.

} // Tether

#endif // __TETHER_PLATFORM_HH__
