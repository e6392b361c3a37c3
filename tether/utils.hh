// This Source Code Form is licensed MPL-2.0: http://mozilla.org/MPL/2.0
#ifndef __TETHER_UTILS_HH__
#define __TETHER_UTILS_HH__

#include <tether/defs.hh>
#include <tether/strings.hh>

namespace Tether {

// == Debugging ==
inline bool               debug_enabled     () TETHER_ALWAYS_INLINE TETHER_PURE;
bool                      debug_key_enabled (const char *conditional) TETHER_PURE;
bool                      debug_key_enabled (const std::string &conditional) TETHER_PURE;
std::string               debug_key_value   (const char *conditional) TETHER_PURE;
template<class ...A> void debug             (const char *cond, const char *format, const A &...args) TETHER_ALWAYS_INLINE;
template<class ...A> void fatal_error       (const char *format, const A &...args) TETHER_NORETURN;
template<class ...A> void warning           (const char *format, const A &...args);
template<class... A> void printout          (const char *format, const A &...args);
template<class... A> void printerr          (const char *format, const A &...args);

// == Diagnostic output ==
void diag_redirect       (int fd);
int  diag_output_fd      ();
void diag_fatal_warnings (bool fatal);

// == Implementation Details ==
void debug_message (const char *cond, const std::string &message);
void diag_message  (uint8 code, const std::string &message);

/// Global boolean to reduce debugging penalty where possible
extern bool tether_debugging_enabled;

/// Check if any kind of debugging is enabled by $TETHER_DEBUG.
inline bool TETHER_ALWAYS_INLINE TETHER_PURE
debug_enabled()
{
  return TETHER_UNLIKELY (tether_debugging_enabled);
}

/// Issue a printf-like debugging message if `cond` is enabled by $TETHER_DEBUG.
template<class ...Args> inline void TETHER_ALWAYS_INLINE
debug (const char *cond, const char *format, const Args &...args)
{
  if (debug_enabled())
    {
      if (TETHER_UNLIKELY (debug_key_enabled (cond)))
        debug_message (cond, string_format (format, args...));
    }
}

/** Issue a printf-like message and abort the program, this function will not return.
 * Avoid using this in library code, aborting may take precious user data with it,
 * library code should instead use warning() or assert_return().
 */
template<class ...Args> void TETHER_NORETURN
fatal_error (const char *format, const Args &...args)
{
  diag_message ('F', string_format (format, args...));
  while (1);
}

/// Issue a printf-like warning message.
template<class ...Args> void
warning (const char *format, const Args &...args)
{
  diag_message ('W', string_format (format, args...));
}

/// Print a message on stdout (and flush stdout) ala printf(), using the POSIX/C locale.
template<class... Args> void
printout (const char *format, const Args &...args)
{
  diag_message ('o', string_format (format, args...));
}

/// Print a message on the diagnostic stream (stderr by default) ala printf(), using the POSIX/C locale.
template<class... Args> void
printerr (const char *format, const Args &...args)
{
  diag_message ('e', string_format (format, args...));
}

} // Tether

#endif // __TETHER_UTILS_HH__
