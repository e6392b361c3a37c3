// This Source Code Form is licensed MPL-2.0: http://mozilla.org/MPL/2.0
#ifndef __TETHER_INTERNAL_HH__
#define __TETHER_INTERNAL_HH__

#include <tether/cxxaux.hh>

// Import simple Tether types into global scope
using Tether::uint8;
using Tether::uint16;
using Tether::uint32;
using Tether::uint64;
using Tether::int32;
using Tether::int64;
using Tether::String;

/// Yield the number of C @a array elements.
#define ARRAY_SIZE(array)               TETHER_ARRAY_SIZE (array)

/// Return from the current function if `expr` is unmet and issue an assertion warning.
#define assert_return(expr, ...)        TETHER_ASSERT_RETURN (expr, __VA_ARGS__)
/// Return from the current function and issue an assertion warning.
#define assert_return_unreached(...)    TETHER_ASSERT_RETURN_UNREACHED (__VA_ARGS__)
/// Issue an assertion warning if `expr` evaluates to false.
#define assert_warn(expr)               TETHER_ASSERT_WARN (expr)

/// Hint to the compiler to optimize for @a cond == TRUE.
#define ISLIKELY(cond)  TETHER_ISLIKELY (cond)
/// Hint to the compiler to optimize for @a cond == FALSE.
#define UNLIKELY(cond)  TETHER_UNLIKELY (cond)

/// Return silently if @a cond does not evaluate to true with return value @a ...
#define return_unless(cond, ...)        TETHER_RETURN_UNLESS (cond, __VA_ARGS__)

/// Register `func` as an integrity test.
#define TEST_INTEGRITY(FUNC)        static void FUNC() __attribute__ ((__cold__, __unused__)); \
  static ::Tether::Test::IntegrityCheck TETHER_CPP_PASTE2 (__Tether__Test__IntegrityCheck__line, __LINE__) { #FUNC, FUNC, 'I' }

namespace Tether {

namespace Test {

// == IntegrityCheck ==
struct IntegrityCheck {
  using TestFunc = void (*) ();
  IntegrityCheck (const char *name, TestFunc func, char hint)
  {
    func_ = func;
    name_ = name;
    hint_ = hint;
    next_ = first_;
    first_ = this;
  }
  static int run (const StringS &filters); // see testing.cc
private:
  const char *name_;
  TestFunc func_;
  char hint_;
  IntegrityCheck *next_;
  static IntegrityCheck *first_;    // see testing.cc
};

} } // Tether::Test

#endif  // __TETHER_INTERNAL_HH__
