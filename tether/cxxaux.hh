// This Source Code Form is licensed MPL-2.0: http://mozilla.org/MPL/2.0
#ifndef __TETHER_CXXAUX_HH__
#define __TETHER_CXXAUX_HH__

#include <sys/types.h>                  // ssize_t
#include <cstdint>                      // uint64_t
#include <string>
#include <functional>
#include <typeinfo>
#include <vector>
#include <memory>

namespace Tether {

// == type aliases ==
typedef uint8_t         uint8;          ///< An 8-bit unsigned integer.
typedef uint16_t        uint16;         ///< A 16-bit unsigned integer.
typedef uint32_t        uint32;         ///< A 32-bit unsigned integer.
typedef uint64_t        uint64;         ///< A 64-bit unsigned integer, use PRI*64 in format strings.
typedef int32_t         int32;          ///< A 32-bit signed integer.
typedef int64_t         int64;          ///< A 64-bit signed integer, use PRI*64 in format strings.
static_assert (sizeof (uint8) == 1 && sizeof (uint16) == 2 && sizeof (uint32) == 4 && sizeof (uint64) == 8, "");
using String = std::string;               ///< Convenience alias for std::string.
using StringS = std::vector<String>;      ///< Convenience alias for a std::vector<std::string>.
using VoidF = std::function<void()>;

// == Utility Macros ==
#define TETHER_CPP_STRINGIFY(s)    TETHER_CPP_STRINGIFY_ (s)            ///< Convert macro argument into a C const char*.
#define TETHER_CPP_STRINGIFY_(s)   #s                                   // Indirection helper, required to expand macros like __LINE__
#define TETHER_CPP_PASTE2_(a,b)    a ## b                               // Indirection helper, required to expand macros like __LINE__
#define TETHER_CPP_PASTE2(a,b)     TETHER_CPP_PASTE2_ (a,b)             ///< Paste two macro arguments into one C symbol name
#define TETHER_ISLIKELY(expr)      __builtin_expect (bool (expr), 1)    ///< Compiler hint to optimize for @a expr evaluating to true.
#define TETHER_UNLIKELY(expr)      __builtin_expect (bool (expr), 0)    ///< Compiler hint to optimize for @a expr evaluating to false.
#define TETHER_ARRAY_SIZE(array)   (sizeof (array) / sizeof ((array)[0]))       ///< Yield the number of C @a array elements.

// Shorthands for <a href="https://gcc.gnu.org/onlinedocs/gcc/Common-Function-Attributes.html">GCC Attributes</a>.
#define TETHER_ALWAYS_INLINE       __attribute__ ((always_inline))
#define TETHER_COLD                __attribute__ ((__cold__))
#define TETHER_NOINLINE            __attribute__ ((noinline))
#define TETHER_NORETURN            __attribute__ ((__noreturn__))
#define TETHER_PRINTF(fx, ax)      __attribute__ ((__format__ (__printf__, fx, ax)))
#define TETHER_PURE                __attribute__ ((__pure__))
#define TETHER_UNUSED              __attribute__ ((__unused__))
#define TETHER_USE_RESULT          __attribute__ ((warn_unused_result))

/// Return silently if @a cond does not evaluate to true, with return value @a ...
#define TETHER_RETURN_UNLESS(cond, ...)      do { if (TETHER_UNLIKELY (!bool (cond))) return __VA_ARGS__; } while (0)

/// Return from the current function if `expr` evaluates to false and issue an assertion warning.
#define TETHER_ASSERT_RETURN(expr, ...)     do { if (TETHER_ISLIKELY (expr)) break; ::Tether::assertion_failed (#expr); return __VA_ARGS__; } while (0)

/// Return from the current function and issue an assertion warning.
#define TETHER_ASSERT_RETURN_UNREACHED(...) do { ::Tether::assertion_failed (""); return __VA_ARGS__; } while (0)

/// Issue an assertion warning if `expr` evaluates to false.
#define TETHER_ASSERT_WARN(expr)            do { if (TETHER_ISLIKELY (expr)) break; ::Tether::assertion_failed (#expr); } while (0)

/// Delete copy ctor and assignment operator.
#define TETHER_CLASS_NON_COPYABLE(ClassName)  \
  /*copy-ctor*/ ClassName  (const ClassName&) = delete; \
  ClassName&    operator=  (const ClassName&) = delete

/// Forward declare `struct Klass;` as well as shared_ptr `KlassP` and vector `KlassS`.
#define TETHER_STRUCT_DECLS(Klass)                                      \
  struct Klass;                                                         \
  using TETHER_CPP_PASTE2 (Klass, P) = ::std::shared_ptr<Klass>;        \
  using TETHER_CPP_PASTE2 (Klass, S) = ::std::vector<Klass>;

/// Forward declare `class Klass;` as well as `KlassP` and `KlassS` as `vector<KlassP>`.
#define TETHER_CLASS_DECLS(Klass)                                       \
  class Klass;                                                          \
  using TETHER_CPP_PASTE2 (Klass, W) = ::std::weak_ptr<Klass>;          \
  using TETHER_CPP_PASTE2 (Klass, P) = ::std::shared_ptr<Klass>;        \
  using TETHER_CPP_PASTE2 (Klass, S) = ::std::vector<TETHER_CPP_PASTE2 (Klass, P)>;

/// Demangle identifier via libcc.
std::string string_demangle_cxx (const char *mangled_identifier) noexcept;

/// Provide demangled stringified name for type `T`.
template<class T> TETHER_PURE static inline String
typeid_name()
{
  return string_demangle_cxx (typeid (T).name());
}

/// Provide demangled stringified name for object `obj`.
template<class T> TETHER_PURE static inline String
typeid_name (T &obj)
{
  return string_demangle_cxx (typeid (obj).name());
}

/// Common base type to allow casting between polymorphic classes.
struct VirtualBase {
protected:
  virtual ~VirtualBase() = 0;
};
using VirtualBaseP = std::shared_ptr<VirtualBase>;

/// Issue a warning about an assertion error.
void assertion_failed (const char *msg = "", const char *file = __builtin_FILE(),
                       int line = __builtin_LINE(), const char *func = __builtin_FUNCTION()) noexcept;

/// Global flag to force aborting on assertion warnings.
extern bool assertion_failed_fatal;

/// REQUIRES<value> - Simplified version of std::enable_if<cond,bool>::type to use SFINAE in function templates.
template<bool value> using REQUIRES = typename ::std::enable_if<value, bool>::type;

/// REQUIRESv<value> - Simplified version of std::enable_if<cond,void>::type to use SFINAE in struct templates.
template<bool value> using REQUIRESv = typename ::std::enable_if<value, void>::type;

} // Tether

#endif // __TETHER_CXXAUX_HH__
