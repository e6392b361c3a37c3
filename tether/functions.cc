// This Source Code Form is licensed MPL-2.0: http://mozilla.org/MPL/2.0
#include "runtime.hh"
#include "binding.hh"
#include "classes.hh"
#include "platform.hh"
#include "internal.hh"
#include <cmath>

namespace Tether {

static constexpr int64 COUNT_RECURSIVE = 1;
static constexpr int64 E_USER_ERROR = 256;
static constexpr int64 E_USER_WARNING = 512;
static constexpr int64 E_USER_NOTICE = 1024;
static constexpr int64 MAX_RANGE_ELEMENTS = 64 * 1024 * 1024;

/// Comparison with type juggling, as used by `==` and non-strict in_array().
static bool
loose_equals (const Value &a, const Value &b)
{
  if (a.index() == b.index())
    {
      if (a.index() == Value::STRING)
        {
          double da = 0, db = 0;
          if (numeric_string (std::get<String> (a), &da, nullptr) && numeric_string (std::get<String> (b), &db, nullptr))
            return da == db;
        }
      if (a.index() == Value::ARRAY)
        {
          const ValueA &aa = std::get<ValueA> (a), &ab = std::get<ValueA> (b);
          if (aa.size() != ab.size())
            return false;
          for (const ValueEntry &e : aa)
            {
              const Value *v = ab.find (e.key);
              if (!v || !loose_equals (*e.value, *v))
                return false;
            }
          return true;
        }
      return a == b;
    }
  if (a.index() == Value::BOOL || b.index() == Value::BOOL)
    return a.as_bool() == b.as_bool();
  if (a.index() == Value::NONE || b.index() == Value::NONE)
    {
      const Value &other = a.is_null() ? b : a;
      if (other.index() == Value::STRING)
        return std::get<String> (other).empty();
      return !other.as_bool();
    }
  if (a.is_numeric() && b.is_numeric())
    return a.as_double() == b.as_double();
  if ((a.is_numeric() && b.index() == Value::STRING) || (b.is_numeric() && a.index() == Value::STRING))
    {
      const Value &number = a.is_numeric() ? a : b;
      const String &string = std::get<String> (a.is_numeric() ? b : a);
      double d = 0;
      if (numeric_string (string, &d, nullptr))
        return number.as_double() == d;
      return number.as_string() == string;
    }
  return false;
}

// == Arrays ==
static int64
builtin_count (const Value &value, int64 mode)
{
  if (mode == COUNT_RECURSIVE && value.index() == Value::ARRAY)
    {
      int64 n = 0;
      for (const ValueEntry &e : std::get<ValueA> (value))
        n += 1 + (e.value->index() == Value::ARRAY ? builtin_count (*e.value, mode) : 0);
      return n;
    }
  return Runtime::current().count (value);
}

/// Exchange keys with their values, only string and integer values can become keys.
static ValueA
array_flip (const ValueA &array)
{
  ValueA result;
  for (const ValueEntry &e : array)
    {
      const Value &v = *e.value;
      if (v.index() != Value::INT64 && v.index() != Value::STRING)
        {
          Runtime::warning ("array_flip(): Can only flip string and integer values, entry skipped");
          continue;
        }
      result.set (ValueA::key_from (v), key_to_value (e.key));
    }
  return result;
}

static ValueA
array_keys (const ValueA &array)
{
  ValueA result;
  for (const ValueEntry &e : array)
    result.append (key_to_value (e.key));
  return result;
}

static ValueA
array_values (const ValueA &array)
{
  ValueA result;
  for (const ValueEntry &e : array)
    result.append (*e.value);
  return result;
}

/// Merge arrays, integer keys are renumbered and later string keys win.
static ValueA
array_merge (const ValueS &arrays)
{
  ValueA result;
  for (size_t i = 0; i < arrays.size(); i++)
    {
      if (arrays[i].index() != Value::ARRAY)
        throw TypeError (string_format ("array_merge(): Argument #%d must be of type array, %s given",
                                        int (i + 1), arrays[i].type_name()));
      for (const ValueEntry &e : std::get<ValueA> (arrays[i]))
        if (std::holds_alternative<int64> (e.key))
          result.append (*e.value);
        else
          result.set (e.key, *e.value);
    }
  return result;
}

static ValueA
array_reverse (const ValueA &array, bool preserve_keys)
{
  ValueA result;
  for (auto it = array.end(); it != array.begin();)
    {
      --it;
      if (std::holds_alternative<int64> (it->key) && !preserve_keys)
        result.append (*it->value);
      else
        result.set (it->key, *it->value);
    }
  return result;
}

static bool
in_array (const Value &needle, const ValueA &haystack, bool strict)
{
  for (const ValueEntry &e : haystack)
    if (strict ? *e.value == needle : loose_equals (*e.value, needle))
      return true;
  return false;
}

static bool
array_key_exists (const Value &key, const ValueA &array)
{
  return array.has (ValueA::key_from (key));
}

static Value
array_sum (const ValueA &array)
{
  int64 isum = 0;
  double dsum = 0;
  bool integral = true;
  for (const ValueEntry &e : array)
    {
      const Value &v = *e.value;
      if (v.index() == Value::ARRAY || v.index() == Value::INSTANCE)
        {
          Runtime::warning (string_format ("array_sum(): Addition is not supported on type %s", v.type_name()));
          continue;
        }
      double d = v.as_double();
      bool is_int = v.index() != Value::DOUBLE;
      if (v.index() == Value::STRING)
        {
          bool whole = false;
          if (!numeric_string (std::get<String> (v), &d, &whole))
            d = 0;
          is_int = whole;
        }
      int64 next = 0;
      if (integral && is_int && !__builtin_add_overflow (isum, int64 (d), &next))
        {
          isum = next;
          continue;
        }
      if (integral)
        dsum = double (isum);
      integral = false;
      dsum += d;
    }
  if (integral)
    return isum;
  return dsum;
}

/// Apply `callback` to all elements, keys are preserved.
static ValueA
array_map (const Value &callback, const ValueA &array)
{
  return_unless (!callback.is_null(), array);
  Runtime &runtime = Runtime::current();
  ValueA result;
  for (const ValueEntry &e : array)
    {
      ValueS args { *e.value };
      result.set (e.key, runtime.call_callable (callback, args));
    }
  return result;
}

/// Elements from `start` to `end`, floats are produced if any argument is a float.
static ValueA
range (const Value &start, const Value &end, const Value &step)
{
  auto is_float = [] (const Value &v) {
    if (v.index() == Value::DOUBLE)
      return true;
    bool integral = true;
    return v.index() == Value::STRING && numeric_string (std::get<String> (v), nullptr, &integral) && !integral;
  };
  const double dstep = std::abs (step.as_double());
  if (dstep == 0 || !std::isfinite (dstep))
    throw ValueError ("range(): Argument #3 ($step) cannot be 0");
  const double dstart = start.as_double(), dend = end.as_double();
  if (!std::isfinite (dstart) || !std::isfinite (dend))
    throw ValueError ("range(): Argument #1 ($start) must be a finite number, INF provided");
  if (std::abs (dend - dstart) / dstep >= MAX_RANGE_ELEMENTS)
    throw ValueError ("The supplied range exceeds the maximum array size");
  const int64 n = int64 (std::abs (dend - dstart) / dstep) + 1;
  const double direction = dstart <= dend ? +1 : -1;
  ValueA result;
  if (is_float (start) || is_float (end) || is_float (step))
    for (int64 i = 0; i < n; i++)
      result.append (dstart + direction * i * dstep);
  else
    {
      // unsigned arithmetic, every element lies between start and end
      const int64 istart = start.as_int(), iend = end.as_int(), istep = step.as_int();
      const uint64 span = istart <= iend ? uint64 (iend) - uint64 (istart) : uint64 (istart) - uint64 (iend);
      const uint64 ustep = istep < 0 ? -uint64 (istep) : uint64 (istep);
      const uint64 count = span / ustep + 1;
      for (uint64 i = 0; i < count; i++)
        result.append (int64 (istart <= iend ? uint64 (istart) + i * ustep : uint64 (istart) - i * ustep));
    }
  return result;
}

/// Collect the elements of an iterable, optionally renumbering the keys.
static ValueA
iterator_to_array (const Value &iterable, bool preserve_keys)
{
  GeneratorP generator = Generator::from_value (iterable);
  ValueA result;
  for (; generator->valid(); generator->next())
    if (preserve_keys)
      result.set (ValueA::key_from (generator->key()), generator->current());
    else
      result.append (generator->current());
  return result;
}

static GeneratorP
xrange (int64 start, int64 end, int64 step)
{
  return Generator::from_range (start, end, step);
}

// == Strings ==
static int64
builtin_strlen (const String &string)
{
  return string.size();
}

static String
strtoupper (const String &string)
{
  String s = string;
  for (char &c : s)
    if (c >= 'a' && c <= 'z')
      c = c - 'a' + 'A';
  return s;
}

static String
strtolower (const String &string)
{
  String s = string;
  for (char &c : s)
    if (c >= 'A' && c <= 'Z')
      c = c - 'A' + 'a';
  return s;
}

static String
str_repeat (const String &string, int64 times)
{
  if (times < 0)
    throw ValueError ("str_repeat(): Argument #2 ($times) must be greater than or equal to 0");
  String s;
  s.reserve (string.size() * times);
  for (int64 i = 0; i < times; i++)
    s += string;
  return s;
}

static String
str_replace (const String &search, const String &replace, const String &subject)
{
  return_unless (!search.empty(), subject);
  return string_replace (subject, search, replace);
}

/// Part of `string` at `offset`, negative offsets and lengths count from the end.
static String
substr (const String &string, int64 offset, const Value &length)
{
  const int64 size = string.size();
  if (offset < 0)
    offset = std::max<int64> (0, size + offset);
  offset = std::min (offset, size);
  int64 l = size - offset;
  if (!length.is_null())
    {
      const int64 n = length.as_int();
      l = n < 0 ? std::max<int64> (0, l + n) : std::min (n, l);
    }
  return string.substr (offset, l);
}

/// Join array elements with `separator`, the separator may be omitted.
static String
implode (const Value &separator, const Value &array)
{
  String glue;
  const ValueA *pieces = nullptr;
  if (separator.index() == Value::ARRAY && array.is_null())
    pieces = &std::get<ValueA> (separator);
  else if (array.index() == Value::ARRAY && separator.index() != Value::ARRAY)
    {
      glue = Runtime::current().to_string (separator);
      pieces = &std::get<ValueA> (array);
    }
  else if (array.is_null())
    throw TypeError (string_format ("implode(): Argument #1 ($pieces) must be of type array, %s given", separator.type_name()));
  else
    throw TypeError (string_format ("implode(): Argument #2 ($array) must be of type ?array, %s given", array.type_name()));
  Runtime &runtime = Runtime::current();
  StringS strings;
  for (const ValueEntry &e : *pieces)
    strings.push_back (runtime.to_string (*e.value));
  return string_join (glue, strings);
}

/// Split `string` at `separator`, a negative limit drops elements from the end.
static StringS
explode (const String &separator, const String &string, int64 limit)
{
  if (separator.empty())
    throw ValueError ("explode(): Argument #1 ($separator) cannot be empty");
  if (limit > 0)
    return string_split (string, separator, limit);
  if (limit == 0)
    return string_split (string, separator, 1);
  StringS parts = string_split (string, separator);
  const size_t drop = std::min<uint64> (-uint64 (limit), parts.size());
  parts.resize (parts.size() - drop);
  return parts;
}

// == Types and reflection ==
static String
gettype (const Value &value)
{
  switch (value.index())
    {
    case Value::NONE:           return "NULL";
    case Value::BOOL:           return "boolean";
    case Value::INT64:          return "integer";
    case Value::DOUBLE:         return "double";
    case Value::STRING:         return "string";
    case Value::ARRAY:          return "array";
    case Value::INSTANCE:       return "object";
    case Value::RESOURCE:       return value.as_resource() && value.as_resource()->kind() == "Unknown" ? "resource (closed)" : "resource";
    }
  return "unknown type";
}

static String
get_class (const InstanceP &object)
{
  return object->class_name();
}

static int64
spl_object_id (const InstanceP &object)
{
  return object->serial();
}

static ValueA
get_object_vars (const InstanceP &object)
{
  ValueA result;
  for (const String &name : Runtime::current().property_names (object))
    result.set (name, object->props().get (name));
  return result;
}

static const ClassInfo*
class_from (const Value &object_or_class)
{
  if (object_or_class.index() == Value::INSTANCE)
    return object_or_class.as_instance()->class_info();
  if (object_or_class.index() == Value::STRING)
    return Runtime::find_class (std::get<String> (object_or_class));
  throw TypeError (string_format ("Argument #1 ($object_or_class) must be of type object|string, %s given", object_or_class.type_name()));
}

static bool
method_exists (const Value &object_or_class, const String &method)
{
  const ClassInfo *info = class_from (object_or_class);
  return info && info->find_method (method);
}

static bool
property_exists (const Value &object_or_class, const String &property)
{
  const ClassInfo *info = class_from (object_or_class);
  if (info && info->find_property (property))
    return true;
  return object_or_class.index() == Value::INSTANCE && object_or_class.as_instance()->props().has (property);
}

static bool
is_callable (const Value &value)
{
  return Runtime::current().is_callable (value);
}

static bool
function_exists (const String &name)
{
  return Runtime::find_function (name) != nullptr;
}

static bool
class_exists (const String &name)
{
  const ClassInfo *info = Runtime::find_class (name);
  return info && !info->is_interface;
}

static bool
interface_exists (const String &name)
{
  const ClassInfo *info = Runtime::find_class (name);
  return info && info->is_interface;
}

static bool
defined (const String &name)
{
  return Runtime::current().has_constant (name);
}

static Value
constant (const String &name)
{
  return Runtime::current().constant (name);
}

static bool
define (const String &name, const Value &value)
{
  return Runtime::current().define_constant (name, value);
}

// == Calls and errors ==
static Value
call_user_func (const Value &callback, const ValueS &args)
{
  ValueS callargs = args;
  return Runtime::current().call_callable (callback, callargs);
}

static Value
call_user_func_array (const Value &callback, const ValueA &args)
{
  ValueS callargs;
  for (const ValueEntry &e : args)
    callargs.push_back (*e.value);
  return Runtime::current().call_callable (callback, callargs);
}

/// Issue a user level diagnostic, E_USER_ERROR aborts the current command.
static bool
trigger_error (const String &message, int64 level)
{
  switch (level)
    {
    case E_USER_ERROR:
      throw Error (message);
    case E_USER_WARNING:
    case E_USER_NOTICE:
      Runtime::warning (message);
      return true;
    default:
      throw ValueError ("trigger_error(): Argument #2 ($error_level) must be one of E_USER_ERROR, E_USER_WARNING or E_USER_NOTICE");
    }
}

static int64
intdiv (int64 num1, int64 num2)
{
  if (num2 == 0)
    throw DivisionByZeroError ("Division by zero");
  if (num1 == I63MIN && num2 == -1)
    throw Error ("Division of INT_MIN by -1 is not an integer");
  return num1 / num2;
}

void
register_builtin_functions ()
{
  // arrays
  register_function ("count", builtin_count, "Count the elements of an array or Countable object",
                     { "value", { "mode", int64 (0) } });
  register_function ("array_flip", array_flip, "Exchange all keys with their associated values", { "array" });
  register_function ("array_keys", array_keys, "Return all the keys of an array", { "array" });
  register_function ("array_values", array_values, "Return all the values of an array", { "array" });
  register_function ("array_merge", array_merge, "Merge one or more arrays", { "arrays" });
  register_function ("array_reverse", array_reverse, "Return an array with elements in reverse order",
                     { "array", { "preserve_keys", false } });
  register_function ("array_key_exists", array_key_exists, "Check if the given key exists in the array", { "key", "array" });
  register_function ("array_sum", array_sum, "Calculate the sum of values in an array", { "array" });
  register_function ("array_map", array_map, "Apply the callback to the elements of an array", { "callback", "array" });
  register_function ("in_array", in_array, "Check if a value exists in an array",
                     { "needle", "haystack", { "strict", false } });
  register_function ("range", range, "Create an array containing a range of elements",
                     { "start", "end", { "step", int64 (1) } });
  register_function ("iterator_to_array", iterator_to_array, "Copy the elements of an iterable into an array",
                     { "iterator", { "preserve_keys", true } });
  register_function ("xrange", xrange, "Lazily produce a range of integers",
                     { "start", "end", { "step", int64 (1) } });
  // strings
  register_function ("strlen", builtin_strlen, "Get string length in bytes", { "string" });
  register_function ("strtoupper", strtoupper, "Make a string uppercase", { "string" });
  register_function ("strtolower", strtolower, "Make a string lowercase", { "string" });
  register_function ("str_repeat", str_repeat, "Repeat a string", { "string", "times" });
  register_function ("str_replace", str_replace, "Replace all occurrences of the search string", { "search", "replace", "subject" });
  register_function ("substr", substr, "Return part of a string", { "string", "offset", { "length", Value() } });
  register_function ("implode", implode, "Join array elements with a string", { "separator", { "array", Value() } });
  register_function ("explode", explode, "Split a string by a string",
                     { "separator", "string", { "limit", int64 (I63MAX) } });
  // types and reflection
  register_function ("gettype", gettype, "Get the type of a variable", { "value" });
  register_function ("get_class", get_class, "Return the name of the class of an object", { "object" });
  register_function ("spl_object_id", spl_object_id, "Return the integer object handle", { "object" });
  register_function ("get_object_vars", get_object_vars, "Get the public properties of an object", { "object" });
  register_function ("method_exists", method_exists, "Check if the class method exists", { "object_or_class", "method" });
  register_function ("property_exists", property_exists, "Check if the object or class has a property",
                     { "object_or_class", "property" });
  register_function ("is_callable", is_callable, "Verify that a value can be called as a function", { "value" });
  register_function ("function_exists", function_exists, "Return true if the given function has been defined", { "function" });
  register_function ("class_exists", class_exists, "Check if the class has been defined", { "class" });
  register_function ("interface_exists", interface_exists, "Check if the interface has been defined", { "interface" });
  register_function ("defined", defined, "Check whether a given named constant exists", { "constant_name" });
  register_function ("constant", constant, "Return the value of a constant", { "name" });
  register_function ("define", define, "Define a named constant", { "constant_name", "value" });
  register_function ("is_null", +[] (const Value &v) { return v.index() == Value::NONE; }, "", { "value" });
  register_function ("is_bool", +[] (const Value &v) { return v.index() == Value::BOOL; }, "", { "value" });
  register_function ("is_int", +[] (const Value &v) { return v.index() == Value::INT64; }, "", { "value" });
  register_function ("is_float", +[] (const Value &v) { return v.index() == Value::DOUBLE; }, "", { "value" });
  register_function ("is_string", +[] (const Value &v) { return v.index() == Value::STRING; }, "", { "value" });
  register_function ("is_array", +[] (const Value &v) { return v.index() == Value::ARRAY; }, "", { "value" });
  register_function ("is_object", +[] (const Value &v) { return v.index() == Value::INSTANCE; }, "", { "value" });
  register_function ("is_resource", +[] (const Value &v) {
    return v.index() == Value::RESOURCE && v.as_resource() && v.as_resource()->kind() != "Unknown";
  }, "", { "value" });
  // calls and errors
  register_function ("call_user_func", call_user_func, "Call the callback given by the first parameter", { "callback", "args" });
  register_function ("call_user_func_array", call_user_func_array, "Call a callback with an array of parameters",
                     { "callback", "args" });
  register_function ("trigger_error", trigger_error, "Generate a user-level error, warning or notice",
                     { "message", { "error_level", E_USER_NOTICE } });
  register_function ("intdiv", intdiv, "Integer division", { "num1", "num2" });
}

void
define_builtin_constants (Runtime &runtime)
{
  runtime.define_constant ("M_PI", M_PI);
  runtime.define_constant ("M_E", M_E);
  runtime.define_constant ("NAN", double (NAN));
  runtime.define_constant ("INF", double (INFINITY));
  runtime.define_constant ("INT_MAX", I63MAX);
  runtime.define_constant ("INT_MIN", I63MIN);
  runtime.define_constant ("INT_SIZE", int64 (sizeof (int64)));
  runtime.define_constant ("FLOAT_EPSILON", D64EPS);
  runtime.define_constant ("FLOAT_MAX", D64MAX);
  runtime.define_constant ("EOL", "\n");
  runtime.define_constant ("COUNT_RECURSIVE", COUNT_RECURSIVE);
  runtime.define_constant ("E_USER_ERROR", E_USER_ERROR);
  runtime.define_constant ("E_USER_WARNING", E_USER_WARNING);
  runtime.define_constant ("E_USER_NOTICE", E_USER_NOTICE);
  runtime.define_constant ("TETHER_VERSION", tether_version());
}

} // Tether

#include "testing.hh"

namespace { // Anon
using namespace Tether;

static Value
call (Runtime &runtime, const String &name, ValueS args)
{
  return runtime.call_function (name, args);
}

TEST_INTEGRITY (functions_tests);
static void
functions_tests()
{
  Runtime runtime;
  Runtime::Scope scope (runtime);
  StringS warnings;
  Runtime::WarningHandler old = Runtime::set_warning_handler ([&warnings] (const String &m) { warnings.push_back (m); });
  // array_flip skips values that cannot become keys
  const Value flipped = call (runtime, "ARRAY_FLIP", { ValueA { "a", "b", 3, 1.5 } });
  TASSERT (flipped == ValueA::record ({ { "a", 0 }, { "b", 1 }, { "3", 2 } }));
  TCMP (warnings.size(), ==, 1u);
  TASSERT (call (runtime, "count", { flipped }) == Value (int64 (3)));
  TASSERT (call (runtime, "count", { ValueA { 1, ValueA { 2, 3 } }, int64 (1) }) == Value (int64 (4)));
  TTHROWS (call (runtime, "count", { int64 (1) }), TypeError);
  TTHROWS (call (runtime, "count", {}), ArgumentCountError);
  TTHROWS (call (runtime, "strlen", { "a", "b" }), ArgumentCountError);
  TTHROWS (call (runtime, "strlen", { ValueA() }), TypeError);
  TTHROWS (call (runtime, "no_such_function", {}), Error);
  // arrays
  TASSERT (call (runtime, "array_merge", { ValueA { 1 }, ValueA::record ({ { "k", 2 } }), ValueA { 3 } }) ==
           ValueA::record ({ { "0", 1 }, { "k", 2 }, { "1", 3 } }));
  TASSERT (call (runtime, "array_reverse", { ValueA { 1, 2 } }) == ValueA ({ 2, 1 }));
  TASSERT (call (runtime, "in_array", { "1", ValueA { 1 } }).as_bool());
  TASSERT (!call (runtime, "in_array", { "1", ValueA { 1 }, true }).as_bool());
  TASSERT (!call (runtime, "in_array", { "abc", ValueA { 0 } }).as_bool());
  TASSERT (call (runtime, "range", { int64 (5), int64 (1), int64 (2) }) == ValueA ({ 5, 3, 1 }));
  TASSERT (call (runtime, "range", { int64 (0), 1.0, 0.5 }) == ValueA ({ 0.0, 0.5, 1.0 }));
  TTHROWS (call (runtime, "range", { int64 (0), int64 (1), int64 (0) }), ValueError);
  TASSERT (call (runtime, "range", { I63MIN, I63MAX, I63MAX }) == ValueA ({ I63MIN, int64 (-1), I63MAX - 1 }));
  TASSERT (call (runtime, "range", { I63MAX, I63MIN, I63MIN }) == ValueA ({ I63MAX, int64 (-1) }));
  TASSERT (call (runtime, "range", { int64 (-2), int64 (2), int64 (-2) }) == ValueA ({ -2, 0, 2 }));
  TASSERT (call (runtime, "array_sum", { ValueA { 1, 2, "3" } }) == Value (int64 (6)));
  TASSERT (call (runtime, "array_sum", { ValueA { 1, 0.5 } }) == Value (1.5));
  TASSERT (call (runtime, "array_map", { "strtoupper", ValueA::record ({ { "x", "a" } }) }) == ValueA::record ({ { "x", "A" } }));
  TASSERT (call (runtime, "iterator_to_array", { call (runtime, "xrange", { int64 (1), int64 (3) }) }) == ValueA ({ 1, 2, 3 }));
  // strings
  TASSERT (call (runtime, "implode", { ", ", ValueA { 1, "b", 2.5 } }) == Value ("1, b, 2.5"));
  TASSERT (call (runtime, "implode", { ValueA { "a", "b" } }) == Value ("ab"));
  TASSERT (call (runtime, "explode", { ",", "a,b,c", int64 (2) }) == ValueA ({ "a", "b,c" }));
  TASSERT (call (runtime, "explode", { ",", "a,b,c", int64 (-1) }) == ValueA ({ "a", "b" }));
  TTHROWS (call (runtime, "explode", { "", "abc" }), ValueError);
  TASSERT (call (runtime, "substr", { "abcdef", int64 (-3), int64 (2) }) == Value ("de"));
  TASSERT (call (runtime, "str_repeat", { "ab", int64 (2) }) == Value ("abab"));
  TASSERT (call (runtime, "strlen", { int64 (1234) }) == Value (int64 (4)));
  // reflection
  TASSERT (call (runtime, "gettype", { 1.0 }) == Value ("double"));
  TASSERT (call (runtime, "function_exists", { "\\Array_Keys" }).as_bool());
  TASSERT (!call (runtime, "function_exists", { "echo" }).as_bool());
  TASSERT (call (runtime, "class_exists", { "arrayobject" }).as_bool());
  TASSERT (!call (runtime, "class_exists", { "Countable" }).as_bool());
  TASSERT (call (runtime, "interface_exists", { "Countable" }).as_bool());
  TASSERT (call (runtime, "method_exists", { "ArrayObject", "getIterator" }).as_bool());
  TASSERT (call (runtime, "is_callable", { ValueA { "Closure", "fromCallable" } }).as_bool());
  TASSERT (call (runtime, "constant", { "INT_MAX" }) == Value (I63MAX));
  TASSERT (call (runtime, "define", { "ANSWER", int64 (42) }).as_bool());
  TASSERT (!call (runtime, "define", { "ANSWER", int64 (43) }).as_bool());
  TASSERT (runtime.constant ("ANSWER") == Value (int64 (42)));
  TCMP (warnings.size(), ==, 2u);
  // errors
  TTHROWS (call (runtime, "intdiv", { int64 (1), int64 (0) }), DivisionByZeroError);
  TASSERT (call (runtime, "intdiv", { int64 (7), int64 (2) }) == Value (int64 (3)));
  TTHROWS (call (runtime, "trigger_error", { "boom", int64 (256) }), Error);
  TASSERT (call (runtime, "call_user_func", { "str_repeat", "x", int64 (3) }) == Value ("xxx"));
  TASSERT (call (runtime, "call_user_func_array", { "strtolower", ValueA { "ABC" } }) == Value ("abc"));
  Runtime::set_warning_handler (old);
}

} // Anon
