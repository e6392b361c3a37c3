// This Source Code Form is licensed MPL-2.0: http://mozilla.org/MPL/2.0
#include "runtime.hh"
#include "binding.hh"
#include "internal.hh"

namespace Tether {

// == Output ==
static void
construct_echo (const Value &arg1, const ValueS &rest)
{
  Runtime &runtime = Runtime::current();
  String text = runtime.to_string (arg1);
  for (const Value &v : rest)
    text += runtime.to_string (v);
  runtime.output (text);
}

static int64
construct_print (const Value &arg)
{
  Runtime &runtime = Runtime::current();
  runtime.output (runtime.to_string (arg));
  return 1;
}

// == Evaluation ==
static Value
construct_eval (const String &code)
{
  return Runtime::current().evaluate (code, "eval()'d code");
}

static Value
construct_include (const String &file)
{
  return Runtime::current().include_file (file, false, false);
}

static Value
construct_require (const String &file)
{
  return Runtime::current().include_file (file, true, false);
}

static Value
construct_include_once (const String &file)
{
  return Runtime::current().include_file (file, false, true);
}

static Value
construct_require_once (const String &file)
{
  return Runtime::current().include_file (file, true, true);
}

/// End the session, string statuses are printed and exit with 0.
static void
construct_exit (const Value &status)
{
  if (status.index() == Value::STRING)
    {
      Runtime::current().output (std::get<String> (status));
      throw SessionExit { 0 };
    }
  if (status.index() != Value::INT64 && status.index() != Value::BOOL && !status.is_null())
    throw TypeError (string_format ("exit(): Argument #1 ($status) must be of type string|int, %s given", status.type_name()));
  throw SessionExit { int (status.as_int()) };
}

// == Casts ==
static int64
cast_int (const Value &value)
{
  return value.as_int();
}

static bool
cast_bool (const Value &value)
{
  return value.as_bool();
}

static double
cast_float (const Value &value)
{
  return value.as_double();
}

static String
cast_string (const Value &value)
{
  return Runtime::current().to_string (value);
}

/// Arrays stay, objects yield their properties, null yields an empty array, scalars are wrapped.
static ValueA
cast_array (const Value &value)
{
  switch (value.index())
    {
    case Value::ARRAY:          return std::get<ValueA> (value);
    case Value::NONE:           return ValueA();
    case Value::INSTANCE: {
      ValueA props;
      for (const ValueEntry &e : value.as_instance()->props())
        props.set (ValueA::key_from (key_to_value (e.key)), *e.value);
      return props; }
    default:                    return ValueA { value };
    }
}

/// Objects stay, arrays become stdClass properties, scalars are stored as `scalar`.
static InstanceP
cast_object (const Value &value)
{
  switch (value.index())
    {
    case Value::INSTANCE:       return value.as_instance();
    case Value::ARRAY:          return StdClass::create (std::get<ValueA> (value));
    case Value::NONE:           return StdClass::create();
    default:                    return StdClass::create (ValueA::record ({ { "scalar", value } }));
    }
}

void
register_builtin_constructs ()
{
  register_construct ("echo", construct_echo, "Output one or more strings", { "arg1", "args" });
  register_construct ("print", construct_print, "Output a string, always returns 1", { "arg" });
  register_construct ("eval", construct_eval, "Evaluate code in the command language", { "code" });
  register_construct ("include", construct_include, "Evaluate a file, a missing file is a warning", { "file" });
  register_construct ("require", construct_require, "Evaluate a file, a missing file is an error", { "file" });
  register_construct ("include_once", construct_include_once, "Evaluate a file once", { "file" });
  register_construct ("require_once", construct_require_once, "Evaluate a file once, a missing file is an error", { "file" });
  register_construct ("exit", construct_exit, "Output a message or set the status and end the session", { { "status", int64 (0) } });
  register_construct ("die", construct_exit, "Alias of exit", { { "status", int64 (0) } });
  register_construct ("int", cast_int, "Cast to int", { "value" });
  register_construct ("bool", cast_bool, "Cast to bool", { "value" });
  register_construct ("float", cast_float, "Cast to float", { "value" });
  register_construct ("string", cast_string, "Cast to string", { "value" });
  register_construct ("array", cast_array, "Cast to array", { "value" });
  register_construct ("object", cast_object, "Cast to object", { "value" });
}

} // Tether

#include "testing.hh"
#include <unistd.h>
#include <fcntl.h>

namespace { // Anon
using namespace Tether;

TEST_INTEGRITY (constructs_tests);
static void
constructs_tests()
{
  Runtime runtime;
  Runtime::Scope scope (runtime);
  int fds[2];
  TASSERT (pipe (fds) == 0);
  fcntl (fds[0], F_SETFL, O_NONBLOCK);
  runtime.set_output_fd (fds[1]);
  ValueS args { "a", int64 (1), 2.5 };
  TASSERT (runtime.call_function ("echo", args).is_null());
  args = { "!" };
  TASSERT (runtime.call_function ("PRINT", args) == Value (int64 (1)));
  char buffer[64] = { 0, };
  const ssize_t n = read (fds[0], buffer, sizeof (buffer) - 1);
  TCMP (String (buffer, n > 0 ? n : 0), ==, "a12.5!");
  args = {};
  TTHROWS (runtime.call_function ("echo", args), ArgumentCountError);
  // casts
  args = { "12abc" };
  TASSERT (runtime.call_function ("int", args) == Value (int64 (12)));
  args = { "0" };
  TASSERT (runtime.call_function ("bool", args) == Value (false));
  args = { ValueA::record ({ { "x", 1 } }) };
  const Value obj = runtime.call_function ("object", args);
  TCMP (obj.type_name(), ==, "stdClass");
  args = { obj };
  TASSERT (runtime.call_function ("array", args) == ValueA::record ({ { "x", 1 } }));
  args = { int64 (5) };
  TASSERT (runtime.call_function ("array", args) == ValueA ({ 5 }));
  // eval and include
  args = { "anything" };
  TTHROWS (runtime.call_function ("eval", args), Error);
  runtime.set_evaluator ([] (const String &code, const String &origin) { return Value (origin + ":" + code); });
  args = { "x" };
  TASSERT (runtime.call_function ("eval", args) == Value ("eval()'d code:x"));
  StringS warnings;
  Runtime::WarningHandler old = Runtime::set_warning_handler ([&warnings] (const String &m) { warnings.push_back (m); });
  args = { "/nonexistent/tether/script" };
  TASSERT (runtime.call_function ("include", args) == Value (false));
  TCMP (warnings.size(), ==, 1u);
  TTHROWS (runtime.call_function ("require", args), Error);
  Runtime::set_warning_handler (old);
  char tmpname[] = "/tmp/tether-constructs-XXXXXX";
  const int tmpfd = mkstemp (tmpname);
  TASSERT (tmpfd >= 0);
  TASSERT (write (tmpfd, "code", 4) == 4);
  close (tmpfd);
  args = { tmpname };
  TCMP (runtime.call_function ("require_once", args).as_string(), !=, "");
  TASSERT (runtime.call_function ("include_once", args) == Value (true));
  unlink (tmpname);
  // exit
  args = { int64 (3) };
  try {
    runtime.call_function ("die", args);
    TASSERT (!"die() returned");
  } catch (const SessionExit &exit) {
    TCMP (exit.status, ==, 3);
  }
  args = { "bye" };
  TTHROWS (runtime.call_function ("exit", args), SessionExit);
  close (fds[0]);
  close (fds[1]);
}

} // Anon
