// This Source Code Form is licensed MPL-2.0: http://mozilla.org/MPL/2.0
#include "generator.hh"
#include "utils.hh"
#include "internal.hh"

namespace Tether {

Generator::Generator (const Step &step) :
  step_ (step)
{}

void
Generator::pull ()
{
  return_unless (!finished_);
  Value k, v;
  bool more = false;
  try {
    more = step_ && step_ (k, v);
  } catch (...) {
    finished_ = true;   // a failing step ends the iteration, the error propagates
    key_ = value_ = Value();
    step_ = nullptr;
    throw;
  }
  if (more)
    {
      key_ = k;
      value_ = v;
    }
  else
    {
      finished_ = true;
      key_ = value_ = Value();
      step_ = nullptr;
    }
}

/// Run up to the first element on first use.
void
Generator::ensure_started ()
{
  return_unless (!started_);
  started_ = true;
  pull();
}

Value
Generator::current ()
{
  ensure_started();
  return value_;
}

Value
Generator::key ()
{
  ensure_started();
  return key_;
}

void
Generator::next ()
{
  ensure_started();
  moved_ = true;
  pull();
}

bool
Generator::valid ()
{
  ensure_started();
  return !finished_;
}

void
Generator::rewind ()
{
  if (moved_)
    throw Exception ("Cannot rewind a generator that was already run");
  ensure_started();
}

/// Yield [valid, key, current] and move on, exhausted generators constantly yield [false, null, null].
ValueA
Generator::advance_triple ()
{
  const bool more = valid();
  ValueA triple { more, key_, value_ };
  if (more)
    next();
  return triple;
}

/// Iterate over a snapshot of `array`.
GeneratorP
Generator::from_array (const ValueA &array)
{
  auto position = std::make_shared<size_t> (0);
  auto snapshot = std::make_shared<ValueA> (array);
  return std::make_shared<Generator> ([position, snapshot] (Value &key, Value &value) {
    return_unless (*position < snapshot->size(), false);
    auto it = snapshot->begin() + *position;
    *position += 1;
    key = key_to_value (it->key);
    value = *it->value;
    return true;
  });
}

/// Lazily count from `start` to `end` (inclusive) in increments of `step`.
GeneratorP
Generator::from_range (int64 start, int64 end, int64 step)
{
  if (step == 0)
    throw ValueError ("xrange(): Argument #3 ($step) cannot be 0");
  if (step < 0)
    step = -step;
  const int64 direction = start <= end ? +1 : -1;
  auto counter = std::make_shared<int64> (0);
  auto current = std::make_shared<int64> (start);
  auto done = std::make_shared<bool> (false);
  return std::make_shared<Generator> ([=] (Value &key, Value &value) {
    return_unless (!*done, false);
    if ((direction > 0 && *current > end) || (direction < 0 && *current < end))
      return false;
    key = *counter;
    value = *current;
    *counter += 1;
    const int64 remaining = direction > 0 ? end - *current : *current - end;
    if (remaining < step)
      *done = true;     // avoids overflowing *current near the int64 limits
    else
      *current += direction * step;
    return true;
  });
}

/// Wrap Iterator objects, IteratorAggregate objects, plain objects and arrays into a Generator.
GeneratorP
Generator::from_value (const Value &iterable)
{
  if (iterable.index() == Value::ARRAY)
    return from_array (std::get<ValueA> (iterable));
  if (iterable.index() != Value::INSTANCE || !iterable.as_instance())
    throw TypeError (string_format ("Value of type %s is not iterable", iterable.type_name()));
  InstanceP object = iterable.as_instance();
  Runtime &runtime = Runtime::current();
  if (Runtime::instance_of (object, "IteratorAggregate"))
    {
      ValueS noargs;
      const Value inner = runtime.call_method (object, "getIterator", noargs);
      if (inner.index() != Value::INSTANCE || !Runtime::instance_of (inner.as_instance(), "Traversable"))
        throw TypeError (string_format ("%s::getIterator(): Return value must be of type Traversable, %s returned",
                                        object->class_name(), inner.type_name()));
      return from_value (inner);
    }
  if (Runtime::instance_of (object, "Iterator"))
    {
      auto first = std::make_shared<bool> (true);
      return std::make_shared<Generator> ([object, first] (Value &key, Value &value) {
        Runtime &rt = Runtime::current();
        ValueS noargs;
        if (*first)
          {
            *first = false;
            rt.call_method (object, "rewind", noargs);
          }
        else
          rt.call_method (object, "next", noargs);
        if (!rt.call_method (object, "valid", noargs).as_bool())
          return false;
        value = rt.call_method (object, "current", noargs);
        key = rt.call_method (object, "key", noargs);
        return true;
      });
    }
  ValueA properties;
  for (const String &name : runtime.property_names (object))
    properties.set (name, object->props().get (name));
  return from_array (properties);
}

} // Tether

#include "testing.hh"

namespace { // Anon
using namespace Tether;

TEST_INTEGRITY (generator_tests);
static void
generator_tests()
{
  GeneratorP g = Generator::from_array (ValueA { "a", "b" });
  TASSERT (g->advance_triple() == ValueA ({ true, 0, "a" }));
  TASSERT (g->advance_triple() == ValueA ({ true, 1, "b" }));
  for (int i = 0; i < 3; i++)
    TASSERT (g->advance_triple() == ValueA ({ false, Value(), Value() }));
  g = Generator::from_range (1, 7, 3);
  TCMP (g->current().as_int(), ==, 1);
  g->next();
  TCMP (g->current().as_int(), ==, 4);
  TTHROWS (g->rewind(), Exception);
  g->next();
  TCMP (g->key().as_int(), ==, 2);
  g->next();
  TASSERT (!g->valid() && g->current().is_null());
  g = Generator::from_range (3, 1, 1);
  int64 sum = 0;
  while (g->valid())
    {
      sum = sum * 10 + g->current().as_int();
      g->next();
    }
  TCMP (sum, ==, 321);
  g = Generator::from_range (I63MAX - 1, I63MAX, 5);
  TASSERT (g->advance_triple() == ValueA ({ true, 0, I63MAX - 1 }));
  TASSERT (!g->valid());
  TTHROWS (Generator::from_value (int64 (5)), TypeError);
}

} // Anon
