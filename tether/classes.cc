// This Source Code Form is licensed MPL-2.0: http://mozilla.org/MPL/2.0
#include "classes.hh"
#include "binding.hh"
#include "representer.hh"
#include "internal.hh"

namespace Tether {

// == Interface ==
static ClassInfo
interface_info (const String &name, const String &doc)
{
  ClassInfo c;
  c.name = name;
  c.doc = doc;
  c.is_interface = true;
  c.is_abstract = true;
  return c;
}

Interface::Interface (const String &name, const String &doc) :
  info_ (Runtime::register_class (interface_info (name, doc)))
{}

Interface&
Interface::extends (const String &interface)
{
  info_.interfaces.push_back (Runtime::canonical_name (interface));
  return *this;
}

/// Declare an abstract method with untyped parameters.
Interface&
Interface::method (const String &name, const String &return_type, const String &doc, const StringS &params)
{
  MethodInfo m;
  m.name = name;
  m.doc = doc;
  m.owner = info_.name;
  m.return_type = return_type;
  m.is_abstract = true;
  for (const String &pname : params)
    {
      ParamInfo p;
      p.name = pname;
      m.params.push_back (p);
    }
  info_.methods.push_back (m);
  return *this;
}

// == ArrayStorage ==
static String
undefined_key_message (const ValueKey &key)
{
  if (std::holds_alternative<int64> (key))
    return "Undefined array key " + key_to_string (key);
  return "Undefined array key \"" + key_to_string (key) + "\"";
}

bool
ArrayStorage::offsetExists (const Value &offset)
{
  return storage_.has (ValueA::key_from (offset));
}

Value
ArrayStorage::offsetGet (const Value &offset)
{
  const ValueKey key = ValueA::key_from (offset);
  const Value *v = storage_.find (key);
  if (!v)
    {
      Runtime::warning (undefined_key_message (key));
      return Value();
    }
  return *v;
}

/// Store `value` under `offset`, a null offset appends.
void
ArrayStorage::offsetSet (const Value &offset, const Value &value)
{
  if (offset.is_null())
    storage_.append (value);
  else
    storage_.set (ValueA::key_from (offset), value);
}

void
ArrayStorage::offsetUnset (const Value &offset)
{
  storage_.erase (ValueA::key_from (offset));
}

int64
ArrayStorage::count ()
{
  return storage_.size();
}

ValueA
ArrayStorage::getArrayCopy ()
{
  return storage_;
}

String
ArrayStorage::represent (const Representer &representer, int depth) const
{
  return representer.class_name (class_name()) + "(" + representer.repr (storage_, depth + 1) + ")";
}

// == ArrayObject ==
void
ArrayObject::append (const Value &value)
{
  storage_.append (value);
}

ArrayIteratorP
ArrayObject::getIterator ()
{
  return std::make_shared<ArrayIterator> (storage_);
}

// == ArrayIterator ==
Value
ArrayIterator::current ()
{
  return_unless (position_ < storage_.size(), Value());
  return storage_.at (position_);
}

Value
ArrayIterator::key ()
{
  return_unless (position_ < storage_.size(), Value());
  return key_to_value ((storage_.begin() + position_)->key);
}

void
ArrayIterator::next ()
{
  if (position_ < storage_.size())
    position_++;
}

void
ArrayIterator::rewind ()
{
  position_ = 0;
}

bool
ArrayIterator::valid ()
{
  return position_ < storage_.size();
}

// == ClosureObject ==
Value
ClosureObject::__invoke (const ValueS &args)
{
  ValueS callargs = args;
  return Runtime::current().call_callable (callable_, callargs);
}

/// Wrap `callable` into a Closure, closures are returned as is.
ClosureObjectP
ClosureObject::fromCallable (const Value &callable)
{
  if (ClosureObjectP closure = std::dynamic_pointer_cast<ClosureObject> (callable.as_instance()))
    return closure;
  if (!Runtime::current().is_callable (callable))
    throw TypeError (string_format ("Failed to create closure from callable: %s is not callable", callable.type_name()));
  return std::make_shared<ClosureObject> (callable);
}

// == Registration ==
template<class T> static void
array_access_methods (Class<T> &c)
{
  c.method ("offsetExists", &ArrayStorage::offsetExists, "Whether the offset exists", { "key" })
   .method ("offsetGet", &ArrayStorage::offsetGet, "Value at the offset", { "key" })
   .method ("offsetSet", &ArrayStorage::offsetSet, "Assign a value to the offset", { "key", "value" })
   .method ("offsetUnset", &ArrayStorage::offsetUnset, "Remove the offset", { "key" })
   .method ("count", &ArrayStorage::count, "Number of elements", {})
   .method ("getArrayCopy", &ArrayStorage::getArrayCopy, "Copy of the elements as array", {});
}

void
register_builtin_classes ()
{
  Interface ("Traversable", "Marks classes that can be iterated over");
  Interface ("Iterator", "Iterator that can be advanced step by step")
    .extends ("Traversable")
    .method ("current", "mixed", "Current element")
    .method ("key", "mixed", "Key of the current element")
    .method ("next", "void", "Move forward to the next element")
    .method ("rewind", "void", "Rewind to the first element")
    .method ("valid", "bool", "Whether the current position is valid");
  Interface ("IteratorAggregate", "Object that provides an external iterator")
    .extends ("Traversable")
    .method ("getIterator", "Traversable", "Retrieve an external iterator");
  Interface ("ArrayAccess", "Objects that can be accessed like arrays")
    .method ("offsetExists", "bool", "Whether an offset exists", { "offset" })
    .method ("offsetGet", "mixed", "Offset to retrieve", { "offset" })
    .method ("offsetSet", "void", "Assign a value to the specified offset", { "offset", "value" })
    .method ("offsetUnset", "void", "Unset an offset", { "offset" });
  Interface ("Countable", "Objects that can be used with count()")
    .method ("count", "int", "Count elements of an object");
  Interface ("Stringable", "Objects with a string representation")
    .method ("__toString", "string", "String representation of the object");

  Class<StdClass> ("stdClass", "Generic empty class with dynamic properties");

  Class<ArrayObject> array_object ("ArrayObject", "Allows objects to work as arrays");
  array_object
    .implements ("IteratorAggregate")
    .implements ("ArrayAccess")
    .implements ("Countable")
    .constructor<ValueA> ("Construct a new array object", { { "array", ValueA() } })
    .method ("append", &ArrayObject::append, "Append a value", { "value" })
    .method ("getIterator", &ArrayObject::getIterator, "Create a new iterator from an ArrayObject instance", {});
  array_access_methods (array_object);

  Class<ArrayIterator> array_iterator ("ArrayIterator", "Iterate over arrays and objects");
  array_iterator
    .implements ("Iterator")
    .implements ("ArrayAccess")
    .implements ("Countable")
    .constructor<ValueA> ("Construct an ArrayIterator", { { "array", ValueA() } })
    .method ("current", &ArrayIterator::current, "Return current array entry", {})
    .method ("key", &ArrayIterator::key, "Return current array key", {})
    .method ("next", &ArrayIterator::next, "Move to next entry", {})
    .method ("rewind", &ArrayIterator::rewind, "Rewind array back to the start", {})
    .method ("valid", &ArrayIterator::valid, "Check whether array contains more entries", {});
  array_access_methods (array_iterator);

  Class<Generator> ("Generator", "Suspended iteration, produced by startIteration and xrange()")
    .final()
    .implements ("Iterator")
    .method ("current", &Generator::current, "Get the yielded value", {})
    .method ("key", &Generator::key, "Get the yielded key", {})
    .method ("next", &Generator::next, "Resume execution of the generator", {})
    .method ("rewind", &Generator::rewind, "Execute up to the first yield, fails once the generator moved on", {})
    .method ("valid", &Generator::valid, "Check if the generator is not exhausted", {});

  Class<ClosureObject> ("Closure", "Class used to represent anonymous functions")
    .final()
    .method ("__invoke", &ClosureObject::__invoke, "Call the wrapped callable", { "args" })
    .method ("fromCallable", &ClosureObject::fromCallable, "Convert a callable into a closure", { "callback" });
}

} // Tether

#include "testing.hh"

namespace { // Anon
using namespace Tether;

TEST_INTEGRITY (classes_tests);
static void
classes_tests()
{
  Runtime runtime;
  Runtime::Scope scope (runtime);
  StringS warnings;
  Runtime::WarningHandler old = Runtime::set_warning_handler ([&warnings] (const String &m) { warnings.push_back (m); });
  // interfaces
  const ClassInfo *iterator = Runtime::find_class ("\\iterator");
  TASSERT (iterator && iterator->is_interface && iterator->find_method ("valid"));
  TASSERT (iterator->is_a ("Traversable"));
  ValueS args;
  TTHROWS (runtime.create_object ("Countable", args), Error);
  // ArrayObject
  args = { ValueA::record ({ { "a", 1 }, { "b", 2 } }) };
  InstanceP ao = runtime.create_object ("ArrayObject", args);
  TCMP (ao->class_name(), ==, "ArrayObject");
  TASSERT (Runtime::instance_of (ao, "Traversable") && Runtime::instance_of (ao, "countable"));
  TCMP (runtime.count (ao), ==, 2);
  args = { "a" };
  TCMP (runtime.call_method (ao, "offsetGet", args).as_int(), ==, 1);
  args = { Value(), "c" };
  runtime.call_method (ao, "offsetSet", args);
  args = { "zz" };
  TASSERT (runtime.call_method (ao, "offsetGet", args).is_null());
  TCMP (warnings.size(), ==, 1u);
  TCMP (warnings[0], ==, "Undefined array key \"zz\"");
  args = {};
  TASSERT (runtime.call_method (ao, "getArrayCopy", args) == ValueA::record ({ { "a", 1 }, { "b", 2 }, { "0", "c" } }));
  // iteration through IteratorAggregate and Iterator
  GeneratorP g = Generator::from_value (ao);
  TASSERT (g->advance_triple() == ValueA ({ true, "a", 1 }));
  TASSERT (g->advance_triple() == ValueA ({ true, "b", 2 }));
  TASSERT (g->advance_triple() == ValueA ({ true, 0, "c" }));
  TASSERT (g->advance_triple() == ValueA ({ false, Value(), Value() }));
  TCMP (g->class_name(), ==, "Generator");
  TASSERT (Runtime::instance_of (g, "Iterator"));
  // wrong argument types
  args = { int64 (5) };
  TTHROWS (runtime.create_object ("ArrayObject", args), TypeError);
  // representation
  Representer r;
  TCMP (r.repr (ao), ==, "ArrayObject({'a': 1, 'b': 2, 0: 'c'})");
  TCMP (r.repr (ao, 1), ==, "ArrayObject({...: (3)})");
  // closures
  const ClassInfo *closure = Runtime::find_class ("Closure");
  TASSERT (closure && closure->is_final && !closure->constructor.call);
  args = { ValueA { ao, "count" } };
  Value c = runtime.call_static ("Closure", "fromCallable", args);
  TCMP (c.type_name(), ==, "Closure");
  args = {};
  TCMP (runtime.call_callable (c, args).as_int(), ==, 3);
  args = { int64 (7) };
  TTHROWS (runtime.call_static ("Closure", "fromCallable", args), TypeError);
  Runtime::set_warning_handler (old);
}

} // Anon
