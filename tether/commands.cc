// This Source Code Form is licensed MPL-2.0: http://mozilla.org/MPL/2.0
#include "commands.hh"
#include "classes.hh"
#include "binding.hh"
#include "internal.hh"

namespace Tether {

Commands::Commands (Runtime &runtime, const Representer &representer) :
  runtime_ (runtime), representer_ (representer)
{}

/// Run the operation named by `request`.
Value
Commands::execute (const Request &request)
{
  return std::visit ([this] (const auto &r) { return run (r); }, request);
}

// == Reflection records ==
static Value
doc_value (const String &doc)
{
  return doc.empty() ? Value() : Value (doc);
}

static Value
type_record (const String &name, bool is_class, bool nullable)
{
  return_unless (!name.empty(), Value());
  return ValueA::record ({ { "name", name },
                           { "isClass", is_class || Runtime::find_class (name) != nullptr },
                           { "nullable", nullable } });
}

static ValueA
param_records (const ParamInfoS &params)
{
  ValueA list;
  for (const ParamInfo &p : params)
    list.append (ValueA::record ({ { "name", p.name },
                                   { "type", type_record (p.type_label(), p.is_class(), p.nullable) },
                                   { "hasDefault", p.has_default },
                                   { "default", p.fallback },
                                   { "variadic", p.variadic },
                                   { "isOptional", p.has_default || p.variadic } }));
  return list;
}

static Value
return_record (const FunctionInfo &f)
{
  return type_record (f.return_type_label(), f.return_class != nullptr, f.returns_nullable);
}

static ValueA
method_record (const MethodInfo &m)
{
  return ValueA::record ({ { "static", m.is_static },
                           { "doc", doc_value (m.doc) },
                           { "params", param_records (m.params) },
                           { "returnType", return_record (m) },
                           { "owner", m.owner } });
}

/// Add methods of `info` and its ancestors, definitions closer to the class win.
static void
collect_methods (const ClassInfo &info, ValueA &methods)
{
  for (const MethodInfo &m : info.methods)
    if (!methods.has (m.name))
      methods.set (m.name, method_record (m));
  if (const ClassInfo *parent = info.parent_info())
    collect_methods (*parent, methods);
  for (const String &iname : info.interfaces)
    if (const ClassInfo *iface = Runtime::find_class (iname))
      collect_methods (*iface, methods);
}

static void
collect_constants (const ClassInfo &info, ValueA &consts)
{
  for (const ValueEntry &e : info.constants)
    if (!consts.has (e.key))
      consts.set (e.key, *e.value);
  if (const ClassInfo *parent = info.parent_info())
    collect_constants (*parent, consts);
  for (const String &iname : info.interfaces)
    if (const ClassInfo *iface = Runtime::find_class (iname))
      collect_constants (*iface, consts);
}

static void
collect_properties (const ClassInfo &info, ValueA &properties)
{
  for (const PropertyInfo &p : info.properties)
    if (p.visibility == PropertyInfo::PUBLIC && !properties.has (p.name))
      properties.set (p.name, ValueA::record ({ { "doc", doc_value (p.doc) }, { "default", p.fallback } }));
  if (const ClassInfo *parent = info.parent_info())
    collect_properties (*parent, properties);
}

/// Reflection record of a class or interface, members include inherited ones.
ValueA
Commands::class_info (const ClassInfo &info)
{
  ValueA methods, consts, properties;
  if (info.constructor.call)
    methods.set (info.constructor.name, method_record (info.constructor));
  collect_methods (info, methods);
  collect_constants (info, consts);
  collect_properties (info, properties);
  const ClassInfo *parent = info.parent_info();
  return ValueA::record ({ { "name", info.name },
                           { "doc", doc_value (info.doc) },
                           { "consts", consts },
                           { "methods", methods },
                           { "properties", properties },
                           { "interfaces", Convert<StringS>::to_value (info.all_interfaces()) },
                           { "isAbstract", info.is_abstract },
                           { "isInterface", info.is_interface },
                           { "parent", parent ? Value (parent->name) : Value() } });
}

/// Reflection record of a function or language construct.
ValueA
Commands::function_info (const FunctionInfo &info)
{
  return ValueA::record ({ { "name", info.name },
                           { "doc", doc_value (info.doc) },
                           { "params", param_records (info.params) },
                           { "returnType", return_record (info) } });
}

// == Constants and globals ==
Value
Commands::run (const GetConstRequest &r)
{
  return runtime_.constant (r.name);
}

Value
Commands::run (const SetConstRequest &r)
{
  runtime_.define_constant (r.name, r.value);
  return Value();
}

Value
Commands::run (const GetGlobalRequest &r)
{
  return runtime_.global (r.name);
}

Value
Commands::run (const SetGlobalRequest &r)
{
  runtime_.set_global (r.name, r.value);
  return Value();
}

// == Calls ==
Value
Commands::run (const CallFunRequest &r)
{
  ValueS args = r.args;
  return runtime_.call_function (r.name, args);
}

Value
Commands::run (const CreateObjectRequest &r)
{
  ValueS args = r.args;
  return runtime_.create_object (r.name, args);
}

Value
Commands::run (const CallObjRequest &r)
{
  ValueS args = r.args;
  return runtime_.call_callable (r.obj, args);
}

/// Call a method of an object, or a static method if `obj` is a class name.
Value
Commands::run (const CallMethodRequest &r)
{
  ValueS args = r.args;
  if (r.obj.index() == Value::STRING)
    return runtime_.call_static (std::get<String> (r.obj), r.name, args);
  if (r.obj.index() != Value::INSTANCE)
    throw TypeError (string_format ("Call to a member function %s() on %s", r.name, r.obj.type_name()));
  return runtime_.call_method (r.obj.as_instance(), r.name, args);
}

// == Items ==
/// Object implementing ArrayAccess, nullptr for arrays, other values raise Error.
InstanceP
Commands::array_access (const Value &obj) const
{
  if (obj.index() == Value::ARRAY)
    return nullptr;
  if (obj.index() == Value::INSTANCE && Runtime::instance_of (obj.as_instance(), "ArrayAccess"))
    return obj.as_instance();
  throw Error (string_format ("Cannot use a value of type %s as an array", obj.type_name()));
}

Value
Commands::run (const HasItemRequest &r)
{
  if (InstanceP object = array_access (r.obj))
    {
      ValueS args { r.offset };
      return runtime_.call_method (object, "offsetExists", args).as_bool();
    }
  return std::get<ValueA> (r.obj).has (ValueA::key_from (r.offset));
}

Value
Commands::run (const GetItemRequest &r)
{
  if (InstanceP object = array_access (r.obj))
    {
      ValueS args { r.offset };
      return runtime_.call_method (object, "offsetGet", args);
    }
  const ValueKey key = ValueA::key_from (r.offset);
  const Value *v = std::get<ValueA> (r.obj).find (key);
  if (v)
    return *v;
  if (std::holds_alternative<int64> (key))
    Runtime::warning ("Undefined array key " + key_to_string (key));
  else
    Runtime::warning ("Undefined array key \"" + key_to_string (key) + "\"");
  return Value();
}

Value
Commands::run (const SetItemRequest &r)
{
  InstanceP object = array_access (r.obj);
  if (!object)
    throw Error ("Cannot modify array passed by value");
  ValueS args { r.offset, r.value };
  runtime_.call_method (object, "offsetSet", args);
  return Value();
}

Value
Commands::run (const DelItemRequest &r)
{
  InstanceP object = array_access (r.obj);
  if (!object)
    throw Error ("Cannot modify array passed by value");
  ValueS args { r.offset };
  runtime_.call_method (object, "offsetUnset", args);
  return Value();
}

// == Properties ==
InstanceP
Commands::instance_arg (const Value &obj, const char *command) const
{
  InstanceP object = obj.index() == Value::INSTANCE ? obj.as_instance() : nullptr;
  if (!object)
    throw TypeError (string_format ("%s(): Argument #1 ($obj) must be of type object, %s given", command, obj.type_name()));
  return object;
}

Value
Commands::run (const GetPropertyRequest &r)
{
  return runtime_.get_property (instance_arg (r.obj, "getProperty"), r.name);
}

Value
Commands::run (const SetPropertyRequest &r)
{
  runtime_.set_property (instance_arg (r.obj, "setProperty"), r.name, r.value);
  return Value();
}

Value
Commands::run (const UnsetPropertyRequest &r)
{
  runtime_.unset_property (instance_arg (r.obj, "unsetProperty"), r.name);
  return Value();
}

Value
Commands::run (const ListPropertiesRequest &r)
{
  return Convert<StringS>::to_value (runtime_.property_names (instance_arg (r.obj, "listProperties")));
}

Value
Commands::run (const ListNonDefaultPropertiesRequest &r)
{
  return Convert<StringS>::to_value (runtime_.property_names (instance_arg (r.obj, "listNonDefaultProperties"), true));
}

// == Reflection ==
Value
Commands::run (const ClassInfoRequest &r)
{
  const ClassInfo *info = Runtime::find_class (r.name);
  if (!info)
    throw Error (string_format ("Class '%s' does not exist", r.name));
  return class_info (*info);
}

Value
Commands::run (const FuncInfoRequest &r)
{
  const FunctionInfo *info = Runtime::find_function (r.name);
  if (!info)
    info = Runtime::find_construct (r.name);
  if (!info)
    throw Error (string_format ("Function %s() does not exist", r.name));
  return function_info (*info);
}

Value
Commands::run (const ListConstsRequest&)
{
  return Convert<StringS>::to_value (runtime_.constant_names());
}

Value
Commands::run (const ListGlobalsRequest&)
{
  return Convert<StringS>::to_value (runtime_.global_names());
}

/// Language constructs first, then functions.
Value
Commands::run (const ListFunsRequest&)
{
  StringS names = Runtime::construct_names();
  for (const String &name : Runtime::function_names())
    names.push_back (name);
  return Convert<StringS>::to_value (names);
}

Value
Commands::run (const ListClassesRequest&)
{
  return Convert<StringS>::to_value (Runtime::class_names());
}

/// Classify `name` as constant, function, class, global or nothing, in that order.
Value
Commands::run (const ResolveNameRequest &r)
{
  if (runtime_.has_constant (r.name))
    return ValueA { "const", runtime_.constant (r.name) };
  const FunctionInfo *f = Runtime::find_function (r.name);
  if (!f)
    f = Runtime::find_construct (r.name);
  if (f)
    return ValueA { "func", f->name };
  if (const ClassInfo *c = Runtime::find_class (r.name))
    return ValueA { "class", c->name };
  if (runtime_.has_global (r.name))
    return ValueA { "global", runtime_.global (r.name) };
  return ValueA { "none", Value() };
}

// == Conversions ==
Value
Commands::run (const ReprRequest &r)
{
  return representer_.repr (r.value);
}

Value
Commands::run (const StrRequest &r)
{
  return runtime_.to_string (r.value);
}

Value
Commands::run (const CountRequest &r)
{
  return runtime_.count (r.value);
}

// == Iteration ==
Value
Commands::run (const StartIterationRequest &r)
{
  return InstanceP (Generator::from_value (r.value));
}

/// Advance a cursor by one step, yields `[hasMore, key, value]`.
Value
Commands::run (const NextIterationRequest &r)
{
  GeneratorP cursor = r.cursor.index() == Value::INSTANCE ? std::dynamic_pointer_cast<Generator> (r.cursor.as_instance()) : nullptr;
  if (!cursor)
    throw TypeError (string_format ("nextIteration(): Argument #1 ($cursor) must be of type Generator, %s given", r.cursor.type_name()));
  return cursor->advance_triple();
}

} // Tether

#include "testing.hh"

namespace { // Anon
using namespace Tether;

TEST_INTEGRITY (commands_tests);
static void
commands_tests()
{
  Runtime runtime;
  Runtime::Scope scope (runtime);
  Representer representer;
  Commands commands (runtime, representer);
  StringS warnings;
  Runtime::WarningHandler old = Runtime::set_warning_handler ([&warnings] (const String &m) { warnings.push_back (m); });
  // constants and globals
  TCMP (commands.execute (GetConstRequest { "INT_SIZE" }).as_int(), ==, 8);
  TTHROWS (commands.execute (GetConstRequest { "NO_SUCH_CONST" }), Error);
  TASSERT (commands.execute (SetConstRequest { "ANSWER", 42 }).is_null());
  TCMP (commands.execute (GetConstRequest { "ANSWER" }).as_int(), ==, 42);
  commands.execute (SetConstRequest { "ANSWER", 43 });
  TCMP (warnings.size(), ==, 1u);
  TCMP (commands.execute (GetConstRequest { "ANSWER" }).as_int(), ==, 42);
  TTHROWS (commands.execute (SetConstRequest { "OBJ", StdClass::create() }), TypeError);
  commands.execute (SetGlobalRequest { "x", "y" });
  TCMP (commands.execute (GetGlobalRequest { "x" }).as_string(), ==, "y");
  TASSERT (commands.execute (GetGlobalRequest { "GLOBALS" }) == ValueA::record ({ { "x", "y" } }));
  TTHROWS (commands.execute (SetGlobalRequest { "GLOBALS", 1 }), Error);
  TTHROWS (commands.execute (GetGlobalRequest { "nope" }), Error);
  // calls
  TCMP (commands.execute (CallFunRequest { "\\STRTOUPPER", { "abc" } }).as_string(), ==, "ABC");
  TCMP (commands.execute (CallFunRequest { "int", { "17" } }).as_int(), ==, 17);
  TTHROWS (commands.execute (CallFunRequest { "no_such_function", {} }), Error);
  const Value ao = commands.execute (CreateObjectRequest { "ArrayObject", { ValueA { 1, 2 } } });
  TCMP (ao.as_instance()->class_name(), ==, "ArrayObject");
  TTHROWS (commands.execute (CreateObjectRequest { "Countable", {} }), Error);
  TTHROWS (commands.execute (CreateObjectRequest { "NoSuchClass", {} }), Error);
  TCMP (commands.execute (CallMethodRequest { ao, "count", {} }).as_int(), ==, 2);
  TTHROWS (commands.execute (CallMethodRequest { int64 (5), "count", {} }), TypeError);
  const Value closure = commands.execute (CallMethodRequest { "Closure", "fromCallable", { "strlen" } });
  TCMP (commands.execute (CallObjRequest { closure, { "four" } }).as_int(), ==, 4);
  TCMP (commands.execute (CallObjRequest { "strlen", { "abc" } }).as_int(), ==, 3);
  TCMP (commands.execute (CallObjRequest { ValueA { ao, "count" }, {} }).as_int(), ==, 2);
  // items
  TASSERT (commands.execute (HasItemRequest { ao, 1 }).as_bool());
  TASSERT (!commands.execute (HasItemRequest { ValueA { 1 }, 1 }).as_bool());
  TCMP (commands.execute (GetItemRequest { ValueA { 7 }, "0" }).as_int(), ==, 7);
  commands.execute (SetItemRequest { ao, "k", "v" });
  TCMP (commands.execute (GetItemRequest { ao, "k" }).as_string(), ==, "v");
  commands.execute (DelItemRequest { ao, "k" });
  TASSERT (!commands.execute (HasItemRequest { ao, "k" }).as_bool());
  TTHROWS (commands.execute (SetItemRequest { ValueA { 1 }, 0, 2 }), Error);
  TTHROWS (commands.execute (GetItemRequest { "abc", 0 }), Error);
  warnings.clear();
  TASSERT (commands.execute (GetItemRequest { ValueA(), "missing" }).is_null());
  TCMP (warnings.size(), ==, 1u);
  TCMP (warnings[0], ==, "Undefined array key \"missing\"");
  // properties
  const Value obj = commands.execute (CreateObjectRequest { "stdClass", {} });
  commands.execute (SetPropertyRequest { obj, "a", 1 });
  TCMP (commands.execute (GetPropertyRequest { obj, "a" }).as_int(), ==, 1);
  TASSERT (commands.execute (ListPropertiesRequest { obj }) == ValueA { "a" });
  TASSERT (commands.execute (ListNonDefaultPropertiesRequest { obj }) == ValueA { "a" });
  commands.execute (UnsetPropertyRequest { obj, "a" });
  TTHROWS (commands.execute (GetPropertyRequest { obj, "a" }), AttributeError);
  TTHROWS (commands.execute (UnsetPropertyRequest { obj, "a" }), AttributeError);
  TTHROWS (commands.execute (GetPropertyRequest { ValueA(), "a" }), TypeError);
  // reflection
  const ValueA info = commands.execute (ClassInfoRequest { "\\arrayobject" }).as_array();
  TCMP (info.get ("name").as_string(), ==, "ArrayObject");
  TASSERT (info.get ("parent").is_null());
  TASSERT (!info.get ("isInterface").as_bool());
  const ValueA &methods = info.get ("methods").as_array();
  TASSERT (methods.has ("__construct") && methods.has ("offsetGet") && methods.has ("getIterator"));
  const ValueA &ctor = methods.get ("__construct").as_array();
  TASSERT (ctor.get ("returnType").is_null());
  const ValueA &param = ctor.get ("params").as_array().at (0).as_array();
  TCMP (param.get ("name").as_string(), ==, "array");
  TASSERT (param.get ("hasDefault").as_bool() && param.get ("isOptional").as_bool() && !param.get ("variadic").as_bool());
  TASSERT (param.get ("type").as_array().get ("name") == Value ("array"));
  StringS interfaces;
  for (const ValueEntry &e : info.get ("interfaces").as_array())
    interfaces.push_back (e.value->as_string());
  TASSERT (string_join (",", interfaces).find ("Traversable") != String::npos);
  const ValueA iinfo = commands.execute (ClassInfoRequest { "Iterator" }).as_array();
  TASSERT (iinfo.get ("isInterface").as_bool() && iinfo.get ("isAbstract").as_bool());
  TTHROWS (commands.execute (ClassInfoRequest { "NoSuchClass" }), Error);
  const ValueA finfo = commands.execute (FuncInfoRequest { "implode" }).as_array();
  TCMP (finfo.get ("name").as_string(), ==, "implode");
  TCMP (finfo.get ("params").count(), ==, 2u);
  TASSERT (commands.execute (FuncInfoRequest { "echo" }).as_array().get ("params").count() >= 1);
  TTHROWS (commands.execute (FuncInfoRequest { "no_such_function" }), Error);
  // listings
  const ValueA funs = commands.execute (ListFunsRequest()).as_array();
  TCMP (funs.at (0).as_string(), ==, Runtime::construct_names()[0]);
  TCMP (funs.size(), ==, Runtime::construct_names().size() + Runtime::function_names().size());
  TCMP (commands.execute (ListGlobalsRequest()).as_array().at (0).as_string(), ==, "GLOBALS");
  TASSERT (commands.execute (ListConstsRequest()).count() > 10);
  TASSERT (commands.execute (ListClassesRequest()).count() >= 5);
  // resolveName precedence
  TASSERT (commands.execute (ResolveNameRequest { "ANSWER" }) == ValueA ({ "const", 42 }));
  TASSERT (commands.execute (ResolveNameRequest { "Count" }) == ValueA ({ "func", "count" }));
  TASSERT (commands.execute (ResolveNameRequest { "echo" }) == ValueA ({ "func", "echo" }));
  TASSERT (commands.execute (ResolveNameRequest { "countable" }) == ValueA ({ "class", "Countable" }));
  TASSERT (commands.execute (ResolveNameRequest { "x" }) == ValueA ({ "global", "y" }));
  TASSERT (commands.execute (ResolveNameRequest { "unknown_name" }) == ValueA ({ "none", Value() }));
  // conversions
  TCMP (commands.execute (ReprRequest { ValueA { 1, "a" } }).as_string(), ==, "[1, 'a']");
  TCMP (commands.execute (StrRequest { 2.5 }).as_string(), ==, "2.5");
  TCMP (commands.execute (CountRequest { ValueA { 1, 2, 3 } }).as_int(), ==, 3);
  TTHROWS (commands.execute (CountRequest { int64 (3) }), TypeError);
  // iteration
  const Value cursor = commands.execute (StartIterationRequest { ValueA::record ({ { "a", 1 } }) });
  TASSERT (commands.execute (NextIterationRequest { cursor }) == ValueA ({ true, "a", 1 }));
  TASSERT (commands.execute (NextIterationRequest { cursor }) == ValueA ({ false, Value(), Value() }));
  TASSERT (commands.execute (NextIterationRequest { cursor }) == ValueA ({ false, Value(), Value() }));
  TTHROWS (commands.execute (StartIterationRequest { int64 (1) }), TypeError);
  TTHROWS (commands.execute (NextIterationRequest { obj }), TypeError);
  Runtime::set_warning_handler (old);
}

} // Anon
