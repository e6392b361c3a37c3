// This Source Code Form is licensed MPL-2.0: http://mozilla.org/MPL/2.0
#include "runtime.hh"
#include "binding.hh"
#include "utils.hh"
#include "internal.hh"
#include <unordered_map>
#include <fstream>
#include <sstream>
#include <climits>
#include <cstdlib>
#include <cstring>
#include <cerrno>
#include <unistd.h>

namespace Tether {

/// Check if `string` is numeric, `integral` is set if it has no fraction or exponent.
bool
numeric_string (const String &string, double *number, bool *integral)
{
  const String s = string_strip (string);
  return_unless (!s.empty(), false);
  double d = 0;
  if (!string_to_double (s, &d) || s.find_first_of ("xXnNiI") != String::npos)
    return false;       // rejects hex, nan and inf spellings
  if (number)
    *number = d;
  if (integral)
    {
      int64 i = 0;
      *integral = string_to_int (s, &i);
    }
  return true;
}

// == Registry ==
namespace {
struct Registry {
  std::map<String, ClassInfoP>                         classes;
  StringS                                              class_order;
  std::unordered_map<std::type_index, const ClassInfo*> types;
  std::map<String, FunctionInfoP>                      functions;
  StringS                                              function_order;
  std::map<String, FunctionInfoP>                      constructs;
  StringS                                              construct_order;
};

Registry&
registry()
{
  static Registry registry_;
  return registry_;
}

String
lookup_key (const String &name)
{
  return string_tolower (Runtime::canonical_name (name));
}

bool
names_equal (const String &a, const String &b)
{
  return lookup_key (a) == lookup_key (b);
}
} // Anon

// == ParamInfo ==
/// Type name for reflection, object parameters resolve to their registered class.
String
ParamInfo::type_label () const
{
  if (class_type)
    {
      const ClassInfo *info = Runtime::class_of (*class_type);
      return info ? info->name : "object";
    }
  return type;
}

bool
ParamInfo::is_class () const
{
  return class_type != nullptr;
}

// == FunctionInfo ==
/// Number of leading parameters without default.
size_t
FunctionInfo::required_args () const
{
  size_t n = 0;
  for (size_t i = 0; i < params.size(); i++)
    if (!params[i].has_default && !params[i].variadic)
      n = i + 1;
  return n;
}

String
FunctionInfo::return_type_label () const
{
  if (return_class)
    {
      const ClassInfo *info = Runtime::class_of (*return_class);
      return info ? info->name : "object";
    }
  return return_type;
}

/// Check arity, complete `args` with parameter defaults and call the implementation.
Value
FunctionInfo::invoke (Instance *self, ValueS &args, const String &qualified_name) const
{
  const size_t required = required_args();
  const bool variadic = !params.empty() && params.back().variadic;
  if (args.size() < required)
    throw ArgumentCountError (string_format ("Too few arguments to function %s(), %d passed and %s %d expected",
                                             qualified_name, int (args.size()),
                                             required == params.size() ? "exactly" : "at least", int (required)));
  if (!variadic && args.size() > params.size())
    throw ArgumentCountError (string_format ("%s() expects %s %d argument%s, %d given", qualified_name,
                                             required == params.size() ? "exactly" : "at most", int (params.size()),
                                             params.size() == 1 ? "" : "s", int (args.size())));
  for (size_t i = args.size(); i < params.size() && !params[i].variadic; i++)
    args.push_back (params[i].fallback);
  if (!call)
    throw Error (string_format ("Cannot call abstract method %s()", qualified_name));
  return call (self, args);
}

// == ClassInfo ==
const MethodInfo*
ClassInfo::find_method (const String &method) const
{
  for (const MethodInfo &m : methods)
    if (names_equal (m.name, method))
      return &m;
  if (const ClassInfo *p = parent_info())
    if (const MethodInfo *m = p->find_method (method))
      return m;
  for (const String &iface : interfaces)
    if (const ClassInfo *i = Runtime::find_class (iface))
      if (const MethodInfo *m = i->find_method (method))
        return m;
  return nullptr;
}

const PropertyInfo*
ClassInfo::find_property (const String &property) const
{
  for (const PropertyInfo &p : properties)
    if (p.name == property)
      return &p;
  const ClassInfo *p = parent_info();
  return p ? p->find_property (property) : nullptr;
}

const ClassInfo*
ClassInfo::parent_info () const
{
  return parent.empty() ? nullptr : Runtime::find_class (parent);
}

/// Interfaces implemented directly, inherited from the parent or extended by other interfaces.
StringS
ClassInfo::all_interfaces () const
{
  StringS result;
  auto add = [&result] (const String &name) {
    for (const String &r : result)
      if (names_equal (r, name))
        return false;
    result.push_back (name);
    return true;
  };
  std::function<void (const ClassInfo*)> collect = [&] (const ClassInfo *info) {
    for (const String &iname : info->interfaces)
      {
        const ClassInfo *iinfo = Runtime::find_class (iname);
        if (add (iinfo ? iinfo->name : iname) && iinfo)
          collect (iinfo);
      }
    if (const ClassInfo *p = info->parent_info())
      collect (p);
  };
  collect (this);
  return result;
}

/// Check if this class is, extends or implements `classname`.
bool
ClassInfo::is_a (const String &classname) const
{
  for (const ClassInfo *info = this; info; info = info->parent_info())
    if (names_equal (info->name, classname))
      return true;
  for (const String &iname : all_interfaces())
    if (names_equal (iname, classname))
      return true;
  return false;
}

// == Runtime::Scope ==
static thread_local Runtime::Scope *current_scope = nullptr;

Runtime::Scope::Scope (Runtime &runtime) :
  prev_ (current_scope), runtime_ (runtime)
{
  current_scope = this;
}

Runtime::Scope::~Scope ()
{
  current_scope = prev_;
}

/// The Runtime of the innermost Scope, builtins use it to reach session state.
Runtime&
Runtime::current ()
{
  if (!current_scope)
    throw std::logic_error ("Tether::Runtime::current(): invalid Scope: nullptr");
  return current_scope->runtime_;
}

// == Runtime ==
Runtime::Runtime ()
{
  static const bool builtins_registered = [] () {
    register_builtin_classes();
    register_builtin_functions();
    register_builtin_streams();
    register_builtin_constructs();
    return true;
  } ();
  (void) builtins_registered;
  define_builtin_constants (*this);
}

Runtime::~Runtime ()
{}

/// Strip a leading namespace separator from `name`.
String
Runtime::canonical_name (const String &name)
{
  return !name.empty() && name[0] == '\\' ? name.substr (1) : name;
}

/// Add a class to the process-wide table, `type` maps C++ instances to it.
ClassInfo&
Runtime::register_class (const ClassInfo &info, const std::type_info *type)
{
  Registry &r = registry();
  const String key = lookup_key (info.name);
  if (key.empty() || r.classes.count (key))
    throw std::runtime_error ("duplicate class registration: " + info.name);
  ClassInfoP cinfo = std::make_shared<ClassInfo> (info);
  cinfo->name = canonical_name (info.name);
  r.classes[key] = cinfo;
  r.class_order.push_back (cinfo->name);
  if (type)
    r.types[std::type_index (*type)] = cinfo.get();
  debug ("runtime", "registered class: %s", cinfo->name);
  return *cinfo;
}

const ClassInfo*
Runtime::find_class (const String &name)
{
  Registry &r = registry();
  auto it = r.classes.find (lookup_key (name));
  return it == r.classes.end() ? nullptr : it->second.get();
}

const ClassInfo*
Runtime::class_of (const std::type_info &type)
{
  Registry &r = registry();
  auto it = r.types.find (std::type_index (type));
  return it == r.types.end() ? nullptr : it->second;
}

FunctionInfo&
Runtime::register_function (const FunctionInfo &info)
{
  Registry &r = registry();
  const String key = lookup_key (info.name);
  if (key.empty() || r.functions.count (key))
    throw std::runtime_error ("duplicate function registration: " + info.name);
  FunctionInfoP finfo = std::make_shared<FunctionInfo> (info);
  r.functions[key] = finfo;
  r.function_order.push_back (finfo->name);
  return *finfo;
}

const FunctionInfo*
Runtime::find_function (const String &name)
{
  Registry &r = registry();
  auto it = r.functions.find (lookup_key (name));
  return it == r.functions.end() ? nullptr : it->second.get();
}

/// Register a language construct that is callable by name like a function.
FunctionInfo&
Runtime::register_construct (const FunctionInfo &info)
{
  Registry &r = registry();
  const String key = lookup_key (info.name);
  if (key.empty() || r.constructs.count (key))
    throw std::runtime_error ("duplicate construct registration: " + info.name);
  FunctionInfoP finfo = std::make_shared<FunctionInfo> (info);
  r.constructs[key] = finfo;
  r.construct_order.push_back (finfo->name);
  return *finfo;
}

const FunctionInfo*
Runtime::find_construct (const String &name)
{
  Registry &r = registry();
  auto it = r.constructs.find (lookup_key (name));
  return it == r.constructs.end() ? nullptr : it->second.get();
}

StringS
Runtime::class_names ()
{
  StringS names;
  for (const String &name : registry().class_order)
    if (!find_class (name)->is_interface)
      names.push_back (name);
  return names;
}

StringS
Runtime::function_names ()
{
  return registry().function_order;
}

StringS
Runtime::construct_names ()
{
  return registry().construct_order;
}

// == Constants and globals ==
bool
Runtime::has_constant (const String &name) const
{
  return constants_.has (canonical_name (name));
}

const Value&
Runtime::constant (const String &name) const
{
  const Value *v = constants_.find (canonical_name (name));
  if (!v)
    throw Error (string_format ("Constant '%s' is not defined", name));
  return *v;
}

/// Define a constant once, redefinition issues a warning and yields false.
bool
Runtime::define_constant (const String &name, const Value &value)
{
  const String cname = canonical_name (name);
  if (cname.empty())
    throw ValueError ("Constant name must not be empty");
  if (value.index() == Value::INSTANCE)
    throw TypeError (string_format ("Constant %s may only evaluate to scalar values, arrays or resources", cname));
  if (constants_.has (cname))
    {
      warning (string_format ("Constant %s already defined", cname));
      return false;
    }
  constants_.set (cname, value);
  return true;
}

StringS
Runtime::constant_names () const
{
  return constants_.string_keys();
}

bool
Runtime::has_global (const String &name) const
{
  return name == "GLOBALS" || globals_.has (name);
}

/// Value of a global variable, `GLOBALS` yields a copy of all globals.
Value
Runtime::global (const String &name) const
{
  if (name == "GLOBALS")
    return globals_;
  const Value *v = globals_.find (name);
  if (!v)
    throw Error (string_format ("Global '%s' is not defined", name));
  return *v;
}

void
Runtime::set_global (const String &name, const Value &value)
{
  if (name == "GLOBALS")
    throw Error ("Cannot re-assign $GLOBALS");
  globals_.set (name, value);
}

StringS
Runtime::global_names () const
{
  StringS names { "GLOBALS" };
  for (const String &k : globals_.string_keys())
    names.push_back (k);
  return names;
}

// == Calls ==
/// Call a function by name, language constructs are tried if no function matches.
Value
Runtime::call_function (const String &name, ValueS &args)
{
  if (const FunctionInfo *f = find_function (name))
    return f->invoke (nullptr, args, f->name);
  if (const FunctionInfo *c = find_construct (name))
    return c->invoke (nullptr, args, c->name);
  throw Error (string_format ("Could not resolve function '%s'", name));
}

Value
Runtime::call_method (const InstanceP &self, const String &name, ValueS &args)
{
  if (!self)
    throw Error (string_format ("Call to a member function %s() on null", name));
  const ClassInfo *info = self->class_info();
  if (!info)
    throw Error (string_format ("Call to method %s() on unregistered object of type %s", name, typeid_name (*self)));
  const MethodInfo *m = info->find_method (name);
  if (!m)
    throw Error (string_format ("Call to undefined method %s::%s()", info->name, name));
  return m->invoke (m->is_static ? nullptr : self.get(), args, m->owner + "::" + m->name);
}

Value
Runtime::call_static (const String &classname, const String &name, ValueS &args)
{
  const ClassInfo *info = find_class (classname);
  if (!info)
    throw Error (string_format ("Class \"%s\" not found", canonical_name (classname)));
  const MethodInfo *m = info->find_method (name);
  if (!m)
    throw Error (string_format ("Call to undefined method %s::%s()", info->name, name));
  if (!m->is_static)
    throw Error (string_format ("Non-static method %s::%s() cannot be called statically", m->owner, m->name));
  return m->invoke (nullptr, args, m->owner + "::" + m->name);
}

/// Invoke a callable value: function name, "Class::method", [object-or-class, method] or invokable object.
Value
Runtime::call_callable (const Value &callable, ValueS &args)
{
  switch (callable.index())
    {
    case Value::STRING: {
      const String &name = std::get<String> (callable);
      const size_t sep = name.find ("::");
      if (sep != String::npos)
        return call_static (name.substr (0, sep), name.substr (sep + 2), args);
      const FunctionInfo *f = find_function (name);
      if (!f)
        throw Error (string_format ("Call to undefined function %s()", name));
      return f->invoke (nullptr, args, f->name); }
    case Value::ARRAY: {
      const ValueA &pair = std::get<ValueA> (callable);
      if (pair.size() == 2 && pair.is_list() && pair.at (1).index() == Value::STRING)
        {
          const Value &target = pair.at (0);
          if (target.index() == Value::INSTANCE)
            return call_method (target.as_instance(), pair.at (1).as_string(), args);
          if (target.index() == Value::STRING)
            return call_static (target.as_string(), pair.at (1).as_string(), args);
        }
      throw TypeError ("Array callback must have exactly two elements, an object or class name and a method name"); }
    case Value::INSTANCE: {
      InstanceP self = callable.as_instance();
      const ClassInfo *info = self ? self->class_info() : nullptr;
      if (!info || !info->find_method ("__invoke"))
        throw Error (string_format ("Object of type %s is not callable", callable.type_name()));
      return call_method (self, "__invoke", args); }
    default:
      throw TypeError (string_format ("Value of type %s is not callable", callable.type_name()));
    }
}

bool
Runtime::is_callable (const Value &callable) const
{
  switch (callable.index())
    {
    case Value::STRING: {
      const String &name = std::get<String> (callable);
      const size_t sep = name.find ("::");
      if (sep == String::npos)
        return find_function (name) != nullptr;
      const ClassInfo *info = find_class (name.substr (0, sep));
      const MethodInfo *m = info ? info->find_method (name.substr (sep + 2)) : nullptr;
      return m && m->is_static; }
    case Value::ARRAY: {
      const ValueA &pair = std::get<ValueA> (callable);
      if (pair.size() != 2 || !pair.is_list() || pair.at (1).index() != Value::STRING)
        return false;
      const Value &target = pair.at (0);
      const ClassInfo *info = target.index() == Value::INSTANCE ? target.as_instance()->class_info() :
                              target.index() == Value::STRING ? find_class (target.as_string()) : nullptr;
      return info && info->find_method (pair.at (1).as_string()); }
    case Value::INSTANCE: {
      const ClassInfo *info = callable.as_instance() ? callable.as_instance()->class_info() : nullptr;
      return info && info->find_method ("__invoke"); }
    default:
      return false;
    }
}

/// Construct an instance of `classname`, constructor errors propagate.
InstanceP
Runtime::create_object (const String &classname, ValueS &args)
{
  const ClassInfo *info = find_class (classname);
  if (!info)
    throw Error (string_format ("Class \"%s\" not found", canonical_name (classname)));
  if (info->is_interface)
    throw Error (string_format ("Cannot instantiate interface %s", info->name));
  if (info->is_abstract)
    throw Error (string_format ("Cannot instantiate abstract class %s", info->name));
  if (!info->constructor.call)
    throw Error (string_format ("Cannot instantiate class %s without constructor", info->name));
  InstanceP instance = info->constructor.invoke (nullptr, args, info->name + "::__construct").as_instance();
  if (!instance)
    throw Error (string_format ("Constructor of %s did not yield an object", info->name));
  return instance;
}

bool
Runtime::instance_of (const InstanceP &instance, const String &classname)
{
  const ClassInfo *info = instance ? instance->class_info() : nullptr;
  return info && info->is_a (classname);
}

// == Properties ==
static const char*
visibility_name (PropertyInfo::Visibility visibility)
{
  return visibility == PropertyInfo::PRIVATE ? "private" : "protected";
}

Value
Runtime::get_property (const InstanceP &self, const String &name)
{
  assert_return (self != nullptr, {});
  const ClassInfo *info = self->class_info();
  const PropertyInfo *decl = info ? info->find_property (name) : nullptr;
  if (decl && decl->visibility != PropertyInfo::PUBLIC)
    throw Error (string_format ("Cannot access %s property %s::$%s", visibility_name (decl->visibility), info->name, name));
  const Value *v = self->props().find (name);
  if (!v)
    throw AttributeError (string_format ("Undefined property: %s::$%s", self->class_name(), name));
  return *v;
}

void
Runtime::set_property (const InstanceP &self, const String &name, const Value &value)
{
  assert_return (self != nullptr);
  const ClassInfo *info = self->class_info();
  const PropertyInfo *decl = info ? info->find_property (name) : nullptr;
  if (decl && decl->visibility != PropertyInfo::PUBLIC)
    throw Error (string_format ("Cannot modify %s property %s::$%s", visibility_name (decl->visibility), info->name, name));
  if (name.empty())
    throw Error ("Cannot access property starting with \"\\0\"");
  self->props().set (name, value);
}

void
Runtime::unset_property (const InstanceP &self, const String &name)
{
  assert_return (self != nullptr);
  const ClassInfo *info = self->class_info();
  const PropertyInfo *decl = info ? info->find_property (name) : nullptr;
  if (decl && decl->visibility != PropertyInfo::PUBLIC)
    throw Error (string_format ("Cannot unset %s property %s::$%s", visibility_name (decl->visibility), info->name, name));
  if (!self->props().erase (name))
    throw AttributeError (string_format ("Undefined property: %s::$%s", self->class_name(), name));
}

/// Names of the public properties, optionally only those not declared by the class.
StringS
Runtime::property_names (const InstanceP &self, bool dynamic_only) const
{
  StringS names;
  return_unless (self != nullptr, names);
  const ClassInfo *info = self->class_info();
  for (const String &name : self->props().string_keys())
    {
      const PropertyInfo *decl = info ? info->find_property (name) : nullptr;
      if (decl && (dynamic_only || decl->visibility != PropertyInfo::PUBLIC))
        continue;
      names.push_back (name);
    }
  return names;
}

// == Conversions ==
/// Cast `value` to string, objects need `__toString`.
String
Runtime::to_string (const Value &value)
{
  switch (value.index())
    {
    case Value::ARRAY:
      warning ("Array to string conversion");
      return "Array";
    case Value::INSTANCE: {
      InstanceP self = value.as_instance();
      const ClassInfo *info = self ? self->class_info() : nullptr;
      if (!info || !info->find_method ("__toString"))
        throw Error (string_format ("Object of class %s could not be converted to string", value.type_name()));
      ValueS args;
      const Value result = call_method (self, "__toString", args);
      if (result.index() != Value::STRING)
        throw Error (string_format ("%s::__toString(): Return value must be of type string, %s returned", info->name, result.type_name()));
      return std::get<String> (result); }
    default:
      return value.as_string();
    }
}

/// Element count of arrays and Countable objects.
int64
Runtime::count (const Value &value)
{
  if (value.index() == Value::ARRAY)
    return value.count();
  if (value.index() == Value::INSTANCE && instance_of (value.as_instance(), "Countable"))
    {
      ValueS args;
      return call_method (value.as_instance(), "count", args).as_int();
    }
  throw TypeError (string_format ("count(): Argument #1 ($value) must be of type Countable|array, %s given", value.type_name()));
}

// == Output, warnings and evaluation ==
/// Write `text` to the runtime output stream (used by echo and print).
void
Runtime::output (const String &text)
{
  return_unless (output_fd_ >= 0);
  size_t n = 0;
  while (n < text.size())
    {
      const ssize_t l = ::write (output_fd_, text.data() + n, text.size() - n);
      if (l < 0 && errno == EINTR)
        continue;
      if (l <= 0)
        {
          warning (string_format ("Failed to write %d bytes of output: %s", int (text.size() - n), string_from_errno (errno)));
          return;
        }
      n += l;
    }
}

static Runtime::WarningHandler warning_handler;

/// Issue a runtime warning, the installed handler may turn it into an exception.
void
Runtime::warning (const String &message)
{
  if (warning_handler)
    warning_handler (message);
  else
    Tether::warning ("%s", message);
}

/// Install a process-wide handler for runtime warnings, returns the previous one.
Runtime::WarningHandler
Runtime::set_warning_handler (const WarningHandler &handler)
{
  WarningHandler old = warning_handler;
  warning_handler = handler;
  return old;
}

/// Turn all subsequent runtime warnings into ErrorException.
void
Runtime::promote_warnings ()
{
  set_warning_handler ([] (const String &message) {
    throw ErrorException (message);
  });
}

Runtime::Evaluator
Runtime::set_evaluator (const Evaluator &evaluator)
{
  Evaluator old = evaluator_;
  evaluator_ = evaluator;
  return old;
}

/// Evaluate `code` in the command language of the session.
Value
Runtime::evaluate (const String &code, const String &origin)
{
  if (!evaluator_)
    throw Error ("No evaluator available for " + origin);
  debug ("eval", "%s: %d bytes", origin, int (code.size()));
  return evaluator_ (code, origin);
}

/// Evaluate the contents of the file at `path`, see include and require.
Value
Runtime::include_file (const String &path, bool require, bool once)
{
  const char *const construct = require ? (once ? "require_once" : "require") : (once ? "include_once" : "include");
  char buffer[PATH_MAX + 1] = { 0, };
  const char *rpath = realpath (path.c_str(), buffer);
  std::ifstream file (rpath ? rpath : path.c_str(), std::ios::binary);
  if (!rpath || !file)
    {
      const String reason = string_from_errno (rpath ? EACCES : errno);
      if (require)
        throw Error (string_format ("Failed opening required '%s': %s", path, reason));
      warning (string_format ("%s(%s): Failed to open stream: %s", construct, path, reason));
      return false;
    }
  const String key = rpath;
  if (once)
    for (const String &seen : included_)
      if (seen == key)
        return true;
  included_.push_back (key);
  std::ostringstream contents;
  contents << file.rdbuf();
  return evaluate (contents.str(), key);
}

} // Tether
