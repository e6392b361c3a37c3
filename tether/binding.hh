// This Source Code Form is licensed MPL-2.0: http://mozilla.org/MPL/2.0
#ifndef __TETHER_BINDING_HH__
#define __TETHER_BINDING_HH__

#include <tether/runtime.hh>
#include <tether/utils.hh>
#include <cmath>
#include <tuple>

namespace Tether {

/// Parameter name and optional default for binding a C++ callable.
struct Arg {
  String name;
  Value  fallback;
  bool   has_default = false;
  Arg (const char *pname) : name (pname) {}
  Arg (const char *pname, const Value &dflt) : name (pname), fallback (dflt), has_default (true) {}
};
using ArgS = std::vector<Arg>;

// == Convert ==
/// Template class providing C++ <-> Value conversions for argument passing
template<typename T, typename Enable = void>
struct Convert;

// Value type
template<>
struct Convert<Value> {
  static bool  from_value (const Value &value, Value &out, bool) { out = value; return true; }
  static Value to_value   (const Value &value)                   { return value; }
  static void  describe   (ParamInfo &p)                         { p.type = "mixed"; p.nullable = true; }
};

// bool type
template<>
struct Convert<bool> {
  static bool
  from_value (const Value &value, bool &out, bool)
  {
    if (value.index() == Value::ARRAY || value.index() == Value::INSTANCE || value.index() == Value::RESOURCE)
      return false;
    out = value.as_bool();
    return true;
  }
  static Value to_value (bool b)            { return b; }
  static void  describe (ParamInfo &p)      { p.type = "bool"; }
};

/// Parse numeric strings like the runtime does for arithmetic, with optional surrounding whitespace.
bool numeric_string (const String &string, double *number, bool *integral);

// int types
template<typename T>
struct Convert<T, REQUIRESv< std::is_integral<T>::value && !std::is_same<T, bool>::value > > {
  static bool
  from_value (const Value &value, T &out, bool)
  {
    switch (value.index())
      {
      case Value::NONE:         out = 0; return true;
      case Value::BOOL:         out = std::get<bool> (value); return true;
      case Value::INT64:        out = T (std::get<int64> (value)); return true;
      case Value::DOUBLE: {
        const double d = std::get<double> (value);
        if (!std::isfinite (d) || d != std::trunc (d) || std::abs (d) >= 9.2233720368547758e18)
          return false;
        out = T (d);
        return true; }
      case Value::STRING: {
        double d = 0;
        bool integral = false;
        if (!numeric_string (std::get<String> (value), &d, &integral) || !integral)
          return false;
        out = T (d);
        return true; }
      default:                  return false;
      }
  }
  static Value to_value (T i)               { return int64 (i); }
  static void  describe (ParamInfo &p)      { p.type = "int"; }
};

// floating point types
template<typename T>
struct Convert<T, REQUIRESv< std::is_floating_point<T>::value >> {
  static bool
  from_value (const Value &value, T &out, bool)
  {
    switch (value.index())
      {
      case Value::NONE:
      case Value::BOOL:
      case Value::INT64:
      case Value::DOUBLE:       out = value.as_double(); return true;
      case Value::STRING: {
        double d = 0;
        bool integral = false;
        if (!numeric_string (std::get<String> (value), &d, &integral))
          return false;
        out = d;
        return true; }
      default:                  return false;
      }
  }
  static Value to_value (T f)               { return double (f); }
  static void  describe (ParamInfo &p)      { p.type = "float"; }
};

// std::string type
template<>
struct Convert<String> {
  static bool
  from_value (const Value &value, String &out, bool)
  {
    if (value.index() == Value::ARRAY || value.index() == Value::INSTANCE || value.index() == Value::RESOURCE)
      return false;
    out = value.as_string();
    return true;
  }
  static Value to_value (const String &s)   { return s; }
  static void  describe (ParamInfo &p)      { p.type = "string"; }
};

// const char* return type
template<>
struct Convert<const char*> {
  static Value to_value (const char *s)     { return s ? Value (s) : Value(); }
};

// array type
template<>
struct Convert<ValueA> {
  static bool
  from_value (const Value &value, ValueA &out, bool)
  {
    if (value.index() != Value::ARRAY)
      return false;
    out = std::get<ValueA> (value);
    return true;
  }
  static Value to_value (const ValueA &a)   { return a; }
  static void  describe (ParamInfo &p)      { p.type = "array"; }
};

// string list return type
template<>
struct Convert<StringS> {
  static Value
  to_value (const StringS &strings)
  {
    ValueA a;
    for (const String &s : strings)
      a.append (s);
    return a;
  }
};

// object types
template<typename C>
struct Convert<std::shared_ptr<C>, REQUIRESv< std::is_base_of<Instance, C>::value >> {
  static bool
  from_value (const Value &value, std::shared_ptr<C> &out, bool nullable)
  {
    if (value.index() == Value::NONE && nullable)
      {
        out = nullptr;
        return true;
      }
    out = std::dynamic_pointer_cast<C> (value.as_instance());
    return out != nullptr;
  }
  static Value to_value (const std::shared_ptr<C> &sptr) { return sptr ? Value (InstanceP (sptr)) : Value(); }
  static void
  describe (ParamInfo &p)
  {
    if (std::is_same<C, Instance>::value)
      p.type = "object";
    else
      p.class_type = &typeid (C);
  }
};

// resource types
template<typename R>
struct Convert<std::shared_ptr<R>, REQUIRESv< std::is_base_of<Resource, R>::value >> {
  static bool
  from_value (const Value &value, std::shared_ptr<R> &out, bool nullable)
  {
    if (value.index() == Value::NONE && nullable)
      {
        out = nullptr;
        return true;
      }
    out = std::dynamic_pointer_cast<R> (value.as_resource());
    return out != nullptr;
  }
  static Value to_value (const std::shared_ptr<R> &sptr) { return sptr ? Value (ResourceP (sptr)) : Value(); }
  static void  describe (ParamInfo &p)                   { p.type = "resource"; }
};

/// Type label used in argument errors, see Convert<>::describe().
template<class T> String
convert_type_label ()
{
  ParamInfo p;
  Convert<T>::describe (p);
  return p.type_label();
}

// == FunctionTraits ==
/// Template class to identify the return type, argument types and class of callables.
template<typename F> struct FunctionTraits;
template<typename R, typename... Args>
struct FunctionTraits<R (*) (Args...)> {
  using ReturnType = R;
  using Arguments = std::tuple<Args...>;
  using ClassType = void;
  static constexpr const size_t N_ARGS = sizeof... (Args);
};
template<typename C, typename R, typename... Args>
struct FunctionTraits<R (C::*) (Args...)> : FunctionTraits<R (*) (Args...)> {
  using ClassType = C;
};
template<typename C, typename R, typename... Args>
struct FunctionTraits<R (C::*) (Args...) const> : FunctionTraits<R (*) (Args...)> {
  using ClassType = C;
};

/// Names and nullability of parameters for argument conversion errors.
struct CallSite {
  String        name;
  StringS       params;
  std::vector<bool> nullable;
};

// == CallTraits ==
/// Template class to convert a ValueS argument list into C++ call arguments.
template<typename F>
struct CallTraits : FunctionTraits<F> {
  using Traits = FunctionTraits<F>;
  using ReturnType = typename Traits::ReturnType;
  using Arguments = typename Traits::Arguments;
  using ClassType = typename Traits::ClassType;
  static constexpr const size_t N_ARGS = Traits::N_ARGS;
  template<size_t I> using ArgType = typename std::decay<typename std::tuple_element<I, Arguments>::type>::type;
  template<size_t I> static constexpr bool
  is_rest ()
  {
    return std::is_same<ArgType<I>, ValueS>::value;
  }
  /// Fill parameter and return type reflection of `info`.
  static void
  describe (FunctionInfo &info, const ArgS &args)
  {
    if (args.size() != N_ARGS)
      warning ("%s: %d parameter names given for %d parameters", info.name, int (args.size()), int (N_ARGS));
    info.params.clear();
    describe_params (info, args, std::make_index_sequence<N_ARGS>());
    using R = typename std::decay<ReturnType>::type;
    if constexpr (std::is_void<R>::value)
      info.return_type = "void";
    else if constexpr (std::is_same<R, StringS>::value)
      info.return_type = "array";
    else if constexpr (std::is_same<R, const char*>::value || std::is_same<R, char*>::value)
      info.return_type = "string";
    else
      {
        ParamInfo p;
        Convert<R>::describe (p);
        info.return_type = p.type;
        info.return_class = p.class_type;
        info.returns_nullable = p.nullable || p.class_type;
      }
  }
  template<size_t... I> static void
  describe_params (FunctionInfo &info, const ArgS &args, std::index_sequence<I...>)
  {
    (describe_param<I> (info, args), ...);  // C++17 fold expression
  }
  template<size_t I> static void
  describe_param (FunctionInfo &info, const ArgS &args)
  {
    ParamInfo p;
    p.name = I < args.size() ? args[I].name : string_format ("arg%d", int (I + 1));
    if constexpr (is_rest<I>())
      {
        p.type = "mixed";
        p.nullable = true;
        p.variadic = true;
      }
    else
      {
        Convert<ArgType<I>>::describe (p);
        if (I < args.size() && args[I].has_default)
          {
            p.has_default = true;
            p.fallback = args[I].fallback;
            p.nullable = p.nullable || p.fallback.is_null();
          }
      }
    info.params.push_back (p);
  }
  /// Convert argument `I` of `args` or throw TypeError naming the parameter.
  template<size_t I> static ArgType<I>
  arg_from (ValueS &args, const CallSite &site)
  {
    using A = ArgType<I>;
    if constexpr (is_rest<I>())
      return ValueS (args.begin() + std::min (I, args.size()), args.end());
    else
      {
        if (I >= args.size())
          throw ArgumentCountError (string_format ("%s(): Argument #%d ($%s) not passed", site.name, int (I + 1), site.params[I]));
        A out {};
        if (!Convert<A>::from_value (args[I], out, site.nullable[I]))
          throw TypeError (string_format ("%s(): Argument #%d ($%s) must be of type %s, %s given", site.name,
                                          int (I + 1), site.params[I], convert_type_label<A>(), args[I].type_name()));
        return out;
      }
  }
  template<size_t... I> static Value
  call_unpacked (const F &func, Instance *self, ValueS &args, const CallSite &site, std::index_sequence<I...>)
  {
    using R = typename std::decay<ReturnType>::type;
    if constexpr (std::is_void<ClassType>::value)
      {
        if constexpr (std::is_void<R>::value)
          {
            func (arg_from<I> (args, site)...);
            return Value();
          }
        else
          return Convert<R>::to_value (func (arg_from<I> (args, site)...));
      }
    else
      {
        ClassType *obj = dynamic_cast<ClassType*> (self);
        if (!obj)
          throw TypeError (string_format ("%s(): method called on incompatible object", site.name));
        if constexpr (std::is_void<R>::value)
          {
            (obj->*func) (arg_from<I> (args, site)...);
            return Value();
          }
        else
          return Convert<R>::to_value ((obj->*func) (arg_from<I> (args, site)...));
      }
  }
  static Value
  call (const F &func, Instance *self, ValueS &args, const CallSite &site)
  {
    return call_unpacked (func, self, args, site, std::make_index_sequence<N_ARGS>());
  }
};

/// Fill `info` with reflection and an implementation that calls `func` with converted arguments.
template<typename F> void
bind_callable (FunctionInfo &info, const String &qualified_name, F func, const ArgS &args)
{
  using CT = CallTraits<F>;
  CT::describe (info, args);
  CallSite site;
  site.name = qualified_name;
  for (const ParamInfo &p : info.params)
    {
      site.params.push_back (p.name);
      site.nullable.push_back (p.nullable);
    }
  info.call = [func, site] (Instance *self, ValueS &vargs) -> Value {
    return CT::call (func, self, vargs, site);
  };
}

/// Register the free function `func` with the runtime as `name`.
template<typename F> FunctionInfo&
register_function (const String &name, F func, const String &doc = "", const ArgS &args = {})
{
  FunctionInfo info;
  info.name = name;
  info.doc = doc;
  bind_callable (info, name, func, args);
  return Runtime::register_function (info);
}

/// Register `func` as language construct `name`, see Runtime::register_construct().
template<typename F> FunctionInfo&
register_construct (const String &name, F func, const String &doc = "", const ArgS &args = {})
{
  FunctionInfo info;
  info.name = name;
  info.doc = doc;
  bind_callable (info, name, func, args);
  return Runtime::register_construct (info);
}

// == Interface ==
/// Builder for the reflection of abstract interfaces.
class Interface {
  ClassInfo &info_;
public:
  explicit   Interface (const String &name, const String &doc = "");
  Interface& extends   (const String &interface);
  Interface& method    (const String &name, const String &return_type, const String &doc = "", const StringS &params = {});
};

// == Class ==
/// Builder to register the C++ class `T` with the runtime, modeled after Jsonipc::Class<>.
template<typename T>
class Class {
  ClassInfo &info_;
  template<typename... A> static std::shared_ptr<T>
  make (A... args)
  {
    return std::make_shared<T> (args...);
  }
  MethodInfo&
  add_method (const String &name, const String &doc)
  {
    for (const MethodInfo &m : info_.methods)
      if (string_tolower (m.name) == string_tolower (name))
        throw std::runtime_error ("duplicate method registration: " + info_.name + "::" + name);
    info_.methods.push_back (MethodInfo());
    MethodInfo &m = info_.methods.back();
    m.name = name;
    m.doc = doc;
    m.owner = info_.name;
    return m;
  }
public:
  explicit
  Class (const String &name, const String &doc = "") :
    info_ (Runtime::register_class ([&] () { ClassInfo c; c.name = name; c.doc = doc; return c; } (), &typeid (T)))
  {
    static_assert (std::is_base_of<Instance, T>::value, "Class<T> requires T to derive from Tether::Instance");
    if constexpr (std::is_default_constructible<T>::value && !std::is_abstract<T>::value)
      constructor<>();
  }
  /// Set the parent class.
  Class& extends    (const String &parent)      { info_.parent = Runtime::canonical_name (parent); return *this; }
  /// Add an implemented interface.
  Class& implements (const String &interface)   { info_.interfaces.push_back (Runtime::canonical_name (interface)); return *this; }
  /// Mark the class as not instantiable.
  Class& abstract   ()                          { info_.is_abstract = true; info_.constructor.call = nullptr; return *this; }
  /// Mark the class as final.
  Class& final      ()                          { info_.is_final = true; return *this; }
  /// Add a class constant.
  Class&
  constant (const String &name, const Value &value)
  {
    info_.constants.set (name, value);
    return *this;
  }
  /// Declare a property with its default value.
  Class&
  property (const String &name, const Value &fallback = Value(), const String &doc = "",
            PropertyInfo::Visibility visibility = PropertyInfo::PUBLIC)
  {
    PropertyInfo p;
    p.name = name;
    p.fallback = fallback;
    p.doc = doc;
    p.visibility = visibility;
    info_.properties.push_back (p);
    return *this;
  }
  /// Construct instances by calling `T (A...)` with converted arguments.
  template<typename... A> Class&
  constructor (const String &doc = "", const ArgS &args = {})
  {
    MethodInfo &m = info_.constructor;
    m.name = "__construct";
    m.doc = doc;
    m.owner = info_.name;
    bind_callable (m, info_.name + "::__construct", &Class::template make<A...>, args);
    m.return_type = "";
    m.return_class = nullptr;
    return *this;
  }
  /// Register a member function as method, or a free function as static method.
  template<typename F> Class&
  method (const String &name, F func, const String &doc = "", const ArgS &args = {})
  {
    MethodInfo &m = add_method (name, doc);
    m.is_static = std::is_void<typename FunctionTraits<F>::ClassType>::value;
    bind_callable (m, info_.name + "::" + name, func, args);
    return *this;
  }
};

} // Tether

#endif // __TETHER_BINDING_HH__
