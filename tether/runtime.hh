// This Source Code Form is licensed MPL-2.0: http://mozilla.org/MPL/2.0
#ifndef __TETHER_RUNTIME_HH__
#define __TETHER_RUNTIME_HH__

#include <tether/object.hh>
#include <tether/errors.hh>
#include <map>
#include <typeindex>

namespace Tether {

/// Native implementation of a callable, `self` is nullptr for functions and static methods.
using Callable = std::function<Value (Instance *self, ValueS &args)>;

/// Reflected parameter of a callable.
struct ParamInfo {
  String                name;
  String                type;                   ///< Type label, empty if untyped.
  const std::type_info *class_type = nullptr;   ///< C++ type of object parameters, resolved to a class name on demand.
  bool                  nullable = false;
  bool                  has_default = false;
  bool                  variadic = false;
  Value                 fallback;
  String                type_label  () const;
  bool                  is_class    () const;
};

/// Reflected function or method, `call` receives the arguments completed with defaults.
struct FunctionInfo {
  String        name;
  String        doc;
  ParamInfoS    params;
  String        return_type;
  const std::type_info *return_class = nullptr;
  bool          returns_nullable = false;
  Callable      call;
  size_t        required_args     () const;
  String        return_type_label () const;
  Value         invoke            (Instance *self, ValueS &args, const String &qualified_name) const;
};

/// Reflected method, `owner` names the declaring class.
struct MethodInfo : FunctionInfo {
  bool          is_static = false;
  bool          is_abstract = false;
  String        owner;
};

/// Reflected property declaration.
struct PropertyInfo {
  enum Visibility { PUBLIC, PROTECTED, PRIVATE };
  String        name;
  String        doc;
  Value         fallback;
  Visibility    visibility = PUBLIC;
};

/// Reflected class or interface.
struct ClassInfo {
  using Factory = std::function<InstanceP (ValueS &args)>;
  String        name;
  String        doc;
  String        parent;
  StringS       interfaces;
  bool          is_abstract = false;
  bool          is_interface = false;
  bool          is_final = false;
  ValueA        constants;
  MethodInfoS   methods;
  PropertyInfoS properties;
  MethodInfo    constructor;            ///< Parameters and factory of `__construct`, `call` yields an INSTANCE.
  const MethodInfo*   find_method       (const String &method) const;
  const PropertyInfo* find_property     (const String &property) const;
  const ClassInfo*    parent_info       () const;
  StringS             all_interfaces    () const;
  bool                is_a              (const String &classname) const;
};

/// The foreign runtime: process-wide class and function tables plus per-session constants and globals.
class Runtime {
  ValueA                constants_;
  ValueA                globals_;
  StringS               included_;
  int                   output_fd_ = 1;
  std::function<Value (const String&, const String&)> evaluator_;
  TETHER_CLASS_NON_COPYABLE (Runtime);
public:
  using WarningHandler = std::function<void (const String &message)>;
  using Evaluator = std::function<Value (const String &code, const String &origin)>;
  explicit              Runtime         ();
  virtual              ~Runtime         ();
  /// Make a Runtime the current one for the lifetime of a Scope, see current().
  class Scope {
    Scope *prev_;
    Runtime &runtime_;
    friend class Runtime;
  public:
    explicit Scope  (Runtime &runtime);
    /*dtor*/ ~Scope ();
  };
  static Runtime&       current         ();
  // == Class and function tables ==
  static ClassInfo&     register_class   (const ClassInfo &info, const std::type_info *type = nullptr);
  static const ClassInfo* find_class     (const String &name);
  static const ClassInfo* class_of       (const std::type_info &type);
  static FunctionInfo&  register_function (const FunctionInfo &info);
  static const FunctionInfo* find_function (const String &name);
  static FunctionInfo&  register_construct (const FunctionInfo &info);
  static const FunctionInfo* find_construct (const String &name);
  static StringS        class_names      ();
  static StringS        function_names   ();
  static StringS        construct_names  ();
  static String         canonical_name   (const String &name);
  // == Constants and globals ==
  bool                  has_constant    (const String &name) const;
  const Value&          constant        (const String &name) const;
  bool                  define_constant (const String &name, const Value &value);
  StringS               constant_names  () const;
  bool                  has_global      (const String &name) const;
  Value                 global          (const String &name) const;
  void                  set_global      (const String &name, const Value &value);
  StringS               global_names    () const;
  // == Calls ==
  Value                 call_function   (const String &name, ValueS &args);
  Value                 call_method     (const InstanceP &self, const String &name, ValueS &args);
  Value                 call_static     (const String &classname, const String &name, ValueS &args);
  Value                 call_callable   (const Value &callable, ValueS &args);
  bool                  is_callable     (const Value &callable) const;
  InstanceP             create_object   (const String &classname, ValueS &args);
  static bool           instance_of     (const InstanceP &instance, const String &classname);
  // == Properties ==
  Value                 get_property    (const InstanceP &self, const String &name);
  void                  set_property    (const InstanceP &self, const String &name, const Value &value);
  void                  unset_property  (const InstanceP &self, const String &name);
  StringS               property_names  (const InstanceP &self, bool dynamic_only = false) const;
  // == Conversions ==
  String                to_string       (const Value &value);
  int64                 count           (const Value &value);
  // == Output, warnings and evaluation ==
  void                  output          (const String &text);
  void                  set_output_fd   (int fd)        { output_fd_ = fd; }
  static void           warning         (const String &message);
  static WarningHandler set_warning_handler (const WarningHandler &handler);
  static void           promote_warnings ();
  Evaluator             set_evaluator   (const Evaluator &evaluator);
  Value                 evaluate        (const String &code, const String &origin);
  Value                 include_file    (const String &path, bool require, bool once);
};

// == Builtins ==
void register_builtin_classes    ();
void register_builtin_functions  ();
void register_builtin_constructs ();
void register_builtin_streams    ();
void define_builtin_constants    (Runtime &runtime);

} // Tether

#endif // __TETHER_RUNTIME_HH__
