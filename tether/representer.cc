// This Source Code Form is licensed MPL-2.0: http://mozilla.org/MPL/2.0
#include "representer.hh"
#include "runtime.hh"
#include "utils.hh"
#include "internal.hh"
#include <cmath>

namespace Tether {

Representer::Representer () :
  style_()
{}

Representer::Representer (const Style &style) :
  style_ (style)
{}

/// Literals as Python prints them, for clients that show values in Python sessions.
Representer::Style
Representer::python_style ()
{
  Style s;
  s.null_word = "None";
  s.true_word = "True";
  s.false_word = "False";
  s.nan = "nan";
  s.inf = "inf";
  s.ninf = "-inf";
  return s;
}

/// Class name hook that turns `A\B` into `module.A.B`.
Representer::ClassNameHook
Representer::module_path_hook (const String &module)
{
  return [module] (const String &classname) {
    const String path = string_replace (classname, "\\", ".");
    return module.empty() ? path : module + "." + path;
  };
}

String
Representer::class_name (const String &name) const
{
  return class_name_hook_ ? class_name_hook_ (name) : name;
}

/** Represent `value` up to `depth` levels deep.
 * The depth counts down on every nesting level, collections and objects
 * reached at a depth of 0 or less are summarized.
 */
String
Representer::repr (const Value &value, int depth) const
{
  depth -= 1;
  switch (value.index())
    {
    case Value::NONE:           return style_.null_word;
    case Value::BOOL:           return std::get<bool> (value) ? style_.true_word : style_.false_word;
    case Value::INT64:          return string_from_int (std::get<int64> (value));
    case Value::DOUBLE:         return repr_double (std::get<double> (value));
    case Value::STRING:         return repr_string (std::get<String> (value));
    case Value::ARRAY:          return repr_array (std::get<ValueA> (value), depth);
    case Value::INSTANCE: {
      InstanceP object = value.as_instance();
      if (!object)
        return style_.null_word;
      if (const Representable *r = dynamic_cast<const Representable*> (object.get()))
        return r->represent (*this, depth);
      return repr_object (object, depth); }
    case Value::RESOURCE: {
      ResourceP resource = value.as_resource();
      if (!resource)
        return style_.null_word;
      return string_format ("<%s %s id #%lld>", resource->kind(), style_.resource_word, (long long) resource->id()); }
    }
  return "<unknown>";
}

/// Quote `string` as single quoted literal.
String
Representer::repr_string (const String &string) const
{
  String s = "'";
  for (const char c : string)
    {
      if (c == '\\' || c == '\'')
        s += '\\';
      s += c;
    }
  return s + "'";
}

/// Shortest literal that reads back as `d`, integral values keep a `.0`.
String
Representer::repr_double (double d) const
{
  if (std::isnan (d))
    return style_.nan;
  if (std::isinf (d))
    return d > 0 ? style_.inf : style_.ninf;
  String s = string_from_double (d);
  if (s.find_first_of (".eE") == String::npos)
    s += ".0";
  return s;
}

String
Representer::repr_array (const ValueA &array, int depth) const
{
  if (array.empty())
    return style_.seq_open + style_.seq_close;
  const bool sequential = array.is_list();
  if (depth <= 0)
    {
      const String count = string_format ("(%d)", int (array.size()));
      if (sequential)
        return style_.seq_open + "... " + count + style_.seq_close;
      return style_.map_open + "..." + style_.key_sep + count + style_.map_close;
    }
  String content;
  for (const ValueEntry &e : array)
    {
      if (!content.empty())
        content += style_.item_sep;
      if (!sequential)
        content += repr (key_to_value (e.key), depth) + style_.key_sep;
      content += repr (*e.value, depth);
    }
  if (sequential)
    return style_.seq_open + content + style_.seq_close;
  return style_.map_open + content + style_.map_close;
}

String
Representer::repr_object (const InstanceP &object, int depth) const
{
  const ValueA &props = object->props();
  if (depth <= 0 || props.empty())
    return repr_opaque (*object);
  String content;
  for (const ValueEntry &e : props)
    {
      if (!content.empty())
        content += ", ";
      content += key_to_string (e.key) + "=" + repr (*e.value, depth);
    }
  const String cname = object->class_name();
  return "<" + class_name (cname.empty() ? typeid_name (*object) : cname) + " " + style_.object_word + " (" + content + ")>";
}

/// Summary with the class name and serial number only.
String
Representer::repr_opaque (const Instance &object) const
{
  const String cname = object.class_name();
  return string_format ("<%s %s 0x%08llx>", class_name (cname.empty() ? typeid_name (object) : cname),
                        style_.object_word, (unsigned long long) object.serial());
}

} // Tether

#include "testing.hh"

namespace { // Anon
using namespace Tether;

TEST_INTEGRITY (representer_tests);
static void
representer_tests()
{
  Runtime runtime;
  Representer r;
  TCMP (r.repr (Value()), ==, "null");
  TCMP (r.repr (true), ==, "true");
  TCMP (r.repr (int64 (-17)), ==, "-17");
  TCMP (r.repr (2.0), ==, "2.0");
  TCMP (r.repr (0.1), ==, "0.1");
  TCMP (r.repr (-double (INFINITY)), ==, "-INF");
  TCMP (r.repr ("it's \\"), ==, "'it\\'s \\\\'");
  TCMP (r.repr (ValueA()), ==, "[]");
  const ValueA nested { 1, ValueA { 2, ValueA { 3 } } };
  TCMP (r.repr (nested), ==, "[1, [... (2)]]");
  TCMP (r.repr (nested, 3), ==, "[1, [2, [... (1)]]]");
  TCMP (r.repr (nested, 0), ==, "[... (2)]");
  TCMP (r.repr (ValueA::record ({ { "a", 1 }, { "b", ValueA::record ({ { "c", Value() } }) } })), ==, "{'a': 1, 'b': {...: (1)}}");
  ValueA sparse;
  sparse.set (int64 (5), "x");
  TCMP (r.repr (sparse), ==, "{5: 'x'}");
  InstanceP obj = StdClass::create (ValueA::record ({ { "x", 1 }, { "y", ValueA { 1 } } }));
  TCMP (r.repr (obj), ==, "<stdClass object (x=1, y=[... (1)])>");
  TCMP (r.repr (obj, 1), ==, string_format ("<stdClass object 0x%08llx>", (unsigned long long) obj->serial()));
  TCMP (r.repr (StdClass::create()), !=, "");
  Representer p (Representer::python_style());
  p.class_name_hook (Representer::module_path_hook ("php"));
  TCMP (p.repr (ValueA { Value(), false, double (NAN) }), ==, "[None, False, nan]");
  TCMP (p.class_name ("Foo\\Bar"), ==, "php.Foo.Bar");
  TCMP (p.repr (obj, 1), ==, string_format ("<php.stdClass object 0x%08llx>", (unsigned long long) obj->serial()));
}

} // Anon
