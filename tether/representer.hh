// This Source Code Form is licensed MPL-2.0: http://mozilla.org/MPL/2.0
#ifndef __TETHER_REPRESENTER_HH__
#define __TETHER_REPRESENTER_HH__

#include <tether/object.hh>

namespace Tether {

/// Terse, depth limited display strings for values.
class Representer {
public:
  /// Literals and delimiters of a representation flavor.
  struct Style {
    String null_word = "null", true_word = "true", false_word = "false";
    String nan = "NAN", inf = "INF", ninf = "-INF";
    String seq_open = "[", seq_close = "]";
    String map_open = "{", map_close = "}";
    String key_sep = ": ", item_sep = ", ";
    String object_word = "object", resource_word = "resource";
  };
  using ClassNameHook = std::function<String (const String &classname)>;
  explicit             Representer      ();
  explicit             Representer      (const Style &style);
  static Style         python_style     ();
  static ClassNameHook module_path_hook (const String &module);
  void                 class_name_hook  (const ClassNameHook &hook)   { class_name_hook_ = hook; }
  const Style&         style            () const                      { return style_; }
  String               repr             (const Value &value, int depth = 2) const;
  String               class_name       (const String &name) const;
  String               repr_string      (const String &string) const;
  String               repr_double      (double d) const;
private:
  Style         style_;
  ClassNameHook class_name_hook_;
  String        repr_array       (const ValueA &array, int depth) const;
  String        repr_object      (const InstanceP &object, int depth) const;
  String        repr_opaque      (const Instance &object) const;
};

} // Tether

#endif // __TETHER_REPRESENTER_HH__
