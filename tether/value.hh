// This Source Code Form is licensed MPL-2.0: http://mozilla.org/MPL/2.0
#ifndef __TETHER_VALUE_HH__
#define __TETHER_VALUE_HH__

#include <tether/defs.hh>
#include <unordered_map>
#include <variant>

namespace Tether {

/// Array keys are either integers or strings, see ValueA::key_from() for normalization.
using ValueKey = std::variant<int64,String>;

String key_to_string (const ValueKey &key);
Value  key_to_value  (const ValueKey &key);

/// Element of a ValueA, the value is immutable once inserted.
struct ValueEntry {
  ValueKey key;
  ValueP   value;
};

/// Insertion ordered hash table with integer and string keys.
class ValueA {
  std::vector<ValueEntry>             entries_;
  std::unordered_map<ValueKey,size_t> index_;
  int64                               next_index_ = 0;
  void         reindex    ();
public:
  using const_iterator = std::vector<ValueEntry>::const_iterator;
  ValueA     () = default;
  ValueA     (std::initializer_list<Value> il);
  static ValueA   record     (std::initializer_list<std::pair<String,Value>> il);
  static ValueKey key_from   (const Value &v);
  size_t         size       () const    { return entries_.size(); }
  bool           empty      () const    { return entries_.empty(); }
  const_iterator begin      () const    { return entries_.begin(); }
  const_iterator end        () const    { return entries_.end(); }
  bool           has        (const ValueKey &key) const;
  const Value*   find       (const ValueKey &key) const;
  const Value&   get        (const ValueKey &key) const;
  const Value&   at         (size_t position) const;
  void           set        (const ValueKey &key, const Value &value);
  void           append     (const Value &value);
  bool           erase      (const ValueKey &key);
  int64          next_index () const    { return next_index_; }
  bool           is_list    () const;
  StringS        string_keys () const;
  bool           operator== (const ValueA &other) const;
  bool           operator!= (const ValueA &other) const { return !(other == *this); }
};

/// Variant type to hold different types of values.
using ValueVariant = std::variant<std::monostate,bool,int64,double,String,ValueA,InstanceP,ResourceP>;

/// Value type of the runtime, passed into and returned from all callables.
struct Value : ValueVariant {
  using ValueVariant::ValueVariant;
  enum Type { NONE, BOOL, INT64, DOUBLE, STRING, ARRAY, INSTANCE, RESOURCE };
  constexpr Type index       () const    { return Type (ValueVariant::index()); }
  bool           is_null     () const    { return index() == NONE; }
  bool           is_numeric  (bool boolisnumeric = false) const;
  bool           as_bool     () const;
  int64          as_int      () const;
  double         as_double   () const;
  String         as_string   () const;
  const ValueA&  as_array    () const;
  InstanceP      as_instance () const;
  ResourceP      as_resource () const;
  String         type_name   () const;
  size_t         count       () const;
  Value ()                      {}
  Value (bool v)                { ValueVariant::operator= (v); }
  Value (int64 v)               { ValueVariant::operator= (v); }
  Value (int32 v)               { ValueVariant::operator= (int64 (v)); }
  Value (uint32 v)              { ValueVariant::operator= (int64 (v)); }
  Value (double v)              { ValueVariant::operator= (v); }
  Value (const char *v)         { ValueVariant::operator= (String (v)); }
  Value (const String &v)       { ValueVariant::operator= (v); }
  Value (String &&v)            { ValueVariant::operator= (std::move (v)); }
  Value (const ValueA &v)       { ValueVariant::operator= (v); }
  Value (ValueA &&v)            { ValueVariant::operator= (std::move (v)); }
  Value (uint64 v)              { ValueVariant::operator= (int64 (v)); }
  bool operator== (const Value &other) const;
  bool operator!= (const Value &other) const { return !(other == *this); }
  static const Value empty_value;
};

} // Tether

#endif // __TETHER_VALUE_HH__
