// This Source Code Form is licensed MPL-2.0: http://mozilla.org/MPL/2.0
#include "value.hh"
#include "object.hh"
#include "errors.hh"
#include "strings.hh"
#include "internal.hh"
#include <cmath>

namespace Tether {

String
key_to_string (const ValueKey &key)
{
  if (const int64 *i = std::get_if<int64> (&key))
    return string_from_int (*i);
  return std::get<String> (key);
}

Value
key_to_value (const ValueKey &key)
{
  if (const int64 *i = std::get_if<int64> (&key))
    return *i;
  return std::get<String> (key);
}

// == ValueA ==
ValueA::ValueA (std::initializer_list<Value> il)
{
  for (auto &v : il)
    append (v);
}

/// Create an array with string keys from name value pairs.
ValueA
ValueA::record (std::initializer_list<std::pair<String,Value>> il)
{
  ValueA a;
  for (auto &f : il)
    a.set (key_from (f.first), f.second);
  return a;
}

/// Normalize `v` into an array key, canonical decimal strings become integers.
ValueKey
ValueA::key_from (const Value &v)
{
  switch (v.index())
    {
    case Value::NONE:
      return String();
    case Value::BOOL:
      return int64 (std::get<bool> (v));
    case Value::INT64:
      return std::get<int64> (v);
    case Value::DOUBLE: {
      const double d = std::get<double> (v);
      if (!std::isfinite (d) || d >= 9.2233720368547758e18 || d < -9.2233720368547758e18)
        return int64 (0);
      return int64 (d); }
    case Value::STRING: {
      const String &s = std::get<String> (v);
      int64 i = 0;
      if (string_to_int (s, &i, true))
        return i;
      return s; }
    case Value::RESOURCE:
      return std::get<ResourceP> (v) ? std::get<ResourceP> (v)->id() : 0;
    case Value::ARRAY:
    case Value::INSTANCE:
      break;
    }
  throw TypeError ("Illegal offset type " + v.type_name());
}

void
ValueA::reindex ()
{
  index_.clear();
  for (size_t i = 0; i < entries_.size(); i++)
    index_[entries_[i].key] = i;
}

bool
ValueA::has (const ValueKey &key) const
{
  return index_.find (key) != index_.end();
}

/// Lookup the value stored under `key`, returns nullptr if absent.
const Value*
ValueA::find (const ValueKey &key) const
{
  auto it = index_.find (key);
  return it == index_.end() ? nullptr : entries_[it->second].value.get();
}

const Value&
ValueA::get (const ValueKey &key) const
{
  const Value *v = find (key);
  return v ? *v : Value::empty_value;
}

/// Value at insertion `position`.
const Value&
ValueA::at (size_t position) const
{
  assert_return (position < entries_.size(), Value::empty_value);
  return *entries_[position].value;
}

/// Store `value` under `key`, existing keys keep their position.
void
ValueA::set (const ValueKey &key, const Value &value)
{
  ValueP vp = std::make_shared<Value> (value);
  auto it = index_.find (key);
  if (it != index_.end())
    {
      entries_[it->second].value = vp;
      return;
    }
  index_[key] = entries_.size();
  entries_.push_back ({ key, vp });
  if (const int64 *i = std::get_if<int64> (&key))
    if (*i >= next_index_)
      next_index_ = *i < I63MAX ? *i + 1 : *i;
}

/// Store `value` under the next free integer key.
void
ValueA::append (const Value &value)
{
  set (next_index_, value);
}

bool
ValueA::erase (const ValueKey &key)
{
  auto it = index_.find (key);
  return_unless (it != index_.end(), false);
  entries_.erase (entries_.begin() + it->second);
  reindex();
  return true;
}

/// Check if the keys are exactly 0, 1, …, size()-1 in order.
bool
ValueA::is_list () const
{
  for (size_t i = 0; i < entries_.size(); i++)
    {
      const int64 *k = std::get_if<int64> (&entries_[i].key);
      if (!k || *k != int64 (i))
        return false;
    }
  return true;
}

StringS
ValueA::string_keys () const
{
  StringS keys;
  for (const auto &e : entries_)
    keys.push_back (key_to_string (e.key));
  return keys;
}

bool
ValueA::operator== (const ValueA &other) const
{
  if (entries_.size() != other.entries_.size())
    return false;
  for (size_t i = 0; i < entries_.size(); i++)
    if (entries_[i].key != other.entries_[i].key || *entries_[i].value != *other.entries_[i].value)
      return false;
  return true;
}

// == Value ==
const Value Value::empty_value;

/// Check for INT64 or DOUBLE values, optionally count BOOL as numeric.
bool
Value::is_numeric (bool boolisnumeric) const
{
  switch (index())
    {
    case BOOL:          return boolisnumeric;
    case INT64:
    case DOUBLE:        return true;
    default:            return false;
    }
}

/// Truthiness of a value, empty strings, arrays and "0" are false.
bool
Value::as_bool () const
{
  switch (index())
    {
    case NONE:          return false;
    case BOOL:          return std::get<bool> (*this);
    case INT64:         return std::get<int64> (*this) != 0;
    case DOUBLE:        return std::get<double> (*this) != 0;
    case STRING:        { const String &s = std::get<String> (*this); return !s.empty() && s != "0"; }
    case ARRAY:         return !std::get<ValueA> (*this).empty();
    case INSTANCE:      return std::get<InstanceP> (*this) != nullptr;
    case RESOURCE:      return std::get<ResourceP> (*this) != nullptr;
    }
  return false;
}

/// Convert to integer, doubles are truncated, strings are parsed with a leading number.
int64
Value::as_int () const
{
  switch (index())
    {
    case BOOL:          return std::get<bool> (*this);
    case INT64:         return std::get<int64> (*this);
    case DOUBLE: {
      const double d = std::get<double> (*this);
      return std::isfinite (d) && std::abs (d) < 9.2233720368547758e18 ? int64 (d) : 0; }
    case STRING:        return strtoll (std::get<String> (*this).c_str(), nullptr, 10);
    case ARRAY:         return !std::get<ValueA> (*this).empty();
    case RESOURCE:      return std::get<ResourceP> (*this) ? std::get<ResourceP> (*this)->id() : 0;
    case INSTANCE:      return 1;
    case NONE:          ;
    }
  return 0;
}

/// Convert to floating point, strings are parsed with a leading number.
double
Value::as_double () const
{
  switch (index())
    {
    case DOUBLE:        return std::get<double> (*this);
    case STRING:        return strtod (std::get<String> (*this).c_str(), nullptr);
    default:            return as_int();
    }
}

/// Convert to string as the runtime casts values, arrays yield "Array".
String
Value::as_string () const
{
  switch (index())
    {
    case NONE:          return "";
    case BOOL:          return std::get<bool> (*this) ? "1" : "";
    case INT64:         return string_from_int (std::get<int64> (*this));
    case DOUBLE:        return string_from_double (std::get<double> (*this));
    case STRING:        return std::get<String> (*this);
    case ARRAY:         return "Array";
    case INSTANCE:      return std::get<InstanceP> (*this) ? std::get<InstanceP> (*this)->class_name() : "";
    case RESOURCE:      return std::get<ResourceP> (*this) ? string_format ("Resource id #%lld", (long long) std::get<ResourceP> (*this)->id()) : "";
    }
  return "";
}

const ValueA&
Value::as_array () const
{
  static const ValueA empty_array;
  const ValueA *a = std::get_if<ValueA> (this);
  return a ? *a : empty_array;
}

InstanceP
Value::as_instance () const
{
  const InstanceP *i = std::get_if<InstanceP> (this);
  return i ? *i : nullptr;
}

ResourceP
Value::as_resource () const
{
  const ResourceP *r = std::get_if<ResourceP> (this);
  return r ? *r : nullptr;
}

/// Name of the value type as used in error messages, objects yield their class name.
String
Value::type_name () const
{
  switch (index())
    {
    case NONE:          return "null";
    case BOOL:          return "bool";
    case INT64:         return "int";
    case DOUBLE:        return "float";
    case STRING:        return "string";
    case ARRAY:         return "array";
    case INSTANCE:      return std::get<InstanceP> (*this) ? std::get<InstanceP> (*this)->class_name() : "null";
    case RESOURCE:      return "resource";
    }
  return "unknown";
}

/// Number of array elements, 0 for all other types.
size_t
Value::count () const
{
  const ValueA *a = std::get_if<ValueA> (this);
  return a ? a->size() : 0;
}

/// Structural equality, objects and resources compare by identity.
bool
Value::operator== (const Value &other) const
{
  return static_cast<const ValueVariant&> (*this) == static_cast<const ValueVariant&> (other);
}

} // Tether

#include "testing.hh"

namespace { // Anon
using namespace Tether;

TEST_INTEGRITY (value_tests);
static void
value_tests()
{
  Value v;
  TASSERT (v.index() == Value::NONE && v.is_null());
  v = true;
  TASSERT (v.index() == Value::BOOL && v.as_int() == 1 && v.as_string() == "1");
  v = int64 (-7);
  TASSERT (v.index() == Value::INT64 && v.as_double() == -7);
  v = 0.5;
  TASSERT (v.index() == Value::DOUBLE && v.as_string() == "0.5" && v.as_bool());
  v = "0";
  TASSERT (v.index() == Value::STRING && !v.as_bool());
  TCMP (Value (ValueA { 1, 2 }).count(), ==, 2u);
  // key normalization
  TASSERT (ValueA::key_from ("12") == ValueKey (int64 (12)));
  TASSERT (ValueA::key_from ("012") == ValueKey (String ("012")));
  TASSERT (ValueA::key_from (true) == ValueKey (int64 (1)));
  TASSERT (ValueA::key_from (Value()) == ValueKey (String ("")));
  TASSERT (ValueA::key_from (2.7) == ValueKey (int64 (2)));
  TTHROWS (ValueA::key_from (ValueA{}), TypeError);
  // ordering and lists
  ValueA a { "a", "b", "c" };
  TASSERT (a.is_list() && a.next_index() == 3);
  a.set (String ("x"), 5);
  TASSERT (!a.is_list());
  a.append ("d");
  TASSERT (a.has (int64 (3)) && a.get (int64 (3)) == Value ("d"));
  TASSERT (a.erase (int64 (0)) && !a.has (int64 (0)));
  TCMP (string_join (",", a.string_keys()), ==, "1,2,x,3");
  a.set (int64 (1), "B");
  TCMP (string_join (",", a.string_keys()), ==, "1,2,x,3");
  TASSERT (a.get (int64 (1)) == Value ("B"));
  // copies are independent
  ValueA b = a;
  b.set (int64 (1), "changed");
  TASSERT (a.get (int64 (1)) == Value ("B"));
  TASSERT (a != b);
  ValueA r = ValueA::record ({ { "name", "x" }, { "7", 7 } });
  TASSERT (r.has (int64 (7)) && r.has (String ("name")));
  TASSERT (Value (ValueA { 1, 2.0 }) == Value (ValueA { 1, 2.0 }));
  TASSERT (Value (ValueA { 1, 2.0 }) != Value (ValueA { 1, 2 }));
}

} // Anon
