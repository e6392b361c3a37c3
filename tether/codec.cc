// This Source Code Form is licensed MPL-2.0: http://mozilla.org/MPL/2.0
#include "codec.hh"
#include "errors.hh"
#include "utils.hh"
#include "internal.hh"
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>
#include <cmath>

namespace Tether {

static JsonValue
tagged (const char *type, JsonValue &value, JsonAllocator &a)
{
  JsonValue wire (rapidjson::kObjectType);
  wire.AddMember ("type", rapidjson::StringRef (type), a);
  wire.AddMember ("value", value, a); // moves value
  return wire;
}

static JsonValue
json_string (const String &s, JsonAllocator &a)
{
  return JsonValue (s.data(), rapidjson::SizeType (s.size()), a);
}

/// Encode `value` as tagged wire value, objects and resources are entered into the store.
JsonValue
Codec::encode (const Value &value, JsonAllocator &a)
{
  JsonValue v;
  switch (value.index())
    {
    case Value::NONE:
      return tagged ("NULL", v, a);
    case Value::BOOL:
      v = JsonValue (std::get<bool> (value));
      return tagged ("boolean", v, a);
    case Value::INT64:
      v = JsonValue (int64_t (std::get<int64> (value)));
      return tagged ("integer", v, a);
    case Value::DOUBLE: {
      const double d = std::get<double> (value);
      if (std::isnan (d))
        v = JsonValue (rapidjson::StringRef ("NAN"));
      else if (std::isinf (d))
        v = JsonValue (rapidjson::StringRef (d > 0 ? "INF" : "-INF"));
      else
        v = JsonValue (d);
      return tagged ("double", v, a); }
    case Value::STRING:
      v = json_string (std::get<String> (value), a);
      return tagged ("string", v, a);
    case Value::ARRAY: {
      const ValueA &array = std::get<ValueA> (value);
      if (array.is_list())
        {
          v.SetArray();
          for (const ValueEntry &e : array)
            {
              JsonValue element = encode (*e.value, a);
              v.PushBack (element, a);
            }
        }
      else
        {
          v.SetObject();
          for (const ValueEntry &e : array)
            {
              JsonValue name = json_string (key_to_string (e.key), a);
              JsonValue element = encode (*e.value, a);
              v.AddMember (name, element, a);
            }
        }
      return tagged ("array", v, a); }
    case Value::INSTANCE: {
      InstanceP object = value.as_instance();
      if (!object)
        throw EncodingError ("Cannot encode an empty object slot");
      const String classname = object->class_name();
      if (classname.empty())
        throw EncodingError (string_format ("Cannot encode object of unregistered type %s", typeid_name (*object)));
      JsonValue cname = json_string (classname, a);
      JsonValue hash = json_string (store_.encode (object), a);
      v.SetObject();
      v.AddMember ("class", cname, a);
      v.AddMember ("hash", hash, a);
      return tagged ("object", v, a); }
    case Value::RESOURCE: {
      ResourceP resource = value.as_resource();
      if (!resource)
        throw EncodingError ("Cannot encode an empty resource slot");
      JsonValue kind = json_string (resource->kind(), a);
      JsonValue hash (int64_t (store_.encode (resource)));
      v.SetObject();
      v.AddMember ("type", kind, a);
      v.AddMember ("hash", hash, a);
      return tagged ("resource", v, a); }
    }
  throw EncodingError ("Cannot encode value of unknown type");
}

/// Encode the error response for an exception of `kind`.
JsonValue
Codec::encode_exception (const String &kind, const String &message, JsonAllocator &a)
{
  JsonValue jkind = json_string (kind, a);
  JsonValue jmessage = json_string (message, a);
  JsonValue v (rapidjson::kObjectType);
  v.AddMember ("type", jkind, a);
  v.AddMember ("message", jmessage, a);
  return tagged ("thrownException", v, a);
}

static const JsonValue*
find_member (const JsonValue &object, const char *name)
{
  if (!object.IsObject())
    return nullptr;
  auto it = object.FindMember (name);
  return it == object.MemberEnd() ? nullptr : &it->value;
}

static String
json_to_string (const JsonValue &v)
{
  return String (v.GetString(), v.GetStringLength());
}

/// Decode a tagged wire value, the inverse of encode().
Value
Codec::decode (const JsonValue &wire) const
{
  const JsonValue *jtype = find_member (wire, "type");
  const JsonValue *v = find_member (wire, "value");
  if (!jtype || !jtype->IsString() || !v)
    throw DecodingError ("Wire value requires 'type' and 'value' members");
  const String type = json_to_string (*jtype);
  auto invalid = [&type] () {
    return DecodingError (string_format ("Invalid value for type '%s'", type));
  };
  if (type == "NULL")
    return Value();
  if (type == "boolean")
    {
      if (!v->IsBool())
        throw invalid();
      return v->GetBool();
    }
  if (type == "integer")
    {
      if (!v->IsInt64())
        throw invalid();
      return int64 (v->GetInt64());
    }
  if (type == "double")
    {
      if (v->IsNumber())
        return v->GetDouble();
      const String s = v->IsString() ? json_to_string (*v) : "";
      if (s == "NAN")
        return double (NAN);
      if (s == "INF")
        return double (INFINITY);
      if (s == "-INF")
        return -double (INFINITY);
      throw invalid();
    }
  if (type == "string")
    {
      if (!v->IsString())
        throw invalid();
      return json_to_string (*v);
    }
  if (type == "array")
    {
      ValueA array;
      if (v->IsArray())
        for (const auto &element : v->GetArray())
          array.append (decode (element));
      else if (v->IsObject())
        for (const auto &m : v->GetObject())
          array.set (ValueA::key_from (json_to_string (m.name)), decode (m.value));
      else
        throw invalid();
      return array;
    }
  if (type == "object")
    {
      const JsonValue *hash = v->IsObject() ? find_member (*v, "hash") : v;
      if (!hash || !hash->IsString())
        throw invalid();
      return store_.decode_object (json_to_string (*hash));
    }
  if (type == "resource")
    {
      const JsonValue *hash = v->IsObject() ? find_member (*v, "hash") : v;
      if (!hash || !hash->IsInt64())
        throw invalid();
      return store_.decode_resource (hash->GetInt64());
    }
  if (type == "thrownException")
    {
      const JsonValue *message = find_member (*v, "message");
      throw Exception (message && message->IsString() ? json_to_string (*message) : "");
    }
  throw DecodingError (string_format ("Unknown type '%s'", type));
}

/// Decode a JSON array of wire values, as used for argument lists.
ValueS
Codec::decode_list (const JsonValue &wires) const
{
  if (!wires.IsArray())
    throw DecodingError ("Expected an array of wire values");
  ValueS values;
  for (const auto &w : wires.GetArray())
    values.push_back (decode (w));
  return values;
}

String
jsonvalue_to_string (const JsonValue &value)
{
  rapidjson::StringBuffer buffer;
  rapidjson::Writer<rapidjson::StringBuffer, rapidjson::UTF8<>, rapidjson::UTF8<>, rapidjson::CrtAllocator,
                    rapidjson::kWriteValidateEncodingFlag> writer (buffer);
  if (!value.Accept (writer))
    throw EncodingError ("Cannot encode string with invalid UTF-8");
  return String (buffer.GetString(), buffer.GetSize());
}

} // Tether

#include "testing.hh"
#include "runtime.hh"

namespace { // Anon
using namespace Tether;

struct UnregisteredObject : Instance {};

struct TestStream : Resource {
  String kind () const override { return "stream"; }
};

static String
encode_string (Codec &codec, const Value &value)
{
  rapidjson::Document doc;
  JsonValue wire = codec.encode (value, doc.GetAllocator());
  return jsonvalue_to_string (wire);
}

static Value
decode_string (Codec &codec, const String &json)
{
  rapidjson::Document doc;
  doc.Parse<rapidjson::kParseFullPrecisionFlag> (json.data(), json.size());
  TASSERT (!doc.HasParseError());
  return codec.decode (doc);
}

TEST_INTEGRITY (codec_tests);
static void
codec_tests()
{
  Runtime runtime;
  ObjectStore store;
  Codec codec (store);
  // scalars and arrays
  TCMP (encode_string (codec, int64 (-5)), ==, "{\"type\":\"integer\",\"value\":-5}");
  TCMP (encode_string (codec, 2.0), ==, "{\"type\":\"double\",\"value\":2.0}");
  TCMP (encode_string (codec, Value()), ==, "{\"type\":\"NULL\",\"value\":null}");
  TCMP (encode_string (codec, "a\nb"), ==, "{\"type\":\"string\",\"value\":\"a\\nb\"}");
  TCMP (encode_string (codec, ValueA { true }), ==, "{\"type\":\"array\",\"value\":[{\"type\":\"boolean\",\"value\":true}]}");
  ValueA sparse;
  sparse.set (int64 (3), "x");
  sparse.set ("k", Value());
  TCMP (encode_string (codec, sparse), ==,
        "{\"type\":\"array\",\"value\":{\"3\":{\"type\":\"string\",\"value\":\"x\"},\"k\":{\"type\":\"NULL\",\"value\":null}}}");
  const ValueA nested { int64 (1), 0.25, "s", ValueA::record ({ { "a", ValueA { Value(), false } }, { "7", I63MIN } }) };
  TASSERT (decode_string (codec, encode_string (codec, nested)) == nested);
  TASSERT (decode_string (codec, encode_string (codec, sparse)) == sparse);
  // non-finite doubles
  TCMP (encode_string (codec, -double (INFINITY)), ==, "{\"type\":\"double\",\"value\":\"-INF\"}");
  const Value nan = decode_string (codec, encode_string (codec, double (NAN)));
  TASSERT (nan.index() == Value::DOUBLE && std::isnan (std::get<double> (nan)));
  TASSERT (decode_string (codec, "{\"type\":\"double\",\"value\":\"INF\"}") == Value (double (INFINITY)));
  TASSERT (decode_string (codec, "{\"type\":\"double\",\"value\":3}") == Value (3.0));
  // objects and resources keep their identity
  InstanceP object = StdClass::create (ValueA::record ({ { "x", 1 } }));
  const String first = encode_string (codec, object);
  TCMP (encode_string (codec, object), ==, first);
  TCMP (store.n_objects(), ==, 1u);
  TASSERT (decode_string (codec, first) == Value (object));
  const String handle = ObjectStore::object_handle (*object);
  TASSERT (decode_string (codec, "{\"type\":\"object\",\"value\":\"" + handle + "\"}") == Value (object));
  ResourceP resource = std::make_shared<TestStream>();
  const String rwire = encode_string (codec, resource);
  TCMP (rwire, ==, string_format ("{\"type\":\"resource\",\"value\":{\"type\":\"stream\",\"hash\":%lld}}", (long long) resource->id()));
  TASSERT (decode_string (codec, rwire) == Value (resource));
  TASSERT (decode_string (codec, string_format ("{\"type\":\"resource\",\"value\":%lld}", (long long) resource->id())) == Value (resource));
  TTHROWS (decode_string (codec, string_format ("{\"type\":\"object\",\"value\":\"%lld\"}", (long long) resource->id())), HandleNotFoundError);
  // encoding errors
  TTHROWS (encode_string (codec, InstanceP (std::make_shared<UnregisteredObject>())), EncodingError);
  TTHROWS (encode_string (codec, InstanceP()), EncodingError);
  TTHROWS (encode_string (codec, "\xff\xfe"), EncodingError);
  // decoding errors
  TTHROWS (decode_string (codec, "{\"type\":\"integer\",\"value\":1.5}"), DecodingError);
  TTHROWS (decode_string (codec, "{\"type\":\"integer\",\"value\":18446744073709551615}"), DecodingError);
  TTHROWS (decode_string (codec, "{\"type\":\"double\",\"value\":\"nan\"}"), DecodingError);
  TTHROWS (decode_string (codec, "{\"type\":\"complex\",\"value\":1}"), DecodingError);
  TTHROWS (decode_string (codec, "{\"value\":1}"), DecodingError);
  TTHROWS (decode_string (codec, "[1]"), DecodingError);
  try {
    decode_string (codec, "{\"type\":\"thrownException\",\"value\":{\"type\":\"Error\",\"message\":\"boom\"}}");
    TASSERT (!"thrownException decoded as value");
  } catch (const Exception &exc) {
    TCMP (exc.kind(), ==, "Exception");
    TCMP (String (exc.what()), ==, "boom");
  }
}

} // Anon
