// This Source Code Form is licensed MPL-2.0: http://mozilla.org/MPL/2.0
#include "request.hh"
#include "errors.hh"
#include "utils.hh"
#include "internal.hh"
#include <cstring>

namespace Tether {

namespace { // Anon

/// Field access on the `data` member of a command.
struct Fields {
  const char      *cmd;
  const JsonValue &data;
  const Codec     &codec;
  const JsonValue&
  member (const char *name) const
  {
    if (!data.IsObject())
      throw DecodingError (string_format ("%s: data must be an object", cmd));
    auto it = data.FindMember (name);
    if (it == data.MemberEnd())
      throw DecodingError (string_format ("%s: missing field '%s'", cmd, name));
    return it->value;
  }
  String
  string (const char *name) const
  {
    const JsonValue &m = member (name);
    if (!m.IsString())
      throw DecodingError (string_format ("%s: field '%s' must be a string", cmd, name));
    return String (m.GetString(), m.GetStringLength());
  }
  Value
  value (const char *name) const
  {
    return codec.decode (member (name));
  }
  /// Argument list, an absent list means no arguments.
  ValueS
  args () const
  {
    if (data.IsObject() && !data.HasMember ("args"))
      return {};
    return codec.decode_list (member ("args"));
  }
  String
  data_string () const
  {
    if (!data.IsString())
      throw DecodingError (string_format ("%s: data must be a string", cmd));
    return String (data.GetString(), data.GetStringLength());
  }
  Value
  data_value () const
  {
    return codec.decode (data);
  }
};

using Parser = Request (*) (const Fields &f);

struct ParserEntry {
  const char *name;
  Parser      parse;
};

static const ParserEntry parsers[] = {
  { "getConst",         [] (const Fields &f) -> Request { return GetConstRequest { f.data_string() }; } },
  { "setConst",         [] (const Fields &f) -> Request { return SetConstRequest { f.string ("name"), f.value ("value") }; } },
  { "getGlobal",        [] (const Fields &f) -> Request { return GetGlobalRequest { f.data_string() }; } },
  { "setGlobal",        [] (const Fields &f) -> Request { return SetGlobalRequest { f.string ("name"), f.value ("value") }; } },
  { "callFun",          [] (const Fields &f) -> Request { return CallFunRequest { f.string ("name"), f.args() }; } },
  { "createObject",     [] (const Fields &f) -> Request { return CreateObjectRequest { f.string ("name"), f.args() }; } },
  { "callObj",          [] (const Fields &f) -> Request { return CallObjRequest { f.value ("obj"), f.args() }; } },
  { "callMethod",       [] (const Fields &f) -> Request {
      return CallMethodRequest { f.value ("obj"), f.string ("name"), f.args() }; } },
  { "hasItem",          [] (const Fields &f) -> Request { return HasItemRequest { f.value ("obj"), f.value ("offset") }; } },
  { "getItem",          [] (const Fields &f) -> Request { return GetItemRequest { f.value ("obj"), f.value ("offset") }; } },
  { "setItem",          [] (const Fields &f) -> Request {
      return SetItemRequest { f.value ("obj"), f.value ("offset"), f.value ("value") }; } },
  { "delItem",          [] (const Fields &f) -> Request { return DelItemRequest { f.value ("obj"), f.value ("offset") }; } },
  { "getProperty",      [] (const Fields &f) -> Request { return GetPropertyRequest { f.value ("obj"), f.string ("name") }; } },
  { "setProperty",      [] (const Fields &f) -> Request {
      return SetPropertyRequest { f.value ("obj"), f.string ("name"), f.value ("value") }; } },
  { "unsetProperty",    [] (const Fields &f) -> Request { return UnsetPropertyRequest { f.value ("obj"), f.string ("name") }; } },
  { "listProperties",   [] (const Fields &f) -> Request { return ListPropertiesRequest { f.data_value() }; } },
  { "listNonDefaultProperties", [] (const Fields &f) -> Request { return ListNonDefaultPropertiesRequest { f.data_value() }; } },
  { "classInfo",        [] (const Fields &f) -> Request { return ClassInfoRequest { f.data_string() }; } },
  { "funcInfo",         [] (const Fields &f) -> Request { return FuncInfoRequest { f.data_string() }; } },
  { "listConsts",       [] (const Fields&) -> Request { return ListConstsRequest {}; } },
  { "listGlobals",      [] (const Fields&) -> Request { return ListGlobalsRequest {}; } },
  { "listFuns",         [] (const Fields&) -> Request { return ListFunsRequest {}; } },
  { "listClasses",      [] (const Fields&) -> Request { return ListClassesRequest {}; } },
  { "resolveName",      [] (const Fields &f) -> Request { return ResolveNameRequest { f.data_string() }; } },
  { "repr",             [] (const Fields &f) -> Request { return ReprRequest { f.data_value() }; } },
  { "str",              [] (const Fields &f) -> Request { return StrRequest { f.data_value() }; } },
  { "count",            [] (const Fields &f) -> Request { return CountRequest { f.data_value() }; } },
  { "startIteration",   [] (const Fields &f) -> Request { return StartIterationRequest { f.data_value() }; } },
  { "nextIteration",    [] (const Fields &f) -> Request { return NextIterationRequest { f.data_value() }; } },
};

} // Anon

Request
parse_request (const JsonValue &message, const Codec &codec)
{
  static const JsonValue null_data;
  if (!message.IsObject())
    throw DecodingError ("Request must be an object with 'cmd' and 'data' members");
  auto cmd = message.FindMember ("cmd");
  if (cmd == message.MemberEnd() || !cmd->value.IsString())
    throw DecodingError ("Request lacks a 'cmd' string");
  auto data = message.FindMember ("data");
  const char *name = cmd->value.GetString();
  for (const ParserEntry &entry : parsers)
    if (strcmp (entry.name, name) == 0)
      return entry.parse (Fields { entry.name, data == message.MemberEnd() ? null_data : data->value, codec });
  throw DecodingError (string_format ("Unknown command '%s'", name));
}

StringS
request_names ()
{
  StringS names;
  for (const ParserEntry &entry : parsers)
    names.push_back (entry.name);
  return names;
}

} // Tether

#include "testing.hh"

namespace { // Anon
using namespace Tether;

static Request
parse (const Codec &codec, const char *json)
{
  rapidjson::Document doc;
  doc.Parse<rapidjson::kParseFullPrecisionFlag> (json);
  TASSERT (!doc.HasParseError());
  return parse_request (doc, codec);
}

TEST_INTEGRITY (request_tests);
static void
request_tests()
{
  ObjectStore store;
  Codec codec (store);
  TCMP (request_names().size(), ==, std::variant_size<Request>::value);
  Request r = parse (codec, "{\"cmd\":\"getConst\",\"data\":\"M_PI\"}");
  TASSERT (std::holds_alternative<GetConstRequest> (r) && std::get<GetConstRequest> (r).name == "M_PI");
  r = parse (codec, "{\"cmd\":\"callFun\",\"data\":{\"name\":\"strlen\",\"args\":[{\"type\":\"string\",\"value\":\"abc\"}]}}");
  TASSERT (std::holds_alternative<CallFunRequest> (r));
  TASSERT (std::get<CallFunRequest> (r).args.size() == 1 && std::get<CallFunRequest> (r).args[0] == Value ("abc"));
  r = parse (codec, "{\"cmd\":\"createObject\",\"data\":{\"name\":\"stdClass\"}}");
  TASSERT (std::get<CreateObjectRequest> (r).args.empty());
  r = parse (codec, "{\"cmd\":\"listClasses\"}");
  TASSERT (std::holds_alternative<ListClassesRequest> (r));
  r = parse (codec, "{\"cmd\":\"setItem\",\"data\":{\"obj\":{\"type\":\"array\",\"value\":[]},\"offset\":{\"type\":\"NULL\",\"value\":null},"
             "\"value\":{\"type\":\"integer\",\"value\":5}}}");
  TASSERT (std::get<SetItemRequest> (r).value == Value (int64 (5)));
  TTHROWS (parse (codec, "{\"cmd\":\"noSuchCommand\",\"data\":null}"), DecodingError);
  TTHROWS (parse (codec, "{\"data\":null}"), DecodingError);
  TTHROWS (parse (codec, "[]"), DecodingError);
  TTHROWS (parse (codec, "{\"cmd\":\"getConst\",\"data\":5}"), DecodingError);
  TTHROWS (parse (codec, "{\"cmd\":\"setGlobal\",\"data\":{\"name\":\"x\"}}"), DecodingError);
  TTHROWS (parse (codec, "{\"cmd\":\"callFun\",\"data\":{\"name\":\"f\",\"args\":{}}}"), DecodingError);
  TTHROWS (parse (codec, "{\"cmd\":\"getProperty\",\"data\":{\"obj\":{\"type\":\"object\",\"value\":\"00ff\"},\"name\":\"x\"}}"),
           HandleNotFoundError);
}

} // Anon
