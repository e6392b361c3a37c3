// This Source Code Form is licensed MPL-2.0: http://mozilla.org/MPL/2.0
#include "server.hh"
#include "platform.hh"
#include "utils.hh"
#include "internal.hh"
#include <rapidjson/error/en.h>

namespace Tether {

CommandServer::CommandServer (Transport &transport, Runtime &runtime, const Representer &representer) :
  transport_ (transport), runtime_ (runtime), codec_ (store_), representer_ (representer),
  commands_ (runtime_, representer_)
{
  log_ipc_ = debug_key_enabled ("ipc");
  old_evaluator_ = runtime_.set_evaluator ([this] (const String &code, const String &origin) {
    return evaluate (code, origin);
  });
}

CommandServer::~CommandServer ()
{
  runtime_.set_evaluator (old_evaluator_);
}

void
CommandServer::log (const String &message) const
{
  printerr ("ipc: %s\n", message);
}

/// Parse, decode and execute a single request, errors propagate.
Value
CommandServer::execute_line (const String &line)
{
  rapidjson::Document document;
  document.Parse<rapidjson::kParseFullPrecisionFlag> (line.data(), line.size());
  if (document.HasParseError())
    throw DecodingError (string_format ("Invalid JSON at offset %d: %s", int (document.GetErrorOffset()),
                                        rapidjson::GetParseError_En (document.GetParseError())));
  const Request request = parse_request (document, codec_);
  Runtime::Scope scope (runtime_);
  return commands_.execute (request);
}

/// Serialize a `thrownException` response.
String
CommandServer::exception_reply (const String &kind, const String &message)
{
  JsonAllocator allocator;
  if (!string_is_utf8 (kind) || !string_is_utf8 (message))
    return jsonvalue_to_string (codec_.encode_exception ("EncodingError", "Exception message contains invalid UTF-8", allocator));
  return jsonvalue_to_string (codec_.encode_exception (kind, message, allocator));
}

/// Produce the response line for a request line, every std::exception is answered as `thrownException`.
String
CommandServer::handle (const String &line)
{
  try {
    const Value result = execute_line (line);
    JsonAllocator allocator;
    return jsonvalue_to_string (codec_.encode (result, allocator));
  } catch (const std::exception &exc) {
    return exception_reply (exception_kind (exc), exc.what());
  }
}

/// Run newline separated requests as script, yields the value of the last request.
Value
CommandServer::evaluate (const String &code, const String &origin)
{
  Value result;
  size_t lineno = 0;
  for (const String &line : string_split (code, "\n"))
    {
      lineno++;
      const String request = string_strip (line);
      if (request.empty() || request[0] == '#')
        continue;
      debug ("eval", "%s:%d: %s", origin, int (lineno), request);
      result = execute_line (request);
    }
  return result;
}

/// Serve requests until the transport reports end of stream.
void
CommandServer::run ()
{
  for (;;)
    {
      const std::optional<String> line = transport_.receive();
      if (!line)
        break;
      if (string_strip (*line).empty())
        continue;
      n_requests_++;
      if (log_ipc_)
        log (string_format ("→ %s", *line));
      const String reply = handle (*line);
      if (log_ipc_)
        {
          if (reply.compare (0, 26, "{\"type\":\"thrownException\",") == 0)
            {
              using namespace AnsiColors;
              auto R1 = color (BOLD) + color (FG_RED), R0 = color (FG_DEFAULT) + color (BOLD_OFF);
              log (string_format ("%s←%s %s", R1, R0, reply));
            }
          else
            log (string_format ("← %s", reply));
        }
      transport_.send (reply);
    }
  debug ("ipc", "end of stream after %d requests", int (n_requests_));
}

} // Tether

#include "testing.hh"
#include "binding.hh"
#include <cmath>
#include <cstdlib>

namespace { // Anon
using namespace Tether;

class TestPoint : public Instance {
public:
  explicit
  TestPoint (double x, double y)
  {
    props().set ("x", x);
    props().set ("y", y);
  }
  double
  norm ()
  {
    return std::hypot (props().get ("x").as_double(), props().get ("y").as_double());
  }
};

class TestLabel : public Instance {};

static void
register_test_point ()
{
  static const bool registered = [] () {
    Class<TestLabel> ("TetherTestLabel", "Label with a declared default")
      .property ("text", "none", "Displayed text");
    Class<TestPoint> ("TetherTestPoint", "Point with declared coordinates")
      .constructor<double, double> ("Create a point", { { "x", 0.0 }, { "y", 0.0 } })
      .property ("x", 0.0, "Horizontal coordinate")
      .property ("y", 0.0, "Vertical coordinate")
      .property ("tag", "", "Hidden label", PropertyInfo::PRIVATE)
      .constant ("ORIGIN", ValueA { 0.0, 0.0 })
      .method ("norm", &TestPoint::norm, "Distance from the origin", {});
    return true;
  } ();
  (void) registered;
}

static String
request (const char *cmd, const String &data)
{
  return string_format ("{\"cmd\":\"%s\",\"data\":%s}", cmd, data);
}

/// Extract the `value` member of a wire response as JSON text.
static String
wire_member (const String &reply, const char *member)
{
  rapidjson::Document doc;
  doc.Parse<rapidjson::kParseFullPrecisionFlag> (reply.data(), reply.size());
  TASSERT (!doc.HasParseError() && doc.IsObject() && doc.HasMember ("value"));
  const JsonValue &value = doc["value"];
  TASSERT (value.IsObject() && value.HasMember (member));
  return jsonvalue_to_string (value[member]);
}

static const char *const exhausted = "{\"type\":\"array\",\"value\":[{\"type\":\"boolean\",\"value\":false},"
                                     "{\"type\":\"NULL\",\"value\":null},{\"type\":\"NULL\",\"value\":null}]}";

TEST_INTEGRITY (server_session_tests);
static void
server_session_tests()
{
  register_test_point();
  Runtime runtime;
  Runtime::WarningHandler old = Runtime::set_warning_handler (nullptr);
  Runtime::promote_warnings();
  MemoryTransport transport ({
      request ("callFun", "{\"name\":\"array_flip\",\"args\":[{\"type\":\"array\",\"value\":"
               "[{\"type\":\"string\",\"value\":\"foo\"},{\"type\":\"string\",\"value\":\"bar\"}]}]}"),
      request ("getConst", "\"DOES_NOT_EXIST\""),
      "",
      request ("getConst", "\"INT_SIZE\""),
      "{\"cmd\":",
      request ("noSuchCommand", "null"),
      request ("callFun", "{\"name\":\"array_flip\",\"args\":[{\"type\":\"array\",\"value\":[{\"type\":\"double\",\"value\":1.5}]}]}"),
      request ("getConst", "\"NAN\""),
      request ("setGlobal", "{\"name\":\"v\",\"value\":{\"type\":\"array\",\"value\":{\"a\":{\"type\":\"double\",\"value\":2.0},"
               "\"7\":{\"type\":\"double\",\"value\":\"-INF\"},\"b\":{\"type\":\"array\",\"value\":[]}}}}"),
      request ("getGlobal", "\"v\""),
  });
  CommandServer server (transport, runtime);
  server.run();
  TCMP (server.n_requests(), ==, 9u);
  const StringS &sent = transport.sent();
  TCMP (sent.size(), ==, 9u);
  // function call scenario
  TCMP (sent[0], ==, "{\"type\":\"array\",\"value\":{\"foo\":{\"type\":\"integer\",\"value\":0},\"bar\":{\"type\":\"integer\",\"value\":1}}}");
  // missing constant, the session stays usable
  TCMP (sent[1], ==, "{\"type\":\"thrownException\",\"value\":{\"type\":\"Error\",\"message\":\"Constant 'DOES_NOT_EXIST' is not defined\"}}");
  TCMP (sent[2], ==, "{\"type\":\"integer\",\"value\":8}");
  // malformed requests
  TCMP (sent[3].compare (0, 68, "{\"type\":\"thrownException\",\"value\":{\"type\":\"DecodingError\",\"message\":"), ==, 0);
  TCMP (sent[4], ==, "{\"type\":\"thrownException\",\"value\":{\"type\":\"DecodingError\",\"message\":\"Unknown command 'noSuchCommand'\"}}");
  // promoted warning
  TCMP (sent[5], ==, "{\"type\":\"thrownException\",\"value\":{\"type\":\"ErrorException\","
        "\"message\":\"array_flip(): Can only flip string and integer values, entry skipped\"}}");
  // non-finite values and round-trip
  TCMP (sent[6], ==, "{\"type\":\"double\",\"value\":\"NAN\"}");
  TCMP (sent[7], ==, "{\"type\":\"NULL\",\"value\":null}");
  TCMP (sent[8], ==, "{\"type\":\"array\",\"value\":{\"a\":{\"type\":\"double\",\"value\":2.0},"
        "\"7\":{\"type\":\"double\",\"value\":\"-INF\"},\"b\":{\"type\":\"array\",\"value\":[]}}}");
  TASSERT (std::isinf (runtime.global ("v").as_array().get (int64 (7)).as_double()));
  // doubles keep every bit through request parsing and response writing
  static const char *const doubles[] = { "956.0342718892493", "0.12345678901234567", "2.2250738585072014e-308" };
  for (const char *digits : doubles)
    {
      const double expected = strtod (digits, nullptr);
      TCMP (server.handle (request ("setGlobal", string_format ("{\"name\":\"d\",\"value\":{\"type\":\"double\",\"value\":%s}}", digits))), ==,
            "{\"type\":\"NULL\",\"value\":null}");
      TCMP (runtime.global ("d").as_double(), ==, expected);
      const String reply = server.handle (request ("getGlobal", "\"d\""));
      rapidjson::Document echoed;
      echoed.Parse<rapidjson::kParseFullPrecisionFlag> (reply.data(), reply.size());
      TASSERT (!echoed.HasParseError() && echoed.IsObject() && echoed.HasMember ("value") && echoed["value"].IsNumber());
      TCMP (echoed["value"].GetDouble(), ==, expected);
    }
  // declared property defaults are visible through a const object
  std::shared_ptr<TestLabel> label = std::make_shared<TestLabel>();
  const Instance &clabel = *label;
  TASSERT (clabel.props().get ("text") == Value ("none"));
  label->props().set ("text", "changed");
  TASSERT (clabel.props().get ("text") == Value ("changed"));
  TCMP (clabel.props().size(), ==, 1u);
  // object property round-trip on a class with declared properties
  const String point = server.handle (request ("createObject", "{\"name\":\"TetherTestPoint\",\"args\":[{\"type\":\"double\",\"value\":1.5},"
                                               "{\"type\":\"integer\",\"value\":2}]}"));
  TCMP (wire_member (point, "class"), ==, "\"TetherTestPoint\"");
  const String &pwire = point;
  TCMP (server.handle (request ("getProperty", "{\"obj\":" + pwire + ",\"name\":\"x\"}")), ==, "{\"type\":\"double\",\"value\":1.5}");
  TCMP (server.handle (request ("getProperty", "{\"obj\":" + pwire + ",\"name\":\"y\"}")), ==, "{\"type\":\"double\",\"value\":2.0}");
  TCMP (server.handle (request ("callMethod", "{\"obj\":" + pwire + ",\"name\":\"norm\"}")), ==, "{\"type\":\"double\",\"value\":2.5}");
  TCMP (server.handle (request ("getProperty", "{\"obj\":" + pwire + ",\"name\":\"z\"}")), ==,
        "{\"type\":\"thrownException\",\"value\":{\"type\":\"AttributeError\",\"message\":\"Undefined property: TetherTestPoint::$z\"}}");
  TCMP (server.handle (request ("getProperty", "{\"obj\":" + pwire + ",\"name\":\"tag\"}")), ==,
        "{\"type\":\"thrownException\",\"value\":{\"type\":\"Error\",\"message\":\"Cannot access private property TetherTestPoint::$tag\"}}");
  TCMP (server.handle (request ("setProperty", "{\"obj\":" + pwire + ",\"name\":\"extra\",\"value\":{\"type\":\"boolean\",\"value\":true}}")), ==,
        "{\"type\":\"NULL\",\"value\":null}");
  TCMP (server.handle (request ("listNonDefaultProperties", pwire)), ==,
        "{\"type\":\"array\",\"value\":[{\"type\":\"string\",\"value\":\"extra\"}]}");
  const String info = server.handle (request ("classInfo", "\"tetherTESTpoint\""));
  TCMP (wire_member (info, "name"), ==, "{\"type\":\"string\",\"value\":\"TetherTestPoint\"}");
  TASSERT (info.find ("\"ORIGIN\"") != String::npos && info.find ("\"norm\"") != String::npos);
  TASSERT (info.find ("\"tag\"") == String::npos);
  // identity stability
  const String hash = wire_member (point, "hash");
  TCMP (server.handle (request ("setGlobal", "{\"name\":\"p\",\"value\":" + pwire + "}")), ==, "{\"type\":\"NULL\",\"value\":null}");
  TCMP (server.handle (request ("getGlobal", "\"p\"")), ==, point);
  TCMP (server.handle (request ("getGlobal", "\"p\"")), ==, point);
  const String bare = "{\"type\":\"object\",\"value\":" + hash + "}";
  TCMP (server.handle (request ("callMethod", "{\"obj\":" + bare + ",\"name\":\"norm\"}")), ==, "{\"type\":\"double\",\"value\":2.5}");
  InstanceP p1 = server.store().decode_object (hash.substr (1, hash.size() - 2));
  TASSERT (p1 == runtime.global ("p").as_instance());
  const String other = server.handle (request ("createObject", "{\"name\":\"TetherTestPoint\"}"));
  TCMP (wire_member (other, "hash"), !=, hash);
  // disjoint identity spaces
  const String stream = server.handle (request ("callFun", "{\"name\":\"tmpfile\"}"));
  TCMP (wire_member (stream, "type"), ==, "\"stream\"");
  TCMP (server.store().n_resources(), ==, 1u);
  TCMP (server.store().n_objects(), ==, 2u);
  const String rhash = wire_member (stream, "hash");
  TCMP (server.handle (request ("getProperty", "{\"obj\":{\"type\":\"object\",\"value\":\"" + rhash + "\"},\"name\":\"x\"}")).find ("HandleNotFoundError"),
        !=, String::npos);
  // resolveName precedence
  TCMP (server.handle (request ("setConst", "{\"name\":\"strlen\",\"value\":{\"type\":\"integer\",\"value\":3}}")), ==, "{\"type\":\"NULL\",\"value\":null}");
  TCMP (server.handle (request ("resolveName", "\"strlen\"")), ==,
        "{\"type\":\"array\",\"value\":[{\"type\":\"string\",\"value\":\"const\"},{\"type\":\"integer\",\"value\":3}]}");
  TCMP (server.handle (request ("resolveName", "\"STRLEN\"")), ==,
        "{\"type\":\"array\",\"value\":[{\"type\":\"string\",\"value\":\"func\"},{\"type\":\"string\",\"value\":\"strlen\"}]}");
  TCMP (server.handle (request ("resolveName", "\"nothing_here\"")), ==,
        "{\"type\":\"array\",\"value\":[{\"type\":\"string\",\"value\":\"none\"},{\"type\":\"NULL\",\"value\":null}]}");
  // iteration exhaustion
  const String cursor = server.handle (request ("startIteration", "{\"type\":\"array\",\"value\":{\"a\":{\"type\":\"integer\",\"value\":1},"
                                                "\"b\":{\"type\":\"integer\",\"value\":2}}}"));
  TCMP (wire_member (cursor, "class"), ==, "\"Generator\"");
  const String cursor_data = "{\"type\":\"object\",\"value\":" + wire_member (cursor, "hash") + "}";
  TCMP (server.handle (request ("nextIteration", cursor_data)), ==, "{\"type\":\"array\",\"value\":[{\"type\":\"boolean\",\"value\":true},"
        "{\"type\":\"string\",\"value\":\"a\"},{\"type\":\"integer\",\"value\":1}]}");
  TCMP (server.handle (request ("nextIteration", cursor_data)), ==, "{\"type\":\"array\",\"value\":[{\"type\":\"boolean\",\"value\":true},"
        "{\"type\":\"string\",\"value\":\"b\"},{\"type\":\"integer\",\"value\":2}]}");
  TCMP (server.handle (request ("nextIteration", cursor_data)), ==, exhausted);
  TCMP (server.handle (request ("nextIteration", cursor_data)), ==, exhausted);
  TCMP (server.handle (request ("nextIteration", pwire)).find ("\"TypeError\""), !=, String::npos);
  // responses that cannot be serialized
  TCMP (server.handle (request ("callFun", "{\"name\":\"substr\",\"args\":[{\"type\":\"string\",\"value\":\"\\u00e4\"},"
                                "{\"type\":\"integer\",\"value\":1}]}")).find ("\"EncodingError\""), !=, String::npos);
  // exception messages carrying invalid UTF-8 from the request
  TCMP (server.handle (request ("getConst", "\"\xff\"")), ==,
        "{\"type\":\"thrownException\",\"value\":{\"type\":\"EncodingError\",\"message\":\"Exception message contains invalid UTF-8\"}}");
  // eval runs requests of the command language
  const String script = request ("setGlobal", "{\"name\":\"e\",\"value\":{\"type\":\"integer\",\"value\":5}}") + "\n\n# comment\n" +
                        request ("getGlobal", "\"e\"");
  rapidjson::Document doc (rapidjson::kObjectType);
  const String script_json = jsonvalue_to_string (JsonValue (script.data(), rapidjson::SizeType (script.size()), doc.GetAllocator()));
  TCMP (server.handle (request ("callFun", "{\"name\":\"eval\",\"args\":[{\"type\":\"string\",\"value\":" + script_json + "}]}")), ==,
        "{\"type\":\"integer\",\"value\":5}");
  TCMP (server.handle (request ("callFun", "{\"name\":\"eval\",\"args\":[{\"type\":\"string\",\"value\":\"[]\"}]}")).find ("DecodingError"),
        !=, String::npos);
  // exit leaves the session without a response
  MemoryTransport exiting ({ request ("callFun", "{\"name\":\"exit\",\"args\":[{\"type\":\"integer\",\"value\":3}]}"),
                             request ("getConst", "\"INT_SIZE\"") });
  int status = -1;
  try {
    CommandServer exiting_server (exiting, runtime);
    exiting_server.run();
  } catch (const SessionExit &session_exit) {
    status = session_exit.status;
  }
  TCMP (status, ==, 3);
  TCMP (exiting.sent().size(), ==, 0u);
  Runtime::set_warning_handler (old);
}

} // Anon
