// This Source Code Form is licensed MPL-2.0: http://mozilla.org/MPL/2.0
#include "streams.hh"
#include "binding.hh"
#include "internal.hh"
#include <cerrno>

namespace Tether {

StreamResource::StreamResource (FILE *file) :
  file_ (file)
{}

StreamResource::~StreamResource ()
{
  close();
}

String
StreamResource::kind () const
{
  return file_ ? "stream" : "Unknown";
}

bool
StreamResource::close ()
{
  return_unless (file_, false);
  const int r = fclose (file_);
  file_ = nullptr;
  return r == 0;
}

/// Open `path` with fopen(3) `mode`, yields nullptr and sets errno on failure.
ResourceP
StreamResource::open (const String &path, const String &mode)
{
  FILE *file = fopen (path.c_str(), mode.c_str());
  return_unless (file, nullptr);
  return std::make_shared<StreamResource> (file);
}

static FILE*
stream_file (const char *func, const StreamResourceP &stream)
{
  if (!stream->file())
    throw TypeError (string_format ("%s(): supplied resource is not a valid stream resource", func));
  return stream->file();
}

static Value
builtin_fopen (const String &filename, const String &mode)
{
  ResourceP stream = StreamResource::open (filename, mode);
  if (!stream)
    {
      Runtime::warning (string_format ("fopen(%s): Failed to open stream: %s", filename, string_from_errno (errno)));
      return false;
    }
  return stream;
}

static Value
builtin_tmpfile ()
{
  FILE *file = tmpfile();
  if (!file)
    {
      Runtime::warning (string_format ("tmpfile(): Failed to create temporary file: %s", string_from_errno (errno)));
      return false;
    }
  return ResourceP (std::make_shared<StreamResource> (file));
}

/// Read a line including its newline, at most `length - 1` bytes, false at end of file.
static Value
builtin_fgets (const StreamResourceP &stream, const Value &length)
{
  FILE *file = stream_file ("fgets", stream);
  int64 limit = I63MAX;
  if (!length.is_null())
    {
      limit = length.as_int();
      if (limit <= 0)
        throw ValueError ("fgets(): Argument #2 ($length) must be greater than 0");
      limit -= 1;
    }
  String line;
  int c = 0;
  while (int64 (line.size()) < limit && (c = fgetc (file)) != EOF)
    {
      line += char (c);
      if (c == '\n')
        break;
    }
  if (line.empty())
    return false;
  return line;
}

static Value
builtin_fread (const StreamResourceP &stream, int64 length)
{
  FILE *file = stream_file ("fread", stream);
  if (length <= 0)
    throw ValueError ("fread(): Argument #2 ($length) must be greater than 0");
  String data (length, 0);
  const size_t n = fread (&data[0], 1, data.size(), file);
  if (n == 0 && ferror (file))
    return false;
  data.resize (n);
  return data;
}

static Value
builtin_fwrite (const StreamResourceP &stream, const String &data)
{
  FILE *file = stream_file ("fwrite", stream);
  const size_t n = fwrite (data.data(), 1, data.size(), file);
  if (n < data.size() && ferror (file))
    {
      Runtime::warning (string_format ("fwrite(): Write of %d bytes failed: %s", int (data.size()), string_from_errno (errno)));
      return false;
    }
  fflush (file);
  return int64 (n);
}

static bool
builtin_feof (const StreamResourceP &stream)
{
  FILE *file = stream_file ("feof", stream);
  const int c = fgetc (file);
  if (c == EOF)
    return true;
  ungetc (c, file);
  return false;
}

static bool
builtin_rewind (const StreamResourceP &stream)
{
  return fseek (stream_file ("rewind", stream), 0, SEEK_SET) == 0;
}

static bool
builtin_fclose (const StreamResourceP &stream)
{
  stream_file ("fclose", stream);
  return stream->close();
}

static String
get_resource_type (const ResourceP &resource)
{
  return resource->kind();
}

static int64
get_resource_id (const ResourceP &resource)
{
  return resource->id();
}

void
register_builtin_streams ()
{
  register_function ("fopen", builtin_fopen, "Open a file, yields false on failure", { "filename", "mode" });
  register_function ("tmpfile", builtin_tmpfile, "Create a temporary file that is removed once closed", {});
  register_function ("fgets", builtin_fgets, "Get a line from a stream", { "stream", { "length", Value() } });
  register_function ("fread", builtin_fread, "Binary-safe read of up to length bytes", { "stream", "length" });
  register_function ("fwrite", builtin_fwrite, "Binary-safe write to a stream", { "stream", "data" });
  register_function ("feof", builtin_feof, "Test for end-of-file on a stream", { "stream" });
  register_function ("rewind", builtin_rewind, "Rewind the position of a stream", { "stream" });
  register_function ("fclose", builtin_fclose, "Close an open stream", { "stream" });
  register_function ("get_resource_type", get_resource_type, "Return the resource type", { "resource" });
  register_function ("get_resource_id", get_resource_id, "Return an integer identifier for the given resource", { "resource" });
}

} // Tether

#include "testing.hh"

namespace { // Anon
using namespace Tether;

TEST_INTEGRITY (streams_tests);
static void
streams_tests()
{
  Runtime runtime;
  Runtime::Scope scope (runtime);
  ValueS args;
  const Value tmp = runtime.call_function ("tmpfile", args);
  TCMP (tmp.index(), ==, Value::RESOURCE);
  TCMP (tmp.as_resource()->kind(), ==, "stream");
  args = { tmp, "first\nsecond" };
  TASSERT (runtime.call_function ("fwrite", args) == Value (int64 (12)));
  args = { tmp };
  TASSERT (runtime.call_function ("rewind", args).as_bool());
  args = { tmp };
  TASSERT (runtime.call_function ("fgets", args) == Value ("first\n"));
  args = { tmp, int64 (4) };
  TASSERT (runtime.call_function ("fgets", args) == Value ("sec"));
  args = { tmp };
  TASSERT (!runtime.call_function ("feof", args).as_bool());
  args = { tmp };
  TASSERT (runtime.call_function ("fgets", args) == Value ("ond"));
  args = { tmp };
  TASSERT (runtime.call_function ("fgets", args) == Value (false));
  args = { tmp };
  TASSERT (runtime.call_function ("fclose", args).as_bool());
  TCMP (tmp.as_resource()->kind(), ==, "Unknown");
  args = { tmp };
  TASSERT (runtime.call_function ("gettype", args) == Value ("resource (closed)"));
  args = { tmp };
  TTHROWS (runtime.call_function ("fgets", args), TypeError);
  args = { "abc" };
  TTHROWS (runtime.call_function ("feof", args), TypeError);
  Runtime::WarningHandler old = Runtime::set_warning_handler ([] (const String &m) { throw ErrorException (m); });
  args = { "/nonexistent/tether/file", "r" };
  TTHROWS (runtime.call_function ("fopen", args), ErrorException);
  Runtime::set_warning_handler (old);
}

} // Anon
