// This Source Code Form is licensed MPL-2.0: http://mozilla.org/MPL/2.0
#include "transport.hh"
#include "errors.hh"
#include "utils.hh"
#include "internal.hh"
#include <unistd.h>
#include <fcntl.h>
#include <cerrno>

namespace Tether {

// == FdTransport ==
FdTransport::FdTransport (int readfd, int writefd) :
  rfd_ (readfd), wfd_ (writefd)
{}

FdTransport::FdTransport (const String &inputpath, const String &outputpath) :
  owned_ (true)
{
  rfd_ = open (inputpath.c_str(), O_RDONLY | O_CLOEXEC);
  if (rfd_ < 0)
    throw ConnectionLost (string_format ("%s: %s", inputpath, string_from_errno (errno)));
  wfd_ = open (outputpath.c_str(), O_WRONLY | O_CREAT | O_APPEND | O_CLOEXEC, 0666);
  if (wfd_ < 0)
    {
      const int saved = errno;
      ::close (rfd_);
      throw ConnectionLost (string_format ("%s: %s", outputpath, string_from_errno (saved)));
    }
}

FdTransport::~FdTransport ()
{
  if (owned_)
    {
      ::close (rfd_);
      ::close (wfd_);
    }
}

/// Read up to the next newline, a final unterminated line is delivered before end of stream.
std::optional<String>
FdTransport::receive ()
{
  for (;;)
    {
      const size_t eol = buffer_.find ('\n');
      if (eol != String::npos)
        {
          String line = buffer_.substr (0, eol);
          buffer_.erase (0, eol + 1);
          if (!line.empty() && line.back() == '\r')
            line.pop_back();
          return line;
        }
      if (eof_)
        {
          return_unless (!buffer_.empty(), std::nullopt);
          String line;
          line.swap (buffer_);
          return line;
        }
      char chunk[4096];
      ssize_t l;
      do
        l = ::read (rfd_, chunk, sizeof (chunk));
      while (l == -1 && errno == EINTR);
      if (l < 0)
        throw ConnectionLost (string_format ("read failed: %s", string_from_errno (errno)));
      if (l == 0)
        eof_ = true;
      else
        buffer_.append (chunk, l);
    }
}

void
FdTransport::send (const String &line)
{
  const String data = line + "\n";
  const char *p = data.data(), *const e = p + data.size();
  while (p < e)
    {
      ssize_t l;
      do
        l = ::write (wfd_, p, e - p);
      while (l == -1 && errno == EINTR);
      if (l < 0)
        throw ConnectionLost (string_format ("write failed: %s", string_from_errno (errno)));
      p += l;
    }
}

// == MemoryTransport ==
MemoryTransport::MemoryTransport (const StringS &lines) :
  input_ (lines)
{}

std::optional<String>
MemoryTransport::receive ()
{
  return_unless (position_ < input_.size(), std::nullopt);
  return input_[position_++];
}

void
MemoryTransport::send (const String &line)
{
  output_.push_back (line);
}

} // Tether

#include "testing.hh"

namespace { // Anon
using namespace Tether;

TEST_INTEGRITY (transport_tests);
static void
transport_tests()
{
  int up[2], down[2];
  TASSERT (pipe (up) == 0 && pipe (down) == 0);
  {
    FdTransport transport (up[0], down[1]);
    const String script = "{\"cmd\":\"a\"}\r\n\n{\"cmd\":\"b\"}\n{\"cmd\":\"c\"}";
    TCMP (write (up[1], script.data(), script.size()), ==, ssize_t (script.size()));
    close (up[1]);
    TCMP (transport.receive().value_or ("-"), ==, "{\"cmd\":\"a\"}");
    TCMP (transport.receive().value_or ("-"), ==, "");
    TCMP (transport.receive().value_or ("-"), ==, "{\"cmd\":\"b\"}");
    TCMP (transport.receive().value_or ("-"), ==, "{\"cmd\":\"c\"}");
    TASSERT (!transport.receive().has_value());
    TASSERT (!transport.receive().has_value());
    transport.send ("{\"type\":\"NULL\",\"value\":null}");
    char buffer[64] = { 0, };
    const ssize_t n = read (down[0], buffer, sizeof (buffer) - 1);
    TCMP (String (buffer, n > 0 ? n : 0), ==, "{\"type\":\"NULL\",\"value\":null}\n");
    TCMP (transport.output_fd(), ==, down[1]);
  }
  close (up[0]);
  close (down[0]);
  close (down[1]);
  TTHROWS (FdTransport ("/nonexistent/tether-input", "/dev/null"), ConnectionLost);
  MemoryTransport memory ({ "one" });
  memory.push ("two");
  TCMP (memory.receive().value_or ("-"), ==, "one");
  TCMP (memory.receive().value_or ("-"), ==, "two");
  TASSERT (!memory.receive().has_value());
  memory.send ("three");
  TCMP (memory.sent().size(), ==, 1u);
  TCMP (memory.output_fd(), ==, -1);
}

} // Anon
