// This Source Code Form is licensed MPL-2.0: http://mozilla.org/MPL/2.0
#ifndef __TETHER_TRANSPORT_HH__
#define __TETHER_TRANSPORT_HH__

#include <tether/defs.hh>
#include <optional>

namespace Tether {

/// Line framed message channel, one JSON value per line in each direction.
class Transport {
public:
  virtual                      ~Transport () = default;
  /// Next line without terminator, std::nullopt once the peer closed the stream.
  virtual std::optional<String> receive    () = 0;
  /// Send `line` followed by a newline.
  virtual void                  send       (const String &line) = 0;
  /// File descriptor responses are written to, -1 if not backed by a file descriptor.
  virtual int                   output_fd  () const     { return -1; }
};

/// Transport over a pair of file descriptors, like stdin and stdout.
class FdTransport : public Transport {
  int    rfd_ = -1, wfd_ = -1;
  bool   owned_ = false;
  bool   eof_ = false;
  String buffer_;
  TETHER_CLASS_NON_COPYABLE (FdTransport);
public:
  explicit              FdTransport (int readfd = 0, int writefd = 1);
  explicit              FdTransport (const String &inputpath, const String &outputpath);
  /*dtor*/             ~FdTransport () override;
  std::optional<String> receive     () override;
  void                  send        (const String &line) override;
  int                   output_fd   () const override   { return wfd_; }
};

/// Transport reading scripted lines and collecting the sent lines.
class MemoryTransport : public Transport {
  StringS input_;
  size_t  position_ = 0;
  StringS output_;
public:
  explicit              MemoryTransport (const StringS &lines = {});
  void                  push            (const String &line)    { input_.push_back (line); }
  const StringS&        sent            () const                { return output_; }
  std::optional<String> receive         () override;
  void                  send            (const String &line) override;
};

} // Tether

#endif // __TETHER_TRANSPORT_HH__
