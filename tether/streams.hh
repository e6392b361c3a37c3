// This Source Code Form is licensed MPL-2.0: http://mozilla.org/MPL/2.0
#ifndef __TETHER_STREAMS_HH__
#define __TETHER_STREAMS_HH__

#include <tether/object.hh>
#include <cstdio>

namespace Tether {

/// Resource wrapping a stdio stream, its kind turns into "Unknown" once closed.
class StreamResource : public Resource {
  FILE *file_ = nullptr;
public:
  explicit              StreamResource (FILE *file);
  virtual              ~StreamResource ();
  String                kind           () const override;
  FILE*                 file           () const   { return file_; }
  bool                  close          ();
  static ResourceP      open           (const String &path, const String &mode);
};
using StreamResourceP = std::shared_ptr<StreamResource>;

} // Tether

#endif // __TETHER_STREAMS_HH__
