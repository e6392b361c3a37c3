// This Source Code Form is licensed MPL-2.0: http://mozilla.org/MPL/2.0
#ifndef __TETHER_CODEC_HH__
#define __TETHER_CODEC_HH__

#include <tether/objectstore.hh>
#include <rapidjson/document.h>

namespace Tether {

using JsonValue = rapidjson::GenericValue<rapidjson::UTF8<char>, rapidjson::MemoryPoolAllocator<rapidjson::CrtAllocator> >;
using JsonAllocator = rapidjson::MemoryPoolAllocator<rapidjson::CrtAllocator>;

/// Conversion between Value and the tagged `{type, value}` wire format, objects and resources pass through an ObjectStore.
class Codec {
  ObjectStore &store_;
public:
  explicit  Codec            (ObjectStore &store) : store_ (store) {}
  JsonValue encode           (const Value &value, JsonAllocator &allocator);
  JsonValue encode_exception (const String &kind, const String &message, JsonAllocator &allocator);
  Value     decode           (const JsonValue &wire) const;
  ValueS    decode_list      (const JsonValue &wires) const;
};

/// Serialize `value` into a single line, invalid UTF-8 raises EncodingError.
String jsonvalue_to_string (const JsonValue &value);

} // Tether

#endif // __TETHER_CODEC_HH__
