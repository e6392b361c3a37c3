// This Source Code Form is licensed MPL-2.0: http://mozilla.org/MPL/2.0
#ifndef __TETHER_OBJECTSTORE_HH__
#define __TETHER_OBJECTSTORE_HH__

#include <tether/object.hh>
#include <unordered_map>

namespace Tether {

/// Wire handle of an object (string) or a resource (integer).
using Handle = std::variant<String,int64>;

/// Keeps encoded objects and resources alive and addressable by handle for the lifetime of a session.
class ObjectStore {
  std::unordered_map<String,InstanceP> objects_;
  std::unordered_map<int64,ResourceP>  resources_;
  TETHER_CLASS_NON_COPYABLE (ObjectStore);
public:
  explicit      ObjectStore     () = default;
  String        encode          (const InstanceP &object);
  int64         encode          (const ResourceP &resource);
  InstanceP     decode_object   (const String &handle) const;
  ResourceP     decode_resource (int64 handle) const;
  Value         decode          (const Handle &handle) const;
  bool          remove          (const Handle &handle);
  size_t        n_objects       () const        { return objects_.size(); }
  size_t        n_resources     () const        { return resources_.size(); }
  static String object_handle   (const Instance &object);
};

} // Tether

#endif // __TETHER_OBJECTSTORE_HH__
