// This Source Code Form is licensed MPL-2.0: http://mozilla.org/MPL/2.0
#include "objectstore.hh"
#include "errors.hh"
#include "utils.hh"
#include "internal.hh"

namespace Tether {

/// Handle of `object`, its serial number as fixed width hex string.
String
ObjectStore::object_handle (const Instance &object)
{
  return string_format ("%032llx", (unsigned long long) object.serial());
}

/// Store `object` unless already present and yield its handle.
String
ObjectStore::encode (const InstanceP &object)
{
  if (!object)
    throw EncodingError ("Cannot encode a null object reference");
  const String handle = object_handle (*object);
  auto it = objects_.find (handle);
  if (it == objects_.end())
    {
      objects_[handle] = object;
      debug ("store", "new object %s: %s", handle, object->class_name());
    }
  return handle;
}

/// Store `resource` unless already present and yield its handle.
int64
ObjectStore::encode (const ResourceP &resource)
{
  if (!resource)
    throw EncodingError ("Cannot encode a null resource reference");
  const int64 handle = resource->id();
  auto it = resources_.find (handle);
  if (it == resources_.end())
    {
      resources_[handle] = resource;
      debug ("store", "new resource %lld: %s", (long long) handle, resource->kind());
    }
  return handle;
}

InstanceP
ObjectStore::decode_object (const String &handle) const
{
  auto it = objects_.find (handle);
  if (it == objects_.end())
    throw HandleNotFoundError (string_format ("Unknown object handle '%s'", handle));
  return it->second;
}

ResourceP
ObjectStore::decode_resource (int64 handle) const
{
  auto it = resources_.find (handle);
  if (it == resources_.end())
    throw HandleNotFoundError (string_format ("Unknown resource handle %lld", (long long) handle));
  return it->second;
}

/// Resolve `handle` in the identity space selected by its type.
Value
ObjectStore::decode (const Handle &handle) const
{
  if (const int64 *id = std::get_if<int64> (&handle))
    return decode_resource (*id);
  return decode_object (std::get<String> (handle));
}

/// Forget `handle`, never called during a regular session.
bool
ObjectStore::remove (const Handle &handle)
{
  if (const int64 *id = std::get_if<int64> (&handle))
    return resources_.erase (*id) > 0;
  return objects_.erase (std::get<String> (handle)) > 0;
}

} // Tether

#include "testing.hh"

namespace { // Anon
using namespace Tether;

struct TestResource : Resource {
  String kind () const override { return "test"; }
};

TEST_INTEGRITY (objectstore_tests);
static void
objectstore_tests()
{
  ObjectStore store;
  InstanceP a = StdClass::create(), b = StdClass::create();
  const String ha = store.encode (a);
  TCMP (ha.size(), ==, 32u);
  TCMP (store.encode (a), ==, ha);
  TCMP (store.n_objects(), ==, 1u);
  TCMP (store.encode (b), !=, ha);
  TASSERT (store.decode_object (ha) == a);
  TASSERT (store.decode (Handle (ha)) == Value (a));
  // resources live in their own identity space
  ResourceP r = std::make_shared<TestResource>();
  const int64 hr = store.encode (r);
  TCMP (store.encode (r), ==, hr);
  TASSERT (store.decode_resource (hr) == r);
  TCMP (store.n_resources(), ==, 1u);
  TTHROWS (store.decode_object (string_from_int (hr)), HandleNotFoundError);
  TASSERT (store.decode (Handle (hr)) == Value (r));
  TTHROWS (store.decode_object ("feed"), HandleNotFoundError);
  TTHROWS (store.encode (InstanceP()), EncodingError);
  TASSERT (store.remove (Handle (ha)));
  TASSERT (!store.remove (Handle (ha)));
  TTHROWS (store.decode_object (ha), HandleNotFoundError);
}

} // Anon
