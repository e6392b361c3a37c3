// This Source Code Form is licensed MPL-2.0: http://mozilla.org/MPL/2.0
#ifndef __TETHER_OBJECT_HH__
#define __TETHER_OBJECT_HH__

#include <tether/value.hh>

namespace Tether {

/// Common base type for polymorphic classes managed by `std::shared_ptr<>`.
class SharedBase : public virtual VirtualBase,
                   public virtual std::enable_shared_from_this<SharedBase>
{};

/** Shorthand for std::dynamic_pointer_cast<>(shared_from_this()).
 * Yields NULL if `object` is NULL, not managed by a std::shared_ptr or of another type.
 */
template<class Target, class Source> std::shared_ptr<Target>
shared_ptr_cast (Source *object)
{
  if (!object)
    return nullptr;
  std::shared_ptr<SharedBase> sptr;
  try {
    sptr = object->shared_from_this();
  } catch (const std::bad_weak_ptr&) {
    return nullptr;
  }
  return std::dynamic_pointer_cast<Target> (sptr);
}

/// Base type of all objects of the runtime.
class Instance : public virtual SharedBase {
  const uint64 serial_;
  mutable ValueA props_;
  mutable bool   props_initialized_ = false;
  void           init_props () const;
protected:
  explicit              Instance   ();
  virtual              ~Instance   ();
public:
  uint64                serial     () const     { return serial_; }
  String                class_name () const;
  const ClassInfo*      class_info () const;
  ValueA&               props      ()           { init_props(); return props_; }
  const ValueA&         props      () const     { init_props(); return props_; }
};

/// Base type of runtime resources, opaque handles to host facilities like streams.
class Resource : public virtual SharedBase {
  const int64 id_;
protected:
  explicit              Resource   ();
  virtual              ~Resource   ();
public:
  int64                 id         () const     { return id_; }
  virtual String        kind       () const = 0;
};

/// Objects that render themselves for display, see Representer.
class Representable {
public:
  virtual              ~Representable () = default;
  virtual String        represent      (const Representer &representer, int depth) const = 0;
};

/// Plain object with dynamic properties only.
class StdClass : public Instance {
public:
  explicit              StdClass       () {}
  static InstanceP      create         (const ValueA &properties = {});
};

} // Tether

#endif // __TETHER_OBJECT_HH__
