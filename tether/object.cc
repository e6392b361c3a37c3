// This Source Code Form is licensed MPL-2.0: http://mozilla.org/MPL/2.0
#include "object.hh"
#include "runtime.hh"
#include "utils.hh"
#include "internal.hh"

namespace Tether {

static uint64 instance_counter = 0;
static int64  resource_counter = 0;

// == Instance ==
Instance::Instance () :
  serial_ (++instance_counter)
{}

Instance::~Instance ()
{}

const ClassInfo*
Instance::class_info () const
{
  return Runtime::class_of (typeid (*this));
}

/// Registered class name, empty for C++ types unknown to the runtime.
String
Instance::class_name () const
{
  const ClassInfo *info = class_info();
  return info ? info->name : "";
}

/// Fill the property table from the declared defaults of the class hierarchy, the dynamic type is only known after construction.
void
Instance::init_props () const
{
  return_unless (!props_initialized_);
  props_initialized_ = true;
  std::vector<const ClassInfo*> chain;
  for (const ClassInfo *info = class_info(); info; info = info->parent_info())
    chain.insert (chain.begin(), info);
  for (const ClassInfo *info : chain)
    for (const PropertyInfo &p : info->properties)
      if (!props_.has (p.name))
        props_.set (p.name, p.fallback);
}

// == Resource ==
Resource::Resource () :
  id_ (++resource_counter)
{}

Resource::~Resource ()
{}

// == StdClass ==
InstanceP
StdClass::create (const ValueA &properties)
{
  auto obj = std::make_shared<StdClass>();
  for (const auto &e : properties)
    obj->props().set (key_to_string (e.key), *e.value);
  return obj;
}

} // Tether
