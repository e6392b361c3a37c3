// This Source Code Form is licensed MPL-2.0: http://mozilla.org/MPL/2.0
#ifndef __TETHER_DEFS_HH__
#define __TETHER_DEFS_HH__

#include <tether/cxxaux.hh>

namespace Tether {

// = Constants ==
static constexpr int64_t  I63MAX = +9223372036854775807;      // 2^63-1
static constexpr int64_t  I63MIN = -9223372036854775807 - 1;  // -2^63
static constexpr double   D64EPS = 2.220446049250313e-16;     // 2^-52, machine epsilon
static constexpr double   D64MAX = 1.7976931348623157e+308;   // 0x7fefffff ffffffff, IEEE-754 Double Maximum

// == Struct Forward Declarations ==
TETHER_STRUCT_DECLS (Value);
TETHER_STRUCT_DECLS (ClassInfo);
TETHER_STRUCT_DECLS (FunctionInfo);
TETHER_STRUCT_DECLS (MethodInfo);
TETHER_STRUCT_DECLS (ParamInfo);
TETHER_STRUCT_DECLS (PropertyInfo);

// == Class Forward Declarations ==
TETHER_CLASS_DECLS (ClosureObject);
TETHER_CLASS_DECLS (Generator);
TETHER_CLASS_DECLS (Instance);
TETHER_CLASS_DECLS (Resource);

class ObjectStore;
class Representer;
class Runtime;
class Transport;
class ValueA;

using ValueS = std::vector<Value>;      ///< Argument lists and other plain sequences of values.

} // Tether

#endif // __TETHER_DEFS_HH__
