// This Source Code Form is licensed MPL-2.0: http://mozilla.org/MPL/2.0
#ifndef __TETHER_COMMANDS_HH__
#define __TETHER_COMMANDS_HH__

#include <tether/request.hh>
#include <tether/representer.hh>
#include <tether/runtime.hh>

namespace Tether {

/// The operations available to the controlling process, one `run()` overload per Request alternative.
class Commands {
  Runtime           &runtime_;
  const Representer &representer_;
  InstanceP         instance_arg  (const Value &obj, const char *command) const;
  InstanceP         array_access  (const Value &obj) const;
public:
  explicit     Commands     (Runtime &runtime, const Representer &representer);
  Value        execute      (const Request &request);
  static ValueA class_info    (const ClassInfo &info);
  static ValueA function_info (const FunctionInfo &info);
  Value run (const GetConstRequest &r);
  Value run (const SetConstRequest &r);
  Value run (const GetGlobalRequest &r);
  Value run (const SetGlobalRequest &r);
  Value run (const CallFunRequest &r);
  Value run (const CreateObjectRequest &r);
  Value run (const CallObjRequest &r);
  Value run (const CallMethodRequest &r);
  Value run (const HasItemRequest &r);
  Value run (const GetItemRequest &r);
  Value run (const SetItemRequest &r);
  Value run (const DelItemRequest &r);
  Value run (const GetPropertyRequest &r);
  Value run (const SetPropertyRequest &r);
  Value run (const UnsetPropertyRequest &r);
  Value run (const ListPropertiesRequest &r);
  Value run (const ListNonDefaultPropertiesRequest &r);
  Value run (const ClassInfoRequest &r);
  Value run (const FuncInfoRequest &r);
  Value run (const ListConstsRequest &r);
  Value run (const ListGlobalsRequest &r);
  Value run (const ListFunsRequest &r);
  Value run (const ListClassesRequest &r);
  Value run (const ResolveNameRequest &r);
  Value run (const ReprRequest &r);
  Value run (const StrRequest &r);
  Value run (const CountRequest &r);
  Value run (const StartIterationRequest &r);
  Value run (const NextIterationRequest &r);
};

} // Tether

#endif // __TETHER_COMMANDS_HH__
