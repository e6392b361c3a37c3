// This Source Code Form is licensed MPL-2.0: http://mozilla.org/MPL/2.0
#ifndef __TETHER_REQUEST_HH__
#define __TETHER_REQUEST_HH__

#include <tether/codec.hh>

namespace Tether {

// == Request types ==
struct GetConstRequest                  { String name; };
struct SetConstRequest                  { String name; Value value; };
struct GetGlobalRequest                 { String name; };
struct SetGlobalRequest                 { String name; Value value; };
struct CallFunRequest                   { String name; ValueS args; };
struct CreateObjectRequest              { String name; ValueS args; };
struct CallObjRequest                   { Value obj; ValueS args; };
struct CallMethodRequest                { Value obj; String name; ValueS args; };
struct HasItemRequest                   { Value obj; Value offset; };
struct GetItemRequest                   { Value obj; Value offset; };
struct SetItemRequest                   { Value obj; Value offset; Value value; };
struct DelItemRequest                   { Value obj; Value offset; };
struct GetPropertyRequest               { Value obj; String name; };
struct SetPropertyRequest               { Value obj; String name; Value value; };
struct UnsetPropertyRequest             { Value obj; String name; };
struct ListPropertiesRequest            { Value obj; };
struct ListNonDefaultPropertiesRequest  { Value obj; };
struct ClassInfoRequest                 { String name; };
struct FuncInfoRequest                  { String name; };
struct ListConstsRequest                {};
struct ListGlobalsRequest               {};
struct ListFunsRequest                  {};
struct ListClassesRequest               {};
struct ResolveNameRequest               { String name; };
struct ReprRequest                      { Value value; };
struct StrRequest                       { Value value; };
struct CountRequest                     { Value value; };
struct StartIterationRequest            { Value value; };
struct NextIterationRequest             { Value cursor; };

/// A decoded command, one alternative per command name.
using Request = std::variant<GetConstRequest, SetConstRequest, GetGlobalRequest, SetGlobalRequest,
                             CallFunRequest, CreateObjectRequest, CallObjRequest, CallMethodRequest,
                             HasItemRequest, GetItemRequest, SetItemRequest, DelItemRequest,
                             GetPropertyRequest, SetPropertyRequest, UnsetPropertyRequest,
                             ListPropertiesRequest, ListNonDefaultPropertiesRequest,
                             ClassInfoRequest, FuncInfoRequest,
                             ListConstsRequest, ListGlobalsRequest, ListFunsRequest, ListClassesRequest,
                             ResolveNameRequest, ReprRequest, StrRequest, CountRequest,
                             StartIterationRequest, NextIterationRequest>;

/// Decode a `{cmd, data}` message, embedded wire values are resolved with `codec`.
Request parse_request (const JsonValue &message, const Codec &codec);
/// Names of all commands understood by parse_request().
StringS request_names ();

} // Tether

#endif // __TETHER_REQUEST_HH__
