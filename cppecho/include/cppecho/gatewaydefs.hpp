/*------------------------------------------------------------------------------
    Copyright Butterfly Energy Systems 2024.
    Distributed under the Boost Software License, Version 1.0.
    http://www.boost.org/LICENSE_1_0.txt
------------------------------------------------------------------------------*/

#ifndef CPPECHO_GATEWAYDEFS_HPP
#define CPPECHO_GATEWAYDEFS_HPP

//------------------------------------------------------------------------------
/** @file
    @brief Contains type definitions shared by the routing components. */
//------------------------------------------------------------------------------

#include <set>
#include <string>
#include <vector>
#include <jsoncons/json.hpp>

namespace echo
{

/** Identifies a connected socket. */
using SocketId = std::string;

/** Set of socket identifiers. */
using SocketIdSet = std::set<SocketId>;

/** Name of a channel (room). An empty name means that it is absent. */
using ChannelName = std::string;

/** Opaque JSON document carried through the gateway. */
using Payload = jsoncons::json;

/** Obtains a payload holding the JSON null value. */
inline Payload nullPayload() {return Payload(jsoncons::null_type{});}

/** Describes a presence channel member. It is a structured document when
    the authenticator's channel data could be parsed, otherwise it holds the
    raw channel data string. */
using MemberDescriptor = Payload;

/** Positional arguments of an event emitted to sockets. */
using EventArgs = std::vector<Payload>;

/** Status code reported by the authenticator when denying a
    subscription. */
using StatusCode = int;

/** Name of the event sent to a socket whose subscription was refused. */
constexpr const char* subscriptionErrorEvent = "subscription_error";

} // namespace echo

#endif // CPPECHO_GATEWAYDEFS_HPP
