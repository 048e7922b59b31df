/*------------------------------------------------------------------------------
    Copyright Butterfly Energy Systems 2024.
    Distributed under the Boost Software License, Version 1.0.
    http://www.boost.org/LICENSE_1_0.txt
------------------------------------------------------------------------------*/

#ifndef CPPECHO_REQUESTS_HPP
#define CPPECHO_REQUESTS_HPP

//------------------------------------------------------------------------------
/** @file
    @brief Contains the request types received from sockets. */
//------------------------------------------------------------------------------

#include <string>
#include "api.hpp"
#include "gatewaydefs.hpp"

namespace echo
{

//------------------------------------------------------------------------------
/** Request by a socket to join a channel. */
//------------------------------------------------------------------------------
struct CPPECHO_API SubscriptionRequest
{
    /** Extracts a request from a decoded `subscribe` message.
        Missing or wrongly-typed members are left empty. */
    static SubscriptionRequest fromJson(const Payload& message);

    /** Default constructor. */
    SubscriptionRequest() = default;

    /** Constructor taking the target channel and the opaque authentication
        fields. */
    explicit SubscriptionRequest(ChannelName channel,
                                 Payload auth = nullPayload());

    /// Target channel, empty if absent.
    ChannelName channel;

    /// Opaque authentication fields, forwarded untouched to the Authenticator.
    Payload auth = nullPayload();
};

//------------------------------------------------------------------------------
/** Event originated by a socket and addressed to a channel, or to the
    backend application. */
//------------------------------------------------------------------------------
struct CPPECHO_API ClientEventRequest
{
    /** Extracts a request from a decoded `client event` message.
        Missing or wrongly-typed members are left empty. */
    static ClientEventRequest fromJson(const Payload& message);

    /** Default constructor. */
    ClientEventRequest() = default;

    /** Constructor taking the channel, event name and event data. */
    ClientEventRequest(ChannelName channel, std::string event,
                       Payload data = nullPayload());

    /** Flags the event for delivery to the given application channel. */
    ClientEventRequest& withAppChannel(ChannelName appChannel);

    ChannelName channel;          ///< Originating channel, empty if absent.
    std::string event;            ///< Event name, empty if absent.
    Payload data = nullPayload(); ///< Opaque event data.
    ChannelName appChannel;       ///< Target application channel, if any.
    bool toApplication = false;   ///< True if destined for the application.
};

} // namespace echo

#ifndef CPPECHO_COMPILED_LIB
#include "internal/requests.inl.hpp"
#endif

#endif // CPPECHO_REQUESTS_HPP
