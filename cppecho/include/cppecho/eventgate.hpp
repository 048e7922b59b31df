/*------------------------------------------------------------------------------
    Copyright Butterfly Energy Systems 2024.
    Distributed under the Boost Software License, Version 1.0.
    http://www.boost.org/LICENSE_1_0.txt
------------------------------------------------------------------------------*/

#ifndef CPPECHO_EVENTGATE_HPP
#define CPPECHO_EVENTGATE_HPP

//------------------------------------------------------------------------------
/** @file
    @brief Contains the EventGate class. */
//------------------------------------------------------------------------------

#include <system_error>
#include "api.hpp"
#include "channelclassifier.hpp"
#include "gatewaydefs.hpp"
#include "requests.hpp"
#include "transport.hpp"

namespace echo
{

//------------------------------------------------------------------------------
/** Decides whether a client event may be relayed.
    An event is acceptable only if its name is a client event, its channel
    is private, and the sender currently is in the channel's room. */
//------------------------------------------------------------------------------
class CPPECHO_API EventGate
{
public:
    /** Constructor. */
    EventGate(ChannelClassifier::ConstPtr classifier, Transport::Ptr transport);

    /** Determines if the given event may be relayed. */
    bool isEventAcceptable(const SocketId& socket,
                           const ClientEventRequest& request) const;

    /** Obtains the reason why the given event may not be relayed.
        @returns GatewayErrc::malformedRequest if the channel or event name
                 is missing, GatewayErrc::eventRejected if any of the
                 conditions is not met, or a default-constructed error code
                 if the event is acceptable. */
    std::error_code check(const SocketId& socket,
                          const ClientEventRequest& request) const;

private:
    ChannelClassifier::ConstPtr classifier_;
    Transport::Ptr transport_;
};

} // namespace echo

#ifndef CPPECHO_COMPILED_LIB
#include "internal/eventgate.inl.hpp"
#endif

#endif // CPPECHO_EVENTGATE_HPP
