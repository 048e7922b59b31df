/*------------------------------------------------------------------------------
    Copyright Butterfly Energy Systems 2024.
    Distributed under the Boost Software License, Version 1.0.
    http://www.boost.org/LICENSE_1_0.txt
------------------------------------------------------------------------------*/

#ifndef CPPECHO_PRESENCE_HPP
#define CPPECHO_PRESENCE_HPP

//------------------------------------------------------------------------------
/** @file
    @brief Contains the interface to the presence membership tracker. */
//------------------------------------------------------------------------------

#include <memory>
#include "api.hpp"
#include "gatewaydefs.hpp"

namespace echo
{

//------------------------------------------------------------------------------
/** Interface to the tracker that maintains the members of presence channels
    and informs the other members of arrivals and departures. */
//------------------------------------------------------------------------------
class CPPECHO_API PresenceTracker
{
public:
    /// Shared pointer type
    using Ptr = std::shared_ptr<PresenceTracker>;

    /** Destructor. */
    virtual ~PresenceTracker() = default;

    /** Called after a socket was admitted into a presence channel. */
    virtual void join(const SocketId& socket, const ChannelName& channel,
                      MemberDescriptor member) = 0;

    /** Called before a socket is removed from a presence channel. */
    virtual void leave(const SocketId& socket, const ChannelName& channel) = 0;
};

} // namespace echo

#endif // CPPECHO_PRESENCE_HPP
