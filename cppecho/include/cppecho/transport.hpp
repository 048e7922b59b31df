/*------------------------------------------------------------------------------
    Copyright Butterfly Energy Systems 2024.
    Distributed under the Boost Software License, Version 1.0.
    http://www.boost.org/LICENSE_1_0.txt
------------------------------------------------------------------------------*/

#ifndef CPPECHO_TRANSPORT_HPP
#define CPPECHO_TRANSPORT_HPP

//------------------------------------------------------------------------------
/** @file
    @brief Contains the interface to the connection transport. */
//------------------------------------------------------------------------------

#include <memory>
#include <string>
#include "api.hpp"
#include "gatewaydefs.hpp"

namespace echo
{

//------------------------------------------------------------------------------
/** Interface to the transport maintaining socket connections and their
    room memberships.

    Implementations must allow these operations to be invoked concurrently.
    Joining a room that the socket is already in, or leaving a room that
    it is not in, must have no effect. */
//------------------------------------------------------------------------------
class CPPECHO_API Transport
{
public:
    /// Shared pointer type
    using Ptr = std::shared_ptr<Transport>;

    /** Destructor. */
    virtual ~Transport() = default;

    /** Adds the given socket to the channel's room. */
    virtual void join(const SocketId& socket, const ChannelName& channel) = 0;

    /** Removes the given socket from the channel's room. */
    virtual void leave(const SocketId& socket, const ChannelName& channel) = 0;

    /** Obtains the sockets currently in the channel's room. */
    virtual SocketIdSet membersOf(const ChannelName& channel) const = 0;

    /** Determines if the socket is currently in the channel's room.
        The default implementation searches the result of `membersOf`. */
    virtual bool isMember(const SocketId& socket,
                          const ChannelName& channel) const
    {
        return membersOf(channel).count(socket) != 0;
    }

    /** Emits an event to every socket in the channel's room, except for
        `excludeSocket`. */
    virtual void broadcast(const ChannelName& channel, const std::string& event,
                           EventArgs args, const SocketId& excludeSocket) = 0;

    /** Emits an event to a single socket. */
    virtual void emitTo(const SocketId& socket, const std::string& event,
                        EventArgs args) = 0;
};

} // namespace echo

#endif // CPPECHO_TRANSPORT_HPP
