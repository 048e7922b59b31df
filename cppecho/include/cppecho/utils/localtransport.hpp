/*------------------------------------------------------------------------------
    Copyright Butterfly Energy Systems 2024.
    Distributed under the Boost Software License, Version 1.0.
    http://www.boost.org/LICENSE_1_0.txt
------------------------------------------------------------------------------*/

#ifndef CPPECHO_UTILS_LOCALTRANSPORT_HPP
#define CPPECHO_UTILS_LOCALTRANSPORT_HPP

//------------------------------------------------------------------------------
/** @file
    @brief Contains an in-process Transport implementation. */
//------------------------------------------------------------------------------

#include <cstddef>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include "../api.hpp"
#include "../gatewaydefs.hpp"
#include "../transport.hpp"

namespace echo
{

namespace utils
{

//------------------------------------------------------------------------------
/** Event delivered to a single socket by LocalTransport. */
//------------------------------------------------------------------------------
struct CPPECHO_API Emission
{
    SocketId target;   ///< Receiving socket.
    std::string event; ///< Event name.
    EventArgs args;    ///< Event arguments.
};

//------------------------------------------------------------------------------
/** Transport keeping room memberships in memory, and handing emitted
    events to a user-provided handler.
    Room membership changes are serialized by a mutex. The emit handler is
    invoked synchronously without the mutex being locked. */
//------------------------------------------------------------------------------
class CPPECHO_API LocalTransport : public Transport
{
public:
    /// Shared pointer type
    using Ptr = std::shared_ptr<LocalTransport>;

    /// Handler invoked for every emitted event.
    using EmitHandler = std::function<void (Emission)>;

    /** Creates a LocalTransport instance. */
    static Ptr create(EmitHandler handler = nullptr);

    void join(const SocketId& socket, const ChannelName& channel) override;

    void leave(const SocketId& socket, const ChannelName& channel) override;

    SocketIdSet membersOf(const ChannelName& channel) const override;

    bool isMember(const SocketId& socket,
                  const ChannelName& channel) const override;

    void broadcast(const ChannelName& channel, const std::string& event,
                   EventArgs args, const SocketId& excludeSocket) override;

    void emitTo(const SocketId& socket, const std::string& event,
                EventArgs args) override;

    /** Obtains the rooms the given socket is in. */
    std::set<ChannelName> roomsOf(const SocketId& socket) const;

    /** Obtains the number of non-empty rooms. */
    std::size_t roomCount() const;

private:
    using MutexGuard = std::lock_guard<std::mutex>;

    explicit LocalTransport(EmitHandler handler);

    void emit(Emission&& emission);

    std::map<ChannelName, SocketIdSet> rooms_;
    EmitHandler handler_;
    mutable std::mutex mutex_;
};

} // namespace utils

} // namespace echo

#ifndef CPPECHO_COMPILED_LIB
#include "../internal/localtransport.inl.hpp"
#endif

#endif // CPPECHO_UTILS_LOCALTRANSPORT_HPP
