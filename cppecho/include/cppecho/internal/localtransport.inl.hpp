/*------------------------------------------------------------------------------
    Copyright Butterfly Energy Systems 2024.
    Distributed under the Boost Software License, Version 1.0.
    http://www.boost.org/LICENSE_1_0.txt
------------------------------------------------------------------------------*/

#include "../utils/localtransport.hpp"
#include <utility>
#include "../api.hpp"

namespace echo
{

namespace utils
{

//------------------------------------------------------------------------------
CPPECHO_INLINE LocalTransport::Ptr LocalTransport::create(EmitHandler handler)
{
    return Ptr(new LocalTransport(std::move(handler)));
}

//------------------------------------------------------------------------------
CPPECHO_INLINE void LocalTransport::join(const SocketId& socket,
                                         const ChannelName& channel)
{
    const MutexGuard guard{mutex_};
    rooms_[channel].insert(socket);
}

//------------------------------------------------------------------------------
CPPECHO_INLINE void LocalTransport::leave(const SocketId& socket,
                                          const ChannelName& channel)
{
    const MutexGuard guard{mutex_};
    auto found = rooms_.find(channel);
    if (found == rooms_.end())
        return;
    found->second.erase(socket);
    if (found->second.empty())
        rooms_.erase(found);
}

//------------------------------------------------------------------------------
CPPECHO_INLINE SocketIdSet
LocalTransport::membersOf(const ChannelName& channel) const
{
    const MutexGuard guard{mutex_};
    auto found = rooms_.find(channel);
    if (found == rooms_.end())
        return {};
    return found->second;
}

//------------------------------------------------------------------------------
CPPECHO_INLINE bool LocalTransport::isMember(const SocketId& socket,
                                             const ChannelName& channel) const
{
    const MutexGuard guard{mutex_};
    auto found = rooms_.find(channel);
    return found != rooms_.end() && found->second.count(socket) != 0;
}

//------------------------------------------------------------------------------
CPPECHO_INLINE void LocalTransport::broadcast(
    const ChannelName& channel, const std::string& event, EventArgs args,
    const SocketId& excludeSocket)
{
    for (const auto& member: membersOf(channel))
    {
        if (member != excludeSocket)
            emit(Emission{member, event, args});
    }
}

//------------------------------------------------------------------------------
CPPECHO_INLINE void LocalTransport::emitTo(
    const SocketId& socket, const std::string& event, EventArgs args)
{
    emit(Emission{socket, event, std::move(args)});
}

//------------------------------------------------------------------------------
CPPECHO_INLINE std::set<ChannelName>
LocalTransport::roomsOf(const SocketId& socket) const
{
    std::set<ChannelName> rooms;
    const MutexGuard guard{mutex_};
    for (const auto& kv: rooms_)
    {
        if (kv.second.count(socket) != 0)
            rooms.insert(kv.first);
    }
    return rooms;
}

//------------------------------------------------------------------------------
CPPECHO_INLINE std::size_t LocalTransport::roomCount() const
{
    const MutexGuard guard{mutex_};
    return rooms_.size();
}

//------------------------------------------------------------------------------
CPPECHO_INLINE LocalTransport::LocalTransport(EmitHandler handler)
    : handler_(std::move(handler))
{}

//------------------------------------------------------------------------------
CPPECHO_INLINE void LocalTransport::emit(Emission&& emission)
{
    if (handler_)
        handler_(std::move(emission));
}

} // namespace utils

} // namespace echo
