/*------------------------------------------------------------------------------
    Copyright Butterfly Energy Systems 2024.
    Distributed under the Boost Software License, Version 1.0.
    http://www.boost.org/LICENSE_1_0.txt
------------------------------------------------------------------------------*/

#include "../subscriptionauthorizer.hpp"
#include <boost/asio/dispatch.hpp>
#include "../api.hpp"
#include "../errorcodes.hpp"
#include "../exceptions.hpp"
#include "../payload.hpp"

namespace echo
{

//------------------------------------------------------------------------------
CPPECHO_INLINE const char* subscriptionStateLabel(SubscriptionState state)
{
    switch (state)
    {
    case SubscriptionState::unsubscribed: return "unsubscribed";
    case SubscriptionState::pendingAuth:  return "pendingAuth";
    case SubscriptionState::subscribed:   return "subscribed";
    case SubscriptionState::rejected:     return "rejected";
    default: break;
    }
    return "unknown";
}

//------------------------------------------------------------------------------
CPPECHO_INLINE SubscriptionAuthorizer::Ptr SubscriptionAuthorizer::create(
    IoStrand strand, ChannelClassifier::ConstPtr classifier,
    Transport::Ptr transport, Authenticator::Ptr authenticator,
    PresenceTracker::Ptr presence, GatewayLogger::Ptr logger)
{
    return Ptr(new SubscriptionAuthorizer(
        std::move(strand), std::move(classifier), std::move(transport),
        std::move(authenticator), std::move(presence), std::move(logger)));
}

//------------------------------------------------------------------------------
CPPECHO_INLINE void SubscriptionAuthorizer::authorizeAndJoin(
    const SocketId& socket, SubscriptionRequest request)
{
    if (request.channel.empty())
        return;

    if (classifier_->isPrivate(request.channel))
        joinPrivate(socket, std::move(request));
    else
        joinPublic(socket, request.channel);
}

//------------------------------------------------------------------------------
CPPECHO_INLINE SubscriptionState SubscriptionAuthorizer::state(
    const SocketId& socket, const ChannelName& channel) const
{
    const MutexGuard guard{mutex_};
    auto found = records_.find(Key{socket, channel});
    if (found == records_.end())
        return SubscriptionState::unsubscribed;
    return found->second.state;
}

//------------------------------------------------------------------------------
CPPECHO_INLINE bool SubscriptionAuthorizer::release(const SocketId& socket,
                                                    const ChannelName& channel)
{
    const MutexGuard guard{mutex_};
    auto found = records_.find(Key{socket, channel});
    if (found == records_.end())
        return false;
    bool wasSubscribed = found->second.state == SubscriptionState::subscribed;
    records_.erase(found);
    return wasSubscribed;
}

//------------------------------------------------------------------------------
CPPECHO_INLINE std::vector<ChannelName>
SubscriptionAuthorizer::releaseAll(const SocketId& socket)
{
    std::vector<ChannelName> channels;
    const MutexGuard guard{mutex_};
    auto iter = records_.lower_bound(Key{socket, {}});
    while (iter != records_.end() && iter->first.first == socket)
    {
        if (iter->second.state == SubscriptionState::subscribed)
            channels.push_back(iter->first.second);
        iter = records_.erase(iter);
    }
    return channels;
}

//------------------------------------------------------------------------------
CPPECHO_INLINE SubscriptionAuthorizer::SubscriptionAuthorizer(
    IoStrand strand, ChannelClassifier::ConstPtr classifier,
    Transport::Ptr transport, Authenticator::Ptr authenticator,
    PresenceTracker::Ptr presence, GatewayLogger::Ptr logger)
    : strand_(std::move(strand)),
      classifier_(std::move(classifier)),
      transport_(std::move(transport)),
      authenticator_(std::move(authenticator)),
      presence_(std::move(presence)),
      logger_(std::move(logger))
{
    CPPECHO_LOGIC_CHECK(classifier_ != nullptr, "Classifier cannot be null");
    CPPECHO_LOGIC_CHECK(transport_ != nullptr, "Transport cannot be null");
    CPPECHO_LOGIC_CHECK(authenticator_ != nullptr,
                        "Authenticator cannot be null");
    CPPECHO_LOGIC_CHECK(presence_ != nullptr,
                        "Presence tracker cannot be null");
    CPPECHO_LOGIC_CHECK(logger_ != nullptr, "Logger cannot be null");
}

//------------------------------------------------------------------------------
/** @details
    May be called from any thread. The outcome is moved to the strand
    before any bookkeeping is done. */
//------------------------------------------------------------------------------
CPPECHO_INLINE void SubscriptionAuthorizer::onAuthenticated(
    Ticket ticket, const SocketId& socket, const ChannelName& channel,
    AuthResult&& result)
{
    struct Dispatched
    {
        Ptr self;
        Ticket ticket;
        SocketId socket;
        ChannelName channel;
        AuthResult result;

        void operator()() {self->onCompletion(ticket, socket, channel, result);}
    };

    boost::asio::dispatch(
        strand_,
        Dispatched{shared_from_this(), ticket, socket, channel,
                   std::move(result)});
}

//------------------------------------------------------------------------------
CPPECHO_INLINE void SubscriptionAuthorizer::joinPublic(
    const SocketId& socket, const ChannelName& channel)
{
    {
        const MutexGuard guard{mutex_};
        records_[Key{socket, channel}].state = SubscriptionState::subscribed;
        transport_->join(socket, channel);
    }

    logger_->log(AccessLogEntry{socket, "join", channel});
}

//------------------------------------------------------------------------------
CPPECHO_INLINE void SubscriptionAuthorizer::joinPrivate(
    const SocketId& socket, SubscriptionRequest&& request)
{
    Ticket ticket = 0;

    {
        const MutexGuard guard{mutex_};
        auto& record = records_[Key{socket, request.channel}];
        if (record.state != SubscriptionState::subscribed)
            record.state = SubscriptionState::pendingAuth;
        ticket = ++nextTicket_;
        record.tickets.insert(ticket);
    }

    internal::AuthListener::WeakPtr listener = shared_from_this();
    authenticator_->authenticate(
        AuthRequest{internal::PassKey{}, std::move(listener), socket,
                    std::move(request), ticket});
}

//------------------------------------------------------------------------------
CPPECHO_INLINE void SubscriptionAuthorizer::onCompletion(
    Ticket ticket, const SocketId& socket, const ChannelName& channel,
    AuthResult& result)
{
    if (result.good())
        onGranted(ticket, socket, channel, result);
    else
        onDenied(ticket, socket, channel, result);
}

//------------------------------------------------------------------------------
CPPECHO_INLINE void SubscriptionAuthorizer::onGranted(
    Ticket ticket, const SocketId& socket, const ChannelName& channel,
    AuthResult& result)
{
    bool alreadySubscribed = false;
    {
        const MutexGuard guard{mutex_};
        auto record = claim(ticket, socket, channel);
        if (record == nullptr)
            return abandon(socket, channel);
        alreadySubscribed = record->state == SubscriptionState::subscribed;
        record->state = SubscriptionState::subscribed;
        transport_->join(socket, channel);
    }

    if (!alreadySubscribed && classifier_->isPresence(channel))
        presence_->join(socket, channel, memberOf(socket, channel, result));

    logger_->log(AccessLogEntry{socket, "join", channel});
}

//------------------------------------------------------------------------------
CPPECHO_INLINE void SubscriptionAuthorizer::onDenied(
    Ticket ticket, const SocketId& socket, const ChannelName& channel,
    AuthResult& result)
{
    {
        const MutexGuard guard{mutex_};
        auto record = claim(ticket, socket, channel);
        if (record == nullptr)
            return abandon(socket, channel);
        if (record->state != SubscriptionState::subscribed)
            record->state = SubscriptionState::rejected;
    }

    logger_->log(LogLevel::warning,
                 "Subscription of socket '" + socket + "' to channel '" +
                     channel + "' denied: " + result.reason(),
                 result.error());

    transport_->emitTo(socket, subscriptionErrorEvent,
                       EventArgs{Payload(channel), Payload(result.status())});

    logger_->log(AccessLogEntry{socket, "reject", channel, result.reason(),
                                result.error()});
}

//------------------------------------------------------------------------------
/** @details
    Must be called while the mutex is locked.
    @returns The subscription record if the ticket was outstanding, or
             nullptr if it has been discarded. */
//------------------------------------------------------------------------------
CPPECHO_INLINE SubscriptionAuthorizer::Record* SubscriptionAuthorizer::claim(
    Ticket ticket, const SocketId& socket, const ChannelName& channel)
{
    auto found = records_.find(Key{socket, channel});
    if (found == records_.end())
        return nullptr;
    auto& record = found->second;
    if (record.tickets.erase(ticket) == 0)
        return nullptr;
    return &record;
}

//------------------------------------------------------------------------------
CPPECHO_INLINE void SubscriptionAuthorizer::abandon(const SocketId& socket,
                                                    const ChannelName& channel)
{
    logger_->log(LogLevel::debug,
                 "Discarding authentication outcome for socket '" + socket +
                     "' on channel '" + channel + "'",
                 make_error_code(GatewayErrc::subscriptionAbandoned));
}

//------------------------------------------------------------------------------
/** @details
    Channel data that is not a well-formed JSON document is passed on as a
    string. A grant without channel data yields a null descriptor. */
//------------------------------------------------------------------------------
CPPECHO_INLINE MemberDescriptor SubscriptionAuthorizer::memberOf(
    const SocketId& socket, const ChannelName& channel,
    const AuthResult& result)
{
    auto channelData = result.channelData();
    if (!channelData)
        return nullPayload();

    auto parsed = parsePayload(*channelData);
    if (parsed)
        return std::move(*parsed);

    logger_->log(LogLevel::debug,
                 "Using raw channel data as the member descriptor of socket '" +
                     socket + "' on channel '" + channel + "'",
                 parsed.error());
    return MemberDescriptor(*channelData);
}

} // namespace echo
