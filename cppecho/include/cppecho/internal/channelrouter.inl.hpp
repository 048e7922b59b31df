/*------------------------------------------------------------------------------
    Copyright Butterfly Energy Systems 2024.
    Distributed under the Boost Software License, Version 1.0.
    http://www.boost.org/LICENSE_1_0.txt
------------------------------------------------------------------------------*/

#include "../channelrouter.hpp"
#include <utility>
#include <boost/asio/dispatch.hpp>
#include "../api.hpp"
#include "../errorcodes.hpp"
#include "../exceptions.hpp"

namespace echo
{

namespace internal
{

//------------------------------------------------------------------------------
inline ApplicationPublisher::Ptr bridgedPublisher(
    const GatewayOptions& options, ApplicationPublisher::Ptr publisher)
{
    if (!options.bridgeEnabled())
        return nullptr;
    return publisher;
}

} // namespace internal


//------------------------------------------------------------------------------
CPPECHO_INLINE ChannelRouter::Ptr ChannelRouter::create(
    AnyIoExecutor executor, GatewayOptions options, Transport::Ptr transport,
    Authenticator::Ptr authenticator, PresenceTracker::Ptr presence,
    ApplicationPublisher::Ptr publisher)
{
    return Ptr(new ChannelRouter(std::move(executor), std::move(options),
                                 std::move(transport), std::move(authenticator),
                                 std::move(presence), std::move(publisher)));
}

//------------------------------------------------------------------------------
CPPECHO_INLINE const ChannelClassifier& ChannelRouter::classifier() const
{
    return *classifier_;
}

//------------------------------------------------------------------------------
CPPECHO_INLINE const GatewayOptions& ChannelRouter::options() const
{
    return options_;
}

//------------------------------------------------------------------------------
CPPECHO_INLINE LogLevel ChannelRouter::logLevel() const
{
    return logger_->level();
}

//------------------------------------------------------------------------------
CPPECHO_INLINE void ChannelRouter::setLogLevel(LogLevel level)
{
    logger_->setLevel(level);
}

//------------------------------------------------------------------------------
CPPECHO_INLINE bool ChannelRouter::bridgeEnabled() const
{
    return bridge_.enabled();
}

//------------------------------------------------------------------------------
CPPECHO_INLINE void ChannelRouter::join(const SocketId& socket,
                                        SubscriptionRequest request)
{
    struct Dispatched
    {
        Ptr self;
        SocketId socket;
        SubscriptionRequest request;

        void operator()()
        {
            self->authorizer_->authorizeAndJoin(socket, std::move(request));
        }
    };

    boost::asio::dispatch(
        strand_, Dispatched{shared_from_this(), socket, std::move(request)});
}

//------------------------------------------------------------------------------
CPPECHO_INLINE void ChannelRouter::leave(const SocketId& socket,
                                         const ChannelName& channel,
                                         const std::string& reason)
{
    struct Dispatched
    {
        Ptr self;
        SocketId socket;
        ChannelName channel;
        std::string reason;

        void operator()() {self->onLeave(socket, channel, reason);}
    };

    if (channel.empty())
        return;
    boost::asio::dispatch(
        strand_, Dispatched{shared_from_this(), socket, channel, reason});
}

//------------------------------------------------------------------------------
CPPECHO_INLINE std::error_code ChannelRouter::clientEvent(
    const SocketId& socket, ClientEventRequest request)
{
    auto ec = gate_.check(socket, request);
    if (ec)
        return ec;

    if (bridge_.isApplicationBound(request))
        return bridge_.route(std::move(request));

    EventArgs args{Payload(request.channel), std::move(request.data)};
    transport_->broadcast(request.channel, request.event, std::move(args),
                          socket);
    return {};
}

//------------------------------------------------------------------------------
CPPECHO_INLINE void ChannelRouter::disconnect(const SocketId& socket,
                                              const std::string& reason)
{
    struct Dispatched
    {
        Ptr self;
        SocketId socket;
        std::string reason;

        void operator()() {self->onDisconnect(socket, reason);}
    };

    boost::asio::dispatch(strand_,
                          Dispatched{shared_from_this(), socket, reason});
}

//------------------------------------------------------------------------------
CPPECHO_INLINE SubscriptionState ChannelRouter::subscriptionState(
    const SocketId& socket, const ChannelName& channel) const
{
    return authorizer_->state(socket, channel);
}

//------------------------------------------------------------------------------
CPPECHO_INLINE ChannelRouter::ChannelRouter(
    AnyIoExecutor executor, GatewayOptions options, Transport::Ptr transport,
    Authenticator::Ptr authenticator, PresenceTracker::Ptr presence,
    ApplicationPublisher::Ptr publisher)
    : options_(std::move(options)),
      executor_(std::move(executor)),
      strand_(boost::asio::make_strand(executor_)),
      classifier_(std::make_shared<ChannelClassifier>(options_.patterns())),
      transport_(std::move(transport)),
      presence_(std::move(presence)),
      logger_(std::make_shared<GatewayLogger>(
          executor_, options_.logHandler(), options_.logLevel(),
          options_.accessLogHandler(), options_.devMode())),
      authorizer_(SubscriptionAuthorizer::create(
          strand_, classifier_, transport_, std::move(authenticator),
          presence_, logger_)),
      gate_(classifier_, transport_),
      bridge_(classifier_,
              internal::bridgedPublisher(options_, std::move(publisher)),
              logger_)
{
    if (!bridge_.enabled())
    {
        logger_->log(LogLevel::info,
                     "Application bridge disabled (database: '" +
                         options_.database() + "')");
    }

    logger_->log(LogLevel::info, "Channels are ready.");
}

//------------------------------------------------------------------------------
/** @details
    A pending authentication for the channel is discarded. An outcome
    already granted has completed its room and presence joins by the time
    this runs, since both happen on the strand. */
//------------------------------------------------------------------------------
CPPECHO_INLINE void ChannelRouter::onLeave(const SocketId& socket,
                                           const ChannelName& channel,
                                           const std::string& reason)
{
    bool wasSubscribed = authorizer_->release(socket, channel);
    if (wasSubscribed || transport_->isMember(socket, channel))
        removeFromRoom(socket, channel, reason);
}

//------------------------------------------------------------------------------
CPPECHO_INLINE void ChannelRouter::onDisconnect(const SocketId& socket,
                                                const std::string& reason)
{
    auto channels = authorizer_->releaseAll(socket);
    for (const auto& channel: channels)
        removeFromRoom(socket, channel, reason);
}

//------------------------------------------------------------------------------
/** @details
    If the channel is a presence channel, the presence tracker is informed
    before the socket is removed from the room, so that the other members
    are notified while the departing socket is still reachable. */
//------------------------------------------------------------------------------
CPPECHO_INLINE void ChannelRouter::removeFromRoom(const SocketId& socket,
                                                  const ChannelName& channel,
                                                  const std::string& reason)
{
    if (classifier_->isPresence(channel))
        presence_->leave(socket, channel);
    transport_->leave(socket, channel);
    logger_->log(AccessLogEntry{socket, "leave", channel, reason});
}

} // namespace echo
