/*------------------------------------------------------------------------------
    Copyright Butterfly Energy Systems 2024.
    Distributed under the Boost Software License, Version 1.0.
    http://www.boost.org/LICENSE_1_0.txt
------------------------------------------------------------------------------*/

#ifndef CPPECHO_CHANNELROUTER_HPP
#define CPPECHO_CHANNELROUTER_HPP

//------------------------------------------------------------------------------
/** @file
    @brief Contains the ChannelRouter class. */
//------------------------------------------------------------------------------

#include <memory>
#include <string>
#include <system_error>
#include "api.hpp"
#include "applicationbridge.hpp"
#include "asiodefs.hpp"
#include "authenticator.hpp"
#include "channelclassifier.hpp"
#include "eventgate.hpp"
#include "gatewaydefs.hpp"
#include "gatewaylogger.hpp"
#include "gatewayoptions.hpp"
#include "presence.hpp"
#include "publisher.hpp"
#include "requests.hpp"
#include "subscriptionauthorizer.hpp"
#include "transport.hpp"

namespace echo
{

//------------------------------------------------------------------------------
/** Routes the join, leave, and client event requests of sockets to the
    transport's rooms, or to the backend application.

    All operations may be invoked concurrently from any thread.
    Joins, leaves, disconnections and authentication outcomes are carried
    out in order on a strand of the executor passed to `create`, which must
    therefore be run. Log entries are also delivered via that executor.

    Requests lacking a channel or event name are ignored. */
//------------------------------------------------------------------------------
class CPPECHO_API ChannelRouter
    : public std::enable_shared_from_this<ChannelRouter>
{
public:
    /// Shared pointer type
    using Ptr = std::shared_ptr<ChannelRouter>;

    /** Creates a ChannelRouter instance.
        The publisher is only used when the options' database selector
        enables the application bridge.
        @throws error::Failure if any of the patterns is invalid.
        @throws error::Logic if the transport, authenticator, or presence
                tracker is null. */
    static Ptr create(AnyIoExecutor executor, GatewayOptions options,
                      Transport::Ptr transport,
                      Authenticator::Ptr authenticator,
                      PresenceTracker::Ptr presence,
                      ApplicationPublisher::Ptr publisher = nullptr);

    /** Obtains the classifier built from the configured patterns. */
    const ChannelClassifier& classifier() const;

    /** Obtains the options the router was created with. */
    const GatewayOptions& options() const;

    /** Obtains the current log level. */
    LogLevel logLevel() const;

    /** Changes the log level. */
    void setLogLevel(LogLevel level);

    /** Returns true if application-bound events can be published. */
    bool bridgeEnabled() const;

    /** Joins the socket to a channel, after authentication if the channel
        is private. Takes effect once the router's strand runs it. */
    void join(const SocketId& socket, SubscriptionRequest request);

    /** Removes the socket from a channel. Leaving a channel that was not
        joined has no effect. Takes effect once the router's strand runs it,
        after any authentication outcome already being processed. */
    void leave(const SocketId& socket, const ChannelName& channel,
               const std::string& reason = {});

    /** Relays a client event to the other members of its channel, or
        publishes it to the backend application.
        @returns The reason why the event was dropped, if it was. The
                 sender is never informed. */
    std::error_code clientEvent(const SocketId& socket,
                                ClientEventRequest request);

    /** Removes the socket from every channel it joined, and discards its
        pending authentications. Takes effect once the router's strand
        runs it. */
    void disconnect(const SocketId& socket, const std::string& reason = {});

    /** Obtains the state of the socket's subscription to a channel. */
    SubscriptionState subscriptionState(const SocketId& socket,
                                        const ChannelName& channel) const;

private:
    ChannelRouter(AnyIoExecutor executor, GatewayOptions options,
                  Transport::Ptr transport, Authenticator::Ptr authenticator,
                  PresenceTracker::Ptr presence,
                  ApplicationPublisher::Ptr publisher);

    void onLeave(const SocketId& socket, const ChannelName& channel,
                 const std::string& reason);

    void onDisconnect(const SocketId& socket, const std::string& reason);

    void removeFromRoom(const SocketId& socket, const ChannelName& channel,
                        const std::string& reason);

    GatewayOptions options_;
    AnyIoExecutor executor_;
    IoStrand strand_;
    ChannelClassifier::ConstPtr classifier_;
    Transport::Ptr transport_;
    PresenceTracker::Ptr presence_;
    GatewayLogger::Ptr logger_;
    SubscriptionAuthorizer::Ptr authorizer_;
    EventGate gate_;
    ApplicationBridge bridge_;
};

} // namespace echo

#ifndef CPPECHO_COMPILED_LIB
#include "internal/channelrouter.inl.hpp"
#endif

#endif // CPPECHO_CHANNELROUTER_HPP
