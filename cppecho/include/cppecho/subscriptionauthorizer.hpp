/*------------------------------------------------------------------------------
    Copyright Butterfly Energy Systems 2024.
    Distributed under the Boost Software License, Version 1.0.
    http://www.boost.org/LICENSE_1_0.txt
------------------------------------------------------------------------------*/

#ifndef CPPECHO_SUBSCRIPTIONAUTHORIZER_HPP
#define CPPECHO_SUBSCRIPTIONAUTHORIZER_HPP

//------------------------------------------------------------------------------
/** @file
    @brief Contains the SubscriptionAuthorizer class. */
//------------------------------------------------------------------------------

#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <utility>
#include <vector>
#include "api.hpp"
#include "asiodefs.hpp"
#include "authenticator.hpp"
#include "channelclassifier.hpp"
#include "gatewaydefs.hpp"
#include "gatewaylogger.hpp"
#include "presence.hpp"
#include "requests.hpp"
#include "transport.hpp"
#include "internal/authlistener.hpp"

namespace echo
{

//------------------------------------------------------------------------------
/** State of a socket's subscription to a channel. */
//------------------------------------------------------------------------------
enum class CPPECHO_API SubscriptionState
{
    unsubscribed, ///< Not joined, or left.
    pendingAuth,  ///< Awaiting the outcome of authentication.
    subscribed,   ///< Member of the channel's room.
    rejected      ///< Authentication was denied.
};

/** Obtains the name of the given subscription state.
    @relates SubscriptionState */
CPPECHO_API const char* subscriptionStateLabel(SubscriptionState state);


//------------------------------------------------------------------------------
/** Decides whether a socket may join a channel, authenticating it first
    when the channel is private.

    Authentication outcomes are processed via the strand passed to
    `create`, and `authorizeAndJoin`, `release` and `releaseAll` must also
    be called from within that strand. `state` may be called from any
    thread. An outcome arriving after the socket has released the channel
    is discarded. No lock is held while the Authenticator is invoked.

    Back-to-back join attempts by the same socket to the same channel are
    neither deduplicated nor ordered; each outcome is processed as it
    arrives. The presence tracker only learns of the first one granted. */
//------------------------------------------------------------------------------
class CPPECHO_API SubscriptionAuthorizer
    : public std::enable_shared_from_this<SubscriptionAuthorizer>,
      public internal::AuthListener
{
public:
    /// Shared pointer type
    using Ptr = std::shared_ptr<SubscriptionAuthorizer>;

    /** Creates a SubscriptionAuthorizer instance. */
    static Ptr create(IoStrand strand, ChannelClassifier::ConstPtr classifier,
                      Transport::Ptr transport,
                      Authenticator::Ptr authenticator,
                      PresenceTracker::Ptr presence,
                      GatewayLogger::Ptr logger);

    /** Admits the socket into the requested channel, authenticating it
        beforehand if the channel is private. A request without a channel
        is ignored. */
    void authorizeAndJoin(const SocketId& socket, SubscriptionRequest request);

    /** Obtains the state of the socket's subscription to a channel. */
    SubscriptionState state(const SocketId& socket,
                            const ChannelName& channel) const;

    /** Forgets the socket's subscription to a channel, discarding any
        pending authentication.
        @returns true if the socket was subscribed. */
    bool release(const SocketId& socket, const ChannelName& channel);

    /** Forgets all of the socket's subscriptions, discarding any pending
        authentication.
        @returns The channels the socket was subscribed to. */
    std::vector<ChannelName> releaseAll(const SocketId& socket);

private:
    using Ticket = internal::AuthTicket;
    using Key = std::pair<SocketId, ChannelName>;
    using MutexGuard = std::lock_guard<std::mutex>;

    struct Record
    {
        std::set<Ticket> tickets;
        SubscriptionState state = SubscriptionState::unsubscribed;
    };

    SubscriptionAuthorizer(IoStrand strand,
                           ChannelClassifier::ConstPtr classifier,
                           Transport::Ptr transport,
                           Authenticator::Ptr authenticator,
                           PresenceTracker::Ptr presence,
                           GatewayLogger::Ptr logger);

    void onAuthenticated(Ticket ticket, const SocketId& socket,
                         const ChannelName& channel,
                         AuthResult&& result) override;

    void joinPublic(const SocketId& socket, const ChannelName& channel);

    void joinPrivate(const SocketId& socket, SubscriptionRequest&& request);

    void onCompletion(Ticket ticket, const SocketId& socket,
                      const ChannelName& channel, AuthResult& result);

    void onGranted(Ticket ticket, const SocketId& socket,
                   const ChannelName& channel, AuthResult& result);

    void onDenied(Ticket ticket, const SocketId& socket,
                  const ChannelName& channel, AuthResult& result);

    Record* claim(Ticket ticket, const SocketId& socket,
                  const ChannelName& channel);

    void abandon(const SocketId& socket, const ChannelName& channel);

    MemberDescriptor memberOf(const SocketId& socket,
                              const ChannelName& channel,
                              const AuthResult& result);

    std::map<Key, Record> records_;
    IoStrand strand_;
    ChannelClassifier::ConstPtr classifier_;
    Transport::Ptr transport_;
    Authenticator::Ptr authenticator_;
    PresenceTracker::Ptr presence_;
    GatewayLogger::Ptr logger_;
    mutable std::mutex mutex_;
    Ticket nextTicket_ = 0;
};

} // namespace echo

#ifndef CPPECHO_COMPILED_LIB
#include "internal/subscriptionauthorizer.inl.hpp"
#endif

#endif // CPPECHO_SUBSCRIPTIONAUTHORIZER_HPP
