/*------------------------------------------------------------------------------
    Copyright Butterfly Energy Systems 2024.
    Distributed under the Boost Software License, Version 1.0.
    http://www.boost.org/LICENSE_1_0.txt
------------------------------------------------------------------------------*/

#ifndef CPPECHO_AUTHENTICATOR_HPP
#define CPPECHO_AUTHENTICATOR_HPP

//------------------------------------------------------------------------------
/** @file
    @brief Contains facilities for authenticating private channel
           subscriptions. */
//------------------------------------------------------------------------------

#include <memory>
#include <string>
#include <system_error>
#include "api.hpp"
#include "erroror.hpp"
#include "gatewaydefs.hpp"
#include "requests.hpp"
#include "internal/authlistener.hpp"
#include "internal/passkey.hpp"

namespace echo
{

//------------------------------------------------------------------------------
/** Outcome of a private channel authentication attempt.
    It either grants the subscription, optionally with the channel data
    describing a presence member, or denies it with a status code. */
//------------------------------------------------------------------------------
class CPPECHO_API AuthResult
{
public:
    /** Grants the subscription without channel data. */
    static AuthResult granted();

    /** Grants the subscription with the given serialized channel data. */
    static AuthResult granted(std::string channelData);

    /** Denies the subscription. */
    static AuthResult denied(StatusCode status, std::string reason = {});

    /** Returns true if the subscription was granted. */
    bool good() const;

    /** Obtains the channel data of a granted subscription.
        @returns MiscErrc::absent if there is no channel data. */
    ErrorOr<std::string> channelData() const;

    /** Obtains the status code of a denied subscription. */
    StatusCode status() const;

    /** Obtains the reason given for denying the subscription. */
    const std::string& reason() const;

    /** Obtains GatewayErrc::authenticationDenied if the subscription was
        denied, or a default-constructed error code otherwise. */
    std::error_code error() const;

private:
    AuthResult(bool granted, bool hasData, std::string text,
               StatusCode status);

    std::string text_;
    StatusCode status_ = 0;
    bool granted_ = false;
    bool hasData_ = false;
};


//------------------------------------------------------------------------------
/** Handle to a pending private channel authentication.
    It is passed to Authenticator::authenticate and must eventually be
    completed via `grant` or `reject`, from any thread. Completing a request
    whose socket has since left the channel or disconnected has no
    effect. Only the first completion of a given request is honored. */
//------------------------------------------------------------------------------
class CPPECHO_API AuthRequest
{
public:
    /** Default constructor. Completing a default-constructed request has
        no effect. */
    AuthRequest();

    /** Obtains the identity of the socket requesting the subscription. */
    const SocketId& socket() const;

    /** Obtains the subscription request, which contains the opaque
        authentication fields. */
    const SubscriptionRequest& request() const;

    /** Obtains the channel to be joined. */
    const ChannelName& channel() const;

    /** Grants the subscription without channel data. */
    void grant();

    /** Grants the subscription with the given serialized channel data. */
    void grant(std::string channelData);

    /** Denies the subscription. */
    void reject(StatusCode status, std::string reason = {});

    /** Completes the request with the given result. */
    void complete(AuthResult result);

private:
    using Listener = internal::AuthListener;
    using Ticket = internal::AuthTicket;

    Listener::WeakPtr listener_;
    SocketId socket_;
    SubscriptionRequest request_;
    Ticket ticket_ = 0;

public: // Internal use only
    AuthRequest(internal::PassKey, Listener::WeakPtr listener,
                SocketId socket, SubscriptionRequest request, Ticket ticket);
};


//------------------------------------------------------------------------------
/** Interface for user-defined private channel authenticators.
    A typical implementation forwards the request to the backend
    application's authentication endpoint, and completes the AuthRequest
    once the response arrives. */
//------------------------------------------------------------------------------
class CPPECHO_API Authenticator
{
public:
    /// Shared pointer type
    using Ptr = std::shared_ptr<Authenticator>;

    /** Destructor. */
    virtual ~Authenticator() = default;

    /** Authenticates a socket wanting to join a private channel.
        The implementation must not block while awaiting the outcome. */
    virtual void authenticate(AuthRequest request) = 0;
};

} // namespace echo

#ifndef CPPECHO_COMPILED_LIB
#include "internal/authenticator.inl.hpp"
#endif

#endif // CPPECHO_AUTHENTICATOR_HPP
