/*------------------------------------------------------------------------------
    Copyright Butterfly Energy Systems 2024.
    Distributed under the Boost Software License, Version 1.0.
    http://www.boost.org/LICENSE_1_0.txt
------------------------------------------------------------------------------*/

#include "../authenticator.hpp"
#include <utility>
#include "../api.hpp"
#include "../errorcodes.hpp"

namespace echo
{

//******************************************************************************
// AuthResult
//******************************************************************************

//------------------------------------------------------------------------------
CPPECHO_INLINE AuthResult AuthResult::granted()
{
    return AuthResult{true, false, {}, 0};
}

//------------------------------------------------------------------------------
CPPECHO_INLINE AuthResult AuthResult::granted(std::string channelData)
{
    return AuthResult{true, true, std::move(channelData), 0};
}

//------------------------------------------------------------------------------
CPPECHO_INLINE AuthResult AuthResult::denied(StatusCode status,
                                             std::string reason)
{
    return AuthResult{false, false, std::move(reason), status};
}

//------------------------------------------------------------------------------
CPPECHO_INLINE bool AuthResult::good() const {return granted_;}

//------------------------------------------------------------------------------
CPPECHO_INLINE ErrorOr<std::string> AuthResult::channelData() const
{
    if (!hasData_)
        return makeUnexpectedError(MiscErrc::absent);
    return text_;
}

//------------------------------------------------------------------------------
CPPECHO_INLINE StatusCode AuthResult::status() const {return status_;}

//------------------------------------------------------------------------------
CPPECHO_INLINE const std::string& AuthResult::reason() const
{
    static const std::string empty;
    return granted_ ? empty : text_;
}

//------------------------------------------------------------------------------
CPPECHO_INLINE std::error_code AuthResult::error() const
{
    if (granted_)
        return {};
    return make_error_code(GatewayErrc::authenticationDenied);
}

//------------------------------------------------------------------------------
CPPECHO_INLINE AuthResult::AuthResult(bool granted, bool hasData,
                                      std::string text, StatusCode status)
    : text_(std::move(text)),
      status_(status),
      granted_(granted),
      hasData_(hasData)
{}


//******************************************************************************
// AuthRequest
//******************************************************************************

//------------------------------------------------------------------------------
CPPECHO_INLINE AuthRequest::AuthRequest() = default;

//------------------------------------------------------------------------------
CPPECHO_INLINE const SocketId& AuthRequest::socket() const {return socket_;}

//------------------------------------------------------------------------------
CPPECHO_INLINE const SubscriptionRequest& AuthRequest::request() const
{
    return request_;
}

//------------------------------------------------------------------------------
CPPECHO_INLINE const ChannelName& AuthRequest::channel() const
{
    return request_.channel;
}

//------------------------------------------------------------------------------
CPPECHO_INLINE void AuthRequest::grant()
{
    complete(AuthResult::granted());
}

//------------------------------------------------------------------------------
CPPECHO_INLINE void AuthRequest::grant(std::string channelData)
{
    complete(AuthResult::granted(std::move(channelData)));
}

//------------------------------------------------------------------------------
CPPECHO_INLINE void AuthRequest::reject(StatusCode status, std::string reason)
{
    complete(AuthResult::denied(status, std::move(reason)));
}

//------------------------------------------------------------------------------
CPPECHO_INLINE void AuthRequest::complete(AuthResult result)
{
    auto listener = listener_.lock();
    if (listener)
    {
        listener->onAuthenticated(ticket_, socket_, request_.channel,
                                  std::move(result));
    }
}

//------------------------------------------------------------------------------
CPPECHO_INLINE AuthRequest::AuthRequest(
    internal::PassKey, Listener::WeakPtr listener, SocketId socket,
    SubscriptionRequest request, Ticket ticket)
    : listener_(std::move(listener)),
      socket_(std::move(socket)),
      request_(std::move(request)),
      ticket_(ticket)
{}

} // namespace echo
