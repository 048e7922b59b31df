/*------------------------------------------------------------------------------
    Copyright Butterfly Energy Systems 2024.
    Distributed under the Boost Software License, Version 1.0.
    http://www.boost.org/LICENSE_1_0.txt
------------------------------------------------------------------------------*/

#include "../requests.hpp"
#include <utility>
#include "../api.hpp"

namespace echo
{

namespace internal
{

//------------------------------------------------------------------------------
inline std::string stringMember(const Payload& message, const char* key)
{
    if (!message.is_object() || !message.contains(key))
        return {};
    const auto& member = message.at(key);
    return member.is_string() ? member.as<std::string>() : std::string{};
}

//------------------------------------------------------------------------------
inline Payload anyMember(const Payload& message, const char* key)
{
    if (!message.is_object() || !message.contains(key))
        return nullPayload();
    return message.at(key);
}

//------------------------------------------------------------------------------
// Mimics the truthiness of a JavaScript value, which is how the
// `toApplication` flag is interpreted by client libraries.
//------------------------------------------------------------------------------
inline bool isTruthy(const Payload& value)
{
    if (value.is_null())
        return false;
    if (value.is_bool())
        return value.as<bool>();
    if (value.is_int64() || value.is_uint64() || value.is_double())
        return value.as<double>() != 0.0;
    if (value.is_string())
        return !value.as<std::string>().empty();
    return true;
}

} // namespace internal


//******************************************************************************
// SubscriptionRequest
//******************************************************************************

//------------------------------------------------------------------------------
/** @details
    The `channel` member is expected to be a string. The `auth` member, if
    present, is kept as-is. */
//------------------------------------------------------------------------------
CPPECHO_INLINE SubscriptionRequest
SubscriptionRequest::fromJson(const Payload& message)
{
    return SubscriptionRequest{internal::stringMember(message, "channel"),
                               internal::anyMember(message, "auth")};
}

//------------------------------------------------------------------------------
CPPECHO_INLINE SubscriptionRequest::SubscriptionRequest(ChannelName channel,
                                                        Payload auth)
    : channel(std::move(channel)),
      auth(std::move(auth))
{}


//******************************************************************************
// ClientEventRequest
//******************************************************************************

//------------------------------------------------------------------------------
CPPECHO_INLINE ClientEventRequest
ClientEventRequest::fromJson(const Payload& message)
{
    ClientEventRequest req{internal::stringMember(message, "channel"),
                           internal::stringMember(message, "event"),
                           internal::anyMember(message, "data")};
    req.appChannel = internal::stringMember(message, "appChannel");
    req.toApplication =
        internal::isTruthy(internal::anyMember(message, "toApplication"));
    return req;
}

//------------------------------------------------------------------------------
CPPECHO_INLINE ClientEventRequest::ClientEventRequest(
    ChannelName channel, std::string event, Payload data)
    : channel(std::move(channel)),
      event(std::move(event)),
      data(std::move(data))
{}

//------------------------------------------------------------------------------
CPPECHO_INLINE ClientEventRequest&
ClientEventRequest::withAppChannel(ChannelName appChannel)
{
    this->appChannel = std::move(appChannel);
    toApplication = true;
    return *this;
}

} // namespace echo
