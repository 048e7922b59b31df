/*------------------------------------------------------------------------------
    Copyright Butterfly Energy Systems 2024.
    Distributed under the Boost Software License, Version 1.0.
    http://www.boost.org/LICENSE_1_0.txt
------------------------------------------------------------------------------*/

#include "../eventgate.hpp"
#include <utility>
#include "../api.hpp"
#include "../errorcodes.hpp"
#include "../exceptions.hpp"

namespace echo
{

//------------------------------------------------------------------------------
CPPECHO_INLINE EventGate::EventGate(ChannelClassifier::ConstPtr classifier,
                                    Transport::Ptr transport)
    : classifier_(std::move(classifier)),
      transport_(std::move(transport))
{
    CPPECHO_LOGIC_CHECK(classifier_ != nullptr, "Classifier cannot be null");
    CPPECHO_LOGIC_CHECK(transport_ != nullptr, "Transport cannot be null");
}

//------------------------------------------------------------------------------
CPPECHO_INLINE bool EventGate::isEventAcceptable(
    const SocketId& socket, const ClientEventRequest& request) const
{
    return !check(socket, request);
}

//------------------------------------------------------------------------------
/** @details
    The room membership lookup is only performed when the other two
    conditions are met. */
//------------------------------------------------------------------------------
CPPECHO_INLINE std::error_code EventGate::check(
    const SocketId& socket, const ClientEventRequest& request) const
{
    if (request.channel.empty() || request.event.empty())
        return make_error_code(GatewayErrc::malformedRequest);

    bool accepted = classifier_->isClientEvent(request.event) &&
                    classifier_->isPrivate(request.channel) &&
                    transport_->isMember(socket, request.channel);

    if (!accepted)
        return make_error_code(GatewayErrc::eventRejected);
    return {};
}

} // namespace echo
