/*------------------------------------------------------------------------------
    Copyright Butterfly Energy Systems 2024.
    Distributed under the Boost Software License, Version 1.0.
    http://www.boost.org/LICENSE_1_0.txt
------------------------------------------------------------------------------*/

#include "../applicationbridge.hpp"
#include <utility>
#include "../api.hpp"
#include "../errorcodes.hpp"
#include "../exceptions.hpp"

namespace echo
{

//------------------------------------------------------------------------------
CPPECHO_INLINE ApplicationBridge::ApplicationBridge(
    ChannelClassifier::ConstPtr classifier, ApplicationPublisher::Ptr publisher,
    GatewayLogger::Ptr logger)
    : classifier_(std::move(classifier)),
      publisher_(std::move(publisher)),
      logger_(std::move(logger))
{
    CPPECHO_LOGIC_CHECK(classifier_ != nullptr, "Classifier cannot be null");
    CPPECHO_LOGIC_CHECK(logger_ != nullptr, "Logger cannot be null");
}

//------------------------------------------------------------------------------
CPPECHO_INLINE bool ApplicationBridge::enabled() const
{
    return publisher_ != nullptr;
}

//------------------------------------------------------------------------------
CPPECHO_INLINE bool ApplicationBridge::isApplicationBound(
    const ClientEventRequest& request) const
{
    return request.toApplication && !request.appChannel.empty();
}

//------------------------------------------------------------------------------
CPPECHO_INLINE ChannelName
ApplicationBridge::normalizeChannel(const ChannelName& name) const
{
    if (classifier_->isAppChannel(name))
        return name;
    return classifier_->appChannelPrefix() + name;
}

//------------------------------------------------------------------------------
CPPECHO_INLINE Payload ApplicationBridge::decorate(
    Payload data, const ChannelName& sourceChannel)
{
    if (data.is_null())
    {
        data = Payload(jsoncons::json_object_arg);
    }
    else if (!data.is_object())
    {
        Payload wrapper(jsoncons::json_object_arg);
        wrapper.insert_or_assign("data", std::move(data));
        data = std::move(wrapper);
    }

    data.insert_or_assign("sourceChannel", sourceChannel);
    return data;
}

//------------------------------------------------------------------------------
CPPECHO_INLINE std::error_code ApplicationBridge::route(
    ClientEventRequest request)
{
    if (!isApplicationBound(request))
        return make_error_code(GatewayErrc::malformedRequest);

    if (!publisher_)
        return make_error_code(GatewayErrc::bridgeUnavailable);

    auto channel = normalizeChannel(request.appChannel);
    auto payload = decorate(std::move(request.data), request.channel);
    logger_->log(LogLevel::info,
                 "Sending data to application channel: " + channel);
    publisher_->publish(channel, std::move(payload));
    return {};
}

} // namespace echo
