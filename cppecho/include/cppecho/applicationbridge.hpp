/*------------------------------------------------------------------------------
    Copyright Butterfly Energy Systems 2024.
    Distributed under the Boost Software License, Version 1.0.
    http://www.boost.org/LICENSE_1_0.txt
------------------------------------------------------------------------------*/

#ifndef CPPECHO_APPLICATIONBRIDGE_HPP
#define CPPECHO_APPLICATIONBRIDGE_HPP

//------------------------------------------------------------------------------
/** @file
    @brief Contains the ApplicationBridge class. */
//------------------------------------------------------------------------------

#include <system_error>
#include "api.hpp"
#include "channelclassifier.hpp"
#include "gatewaydefs.hpp"
#include "gatewaylogger.hpp"
#include "publisher.hpp"
#include "requests.hpp"

namespace echo
{

//------------------------------------------------------------------------------
/** Forwards client events destined for the backend application to the
    pub/sub transport.

    The bridge is disabled when it is constructed without a publisher, in
    which case application-bound events are silently dropped. */
//------------------------------------------------------------------------------
class CPPECHO_API ApplicationBridge
{
public:
    /** Constructor. The publisher may be null. */
    ApplicationBridge(ChannelClassifier::ConstPtr classifier,
                      ApplicationPublisher::Ptr publisher,
                      GatewayLogger::Ptr logger);

    /** Returns true if a publisher is available. */
    bool enabled() const;

    /** Determines if the given event is destined for the application. */
    bool isApplicationBound(const ClientEventRequest& request) const;

    /** Prepends the application channel prefix to the given name, unless
        the name already designates an application channel. */
    ChannelName normalizeChannel(const ChannelName& name) const;

    /** Adds the `sourceChannel` member to the given event data.
        Data that is not an object is wrapped as the `data` member of a new
        object, and null data is replaced by an empty object. */
    static Payload decorate(Payload data, const ChannelName& sourceChannel);

    /** Publishes the given application-bound event.
        @returns GatewayErrc::malformedRequest if the event is not
                 application-bound, GatewayErrc::bridgeUnavailable if there
                 is no publisher, or a default-constructed error code if the
                 event was published. */
    std::error_code route(ClientEventRequest request);

private:
    ChannelClassifier::ConstPtr classifier_;
    ApplicationPublisher::Ptr publisher_;
    GatewayLogger::Ptr logger_;
};

} // namespace echo

#ifndef CPPECHO_COMPILED_LIB
#include "internal/applicationbridge.inl.hpp"
#endif

#endif // CPPECHO_APPLICATIONBRIDGE_HPP
