/*------------------------------------------------------------------------------
    Copyright Butterfly Energy Systems 2024.
    Distributed under the Boost Software License, Version 1.0.
    http://www.boost.org/LICENSE_1_0.txt
------------------------------------------------------------------------------*/

#ifndef CPPECHO_GATEWAYOPTIONS_HPP
#define CPPECHO_GATEWAYOPTIONS_HPP

//------------------------------------------------------------------------------
/** @file
    @brief Contains the GatewayOptions class. */
//------------------------------------------------------------------------------

#include <string>
#include "anyhandler.hpp"
#include "api.hpp"
#include "channelpatterns.hpp"
#include "erroror.hpp"
#include "gatewaydefs.hpp"
#include "logging.hpp"

namespace echo
{

//------------------------------------------------------------------------------
/** Configuration of a ChannelRouter. */
//------------------------------------------------------------------------------
class CPPECHO_API GatewayOptions
{
public:
    /// Type-erases a LogEntry handler and its associated executor.
    using LogHandler = AnyReusableHandler<void (LogEntry)>;

    /// Type-erases an AccessLogEntry handler and its associated executor.
    using AccessLogHandler = AnyReusableHandler<void (AccessLogEntry)>;

    /** Database selector enabling the application bridge. */
    static const std::string& bridgeDatabase();

    /** Reads options from a server configuration document.
        The recognized members are `devMode` (boolean), `database` (string),
        `privateChannels` and `clientEvents` (arrays of strings), and
        `appChannel` (string). Absent members keep their default value and
        unrecognized members are ignored.
        @returns MiscErrc::badType if the document is not an object, or if
                 a recognized member has the wrong type. */
    static ErrorOr<GatewayOptions> fromJson(const Payload& config);

    GatewayOptions& withPatterns(ChannelPatterns patterns);

    GatewayOptions& withDevMode(bool enabled = true);

    GatewayOptions& withDatabase(std::string database);

    GatewayOptions& withLogHandler(LogHandler f);

    GatewayOptions& withLogLevel(LogLevel level);

    GatewayOptions& withAccessLogHandler(AccessLogHandler f);

    const ChannelPatterns& patterns() const;

    bool devMode() const;

    const std::string& database() const;

    /** Returns true if the database selector enables the application
        bridge. */
    bool bridgeEnabled() const;

    const LogHandler& logHandler() const;

    LogLevel logLevel() const;

    const AccessLogHandler& accessLogHandler() const;

private:
    ChannelPatterns patterns_;
    std::string database_ = "redis";
    LogHandler logHandler_;
    AccessLogHandler accessLogHandler_;
    LogLevel logLevel_ = LogLevel::info;
    bool devMode_ = false;
};

} // namespace echo

#ifndef CPPECHO_COMPILED_LIB
#include "internal/gatewayoptions.inl.hpp"
#endif

#endif // CPPECHO_GATEWAYOPTIONS_HPP
