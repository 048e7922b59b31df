/*------------------------------------------------------------------------------
    Copyright Butterfly Energy Systems 2024.
    Distributed under the Boost Software License, Version 1.0.
    http://www.boost.org/LICENSE_1_0.txt
------------------------------------------------------------------------------*/

#ifndef CPPECHO_GATEWAYLOGGER_HPP
#define CPPECHO_GATEWAYLOGGER_HPP

//------------------------------------------------------------------------------
/** @file
    @brief Contains the GatewayLogger class. */
//------------------------------------------------------------------------------

#include <atomic>
#include <memory>
#include <utility>
#include "anyhandler.hpp"
#include "asiodefs.hpp"
#include "logging.hpp"

namespace echo
{

//------------------------------------------------------------------------------
/** Forwards log entries to user-provided handlers via an executor.
    Access log entries are only forwarded when dev mode is enabled. */
//------------------------------------------------------------------------------
class GatewayLogger
{
public:
    using Ptr = std::shared_ptr<GatewayLogger>;
    using LogHandler = AnyReusableHandler<void (LogEntry)>;
    using AccessLogHandler = AnyReusableHandler<void (AccessLogEntry)>;

    GatewayLogger(AnyIoExecutor e, LogHandler lh, LogLevel lv,
                  AccessLogHandler alh, bool devMode)
        : executor_(std::move(e)),
          logHandler_(std::move(lh)),
          accessLogHandler_(std::move(alh)),
          logLevel_(lv),
          devMode_(devMode)
    {}

    LogLevel level() const {return logLevel_.load();}

    void setLevel(LogLevel level) {logLevel_.store(level);}

    bool devMode() const {return devMode_;}

    void log(LogEntry entry)
    {
        if (logHandler_ && entry.severity() >= level())
            postAny(executor_, logHandler_, std::move(entry));
    }

    void log(LogLevel severity, std::string message, std::error_code ec = {})
    {
        if (logHandler_ && severity >= level())
            log(LogEntry{severity, std::move(message), ec});
    }

    void log(AccessLogEntry entry)
    {
        if (accessLogHandler_ && devMode_)
            postAny(executor_, accessLogHandler_, std::move(entry));
    }

private:
    AnyIoExecutor executor_;
    LogHandler logHandler_;
    AccessLogHandler accessLogHandler_;
    std::atomic<LogLevel> logLevel_;
    bool devMode_ = false;
};

} // namespace echo

#endif // CPPECHO_GATEWAYLOGGER_HPP
