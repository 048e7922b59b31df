/*------------------------------------------------------------------------------
    Copyright Butterfly Energy Systems 2022-2024.
    Distributed under the Boost Software License, Version 1.0.
    http://www.boost.org/LICENSE_1_0.txt
------------------------------------------------------------------------------*/

#ifndef CPPECHO_LOGGING_HPP
#define CPPECHO_LOGGING_HPP

//------------------------------------------------------------------------------
/** @file
    @brief Contains facilities for logging. */
//------------------------------------------------------------------------------

#include <chrono>
#include <functional>
#include <ostream>
#include <string>
#include <system_error>
#include "api.hpp"
#include "gatewaydefs.hpp"

namespace echo
{

//------------------------------------------------------------------------------
/** Log entry severity levels.
    These match the levels of the popular
    [gabime/spdlog](https://github.com/gabime/spdlog) library. */
//------------------------------------------------------------------------------
enum class CPPECHO_API LogLevel
{
    trace,    ///< Not yet used
    debug,    ///< For discarded requests and recovered problems
    info,     ///< For routing milestones
    warning,  ///< For refused subscriptions
    error,    ///< For failures where operations cannot be completed
    critical, ///< Not yet used
    off       ///< Used to disable all log events
};

//------------------------------------------------------------------------------
CPPECHO_API const std::string& logLevelLabel(LogLevel lv);

//------------------------------------------------------------------------------
/** Contains logging information. */
//------------------------------------------------------------------------------
class CPPECHO_API LogEntry
{
public:
    using TimePoint = std::chrono::system_clock::time_point;

    /** Outputs a timestamp in RFC3339 format. */
    static std::ostream& outputTime(std::ostream& out, TimePoint when);

    /** Constructor. */
    LogEntry(LogLevel severity, std::string message, std::error_code ec = {});

    /** Obtains the entry's severity level. */
    LogLevel severity() const;

    /** Obtains the entry's information text. */
    const std::string& message() const &;

    /** Moves the entry's information text. */
    std::string&& message() &&;

    /** Appends the given text to the entry's information text. */
    LogEntry& append(std::string extra);

    /** Obtains the error code associated with this entry, if applicable. */
    const std::error_code& error() const;

    /** Obtains the entry's timestamp. */
    TimePoint when() const;

private:
    std::string message_;
    std::error_code ec_;
    TimePoint when_;
    LogLevel severity_ = LogLevel::off;
};

/** Obtains a formatted log entry string combining all available information.
    @relates LogEntry */
CPPECHO_API std::string toString(const LogEntry& entry);

/** Obtains a formatted log entry string with a custom origin field.
    @relates LogEntry */
CPPECHO_API std::string toString(const LogEntry& entry,
                                 const std::string& origin);

/** Outputs a formatted log entry combining all available information.
    @relates LogEntry */
CPPECHO_API std::ostream& toStream(std::ostream& out, const LogEntry& entry);

/** Outputs a formatted log entry with a custom origin field.
    @relates LogEntry */
CPPECHO_API std::ostream& toStream(std::ostream& out, const LogEntry& entry,
                                   const std::string& origin);

/** Outputs a formatted log entry using ANSI color escape codes.
    @relates LogEntry */
CPPECHO_API std::ostream& toColorStream(std::ostream& out,
                                        const LogEntry& entry,
                                        const std::string& origin);

/** Outputs a LogEntry to an output stream.
    @relates LogEntry */
CPPECHO_API std::ostream& operator<<(std::ostream& out, const LogEntry& entry);


//------------------------------------------------------------------------------
/** Contains structured information on a channel membership action
    performed on behalf of a socket. */
//------------------------------------------------------------------------------
struct CPPECHO_API AccessLogEntry
{
    using TimePoint = std::chrono::system_clock::time_point;

    /** Constructor. */
    AccessLogEntry(SocketId socket, std::string action, ChannelName channel,
                   std::string detail = {}, std::error_code ec = {});

    SocketId socket;     ///< The socket on whose behalf the action occurred.
    std::string action;  ///< Action name, such as "join" or "leave".
    ChannelName channel; ///< The channel targeted by the action.
    std::string detail;  ///< Additional information, such as a leave reason.
    std::error_code ec;  ///< Why the action was not carried out, if it failed.
    TimePoint when;      ///< Timestamp.
};

/** Obtains a formatted access log entry string.
    @relates AccessLogEntry */
CPPECHO_API std::string toString(const AccessLogEntry& entry,
                                 const std::string& origin = "cppecho");

/** Outputs a formatted access log entry.
    @relates AccessLogEntry */
CPPECHO_API std::ostream& toStream(std::ostream& out,
                                   const AccessLogEntry& entry,
                                   const std::string& origin = "cppecho");

/** Outputs a formatted access log entry using ANSI color escape codes.
    @relates AccessLogEntry */
CPPECHO_API std::ostream& toColorStream(std::ostream& out,
                                        const AccessLogEntry& entry,
                                        const std::string& origin = "cppecho");

/** Outputs an AccessLogEntry to an output stream.
    @relates AccessLogEntry */
CPPECHO_API std::ostream& operator<<(std::ostream& out,
                                     const AccessLogEntry& entry);

} // namespace echo

#ifndef CPPECHO_COMPILED_LIB
#include "internal/logging.inl.hpp"
#endif

#endif // CPPECHO_LOGGING_HPP
