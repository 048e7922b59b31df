/*------------------------------------------------------------------------------
    Copyright Butterfly Energy Systems 2022-2024.
    Distributed under the Boost Software License, Version 1.0.
    http://www.boost.org/LICENSE_1_0.txt
------------------------------------------------------------------------------*/

#include "../logging.hpp"
#include <cassert>
#include <sstream>
#include <type_traits>
#include <utility>
#include "../api.hpp"
#include "timeformatting.hpp"

namespace echo
{

namespace internal
{

//------------------------------------------------------------------------------
inline const char* logLevelColor(LogLevel lv)
{
    static constexpr const char* red = "\x1b[1;31m";
    static constexpr const char* green = "\x1b[1;32m";
    static constexpr const char* yellow = "\x1b[1;33m";

    switch (lv)
    {
    case LogLevel::info:     return green;
    case LogLevel::warning:  return yellow;
    case LogLevel::error:    return red;
    case LogLevel::critical: return red;
    default:                 break;
    }
    return nullptr;
}

//------------------------------------------------------------------------------
inline std::ostream& outputErrorField(std::ostream& out, std::error_code ec)
{
    static constexpr const char* sep = " | ";
    if (ec)
        out << sep << ec << " (" << ec.message() << ")";
    else
        out << sep << '-';
    return out;
}

} // namespace internal


//******************************************************************************
// LogLevel
//******************************************************************************

//------------------------------------------------------------------------------
/** @relates LogLevel */
//------------------------------------------------------------------------------
CPPECHO_INLINE const std::string& logLevelLabel(LogLevel lv)
{
    static const std::string labels[] =
    {
        "trace",
        "debug",
        "info",
        "warning",
        "error",
        "critical",
        "off"
    };

    using T = std::underlying_type<LogLevel>::type;
    auto n = static_cast<T>(lv);
    assert(n >= 0 && n < T(std::extent<decltype(labels)>::value));
    return labels[n];
}


//******************************************************************************
// LogEntry
//******************************************************************************

//------------------------------------------------------------------------------
/** @details
    The following format is used:
    ```
    YYYY-MM-DDTHH:MM:SS.sssZ
    ``` */
//------------------------------------------------------------------------------
CPPECHO_INLINE std::ostream& LogEntry::outputTime(std::ostream& out,
                                                  TimePoint when)
{
    return internal::outputRfc3339TimestampInMilliseconds(out, when);
}

//------------------------------------------------------------------------------
CPPECHO_INLINE LogEntry::LogEntry(LogLevel severity, std::string message,
                                  std::error_code ec)
    : message_(std::move(message)),
      ec_(ec),
      when_(std::chrono::system_clock::now()),
      severity_(severity)
{}

//------------------------------------------------------------------------------
CPPECHO_INLINE LogLevel LogEntry::severity() const {return severity_;}

//------------------------------------------------------------------------------
CPPECHO_INLINE const std::string& LogEntry::message() const & {return message_;}

//------------------------------------------------------------------------------
CPPECHO_INLINE std::string&& LogEntry::message() && {return std::move(message_);}

//------------------------------------------------------------------------------
CPPECHO_INLINE LogEntry& LogEntry::append(std::string extra)
{
    message_ += std::move(extra);
    return *this;
}

//------------------------------------------------------------------------------
CPPECHO_INLINE const std::error_code& LogEntry::error() const {return ec_;}

//------------------------------------------------------------------------------
CPPECHO_INLINE LogEntry::TimePoint LogEntry::when() const {return when_;}

//------------------------------------------------------------------------------
/** @relates LogEntry
    @details
    The following format is used:
    ```
    YYYY-MM-DDTHH:MM:SS.sssZ | origin | level | message | error code info
    ``` */
//------------------------------------------------------------------------------
CPPECHO_INLINE std::string toString(const LogEntry& entry)
{
    return toString(entry, "cppecho");
}

//------------------------------------------------------------------------------
/** @relates LogEntry
    @copydetails toString(const LogEntry&) */
//------------------------------------------------------------------------------
CPPECHO_INLINE std::string toString(const LogEntry& entry,
                                    const std::string& origin)
{
    std::ostringstream oss;
    toStream(oss, entry, origin);
    return oss.str();
}

//------------------------------------------------------------------------------
CPPECHO_INLINE std::ostream& toStream(std::ostream& out, const LogEntry& entry)
{
    return toStream(out, entry, "cppecho");
}

//------------------------------------------------------------------------------
CPPECHO_INLINE std::ostream& toStream(std::ostream& out, const LogEntry& entry,
                                      const std::string& origin)
{
    static constexpr const char* sep = " | ";

    LogEntry::outputTime(out, entry.when());
    out << sep << origin << sep << logLevelLabel(entry.severity())
        << sep << entry.message();
    return internal::outputErrorField(out, entry.error());
}

//------------------------------------------------------------------------------
CPPECHO_INLINE std::ostream& toColorStream(std::ostream& out,
                                           const LogEntry& entry,
                                           const std::string& origin)
{
    static constexpr const char* sep = " | ";
    static constexpr const char* plain = "\x1b[0m";

    LogEntry::outputTime(out, entry.when());
    out << sep << origin << sep;

    const char* color = internal::logLevelColor(entry.severity());
    if (color != nullptr)
        out << color << logLevelLabel(entry.severity()) << plain;
    else
        out << logLevelLabel(entry.severity());

    out << sep << entry.message();
    return internal::outputErrorField(out, entry.error());
}

//------------------------------------------------------------------------------
CPPECHO_INLINE std::ostream& operator<<(std::ostream& out,
                                        const LogEntry& entry)
{
    return toStream(out, entry);
}


//******************************************************************************
// AccessLogEntry
//******************************************************************************

//------------------------------------------------------------------------------
CPPECHO_INLINE AccessLogEntry::AccessLogEntry(
    SocketId socket, std::string action, ChannelName channel,
    std::string detail, std::error_code ec)
    : socket(std::move(socket)),
      action(std::move(action)),
      channel(std::move(channel)),
      detail(std::move(detail)),
      ec(ec),
      when(std::chrono::system_clock::now())
{}

//------------------------------------------------------------------------------
/** @relates AccessLogEntry
    @details
    The following format is used:
    ```
    YYYY-MM-DDTHH:MM:SS.sssZ | origin | socket | action | channel | detail | error
    ```
    Empty fields are output as a single dash. */
//------------------------------------------------------------------------------
CPPECHO_INLINE std::string toString(const AccessLogEntry& entry,
                                    const std::string& origin)
{
    std::ostringstream oss;
    toStream(oss, entry, origin);
    return oss.str();
}

//------------------------------------------------------------------------------
CPPECHO_INLINE std::ostream& toStream(std::ostream& out,
                                      const AccessLogEntry& entry,
                                      const std::string& origin)
{
    static constexpr const char* sep = " | ";

    auto field = [&out](const std::string& text) -> std::ostream&
    {
        out << sep;
        if (text.empty())
            out << '-';
        else
            out << text;
        return out;
    };

    LogEntry::outputTime(out, entry.when);
    out << sep << origin;
    field(entry.socket);
    field(entry.action);
    field(entry.channel);
    field(entry.detail);
    return internal::outputErrorField(out, entry.ec);
}

//------------------------------------------------------------------------------
CPPECHO_INLINE std::ostream& toColorStream(std::ostream& out,
                                           const AccessLogEntry& entry,
                                           const std::string& origin)
{
    static constexpr const char* red = "\x1b[1;31m";
    static constexpr const char* plain = "\x1b[0m";

    if (!entry.ec)
        return toStream(out, entry, origin);

    out << red;
    toStream(out, entry, origin);
    return out << plain;
}

//------------------------------------------------------------------------------
CPPECHO_INLINE std::ostream& operator<<(std::ostream& out,
                                        const AccessLogEntry& entry)
{
    return toStream(out, entry);
}

} // namespace echo
