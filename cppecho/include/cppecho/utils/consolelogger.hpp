/*------------------------------------------------------------------------------
    Copyright Butterfly Energy Systems 2024.
    Distributed under the Boost Software License, Version 1.0.
    http://www.boost.org/LICENSE_1_0.txt
------------------------------------------------------------------------------*/

#ifndef CPPECHO_UTILS_CONSOLELOGGER_HPP
#define CPPECHO_UTILS_CONSOLELOGGER_HPP

//------------------------------------------------------------------------------
/** @file
    @brief Contains facilities for logging to the console. */
//------------------------------------------------------------------------------

#include <ostream>
#include <string>
#include "../api.hpp"
#include "../logging.hpp"

namespace echo
{

namespace utils
{

//------------------------------------------------------------------------------
/** Contains options for use with echo::utils::ConsoleLogger */
//------------------------------------------------------------------------------
class CPPECHO_API ConsoleLoggerOptions
{
public:
    /** Sets the label prefixed to every line. */
    ConsoleLoggerOptions& withOriginLabel(std::string originLabel);

    /** Enables ANSI color output. */
    ConsoleLoggerOptions& withColor(bool enabled = true);

    const std::string& originLabel() const;

    bool colorEnabled() const;

private:
    std::string originLabel_ = "cppecho";
    bool colorEnabled_ = false;
};

//------------------------------------------------------------------------------
/** Console sink for both the gateway's diagnostic log and its access log.
    Access entries and entries below LogLevel::warning go to std::clog. All
    other entries go to std::cerr and are flushed immediately. */
//------------------------------------------------------------------------------
class CPPECHO_API ConsoleLogger
{
public:
    using Options = ConsoleLoggerOptions;

    /** Constructor taking options. */
    explicit ConsoleLogger(Options options = {});

    /** Outputs the given log entry to the console. */
    void operator()(const LogEntry& entry) const;

    /** Outputs the given access log entry to the console. */
    void operator()(const AccessLogEntry& entry) const;

private:
    template <typename TEntry>
    void write(std::ostream& out, const TEntry& entry) const;

    Options options_;
};

} // namespace utils

} // namespace echo

#ifndef CPPECHO_COMPILED_LIB
#include "../internal/consolelogger.inl.hpp"
#endif

#endif // CPPECHO_UTILS_CONSOLELOGGER_HPP
