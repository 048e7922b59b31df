/*------------------------------------------------------------------------------
    Copyright Butterfly Energy Systems 2024.
    Distributed under the Boost Software License, Version 1.0.
    http://www.boost.org/LICENSE_1_0.txt
------------------------------------------------------------------------------*/

#include "../utils/consolelogger.hpp"
#include <iostream>
#include <utility>
#include "../api.hpp"

namespace echo
{

namespace utils
{

//******************************************************************************
// ConsoleLoggerOptions
//******************************************************************************

CPPECHO_INLINE ConsoleLoggerOptions&
ConsoleLoggerOptions::withOriginLabel(std::string originLabel)
{
    originLabel_ = std::move(originLabel);
    return *this;
}

CPPECHO_INLINE ConsoleLoggerOptions&
ConsoleLoggerOptions::withColor(bool enabled)
{
    colorEnabled_ = enabled;
    return *this;
}

CPPECHO_INLINE const std::string& ConsoleLoggerOptions::originLabel() const
{
    return originLabel_;
}

CPPECHO_INLINE bool ConsoleLoggerOptions::colorEnabled() const
{
    return colorEnabled_;
}


//******************************************************************************
// ConsoleLogger
//******************************************************************************

CPPECHO_INLINE ConsoleLogger::ConsoleLogger(Options options)
    : options_(std::move(options))
{}

CPPECHO_INLINE void ConsoleLogger::operator()(const LogEntry& entry) const
{
    if (entry.severity() < LogLevel::warning)
        return write(std::clog, entry);
    write(std::cerr, entry);
    std::cerr << std::flush;
}

CPPECHO_INLINE void ConsoleLogger::operator()(const AccessLogEntry& entry) const
{
    write(std::clog, entry);
}

template <typename TEntry>
void ConsoleLogger::write(std::ostream& out, const TEntry& entry) const
{
    if (options_.colorEnabled())
        toColorStream(out, entry, options_.originLabel());
    else
        toStream(out, entry, options_.originLabel());
    out << '\n';
}

} // namespace utils

} // namespace echo
