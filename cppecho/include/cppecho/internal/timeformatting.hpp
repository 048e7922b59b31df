/*------------------------------------------------------------------------------
    Copyright Butterfly Energy Systems 2024.
    Distributed under the Boost Software License, Version 1.0.
    http://www.boost.org/LICENSE_1_0.txt
------------------------------------------------------------------------------*/

#ifndef CPPECHO_INTERNAL_TIMEFORMATTING_HPP
#define CPPECHO_INTERNAL_TIMEFORMATTING_HPP

#include <chrono>
#include <ctime>
#include <iomanip>
#include <locale>
#include <ostream>

namespace echo
{

namespace internal
{

//------------------------------------------------------------------------------
// Outputs a UTC timestamp of the form 2024-03-01T12:34:56.789Z
//------------------------------------------------------------------------------
inline std::ostream& outputRfc3339TimestampInMilliseconds(
    std::ostream& out, std::chrono::system_clock::time_point when)
{
    using Clock = std::chrono::system_clock;
    using std::chrono::duration_cast;
    using std::chrono::milliseconds;
    using std::chrono::seconds;

    auto sinceEpoch = when.time_since_epoch();
    auto wholeSecs = duration_cast<seconds>(sinceEpoch);
    if (wholeSecs > sinceEpoch)
        wholeSecs -= seconds{1};
    auto ms = duration_cast<milliseconds>(sinceEpoch - wholeSecs).count();

    std::time_t time = Clock::to_time_t(Clock::time_point{wholeSecs});
    std::tm utc{};
#ifdef _WIN32
    ::gmtime_s(&utc, &time);
#else
    ::gmtime_r(&time, &utc);
#endif

    auto savedLocale = out.imbue(std::locale::classic());
    out << std::put_time(&utc, "%FT%T") << '.'
        << std::setfill('0') << std::setw(3) << ms << 'Z';
    out.imbue(savedLocale);
    return out;
}

} // namespace internal

} // namespace echo

#endif // CPPECHO_INTERNAL_TIMEFORMATTING_HPP
