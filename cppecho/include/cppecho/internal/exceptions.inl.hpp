/*------------------------------------------------------------------------------
    Copyright Butterfly Energy Systems 2024.
    Distributed under the Boost Software License, Version 1.0.
    http://www.boost.org/LICENSE_1_0.txt
------------------------------------------------------------------------------*/

#include "../exceptions.hpp"
#include <sstream>
#include "../api.hpp"

namespace echo
{

namespace error
{

//------------------------------------------------------------------------------
CPPECHO_INLINE Failure::Failure(std::error_code ec, const std::string& info)
    : std::system_error(ec, info)
{}

//------------------------------------------------------------------------------
CPPECHO_INLINE void Logic::check(bool condition, const char* file, int line,
                                 const std::string& msg)
{
    if (condition)
        return;
    std::ostringstream oss;
    oss << file << ':' << line << ": " << msg;
    throw Logic(oss.str());
}

} // namespace error

} // namespace echo
