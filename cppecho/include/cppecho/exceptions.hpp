/*------------------------------------------------------------------------------
    Copyright Butterfly Energy Systems 2024.
    Distributed under the Boost Software License, Version 1.0.
    http://www.boost.org/LICENSE_1_0.txt
------------------------------------------------------------------------------*/

#ifndef CPPECHO_EXCEPTIONS_HPP
#define CPPECHO_EXCEPTIONS_HPP

//------------------------------------------------------------------------------
/** @file
    @brief Provides exception types. */
//------------------------------------------------------------------------------

#include <stdexcept>
#include <string>
#include <system_error>
#include "api.hpp"

//------------------------------------------------------------------------------
/** Throws an echo::error::Logic exception having the given message if the
    given condition does not hold. */
//------------------------------------------------------------------------------
#define CPPECHO_LOGIC_CHECK(cond, msg) \
    {::echo::error::Logic::check((cond), __FILE__, __LINE__, (msg));}

namespace echo
{

namespace error
{

//------------------------------------------------------------------------------
/** Thrown when the gateway cannot be set up, carrying the error code that
    explains why. */
//------------------------------------------------------------------------------
class CPPECHO_API Failure : public std::system_error
{
public:
    /** Constructor taking an error code and optional context, such as the
        name of the offending setting. */
    explicit Failure(std::error_code ec, const std::string& info = {});
};

//------------------------------------------------------------------------------
/** Exception thrown when a pre-condition is not met. */
//------------------------------------------------------------------------------
struct CPPECHO_API Logic : public std::logic_error
{
    using std::logic_error::logic_error;

    /** Throws an error::Logic exception, prefixed with the given source
        location, if the given condition is false. */
    static void check(bool condition, const char* file, int line,
                      const std::string& msg);
};

} // namespace error

} // namespace echo

#ifndef CPPECHO_COMPILED_LIB
#include "internal/exceptions.inl.hpp"
#endif

#endif // CPPECHO_EXCEPTIONS_HPP
