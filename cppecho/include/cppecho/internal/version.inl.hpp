/*------------------------------------------------------------------------------
    Copyright Butterfly Energy Systems 2024.
    Distributed under the Boost Software License, Version 1.0.
    http://www.boost.org/LICENSE_1_0.txt
------------------------------------------------------------------------------*/

#include "../version.hpp"
#include "../api.hpp"

namespace echo
{

//------------------------------------------------------------------------------
/** @details
The string representation is formatted as:
```
MAJOR.MINOR.PATCH
```
without any zero padding. */
//------------------------------------------------------------------------------
CPPECHO_INLINE const std::string& Version::asString()
{
    static const auto str = std::to_string(CPPECHO_MAJOR_VERSION) + '.' +
                            std::to_string(CPPECHO_MINOR_VERSION) + '.' +
                            std::to_string(CPPECHO_PATCH_VERSION);
    return str;
}

//------------------------------------------------------------------------------
CPPECHO_INLINE const std::string& Version::agentString()
{
    static const auto str = std::string{"cppecho/"} + Version::asString();
    return str;
}

} // namespace echo
