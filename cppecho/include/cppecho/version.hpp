/*------------------------------------------------------------------------------
    Copyright Butterfly Energy Systems 2024.
    Distributed under the Boost Software License, Version 1.0.
    http://www.boost.org/LICENSE_1_0.txt
------------------------------------------------------------------------------*/

#ifndef CPPECHO_VERSION_HPP
#define CPPECHO_VERSION_HPP

#include <string>
#include "api.hpp"

//------------------------------------------------------------------------------
/** @file
    @brief Contains version information on the CppEcho library. */
//------------------------------------------------------------------------------

// NOLINTBEGIN(modernize-macro-to-enum)

/// Major version with incompatible API changes
#define CPPECHO_MAJOR_VERSION 0

/// Minor version with functionality added in a backwards-compatible manner.
#define CPPECHO_MINOR_VERSION 1

/// Patch version for backwards-compatible bug fixes.
#define CPPECHO_PATCH_VERSION 0

// NOLINTEND(modernize-macro-to-enum)

namespace echo
{

//------------------------------------------------------------------------------
/** Provides the library's version, as embedded in the agent strings that
    identify the gateway in logs.
    @see CPPECHO_MAJOR_VERSION
    @see CPPECHO_MINOR_VERSION
    @see CPPECHO_PATCH_VERSION */
//------------------------------------------------------------------------------
struct CPPECHO_API Version
{
    /** Obtains the library's current version as a string. */
    static const std::string& asString();

    /** Obtains the library name followed by its version. */
    static const std::string& agentString();
};

} // namespace echo

#ifndef CPPECHO_COMPILED_LIB
#include "internal/version.inl.hpp"
#endif

#endif // CPPECHO_VERSION_HPP
