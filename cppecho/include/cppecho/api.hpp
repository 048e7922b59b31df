/*------------------------------------------------------------------------------
    Copyright Butterfly Energy Systems 2022-2024.
    Distributed under the Boost Software License, Version 1.0.
    http://www.boost.org/LICENSE_1_0.txt
------------------------------------------------------------------------------*/

#ifndef CPPECHO_API_HPP
#define CPPECHO_API_HPP

//------------------------------------------------------------------------------
/** @file
    @brief Defines macros related to exporting/importing APIs. */
//------------------------------------------------------------------------------

#ifdef CPPECHO_COMPILED_LIB
#   define CPPECHO_INLINE
#   if defined _WIN32 || defined __CYGWIN__
#       define CPPECHO_API_IMPORT __declspec(dllimport)
#       define CPPECHO_API_EXPORT __declspec(dllexport)
#       define CPPECHO_API_HIDDEN
#   else
#       define CPPECHO_API_IMPORT __attribute__((visibility("default")))
#       define CPPECHO_API_EXPORT __attribute__((visibility("default")))
#       define CPPECHO_API_HIDDEN __attribute__((visibility("hidden")))
#   endif
#   ifdef CPPECHO_IS_STATIC
#       define CPPECHO_API
#       define CPPECHO_HIDDEN
#   else
#       ifdef cppecho_EXPORTS // We are building this library
#           define CPPECHO_API CPPECHO_API_EXPORT
#       else // We are using this library
#           define CPPECHO_API CPPECHO_API_IMPORT
#       endif
#       define CPPECHO_HIDDEN CPPECHO_API_HIDDEN
#   endif
#else
#   define CPPECHO_INLINE inline
#   define CPPECHO_API
#   define CPPECHO_HIDDEN
#endif

#endif // CPPECHO_API_HPP
