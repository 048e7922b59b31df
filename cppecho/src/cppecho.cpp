/*------------------------------------------------------------------------------
    Copyright Butterfly Energy Systems 2024.
    Distributed under the Boost Software License, Version 1.0.
    http://www.boost.org/LICENSE_1_0.txt
------------------------------------------------------------------------------*/

#ifndef CPPECHO_COMPILED_LIB
#error CPPECHO_COMPILED_LIB must be defined to use this source file
#endif

#include <cppecho/internal/applicationbridge.inl.hpp>
#include <cppecho/internal/authenticator.inl.hpp>
#include <cppecho/internal/channelclassifier.inl.hpp>
#include <cppecho/internal/channelpatterns.inl.hpp>
#include <cppecho/internal/channelrouter.inl.hpp>
#include <cppecho/internal/consolelogger.inl.hpp>
#include <cppecho/internal/errorcodes.inl.hpp>
#include <cppecho/internal/eventgate.inl.hpp>
#include <cppecho/internal/exceptions.inl.hpp>
#include <cppecho/internal/gatewayoptions.inl.hpp>
#include <cppecho/internal/localtransport.inl.hpp>
#include <cppecho/internal/logging.inl.hpp>
#include <cppecho/internal/payload.inl.hpp>
#include <cppecho/internal/requests.inl.hpp>
#include <cppecho/internal/subscriptionauthorizer.inl.hpp>
#include <cppecho/internal/version.inl.hpp>
