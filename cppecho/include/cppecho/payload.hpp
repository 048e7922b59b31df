/*------------------------------------------------------------------------------
    Copyright Butterfly Energy Systems 2024.
    Distributed under the Boost Software License, Version 1.0.
    http://www.boost.org/LICENSE_1_0.txt
------------------------------------------------------------------------------*/

#ifndef CPPECHO_PAYLOAD_HPP
#define CPPECHO_PAYLOAD_HPP

//------------------------------------------------------------------------------
/** @file
    @brief Contains a function for decoding serialized payloads. */
//------------------------------------------------------------------------------

#include <string>
#include "api.hpp"
#include "erroror.hpp"
#include "gatewaydefs.hpp"

namespace echo
{

//------------------------------------------------------------------------------
/** Parses a serialized JSON document.
    Strict parsing is used, and trailing content after the document is
    considered an error.
    @returns The parsed document, or GatewayErrc::malformedMemberData if
             the text is not a single well-formed JSON document. */
//------------------------------------------------------------------------------
CPPECHO_API ErrorOr<Payload> parsePayload(const std::string& text);

} // namespace echo

#ifndef CPPECHO_COMPILED_LIB
#include "internal/payload.inl.hpp"
#endif

#endif // CPPECHO_PAYLOAD_HPP
