/*------------------------------------------------------------------------------
    Copyright Butterfly Energy Systems 2024.
    Distributed under the Boost Software License, Version 1.0.
    http://www.boost.org/LICENSE_1_0.txt
------------------------------------------------------------------------------*/

#include "../payload.hpp"
#include <jsoncons/json_decoder.hpp>
#include <jsoncons/json_parser.hpp>
#include "../api.hpp"
#include "../errorcodes.hpp"

namespace echo
{

//------------------------------------------------------------------------------
CPPECHO_INLINE ErrorOr<Payload> parsePayload(const std::string& text)
{
    jsoncons::basic_json_parser<char> parser{jsoncons::strict_json_parsing{}};
    jsoncons::json_decoder<Payload> decoder;
    std::error_code ec;

    parser.update(text.data(), text.size());
    parser.finish_parse(decoder, ec);
    if (!ec)
        parser.check_done(ec);

    // jsoncons::basic_json_parser does not treat an input with no
    // tokens as an error.
    if (ec || !decoder.is_valid())
        return makeUnexpectedError(GatewayErrc::malformedMemberData);
    return decoder.get_result();
}

} // namespace echo
