/*------------------------------------------------------------------------------
    Copyright Butterfly Energy Systems 2014-2015, 2022-2024.
    Distributed under the Boost Software License, Version 1.0.
    http://www.boost.org/LICENSE_1_0.txt
------------------------------------------------------------------------------*/

#include "../errorcodes.hpp"
#include <array>
#include <cstddef>
#include "../api.hpp"

namespace echo
{

namespace internal
{

//------------------------------------------------------------------------------
template <typename TEnum, std::size_t N>
std::string lookupErrorMessage(const char* categoryName, int errorCodeValue,
                               const std::array<const char*, N>& table)
{
    static_assert(N == static_cast<unsigned>(TEnum::count), "");
    if (errorCodeValue >= 0 && errorCodeValue < static_cast<int>(N))
        return table.at(errorCodeValue);
    return std::string(categoryName) + ':' + std::to_string(errorCodeValue);
}

} // namespace internal


//------------------------------------------------------------------------------
// Gateway Routing Error Codes
//------------------------------------------------------------------------------

CPPECHO_INLINE const char* GatewayCategory::name() const noexcept
{
    return "echo::GatewayCategory";
}

CPPECHO_INLINE std::string GatewayCategory::message(int ev) const
{
    static constexpr auto count = static_cast<unsigned>(GatewayErrc::count);

    static const std::array<const char*, count> msg{
    {
        /* success               */ "Routing action performed",
        /* malformedRequest      */ "Request lacks a channel or event name",
        /* authenticationDenied  */ "Subscription refused by the authenticator",
        /* malformedMemberData   */ "Presence member data is not valid JSON",
        /* eventRejected         */ "Client event is not acceptable",
        /* bridgeUnavailable     */ "No application publisher is configured",
        /* subscriptionAbandoned */ "Socket left before authentication ended"
    }};

    return internal::lookupErrorMessage<GatewayErrc>("echo::GatewayCategory",
                                                     ev, msg);
}

CPPECHO_INLINE bool GatewayCategory::equivalent(const std::error_code& code,
                                                int condition) const noexcept
{
    if (code.category() == gatewayCategory())
        return code.value() == condition;
    if (condition == static_cast<int>(GatewayErrc::success))
        return !code;
    return false;
}

CPPECHO_INLINE GatewayCategory::GatewayCategory() = default;

CPPECHO_INLINE GatewayCategory& gatewayCategory()
{
    static GatewayCategory instance;
    return instance;
}

CPPECHO_INLINE std::error_code make_error_code(GatewayErrc errc)
{
    return {static_cast<int>(errc), gatewayCategory()};
}

CPPECHO_INLINE std::error_condition make_error_condition(GatewayErrc errc)
{
    return {static_cast<int>(errc), gatewayCategory()};
}


//------------------------------------------------------------------------------
// Miscellaneous Error Codes
//------------------------------------------------------------------------------

CPPECHO_INLINE const char* MiscCategory::name() const noexcept
{
    return "echo::MiscCategory";
}

CPPECHO_INLINE std::string MiscCategory::message(int ev) const
{
    static constexpr auto count = static_cast<unsigned>(MiscErrc::count);

    static const std::array<const char*, count> msg{
    {
        /* success    */ "Operation successful",
        /* absent     */ "Item is absent",
        /* badType    */ "Invalid or unexpected type",
        /* badPattern */ "Channel pattern is not a valid regular expression"
    }};

    return internal::lookupErrorMessage<MiscErrc>("echo::MiscCategory",
                                                  ev, msg);
}

CPPECHO_INLINE bool MiscCategory::equivalent(const std::error_code& code,
                                             int condition) const noexcept
{
    if (code.category() == miscCategory())
        return code.value() == condition;
    if (condition == static_cast<int>(MiscErrc::success))
        return !code;
    return false;
}

CPPECHO_INLINE MiscCategory::MiscCategory() = default;

CPPECHO_INLINE MiscCategory& miscCategory()
{
    static MiscCategory instance;
    return instance;
}

CPPECHO_INLINE std::error_code make_error_code(MiscErrc errc)
{
    return {static_cast<int>(errc), miscCategory()};
}

CPPECHO_INLINE std::error_condition make_error_condition(MiscErrc errc)
{
    return {static_cast<int>(errc), miscCategory()};
}


//------------------------------------------------------------------------------
/** The format is `<category>:<value>`. */
//-----------------------------------------------------------------------------
CPPECHO_INLINE std::string briefErrorCodeString(std::error_code ec)
{
    return std::string{ec.category().name()} + ':' + std::to_string(ec.value());
}

//------------------------------------------------------------------------------
/** The format is `<category>:<value> (<message>)`. */
//-----------------------------------------------------------------------------
CPPECHO_INLINE std::string detailedErrorCodeString(std::error_code ec)
{
    return std::string{ec.category().name()} + ':' +
           std::to_string(ec.value()) + " (" + ec.message() + ')';
}

} // namespace echo
