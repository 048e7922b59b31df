/*------------------------------------------------------------------------------
    Copyright Butterfly Energy Systems 2014-2015, 2022-2024.
    Distributed under the Boost Software License, Version 1.0.
    http://www.boost.org/LICENSE_1_0.txt
------------------------------------------------------------------------------*/

#ifndef CPPECHO_ERRORCODES_HPP
#define CPPECHO_ERRORCODES_HPP

//------------------------------------------------------------------------------
/** @file
    @brief Provides error codes and their categories. */
//------------------------------------------------------------------------------

#include <string>
#include <system_error>
#include "api.hpp"

namespace echo
{

//------------------------------------------------------------------------------
/** Converts an error code to a string containing the category and number. */
//-----------------------------------------------------------------------------
CPPECHO_API std::string briefErrorCodeString(std::error_code ec);

//------------------------------------------------------------------------------
/** Converts an error to a string containing the category, number, and
    associated message. */
//-----------------------------------------------------------------------------
CPPECHO_API std::string detailedErrorCodeString(std::error_code ec);


//******************************************************************************
// Gateway Routing Error Codes
//******************************************************************************

//------------------------------------------------------------------------------
/** %Error code values used with the GatewayCategory error category.
    None of these conditions are fatal; they describe why a routing action
    was not carried out. */
//------------------------------------------------------------------------------
enum class GatewayErrc
{
    success               = 0, ///< Routing action performed
    malformedRequest      = 1, ///< Request lacks a channel or event name
    authenticationDenied  = 2, ///< Authenticator refused the subscription
    malformedMemberData   = 3, ///< Presence member data is not structured
    eventRejected         = 4, ///< Client event failed the admission test
    bridgeUnavailable     = 5, ///< No application publisher is configured
    subscriptionAbandoned = 6, ///< Socket left before authentication ended
    count
};

//------------------------------------------------------------------------------
/** std::error_category used for reporting routing decisions.
    @see GatewayErrc */
//------------------------------------------------------------------------------
class CPPECHO_API GatewayCategory : public std::error_category
{
public:
    /** Obtains the name of the category. */
    virtual const char* name() const noexcept override;

    /** Obtains the explanatory string. */
    virtual std::string message(int ev) const override;

    /** Compares `error_code` and and error condition for equivalence. */
    virtual bool equivalent(const std::error_code& code,
                            int condition) const noexcept override;

private:
    CPPECHO_HIDDEN GatewayCategory();

    friend GatewayCategory& gatewayCategory();
};

//------------------------------------------------------------------------------
/** Obtains a reference to the static error category object for gateway
    errors.
    @relates GatewayCategory */
//------------------------------------------------------------------------------
CPPECHO_API GatewayCategory& gatewayCategory();

//------------------------------------------------------------------------------
/** Creates an error code value from a GatewayErrc enumerator.
    @relates GatewayCategory */
//-----------------------------------------------------------------------------
CPPECHO_API std::error_code make_error_code(GatewayErrc errc);

//------------------------------------------------------------------------------
/** Creates an error condition value from a GatewayErrc enumerator.
    @relates GatewayCategory */
//-----------------------------------------------------------------------------
CPPECHO_API std::error_condition make_error_condition(GatewayErrc errc);


//******************************************************************************
// Miscellaneous Error Codes
//******************************************************************************

//------------------------------------------------------------------------------
/** %Error code values used with the MiscCategory error category. */
//------------------------------------------------------------------------------
enum class MiscErrc
{
    success    = 0, ///< Operation successful
    absent     = 1, ///< Item is absent
    badType    = 2, ///< Invalid or unexpected type
    badPattern = 3, ///< Channel pattern is not a valid regular expression
    count
};

//------------------------------------------------------------------------------
/** std::error_category used for reporting miscellanous errors not belonging
    to another category.
    @see MiscErrc */
//------------------------------------------------------------------------------
class CPPECHO_API MiscCategory : public std::error_category
{
public:
    /** Obtains the name of the category. */
    virtual const char* name() const noexcept override;

    /** Obtains the explanatory string. */
    virtual std::string message(int ev) const override;

    /** Compares `error_code` and and error condition for equivalence. */
    virtual bool equivalent(const std::error_code& code,
                            int condition) const noexcept override;

private:
    CPPECHO_HIDDEN MiscCategory();

    friend MiscCategory& miscCategory();
};

//------------------------------------------------------------------------------
/** Obtains a reference to the static error category object for
    miscellaneous errors.
    @relates MiscCategory */
//------------------------------------------------------------------------------
CPPECHO_API MiscCategory& miscCategory();

//------------------------------------------------------------------------------
/** Creates an error code value from an MiscErrc enumerator.
    @relates MiscCategory */
//-----------------------------------------------------------------------------
CPPECHO_API std::error_code make_error_code(MiscErrc errc);

//------------------------------------------------------------------------------
/** Creates an error condition value from an MiscErrc enumerator.
    @relates MiscCategory */
//-----------------------------------------------------------------------------
CPPECHO_API std::error_condition make_error_condition(MiscErrc errc);

} // namespace echo


//------------------------------------------------------------------------------
namespace std
{

template <>
struct CPPECHO_API is_error_condition_enum<echo::GatewayErrc>
    : public true_type
{};

template <>
struct CPPECHO_API is_error_condition_enum<echo::MiscErrc>
    : public true_type
{};

} // namespace std


#ifndef CPPECHO_COMPILED_LIB
#include "internal/errorcodes.inl.hpp"
#endif

#endif // CPPECHO_ERRORCODES_HPP
