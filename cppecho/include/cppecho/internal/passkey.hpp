/*------------------------------------------------------------------------------
    Copyright Butterfly Energy Systems 2024.
    Distributed under the Boost Software License, Version 1.0.
    http://www.boost.org/LICENSE_1_0.txt
------------------------------------------------------------------------------*/

#ifndef CPPECHO_PASSKEY_HPP
#define CPPECHO_PASSKEY_HPP

namespace echo
{

class SubscriptionAuthorizer;

namespace internal
{
    class PassKey
    {
        constexpr PassKey() {};

        friend class echo::SubscriptionAuthorizer;
    };

} // namespace internal

} // namespace echo

#endif // CPPECHO_PASSKEY_HPP
