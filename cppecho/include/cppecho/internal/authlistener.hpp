/*------------------------------------------------------------------------------
    Copyright Butterfly Energy Systems 2024.
    Distributed under the Boost Software License, Version 1.0.
    http://www.boost.org/LICENSE_1_0.txt
------------------------------------------------------------------------------*/

#ifndef CPPECHO_INTERNAL_AUTHLISTENER_HPP
#define CPPECHO_INTERNAL_AUTHLISTENER_HPP

#include <cstdint>
#include <memory>
#include "../gatewaydefs.hpp"

namespace echo
{

class AuthResult;

namespace internal
{

using AuthTicket = std::uint64_t;

//------------------------------------------------------------------------------
class AuthListener
{
public:
    using WeakPtr = std::weak_ptr<AuthListener>;

    virtual ~AuthListener() = default;

    virtual void onAuthenticated(AuthTicket ticket, const SocketId& socket,
                                 const ChannelName& channel,
                                 AuthResult&& result) = 0;
};

} // namespace internal

} // namespace echo

#endif // CPPECHO_INTERNAL_AUTHLISTENER_HPP
