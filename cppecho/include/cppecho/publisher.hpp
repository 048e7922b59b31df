/*------------------------------------------------------------------------------
    Copyright Butterfly Energy Systems 2024.
    Distributed under the Boost Software License, Version 1.0.
    http://www.boost.org/LICENSE_1_0.txt
------------------------------------------------------------------------------*/

#ifndef CPPECHO_PUBLISHER_HPP
#define CPPECHO_PUBLISHER_HPP

//------------------------------------------------------------------------------
/** @file
    @brief Contains the interface to the cross-process pub/sub transport. */
//------------------------------------------------------------------------------

#include <memory>
#include "api.hpp"
#include "gatewaydefs.hpp"

namespace echo
{

//------------------------------------------------------------------------------
/** Interface to the pub/sub transport carrying messages to the backend
    application. */
//------------------------------------------------------------------------------
class CPPECHO_API ApplicationPublisher
{
public:
    /// Shared pointer type
    using Ptr = std::shared_ptr<ApplicationPublisher>;

    /** Destructor. */
    virtual ~ApplicationPublisher() = default;

    /** Publishes the given payload to an application channel. */
    virtual void publish(const ChannelName& channel, Payload payload) = 0;
};

} // namespace echo

#endif // CPPECHO_PUBLISHER_HPP
