/*------------------------------------------------------------------------------
    Copyright Butterfly Energy Systems 2024.
    Distributed under the Boost Software License, Version 1.0.
    http://www.boost.org/LICENSE_1_0.txt
------------------------------------------------------------------------------*/

#include "../channelpatterns.hpp"
#include <utility>
#include "../api.hpp"

namespace echo
{

//------------------------------------------------------------------------------
CPPECHO_INLINE ChannelPatterns::ChannelPatterns()
    : privateChannels_({"private-*", "presence-*"}),
      clientEvents_({"client-*"}),
      appChannel_("app-*")
{}

//------------------------------------------------------------------------------
CPPECHO_INLINE ChannelPatterns&
ChannelPatterns::withPrivateChannels(PatternList patterns)
{
    privateChannels_ = std::move(patterns);
    return *this;
}

//------------------------------------------------------------------------------
CPPECHO_INLINE ChannelPatterns&
ChannelPatterns::withClientEvents(PatternList patterns)
{
    clientEvents_ = std::move(patterns);
    return *this;
}

//------------------------------------------------------------------------------
CPPECHO_INLINE ChannelPatterns&
ChannelPatterns::withAppChannel(std::string pattern)
{
    appChannel_ = std::move(pattern);
    return *this;
}

//------------------------------------------------------------------------------
CPPECHO_INLINE const ChannelPatterns::PatternList&
ChannelPatterns::privateChannels() const
{
    return privateChannels_;
}

//------------------------------------------------------------------------------
CPPECHO_INLINE const ChannelPatterns::PatternList&
ChannelPatterns::clientEvents() const
{
    return clientEvents_;
}

//------------------------------------------------------------------------------
CPPECHO_INLINE const std::string& ChannelPatterns::appChannel() const
{
    return appChannel_;
}

} // namespace echo
