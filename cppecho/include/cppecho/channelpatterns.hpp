/*------------------------------------------------------------------------------
    Copyright Butterfly Energy Systems 2024.
    Distributed under the Boost Software License, Version 1.0.
    http://www.boost.org/LICENSE_1_0.txt
------------------------------------------------------------------------------*/

#ifndef CPPECHO_CHANNELPATTERNS_HPP
#define CPPECHO_CHANNELPATTERNS_HPP

//------------------------------------------------------------------------------
/** @file
    @brief Contains the ChannelPatterns class. */
//------------------------------------------------------------------------------

#include <string>
#include <vector>
#include "api.hpp"

namespace echo
{

//------------------------------------------------------------------------------
/** Glob-like patterns used to classify channel and event names.
    Only the first `*` wildcard of each pattern is significant; it stands
    for any sequence of characters. */
//------------------------------------------------------------------------------
class CPPECHO_API ChannelPatterns
{
public:
    /// List of glob-like patterns.
    using PatternList = std::vector<std::string>;

    /** Constructs patterns having the default values
        (`private-*`, `presence-*`), (`client-*`), and `app-*`. */
    ChannelPatterns();

    /** Replaces the patterns identifying private channels. */
    ChannelPatterns& withPrivateChannels(PatternList patterns);

    /** Replaces the patterns identifying client events. */
    ChannelPatterns& withClientEvents(PatternList patterns);

    /** Replaces the pattern identifying application channels. */
    ChannelPatterns& withAppChannel(std::string pattern);

    /** Obtains the patterns identifying private channels. */
    const PatternList& privateChannels() const;

    /** Obtains the patterns identifying client events. */
    const PatternList& clientEvents() const;

    /** Obtains the pattern identifying application channels. */
    const std::string& appChannel() const;

private:
    PatternList privateChannels_;
    PatternList clientEvents_;
    std::string appChannel_;
};

} // namespace echo

#ifndef CPPECHO_COMPILED_LIB
#include "internal/channelpatterns.inl.hpp"
#endif

#endif // CPPECHO_CHANNELPATTERNS_HPP
