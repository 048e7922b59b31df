/*------------------------------------------------------------------------------
    Copyright Butterfly Energy Systems 2024.
    Distributed under the Boost Software License, Version 1.0.
    http://www.boost.org/LICENSE_1_0.txt
------------------------------------------------------------------------------*/

#ifndef CPPECHO_CHANNELCLASSIFIER_HPP
#define CPPECHO_CHANNELCLASSIFIER_HPP

//------------------------------------------------------------------------------
/** @file
    @brief Contains the ChannelClassifier class. */
//------------------------------------------------------------------------------

#include <memory>
#include <regex>
#include <string>
#include <vector>
#include "api.hpp"
#include "channelpatterns.hpp"
#include "gatewaydefs.hpp"

namespace echo
{

//------------------------------------------------------------------------------
/** Labels channel names and event names according to a set of
    ChannelPatterns.

    A pattern is turned into an ECMAScript regular expression by replacing
    its first `*` with `.*`. The private channel and client event tests
    search for that expression anywhere within the name, so that
    `not-private-x` is considered private with the default patterns. The
    presence and application channel tests are anchored at the start of
    the name.

    All predicates are pure and may be called concurrently. */
//------------------------------------------------------------------------------
class CPPECHO_API ChannelClassifier
{
public:
    /// Shared pointer to an immutable classifier.
    using ConstPtr = std::shared_ptr<const ChannelClassifier>;

    /** Constructs a classifier having the default patterns. */
    ChannelClassifier();

    /** Constructs a classifier using the given patterns.
        @throws error::Failure with MiscErrc::badPattern if any of the
                patterns does not form a valid regular expression. */
    explicit ChannelClassifier(ChannelPatterns patterns);

    /** Obtains the patterns this classifier was built from. */
    const ChannelPatterns& patterns() const;

    /** Determines if the given channel requires authentication. */
    bool isPrivate(const ChannelName& name) const;

    /** Determines if the given channel name starts with `presence-`. */
    bool isPresence(const ChannelName& name) const;

    /** Determines if the given event name was originated by a client. */
    bool isClientEvent(const std::string& eventName) const;

    /** Determines if the given channel name already designates an
        application channel. */
    bool isAppChannel(const ChannelName& name) const;

    /** Obtains the application channel pattern with its wildcard
        removed. */
    const std::string& appChannelPrefix() const;

private:
    using RegexList = std::vector<std::regex>;

    static std::string toRegexText(std::string pattern);

    static std::regex compile(const std::string& text);

    static RegexList compileAll(const ChannelPatterns::PatternList& patterns);

    static bool searchAny(const RegexList& regexes, const std::string& name);

    ChannelPatterns patterns_;
    RegexList privateRegexes_;
    RegexList clientEventRegexes_;
    std::regex appRegex_;
    std::string appPrefix_;
};

} // namespace echo

#ifndef CPPECHO_COMPILED_LIB
#include "internal/channelclassifier.inl.hpp"
#endif

#endif // CPPECHO_CHANNELCLASSIFIER_HPP
