/*------------------------------------------------------------------------------
    Copyright Butterfly Energy Systems 2024.
    Distributed under the Boost Software License, Version 1.0.
    http://www.boost.org/LICENSE_1_0.txt
------------------------------------------------------------------------------*/

#include "../channelclassifier.hpp"
#include <utility>
#include "../api.hpp"
#include "../errorcodes.hpp"
#include "../exceptions.hpp"

namespace echo
{

//------------------------------------------------------------------------------
CPPECHO_INLINE ChannelClassifier::ChannelClassifier()
    : ChannelClassifier(ChannelPatterns{})
{}

//------------------------------------------------------------------------------
CPPECHO_INLINE ChannelClassifier::ChannelClassifier(ChannelPatterns patterns)
    : patterns_(std::move(patterns)),
      privateRegexes_(compileAll(patterns_.privateChannels())),
      clientEventRegexes_(compileAll(patterns_.clientEvents())),
      appRegex_(compile('^' + toRegexText(patterns_.appChannel()))),
      appPrefix_(patterns_.appChannel())
{
    auto pos = appPrefix_.find('*');
    if (pos != std::string::npos)
        appPrefix_.erase(pos, 1);
}

//------------------------------------------------------------------------------
CPPECHO_INLINE const ChannelPatterns& ChannelClassifier::patterns() const
{
    return patterns_;
}

//------------------------------------------------------------------------------
CPPECHO_INLINE bool ChannelClassifier::isPrivate(const ChannelName& name) const
{
    return searchAny(privateRegexes_, name);
}

//------------------------------------------------------------------------------
CPPECHO_INLINE bool ChannelClassifier::isPresence(const ChannelName& name) const
{
    static const std::string prefix = "presence-";
    return name.compare(0, prefix.size(), prefix) == 0;
}

//------------------------------------------------------------------------------
CPPECHO_INLINE bool
ChannelClassifier::isClientEvent(const std::string& eventName) const
{
    return searchAny(clientEventRegexes_, eventName);
}

//------------------------------------------------------------------------------
CPPECHO_INLINE bool
ChannelClassifier::isAppChannel(const ChannelName& name) const
{
    return std::regex_search(name, appRegex_);
}

//------------------------------------------------------------------------------
CPPECHO_INLINE const std::string& ChannelClassifier::appChannelPrefix() const
{
    return appPrefix_;
}

//------------------------------------------------------------------------------
/** Only the first wildcard is expanded; any others are left as regular
    expression quantifiers. */
//------------------------------------------------------------------------------
CPPECHO_INLINE std::string ChannelClassifier::toRegexText(std::string pattern)
{
    auto pos = pattern.find('*');
    if (pos != std::string::npos)
        pattern.replace(pos, 1, ".*");
    return pattern;
}

//------------------------------------------------------------------------------
CPPECHO_INLINE std::regex ChannelClassifier::compile(const std::string& text)
{
    try
    {
        return std::regex{text, std::regex::ECMAScript};
    }
    catch (const std::regex_error& e)
    {
        throw error::Failure{make_error_code(MiscErrc::badPattern),
                             "'" + text + "': " + e.what()};
    }
}

//------------------------------------------------------------------------------
CPPECHO_INLINE ChannelClassifier::RegexList
ChannelClassifier::compileAll(const ChannelPatterns::PatternList& patterns)
{
    RegexList regexes;
    regexes.reserve(patterns.size());
    for (const auto& p: patterns)
        regexes.push_back(compile(toRegexText(p)));
    return regexes;
}

//------------------------------------------------------------------------------
CPPECHO_INLINE bool ChannelClassifier::searchAny(const RegexList& regexes,
                                                 const std::string& name)
{
    for (const auto& r: regexes)
    {
        if (std::regex_search(name, r))
            return true;
    }
    return false;
}

} // namespace echo
