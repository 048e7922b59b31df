/*------------------------------------------------------------------------------
    Copyright Butterfly Energy Systems 2024.
    Distributed under the Boost Software License, Version 1.0.
    http://www.boost.org/LICENSE_1_0.txt
------------------------------------------------------------------------------*/

#include "../gatewayoptions.hpp"
#include <utility>
#include <vector>
#include "../api.hpp"
#include "../errorcodes.hpp"

namespace echo
{

namespace internal
{

//------------------------------------------------------------------------------
class GatewayConfigReader
{
public:
    explicit GatewayConfigReader(const Payload& config) : config_(config) {}

    void read(const char* key, bool& value)
    {
        const Payload* member = find(key);
        if (member == nullptr)
            return;
        if (!member->is_bool())
            return fail();
        value = member->as<bool>();
    }

    void read(const char* key, std::string& value)
    {
        const Payload* member = find(key);
        if (member == nullptr)
            return;
        if (!member->is_string())
            return fail();
        value = member->as<std::string>();
    }

    void read(const char* key, std::vector<std::string>& list)
    {
        const Payload* member = find(key);
        if (member == nullptr)
            return;
        if (!member->is_array())
            return fail();

        std::vector<std::string> items;
        for (const auto& item: member->array_range())
        {
            if (!item.is_string())
                return fail();
            items.push_back(item.as<std::string>());
        }
        list = std::move(items);
    }

    bool ok() const {return ok_;}

private:
    const Payload* find(const char* key) const
    {
        if (!ok_)
            return nullptr;
        if (!config_.contains(key))
            return nullptr;
        return &config_.at(key);
    }

    void fail() {ok_ = false;}

    const Payload& config_;
    bool ok_ = true;
};

} // namespace internal


//------------------------------------------------------------------------------
CPPECHO_INLINE const std::string& GatewayOptions::bridgeDatabase()
{
    static const std::string database = "redis";
    return database;
}

//------------------------------------------------------------------------------
CPPECHO_INLINE ErrorOr<GatewayOptions>
GatewayOptions::fromJson(const Payload& config)
{
    if (!config.is_object())
        return makeUnexpectedError(MiscErrc::badType);

    GatewayOptions options;
    internal::GatewayConfigReader reader{config};
    auto privateChannels = options.patterns_.privateChannels();
    auto clientEvents = options.patterns_.clientEvents();
    auto appChannel = options.patterns_.appChannel();

    reader.read("devMode", options.devMode_);
    reader.read("database", options.database_);
    reader.read("privateChannels", privateChannels);
    reader.read("clientEvents", clientEvents);
    reader.read("appChannel", appChannel);
    if (!reader.ok())
        return makeUnexpectedError(MiscErrc::badType);

    options.patterns_.withPrivateChannels(std::move(privateChannels))
                     .withClientEvents(std::move(clientEvents))
                     .withAppChannel(std::move(appChannel));
    return options;
}

//------------------------------------------------------------------------------
CPPECHO_INLINE GatewayOptions&
GatewayOptions::withPatterns(ChannelPatterns patterns)
{
    patterns_ = std::move(patterns);
    return *this;
}

CPPECHO_INLINE GatewayOptions& GatewayOptions::withDevMode(bool enabled)
{
    devMode_ = enabled;
    return *this;
}

CPPECHO_INLINE GatewayOptions&
GatewayOptions::withDatabase(std::string database)
{
    database_ = std::move(database);
    return *this;
}

CPPECHO_INLINE GatewayOptions& GatewayOptions::withLogHandler(LogHandler f)
{
    logHandler_ = std::move(f);
    return *this;
}

CPPECHO_INLINE GatewayOptions& GatewayOptions::withLogLevel(LogLevel level)
{
    logLevel_ = level;
    return *this;
}

CPPECHO_INLINE GatewayOptions&
GatewayOptions::withAccessLogHandler(AccessLogHandler f)
{
    accessLogHandler_ = std::move(f);
    return *this;
}

CPPECHO_INLINE const ChannelPatterns& GatewayOptions::patterns() const
{
    return patterns_;
}

CPPECHO_INLINE bool GatewayOptions::devMode() const {return devMode_;}

CPPECHO_INLINE const std::string& GatewayOptions::database() const
{
    return database_;
}

CPPECHO_INLINE bool GatewayOptions::bridgeEnabled() const
{
    return database_ == bridgeDatabase();
}

CPPECHO_INLINE const GatewayOptions::LogHandler&
GatewayOptions::logHandler() const
{
    return logHandler_;
}

CPPECHO_INLINE LogLevel GatewayOptions::logLevel() const {return logLevel_;}

CPPECHO_INLINE const GatewayOptions::AccessLogHandler&
GatewayOptions::accessLogHandler() const
{
    return accessLogHandler_;
}

} // namespace echo
