/*------------------------------------------------------------------------------
    Copyright Butterfly Energy Systems 2024.
    Distributed under the Boost Software License, Version 1.0.
    http://www.boost.org/LICENSE_1_0.txt
------------------------------------------------------------------------------*/

#include <catch2/catch.hpp>
#include <string>
#include <vector>
#include <cppecho/channelclassifier.hpp>
#include <cppecho/errorcodes.hpp>
#include <cppecho/exceptions.hpp>

using namespace echo;

//------------------------------------------------------------------------------
SCENARIO( "Classifying private channels", "[Classifier]" )
{
    ChannelClassifier c;

    SECTION("Channels matching the default patterns")
    {
        std::vector<std::string> names = {
            "private-room", "private-", "private-a.b.c", "presence-room",
            "presence-", "presence-chat.1"};
        for (const auto& name: names)
        {
            INFO("For channel '" << name << "'");
            CHECK(c.isPrivate(name));
        }
    }

    SECTION("Channels not matching the default patterns")
    {
        std::vector<std::string> names = {
            "public-room", "room", "", "privat-room", "PRIVATE-room",
            "presence", "app-orders"};
        for (const auto& name: names)
        {
            INFO("For channel '" << name << "'");
            CHECK_FALSE(c.isPrivate(name));
        }
    }

    SECTION("Matching is not anchored")
    {
        CHECK(c.isPrivate("not-private-x"));
        CHECK(c.isPrivate("my-presence-room"));
        CHECK(c.isPrivate("xprivate-"));
    }

    SECTION("Custom patterns")
    {
        ChannelClassifier custom{
            ChannelPatterns{}.withPrivateChannels({"secret-*"})};
        CHECK(custom.isPrivate("secret-plans"));
        CHECK_FALSE(custom.isPrivate("private-room"));
        CHECK_FALSE(custom.isPrivate("presence-room"));
    }

    SECTION("Empty pattern list")
    {
        ChannelClassifier custom{ChannelPatterns{}.withPrivateChannels({})};
        CHECK_FALSE(custom.isPrivate("private-room"));
    }
}

//------------------------------------------------------------------------------
SCENARIO( "Classifying presence channels", "[Classifier]" )
{
    ChannelClassifier c;

    std::vector<std::string> names = {
        "presence-room", "presence-", "presence", "my-presence-room",
        "Presence-room", "private-room", "", " presence-room"};
    for (const auto& name: names)
    {
        INFO("For channel '" << name << "'");
        bool expected = name.compare(0, 9, "presence-") == 0;
        CHECK(c.isPresence(name) == expected);
    }

    SECTION("Presence channels are private")
    {
        CHECK(c.isPresence("presence-room"));
        CHECK(c.isPrivate("presence-room"));
    }

    SECTION("Unaffected by the private channel patterns")
    {
        ChannelClassifier custom{ChannelPatterns{}.withPrivateChannels({})};
        CHECK(custom.isPresence("presence-room"));
    }
}

//------------------------------------------------------------------------------
SCENARIO( "Classifying client events", "[Classifier]" )
{
    ChannelClassifier c;

    CHECK(c.isClientEvent("client-typing"));
    CHECK(c.isClientEvent("client-"));
    CHECK(c.isClientEvent("not-client-typing"));
    CHECK_FALSE(c.isClientEvent("typing"));
    CHECK_FALSE(c.isClientEvent(""));
    CHECK_FALSE(c.isClientEvent("Client-typing"));

    SECTION("Custom patterns")
    {
        ChannelClassifier custom{
            ChannelPatterns{}.withClientEvents({"whisper-*", "ping"})};
        CHECK(custom.isClientEvent("whisper-hello"));
        CHECK(custom.isClientEvent("ping"));
        CHECK(custom.isClientEvent("pingpong"));
        CHECK_FALSE(custom.isClientEvent("client-typing"));
    }
}

//------------------------------------------------------------------------------
SCENARIO( "Classifying application channels", "[Classifier]" )
{
    ChannelClassifier c;

    CHECK(c.isAppChannel("app-orders"));
    CHECK(c.isAppChannel("app-"));
    CHECK_FALSE(c.isAppChannel("orders"));
    CHECK_FALSE(c.isAppChannel("my-app-x"));
    CHECK_FALSE(c.isAppChannel(""));
    CHECK(c.appChannelPrefix() == "app-");

    SECTION("Custom pattern")
    {
        ChannelClassifier custom{
            ChannelPatterns{}.withAppChannel("backend.*")};
        CHECK(custom.appChannelPrefix() == "backend.");
        CHECK(custom.isAppChannel("backend.orders"));
        CHECK(custom.isAppChannel("backendXorders"));
        CHECK_FALSE(custom.isAppChannel("app-orders"));
    }

    SECTION("Pattern without wildcard")
    {
        ChannelClassifier custom{ChannelPatterns{}.withAppChannel("backend")};
        CHECK(custom.appChannelPrefix() == "backend");
        CHECK(custom.isAppChannel("backend-orders"));
        CHECK_FALSE(custom.isAppChannel("orders"));
    }
}

//------------------------------------------------------------------------------
SCENARIO( "Only the first wildcard is expanded", "[Classifier]" )
{
    // The second '*' remains a regular expression quantifier applying to the
    // preceding '-'.
    ChannelClassifier c{ChannelPatterns{}.withPrivateChannels({"a-*b-*"})};
    CHECK(c.isPrivate("a-xb"));
    CHECK(c.isPrivate("a-xb--"));
    CHECK_FALSE(c.isPrivate("a-x"));
}

//------------------------------------------------------------------------------
SCENARIO( "Invalid channel patterns", "[Classifier]" )
{
    SECTION("Invalid private channel pattern")
    {
        auto patterns = ChannelPatterns{}.withPrivateChannels({"private-(*"});
        CHECK_THROWS_AS(ChannelClassifier{patterns}, error::Failure);
    }

    SECTION("Invalid client event pattern")
    {
        auto patterns = ChannelPatterns{}.withClientEvents({"client-[*"});
        CHECK_THROWS_AS(ChannelClassifier{patterns}, error::Failure);
    }

    SECTION("Error code carried by the exception")
    {
        auto patterns = ChannelPatterns{}.withAppChannel("app-(*");
        bool thrown = false;
        try
        {
            ChannelClassifier c{patterns};
        }
        catch (const error::Failure& e)
        {
            thrown = true;
            CHECK(e.code() == MiscErrc::badPattern);
        }
        CHECK(thrown);
    }
}

//------------------------------------------------------------------------------
SCENARIO( "Default channel patterns", "[Classifier]" )
{
    using List = ChannelPatterns::PatternList;
    const List expectedPrivate = {"private-*", "presence-*"};
    const List expectedClient = {"client-*"};

    ChannelPatterns p;
    CHECK(p.privateChannels() == expectedPrivate);
    CHECK(p.clientEvents() == expectedClient);
    CHECK(p.appChannel() == "app-*");

    ChannelClassifier c{p};
    CHECK(c.patterns().appChannel() == "app-*");
}
