/*------------------------------------------------------------------------------
    Copyright Butterfly Energy Systems 2024.
    Distributed under the Boost Software License, Version 1.0.
    http://www.boost.org/LICENSE_1_0.txt
------------------------------------------------------------------------------*/

#include <catch2/catch.hpp>
#include <string>
#include <cppecho/errorcodes.hpp>
#include <cppecho/payload.hpp>
#include <cppecho/requests.hpp>

using namespace echo;

//------------------------------------------------------------------------------
SCENARIO( "Parsing serialized payloads", "[Payload]" )
{
    SECTION("Well-formed object")
    {
        auto parsed = parsePayload(R"({"id":1,"name":"A"})");
        REQUIRE(parsed.has_value());
        CHECK(parsed->is_object());
        CHECK(parsed->at("id").as<int>() == 1);
        CHECK(parsed->at("name").as<std::string>() == "A");
        CHECK(*parsed == Payload::parse(R"({"name":"A","id":1})"));
    }

    SECTION("Well-formed scalars and arrays")
    {
        auto number = parsePayload("42");
        REQUIRE(number.has_value());
        CHECK(number->as<int>() == 42);

        auto text = parsePayload(R"("hello")");
        REQUIRE(text.has_value());
        CHECK(text->as<std::string>() == "hello");

        auto array = parsePayload("[1, 2, 3]");
        REQUIRE(array.has_value());
        CHECK(array->size() == 3);

        auto null = parsePayload("null");
        REQUIRE(null.has_value());
        CHECK(null->is_null());
    }

    SECTION("Malformed input")
    {
        const char* inputs[] = {
            "not-json", "", "   ", "{", R"({"id":1,})", "[1 2]",
            R"({"id":1} trailing)", "{'id':1}"};
        for (const char* input: inputs)
        {
            INFO("For input '" << input << "'");
            auto parsed = parsePayload(input);
            REQUIRE_FALSE(parsed.has_value());
            CHECK(parsed.error() == GatewayErrc::malformedMemberData);
        }
    }
}

//------------------------------------------------------------------------------
SCENARIO( "Extracting subscription requests", "[Payload]" )
{
    SECTION("Complete message")
    {
        auto msg = Payload::parse(
            R"({"channel":"private-room","auth":{"headers":{"X":"y"}}})");
        auto req = SubscriptionRequest::fromJson(msg);
        CHECK(req.channel == "private-room");
        CHECK(req.auth == msg.at("auth"));
    }

    SECTION("Missing or wrongly-typed members")
    {
        auto req = SubscriptionRequest::fromJson(Payload::parse("{}"));
        CHECK(req.channel.empty());
        CHECK(req.auth.is_null());

        req = SubscriptionRequest::fromJson(Payload::parse(R"({"channel":3})"));
        CHECK(req.channel.empty());

        req = SubscriptionRequest::fromJson(Payload::parse("[1,2]"));
        CHECK(req.channel.empty());
    }
}

//------------------------------------------------------------------------------
SCENARIO( "Extracting client event requests", "[Payload]" )
{
    SECTION("Broadcast event")
    {
        auto msg = Payload::parse(
            R"({"channel":"private-room","event":"client-msg","data":{"x":1}})");
        auto req = ClientEventRequest::fromJson(msg);
        CHECK(req.channel == "private-room");
        CHECK(req.event == "client-msg");
        CHECK(req.data == msg.at("data"));
        CHECK_FALSE(req.toApplication);
        CHECK(req.appChannel.empty());
    }

    SECTION("Application-bound event")
    {
        auto msg = Payload::parse(
            R"({"channel":"private-room","event":"client-msg","data":{},)"
            R"("toApplication":true,"appChannel":"orders"})");
        auto req = ClientEventRequest::fromJson(msg);
        CHECK(req.toApplication);
        CHECK(req.appChannel == "orders");
    }

    SECTION("Truthiness of the toApplication flag")
    {
        struct Case
        {
            const char* flag;
            bool expected;
        };

        Case cases[] = {
            {"true", true}, {"false", false}, {"1", true}, {"0", false},
            {"\"yes\"", true}, {"\"\"", false}, {"null", false},
            {"{}", true}, {"[]", true}};

        for (const auto& c: cases)
        {
            INFO("For flag " << c.flag);
            auto msg = Payload::parse(
                std::string{R"({"channel":"c","event":"e","toApplication":)"} +
                c.flag + "}");
            auto req = ClientEventRequest::fromJson(msg);
            CHECK(req.toApplication == c.expected);
        }
    }

    SECTION("Missing members")
    {
        auto req = ClientEventRequest::fromJson(Payload::parse("{}"));
        CHECK(req.channel.empty());
        CHECK(req.event.empty());
        CHECK(req.data.is_null());
        CHECK_FALSE(req.toApplication);
    }

    SECTION("Fluent construction")
    {
        auto req = ClientEventRequest{"private-room", "client-msg"}
                       .withAppChannel("orders");
        CHECK(req.toApplication);
        CHECK(req.appChannel == "orders");
        CHECK(req.data.is_null());
    }
}
