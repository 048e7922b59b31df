/*------------------------------------------------------------------------------
    Copyright Butterfly Energy Systems 2024.
    Distributed under the Boost Software License, Version 1.0.
    http://www.boost.org/LICENSE_1_0.txt
------------------------------------------------------------------------------*/

#include <catch2/catch.hpp>
#include <chrono>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>
#include <cppecho/errorcodes.hpp>
#include <cppecho/gatewaylogger.hpp>
#include <cppecho/logging.hpp>
#include <cppecho/version.hpp>
#include <cppecho/utils/consolelogger.hpp>
#include <cppecho/internal/timeformatting.hpp>

using namespace echo;

namespace
{

//------------------------------------------------------------------------------
bool endsWith(const std::string& text, const std::string& suffix)
{
    return text.size() >= suffix.size() &&
           text.compare(text.size() - suffix.size(), suffix.size(),
                        suffix) == 0;
}

} // anonymous namespace

//------------------------------------------------------------------------------
SCENARIO( "Log level labels", "[Logging]" )
{
    CHECK(logLevelLabel(LogLevel::trace) == "trace");
    CHECK(logLevelLabel(LogLevel::debug) == "debug");
    CHECK(logLevelLabel(LogLevel::info) == "info");
    CHECK(logLevelLabel(LogLevel::warning) == "warning");
    CHECK(logLevelLabel(LogLevel::error) == "error");
    CHECK(logLevelLabel(LogLevel::critical) == "critical");
    CHECK(logLevelLabel(LogLevel::off) == "off");
}

//------------------------------------------------------------------------------
SCENARIO( "Formatting log entries", "[Logging]" )
{
    SECTION("Without error code")
    {
        LogEntry entry{LogLevel::info, "Channels are ready."};
        auto text = toString(entry);
        INFO(text);
        CHECK(endsWith(text, " | cppecho | info | Channels are ready. | -"));
        CHECK(text.size() > 24);
        CHECK(text[4] == '-');
        CHECK(text[23] == 'Z');
    }

    SECTION("With error code and custom origin")
    {
        auto ec = make_error_code(GatewayErrc::authenticationDenied);
        LogEntry entry{LogLevel::warning, "Denied", ec};
        auto text = toString(entry, "gateway");
        INFO(text);
        CHECK(endsWith(text, " | gateway | warning | Denied | "
                             "echo::GatewayCategory:2 "
                             "(Subscription refused by the authenticator)"));
    }

    SECTION("Appending to the message")
    {
        LogEntry entry{LogLevel::debug, "Hello"};
        entry.append(" world");
        CHECK(entry.message() == "Hello world");
        CHECK(entry.severity() == LogLevel::debug);
        CHECK_FALSE(entry.error());
    }

    SECTION("Stream output")
    {
        LogEntry entry{LogLevel::error, "Oops"};
        std::ostringstream oss;
        oss << entry;
        CHECK(oss.str() == toString(entry));
    }
}

//------------------------------------------------------------------------------
SCENARIO( "Formatting access log entries", "[Logging]" )
{
    SECTION("Join without detail")
    {
        AccessLogEntry entry{"s1", "join", "private-room"};
        auto text = toString(entry);
        INFO(text);
        CHECK(endsWith(text, " | cppecho | s1 | join | private-room | - | -"));
    }

    SECTION("Leave with reason")
    {
        AccessLogEntry entry{"s1", "leave", "public-room", "transport close"};
        auto text = toString(entry, "echo");
        INFO(text);
        CHECK(endsWith(text, " | echo | s1 | leave | public-room | "
                             "transport close | -"));
    }

    SECTION("Rejection with error code")
    {
        AccessLogEntry entry{"s2", "reject", "private-room", "Forbidden",
                             make_error_code(GatewayErrc::authenticationDenied)};
        auto text = toString(entry);
        INFO(text);
        CHECK(endsWith(text, " | s2 | reject | private-room | Forbidden | "
                             "echo::GatewayCategory:2 "
                             "(Subscription refused by the authenticator)"));

        std::ostringstream oss;
        toColorStream(oss, entry);
        CHECK(oss.str().find("\x1b[1;31m") == 0);
    }
}

//------------------------------------------------------------------------------
SCENARIO( "Gateway logger filtering", "[Logging]" )
{
    IoContext ioctx;
    std::vector<LogEntry> entries;
    std::vector<AccessLogEntry> accessEntries;

    auto logHandler = [&entries](LogEntry e) {entries.push_back(std::move(e));};
    auto accessHandler =
        [&accessEntries](AccessLogEntry e) {accessEntries.push_back(e);};

    SECTION("Entries below the log level are dropped")
    {
        GatewayLogger logger{ioctx.get_executor(), logHandler,
                             LogLevel::warning, accessHandler, false};
        logger.log(LogLevel::info, "dropped");
        logger.log(LogEntry{LogLevel::error, "kept"});
        logger.log(LogLevel::warning, "also kept");
        ioctx.run();

        REQUIRE(entries.size() == 2);
        CHECK(entries[0].message() == "kept");
        CHECK(entries[1].message() == "also kept");
    }

    SECTION("Changing the log level")
    {
        GatewayLogger logger{ioctx.get_executor(), logHandler,
                             LogLevel::warning, accessHandler, false};
        logger.setLevel(LogLevel::trace);
        CHECK(logger.level() == LogLevel::trace);
        logger.log(LogLevel::trace, "kept");
        ioctx.run();
        CHECK(entries.size() == 1);
    }

    SECTION("Access log entries require dev mode")
    {
        GatewayLogger quiet{ioctx.get_executor(), logHandler, LogLevel::info,
                            accessHandler, false};
        quiet.log(AccessLogEntry{"s1", "join", "room"});
        ioctx.run();
        CHECK(accessEntries.empty());

        ioctx.restart();
        GatewayLogger verbose{ioctx.get_executor(), logHandler, LogLevel::info,
                              accessHandler, true};
        CHECK(verbose.devMode());
        verbose.log(AccessLogEntry{"s1", "join", "room"});
        ioctx.run();
        REQUIRE(accessEntries.size() == 1);
        CHECK(accessEntries[0].socket == "s1");
        CHECK(accessEntries[0].channel == "room");
    }

    SECTION("Absent handlers")
    {
        GatewayLogger logger{ioctx.get_executor(), nullptr, LogLevel::trace,
                             nullptr, true};
        logger.log(LogLevel::critical, "nobody listens");
        logger.log(AccessLogEntry{"s1", "join", "room"});
        ioctx.run();
        CHECK(entries.empty());
        CHECK(accessEntries.empty());
    }
}

//------------------------------------------------------------------------------
SCENARIO( "Version strings", "[Logging]" )
{
    const auto expected = std::to_string(CPPECHO_MAJOR_VERSION) + '.' +
                          std::to_string(CPPECHO_MINOR_VERSION) + '.' +
                          std::to_string(CPPECHO_PATCH_VERSION);
    CHECK(Version::asString() == expected);
    CHECK(Version::agentString() == "cppecho/" + expected);
}

//------------------------------------------------------------------------------
SCENARIO( "Console logger output", "[Logging]" )
{
    auto options = utils::ConsoleLoggerOptions{}.withOriginLabel("gateway");
    CHECK(options.originLabel() == "gateway");
    CHECK_FALSE(options.colorEnabled());
    CHECK(utils::ConsoleLoggerOptions{}.withColor().colorEnabled());

    utils::ConsoleLogger logger{options};
    std::ostringstream routine;
    std::ostringstream urgent;
    auto* savedClog = std::clog.rdbuf(routine.rdbuf());
    auto* savedCerr = std::cerr.rdbuf(urgent.rdbuf());
    logger(LogEntry{LogLevel::info, "Channels are ready."});
    logger(AccessLogEntry{"s1", "join", "news"});
    logger(LogEntry{LogLevel::error, "Publish failed"});
    std::clog.rdbuf(savedClog);
    std::cerr.rdbuf(savedCerr);

    auto text = routine.str();
    CHECK(text.find("gateway") != std::string::npos);
    CHECK(text.find("Channels are ready.") != std::string::npos);
    CHECK(text.find("| s1 | join | news |") != std::string::npos);
    CHECK(text.find("Publish failed") == std::string::npos);
    CHECK(urgent.str().find("Publish failed") != std::string::npos);
}

//------------------------------------------------------------------------------
SCENARIO( "Log timestamp format", "[Logging]" )
{
    using Clock = std::chrono::system_clock;
    using std::chrono::milliseconds;

    auto format = [](Clock::time_point when) -> std::string
    {
        std::ostringstream oss;
        internal::outputRfc3339TimestampInMilliseconds(oss, when);
        return oss.str();
    };

    CHECK(format(Clock::time_point{}) == "1970-01-01T00:00:00.000Z");
    CHECK(format(Clock::time_point{} + milliseconds{86401007}) ==
          "1970-01-02T00:00:01.007Z");
    CHECK(format(Clock::time_point{} - milliseconds{500}) ==
          "1969-12-31T23:59:59.500Z");
}
