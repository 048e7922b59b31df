/*------------------------------------------------------------------------------
    Copyright Butterfly Energy Systems 2024.
    Distributed under the Boost Software License, Version 1.0.
    http://www.boost.org/LICENSE_1_0.txt
------------------------------------------------------------------------------*/

//******************************************************************************
// Example of a channel router driven by a scripted sequence of socket
// requests, with rooms kept in memory.
//******************************************************************************

#include <fstream>
#include <iostream>
#include <map>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <boost/asio/post.hpp>
#include <cppecho/channelrouter.hpp>
#include <cppecho/payload.hpp>
#include <cppecho/utils/consolelogger.hpp>
#include <cppecho/utils/localtransport.hpp>
#include <cppecho/version.hpp>

//------------------------------------------------------------------------------
// Grants private subscriptions bearing the expected token, asynchronously.
//------------------------------------------------------------------------------
class TokenAuthenticator : public echo::Authenticator
{
public:
    TokenAuthenticator(echo::AnyIoExecutor exec, std::string token)
        : executor_(std::move(exec)),
          token_(std::move(token))
    {}

    void authenticate(echo::AuthRequest request) override
    {
        const auto& auth = request.request().auth;
        bool granted = auth.is_object() && auth.contains("token") &&
                       auth.at("token").is_string() &&
                       auth.at("token").as<std::string>() == token_;

        std::string channelData = R"({"user_id":")" + request.socket() +
                                  R"(","user_info":{"name":"Guest"}})";

        boost::asio::post(
            executor_,
            [request, granted, channelData]() mutable
            {
                if (granted)
                    request.grant(std::move(channelData));
                else
                    request.reject(403, "Bad token");
            });
    }

private:
    echo::AnyIoExecutor executor_;
    std::string token_;
};

//------------------------------------------------------------------------------
class PrintingPresenceTracker : public echo::PresenceTracker
{
public:
    void join(const echo::SocketId& socket, const echo::ChannelName& channel,
              echo::MemberDescriptor member) override
    {
        std::cout << "[presence] " << socket << " is here on " << channel
                  << ": " << member.to_string() << std::endl;
    }

    void leave(const echo::SocketId& socket,
               const echo::ChannelName& channel) override
    {
        std::cout << "[presence] " << socket << " left " << channel
                  << std::endl;
    }
};

//------------------------------------------------------------------------------
class PrintingPublisher : public echo::ApplicationPublisher
{
public:
    void publish(const echo::ChannelName& channel,
                 echo::Payload payload) override
    {
        std::cout << "[publish] " << channel << ": " << payload.to_string()
                  << std::endl;
    }
};

//------------------------------------------------------------------------------
void printEmission(const echo::utils::Emission& emission)
{
    std::cout << "[emit] " << emission.target << " <- " << emission.event;
    for (const auto& arg: emission.args)
        std::cout << ' ' << arg.to_string();
    std::cout << std::endl;
}

//------------------------------------------------------------------------------
echo::GatewayOptions loadOptions(const std::string& path)
{
    if (path.empty())
        return {};

    std::ifstream file(path);
    if (!file)
        throw std::runtime_error("Cannot open configuration file " + path);
    std::ostringstream oss;
    oss << file.rdbuf();

    auto config = echo::parsePayload(oss.str());
    if (!config)
        throw echo::error::Failure(config.error(), "Bad configuration file");

    auto options = echo::GatewayOptions::fromJson(*config);
    if (!options)
        throw echo::error::Failure(options.error(), "Bad configuration");
    return std::move(*options);
}

//------------------------------------------------------------------------------
// Usage: cppecho-example-gateway [config_file] | help
//------------------------------------------------------------------------------
int main(int argc, char* argv[])
{
    if (argc >= 2 && std::string{argv[1]} == "help")
    {
        std::cout << "Usage: " << argv[0] << " [config_file]" << std::endl;
        return 0;
    }

    try
    {
        std::cout << "Running " << echo::Version::agentString() << std::endl;

        echo::IoContext ioctx;
        auto exec = ioctx.get_executor();

        auto loggerOptions =
            echo::utils::ConsoleLoggerOptions{}.withOriginLabel("gateway")
                                               .withColor();
        echo::utils::ConsoleLogger logger{std::move(loggerOptions)};

        auto options = loadOptions(argc >= 2 ? argv[1] : "");
        options.withLogHandler(logger)
               .withAccessLogHandler(logger)
               .withLogLevel(echo::LogLevel::debug)
               .withDevMode();

        auto transport = echo::utils::LocalTransport::create(&printEmission);
        auto router = echo::ChannelRouter::create(
            exec, std::move(options), transport,
            std::make_shared<TokenAuthenticator>(exec, "secret"),
            std::make_shared<PrintingPresenceTracker>(),
            std::make_shared<PrintingPublisher>());

        auto goodToken = echo::Payload::parse(R"({"token":"secret"})");
        auto badToken = echo::Payload::parse(R"({"token":"guess"})");

        router->join("alice", echo::SubscriptionRequest{"news"});
        router->join("alice", echo::SubscriptionRequest{"private-room",
                                                        goodToken});
        router->join("bob", echo::SubscriptionRequest{"private-room",
                                                      goodToken});
        router->join("carol", echo::SubscriptionRequest{"private-room",
                                                        badToken});
        router->join("bob", echo::SubscriptionRequest{"presence-lobby",
                                                      goodToken});
        ioctx.run();

        auto send = [&router](const echo::SocketId& socket,
                              echo::ClientEventRequest request)
        {
            auto ec = router->clientEvent(socket, std::move(request));
            if (ec)
            {
                std::cout << socket << "'s event dropped: " << ec.message()
                          << std::endl;
            }
        };

        auto hello = echo::Payload::parse(R"({"text":"hello"})");
        send("alice",
             echo::ClientEventRequest{"private-room", "client-msg", hello});
        send("carol",
             echo::ClientEventRequest{"private-room", "client-msg", hello});
        send("alice", echo::ClientEventRequest{"news", "client-msg", hello});

        auto order = echo::Payload::parse(R"({"item":"coffee"})");
        echo::ClientEventRequest orderEvent{"private-room", "client-order",
                                            order};
        send("bob", orderEvent.withAppChannel("orders"));

        router->leave("alice", "news", "client namespace disconnect");
        router->disconnect("bob", "transport close");
        ioctx.restart();
        ioctx.run();
    }
    catch (const std::exception& e)
    {
        std::cerr << "Unhandled exception: " << e.what() << ", terminating."
                  << std::endl;
        return 1;
    }

    return 0;
}
