/*------------------------------------------------------------------------------
    Copyright Butterfly Energy Systems 2024.
    Distributed under the Boost Software License, Version 1.0.
    http://www.boost.org/LICENSE_1_0.txt
------------------------------------------------------------------------------*/

#ifndef CPPECHO_MOCKCOLLABORATORS_HPP
#define CPPECHO_MOCKCOLLABORATORS_HPP

#include <algorithm>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>
#include <cppecho/authenticator.hpp>
#include <cppecho/presence.hpp>
#include <cppecho/publisher.hpp>
#include <cppecho/transport.hpp>
#include <cppecho/utils/localtransport.hpp>

// The mocks below may be driven from several threads at once. Their
// accessors return snapshots taken under their mutex.

namespace test
{

using Guard = std::lock_guard<std::mutex>;

//------------------------------------------------------------------------------
// Ordered record of the side effects performed on collaborators, used to
// check the relative order of presence and room operations.
//------------------------------------------------------------------------------
class Journal
{
public:
    using Entries = std::vector<std::string>;

    void add(std::string entry)
    {
        const Guard guard{mutex_};
        entries_.push_back(std::move(entry));
    }

    Entries entries() const
    {
        const Guard guard{mutex_};
        return entries_;
    }

    bool empty() const
    {
        const Guard guard{mutex_};
        return entries_.empty();
    }

    std::size_t count(const std::string& entry) const
    {
        const Guard guard{mutex_};
        return std::count(entries_.begin(), entries_.end(), entry);
    }

    void clear()
    {
        const Guard guard{mutex_};
        entries_.clear();
    }

private:
    mutable std::mutex mutex_;
    Entries entries_;
};

using JournalPtr = std::shared_ptr<Journal>;

//------------------------------------------------------------------------------
class MockTransport : public echo::Transport
{
public:
    using Ptr = std::shared_ptr<MockTransport>;
    using Emission = echo::utils::Emission;

    static Ptr create(JournalPtr journal)
    {
        return Ptr(new MockTransport(std::move(journal)));
    }

    void join(const echo::SocketId& socket,
              const echo::ChannelName& channel) override
    {
        journal_->add("room.join " + socket + " " + channel);
        rooms_->join(socket, channel);
    }

    void leave(const echo::SocketId& socket,
               const echo::ChannelName& channel) override
    {
        journal_->add("room.leave " + socket + " " + channel);
        rooms_->leave(socket, channel);
    }

    echo::SocketIdSet membersOf(const echo::ChannelName& channel) const override
    {
        return rooms_->membersOf(channel);
    }

    bool isMember(const echo::SocketId& socket,
                  const echo::ChannelName& channel) const override
    {
        return rooms_->isMember(socket, channel);
    }

    void broadcast(const echo::ChannelName& channel, const std::string& event,
                   echo::EventArgs args,
                   const echo::SocketId& excludeSocket) override
    {
        rooms_->broadcast(channel, event, std::move(args), excludeSocket);
    }

    void emitTo(const echo::SocketId& socket, const std::string& event,
                echo::EventArgs args) override
    {
        rooms_->emitTo(socket, event, std::move(args));
    }

    std::size_t roomCount() const {return rooms_->roomCount();}

    std::vector<Emission> emissions() const
    {
        const Guard guard{mutex_};
        return emissions_;
    }

    std::vector<Emission> emissionsTo(const echo::SocketId& socket) const
    {
        std::vector<Emission> found;
        for (const auto& e: emissions())
            if (e.target == socket)
                found.push_back(e);
        return found;
    }

    void clearEmissions()
    {
        const Guard guard{mutex_};
        emissions_.clear();
    }

private:
    explicit MockTransport(JournalPtr journal)
        : journal_(std::move(journal))
    {
        rooms_ = echo::utils::LocalTransport::create(
            [this](Emission e)
            {
                const Guard guard{mutex_};
                emissions_.push_back(std::move(e));
            });
    }

    echo::utils::LocalTransport::Ptr rooms_;
    JournalPtr journal_;
    std::vector<Emission> emissions_;
    mutable std::mutex mutex_;
};

//------------------------------------------------------------------------------
// Keeps the authentication requests it receives so that tests can complete
// them later, possibly out of order.
//------------------------------------------------------------------------------
class MockAuthenticator : public echo::Authenticator
{
public:
    using Ptr = std::shared_ptr<MockAuthenticator>;
    using Hook = std::function<void (const echo::AuthRequest&)>;

    static Ptr create() {return Ptr(new MockAuthenticator);}

    void authenticate(echo::AuthRequest request) override
    {
        if (onAuthenticate)
            onAuthenticate(request);
        const Guard guard{mutex_};
        ++callCount_;
        pending_.push_back(std::move(request));
    }

    echo::AuthRequest take()
    {
        const Guard guard{mutex_};
        if (pending_.empty())
            throw std::logic_error("No pending authentication request");
        auto request = std::move(pending_.front());
        pending_.erase(pending_.begin());
        return request;
    }

    std::vector<echo::AuthRequest> pending() const
    {
        const Guard guard{mutex_};
        return pending_;
    }

    unsigned callCount() const
    {
        const Guard guard{mutex_};
        return callCount_;
    }

    // Invoked with each request before it is queued.
    Hook onAuthenticate;

private:
    MockAuthenticator() = default;

    std::vector<echo::AuthRequest> pending_;
    unsigned callCount_ = 0;
    mutable std::mutex mutex_;
};

//------------------------------------------------------------------------------
class MockPresenceTracker : public echo::PresenceTracker
{
public:
    using Ptr = std::shared_ptr<MockPresenceTracker>;
    using Hook = std::function<void (const echo::SocketId&,
                                     const echo::ChannelName&)>;

    struct Joined
    {
        echo::SocketId socket;
        echo::ChannelName channel;
        echo::MemberDescriptor member;
    };

    static Ptr create(JournalPtr journal)
    {
        return Ptr(new MockPresenceTracker(std::move(journal)));
    }

    void join(const echo::SocketId& socket, const echo::ChannelName& channel,
              echo::MemberDescriptor member) override
    {
        if (beforeJoin)
            beforeJoin(socket, channel);
        journal_->add("presence.join " + socket + " " + channel);
        const Guard guard{mutex_};
        joined_.push_back({socket, channel, std::move(member)});
    }

    void leave(const echo::SocketId& socket,
               const echo::ChannelName& channel) override
    {
        journal_->add("presence.leave " + socket + " " + channel);
        const Guard guard{mutex_};
        ++leaveCount_;
    }

    std::vector<Joined> joined() const
    {
        const Guard guard{mutex_};
        return joined_;
    }

    unsigned leaveCount() const
    {
        const Guard guard{mutex_};
        return leaveCount_;
    }

    // Invoked before a join is recorded.
    Hook beforeJoin;

private:
    explicit MockPresenceTracker(JournalPtr journal)
        : journal_(std::move(journal))
    {}

    JournalPtr journal_;
    std::vector<Joined> joined_;
    unsigned leaveCount_ = 0;
    mutable std::mutex mutex_;
};

//------------------------------------------------------------------------------
class MockPublisher : public echo::ApplicationPublisher
{
public:
    using Ptr = std::shared_ptr<MockPublisher>;

    struct Published
    {
        echo::ChannelName channel;
        echo::Payload payload;
    };

    static Ptr create() {return Ptr(new MockPublisher);}

    void publish(const echo::ChannelName& channel,
                 echo::Payload payload) override
    {
        const Guard guard{mutex_};
        published_.push_back({channel, std::move(payload)});
    }

    std::vector<Published> published() const
    {
        const Guard guard{mutex_};
        return published_;
    }

private:
    MockPublisher() = default;

    std::vector<Published> published_;
    mutable std::mutex mutex_;
};

} // namespace test

#endif // CPPECHO_MOCKCOLLABORATORS_HPP
