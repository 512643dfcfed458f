#pragma once

#include "meshcast/Types.hpp"
#include "meshcast/transport/BroadcastChannel.hpp"

#include <cstdint>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <random>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace meshcast::transport {

struct ParsedTicket {
    std::string topic;
    std::vector<PeerId> peers;
};

// Accepts "stream<topic-hex>" optionally followed by ":<peer>,<peer>...".
std::optional<ParsedTicket> parse_ticket(std::string_view ticket);

// In-process gossip: every member of a topic receives what the others send.
class LoopbackHub : public ChannelFactory, public std::enable_shared_from_this<LoopbackHub> {
public:
    struct Options {
        std::size_t inbox_capacity{4096};
        std::optional<std::uint64_t> seed{};
    };

    struct TestHooks {
        // Returns true to drop the delivery from -> to.
        std::function<bool(const PeerId& from, const PeerId& to, std::int64_t tag)> drop;
        bool fail_sends{false};
    };

    static std::shared_ptr<LoopbackHub> make(Options options);
    static std::shared_ptr<LoopbackHub> make();

    ~LoopbackHub() override;

    std::future<std::unique_ptr<BroadcastChannel>> create(const PeerId& self, const std::string& topic_name) override;
    std::future<std::unique_ptr<BroadcastChannel>> join(const std::string& ticket, const PeerId& self) override;
    void shutdown() override;

    void set_test_hooks(TestHooks hooks);
    std::size_t member_count(const std::string& topic) const;
    bool is_shut_down() const;

    struct Member;

private:
    explicit LoopbackHub(Options options);

    struct PendingJoin {
        PeerId self;
        std::promise<std::unique_ptr<BroadcastChannel>> promise;
    };

    struct Topic {
        std::string name;
        std::vector<std::shared_ptr<Member>> members;
        std::vector<PendingJoin> pending_joins;
    };

    friend class LoopbackChannel;

    std::unique_ptr<BroadcastChannel> admit(const std::string& topic_id, const PeerId& self);
    void fulfil_pending(const std::string& topic_id);
    void deliver(const Member& from, TransportEvent event);
    void leave(const std::shared_ptr<Member>& member);
    std::vector<PeerId> neighbors_of(const Member& member) const;
    std::string ticket_for(const Member& member, const TicketOptions& options) const;

    Options options_;
    TestHooks hooks_;
    std::mt19937_64 generator_;
    std::unordered_map<std::string, Topic> topics_;
    bool shut_down_{false};
    mutable std::recursive_mutex mutex_;
};

}  // namespace meshcast::transport
