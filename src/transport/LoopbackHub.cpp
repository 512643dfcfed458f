#include "meshcast/transport/LoopbackHub.hpp"

#include "meshcast/Error.hpp"
#include "meshcast/logging/StructuredLogger.hpp"
#include "meshcast/transport/FrameTag.hpp"

#include <algorithm>
#include <condition_variable>
#include <deque>
#include <utility>

namespace meshcast::transport {

namespace {

using logging::StructuredLogger;

void log_event(StructuredLogger::Level level,
               std::string_view event,
               StructuredLogger::FieldList fields = {}) {
    StructuredLogger::instance().log(level, event, std::move(fields));
}

constexpr std::size_t kTopicBytes = 16;

}  // namespace

struct LoopbackHub::Member {
    PeerId id;
    std::string topic;
    std::string display_name;

    std::mutex mutex;
    std::condition_variable ready;
    std::deque<TransportEvent> inbox;
    std::size_t capacity{0};
    bool lagged{false};
    bool closed{false};

    void push(TransportEvent event) {
        {
            std::scoped_lock lock(mutex);
            if (closed) {
                return;
            }
            if (inbox.size() >= capacity) {
                inbox.pop_front();
                lagged = true;
            }
            inbox.push_back(std::move(event));
        }
        ready.notify_one();
    }
};

class LoopbackChannel : public BroadcastChannel {
public:
    LoopbackChannel(std::shared_ptr<LoopbackHub> hub, std::shared_ptr<LoopbackHub::Member> member)
        : hub_(std::move(hub)), member_(std::move(member)) {}

    ~LoopbackChannel() override {
        close();
    }

    void send(std::span<const std::uint8_t> payload, std::int64_t tag) override {
        if (closed()) {
            throw TransportError("E_TRANSPORT_CLOSED", "Channel is closed");
        }
        if (payload.size() > kMaxTransportMessageSize) {
            throw TransportError("E_TRANSPORT_MESSAGE_TOO_LARGE",
                                 "Message of " + std::to_string(payload.size()) + " bytes exceeds the " +
                                     std::to_string(kMaxTransportMessageSize) + " byte limit");
        }
        TransportEvent event;
        event.kind = is_signal_tag(tag) ? TransportEventKind::Signal : TransportEventKind::Chunk;
        event.sender = member_->id;
        event.tag = tag;
        event.payload.assign(payload.begin(), payload.end());
        event.sent_timestamp_ms = unix_time_ms();
        hub_->deliver(*member_, std::move(event));
    }

    void announce_presence() override {
        if (closed()) {
            throw TransportError("E_TRANSPORT_CLOSED", "Channel is closed");
        }
        TransportEvent event;
        event.kind = TransportEventKind::Presence;
        event.sender = member_->id;
        {
            std::scoped_lock lock(member_->mutex);
            event.display_name = member_->display_name;
        }
        event.sent_timestamp_ms = unix_time_ms();
        hub_->deliver(*member_, std::move(event));
    }

    void set_display_name(std::string name) override {
        std::scoped_lock lock(member_->mutex);
        member_->display_name = std::move(name);
    }

    std::string ticket(const TicketOptions& options) const override {
        return hub_->ticket_for(*member_, options);
    }

    std::vector<PeerId> neighbors() const override {
        return hub_->neighbors_of(*member_);
    }

    std::optional<TransportEvent> next_event(std::chrono::milliseconds timeout) override {
        std::unique_lock lock(member_->mutex);
        member_->ready.wait_for(lock, timeout, [&] {
            return member_->closed || member_->lagged || !member_->inbox.empty();
        });
        if (member_->closed) {
            return std::nullopt;
        }
        if (member_->lagged) {
            member_->lagged = false;
            TransportEvent event;
            event.kind = TransportEventKind::Lagged;
            event.arrival = Clock::now();
            return event;
        }
        if (member_->inbox.empty()) {
            return std::nullopt;
        }
        auto event = std::move(member_->inbox.front());
        member_->inbox.pop_front();
        return event;
    }

    void close() override {
        {
            std::scoped_lock lock(member_->mutex);
            if (member_->closed) {
                return;
            }
            member_->closed = true;
            member_->inbox.clear();
        }
        member_->ready.notify_all();
        hub_->leave(member_);
    }

    bool closed() const override {
        std::scoped_lock lock(member_->mutex);
        return member_->closed;
    }

    const PeerId& local_id() const noexcept override {
        return member_->id;
    }

    const std::string& topic() const noexcept override {
        return member_->topic;
    }

private:
    std::shared_ptr<LoopbackHub> hub_;
    std::shared_ptr<LoopbackHub::Member> member_;
};

std::optional<ParsedTicket> parse_ticket(std::string_view ticket) {
    if (!ticket.starts_with(kTicketPrefix)) {
        return std::nullopt;
    }
    ticket.remove_prefix(kTicketPrefix.size());
    ParsedTicket parsed;
    const auto colon = ticket.find(':');
    parsed.topic = std::string(ticket.substr(0, colon));
    if (parsed.topic.empty() || !is_valid_peer_id(parsed.topic)) {
        return std::nullopt;
    }
    if (colon == std::string_view::npos) {
        return parsed;
    }
    auto rest = ticket.substr(colon + 1);
    while (!rest.empty()) {
        const auto comma = rest.find(',');
        const auto token = rest.substr(0, comma);
        if (!is_valid_peer_id(std::string(token))) {
            return std::nullopt;
        }
        parsed.peers.emplace_back(token);
        if (comma == std::string_view::npos) {
            break;
        }
        rest.remove_prefix(comma + 1);
    }
    return parsed;
}

std::shared_ptr<LoopbackHub> LoopbackHub::make(Options options) {
    return std::shared_ptr<LoopbackHub>(new LoopbackHub(std::move(options)));
}

std::shared_ptr<LoopbackHub> LoopbackHub::make() {
    return make(Options{});
}

LoopbackHub::LoopbackHub(Options options)
    : options_(std::move(options)) {
    if (options_.seed.has_value()) {
        generator_.seed(*options_.seed);
    } else {
        std::random_device device;
        generator_.seed((static_cast<std::uint64_t>(device()) << 32) ^ device());
    }
}

LoopbackHub::~LoopbackHub() {
    shutdown();
}

std::future<std::unique_ptr<BroadcastChannel>> LoopbackHub::create(const PeerId& self, const std::string& topic_name) {
    std::promise<std::unique_ptr<BroadcastChannel>> promise;
    auto future = promise.get_future();

    std::scoped_lock lock(mutex_);
    if (shut_down_) {
        promise.set_exception(std::make_exception_ptr(
            TransportError("E_TRANSPORT_UNAVAILABLE", "Loopback hub has been shut down")));
        return future;
    }
    std::string topic_id = random_hex(generator_, kTopicBytes);
    while (topics_.contains(topic_id)) {
        topic_id = random_hex(generator_, kTopicBytes);
    }
    topics_[topic_id].name = topic_name;
    promise.set_value(admit(topic_id, self));
    log_event(StructuredLogger::Level::Info,
              "loopback.topic.created",
              {{"topic", topic_id}, {"name", topic_name}, {"peer", short_peer_id(self)}});
    return future;
}

std::future<std::unique_ptr<BroadcastChannel>> LoopbackHub::join(const std::string& ticket, const PeerId& self) {
    std::promise<std::unique_ptr<BroadcastChannel>> promise;
    auto future = promise.get_future();

    const auto parsed = parse_ticket(ticket);
    if (!parsed.has_value()) {
        promise.set_exception(std::make_exception_ptr(
            TransportError("E_TICKET_INVALID", "Ticket could not be parsed")));
        return future;
    }

    std::scoped_lock lock(mutex_);
    if (shut_down_) {
        promise.set_exception(std::make_exception_ptr(
            TransportError("E_TRANSPORT_UNAVAILABLE", "Loopback hub has been shut down")));
        return future;
    }
    auto& topic = topics_[parsed->topic];
    if (topic.members.empty()) {
        // Gossip joins complete only once a neighbour is reachable.
        topic.pending_joins.push_back(PendingJoin{self, std::move(promise)});
        return future;
    }
    promise.set_value(admit(parsed->topic, self));
    return future;
}

std::unique_ptr<BroadcastChannel> LoopbackHub::admit(const std::string& topic_id, const PeerId& self) {
    auto member = std::make_shared<Member>();
    member->id = self;
    member->topic = topic_id;
    member->capacity = std::max<std::size_t>(options_.inbox_capacity, 1);

    auto& topic = topics_[topic_id];
    const auto now = Clock::now();
    for (const auto& existing : topic.members) {
        TransportEvent up;
        up.kind = TransportEventKind::NeighborUp;
        up.sender = self;
        up.arrival = now;
        existing->push(std::move(up));

        TransportEvent seen;
        seen.kind = TransportEventKind::NeighborUp;
        seen.sender = existing->id;
        seen.arrival = now;
        member->push(std::move(seen));
    }
    topic.members.push_back(member);

    auto channel = std::make_unique<LoopbackChannel>(shared_from_this(), member);
    fulfil_pending(topic_id);
    return channel;
}

void LoopbackHub::fulfil_pending(const std::string& topic_id) {
    auto& topic = topics_[topic_id];
    if (topic.members.empty() || topic.pending_joins.empty()) {
        return;
    }
    auto pending = std::move(topic.pending_joins);
    topic.pending_joins.clear();
    for (auto& join : pending) {
        join.promise.set_value(admit(topic_id, join.self));
    }
}

void LoopbackHub::deliver(const Member& from, TransportEvent event) {
    std::scoped_lock lock(mutex_);
    if (hooks_.fail_sends && event.kind != TransportEventKind::Presence) {
        throw TransportError("E_TRANSPORT_SEND", "Send rejected by the transport");
    }
    const auto it = topics_.find(from.topic);
    if (it == topics_.end()) {
        return;
    }
    for (const auto& member : it->second.members) {
        if (member->id == from.id) {
            continue;
        }
        if (hooks_.drop && hooks_.drop(from.id, member->id, event.tag)) {
            continue;
        }
        TransportEvent copy = event;
        copy.arrival = Clock::now();
        member->push(std::move(copy));
    }
}

void LoopbackHub::leave(const std::shared_ptr<Member>& member) {
    std::scoped_lock lock(mutex_);
    const auto it = topics_.find(member->topic);
    if (it == topics_.end()) {
        return;
    }
    auto& members = it->second.members;
    std::erase(members, member);
    const auto now = Clock::now();
    for (const auto& remaining : members) {
        TransportEvent down;
        down.kind = TransportEventKind::NeighborDown;
        down.sender = member->id;
        down.arrival = now;
        remaining->push(std::move(down));
    }
}

std::vector<PeerId> LoopbackHub::neighbors_of(const Member& member) const {
    std::scoped_lock lock(mutex_);
    std::vector<PeerId> result;
    const auto it = topics_.find(member.topic);
    if (it == topics_.end()) {
        return result;
    }
    for (const auto& other : it->second.members) {
        if (other->id != member.id) {
            result.push_back(other->id);
        }
    }
    return result;
}

std::string LoopbackHub::ticket_for(const Member& member, const TicketOptions& options) const {
    std::scoped_lock lock(mutex_);
    std::vector<PeerId> peers;
    const auto add = [&](const PeerId& id) {
        if (std::find(peers.begin(), peers.end(), id) == peers.end()) {
            peers.push_back(id);
        }
    };
    const auto it = topics_.find(member.topic);
    if (options.include_myself) {
        add(member.id);
    }
    if (it != topics_.end()) {
        const auto& members = it->second.members;
        if (options.include_bootstrap && !members.empty()) {
            add(members.front()->id);
        }
        if (options.include_neighbors) {
            for (const auto& other : members) {
                if (other->id != member.id) {
                    add(other->id);
                }
            }
        }
    }

    std::string ticket(kTicketPrefix);
    ticket += member.topic;
    if (!peers.empty()) {
        ticket.push_back(':');
        for (std::size_t i = 0; i < peers.size(); ++i) {
            if (i != 0) {
                ticket.push_back(',');
            }
            ticket += peers[i];
        }
    }
    return ticket;
}

void LoopbackHub::shutdown() {
    std::vector<std::shared_ptr<Member>> members;
    {
        std::scoped_lock lock(mutex_);
        if (shut_down_) {
            return;
        }
        shut_down_ = true;
        for (auto& [id, topic] : topics_) {
            for (auto& join : topic.pending_joins) {
                join.promise.set_exception(std::make_exception_ptr(
                    TransportError("E_TRANSPORT_UNAVAILABLE", "Loopback hub has been shut down")));
            }
            topic.pending_joins.clear();
            members.insert(members.end(), topic.members.begin(), topic.members.end());
            topic.members.clear();
        }
    }
    for (const auto& member : members) {
        {
            std::scoped_lock lock(member->mutex);
            member->closed = true;
            member->inbox.clear();
        }
        member->ready.notify_all();
    }
}

void LoopbackHub::set_test_hooks(TestHooks hooks) {
    std::scoped_lock lock(mutex_);
    hooks_ = std::move(hooks);
}

std::size_t LoopbackHub::member_count(const std::string& topic) const {
    std::scoped_lock lock(mutex_);
    const auto it = topics_.find(topic);
    return it == topics_.end() ? 0 : it->second.members.size();
}

bool LoopbackHub::is_shut_down() const {
    std::scoped_lock lock(mutex_);
    return shut_down_;
}

}  // namespace meshcast::transport
