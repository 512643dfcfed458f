#pragma once

#include "meshcast/Config.hpp"
#include "meshcast/Types.hpp"
#include "meshcast/protocol/WireMessage.hpp"
#include "meshcast/transport/StreamChannel.hpp"

#include <atomic>
#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace meshcast::test {
class SessionTestAccess;
}

namespace meshcast::session {

struct NeighborInfo {
    PeerId peer;
    std::string display_name;
    Timestamp last_seen{};
};

// The single inbound-processing path of one stream: events are dispatched one
// at a time and timers run between them on the same thread.
class SessionLoop {
public:
    SessionLoop(std::unique_ptr<transport::StreamChannel> channel, const Config& config);
    // Derived classes must call stop() in their destructors; the base only
    // releases the worker and the transport.
    virtual ~SessionLoop();

    SessionLoop(const SessionLoop&) = delete;
    SessionLoop& operator=(const SessionLoop&) = delete;

    // Runs the start hook once. start() and poll() call it as needed.
    void activate(Timestamp now);

    // Activates, then runs poll() on a worker thread until stop().
    void start();

    // Stops timers, closes peer handles, clears tables and releases the
    // transport. Safe to call more than once and from any thread but the worker.
    void stop() noexcept;

    // Dispatches at most one event, then runs due timers. Returns false once stopped.
    bool poll(std::chrono::milliseconds timeout);

    // Runs due timers only.
    void tick(Timestamp now);

    bool running() const noexcept { return !stopped_.load(); }
    transport::StreamChannel& channel() noexcept { return *channel_; }
    const PeerId& local_id() const noexcept { return channel_->local_id(); }
    std::string ticket(const transport::TicketOptions& options = {}) const;

    std::vector<NeighborInfo> neighbors() const;
    std::optional<std::string> last_error() const;

protected:
    virtual void on_start(Timestamp now) = 0;
    virtual void on_event(const transport::StreamEvent& event, Timestamp now) = 0;
    virtual void on_tick(Timestamp now) = 0;
    virtual void on_teardown() noexcept = 0;

    // Decodes a Signal or MediaFrame carrying a wire message. Self-originated
    // and malformed messages yield nullopt.
    std::optional<protocol::WireMessage> decode_message(const transport::StreamEvent& event) const;

    void record_error(std::string message);

    const Config& config() const noexcept { return config_; }
    std::recursive_mutex& state_mutex() const noexcept { return mutex_; }

private:
    friend class test::SessionTestAccess;

    void run();
    void dispatch(const transport::StreamEvent& event, Timestamp now);
    void track_neighbor(const transport::StreamEvent& event, Timestamp now);
    void run_timers(Timestamp now);

    std::unique_ptr<transport::StreamChannel> channel_;
    Config config_;

    std::map<PeerId, NeighborInfo> neighbors_;
    std::optional<std::string> last_error_{};
    Timestamp next_presence_at_{};
    bool started_{false};

    std::atomic<bool> stopped_{false};
    std::atomic<bool> worker_running_{false};
    std::thread worker_;
    mutable std::recursive_mutex mutex_;
};

}  // namespace meshcast::session
