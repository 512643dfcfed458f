#include "meshcast/session/StreamNode.hpp"

#include "meshcast/Error.hpp"
#include "meshcast/logging/StructuredLogger.hpp"

#include <future>
#include <utility>

namespace meshcast::session {

namespace {

using logging::StructuredLogger;

void log_event(StructuredLogger::Level level,
               std::string_view event,
               StructuredLogger::FieldList fields = {}) {
    StructuredLogger::instance().log(level, event, std::move(fields));
}

std::unique_ptr<transport::BroadcastChannel> resolve(std::future<std::unique_ptr<transport::BroadcastChannel>>& pending) {
    try {
        auto channel = pending.get();
        if (!channel) {
            throw ResourceError("E_TRANSPORT_UNAVAILABLE", "Transport returned no channel");
        }
        return channel;
    } catch (const ResourceError&) {
        throw;
    } catch (const Error& ex) {
        const auto code = ex.code() == "E_TICKET_INVALID" ? ex.code() : std::string("E_TRANSPORT_UNAVAILABLE");
        throw ResourceError(code, ex.message(), "Check that the transport is running and the ticket is current");
    } catch (const std::exception& ex) {
        throw ResourceError("E_TRANSPORT_UNAVAILABLE", ex.what());
    }
}

}  // namespace

StreamNode::StreamNode(std::shared_ptr<transport::ChannelFactory> factory, Config config, PeerId id)
    : factory_(std::move(factory)),
      config_(std::move(config)),
      id_(std::move(id)) {
    if (!factory_) {
        throw ResourceError("E_TRANSPORT_UNAVAILABLE", "No transport factory provided");
    }
    if (!is_valid_peer_id(id_)) {
        throw ResourceError("E_PEER_ID_INVALID", "Peer id must be hexadecimal", "Use random_peer_id()");
    }
}

StreamNode::~StreamNode() {
    shutdown();
}

std::shared_ptr<transport::ChannelFactory> StreamNode::require_factory() const {
    std::scoped_lock lock(mutex_);
    if (!factory_) {
        throw ResourceError("E_TRANSPORT_UNAVAILABLE", "Stream node has been shut down");
    }
    return factory_;
}

std::unique_ptr<transport::StreamChannel> StreamNode::create_stream(const std::string& name) {
    auto factory = require_factory();
    std::future<std::unique_ptr<transport::BroadcastChannel>> pending;
    try {
        pending = factory->create(id_, name);
    } catch (const std::exception& ex) {
        throw ResourceError("E_TRANSPORT_UNAVAILABLE", ex.what());
    }
    auto channel = std::make_unique<transport::StreamChannel>(resolve(pending), config_);
    channel->set_display_name(config_.display_name);
    log_event(StructuredLogger::Level::Info,
              "node.stream.created",
              {{"topic", channel->topic()}, {"name", name}, {"peer", short_peer_id(id_)}});
    return channel;
}

std::unique_ptr<transport::StreamChannel> StreamNode::join_stream(const std::string& ticket,
                                                                  const std::string& display_name) {
    if (ticket.rfind(transport::kTicketPrefix, 0) != 0) {
        throw ResourceError("E_TICKET_INVALID",
                            "Ticket must start with '" + std::string(transport::kTicketPrefix) + "'",
                            "Copy the full ticket printed by the broadcaster");
    }

    auto factory = require_factory();
    std::future<std::unique_ptr<transport::BroadcastChannel>> pending;
    try {
        pending = factory->join(ticket, id_);
    } catch (const std::exception& ex) {
        throw ResourceError("E_TRANSPORT_UNAVAILABLE", ex.what());
    }

    if (pending.wait_for(config_.join_timeout) != std::future_status::ready) {
        log_event(StructuredLogger::Level::Warning,
                  "node.stream.join_timeout",
                  {{"peer", short_peer_id(id_)}, {"timeout_ms", std::to_string(config_.join_timeout.count())}});
        throw TimeoutError("E_JOIN_TIMEOUT",
                           "Joining the stream timed out",
                           "Make sure the broadcaster is online and retry");
    }

    auto channel = std::make_unique<transport::StreamChannel>(resolve(pending), config_);
    channel->set_display_name(display_name.empty() ? config_.display_name : display_name);
    log_event(StructuredLogger::Level::Info,
              "node.stream.joined",
              {{"topic", channel->topic()}, {"peer", short_peer_id(id_)}});
    return channel;
}

void StreamNode::shutdown() {
    std::shared_ptr<transport::ChannelFactory> factory;
    {
        std::scoped_lock lock(mutex_);
        factory = std::move(factory_);
        factory_.reset();
    }
    if (factory) {
        log_event(StructuredLogger::Level::Info, "node.shutdown", {{"peer", short_peer_id(id_)}});
    }
}

}  // namespace meshcast::session
