#pragma once

#include "meshcast/Config.hpp"
#include "meshcast/Export.hpp"
#include "meshcast/Types.hpp"
#include "meshcast/transport/BroadcastChannel.hpp"
#include "meshcast/transport/StreamChannel.hpp"

#include <memory>
#include <mutex>
#include <string>

namespace meshcast::session {

// Entry point for one endpoint: opens stream channels through a transport factory.
class MESHCAST_API StreamNode {
public:
    StreamNode(std::shared_ptr<transport::ChannelFactory> factory, Config config, PeerId id = random_peer_id());
    ~StreamNode();

    StreamNode(const StreamNode&) = delete;
    StreamNode& operator=(const StreamNode&) = delete;

    std::unique_ptr<transport::StreamChannel> create_stream(const std::string& name);

    // Blocks until the join completes or join_timeout elapses (TimeoutError).
    std::unique_ptr<transport::StreamChannel> join_stream(const std::string& ticket,
                                                          const std::string& display_name = {});

    void shutdown();

    const PeerId& id() const noexcept { return id_; }
    const Config& config() const noexcept { return config_; }

private:
    std::shared_ptr<transport::ChannelFactory> require_factory() const;

    std::shared_ptr<transport::ChannelFactory> factory_;
    Config config_;
    PeerId id_;
    mutable std::mutex mutex_;
};

}  // namespace meshcast::session
