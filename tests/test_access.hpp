#pragma once

#include "meshcast/exchange/VideoFileViewer.hpp"
#include "meshcast/session/SessionLoop.hpp"
#include "meshcast/signaling/SignalingSession.hpp"

#include <cstdint>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace meshcast::test {

class SessionTestAccess {
public:
    static std::vector<std::string> queued_candidate_strings(const signaling::SignalingSession& session,
                                                             const PeerId& peer) {
        std::scoped_lock lock(session.mutex_);
        std::vector<std::string> result;
        const auto it = session.pending_candidates_.find(peer);
        if (it == session.pending_candidates_.end()) {
            return result;
        }
        for (const auto& candidate : it->second) {
            result.push_back(candidate.candidate);
        }
        return result;
    }

    static std::optional<std::uint64_t> generation(const signaling::SignalingSession& session, const PeerId& peer) {
        std::scoped_lock lock(session.mutex_);
        const auto it = session.records_.find(peer);
        if (it == session.records_.end()) {
            return std::nullopt;
        }
        return it->second.generation;
    }

    static bool has_connection(const signaling::SignalingSession& session, const PeerId& peer) {
        std::scoped_lock lock(session.mutex_);
        const auto it = session.records_.find(peer);
        return it != session.records_.end() && it->second.connection != nullptr;
    }

    static std::set<std::uint32_t> requested(const exchange::VideoFileViewer& viewer) {
        return viewer.requested_;
    }

    static std::size_t received_count(const exchange::VideoFileViewer& viewer) {
        return viewer.received_.size();
    }

    static std::size_t metadata_attempts(const exchange::VideoFileViewer& viewer) {
        return viewer.metadata_attempts_;
    }

    static std::size_t neighbor_count(const session::SessionLoop& loop) {
        std::scoped_lock lock(loop.mutex_);
        return loop.neighbors_.size();
    }

    static bool worker_running(const session::SessionLoop& loop) {
        return loop.worker_running_.load() || loop.worker_.joinable();
    }
};

}  // namespace meshcast::test
