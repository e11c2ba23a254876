/**
 * @file session_manager.h
 * @brief Session lifecycle: connect, event loop, disconnect
 */

#ifndef WWS_SESSION_MANAGER_INTERNAL_H
#define WWS_SESSION_MANAGER_INTERNAL_H

#include "event_stream.h"
#include "wake_session.h"

#include "wws/features/wakeword/wws_detector_cache.h"

#include <atomic>
#include <cstdint>
#include <string>

namespace wws {
namespace server {

class SessionManager {
public:
    /**
     * @param cache Shared detector cache (must outlive the manager)
     * @param config Session settings (copied)
     */
    SessionManager(wakeword::DetectorCache& cache, SessionConfig config);

    SessionManager(const SessionManager&) = delete;
    SessionManager& operator=(const SessionManager&) = delete;

    /**
     * @brief Serve one connection until it ends
     *
     * Reads and dispatches events until audio-stop, end of stream or an
     * error. The session's detector is back in the cache when this returns.
     *
     * @return WWS_SUCCESS on a normal close, otherwise the error that ended it
     */
    wws_result_t runConnection(EventReader& reader, EventWriter& writer);

    int32_t activeConnections() const { return active_connections_; }
    int64_t totalConnections() const { return total_connections_; }
    int64_t totalDetections() const { return total_detections_; }

    wakeword::DetectorCache& cache() { return cache_; }
    const SessionConfig& config() const { return config_; }

private:
    wakeword::DetectorCache& cache_;
    const SessionConfig config_;

    std::atomic<int32_t> active_connections_{0};
    std::atomic<int64_t> total_connections_{0};
    std::atomic<int64_t> total_detections_{0};
};

/**
 * @brief Unique client id derived from the monotonic clock (nanoseconds)
 */
std::string generateClientId();

}  // namespace server
}  // namespace wws

#endif  // WWS_SESSION_MANAGER_INTERNAL_H
