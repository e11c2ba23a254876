/**
 * @file session_manager.cpp
 * @brief Session lifecycle implementation
 */

#include "session_manager.h"

#include "wws/core/wws_logger.h"

#include <chrono>
#include <utility>

namespace wws {
namespace server {

std::string generateClientId() {
    static std::atomic<int64_t> last{0};

    int64_t now = std::chrono::duration_cast<std::chrono::nanoseconds>(
                      std::chrono::steady_clock::now().time_since_epoch())
                      .count();
    int64_t prev = last.load();
    int64_t next;
    do {
        next = now > prev ? now : prev + 1;
    } while (!last.compare_exchange_weak(prev, next));

    return std::to_string(next);
}

SessionManager::SessionManager(wakeword::DetectorCache& cache, SessionConfig config)
    : cache_(cache), config_(std::move(config)) {}

wws_result_t SessionManager::runConnection(EventReader& reader, EventWriter& writer) {
    active_connections_++;
    total_connections_++;

    WakeSession session(generateClientId(), cache_, config_, writer);
    WWS_LOG_DEBUG("Session", "Client connected: %s", session.clientId().c_str());

    wws_result_t result = WWS_SUCCESS;
    for (;;) {
        events::Event event;
        wws_result_t rc = reader.readEvent(event);
        if (rc == WWS_ERROR_STREAM_CLOSED) {
            break;
        }
        if (WWS_FAILED(rc)) {
            WWS_LOG_WARNING("Session", "Client %s: %s", session.clientId().c_str(),
                            wws_error_message(rc));
            result = rc;
            break;
        }

        events::InboundEvent inbound;
        rc = events::decodeInbound(std::move(event), inbound);
        if (WWS_FAILED(rc)) {
            WWS_LOG_WARNING("Session", "Client %s sent a malformed event",
                            session.clientId().c_str());
            result = rc;
            break;
        }

        const int64_t before = session.detections();
        bool keep_going = true;
        rc = session.handleEvent(inbound, keep_going);
        total_detections_ += session.detections() - before;

        if (WWS_FAILED(rc)) {
            if (rc != WWS_ERROR_TRANSPORT_WRITE) {
                WWS_LOG_ERROR("Session", "Client %s: %s", session.clientId().c_str(),
                              wws_error_message(rc));
            }
            result = rc;
            break;
        }
        if (!keep_going) {
            break;
        }
    }

    session.disconnect();
    WWS_LOG_DEBUG("Session", "Client disconnected: %s", session.clientId().c_str());

    active_connections_--;
    return result;
}

}  // namespace server
}  // namespace wws
