/**
 * @file wake_session.cpp
 * @brief Per-connection wake word session
 */

#include "wake_session.h"

#include "wws/core/wws_logger.h"

#include <utility>
#include <variant>

namespace wws {
namespace server {

using namespace wws::events;

WakeSession::WakeSession(std::string client_id, wakeword::DetectorCache& cache,
                         const SessionConfig& config, EventWriter& writer)
    : client_id_(std::move(client_id)), cache_(cache), config_(config), writer_(writer) {}

WakeSession::~WakeSession() {
    releaseDetector();
}

wws_result_t WakeSession::handleEvent(const InboundEvent& event, bool& keep_going) {
    keep_going = true;
    return std::visit([this, &keep_going](const auto& e) { return this->onEvent(e, keep_going); },
                      event);
}

void WakeSession::disconnect() {
    releaseDetector();
}

// =============================================================================
// EVENT HANDLERS
// =============================================================================

wws_result_t WakeSession::onEvent(const DescribeEvent& /*event*/, bool& /*keep_going*/) {
    return writer_.writeEvent(config_.info);
}

wws_result_t WakeSession::onEvent(const DetectEvent& event, bool& /*keep_going*/) {
    if (event.names.empty()) {
        return WWS_SUCCESS;
    }
    if (event.names.size() > 1) {
        WWS_LOG_DEBUG("Session", "Client %s asked for %zu keywords, using %s", client_id_.c_str(),
                      event.names.size(), event.names.front().c_str());
    }
    return loadKeyword(event.names.front());
}

wws_result_t WakeSession::onEvent(const AudioStartEvent& /*event*/, bool& /*keep_going*/) {
    detected_ = false;
    return WWS_SUCCESS;
}

wws_result_t WakeSession::onEvent(const AudioChunkEvent& event, bool& /*keep_going*/) {
    if (!detector_) {
        wws_result_t rc = loadKeyword(config_.default_keyword);
        if (WWS_FAILED(rc)) {
            return rc;
        }
    }

    wws_result_t rc =
        converter_.convert(event.format, event.audio.data(), event.audio.size(), buffer_);
    if (WWS_FAILED(rc)) {
        return rc;
    }

    return processFrames(event.timestamp);
}

wws_result_t WakeSession::onEvent(const AudioStopEvent& /*event*/, bool& keep_going) {
    keep_going = false;
    if (detected_) {
        return WWS_SUCCESS;
    }
    WWS_LOG_DEBUG("Session", "No detection for client %s", client_id_.c_str());
    return writer_.writeEvent(makeNotDetected());
}

wws_result_t WakeSession::onEvent(const UnknownEvent& event, bool& /*keep_going*/) {
    WWS_LOG_DEBUG("Session", "Ignoring %s from client %s", event.type.c_str(),
                  client_id_.c_str());
    return WWS_SUCCESS;
}

// =============================================================================
// DETECTION
// =============================================================================

wws_result_t WakeSession::loadKeyword(const std::string& name) {
    releaseDetector();
    buffer_.clear();

    std::unique_ptr<wakeword::Detector> detector;
    wws_result_t rc = cache_.acquire(name, config_.sensitivity, config_.access_key, detector);
    if (WWS_FAILED(rc)) {
        return rc;
    }

    if (detector->frameLength() <= 0) {
        WWS_LOG_ERROR("Session", "Detector for %s has invalid frame length %d", name.c_str(),
                      detector->frameLength());
        // Not returned to the cache; later acquires build a fresh instance
        detector.reset();
        return WWS_ERROR_DETECTOR_PROCESS_FAILED;
    }

    detector_ = std::move(detector);
    keyword_name_ = name;
    WWS_LOG_DEBUG("Session", "Client %s listening for %s", client_id_.c_str(),
                  keyword_name_.c_str());
    return WWS_SUCCESS;
}

wws_result_t WakeSession::processFrames(std::optional<int64_t> timestamp) {
    const size_t frame_length = static_cast<size_t>(detector_->frameLength());
    const size_t frame_bytes = frame_length * 2;
    frame_.resize(frame_length);

    size_t offset = 0;
    wws_result_t rc = WWS_SUCCESS;
    while (buffer_.size() - offset >= frame_bytes) {
        const uint8_t* bytes = buffer_.data() + offset;
        for (size_t i = 0; i < frame_length; ++i) {
            frame_[i] = static_cast<int16_t>(static_cast<uint16_t>(bytes[2 * i]) |
                                             (static_cast<uint16_t>(bytes[2 * i + 1]) << 8));
        }
        offset += frame_bytes;

        int32_t keyword_index = -1;
        rc = detector_->process(frame_.data(), &keyword_index);
        if (WWS_FAILED(rc)) {
            break;
        }

        if (keyword_index >= 0) {
            WWS_LOG_DEBUG("Session", "Detected %s from client %s", keyword_name_.c_str(),
                          client_id_.c_str());
            detected_ = true;
            ++detections_;
            rc = writer_.writeEvent(makeDetection(keyword_name_, timestamp));
            if (WWS_FAILED(rc)) {
                break;
            }
        }
    }

    buffer_.erase(buffer_.begin(), buffer_.begin() + static_cast<std::ptrdiff_t>(offset));
    return rc;
}

void WakeSession::releaseDetector() {
    if (detector_) {
        cache_.release(keyword_name_, std::move(detector_));
        detector_.reset();
    }
}

}  // namespace server
}  // namespace wws
