/**
 * @file wake_session.h
 * @brief Per-connection wake word session
 *
 * State machine driven by inbound events:
 *
 *   IDLE  --(detect / first audio chunk)-->  ARMED
 *   ARMED --(detect)-->                      ARMED (detector swapped)
 *   ARMED --(audio-stop / disconnect)-->     IDLE  (detector returned)
 *
 * Audio is converted to 16 kHz mono 16-bit PCM, buffered, and fed to the
 * bound detector in frames of exactly frameLength() samples.
 */

#ifndef WWS_WAKE_SESSION_INTERNAL_H
#define WWS_WAKE_SESSION_INTERNAL_H

#include "event_stream.h"

#include "wws/core/wws_audio_utils.h"
#include "wws/features/wakeword/wws_detector_cache.h"
#include "wws/server/wws_events.h"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace wws {
namespace server {

enum class SessionState { Idle, Armed };

/**
 * @brief Settings shared by every session of a server
 */
struct SessionConfig {
    float sensitivity = 0.5f;
    std::string access_key;
    std::string default_keyword = wakeword::kDefaultKeyword;
    /** Reply to describe, built once from the discovered keywords */
    events::Event info;
};

class WakeSession {
public:
    WakeSession(std::string client_id, wakeword::DetectorCache& cache,
                const SessionConfig& config, EventWriter& writer);

    /** Returns a still-bound detector to the cache */
    ~WakeSession();

    WakeSession(const WakeSession&) = delete;
    WakeSession& operator=(const WakeSession&) = delete;

    /**
     * @brief Handle one inbound event
     *
     * @param event Decoded event
     * @param keep_going Set to false when the connection should close
     * @return WWS_SUCCESS, or the error that ends the session
     */
    wws_result_t handleEvent(const events::InboundEvent& event, bool& keep_going);

    /**
     * @brief Return the bound detector to the cache
     */
    void disconnect();

    const std::string& clientId() const { return client_id_; }
    SessionState state() const { return detector_ ? SessionState::Armed : SessionState::Idle; }
    const std::string& keywordName() const { return keyword_name_; }
    size_t bufferedBytes() const { return buffer_.size(); }
    bool detected() const { return detected_; }
    int64_t detections() const { return detections_; }

private:
    wws_result_t onEvent(const events::DescribeEvent& event, bool& keep_going);
    wws_result_t onEvent(const events::DetectEvent& event, bool& keep_going);
    wws_result_t onEvent(const events::AudioStartEvent& event, bool& keep_going);
    wws_result_t onEvent(const events::AudioChunkEvent& event, bool& keep_going);
    wws_result_t onEvent(const events::AudioStopEvent& event, bool& keep_going);
    wws_result_t onEvent(const events::UnknownEvent& event, bool& keep_going);

    /** Release any bound detector, then bind one for name */
    wws_result_t loadKeyword(const std::string& name);

    /** Feed every complete frame in the buffer to the detector */
    wws_result_t processFrames(std::optional<int64_t> timestamp);

    void releaseDetector();

    const std::string client_id_;
    wakeword::DetectorCache& cache_;
    const SessionConfig& config_;
    EventWriter& writer_;

    std::string keyword_name_;
    std::unique_ptr<wakeword::Detector> detector_;

    audio::AudioConverter converter_;
    std::vector<uint8_t> buffer_;
    std::vector<int16_t> frame_;

    bool detected_ = false;
    int64_t detections_ = 0;
};

}  // namespace server
}  // namespace wws

#endif  // WWS_WAKE_SESSION_INTERNAL_H
