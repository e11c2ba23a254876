/**
 * @file wws_events.h
 * @brief Wake Word Server - Protocol Events
 *
 * Events exchanged with clients. On the wire every event is a JSON header
 * line, optional JSON data and an optional binary payload (see
 * event_stream.h). Inbound events are decoded once into InboundEvent, a
 * closed variant the session state machine visits exhaustively.
 *
 * Inbound:  describe, detect, audio-start, audio-chunk, audio-stop
 * Outbound: info, detection, not-detected
 */

#ifndef WWS_EVENTS_H
#define WWS_EVENTS_H

#include "wws/core/wws_audio_utils.h"
#include "wws/core/wws_error.h"
#include "wws/features/wakeword/wws_keyword.h"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace wws {
namespace events {

using Json = nlohmann::json;

/** Protocol version written into every outbound header */
constexpr const char* kProtocolVersion = "1.5.4";

constexpr const char* kTypeDescribe = "describe";
constexpr const char* kTypeInfo = "info";
constexpr const char* kTypeDetect = "detect";
constexpr const char* kTypeDetection = "detection";
constexpr const char* kTypeNotDetected = "not-detected";
constexpr const char* kTypeAudioStart = "audio-start";
constexpr const char* kTypeAudioChunk = "audio-chunk";
constexpr const char* kTypeAudioStop = "audio-stop";

/**
 * @brief Event as it appears on the wire
 */
struct Event {
    std::string type;
    Json data = Json::object();
    std::vector<uint8_t> payload;
};

// =============================================================================
// INBOUND EVENTS
// =============================================================================

struct DescribeEvent {};

struct DetectEvent {
    /** Requested keyword names in client order. Only the first is used. */
    std::vector<std::string> names;
};

struct AudioStartEvent {
    audio::AudioFormat format;
    std::optional<int64_t> timestamp;
};

struct AudioChunkEvent {
    audio::AudioFormat format;
    std::optional<int64_t> timestamp;
    std::vector<uint8_t> audio;
};

struct AudioStopEvent {
    std::optional<int64_t> timestamp;
};

/** Any event type this server does not consume */
struct UnknownEvent {
    std::string type;
    Json data;
};

using InboundEvent = std::variant<DescribeEvent, DetectEvent, AudioStartEvent, AudioChunkEvent,
                                  AudioStopEvent, UnknownEvent>;

/**
 * @brief Decode a wire event into the inbound variant
 *
 * Validates the fields each known type requires (rate/width/channels on
 * audio events, a list of strings for detect names).
 *
 * @param event Wire event (payload is moved out)
 * @param out Decoded event
 * @return WWS_SUCCESS or WWS_ERROR_MALFORMED_EVENT
 */
wws_result_t decodeInbound(Event event, InboundEvent& out);

// =============================================================================
// OUTBOUND EVENTS
// =============================================================================

/**
 * @brief Service description listing every discovered keyword as a model
 */
Event makeInfo(const wakeword::KeywordMap& keywords);

Event makeDetection(const std::string& name, std::optional<int64_t> timestamp);

Event makeNotDetected();

}  // namespace events
}  // namespace wws

#endif  // WWS_EVENTS_H
