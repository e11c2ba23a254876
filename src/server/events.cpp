/**
 * @file events.cpp
 * @brief Protocol event decoding and construction
 */

#include "wws/server/wws_events.h"
#include "wws/core/wws_logger.h"

#include <cstdint>
#include <limits>
#include <utility>

namespace wws {
namespace events {

namespace {

constexpr const char* kProgramName = "porcupine";
constexpr const char* kProgramDescription =
    "On-device wake word detection powered by deep learning";
constexpr const char* kAttributionName = "Picovoice";
constexpr const char* kAttributionUrl = "https://github.com/Picovoice/porcupine";

bool parse_timestamp(const Json& data, std::optional<int64_t>& out) {
    out.reset();
    if (!data.contains("timestamp") || data["timestamp"].is_null()) {
        return true;
    }
    const Json& value = data["timestamp"];
    if (!value.is_number_integer()) {
        return false;
    }
    if (value.is_number_unsigned() &&
        value.get<uint64_t>() > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
        return false;
    }
    out = value.get<int64_t>();
    return true;
}

bool get_int32(const Json& value, int32_t& out) {
    if (value.is_number_unsigned()) {
        if (value.get<uint64_t>() > static_cast<uint64_t>(std::numeric_limits<int32_t>::max())) {
            return false;
        }
    } else {
        const int64_t v = value.get<int64_t>();
        if (v < std::numeric_limits<int32_t>::min() || v > std::numeric_limits<int32_t>::max()) {
            return false;
        }
    }
    out = value.get<int32_t>();
    return true;
}

bool parse_format(const Json& data, audio::AudioFormat& format) {
    for (const char* key : {"rate", "width", "channels"}) {
        if (!data.contains(key) || !data[key].is_number_integer()) {
            WWS_LOG_DEBUG("Events", "Audio event missing integer field '%s'", key);
            return false;
        }
    }
    if (!get_int32(data["rate"], format.rate) || !get_int32(data["width"], format.width) ||
        !get_int32(data["channels"], format.channels)) {
        WWS_LOG_DEBUG("Events", "Audio format field out of range");
        return false;
    }
    return true;
}

bool parse_names(const Json& data, std::vector<std::string>& names) {
    names.clear();
    if (!data.contains("names") || data["names"].is_null()) {
        return true;
    }
    if (!data["names"].is_array()) {
        return false;
    }
    for (const auto& name : data["names"]) {
        if (!name.is_string()) {
            return false;
        }
        names.push_back(name.get<std::string>());
    }
    return true;
}

Json attribution() {
    Json json;
    json["name"] = kAttributionName;
    json["url"] = kAttributionUrl;
    return json;
}

}  // namespace

wws_result_t decodeInbound(Event event, InboundEvent& out) {
    const Json& data = event.data;
    if (!data.is_object()) {
        return WWS_ERROR_MALFORMED_EVENT;
    }

    try {
        if (event.type == kTypeDescribe) {
            out = DescribeEvent{};
        } else if (event.type == kTypeDetect) {
            DetectEvent detect;
            if (!parse_names(data, detect.names)) {
                return WWS_ERROR_MALFORMED_EVENT;
            }
            out = std::move(detect);
        } else if (event.type == kTypeAudioStart) {
            AudioStartEvent start;
            if (!parse_format(data, start.format) || !parse_timestamp(data, start.timestamp)) {
                return WWS_ERROR_MALFORMED_EVENT;
            }
            out = start;
        } else if (event.type == kTypeAudioChunk) {
            AudioChunkEvent chunk;
            if (!parse_format(data, chunk.format) || !parse_timestamp(data, chunk.timestamp)) {
                return WWS_ERROR_MALFORMED_EVENT;
            }
            chunk.audio = std::move(event.payload);
            out = std::move(chunk);
        } else if (event.type == kTypeAudioStop) {
            AudioStopEvent stop;
            if (!parse_timestamp(data, stop.timestamp)) {
                return WWS_ERROR_MALFORMED_EVENT;
            }
            out = stop;
        } else {
            out = UnknownEvent{event.type, data};
        }
    } catch (const Json::exception& e) {
        WWS_LOG_DEBUG("Events", "Failed to decode %s: %s", event.type.c_str(), e.what());
        return WWS_ERROR_MALFORMED_EVENT;
    }

    return WWS_SUCCESS;
}

Event makeInfo(const wakeword::KeywordMap& keywords) {
    Json models = Json::array();
    for (const auto& entry : keywords) {
        const wakeword::Keyword& kw = entry.second;
        Json model;
        model["name"] = kw.name;
        model["description"] = kw.name + " (" + kw.language + ")";
        model["languages"] = Json::array({kw.language});
        model["attribution"] = attribution();
        model["installed"] = true;
        model["version"] = nullptr;
        model["phrase"] = kw.name;
        models.push_back(std::move(model));
    }

    Json program;
    program["name"] = kProgramName;
    program["description"] = kProgramDescription;
    program["attribution"] = attribution();
    program["installed"] = true;
    program["version"] = WWS_VERSION_STRING;
    program["models"] = std::move(models);

    Event event;
    event.type = kTypeInfo;
    event.data["asr"] = Json::array();
    event.data["tts"] = Json::array();
    event.data["handle"] = Json::array();
    event.data["intent"] = Json::array();
    event.data["wake"] = Json::array({std::move(program)});
    return event;
}

Event makeDetection(const std::string& name, std::optional<int64_t> timestamp) {
    Event event;
    event.type = kTypeDetection;
    event.data["name"] = name;
    if (timestamp) {
        event.data["timestamp"] = *timestamp;
    } else {
        event.data["timestamp"] = nullptr;
    }
    return event;
}

Event makeNotDetected() {
    Event event;
    event.type = kTypeNotDetected;
    return event;
}

}  // namespace events
}  // namespace wws
