/**
 * @file test_wake_session.cpp
 * @brief Tests for the per-connection session state machine
 */

#include <gtest/gtest.h>

#include <memory>
#include <string>
#include <vector>

#include "server/wake_session.h"
#include "test_common.h"
#include "wws/features/wakeword/wws_detector_cache.h"

using namespace wws::events;
using wws::server::SessionConfig;
using wws::server::SessionState;
using wws::server::WakeSession;
using wws::wakeword::DetectorCache;
using wws_test::FakeDetectorFactory;
using wws_test::RecordingEventWriter;
using wws_test::kTriggerSample;
using wws_test::make_keywords;
using wws_test::pcm_bytes;
using wws_test::ramp;

namespace {

constexpr int32_t kFrameLength = 512;

AudioChunkEvent chunk(const std::vector<int16_t>& samples,
                      std::optional<int64_t> timestamp = std::nullopt) {
    AudioChunkEvent event;
    event.audio = pcm_bytes(samples);
    event.timestamp = timestamp;
    return event;
}

AudioChunkEvent raw_chunk(std::vector<uint8_t> bytes) {
    AudioChunkEvent event;
    event.audio = std::move(bytes);
    return event;
}

std::vector<int16_t> frame_with_trigger() {
    std::vector<int16_t> frame(kFrameLength, 0);
    frame[kFrameLength / 2] = kTriggerSample;
    return frame;
}

class WakeSessionTest : public ::testing::Test {
protected:
    WakeSessionTest()
        : factory(kFrameLength), cache(make_keywords({"porcupine", "ok home"}), factory) {
        config.sensitivity = 0.5f;
        config.access_key = "key";
        config.info = makeInfo(cache.keywords());
    }

    wws_result_t send(WakeSession& session, const InboundEvent& event) {
        bool keep_going = true;
        wws_result_t rc = session.handleEvent(event, keep_going);
        last_keep_going = keep_going;
        return rc;
    }

    FakeDetectorFactory factory;
    DetectorCache cache;
    SessionConfig config;
    RecordingEventWriter writer;
    bool last_keep_going = true;
};

}  // namespace

// =============================================================================
// DESCRIBE / DETECT
// =============================================================================

TEST_F(WakeSessionTest, DescribeWritesInfo) {
    WakeSession session("c1", cache, config, writer);

    ASSERT_EQ(send(session, DescribeEvent{}), WWS_SUCCESS);
    EXPECT_TRUE(last_keep_going);

    auto events = writer.events();
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0].type, kTypeInfo);
    EXPECT_EQ(events[0].data["wake"][0]["models"].size(), 2u);
    EXPECT_EQ(session.state(), SessionState::Idle);
}

TEST_F(WakeSessionTest, DetectBindsFirstNameOnly) {
    WakeSession session("c1", cache, config, writer);

    ASSERT_EQ(send(session, DetectEvent{{"ok home", "porcupine"}}), WWS_SUCCESS);
    EXPECT_EQ(session.state(), SessionState::Armed);
    EXPECT_EQ(session.keywordName(), "ok home");
    EXPECT_EQ(factory.builtKeywords(), std::vector<std::string>({"ok home"}));
    EXPECT_TRUE(writer.events().empty());
}

TEST_F(WakeSessionTest, EmptyDetectDoesNothing) {
    WakeSession session("c1", cache, config, writer);

    ASSERT_EQ(send(session, DetectEvent{}), WWS_SUCCESS);
    EXPECT_EQ(session.state(), SessionState::Idle);
    EXPECT_EQ(factory.builds.load(), 0);
}

TEST_F(WakeSessionTest, RebindReturnsPreviousDetectorAndClearsBuffer) {
    WakeSession session("c1", cache, config, writer);

    ASSERT_EQ(send(session, DetectEvent{{"ok home"}}), WWS_SUCCESS);
    ASSERT_EQ(send(session, chunk(ramp(100))), WWS_SUCCESS);
    EXPECT_EQ(session.bufferedBytes(), 200u);

    ASSERT_EQ(send(session, DetectEvent{{"porcupine"}}), WWS_SUCCESS);
    EXPECT_EQ(session.keywordName(), "porcupine");
    EXPECT_EQ(session.bufferedBytes(), 0u);
    EXPECT_EQ(cache.idleCount("ok home"), 1u);
    EXPECT_EQ(cache.idleCount("porcupine"), 0u);
}

TEST_F(WakeSessionTest, UnknownKeywordEndsSession) {
    WakeSession session("c1", cache, config, writer);

    ASSERT_EQ(send(session, DetectEvent{{"ok home"}}), WWS_SUCCESS);
    EXPECT_EQ(send(session, DetectEvent{{"hey nobody"}}), WWS_ERROR_UNKNOWN_KEYWORD);
    EXPECT_EQ(session.state(), SessionState::Idle);

    // The detector bound before the failed detect is back in the cache
    EXPECT_EQ(cache.idleCount("ok home"), 1u);
}

// =============================================================================
// AUDIO
// =============================================================================

TEST_F(WakeSessionTest, FirstChunkBindsDefaultKeyword) {
    WakeSession session("c1", cache, config, writer);

    ASSERT_EQ(send(session, AudioStartEvent{}), WWS_SUCCESS);
    EXPECT_EQ(session.state(), SessionState::Idle);

    ASSERT_EQ(send(session, chunk(ramp(10))), WWS_SUCCESS);
    EXPECT_EQ(session.state(), SessionState::Armed);
    EXPECT_EQ(session.keywordName(), "porcupine");
}

TEST_F(WakeSessionTest, FramesDoNotDependOnChunkSize) {
    const std::vector<int16_t> samples = ramp(3000);
    const std::vector<uint8_t> bytes = pcm_bytes(samples);

    FakeDetectorFactory bulk_factory(kFrameLength);
    DetectorCache bulk_cache(make_keywords({"porcupine"}), bulk_factory);
    WakeSession bulk("bulk", bulk_cache, config, writer);
    ASSERT_EQ(send(bulk, raw_chunk(bytes)), WWS_SUCCESS);

    FakeDetectorFactory byte_factory(kFrameLength);
    DetectorCache byte_cache(make_keywords({"porcupine"}), byte_factory);
    WakeSession bytewise("bytewise", byte_cache, config, writer);
    for (uint8_t b : bytes) {
        ASSERT_EQ(send(bytewise, raw_chunk({b})), WWS_SUCCESS);
    }

    const size_t expected_frames = samples.size() / kFrameLength;
    ASSERT_EQ(bulk_factory.log->size(), expected_frames);
    ASSERT_EQ(byte_factory.log->size(), expected_frames);
    EXPECT_EQ(bulk_factory.log->frames, byte_factory.log->frames);

    for (size_t f = 0; f < expected_frames; ++f) {
        const std::vector<int16_t> expected(samples.begin() + f * kFrameLength,
                                            samples.begin() + (f + 1) * kFrameLength);
        EXPECT_EQ(bulk_factory.log->frames[f], expected);
    }

    const size_t leftover = (samples.size() % kFrameLength) * 2;
    EXPECT_EQ(bulk.bufferedBytes(), leftover);
    EXPECT_EQ(bytewise.bufferedBytes(), leftover);
}

TEST_F(WakeSessionTest, DetectionCarriesChunkTimestamp) {
    WakeSession session("c1", cache, config, writer);

    ASSERT_EQ(send(session, AudioStartEvent{}), WWS_SUCCESS);
    ASSERT_EQ(send(session, chunk(frame_with_trigger(), 1234)), WWS_SUCCESS);

    auto events = writer.events();
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0].type, kTypeDetection);
    EXPECT_EQ(events[0].data["name"], "porcupine");
    EXPECT_EQ(events[0].data["timestamp"], 1234);
    EXPECT_TRUE(session.detected());
    EXPECT_EQ(session.detections(), 1);
}

TEST_F(WakeSessionTest, DetectionWithoutTimestampIsNull) {
    WakeSession session("c1", cache, config, writer);

    ASSERT_EQ(send(session, chunk(frame_with_trigger())), WWS_SUCCESS);

    auto events = writer.events();
    ASSERT_EQ(events.size(), 1u);
    EXPECT_TRUE(events[0].data["timestamp"].is_null());
}

TEST_F(WakeSessionTest, EveryMatchingFrameEmitsDetection) {
    WakeSession session("c1", cache, config, writer);

    std::vector<int16_t> audio = frame_with_trigger();
    std::vector<int16_t> second = frame_with_trigger();
    audio.insert(audio.end(), second.begin(), second.end());

    ASSERT_EQ(send(session, AudioStartEvent{}), WWS_SUCCESS);
    ASSERT_EQ(send(session, chunk(audio, 5)), WWS_SUCCESS);
    EXPECT_EQ(writer.count(kTypeDetection), 2u);
    EXPECT_EQ(session.detections(), 2);
}

TEST_F(WakeSessionTest, AudioStopWithoutDetectionWritesNotDetected) {
    WakeSession session("c1", cache, config, writer);

    ASSERT_EQ(send(session, AudioStartEvent{}), WWS_SUCCESS);
    ASSERT_EQ(send(session, chunk(ramp(2000))), WWS_SUCCESS);
    ASSERT_EQ(send(session, AudioStopEvent{}), WWS_SUCCESS);
    EXPECT_FALSE(last_keep_going);

    auto events = writer.events();
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0].type, kTypeNotDetected);
    EXPECT_TRUE(events[0].data.empty());
}

TEST_F(WakeSessionTest, AudioStopAfterDetectionWritesNothing) {
    WakeSession session("c1", cache, config, writer);

    ASSERT_EQ(send(session, AudioStartEvent{}), WWS_SUCCESS);
    ASSERT_EQ(send(session, chunk(frame_with_trigger())), WWS_SUCCESS);
    ASSERT_EQ(send(session, AudioStopEvent{}), WWS_SUCCESS);
    EXPECT_FALSE(last_keep_going);

    EXPECT_EQ(writer.count(kTypeDetection), 1u);
    EXPECT_EQ(writer.count(kTypeNotDetected), 0u);
}

TEST_F(WakeSessionTest, AudioStartResetsDetectedFlag) {
    WakeSession session("c1", cache, config, writer);

    ASSERT_EQ(send(session, AudioStartEvent{}), WWS_SUCCESS);
    ASSERT_EQ(send(session, chunk(frame_with_trigger())), WWS_SUCCESS);
    EXPECT_TRUE(session.detected());

    ASSERT_EQ(send(session, AudioStartEvent{}), WWS_SUCCESS);
    EXPECT_FALSE(session.detected());
    ASSERT_EQ(send(session, chunk(ramp(kFrameLength))), WWS_SUCCESS);
    ASSERT_EQ(send(session, AudioStopEvent{}), WWS_SUCCESS);

    EXPECT_EQ(writer.count(kTypeDetection), 1u);
    EXPECT_EQ(writer.count(kTypeNotDetected), 1u);
}

TEST_F(WakeSessionTest, ResampledAudioIsBufferedAtCanonicalRate) {
    WakeSession session("c1", cache, config, writer);

    AudioChunkEvent event = chunk(ramp(300));
    event.format.rate = 48000;
    ASSERT_EQ(send(session, event), WWS_SUCCESS);
    EXPECT_EQ(session.bufferedBytes(), 200u);
}

TEST_F(WakeSessionTest, UnsupportedAudioFormatEndsSession) {
    WakeSession session("c1", cache, config, writer);

    AudioChunkEvent event = chunk(ramp(10));
    event.format.width = 3;
    EXPECT_EQ(send(session, event), WWS_ERROR_UNSUPPORTED_AUDIO_FORMAT);
}

TEST_F(WakeSessionTest, UnknownEventIsIgnored) {
    WakeSession session("c1", cache, config, writer);

    ASSERT_EQ(send(session, UnknownEvent{"transcribe", Json::object()}), WWS_SUCCESS);
    EXPECT_TRUE(last_keep_going);
    EXPECT_TRUE(writer.events().empty());
    EXPECT_EQ(session.state(), SessionState::Idle);
}

// =============================================================================
// ERRORS
// =============================================================================

TEST_F(WakeSessionTest, DetectorFailureEndsSession) {
    factory.fail_process = true;
    WakeSession session("c1", cache, config, writer);

    EXPECT_EQ(send(session, chunk(ramp(kFrameLength))), WWS_ERROR_DETECTOR_PROCESS_FAILED);
    EXPECT_TRUE(writer.events().empty());
}

TEST_F(WakeSessionTest, BuildFailureEndsSession) {
    factory.fail_build = true;
    WakeSession session("c1", cache, config, writer);

    EXPECT_EQ(send(session, chunk(ramp(10))), WWS_ERROR_DETECTOR_BUILD_FAILED);
    EXPECT_EQ(session.state(), SessionState::Idle);
    EXPECT_EQ(cache.totalIdle(), 0u);
}

TEST_F(WakeSessionTest, InvalidFrameLengthDetectorIsDiscarded) {
    FakeDetectorFactory broken_factory(0);
    DetectorCache broken_cache(make_keywords({"porcupine"}), broken_factory);

    {
        WakeSession session("c1", broken_cache, config, writer);
        EXPECT_EQ(send(session, chunk(ramp(10))), WWS_ERROR_DETECTOR_PROCESS_FAILED);
        EXPECT_EQ(session.state(), SessionState::Idle);
    }
    EXPECT_EQ(broken_cache.totalIdle(), 0u);

    WakeSession next("c2", broken_cache, config, writer);
    EXPECT_EQ(send(next, chunk(ramp(10))), WWS_ERROR_DETECTOR_PROCESS_FAILED);
    EXPECT_EQ(broken_factory.builds.load(), 2);
    EXPECT_EQ(broken_cache.totalIdle(), 0u);
}

TEST_F(WakeSessionTest, WriteFailureIsReported) {
    writer.fail = true;
    WakeSession session("c1", cache, config, writer);

    EXPECT_EQ(send(session, DescribeEvent{}), WWS_ERROR_TRANSPORT_WRITE);
    EXPECT_EQ(send(session, chunk(frame_with_trigger())), WWS_ERROR_TRANSPORT_WRITE);
}

// =============================================================================
// RESOURCE RETURN
// =============================================================================

TEST_F(WakeSessionTest, DisconnectReturnsDetector) {
    WakeSession session("c1", cache, config, writer);

    ASSERT_EQ(send(session, chunk(ramp(10))), WWS_SUCCESS);
    EXPECT_EQ(cache.idleCount("porcupine"), 0u);

    session.disconnect();
    EXPECT_EQ(session.state(), SessionState::Idle);
    EXPECT_EQ(cache.idleCount("porcupine"), 1u);

    // Disconnecting twice returns nothing more
    session.disconnect();
    EXPECT_EQ(cache.idleCount("porcupine"), 1u);
}

TEST_F(WakeSessionTest, DestructorReturnsDetector) {
    {
        WakeSession session("c1", cache, config, writer);
        ASSERT_EQ(send(session, DetectEvent{{"ok home"}}), WWS_SUCCESS);
    }
    EXPECT_EQ(cache.idleCount("ok home"), 1u);

    WakeSession next("c2", cache, config, writer);
    ASSERT_EQ(send(next, DetectEvent{{"ok home"}}), WWS_SUCCESS);
    EXPECT_EQ(factory.builds.load(), 1);
}
