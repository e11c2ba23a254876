/**
 * @file test_audio_utils.cpp
 * @brief Tests for conversion of client audio to canonical PCM
 */

#include <gtest/gtest.h>

#include <vector>

#include "test_common.h"
#include "wws/core/wws_audio_utils.h"

using wws::audio::AudioConverter;
using wws::audio::AudioFormat;
using wws_test::pcm_bytes;
using wws_test::pcm_samples;
using wws_test::ramp;

namespace {

AudioFormat format(int32_t rate, int32_t width, int32_t channels) {
    AudioFormat f;
    f.rate = rate;
    f.width = width;
    f.channels = channels;
    return f;
}

std::vector<int16_t> convert_all(AudioConverter& converter, const AudioFormat& fmt,
                                 const std::vector<uint8_t>& bytes) {
    std::vector<uint8_t> out;
    EXPECT_EQ(converter.convert(fmt, bytes.data(), bytes.size(), out), WWS_SUCCESS);
    return pcm_samples(out);
}

}  // namespace

// =============================================================================
// FORMAT SUPPORT
// =============================================================================

TEST(AudioConverter, SupportedFormats) {
    EXPECT_TRUE(AudioConverter::isSupported(format(16000, 2, 1)));
    EXPECT_TRUE(AudioConverter::isSupported(format(8000, 1, 2)));
    EXPECT_TRUE(AudioConverter::isSupported(format(48000, 4, 6)));

    EXPECT_FALSE(AudioConverter::isSupported(format(16000, 3, 1)));
    EXPECT_FALSE(AudioConverter::isSupported(format(16000, 2, 0)));
    EXPECT_FALSE(AudioConverter::isSupported(format(0, 2, 1)));
    EXPECT_FALSE(AudioConverter::isSupported(format(-16000, 2, 1)));
}

TEST(AudioConverter, UnsupportedFormatIsRejected) {
    AudioConverter converter;
    std::vector<uint8_t> in(12, 0);
    std::vector<uint8_t> out;
    EXPECT_EQ(converter.convert(format(16000, 3, 1), in.data(), in.size(), out),
              WWS_ERROR_UNSUPPORTED_AUDIO_FORMAT);
    EXPECT_TRUE(out.empty());
}

// =============================================================================
// CANONICAL INPUT
// =============================================================================

TEST(AudioConverter, CanonicalInputPassesThrough) {
    AudioConverter converter;
    const std::vector<uint8_t> bytes = pcm_bytes(ramp(100));

    std::vector<uint8_t> out;
    ASSERT_EQ(converter.convert(AudioFormat{}, bytes.data(), bytes.size(), out), WWS_SUCCESS);
    EXPECT_EQ(out, bytes);
}

TEST(AudioConverter, CanonicalOddByteCountIsKept) {
    AudioConverter converter;
    const std::vector<uint8_t> bytes = {1, 2, 3};

    std::vector<uint8_t> out;
    ASSERT_EQ(converter.convert(AudioFormat{}, bytes.data(), bytes.size(), out), WWS_SUCCESS);
    EXPECT_EQ(out, bytes);
}

TEST(AudioConverter, OutputIsAppended) {
    AudioConverter converter;
    std::vector<uint8_t> out = {9, 9};
    const std::vector<uint8_t> bytes = {1, 2};
    ASSERT_EQ(converter.convert(AudioFormat{}, bytes.data(), bytes.size(), out), WWS_SUCCESS);
    EXPECT_EQ(out, std::vector<uint8_t>({9, 9, 1, 2}));
}

TEST(AudioConverter, EmptyChunkProducesNothing) {
    AudioConverter converter;
    std::vector<uint8_t> out;
    EXPECT_EQ(converter.convert(format(8000, 2, 1), nullptr, 0, out), WWS_SUCCESS);
    EXPECT_TRUE(out.empty());
}

// =============================================================================
// SAMPLE WIDTH AND CHANNELS
// =============================================================================

TEST(AudioConverter, EightBitIsUnsigned) {
    AudioConverter converter;
    const std::vector<uint8_t> bytes = {128, 0, 255, 192, 64, 127};
    auto samples = convert_all(converter, format(16000, 1, 1), bytes);

    ASSERT_EQ(samples.size(), 6u);
    EXPECT_EQ(samples[0], 0);
    EXPECT_EQ(samples[1], -32768);
    EXPECT_EQ(samples[2], 127 * 256);
    EXPECT_EQ(samples[3], 64 * 256);
    EXPECT_EQ(samples[4], -64 * 256);
    EXPECT_EQ(samples[5], -256);
}

TEST(AudioConverter, ThirtyTwoBitKeepsHighBits) {
    AudioConverter converter;
    // 0x12345678 and -0x10000 (0xFFFF0000)
    const std::vector<uint8_t> bytes = {0x78, 0x56, 0x34, 0x12, 0x00, 0x00, 0xFF, 0xFF};
    auto samples = convert_all(converter, format(16000, 4, 1), bytes);

    ASSERT_EQ(samples.size(), 2u);
    EXPECT_EQ(samples[0], 0x1234);
    EXPECT_EQ(samples[1], -1);
}

TEST(AudioConverter, ChannelsAreAveraged) {
    AudioConverter converter;
    const std::vector<uint8_t> bytes = pcm_bytes({1000, 3000, -200, -400, 7, 8});
    auto samples = convert_all(converter, format(16000, 2, 2), bytes);

    ASSERT_EQ(samples.size(), 3u);
    EXPECT_EQ(samples[0], 2000);
    EXPECT_EQ(samples[1], -300);
    EXPECT_EQ(samples[2], 7);
}

TEST(AudioConverter, PartialFrameIsCarriedToNextChunk) {
    AudioConverter converter;
    const AudioFormat stereo = format(16000, 2, 2);
    const std::vector<uint8_t> bytes = pcm_bytes({100, 300, 500, 700});

    std::vector<uint8_t> out;
    ASSERT_EQ(converter.convert(stereo, bytes.data(), 3, out), WWS_SUCCESS);
    EXPECT_TRUE(out.empty());

    ASSERT_EQ(converter.convert(stereo, bytes.data() + 3, bytes.size() - 3, out), WWS_SUCCESS);
    EXPECT_EQ(pcm_samples(out), std::vector<int16_t>({200, 600}));
}

TEST(AudioConverter, FormatChangeDropsCarriedBytes) {
    AudioConverter converter;
    const std::vector<uint8_t> stereo_bytes = pcm_bytes({100, 300});

    std::vector<uint8_t> out;
    ASSERT_EQ(converter.convert(format(16000, 2, 2), stereo_bytes.data(), 3, out), WWS_SUCCESS);
    EXPECT_TRUE(out.empty());

    const std::vector<uint8_t> mono_bytes = pcm_bytes({42});
    ASSERT_EQ(converter.convert(format(16000, 1, 1), mono_bytes.data(), 1, out), WWS_SUCCESS);
    ASSERT_EQ(out.size(), 2u);
    EXPECT_EQ(pcm_samples(out)[0], (42 - 128) << 8);
}

// =============================================================================
// RESAMPLING
// =============================================================================

TEST(AudioConverter, DownsamplesByIntegerRatio) {
    AudioConverter converter;
    const std::vector<int16_t> in = ramp(300);
    auto samples = convert_all(converter, format(48000, 2, 1), pcm_bytes(in));

    ASSERT_EQ(samples.size(), 100u);
    for (size_t i = 0; i < samples.size(); ++i) {
        EXPECT_EQ(samples[i], in[3 * i]) << "at " << i;
    }
}

TEST(AudioConverter, UpsamplingInterpolates) {
    AudioConverter converter;
    const std::vector<int16_t> in = {0, 100, 200, 300};
    auto samples = convert_all(converter, format(8000, 2, 1), pcm_bytes(in));

    // The midpoint after the last input sample waits for the next chunk
    EXPECT_EQ(samples, std::vector<int16_t>({0, 50, 100, 150, 200, 250, 300}));
}

TEST(AudioConverter, ResamplingDoesNotDependOnChunking) {
    const std::vector<int16_t> in = ramp(101);
    const std::vector<uint8_t> bytes = pcm_bytes(in);
    const AudioFormat narrowband = format(8000, 2, 1);

    AudioConverter whole;
    auto expected = convert_all(whole, narrowband, bytes);
    EXPECT_EQ(expected.size(), 201u);

    for (size_t split : {size_t(1), size_t(50), size_t(77), size_t(101)}) {
        AudioConverter chunked;
        std::vector<uint8_t> out;
        ASSERT_EQ(chunked.convert(narrowband, bytes.data(), split, out), WWS_SUCCESS);
        ASSERT_EQ(chunked.convert(narrowband, bytes.data() + split, bytes.size() - split, out),
                  WWS_SUCCESS);
        EXPECT_EQ(pcm_samples(out), expected) << "split at byte " << split;
    }
}

TEST(AudioConverter, ResetForgetsResamplerState) {
    const std::vector<uint8_t> bytes = pcm_bytes(ramp(40, 500));
    const AudioFormat narrowband = format(8000, 2, 1);

    AudioConverter fresh;
    auto expected = convert_all(fresh, narrowband, bytes);

    AudioConverter reused;
    convert_all(reused, narrowband, pcm_bytes(ramp(13, 9000)));
    reused.reset();
    EXPECT_EQ(convert_all(reused, narrowband, bytes), expected);
}
