/**
 * @file wws_audio_utils.h
 * @brief Wake Word Server - Audio Format Conversion
 *
 * Converts client audio chunks of arbitrary rate/width/channels into the
 * canonical PCM format consumed by the detectors: 16 kHz, signed 16-bit
 * little-endian, mono.
 */

#ifndef WWS_AUDIO_UTILS_H
#define WWS_AUDIO_UTILS_H

#include "wws/core/wws_error.h"
#include "wws/core/wws_types.h"

#include <cstddef>
#include <cstdint>
#include <vector>

namespace wws {
namespace audio {

constexpr int32_t kCanonicalRate = 16000;
constexpr int32_t kCanonicalWidth = 2;
constexpr int32_t kCanonicalChannels = 1;

/**
 * @brief Raw PCM layout of an audio chunk
 */
struct AudioFormat {
    int32_t rate = kCanonicalRate;          ///< Samples per second
    int32_t width = kCanonicalWidth;        ///< Bytes per sample (1, 2 or 4)
    int32_t channels = kCanonicalChannels;  ///< Interleaved channel count

    bool operator==(const AudioFormat& other) const {
        return rate == other.rate && width == other.width && channels == other.channels;
    }
    bool operator!=(const AudioFormat& other) const { return !(*this == other); }

    bool isCanonical() const {
        return rate == kCanonicalRate && width == kCanonicalWidth &&
               channels == kCanonicalChannels;
    }
};

/**
 * @brief Stateful converter to canonical PCM
 *
 * One converter per audio stream. Partial sample frames and the resampler
 * phase are carried between calls, so the output does not depend on how the
 * input is split into chunks. A change of input format resets that state.
 */
class AudioConverter {
public:
    AudioConverter() = default;

    /**
     * @brief Convert one chunk, appending canonical bytes to out
     *
     * @param format Layout of the input bytes
     * @param data Input bytes (may be NULL when size is 0)
     * @param size Number of input bytes
     * @param out Receives converted bytes (appended)
     * @return WWS_SUCCESS, or WWS_ERROR_UNSUPPORTED_AUDIO_FORMAT
     */
    wws_result_t convert(const AudioFormat& format, const uint8_t* data, size_t size,
                         std::vector<uint8_t>& out);

    /**
     * @brief Drop carried-over bytes and resampler state
     */
    void reset();

    /**
     * @brief Whether the layout can be converted
     */
    static bool isSupported(const AudioFormat& format);

private:
    void resample(const std::vector<int32_t>& mono, int32_t in_rate, std::vector<int16_t>& out);

    AudioFormat current_;
    bool has_format_ = false;

    // Incomplete sample frame bytes from the previous chunk
    std::vector<uint8_t> pending_;

    // Resampler state. Position of the next output sample, in units of
    // 1/kCanonicalRate input samples, relative to the next chunk's first
    // sample. Negative values fall between last_sample_ and that sample.
    int64_t phase_ = 0;
    int32_t last_sample_ = 0;
};

}  // namespace audio
}  // namespace wws

#endif  // WWS_AUDIO_UTILS_H
