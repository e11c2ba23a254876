/**
 * @file wws_audio_utils.cpp
 * @brief Wake Word Server - Audio Format Conversion Implementation
 */

#include "wws/core/wws_audio_utils.h"

#include <algorithm>
#include <cstring>

#include "wws/core/wws_logger.h"

namespace wws {
namespace audio {

namespace {

constexpr int32_t kMaxChannels = 16;
constexpr int32_t kMaxRate = 384000;

int32_t read_sample(const uint8_t* p, int32_t width) {
    switch (width) {
        case 1:
            // 8-bit PCM is unsigned
            return (static_cast<int32_t>(p[0]) - 128) * 256;
        case 2:
            return static_cast<int16_t>(static_cast<uint16_t>(p[0]) |
                                        (static_cast<uint16_t>(p[1]) << 8));
        case 4: {
            uint32_t v = static_cast<uint32_t>(p[0]) | (static_cast<uint32_t>(p[1]) << 8) |
                         (static_cast<uint32_t>(p[2]) << 16) |
                         (static_cast<uint32_t>(p[3]) << 24);
            return static_cast<int32_t>(v) >> 16;
        }
        default:
            return 0;
    }
}

int16_t clamp16(int64_t v) {
    return static_cast<int16_t>(std::min<int64_t>(32767, std::max<int64_t>(-32768, v)));
}

int64_t floor_div(int64_t a, int64_t b) {
    int64_t q = a / b;
    if ((a % b != 0) && ((a < 0) != (b < 0))) {
        --q;
    }
    return q;
}

}  // namespace

bool AudioConverter::isSupported(const AudioFormat& format) {
    if (format.width != 1 && format.width != 2 && format.width != 4) {
        return false;
    }
    if (format.channels < 1 || format.channels > kMaxChannels) {
        return false;
    }
    return format.rate > 0 && format.rate <= kMaxRate;
}

void AudioConverter::reset() {
    pending_.clear();
    phase_ = 0;
    last_sample_ = 0;
}

wws_result_t AudioConverter::convert(const AudioFormat& format, const uint8_t* data,
                                     size_t size, std::vector<uint8_t>& out) {
    if (!isSupported(format)) {
        WWS_LOG_ERROR("Audio", "Unsupported audio format: rate=%d width=%d channels=%d",
                      format.rate, format.width, format.channels);
        return WWS_ERROR_UNSUPPORTED_AUDIO_FORMAT;
    }
    if (size > 0 && data == nullptr) {
        return WWS_ERROR_NULL_POINTER;
    }

    if (!has_format_ || format != current_) {
        reset();
        current_ = format;
        has_format_ = true;
    }

    if (format.isCanonical()) {
        out.insert(out.end(), data, data + size);
        return WWS_SUCCESS;
    }

    if (size > 0) {
        pending_.insert(pending_.end(), data, data + size);
    }

    const size_t frame_bytes = static_cast<size_t>(format.width) * format.channels;
    const size_t num_frames = pending_.size() / frame_bytes;

    std::vector<int32_t> mono(num_frames);
    for (size_t f = 0; f < num_frames; ++f) {
        const uint8_t* frame = pending_.data() + f * frame_bytes;
        int64_t sum = 0;
        for (int32_t c = 0; c < format.channels; ++c) {
            sum += read_sample(frame + c * format.width, format.width);
        }
        mono[f] = static_cast<int32_t>(sum / format.channels);
    }
    pending_.erase(pending_.begin(), pending_.begin() + num_frames * frame_bytes);

    std::vector<int16_t> samples;
    resample(mono, format.rate, samples);

    const size_t offset = out.size();
    out.resize(offset + samples.size() * 2);
    for (size_t i = 0; i < samples.size(); ++i) {
        const uint16_t v = static_cast<uint16_t>(samples[i]);
        out[offset + i * 2] = static_cast<uint8_t>(v & 0xFF);
        out[offset + i * 2 + 1] = static_cast<uint8_t>((v >> 8) & 0xFF);
    }

    return WWS_SUCCESS;
}

void AudioConverter::resample(const std::vector<int32_t>& mono, int32_t in_rate,
                              std::vector<int16_t>& out) {
    const int64_t n = static_cast<int64_t>(mono.size());
    out.clear();

    if (in_rate == kCanonicalRate) {
        out.reserve(mono.size());
        for (int32_t s : mono) {
            out.push_back(clamp16(s));
        }
        return;
    }

    if (n == 0) {
        return;
    }

    auto sample_at = [&](int64_t i) -> int64_t { return i < 0 ? last_sample_ : mono[i]; };

    out.reserve(static_cast<size_t>(n * kCanonicalRate / in_rate + 2));

    int64_t t = phase_;
    for (;;) {
        const int64_t idx = floor_div(t, kCanonicalRate);
        const int64_t rem = t - idx * kCanonicalRate;
        if (idx >= n) {
            break;
        }
        int64_t value;
        if (rem == 0) {
            value = sample_at(idx);
        } else {
            if (idx + 1 >= n) {
                // Right neighbour arrives with the next chunk
                break;
            }
            const int64_t a = sample_at(idx);
            const int64_t b = sample_at(idx + 1);
            value = a + (b - a) * rem / kCanonicalRate;
        }
        out.push_back(clamp16(value));
        t += in_rate;
    }

    last_sample_ = mono[static_cast<size_t>(n - 1)];
    phase_ = t - n * kCanonicalRate;
}

}  // namespace audio
}  // namespace wws
