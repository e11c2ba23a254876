/**
 * @file wws_detector.h
 * @brief Wake Word Server - Detector and Detector Factory Interfaces
 *
 * A Detector wraps one native wake word engine instance bound to a single
 * keyword at a fixed sensitivity. Building one loads model files and is
 * expensive; reusing one is cheap. Detectors are owned through
 * std::unique_ptr and are never shared between sessions.
 */

#ifndef WWS_DETECTOR_H
#define WWS_DETECTOR_H

#include "wws/core/wws_error.h"
#include "wws/features/wakeword/wws_keyword.h"

#include <cstdint>
#include <memory>
#include <string>

namespace wws {
namespace wakeword {

/**
 * @brief Wake word detector
 */
class Detector {
public:
    explicit Detector(float sensitivity) : sensitivity_(sensitivity) {}
    virtual ~Detector() = default;

    Detector(const Detector&) = delete;
    Detector& operator=(const Detector&) = delete;

    /**
     * @brief Score one frame of audio
     *
     * @param pcm Exactly frameLength() signed 16-bit samples at 16 kHz
     * @param out_keyword_index Matched keyword index, or -1 for no match
     * @return WWS_SUCCESS, or WWS_ERROR_DETECTOR_PROCESS_FAILED
     */
    virtual wws_result_t process(const int16_t* pcm, int32_t* out_keyword_index) = 0;

    /**
     * @brief Samples consumed per process() call (fixed at construction)
     */
    virtual int32_t frameLength() const = 0;

    /** Sensitivity the detector was built with */
    float sensitivity() const { return sensitivity_; }

private:
    const float sensitivity_;
};

/**
 * @brief Builds detectors on a cache miss
 *
 * build() blocks while model files load. Callers must not hold any lock
 * shared with other connections while calling it.
 */
class DetectorFactory {
public:
    virtual ~DetectorFactory() = default;

    /**
     * @brief Build a detector for one keyword
     *
     * @param keyword Keyword to detect
     * @param sensitivity Detection sensitivity in [0, 1]
     * @param access_key Engine access credential
     * @param out_detector Receives the new detector on success
     * @return WWS_SUCCESS, or WWS_ERROR_DETECTOR_BUILD_FAILED
     */
    virtual wws_result_t build(const Keyword& keyword, float sensitivity,
                               const std::string& access_key,
                               std::unique_ptr<Detector>& out_detector) = 0;
};

}  // namespace wakeword
}  // namespace wws

#endif  // WWS_DETECTOR_H
