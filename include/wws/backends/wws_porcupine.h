/**
 * @file wws_porcupine.h
 * @brief Wake Word Server - Porcupine Detector Backend
 *
 * Detector implementation on top of the Picovoice Porcupine C library.
 * One Porcupine instance per detector, loaded with a single keyword.
 */

#ifndef WWS_PORCUPINE_H
#define WWS_PORCUPINE_H

#include "wws/features/wakeword/wws_detector.h"
#include "wws/features/wakeword/wws_keyword.h"

#include <memory>
#include <string>

namespace wws {
namespace backends {

/** Porcupine inference device used when none is configured */
constexpr const char* kPorcupineDefaultDevice = "best";

class PorcupineDetectorFactory : public wakeword::DetectorFactory {
public:
    /**
     * @param language_models language -> Porcupine model (.pv) path
     * @param device Inference device passed to Porcupine (e.g. "best", "cpu")
     */
    explicit PorcupineDetectorFactory(wakeword::LanguageModelMap language_models,
                                      std::string device = kPorcupineDefaultDevice);

    wws_result_t build(const wakeword::Keyword& keyword, float sensitivity,
                       const std::string& access_key,
                       std::unique_ptr<wakeword::Detector>& out_detector) override;

private:
    const wakeword::LanguageModelMap language_models_;
    const std::string device_;
};

}  // namespace backends
}  // namespace wws

// =============================================================================
// REGISTRATION API
// =============================================================================

extern "C" {

/**
 * @brief Register Porcupine as the detector backend
 *
 * @return WWS_SUCCESS or WWS_ERROR_BACKEND_ALREADY_REGISTERED
 */
WWS_API wws_result_t wws_backend_porcupine_register(void);

WWS_API wws_result_t wws_backend_porcupine_unregister(void);

/**
 * @brief Porcupine library version string
 */
WWS_API const char* wws_backend_porcupine_version(void);

}  // extern "C"

#endif  // WWS_PORCUPINE_H
