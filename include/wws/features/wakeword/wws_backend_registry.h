/**
 * @file wws_backend_registry.h
 * @brief Wake Word Server - Detector Backend Registry
 *
 * Backends register a factory creator under a name. The server asks the
 * registry for a factory at startup, so the core never links a backend
 * directly.
 *
 * Usage:
 *   wws_backend_porcupine_register();
 *   std::unique_ptr<DetectorFactory> factory;
 *   createDetectorFactory(language_models, "best", factory);
 */

#ifndef WWS_BACKEND_REGISTRY_H
#define WWS_BACKEND_REGISTRY_H

#include "wws/features/wakeword/wws_detector.h"
#include "wws/features/wakeword/wws_keyword.h"

#include <memory>
#include <string>

namespace wws {
namespace wakeword {

/**
 * @brief Creates a detector factory for the discovered language models
 */
using DetectorFactoryCreateFn = std::unique_ptr<DetectorFactory> (*)(
    const LanguageModelMap& language_models, const std::string& device);

/**
 * @return WWS_SUCCESS or WWS_ERROR_BACKEND_ALREADY_REGISTERED
 */
wws_result_t registerDetectorBackend(const std::string& name, DetectorFactoryCreateFn create);

/**
 * @return WWS_SUCCESS or WWS_ERROR_BACKEND_NOT_REGISTERED
 */
wws_result_t unregisterDetectorBackend(const std::string& name);

/**
 * @brief Create a factory from the first registered backend
 *
 * @return WWS_SUCCESS or WWS_ERROR_BACKEND_NOT_REGISTERED
 */
wws_result_t createDetectorFactory(const LanguageModelMap& language_models,
                                   const std::string& device,
                                   std::unique_ptr<DetectorFactory>& out_factory);

}  // namespace wakeword
}  // namespace wws

#endif  // WWS_BACKEND_REGISTRY_H
