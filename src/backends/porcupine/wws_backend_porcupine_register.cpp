/**
 * @file wws_backend_porcupine_register.cpp
 * @brief Wake Word Server - Porcupine Backend Registration
 */

#include "wws/backends/wws_porcupine.h"
#include "wws/core/wws_logger.h"
#include "wws/features/wakeword/wws_backend_registry.h"

#include <memory>
#include <mutex>

#include "pv_porcupine.h"

static const char* LOG_CAT = "Porcupine";

namespace {

constexpr const char* kBackendName = "porcupine";

struct PorcupineRegistryState {
    std::mutex mutex;
    bool registered = false;
};

PorcupineRegistryState& get_state() {
    static PorcupineRegistryState state;
    return state;
}

std::unique_ptr<wws::wakeword::DetectorFactory> create_factory(
    const wws::wakeword::LanguageModelMap& language_models, const std::string& device) {
    return std::make_unique<wws::backends::PorcupineDetectorFactory>(
        language_models, device.empty() ? wws::backends::kPorcupineDefaultDevice : device);
}

}  // namespace

extern "C" {

wws_result_t wws_backend_porcupine_register(void) {
    auto& state = get_state();
    std::lock_guard<std::mutex> lock(state.mutex);

    if (state.registered) {
        return WWS_ERROR_BACKEND_ALREADY_REGISTERED;
    }

    wws_result_t result = wws::wakeword::registerDetectorBackend(kBackendName, create_factory);
    if (WWS_FAILED(result)) {
        WWS_LOG_ERROR(LOG_CAT, "Backend registration failed: %s", wws_error_message(result));
        return result;
    }

    state.registered = true;
    WWS_LOG_DEBUG(LOG_CAT, "Backend registered (Porcupine %s)", pv_porcupine_version());
    return WWS_SUCCESS;
}

wws_result_t wws_backend_porcupine_unregister(void) {
    auto& state = get_state();
    std::lock_guard<std::mutex> lock(state.mutex);

    if (!state.registered) {
        return WWS_ERROR_BACKEND_NOT_REGISTERED;
    }

    wws_result_t result = wws::wakeword::unregisterDetectorBackend(kBackendName);
    state.registered = false;
    return result;
}

const char* wws_backend_porcupine_version(void) {
    return pv_porcupine_version();
}

}  // extern "C"
