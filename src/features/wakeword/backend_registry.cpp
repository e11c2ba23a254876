/**
 * @file backend_registry.cpp
 * @brief Detector backend registry implementation
 */

#include "wws/features/wakeword/wws_backend_registry.h"
#include "wws/core/wws_logger.h"

#include <algorithm>
#include <mutex>
#include <utility>
#include <vector>

namespace wws {
namespace wakeword {

namespace {

struct BackendEntry {
    std::string name;
    DetectorFactoryCreateFn create;
};

// Function-local statics: backends may register before globals are initialized
struct RegistryState {
    std::mutex mutex;
    std::vector<BackendEntry> backends;
};

RegistryState& get_state() {
    static RegistryState state;
    return state;
}

}  // namespace

wws_result_t registerDetectorBackend(const std::string& name, DetectorFactoryCreateFn create) {
    if (name.empty() || create == nullptr) {
        return WWS_ERROR_INVALID_ARGUMENT;
    }

    auto& state = get_state();
    std::lock_guard<std::mutex> lock(state.mutex);

    auto it = std::find_if(state.backends.begin(), state.backends.end(),
                           [&name](const BackendEntry& entry) { return entry.name == name; });
    if (it != state.backends.end()) {
        return WWS_ERROR_BACKEND_ALREADY_REGISTERED;
    }

    state.backends.push_back(BackendEntry{name, create});
    WWS_LOG_DEBUG("Registry", "Registered detector backend: %s", name.c_str());
    return WWS_SUCCESS;
}

wws_result_t unregisterDetectorBackend(const std::string& name) {
    auto& state = get_state();
    std::lock_guard<std::mutex> lock(state.mutex);

    auto it = std::find_if(state.backends.begin(), state.backends.end(),
                           [&name](const BackendEntry& entry) { return entry.name == name; });
    if (it == state.backends.end()) {
        return WWS_ERROR_BACKEND_NOT_REGISTERED;
    }

    state.backends.erase(it);
    return WWS_SUCCESS;
}

wws_result_t createDetectorFactory(const LanguageModelMap& language_models,
                                   const std::string& device,
                                   std::unique_ptr<DetectorFactory>& out_factory) {
    DetectorFactoryCreateFn create = nullptr;
    std::string name;
    {
        auto& state = get_state();
        std::lock_guard<std::mutex> lock(state.mutex);
        if (state.backends.empty()) {
            WWS_LOG_ERROR("Registry", "No detector backend registered");
            return WWS_ERROR_BACKEND_NOT_REGISTERED;
        }
        create = state.backends.front().create;
        name = state.backends.front().name;
    }

    out_factory = create(language_models, device);
    if (!out_factory) {
        WWS_LOG_ERROR("Registry", "Backend %s returned no factory", name.c_str());
        return WWS_ERROR_BACKEND_NOT_REGISTERED;
    }

    WWS_LOG_DEBUG("Registry", "Using detector backend: %s", name.c_str());
    return WWS_SUCCESS;
}

}  // namespace wakeword
}  // namespace wws
