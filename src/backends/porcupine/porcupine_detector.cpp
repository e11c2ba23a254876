/**
 * @file porcupine_detector.cpp
 * @brief Porcupine detector backend
 */

#include "wws/backends/wws_porcupine.h"
#include "wws/core/wws_logger.h"

#include <filesystem>
#include <string>
#include <utility>

#include "picovoice.h"
#include "pv_porcupine.h"

namespace wws {
namespace backends {

namespace {

void log_error_stack(const char* what, pv_status_t status) {
    WWS_LOG_ERROR("Porcupine", "%s: %s", what, pv_status_to_string(status));

    char** message_stack = nullptr;
    int32_t message_stack_depth = 0;
    if (pv_get_error_stack(&message_stack, &message_stack_depth) != PV_STATUS_SUCCESS) {
        return;
    }
    for (int32_t i = 0; i < message_stack_depth; ++i) {
        WWS_LOG_ERROR("Porcupine", "  [%d] %s", i, message_stack[i]);
    }
    pv_free_error_stack(message_stack);
}

class PorcupineDetector : public wakeword::Detector {
public:
    PorcupineDetector(pv_porcupine_t* handle, float sensitivity)
        : Detector(sensitivity), handle_(handle), frame_length_(pv_porcupine_frame_length()) {}

    ~PorcupineDetector() override {
        if (handle_) {
            pv_porcupine_delete(handle_);
            handle_ = nullptr;
        }
    }

    wws_result_t process(const int16_t* pcm, int32_t* out_keyword_index) override {
        if (!pcm || !out_keyword_index) {
            return WWS_ERROR_NULL_POINTER;
        }

        int32_t keyword_index = -1;
        pv_status_t status = pv_porcupine_process(handle_, pcm, &keyword_index);
        if (status != PV_STATUS_SUCCESS) {
            log_error_stack("pv_porcupine_process failed", status);
            return WWS_ERROR_DETECTOR_PROCESS_FAILED;
        }

        *out_keyword_index = keyword_index;
        return WWS_SUCCESS;
    }

    int32_t frameLength() const override { return frame_length_; }

private:
    pv_porcupine_t* handle_;
    const int32_t frame_length_;
};

}  // namespace

PorcupineDetectorFactory::PorcupineDetectorFactory(wakeword::LanguageModelMap language_models,
                                                   std::string device)
    : language_models_(std::move(language_models)), device_(std::move(device)) {}

wws_result_t PorcupineDetectorFactory::build(const wakeword::Keyword& keyword, float sensitivity,
                                             const std::string& access_key,
                                             std::unique_ptr<wakeword::Detector>& out_detector) {
    if (access_key.empty()) {
        WWS_LOG_ERROR("Porcupine", "Access key is empty");
        return WWS_ERROR_DETECTOR_BUILD_FAILED;
    }
    if (sensitivity < 0.0f || sensitivity > 1.0f) {
        WWS_LOG_ERROR("Porcupine", "Sensitivity out of range: %f", sensitivity);
        return WWS_ERROR_DETECTOR_BUILD_FAILED;
    }

    auto lib = language_models_.find(keyword.language);
    if (lib == language_models_.end()) {
        WWS_LOG_ERROR("Porcupine", "No language model for '%s' (keyword %s)",
                      keyword.language.c_str(), keyword.name.c_str());
        return WWS_ERROR_DETECTOR_BUILD_FAILED;
    }

    std::error_code ec;
    if (!std::filesystem::is_regular_file(keyword.model_path, ec)) {
        WWS_LOG_ERROR("Porcupine", "Invalid keyword path: %s", keyword.model_path.c_str());
        return WWS_ERROR_DETECTOR_BUILD_FAILED;
    }
    if (!std::filesystem::is_regular_file(lib->second, ec)) {
        WWS_LOG_ERROR("Porcupine", "Invalid model path: %s", lib->second.c_str());
        return WWS_ERROR_DETECTOR_BUILD_FAILED;
    }

    const char* keyword_paths[1] = {keyword.model_path.c_str()};
    const float sensitivities[1] = {sensitivity};

    pv_porcupine_t* handle = nullptr;
    pv_status_t status = pv_porcupine_init(access_key.c_str(), lib->second.c_str(),
                                           device_.c_str(), 1, keyword_paths, sensitivities,
                                           &handle);
    if (status != PV_STATUS_SUCCESS) {
        log_error_stack("pv_porcupine_init failed", status);
        return WWS_ERROR_DETECTOR_BUILD_FAILED;
    }

    out_detector = std::make_unique<PorcupineDetector>(handle, sensitivity);

    WWS_LOG_INFO("Porcupine", "Loaded %s (%s), sensitivity=%.2f, frame_length=%d, version=%s",
                 keyword.name.c_str(), keyword.language.c_str(), sensitivity,
                 out_detector->frameLength(), pv_porcupine_version());
    return WWS_SUCCESS;
}

}  // namespace backends
}  // namespace wws
