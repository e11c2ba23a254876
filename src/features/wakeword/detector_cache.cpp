/**
 * @file detector_cache.cpp
 * @brief Detector cache implementation
 */

#include "wws/features/wakeword/wws_detector_cache.h"
#include "wws/core/wws_logger.h"

#include <algorithm>
#include <utility>

namespace wws {
namespace wakeword {

DetectorCache::DetectorCache(KeywordMap keywords, DetectorFactory& factory)
    : keywords_(std::move(keywords)), factory_(factory) {}

wws_result_t DetectorCache::acquire(const std::string& keyword_name, float sensitivity,
                                    const std::string& access_key,
                                    std::unique_ptr<Detector>& out_detector) {
    auto kw = keywords_.find(keyword_name);
    if (kw == keywords_.end()) {
        WWS_LOG_ERROR("Cache", "No keyword %s", keyword_name.c_str());
        return WWS_ERROR_UNKNOWN_KEYWORD;
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = idle_.find(keyword_name);
        if (it != idle_.end()) {
            auto& detectors = it->second;
            auto match = std::find_if(detectors.begin(), detectors.end(),
                                      [sensitivity](const std::unique_ptr<Detector>& d) {
                                          return d->sensitivity() == sensitivity;
                                      });
            if (match != detectors.end()) {
                out_detector = std::move(*match);
                detectors.erase(match);
                WWS_LOG_DEBUG("Cache", "Using detector for %s from cache (%zu)",
                              keyword_name.c_str(), detectors.size());
                return WWS_SUCCESS;
            }
        }
    }

    // Miss: build outside the lock
    const Keyword& keyword = kw->second;
    WWS_LOG_DEBUG("Cache", "Loading %s for %s", keyword.name.c_str(), keyword.language.c_str());

    std::unique_ptr<Detector> detector;
    wws_result_t rc = factory_.build(keyword, sensitivity, access_key, detector);
    if (WWS_FAILED(rc)) {
        WWS_LOG_ERROR("Cache", "Failed to build detector for %s: %s", keyword_name.c_str(),
                      wws_error_message(rc));
        return rc;
    }
    if (!detector) {
        return WWS_ERROR_DETECTOR_BUILD_FAILED;
    }

    out_detector = std::move(detector);
    return WWS_SUCCESS;
}

void DetectorCache::release(const std::string& keyword_name, std::unique_ptr<Detector> detector) {
    if (!detector) {
        return;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    auto& detectors = idle_[keyword_name];
    detectors.push_back(std::move(detector));
    WWS_LOG_DEBUG("Cache", "Detector for %s returned to cache (%zu)", keyword_name.c_str(),
                  detectors.size());
}

size_t DetectorCache::idleCount(const std::string& keyword_name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = idle_.find(keyword_name);
    return it == idle_.end() ? 0 : it->second.size();
}

size_t DetectorCache::totalIdle() const {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t total = 0;
    for (const auto& entry : idle_) {
        total += entry.second.size();
    }
    return total;
}

}  // namespace wakeword
}  // namespace wws
