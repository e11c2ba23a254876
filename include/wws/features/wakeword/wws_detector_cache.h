/**
 * @file wws_detector_cache.h
 * @brief Wake Word Server - Detector Cache
 *
 * Process-wide pool of idle detectors keyed by keyword name. Sessions take a
 * detector with acquire() and give it back with release() when they
 * disconnect. A detector is either held by exactly one session or sits in
 * the idle set, never both.
 *
 * Only the idle-set bookkeeping is serialized. Building a detector on a miss
 * happens outside the lock, so first use of different keywords by different
 * connections loads models in parallel.
 */

#ifndef WWS_DETECTOR_CACHE_H
#define WWS_DETECTOR_CACHE_H

#include "wws/features/wakeword/wws_detector.h"
#include "wws/features/wakeword/wws_keyword.h"

#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace wws {
namespace wakeword {

class DetectorCache {
public:
    /**
     * @param keywords Discovered keywords (immutable for the cache lifetime)
     * @param factory Builds detectors on a miss (must outlive the cache)
     */
    DetectorCache(KeywordMap keywords, DetectorFactory& factory);

    DetectorCache(const DetectorCache&) = delete;
    DetectorCache& operator=(const DetectorCache&) = delete;

    /**
     * @brief Take an idle detector, or build a new one
     *
     * Returns an idle detector for keyword_name whose sensitivity equals the
     * requested value exactly, removing it from the idle set. On a miss the
     * factory builds one, which goes straight to the caller.
     *
     * @return WWS_SUCCESS, WWS_ERROR_UNKNOWN_KEYWORD or WWS_ERROR_DETECTOR_BUILD_FAILED
     */
    wws_result_t acquire(const std::string& keyword_name, float sensitivity,
                         const std::string& access_key, std::unique_ptr<Detector>& out_detector);

    /**
     * @brief Return a detector to the idle set
     */
    void release(const std::string& keyword_name, std::unique_ptr<Detector> detector);

    /** Idle detectors for one keyword */
    size_t idleCount(const std::string& keyword_name) const;

    /** Idle detectors across all keywords */
    size_t totalIdle() const;

    const KeywordMap& keywords() const { return keywords_; }

private:
    const KeywordMap keywords_;
    DetectorFactory& factory_;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::vector<std::unique_ptr<Detector>>> idle_;
};

}  // namespace wakeword
}  // namespace wws

#endif  // WWS_DETECTOR_CACHE_H
