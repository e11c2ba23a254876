/**
 * @file wws_keyword.h
 * @brief Wake Word Server - Keywords and Keyword Discovery
 *
 * A keyword is one wake phrase plus the model file needed to detect it.
 * Keywords are discovered once at startup from the data directory and from
 * any custom keyword directories.
 *
 * Data directory layout:
 *   <data_dir>/lib/common/porcupine_params_<lang>.pv     language models
 *   <data_dir>/resources/<lang>/<any>/<name>_<system>.ppn built-in keywords
 *   <custom_dir>/<name>_<lang>_<system>_<version>.ppn    custom keywords
 */

#ifndef WWS_KEYWORD_H
#define WWS_KEYWORD_H

#include "wws/core/wws_error.h"

#include <map>
#include <string>
#include <vector>

namespace wws {
namespace wakeword {

/** Keyword used when a client streams audio without sending Detect first */
constexpr const char* kDefaultKeyword = "porcupine";

/**
 * @brief Single wake word keyword
 */
struct Keyword {
    std::string name;        ///< Wake phrase, unique per server (e.g. "ok home")
    std::string language;    ///< Language code (e.g. "en")
    std::string model_path;  ///< Keyword model file (.ppn)
};

/** keyword name -> keyword */
using KeywordMap = std::map<std::string, Keyword>;

/** language -> language model file (.pv) */
using LanguageModelMap = std::map<std::string, std::string>;

/**
 * @brief Discovery inputs
 */
struct DiscoveryOptions {
    std::string data_dir;
    std::string system;                         ///< Target platform tag (e.g. "linux")
    std::vector<std::string> custom_keyword_dirs;
};

/**
 * @brief Everything found by discovery
 */
struct DiscoveryResult {
    KeywordMap keywords;
    LanguageModelMap language_models;
};

/**
 * @brief Scan the data directory and custom directories
 *
 * Directories that do not exist are skipped. Later definitions of a keyword
 * name replace earlier ones (built-ins first, then custom directories in the
 * order given).
 *
 * @param options Discovery inputs
 * @param result Output keywords and language models
 * @return WWS_SUCCESS, or WWS_ERROR_INVALID_ARGUMENT if data_dir or system is empty
 */
wws_result_t discoverKeywords(const DiscoveryOptions& options, DiscoveryResult& result);

/**
 * @brief Platform tag of the running machine ("raspberry-pi" or "linux")
 */
std::string detectSystem();

}  // namespace wakeword
}  // namespace wws

#endif  // WWS_KEYWORD_H
