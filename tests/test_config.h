#ifndef WWS_TEST_CONFIG_H
#define WWS_TEST_CONFIG_H

#include <cstdlib>
#include <string>
#include <sys/stat.h>

namespace test_config {

// =============================================================================
// File Utilities
// =============================================================================

inline bool file_exists(const std::string& path) {
    struct stat st;
    return (stat(path.c_str(), &st) == 0);
}

inline std::string get_env(const char* name) {
    const char* env = std::getenv(name);
    if (env && env[0] != '\0') return std::string(env);
    return "";
}

// =============================================================================
// Porcupine
// =============================================================================

/** Picovoice access key for tests that run the real engine */
inline std::string get_access_key() {
    return get_env("WWS_TEST_ACCESS_KEY");
}

/** Porcupine data directory (lib/common and resources) */
inline std::string get_data_dir() {
    return get_env("WWS_TEST_DATA_DIR");
}

/**
 * Directory with test recordings:
 *   ok_home.wav   someone saying "ok home"
 *   speech.wav    unrelated speech
 */
inline std::string get_test_audio_dir() {
    return get_env("WWS_TEST_AUDIO_DIR");
}

inline std::string get_test_audio_file(const std::string& filename) {
    std::string dir = get_test_audio_dir();
    if (dir.empty()) return "";
    return dir + "/" + filename;
}

/** Whether everything needed by the real-engine tests is configured */
inline bool has_porcupine_setup(std::string& reason) {
    if (get_access_key().empty()) {
        reason = "WWS_TEST_ACCESS_KEY not set";
        return false;
    }
    if (get_data_dir().empty() || !file_exists(get_data_dir())) {
        reason = "WWS_TEST_DATA_DIR not set or missing";
        return false;
    }
    if (get_test_audio_dir().empty() || !file_exists(get_test_audio_dir())) {
        reason = "WWS_TEST_AUDIO_DIR not set or missing";
        return false;
    }
    return true;
}

}  // namespace test_config

#endif  // WWS_TEST_CONFIG_H
