/**
 * @file keyword_discovery.cpp
 * @brief Keyword and language model discovery
 */

#include "wws/features/wakeword/wws_keyword.h"
#include "wws/core/wws_logger.h"

#include <sys/utsname.h>

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <system_error>

namespace fs = std::filesystem;

namespace wws {
namespace wakeword {

namespace {

std::vector<std::string> split(const std::string& s, char sep) {
    std::vector<std::string> parts;
    std::string::size_type start = 0;
    for (;;) {
        auto pos = s.find(sep, start);
        if (pos == std::string::npos) {
            parts.push_back(s.substr(start));
            break;
        }
        parts.push_back(s.substr(start, pos - start));
        start = pos + 1;
    }
    return parts;
}

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

// Regular files with the given extension, sorted by path
std::vector<fs::path> list_files(const fs::path& dir, const std::string& extension,
                                 bool recursive) {
    std::vector<fs::path> files;
    std::error_code ec;
    if (!fs::is_directory(dir, ec)) {
        WWS_LOG_DEBUG("Discovery", "Skipping missing directory: %s", dir.string().c_str());
        return files;
    }

    if (recursive) {
        for (auto it = fs::recursive_directory_iterator(dir, ec);
             !ec && it != fs::recursive_directory_iterator(); it.increment(ec)) {
            if (it->is_regular_file(ec) && it->path().extension() == extension) {
                files.push_back(it->path());
            }
        }
    } else {
        for (auto it = fs::directory_iterator(dir, ec); !ec && it != fs::directory_iterator();
             it.increment(ec)) {
            if (it->is_regular_file(ec) && it->path().extension() == extension) {
                files.push_back(it->path());
            }
        }
    }

    if (ec) {
        WWS_LOG_WARNING("Discovery", "Error listing %s: %s", dir.string().c_str(),
                        ec.message().c_str());
    }

    std::sort(files.begin(), files.end());
    return files;
}

void discover_language_models(const fs::path& data_dir, LanguageModelMap& models) {
    for (const auto& path : list_files(data_dir / "lib" / "common", ".pv", false)) {
        const std::string lang = split(path.stem().string(), '_').back();
        models[lang] = path.string();
    }
}

// <data_dir>/resources/<lang>/<dir>/<name>_<system>.ppn
void discover_builtin_keywords(const fs::path& data_dir, const std::string& system,
                               KeywordMap& keywords) {
    for (const auto& path : list_files(data_dir / "resources", ".ppn", true)) {
        const std::string stem = path.stem().string();
        const auto sep = stem.rfind('_');
        const std::string kw_system = (sep == std::string::npos) ? stem : stem.substr(sep + 1);
        if (kw_system != system) {
            continue;
        }

        Keyword keyword;
        keyword.name = (sep == std::string::npos) ? stem : stem.substr(0, sep);
        keyword.language = path.parent_path().parent_path().filename().string();
        keyword.model_path = path.string();
        keywords[keyword.name] = keyword;
    }
}

// <custom_dir>/<name>_<lang>_<system>_<rest>.ppn
void discover_custom_keywords(const fs::path& dir, const std::string& system,
                              KeywordMap& keywords) {
    for (const auto& path : list_files(dir, ".ppn", false)) {
        const std::string stem = path.stem().string();

        // Split into at most four parts; the last one keeps its underscores
        std::vector<std::string> parts;
        std::string::size_type start = 0;
        while (parts.size() < 3) {
            auto pos = stem.find('_', start);
            if (pos == std::string::npos) {
                break;
            }
            parts.push_back(stem.substr(start, pos - start));
            start = pos + 1;
        }
        if (parts.size() < 3) {
            WWS_LOG_WARNING("Discovery", "Incorrect keyword filename (%s), ignoring",
                            path.string().c_str());
            continue;
        }
        parts.push_back(stem.substr(start));

        if (parts[2] != system) {
            WWS_LOG_WARNING("Discovery", "Incorrect keyword system (%s), ignoring",
                            path.string().c_str());
            continue;
        }

        Keyword keyword;
        keyword.name = parts[0];
        keyword.language = parts[1];
        keyword.model_path = path.string();
        keywords[keyword.name] = keyword;
    }
}

}  // namespace

wws_result_t discoverKeywords(const DiscoveryOptions& options, DiscoveryResult& result) {
    if (options.data_dir.empty() || options.system.empty()) {
        return WWS_ERROR_INVALID_ARGUMENT;
    }

    result.keywords.clear();
    result.language_models.clear();

    const fs::path data_dir(options.data_dir);
    discover_language_models(data_dir, result.language_models);
    discover_builtin_keywords(data_dir, options.system, result.keywords);

    for (const auto& dir : options.custom_keyword_dirs) {
        discover_custom_keywords(fs::path(dir), options.system, result.keywords);
    }

    WWS_LOG_DEBUG("Discovery", "Found %zu language model(s), %zu keyword(s)",
                  result.language_models.size(), result.keywords.size());

    return WWS_SUCCESS;
}

std::string detectSystem() {
    struct utsname info;
    if (uname(&info) != 0) {
        return "linux";
    }

    const std::string machine = to_lower(info.machine);
    if (machine.find("arm") != std::string::npos || machine.find("aarch") != std::string::npos) {
        return "raspberry-pi";
    }
    return "linux";
}

}  // namespace wakeword
}  // namespace wws
