/**
 * @file wakeword-server.cpp
 * @brief Wake Word Server - streaming wake word detection over stdio, TCP or Unix sockets
 *
 * Usage:
 *   wakeword-server --access-key <key> [options]
 *
 * Options:
 *   --uri <uri>                  stdio://, tcp://host:port or unix://path (default: stdio://)
 *   --data-dir <dir>             Porcupine data directory (default: ./data)
 *   --system <tag>               Keyword platform tag (default: detected)
 *   --sensitivity <f>            Detection sensitivity in [0, 1] (default: 0.5)
 *   --access-key <key>           Picovoice access key (required)
 *   --custom-keyword-dir <dir>   Extra custom keyword directory (repeatable)
 *   --device <name>              Porcupine inference device (default: best)
 *   --debug                      Enable debug logging
 *   --help, -h                   Show this help message
 *
 * Environment Variables:
 *   WWS_URI, WWS_DATA_DIR, WWS_SYSTEM, WWS_SENSITIVITY, WWS_ACCESS_KEY, WWS_DEVICE
 *
 * Example:
 *   wakeword-server --uri tcp://0.0.0.0:10400 --data-dir ./porcupine --access-key $KEY
 *
 * Everything this program prints goes to stderr: with stdio:// the standard
 * output carries protocol events.
 */

#include "wws/backends/wws_porcupine.h"
#include "wws/core/wws_error.h"
#include "wws/core/wws_error_model.h"
#include "wws/core/wws_logger.h"
#include "wws/server/wws_server.h"

#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <string>
#include <vector>

// =============================================================================
// SIGNAL HANDLING
// =============================================================================

static void signalHandler(int signum) {
    (void)signum;
    wws_server_interrupt();
}

// =============================================================================
// ARGUMENT PARSING
// =============================================================================

struct ServerOptions {
    std::string uri = "stdio://";
    std::string dataDir = "./data";
    std::string system;
    std::string sensitivityText = "0.5";
    std::string accessKey;
    std::vector<std::string> customKeywordDirs;
    std::string device = "best";
    bool debug = false;
    bool showHelp = false;
    std::string error;
};

static void printUsage(const char* programName) {
    fprintf(stderr, "Wake Word Server - streaming wake word detection\n\n");
    fprintf(stderr, "Usage: %s --access-key <key> [options]\n\n", programName);
    fprintf(stderr, "Required:\n");
    fprintf(stderr, "  --access-key <key>           Picovoice access key\n\n");
    fprintf(stderr, "Options:\n");
    fprintf(stderr, "  --uri <uri>                  stdio://, tcp://host:port or unix://path "
                    "(default: stdio://)\n");
    fprintf(stderr, "  --data-dir <dir>             Porcupine data directory (default: ./data)\n");
    fprintf(stderr, "  --system <tag>               Keyword platform tag (default: detected)\n");
    fprintf(stderr, "  --sensitivity <f>            Detection sensitivity in [0, 1] "
                    "(default: 0.5)\n");
    fprintf(stderr, "  --custom-keyword-dir <dir>   Extra custom keyword directory "
                    "(repeatable)\n");
    fprintf(stderr, "  --device <name>              Porcupine inference device (default: best)\n");
    fprintf(stderr, "  --debug                      Enable debug logging\n");
    fprintf(stderr, "  --help, -h                   Show this help message\n\n");
    fprintf(stderr, "Environment Variables:\n");
    fprintf(stderr, "  WWS_URI                      Server URI\n");
    fprintf(stderr, "  WWS_DATA_DIR                 Data directory\n");
    fprintf(stderr, "  WWS_SYSTEM                   Keyword platform tag\n");
    fprintf(stderr, "  WWS_SENSITIVITY              Detection sensitivity\n");
    fprintf(stderr, "  WWS_ACCESS_KEY               Picovoice access key\n");
    fprintf(stderr, "  WWS_DEVICE                   Porcupine inference device\n\n");
    fprintf(stderr, "Example:\n");
    fprintf(stderr, "  %s --uri tcp://0.0.0.0:10400 --data-dir ./porcupine --access-key KEY\n",
            programName);
}

static ServerOptions parseArgs(int argc, char* argv[]) {
    ServerOptions opts;

    // Check environment variables first
    const char* envUri = std::getenv("WWS_URI");
    if (envUri) opts.uri = envUri;

    const char* envDataDir = std::getenv("WWS_DATA_DIR");
    if (envDataDir) opts.dataDir = envDataDir;

    const char* envSystem = std::getenv("WWS_SYSTEM");
    if (envSystem) opts.system = envSystem;

    const char* envSensitivity = std::getenv("WWS_SENSITIVITY");
    if (envSensitivity) opts.sensitivityText = envSensitivity;

    const char* envAccessKey = std::getenv("WWS_ACCESS_KEY");
    if (envAccessKey) opts.accessKey = envAccessKey;

    const char* envDevice = std::getenv("WWS_DEVICE");
    if (envDevice) opts.device = envDevice;

    // Parse command line arguments (override env vars)
    for (int i = 1; i < argc; ++i) {
        const char* arg = argv[i];

        if (std::strcmp(arg, "--help") == 0 || std::strcmp(arg, "-h") == 0) {
            opts.showHelp = true;
        }
        else if (std::strcmp(arg, "--debug") == 0) {
            opts.debug = true;
        }
        else if (std::strcmp(arg, "--uri") == 0 && i + 1 < argc) {
            opts.uri = argv[++i];
        }
        else if (std::strcmp(arg, "--data-dir") == 0 && i + 1 < argc) {
            opts.dataDir = argv[++i];
        }
        else if (std::strcmp(arg, "--system") == 0 && i + 1 < argc) {
            opts.system = argv[++i];
        }
        else if (std::strcmp(arg, "--sensitivity") == 0 && i + 1 < argc) {
            opts.sensitivityText = argv[++i];
        }
        else if (std::strcmp(arg, "--access-key") == 0 && i + 1 < argc) {
            opts.accessKey = argv[++i];
        }
        else if (std::strcmp(arg, "--custom-keyword-dir") == 0 && i + 1 < argc) {
            opts.customKeywordDirs.push_back(argv[++i]);
        }
        else if (std::strcmp(arg, "--device") == 0 && i + 1 < argc) {
            opts.device = argv[++i];
        }
        else {
            opts.error = std::string("Unknown or incomplete argument: ") + arg;
            break;
        }
    }

    return opts;
}

static bool parseSensitivity(const std::string& text, float& out) {
    if (text.empty()) {
        return false;
    }
    char* end = nullptr;
    out = std::strtof(text.c_str(), &end);
    if (end == text.c_str() || *end != '\0') {
        return false;
    }
    return out >= 0.0f && out <= 1.0f;
}

// =============================================================================
// MAIN
// =============================================================================

int main(int argc, char* argv[]) {
    // Parse arguments
    ServerOptions opts = parseArgs(argc, argv);

    if (opts.showHelp) {
        printUsage(argv[0]);
        return 0;
    }

    if (!opts.error.empty()) {
        fprintf(stderr, "Error: %s\n\n", opts.error.c_str());
        printUsage(argv[0]);
        return 1;
    }

    if (opts.accessKey.empty()) {
        fprintf(stderr, "Error: Access key is required\n\n");
        printUsage(argv[0]);
        return 1;
    }

    float sensitivity = 0.0f;
    if (!parseSensitivity(opts.sensitivityText, sensitivity)) {
        fprintf(stderr, "Error: Sensitivity must be a number in [0, 1], got '%s'\n\n",
                opts.sensitivityText.c_str());
        printUsage(argv[0]);
        return 1;
    }

    // Initialize logging
    if (opts.debug) {
        wws::Logger::instance().setMinLevel(wws::LogLevel::Debug);
    }

    // Setup signal handlers
    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);
    std::signal(SIGHUP, signalHandler);
    std::signal(SIGPIPE, SIG_IGN);

    // Register backends
    wws_result_t result = wws_backend_porcupine_register();
    if (WWS_FAILED(result) && result != WWS_ERROR_BACKEND_ALREADY_REGISTERED) {
        fprintf(stderr, "Error: Failed to register Porcupine backend: %s\n",
                wws_error_message(result));
        return 1;
    }
    WWS_LOG_INFO("Main", "Porcupine %s", wws_backend_porcupine_version());

    // Configure server
    std::vector<const char*> customDirs;
    for (const auto& dir : opts.customKeywordDirs) {
        customDirs.push_back(dir.c_str());
    }

    wws_server_config_t config = WWS_SERVER_CONFIG_DEFAULT;
    config.uri = opts.uri.c_str();
    config.data_dir = opts.dataDir.c_str();
    config.system = opts.system.empty() ? WWS_NULL : opts.system.c_str();
    config.access_key = opts.accessKey.c_str();
    config.sensitivity = sensitivity;
    config.custom_keyword_dirs = customDirs.empty() ? WWS_NULL : customDirs.data();
    config.num_custom_keyword_dirs = static_cast<int32_t>(customDirs.size());
    config.device = opts.device.c_str();

    WWS_LOG_DEBUG("Main", "uri=%s data_dir=%s sensitivity=%.2f device=%s", opts.uri.c_str(),
                  opts.dataDir.c_str(), sensitivity, opts.device.c_str());

    // Start server
    result = wws_server_start(&config);
    if (WWS_FAILED(result)) {
        wws_error_model_t error = wws_make_error_model(result);
        fprintf(stderr, "Error: Failed to start server: [%s] %s (code: %d)\n", error.category,
                error.message, error.code);
        return 1;
    }

    // Wait for the session (stdio) or a signal
    int exitCode = wws_server_wait();

    // Print final stats
    wws_server_status_t status = {};
    if (WWS_SUCCEEDED(wws_server_get_status(&status))) {
        WWS_LOG_INFO("Main", "Connections: %lld, detections: %lld",
                     (long long)status.total_connections, (long long)status.total_detections);
    }

    result = wws_server_stop();
    if (WWS_FAILED(result) && result != WWS_ERROR_SERVER_NOT_RUNNING) {
        fprintf(stderr, "Error: Failed to stop server: %s\n", wws_error_message(result));
        return 1;
    }

    return exitCode;
}
