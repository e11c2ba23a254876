/**
 * @file wws_server.h
 * @brief Wake Word Server - Event Server
 *
 * Public API of the wake word event server. Clients connect over stdio, TCP
 * or a Unix domain socket, stream audio events and receive detection events.
 *
 * Usage:
 *   1. Register a detector backend (e.g. wws_backend_porcupine_register())
 *   2. Configure with wws_server_config_t
 *   3. Call wws_server_start(), then wws_server_wait()
 *
 * Example:
 *   wws_server_config_t config = WWS_SERVER_CONFIG_DEFAULT;
 *   config.uri = "tcp://0.0.0.0:10400";
 *   config.access_key = key;
 *   wws_server_start(&config);
 *   wws_server_wait();
 *   wws_server_stop();
 */

#ifndef WWS_SERVER_H
#define WWS_SERVER_H

#include "wws/core/wws_types.h"

#ifdef __cplusplus
extern "C" {
#endif

// =============================================================================
// SERVER CONFIGURATION
// =============================================================================

typedef struct wws_server_config {
    /** stdio://, tcp://host:port or unix://path (default: "stdio://") */
    const char* uri;

    /** Directory holding lib/common and resources (default: "./data") */
    const char* data_dir;

    /** Platform tag of keyword files to load (default: NULL = detect) */
    const char* system;

    /** Detector access key (required) */
    const char* access_key;

    /** Detection sensitivity in [0, 1] (default: 0.5) */
    float sensitivity;

    /** Extra custom keyword directories, searched after <data_dir>/custom_models */
    const char* const* custom_keyword_dirs;

    /** Number of entries in custom_keyword_dirs */
    int32_t num_custom_keyword_dirs;

    /** Detector inference device (default: "best") */
    const char* device;
} wws_server_config_t;

/**
 * @brief Default server configuration
 *
 * Fields in declaration order: uri, data_dir, system, access_key,
 * sensitivity, custom_keyword_dirs, num_custom_keyword_dirs, device.
 */
static const wws_server_config_t WWS_SERVER_CONFIG_DEFAULT = {
    "stdio://", "./data", WWS_NULL, WWS_NULL, 0.5f, WWS_NULL, 0, "best"};

// =============================================================================
// SERVER STATUS
// =============================================================================

typedef struct wws_server_status {
    /** Whether the server is currently running */
    wws_bool_t is_running;

    /** URI the server was started with */
    const char* uri;

    /** Bound TCP port (0 for stdio and unix) */
    uint16_t port;

    /** Connections currently being served */
    int32_t active_connections;

    /** Connections accepted since start */
    int64_t total_connections;

    /** Detection events sent since start */
    int64_t total_detections;

    /** Detectors idle in the cache */
    int32_t idle_detectors;

    /** Discovered keywords */
    int32_t num_keywords;

    /** Server uptime in seconds */
    int64_t uptime_seconds;
} wws_server_status_t;

// =============================================================================
// SERVER LIFECYCLE
// =============================================================================

/**
 * @brief Start the server
 *
 * Discovers keywords, creates a detector factory from the registered backend
 * and starts serving in a background thread. Returns once the listening
 * socket is bound (or the stdio session has started).
 *
 * Error codes:
 *   - WWS_ERROR_INVALID_ARGUMENT: config is NULL or a field is out of range
 *   - WWS_ERROR_ACCESS_KEY_MISSING: access_key is NULL or empty
 *   - WWS_ERROR_INVALID_URI: uri cannot be parsed
 *   - WWS_ERROR_SERVER_ALREADY_RUNNING: server is already running
 *   - WWS_ERROR_BACKEND_NOT_REGISTERED: no detector backend registered
 *   - WWS_ERROR_SERVER_BIND_FAILED: failed to bind or listen
 */
WWS_API wws_result_t wws_server_start(const wws_server_config_t* config);

/**
 * @brief Stop the server
 *
 * Closes the listening socket and every live connection, then waits for all
 * sessions to return their detectors.
 *
 * @return WWS_SUCCESS, or WWS_ERROR_SERVER_NOT_RUNNING
 */
WWS_API wws_result_t wws_server_stop(void);

/**
 * @brief Ask the server to stop without waiting
 *
 * Async-signal-safe: only writes to a pipe. wws_server_wait() returns
 * shortly after; call wws_server_stop() afterwards to release resources.
 */
WWS_API void wws_server_interrupt(void);

WWS_API wws_bool_t wws_server_is_running(void);

/**
 * @param status Output parameter for status (must not be NULL)
 * @return WWS_SUCCESS, or WWS_ERROR_NULL_POINTER
 */
WWS_API wws_result_t wws_server_get_status(wws_server_status_t* status);

/**
 * @brief Block until the server stops serving
 *
 * Returns when the stdio session ends, when the server is interrupted or
 * stopped, or when the accept loop fails.
 *
 * @return Exit code (0 on clean shutdown)
 */
WWS_API int wws_server_wait(void);

#ifdef __cplusplus
}
#endif

#endif /* WWS_SERVER_H */
