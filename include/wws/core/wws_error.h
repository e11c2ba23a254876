/**
 * @file wws_error.h
 * @brief Wake Word Server - Error Codes
 *
 * Error codes are negative and grouped by range:
 *
 *   -100 .. -109  Initialization
 *   -110 .. -129  Model (keywords, detectors)
 *   -150 .. -179  Network (transport, server)
 *   -250 .. -279  Validation
 *   -280 .. -299  Audio
 *   -320 .. -329  Authentication
 *   -700 .. -799  Event
 *   -800 .. -899  Other
 */

#ifndef WWS_ERROR_H
#define WWS_ERROR_H

#include "wws/core/wws_types.h"

#ifdef __cplusplus
extern "C" {
#endif

// Initialization
#define WWS_ERROR_BACKEND_NOT_REGISTERED    ((wws_result_t)-101)
#define WWS_ERROR_BACKEND_ALREADY_REGISTERED ((wws_result_t)-102)

// Model
#define WWS_ERROR_UNKNOWN_KEYWORD           ((wws_result_t)-110)
#define WWS_ERROR_DETECTOR_BUILD_FAILED     ((wws_result_t)-111)
#define WWS_ERROR_DETECTOR_PROCESS_FAILED   ((wws_result_t)-112)

// Network
#define WWS_ERROR_STREAM_CLOSED             ((wws_result_t)-150)
#define WWS_ERROR_TRANSPORT_READ            ((wws_result_t)-151)
#define WWS_ERROR_TRANSPORT_WRITE           ((wws_result_t)-152)
#define WWS_ERROR_INVALID_URI               ((wws_result_t)-153)
#define WWS_ERROR_SERVER_BIND_FAILED        ((wws_result_t)-154)
#define WWS_ERROR_SERVER_ALREADY_RUNNING    ((wws_result_t)-155)
#define WWS_ERROR_SERVER_NOT_RUNNING        ((wws_result_t)-156)

// Validation
#define WWS_ERROR_INVALID_ARGUMENT          ((wws_result_t)-250)
#define WWS_ERROR_NULL_POINTER              ((wws_result_t)-251)

// Audio
#define WWS_ERROR_UNSUPPORTED_AUDIO_FORMAT  ((wws_result_t)-280)

// Authentication
#define WWS_ERROR_ACCESS_KEY_MISSING        ((wws_result_t)-320)

// Event
#define WWS_ERROR_MALFORMED_EVENT           ((wws_result_t)-700)

// Other
#define WWS_ERROR_UNKNOWN                   ((wws_result_t)-800)

/**
 * @brief Get a human-readable message for an error code
 *
 * @param code Result code
 * @return Static string, never NULL
 */
WWS_API const char* wws_error_message(wws_result_t code);

#ifdef __cplusplus
}
#endif

#endif /* WWS_ERROR_H */
