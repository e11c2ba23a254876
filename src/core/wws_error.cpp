/**
 * @file wws_error.cpp
 * @brief Wake Word Server - Error Messages
 */

#include "wws/core/wws_error.h"

extern "C" {

const char* wws_error_message(wws_result_t code) {
    switch (code) {
        case WWS_SUCCESS:
            return "Success";

        // Initialization
        case WWS_ERROR_BACKEND_NOT_REGISTERED:
            return "No detector backend registered";
        case WWS_ERROR_BACKEND_ALREADY_REGISTERED:
            return "Detector backend already registered";

        // Model
        case WWS_ERROR_UNKNOWN_KEYWORD:
            return "Unknown keyword";
        case WWS_ERROR_DETECTOR_BUILD_FAILED:
            return "Failed to build wake word detector";
        case WWS_ERROR_DETECTOR_PROCESS_FAILED:
            return "Wake word detector failed to process audio frame";

        // Network
        case WWS_ERROR_STREAM_CLOSED:
            return "Stream closed";
        case WWS_ERROR_TRANSPORT_READ:
            return "Failed to read from client";
        case WWS_ERROR_TRANSPORT_WRITE:
            return "Failed to write to client";
        case WWS_ERROR_INVALID_URI:
            return "Invalid server URI";
        case WWS_ERROR_SERVER_BIND_FAILED:
            return "Failed to bind server socket";
        case WWS_ERROR_SERVER_ALREADY_RUNNING:
            return "Server is already running";
        case WWS_ERROR_SERVER_NOT_RUNNING:
            return "Server is not running";

        // Validation
        case WWS_ERROR_INVALID_ARGUMENT:
            return "Invalid argument";
        case WWS_ERROR_NULL_POINTER:
            return "Null pointer";

        // Audio
        case WWS_ERROR_UNSUPPORTED_AUDIO_FORMAT:
            return "Unsupported audio format";

        // Authentication
        case WWS_ERROR_ACCESS_KEY_MISSING:
            return "Access key is missing";

        // Event
        case WWS_ERROR_MALFORMED_EVENT:
            return "Malformed event";

        case WWS_ERROR_UNKNOWN:
        default:
            return "Unknown error";
    }
}

}  // extern "C"
