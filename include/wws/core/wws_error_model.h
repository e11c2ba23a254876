/**
 * @file wws_error_model.h
 * @brief Wake Word Server - Structured Error Model
 */

#ifndef WWS_ERROR_MODEL_H
#define WWS_ERROR_MODEL_H

#include "wws/core/wws_error.h"

#ifdef __cplusplus
extern "C" {
#endif

/**
 * @brief Structured error model
 *
 * Wraps a wws_result_t code into a typed record for logging and status
 * reporting.
 */
typedef struct {
    wws_result_t code;      /**< Numeric error code */
    const char* message;    /**< Human-readable error message */
    const char* category;   /**< Error category (e.g., Model, Network, Event) */
} wws_error_model_t;

/**
 * @brief Create structured error model from error code
 */
WWS_API wws_error_model_t wws_make_error_model(wws_result_t code);

/**
 * @brief Get error category string from error code
 */
WWS_API const char* wws_error_category(wws_result_t code);

#ifdef __cplusplus
}
#endif

#endif // WWS_ERROR_MODEL_H
