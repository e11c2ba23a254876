/**
 * @file wws_types.h
 * @brief Wake Word Server - Common Types
 *
 * Basic types shared by every module: result codes, booleans, handles
 * and the export macro.
 */

#ifndef WWS_TYPES_H
#define WWS_TYPES_H

#include <stddef.h>
#include <stdint.h>

#ifdef __cplusplus
extern "C" {
#endif

// =============================================================================
// EXPORT
// =============================================================================

#if defined(_WIN32)
#define WWS_API __declspec(dllexport)
#else
#define WWS_API __attribute__((visibility("default")))
#endif

// =============================================================================
// VERSION
// =============================================================================

#define WWS_VERSION_STRING "1.0.0"

// =============================================================================
// BASIC TYPES
// =============================================================================

/** Result code. 0 is success, negative values are errors (see wws_error.h) */
typedef int32_t wws_result_t;

/** C-compatible boolean */
typedef int32_t wws_bool_t;

#define WWS_TRUE ((wws_bool_t)1)
#define WWS_FALSE ((wws_bool_t)0)

#define WWS_NULL NULL

#define WWS_SUCCESS ((wws_result_t)0)

#define WWS_SUCCEEDED(result) ((result) >= 0)
#define WWS_FAILED(result) ((result) < 0)

#ifdef __cplusplus
}
#endif

#endif /* WWS_TYPES_H */
