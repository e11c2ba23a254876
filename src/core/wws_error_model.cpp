/**
 * @file wws_error_model.cpp
 * @brief Wake Word Server - Error Categories
 *
 * Maps a result code to the category of its range (see wws_error.h) so
 * startup failures and logs can report "[Network] Failed to bind ..."
 * instead of a bare number.
 */

#include "wws/core/wws_error_model.h"

namespace {

struct CategoryRange {
    wws_result_t lowest;
    wws_result_t highest;
    const char* name;
};

constexpr CategoryRange kCategories[] = {
    {-109, -100, "Initialization"},
    {-129, -110, "Model"},
    {-179, -150, "Network"},
    {-279, -250, "Validation"},
    {-299, -280, "Audio"},
    {-329, -320, "Authentication"},
    {-799, -700, "Event"},
    {-899, -800, "Other"},
};

}  // namespace

extern "C" {

const char* wws_error_category(wws_result_t code) {
    if (code == WWS_SUCCESS) {
        return "Success";
    }
    for (const CategoryRange& range : kCategories) {
        if (code >= range.lowest && code <= range.highest) {
            return range.name;
        }
    }
    return "Unknown";
}

wws_error_model_t wws_make_error_model(wws_result_t code) {
    wws_error_model_t model;
    model.code = code;
    model.message = wws_error_message(code);
    model.category = wws_error_category(code);
    return model;
}

}  // extern "C"
