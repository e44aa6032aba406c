#pragma once
#include <string>

// ------------------------------------------------------------
// ActionResult: unified return type for fallible pipeline steps
// ------------------------------------------------------------
struct ActionResult {
    bool success = false;   // true if the step succeeded
    std::string message;    // user-facing text
    std::string errorCode;  // error code for ErrorManager ("ERR_NONE" on success)
};

inline ActionResult okResult(const std::string& message) {
    return { true, message, "ERR_NONE" };
}
