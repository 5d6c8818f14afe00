#pragma once
#include <string>

// ------------------------------------------------------------
// CycleResult: unified return type for one capture→response cycle
// ------------------------------------------------------------
struct CycleResult {
    std::string message;               // user-facing text (full response on success)
    bool success = false;              // true if the cycle completed
    std::string errorCode = "ERR_NONE"; // code for ErrorManager/logger
};
