#pragma once

#include <string>
#include <nlohmann/json.hpp>

// Undefine Windows ERROR macro if it leaks in
#ifdef ERROR
#undef ERROR
#endif

#include "cycle_result.hpp"

// ------------------------------------------------------------
// ErrorManager
// ------------------------------------------------------------
// Error codes map to { "user": ..., "debug": ... } messages.
// Until load()/loadFromJson() runs, the built-in defaults from
// bootstrap_config::defaultErrors() are used.
namespace ErrorManager {
    // Load error codes from JSON (errors.json)
    bool load(const std::string& path);
    void loadFromJson(const nlohmann::json& table);

    // Get messages
    std::string getUserMessage(const std::string& code);
    std::string getDebugMessage(const std::string& code);

    // Report an error: logs the debug text (plus detail) and returns
    // a failed CycleResult carrying the user text.
    CycleResult report(const std::string& code, const std::string& detail = "");

    // Log-only variant for recoverable chunk-level anomalies
    void note(const std::string& code, const std::string& detail = "");
}
