#include "error_manager.hpp"
#include "bootstrap_config.hpp"
#include "logger.hpp"

#include <fstream>
#include <filesystem>
#include <mutex>

// ------------------------------------------------------------
// Storage
// ------------------------------------------------------------
static nlohmann::json g_errors;
static bool g_loaded = false;
static std::mutex g_errorsMutex;

// Caller holds g_errorsMutex
static const nlohmann::json& table() {
    if (!g_loaded) {
        g_errors = bootstrap_config::defaultErrors();
        g_loaded = true;
    }
    return g_errors;
}

static std::string lookup(const std::string& code, const char* field) {
    std::lock_guard<std::mutex> lock(g_errorsMutex);
    const auto& root = table();

    auto it = root.find(code);
    if (it != root.end() && it->is_object()) {
        auto msg = it->find(field);
        if (msg != it->end() && msg->is_string()) {
            return msg->get<std::string>();
        }
    }
    return {};
}

// ------------------------------------------------------------
// ErrorManager implementation
// ------------------------------------------------------------
void ErrorManager::loadFromJson(const nlohmann::json& source) {
    std::lock_guard<std::mutex> lock(g_errorsMutex);

    // Accept both { "errors": {...} } and a bare table
    if (source.contains("errors") && source["errors"].is_object()) {
        g_errors = source["errors"];
    } else {
        g_errors = source;
    }
    g_loaded = true;
}

bool ErrorManager::load(const std::string& path) {
    namespace fs = std::filesystem;

    std::ifstream in(path);
    if (!in) {
        LOG_ERROR("Errors", "Could not open " + path);
        return false;
    }

    try {
        nlohmann::json parsed;
        in >> parsed;
        loadFromJson(parsed);

        LOG_DEBUG("Errors", "Loaded error table from: " + fs::absolute(path).string());
        return true;
    } catch (const std::exception& e) {
        LOG_ERROR("Errors", "Failed to parse " + path + " -> " + e.what());
        return false;
    }
}

std::string ErrorManager::getUserMessage(const std::string& code) {
    std::string msg = lookup(code, "user");
    if (msg.empty()) {
        return "[Error] Unknown error code: " + code;
    }
    return msg;
}

std::string ErrorManager::getDebugMessage(const std::string& code) {
    std::string msg = lookup(code, "debug");
    if (msg.empty()) {
        return "[Debug] No debug message for code: " + code;
    }
    return msg;
}

CycleResult ErrorManager::report(const std::string& code, const std::string& detail) {
    CycleResult result;
    result.success   = false;
    result.message   = getUserMessage(code);
    result.errorCode = code;

    note(code, detail);
    return result;
}

void ErrorManager::note(const std::string& code, const std::string& detail) {
    std::string line = code + " -> " + getDebugMessage(code);
    if (!detail.empty()) {
        line += " (" + detail + ")";
    }
    LOG_ERROR("Errors", line);
}
