#pragma once
#include <string>

// =====================================================
// Levels
// =====================================================
// Trace: per-frame / per-chunk detail
// Debug: cycle lifecycle, requests, config
// Error: failures (always written unless Off)
enum class LogLevel {
    Trace,
    Debug,
    Error,
    Off
};

// "trace" | "debug" | "error" | "off"; anything else → fallback
LogLevel parseLogLevel(const std::string& name, LogLevel fallback);

// =====================================================
// Lifecycle
// =====================================================
// Opens (or reopens) the log file in append mode
void initLogger(const std::string& filename);
void shutdownLogger();

// Default: Trace in debug builds, Debug in release builds
void setLogLevel(LogLevel level);
LogLevel logLevel();

// Mirror log lines to stderr (on by default)
void setConsoleLogging(bool enabled);

// =====================================================
// Core Logging Functions
// =====================================================
void logPhaseInternal(const std::string& file,
                      const std::string& phase,
                      bool success);

void logDebug(const std::string& tag, const std::string& msg);
void logTrace(const std::string& tag, const std::string& msg);
void logError(const std::string& tag, const std::string& msg);

// =====================================================
// Macros for convenience
// =====================================================
#define LOG_PHASE(phase, success) logPhaseInternal(__FILE__, phase, success)
#define LOG_DEBUG(tag, msg) logDebug(tag, msg)
#define LOG_TRACE(tag, msg) logTrace(tag, msg)
#define LOG_ERROR(tag, msg) logError(tag, msg)
