#include "logger.hpp"

#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>

// =====================================================
// State
// =====================================================
#if defined(_DEBUG) || !defined(NDEBUG)
static std::atomic<LogLevel> g_level{LogLevel::Trace};
#else
static std::atomic<LogLevel> g_level{LogLevel::Debug};
#endif

static std::mutex g_logMutex;
static std::ofstream g_logFile;
static bool g_console = true;

// Reader thread, fetch tasks and the cycle loop all log; number them
static std::atomic<int> g_nextThread{0};
static thread_local int t_threadNo = -1;

// =====================================================
// Helpers
// =====================================================
static std::string timestamp() {
    auto now = std::chrono::system_clock::now();
    auto t = std::chrono::system_clock::to_time_t(now);
    std::tm tm{};
#if defined(_WIN32)
    localtime_s(&tm, &t);
#else
    localtime_r(&t, &tm);
#endif
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                  now.time_since_epoch()).count() % 1000;

    std::ostringstream oss;
    oss << std::put_time(&tm, "%H:%M:%S")
        << '.' << std::setw(3) << std::setfill('0') << ms;
    return oss.str();
}

static int threadNo() {
    if (t_threadNo < 0) t_threadNo = g_nextThread++;
    return t_threadNo;
}

static bool enabled(LogLevel level) {
    LogLevel current = g_level.load();
    return current != LogLevel::Off && level >= current;
}

static void write(const char* level, const std::string& tag, const std::string& msg) {
    std::ostringstream oss;
    oss << '[' << timestamp() << "][t" << threadNo() << "][" << level << "][" << tag << "] " << msg;
    const std::string line = oss.str();

    std::lock_guard<std::mutex> lock(g_logMutex);
    if (g_logFile.is_open()) {
        g_logFile << line << '\n';
        g_logFile.flush();
    }
    if (g_console) {
        std::cerr << line << '\n';
    }
}

// =====================================================
// Configuration
// =====================================================
LogLevel parseLogLevel(const std::string& name, LogLevel fallback) {
    if (name == "trace") return LogLevel::Trace;
    if (name == "debug") return LogLevel::Debug;
    if (name == "error") return LogLevel::Error;
    if (name == "off")   return LogLevel::Off;
    return fallback;
}

void setLogLevel(LogLevel level) { g_level = level; }

LogLevel logLevel() { return g_level.load(); }

void setConsoleLogging(bool enabled) {
    std::lock_guard<std::mutex> lock(g_logMutex);
    g_console = enabled;
}

// =====================================================
// Logging
// =====================================================
// Phase lines: "| time | file | phase | ok |", the format scripts grep for
void logPhaseInternal(const std::string& file,
                      const std::string& phase,
                      bool success)
{
    if (!enabled(success ? LogLevel::Debug : LogLevel::Error)) return;

    std::string name = std::filesystem::path(file).filename().string();
    std::lock_guard<std::mutex> lock(g_logMutex);

    std::ostringstream oss;
    oss << "| " << timestamp() << " | " << name << " | " << phase
        << " | " << (success ? "ok" : "FAILED") << " |";

    if (g_logFile.is_open()) {
        g_logFile << oss.str() << '\n';
        g_logFile.flush();
    }
    if (g_console) {
        std::cerr << oss.str() << '\n';
    }
}

void logTrace(const std::string& tag, const std::string& msg) {
    if (enabled(LogLevel::Trace)) write("TRACE", tag, msg);
}

void logDebug(const std::string& tag, const std::string& msg) {
    if (enabled(LogLevel::Debug)) write("DEBUG", tag, msg);
}

void logError(const std::string& tag, const std::string& msg) {
    if (enabled(LogLevel::Error)) write("ERROR", tag, msg);
}

// =====================================================
// Lifecycle
// =====================================================
void initLogger(const std::string& filename) {
    std::lock_guard<std::mutex> lock(g_logMutex);

    if (g_logFile.is_open()) {
        g_logFile << "==== log continues in " << filename << " ====" << std::endl;
        g_logFile.close();
    }

    auto path = std::filesystem::absolute(filename);
    g_logFile.open(path, std::ios::out | std::ios::app);

    if (!g_logFile.is_open()) {
        std::cerr << "[Logger] Could not open log file: " << path.string() << std::endl;
        return;
    }
    g_logFile << "==== voxstream log started " << timestamp() << " ====" << std::endl;
}

void shutdownLogger() {
    std::lock_guard<std::mutex> lock(g_logMutex);
    if (g_logFile.is_open()) {
        g_logFile << "==== voxstream log ended " << timestamp() << " ====" << std::endl;
        g_logFile.close();
    }
}
