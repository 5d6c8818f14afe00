#include "resources.hpp"
#include "logger.hpp"

#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <vector>

#if defined(_WIN32)
    #define WIN32_LEAN_AND_MEAN
    #include <windows.h>
#elif defined(__APPLE__)
    #include <mach-o/dyld.h>
#endif

namespace fs = std::filesystem;

#if defined(VOXSTREAM_PORTABLE_ONLY)
// Directory holding the running binary, empty if unknown
static fs::path executableDir() {
#if defined(_WIN32)
    char buffer[MAX_PATH];
    DWORD n = GetModuleFileNameA(nullptr, buffer, MAX_PATH);
    if (n == 0 || n == MAX_PATH) return {};
    return fs::path(buffer).parent_path();
#elif defined(__APPLE__)
    char buffer[1024];
    uint32_t size = sizeof(buffer);
    if (_NSGetExecutablePath(buffer, &size) != 0) return {};
    return fs::path(buffer).parent_path();
#else
    std::error_code ec;
    fs::path exe = fs::read_symlink("/proc/self/exe", ec);
    return ec ? fs::path{} : exe.parent_path();
#endif
}
#endif

// -------------------------------------------------------------
// Resource root, first existing candidate wins:
//   $VOXSTREAM_RESOURCES
//   <exe dir>/resources        (portable builds only)
//   <cwd>/../resources         (running from build/)
//   <cwd>/resources
//   <cwd>
// -------------------------------------------------------------
std::string getResourcePath() {
    std::vector<fs::path> candidates;

    if (const char* env = std::getenv("VOXSTREAM_RESOURCES"); env && *env) {
        candidates.emplace_back(env);
    }
#if defined(VOXSTREAM_PORTABLE_ONLY)
    if (fs::path exe = executableDir(); !exe.empty()) {
        candidates.push_back(exe / "resources");
    }
#endif
    const fs::path cwd = fs::current_path();
    candidates.push_back(cwd.parent_path() / "resources");
    candidates.push_back(cwd / "resources");

    for (const auto& dir : candidates) {
        std::error_code ec;
        if (fs::is_directory(dir, ec)) {
            LOG_DEBUG("Resources", "Using resource path: " + dir.string());
            return dir.string();
        }
    }

#if defined(VOXSTREAM_PORTABLE_ONLY)
    if (fs::path exe = executableDir(); !exe.empty()) {
        LOG_DEBUG("Resources", "No resources/ found, using " + exe.string());
        return exe.string();
    }
#endif
    LOG_DEBUG("Resources", "No resources/ found, using " + cwd.string());
    return cwd.string();
}

// -------------------------------------------------------------
// Read a file (captured clips, test fixtures) as raw bytes
// -------------------------------------------------------------
std::string loadBinaryResource(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        LOG_ERROR("Resources", "Cannot open " + path);
        return {};
    }
    return { std::istreambuf_iterator<char>(file),
             std::istreambuf_iterator<char>() };
}
