#include "resources.hpp"
#include "logger.hpp"

#include <filesystem>
#include <mutex>
#include <unistd.h>

namespace fs = std::filesystem;

static std::string locateResources() {
#if defined(ECHOBIN_PORTABLE_ONLY)
    fs::path exePath;
    char buffer[4096];
    ssize_t n = ::readlink("/proc/self/exe", buffer, sizeof(buffer) - 1);
    if (n > 0) {
        buffer[n] = '\0';
        exePath = fs::path(buffer).parent_path();
    } else {
        exePath = fs::current_path();
    }

    fs::path portablePath = exePath / "resources";
    if (fs::exists(portablePath)) {
        LOG_DEBUG("Resources", "Using portable resource path: " + portablePath.string());
        return portablePath.string();
    }
    return exePath.string();
#else
    fs::path buildPath   = fs::current_path() / "resources";
    fs::path projectPath = fs::current_path().parent_path() / "resources";

    // Prefer project resources first
    if (fs::exists(projectPath)) {
        LOG_DEBUG("Resources", "Using resource path: " + projectPath.string());
        return projectPath.string();
    }
    if (fs::exists(buildPath)) {
        LOG_DEBUG("Resources", "Using fallback resource path: " + buildPath.string());
        return buildPath.string();
    }

    LOG_DEBUG("Resources", "Falling back to cwd: " + fs::current_path().string());
    return fs::current_path().string();
#endif
}

// -------------------------------------------------------------
// Locate resource root once (prefer repo/resources over build/resources)
// -------------------------------------------------------------
std::string getResourcePath() {
    static std::once_flag once;
    static std::string path;
    std::call_once(once, [] {
        path = locateResources();
        LOG_PHASE("Resource path set", true);
    });
    return path;
}

std::string resolveResourcePath(const std::string& path) {
    if (path.empty()) return path;
    fs::path p(path);
    if (p.is_absolute()) return p.string();
    return (fs::path(getResourcePath()) / p).string();
}
