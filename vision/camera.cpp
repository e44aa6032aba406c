#include "camera.hpp"
#include "error_manager.hpp"
#include "logger.hpp"

#include <array>
#include <cstdio>
#include <filesystem>
#include <sys/wait.h>

namespace fs = std::filesystem;

namespace Vision {

std::string expandCaptureCommand(const std::string& tmpl, const std::string& path) {
    static const std::string token = "{path}";
    std::string out = tmpl;
    size_t pos = 0;
    while ((pos = out.find(token, pos)) != std::string::npos) {
        out.replace(pos, token.size(), path);
        pos += path.size();
    }
    return out;
}

CommandCamera::CommandCamera(const CameraConfig& cfg)
    : cfg_(cfg) {}

std::optional<std::string> CommandCamera::captureImage() {
    const fs::path snapshot = cfg_.snapshotPath;

    std::error_code ec;
    if (snapshot.has_parent_path()) {
        fs::create_directories(snapshot.parent_path(), ec);
        if (ec) {
            ErrorManager::report("ERR_CAPTURE_FAILED", "mkdir " + snapshot.parent_path().string() +
                                                       ": " + ec.message());
            return std::nullopt;
        }
    }

    // A stale frame from the previous cycle must not pass as a new one
    fs::remove(snapshot, ec);

    const std::string command = expandCaptureCommand(cfg_.captureCommand, snapshot.string()) + " 2>&1";
    LOG_TRACE("Camera", "Running: " + command);

    FILE* pipe = ::popen(command.c_str(), "r");
    if (!pipe) {
        ErrorManager::report("ERR_CAPTURE_FAILED", "popen failed");
        return std::nullopt;
    }

    std::string output;
    std::array<char, 256> buf{};
    while (std::fgets(buf.data(), static_cast<int>(buf.size()), pipe)) {
        output += buf.data();
    }

    int status = ::pclose(pipe);
    if (status == -1 || !WIFEXITED(status) || WEXITSTATUS(status) != 0) {
        ErrorManager::report("ERR_CAPTURE_FAILED", "capture command failed: " + output);
        return std::nullopt;
    }

    if (!fs::exists(snapshot, ec) || fs::file_size(snapshot, ec) == 0) {
        ErrorManager::report("ERR_CAPTURE_FAILED", "no frame written to " + snapshot.string());
        return std::nullopt;
    }

    LOG_DEBUG("Camera", "Photo captured: " + snapshot.string());
    return snapshot.string();
}

} // namespace Vision
