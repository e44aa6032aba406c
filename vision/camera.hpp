#pragma once
#include <optional>
#include <string>

#include "config/assistant_config.hpp"

namespace Vision {

/// Camera
/// "Capture one frame, return its path."
class Camera {
public:
    virtual ~Camera() = default;
    virtual std::optional<std::string> captureImage() = 0;
};

// Replace every "{path}" in tmpl with path
std::string expandCaptureCommand(const std::string& tmpl, const std::string& path);

/// CommandCamera
/// Runs an external capture tool (fswebcam, libcamera-still, ...) that
/// writes a single frame to the snapshot path.
class CommandCamera : public Camera {
public:
    explicit CommandCamera(const CameraConfig& cfg);

    std::optional<std::string> captureImage() override;

private:
    const CameraConfig& cfg_;
};

} // namespace Vision
