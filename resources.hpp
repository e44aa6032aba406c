#pragma once
#include <string>

// ------------------------------------------------------------
// Constants
// ------------------------------------------------------------
inline constexpr const char* ASSISTANT_CONFIG_FILE = "echobin_config.json";
inline constexpr const char* ERRORS_FILE           = "errors.json";
inline constexpr const char* LOG_FILE              = "echobin.log";

// ------------------------------------------------------------
// Resource loading
// ------------------------------------------------------------
std::string getResourcePath();

// Absolute paths pass through; relative ones resolve under getResourcePath()
std::string resolveResourcePath(const std::string& path);
