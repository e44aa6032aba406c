#pragma once
#include <string>

#include "config/assistant_config.hpp"

// Load error catalogue and configuration, resolve and check audio assets.
// False means a configuration error: the process must not start.
bool runBootstrapChecks(const std::string& configPath, AssistantConfig& out);

// Resolve relative asset paths under the resource directory
void resolveAssetPaths(AssistantConfig& cfg);

// Every configured asset must be a mono 16 kHz 16-bit PCM WAV
bool validateAssets(const AssistantConfig& cfg, std::string* err = nullptr);
