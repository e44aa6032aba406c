#pragma once
#include <nlohmann/json.hpp>
#include <string>
#include <filesystem>

// Centralized config + error catalogue bootstrap for EchoBin
namespace bootstrap_config {

    // Generic loader → ensures defaults, patches missing keys, saves back
    bool loadConfig(const std::filesystem::path& path,
                    const nlohmann::json& defaults,
                    nlohmann::json& outConfig,
                    const std::string& name,
                    const std::string& errorCode = "");

    // Patch missing / wrongly-typed keys of cfg from defs. Maps whose
    // entries belong to the user ("categories", "events") are only
    // filled in when absent, never merged entry by entry.
    bool mergeDefaults(nlohmann::json& cfg,
                       const nlohmann::json& defs,
                       int* patchedCount = nullptr);

    // Canonical defaults
    nlohmann::json defaultAssistant();
    nlohmann::json defaultErrors();
}
