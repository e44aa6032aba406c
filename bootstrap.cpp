#include "bootstrap.hpp"
#include "bootstrap_config.hpp"
#include "error_manager.hpp"
#include "resources.hpp"
#include "voice/wav_check.hpp"
#include "logger.hpp"

#include <filesystem>

namespace fs = std::filesystem;

void resolveAssetPaths(AssistantConfig& cfg) {
    for (auto& [label, entry] : cfg.categories) {
        entry.assetPath = resolveResourcePath(entry.assetPath);
    }
    for (auto& [key, path] : cfg.audio.events) {
        path = resolveResourcePath(path);
    }
}

bool validateAssets(const AssistantConfig& cfg, std::string* err) {
    auto check = [err](const std::string& owner, const std::string& path) {
        std::string why;
        if (!Voice::isPlayableAsset(path, &why)) {
            if (err) *err = owner + ": " + why;
            return false;
        }
        LOG_TRACE("Assets", owner + " ok: " + path);
        return true;
    };

    for (const auto& [label, entry] : cfg.categories) {
        if (entry.assetPath.empty()) continue;
        if (!check("category '" + label + "'", entry.assetPath)) return false;
    }
    for (const auto& [key, path] : cfg.audio.events) {
        if (path.empty()) continue;
        if (!check("event '" + key + "'", path)) return false;
    }
    return true;
}

bool runBootstrapChecks(const std::string& configPath, AssistantConfig& out) {
    LOG_PHASE("Bootstrap begin", true);

    // ============================================================
    // Error catalogue + assistant config
    // ============================================================
    beginPhaseGroup();

    fs::path errPath = fs::path(getResourcePath()) / ERRORS_FILE;
    nlohmann::json errorsCfg;
    bootstrap_config::loadConfig(errPath, bootstrap_config::defaultErrors(), errorsCfg, "Errors config");
    ErrorManager::setCatalogue(errorsCfg);

    nlohmann::json doc;
    bool parsedFile = bootstrap_config::loadConfig(configPath, bootstrap_config::defaultAssistant(),
                                                   doc, "Assistant config", "ERR_CONFIG_INVALID");
    endPhaseGroup();

    if (!parsedFile) {
        LOG_DEBUG("Config", "Continuing with defaults written to " + configPath);
    }

    std::string err;
    if (!parseAssistantConfig(doc, out, &err)) {
        ErrorManager::report("ERR_CONFIG_INVALID", err);
        LOG_PHASE("Config validation", false);
        return false;
    }
    LOG_PHASE("Config validation", true);

    // ============================================================
    // Audio assets
    // ============================================================
    resolveAssetPaths(out);
    if (!validateAssets(out, &err)) {
        ErrorManager::report("ERR_ASSET_FORMAT", err);
        LOG_PHASE("Asset check", false);
        return false;
    }
    LOG_PHASE("Asset check", true);

    LOG_DEBUG("Config", "Peripheral bus " + std::to_string(out.peripheral.busId) +
                        ", " + std::to_string(out.kws.keywords.size()) + " keyword(s), " +
                        std::to_string(out.categories.size()) + " categories, cooldown " +
                        std::to_string(out.pipeline.cooldown.count()) + " ms");

    LOG_PHASE("Bootstrap complete", true);
    return true;
}
