#include "bootstrap_config.hpp"
#include "error_manager.hpp"
#include "logger.hpp"

#include <fstream>

namespace fs = std::filesystem;

namespace bootstrap_config {

// ----------------- helpers -----------------
static bool isUserMap(const std::string& key) {
    return key == "categories" || key == "events";
}

// Write-back is best effort; a read-only config stays usable
static void saveConfig(const fs::path& path, const nlohmann::json& cfg, const std::string& name) {
    std::ofstream out(path);
    if (!out) {
        LOG_ERROR("Config", "Could not write " + name + " to " + path.string());
        return;
    }
    out << cfg.dump(2) << "\n";
}

bool mergeDefaults(nlohmann::json& cfg,
                   const nlohmann::json& defs,
                   int* patchedCount) {
    bool patched = false;
    for (auto& [key, defVal] : defs.items()) {
        if (!cfg.contains(key) || cfg[key].is_null()) {
            cfg[key] = defVal;
            patched = true;
            if (patchedCount) (*patchedCount)++;
        } else if (defVal.is_object() && cfg[key].is_object()) {
            if (isUserMap(key)) continue;
            if (mergeDefaults(cfg[key], defVal, patchedCount))
                patched = true;
        } else if (defVal.is_number() && cfg[key].is_number()) {
            // 3 vs 3.0 is not a type error; parseAssistantConfig checks integrality
            continue;
        } else if (cfg[key].type() != defVal.type()) {
            // Integer fields take 52 or "0x34" either way round; the parser validates them
            if (defVal.is_string() && cfg[key].is_number_integer()) continue;
            if (defVal.is_number_integer() && cfg[key].is_string()) continue;
            cfg[key] = defVal;
            patched = true;
            if (patchedCount) (*patchedCount)++;
        }
    }
    return patched;
}

// ----------------- defaults -----------------
nlohmann::json defaultAssistant() {
    return {
        {"peripheral", {
            {"bus_id", 4},
            {"address", "0x34"},
            {"result_register", "0x64"},
            {"speak_register", "0x6E"}
        }},

        {"kws", {
            {"model_path", "models/ggml-base.bin"},
            {"language", "zh"},
            {"sample_rate", 16000},
            {"window_ms", 2000},
            {"hop_ms", 500},
            {"input_device_index", -1},
            {"threads", 4},
            {"keywords", nlohmann::json::array({
                {{"phrase", "开启垃圾分类"}, {"threshold", 0.3}}
            })}
        }},

        {"pipeline", {
            {"cooldown_ms", 3000},
            {"debounce_ms", 800},
            {"channel_capacity", 10},
            {"poll_timeout_ms", 100},
            {"post_trigger_delay_ms", 0}
        }},

        {"audio", {
            {"volume", 85},
            {"events", {
                {"photo_ack", ""},
                {"result_prefix", ""},
                {"capture_error", ""},
                {"network_error", ""}
            }}
        }},

        {"categories", {
            {"可回收物", {{"asset", ""}, {"phrase_id", 1}}},
            {"厨余垃圾", {{"asset", ""}, {"phrase_id", 2}}},
            {"有害垃圾", {{"asset", ""}, {"phrase_id", 3}}},
            {"其他垃圾", {{"asset", ""}, {"phrase_id", 4}}}
        }},

        {"server", {
            {"url", "http://10.4.0.3:8000/classify"},
            {"timeout_ms", 15000}
        }},

        {"camera", {
            {"capture_command", "fswebcam -q -r 640x480 --no-banner {path}"},
            {"snapshot_path", "/tmp/echobin_snapshot.jpg"}
        }},

        {"diagnostics", {
            {"read_result_register", false}
        }}
    };
}

nlohmann::json defaultErrors() {
    return {
        {"ERR_CONFIG_INVALID", {
            {"user", "[Config] Configuration invalid."},
            {"debug", "echobin_config.json failed parsing or validation."}
        }},
        {"ERR_ASSET_FORMAT", {
            {"user", "[Audio] An audio asset is missing or has the wrong format."},
            {"debug", "Assets must be mono, 16 kHz, 16-bit PCM WAV files."}
        }},
        {"ERR_BUS_OPEN", {
            {"user", "[Peripheral] Voice module bus could not be opened."},
            {"debug", "open() on the i2c-dev node failed."}
        }},
        {"ERR_BUS_WRITE", {
            {"user", "[Peripheral] Voice module did not accept a command."},
            {"debug", "I2C_RDWR block write failed."}
        }},
        {"ERR_BUS_READ", {
            {"user", "[Peripheral] Voice module could not be read."},
            {"debug", "I2C_RDWR register read failed."}
        }},
        {"ERR_KWS_INIT", {
            {"user", "[KWS] Keyword detection could not start."},
            {"debug", "Model load or microphone open failed."}
        }},
        {"ERR_KWS_STEP", {
            {"user", "[KWS] A detection step was skipped."},
            {"debug", "Audio read or inference step returned an error."}
        }},
        {"ERR_CAPTURE_FAILED", {
            {"user", "[Camera] Could not take a photo."},
            {"debug", "Capture command failed or wrote no frame."}
        }},
        {"ERR_CLASSIFY_FAILED", {
            {"user", "[Server] Could not classify the photo."},
            {"debug", "Upload failed, non-2xx status, or no 'category' in response."}
        }},
        {"ERR_ANNOUNCE_FAILED", {
            {"user", "[Audio] Could not announce the result."},
            {"debug", "No asset/phrase id for the category, or the peripheral write failed."}
        }},
        {"ERR_PLAYBACK_FAILED", {
            {"user", "[Audio] Playback failed."},
            {"debug", "SFML could not load or play the WAV file."}
        }}
    };
}

// ----------------- loader -----------------
bool loadConfig(const fs::path& path,
                const nlohmann::json& defaults,
                nlohmann::json& outConfig,
                const std::string& name,
                const std::string& errorCode) {
    if (!fs::exists(path)) {
        outConfig = defaults;
        saveConfig(path, outConfig, name);

        LOG_PHASE(name + " created", true);
        return true;
    }

    try {
        std::ifstream f(path);
        f >> outConfig;

        int patchedCount = 0;
        if (mergeDefaults(outConfig, defaults, &patchedCount)) {
            saveConfig(path, outConfig, name);
            LOG_PHASE(name + " patched", true);
            LOG_DEBUG("Config", name + " patched (" + std::to_string(patchedCount) + " keys)");
        } else {
            LOG_PHASE(name + " load", true);
        }
        return true;
    } catch (const std::exception& e) {
        LOG_ERROR("Config", name + " invalid → reset to defaults (" + e.what() + ")");
        LOG_PHASE(name + " load", false);

        if (!errorCode.empty())
            ErrorManager::report(errorCode);

        outConfig = defaults;
        saveConfig(path, outConfig, name);
        return false;
    }
}

} // namespace bootstrap_config
