#pragma once
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json_fwd.hpp>

// =========================================================
// Category mapping (label -> asset / actuator phrase)
// =========================================================
struct CategoryEntry {
    std::string assetPath;  // empty = no pre-recorded asset
    int phraseId = 0;       // 1-based actuator phrase, 0 = none
};

// Labels are unique; read-only after bootstrap
using CategoryMapping = std::map<std::string, CategoryEntry>;

// =========================================================
// Sections
// =========================================================
struct PeripheralConfig {
    int busId = 4;
    std::uint8_t address = 0x34;
    std::uint8_t resultRegister = 0x64;
    std::uint8_t speakRegister = 0x6E;
};

struct KeywordSpec {
    std::string phrase;
    float threshold = 0.3f;   // 0.0 - 1.0
};

// Input rate whisper models are trained on (WHISPER_SAMPLE_RATE)
inline constexpr int KWS_SAMPLE_RATE = 16000;

struct KwsConfig {
    std::string modelPath;
    std::string language = "zh";
    std::vector<KeywordSpec> keywords;
    int sampleRate = KWS_SAMPLE_RATE;
    int windowMs = 2000;
    int hopMs = 500;
    int inputDeviceIndex = -1;
    int threads = 4;
};

struct PipelineConfig {
    std::chrono::milliseconds cooldown{3000};          // quiet period after a cycle
    std::chrono::milliseconds debounce{800};           // per-keyword repeat suppression
    std::chrono::milliseconds pollTimeout{100};        // consumer wait per iteration
    std::chrono::milliseconds postTriggerDelay{0};
    std::size_t channelCapacity = 10;
};

struct AudioAssetConfig {
    std::map<std::string, std::string> events;   // event key -> wav path
    int volume = 85;                             // 0 - 100
};

struct ServerConfig {
    std::string url;
    std::chrono::milliseconds timeout{15000};
};

struct CameraConfig {
    std::string captureCommand;   // "{path}" is replaced by snapshotPath
    std::string snapshotPath;
};

// =========================================================
// AssistantConfig: immutable snapshot built once at startup
// =========================================================
struct AssistantConfig {
    PeripheralConfig peripheral;
    KwsConfig kws;
    PipelineConfig pipeline;
    AudioAssetConfig audio;
    CategoryMapping categories;
    ServerConfig server;
    CameraConfig camera;
    bool readResultRegister = false;
};

// Convert a (defaults-patched) JSON document into AssistantConfig.
// Returns false and fills err on the first range/type violation.
bool parseAssistantConfig(const nlohmann::json& doc,
                          AssistantConfig& out,
                          std::string* err = nullptr);

// Phrase id configured for a label, if any
std::optional<int> phraseIdFor(const CategoryMapping& mapping, const std::string& label);

// Asset configured for a label, if any
std::optional<std::string> assetFor(const CategoryMapping& mapping, const std::string& label);
