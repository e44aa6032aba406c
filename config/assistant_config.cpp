#include "assistant_config.hpp"

#include <nlohmann/json.hpp>
#include <cmath>
#include <cstdint>
#include <limits>
#include <stdexcept>

using json = nlohmann::json;

// ----------------- helpers -----------------
static void fail(const std::string& msg) {
    throw std::invalid_argument(msg);
}

static int checkedInt(std::int64_t v, const std::string& key) {
    if (v < std::numeric_limits<int>::min() || v > std::numeric_limits<int>::max())
        fail(key + ": out of range: " + std::to_string(v));
    return static_cast<int>(v);
}

// Accepts 52, 52.0 or "0x34"
static int readInteger(const json& node, const std::string& key) {
    const json& v = node.at(key);
    if (v.is_number_unsigned()) {
        std::uint64_t u = v.get<std::uint64_t>();
        if (u > static_cast<std::uint64_t>(std::numeric_limits<int>::max()))
            fail(key + ": out of range: " + std::to_string(u));
        return static_cast<int>(u);
    }
    if (v.is_number_integer()) return checkedInt(v.get<std::int64_t>(), key);
    if (v.is_number_float()) {
        double d = v.get<double>();
        if (!std::isfinite(d) || std::trunc(d) != d) fail(key + ": not an integer: " + v.dump());
        if (d < std::numeric_limits<int>::min() || d > std::numeric_limits<int>::max())
            fail(key + ": out of range: " + v.dump());
        return static_cast<int>(d);
    }
    if (v.is_string()) {
        const std::string s = v.get<std::string>();
        std::size_t used = 0;
        long long value = 0;
        try {
            value = std::stoll(s, &used, 0);
        } catch (const std::exception&) {
            fail(key + ": not an integer: " + s);
        }
        if (used != s.size()) fail(key + ": trailing characters in " + s);
        return checkedInt(value, key);
    }
    fail(key + ": expected integer or hex string");
    return 0;
}

static std::uint8_t readByte(const json& node, const std::string& key) {
    int v = readInteger(node, key);
    if (v < 0 || v > 0xFF) fail(key + ": out of byte range");
    return static_cast<std::uint8_t>(v);
}

static std::chrono::milliseconds readMs(const json& node, const std::string& key) {
    int v = readInteger(node, key);
    if (v < 0) fail(key + ": must not be negative");
    return std::chrono::milliseconds(v);
}

// ----------------- sections -----------------
static PeripheralConfig parsePeripheral(const json& p) {
    PeripheralConfig cfg;
    cfg.busId          = readInteger(p, "bus_id");
    cfg.address        = readByte(p, "address");
    cfg.resultRegister = readByte(p, "result_register");
    cfg.speakRegister  = readByte(p, "speak_register");

    if (cfg.busId < 0) fail("peripheral.bus_id: must not be negative");
    // 7-bit addresses outside the reserved ranges
    if (cfg.address < 0x03 || cfg.address > 0x77) fail("peripheral.address: not a valid 7-bit address");
    return cfg;
}

static KwsConfig parseKws(const json& k) {
    KwsConfig cfg;
    cfg.modelPath        = k.at("model_path").get<std::string>();
    cfg.language         = k.at("language").get<std::string>();
    cfg.sampleRate       = readInteger(k, "sample_rate");
    cfg.windowMs         = readInteger(k, "window_ms");
    cfg.hopMs            = readInteger(k, "hop_ms");
    cfg.inputDeviceIndex = readInteger(k, "input_device_index");
    cfg.threads          = readInteger(k, "threads");

    if (cfg.modelPath.empty()) fail("kws.model_path: empty");
    if (cfg.sampleRate != KWS_SAMPLE_RATE)
        fail("kws.sample_rate: the keyword model only takes " + std::to_string(KWS_SAMPLE_RATE) + " Hz");
    if (cfg.hopMs <= 0 || cfg.windowMs < cfg.hopMs) fail("kws: need 0 < hop_ms <= window_ms");
    if (cfg.threads <= 0) fail("kws.threads: must be positive");

    const json& kws = k.at("keywords");
    if (!kws.is_array() || kws.empty()) fail("kws.keywords: need at least one keyword");

    for (const auto& entry : kws) {
        KeywordSpec spec;
        spec.phrase    = entry.at("phrase").get<std::string>();
        spec.threshold = entry.at("threshold").get<float>();
        if (spec.phrase.empty()) fail("kws.keywords: empty phrase");
        if (spec.threshold < 0.0f || spec.threshold > 1.0f)
            fail("kws.keywords[" + spec.phrase + "].threshold: outside 0.0-1.0");
        cfg.keywords.push_back(spec);
    }
    return cfg;
}

static PipelineConfig parsePipeline(const json& p) {
    PipelineConfig cfg;
    cfg.cooldown         = readMs(p, "cooldown_ms");
    cfg.debounce         = readMs(p, "debounce_ms");
    cfg.pollTimeout      = readMs(p, "poll_timeout_ms");
    cfg.postTriggerDelay = readMs(p, "post_trigger_delay_ms");

    int capacity = readInteger(p, "channel_capacity");
    if (capacity < 1) fail("pipeline.channel_capacity: must be at least 1");
    cfg.channelCapacity = static_cast<std::size_t>(capacity);

    if (cfg.pollTimeout.count() == 0) fail("pipeline.poll_timeout_ms: must be positive");
    return cfg;
}

static AudioAssetConfig parseAudio(const json& a) {
    AudioAssetConfig cfg;
    cfg.volume = readInteger(a, "volume");
    if (cfg.volume < 0 || cfg.volume > 100) fail("audio.volume: outside 0-100");

    for (auto& [key, val] : a.at("events").items()) {
        std::string path = val.get<std::string>();
        if (!path.empty()) cfg.events[key] = path;
    }
    return cfg;
}

static CategoryMapping parseCategories(const json& c) {
    if (!c.is_object()) fail("categories: expected object");

    CategoryMapping mapping;
    for (auto& [label, val] : c.items()) {
        CategoryEntry entry;
        entry.assetPath = val.value("asset", "");
        if (val.contains("phrase_id")) {
            entry.phraseId = readInteger(val, "phrase_id");
            if (entry.phraseId < 1 || entry.phraseId > 255)
                fail("categories[" + label + "].phrase_id: outside 1-255");
        }
        mapping[label] = entry;
    }
    return mapping;
}

// ----------------- entry -----------------
bool parseAssistantConfig(const json& doc, AssistantConfig& out, std::string* err) {
    try {
        AssistantConfig cfg;
        cfg.peripheral = parsePeripheral(doc.at("peripheral"));
        cfg.kws        = parseKws(doc.at("kws"));
        cfg.pipeline   = parsePipeline(doc.at("pipeline"));
        cfg.audio      = parseAudio(doc.at("audio"));
        cfg.categories = parseCategories(doc.at("categories"));

        const json& server = doc.at("server");
        cfg.server.url     = server.at("url").get<std::string>();
        cfg.server.timeout = readMs(server, "timeout_ms");
        if (cfg.server.url.empty()) fail("server.url: empty");
        if (cfg.server.timeout.count() == 0) fail("server.timeout_ms: must be positive");

        const json& camera = doc.at("camera");
        cfg.camera.captureCommand = camera.at("capture_command").get<std::string>();
        cfg.camera.snapshotPath   = camera.at("snapshot_path").get<std::string>();
        if (cfg.camera.snapshotPath.empty()) fail("camera.snapshot_path: empty");

        cfg.readResultRegister = doc.at("diagnostics").value("read_result_register", false);

        out = cfg;
        return true;
    } catch (const std::exception& e) {
        if (err) *err = e.what();
        return false;
    }
}

std::optional<int> phraseIdFor(const CategoryMapping& mapping, const std::string& label) {
    auto it = mapping.find(label);
    if (it == mapping.end() || it->second.phraseId <= 0) return std::nullopt;
    return it->second.phraseId;
}

std::optional<std::string> assetFor(const CategoryMapping& mapping, const std::string& label) {
    auto it = mapping.find(label);
    if (it == mapping.end() || it->second.assetPath.empty()) return std::nullopt;
    return it->second.assetPath;
}
