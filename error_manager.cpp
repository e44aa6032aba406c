#include "error_manager.hpp"
#include "logger.hpp"

#include <fstream>
#include <filesystem>
#include <mutex>

namespace ErrorManager {

// Written during bootstrap, read from both pipeline threads afterwards
static nlohmann::json g_root = nlohmann::json::object();
static std::mutex g_rootMutex;

void setCatalogue(const nlohmann::json& doc) {
    std::lock_guard<std::mutex> lock(g_rootMutex);
    if (doc.contains("errors") && doc["errors"].is_object()) {
        g_root = doc["errors"];
    } else if (doc.is_object()) {
        g_root = doc;
    } else {
        g_root = nlohmann::json::object();
    }
}

bool load(const std::string& path) {
    namespace fs = std::filesystem;

    std::ifstream in(path);
    if (!in) {
        LOG_ERROR("ErrorManager", "Could not open " + path);
        return false;
    }

    try {
        nlohmann::json doc;
        in >> doc;
        setCatalogue(doc);
        LOG_DEBUG("ErrorManager", "Loaded error catalogue from: " +
                                  fs::absolute(path).string());
        return true;
    } catch (const std::exception& e) {
        LOG_ERROR("ErrorManager", "Failed to parse " + path + " -> " + e.what());
        return false;
    }
}

std::string getUserMessage(const std::string& code) {
    std::lock_guard<std::mutex> lock(g_rootMutex);
    if (g_root.contains(code) && g_root[code].contains("user") &&
        g_root[code]["user"].is_string()) {
        return g_root[code]["user"].get<std::string>();
    }
    return "[Error] Unknown error code: " + code;
}

std::string getDebugMessage(const std::string& code) {
    std::lock_guard<std::mutex> lock(g_rootMutex);
    if (g_root.contains(code) && g_root[code].contains("debug") &&
        g_root[code]["debug"].is_string()) {
        return g_root[code]["debug"].get<std::string>();
    }
    return "[Debug] No debug message for code: " + code;
}

ActionResult report(const std::string& code) {
    return report(code, "");
}

ActionResult report(const std::string& code, const std::string& detail) {
    ActionResult result;
    result.success   = false;
    result.message   = getUserMessage(code);
    result.errorCode = code;

    std::string line = code + " -> " + getDebugMessage(code);
    if (!detail.empty()) line += " (" + detail + ")";
    LOG_ERROR("ErrorManager", line);
    return result;
}

} // namespace ErrorManager
