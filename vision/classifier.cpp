#include "classifier.hpp"
#include "error_manager.hpp"
#include "logger.hpp"

#include <cpr/cpr.h>
#include <nlohmann/json.hpp>
#include <filesystem>

namespace Vision {

std::optional<std::string> parseCategoryResponse(long status,
                                                 const std::string& body,
                                                 std::string* err) {
    if (status < 200 || status >= 300) {
        if (err) *err = "HTTP status " + std::to_string(status);
        return std::nullopt;
    }

    auto j = nlohmann::json::parse(body, nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
        if (err) *err = "response is not a JSON object";
        return std::nullopt;
    }

    auto it = j.find("category");
    if (it == j.end() || !it->is_string()) {
        if (err) *err = "response has no string 'category'";
        return std::nullopt;
    }

    std::string category = it->get<std::string>();
    if (category.empty()) {
        if (err) *err = "empty 'category'";
        return std::nullopt;
    }
    return category;
}

HttpClassifier::HttpClassifier(const ServerConfig& cfg)
    : cfg_(cfg) {}

std::optional<std::string> HttpClassifier::classify(const std::string& imagePath) {
    std::error_code ec;
    if (!std::filesystem::exists(imagePath, ec)) {
        ErrorManager::report("ERR_CLASSIFY_FAILED", "image missing: " + imagePath);
        return std::nullopt;
    }

    LOG_DEBUG("Server", "Uploading " + imagePath + " to " + cfg_.url);

    try {
        auto resp = cpr::Post(
            cpr::Url{ cfg_.url },
            cpr::Multipart{ { "file", cpr::File{ imagePath } } },
            cpr::Timeout{ cfg_.timeout }
        );

        if (resp.error.code != cpr::ErrorCode::OK) {
            ErrorManager::report("ERR_CLASSIFY_FAILED", "transport: " + resp.error.message);
            return std::nullopt;
        }

        std::string why;
        auto category = parseCategoryResponse(resp.status_code, resp.text, &why);
        if (!category) {
            ErrorManager::report("ERR_CLASSIFY_FAILED", why);
            return std::nullopt;
        }

        LOG_DEBUG("Server", "Category: " + *category);
        return category;
    } catch (const std::exception& e) {
        ErrorManager::report("ERR_CLASSIFY_FAILED", std::string("exception: ") + e.what());
        return std::nullopt;
    }
}

} // namespace Vision
