#pragma once
#include <optional>
#include <string>

#include "config/assistant_config.hpp"

namespace Vision {

/// Classifier
/// "POST an image, receive a category label." nullopt on any failure.
class Classifier {
public:
    virtual ~Classifier() = default;
    virtual std::optional<std::string> classify(const std::string& imagePath) = 0;
};

// 2xx status + JSON object with a string "category" -> label
std::optional<std::string> parseCategoryResponse(long status,
                                                 const std::string& body,
                                                 std::string* err = nullptr);

/// HttpClassifier
/// Multipart upload (field "file") to the classification endpoint.
/// One attempt per call.
class HttpClassifier : public Classifier {
public:
    explicit HttpClassifier(const ServerConfig& cfg);

    std::optional<std::string> classify(const std::string& imagePath) override;

private:
    const ServerConfig& cfg_;
};

} // namespace Vision
