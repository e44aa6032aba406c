#pragma once

#include <string>
#include <nlohmann/json.hpp>

#include "action_result.hpp"

// ------------------------------------------------------------
// ErrorManager
// ------------------------------------------------------------
namespace ErrorManager {
    // Load error codes from JSON (errors.json)
    bool load(const std::string& path);

    // Replace the catalogue with an already parsed document
    void setCatalogue(const nlohmann::json& doc);

    // Get messages
    std::string getUserMessage(const std::string& code);
    std::string getDebugMessage(const std::string& code);

    // Report an error (logs debug text, returns failed ActionResult)
    ActionResult report(const std::string& code);
    ActionResult report(const std::string& code, const std::string& detail);
}
