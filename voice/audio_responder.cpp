#include "audio_responder.hpp"
#include "error_manager.hpp"
#include "logger.hpp"

namespace Voice {

AudioResponder::AudioResponder(const CategoryMapping& categories,
                               const AudioAssetConfig& assets,
                               AudioPlayer& player,
                               Echo::Actuator* actuator)
    : categories_(categories), assets_(assets), player_(player), actuator_(actuator) {}

ActionResult AudioResponder::announceCategory(const std::string& category) {
    if (auto asset = assetFor(categories_, category)) {
        if (player_.play(*asset, assets_.volume)) {
            return okResult("Announced '" + category + "' from " + *asset);
        }
        LOG_ERROR("Responder", "Asset playback failed for '" + category + "', trying peripheral");
    }

    auto phraseId = phraseIdFor(categories_, category);
    if (!phraseId) {
        return ErrorManager::report("ERR_ANNOUNCE_FAILED", "no asset or phrase id for '" + category + "'");
    }

    if (!actuator_) {
        return ErrorManager::report("ERR_ANNOUNCE_FAILED", "no peripheral for phrase " + std::to_string(*phraseId));
    }

    if (!actuator_->speak(Echo::CommandType::Announcement, static_cast<std::uint8_t>(*phraseId))) {
        return ErrorManager::report("ERR_ANNOUNCE_FAILED", "speak(0xFF, " + std::to_string(*phraseId) + ")");
    }

    return okResult("Announced '" + category + "' as phrase " + std::to_string(*phraseId));
}

bool AudioResponder::respond(const std::string& eventKey) {
    auto it = assets_.events.find(eventKey);
    if (it == assets_.events.end() || it->second.empty()) {
        LOG_TRACE("Responder", "No asset for event '" + eventKey + "'");
        return false;
    }
    return player_.play(it->second, assets_.volume);
}

ActionResult AudioResponder::announceError() {
    if (respond(EVENT_NETWORK_ERROR)) {
        return okResult("Played classification error prompt");
    }
    // Nothing audible; the log line is the signal
    return ErrorManager::report("ERR_PLAYBACK_FAILED", "no '" + std::string(EVENT_NETWORK_ERROR) + "' prompt played");
}

} // namespace Voice
