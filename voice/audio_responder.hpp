#pragma once
#include <string>

#include "action_result.hpp"
#include "config/assistant_config.hpp"
#include "device_setups/actuator.hpp"
#include "voice_speak.hpp"

namespace Voice {

// System event keys played around a trigger cycle
inline constexpr const char* EVENT_PHOTO_ACK     = "photo_ack";
inline constexpr const char* EVENT_RESULT_PREFIX = "result_prefix";
inline constexpr const char* EVENT_CAPTURE_ERROR = "capture_error";
inline constexpr const char* EVENT_NETWORK_ERROR = "network_error";

/// AudioResponder
/// Speaks results: a pre-recorded asset when one is configured, otherwise
/// an announcement phrase on the peripheral.
class AudioResponder {
public:
    AudioResponder(const CategoryMapping& categories,
                   const AudioAssetConfig& assets,
                   AudioPlayer& player,
                   Echo::Actuator* actuator);

    /// Asset for category, else speak(Announcement, phraseId), else failure.
    ActionResult announceCategory(const std::string& category);

    /// Play a system event asset if configured. No actuator fallback.
    /// Returns true only if something was played.
    bool respond(const std::string& eventKey);

    /// Audible signal for "no category". Never touches the actuator.
    ActionResult announceError();

private:
    const CategoryMapping& categories_;
    const AudioAssetConfig& assets_;
    AudioPlayer& player_;
    Echo::Actuator* actuator_;   // may be null (no peripheral)
};

} // namespace Voice
