#include "voice_speak.hpp"
#include "error_manager.hpp"
#include "logger.hpp"

#include <SFML/Audio.hpp>
#include <algorithm>
#include <chrono>
#include <thread>

namespace Voice {

// Status poll while a sound is playing
constexpr auto PLAYBACK_POLL = std::chrono::milliseconds(20);

// Let the output device flush before the mic is trusted again
constexpr auto PLAYBACK_TAIL = std::chrono::milliseconds(200);

bool SfmlAudioPlayer::play(const std::string& path, int volume) {
    try {
        sf::SoundBuffer buffer;
        if (!buffer.loadFromFile(path)) {
            ErrorManager::report("ERR_PLAYBACK_FAILED", "could not load " + path);
            return false;
        }

        sf::Sound sound(buffer);
        sound.setVolume(static_cast<float>(std::clamp(volume, 0, 100)));

        LOG_DEBUG("Voice/Audio", "Playing: " + path +
            " (duration=" + std::to_string(buffer.getDuration().asSeconds()) + "s)");

        sound.play();
        while (sound.getStatus() == sf::SoundSource::Status::Playing) {
            std::this_thread::sleep_for(PLAYBACK_POLL);
        }
        std::this_thread::sleep_for(PLAYBACK_TAIL);

        LOG_TRACE("Voice/Audio", "Playback finished: " + path);
        return true;
    } catch (const std::exception& e) {
        ErrorManager::report("ERR_PLAYBACK_FAILED", std::string("exception: ") + e.what());
        return false;
    }
}

} // namespace Voice
