#pragma once
#include <string>

namespace Voice {

/// AudioPlayer
/// Plays one WAV file to completion.
class AudioPlayer {
public:
    virtual ~AudioPlayer() = default;

    /// volume 0-100. Returns false if the file could not be loaded or played.
    virtual bool play(const std::string& path, int volume) = 0;
};

/// SfmlAudioPlayer
/// SFML Audio backend; blocks the calling thread until playback ends.
class SfmlAudioPlayer : public AudioPlayer {
public:
    bool play(const std::string& path, int volume) override;
};

} // namespace Voice
