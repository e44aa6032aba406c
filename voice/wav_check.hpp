#pragma once
#include <string>

namespace Voice {
    struct WavFormat {
        int channels = 0;
        int sampleRate = 0;
        int bitsPerSample = 0;
        int audioFormat = 0;   // 1 = PCM
    };

    // Parse the fmt chunk of a RIFF/WAVE file. False if unreadable or not RIFF/WAVE.
    bool readWavFormat(const std::string& path, WavFormat& out, std::string* err = nullptr);

    // True only for mono, 16 kHz, 16-bit PCM
    bool isPlayableAsset(const std::string& path, std::string* err = nullptr);
}
