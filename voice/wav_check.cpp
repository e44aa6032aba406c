#include "wav_check.hpp"

#include <array>
#include <cstdint>
#include <cstring>
#include <fstream>

namespace Voice {

static std::uint32_t le32(const unsigned char* p) {
    return static_cast<std::uint32_t>(p[0]) |
           (static_cast<std::uint32_t>(p[1]) << 8) |
           (static_cast<std::uint32_t>(p[2]) << 16) |
           (static_cast<std::uint32_t>(p[3]) << 24);
}

static std::uint16_t le16(const unsigned char* p) {
    return static_cast<std::uint16_t>(p[0] | (p[1] << 8));
}

bool readWavFormat(const std::string& path, WavFormat& out, std::string* err) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        if (err) *err = "cannot open " + path;
        return false;
    }

    std::array<unsigned char, 12> riff{};
    if (!in.read(reinterpret_cast<char*>(riff.data()), riff.size())) {
        if (err) *err = "file too small";
        return false;
    }
    if (std::memcmp(riff.data(), "RIFF", 4) != 0 ||
        std::memcmp(riff.data() + 8, "WAVE", 4) != 0) {
        if (err) *err = "not a RIFF/WAVE file";
        return false;
    }

    // Walk chunks until "fmt "; LIST/JUNK chunks may precede it
    std::array<unsigned char, 8> header{};
    while (in.read(reinterpret_cast<char*>(header.data()), header.size())) {
        std::uint32_t size = le32(header.data() + 4);

        if (std::memcmp(header.data(), "fmt ", 4) == 0) {
            if (size < 16) {
                if (err) *err = "fmt chunk too short";
                return false;
            }
            std::array<unsigned char, 16> fmt{};
            if (!in.read(reinterpret_cast<char*>(fmt.data()), fmt.size())) {
                if (err) *err = "truncated fmt chunk";
                return false;
            }
            out.audioFormat   = le16(fmt.data());
            out.channels      = le16(fmt.data() + 2);
            out.sampleRate    = static_cast<int>(le32(fmt.data() + 4));
            out.bitsPerSample = le16(fmt.data() + 14);
            return true;
        }

        // Chunks are word aligned
        in.seekg(static_cast<std::streamoff>(size + (size & 1u)), std::ios::cur);
    }

    if (err) *err = "no fmt chunk";
    return false;
}

bool isPlayableAsset(const std::string& path, std::string* err) {
    WavFormat fmt;
    if (!readWavFormat(path, fmt, err)) return false;

    std::string issues;
    if (fmt.audioFormat != 1)    issues += " format=" + std::to_string(fmt.audioFormat) + " (need PCM)";
    if (fmt.channels != 1)       issues += " channels=" + std::to_string(fmt.channels) + " (need 1)";
    if (fmt.sampleRate != 16000) issues += " rate=" + std::to_string(fmt.sampleRate) + " (need 16000)";
    if (fmt.bitsPerSample != 16) issues += " bits=" + std::to_string(fmt.bitsPerSample) + " (need 16)";

    if (!issues.empty()) {
        if (err) *err = path + ":" + issues;
        return false;
    }
    return true;
}

} // namespace Voice
