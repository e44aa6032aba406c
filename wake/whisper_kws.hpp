#pragma once
#include <string>
#include <vector>

#include "config/assistant_config.hpp"
#include "keyword_engine.hpp"

struct whisper_context;
typedef void PaStream;

namespace Wake {

// Lowercase ASCII, strip whitespace and ASCII/CJK punctuation
std::string normalizeText(const std::string& text);

// True when the normalized keyword occurs in the normalized transcript
bool containsKeyword(const std::string& transcript, const std::string& keyword);

// One probability per keyword: confidence if present in transcript, else 0
std::vector<float> scoreKeywords(const std::string& transcript,
                                 float confidence,
                                 const std::vector<KeywordSpec>& keywords);

/// WhisperKeywordEngine
/// Keyword spotting on a sliding window of microphone audio.
/// Audio comes from a PortAudio blocking input stream; each hop re-runs
/// whisper over the window and scores the transcript against the keywords.
class WhisperKeywordEngine : public KeywordEngine {
public:
    explicit WhisperKeywordEngine(const KwsConfig& cfg);
    ~WhisperKeywordEngine() override;

    WhisperKeywordEngine(const WhisperKeywordEngine&) = delete;
    WhisperKeywordEngine& operator=(const WhisperKeywordEngine&) = delete;

    bool init(const ProbabilityCallback& callback, std::string* err) override;
    int run() override;
    void shutdown() override;

private:
    bool loadModel(std::string* err);
    bool openInput(std::string* err);
    bool transcribe(std::string& text, float& confidence);

    const KwsConfig& cfg_;
    ProbabilityCallback callback_;

    whisper_context* ctx_ = nullptr;
    PaStream* stream_ = nullptr;
    bool paInitialized_ = false;

    std::string prompt_;          // keywords joined, biases decoding
    std::vector<float> hop_;      // one read
    std::vector<float> window_;   // most recent windowMs of audio
};

} // namespace Wake
