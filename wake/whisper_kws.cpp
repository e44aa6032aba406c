#include "whisper_kws.hpp"
#include "resources.hpp"
#include "logger.hpp"

#include <whisper.h>
#include <portaudio.h>
#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstddef>
#include <filesystem>

namespace fs = std::filesystem;

namespace Wake {

// Below this RMS the window is treated as silence and not transcribed
constexpr double SILENCE_RMS = 0.01;

// Upper bound on decoded tokens per window; keywords are short
constexpr int MAX_TOKENS = 32;

// ---------------- Text matching ----------------
static const char* const CJK_PUNCTUATION[] = {
    "\xEF\xBC\x8C",  // ，
    "\xE3\x80\x82",  // 。
    "\xEF\xBC\x81",  // ！
    "\xEF\xBC\x9F",  // ？
    "\xE3\x80\x81",  // 、
    "\xEF\xBC\x9A",  // ：
    "\xEF\xBC\x9B",  // ；
};

std::string normalizeText(const std::string& text) {
    std::string out;
    out.reserve(text.size());

    size_t i = 0;
    while (i < text.size()) {
        unsigned char c = static_cast<unsigned char>(text[i]);

        if (c < 0x80) {
            if (!std::isspace(c) && !std::ispunct(c)) {
                out.push_back(static_cast<char>(std::tolower(c)));
            }
            ++i;
            continue;
        }

        bool skipped = false;
        for (const char* p : CJK_PUNCTUATION) {
            if (text.compare(i, 3, p) == 0) {
                i += 3;
                skipped = true;
                break;
            }
        }
        if (!skipped) {
            out.push_back(text[i]);
            ++i;
        }
    }
    return out;
}

bool containsKeyword(const std::string& transcript, const std::string& keyword) {
    std::string k = normalizeText(keyword);
    if (k.empty()) return false;
    return normalizeText(transcript).find(k) != std::string::npos;
}

std::vector<float> scoreKeywords(const std::string& transcript,
                                 float confidence,
                                 const std::vector<KeywordSpec>& keywords) {
    std::vector<float> probs(keywords.size(), 0.0f);
    const float p = std::clamp(confidence, 0.0f, 1.0f);
    for (size_t i = 0; i < keywords.size(); ++i) {
        if (containsKeyword(transcript, keywords[i].phrase)) probs[i] = p;
    }
    return probs;
}

// ---------------- Silence Detection ----------------
static bool isSilence(const std::vector<float>& pcm) {
    if (pcm.empty()) return true;

    double energy = 0.0;
    for (float s : pcm) energy += static_cast<double>(s) * s;
    energy /= pcm.size();

    return std::sqrt(energy) < SILENCE_RMS;
}

// ---------------- Engine ----------------
WhisperKeywordEngine::WhisperKeywordEngine(const KwsConfig& cfg)
    : cfg_(cfg) {
    for (const auto& k : cfg_.keywords) {
        if (!prompt_.empty()) prompt_ += " ";
        prompt_ += k.phrase;
    }
}

WhisperKeywordEngine::~WhisperKeywordEngine() {
    shutdown();
}

bool WhisperKeywordEngine::loadModel(std::string* err) {
    fs::path modelPath = cfg_.modelPath;
    if (modelPath.is_relative()) {
        modelPath = fs::path(getResourcePath()) / modelPath;
    }

    LOG_DEBUG("KWS", "Looking for Whisper model at: " + modelPath.string());
    if (!fs::exists(modelPath)) {
        if (err) *err = "model missing: " + modelPath.string();
        return false;
    }

    whisper_context_params wparams = whisper_context_default_params();
    ctx_ = whisper_init_from_file_with_params(modelPath.string().c_str(), wparams);
    if (!ctx_) {
        if (err) *err = "failed to load model: " + modelPath.string();
        return false;
    }

    LOG_DEBUG("KWS", "Whisper model loaded: " + modelPath.filename().string());
    return true;
}

bool WhisperKeywordEngine::openInput(std::string* err) {
    PaError pa = Pa_Initialize();
    if (pa != paNoError) {
        if (err) *err = std::string("PortAudio init: ") + Pa_GetErrorText(pa);
        return false;
    }
    paInitialized_ = true;

    int deviceIndex = (cfg_.inputDeviceIndex >= 0) ? cfg_.inputDeviceIndex
                                                   : Pa_GetDefaultInputDevice();
    if (deviceIndex == paNoDevice || deviceIndex < 0 || deviceIndex >= Pa_GetDeviceCount()) {
        if (err) *err = "no valid input device";
        return false;
    }

    const PaDeviceInfo* devInfo = Pa_GetDeviceInfo(deviceIndex);

    PaStreamParameters inputParams;
    inputParams.device = deviceIndex;
    inputParams.channelCount = 1;
    inputParams.sampleFormat = paFloat32;
    inputParams.suggestedLatency = devInfo->defaultLowInputLatency;
    inputParams.hostApiSpecificStreamInfo = nullptr;

    const unsigned long hopSamples =
        static_cast<unsigned long>(cfg_.sampleRate) * cfg_.hopMs / 1000;

    // No callback: the producer thread pulls with Pa_ReadStream
    pa = Pa_OpenStream(&stream_, &inputParams, nullptr, cfg_.sampleRate,
                       hopSamples, paNoFlag, nullptr, nullptr);
    if (pa != paNoError || !stream_) {
        if (err) *err = std::string("could not open mic stream: ") + Pa_GetErrorText(pa);
        stream_ = nullptr;
        return false;
    }

    pa = Pa_StartStream(stream_);
    if (pa != paNoError) {
        if (err) *err = std::string("could not start mic stream: ") + Pa_GetErrorText(pa);
        return false;
    }

    hop_.assign(hopSamples, 0.0f);
    window_.clear();

    LOG_DEBUG("KWS", std::string("Mic open: ") + devInfo->name +
                     " @ " + std::to_string(cfg_.sampleRate) + " Hz");
    return true;
}

bool WhisperKeywordEngine::init(const ProbabilityCallback& callback, std::string* err) {
    callback_ = callback;

    if (!loadModel(err) || !openInput(err)) {
        shutdown();
        return false;
    }
    return true;
}

bool WhisperKeywordEngine::transcribe(std::string& text, float& confidence) {
    whisper_full_params params = whisper_full_default_params(WHISPER_SAMPLING_GREEDY);
    params.n_threads        = cfg_.threads;
    params.language         = cfg_.language.c_str();
    params.no_timestamps    = true;
    params.single_segment   = true;
    params.print_progress   = false;
    params.print_realtime   = false;
    params.print_special    = false;
    params.print_timestamps = false;
    params.max_tokens       = MAX_TOKENS;
    params.initial_prompt   = prompt_.c_str();

    if (whisper_full(ctx_, params, window_.data(), static_cast<int>(window_.size())) != 0) {
        return false;
    }

    text.clear();
    double pSum = 0.0;
    int pCount = 0;
    const whisper_token eot = whisper_token_eot(ctx_);

    int segments = whisper_full_n_segments(ctx_);
    for (int i = 0; i < segments; ++i) {
        text += whisper_full_get_segment_text(ctx_, i);

        int tokens = whisper_full_n_tokens(ctx_, i);
        for (int j = 0; j < tokens; ++j) {
            if (whisper_full_get_token_id(ctx_, i, j) >= eot) continue;  // special tokens
            pSum += whisper_full_get_token_p(ctx_, i, j);
            ++pCount;
        }
    }

    confidence = pCount > 0 ? static_cast<float>(pSum / pCount) : 0.0f;
    return true;
}

int WhisperKeywordEngine::run() {
    if (!stream_ || !ctx_) return -1;

    PaError pa = Pa_ReadStream(stream_, hop_.data(), hop_.size());
    if (pa == paInputOverflowed) {
        LOG_ERROR("KWS", "Input overflowed, audio dropped");
        return -1;
    }
    if (pa != paNoError) {
        LOG_ERROR("KWS", std::string("Pa_ReadStream: ") + Pa_GetErrorText(pa));
        return -1;
    }

    const size_t windowSamples = static_cast<size_t>(cfg_.sampleRate) * cfg_.windowMs / 1000;
    window_.insert(window_.end(), hop_.begin(), hop_.end());
    if (window_.size() > windowSamples) {
        window_.erase(window_.begin(),
                      window_.end() - static_cast<std::ptrdiff_t>(windowSamples));
    }

    const int consumed = static_cast<int>(hop_.size());
    if (window_.size() < windowSamples) return consumed;   // still filling

    if (isSilence(window_)) {
        if (callback_) callback_(std::vector<float>(cfg_.keywords.size(), 0.0f));
        return consumed;
    }

    std::string text;
    float confidence = 0.0f;
    if (!transcribe(text, confidence)) {
        LOG_ERROR("KWS", "whisper_full() failed");
        return -1;
    }

    if (!text.empty()) LOG_TRACE("KWS", "Heard: " + text);
    if (callback_) callback_(scoreKeywords(text, confidence, cfg_.keywords));
    return consumed;
}

void WhisperKeywordEngine::shutdown() {
    if (stream_) {
        PaError pa = Pa_StopStream(stream_);
        if (pa != paNoError) LOG_ERROR("KWS", std::string("Pa_StopStream: ") + Pa_GetErrorText(pa));
        pa = Pa_CloseStream(stream_);
        if (pa != paNoError) LOG_ERROR("KWS", std::string("Pa_CloseStream: ") + Pa_GetErrorText(pa));
        stream_ = nullptr;
    }
    if (paInitialized_) {
        Pa_Terminate();
        paInitialized_ = false;
    }
    if (ctx_) {
        whisper_free(ctx_);
        ctx_ = nullptr;
    }
}

} // namespace Wake
