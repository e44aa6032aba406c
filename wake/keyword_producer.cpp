#include "keyword_producer.hpp"
#include "error_manager.hpp"
#include "logger.hpp"

#include <algorithm>
#include <chrono>
#include <iomanip>
#include <sstream>

namespace Wake {

// Probabilities above this are worth a trace line even below threshold
constexpr float DEBUG_PROBABILITY_FLOOR = 0.05f;

// Back-off after a failed inference step
constexpr auto STEP_ERROR_BACKOFF = std::chrono::milliseconds(100);

KeywordProducer::KeywordProducer(KeywordEngine& engine,
                                 const KwsConfig& kws,
                                 const PipelineConfig& pipeline,
                                 EventChannel<DetectionEvent>& channel,
                                 const std::atomic<bool>& exitFlag)
    : engine_(engine),
      kws_(kws),
      pipeline_(pipeline),
      channel_(channel),
      exitFlag_(exitFlag),
      lastEmit_(kws.keywords.size()),
      emitted_(kws.keywords.size(), false) {}

KeywordProducer::~KeywordProducer() {
    stop();
}

bool KeywordProducer::start(std::string* err) {
    if (running_.load()) return true;

    std::string initErr;
    bool ok = engine_.init([this](const std::vector<float>& p) { onProbabilities(p); }, &initErr);
    if (!ok) {
        ErrorManager::report("ERR_KWS_INIT", initErr);
        LOG_PHASE("Keyword engine init", false);
        if (err) *err = initErr;
        return false;
    }
    LOG_PHASE("Keyword engine init", true);

    running_.store(true);
    thread_ = std::thread([this] { run(); });

    std::string list;
    for (const auto& k : kws_.keywords) {
        if (!list.empty()) list += ", ";
        list += "'" + k.phrase + "'";
    }
    LOG_DEBUG("KWS", "Listening for: " + list);
    return true;
}

void KeywordProducer::stop() {
    running_.store(false);
    if (thread_.joinable()) {
        thread_.join();
        engine_.shutdown();
        LOG_PHASE("Keyword producer stopped", true);
    }
}

void KeywordProducer::run() {
    LOG_TRACE("KWS", "Producer loop started");

    while (running_.load() && !exitFlag_.load()) {
        int frames = engine_.run();
        if (frames < 0) {
            // One bad step is skipped; the next call drains the buffer again
            failedSteps_.fetch_add(1);
            ErrorManager::report("ERR_KWS_STEP", std::to_string(failedSteps_.load()) + " total");
            std::this_thread::sleep_for(STEP_ERROR_BACKOFF);
        }
    }

    LOG_TRACE("KWS", "Producer loop stopped");
}

void KeywordProducer::onProbabilities(const std::vector<float>& probabilities) {
    const std::size_t n = std::min(probabilities.size(), kws_.keywords.size());
    const auto now = Clock::now();

    for (std::size_t i = 0; i < n; ++i) {
        const float p = probabilities[i];
        const float threshold = kws_.keywords[i].threshold;

        if (p > DEBUG_PROBABILITY_FLOOR) {
            std::ostringstream oss;
            oss << std::fixed << std::setprecision(3)
                << "'" << kws_.keywords[i].phrase << "' p=" << p
                << " (threshold " << threshold << ")"
                << (p > threshold ? " TRIGGER" : "");
            LOG_TRACE("KWS", oss.str());
        }

        if (p <= threshold || paused_.load()) continue;

        // Consecutive inference steps over one utterance cross together
        if (emitted_[i] && now - lastEmit_[i] < pipeline_.debounce) continue;

        lastEmit_[i] = now;
        emitted_[i] = true;

        if (!channel_.tryPush({ i, now })) {
            LOG_TRACE("KWS", "Channel full, dropped detection for keyword " + std::to_string(i));
        }
    }
}

void KeywordProducer::pause() {
    paused_.store(true);
    std::size_t n = channel_.drain();
    if (n > 0) LOG_TRACE("KWS", "Pause discarded " + std::to_string(n) + " queued event(s)");
}

void KeywordProducer::resume() {
    std::size_t n = channel_.drain();
    if (n > 0) LOG_TRACE("KWS", "Resume discarded " + std::to_string(n) + " stale event(s)");
    paused_.store(false);
}

} // namespace Wake
