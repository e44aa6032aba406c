#pragma once
#include <atomic>
#include <cstddef>
#include <string>
#include <thread>
#include <vector>

#include "config/assistant_config.hpp"
#include "event_channel.hpp"
#include "keyword_engine.hpp"
#include "wake.hpp"

namespace Wake {

/// DetectionGate
/// Advisory suppression of detection while the device itself is talking.
class DetectionGate {
public:
    virtual ~DetectionGate() = default;
    virtual void pause() = 0;
    virtual void resume() = 0;
};

/// KeywordProducer
/// Runs the inference loop on its own thread so the engine's audio buffer
/// is always drained, and turns threshold crossings into DetectionEvents.
class KeywordProducer : public DetectionGate {
public:
    KeywordProducer(KeywordEngine& engine,
                    const KwsConfig& kws,
                    const PipelineConfig& pipeline,
                    EventChannel<DetectionEvent>& channel,
                    const std::atomic<bool>& exitFlag);
    ~KeywordProducer() override;

    KeywordProducer(const KeywordProducer&) = delete;
    KeywordProducer& operator=(const KeywordProducer&) = delete;

    /// Initialize the engine and launch the loop. False is fatal.
    bool start(std::string* err = nullptr);

    /// Stop the loop and join the thread.
    void stop();

    /// Loop body; returns once exit is requested or stop() is called.
    void run();

    /// Engine callback. Its only side effect is a non-blocking push.
    void onProbabilities(const std::vector<float>& probabilities);

    // Discards queued events, then suppresses new ones
    void pause() override;
    // Discards anything that slipped in, then re-enables detection
    void resume() override;

    bool isPaused() const { return paused_.load(); }
    std::size_t failedSteps() const { return failedSteps_.load(); }

private:
    KeywordEngine& engine_;
    const KwsConfig& kws_;
    const PipelineConfig& pipeline_;
    EventChannel<DetectionEvent>& channel_;
    const std::atomic<bool>& exitFlag_;

    std::atomic<bool> paused_{false};
    std::atomic<bool> running_{false};
    std::atomic<std::size_t> failedSteps_{0};
    std::thread thread_;

    // Producer thread only
    std::vector<Clock::time_point> lastEmit_;
    std::vector<bool> emitted_;
};

} // namespace Wake
