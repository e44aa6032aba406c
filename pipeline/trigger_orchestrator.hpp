#pragma once
#include <atomic>
#include <cstddef>
#include <functional>
#include <optional>
#include <string>

#include "config/assistant_config.hpp"
#include "device_setups/actuator.hpp"
#include "vision/camera.hpp"
#include "vision/classifier.hpp"
#include "voice/audio_responder.hpp"
#include "wake/event_channel.hpp"
#include "wake/keyword_producer.hpp"
#include "wake/wake.hpp"

namespace Pipeline {

enum class TriggerState {
    Idle,
    Capturing,
    Classifying,
    Announcing,
    Cooldown
};

enum class CycleOutcome {
    Announced,
    CaptureFailed,
    ClassifyFailed,
    AnnounceFailed
};

const char* toString(TriggerState state);
const char* toString(CycleOutcome outcome);

struct CycleReport {
    CycleOutcome outcome = CycleOutcome::Announced;
    std::optional<std::string> category;
};

/// TriggerOrchestrator
/// Single consumer of the detection channel. Sequences
/// capture -> classify -> announce for one event at a time and enforces
/// the cooldown between cycles.
class TriggerOrchestrator {
public:
    using NowFn = std::function<Wake::Clock::time_point()>;
    using StateListener = std::function<void(TriggerState from, TriggerState to)>;

    TriggerOrchestrator(const PipelineConfig& cfg,
                        Wake::EventChannel<Wake::DetectionEvent>& channel,
                        Wake::DetectionGate& gate,
                        Vision::Camera& camera,
                        Vision::Classifier& classifier,
                        Voice::AudioResponder& responder,
                        NowFn now = [] { return Wake::Clock::now(); });

    void setStateListener(StateListener listener) { listener_ = std::move(listener); }

    /// Read the advisory result register at each cycle start (log only).
    void setDiagnostics(Echo::Actuator* actuator) { diagnostics_ = actuator; }

    /// Loop until exitFlag is set; each iteration waits at most pollTimeout.
    void run(const std::atomic<bool>& exitFlag);

    /// One consumer iteration. Returns a report if a cycle ran.
    std::optional<CycleReport> step();

    TriggerState state() const { return state_; }
    std::size_t cyclesStarted() const { return cycles_; }
    std::size_t eventsDiscarded() const { return discarded_; }

private:
    CycleReport runCycle(const Wake::DetectionEvent& ev);
    void finishCycle(TriggerState next);
    void transition(TriggerState next);
    bool inCooldown(Wake::Clock::time_point t) const;

    const PipelineConfig& cfg_;
    Wake::EventChannel<Wake::DetectionEvent>& channel_;
    Wake::DetectionGate& gate_;
    Vision::Camera& camera_;
    Vision::Classifier& classifier_;
    Voice::AudioResponder& responder_;
    NowFn now_;

    StateListener listener_;
    Echo::Actuator* diagnostics_ = nullptr;

    TriggerState state_ = TriggerState::Idle;
    bool hasTriggered_ = false;
    Wake::Clock::time_point lastTrigger_{};
    std::size_t cycles_ = 0;
    std::size_t discarded_ = 0;
};

} // namespace Pipeline
