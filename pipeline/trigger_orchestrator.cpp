#include "trigger_orchestrator.hpp"
#include "logger.hpp"

#include <thread>

namespace Pipeline {

const char* toString(TriggerState state) {
    switch (state) {
        case TriggerState::Idle:        return "Idle";
        case TriggerState::Capturing:   return "Capturing";
        case TriggerState::Classifying: return "Classifying";
        case TriggerState::Announcing:  return "Announcing";
        case TriggerState::Cooldown:    return "Cooldown";
    }
    return "Unknown";
}

const char* toString(CycleOutcome outcome) {
    switch (outcome) {
        case CycleOutcome::Announced:      return "announced";
        case CycleOutcome::CaptureFailed:  return "capture failed";
        case CycleOutcome::ClassifyFailed: return "classification failed";
        case CycleOutcome::AnnounceFailed: return "announcement failed";
    }
    return "unknown";
}

TriggerOrchestrator::TriggerOrchestrator(const PipelineConfig& cfg,
                                         Wake::EventChannel<Wake::DetectionEvent>& channel,
                                         Wake::DetectionGate& gate,
                                         Vision::Camera& camera,
                                         Vision::Classifier& classifier,
                                         Voice::AudioResponder& responder,
                                         NowFn now)
    : cfg_(cfg),
      channel_(channel),
      gate_(gate),
      camera_(camera),
      classifier_(classifier),
      responder_(responder),
      now_(std::move(now)) {}

// =========================================================
// Consumer loop
// =========================================================
void TriggerOrchestrator::run(const std::atomic<bool>& exitFlag) {
    LOG_PHASE("Trigger loop started", true);

    while (!exitFlag.load()) {
        auto report = step();
        if (!report) continue;

        std::string line = std::string("Cycle finished: ") + toString(report->outcome);
        if (report->category) line += " (" + *report->category + ")";
        if (report->outcome == CycleOutcome::Announced) {
            LOG_DEBUG("Assistant", line);
        } else {
            LOG_ERROR("Assistant", line);
        }
        LOG_DEBUG("Assistant", "Listening for keywords...");
    }

    LOG_PHASE("Trigger loop stopped", true);
}

std::optional<CycleReport> TriggerOrchestrator::step() {
    auto ev = channel_.popFor(cfg_.pollTimeout);

    if (state_ == TriggerState::Cooldown && !inCooldown(now_())) {
        transition(TriggerState::Idle);
    }

    if (!ev) return std::nullopt;

    // Only the earliest queued event counts; at most one trigger per cycle
    std::size_t extra = channel_.drain();
    if (extra > 0) {
        discarded_ += extra;
        LOG_TRACE("Assistant", "Dropped " + std::to_string(extra) + " queued event(s)");
    }

    if (state_ != TriggerState::Idle || inCooldown(ev->timestamp)) {
        ++discarded_;
        LOG_TRACE("Assistant", "Event for keyword " + std::to_string(ev->keywordIndex) +
                               " ignored (cooldown)");
        return std::nullopt;
    }

    return runCycle(*ev);
}

// =========================================================
// One trigger cycle
// =========================================================
CycleReport TriggerOrchestrator::runCycle(const Wake::DetectionEvent& ev) {
    ++cycles_;
    LOG_DEBUG("Assistant", "Keyword " + std::to_string(ev.keywordIndex) + " detected, capturing...");

    transition(TriggerState::Capturing);

    // Keep our own voice output from re-triggering
    gate_.pause();

    if (diagnostics_) {
        auto reg = diagnostics_->readResult();
        LOG_TRACE("Assistant", "Result register (advisory): " +
                               (reg ? std::to_string(*reg) : std::string("unreadable")));
    }

    if (cfg_.postTriggerDelay.count() > 0) {
        std::this_thread::sleep_for(cfg_.postTriggerDelay);
    }

    responder_.respond(Voice::EVENT_PHOTO_ACK);

    auto image = camera_.captureImage();
    if (!image) {
        responder_.respond(Voice::EVENT_CAPTURE_ERROR);
        finishCycle(TriggerState::Idle);
        LOG_PHASE("Trigger cycle", false);
        return { CycleOutcome::CaptureFailed, std::nullopt };
    }

    transition(TriggerState::Classifying);
    auto category = classifier_.classify(*image);

    transition(TriggerState::Announcing);

    CycleReport report;
    if (category) {
        LOG_DEBUG("Assistant", "Classification result: " + *category);
        responder_.respond(Voice::EVENT_RESULT_PREFIX);

        ActionResult res = responder_.announceCategory(*category);
        report.outcome  = res.success ? CycleOutcome::Announced : CycleOutcome::AnnounceFailed;
        report.category = category;
    } else {
        responder_.announceError();
        report.outcome = CycleOutcome::ClassifyFailed;
    }

    finishCycle(TriggerState::Cooldown);
    LOG_PHASE("Trigger cycle", report.outcome == CycleOutcome::Announced);
    return report;
}

void TriggerOrchestrator::finishCycle(TriggerState next) {
    gate_.resume();
    lastTrigger_  = now_();
    hasTriggered_ = true;
    transition(next);
}

void TriggerOrchestrator::transition(TriggerState next) {
    TriggerState prev = state_;
    state_ = next;

    LOG_TRACE("Assistant", std::string("State ") + toString(prev) + " -> " + toString(next));
    if (listener_) listener_(prev, next);
}

bool TriggerOrchestrator::inCooldown(Wake::Clock::time_point t) const {
    return hasTriggered_ && (t - lastTrigger_) < cfg_.cooldown;
}

} // namespace Pipeline
