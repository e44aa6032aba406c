#include <gtest/gtest.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <thread>
#include <utility>
#include <vector>

#include "device_setups/actuator.hpp"
#include "fakes.hpp"
#include "pipeline/trigger_orchestrator.hpp"
#include "voice/audio_responder.hpp"
#include "wake/event_channel.hpp"
#include "wake/keyword_producer.hpp"

using namespace std::chrono_literals;
using Pipeline::CycleOutcome;
using Pipeline::TriggerOrchestrator;
using Pipeline::TriggerState;
using Wake::Clock;
using Wake::DetectionEvent;

namespace {

constexpr const char* NETWORK_ERROR_WAV = "/assets/network_error.wav";
constexpr const char* CAPTURE_ERROR_WAV = "/assets/capture_error.wav";

class TriggerOrchestratorTest : public ::testing::Test {
protected:
    TriggerOrchestratorTest()
        : channel(10),
          actuator(bus),
          responder(categories, assets, player, &actuator) {
        pipeline.cooldown = 3000ms;
        pipeline.pollTimeout = 5ms;

        categories["可回收物"] = { "", 1 };
        categories["厨余垃圾"] = { "", 2 };
        categories["有害垃圾"] = { "", 3 };
        categories["其他垃圾"] = { "", 4 };

        assets.events[Voice::EVENT_NETWORK_ERROR] = NETWORK_ERROR_WAV;
        assets.events[Voice::EVENT_CAPTURE_ERROR] = CAPTURE_ERROR_WAV;
    }

    TriggerOrchestrator makeOrchestrator(Wake::DetectionGate& gate) {
        TriggerOrchestrator o(pipeline, channel, gate, camera, classifier, responder,
                              [this] { return now; });
        o.setStateListener([this](TriggerState, TriggerState to) { states.push_back(to); });
        return o;
    }

    void push(Clock::time_point t, std::size_t keyword = 0) {
        ASSERT_TRUE(channel.tryPush({ keyword, t }));
    }

    std::size_t announcementWrites() const {
        return static_cast<std::size_t>(std::count_if(bus.writes.begin(), bus.writes.end(),
            [](const FakeBus::Write& w) { return !w.payload.empty() && w.payload[0] == 0xFF; }));
    }

    std::size_t timesPlayed(const std::string& path) const {
        return static_cast<std::size_t>(std::count(player.played.begin(), player.played.end(), path));
    }

    Clock::time_point now = Clock::time_point{} + 1h;

    PipelineConfig pipeline;
    CategoryMapping categories;
    AudioAssetConfig assets;

    Wake::EventChannel<DetectionEvent> channel;
    FakeBus bus;
    FakePlayer player;
    FakeCamera camera;
    FakeClassifier classifier;
    FakeGate gate;
    Echo::Actuator actuator;
    Voice::AudioResponder responder;

    std::vector<TriggerState> states;
};

} // namespace

TEST_F(TriggerOrchestratorTest, IdleStepWithoutEventDoesNothing) {
    auto o = makeOrchestrator(gate);

    EXPECT_FALSE(o.step().has_value());
    EXPECT_EQ(o.state(), TriggerState::Idle);
    EXPECT_EQ(camera.calls, 0);
    EXPECT_TRUE(states.empty());
}

TEST_F(TriggerOrchestratorTest, RecyclableIsAnnouncedAsPhraseOne) {
    classifier.result = "可回收物";
    auto o = makeOrchestrator(gate);

    push(now);
    auto report = o.step();

    ASSERT_TRUE(report.has_value());
    EXPECT_EQ(report->outcome, CycleOutcome::Announced);
    EXPECT_EQ(report->category, std::optional<std::string>("可回收物"));
    EXPECT_EQ(classifier.lastImage, *camera.result);

    ASSERT_EQ(bus.writes.size(), 1u);
    EXPECT_EQ(bus.writes[0].reg, Echo::SPEAK_REGISTER);
    EXPECT_EQ(bus.writes[0].payload, (std::vector<std::uint8_t>{ 0xFF, 0x01 }));

    EXPECT_EQ(states, (std::vector<TriggerState>{
        TriggerState::Capturing, TriggerState::Classifying,
        TriggerState::Announcing, TriggerState::Cooldown }));
}

TEST_F(TriggerOrchestratorTest, ClassifierTimeoutPlaysErrorPromptAndCoolsDown) {
    classifier.result = std::nullopt;
    auto o = makeOrchestrator(gate);

    push(now);
    auto report = o.step();

    ASSERT_TRUE(report.has_value());
    EXPECT_EQ(report->outcome, CycleOutcome::ClassifyFailed);
    EXPECT_FALSE(report->category.has_value());
    EXPECT_EQ(announcementWrites(), 0u);
    EXPECT_EQ(timesPlayed(NETWORK_ERROR_WAV), 1u);
    EXPECT_EQ(o.state(), TriggerState::Cooldown);

    now += 3000ms;
    EXPECT_FALSE(o.step().has_value());

    EXPECT_EQ(states, (std::vector<TriggerState>{
        TriggerState::Capturing, TriggerState::Classifying, TriggerState::Announcing,
        TriggerState::Cooldown, TriggerState::Idle }));
}

TEST_F(TriggerOrchestratorTest, CooldownHoldsUntilElapsed) {
    classifier.result = "厨余垃圾";
    auto o = makeOrchestrator(gate);

    push(now);
    ASSERT_TRUE(o.step().has_value());

    now += 2999ms;
    EXPECT_FALSE(o.step().has_value());
    EXPECT_EQ(o.state(), TriggerState::Cooldown);

    now += 1ms;
    EXPECT_FALSE(o.step().has_value());
    EXPECT_EQ(o.state(), TriggerState::Idle);
}

TEST_F(TriggerOrchestratorTest, BurstOfEventsTriggersOnce) {
    classifier.result = "有害垃圾";
    auto o = makeOrchestrator(gate);

    push(now);
    push(now + 200ms);
    push(now + 400ms, 1);

    auto report = o.step();
    ASSERT_TRUE(report.has_value());
    EXPECT_EQ(channel.size(), 0u);
    EXPECT_FALSE(o.step().has_value());

    EXPECT_EQ(o.cyclesStarted(), 1u);
    EXPECT_EQ(o.eventsDiscarded(), 2u);
    EXPECT_EQ(camera.calls, 1);
    EXPECT_EQ(announcementWrites(), 1u);
}

TEST_F(TriggerOrchestratorTest, EventDuringCooldownIsDiscarded) {
    classifier.result = "其他垃圾";
    auto o = makeOrchestrator(gate);

    push(now);
    ASSERT_TRUE(o.step().has_value());

    now += 1000ms;
    push(now);
    EXPECT_FALSE(o.step().has_value());
    EXPECT_EQ(camera.calls, 1);
    EXPECT_EQ(o.eventsDiscarded(), 1u);

    now += 2000ms;
    push(now);
    auto report = o.step();
    ASSERT_TRUE(report.has_value());
    EXPECT_EQ(camera.calls, 2);
    EXPECT_EQ(o.cyclesStarted(), 2u);
}

TEST_F(TriggerOrchestratorTest, StaleTimestampAfterCooldownIsDiscarded) {
    classifier.result = "其他垃圾";
    auto o = makeOrchestrator(gate);

    push(now);
    ASSERT_TRUE(o.step().has_value());
    const auto cycleEnd = now;

    // Delivered late, but produced inside the quiet period
    now += 5000ms;
    push(cycleEnd + 500ms);
    EXPECT_FALSE(o.step().has_value());
    EXPECT_EQ(camera.calls, 1);
}

TEST_F(TriggerOrchestratorTest, CaptureFailureReturnsToIdle) {
    camera.result = std::nullopt;
    auto o = makeOrchestrator(gate);

    push(now);
    auto report = o.step();

    ASSERT_TRUE(report.has_value());
    EXPECT_EQ(report->outcome, CycleOutcome::CaptureFailed);
    EXPECT_EQ(classifier.calls, 0);
    EXPECT_EQ(timesPlayed(CAPTURE_ERROR_WAV), 1u);
    EXPECT_TRUE(bus.writes.empty());
    EXPECT_EQ(o.state(), TriggerState::Idle);
    EXPECT_EQ(states, (std::vector<TriggerState>{ TriggerState::Capturing, TriggerState::Idle }));

    // Still rate-limited by the cooldown
    now += 100ms;
    push(now);
    EXPECT_FALSE(o.step().has_value());
    EXPECT_EQ(camera.calls, 1);
}

TEST_F(TriggerOrchestratorTest, UnmappedCategoryIsAnnounceFailure) {
    classifier.result = "电子垃圾";
    auto o = makeOrchestrator(gate);

    push(now);
    auto report = o.step();

    ASSERT_TRUE(report.has_value());
    EXPECT_EQ(report->outcome, CycleOutcome::AnnounceFailed);
    EXPECT_TRUE(bus.writes.empty());
    EXPECT_EQ(o.state(), TriggerState::Cooldown);
}

TEST_F(TriggerOrchestratorTest, GateIsPausedOncePerCycle) {
    classifier.result = "可回收物";
    auto o = makeOrchestrator(gate);

    push(now);
    ASSERT_TRUE(o.step().has_value());

    EXPECT_EQ(gate.pauses, 1);
    EXPECT_EQ(gate.resumes, 1);
    EXPECT_FALSE(gate.paused);
}

TEST_F(TriggerOrchestratorTest, StaleDetectionsAcrossPauseDoNotTrigger) {
    KwsConfig kws;
    kws.keywords = { { "开启垃圾分类", 0.3f } };
    FakeEngine engine;
    std::atomic<bool> exitFlag{false};
    Wake::KeywordProducer producer(engine, kws, pipeline, channel, exitFlag);

    auto o = makeOrchestrator(producer);

    producer.pause();
    producer.onProbabilities({ 0.95f });                 // suppressed
    ASSERT_TRUE(channel.tryPush({ 0, now }));            // in flight
    producer.resume();

    EXPECT_FALSE(o.step().has_value());
    EXPECT_EQ(o.state(), TriggerState::Idle);
    EXPECT_EQ(camera.calls, 0);
}

TEST_F(TriggerOrchestratorTest, ResultRegisterIsReadWhenDiagnosticsEnabled) {
    classifier.result = "可回收物";
    bus.readValue = 0x01;
    auto o = makeOrchestrator(gate);
    o.setDiagnostics(&actuator);

    push(now);
    ASSERT_TRUE(o.step().has_value());

    ASSERT_EQ(bus.reads.size(), 1u);
    EXPECT_EQ(bus.reads[0], Echo::RESULT_REGISTER);
}

TEST_F(TriggerOrchestratorTest, RunReturnsWhenExitRequested) {
    auto o = makeOrchestrator(gate);
    std::atomic<bool> exitFlag{false};

    std::thread loop([&] { o.run(exitFlag); });
    std::this_thread::sleep_for(20ms);
    exitFlag.store(true);
    loop.join();

    EXPECT_EQ(o.cyclesStarted(), 0u);
}

TEST(TriggerStateNames, AreReadable) {
    EXPECT_STREQ(Pipeline::toString(TriggerState::Classifying), "Classifying");
    EXPECT_STREQ(Pipeline::toString(CycleOutcome::CaptureFailed), "capture failed");
}
