#include "bootstrap.hpp"
#include "error_manager.hpp"
#include "resources.hpp"
#include "logger.hpp"
#include "config/assistant_config.hpp"
#include "device_setups/actuator.hpp"
#include "device_setups/audio_devices.hpp"
#include "device_setups/i2c_bus.hpp"
#include "pipeline/trigger_orchestrator.hpp"
#include "vision/camera.hpp"
#include "vision/classifier.hpp"
#include "voice/audio_responder.hpp"
#include "voice/voice_speak.hpp"
#include "wake/event_channel.hpp"
#include "wake/keyword_producer.hpp"
#include "wake/whisper_kws.hpp"
#include "wake/wake.hpp"

#include <csignal>
#include <iostream>
#include <string>

// Exit codes
constexpr int EXIT_CONFIG = 2;
constexpr int EXIT_BUS    = 3;
constexpr int EXIT_KWS    = 4;

static void onSignal(int) {
    Wake::requestExit();
}

// Log where startup stopped, then close the log
static int abortStartup(const std::string& what, int code) {
    PhaseInfo last = lastPhase();
    LOG_PHASE("Startup aborted: " + what, false);
    LOG_DEBUG("Assistant", "Last phase before abort: '" + last.phaseName + "' (" + last.fileName +
                           ", " + (last.success ? "ok" : "failed") + ")");
    shutdownLogger();
    return code;
}

static void printUsage(const char* argv0) {
    std::cout << "Usage: " << argv0 << " [config.json]\n"
              << "       " << argv0 << " --list-devices\n";
}

// ============================================================
// Main entry point
// ============================================================
int main(int argc, char* argv[]) {
    std::string configPath = ASSISTANT_CONFIG_FILE;
    if (argc > 1) {
        std::string arg = argv[1];
        if (arg == "--list-devices") return printInputDevices();
        if (arg == "-h" || arg == "--help") {
            printUsage(argv[0]);
            return 0;
        }
        configPath = arg;
    }

    initLogger(LOG_FILE);
    LOG_PHASE("Startup begin", true);

    std::signal(SIGINT, onSignal);
    std::signal(SIGTERM, onSignal);

    // ============================================================
    // Configuration (immutable from here on)
    // ============================================================
    AssistantConfig loaded;
    if (!runBootstrapChecks(configPath, loaded)) {
        return abortStartup("configuration", EXIT_CONFIG);
    }
    const AssistantConfig& cfg = loaded;

    // ============================================================
    // Peripheral
    // ============================================================
    LinuxI2CBus bus(cfg.peripheral.busId, cfg.peripheral.address);
    std::string err;
    if (!bus.open(&err)) {
        ErrorManager::report("ERR_BUS_OPEN", err);
        return abortStartup("peripheral", EXIT_BUS);
    }

    Echo::Actuator actuator(bus, cfg.peripheral.speakRegister, cfg.peripheral.resultRegister);
    if (!actuator.clearResult()) {
        LOG_DEBUG("Peripheral", "Result register not cleared; continuing");
    }
    LOG_PHASE("Peripheral ready", true);

    // ============================================================
    // Pipeline wiring
    // ============================================================
    Wake::EventChannel<Wake::DetectionEvent> channel(cfg.pipeline.channelCapacity);
    Wake::WhisperKeywordEngine engine(cfg.kws);
    Wake::KeywordProducer producer(engine, cfg.kws, cfg.pipeline, channel, Wake::g_exitRequested);

    Vision::CommandCamera camera(cfg.camera);
    Vision::HttpClassifier classifier(cfg.server);

    Voice::SfmlAudioPlayer player;
    Voice::AudioResponder responder(cfg.categories, cfg.audio, player, &actuator);

    Pipeline::TriggerOrchestrator orchestrator(cfg.pipeline, channel, producer,
                                               camera, classifier, responder);
    if (cfg.readResultRegister) {
        orchestrator.setDiagnostics(&actuator);
    }

    if (!producer.start(&err)) {
        return abortStartup("keyword engine", EXIT_KWS);
    }

    LOG_PHASE("Startup complete, entering trigger loop", true);
    orchestrator.run(Wake::g_exitRequested);

    // ============================================================
    // Shutdown cleanup
    // ============================================================
    LOG_PHASE("Shutdown requested", true);
    producer.stop();

    LOG_DEBUG("Assistant", std::to_string(orchestrator.cyclesStarted()) + " cycle(s), " +
                           std::to_string(orchestrator.eventsDiscarded()) + " event(s) discarded, " +
                           std::to_string(channel.droppedCount()) + " dropped on full channel");
    LOG_PHASE("Shutdown complete", true);

    shutdownLogger();
    return 0;
}
