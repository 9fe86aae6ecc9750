/**
 * Parley - Scenario runner
 *
 * Drives a full orchestrator session from a scripted timeline: simulated
 * microphone (or the real one with --live), scripted STT/LLM/TTS.
 *
 *   parley_sim <scenario.json> [config.json] [--live]
 *   parley_sim --list-devices
 */

#include "parley/Orchestrator.hpp"
#include "parley/OrchestratorConfig.hpp"
#include "parley/audio/AudioEngine.hpp"
#include "parley/telemetry/TelemetryRecorder.hpp"

#include "sim/Scenario.hpp"
#include "sim/ScriptedServices.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <csignal>
#include <iomanip>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

using namespace parley;

std::atomic<bool> g_running{true};

void signalHandler(int) {
    g_running = false;
}

namespace {

using Clock = std::chrono::steady_clock;

void printUsage() {
    std::cout << "Usage: parley_sim <scenario.json> [config.json] [--live]\n"
              << "       parley_sim --list-devices" << std::endl;
}

void listDevices() {
    std::cout << "Input devices:" << std::endl;
    for (const auto& name : audio::AudioEngine::listInputDevices()) {
        std::cout << "  " << name << std::endl;
    }
    std::cout << "Output devices:" << std::endl;
    for (const auto& name : audio::AudioEngine::listOutputDevices()) {
        std::cout << "  " << name << std::endl;
    }
}

/** Sleep until `deadline`, waking early on Ctrl+C. */
bool sleepUntil(Clock::time_point deadline) {
    while (g_running && Clock::now() < deadline) {
        auto left = deadline - Clock::now();
        std::this_thread::sleep_for(std::min<Clock::duration>(left, std::chrono::milliseconds(20)));
    }
    return g_running;
}

long long elapsedMs(Clock::time_point start) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - start).count();
}

} // namespace

int main(int argc, char* argv[]) {
    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);

    std::vector<std::string> args;
    bool live = false;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--list-devices") {
            listDevices();
            return 0;
        }
        if (arg == "--live") {
            live = true;
        } else if (arg == "-h" || arg == "--help") {
            printUsage();
            return 0;
        } else {
            args.push_back(arg);
        }
    }

    if (args.empty()) {
        printUsage();
        return 1;
    }

    sim::Scenario scenario;
    std::string error;
    if (!sim::loadScenario(args[0], scenario, error)) {
        std::cerr << "[Sim] Invalid scenario " << args[0] << ": " << error << std::endl;
        return 1;
    }

    OrchestratorConfig config;
    if (args.size() > 1 && !loadConfig(args[1], config)) {
        std::cerr << "[Sim] Using default configuration" << std::endl;
    }

    std::cout << "[Sim] Running '" << scenario.name << "' for " << scenario.duration.count() << " ms"
              << " (preset: prefetch " << (config.playback.enable_prefetch ? "on" : "off")
              << ", depth " << config.playback.prefetch_depth << ")" << std::endl;

    auto simulated = std::make_shared<sim::SimulatedAudio>(scenario.frame_ms, scenario.silence_confidence);
    std::shared_ptr<audio::AudioIO> device = simulated;
    if (live) {
        device = std::make_shared<audio::AudioEngine>(config.audio);
        std::cout << "[Sim] Using live audio devices, speech steps are ignored" << std::endl;
    }

    auto recognizer = std::make_shared<sim::ScriptedRecognizer>();
    auto model = std::make_shared<sim::ScriptedLanguageModel>(
        scenario.replies, scenario.first_token_delay_ms, scenario.token_delay_ms);
    auto synthesizer = std::make_shared<sim::ScriptedSynthesizer>(
        scenario.synthesis_delay_ms, scenario.speech_ms_per_char, config.audio.output_sample_rate);
    auto recorder = std::make_shared<telemetry::TelemetryRecorder>();

    Orchestrator orchestrator(config, recorder);

    const auto start = Clock::now();

    OrchestratorCallbacks callbacks;
    callbacks.onStateChange = [start](SessionState state) {
        std::cout << "[Sim] t=" << std::setw(6) << elapsedMs(start) << " ms  -> " << stateName(state) << std::endl;
    };
    callbacks.onUserUtterance = [start](const std::string& text) {
        std::cout << "[Sim] t=" << std::setw(6) << elapsedMs(start) << " ms  user: " << text << std::endl;
    };
    callbacks.onAssistantResponse = [start](const std::string& text) {
        std::cout << "[Sim] t=" << std::setw(6) << elapsedMs(start) << " ms  assistant: " << text << std::endl;
    };
    callbacks.onError = [start](const std::string& message) {
        std::cerr << "[Sim] t=" << std::setw(6) << elapsedMs(start) << " ms  error: " << message << std::endl;
    };
    orchestrator.setCallbacks(std::move(callbacks));

    SessionServices services{device, recognizer, model, synthesizer};
    SessionOptions options;
    options.system_prompt = scenario.system_prompt;
    options.ai_speaks_first = scenario.ai_speaks_first;

    if (!orchestrator.startSession(services, options)) {
        std::cerr << "[Sim] Session failed to start: " << orchestrator.lastError() << std::endl;
        return 1;
    }

    bool stoppedEarly = false;
    for (const auto& step : scenario.timeline) {
        if (!sleepUntil(start + step.at)) break;

        if (step.kind == sim::ScenarioStep::Kind::Stop) {
            std::cout << "[Sim] Stop requested by scenario" << std::endl;
            stoppedEarly = true;
            break;
        }

        switch (step.kind) {
            case sim::ScenarioStep::Kind::Speech:
                if (!live) simulated->addSpeech(step.duration, step.confidence);
                break;
            case sim::ScenarioStep::Kind::Transcript:
                recognizer->emit({step.text, step.is_final, step.end_of_utterance, step.latency});
                break;
            case sim::ScenarioStep::Kind::Inject:
                if (!orchestrator.injectUserUtterance(step.text)) {
                    std::cerr << "[Sim] Utterance rejected in state " << stateName(orchestrator.state()) << std::endl;
                }
                break;
            default:
                break;
        }
    }

    if (!stoppedEarly) {
        sleepUntil(start + scenario.duration);
    }
    orchestrator.stopSession();

    std::cout << "\n[Sim] Recognizer received " << recognizer->framesReceived() << " frames, synthesizer ran "
              << synthesizer->synthesisCount() << " times" << std::endl;

    std::cout << "\n[Sim] Telemetry:\n" << recorder->toJson().dump(2) << std::endl;
    if (!scenario.telemetry_path.empty()) {
        if (recorder->exportJson(scenario.telemetry_path)) {
            std::cout << "[Sim] Telemetry written to " << scenario.telemetry_path << std::endl;
        } else {
            std::cerr << "[Sim] Could not write " << scenario.telemetry_path << std::endl;
            return 1;
        }
    }

    return 0;
}
