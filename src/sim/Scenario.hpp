/**
 * Scenario.hpp - Scripted conversation timeline for parley_sim
 */

#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace parley::sim {

struct ScenarioStep {
    enum class Kind {
        Speech,      // VAD reports speech for `duration` (also used for barge-in bursts)
        Transcript,  // recognizer emits `text`
        Inject,      // injectUserUtterance(text)
        Stop         // end the session early
    };

    Kind kind = Kind::Speech;
    std::chrono::milliseconds at{0};        // offset from session start
    std::chrono::milliseconds duration{0};
    float confidence = 0.9f;
    std::string text;
    bool is_final = true;
    bool end_of_utterance = false;
    double latency = 0.0;                   // reported STT latency, seconds
};

struct Scenario {
    std::string name = "scenario";
    bool ai_speaks_first = false;
    std::optional<std::string> system_prompt;

    // Simulated device
    int frame_ms = 20;
    float silence_confidence = 0.05f;

    // Scripted language model: one reply per turn, consumed in order.
    // A reply starting with "!error:" makes the stream fail with the rest as message.
    std::vector<std::string> replies;
    int first_token_delay_ms = 150;
    int token_delay_ms = 25;

    // Scripted synthesizer
    int synthesis_delay_ms = 120;   // before the first chunk
    int speech_ms_per_char = 40;    // length of the produced audio

    std::vector<ScenarioStep> timeline;
    std::chrono::milliseconds duration{10000};

    std::string telemetry_path;     // optional JSON export
};

/**
 * Load a scenario file. Steps are sorted by their offset.
 * @return false (with `error` set) on a missing file or malformed JSON
 */
bool loadScenario(const std::string& path, Scenario& out, std::string& error);

/** Same as loadScenario() for JSON held in a string. */
bool parseScenario(const std::string& text, Scenario& out, std::string& error);

} // namespace parley::sim
