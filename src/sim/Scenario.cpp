/**
 * Scenario.cpp - Scenario JSON parsing
 */

#include "Scenario.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <fstream>
#include <sstream>
#include <stdexcept>

using json = nlohmann::json;

namespace parley::sim {

namespace {

std::chrono::milliseconds readMs(const json& j, const char* key, int fallback = 0) {
    return std::chrono::milliseconds(std::max(0, j.value(key, fallback)));
}

ScenarioStep parseStep(const json& j) {
    ScenarioStep step;
    step.at = readMs(j, "at_ms");
    step.confidence = j.value("confidence", 0.9f);

    if (j.contains("speech_ms") || j.contains("barge_in_ms")) {
        step.kind = ScenarioStep::Kind::Speech;
        step.duration = j.contains("speech_ms") ? readMs(j, "speech_ms") : readMs(j, "barge_in_ms");
    } else if (j.contains("transcript")) {
        step.kind = ScenarioStep::Kind::Transcript;
        step.text = j["transcript"].get<std::string>();
        step.is_final = j.value("final", true);
        step.end_of_utterance = j.value("end_of_utterance", false);
        step.latency = j.value("latency_ms", 0.0) / 1000.0;
    } else if (j.contains("inject")) {
        step.kind = ScenarioStep::Kind::Inject;
        step.text = j["inject"].get<std::string>();
    } else if (j.value("stop", false)) {
        step.kind = ScenarioStep::Kind::Stop;
    } else {
        throw std::runtime_error("timeline step has no action: " + j.dump());
    }
    return step;
}

} // namespace

bool parseScenario(const std::string& text, Scenario& out, std::string& error) {
    out = Scenario{};

    try {
        json j = json::parse(text);
        if (!j.is_object()) {
            error = "scenario must be a JSON object";
            return false;
        }

        out.name = j.value("name", out.name);
        out.ai_speaks_first = j.value("ai_speaks_first", false);
        if (j.contains("system_prompt"))
            out.system_prompt = j["system_prompt"].get<std::string>();

        out.frame_ms = std::clamp(j.value("frame_ms", out.frame_ms), 10, 100);
        out.silence_confidence = j.value("silence_confidence", out.silence_confidence);

        if (j.contains("replies"))
            out.replies = j["replies"].get<std::vector<std::string>>();
        out.first_token_delay_ms = std::max(0, j.value("first_token_delay_ms", out.first_token_delay_ms));
        out.token_delay_ms = std::max(0, j.value("token_delay_ms", out.token_delay_ms));
        out.synthesis_delay_ms = std::max(0, j.value("synthesis_delay_ms", out.synthesis_delay_ms));
        out.speech_ms_per_char = std::max(1, j.value("speech_ms_per_char", out.speech_ms_per_char));

        if (j.contains("timeline")) {
            for (const auto& step : j["timeline"]) {
                out.timeline.push_back(parseStep(step));
            }
        }
        std::stable_sort(out.timeline.begin(), out.timeline.end(),
                         [](const ScenarioStep& a, const ScenarioStep& b) { return a.at < b.at; });

        out.duration = readMs(j, "duration_ms", 10000);
        out.telemetry_path = j.value("telemetry_path", std::string());
    } catch (const std::exception& e) {
        error = e.what();
        out = Scenario{};
        return false;
    }
    return true;
}

bool loadScenario(const std::string& path, Scenario& out, std::string& error) {
    std::ifstream file(path);
    if (!file.is_open()) {
        error = "cannot open " + path;
        return false;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return parseScenario(buffer.str(), out, error);
}

} // namespace parley::sim
