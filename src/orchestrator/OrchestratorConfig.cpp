/**
 * OrchestratorConfig.cpp - JSON configuration loading
 */

#include "parley/OrchestratorConfig.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cctype>
#include <fstream>
#include <iostream>
#include <sstream>

using json = nlohmann::json;

namespace parley {

PlaybackConfig PlaybackConfig::fromPreset(PlaybackPreset preset) {
    PlaybackConfig config;
    switch (preset) {
        case PlaybackPreset::LowLatency:
            config.enable_prefetch = true;
            config.prefetch_depth = 2;
            config.inter_sentence_silence_ms = 0;
            break;
        case PlaybackPreset::Conservative:
            config.enable_prefetch = true;
            config.prefetch_depth = 1;
            config.inter_sentence_silence_ms = 100;
            break;
        case PlaybackPreset::Disabled:
            config.enable_prefetch = false;
            config.prefetch_depth = 0;
            config.inter_sentence_silence_ms = 0;
            break;
        case PlaybackPreset::Default:
        case PlaybackPreset::Custom:
        default:
            break;
    }
    return config;
}

PlaybackPreset parsePlaybackPreset(const std::string& str) {
    // Accept "Low Latency", "low_latency", "lowLatency", ...
    std::string key;
    for (char c : str) {
        if (c == ' ' || c == '_' || c == '-') continue;
        key += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }

    if (key == "lowlatency") return PlaybackPreset::LowLatency;
    if (key == "conservative") return PlaybackPreset::Conservative;
    if (key == "disabled") return PlaybackPreset::Disabled;
    if (key == "custom") return PlaybackPreset::Custom;
    return PlaybackPreset::Default;
}

const char* playbackPresetName(PlaybackPreset preset) {
    switch (preset) {
        case PlaybackPreset::LowLatency: return "Low Latency";
        case PlaybackPreset::Conservative: return "Conservative";
        case PlaybackPreset::Disabled: return "Disabled";
        case PlaybackPreset::Custom: return "Custom";
        case PlaybackPreset::Default:
        default:
            return "Default";
    }
}

namespace {

bool isDefaultPresetName(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lower == "default";
}

void readMs(const json& j, const char* key, std::chrono::milliseconds& out, int minimum) {
    if (j.contains(key)) {
        out = std::chrono::milliseconds(std::max(minimum, j[key].get<int>()));
    }
}

void applyTimings(const json& j, TurnTimings& t) {
    readMs(j, "silence_timeout_ms", t.silence_timeout, 0);
    readMs(j, "barge_in_confirm_ms", t.barge_in_confirm, 0);
    readMs(j, "post_turn_cooldown_ms", t.post_turn_cooldown, 0);
    readMs(j, "error_display_ms", t.error_display, 0);
    readMs(j, "queue_poll_ms", t.queue_poll, 1);
}

void applyPlayback(const json& j, PlaybackConfig& p, bool verbose) {
    if (j.contains("preset")) {
        std::string name = j["preset"].get<std::string>();
        PlaybackPreset preset = parsePlaybackPreset(name);
        if (preset == PlaybackPreset::Default && !isDefaultPresetName(name) && verbose) {
            std::cerr << "[Config] Unknown playback preset '" << name
                      << "', falling back to 'Default'" << std::endl;
        }
        p = PlaybackConfig::fromPreset(preset);
    }

    // Individual keys refine the preset
    if (j.contains("enable_prefetch"))
        p.enable_prefetch = j["enable_prefetch"].get<bool>();
    if (j.contains("prefetch_depth"))
        p.prefetch_depth = j["prefetch_depth"].get<int>();
    if (j.contains("inter_sentence_silence_ms"))
        p.inter_sentence_silence_ms = j["inter_sentence_silence_ms"].get<int>();

    p.prefetch_depth = std::max(0, p.prefetch_depth);
    p.inter_sentence_silence_ms = std::max(0, p.inter_sentence_silence_ms);
}

void applyLlm(const json& j, llm::LLMConfig& l) {
    if (j.contains("model"))
        l.model = j["model"].get<std::string>();
    if (j.contains("max_tokens"))
        l.max_tokens = std::max(1, j["max_tokens"].get<int>());
    if (j.contains("temperature"))
        l.temperature = std::clamp(j["temperature"].get<float>(), 0.0f, 2.0f);
    if (j.contains("top_p"))
        l.top_p = std::clamp(j["top_p"].get<float>(), 0.0f, 1.0f);
    if (j.contains("stop"))
        l.stop = j["stop"].get<std::vector<std::string>>();
}

void applyAudio(const json& j, audio::AudioConfig& a) {
    if (j.contains("sample_rate"))
        a.sample_rate = j["sample_rate"].get<int>();
    if (j.contains("output_sample_rate"))
        a.output_sample_rate = j["output_sample_rate"].get<int>();
    if (j.contains("channels"))
        a.channels = std::max(1, j["channels"].get<int>());
    if (j.contains("frames_per_buffer"))
        a.frames_per_buffer = std::max(1, j["frames_per_buffer"].get<int>());
    if (j.contains("input_device"))
        a.input_device = j["input_device"].get<int>();
    if (j.contains("output_device"))
        a.output_device = j["output_device"].get<int>();
    if (j.contains("vad_mode"))
        a.vad_mode = static_cast<audio::VADMode>(std::clamp(j["vad_mode"].get<int>(), 0, 3));
    if (j.contains("vad_frame_ms")) {
        int ms = j["vad_frame_ms"].get<int>();
        // libfvad only accepts these
        a.vad_frame_ms = (ms == 10 || ms == 20 || ms == 30) ? ms : 20;
    }
}

bool applyJson(const json& j, OrchestratorConfig& out, bool verbose) {
    if (!j.is_object()) {
        if (verbose) std::cerr << "[Config] Top level must be an object, using defaults" << std::endl;
        return false;
    }

    if (j.contains("timings") && j["timings"].is_object())
        applyTimings(j["timings"], out.timings);
    if (j.contains("playback") && j["playback"].is_object())
        applyPlayback(j["playback"], out.playback, verbose);

    if (j.contains("barge_in_threshold"))
        out.barge_in_threshold = std::clamp(j["barge_in_threshold"].get<float>(), 0.0f, 1.0f);
    if (j.contains("enable_interruptions"))
        out.enable_interruptions = j["enable_interruptions"].get<bool>();
    if (j.contains("flush_synthesizer_on_interrupt"))
        out.flush_synthesizer_on_interrupt = j["flush_synthesizer_on_interrupt"].get<bool>();
    if (j.contains("system_prompt"))
        out.system_prompt = j["system_prompt"].get<std::string>();
    if (j.contains("opening_prompt"))
        out.opening_prompt = j["opening_prompt"].get<std::string>();

    if (j.contains("llm") && j["llm"].is_object())
        applyLlm(j["llm"], out.llm);
    if (j.contains("audio") && j["audio"].is_object())
        applyAudio(j["audio"], out.audio);

    return true;
}

} // namespace

bool parseConfig(const std::string& text, OrchestratorConfig& out, bool verbose) {
    out = OrchestratorConfig{};

    try {
        json j = json::parse(text);
        if (!applyJson(j, out, verbose)) {
            out = OrchestratorConfig{};
            return false;
        }
    } catch (const std::exception& e) {
        if (verbose) {
            std::cerr << "[Config] Invalid configuration, using defaults: " << e.what() << std::endl;
        }
        out = OrchestratorConfig{};
        return false;
    }

    if (verbose) {
        std::cout << "[Config] Loaded (prefetch=" << (out.playback.enable_prefetch ? "on" : "off")
                  << ", depth=" << out.playback.prefetch_depth
                  << ", barge_in_threshold=" << out.barge_in_threshold << ")" << std::endl;
    }
    return true;
}

bool loadConfig(const std::string& path, OrchestratorConfig& out, bool verbose) {
    out = OrchestratorConfig{};

    std::ifstream file(path);
    if (!file.is_open()) {
        if (verbose) {
            std::cout << "[Config] " << path << " not found, using defaults" << std::endl;
        }
        return false;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return parseConfig(buffer.str(), out, verbose);
}

} // namespace parley
