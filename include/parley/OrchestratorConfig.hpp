/**
 * OrchestratorConfig.hpp - Construction-time settings for a conversation
 */

#pragma once

#include "parley/audio/AudioIO.hpp"
#include "parley/llm/LanguageModel.hpp"

#include <chrono>
#include <string>

namespace parley {

/** Fixed turn-taking delays. Not changeable while a session runs. */
struct TurnTimings {
    std::chrono::milliseconds silence_timeout{1500};    // silence that ends an utterance
    std::chrono::milliseconds barge_in_confirm{600};    // window to confirm an interruption
    std::chrono::milliseconds post_turn_cooldown{500};  // pause before listening again
    std::chrono::milliseconds error_display{1500};      // Error state before recovery
    std::chrono::milliseconds queue_poll{50};           // speech queue wait while the LLM streams
};

enum class PlaybackPreset {
    Default,
    LowLatency,
    Conservative,
    Disabled,
    Custom
};

/** Sentence prefetching and pacing. */
struct PlaybackConfig {
    bool enable_prefetch = true;
    int prefetch_depth = 1;            // sentences synthesized ahead of playback
    int inter_sentence_silence_ms = 0;

    static PlaybackConfig fromPreset(PlaybackPreset preset);
};

PlaybackPreset parsePlaybackPreset(const std::string& str);
const char* playbackPresetName(PlaybackPreset preset);

struct OrchestratorConfig {
    TurnTimings timings;
    PlaybackConfig playback;

    float barge_in_threshold = 0.7f;   // VAD confidence must exceed this
    bool enable_interruptions = true;
    bool flush_synthesizer_on_interrupt = true;

    std::string system_prompt =
        "You are a helpful AI tutor engaged in a voice conversation.\n"
        "Keep responses concise and conversational.\n"
        "Ask follow-up questions to check understanding.";

    // User message that opens the conversation when the AI speaks first
    std::string opening_prompt = "Please begin the lecture now.";

    llm::LLMConfig llm;
    audio::AudioConfig audio;
};

/**
 * Load configuration from a JSON file.
 *
 * Missing keys keep their defaults, out-of-range values are clamped.
 * On a missing or malformed file `out` is left at defaults.
 *
 * @return true if the file was read and parsed
 */
bool loadConfig(const std::string& path, OrchestratorConfig& out, bool verbose = true);

/**
 * Same as loadConfig() for JSON held in a string.
 * @return false if `text` is not valid JSON or has mistyped values
 */
bool parseConfig(const std::string& text, OrchestratorConfig& out, bool verbose = true);

} // namespace parley
