/**
 * Orchestrator.hpp - Voice conversation controller
 *
 * Turn-taking between a human speaker and a streaming AI pipeline:
 * Audio/VAD → STT → LLM → sentence queue → TTS → Audio, with a
 * two-phase barge-in and sentence prefetching.
 */

#pragma once

#include "parley/OrchestratorConfig.hpp"
#include "parley/audio/AudioIO.hpp"
#include "parley/llm/LanguageModel.hpp"
#include "parley/stt/SpeechRecognizer.hpp"
#include "parley/telemetry/TelemetrySink.hpp"
#include "parley/tts/SpeechSynthesizer.hpp"

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace parley {

enum class SessionState {
    Idle,
    UserSpeaking,
    AiThinking,
    AiSpeaking,
    Interrupted,
    ProcessingUserUtterance,
    Error
};

/** Display name, e.g. "AI Speaking". */
const char* stateName(SessionState state);

/** False for Idle and Error. */
bool isActive(SessionState state);

/**
 * Callbacks run on the orchestrator's own thread. They may call the
 * orchestrator's getters but must not block.
 */
struct OrchestratorCallbacks {
    std::function<void(SessionState)> onStateChange;
    std::function<void(const std::string&)> onUserUtterance;
    std::function<void(const std::string&)> onAssistantResponse;
    std::function<void(const std::string&)> onError;
    std::function<void(const std::string&, bool is_final)> onTranscript;
    std::function<void(const std::string&)> onSentenceQueued;
    std::function<void(float db)> onAudioLevel;
};

/** Collaborators used for one session. All four are required. */
struct SessionServices {
    std::shared_ptr<audio::AudioIO> audio;
    std::shared_ptr<stt::SpeechRecognizer> stt;
    std::shared_ptr<llm::LanguageModel> llm;
    std::shared_ptr<tts::SpeechSynthesizer> tts;
};

struct SessionOptions {
    std::optional<std::string> system_prompt;  // overrides config.system_prompt
    bool ai_speaks_first = false;              // open with config.opening_prompt
};

class Orchestrator {
public:
    explicit Orchestrator(OrchestratorConfig config = OrchestratorConfig{},
                          std::shared_ptr<telemetry::TelemetrySink> telemetry = nullptr);
    ~Orchestrator();

    Orchestrator(const Orchestrator&) = delete;
    Orchestrator& operator=(const Orchestrator&) = delete;

    void setCallbacks(OrchestratorCallbacks callbacks);

    /**
     * Start a session. Returns false (see lastError()) when a service is
     * missing, a session is already running, or the audio/STT side fails
     * to start.
     */
    bool startSession(const SessionServices& services, const SessionOptions& options = SessionOptions{});

    /** Cancel all turn work, release the services and return to Idle. */
    void stopSession();

    /**
     * Finalize `text` as if the user had said it.
     * Returns false unless the session is active and listening.
     */
    bool injectUserUtterance(const std::string& text);

    /** Entry point for captured audio. Safe from any thread. */
    void handleAudioFrame(const audio::AudioFrame& frame, const audio::VADResult& vad);

    SessionState state() const;
    bool isActive() const;

    std::vector<llm::Message> history() const;
    std::string userTranscript() const;
    std::string aiResponse() const;
    std::vector<std::string> pendingSentences() const;
    size_t prefetchCacheSize() const;
    size_t prefetchInFlight() const;

    std::string lastError() const;
    const OrchestratorConfig& config() const;
    std::shared_ptr<telemetry::TelemetrySink> telemetry() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace parley
