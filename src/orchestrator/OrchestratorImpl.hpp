/**
 * OrchestratorImpl.hpp - Orchestrator internals shared by its translation units
 *
 * Everything below is owned by the serial executor: members are read and
 * written only from tasks running on it. Background threads (LLM stream,
 * speech queue, prefetches) talk to it by posting tasks tagged with the turn
 * id they were started for; tasks from a superseded turn are dropped.
 */

#pragma once

#include "parley/Orchestrator.hpp"
#include "parley/core/Cancellation.hpp"
#include "parley/core/SerialExecutor.hpp"
#include "parley/core/TaskGroup.hpp"
#include "parley/llm/ConversationHistory.hpp"
#include "parley/tts/PrefetchCache.hpp"
#include "parley/tts/SentenceSegmenter.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace parley {

using SteadyClock = std::chrono::steady_clock;

/** Shorten long text for log lines. */
inline std::string preview(const std::string& text, size_t length = 50) {
    if (text.size() <= length) return text;
    return text.substr(0, length) + "...";
}

inline double secondsSince(SteadyClock::time_point start) {
    return std::chrono::duration<double>(SteadyClock::now() - start).count();
}

struct Orchestrator::Impl {
    Impl(OrchestratorConfig cfg, std::shared_ptr<telemetry::TelemetrySink> sink);

    const OrchestratorConfig config;
    const std::shared_ptr<telemetry::TelemetrySink> telemetry;

    SessionServices services;
    OrchestratorCallbacks callbacks;

    // Mirrored for lock-free reads from other threads
    std::atomic<SessionState> state{SessionState::Idle};
    bool stopping = false;
    uint64_t sessionId = 0;

    llm::ConversationHistory history;
    std::string userTranscript;
    std::string aiResponse;

    // Current turn
    uint64_t turnId = 0;
    std::shared_ptr<core::CancellationSource> turnCancel;
    std::optional<SteadyClock::time_point> sessionStart;
    std::optional<SteadyClock::time_point> turnStart;

    // Response streaming
    std::string fullResponse;
    tts::SentenceSegmenter segmenter;
    bool firstToken = true;
    bool generationComplete = false;

    // Speech queue
    std::deque<std::string> sentenceQueue;
    tts::PrefetchCache prefetch;
    bool speechPlaying = false;
    bool firstSentence = true;
    bool speechFinished = false;  // last sentence played, cooling down

    // Silence tracking
    std::optional<SteadyClock::time_point> silenceStart;
    bool hasDetectedSpeech = false;
    core::TimerSlot silenceTimer;

    // Barge-in
    bool tentativePause = false;
    core::TimerSlot bargeInTimer;

    core::TimerSlot cooldownTimer;
    core::TimerSlot recoveryTimer;

    mutable std::mutex errorMutex;
    std::string lastError;

    core::TaskGroup tasks;
    core::SerialExecutor executor{"Orchestrator"};

    // Orchestrator.cpp
    void setState(SessionState next);
    void setLastError(const std::string& error);
    void recordLatency(telemetry::LatencyKind kind, double seconds);
    void recordEvent(telemetry::Event event);
    bool beginSession(const SessionServices& requested, const SessionOptions& options);
    std::optional<SessionServices> teardownSession();
    void finalizeSession();
    void resetSilenceTracking();
    void cancelTurn();
    void handleProcessingError(const std::string& message);
    void recoverFromError();

    // TurnDetection.cpp
    void onAudioFrame(const audio::AudioFrame& frame, const audio::VADResult& vad);
    void onSilenceTimeout();
    void handleSttResult(uint64_t session, const stt::STTResult& result);
    bool injectUtterance(const std::string& text);
    void processUserUtterance(const std::string& transcript);

    // ResponseStreaming.cpp
    void beginGeneration();
    void runLanguageModel(std::shared_ptr<llm::LanguageModel> model, uint64_t turn,
                          std::vector<llm::Message> messages, core::CancellationToken cancel);
    void handleToken(uint64_t turn, const llm::Token& token);
    void finishGeneration(uint64_t turn);
    void failGeneration(uint64_t turn, const std::string& message);

    // SpeechQueue.cpp
    struct SpeechStep {
        enum class Kind { Wait, Play, Done, Stop };
        Kind kind = Kind::Wait;
        std::string text;
        bool first_sentence = false;
        std::optional<audio::AudioChunk> cached;
        std::optional<tts::PrefetchFuture> pending;
    };

    void enqueueSentence(const std::string& sentence);
    bool withinPrefetchWindow(size_t index) const;
    void prefetchUpcoming();
    void startPrefetch(const std::string& text);
    void storePrefetch(uint64_t turn, const std::string& text, tts::PrefetchResult result);
    void runSpeechQueue(SessionServices turnServices, uint64_t turn, core::CancellationToken cancel);
    SpeechStep nextSentence(uint64_t turn);
    void playSentence(const SessionServices& turnServices, uint64_t turn, const SpeechStep& step,
                      core::CancellationToken cancel);
    void firstAudioReady(uint64_t turn);
    static void playChunk(audio::AudioIO& output, const audio::AudioChunk& chunk);
    void sentenceFinished(uint64_t turn);
    void finishTurn(uint64_t turn);
    void completeTurn(uint64_t turn);

    // BargeIn.cpp
    static bool qualifiesAsBargeIn(const audio::VADResult& vad, float threshold);
    void beginTentativeBargeIn();
    void onBargeInTimeout(uint64_t turn);
    void resumeFromTentativePause();
    void confirmBargeIn();
};

/** Synthesize `text` completely into one chunk. Empty on failure or cancellation. */
tts::PrefetchResult synthesizeSentence(tts::SpeechSynthesizer& synthesizer,
                                       const std::string& text,
                                       core::CancellationToken cancel);

} // namespace parley
