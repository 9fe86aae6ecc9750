/**
 * Orchestrator.cpp - Session lifecycle and state machine
 *
 * Connects: AudioIO (+VAD) → SpeechRecognizer → LanguageModel → SpeechSynthesizer → AudioIO
 */

#include "OrchestratorImpl.hpp"

#include <exception>
#include <iostream>

namespace parley {

const char* stateName(SessionState state) {
    switch (state) {
        case SessionState::Idle: return "Idle";
        case SessionState::UserSpeaking: return "User Speaking";
        case SessionState::AiThinking: return "AI Thinking";
        case SessionState::AiSpeaking: return "AI Speaking";
        case SessionState::Interrupted: return "Interrupted";
        case SessionState::ProcessingUserUtterance: return "Processing Utterance";
        case SessionState::Error: return "Error";
    }
    return "Unknown";
}

bool isActive(SessionState state) {
    return state != SessionState::Idle && state != SessionState::Error;
}

Orchestrator::Impl::Impl(OrchestratorConfig cfg, std::shared_ptr<telemetry::TelemetrySink> sink)
    : config(std::move(cfg))
    , telemetry(std::move(sink))
{}

void Orchestrator::Impl::setState(SessionState next) {
    SessionState previous = state.load();
    if (previous == next) return;

    state = next;
    std::cout << "[Orchestrator] State: " << stateName(previous) << " -> " << stateName(next) << std::endl;

    if (callbacks.onStateChange) {
        callbacks.onStateChange(next);
    }
}

void Orchestrator::Impl::setLastError(const std::string& error) {
    std::lock_guard<std::mutex> lock(errorMutex);
    lastError = error;
}

void Orchestrator::Impl::recordLatency(telemetry::LatencyKind kind, double seconds) {
    if (telemetry) telemetry->recordLatency(kind, seconds);
}

void Orchestrator::Impl::recordEvent(telemetry::Event event) {
    if (telemetry) telemetry->recordEvent(event);
}

bool Orchestrator::Impl::beginSession(const SessionServices& requested, const SessionOptions& options) {
    if (state != SessionState::Idle || stopping) {
        setLastError("Session is already active");
        std::cerr << "[Orchestrator] Cannot start session: current state is "
                  << stateName(state) << std::endl;
        return false;
    }

    std::cout << "[Orchestrator] Starting session (ai_speaks_first="
              << (options.ai_speaks_first ? "true" : "false") << ")" << std::endl;

    if (!requested.audio->configure(config.audio)) {
        std::string message = "Audio configuration failed: " + requested.audio->lastError();
        setLastError(message);
        std::cerr << "[Orchestrator] " << message << std::endl;
        return false;
    }

    const uint64_t session = ++sessionId;

    try {
        requested.stt->startStreaming(requested.audio->format(),
            [this, session](const stt::STTResult& result) {
                executor.post([this, session, result]() { handleSttResult(session, result); });
            });
    } catch (const std::exception& e) {
        setLastError(std::string("Speech recognition failed to start: ") + e.what());
        std::cerr << "[Orchestrator] " << e.what() << std::endl;
        return false;
    }

    requested.audio->setFrameCallback([this](const audio::AudioFrame& frame, const audio::VADResult& vad) {
        executor.post([this, frame, vad]() { onAudioFrame(frame, vad); });
    });

    if (!requested.audio->start()) {
        std::string message = "Audio start failed: " + requested.audio->lastError();
        setLastError(message);
        std::cerr << "[Orchestrator] " << message << std::endl;
        requested.audio->setFrameCallback(nullptr);
        try {
            requested.stt->stopStreaming();
        } catch (const std::exception& e) {
            std::cerr << "[Orchestrator] STT stop failed: " << e.what() << std::endl;
        }
        return false;
    }

    services = requested;
    history.reset(options.system_prompt.value_or(config.system_prompt));
    userTranscript.clear();
    aiResponse.clear();
    resetSilenceTracking();
    tentativePause = false;

    recordEvent(telemetry::Event::SessionStarted);
    sessionStart = SteadyClock::now();

    if (options.ai_speaks_first) {
        std::cout << "[Orchestrator] AI speaks first" << std::endl;
        history.appendUser(config.opening_prompt);
        turnStart = SteadyClock::now();
        beginGeneration();
    } else {
        setState(SessionState::UserSpeaking);
    }

    std::cout << "[Orchestrator] Session started" << std::endl;
    return true;
}

std::optional<SessionServices> Orchestrator::Impl::teardownSession() {
    if (state == SessionState::Idle || stopping) {
        return std::nullopt;
    }

    std::cout << "[Orchestrator] Stopping session" << std::endl;
    stopping = true;

    cancelTurn();
    silenceTimer.cancel();
    recoveryTimer.cancel();

    SessionServices released = std::move(services);
    services = SessionServices{};
    return released;
}

void Orchestrator::Impl::finalizeSession() {
    history.clear();
    sentenceQueue.clear();
    prefetch.clear();
    segmenter.reset();
    fullResponse.clear();
    userTranscript.clear();
    aiResponse.clear();
    resetSilenceTracking();
    tentativePause = false;
    turnStart.reset();

    recordEvent(telemetry::Event::SessionEnded);
    if (sessionStart) {
        std::cout << "[Orchestrator] Session lasted " << secondsSince(*sessionStart) << " s" << std::endl;
        sessionStart.reset();
    }

    setState(SessionState::Idle);
    stopping = false;
    std::cout << "[Orchestrator] Session stopped, all state cleared" << std::endl;
}

void Orchestrator::Impl::resetSilenceTracking() {
    hasDetectedSpeech = false;
    silenceStart.reset();
    silenceTimer.cancel();
}

void Orchestrator::Impl::cancelTurn() {
    if (turnCancel) {
        turnCancel->cancel();
        turnCancel.reset();
    }
    ++turnId;

    sentenceQueue.clear();
    prefetch.clear();
    segmenter.reset();
    generationComplete = false;
    speechPlaying = false;
    speechFinished = false;
    tentativePause = false;
    bargeInTimer.cancel();
    cooldownTimer.cancel();
}

void Orchestrator::Impl::handleProcessingError(const std::string& message) {
    std::cerr << "[Orchestrator] Processing error: " << message << std::endl;

    cancelTurn();
    if (services.audio) {
        services.audio->stopPlayback();
    }

    setLastError(message);
    setState(SessionState::Error);
    if (callbacks.onError) {
        callbacks.onError(message);
    }

    // Partial response is dropped, never added to history
    fullResponse.clear();
    aiResponse.clear();

    recoveryTimer.arm(executor, config.timings.error_display, [this]() { recoverFromError(); });
}

void Orchestrator::Impl::recoverFromError() {
    if (state != SessionState::Error || stopping) return;

    // The failed utterance must not be finalized again by a later silence
    userTranscript.clear();
    resetSilenceTracking();
    setState(SessionState::UserSpeaking);
    std::cout << "[Orchestrator] Recovered to listening after error" << std::endl;
}

// ============================================================================
// Public API
// ============================================================================

Orchestrator::Orchestrator(OrchestratorConfig config, std::shared_ptr<telemetry::TelemetrySink> telemetry)
    : impl_(std::make_unique<Impl>(std::move(config), std::move(telemetry)))
{}

Orchestrator::~Orchestrator() {
    stopSession();
    impl_->tasks.joinAll();
    impl_->executor.shutdown();
}

void Orchestrator::setCallbacks(OrchestratorCallbacks callbacks) {
    impl_->executor.submit([this, callbacks = std::move(callbacks)]() mutable {
        impl_->callbacks = std::move(callbacks);
    }).get();
}

bool Orchestrator::startSession(const SessionServices& services, const SessionOptions& options) {
    std::string missing;
    if (!services.audio) missing += "audio, ";
    if (!services.stt) missing += "stt, ";
    if (!services.llm) missing += "llm, ";
    if (!services.tts) missing += "tts, ";

    if (!missing.empty()) {
        missing.resize(missing.size() - 2);
        impl_->setLastError("Required services not configured: " + missing);
        std::cerr << "[Orchestrator] Required services not configured: " << missing << std::endl;
        return false;
    }

    return impl_->executor.submit([this, &services, &options]() {
        return impl_->beginSession(services, options);
    }).get();
}

void Orchestrator::stopSession() {
    auto released = impl_->executor.submit([this]() { return impl_->teardownSession(); }).get();
    if (!released) return;

    // Device and provider calls may block, keep them off the executor
    released->audio->setFrameCallback(nullptr);
    released->audio->stopPlayback();
    released->audio->stop();
    try {
        released->stt->stopStreaming();
    } catch (const std::exception& e) {
        std::cerr << "[Orchestrator] STT stop failed: " << e.what() << std::endl;
    }

    // From a callback we are on the executor: the threads are joined later
    if (!impl_->executor.isCurrentThread()) {
        impl_->tasks.joinAll();
    }

    impl_->executor.submit([this]() { impl_->finalizeSession(); }).get();
}

bool Orchestrator::injectUserUtterance(const std::string& text) {
    return impl_->executor.submit([this, text]() { return impl_->injectUtterance(text); }).get();
}

void Orchestrator::handleAudioFrame(const audio::AudioFrame& frame, const audio::VADResult& vad) {
    impl_->executor.post([this, frame, vad]() { impl_->onAudioFrame(frame, vad); });
}

SessionState Orchestrator::state() const {
    return impl_->state.load();
}

bool Orchestrator::isActive() const {
    return parley::isActive(impl_->state.load());
}

std::vector<llm::Message> Orchestrator::history() const {
    return impl_->executor.submit([this]() { return impl_->history.messages(); }).get();
}

std::string Orchestrator::userTranscript() const {
    return impl_->executor.submit([this]() { return impl_->userTranscript; }).get();
}

std::string Orchestrator::aiResponse() const {
    return impl_->executor.submit([this]() { return impl_->aiResponse; }).get();
}

std::vector<std::string> Orchestrator::pendingSentences() const {
    return impl_->executor.submit([this]() {
        return std::vector<std::string>(impl_->sentenceQueue.begin(), impl_->sentenceQueue.end());
    }).get();
}

size_t Orchestrator::prefetchCacheSize() const {
    return impl_->executor.submit([this]() { return impl_->prefetch.cachedCount(); }).get();
}

size_t Orchestrator::prefetchInFlight() const {
    return impl_->executor.submit([this]() { return impl_->prefetch.inFlightCount(); }).get();
}

std::string Orchestrator::lastError() const {
    std::lock_guard<std::mutex> lock(impl_->errorMutex);
    return impl_->lastError;
}

const OrchestratorConfig& Orchestrator::config() const {
    return impl_->config;
}

std::shared_ptr<telemetry::TelemetrySink> Orchestrator::telemetry() const {
    return impl_->telemetry;
}

} // namespace parley
