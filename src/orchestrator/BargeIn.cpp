/**
 * BargeIn.cpp - Two-phase interruption of AI speech
 *
 * Confident speech while the AI talks pauses playback (tentative). More
 * confident speech inside the confirmation window cancels the turn; silence
 * until the window closes resumes playback where it stopped.
 */

#include "OrchestratorImpl.hpp"

#include <exception>
#include <iostream>

namespace parley {

bool Orchestrator::Impl::qualifiesAsBargeIn(const audio::VADResult& vad, float threshold) {
    return vad.is_speech && vad.confidence > threshold;
}

void Orchestrator::Impl::beginTentativeBargeIn() {
    if (tentativePause || state != SessionState::AiSpeaking) return;

    if (!services.audio->pausePlayback()) {
        std::cerr << "[BargeIn] Could not pause playback, ignoring speech" << std::endl;
        return;
    }

    std::cout << "[BargeIn] Possible interruption, playback paused" << std::endl;
    tentativePause = true;
    setState(SessionState::Interrupted);

    const uint64_t turn = turnId;
    bargeInTimer.arm(executor, config.timings.barge_in_confirm, [this, turn]() { onBargeInTimeout(turn); });
}

void Orchestrator::Impl::onBargeInTimeout(uint64_t turn) {
    if (!tentativePause || turn != turnId || stopping) return;

    std::cout << "[BargeIn] False alarm, resuming playback" << std::endl;
    resumeFromTentativePause();
}

void Orchestrator::Impl::resumeFromTentativePause() {
    bargeInTimer.cancel();
    tentativePause = false;

    if (services.audio && !services.audio->resumePlayback()) {
        std::cerr << "[BargeIn] Playback was not paused on resume" << std::endl;
    }

    if (state == SessionState::Interrupted) {
        setState(SessionState::AiSpeaking);
    }
}

void Orchestrator::Impl::confirmBargeIn() {
    if (state != SessionState::Interrupted) return;

    std::cout << "[BargeIn] Interruption confirmed, cancelling AI turn" << std::endl;
    bargeInTimer.cancel();
    tentativePause = false;
    recordEvent(telemetry::Event::UserInterrupted);

    cancelTurn();
    services.audio->stopPlayback();

    if (config.flush_synthesizer_on_interrupt) {
        try {
            services.tts->flush();
        } catch (const std::exception& e) {
            std::cerr << "[BargeIn] Synthesizer flush failed: " << e.what() << std::endl;
        }
    }

    setState(SessionState::UserSpeaking);
    resetSilenceTracking();
    userTranscript.clear();
    aiResponse.clear();
    fullResponse.clear();
}

} // namespace parley
