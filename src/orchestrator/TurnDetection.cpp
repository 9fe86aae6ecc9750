/**
 * TurnDetection.cpp - Deciding when the user has finished speaking
 *
 * Two paths end an utterance: the recognizer flags end-of-utterance on a
 * final result, or VAD reports silence for silence_timeout after speech.
 */

#include "OrchestratorImpl.hpp"

#include <exception>
#include <iostream>

namespace parley {

void Orchestrator::Impl::onAudioFrame(const audio::AudioFrame& frame, const audio::VADResult& vad) {
    if (!parley::isActive(state) || stopping) return;

    if (callbacks.onAudioLevel && !frame.samples.empty()) {
        callbacks.onAudioLevel(audio::levelDb(frame.samples.data(), frame.samples.size()));
    }

    switch (state.load()) {
        case SessionState::UserSpeaking: {
            try {
                services.stt->sendAudio(frame);
            } catch (const std::exception& e) {
                std::cerr << "[Orchestrator] STT send failed: " << e.what() << std::endl;
            }

            if (vad.is_speech) {
                if (!hasDetectedSpeech) {
                    std::cout << "[Orchestrator] Speech started" << std::endl;
                }
                hasDetectedSpeech = true;
                silenceStart.reset();
                silenceTimer.cancel();
            } else if (hasDetectedSpeech && !silenceStart) {
                silenceStart = SteadyClock::now();
                silenceTimer.arm(executor, config.timings.silence_timeout, [this]() { onSilenceTimeout(); });
            }
            break;
        }

        case SessionState::AiSpeaking:
            if (config.enable_interruptions && !speechFinished &&
                qualifiesAsBargeIn(vad, config.barge_in_threshold)) {
                beginTentativeBargeIn();
            }
            break;

        case SessionState::Interrupted:
            if (qualifiesAsBargeIn(vad, config.barge_in_threshold)) {
                confirmBargeIn();
            }
            break;

        default:
            break;
    }
}

void Orchestrator::Impl::onSilenceTimeout() {
    if (state != SessionState::UserSpeaking || stopping) return;

    if (userTranscript.empty()) {
        // Speech without words (cough, noise): keep listening
        std::cerr << "[Orchestrator] Silence after speech but no transcript, still listening" << std::endl;
        silenceStart.reset();
        hasDetectedSpeech = false;
        return;
    }

    std::cout << "[Orchestrator] Silence timeout, finalizing utterance" << std::endl;
    resetSilenceTracking();
    processUserUtterance(userTranscript);
}

void Orchestrator::Impl::handleSttResult(uint64_t session, const stt::STTResult& result) {
    if (session != sessionId || stopping || !parley::isActive(state)) return;

    userTranscript = result.transcript;
    if (callbacks.onTranscript) {
        callbacks.onTranscript(result.transcript, result.is_final);
    }
    recordLatency(telemetry::LatencyKind::SttEmission, result.latency);

    if (result.is_final && result.is_end_of_utterance && !result.transcript.empty() &&
        state == SessionState::UserSpeaking) {
        std::cout << "[Orchestrator] End of utterance: \"" << preview(result.transcript) << "\"" << std::endl;
        resetSilenceTracking();
        processUserUtterance(result.transcript);
    }
}

bool Orchestrator::Impl::injectUtterance(const std::string& text) {
    if (stopping || state != SessionState::UserSpeaking) {
        std::cerr << "[Orchestrator] Cannot inject utterance in state " << stateName(state) << std::endl;
        return false;
    }

    userTranscript = text;
    resetSilenceTracking();
    processUserUtterance(text);
    return true;
}

void Orchestrator::Impl::processUserUtterance(const std::string& transcript) {
    if (state != SessionState::UserSpeaking) return;

    resetSilenceTracking();
    turnStart = SteadyClock::now();

    std::cout << "[Orchestrator] User: \"" << preview(transcript) << "\"" << std::endl;
    history.appendUser(transcript);
    recordEvent(telemetry::Event::UserFinishedSpeaking);

    setState(SessionState::ProcessingUserUtterance);
    if (callbacks.onUserUtterance) {
        callbacks.onUserUtterance(transcript);
    }

    beginGeneration();
}

} // namespace parley
