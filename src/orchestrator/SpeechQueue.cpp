/**
 * SpeechQueue.cpp - Ordered sentence playback with prefetching
 *
 * One processor thread per turn pulls sentences from the queue in order.
 * Audio for upcoming sentences is synthesized ahead on separate threads and
 * kept in the prefetch cache until the processor reaches them.
 */

#include "OrchestratorImpl.hpp"

#include <exception>
#include <future>
#include <iostream>

namespace parley {

tts::PrefetchResult synthesizeSentence(tts::SpeechSynthesizer& synthesizer,
                                       const std::string& text,
                                       core::CancellationToken cancel) {
    std::vector<audio::AudioChunk> chunks;
    try {
        synthesizer.synthesize(text,
            [&chunks, &cancel](const audio::AudioChunk& chunk) {
                if (cancel.isCancelled()) return false;
                chunks.push_back(chunk);
                return true;
            },
            cancel);
    } catch (const std::exception& e) {
        std::cerr << "[SpeechQueue] Synthesis failed for \"" << preview(text, 30) << "\": "
                  << e.what() << std::endl;
        return std::nullopt;
    }

    if (cancel.isCancelled() || chunks.empty()) return std::nullopt;
    return audio::concatenate(chunks);
}

void Orchestrator::Impl::enqueueSentence(const std::string& sentence) {
    sentenceQueue.push_back(sentence);
    std::cout << "[SpeechQueue] Queued: \"" << preview(sentence) << "\" (queue=" << sentenceQueue.size()
              << ")" << std::endl;

    if (callbacks.onSentenceQueued) {
        callbacks.onSentenceQueued(sentence);
    }

    if (withinPrefetchWindow(sentenceQueue.size() - 1)) {
        startPrefetch(sentence);
    }
}

bool Orchestrator::Impl::withinPrefetchWindow(size_t index) const {
    if (!config.playback.enable_prefetch) return false;
    size_t ahead = index + (speechPlaying ? 1 : 0);
    return ahead <= static_cast<size_t>(config.playback.prefetch_depth);
}

void Orchestrator::Impl::prefetchUpcoming() {
    for (size_t i = 0; i < sentenceQueue.size() && withinPrefetchWindow(i); ++i) {
        startPrefetch(sentenceQueue[i]);
    }
}

void Orchestrator::Impl::startPrefetch(const std::string& text) {
    if (!turnCancel || !services.tts || prefetch.contains(text)) return;

    auto cancel = std::make_shared<core::CancellationSource>(turnCancel->token());
    auto promise = std::make_shared<std::promise<tts::PrefetchResult>>();
    tts::PrefetchFuture future = promise->get_future().share();

    if (!prefetch.tryBegin(text, future, cancel)) return;

    const uint64_t turn = turnId;
    core::CancellationToken token = cancel->token();
    std::cout << "[SpeechQueue] Prefetching: \"" << preview(text, 30) << "\"" << std::endl;

    tasks.spawn("prefetch", [this, synthesizer = services.tts, text, turn, token, promise]() {
        tts::PrefetchResult result = synthesizeSentence(*synthesizer, text, token);
        promise->set_value(result);
        if (!token.isCancelled()) {
            executor.post([this, turn, text, result]() { storePrefetch(turn, text, result); });
        }
    });
}

void Orchestrator::Impl::storePrefetch(uint64_t turn, const std::string& text, tts::PrefetchResult result) {
    if (turn != turnId) return;
    if (prefetch.complete(text, std::move(result))) {
        std::cout << "[SpeechQueue] Prefetched: \"" << preview(text, 30) << "\"" << std::endl;
    }
}

void Orchestrator::Impl::runSpeechQueue(SessionServices turnServices, uint64_t turn, core::CancellationToken cancel) {
    while (!cancel.isCancelled()) {
        SpeechStep step;
        try {
            step = executor.submit([this, turn]() { return nextSentence(turn); }).get();
        } catch (const std::future_error&) {
            return;  // executor shut down
        }

        switch (step.kind) {
            case SpeechStep::Kind::Stop:
                return;

            case SpeechStep::Kind::Done:
                executor.post([this, turn]() { finishTurn(turn); });
                return;

            case SpeechStep::Kind::Wait:
                cancel.sleepFor(config.timings.queue_poll);
                break;

            case SpeechStep::Kind::Play:
                playSentence(turnServices, turn, step, cancel);
                if (cancel.isCancelled()) return;

                executor.post([this, turn]() { sentenceFinished(turn); });

                if (config.playback.inter_sentence_silence_ms > 0 &&
                    !cancel.sleepFor(std::chrono::milliseconds(config.playback.inter_sentence_silence_ms))) {
                    return;
                }
                break;
        }
    }
}

Orchestrator::Impl::SpeechStep Orchestrator::Impl::nextSentence(uint64_t turn) {
    SpeechStep step;
    if (turn != turnId || stopping) {
        step.kind = SpeechStep::Kind::Stop;
        return step;
    }

    if (sentenceQueue.empty()) {
        step.kind = generationComplete ? SpeechStep::Kind::Done : SpeechStep::Kind::Wait;
        return step;
    }

    step.kind = SpeechStep::Kind::Play;
    step.text = sentenceQueue.front();
    sentenceQueue.pop_front();
    speechPlaying = true;

    step.first_sentence = firstSentence;
    firstSentence = false;

    if (auto cached = prefetch.takeCached(step.text)) {
        std::cout << "[SpeechQueue] Playing (cached): \"" << preview(step.text) << "\"" << std::endl;
        step.cached = std::move(cached);
    } else if (auto pending = prefetch.inFlight(step.text)) {
        std::cout << "[SpeechQueue] Playing (awaiting prefetch): \"" << preview(step.text) << "\"" << std::endl;
        step.pending = std::move(pending);
        prefetch.release(step.text);
    } else {
        std::cout << "[SpeechQueue] Playing: \"" << preview(step.text) << "\"" << std::endl;
    }

    prefetchUpcoming();
    return step;
}

void Orchestrator::Impl::playSentence(const SessionServices& turnServices, uint64_t turn,
                                      const SpeechStep& step, core::CancellationToken cancel) {
    auto markFirstAudio = [this, turn, first = step.first_sentence]() {
        if (first) executor.post([this, turn]() { firstAudioReady(turn); });
    };

    std::optional<audio::AudioChunk> ready = step.cached;

    if (!ready && step.pending) {
        const tts::PrefetchFuture& future = *step.pending;
        while (future.wait_for(std::chrono::milliseconds(10)) != std::future_status::ready) {
            if (cancel.isCancelled()) return;
        }
        ready = future.get();
        if (!ready) {
            std::cerr << "[SpeechQueue] Prefetch produced no audio, synthesizing directly" << std::endl;
        }
    }

    if (cancel.isCancelled()) return;

    if (ready) {
        markFirstAudio();
        playChunk(*turnServices.audio, *ready);
        return;
    }

    // Cold path: stream each chunk to the device as it arrives
    bool firstChunk = true;
    try {
        turnServices.tts->synthesize(step.text,
            [&](const audio::AudioChunk& chunk) {
                if (cancel.isCancelled()) return false;
                if (firstChunk) {
                    firstChunk = false;
                    markFirstAudio();
                }
                playChunk(*turnServices.audio, chunk);
                return !cancel.isCancelled();
            },
            cancel);
    } catch (const std::exception& e) {
        std::cerr << "[SpeechQueue] Synthesis failed for \"" << preview(step.text, 30) << "\": "
                  << e.what() << std::endl;
    }
}

void Orchestrator::Impl::playChunk(audio::AudioIO& output, const audio::AudioChunk& chunk) {
    if (chunk.samples.empty()) return;
    try {
        output.playAudio(chunk);
    } catch (const std::exception& e) {
        std::cerr << "[SpeechQueue] Playback failed: " << e.what() << std::endl;
    }
}

void Orchestrator::Impl::firstAudioReady(uint64_t turn) {
    if (turn != turnId || !turnStart) return;
    recordLatency(telemetry::LatencyKind::TtsFirstByte, secondsSince(*turnStart));
}

void Orchestrator::Impl::sentenceFinished(uint64_t turn) {
    if (turn != turnId) return;
    speechPlaying = false;
}

void Orchestrator::Impl::finishTurn(uint64_t turn) {
    if (turn != turnId || stopping) return;

    if (tentativePause) {
        // Unconfirmed pause over the tail of the answer
        resumeFromTentativePause();
    }

    prefetch.clear();
    speechPlaying = false;
    speechFinished = true;

    if (turnStart) {
        recordLatency(telemetry::LatencyKind::EndToEndTurn, secondsSince(*turnStart));
    }
    recordEvent(telemetry::Event::AiFinishedSpeaking);
    std::cout << "[SpeechQueue] Turn finished, cooling down" << std::endl;

    cooldownTimer.arm(executor, config.timings.post_turn_cooldown, [this, turn]() { completeTurn(turn); });
}

void Orchestrator::Impl::completeTurn(uint64_t turn) {
    if (turn != turnId || stopping) return;
    if (state != SessionState::AiSpeaking) return;

    resetSilenceTracking();
    userTranscript.clear();
    setState(SessionState::UserSpeaking);
}

} // namespace parley
