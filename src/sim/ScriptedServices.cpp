/**
 * ScriptedServices.cpp - Simulated device and scripted providers
 */

#include "ScriptedServices.hpp"

#include "parley/audio/AudioTypes.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <stdexcept>

namespace parley::sim {

namespace {

constexpr float kTwoPi = 6.28318530718f;

std::vector<float> tone(size_t count, int sample_rate, float amplitude, float frequency = 220.0f) {
    std::vector<float> samples(count);
    for (size_t i = 0; i < count; ++i) {
        samples[i] = amplitude * std::sin(kTwoPi * frequency * static_cast<float>(i) / sample_rate);
    }
    return samples;
}

} // namespace

// ============================================================================
// SimulatedAudio
// ============================================================================

SimulatedAudio::SimulatedAudio(int frame_ms, float silence_confidence)
    : frameMs_(frame_ms)
    , silenceConfidence_(silence_confidence)
{}

SimulatedAudio::~SimulatedAudio() {
    stop();
}

bool SimulatedAudio::configure(const audio::AudioConfig& config) {
    if (running_) return false;
    std::lock_guard<std::mutex> lock(mutex_);
    config_ = config;
    return true;
}

bool SimulatedAudio::start() {
    if (running_) return true;
    running_ = true;
    captureThread_ = std::thread(&SimulatedAudio::captureLoop, this);
    std::cout << "[Sim] Audio device started (" << frameMs_ << " ms frames)" << std::endl;
    return true;
}

void SimulatedAudio::stop() {
    if (!running_.exchange(false)) return;
    if (captureThread_.joinable()) {
        captureThread_.join();
    }
    stopPlayback();
}

void SimulatedAudio::captureLoop() {
    const auto period = std::chrono::milliseconds(frameMs_);
    auto next = std::chrono::steady_clock::now();

    while (running_) {
        next += period;
        std::this_thread::sleep_until(next);

        audio::FrameCallback callback;
        audio::AudioFrame frame;
        audio::VADResult vad;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            callback = callback_;

            const auto now = std::chrono::steady_clock::now();
            bursts_.erase(std::remove_if(bursts_.begin(), bursts_.end(),
                                         [now](const Burst& b) { return b.end <= now; }),
                          bursts_.end());

            frame.sample_rate = config_.sample_rate;
            const size_t count = static_cast<size_t>(config_.sample_rate) * frameMs_ / 1000;
            if (!bursts_.empty()) {
                vad.is_speech = true;
                vad.confidence = bursts_.back().confidence;
                frame.samples = tone(count, config_.sample_rate, 0.3f);
            } else {
                vad.is_speech = false;
                vad.confidence = silenceConfidence_;
                frame.samples = tone(count, config_.sample_rate, 0.001f);
            }
        }

        if (callback) callback(frame, vad);
    }
}

void SimulatedAudio::addSpeech(std::chrono::milliseconds duration, float confidence) {
    std::lock_guard<std::mutex> lock(mutex_);
    bursts_.push_back({std::chrono::steady_clock::now() + duration, confidence});
}

void SimulatedAudio::playAudio(const audio::AudioChunk& chunk) {
    if (!running_) {
        throw std::runtime_error("Audio device not running");
    }

    using namespace std::chrono;
    auto remaining = duration_cast<microseconds>(duration<double>(chunk.durationSeconds()));

    std::unique_lock<std::mutex> lock(mutex_);
    const uint64_t generation = stopGeneration_;

    // Advance the play position only while not paused
    while (remaining.count() > 0 && generation == stopGeneration_) {
        if (paused_) {
            cv_.wait(lock);
            continue;
        }
        auto slice = std::min<microseconds>(remaining, milliseconds(5));
        auto start = steady_clock::now();
        cv_.wait_for(lock, slice);
        if (!paused_) {
            remaining -= duration_cast<microseconds>(steady_clock::now() - start);
        }
    }
}

bool SimulatedAudio::pausePlayback() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (paused_) return false;
    paused_ = true;
    return true;
}

bool SimulatedAudio::resumePlayback() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!paused_) return false;
        paused_ = false;
    }
    cv_.notify_all();
    return true;
}

void SimulatedAudio::stopPlayback() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        ++stopGeneration_;
        paused_ = false;
    }
    cv_.notify_all();
}

audio::AudioFormat SimulatedAudio::format() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return {config_.sample_rate, config_.channels};
}

void SimulatedAudio::setFrameCallback(audio::FrameCallback callback) {
    std::lock_guard<std::mutex> lock(mutex_);
    callback_ = std::move(callback);
}

std::string SimulatedAudio::lastError() const {
    return "";
}

// ============================================================================
// ScriptedRecognizer
// ============================================================================

void ScriptedRecognizer::startStreaming(const audio::AudioFormat& format, stt::ResultCallback onResult) {
    std::lock_guard<std::mutex> lock(mutex_);
    callback_ = std::move(onResult);
    std::cout << "[Sim] Recognizer streaming at " << format.sample_rate << " Hz" << std::endl;
}

void ScriptedRecognizer::sendAudio(const audio::AudioFrame&) {
    ++frames_;
}

void ScriptedRecognizer::stopStreaming() {
    std::lock_guard<std::mutex> lock(mutex_);
    callback_ = nullptr;
}

void ScriptedRecognizer::emit(const stt::STTResult& result) {
    stt::ResultCallback callback;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        callback = callback_;
    }
    if (callback) callback(result);
}

// ============================================================================
// ScriptedLanguageModel
// ============================================================================

ScriptedLanguageModel::ScriptedLanguageModel(std::vector<std::string> replies,
                                             int first_token_delay_ms, int token_delay_ms)
    : replies_(replies.begin(), replies.end())
    , firstTokenDelay_(first_token_delay_ms)
    , tokenDelay_(token_delay_ms)
{}

void ScriptedLanguageModel::streamCompletion(
    const std::vector<llm::Message>& messages,
    const llm::LLMConfig&,
    llm::TokenCallback onToken,
    core::CancellationToken cancel
) {
    std::string reply;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!replies_.empty()) {
            reply = replies_.front();
            replies_.pop_front();
        }
    }

    std::cout << "[Sim] LLM request with " << messages.size() << " messages" << std::endl;
    if (!cancel.sleepFor(firstTokenDelay_)) return;

    const std::string errorPrefix = "!error:";
    if (reply.compare(0, errorPrefix.size(), errorPrefix) == 0) {
        throw std::runtime_error(reply.substr(errorPrefix.size()));
    }

    // One token per word, trailing space attached
    size_t pos = 0;
    while (pos < reply.size()) {
        size_t end = reply.find(' ', pos);
        end = (end == std::string::npos) ? reply.size() : end + 1;

        if (!onToken({reply.substr(pos, end - pos), false})) return;
        pos = end;

        if (!cancel.sleepFor(tokenDelay_)) return;
    }

    onToken({"", true});
}

// ============================================================================
// ScriptedSynthesizer
// ============================================================================

ScriptedSynthesizer::ScriptedSynthesizer(int synthesis_delay_ms, int speech_ms_per_char, int sample_rate)
    : delay_(synthesis_delay_ms)
    , msPerChar_(speech_ms_per_char)
    , sampleRate_(sample_rate)
{}

void ScriptedSynthesizer::synthesize(
    const std::string& text,
    tts::ChunkCallback onChunk,
    core::CancellationToken cancel
) {
    auto started = std::chrono::steady_clock::now();
    if (!cancel.sleepFor(delay_)) return;
    ++synthesized_;

    const size_t total = static_cast<size_t>(text.size()) * msPerChar_ * sampleRate_ / 1000;
    const size_t half = total / 2;

    audio::AudioChunk first;
    first.samples = tone(half, sampleRate_, 0.1f);
    first.sample_rate = sampleRate_;
    first.sequence = 0;
    first.is_first = true;
    first.time_to_first_byte =
        std::chrono::duration<double>(std::chrono::steady_clock::now() - started).count();
    if (!onChunk(first) || cancel.isCancelled()) return;

    audio::AudioChunk last;
    last.samples = tone(total - half, sampleRate_, 0.1f);
    last.sample_rate = sampleRate_;
    last.sequence = 1;
    last.is_last = true;
    onChunk(last);
}

void ScriptedSynthesizer::flush() {
    std::cout << "[Sim] Synthesizer flushed" << std::endl;
}

} // namespace parley::sim
