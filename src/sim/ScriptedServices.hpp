/**
 * ScriptedServices.hpp - Simulated device and scripted providers for parley_sim
 */

#pragma once

#include "Scenario.hpp"

#include "parley/audio/AudioIO.hpp"
#include "parley/llm/LanguageModel.hpp"
#include "parley/stt/SpeechRecognizer.hpp"
#include "parley/tts/SpeechSynthesizer.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <thread>
#include <vector>

namespace parley::sim {

/**
 * Audio device without hardware. Capture emits one frame every frame_ms,
 * classified as speech inside scheduled bursts. Playback takes as long as
 * the audio lasts and honors pause/stop like a real device.
 */
class SimulatedAudio : public audio::AudioIO {
public:
    SimulatedAudio(int frame_ms, float silence_confidence);
    ~SimulatedAudio() override;

    bool configure(const audio::AudioConfig& config) override;
    bool start() override;
    void stop() override;

    void playAudio(const audio::AudioChunk& chunk) override;
    bool pausePlayback() override;
    bool resumePlayback() override;
    void stopPlayback() override;

    audio::AudioFormat format() const override;
    void setFrameCallback(audio::FrameCallback callback) override;
    std::string lastError() const override;

    /** Report speech starting now for `duration`. */
    void addSpeech(std::chrono::milliseconds duration, float confidence);

private:
    struct Burst {
        std::chrono::steady_clock::time_point end;
        float confidence;
    };

    void captureLoop();

    const int frameMs_;
    const float silenceConfidence_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    audio::AudioConfig config_;
    audio::FrameCallback callback_;
    std::vector<Burst> bursts_;
    bool paused_ = false;
    uint64_t stopGeneration_ = 0;

    std::atomic<bool> running_{false};
    std::thread captureThread_;
};

/** Recognizer whose results come from the scenario timeline. */
class ScriptedRecognizer : public stt::SpeechRecognizer {
public:
    void startStreaming(const audio::AudioFormat& format, stt::ResultCallback onResult) override;
    void sendAudio(const audio::AudioFrame& frame) override;
    void stopStreaming() override;

    void emit(const stt::STTResult& result);
    size_t framesReceived() const { return frames_.load(); }

private:
    std::mutex mutex_;
    stt::ResultCallback callback_;
    std::atomic<size_t> frames_{0};
};

/** Streams the next scripted reply word by word. */
class ScriptedLanguageModel : public llm::LanguageModel {
public:
    ScriptedLanguageModel(std::vector<std::string> replies, int first_token_delay_ms, int token_delay_ms);

    void streamCompletion(
        const std::vector<llm::Message>& messages,
        const llm::LLMConfig& config,
        llm::TokenCallback onToken,
        core::CancellationToken cancel
    ) override;

private:
    std::mutex mutex_;
    std::deque<std::string> replies_;
    const std::chrono::milliseconds firstTokenDelay_;
    const std::chrono::milliseconds tokenDelay_;
};

/** Produces a quiet tone whose length follows the text length. */
class ScriptedSynthesizer : public tts::SpeechSynthesizer {
public:
    ScriptedSynthesizer(int synthesis_delay_ms, int speech_ms_per_char, int sample_rate = 24000);

    void synthesize(
        const std::string& text,
        tts::ChunkCallback onChunk,
        core::CancellationToken cancel
    ) override;

    void flush() override;

    size_t synthesisCount() const { return synthesized_.load(); }

private:
    const std::chrono::milliseconds delay_;
    const int msPerChar_;
    const int sampleRate_;
    std::atomic<size_t> synthesized_{0};
};

} // namespace parley::sim
