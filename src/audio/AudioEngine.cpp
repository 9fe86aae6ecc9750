/**
 * AudioEngine.cpp - PortAudio wrapper implementation
 *
 * Captures microphone blocks, classifies them with the VAD and hands both to
 * the frame callback. Playback goes through a ring buffer drained by the
 * output callback; playAudio() blocks until its samples were played.
 */

#include "parley/audio/AudioEngine.hpp"
#include "parley/audio/RingBuffer.hpp"
#include "parley/audio/VADProcessor.hpp"

#include <portaudio.h>
#include <iostream>
#include <mutex>
#include <condition_variable>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <cstring>
#include <stdexcept>
#include <string>

namespace parley::audio {

// Playback buffer size (samples)
constexpr size_t PLAYBACK_BUFFER_SECONDS = 10;

struct AudioEngine::Impl {
    PaStream* inputStream = nullptr;
    PaStream* outputStream = nullptr;

    AudioConfig config;
    std::unique_ptr<VADProcessor> vad;

    std::mutex callbackMutex;
    FrameCallback frameCallback;

    std::unique_ptr<RingBuffer<float>> playbackBuffer;
    std::atomic<bool> paused{false};
    std::atomic<uint64_t> stopGeneration{0};
    std::mutex playbackMutex;
    std::condition_variable playbackCv;

    std::atomic<bool> running{false};
    std::atomic<bool> initialized{false};

    mutable std::mutex errorMutex;
    std::string lastError;

    void setError(const std::string& error) {
        std::lock_guard<std::mutex> lock(errorMutex);
        lastError = error;
        std::cerr << "[AudioEngine] " << error << std::endl;
    }

    void rebuild() {
        vad = std::make_unique<VADProcessor>(config.sample_rate, config.vad_mode, config.vad_frame_ms);
        playbackBuffer = std::make_unique<RingBuffer<float>>(
            static_cast<size_t>(config.output_sample_rate) * PLAYBACK_BUFFER_SECONDS);
    }

    void closeStreams() {
        if (inputStream) {
            Pa_StopStream(inputStream);
            Pa_CloseStream(inputStream);
            inputStream = nullptr;
        }
        if (outputStream) {
            Pa_StopStream(outputStream);
            Pa_CloseStream(outputStream);
            outputStream = nullptr;
        }
    }
};

/**
 * PortAudio callback for input stream
 */
static int inputCallback(
    const void* input,
    void* output,
    unsigned long frameCount,
    const PaStreamCallbackTimeInfo* timeInfo,
    PaStreamCallbackFlags statusFlags,
    void* userData
);

/**
 * PortAudio callback for output stream
 */
static int outputCallback(
    const void* input,
    void* output,
    unsigned long frameCount,
    const PaStreamCallbackTimeInfo* timeInfo,
    PaStreamCallbackFlags statusFlags,
    void* userData
);

AudioEngine::AudioEngine(const AudioConfig& config)
    : pImpl_(std::make_unique<Impl>())
{
    pImpl_->config = config;
    pImpl_->rebuild();
}

AudioEngine::~AudioEngine() {
    stop();

    if (pImpl_->initialized) {
        Pa_Terminate();
    }
}

bool AudioEngine::initialize() {
    if (pImpl_->initialized) {
        return true;
    }

    PaError err = Pa_Initialize();
    if (err != paNoError) {
        pImpl_->setError(std::string("Pa_Initialize failed: ") + Pa_GetErrorText(err));
        return false;
    }

    pImpl_->initialized = true;

    // Log available devices
    int numDevices = Pa_GetDeviceCount();
    std::cout << "[AudioEngine] Found " << numDevices << " audio devices" << std::endl;

    int defaultInput = Pa_GetDefaultInputDevice();
    int defaultOutput = Pa_GetDefaultOutputDevice();

    if (defaultInput >= 0) {
        const PaDeviceInfo* info = Pa_GetDeviceInfo(defaultInput);
        std::cout << "[AudioEngine] Default input: " << info->name << std::endl;
    }

    if (defaultOutput >= 0) {
        const PaDeviceInfo* info = Pa_GetDeviceInfo(defaultOutput);
        std::cout << "[AudioEngine] Default output: " << info->name << std::endl;
    }

    return true;
}

bool AudioEngine::configure(const AudioConfig& config) {
    if (pImpl_->running) {
        pImpl_->setError("Cannot reconfigure while running");
        return false;
    }

    pImpl_->config = config;
    pImpl_->rebuild();

    if (!pImpl_->vad->isValid()) {
        pImpl_->setError("VAD rejected sample rate " + std::to_string(config.sample_rate));
        return false;
    }
    return true;
}

bool AudioEngine::start() {
    if (pImpl_->running) {
        return true;
    }

    if (!pImpl_->initialized && !initialize()) {
        return false;
    }

    const AudioConfig& config = pImpl_->config;
    PaError err;

    // Configure input stream
    PaStreamParameters inputParams;
    inputParams.device = (config.input_device >= 0)
        ? config.input_device
        : Pa_GetDefaultInputDevice();

    if (inputParams.device == paNoDevice) {
        pImpl_->setError("No input device available");
        return false;
    }

    inputParams.channelCount = config.channels;
    inputParams.sampleFormat = paFloat32;
    inputParams.suggestedLatency = Pa_GetDeviceInfo(inputParams.device)->defaultLowInputLatency;
    inputParams.hostApiSpecificStreamInfo = nullptr;

    err = Pa_OpenStream(
        &pImpl_->inputStream,
        &inputParams,
        nullptr,  // No output for this stream
        config.sample_rate,
        config.frames_per_buffer,
        paClipOff,
        inputCallback,
        pImpl_.get()
    );

    if (err != paNoError) {
        pImpl_->inputStream = nullptr;
        pImpl_->setError(std::string("Pa_OpenStream (input) failed: ") + Pa_GetErrorText(err));
        return false;
    }

    // Configure output stream at the synthesis rate
    PaStreamParameters outputParams;
    outputParams.device = (config.output_device >= 0)
        ? config.output_device
        : Pa_GetDefaultOutputDevice();

    if (outputParams.device == paNoDevice) {
        pImpl_->setError("No output device available");
        pImpl_->closeStreams();
        return false;
    }

    outputParams.channelCount = 1;
    outputParams.sampleFormat = paFloat32;
    outputParams.suggestedLatency = Pa_GetDeviceInfo(outputParams.device)->defaultLowOutputLatency;
    outputParams.hostApiSpecificStreamInfo = nullptr;

    err = Pa_OpenStream(
        &pImpl_->outputStream,
        nullptr,  // No input for this stream
        &outputParams,
        config.output_sample_rate,
        paFramesPerBufferUnspecified,
        paClipOff,
        outputCallback,
        pImpl_.get()
    );

    if (err != paNoError) {
        pImpl_->outputStream = nullptr;
        pImpl_->setError(std::string("Pa_OpenStream (output) failed: ") + Pa_GetErrorText(err));
        pImpl_->closeStreams();
        return false;
    }

    err = Pa_StartStream(pImpl_->inputStream);
    if (err != paNoError) {
        pImpl_->setError(std::string("Pa_StartStream (input) failed: ") + Pa_GetErrorText(err));
        pImpl_->closeStreams();
        return false;
    }

    err = Pa_StartStream(pImpl_->outputStream);
    if (err != paNoError) {
        pImpl_->setError(std::string("Pa_StartStream (output) failed: ") + Pa_GetErrorText(err));
        pImpl_->closeStreams();
        return false;
    }

    pImpl_->running = true;
    std::cout << "[AudioEngine] Started (capture=" << config.sample_rate
              << "Hz, playback=" << config.output_sample_rate
              << "Hz, buffer=" << config.frames_per_buffer << " frames)" << std::endl;

    return true;
}

void AudioEngine::stop() {
    if (!pImpl_->running) {
        return;
    }

    pImpl_->running = false;
    stopPlayback();
    pImpl_->closeStreams();
    pImpl_->vad->reset();

    std::cout << "[AudioEngine] Stopped" << std::endl;
}

bool AudioEngine::isRunning() const {
    return pImpl_->running;
}

void AudioEngine::playAudio(const AudioChunk& chunk) {
    if (!pImpl_->running) {
        throw std::runtime_error("Audio output is not running");
    }
    if (chunk.samples.empty()) return;

    std::vector<float> samples = resample(chunk.samples, chunk.sample_rate, pImpl_->config.output_sample_rate);

    const uint64_t generation = pImpl_->stopGeneration.load();
    auto stopped = [&]() {
        return pImpl_->stopGeneration.load() != generation || !pImpl_->running;
    };

    size_t offset = 0;
    std::unique_lock<std::mutex> lock(pImpl_->playbackMutex);
    while (offset < samples.size()) {
        if (stopped()) return;

        offset += pImpl_->playbackBuffer->push(samples.data() + offset, samples.size() - offset);
        if (offset < samples.size()) {
            // Buffer full, wait for the output callback to drain some
            pImpl_->playbackCv.wait_for(lock, std::chrono::milliseconds(10));
        }
    }

    // Wait until played out; while paused the output callback does not drain
    while (pImpl_->playbackBuffer->available() > 0) {
        if (stopped()) return;
        pImpl_->playbackCv.wait_for(lock, std::chrono::milliseconds(10));
    }
}

bool AudioEngine::pausePlayback() {
    if (!pImpl_->running) return false;

    bool expected = false;
    if (!pImpl_->paused.compare_exchange_strong(expected, true)) {
        return false;
    }
    std::cout << "[AudioEngine] Playback paused" << std::endl;
    return true;
}

bool AudioEngine::resumePlayback() {
    bool expected = true;
    if (!pImpl_->paused.compare_exchange_strong(expected, false)) {
        return false;
    }
    pImpl_->playbackCv.notify_all();
    std::cout << "[AudioEngine] Playback resumed" << std::endl;
    return true;
}

void AudioEngine::stopPlayback() {
    pImpl_->stopGeneration.fetch_add(1);
    pImpl_->paused = false;
    pImpl_->playbackBuffer->clear();
    pImpl_->playbackCv.notify_all();
}

bool AudioEngine::isPlaying() const {
    return pImpl_->playbackBuffer->available() > 0;
}

AudioFormat AudioEngine::format() const {
    AudioFormat fmt;
    fmt.sample_rate = pImpl_->config.sample_rate;
    fmt.channels = pImpl_->config.channels;
    return fmt;
}

void AudioEngine::setFrameCallback(FrameCallback callback) {
    std::lock_guard<std::mutex> lock(pImpl_->callbackMutex);
    pImpl_->frameCallback = std::move(callback);
}

namespace {

/** Names of devices with at least one channel in the wanted direction, "[index] name". */
std::vector<std::string> deviceNames(bool input) {
    std::vector<std::string> names;
    if (Pa_Initialize() != paNoError) {
        std::cerr << "[AudioEngine] Cannot enumerate devices" << std::endl;
        return names;
    }

    for (int i = 0; i < Pa_GetDeviceCount(); ++i) {
        const PaDeviceInfo* info = Pa_GetDeviceInfo(i);
        if (!info) continue;
        int channels = input ? info->maxInputChannels : info->maxOutputChannels;
        if (channels > 0) {
            names.push_back("[" + std::to_string(i) + "] " + info->name);
        }
    }

    Pa_Terminate();
    return names;
}

} // namespace

std::vector<std::string> AudioEngine::listInputDevices() {
    return deviceNames(true);
}

std::vector<std::string> AudioEngine::listOutputDevices() {
    return deviceNames(false);
}

std::string AudioEngine::lastError() const {
    std::lock_guard<std::mutex> lock(pImpl_->errorMutex);
    return pImpl_->lastError;
}

// ============================================================================
// PortAudio Callbacks
// ============================================================================

static int inputCallback(
    const void* input,
    void* output,
    unsigned long frameCount,
    const PaStreamCallbackTimeInfo* timeInfo,
    PaStreamCallbackFlags statusFlags,
    void* userData
) {
    auto* impl = static_cast<AudioEngine::Impl*>(userData);
    const float* samples = static_cast<const float*>(input);
    if (!samples) return paContinue;

    // Downmix to mono before classification
    const int channels = impl->config.channels;
    AudioFrame frame;
    frame.sample_rate = impl->config.sample_rate;
    frame.samples.resize(frameCount);
    if (channels <= 1) {
        std::memcpy(frame.samples.data(), samples, frameCount * sizeof(float));
    } else {
        for (unsigned long i = 0; i < frameCount; ++i) {
            float sum = 0.0f;
            for (int c = 0; c < channels; ++c) sum += samples[i * channels + c];
            frame.samples[i] = sum / static_cast<float>(channels);
        }
    }

    VADResult vad = impl->vad->classify(frame.samples.data(), frame.samples.size());

    std::lock_guard<std::mutex> lock(impl->callbackMutex);
    if (impl->frameCallback) {
        impl->frameCallback(frame, vad);
    }

    return paContinue;
}

static int outputCallback(
    const void* input,
    void* output,
    unsigned long frameCount,
    const PaStreamCallbackTimeInfo* timeInfo,
    PaStreamCallbackFlags statusFlags,
    void* userData
) {
    auto* impl = static_cast<AudioEngine::Impl*>(userData);
    float* out = static_cast<float*>(output);

    // Paused: hold position and emit silence
    size_t read = 0;
    if (!impl->paused.load()) {
        read = impl->playbackBuffer->pop(out, frameCount);
    }

    // Zero-fill if not enough data
    if (read < frameCount) {
        std::memset(out + read, 0, (frameCount - read) * sizeof(float));
    }

    if (read > 0) {
        impl->playbackCv.notify_all();
    }

    return paContinue;
}

} // namespace parley::audio
