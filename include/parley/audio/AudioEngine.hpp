/**
 * AudioEngine.hpp - PortAudio-backed microphone capture and speech playback
 */

#pragma once

#include "parley/audio/AudioIO.hpp"

#include <memory>
#include <string>
#include <vector>

namespace parley::audio {

class AudioEngine : public AudioIO {
public:
    explicit AudioEngine(const AudioConfig& config = AudioConfig{});
    ~AudioEngine() override;

    AudioEngine(const AudioEngine&) = delete;
    AudioEngine& operator=(const AudioEngine&) = delete;

    /** Initialize PortAudio. Called by start() when needed. */
    bool initialize();

    bool configure(const AudioConfig& config) override;
    bool start() override;
    void stop() override;
    bool isRunning() const;

    void playAudio(const AudioChunk& chunk) override;
    bool pausePlayback() override;
    bool resumePlayback() override;
    void stopPlayback() override;
    bool isPlaying() const;

    AudioFormat format() const override;
    void setFrameCallback(FrameCallback callback) override;
    std::string lastError() const override;

    static std::vector<std::string> listInputDevices();
    static std::vector<std::string> listOutputDevices();

    struct Impl;

private:
    std::unique_ptr<Impl> pImpl_;
};

} // namespace parley::audio
