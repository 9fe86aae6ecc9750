/**
 * AudioIO.hpp - Audio device contract used by the orchestrator
 *
 * Implementations must be thread-safe: frames are delivered from the device
 * thread, playAudio() is called from the speech queue thread while
 * pause/resume/stop arrive from the orchestrator's own thread.
 */

#pragma once

#include "parley/audio/AudioTypes.hpp"

#include <functional>
#include <string>

namespace parley::audio {

struct AudioConfig {
    int sample_rate = 16000;          // capture rate (VAD and STT)
    int output_sample_rate = 24000;   // playback rate (TTS)
    int channels = 1;
    int frames_per_buffer = 320;      // 20 ms at 16 kHz
    int input_device = -1;            // -1 = system default
    int output_device = -1;
    VADMode vad_mode = VADMode::Aggressive;
    int vad_frame_ms = 20;            // libfvad accepts 10, 20 or 30
};

/** Receives each captured frame together with its VAD classification. */
using FrameCallback = std::function<void(const AudioFrame&, const VADResult&)>;

class AudioIO {
public:
    virtual ~AudioIO() = default;

    virtual bool configure(const AudioConfig& config) = 0;
    virtual bool start() = 0;
    virtual void stop() = 0;

    /**
     * Play a chunk. Blocks until it has been played out or playback was
     * stopped; while paused it keeps waiting. Throws std::runtime_error when
     * the device cannot take the audio.
     */
    virtual void playAudio(const AudioChunk& chunk) = 0;

    /** Pause output in place. Returns false if nothing could be paused. */
    virtual bool pausePlayback() = 0;

    /** Resume a paused output. Returns false if playback was not paused. */
    virtual bool resumePlayback() = 0;

    /** Drop queued audio and release any blocked playAudio() call. */
    virtual void stopPlayback() = 0;

    virtual AudioFormat format() const = 0;

    /** Set (or clear, with nullptr) the capture callback. */
    virtual void setFrameCallback(FrameCallback callback) = 0;

    virtual std::string lastError() const = 0;
};

} // namespace parley::audio
