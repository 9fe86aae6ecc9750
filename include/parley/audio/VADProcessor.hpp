/**
 * VADProcessor.hpp - Per-frame voice activity classification via libfvad
 */

#pragma once

#include "parley/audio/AudioTypes.hpp"

#include <cstddef>
#include <memory>

namespace parley::audio {

class VADProcessor {
public:
    /**
     * @param sample_rate 8000, 16000, 32000 or 48000
     * @param mode libfvad aggressiveness
     * @param frame_ms libfvad sub-frame length: 10, 20 or 30
     */
    VADProcessor(int sample_rate, VADMode mode = VADMode::Aggressive, int frame_ms = 20);
    ~VADProcessor();

    VADProcessor(const VADProcessor&) = delete;
    VADProcessor& operator=(const VADProcessor&) = delete;

    /**
     * Classify one captured block. The block is cut into libfvad sub-frames
     * (leftover samples carry over to the next call); is_speech holds when at
     * least half of them are speech, confidence is the speech fraction
     * averaged over the last few blocks.
     */
    VADResult classify(const float* samples, size_t count);

    /** Number of recent blocks averaged into the confidence (default 3). */
    void setSmoothingWindow(int blocks);

    bool isValid() const;
    bool isSpeaking() const;
    void reset();

private:
    struct Impl;
    std::unique_ptr<Impl> pImpl_;
};

} // namespace parley::audio
