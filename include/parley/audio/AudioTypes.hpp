/**
 * AudioTypes.hpp - Audio data passed between the device, providers and the orchestrator
 */

#pragma once

#include <cstddef>
#include <optional>
#include <vector>

namespace parley::audio {

struct AudioFormat {
    int sample_rate = 16000;
    int channels = 1;
};

/** One block of captured microphone audio (mono float, -1..1). */
struct AudioFrame {
    std::vector<float> samples;
    int sample_rate = 16000;
};

/** Voice activity classification delivered alongside each frame. */
struct VADResult {
    bool is_speech = false;
    float confidence = 0.0f;  // 0..1
};

/** Synthesized audio, either one streamed piece or a complete sentence. */
struct AudioChunk {
    std::vector<float> samples;
    int sample_rate = 24000;
    int sequence = 0;
    bool is_first = false;
    bool is_last = false;
    std::optional<double> time_to_first_byte;  // seconds, set on the first chunk only

    double durationSeconds() const {
        return sample_rate > 0 ? static_cast<double>(samples.size()) / sample_rate : 0.0;
    }
};

/** libfvad aggressiveness modes */
enum class VADMode {
    Quality = 0,
    LowBitrate = 1,
    Aggressive = 2,
    VeryAggressive = 3
};

/**
 * RMS level of a block in dBFS, floored at -60 dB for silence.
 */
float levelDb(const float* samples, size_t count);

/**
 * Join streamed chunks into one chunk spanning the whole sentence.
 * Chunks at a different sample rate than the first are resampled.
 */
AudioChunk concatenate(const std::vector<AudioChunk>& chunks);

/**
 * Linear-interpolation resampler, good enough for speech.
 */
std::vector<float> resample(const std::vector<float>& samples, int from_rate, int to_rate);

} // namespace parley::audio
