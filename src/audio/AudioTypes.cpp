/**
 * AudioTypes.cpp - Level metering, chunk joining and resampling helpers
 */

#include "parley/audio/AudioTypes.hpp"

#include <algorithm>
#include <cmath>

namespace parley::audio {

float levelDb(const float* samples, size_t count) {
    if (!samples || count == 0) return -60.0f;

    double sum = 0.0;
    for (size_t i = 0; i < count; ++i) {
        sum += static_cast<double>(samples[i]) * samples[i];
    }
    double rms = std::sqrt(sum / static_cast<double>(count));
    float db = 20.0f * std::log10(std::max(static_cast<float>(rms), 1e-10f));
    return std::max(db, -60.0f);
}

std::vector<float> resample(const std::vector<float>& samples, int from_rate, int to_rate) {
    if (samples.empty() || from_rate <= 0 || to_rate <= 0 || from_rate == to_rate) {
        return samples;
    }

    double ratio = static_cast<double>(to_rate) / from_rate;
    size_t new_size = static_cast<size_t>(samples.size() * ratio);
    std::vector<float> resampled(new_size);

    for (size_t i = 0; i < new_size; i++) {
        double src_pos = i / ratio;
        size_t idx = static_cast<size_t>(src_pos);
        double frac = src_pos - idx;

        if (idx + 1 < samples.size()) {
            resampled[i] = static_cast<float>(samples[idx] * (1.0 - frac) + samples[idx + 1] * frac);
        } else if (idx < samples.size()) {
            resampled[i] = samples[idx];
        }
    }

    return resampled;
}

AudioChunk concatenate(const std::vector<AudioChunk>& chunks) {
    AudioChunk joined;
    joined.is_first = true;
    joined.is_last = true;
    if (chunks.empty()) return joined;

    joined.sample_rate = chunks.front().sample_rate;
    joined.time_to_first_byte = chunks.front().time_to_first_byte;

    size_t total = 0;
    for (const auto& chunk : chunks) total += chunk.samples.size();
    joined.samples.reserve(total);

    for (const auto& chunk : chunks) {
        if (chunk.sample_rate == joined.sample_rate) {
            joined.samples.insert(joined.samples.end(), chunk.samples.begin(), chunk.samples.end());
        } else {
            auto converted = resample(chunk.samples, chunk.sample_rate, joined.sample_rate);
            joined.samples.insert(joined.samples.end(), converted.begin(), converted.end());
        }
    }

    return joined;
}

} // namespace parley::audio
