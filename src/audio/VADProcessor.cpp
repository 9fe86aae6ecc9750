/**
 * VADProcessor.cpp - Voice Activity Detection via libfvad
 *
 * Classifies each captured block as speech or silence with a confidence.
 * Requires libfvad to be installed.
 */

#include "parley/audio/VADProcessor.hpp"

#include <fvad.h>
#include <iostream>
#include <algorithm>
#include <cstdint>
#include <deque>
#include <numeric>
#include <vector>

namespace parley::audio {

struct VADProcessor::Impl {
    Fvad* vad = nullptr;

    int sample_rate;
    VADMode mode;
    int frame_ms;
    int frame_samples;  // Samples per libfvad sub-frame

    // Sub-frame accumulation across blocks
    std::vector<float> frameBuffer;
    std::vector<int16_t> frame16;

    // Confidence smoothing
    std::deque<float> recentFractions;
    size_t smoothingWindow = 3;

    VADResult last;

    // Returns 1 for speech, 0 for silence, -1 on error
    int processFrame() {
        for (int i = 0; i < frame_samples; ++i) {
            float sample = std::clamp(frameBuffer[i], -1.0f, 1.0f);
            frame16[i] = static_cast<int16_t>(sample * 32767.0f);
        }
        frameBuffer.erase(frameBuffer.begin(), frameBuffer.begin() + frame_samples);
        return fvad_process(vad, frame16.data(), static_cast<size_t>(frame_samples));
    }
};

VADProcessor::VADProcessor(int sample_rate, VADMode mode, int frame_ms)
    : pImpl_(std::make_unique<Impl>())
{
    pImpl_->sample_rate = sample_rate;
    pImpl_->mode = mode;
    pImpl_->frame_ms = frame_ms;
    pImpl_->frame_samples = (sample_rate * frame_ms) / 1000;

    pImpl_->frameBuffer.reserve(pImpl_->frame_samples * 2);
    pImpl_->frame16.resize(pImpl_->frame_samples);

    // Initialize libfvad
    pImpl_->vad = fvad_new();
    if (!pImpl_->vad) {
        std::cerr << "[VADProcessor] Failed to create fvad instance" << std::endl;
        return;
    }

    if (fvad_set_sample_rate(pImpl_->vad, sample_rate) < 0) {
        std::cerr << "[VADProcessor] Invalid sample rate: " << sample_rate << std::endl;
        fvad_free(pImpl_->vad);
        pImpl_->vad = nullptr;
        return;
    }

    if (fvad_set_mode(pImpl_->vad, static_cast<int>(mode)) < 0) {
        std::cerr << "[VADProcessor] Invalid mode" << std::endl;
    }

    std::cout << "[VADProcessor] Initialized (sample_rate=" << sample_rate
              << "Hz, frame=" << frame_ms << "ms, mode=" << static_cast<int>(mode) << ")"
              << std::endl;
}

VADProcessor::~VADProcessor() {
    if (pImpl_->vad) {
        fvad_free(pImpl_->vad);
    }
}

VADResult VADProcessor::classify(const float* samples, size_t count) {
    if (!pImpl_->vad || pImpl_->frame_samples <= 0) return {};

    pImpl_->frameBuffer.insert(pImpl_->frameBuffer.end(), samples, samples + count);

    int frames = 0;
    int speechFrames = 0;
    while (pImpl_->frameBuffer.size() >= static_cast<size_t>(pImpl_->frame_samples)) {
        int result = pImpl_->processFrame();
        if (result < 0) {
            std::cerr << "[VADProcessor] fvad_process failed" << std::endl;
            continue;
        }
        ++frames;
        if (result == 1) ++speechFrames;
    }

    // Block shorter than a sub-frame: keep the previous verdict
    if (frames == 0) return pImpl_->last;

    float fraction = static_cast<float>(speechFrames) / static_cast<float>(frames);

    pImpl_->recentFractions.push_back(fraction);
    while (pImpl_->recentFractions.size() > pImpl_->smoothingWindow) {
        pImpl_->recentFractions.pop_front();
    }

    float sum = std::accumulate(pImpl_->recentFractions.begin(), pImpl_->recentFractions.end(), 0.0f);

    VADResult result;
    result.is_speech = fraction >= 0.5f;
    result.confidence = sum / static_cast<float>(pImpl_->recentFractions.size());
    pImpl_->last = result;
    return result;
}

void VADProcessor::setSmoothingWindow(int blocks) {
    pImpl_->smoothingWindow = static_cast<size_t>(std::max(1, blocks));
}

bool VADProcessor::isValid() const {
    return pImpl_->vad != nullptr;
}

bool VADProcessor::isSpeaking() const {
    return pImpl_->last.is_speech;
}

void VADProcessor::reset() {
    pImpl_->frameBuffer.clear();
    pImpl_->recentFractions.clear();
    pImpl_->last = {};

    // fvad_reset also restores the default rate and mode
    if (pImpl_->vad) {
        fvad_reset(pImpl_->vad);
        fvad_set_sample_rate(pImpl_->vad, pImpl_->sample_rate);
        fvad_set_mode(pImpl_->vad, static_cast<int>(pImpl_->mode));
    }
}

} // namespace parley::audio
