/**
 * SpeechSynthesizer.hpp - Streaming text-to-speech contract
 */

#pragma once

#include "parley/audio/AudioTypes.hpp"
#include "parley/core/Cancellation.hpp"

#include <functional>
#include <string>

namespace parley::tts {

/** Called per synthesized chunk. Return false to stop synthesis. */
using ChunkCallback = std::function<bool(const audio::AudioChunk&)>;

class SpeechSynthesizer {
public:
    virtual ~SpeechSynthesizer() = default;

    /**
     * Synthesize `text`, delivering chunks in order. Blocks until done, the
     * callback returns false or `cancel` fires.
     * Throws std::runtime_error on failure.
     */
    virtual void synthesize(
        const std::string& text,
        ChunkCallback onChunk,
        core::CancellationToken cancel
    ) = 0;

    /** Discard any audio buffered inside the service. */
    virtual void flush() = 0;
};

} // namespace parley::tts
