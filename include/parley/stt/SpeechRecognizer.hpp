/**
 * SpeechRecognizer.hpp - Streaming speech-to-text contract
 */

#pragma once

#include "parley/audio/AudioTypes.hpp"

#include <functional>
#include <string>

namespace parley::stt {

struct STTResult {
    std::string transcript;
    bool is_final = false;
    bool is_end_of_utterance = false;  // final result closing the user's turn
    double latency = 0.0;              // seconds from audio to this result
};

/** May be invoked from any thread. */
using ResultCallback = std::function<void(const STTResult&)>;

class SpeechRecognizer {
public:
    virtual ~SpeechRecognizer() = default;

    /** Open a stream. Throws std::runtime_error when the stream cannot start. */
    virtual void startStreaming(const audio::AudioFormat& format, ResultCallback onResult) = 0;

    /** Forward one captured frame. Throws on send failure. */
    virtual void sendAudio(const audio::AudioFrame& frame) = 0;

    virtual void stopStreaming() = 0;
};

} // namespace parley::stt
