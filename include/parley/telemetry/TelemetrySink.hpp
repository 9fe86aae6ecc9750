/**
 * TelemetrySink.hpp - Latency samples and conversation events
 */

#pragma once

namespace parley::telemetry {

enum class LatencyKind {
    SttEmission,     // audio to transcript
    LlmFirstToken,   // utterance finalized to first token
    TtsFirstByte,    // utterance finalized to first audio of the turn
    EndToEndTurn     // utterance finalized to end of the AI's speech
};

enum class Event {
    SessionStarted,
    SessionEnded,
    UserFinishedSpeaking,
    LlmFirstTokenReceived,
    AiFinishedSpeaking,
    UserInterrupted
};

const char* latencyKindName(LatencyKind kind);
const char* eventName(Event event);

/** Implementations must accept calls from any thread. */
class TelemetrySink {
public:
    virtual ~TelemetrySink() = default;

    virtual void recordLatency(LatencyKind kind, double seconds) = 0;
    virtual void recordEvent(Event event) = 0;
};

} // namespace parley::telemetry
