/**
 * MockServices.hpp - Controllable collaborators for orchestrator tests
 *
 * Every mock writes what happened to a shared EventLog so tests can check
 * ordering across threads ("play-start:...", "synth-end:...", ...).
 */

#pragma once

#include "parley/Orchestrator.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <iostream>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace parley::testing {

class EventLog {
public:
    using Clock = std::chrono::steady_clock;

    void add(const std::string& event) {
        std::lock_guard<std::mutex> lock(mutex_);
        events_.push_back(event);
        times_.push_back(Clock::now());
    }

    std::vector<std::string> snapshot() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return events_;
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return events_.size();
    }

    /** Position of the first `event`, or -1. */
    int indexOf(const std::string& event) const {
        std::lock_guard<std::mutex> lock(mutex_);
        for (size_t i = 0; i < events_.size(); ++i) {
            if (events_[i] == event) return static_cast<int>(i);
        }
        return -1;
    }

    /** Position of the last `event`, or -1. */
    int lastIndexOf(const std::string& event) const {
        std::lock_guard<std::mutex> lock(mutex_);
        for (size_t i = events_.size(); i > 0; --i) {
            if (events_[i - 1] == event) return static_cast<int>(i - 1);
        }
        return -1;
    }

    /** When `event` was first logged. */
    std::optional<Clock::time_point> timeOf(const std::string& event) const {
        std::lock_guard<std::mutex> lock(mutex_);
        for (size_t i = 0; i < events_.size(); ++i) {
            if (events_[i] == event) return times_[i];
        }
        return std::nullopt;
    }

    size_t count(const std::string& event) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return static_cast<size_t>(std::count(events_.begin(), events_.end(), event));
    }

    /** Payloads of events starting with `prefix`, consecutive repeats merged. */
    std::vector<std::string> sequence(const std::string& prefix) const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<std::string> out;
        for (const auto& e : events_) {
            if (e.compare(0, prefix.size(), prefix) != 0) continue;
            std::string payload = e.substr(prefix.size());
            if (out.empty() || out.back() != payload) out.push_back(payload);
        }
        return out;
    }

    void print() const {
        for (const auto& e : snapshot()) std::cout << "    " << e << "\n";
    }

private:
    mutable std::mutex mutex_;
    std::vector<std::string> events_;
    std::vector<Clock::time_point> times_;
};

/** Poll `pred` until it holds or `timeout` passes. */
template <typename Pred>
bool waitFor(Pred pred, std::chrono::milliseconds timeout = std::chrono::milliseconds(3000)) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred()) return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(2));
    }
    return pred();
}

// ============================================================================
// Synthesizer: audio samples carry the id of their text
// ============================================================================

class MockTTS : public tts::SpeechSynthesizer {
public:
    static constexpr int kSampleRate = 1000;

    explicit MockTTS(EventLog& log) : log_(log) {}

    int synthesis_delay_ms = 20;
    int ms_per_char = 5;                            // played length of the audio
    std::map<std::string, int> delay_for;           // per-text synthesis delay override
    std::set<std::string> fail_for;                 // texts that throw

    void synthesize(const std::string& text, tts::ChunkCallback onChunk,
                    core::CancellationToken cancel) override {
        int id = idFor(text);
        int delay = synthesis_delay_ms;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = delay_for.find(text);
            if (it != delay_for.end()) delay = it->second;
            ++calls_[text];
        }

        log_.add("synth-start:" + text);
        if (!cancel.sleepFor(std::chrono::milliseconds(delay))) {
            log_.add("synth-cancelled:" + text);
            return;
        }
        if (fail_for.count(text)) {
            log_.add("synth-failed:" + text);
            throw std::runtime_error("synthesis failed");
        }

        size_t total = std::max<size_t>(2, text.size() * ms_per_char * kSampleRate / 1000);
        audio::AudioChunk first;
        first.samples.assign(total / 2, static_cast<float>(id));
        first.sample_rate = kSampleRate;
        first.is_first = true;
        first.time_to_first_byte = delay / 1000.0;

        audio::AudioChunk last;
        last.samples.assign(total - total / 2, static_cast<float>(id));
        last.sample_rate = kSampleRate;
        last.sequence = 1;
        last.is_last = true;

        log_.add("synth-end:" + text);
        if (!onChunk(first)) return;
        onChunk(last);
    }

    void flush() override { ++flushes; }

    /** Text whose audio `chunk` holds. */
    std::string textFor(const audio::AudioChunk& chunk) const {
        if (chunk.samples.empty()) return "";
        std::lock_guard<std::mutex> lock(mutex_);
        int id = static_cast<int>(chunk.samples.front());
        return (id >= 0 && id < static_cast<int>(texts_.size())) ? texts_[id] : "";
    }

    int calls(const std::string& text) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = calls_.find(text);
        return it == calls_.end() ? 0 : it->second;
    }

    std::atomic<int> flushes{0};

private:
    int idFor(const std::string& text) {
        std::lock_guard<std::mutex> lock(mutex_);
        for (size_t i = 0; i < texts_.size(); ++i) {
            if (texts_[i] == text) return static_cast<int>(i);
        }
        texts_.push_back(text);
        return static_cast<int>(texts_.size() - 1);
    }

    EventLog& log_;
    mutable std::mutex mutex_;
    std::vector<std::string> texts_;
    std::map<std::string, int> calls_;
};

// ============================================================================
// Audio device: playback lasts as long as the audio, pause-aware
// ============================================================================

class MockAudio : public audio::AudioIO {
public:
    MockAudio(EventLog& log, const MockTTS& tts) : log_(log), tts_(tts) {}

    bool fail_configure = false;
    bool fail_start = false;
    bool allow_pause = true;

    bool configure(const audio::AudioConfig& config) override {
        ++configures;
        if (fail_configure) return false;
        format_ = {config.sample_rate, config.channels};
        return true;
    }

    bool start() override {
        if (fail_start) return false;
        running = true;
        return true;
    }

    void stop() override {
        running = false;
        ++stops;
    }

    void playAudio(const audio::AudioChunk& chunk) override {
        const std::string text = tts_.textFor(chunk);
        log_.add("play-start:" + text);

        using namespace std::chrono;
        auto remaining = duration_cast<microseconds>(duration<double>(chunk.durationSeconds()));

        std::unique_lock<std::mutex> lock(mutex_);
        const uint64_t generation = generation_;
        while (remaining.count() > 0 && generation == generation_) {
            if (paused_) {
                cv_.wait(lock);
                continue;
            }
            auto slice = std::min<microseconds>(remaining, milliseconds(2));
            auto start = steady_clock::now();
            cv_.wait_for(lock, slice);
            if (!paused_) remaining -= duration_cast<microseconds>(steady_clock::now() - start);
        }
        bool stopped = generation != generation_;
        lock.unlock();

        log_.add((stopped ? "play-stopped:" : "play-end:") + text);
    }

    bool pausePlayback() override {
        std::lock_guard<std::mutex> lock(mutex_);
        ++pauses;
        if (!allow_pause || paused_) return false;
        paused_ = true;
        log_.add("pause");
        return true;
    }

    bool resumePlayback() override {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            ++resumes;
            if (!paused_) return false;
            paused_ = false;
            log_.add("resume");
        }
        cv_.notify_all();
        return true;
    }

    void stopPlayback() override {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            ++playbackStops;
            ++generation_;
            paused_ = false;
        }
        cv_.notify_all();
    }

    audio::AudioFormat format() const override { return format_; }

    void setFrameCallback(audio::FrameCallback callback) override {
        std::lock_guard<std::mutex> lock(mutex_);
        callback_ = std::move(callback);
    }

    std::string lastError() const override { return fail_start ? "device busy" : ""; }

    /** Deliver one 20 ms frame through the registered callback. */
    void emitFrame(bool is_speech, float confidence) {
        audio::FrameCallback callback;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            callback = callback_;
        }
        if (!callback) return;

        audio::AudioFrame frame;
        frame.sample_rate = format_.sample_rate;
        frame.samples.assign(320, is_speech ? 0.2f : 0.0f);
        callback(frame, {is_speech, confidence});
    }

    bool isPaused() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return paused_;
    }

    bool hasCallback() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return static_cast<bool>(callback_);
    }

    std::atomic<bool> running{false};
    std::atomic<int> configures{0};
    std::atomic<int> stops{0};
    std::atomic<int> pauses{0};
    std::atomic<int> resumes{0};
    std::atomic<int> playbackStops{0};

private:
    EventLog& log_;
    const MockTTS& tts_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    audio::FrameCallback callback_;
    audio::AudioFormat format_;
    bool paused_ = false;
    uint64_t generation_ = 0;
};

// ============================================================================
// Recognizer
// ============================================================================

class MockSTT : public stt::SpeechRecognizer {
public:
    bool fail_start = false;

    void startStreaming(const audio::AudioFormat&, stt::ResultCallback onResult) override {
        if (fail_start) throw std::runtime_error("recognizer unavailable");
        std::lock_guard<std::mutex> lock(mutex_);
        callback_ = std::move(onResult);
        ++starts;
    }

    void sendAudio(const audio::AudioFrame&) override { ++frames; }

    void stopStreaming() override {
        std::lock_guard<std::mutex> lock(mutex_);
        callback_ = nullptr;
        ++stops;
    }

    void emit(const std::string& transcript, bool is_final, bool end_of_utterance = false,
              double latency = 0.1) {
        stt::ResultCallback callback;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            callback = callback_;
        }
        if (callback) callback({transcript, is_final, end_of_utterance, latency});
    }

    /** Callback captured at start, for delivering results late. */
    stt::ResultCallback capturedCallback() {
        std::lock_guard<std::mutex> lock(mutex_);
        return callback_;
    }

    std::atomic<int> starts{0};
    std::atomic<int> stops{0};
    std::atomic<int> frames{0};

private:
    std::mutex mutex_;
    stt::ResultCallback callback_;
};

// ============================================================================
// Language model: scripted replies, one word per token
// ============================================================================

class MockLLM : public llm::LanguageModel {
public:
    int first_token_delay_ms = 10;
    int token_delay_ms = 5;

    /** Reply for the next request. "!throw:msg" fails the stream. */
    void addReply(const std::string& reply) {
        std::lock_guard<std::mutex> lock(mutex_);
        replies_.push_back(reply);
    }

    void streamCompletion(const std::vector<llm::Message>& messages, const llm::LLMConfig&,
                          llm::TokenCallback onToken, core::CancellationToken cancel) override {
        std::string reply;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            requests_.push_back(messages);
            if (!replies_.empty()) {
                reply = replies_.front();
                replies_.pop_front();
            }
        }

        if (!cancel.sleepFor(std::chrono::milliseconds(first_token_delay_ms))) return;

        if (reply.compare(0, 7, "!throw:") == 0) {
            throw std::runtime_error(reply.substr(7));
        }

        size_t pos = 0;
        while (pos < reply.size()) {
            size_t end = reply.find(' ', pos);
            end = (end == std::string::npos) ? reply.size() : end + 1;
            if (!onToken({reply.substr(pos, end - pos), false})) return;
            pos = end;
            if (!cancel.sleepFor(std::chrono::milliseconds(token_delay_ms))) return;
        }
        onToken({"", true});
    }

    std::vector<std::vector<llm::Message>> requests() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return requests_;
    }

private:
    mutable std::mutex mutex_;
    std::deque<std::string> replies_;
    std::vector<std::vector<llm::Message>> requests_;
};

/** The four mocks wired together, plus the shared log. */
struct MockStack {
    EventLog log;
    std::shared_ptr<MockTTS> tts = std::make_shared<MockTTS>(log);
    std::shared_ptr<MockAudio> audio = std::make_shared<MockAudio>(log, *tts);
    std::shared_ptr<MockSTT> stt = std::make_shared<MockSTT>();
    std::shared_ptr<MockLLM> llm = std::make_shared<MockLLM>();

    SessionServices services() const { return {audio, stt, llm, tts}; }
};

/** Records everything the orchestrator reports through its callbacks. */
class CallbackProbe {
public:
    OrchestratorCallbacks callbacks() {
        OrchestratorCallbacks cb;
        cb.onStateChange = [this](SessionState s) { push(states_, s); };
        cb.onUserUtterance = [this](const std::string& t) { push(utterances_, t); };
        cb.onAssistantResponse = [this](const std::string& t) { push(responses_, t); };
        cb.onError = [this](const std::string& t) { push(errors_, t); };
        cb.onTranscript = [this](const std::string& t, bool) { push(transcripts_, t); };
        cb.onSentenceQueued = [this](const std::string& t) { push(queued_, t); };
        cb.onAudioLevel = [this](float db) { push(levels_, db); };
        return cb;
    }

    std::vector<SessionState> states() const { return copy(states_); }
    std::vector<std::string> utterances() const { return copy(utterances_); }
    std::vector<std::string> responses() const { return copy(responses_); }
    std::vector<std::string> errors() const { return copy(errors_); }
    std::vector<std::string> transcripts() const { return copy(transcripts_); }
    std::vector<std::string> queued() const { return copy(queued_); }
    std::vector<float> levels() const { return copy(levels_); }

    bool saw(SessionState state) const {
        auto all = states();
        return std::find(all.begin(), all.end(), state) != all.end();
    }

private:
    template <typename T, typename V>
    void push(std::vector<T>& target, V value) {
        std::lock_guard<std::mutex> lock(mutex_);
        target.push_back(value);
    }

    template <typename T>
    std::vector<T> copy(const std::vector<T>& source) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return source;
    }

    mutable std::mutex mutex_;
    std::vector<SessionState> states_;
    std::vector<std::string> utterances_;
    std::vector<std::string> responses_;
    std::vector<std::string> errors_;
    std::vector<std::string> transcripts_;
    std::vector<std::string> queued_;
    std::vector<float> levels_;
};

/** Short timings so tests run quickly. */
inline OrchestratorConfig fastConfig() {
    OrchestratorConfig config;
    config.timings.silence_timeout = std::chrono::milliseconds(150);
    config.timings.barge_in_confirm = std::chrono::milliseconds(150);
    config.timings.post_turn_cooldown = std::chrono::milliseconds(30);
    config.timings.error_display = std::chrono::milliseconds(80);
    config.timings.queue_poll = std::chrono::milliseconds(5);
    return config;
}

} // namespace parley::testing
