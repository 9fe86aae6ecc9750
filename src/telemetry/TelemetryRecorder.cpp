/**
 * TelemetryRecorder.cpp - Thread-safe latency and event bookkeeping
 */

#include "parley/telemetry/TelemetryRecorder.hpp"

#include <algorithm>
#include <array>
#include <chrono>
#include <fstream>
#include <iostream>
#include <mutex>
#include <numeric>

using json = nlohmann::json;

namespace parley::telemetry {

namespace {

constexpr size_t LATENCY_KINDS = 4;
constexpr size_t EVENT_KINDS = 6;

constexpr std::array<LatencyKind, LATENCY_KINDS> ALL_LATENCY_KINDS = {
    LatencyKind::SttEmission, LatencyKind::LlmFirstToken,
    LatencyKind::TtsFirstByte, LatencyKind::EndToEndTurn
};

constexpr std::array<Event, EVENT_KINDS> ALL_EVENTS = {
    Event::SessionStarted, Event::SessionEnded, Event::UserFinishedSpeaking,
    Event::LlmFirstTokenReceived, Event::AiFinishedSpeaking, Event::UserInterrupted
};

int toMs(double seconds) {
    return static_cast<int>(seconds * 1000.0);
}

} // namespace

const char* latencyKindName(LatencyKind kind) {
    switch (kind) {
        case LatencyKind::SttEmission: return "stt_emission";
        case LatencyKind::LlmFirstToken: return "llm_first_token";
        case LatencyKind::TtsFirstByte: return "tts_ttfb";
        case LatencyKind::EndToEndTurn: return "e2e_turn";
    }
    return "unknown";
}

const char* eventName(Event event) {
    switch (event) {
        case Event::SessionStarted: return "session_started";
        case Event::SessionEnded: return "session_ended";
        case Event::UserFinishedSpeaking: return "user_finished_speaking";
        case Event::LlmFirstTokenReceived: return "llm_first_token_received";
        case Event::AiFinishedSpeaking: return "ai_finished_speaking";
        case Event::UserInterrupted: return "user_interrupted";
    }
    return "unknown";
}

double median(std::vector<double> samples) {
    if (samples.empty()) return 0.0;
    std::sort(samples.begin(), samples.end());
    size_t mid = samples.size() / 2;
    return samples.size() % 2 == 0
        ? (samples[mid] + samples[mid - 1]) / 2.0
        : samples[mid];
}

double percentile(std::vector<double> samples, int p) {
    if (samples.empty()) return 0.0;
    std::sort(samples.begin(), samples.end());
    size_t index = static_cast<size_t>(static_cast<double>(samples.size()) * p / 100.0);
    return samples[std::min(index, samples.size() - 1)];
}

struct TelemetryRecorder::Impl {
    bool verbose;
    mutable std::mutex mutex;
    std::array<std::vector<double>, LATENCY_KINDS> latencies;
    std::array<size_t, EVENT_KINDS> eventCounts{};
    std::vector<Event> eventLog;
    std::chrono::steady_clock::time_point sessionStart{};
    double sessionDuration = 0.0;
};

TelemetryRecorder::TelemetryRecorder(bool verbose)
    : impl_(std::make_unique<Impl>()) {
    impl_->verbose = verbose;
}

TelemetryRecorder::~TelemetryRecorder() = default;

void TelemetryRecorder::recordLatency(LatencyKind kind, double seconds) {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    impl_->latencies[static_cast<size_t>(kind)].push_back(seconds);

    if (impl_->verbose && kind != LatencyKind::SttEmission) {
        std::cout << "[Telemetry] " << latencyKindName(kind) << ": "
                  << toMs(seconds) << " ms" << std::endl;
    }
}

void TelemetryRecorder::recordEvent(Event event) {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    impl_->eventCounts[static_cast<size_t>(event)]++;
    impl_->eventLog.push_back(event);

    auto now = std::chrono::steady_clock::now();
    if (event == Event::SessionStarted) {
        impl_->sessionStart = now;
    } else if (event == Event::SessionEnded) {
        impl_->sessionDuration = std::chrono::duration<double>(now - impl_->sessionStart).count();
    }

    if (impl_->verbose) {
        std::cout << "[Telemetry] Event: " << eventName(event) << std::endl;
    }
}

LatencySummary TelemetryRecorder::summary(LatencyKind kind) const {
    std::vector<double> values = samples(kind);

    LatencySummary result;
    result.count = values.size();
    if (values.empty()) return result;

    result.mean = std::accumulate(values.begin(), values.end(), 0.0) / static_cast<double>(values.size());
    result.median = median(values);
    result.p99 = percentile(values, 99);
    return result;
}

std::vector<double> TelemetryRecorder::samples(LatencyKind kind) const {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    return impl_->latencies[static_cast<size_t>(kind)];
}

size_t TelemetryRecorder::eventCount(Event event) const {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    return impl_->eventCounts[static_cast<size_t>(event)];
}

std::vector<Event> TelemetryRecorder::events() const {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    return impl_->eventLog;
}

json TelemetryRecorder::toJson() const {
    json snapshot;

    json latencies = json::object();
    for (LatencyKind kind : ALL_LATENCY_KINDS) {
        LatencySummary s = summary(kind);
        latencies[latencyKindName(kind)] = {
            {"count", s.count},
            {"mean_ms", toMs(s.mean)},
            {"median_ms", toMs(s.median)},
            {"p99_ms", toMs(s.p99)}
        };
    }
    snapshot["latencies"] = latencies;

    json events = json::object();
    for (Event event : ALL_EVENTS) {
        events[eventName(event)] = eventCount(event);
    }
    snapshot["events"] = events;

    size_t turns = eventCount(Event::UserFinishedSpeaking);
    size_t interruptions = eventCount(Event::UserInterrupted);
    snapshot["quality"] = {
        {"turns_total", turns},
        {"interruptions", interruptions},
        {"interruption_rate", turns > 0 ? static_cast<double>(interruptions) / static_cast<double>(turns) : 0.0}
    };

    {
        std::lock_guard<std::mutex> lock(impl_->mutex);
        snapshot["session_duration_s"] = impl_->sessionDuration;
    }

    return snapshot;
}

bool TelemetryRecorder::exportJson(const std::string& path) const {
    std::ofstream file(path);
    if (!file.is_open()) {
        std::cerr << "[Telemetry] Cannot write " << path << std::endl;
        return false;
    }
    file << toJson().dump(2) << std::endl;
    return true;
}

void TelemetryRecorder::reset() {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    for (auto& values : impl_->latencies) values.clear();
    impl_->eventCounts.fill(0);
    impl_->eventLog.clear();
    impl_->sessionDuration = 0.0;
}

} // namespace parley::telemetry
