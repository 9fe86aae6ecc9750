/**
 * TelemetryRecorder.hpp - In-memory telemetry with latency summaries
 */

#pragma once

#include "parley/telemetry/TelemetrySink.hpp"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

namespace parley::telemetry {

struct LatencySummary {
    size_t count = 0;
    double mean = 0.0;    // seconds
    double median = 0.0;
    double p99 = 0.0;
};

/** Median of `samples` (mean of the two middle values for even counts). */
double median(std::vector<double> samples);

/** Nearest-rank style percentile, p in 0..100. */
double percentile(std::vector<double> samples, int p);

class TelemetryRecorder : public TelemetrySink {
public:
    /** @param verbose log every event as it is recorded */
    explicit TelemetryRecorder(bool verbose = true);
    ~TelemetryRecorder() override;

    void recordLatency(LatencyKind kind, double seconds) override;
    void recordEvent(Event event) override;

    LatencySummary summary(LatencyKind kind) const;
    std::vector<double> samples(LatencyKind kind) const;
    size_t eventCount(Event event) const;

    /** Events in the order they were recorded. */
    std::vector<Event> events() const;

    /**
     * Snapshot with per-kind latency summaries (milliseconds), event counts
     * and turn/interruption totals.
     */
    nlohmann::json toJson() const;

    /** Write toJson() to `path`. Returns false if the file cannot be written. */
    bool exportJson(const std::string& path) const;

    void reset();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace parley::telemetry
