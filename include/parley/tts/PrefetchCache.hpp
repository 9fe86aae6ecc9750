/**
 * PrefetchCache.hpp - Sentence audio synthesized ahead of playback
 *
 * Two maps keyed by literal sentence text: finished audio waiting to be
 * played, and synthesis still in flight. A text is in at most one of them.
 * Not thread-safe: owned by the orchestrator's serial executor.
 */

#pragma once

#include "parley/audio/AudioTypes.hpp"
#include "parley/core/Cancellation.hpp"

#include <future>
#include <map>
#include <memory>
#include <optional>
#include <string>

namespace parley::tts {

/** Empty optional means the synthesis failed or was cancelled. */
using PrefetchResult = std::optional<audio::AudioChunk>;
using PrefetchFuture = std::shared_future<PrefetchResult>;

class PrefetchCache {
public:
    ~PrefetchCache();

    /**
     * Register an in-flight synthesis for `text`.
     * @return false if `text` is already cached or in flight (nothing stored)
     */
    bool tryBegin(const std::string& text, PrefetchFuture future,
                  std::shared_ptr<core::CancellationSource> cancel);

    /**
     * Move a finished synthesis from in-flight to cached. A result for a text
     * no longer in flight (consumed, released or cleared) is dropped.
     * @return true if the result was cached
     */
    bool complete(const std::string& text, PrefetchResult result);

    /** Remove and return cached audio for `text`. */
    std::optional<audio::AudioChunk> takeCached(const std::string& text);

    /** Future of the in-flight synthesis for `text`, if any. */
    std::optional<PrefetchFuture> inFlight(const std::string& text) const;

    /** Forget the in-flight entry for `text` without cancelling it. */
    void release(const std::string& text);

    bool contains(const std::string& text) const;

    /** Cancel everything in flight and drop all cached audio. */
    void clear();

    size_t cachedCount() const { return cached_.size(); }
    size_t inFlightCount() const { return tasks_.size(); }

private:
    struct Task {
        PrefetchFuture future;
        std::shared_ptr<core::CancellationSource> cancel;
    };

    std::map<std::string, audio::AudioChunk> cached_;
    std::map<std::string, Task> tasks_;
};

} // namespace parley::tts
