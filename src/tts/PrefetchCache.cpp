/**
 * PrefetchCache.cpp - Sentence audio cache bookkeeping
 */

#include "parley/tts/PrefetchCache.hpp"

namespace parley::tts {

PrefetchCache::~PrefetchCache() {
    clear();
}

bool PrefetchCache::tryBegin(const std::string& text, PrefetchFuture future,
                             std::shared_ptr<core::CancellationSource> cancel) {
    if (contains(text)) return false;
    tasks_.emplace(text, Task{std::move(future), std::move(cancel)});
    return true;
}

bool PrefetchCache::complete(const std::string& text, PrefetchResult result) {
    auto it = tasks_.find(text);
    if (it == tasks_.end()) return false;
    tasks_.erase(it);

    if (!result) return false;
    cached_[text] = std::move(*result);
    return true;
}

std::optional<audio::AudioChunk> PrefetchCache::takeCached(const std::string& text) {
    auto it = cached_.find(text);
    if (it == cached_.end()) return std::nullopt;

    audio::AudioChunk chunk = std::move(it->second);
    cached_.erase(it);
    return chunk;
}

std::optional<PrefetchFuture> PrefetchCache::inFlight(const std::string& text) const {
    auto it = tasks_.find(text);
    if (it == tasks_.end()) return std::nullopt;
    return it->second.future;
}

void PrefetchCache::release(const std::string& text) {
    tasks_.erase(text);
}

bool PrefetchCache::contains(const std::string& text) const {
    return cached_.count(text) > 0 || tasks_.count(text) > 0;
}

void PrefetchCache::clear() {
    for (auto& [text, task] : tasks_) {
        if (task.cancel) task.cancel->cancel();
    }
    tasks_.clear();
    cached_.clear();
}

} // namespace parley::tts
