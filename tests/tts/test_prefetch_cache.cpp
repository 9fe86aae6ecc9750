/**
 * test_prefetch_cache.cpp - Prefetch bookkeeping tests
 */

#include "parley/tts/PrefetchCache.hpp"

#include <cassert>
#include <future>
#include <iostream>
#include <memory>

using namespace parley;
using namespace parley::tts;

namespace {

struct Pending {
    std::promise<PrefetchResult> promise;
    PrefetchFuture future = promise.get_future().share();
    std::shared_ptr<core::CancellationSource> cancel = std::make_shared<core::CancellationSource>();
};

audio::AudioChunk chunkOf(float value, size_t count = 4) {
    audio::AudioChunk chunk;
    chunk.samples.assign(count, value);
    return chunk;
}

} // namespace

void test_begin_complete_take() {
    PrefetchCache cache;
    Pending p;

    assert(cache.tryBegin("Hello.", p.future, p.cancel));
    assert(cache.contains("Hello."));
    assert(cache.inFlightCount() == 1);
    assert(cache.inFlight("Hello."));

    assert(cache.complete("Hello.", chunkOf(0.5f)));
    assert(cache.inFlightCount() == 0);
    assert(cache.cachedCount() == 1);
    assert(!cache.inFlight("Hello."));

    auto chunk = cache.takeCached("Hello.");
    assert(chunk && chunk->samples.size() == 4 && chunk->samples[0] == 0.5f);
    assert(!cache.contains("Hello."));
    assert(!cache.takeCached("Hello."));

    std::cout << "[PASS] test_begin_complete_take" << std::endl;
}

void test_no_duplicate_work() {
    PrefetchCache cache;
    Pending first;
    Pending second;

    assert(cache.tryBegin("Same.", first.future, first.cancel));
    assert(!cache.tryBegin("Same.", second.future, second.cancel));  // in flight

    cache.complete("Same.", chunkOf(1.0f));
    assert(!cache.tryBegin("Same.", second.future, second.cancel));  // cached

    std::cout << "[PASS] test_no_duplicate_work" << std::endl;
}

void test_failed_result_is_not_cached() {
    PrefetchCache cache;
    Pending p;

    cache.tryBegin("Broken.", p.future, p.cancel);
    assert(!cache.complete("Broken.", std::nullopt));
    assert(!cache.contains("Broken."));

    std::cout << "[PASS] test_failed_result_is_not_cached" << std::endl;
}

void test_release_hands_over_future() {
    PrefetchCache cache;
    Pending p;

    cache.tryBegin("Soon.", p.future, p.cancel);
    auto future = cache.inFlight("Soon.");
    assert(future);
    cache.release("Soon.");
    assert(!cache.contains("Soon."));
    assert(!p.cancel->isCancelled());  // released, not cancelled

    // The consumer still gets the result, the late completion is dropped
    p.promise.set_value(chunkOf(0.25f));
    assert(future->get()->samples[0] == 0.25f);
    assert(!cache.complete("Soon.", chunkOf(0.25f)));
    assert(cache.cachedCount() == 0);

    std::cout << "[PASS] test_release_hands_over_future" << std::endl;
}

void test_clear_cancels_in_flight() {
    PrefetchCache cache;
    Pending a;
    Pending b;

    cache.tryBegin("A.", a.future, a.cancel);
    cache.tryBegin("B.", b.future, b.cancel);
    cache.complete("B.", chunkOf(1.0f));

    cache.clear();
    assert(a.cancel->isCancelled());
    assert(cache.cachedCount() == 0);
    assert(cache.inFlightCount() == 0);

    // Completion after clear is discarded
    assert(!cache.complete("A.", chunkOf(1.0f)));
    assert(!cache.contains("A."));

    std::cout << "[PASS] test_clear_cancels_in_flight" << std::endl;
}

void test_destructor_cancels() {
    Pending p;
    {
        PrefetchCache cache;
        cache.tryBegin("Bye.", p.future, p.cancel);
    }
    assert(p.cancel->isCancelled());

    std::cout << "[PASS] test_destructor_cancels" << std::endl;
}

int main() {
    std::cout << "=== PrefetchCache Tests ===" << std::endl;

    test_begin_complete_take();
    test_no_duplicate_work();
    test_failed_result_is_not_cached();
    test_release_hands_over_future();
    test_clear_cancels_in_flight();
    test_destructor_cancels();

    std::cout << "\nAll tests passed!" << std::endl;
    return 0;
}
