/**
 * Cancellation.cpp - Cooperative cancellation flags with parent chaining
 */

#include "parley/core/Cancellation.hpp"

#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <mutex>
#include <thread>
#include <vector>

namespace parley::core {

struct CancellationToken::State {
    std::atomic<bool> cancelled{false};
    std::mutex mutex;
    std::condition_variable cv;
    std::vector<std::weak_ptr<State>> children;

    void cancel() {
        std::vector<std::weak_ptr<State>> to_cancel;
        {
            std::lock_guard<std::mutex> lock(mutex);
            if (cancelled.exchange(true)) return;
            to_cancel.swap(children);
        }
        cv.notify_all();

        for (auto& weak : to_cancel) {
            if (auto child = weak.lock()) {
                child->cancel();
            }
        }
    }

    void adopt(const std::shared_ptr<State>& child) {
        {
            std::lock_guard<std::mutex> lock(mutex);
            if (!cancelled) {
                // Drop links to sources that are already gone
                children.erase(
                    std::remove_if(children.begin(), children.end(),
                                   [](const std::weak_ptr<State>& w) { return w.expired(); }),
                    children.end());
                children.push_back(child);
                return;
            }
        }
        child->cancel();
    }
};

CancellationToken::CancellationToken(std::shared_ptr<State> state)
    : state_(std::move(state)) {
}

bool CancellationToken::isCancelled() const {
    return state_ && state_->cancelled.load();
}

bool CancellationToken::sleepFor(std::chrono::milliseconds duration) const {
    if (!state_) {
        std::this_thread::sleep_for(duration);
        return true;
    }

    std::unique_lock<std::mutex> lock(state_->mutex);
    return !state_->cv.wait_for(lock, duration, [this]() {
        return state_->cancelled.load();
    });
}

CancellationSource::CancellationSource()
    : state_(std::make_shared<CancellationToken::State>()) {
}

CancellationSource::CancellationSource(const CancellationToken& parent)
    : state_(std::make_shared<CancellationToken::State>()) {
    if (parent.state_) {
        parent.state_->adopt(state_);
    }
}

CancellationSource::~CancellationSource() = default;

void CancellationSource::cancel() {
    state_->cancel();
}

bool CancellationSource::isCancelled() const {
    return state_->cancelled.load();
}

CancellationToken CancellationSource::token() const {
    return CancellationToken(state_);
}

} // namespace parley::core
