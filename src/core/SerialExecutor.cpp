/**
 * SerialExecutor.cpp - Deadline-ordered task queue on a single worker thread
 */

#include "parley/core/SerialExecutor.hpp"

#include <algorithm>
#include <condition_variable>
#include <exception>
#include <iostream>
#include <mutex>
#include <thread>
#include <vector>

namespace parley::core {

namespace {
enum class TimerStatus { Pending, Fired, Cancelled };
} // anonymous namespace

struct Timer::State {
    std::atomic<TimerStatus> status{TimerStatus::Pending};
};

Timer::Timer(std::shared_ptr<State> state) : state_(std::move(state)) {}

bool Timer::cancel() {
    if (!state_) return false;
    auto expected = TimerStatus::Pending;
    return state_->status.compare_exchange_strong(expected, TimerStatus::Cancelled);
}

bool Timer::isPending() const {
    return state_ && state_->status.load() == TimerStatus::Pending;
}

void TimerSlot::arm(SerialExecutor& executor, std::chrono::milliseconds delay, std::function<void()> task) {
    timer_.cancel();
    timer_ = executor.postDelayed(delay, std::move(task));
}

void TimerSlot::cancel() {
    timer_.cancel();
    timer_ = Timer();
}

bool TimerSlot::isArmed() const {
    return timer_.isPending();
}

struct SerialExecutor::Impl {
    struct Entry {
        Clock::time_point deadline;
        uint64_t sequence;
        Task task;
        std::shared_ptr<Timer::State> timer;  // null for plain posts
    };

    struct Later {
        bool operator()(const Entry& a, const Entry& b) const {
            if (a.deadline != b.deadline) return a.deadline > b.deadline;
            return a.sequence > b.sequence;
        }
    };

    std::string name;
    mutable std::mutex mutex;
    std::condition_variable cv;
    std::vector<Entry> queue;  // min-heap on (deadline, sequence)
    uint64_t next_sequence = 0;
    bool stopping = false;
    std::thread worker;
    std::thread::id worker_id;

    void enqueue(Entry entry) {
        {
            std::lock_guard<std::mutex> lock(mutex);
            if (stopping) return;
            entry.sequence = next_sequence++;
            queue.push_back(std::move(entry));
            std::push_heap(queue.begin(), queue.end(), Later());
        }
        cv.notify_one();
    }

    void run() {
        std::unique_lock<std::mutex> lock(mutex);

        while (!stopping) {
            if (queue.empty()) {
                cv.wait(lock, [this]() { return stopping || !queue.empty(); });
                continue;
            }

            auto deadline = queue.front().deadline;
            if (Clock::now() < deadline) {
                cv.wait_until(lock, deadline);
                continue;
            }

            std::pop_heap(queue.begin(), queue.end(), Later());
            Entry entry = std::move(queue.back());
            queue.pop_back();

            if (entry.timer) {
                auto expected = TimerStatus::Pending;
                if (!entry.timer->status.compare_exchange_strong(expected, TimerStatus::Fired)) {
                    continue;  // cancelled
                }
            }

            lock.unlock();
            try {
                entry.task();
            } catch (const std::exception& e) {
                std::cerr << "[" << name << "] Task threw: " << e.what() << std::endl;
            }
            lock.lock();
        }

        // Destroy leftovers outside the lock so their captures can't deadlock us
        std::vector<Entry> dropped;
        dropped.swap(queue);
        lock.unlock();
        dropped.clear();
    }
};

SerialExecutor::SerialExecutor(std::string name)
    : impl_(std::make_unique<Impl>()) {
    impl_->name = std::move(name);
    impl_->worker = std::thread([this]() { impl_->run(); });
    impl_->worker_id = impl_->worker.get_id();
}

SerialExecutor::~SerialExecutor() {
    shutdown();
}

void SerialExecutor::post(Task task) {
    impl_->enqueue({Clock::now(), 0, std::move(task), nullptr});
}

Timer SerialExecutor::postDelayed(std::chrono::milliseconds delay, Task task) {
    auto state = std::make_shared<Timer::State>();
    impl_->enqueue({Clock::now() + delay, 0, std::move(task), state});
    return Timer(state);
}

bool SerialExecutor::isCurrentThread() const {
    return std::this_thread::get_id() == impl_->worker_id;
}

void SerialExecutor::shutdown() {
    {
        std::lock_guard<std::mutex> lock(impl_->mutex);
        impl_->stopping = true;
    }
    impl_->cv.notify_all();

    if (impl_->worker.joinable() && !isCurrentThread()) {
        impl_->worker.join();
    }
}

size_t SerialExecutor::pendingCount() const {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    return impl_->queue.size();
}

const std::string& SerialExecutor::name() const {
    return impl_->name;
}

} // namespace parley::core
