/**
 * SerialExecutor.hpp - Single-threaded execution context with timers
 *
 * Every task posted here runs on one worker thread, in deadline order, so
 * state touched only from inside tasks needs no further locking. Delayed
 * tasks double as timers and can be cancelled until they start running.
 */

#pragma once

#include <atomic>
#include <chrono>
#include <functional>
#include <future>
#include <memory>
#include <string>
#include <type_traits>

namespace parley::core {

class SerialExecutor;

/**
 * Handle to a delayed task. Copies share the same timer.
 */
class Timer {
public:
    Timer() = default;

    /** Cancel if still pending. Returns true if this call prevented it from running. */
    bool cancel();

    /** True while the timer is armed and has neither fired nor been cancelled. */
    bool isPending() const;

    struct State;

private:
    friend class SerialExecutor;
    explicit Timer(std::shared_ptr<State> state);

    std::shared_ptr<State> state_;
};

/**
 * Holds at most one live timer of a kind. Arming replaces (and cancels) the
 * previous timer. Use only from the executor's own thread.
 */
class TimerSlot {
public:
    void arm(SerialExecutor& executor, std::chrono::milliseconds delay, std::function<void()> task);
    void cancel();
    bool isArmed() const;

private:
    Timer timer_;
};

class SerialExecutor {
public:
    using Clock = std::chrono::steady_clock;
    using Task = std::function<void()>;

    explicit SerialExecutor(std::string name = "executor");
    ~SerialExecutor();

    SerialExecutor(const SerialExecutor&) = delete;
    SerialExecutor& operator=(const SerialExecutor&) = delete;

    /** Queue a task to run as soon as possible. Dropped after shutdown(). */
    void post(Task task);

    /** Queue a task to run after `delay`. */
    Timer postDelayed(std::chrono::milliseconds delay, Task task);

    /**
     * Run `fn` on the executor and return its result through a future.
     * Called from the executor thread itself, `fn` runs inline.
     * If the executor shuts down first the future reports broken_promise.
     */
    template <typename Fn>
    auto submit(Fn fn) -> std::future<std::invoke_result_t<Fn>> {
        using Result = std::invoke_result_t<Fn>;
        auto task = std::make_shared<std::packaged_task<Result()>>(std::move(fn));
        auto future = task->get_future();
        if (isCurrentThread()) {
            (*task)();
        } else {
            post([task]() { (*task)(); });
        }
        return future;
    }

    bool isCurrentThread() const;

    /** Stop the worker; pending tasks are discarded. Idempotent. */
    void shutdown();

    size_t pendingCount() const;

    const std::string& name() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace parley::core
