/**
 * TaskGroup.hpp - Owns the background threads spawned for a session
 *
 * Threads are never detached: finished ones are reaped (joined) as the group
 * is used, the rest are joined by joinAll() once their work was cancelled.
 */

#pragma once

#include <functional>
#include <memory>
#include <string>

namespace parley::core {

class TaskGroup {
public:
    TaskGroup();
    ~TaskGroup();

    TaskGroup(const TaskGroup&) = delete;
    TaskGroup& operator=(const TaskGroup&) = delete;

    /** Start `body` on a new thread. Exceptions escaping `body` are logged. */
    void spawn(std::string name, std::function<void()> body);

    /** Join threads whose body already returned. Returns how many were joined. */
    size_t reapFinished();

    /** Join every thread. Blocks until all bodies have returned. */
    void joinAll();

    /** Threads spawned and not yet joined. */
    size_t size() const;

    /** Threads whose body is still running. */
    size_t running() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace parley::core
