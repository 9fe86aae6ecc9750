/**
 * TaskGroup.cpp - Background thread bookkeeping
 */

#include "parley/core/TaskGroup.hpp"

#include <atomic>
#include <exception>
#include <iostream>
#include <iterator>
#include <list>
#include <mutex>
#include <thread>

namespace parley::core {

struct TaskGroup::Impl {
    struct Entry {
        std::string name;
        std::thread thread;
        std::shared_ptr<std::atomic<bool>> done;
    };

    mutable std::mutex mutex;
    std::list<Entry> entries;
};

TaskGroup::TaskGroup() : impl_(std::make_unique<Impl>()) {}

TaskGroup::~TaskGroup() {
    joinAll();
}

void TaskGroup::spawn(std::string name, std::function<void()> body) {
    auto done = std::make_shared<std::atomic<bool>>(false);

    std::thread thread([name, body = std::move(body), done]() {
        try {
            body();
        } catch (const std::exception& e) {
            std::cerr << "[TaskGroup] " << name << " failed: " << e.what() << std::endl;
        }
        done->store(true);
    });

    std::lock_guard<std::mutex> lock(impl_->mutex);
    impl_->entries.push_back({std::move(name), std::move(thread), std::move(done)});
}

size_t TaskGroup::reapFinished() {
    std::list<Impl::Entry> finished;
    {
        std::lock_guard<std::mutex> lock(impl_->mutex);
        for (auto it = impl_->entries.begin(); it != impl_->entries.end();) {
            if (it->done->load()) {
                auto next = std::next(it);
                finished.splice(finished.end(), impl_->entries, it);
                it = next;
            } else {
                ++it;
            }
        }
    }

    for (auto& entry : finished) {
        if (entry.thread.joinable()) {
            entry.thread.join();
        }
    }
    return finished.size();
}

void TaskGroup::joinAll() {
    // Bodies may spawn follow-up work while we wait, so loop until empty
    while (true) {
        std::list<Impl::Entry> pending;
        {
            std::lock_guard<std::mutex> lock(impl_->mutex);
            if (impl_->entries.empty()) break;
            pending.swap(impl_->entries);
        }

        for (auto& entry : pending) {
            if (entry.thread.joinable()) {
                entry.thread.join();
            }
        }
    }
}

size_t TaskGroup::size() const {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    return impl_->entries.size();
}

size_t TaskGroup::running() const {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    size_t count = 0;
    for (const auto& entry : impl_->entries) {
        if (!entry.done->load()) ++count;
    }
    return count;
}

} // namespace parley::core
