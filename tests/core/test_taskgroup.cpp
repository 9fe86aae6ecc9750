/**
 * test_taskgroup.cpp - Background thread ownership tests
 */

#include "parley/core/TaskGroup.hpp"

#include <atomic>
#include <cassert>
#include <chrono>
#include <iostream>
#include <stdexcept>
#include <thread>

using namespace parley::core;
using namespace std::chrono_literals;

void test_join_all_waits() {
    TaskGroup group;
    std::atomic<int> done{0};

    for (int i = 0; i < 8; ++i) {
        group.spawn("worker", [&done]() {
            std::this_thread::sleep_for(10ms);
            ++done;
        });
    }
    group.joinAll();

    assert(done == 8);
    assert(group.size() == 0);

    std::cout << "[PASS] test_join_all_waits" << std::endl;
}

void test_reap_finished_only() {
    TaskGroup group;
    std::atomic<bool> release{false};

    group.spawn("quick", []() {});
    group.spawn("slow", [&release]() {
        while (!release) std::this_thread::sleep_for(1ms);
    });

    std::this_thread::sleep_for(30ms);
    assert(group.running() == 1);
    assert(group.reapFinished() == 1);
    assert(group.size() == 1);

    release = true;
    group.joinAll();
    assert(group.size() == 0);

    std::cout << "[PASS] test_reap_finished_only" << std::endl;
}

void test_exception_is_contained() {
    TaskGroup group;
    group.spawn("throws", []() { throw std::runtime_error("expected failure"); });
    group.joinAll();

    std::cout << "[PASS] test_exception_is_contained" << std::endl;
}

void test_spawn_from_body() {
    TaskGroup group;
    std::atomic<bool> nested{false};

    group.spawn("outer", [&]() {
        group.spawn("inner", [&nested]() {
            std::this_thread::sleep_for(10ms);
            nested = true;
        });
    });

    group.joinAll();
    assert(nested);

    std::cout << "[PASS] test_spawn_from_body" << std::endl;
}

int main() {
    std::cout << "=== TaskGroup Tests ===" << std::endl;

    test_join_all_waits();
    test_reap_finished_only();
    test_exception_is_contained();
    test_spawn_from_body();

    std::cout << "\nAll tests passed!" << std::endl;
    return 0;
}
