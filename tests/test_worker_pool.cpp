#include <catch2/catch_test_macros.hpp>
#include "pipeline/WorkerPool.h"
#include <atomic>
#include <chrono>
#include <stdexcept>
#include <thread>

using namespace SceneStitch;

TEST_CASE("WorkerPool runs every submitted task", "[pool]") {
    WorkerPool pool(4);
    CHECK(pool.size() == 4);
    std::atomic<int> sum{0};
    for (int i = 1; i <= 100; ++i) {
        pool.submit([&sum, i] { sum += i; });
    }
    pool.wait();
    CHECK(sum == 5050);

    // Reusable after a wait
    pool.submit([&sum] { sum += 1; });
    pool.wait();
    CHECK(sum == 5051);
}

TEST_CASE("WorkerPool never runs more tasks at once than it has workers", "[pool]") {
    WorkerPool pool(2);
    std::atomic<int> running{0};
    std::atomic<int> peak{0};
    for (int i = 0; i < 12; ++i) {
        pool.submit([&] {
            int now = ++running;
            int prev = peak.load();
            while (now > prev && !peak.compare_exchange_weak(prev, now)) {}
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
            --running;
        });
    }
    pool.wait();
    CHECK(peak.load() <= 2);
    CHECK(peak.load() >= 1);
}

TEST_CASE("wait rethrows the first failure after in-flight tasks finish", "[pool]") {
    WorkerPool pool(1);
    std::atomic<int> ran{0};
    std::atomic<bool> go{false};
    // Hold the only worker until every task is queued
    pool.submit([&] {
        while (!go.load()) std::this_thread::yield();
        ++ran;
    });
    pool.submit([] { throw std::runtime_error("scene 1 failed"); });
    pool.submit([&ran] { ++ran; });
    go = true;

    try {
        pool.wait();
        FAIL("expected wait() to throw");
    } catch (const std::runtime_error& e) {
        CHECK(std::string(e.what()) == "scene 1 failed");
    }
    // Single worker: the task queued behind the failure is dropped
    CHECK(ran.load() == 1);

    // The error is reported once
    CHECK_NOTHROW(pool.wait());
}

TEST_CASE("Worker count resolution", "[pool]") {
    CHECK(WorkerPool::resolveWorkerCount(3, 10) == 3);
    CHECK(WorkerPool::resolveWorkerCount(8, 2) == 2);
    CHECK(WorkerPool::resolveWorkerCount(0, 1) == 1);
    CHECK(WorkerPool::resolveWorkerCount(0, 0) >= 1);

    WorkerPool zero(0);
    CHECK(zero.size() == 1);
}
