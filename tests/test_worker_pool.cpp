#include <catch2/catch_test_macros.hpp>
#include "core/worker_pool.hpp"

#include <atomic>
#include <chrono>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace auditfusion;

TEST_CASE("WorkerPool: tasks return results through futures", "[worker_pool]") {
    WorkerPool pool(3);
    CHECK(pool.size() == 3);

    std::vector<std::future<int>> futures;
    for (int i = 0; i < 20; ++i) {
        futures.push_back(pool.submit([i] { return i * i; }));
    }
    int sum = 0;
    for (auto& f : futures) sum += f.get();
    CHECK(sum == 2470);
}

TEST_CASE("WorkerPool: exceptions surface from get()", "[worker_pool]") {
    WorkerPool pool(1);
    auto f = pool.submit([]() -> int { throw std::runtime_error("boom"); });
    CHECK_THROWS_AS(f.get(), std::runtime_error);
}

TEST_CASE("WorkerPool: shutdown drains queued tasks", "[worker_pool]") {
    std::atomic<int> done{0};
    std::vector<std::future<void>> futures;
    {
        WorkerPool pool(1);
        for (int i = 0; i < 5; ++i) {
            futures.push_back(pool.submit([&done] {
                std::this_thread::sleep_for(std::chrono::milliseconds(2));
                done.fetch_add(1);
            }));
        }
        pool.shutdown();
        CHECK_THROWS_AS(pool.submit([] {}), std::runtime_error);
    }
    CHECK(done.load() == 5);
    for (auto& f : futures) {
        CHECK(f.wait_for(std::chrono::seconds(0)) == std::future_status::ready);
    }
}

TEST_CASE("WorkerPool: bounded concurrency", "[worker_pool]") {
    WorkerPool pool(2);
    std::atomic<int> active{0};
    std::atomic<int> peak{0};

    std::vector<std::future<void>> futures;
    for (int i = 0; i < 8; ++i) {
        futures.push_back(pool.submit([&] {
            const int now = active.fetch_add(1) + 1;
            int prev = peak.load();
            while (now > prev && !peak.compare_exchange_weak(prev, now)) {}
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
            active.fetch_sub(1);
        }));
    }
    for (auto& f : futures) f.get();
    CHECK(peak.load() <= 2);
}
