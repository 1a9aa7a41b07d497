/**
 * @file test_pool_performance.cpp
 * @brief Throughput comparison of the locked and lock-free buffer pools
 *
 * Measures acquire/release round trips for BufferPool, FastBufferPool
 * with and without a worker cache, and plain allocation, single threaded
 * and under contention. Timings are printed; assertions only check that
 * the pools stayed consistent.
 */

#include <gtest/gtest.h>
#include "secbuf/memory/pool.h"
#include "secbuf/memory/fast_pool.h"
#include "../test_infrastructure/test_utilities.h"

#include <chrono>
#include <iomanip>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

using namespace secbuf;
using namespace secbuf::memory;

class PoolPerformanceTest : public ::testing::Test {
protected:
    void SetUp() override {
        config_ = pool_presets::network_mtu();
    }

    template<typename Func>
    std::chrono::nanoseconds time_operation(Func&& func) {
        auto start = std::chrono::high_resolution_clock::now();
        func();
        auto end = std::chrono::high_resolution_clock::now();
        return std::chrono::duration_cast<std::chrono::nanoseconds>(end - start);
    }

    void print_result(const std::string& name, std::chrono::nanoseconds elapsed, size_t operations) {
        double ns_per_op = static_cast<double>(elapsed.count()) / static_cast<double>(operations);
        std::cout << "  " << std::setw(28) << std::left << name
                  << std::setw(12) << std::fixed << std::setprecision(1) << ns_per_op
                  << " ns/op\n";
    }

    PoolConfig config_;
    static constexpr size_t kIterations = 20000;
};

TEST_F(PoolPerformanceTest, SingleThreadedRoundTrip) {
    BufferPool locked(config_);
    FastBufferPool fast(config_);
    auto cache = fast.create_worker_cache();

    std::cout << "\nSingle-threaded acquire/release (" << config_.buffer_size << " byte buffers):\n";

    auto alloc_time = time_operation([&]() {
        for (size_t i = 0; i < kIterations; ++i) {
            auto buffer = std::make_unique<LinearBuffer>(config_.buffer_size);
            (void)buffer->put_u32(static_cast<uint32_t>(i));
        }
    });
    print_result("direct allocation", alloc_time, kIterations);

    auto locked_time = time_operation([&]() {
        for (size_t i = 0; i < kIterations; ++i) {
            auto buffer = locked.acquire();
            (void)buffer->put_u32(static_cast<uint32_t>(i));
            locked.release(std::move(buffer));
        }
    });
    print_result("BufferPool", locked_time, kIterations);

    auto shared_time = time_operation([&]() {
        for (size_t i = 0; i < kIterations; ++i) {
            auto buffer = fast.acquire();
            (void)buffer->put_u32(static_cast<uint32_t>(i));
            fast.release(std::move(buffer));
        }
    });
    print_result("FastBufferPool (shared)", shared_time, kIterations);

    auto cached_time = time_operation([&]() {
        for (size_t i = 0; i < kIterations; ++i) {
            auto buffer = fast.acquire(cache.get());
            (void)buffer->put_u32(static_cast<uint32_t>(i));
            fast.release(std::move(buffer), cache.get());
        }
    });
    print_result("FastBufferPool (cached)", cached_time, kIterations);

    EXPECT_GT(locked.stats().hit_rate, 0.99);
    EXPECT_GT(fast.stats().cache_hit_count, 0u);
}

TEST_F(PoolPerformanceTest, ContendedRoundTrip) {
    constexpr size_t kWorkers = 8;
    constexpr size_t kPerWorker = kIterations / kWorkers;

    BufferPool locked(config_);
    FastBufferPool fast(config_);

    std::cout << "\nContended acquire/release, " << kWorkers << " workers:\n";

    auto locked_time = time_operation([&]() {
        secbuf::test::ConcurrentTestRunner::run_workers(kWorkers, [&](size_t) {
            for (size_t i = 0; i < kPerWorker; ++i) {
                auto buffer = locked.acquire();
                locked.release(std::move(buffer));
            }
        });
    });
    print_result("BufferPool", locked_time, kWorkers * kPerWorker);

    auto fast_time = time_operation([&]() {
        secbuf::test::ConcurrentTestRunner::run_workers(kWorkers, [&](size_t) {
            auto cache = fast.create_worker_cache();
            for (size_t i = 0; i < kPerWorker; ++i) {
                auto buffer = fast.acquire(cache.get());
                fast.release(std::move(buffer), cache.get());
            }
        });
    });
    print_result("FastBufferPool (cached)", fast_time, kWorkers * kPerWorker);

    EXPECT_EQ(locked.stats().acquire_count, kWorkers * kPerWorker);
    EXPECT_EQ(fast.stats().acquire_count, kWorkers * kPerWorker);
    EXPECT_LE(locked.available(), config_.max_pool_size);
    EXPECT_LE(fast.available(), config_.max_pool_size);
}
