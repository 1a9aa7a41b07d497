/**
 * @file test_memory_pool.cpp
 * @brief Tests for BufferPool, PooledBuffer and PoolRegistry
 */

#include <gtest/gtest.h>
#include <memory>
#include <mutex>
#include <set>
#include <stdexcept>
#include <vector>

#include "secbuf/memory/pool.h"
#include "secbuf/error.h"
#include "../test_infrastructure/test_utilities.h"

using namespace secbuf;
using namespace secbuf::memory;
using secbuf::test::TestDataGenerator;

class BufferPoolTest : public ::testing::Test {
protected:
    void SetUp() override {
        config_.buffer_size = 256;
        config_.max_pool_size = 4;
        config_.min_pool_size = 2;
    }

    PoolConfig config_;
};

TEST_F(BufferPoolTest, DefaultConfiguration) {
    PoolConfig config;
    EXPECT_EQ(config.buffer_size, 8192u);
    EXPECT_EQ(config.max_pool_size, 100u);
    EXPECT_EQ(config.min_pool_size, 10u);
    EXPECT_TRUE(config.validate());
}

TEST_F(BufferPoolTest, Presets) {
    auto small = pool_presets::small_buffers();
    EXPECT_EQ(small.buffer_size, 1024u);
    EXPECT_EQ(small.max_pool_size, 20u);
    EXPECT_EQ(small.min_pool_size, 5u);

    auto large = pool_presets::large_buffers();
    EXPECT_EQ(large.buffer_size, 65536u);
    EXPECT_EQ(large.max_pool_size, 1000u);
    EXPECT_EQ(large.min_pool_size, 50u);

    auto mtu = pool_presets::network_mtu();
    EXPECT_EQ(mtu.buffer_size, 1500u);
    EXPECT_EQ(mtu.max_pool_size, 500u);
    EXPECT_EQ(mtu.min_pool_size, 20u);
}

TEST_F(BufferPoolTest, InvalidConfigurationRejected) {
    PoolConfig bad = config_;
    bad.min_pool_size = 10;
    EXPECT_EQ(bad.validate().error(), SecbufError::INVALID_CONFIGURATION);

    try {
        BufferPool pool(bad);
        FAIL() << "constructor accepted min_pool_size > max_pool_size";
    } catch (const SecbufException& e) {
        EXPECT_EQ(e.secbuf_error(), SecbufError::INVALID_CONFIGURATION);
    }

    bad = config_;
    bad.buffer_size = 0;
    EXPECT_THROW(BufferPool pool(bad), SecbufException);
}

TEST_F(BufferPoolTest, PreWarmsMinimum) {
    BufferPool pool(config_);
    auto stats = pool.stats();
    EXPECT_EQ(stats.available, 2u);
    EXPECT_EQ(stats.total_allocated, 2u);
    EXPECT_EQ(stats.buffer_size, 256u);
    EXPECT_EQ(stats.in_use(), 0u);
    EXPECT_EQ(stats.hit_rate, 0.0);
}

TEST_F(BufferPoolTest, HitsAndMisses) {
    config_.min_pool_size = 0;
    BufferPool pool(config_);

    auto first = pool.acquire();
    ASSERT_NE(first, nullptr);
    EXPECT_EQ(first->capacity(), 256u);
    EXPECT_EQ(pool.stats().miss_count, 1u);

    pool.release(std::move(first));
    EXPECT_EQ(pool.available(), 1u);

    auto second = pool.acquire();
    auto stats = pool.stats();
    EXPECT_EQ(stats.acquire_count, 2u);
    EXPECT_EQ(stats.hit_count, 1u);
    EXPECT_EQ(stats.miss_count, 1u);
    EXPECT_DOUBLE_EQ(stats.hit_rate, 0.5);
    EXPECT_EQ(stats.in_use(), 1u);
}

TEST_F(BufferPoolTest, ReleasedBuffersAreWiped) {
    BufferPool pool(config_);
    auto secret = TestDataGenerator::generate_secret(128);

    auto buffer = pool.acquire();
    LinearBuffer* raw = buffer.get();
    ASSERT_TRUE(buffer->put_bytes(secret));
    ASSERT_TRUE(buffer->set_pos(10));
    pool.release(std::move(buffer));

    // Drain until the released buffer comes back
    std::vector<std::unique_ptr<LinearBuffer>> held;
    for (size_t i = 0; i < config_.max_pool_size; ++i) {
        auto next = pool.acquire();
        if (next.get() == raw) {
            EXPECT_EQ(next->length(), 0u);
            EXPECT_EQ(next->pos(), 0u);
            EXPECT_TRUE(is_memory_cleared(next->storage()));
            EXPECT_FALSE(secbuf::test::contains_sequence(next->storage(), BufferView(secret).slice(0, 16)));
            return;
        }
        held.push_back(std::move(next));
    }
    FAIL() << "released buffer was not reused";
}

TEST_F(BufferPoolTest, ReleaseBeyondMaximumFrees) {
    config_.min_pool_size = 0;
    config_.max_pool_size = 2;
    BufferPool pool(config_);

    std::vector<std::unique_ptr<LinearBuffer>> buffers;
    for (int i = 0; i < 3; ++i) {
        buffers.push_back(pool.acquire());
    }
    EXPECT_EQ(pool.stats().total_allocated, 3u);

    for (auto& buffer : buffers) {
        pool.release(std::move(buffer));
    }

    auto stats = pool.stats();
    EXPECT_EQ(stats.available, 2u);
    EXPECT_EQ(stats.release_count, 3u);
    EXPECT_EQ(stats.discard_count, 1u);
    EXPECT_EQ(stats.total_allocated, 2u);
}

TEST_F(BufferPoolTest, ForeignCapacityIsFreed) {
    BufferPool pool(config_);
    auto stats_before = pool.stats();

    pool.release(std::make_unique<LinearBuffer>(512));

    auto stats = pool.stats();
    EXPECT_EQ(stats.available, stats_before.available);
    EXPECT_EQ(stats.discard_count, 1u);
    EXPECT_EQ(stats.total_allocated, stats_before.total_allocated);

    // Null release is ignored
    pool.release(nullptr);
    EXPECT_EQ(pool.stats().release_count, 1u);
}

TEST_F(BufferPoolTest, ForeignCapacityIsReported) {
    auto reporter = std::make_shared<ErrorReporter>();
    auto config = reporter->get_configuration();
    config.write_to_stderr = false;
    config.minimum_level = ErrorReporter::LogLevel::DEBUG;
    ASSERT_TRUE(reporter->update_configuration(config));

    std::vector<ErrorReporter::ErrorReport> reports;
    reporter->add_reporter_callback([&reports](const ErrorReporter::ErrorReport& report) {
        reports.push_back(report);
    });

    BufferPool pool(config_);
    pool.set_reporter(reporter);
    pool.release(std::make_unique<LinearBuffer>(512));

    ASSERT_EQ(reports.size(), 1u);
    EXPECT_EQ(reports[0].level, ErrorReporter::LogLevel::WARNING);
    EXPECT_EQ(reports[0].category, "buffer_pool");
    EXPECT_NE(reports[0].message.find("512"), std::string::npos);
}

TEST_F(BufferPoolTest, BurnedBufferReturnRetiresAllocation) {
    auto reporter = std::make_shared<ErrorReporter>();
    auto config = reporter->get_configuration();
    config.write_to_stderr = false;
    config.minimum_level = ErrorReporter::LogLevel::WARNING;
    ASSERT_TRUE(reporter->update_configuration(config));
    size_t warnings = 0;
    reporter->add_reporter_callback([&warnings](const ErrorReporter::ErrorReport&) {
        ++warnings;
    });

    BufferPool pool(config_);
    pool.set_reporter(reporter);

    auto buffer = pool.acquire();
    EXPECT_EQ(pool.stats().in_use(), 1u);

    buffer->burn_and_free();
    pool.release(std::move(buffer));

    auto stats = pool.stats();
    EXPECT_EQ(stats.in_use(), 0u);
    EXPECT_EQ(stats.total_allocated, 1u);
    EXPECT_EQ(stats.available, 1u);
    EXPECT_EQ(stats.release_count, 1u);
    EXPECT_EQ(stats.discard_count, 1u);
    EXPECT_EQ(warnings, 0u);
}

TEST_F(BufferPoolTest, ThrowingReporterDoesNotEscapeRelease) {
    auto reporter = std::make_shared<ErrorReporter>();
    auto config = reporter->get_configuration();
    config.write_to_stderr = false;
    config.minimum_level = ErrorReporter::LogLevel::DEBUG;
    ASSERT_TRUE(reporter->update_configuration(config));
    reporter->add_reporter_callback([](const ErrorReporter::ErrorReport&) {
        throw std::runtime_error("collector unavailable");
    });

    BufferPool pool(config_);
    pool.set_reporter(reporter);
    {
        std::vector<PooledBuffer> held;
        for (size_t i = 0; i < config_.max_pool_size + 1; ++i) {
            held.push_back(pool.acquire_pooled());
        }
    }

    // The last return found the pool full and was reported
    EXPECT_EQ(pool.available(), config_.max_pool_size);
    EXPECT_EQ(pool.stats().discard_count, 1u);
    EXPECT_EQ(reporter->get_statistics().failed_reports, 1u);
}

TEST_F(BufferPoolTest, WarmAndShrink) {
    BufferPool pool(config_);

    EXPECT_EQ(pool.warm(10), 2u);        // capped at max_pool_size
    EXPECT_EQ(pool.available(), 4u);
    EXPECT_EQ(pool.warm(3), 0u);

    EXPECT_EQ(pool.shrink(), 2u);        // back to min_pool_size
    EXPECT_EQ(pool.available(), 2u);
    EXPECT_EQ(pool.stats().total_allocated, 2u);

    pool.clear();
    EXPECT_EQ(pool.available(), 0u);
    EXPECT_EQ(pool.stats().total_allocated, 0u);
}

TEST_F(BufferPoolTest, PooledBufferReturnsOnScopeExit) {
    BufferPool pool(config_);
    {
        auto pooled = pool.acquire_pooled();
        ASSERT_TRUE(pooled);
        EXPECT_EQ(pooled->capacity(), 256u);
        EXPECT_EQ(pool.available(), 1u);
    }
    EXPECT_EQ(pool.available(), 2u);
}

TEST_F(BufferPoolTest, PooledBufferReturnsDuringUnwind) {
    BufferPool pool(config_);

    EXPECT_THROW({
        auto pooled = pool.acquire_pooled();
        EXPECT_TRUE(pooled->put_string(std::string("in flight")));
        throw std::runtime_error("connection aborted");
    }, std::runtime_error);

    EXPECT_EQ(pool.available(), 2u);
    EXPECT_EQ(pool.stats().release_count, 1u);
}

TEST_F(BufferPoolTest, PooledBufferRelease) {
    BufferPool pool(config_);

    std::unique_ptr<LinearBuffer> detached;
    {
        auto pooled = pool.acquire_pooled();
        detached = pooled.release();
        EXPECT_FALSE(pooled);
    }
    ASSERT_NE(detached, nullptr);
    EXPECT_EQ(pool.available(), 1u);
    EXPECT_EQ(pool.stats().release_count, 0u);
}

TEST_F(BufferPoolTest, PooledBufferMove) {
    BufferPool pool(config_);

    PooledBuffer outer;
    EXPECT_FALSE(outer);
    {
        auto inner = pool.acquire_pooled();
        outer = std::move(inner);
        EXPECT_FALSE(inner);
    }
    EXPECT_TRUE(outer);
    EXPECT_EQ(pool.available(), 1u);
}

TEST_F(BufferPoolTest, ConcurrentAcquireRelease) {
    config_.max_pool_size = 16;
    BufferPool pool(config_);

    constexpr size_t kWorkers = 8;
    constexpr size_t kIterations = 200;

    std::mutex owners_mutex;
    std::set<LinearBuffer*> owners;
    bool duplicate = false;

    secbuf::test::ConcurrentTestRunner::run_workers(kWorkers, [&](size_t) {
        for (size_t i = 0; i < kIterations; ++i) {
            auto buffer = pool.acquire();
            {
                std::lock_guard<std::mutex> lock(owners_mutex);
                if (!owners.insert(buffer.get()).second) {
                    duplicate = true;
                }
            }
            (void)buffer->put_u32(static_cast<uint32_t>(i));
            {
                std::lock_guard<std::mutex> lock(owners_mutex);
                owners.erase(buffer.get());
            }
            pool.release(std::move(buffer));
        }
    });

    EXPECT_FALSE(duplicate);
    auto stats = pool.stats();
    EXPECT_EQ(stats.acquire_count, kWorkers * kIterations);
    EXPECT_EQ(stats.hit_count + stats.miss_count, stats.acquire_count);
    EXPECT_LE(stats.available, config_.max_pool_size);
}

class PoolRegistryTest : public ::testing::Test {
protected:
    void SetUp() override {
        defaults_.max_pool_size = 8;
        defaults_.min_pool_size = 1;
    }

    PoolConfig defaults_;
};

TEST_F(PoolRegistryTest, GetPoolCreatesOnce) {
    PoolRegistry registry(defaults_);

    auto pool = registry.get_pool(1024);
    ASSERT_NE(pool, nullptr);
    EXPECT_EQ(pool->buffer_size(), 1024u);
    EXPECT_EQ(pool->config().max_pool_size, 8u);
    EXPECT_EQ(registry.get_pool(1024), pool);
    EXPECT_EQ(registry.pool_count(), 1u);
}

TEST_F(PoolRegistryTest, CreatePoolRejectsDuplicate) {
    PoolRegistry registry(defaults_);

    PoolConfig config = defaults_;
    config.buffer_size = 2048;
    ASSERT_TRUE(registry.create_pool(config));
    EXPECT_EQ(registry.create_pool(config).error(), SecbufError::INVALID_PARAMETER);

    config.buffer_size = 0;
    EXPECT_EQ(registry.create_pool(config).error(), SecbufError::INVALID_CONFIGURATION);
}

TEST_F(PoolRegistryTest, IndependentRegistries) {
    PoolRegistry a(defaults_);
    PoolRegistry b(defaults_);

    EXPECT_NE(a.get_pool(512), b.get_pool(512));
    EXPECT_EQ(b.pool_count(), 1u);
}

TEST_F(PoolRegistryTest, StatisticsAndMemoryUsage) {
    PoolRegistry registry(defaults_);
    registry.get_pool(1024);
    registry.get_pool(4096);

    auto stats = registry.get_all_statistics();
    EXPECT_EQ(stats.size(), 2u);
    EXPECT_EQ(registry.total_memory_usage(), 1024u + 4096u);

    registry.clear_all_pools();
    EXPECT_EQ(registry.total_memory_usage(), 0u);
    EXPECT_EQ(registry.pool_count(), 2u);

    registry.remove_pool(1024);
    EXPECT_EQ(registry.pool_count(), 1u);
}

TEST_F(PoolRegistryTest, PoolOutlivesRemoval) {
    PoolRegistry registry(defaults_);
    auto pool = registry.get_pool(1024);
    registry.remove_pool(1024);

    auto buffer = pool->acquire();
    ASSERT_NE(buffer, nullptr);
    pool->release(std::move(buffer));
}
