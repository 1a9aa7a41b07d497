#include <secbuf/memory/pool.h>
#include <secbuf/error.h>
#include <algorithm>
#include <string>
#include <utility>

namespace secbuf {
namespace memory {

namespace {

const char* const POOL_CATEGORY = "buffer_pool";

} // anonymous namespace

// PoolConfig implementation
Result<void> PoolConfig::validate() const {
    if (buffer_size == 0) {
        return make_error<void>(SecbufError::INVALID_CONFIGURATION);
    }
    if (max_pool_size == 0) {
        return make_error<void>(SecbufError::INVALID_CONFIGURATION);
    }
    if (min_pool_size > max_pool_size) {
        return make_error<void>(SecbufError::INVALID_CONFIGURATION);
    }
    return make_result();
}

namespace pool_presets {

PoolConfig small_buffers() {
    PoolConfig config;
    config.buffer_size = 1024;
    config.max_pool_size = 20;
    config.min_pool_size = 5;
    return config;
}

PoolConfig large_buffers() {
    PoolConfig config;
    config.buffer_size = 65536;
    config.max_pool_size = 1000;
    config.min_pool_size = 50;
    return config;
}

PoolConfig network_mtu() {
    PoolConfig config;
    config.buffer_size = 1500;
    config.max_pool_size = 500;
    config.min_pool_size = 20;
    return config;
}

} // namespace pool_presets

// BufferPool implementation
BufferPool::BufferPool(const PoolConfig& config)
    : config_(config) {

    auto valid = config.validate();
    if (!valid) {
        throw SecbufException(valid.error(), "Invalid buffer pool configuration");
    }

    // Pre-allocate initial buffers
    std::lock_guard<std::mutex> lock(pool_mutex_);
    for (size_t i = 0; i < config_.min_pool_size; ++i) {
        available_buffers_.push(create_buffer());
        ++total_allocated_;
    }
}

BufferPool::~BufferPool() {
    clear();
}

std::unique_ptr<LinearBuffer> BufferPool::create_buffer() const {
    return std::make_unique<LinearBuffer>(config_.buffer_size, config_.wipe_policy);
}

std::unique_ptr<LinearBuffer> BufferPool::acquire() {
    {
        std::lock_guard<std::mutex> lock(pool_mutex_);
        ++acquire_count_;

        if (!available_buffers_.empty()) {
            auto buffer = std::move(available_buffers_.front());
            available_buffers_.pop();
            ++hit_count_;
            return buffer;
        }

        ++miss_count_;
    }

    // Allocate outside the critical section
    auto buffer = create_buffer();

    std::lock_guard<std::mutex> lock(pool_mutex_);
    ++total_allocated_;
    return buffer;
}

PooledBuffer BufferPool::acquire_pooled() {
    return PooledBuffer(acquire(), this);
}

void BufferPool::release(std::unique_ptr<LinearBuffer> buffer) {
    if (!buffer) {
        return;
    }

    if (buffer->capacity() == 0) {
        // One of ours, already burned and freed by its holder
        std::lock_guard<std::mutex> lock(pool_mutex_);
        ++release_count_;
        ++discard_count_;
        if (total_allocated_ > 0) {
            --total_allocated_;
        }
        return;
    }

    if (buffer->capacity() != config_.buffer_size) {
        size_t foreign_capacity = buffer->capacity();
        buffer->burn_and_free();
        {
            std::lock_guard<std::mutex> lock(pool_mutex_);
            ++release_count_;
            ++discard_count_;
        }
        SECBUF_REPORT_WARNING(reporter_, SecbufError::INVALID_PARAMETER, POOL_CATEGORY,
                              "Released buffer of foreign capacity " +
                              std::to_string(foreign_capacity) + " freed");
        return;
    }

    // Wipe before the buffer can be seen by another owner
    buffer->burn();

    bool discarded = false;
    {
        std::lock_guard<std::mutex> lock(pool_mutex_);
        ++release_count_;

        if (available_buffers_.size() < config_.max_pool_size) {
            available_buffers_.push(std::move(buffer));
        } else {
            ++discard_count_;
            if (total_allocated_ > 0) {
                --total_allocated_;
            }
            discarded = true;
        }
    }

    if (discarded) {
        SECBUF_REPORT_DEBUG(reporter_, SecbufError::SUCCESS, POOL_CATEGORY,
                            "Pool full at " + std::to_string(config_.max_pool_size) +
                            " buffers, released buffer freed");
    }
}

size_t BufferPool::warm(size_t target) {
    size_t wanted = std::min(target, config_.max_pool_size);

    size_t missing = 0;
    {
        std::lock_guard<std::mutex> lock(pool_mutex_);
        if (available_buffers_.size() >= wanted) {
            return 0;
        }
        missing = wanted - available_buffers_.size();
    }

    std::vector<std::unique_ptr<LinearBuffer>> fresh;
    fresh.reserve(missing);
    for (size_t i = 0; i < missing; ++i) {
        fresh.push_back(create_buffer());
    }

    size_t created = 0;
    std::lock_guard<std::mutex> lock(pool_mutex_);
    for (auto& buffer : fresh) {
        if (available_buffers_.size() >= config_.max_pool_size) {
            break;
        }
        available_buffers_.push(std::move(buffer));
        ++total_allocated_;
        ++created;
    }
    return created;
}

size_t BufferPool::shrink() {
    std::vector<std::unique_ptr<LinearBuffer>> freed;
    {
        std::lock_guard<std::mutex> lock(pool_mutex_);
        while (available_buffers_.size() > config_.min_pool_size) {
            freed.push_back(std::move(available_buffers_.front()));
            available_buffers_.pop();
            --total_allocated_;
        }
    }
    return freed.size();
}

void BufferPool::clear() {
    std::queue<std::unique_ptr<LinearBuffer>> freed;
    {
        std::lock_guard<std::mutex> lock(pool_mutex_);
        total_allocated_ -= std::min(total_allocated_, available_buffers_.size());
        std::swap(freed, available_buffers_);
    }
}

PoolStats BufferPool::stats() const {
    std::lock_guard<std::mutex> lock(pool_mutex_);

    PoolStats stats;
    stats.acquire_count = acquire_count_;
    stats.hit_count = hit_count_;
    stats.miss_count = miss_count_;
    stats.release_count = release_count_;
    stats.discard_count = discard_count_;
    stats.available = available_buffers_.size();
    stats.total_allocated = total_allocated_;
    stats.buffer_size = config_.buffer_size;
    stats.max_pool_size = config_.max_pool_size;

    if (acquire_count_ > 0) {
        stats.hit_rate = static_cast<double>(hit_count_) / static_cast<double>(acquire_count_);
    }

    return stats;
}

size_t BufferPool::available() const {
    std::lock_guard<std::mutex> lock(pool_mutex_);
    return available_buffers_.size();
}

// PooledBuffer implementation
PooledBuffer::PooledBuffer(std::unique_ptr<LinearBuffer> buffer, BufferPool* pool) noexcept
    : buffer_(std::move(buffer))
    , pool_(pool) {}

PooledBuffer::PooledBuffer(PooledBuffer&& other) noexcept
    : buffer_(std::move(other.buffer_))
    , pool_(other.pool_) {
    other.pool_ = nullptr;
}

PooledBuffer& PooledBuffer::operator=(PooledBuffer&& other) noexcept {
    if (this != &other) {
        return_to_pool();
        buffer_ = std::move(other.buffer_);
        pool_ = other.pool_;
        other.pool_ = nullptr;
    }
    return *this;
}

PooledBuffer::~PooledBuffer() {
    return_to_pool();
}

std::unique_ptr<LinearBuffer> PooledBuffer::release() noexcept {
    pool_ = nullptr;
    return std::move(buffer_);
}

void PooledBuffer::return_to_pool() noexcept {
    if (buffer_ && pool_) {
        pool_->release(std::move(buffer_));
    }
    buffer_.reset();
}

// PoolRegistry implementation
PoolRegistry::PoolRegistry(const PoolConfig& defaults)
    : defaults_(defaults) {}

std::shared_ptr<BufferPool> PoolRegistry::get_pool(size_t buffer_size) {
    std::lock_guard<std::mutex> lock(pools_mutex_);

    auto it = pools_.find(buffer_size);
    if (it != pools_.end()) {
        return it->second;
    }

    PoolConfig config = defaults_;
    config.buffer_size = buffer_size;
    auto pool = std::make_shared<BufferPool>(config);
    pool->set_reporter(reporter_);
    pools_.emplace(buffer_size, pool);
    return pool;
}

Result<std::shared_ptr<BufferPool>> PoolRegistry::create_pool(const PoolConfig& config) {
    auto valid = config.validate();
    if (!valid) {
        return make_error<std::shared_ptr<BufferPool>>(valid.error());
    }

    std::lock_guard<std::mutex> lock(pools_mutex_);
    if (pools_.find(config.buffer_size) != pools_.end()) {
        return make_error<std::shared_ptr<BufferPool>>(SecbufError::INVALID_PARAMETER);
    }

    auto pool = std::make_shared<BufferPool>(config);
    pool->set_reporter(reporter_);
    pools_.emplace(config.buffer_size, pool);
    return make_result(std::move(pool));
}

void PoolRegistry::remove_pool(size_t buffer_size) {
    std::lock_guard<std::mutex> lock(pools_mutex_);
    pools_.erase(buffer_size);
}

void PoolRegistry::clear_all_pools() {
    std::lock_guard<std::mutex> lock(pools_mutex_);
    for (auto& entry : pools_) {
        entry.second->clear();
    }
}

size_t PoolRegistry::pool_count() const {
    std::lock_guard<std::mutex> lock(pools_mutex_);
    return pools_.size();
}

std::vector<PoolStats> PoolRegistry::get_all_statistics() const {
    std::lock_guard<std::mutex> lock(pools_mutex_);

    std::vector<PoolStats> stats;
    stats.reserve(pools_.size());
    for (const auto& entry : pools_) {
        stats.push_back(entry.second->stats());
    }
    return stats;
}

size_t PoolRegistry::total_memory_usage() const {
    size_t total = 0;
    for (const auto& stats : get_all_statistics()) {
        total += stats.total_allocated * stats.buffer_size;
    }
    return total;
}

void PoolRegistry::set_reporter(std::shared_ptr<ErrorReporter> reporter) {
    std::lock_guard<std::mutex> lock(pools_mutex_);
    reporter_ = std::move(reporter);
}

} // namespace memory
} // namespace secbuf
