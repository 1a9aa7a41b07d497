#include <secbuf/memory/fast_pool.h>
#include <secbuf/error.h>
#include <algorithm>
#include <string>
#include <utility>

namespace secbuf {
namespace memory {

namespace {

const char* const FAST_POOL_CATEGORY = "fast_buffer_pool";

const PoolConfig& validated(const PoolConfig& config) {
    auto valid = config.validate();
    if (!valid) {
        throw SecbufException(valid.error(), "Invalid fast buffer pool configuration");
    }
    return config;
}

double ratio(uint64_t part, uint64_t whole) noexcept {
    return whole > 0 ? static_cast<double>(part) / static_cast<double>(whole) : 0.0;
}

} // anonymous namespace

// WorkerCache implementation
WorkerCache::WorkerCache(Key, FastBufferPool& pool, size_t capacity)
    : pool_(pool)
    , capacity_(capacity) {
    buffers_.reserve(capacity);
}

WorkerCache::~WorkerCache() {
    flush();
}

void WorkerCache::flush() {
    for (auto& buffer : buffers_) {
        pool_.push_or_discard(std::move(buffer));
    }
    buffers_.clear();
}

// FastBufferPool implementation
FastBufferPool::FastBufferPool(const PoolConfig& config)
    : config_(validated(config))
    , shared_(config.max_pool_size) {
    warm(config_.min_pool_size);
}

FastBufferPool::~FastBufferPool() {
    clear();
}

std::unique_ptr<WorkerCache> FastBufferPool::create_worker_cache() {
    return std::make_unique<WorkerCache>(WorkerCache::Key(), *this, config_.worker_cache_size);
}

bool FastBufferPool::owns_cache(const WorkerCache* cache) const noexcept {
    return cache != nullptr && &cache->pool_ == this;
}

std::unique_ptr<LinearBuffer> FastBufferPool::create_buffer() {
    auto buffer = std::make_unique<LinearBuffer>(config_.buffer_size, config_.wipe_policy);
    total_allocated_.fetch_add(1, std::memory_order_relaxed);
    return buffer;
}

std::unique_ptr<LinearBuffer> FastBufferPool::acquire(WorkerCache* cache) {
    acquire_count_.fetch_add(1, std::memory_order_relaxed);

    // Fast path: the worker's private cache
    if (owns_cache(cache) && !cache->buffers_.empty()) {
        auto buffer = std::move(cache->buffers_.back());
        cache->buffers_.pop_back();
        cache_hit_count_.fetch_add(1, std::memory_order_relaxed);
        return buffer;
    }

    // Contended path: the shared queue
    if (auto buffer = shared_.try_pop()) {
        pool_hit_count_.fetch_add(1, std::memory_order_relaxed);
        return buffer;
    }

    miss_count_.fetch_add(1, std::memory_order_relaxed);
    return create_buffer();
}

FastPooledBuffer FastBufferPool::acquire_pooled(WorkerCache* cache) {
    return FastPooledBuffer(acquire(cache), this, cache);
}

void FastBufferPool::release(std::unique_ptr<LinearBuffer> buffer, WorkerCache* cache) {
    if (!buffer) {
        return;
    }

    release_count_.fetch_add(1, std::memory_order_relaxed);

    if (buffer->capacity() == 0) {
        // One of ours, already burned and freed by its holder
        discard_count_.fetch_add(1, std::memory_order_relaxed);
        total_allocated_.fetch_sub(1, std::memory_order_relaxed);
        return;
    }

    if (buffer->capacity() != config_.buffer_size) {
        size_t foreign_capacity = buffer->capacity();
        buffer->burn_and_free();
        discard_count_.fetch_add(1, std::memory_order_relaxed);
        SECBUF_REPORT_WARNING(reporter_, SecbufError::INVALID_PARAMETER, FAST_POOL_CATEGORY,
                              "Released buffer of foreign capacity " +
                              std::to_string(foreign_capacity) + " freed");
        return;
    }

    // Wipe before the buffer can be seen by another owner
    buffer->burn();

    if (owns_cache(cache) && cache->buffers_.size() < cache->capacity_) {
        cache->buffers_.push_back(std::move(buffer));
        return;
    }

    push_or_discard(std::move(buffer));
}

void FastBufferPool::push_or_discard(std::unique_ptr<LinearBuffer> buffer) {
    if (shared_.try_push(buffer)) {
        return;
    }

    // Shared queue full; buffer is wiped by its destructor
    buffer.reset();
    discard_count_.fetch_add(1, std::memory_order_relaxed);
    total_allocated_.fetch_sub(1, std::memory_order_relaxed);
    SECBUF_REPORT_DEBUG(reporter_, SecbufError::QUEUE_FULL, FAST_POOL_CATEGORY,
                        "Shared queue full at " + std::to_string(shared_.capacity()) +
                        " buffers, released buffer freed");
}

size_t FastBufferPool::warm(size_t target) {
    size_t wanted = std::min(target, shared_.capacity());

    size_t created = 0;
    while (shared_.size_approx() < wanted) {
        auto buffer = create_buffer();
        if (!shared_.try_push(buffer)) {
            total_allocated_.fetch_sub(1, std::memory_order_relaxed);
            break;
        }
        ++created;
    }
    return created;
}

void FastBufferPool::clear() {
    while (auto buffer = shared_.try_pop()) {
        total_allocated_.fetch_sub(1, std::memory_order_relaxed);
    }
}

FastPoolStats FastBufferPool::stats() const {
    FastPoolStats stats;
    stats.acquire_count = acquire_count_.load(std::memory_order_relaxed);
    stats.cache_hit_count = cache_hit_count_.load(std::memory_order_relaxed);
    stats.pool_hit_count = pool_hit_count_.load(std::memory_order_relaxed);
    stats.miss_count = miss_count_.load(std::memory_order_relaxed);
    stats.release_count = release_count_.load(std::memory_order_relaxed);
    stats.discard_count = discard_count_.load(std::memory_order_relaxed);
    stats.available = shared_.size_approx();
    stats.total_allocated = total_allocated_.load(std::memory_order_relaxed);
    stats.cache_hit_rate = ratio(stats.cache_hit_count, stats.acquire_count);
    stats.pool_hit_rate = ratio(stats.pool_hit_count, stats.acquire_count);
    return stats;
}

// FastPooledBuffer implementation
FastPooledBuffer::FastPooledBuffer(std::unique_ptr<LinearBuffer> buffer,
                                   FastBufferPool* pool,
                                   WorkerCache* cache) noexcept
    : buffer_(std::move(buffer))
    , pool_(pool)
    , cache_(cache) {}

FastPooledBuffer::FastPooledBuffer(FastPooledBuffer&& other) noexcept
    : buffer_(std::move(other.buffer_))
    , pool_(other.pool_)
    , cache_(other.cache_) {
    other.pool_ = nullptr;
    other.cache_ = nullptr;
}

FastPooledBuffer& FastPooledBuffer::operator=(FastPooledBuffer&& other) noexcept {
    if (this != &other) {
        return_to_pool();
        buffer_ = std::move(other.buffer_);
        pool_ = other.pool_;
        cache_ = other.cache_;
        other.pool_ = nullptr;
        other.cache_ = nullptr;
    }
    return *this;
}

FastPooledBuffer::~FastPooledBuffer() {
    return_to_pool();
}

std::unique_ptr<LinearBuffer> FastPooledBuffer::release() noexcept {
    pool_ = nullptr;
    cache_ = nullptr;
    return std::move(buffer_);
}

void FastPooledBuffer::return_to_pool() noexcept {
    if (buffer_ && pool_) {
        pool_->release(std::move(buffer_), cache_);
    }
    buffer_.reset();
}

} // namespace memory
} // namespace secbuf
