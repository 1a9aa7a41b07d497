#ifndef SECBUF_MEMORY_FAST_POOL_H
#define SECBUF_MEMORY_FAST_POOL_H

#include <secbuf/config.h>
#include <secbuf/result.h>
#include <secbuf/error_reporter.h>
#include <secbuf/memory/buffer.h>
#include <secbuf/memory/pool.h>
#include <secbuf/memory/slot_queue.h>
#include <atomic>
#include <memory>
#include <vector>

namespace secbuf {
namespace memory {

struct SECBUF_API FastPoolStats {
    uint64_t acquire_count{0};
    uint64_t cache_hit_count{0};
    uint64_t pool_hit_count{0};
    uint64_t miss_count{0};
    uint64_t release_count{0};
    uint64_t discard_count{0};
    size_t available{0};           // buffers in the shared queue
    size_t total_allocated{0};
    double cache_hit_rate{0.0};    // cache_hit_count / acquire_count
    double pool_hit_rate{0.0};     // pool_hit_count / acquire_count
};

class FastBufferPool;

/**
 * Private buffer cache of one worker.
 *
 * Obtained from FastBufferPool::create_worker_cache() when the worker is
 * started and used only by that worker, so it needs no synchronization.
 * Cached buffers are flushed to the pool's shared queue on destruction.
 * The pool must outlive every cache it created.
 */
class SECBUF_API WorkerCache {
public:
    // Constructible only by FastBufferPool
    class Key {
        friend class FastBufferPool;
        Key() {}
    };

    WorkerCache(Key, FastBufferPool& pool, size_t capacity);
    ~WorkerCache();

    WorkerCache(const WorkerCache&) = delete;
    WorkerCache& operator=(const WorkerCache&) = delete;
    WorkerCache(WorkerCache&&) = delete;
    WorkerCache& operator=(WorkerCache&&) = delete;

    size_t size() const noexcept { return buffers_.size(); }
    size_t capacity() const noexcept { return capacity_; }
    bool empty() const noexcept { return buffers_.empty(); }

    // Move every cached buffer to the shared queue, freeing what does not fit
    void flush();

private:
    friend class FastBufferPool;

    FastBufferPool& pool_;
    const size_t capacity_;
    std::vector<std::unique_ptr<LinearBuffer>> buffers_;
};

class FastPooledBuffer;

/**
 * Two-level buffer pool.
 *
 * acquire() tries the caller's WorkerCache, then the shared lock-free
 * SlotQueue, then allocates. release() burns the buffer and offers it to
 * the cache, then the shared queue, and frees it when both are full. The
 * shared queue holds at most max_pool_size buffers.
 */
class SECBUF_API FastBufferPool : public BufferSource {
public:
    // Throws SecbufException(INVALID_CONFIGURATION) when config fails validate()
    explicit FastBufferPool(const PoolConfig& config);
    ~FastBufferPool() override;

    FastBufferPool(const FastBufferPool&) = delete;
    FastBufferPool& operator=(const FastBufferPool&) = delete;
    FastBufferPool(FastBufferPool&&) = delete;
    FastBufferPool& operator=(FastBufferPool&&) = delete;

    std::unique_ptr<WorkerCache> create_worker_cache();

    // A null cache skips the private tier
    std::unique_ptr<LinearBuffer> acquire(WorkerCache* cache = nullptr);
    FastPooledBuffer acquire_pooled(WorkerCache* cache = nullptr);
    void release(std::unique_ptr<LinearBuffer> buffer, WorkerCache* cache = nullptr);

    // Fill the shared queue up to target buffers; returns the number created
    size_t warm(size_t target);

    // Free every buffer in the shared queue
    void clear();

    size_t available() const noexcept { return shared_.size_approx(); }
    FastPoolStats stats() const;

    const PoolConfig& config() const noexcept { return config_; }

    // Diagnostics are off until a reporter is set; set it before sharing the pool
    void set_reporter(std::shared_ptr<ErrorReporter> reporter) { reporter_ = std::move(reporter); }

    // BufferSource
    size_t buffer_size() const noexcept override { return config_.buffer_size; }
    std::unique_ptr<LinearBuffer> acquire_buffer() override { return acquire(); }
    void release_buffer(std::unique_ptr<LinearBuffer> buffer) override { release(std::move(buffer)); }

private:
    friend class WorkerCache;

    const PoolConfig config_;
    SlotQueue<LinearBuffer> shared_;

    std::atomic<uint64_t> acquire_count_{0};
    std::atomic<uint64_t> cache_hit_count_{0};
    std::atomic<uint64_t> pool_hit_count_{0};
    std::atomic<uint64_t> miss_count_{0};
    std::atomic<uint64_t> release_count_{0};
    std::atomic<uint64_t> discard_count_{0};
    std::atomic<size_t> total_allocated_{0};

    std::shared_ptr<ErrorReporter> reporter_;

    std::unique_ptr<LinearBuffer> create_buffer();
    bool owns_cache(const WorkerCache* cache) const noexcept;

    // Push to the shared queue, or free the buffer if the queue is full
    void push_or_discard(std::unique_ptr<LinearBuffer> buffer);
};

// RAII holder returning its buffer to the originating pool and cache
class SECBUF_API FastPooledBuffer {
public:
    FastPooledBuffer() noexcept : pool_(nullptr), cache_(nullptr) {}
    FastPooledBuffer(std::unique_ptr<LinearBuffer> buffer,
                     FastBufferPool* pool,
                     WorkerCache* cache) noexcept;

    FastPooledBuffer(const FastPooledBuffer&) = delete;
    FastPooledBuffer& operator=(const FastPooledBuffer&) = delete;
    FastPooledBuffer(FastPooledBuffer&& other) noexcept;
    FastPooledBuffer& operator=(FastPooledBuffer&& other) noexcept;

    ~FastPooledBuffer();

    LinearBuffer& buffer() { return *buffer_; }
    const LinearBuffer& buffer() const { return *buffer_; }
    LinearBuffer* operator->() { return buffer_.get(); }
    const LinearBuffer* operator->() const { return buffer_.get(); }
    LinearBuffer& operator*() { return *buffer_; }
    const LinearBuffer& operator*() const { return *buffer_; }

    std::unique_ptr<LinearBuffer> release() noexcept;

    bool is_valid() const noexcept { return buffer_ != nullptr; }
    explicit operator bool() const noexcept { return is_valid(); }

private:
    std::unique_ptr<LinearBuffer> buffer_;
    FastBufferPool* pool_;
    WorkerCache* cache_;

    void return_to_pool() noexcept;
};

} // namespace memory
} // namespace secbuf

#endif // SECBUF_MEMORY_FAST_POOL_H
