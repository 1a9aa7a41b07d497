#ifndef SECBUF_MEMORY_POOL_H
#define SECBUF_MEMORY_POOL_H

#include <secbuf/config.h>
#include <secbuf/result.h>
#include <secbuf/error_reporter.h>
#include <secbuf/memory/buffer.h>
#include <memory>
#include <queue>
#include <mutex>
#include <vector>
#include <unordered_map>

namespace secbuf {
namespace memory {

// Pool configuration
struct SECBUF_API PoolConfig {
    size_t buffer_size{8192};        // capacity class served by the pool
    size_t max_pool_size{100};       // upper bound on idle buffers
    size_t min_pool_size{10};        // buffers allocated at construction
    size_t worker_cache_size{16};    // per-worker cache bound, FastBufferPool only
    WipePolicy wipe_policy{};

    Result<void> validate() const;
};

namespace pool_presets {

// 1 KiB buffers for memory-constrained hosts
SECBUF_API PoolConfig small_buffers();

// 64 KiB buffers for high-throughput servers
SECBUF_API PoolConfig large_buffers();

// MTU-sized buffers for packet processing
SECBUF_API PoolConfig network_mtu();

} // namespace pool_presets

// Memory pool statistics
struct SECBUF_API PoolStats {
    uint64_t acquire_count{0};
    uint64_t hit_count{0};
    uint64_t miss_count{0};
    uint64_t release_count{0};
    uint64_t discard_count{0};
    size_t available{0};
    size_t total_allocated{0};
    size_t buffer_size{0};
    size_t max_pool_size{0};
    double hit_rate{0.0};      // hit_count / acquire_count, 0 before the first acquire

    size_t in_use() const noexcept {
        return total_allocated > available ? total_allocated - available : 0;
    }
};

/**
 * A supplier of LinearBuffers of one capacity class. Buffers handed out by
 * acquire_buffer() go back through release_buffer() on the same source.
 */
class SECBUF_API BufferSource {
public:
    virtual ~BufferSource() = default;

    virtual size_t buffer_size() const noexcept = 0;
    virtual std::unique_ptr<LinearBuffer> acquire_buffer() = 0;
    virtual void release_buffer(std::unique_ptr<LinearBuffer> buffer) = 0;
};

class PooledBuffer;

/**
 * Mutex-protected pool of LinearBuffers of one capacity class.
 *
 * Released buffers are burned before they become available again. Idle
 * buffers beyond max_pool_size are freed, as are buffers of any other
 * capacity.
 */
class SECBUF_API BufferPool : public BufferSource {
public:
    // Throws SecbufException(INVALID_CONFIGURATION) when config fails validate()
    explicit BufferPool(const PoolConfig& config);
    ~BufferPool() override;

    // Non-copyable, non-movable
    BufferPool(const BufferPool&) = delete;
    BufferPool& operator=(const BufferPool&) = delete;
    BufferPool(BufferPool&&) = delete;
    BufferPool& operator=(BufferPool&&) = delete;

    // Buffer management
    std::unique_ptr<LinearBuffer> acquire();
    PooledBuffer acquire_pooled();
    void release(std::unique_ptr<LinearBuffer> buffer);

    // Pool management; each returns the number of buffers created or freed
    size_t warm(size_t target);
    size_t shrink();
    void clear();

    // Statistics
    PoolStats stats() const;
    size_t available() const;

    const PoolConfig& config() const noexcept { return config_; }

    // Diagnostics are off until a reporter is set; set it before sharing the pool
    void set_reporter(std::shared_ptr<ErrorReporter> reporter) { reporter_ = std::move(reporter); }

    // BufferSource
    size_t buffer_size() const noexcept override { return config_.buffer_size; }
    std::unique_ptr<LinearBuffer> acquire_buffer() override { return acquire(); }
    void release_buffer(std::unique_ptr<LinearBuffer> buffer) override { release(std::move(buffer)); }

private:
    const PoolConfig config_;

    mutable std::mutex pool_mutex_;
    std::queue<std::unique_ptr<LinearBuffer>> available_buffers_;

    // Guarded by pool_mutex_
    uint64_t acquire_count_{0};
    uint64_t hit_count_{0};
    uint64_t miss_count_{0};
    uint64_t release_count_{0};
    uint64_t discard_count_{0};
    size_t total_allocated_{0};

    std::shared_ptr<ErrorReporter> reporter_;

    std::unique_ptr<LinearBuffer> create_buffer() const;
};

// RAII buffer holder with automatic pool return
class SECBUF_API PooledBuffer {
public:
    PooledBuffer() noexcept : pool_(nullptr) {}
    PooledBuffer(std::unique_ptr<LinearBuffer> buffer, BufferPool* pool) noexcept;

    // Move semantics only
    PooledBuffer(const PooledBuffer&) = delete;
    PooledBuffer& operator=(const PooledBuffer&) = delete;
    PooledBuffer(PooledBuffer&& other) noexcept;
    PooledBuffer& operator=(PooledBuffer&& other) noexcept;

    // Returns the buffer to its pool
    ~PooledBuffer();

    LinearBuffer& buffer() { return *buffer_; }
    const LinearBuffer& buffer() const { return *buffer_; }
    LinearBuffer* operator->() { return buffer_.get(); }
    const LinearBuffer* operator->() const { return buffer_.get(); }
    LinearBuffer& operator*() { return *buffer_; }
    const LinearBuffer& operator*() const { return *buffer_; }

    // Take the buffer out of pool management
    std::unique_ptr<LinearBuffer> release() noexcept;

    bool is_valid() const noexcept { return buffer_ != nullptr; }
    explicit operator bool() const noexcept { return is_valid(); }

private:
    std::unique_ptr<LinearBuffer> buffer_;
    BufferPool* pool_;

    void return_to_pool() noexcept;
};

/**
 * Capacity-class keyed set of BufferPools. Each registry is independent;
 * callers own and pass it where needed.
 */
class SECBUF_API PoolRegistry {
public:
    // defaults supplies everything but buffer_size for pools created on demand
    explicit PoolRegistry(const PoolConfig& defaults = PoolConfig{});

    PoolRegistry(const PoolRegistry&) = delete;
    PoolRegistry& operator=(const PoolRegistry&) = delete;

    // Pool for buffer_size, created from the defaults if absent
    std::shared_ptr<BufferPool> get_pool(size_t buffer_size);

    // Fails with INVALID_PARAMETER if a pool of that size exists
    Result<std::shared_ptr<BufferPool>> create_pool(const PoolConfig& config);

    void remove_pool(size_t buffer_size);
    void clear_all_pools();

    size_t pool_count() const;
    std::vector<PoolStats> get_all_statistics() const;

    // Bytes held by all buffers the registry's pools have allocated
    size_t total_memory_usage() const;

    // Applied to pools created after the call
    void set_reporter(std::shared_ptr<ErrorReporter> reporter);

private:
    const PoolConfig defaults_;
    mutable std::mutex pools_mutex_;
    std::unordered_map<size_t, std::shared_ptr<BufferPool>> pools_;
    std::shared_ptr<ErrorReporter> reporter_;
};

} // namespace memory
} // namespace secbuf

#endif // SECBUF_MEMORY_POOL_H
