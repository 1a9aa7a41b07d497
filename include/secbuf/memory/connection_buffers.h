#ifndef SECBUF_MEMORY_CONNECTION_BUFFERS_H
#define SECBUF_MEMORY_CONNECTION_BUFFERS_H

#include <secbuf/config.h>
#include <secbuf/result.h>
#include <secbuf/error_reporter.h>
#include <secbuf/memory/buffer.h>
#include <secbuf/memory/ring_buffer.h>
#include <secbuf/memory/pool.h>
#include <chrono>
#include <deque>
#include <memory>
#include <optional>
#include <vector>

namespace secbuf {
namespace memory {

/**
 * Limits and thresholds for one connection's buffers.
 *
 * Every field must be set by the caller; a value-initialized config does
 * not validate. See connection_presets for ready-made values.
 */
struct SECBUF_API ConnectionBufferConfig {
    size_t max_packet_queue_size{0};
    size_t max_packet_queue_bytes{0};          // sum of queued packet lengths
    std::chrono::milliseconds idle_timeout{0};
    bool enable_aggressive_shrinking{false};

    // is_problematic() thresholds
    double min_efficiency{0.0};
    size_t max_wasted_bytes{0};

    // force_shrink() reallocates slots whose wasted fraction exceeds this
    double shrink_waste_ratio{1.0};

    WipePolicy wipe_policy{};

    Result<void> validate() const;
};

namespace connection_presets {

// 100 packets, 10 MiB queued, five minute idle timeout
SECBUF_API ConnectionBufferConfig standard();

// 32 packets, 1 MiB queued, thirty second idle timeout, tighter waste limits
SECBUF_API ConnectionBufferConfig memory_constrained();

} // namespace connection_presets

// Memory accounting for one connection; ring buffers count once allocated
struct SECBUF_API ConnectionMemoryStats {
    size_t read_buf_bytes{0};
    size_t write_buf_bytes{0};
    size_t stream_buf_bytes{0};
    size_t packet_queue_bytes{0};    // capacity held by queued packets
    size_t total_bytes{0};
    size_t total_used{0};
    size_t total_wasted{0};
    double efficiency{1.0};          // total_used / total_bytes, 1.0 when nothing is held
};

/**
 * Buffers owned by one logical connection: optional read and write slots,
 * any number of stream ring buffers and a bounded outbound packet queue.
 *
 * Linear slots are drawn from the BufferSource when the requested capacity
 * fits its capacity class and are returned to it on release; otherwise
 * they are allocated directly. Single-owner type; not thread-safe.
 *
 * The set never runs a timer. Callers drive idle handling through
 * handle_idle() on their own schedule.
 */
class SECBUF_API ConnectionBufferSet {
public:
    using Clock = std::chrono::steady_clock;

    enum class IdleAction {
        NONE,       // connection active
        IDLE,       // idle, shrinking disabled
        SHRUNK      // idle, force_shrink() ran
    };

    // Throws SecbufException(INVALID_CONFIGURATION) when config fails validate()
    explicit ConnectionBufferSet(const ConnectionBufferConfig& config,
                                 std::shared_ptr<BufferSource> source = nullptr);

    // Wipes and releases every owned buffer
    ~ConnectionBufferSet();

    ConnectionBufferSet(const ConnectionBufferSet&) = delete;
    ConnectionBufferSet& operator=(const ConnectionBufferSet&) = delete;
    ConnectionBufferSet(ConnectionBufferSet&&) = default;
    ConnectionBufferSet& operator=(ConnectionBufferSet&&) = delete;

    // Slot creation; an existing slot is wiped and released first
    void init_read_buf(size_t capacity);
    void init_write_buf(size_t capacity);

    // Returns the index of the new stream buffer
    size_t add_stream_buf(size_t capacity);

    // Slot access; nullptr when the slot does not exist
    LinearBuffer* read_buf();
    LinearBuffer* write_buf();
    RingBuffer* stream_buf(size_t index);
    size_t stream_buf_count() const noexcept { return stream_bufs_.size(); }

    // True when the slot was drawn from the BufferSource
    bool read_buf_is_pooled() const noexcept { return read_.pooled; }
    bool write_buf_is_pooled() const noexcept { return write_.pooled; }

    /**
     * Queue an outbound packet. Fails with QUEUE_FULL when either the count
     * or the byte bound would be exceeded; packet is then left untouched.
     */
    Result<void> enqueue_packet(LinearBuffer&& packet);
    std::optional<LinearBuffer> dequeue_packet();

    size_t packet_queue_len() const noexcept { return packet_queue_.size(); }
    size_t packet_queue_bytes() const noexcept { return packet_queue_bytes_; }

    // Above 80% of either queue bound
    bool is_queue_near_full() const noexcept;

    ConnectionMemoryStats memory_usage() const;
    bool is_problematic() const;

    // Reallocate wasteful slots tightly; returns the bytes reclaimed
    size_t force_shrink();

    // Idle tracking
    void touch() noexcept { last_activity_ = Clock::now(); }
    Clock::time_point last_activity() const noexcept { return last_activity_; }
    Clock::duration idle_for(Clock::time_point now = Clock::now()) const noexcept;
    bool is_idle(Clock::time_point now = Clock::now()) const noexcept;
    IdleAction handle_idle(Clock::time_point now = Clock::now());

    // Wipe every owned buffer keeping slot allocations; queued packets are dropped
    void burn() noexcept;

    // Clear cursors without wiping; queued packets are dropped
    void reset() noexcept;

    // Wipe and release every owned buffer, returning pooled ones to their source
    void aggressive_cleanup();

    const ConnectionBufferConfig& config() const noexcept { return config_; }
    void set_reporter(std::shared_ptr<ErrorReporter> reporter) { reporter_ = std::move(reporter); }

private:
    struct LinearSlot {
        std::unique_ptr<LinearBuffer> buffer;
        bool pooled{false};
    };

    ConnectionBufferConfig config_;
    std::shared_ptr<BufferSource> source_;

    LinearSlot read_;
    LinearSlot write_;
    std::vector<RingBuffer> stream_bufs_;

    std::deque<LinearBuffer> packet_queue_;
    size_t packet_queue_bytes_{0};

    Clock::time_point last_activity_;
    std::shared_ptr<ErrorReporter> reporter_;

    LinearSlot make_slot(size_t capacity);
    void release_slot(LinearSlot& slot);
    size_t shrink_slot(LinearSlot& slot);
};

} // namespace memory
} // namespace secbuf

#endif // SECBUF_MEMORY_CONNECTION_BUFFERS_H
