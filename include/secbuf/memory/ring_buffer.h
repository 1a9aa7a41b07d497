#ifndef SECBUF_MEMORY_RING_BUFFER_H
#define SECBUF_MEMORY_RING_BUFFER_H

#include <secbuf/config.h>
#include <secbuf/result.h>
#include <secbuf/memory/secure_bytes.h>
#include <cstddef>
#include <utility>

namespace secbuf {
namespace memory {

/**
 * Fixed-capacity circular byte buffer for streaming data.
 *
 * No backing memory is reserved until the first non-empty write. Writes
 * never grow the buffer: a write that does not fit fails with BUFFER_FULL
 * and changes nothing. Copies that cross the end of the region are split
 * in two.
 */
class SECBUF_API RingBuffer {
public:
    explicit RingBuffer(size_t capacity, WipePolicy policy = WipePolicy{});
    ~RingBuffer() = default;

    RingBuffer(const RingBuffer&) = delete;
    RingBuffer& operator=(const RingBuffer&) = delete;
    RingBuffer(RingBuffer&& other) noexcept;
    RingBuffer& operator=(RingBuffer&& other) noexcept;

    size_t capacity() const noexcept { return capacity_; }
    size_t size() const noexcept { return used_; }
    size_t available() const noexcept { return capacity_ - used_; }
    bool empty() const noexcept { return used_ == 0; }
    bool full() const noexcept { return used_ == capacity_; }
    bool is_allocated() const noexcept { return !storage_.empty(); }

    // Bytes held by the backing allocation (zero before the first write)
    size_t allocated_bytes() const noexcept { return storage_.capacity(); }

    Result<void> write(BufferView data);

    // Free bytes reachable from the write cursor without wrapping
    size_t contiguous_available() const noexcept;

    /**
     * Zero-copy writing: fill the region returned by writable_region(), then
     * commit_write() the bytes produced. Both fail with BUFFER_FULL, changing
     * nothing, when length exceeds contiguous_available(). The first call
     * allocates the backing region.
     */
    Result<MutableBufferView> writable_region(size_t length);
    Result<void> commit_write(size_t length);

    // Copy up to length bytes out, consuming them. Returns the count copied.
    size_t read(std::byte* out, size_t length) noexcept;
    size_t read(MutableBufferView out) noexcept { return read(out.data(), out.size()); }

    // Same as read() without consuming
    size_t peek(std::byte* out, size_t length) const noexcept;

    // Consume count bytes without copying; pairs with readable_regions()
    Result<void> discard(size_t count);

    // Unread data as at most two contiguous views, oldest first
    std::pair<BufferView, BufferView> readable_regions() const noexcept;

    // Drop unread data without wiping
    void clear() noexcept;

    // Wipe the backing region and drop unread data; keeps the allocation
    void burn() noexcept;

    // Wipe and free the backing region; the next write allocates again
    void release() noexcept;

    BufferView storage() const noexcept { return storage_.view(); }

private:
    SecureBytes storage_;
    size_t capacity_;
    WipePolicy policy_;
    size_t head_;
    size_t tail_;
    size_t used_;

    size_t copy_out(size_t from, std::byte* out, size_t length) const noexcept;
};

} // namespace memory
} // namespace secbuf

#endif // SECBUF_MEMORY_RING_BUFFER_H
