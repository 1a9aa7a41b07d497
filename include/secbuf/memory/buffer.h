#ifndef SECBUF_MEMORY_BUFFER_H
#define SECBUF_MEMORY_BUFFER_H

#include <secbuf/config.h>
#include <secbuf/result.h>
#include <secbuf/memory/secure_bytes.h>
#include <cstddef>
#include <cstdint>
#include <vector>

namespace secbuf {
namespace memory {

/**
 * Position-tracked read/write buffer over a SecureBytes region.
 *
 * Keeps 0 <= pos() <= write_pos() <= length() <= capacity(). Writes append
 * at write_pos(), reads consume from pos() up to write_pos(). Every fallible
 * operation leaves the buffer unchanged on failure. Multi-byte integers are
 * big-endian; strings carry a 4-byte big-endian length prefix.
 *
 * The backing region is wiped on burn() and on destruction.
 */
class SECBUF_API LinearBuffer {
public:
    explicit LinearBuffer(size_t capacity = 0, WipePolicy policy = WipePolicy{});
    ~LinearBuffer() = default;

    // Move only; use clone() for an explicit deep copy
    LinearBuffer(const LinearBuffer&) = delete;
    LinearBuffer& operator=(const LinearBuffer&) = delete;
    LinearBuffer(LinearBuffer&& other) noexcept;
    LinearBuffer& operator=(LinearBuffer&& other) noexcept;

    LinearBuffer clone() const;

    /**
     * Copy into a buffer of a different capacity, keeping contents and
     * cursors. Fails with CAPACITY_EXCEEDED if new_capacity < length().
     */
    Result<LinearBuffer> resized_copy(size_t new_capacity) const;

    size_t capacity() const noexcept { return storage_.capacity(); }
    size_t length() const noexcept { return length_; }
    size_t pos() const noexcept { return read_pos_; }
    size_t write_pos() const noexcept { return write_pos_; }
    size_t remaining() const noexcept { return write_pos_ - read_pos_; }
    size_t available() const noexcept { return capacity() - write_pos_; }
    bool empty() const noexcept { return length_ == 0; }
    const WipePolicy& policy() const noexcept { return storage_.policy(); }

    // Writers
    Result<void> put_byte(uint8_t value);
    Result<void> put_u32(uint32_t value);
    Result<void> put_u64(uint64_t value);
    Result<void> put_bytes(BufferView data);
    Result<void> put_string(BufferView data);
    Result<void> put_bool(bool value) { return put_byte(value ? 1 : 0); }

    /**
     * Zero-copy writing: fill the count bytes returned by write_view(), then
     * commit() as many of them as were produced. Both fail with
     * CAPACITY_EXCEEDED, changing nothing, when count exceeds available().
     * The view is invalidated by any other write, burn or move.
     */
    Result<MutableBufferView> write_view(size_t count);
    Result<void> commit(size_t count);

    // Readers
    Result<uint8_t> get_byte();
    Result<uint32_t> get_u32();
    Result<uint64_t> get_u64();
    Result<bool> get_bool();    // any non-zero byte is true
    Result<std::vector<std::byte>> get_bytes(size_t count);

    // View into the buffer; invalidated by any write, burn or move
    Result<BufferView> get_bytes_view(size_t count);

    Result<std::vector<std::byte>> get_string();
    Result<void> skip_string();

    // Cursor control
    Result<void> set_pos(size_t position);
    Result<void> set_write_pos(size_t position);
    Result<void> advance(size_t count);

    // Step the read cursor back over count consumed bytes; OUT_OF_RANGE past 0
    Result<void> rewind(size_t count);

    // Set length() directly, clamping both cursors. Bytes dropped by a
    // truncation are wiped. CAPACITY_EXCEEDED beyond capacity().
    Result<void> set_length(size_t length);

    // Clear cursors and length without touching contents
    void reset() noexcept;

    // Wipe the whole region and reset cursors
    void burn() noexcept;

    // Wipe and free the region; capacity becomes zero
    void burn_and_free() noexcept;

    BufferView view() const noexcept { return BufferView(storage_.data(), length_); }
    BufferView unread() const noexcept {
        return BufferView(storage_.data() + read_pos_, write_pos_ - read_pos_);
    }
    BufferView storage() const noexcept { return storage_.view(); }

private:
    SecureBytes storage_;
    size_t length_;
    size_t read_pos_;
    size_t write_pos_;

    bool fits(size_t count) const noexcept;
    void write_unchecked(const std::byte* data, size_t count) noexcept;

    // Peek the length prefix at read_pos_ and validate the payload behind it
    Result<uint32_t> checked_string_length() const;
};

} // namespace memory
} // namespace secbuf

#endif // SECBUF_MEMORY_BUFFER_H
