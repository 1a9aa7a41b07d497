#ifndef SECBUF_MEMORY_SECURE_BYTES_H
#define SECBUF_MEMORY_SECURE_BYTES_H

#include <secbuf/config.h>
#include <memory>
#include <utility>
#include <cstddef>
#include <cstdint>

namespace secbuf {
namespace memory {

/**
 * Overwrite pattern applied when a region is wiped.
 *
 * passes - 1 preliminary passes write the complement of clear_byte, the
 * final pass writes clear_byte. A pass count of zero is treated as one.
 */
struct SECBUF_API WipePolicy {
    uint8_t clear_byte{0x00};
    uint32_t passes{1};

    bool operator==(const WipePolicy& other) const noexcept {
        return clear_byte == other.clear_byte && passes == other.passes;
    }
    bool operator!=(const WipePolicy& other) const noexcept { return !(*this == other); }
};

// Non-owning view of bytes
class SECBUF_API BufferView {
public:
    using value_type = std::byte;

    BufferView() noexcept : data_(nullptr), size_(0) {}
    BufferView(const std::byte* data, size_t size) noexcept : data_(data), size_(size) {}

    template<typename Container,
             typename = decltype(std::declval<const Container&>().data())>
    BufferView(const Container& container) noexcept
        : data_(reinterpret_cast<const std::byte*>(container.data())),
          size_(container.size() * sizeof(typename Container::value_type)) {}

    const std::byte* data() const noexcept { return data_; }
    size_t size() const noexcept { return size_; }
    bool empty() const noexcept { return size_ == 0; }

    // Out-of-range requests are clamped to the view
    BufferView slice(size_t offset, size_t length) const noexcept;
    BufferView subview(size_t offset) const noexcept;

    const std::byte* begin() const noexcept { return data_; }
    const std::byte* end() const noexcept { return data_ + size_; }

    const std::byte& operator[](size_t index) const noexcept { return data_[index]; }

    bool operator==(const BufferView& other) const noexcept;
    bool operator!=(const BufferView& other) const noexcept { return !(*this == other); }

private:
    const std::byte* data_;
    size_t size_;
};

// Mutable non-owning view of bytes
class SECBUF_API MutableBufferView {
public:
    using value_type = std::byte;

    MutableBufferView() noexcept : data_(nullptr), size_(0) {}
    MutableBufferView(std::byte* data, size_t size) noexcept : data_(data), size_(size) {}

    std::byte* data() noexcept { return data_; }
    const std::byte* data() const noexcept { return data_; }
    size_t size() const noexcept { return size_; }
    bool empty() const noexcept { return size_ == 0; }

    std::byte* begin() noexcept { return data_; }
    std::byte* end() noexcept { return data_ + size_; }

    std::byte& operator[](size_t index) noexcept { return data_[index]; }

private:
    std::byte* data_;
    size_t size_;
};

/**
 * Overwrite size bytes at ptr according to policy.
 *
 * Zero passes go through OPENSSL_cleanse; patterned passes use volatile
 * stores followed by a compiler fence, so no pass can be elided.
 */
SECBUF_API void secure_wipe(void* ptr, size_t size, const WipePolicy& policy = WipePolicy{}) noexcept;

// True when every byte of data equals value
SECBUF_API bool is_memory_cleared(BufferView data, uint8_t value = 0x00) noexcept;

// Constant-time equality; a length mismatch compares unequal
SECBUF_API bool constant_time_compare(BufferView a, BufferView b) noexcept;

/**
 * Fixed-capacity owned byte region.
 *
 * The region is zero-initialized and every byte is overwritten with the
 * policy's clear pattern before it is freed, reassigned or moved over.
 */
class SECBUF_API SecureBytes {
public:
    SecureBytes() noexcept;
    explicit SecureBytes(size_t capacity, WipePolicy policy = WipePolicy{});
    ~SecureBytes();

    SecureBytes(const SecureBytes&) = delete;
    SecureBytes& operator=(const SecureBytes&) = delete;
    SecureBytes(SecureBytes&& other) noexcept;
    SecureBytes& operator=(SecureBytes&& other) noexcept;

    std::byte* data() noexcept { return data_.get(); }
    const std::byte* data() const noexcept { return data_.get(); }
    size_t capacity() const noexcept { return capacity_; }
    bool empty() const noexcept { return capacity_ == 0; }
    const WipePolicy& policy() const noexcept { return policy_; }

    BufferView view() const noexcept { return BufferView(data_.get(), capacity_); }
    MutableBufferView mutable_view() noexcept { return MutableBufferView(data_.get(), capacity_); }

    // Overwrite the whole region, keeping the allocation
    void wipe() noexcept;

    // Overwrite [offset, offset + length), clamped to the region
    void wipe_range(size_t offset, size_t length) noexcept;

    // Wipe and free; capacity becomes zero
    void release() noexcept;

private:
    std::unique_ptr<std::byte[]> data_;
    size_t capacity_;
    WipePolicy policy_;
};

} // namespace memory
} // namespace secbuf

#endif // SECBUF_MEMORY_SECURE_BYTES_H
