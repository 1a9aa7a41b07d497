#include <secbuf/memory/secure_bytes.h>
#include <openssl/crypto.h>
#include <algorithm>
#include <atomic>
#include <cstring>

namespace secbuf {
namespace memory {

namespace {

void volatile_fill(void* ptr, size_t size, uint8_t value) noexcept {
    volatile uint8_t* volatile_ptr = static_cast<volatile uint8_t*>(ptr);
    for (size_t i = 0; i < size; ++i) {
        volatile_ptr[i] = value;
    }
    std::atomic_signal_fence(std::memory_order_seq_cst);
}

} // anonymous namespace

void secure_wipe(void* ptr, size_t size, const WipePolicy& policy) noexcept {
    if (!ptr || size == 0) {
        return;
    }

    uint32_t passes = std::max<uint32_t>(policy.passes, 1);
    uint8_t complement = static_cast<uint8_t>(~policy.clear_byte);

    for (uint32_t pass = 1; pass < passes; ++pass) {
        volatile_fill(ptr, size, complement);
    }

    if (policy.clear_byte == 0x00) {
        OPENSSL_cleanse(ptr, size);
    } else {
        volatile_fill(ptr, size, policy.clear_byte);
    }
}

bool is_memory_cleared(BufferView data, uint8_t value) noexcept {
    const std::byte expected{value};
    return std::all_of(data.begin(), data.end(),
                       [expected](std::byte b) { return b == expected; });
}

bool constant_time_compare(BufferView a, BufferView b) noexcept {
    if (a.size() != b.size()) {
        return false;
    }
    if (a.empty()) {
        return true;
    }
    return CRYPTO_memcmp(a.data(), b.data(), a.size()) == 0;
}

// BufferView implementation
BufferView BufferView::slice(size_t offset, size_t length) const noexcept {
    if (offset >= size_) {
        return BufferView();
    }
    return BufferView(data_ + offset, std::min(length, size_ - offset));
}

BufferView BufferView::subview(size_t offset) const noexcept {
    if (offset >= size_) {
        return BufferView();
    }
    return BufferView(data_ + offset, size_ - offset);
}

bool BufferView::operator==(const BufferView& other) const noexcept {
    if (size_ != other.size_) {
        return false;
    }
    if (size_ == 0 || data_ == other.data_) {
        return true;
    }
    return std::memcmp(data_, other.data_, size_) == 0;
}

// SecureBytes implementation
SecureBytes::SecureBytes() noexcept
    : capacity_(0) {}

SecureBytes::SecureBytes(size_t capacity, WipePolicy policy)
    : data_(capacity > 0 ? std::make_unique<std::byte[]>(capacity) : nullptr)
    , capacity_(capacity)
    , policy_(policy) {}

SecureBytes::~SecureBytes() {
    wipe();
}

SecureBytes::SecureBytes(SecureBytes&& other) noexcept
    : data_(std::move(other.data_))
    , capacity_(other.capacity_)
    , policy_(other.policy_) {
    other.capacity_ = 0;
}

SecureBytes& SecureBytes::operator=(SecureBytes&& other) noexcept {
    if (this != &other) {
        wipe();
        data_ = std::move(other.data_);
        capacity_ = other.capacity_;
        policy_ = other.policy_;
        other.capacity_ = 0;
    }
    return *this;
}

void SecureBytes::wipe() noexcept {
    secure_wipe(data_.get(), capacity_, policy_);
}

void SecureBytes::wipe_range(size_t offset, size_t length) noexcept {
    if (offset >= capacity_) {
        return;
    }
    secure_wipe(data_.get() + offset, std::min(length, capacity_ - offset), policy_);
}

void SecureBytes::release() noexcept {
    wipe();
    data_.reset();
    capacity_ = 0;
}

} // namespace memory
} // namespace secbuf
