#include <secbuf/memory/ring_buffer.h>
#include <secbuf/error.h>
#include <algorithm>
#include <cstring>

namespace secbuf {
namespace memory {

RingBuffer::RingBuffer(size_t capacity, WipePolicy policy)
    : capacity_(capacity)
    , policy_(policy)
    , head_(0)
    , tail_(0)
    , used_(0) {}

RingBuffer::RingBuffer(RingBuffer&& other) noexcept
    : storage_(std::move(other.storage_))
    , capacity_(other.capacity_)
    , policy_(other.policy_)
    , head_(other.head_)
    , tail_(other.tail_)
    , used_(other.used_) {
    other.head_ = 0;
    other.tail_ = 0;
    other.used_ = 0;
}

RingBuffer& RingBuffer::operator=(RingBuffer&& other) noexcept {
    if (this != &other) {
        storage_ = std::move(other.storage_);
        capacity_ = other.capacity_;
        policy_ = other.policy_;
        head_ = other.head_;
        tail_ = other.tail_;
        used_ = other.used_;
        other.head_ = 0;
        other.tail_ = 0;
        other.used_ = 0;
    }
    return *this;
}

Result<void> RingBuffer::write(BufferView data) {
    if (data.empty()) {
        return make_result();
    }
    if (data.size() > available()) {
        return make_error<void>(SecbufError::BUFFER_FULL);
    }

    if (!is_allocated()) {
        storage_ = SecureBytes(capacity_, policy_);
    }

    size_t first = std::min(data.size(), capacity_ - tail_);
    std::memcpy(storage_.data() + tail_, data.data(), first);
    if (first < data.size()) {
        std::memcpy(storage_.data(), data.data() + first, data.size() - first);
    }

    tail_ = (tail_ + data.size()) % capacity_;
    used_ += data.size();
    return make_result();
}

size_t RingBuffer::contiguous_available() const noexcept {
    if (full()) {
        return 0;
    }
    return tail_ >= head_ ? capacity_ - tail_ : head_ - tail_;
}

Result<MutableBufferView> RingBuffer::writable_region(size_t length) {
    if (length > contiguous_available()) {
        return make_error<MutableBufferView>(SecbufError::BUFFER_FULL);
    }

    if (!is_allocated()) {
        storage_ = SecureBytes(capacity_, policy_);
    }
    return Result<MutableBufferView>(MutableBufferView(storage_.data() + tail_, length));
}

Result<void> RingBuffer::commit_write(size_t length) {
    if (length > contiguous_available() || (length > 0 && !is_allocated())) {
        return make_error<void>(SecbufError::BUFFER_FULL);
    }
    if (length > 0) {
        tail_ = (tail_ + length) % capacity_;
        used_ += length;
    }
    return make_result();
}

size_t RingBuffer::copy_out(size_t from, std::byte* out, size_t length) const noexcept {
    size_t count = std::min(length, used_);
    if (count == 0 || !out) {
        return 0;
    }

    size_t first = std::min(count, capacity_ - from);
    std::memcpy(out, storage_.data() + from, first);
    if (first < count) {
        std::memcpy(out + first, storage_.data(), count - first);
    }
    return count;
}

size_t RingBuffer::read(std::byte* out, size_t length) noexcept {
    size_t count = copy_out(head_, out, length);
    if (count > 0) {
        head_ = (head_ + count) % capacity_;
        used_ -= count;
    }
    return count;
}

size_t RingBuffer::peek(std::byte* out, size_t length) const noexcept {
    return copy_out(head_, out, length);
}

Result<void> RingBuffer::discard(size_t count) {
    if (count > used_) {
        return make_error<void>(SecbufError::UNDERFLOW_ERROR);
    }
    if (count > 0) {
        head_ = (head_ + count) % capacity_;
        used_ -= count;
    }
    return make_result();
}

std::pair<BufferView, BufferView> RingBuffer::readable_regions() const noexcept {
    if (used_ == 0) {
        return {BufferView(), BufferView()};
    }

    size_t first = std::min(used_, capacity_ - head_);
    BufferView front(storage_.data() + head_, first);
    if (first == used_) {
        return {front, BufferView()};
    }
    return {front, BufferView(storage_.data(), used_ - first)};
}

void RingBuffer::clear() noexcept {
    head_ = 0;
    tail_ = 0;
    used_ = 0;
}

void RingBuffer::burn() noexcept {
    storage_.wipe();
    clear();
}

void RingBuffer::release() noexcept {
    storage_.release();
    clear();
}

} // namespace memory
} // namespace secbuf
