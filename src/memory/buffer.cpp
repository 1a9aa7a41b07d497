#include <secbuf/memory/buffer.h>
#include <secbuf/error.h>
#include <algorithm>
#include <cstring>
#include <limits>

namespace secbuf {
namespace memory {

namespace {

constexpr size_t STRING_PREFIX_SIZE = 4;

void store_be(std::byte* out, uint64_t value, size_t width) noexcept {
    for (size_t i = 0; i < width; ++i) {
        out[i] = static_cast<std::byte>((value >> (8 * (width - 1 - i))) & 0xFF);
    }
}

uint64_t load_be(const std::byte* in, size_t width) noexcept {
    uint64_t value = 0;
    for (size_t i = 0; i < width; ++i) {
        value = (value << 8) | static_cast<uint64_t>(in[i]);
    }
    return value;
}

} // anonymous namespace

LinearBuffer::LinearBuffer(size_t capacity, WipePolicy policy)
    : storage_(capacity, policy)
    , length_(0)
    , read_pos_(0)
    , write_pos_(0) {}

LinearBuffer::LinearBuffer(LinearBuffer&& other) noexcept
    : storage_(std::move(other.storage_))
    , length_(other.length_)
    , read_pos_(other.read_pos_)
    , write_pos_(other.write_pos_) {
    other.reset();
}

LinearBuffer& LinearBuffer::operator=(LinearBuffer&& other) noexcept {
    if (this != &other) {
        storage_ = std::move(other.storage_);
        length_ = other.length_;
        read_pos_ = other.read_pos_;
        write_pos_ = other.write_pos_;
        other.reset();
    }
    return *this;
}

LinearBuffer LinearBuffer::clone() const {
    LinearBuffer copy(capacity(), policy());
    if (length_ > 0) {
        std::memcpy(copy.storage_.data(), storage_.data(), length_);
    }
    copy.length_ = length_;
    copy.read_pos_ = read_pos_;
    copy.write_pos_ = write_pos_;
    return copy;
}

Result<LinearBuffer> LinearBuffer::resized_copy(size_t new_capacity) const {
    if (new_capacity < length_) {
        return make_error<LinearBuffer>(SecbufError::CAPACITY_EXCEEDED);
    }

    LinearBuffer copy(new_capacity, policy());
    if (length_ > 0) {
        std::memcpy(copy.storage_.data(), storage_.data(), length_);
    }
    copy.length_ = length_;
    copy.read_pos_ = read_pos_;
    copy.write_pos_ = write_pos_;
    return Result<LinearBuffer>(std::move(copy));
}

bool LinearBuffer::fits(size_t count) const noexcept {
    return count <= capacity() - write_pos_;
}

void LinearBuffer::write_unchecked(const std::byte* data, size_t count) noexcept {
    if (count > 0) {
        std::memcpy(storage_.data() + write_pos_, data, count);
    }
    write_pos_ += count;
    length_ = std::max(length_, write_pos_);
}

Result<void> LinearBuffer::put_byte(uint8_t value) {
    if (!fits(1)) {
        return make_error<void>(SecbufError::CAPACITY_EXCEEDED);
    }
    const std::byte b{value};
    write_unchecked(&b, 1);
    return make_result();
}

Result<void> LinearBuffer::put_u32(uint32_t value) {
    if (!fits(4)) {
        return make_error<void>(SecbufError::CAPACITY_EXCEEDED);
    }
    std::byte encoded[4];
    store_be(encoded, value, sizeof(encoded));
    write_unchecked(encoded, sizeof(encoded));
    return make_result();
}

Result<void> LinearBuffer::put_u64(uint64_t value) {
    if (!fits(8)) {
        return make_error<void>(SecbufError::CAPACITY_EXCEEDED);
    }
    std::byte encoded[8];
    store_be(encoded, value, sizeof(encoded));
    write_unchecked(encoded, sizeof(encoded));
    return make_result();
}

Result<void> LinearBuffer::put_bytes(BufferView data) {
    if (!fits(data.size())) {
        return make_error<void>(SecbufError::CAPACITY_EXCEEDED);
    }
    write_unchecked(data.data(), data.size());
    return make_result();
}

Result<void> LinearBuffer::put_string(BufferView data) {
    if (data.size() > std::numeric_limits<uint32_t>::max()) {
        return make_error<void>(SecbufError::CAPACITY_EXCEEDED);
    }

    // Prefix and payload are checked together so a failed put writes nothing
    if (!fits(STRING_PREFIX_SIZE) || data.size() > available() - STRING_PREFIX_SIZE) {
        return make_error<void>(SecbufError::CAPACITY_EXCEEDED);
    }

    std::byte prefix[STRING_PREFIX_SIZE];
    store_be(prefix, data.size(), STRING_PREFIX_SIZE);
    write_unchecked(prefix, STRING_PREFIX_SIZE);
    write_unchecked(data.data(), data.size());
    return make_result();
}

Result<MutableBufferView> LinearBuffer::write_view(size_t count) {
    if (!fits(count)) {
        return make_error<MutableBufferView>(SecbufError::CAPACITY_EXCEEDED);
    }
    return Result<MutableBufferView>(MutableBufferView(storage_.data() + write_pos_, count));
}

Result<void> LinearBuffer::commit(size_t count) {
    if (!fits(count)) {
        return make_error<void>(SecbufError::CAPACITY_EXCEEDED);
    }
    write_pos_ += count;
    length_ = std::max(length_, write_pos_);
    return make_result();
}

Result<uint8_t> LinearBuffer::get_byte() {
    if (remaining() < 1) {
        return make_error<uint8_t>(SecbufError::UNDERFLOW_ERROR);
    }
    auto value = static_cast<uint8_t>(storage_.data()[read_pos_]);
    read_pos_ += 1;
    return make_result(value);
}

Result<uint32_t> LinearBuffer::get_u32() {
    if (remaining() < 4) {
        return make_error<uint32_t>(SecbufError::UNDERFLOW_ERROR);
    }
    auto value = static_cast<uint32_t>(load_be(storage_.data() + read_pos_, 4));
    read_pos_ += 4;
    return make_result(value);
}

Result<uint64_t> LinearBuffer::get_u64() {
    if (remaining() < 8) {
        return make_error<uint64_t>(SecbufError::UNDERFLOW_ERROR);
    }
    uint64_t value = load_be(storage_.data() + read_pos_, 8);
    read_pos_ += 8;
    return make_result(value);
}

Result<bool> LinearBuffer::get_bool() {
    auto value = get_byte();
    if (!value) {
        return make_error<bool>(value.error());
    }
    return make_result(*value != 0);
}

Result<std::vector<std::byte>> LinearBuffer::get_bytes(size_t count) {
    if (remaining() < count) {
        return make_error<std::vector<std::byte>>(SecbufError::UNDERFLOW_ERROR);
    }
    const std::byte* begin = storage_.data() + read_pos_;
    std::vector<std::byte> out(begin, begin + count);
    read_pos_ += count;
    return make_result(std::move(out));
}

Result<BufferView> LinearBuffer::get_bytes_view(size_t count) {
    if (remaining() < count) {
        return make_error<BufferView>(SecbufError::UNDERFLOW_ERROR);
    }
    BufferView view(storage_.data() + read_pos_, count);
    read_pos_ += count;
    return Result<BufferView>(view);
}

Result<uint32_t> LinearBuffer::checked_string_length() const {
    if (remaining() < STRING_PREFIX_SIZE) {
        return make_error<uint32_t>(SecbufError::UNDERFLOW_ERROR);
    }
    auto declared = static_cast<uint32_t>(load_be(storage_.data() + read_pos_, STRING_PREFIX_SIZE));
    if (declared > remaining() - STRING_PREFIX_SIZE) {
        return make_error<uint32_t>(SecbufError::MALFORMED_LENGTH);
    }
    return make_result(declared);
}

Result<std::vector<std::byte>> LinearBuffer::get_string() {
    auto length = checked_string_length();
    if (!length) {
        return make_error<std::vector<std::byte>>(length.error());
    }

    const std::byte* begin = storage_.data() + read_pos_ + STRING_PREFIX_SIZE;
    std::vector<std::byte> out(begin, begin + *length);
    read_pos_ += STRING_PREFIX_SIZE + *length;
    return make_result(std::move(out));
}

Result<void> LinearBuffer::skip_string() {
    auto length = checked_string_length();
    if (!length) {
        return make_error<void>(length.error());
    }
    read_pos_ += STRING_PREFIX_SIZE + *length;
    return make_result();
}

Result<void> LinearBuffer::set_pos(size_t position) {
    if (position > length_) {
        return make_error<void>(SecbufError::OUT_OF_RANGE);
    }
    read_pos_ = position;
    write_pos_ = std::max(write_pos_, position);
    return make_result();
}

Result<void> LinearBuffer::set_write_pos(size_t position) {
    if (position > length_) {
        return make_error<void>(SecbufError::OUT_OF_RANGE);
    }
    write_pos_ = position;
    read_pos_ = std::min(read_pos_, position);
    return make_result();
}

Result<void> LinearBuffer::advance(size_t count) {
    if (remaining() < count) {
        return make_error<void>(SecbufError::UNDERFLOW_ERROR);
    }
    read_pos_ += count;
    return make_result();
}

Result<void> LinearBuffer::rewind(size_t count) {
    if (count > read_pos_) {
        return make_error<void>(SecbufError::OUT_OF_RANGE);
    }
    read_pos_ -= count;
    return make_result();
}

Result<void> LinearBuffer::set_length(size_t length) {
    if (length > capacity()) {
        return make_error<void>(SecbufError::CAPACITY_EXCEEDED);
    }
    if (length < length_) {
        storage_.wipe_range(length, length_ - length);
    }
    length_ = length;
    write_pos_ = std::min(write_pos_, length);
    read_pos_ = std::min(read_pos_, length);
    return make_result();
}

void LinearBuffer::reset() noexcept {
    length_ = 0;
    read_pos_ = 0;
    write_pos_ = 0;
}

void LinearBuffer::burn() noexcept {
    storage_.wipe();
    reset();
}

void LinearBuffer::burn_and_free() noexcept {
    storage_.release();
    reset();
}

} // namespace memory
} // namespace secbuf
