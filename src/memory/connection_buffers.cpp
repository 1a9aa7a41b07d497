#include <secbuf/memory/connection_buffers.h>
#include <secbuf/error.h>
#include <algorithm>
#include <string>
#include <utility>

namespace secbuf {
namespace memory {

namespace {

const char* const CONNECTION_CATEGORY = "connection_buffers";

constexpr size_t NEAR_FULL_PERCENT = 80;

// floor(bound * NEAR_FULL_PERCENT / 100) without overflowing for large bounds
constexpr size_t near_full_threshold(size_t bound) noexcept {
    return bound / 100 * NEAR_FULL_PERCENT + bound % 100 * NEAR_FULL_PERCENT / 100;
}

} // anonymous namespace

// ConnectionBufferConfig implementation
Result<void> ConnectionBufferConfig::validate() const {
    if (max_packet_queue_size == 0 || max_packet_queue_bytes == 0) {
        return make_error<void>(SecbufError::INVALID_CONFIGURATION);
    }
    if (idle_timeout <= std::chrono::milliseconds::zero()) {
        return make_error<void>(SecbufError::INVALID_CONFIGURATION);
    }
    if (min_efficiency < 0.0 || min_efficiency > 1.0) {
        return make_error<void>(SecbufError::INVALID_CONFIGURATION);
    }
    if (shrink_waste_ratio < 0.0 || shrink_waste_ratio > 1.0) {
        return make_error<void>(SecbufError::INVALID_CONFIGURATION);
    }
    return make_result();
}

namespace connection_presets {

ConnectionBufferConfig standard() {
    ConnectionBufferConfig config;
    config.max_packet_queue_size = 100;
    config.max_packet_queue_bytes = 10 * 1024 * 1024;
    config.idle_timeout = std::chrono::minutes(5);
    config.enable_aggressive_shrinking = true;
    config.min_efficiency = 0.5;
    config.max_wasted_bytes = 1024 * 1024;
    config.shrink_waste_ratio = 0.5;
    return config;
}

ConnectionBufferConfig memory_constrained() {
    ConnectionBufferConfig config;
    config.max_packet_queue_size = 32;
    config.max_packet_queue_bytes = 1024 * 1024;
    config.idle_timeout = std::chrono::seconds(30);
    config.enable_aggressive_shrinking = true;
    config.min_efficiency = 0.75;
    config.max_wasted_bytes = 64 * 1024;
    config.shrink_waste_ratio = 0.25;
    return config;
}

} // namespace connection_presets

// ConnectionBufferSet implementation
ConnectionBufferSet::ConnectionBufferSet(const ConnectionBufferConfig& config,
                                         std::shared_ptr<BufferSource> source)
    : config_(config)
    , source_(std::move(source))
    , last_activity_(Clock::now()) {

    auto valid = config.validate();
    if (!valid) {
        throw SecbufException(valid.error(), "Invalid connection buffer configuration");
    }
}

ConnectionBufferSet::~ConnectionBufferSet() {
    aggressive_cleanup();
}

ConnectionBufferSet::LinearSlot ConnectionBufferSet::make_slot(size_t capacity) {
    LinearSlot slot;
    if (source_ && capacity <= source_->buffer_size()) {
        slot.buffer = source_->acquire_buffer();
        slot.pooled = true;
    } else {
        slot.buffer = std::make_unique<LinearBuffer>(capacity, config_.wipe_policy);
    }
    return slot;
}

void ConnectionBufferSet::release_slot(LinearSlot& slot) {
    if (!slot.buffer) {
        slot.pooled = false;
        return;
    }

    if (slot.pooled && source_) {
        // The source burns the buffer before reuse
        source_->release_buffer(std::move(slot.buffer));
    } else {
        slot.buffer->burn_and_free();
    }

    slot.buffer.reset();
    slot.pooled = false;
}

void ConnectionBufferSet::init_read_buf(size_t capacity) {
    release_slot(read_);
    read_ = make_slot(capacity);
    touch();
}

void ConnectionBufferSet::init_write_buf(size_t capacity) {
    release_slot(write_);
    write_ = make_slot(capacity);
    touch();
}

size_t ConnectionBufferSet::add_stream_buf(size_t capacity) {
    stream_bufs_.emplace_back(capacity, config_.wipe_policy);
    touch();
    return stream_bufs_.size() - 1;
}

LinearBuffer* ConnectionBufferSet::read_buf() {
    touch();
    return read_.buffer.get();
}

LinearBuffer* ConnectionBufferSet::write_buf() {
    touch();
    return write_.buffer.get();
}

RingBuffer* ConnectionBufferSet::stream_buf(size_t index) {
    touch();
    if (index >= stream_bufs_.size()) {
        return nullptr;
    }
    return &stream_bufs_[index];
}

Result<void> ConnectionBufferSet::enqueue_packet(LinearBuffer&& packet) {
    touch();

    if (packet_queue_.size() >= config_.max_packet_queue_size) {
        SECBUF_REPORT_WARNING(reporter_, SecbufError::QUEUE_FULL, CONNECTION_CATEGORY,
                              "Packet rejected, queue holds " +
                              std::to_string(packet_queue_.size()) + " packets");
        return make_error<void>(SecbufError::QUEUE_FULL);
    }

    if (packet.length() > config_.max_packet_queue_bytes - packet_queue_bytes_) {
        SECBUF_REPORT_WARNING(reporter_, SecbufError::QUEUE_FULL, CONNECTION_CATEGORY,
                              "Packet of " + std::to_string(packet.length()) +
                              " bytes rejected, queue holds " +
                              std::to_string(packet_queue_bytes_) + " bytes");
        return make_error<void>(SecbufError::QUEUE_FULL);
    }

    packet_queue_bytes_ += packet.length();
    packet_queue_.push_back(std::move(packet));
    return make_result();
}

std::optional<LinearBuffer> ConnectionBufferSet::dequeue_packet() {
    touch();

    if (packet_queue_.empty()) {
        return std::nullopt;
    }

    LinearBuffer packet = std::move(packet_queue_.front());
    packet_queue_.pop_front();
    packet_queue_bytes_ -= std::min(packet_queue_bytes_, packet.length());
    return std::optional<LinearBuffer>(std::move(packet));
}

bool ConnectionBufferSet::is_queue_near_full() const noexcept {
    return packet_queue_.size() > near_full_threshold(config_.max_packet_queue_size) ||
           packet_queue_bytes_ > near_full_threshold(config_.max_packet_queue_bytes);
}

ConnectionMemoryStats ConnectionBufferSet::memory_usage() const {
    ConnectionMemoryStats stats;

    if (read_.buffer) {
        stats.read_buf_bytes = read_.buffer->capacity();
        stats.total_used += read_.buffer->length();
    }
    if (write_.buffer) {
        stats.write_buf_bytes = write_.buffer->capacity();
        stats.total_used += write_.buffer->length();
    }
    for (const auto& ring : stream_bufs_) {
        stats.stream_buf_bytes += ring.allocated_bytes();
        if (ring.is_allocated()) {
            stats.total_used += ring.size();
        }
    }
    for (const auto& packet : packet_queue_) {
        stats.packet_queue_bytes += packet.capacity();
        stats.total_used += packet.length();
    }

    stats.total_bytes = stats.read_buf_bytes + stats.write_buf_bytes +
                        stats.stream_buf_bytes + stats.packet_queue_bytes;
    stats.total_wasted = stats.total_bytes - stats.total_used;

    if (stats.total_bytes > 0) {
        stats.efficiency = static_cast<double>(stats.total_used) /
                           static_cast<double>(stats.total_bytes);
    }

    return stats;
}

bool ConnectionBufferSet::is_problematic() const {
    auto stats = memory_usage();
    return stats.efficiency < config_.min_efficiency ||
           stats.total_wasted > config_.max_wasted_bytes;
}

size_t ConnectionBufferSet::shrink_slot(LinearSlot& slot) {
    if (!slot.buffer || slot.buffer->capacity() == 0) {
        return 0;
    }

    size_t capacity = slot.buffer->capacity();
    size_t used = slot.buffer->length();
    double wasted_fraction = static_cast<double>(capacity - used) / static_cast<double>(capacity);
    if (wasted_fraction <= config_.shrink_waste_ratio) {
        return 0;
    }

    auto tight = slot.buffer->resized_copy(used);
    if (!tight) {
        return 0;
    }

    LinearSlot replacement;
    replacement.buffer = std::make_unique<LinearBuffer>(std::move(tight).value());
    release_slot(slot);
    slot = std::move(replacement);
    return capacity - used;
}

size_t ConnectionBufferSet::force_shrink() {
    size_t reclaimed = shrink_slot(read_) + shrink_slot(write_);

    for (auto& ring : stream_bufs_) {
        if (ring.is_allocated() && ring.empty()) {
            reclaimed += ring.allocated_bytes();
            ring.release();
        }
    }

    if (reclaimed > 0) {
        SECBUF_REPORT_INFO(reporter_, SecbufError::SUCCESS, CONNECTION_CATEGORY,
                           "Forced shrink reclaimed " + std::to_string(reclaimed) + " bytes");
    }
    return reclaimed;
}

ConnectionBufferSet::Clock::duration
ConnectionBufferSet::idle_for(Clock::time_point now) const noexcept {
    if (now <= last_activity_) {
        return Clock::duration::zero();
    }
    return now - last_activity_;
}

bool ConnectionBufferSet::is_idle(Clock::time_point now) const noexcept {
    return idle_for(now) >= config_.idle_timeout;
}

ConnectionBufferSet::IdleAction ConnectionBufferSet::handle_idle(Clock::time_point now) {
    if (!is_idle(now)) {
        return IdleAction::NONE;
    }
    if (!config_.enable_aggressive_shrinking) {
        return IdleAction::IDLE;
    }
    force_shrink();
    return IdleAction::SHRUNK;
}

void ConnectionBufferSet::burn() noexcept {
    if (read_.buffer) {
        read_.buffer->burn();
    }
    if (write_.buffer) {
        write_.buffer->burn();
    }
    for (auto& ring : stream_bufs_) {
        ring.burn();
    }
    for (auto& packet : packet_queue_) {
        packet.burn();
    }
    packet_queue_.clear();
    packet_queue_bytes_ = 0;
}

void ConnectionBufferSet::reset() noexcept {
    if (read_.buffer) {
        read_.buffer->reset();
    }
    if (write_.buffer) {
        write_.buffer->reset();
    }
    for (auto& ring : stream_bufs_) {
        ring.clear();
    }
    packet_queue_.clear();
    packet_queue_bytes_ = 0;
}

void ConnectionBufferSet::aggressive_cleanup() {
    release_slot(read_);
    release_slot(write_);

    for (auto& ring : stream_bufs_) {
        ring.release();
    }
    stream_bufs_.clear();

    for (auto& packet : packet_queue_) {
        packet.burn_and_free();
    }
    packet_queue_.clear();
    packet_queue_bytes_ = 0;
}

} // namespace memory
} // namespace secbuf
