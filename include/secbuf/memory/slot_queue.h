#ifndef SECBUF_MEMORY_SLOT_QUEUE_H
#define SECBUF_MEMORY_SLOT_QUEUE_H

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <stdexcept>

namespace secbuf {
namespace memory {

/**
 * Bounded lock-free multi-producer/multi-consumer FIFO of owned objects.
 *
 * Every slot carries a sequence counter. A producer may fill a slot only
 * when its sequence equals the producer's ticket, and a consumer may empty
 * it only when the sequence equals ticket + 1. Emptying a slot advances the
 * sequence by one full lap, so a recycled slot can never be consumed twice.
 *
 * Ownership moves in on a successful try_push() and out on try_pop();
 * objects still queued are destroyed with the queue.
 */
template<typename T>
class SlotQueue {
public:
    explicit SlotQueue(size_t capacity)
        : capacity_(capacity) {
        if (capacity == 0) {
            throw std::invalid_argument("SlotQueue capacity cannot be zero");
        }
        slots_ = std::make_unique<Slot[]>(capacity);
        for (size_t i = 0; i < capacity; ++i) {
            slots_[i].sequence.store(i, std::memory_order_relaxed);
        }
    }

    ~SlotQueue() {
        while (try_pop()) {
        }
    }

    SlotQueue(const SlotQueue&) = delete;
    SlotQueue& operator=(const SlotQueue&) = delete;

    /**
     * Enqueue item. On success item is left empty; when the queue is full
     * false is returned and item keeps ownership.
     */
    bool try_push(std::unique_ptr<T>& item) noexcept {
        if (!item) {
            return false;
        }

        size_t pos = enqueue_pos_.load(std::memory_order_relaxed);
        for (;;) {
            Slot& slot = slots_[pos % capacity_];
            size_t seq = slot.sequence.load(std::memory_order_acquire);
            auto diff = static_cast<intptr_t>(seq) - static_cast<intptr_t>(pos);

            if (diff == 0) {
                if (enqueue_pos_.compare_exchange_weak(pos, pos + 1,
                                                       std::memory_order_relaxed)) {
                    slot.value = item.release();
                    slot.sequence.store(pos + 1, std::memory_order_release);
                    return true;
                }
            } else if (diff < 0) {
                return false; // full
            } else {
                pos = enqueue_pos_.load(std::memory_order_relaxed);
            }
        }
    }

    // Dequeue the oldest item, or nullptr when empty
    std::unique_ptr<T> try_pop() noexcept {
        size_t pos = dequeue_pos_.load(std::memory_order_relaxed);
        for (;;) {
            Slot& slot = slots_[pos % capacity_];
            size_t seq = slot.sequence.load(std::memory_order_acquire);
            auto diff = static_cast<intptr_t>(seq) - static_cast<intptr_t>(pos + 1);

            if (diff == 0) {
                if (dequeue_pos_.compare_exchange_weak(pos, pos + 1,
                                                       std::memory_order_relaxed)) {
                    std::unique_ptr<T> item(slot.value);
                    slot.value = nullptr;
                    slot.sequence.store(pos + capacity_, std::memory_order_release);
                    return item;
                }
            } else if (diff < 0) {
                return nullptr; // empty
            } else {
                pos = dequeue_pos_.load(std::memory_order_relaxed);
            }
        }
    }

    size_t capacity() const noexcept { return capacity_; }

    // Approximate under concurrent use
    size_t size_approx() const noexcept {
        size_t enqueued = enqueue_pos_.load(std::memory_order_acquire);
        size_t dequeued = dequeue_pos_.load(std::memory_order_acquire);
        return enqueued > dequeued ? enqueued - dequeued : 0;
    }

private:
    struct Slot {
        std::atomic<size_t> sequence{0};
        T* value{nullptr};
    };

    const size_t capacity_;
    std::unique_ptr<Slot[]> slots_;
    alignas(64) std::atomic<size_t> enqueue_pos_{0};
    alignas(64) std::atomic<size_t> dequeue_pos_{0};
};

} // namespace memory
} // namespace secbuf

#endif // SECBUF_MEMORY_SLOT_QUEUE_H
