#pragma once

#include <atomic>
#include <cstddef>
#include <vector>

namespace sseview::data {

/// Single-producer single-consumer lock-free ring buffer.
/// Producer: a transport worker thread (stream handle or broadcast request).
/// Consumer: the thread that polls the SseClient.
/// A failed try_push leaves the item untouched so the producer may retry it.
template <typename T> class SPSCQueue {
  public:
    explicit SPSCQueue(size_t capacity) : capacity_(capacity < 2 ? 2 : capacity), slots_(capacity_) {}

    SPSCQueue(const SPSCQueue &) = delete;
    SPSCQueue &operator=(const SPSCQueue &) = delete;

    /// Push an item (producer only). Returns false if full.
    bool try_push(T &&item) {
        const size_t tail = tail_.load(std::memory_order_relaxed);
        const size_t next = advance(tail);
        if (next == head_.load(std::memory_order_acquire)) {
            return false;
        }
        slots_[tail] = std::move(item);
        tail_.store(next, std::memory_order_release);
        return true;
    }

    /// Pop an item (consumer only). Returns false if empty.
    bool try_pop(T &item) {
        const size_t head = head_.load(std::memory_order_relaxed);
        if (head == tail_.load(std::memory_order_acquire)) {
            return false;
        }
        item = std::move(slots_[head]);
        head_.store(advance(head), std::memory_order_release);
        return true;
    }

    [[nodiscard]] bool empty() const {
        return head_.load(std::memory_order_acquire) == tail_.load(std::memory_order_acquire);
    }

    /// Approximate number of queued items (exact only when both sides are idle).
    [[nodiscard]] size_t size_approx() const {
        const size_t tail = tail_.load(std::memory_order_relaxed);
        const size_t head = head_.load(std::memory_order_relaxed);
        return (tail + capacity_ - head) % capacity_;
    }

    /// Usable capacity (one slot tells full from empty).
    [[nodiscard]] size_t capacity() const { return capacity_ - 1; }

  private:
    [[nodiscard]] size_t advance(size_t index) const { return (index + 1) % capacity_; }

    size_t capacity_;
    std::vector<T> slots_;

    // The worker stores tail_ and the poller stores head_ on every call; one
    // cache line each so those stores do not invalidate the other side.
    alignas(64) std::atomic<size_t> head_{0};
    alignas(64) std::atomic<size_t> tail_{0};
};

} // namespace sseview::data
