#pragma once

#include "sseview/protocol/event_record.hpp"

#include <algorithm>
#include <cstddef>
#include <deque>
#include <utility>

namespace sseview::data {

/// Bounded history of display records, newest first.
/// Pushing past capacity silently discards the oldest records.
/// Thread safety: owner thread only, no synchronization.
class EventBuffer {
  public:
    static constexpr size_t kDefaultCapacity = 200;

    using const_iterator = std::deque<protocol::DisplayRecord>::const_iterator;

    explicit EventBuffer(size_t capacity = kDefaultCapacity)
        : capacity_(std::max<size_t>(capacity, 1)) {}

    void push(protocol::DisplayRecord record) {
        records_.push_front(std::move(record));
        while (records_.size() > capacity_) {
            records_.pop_back();
        }
    }

    [[nodiscard]] size_t size() const { return records_.size(); }
    [[nodiscard]] size_t capacity() const { return capacity_; }
    [[nodiscard]] bool full() const { return records_.size() == capacity_; }
    [[nodiscard]] bool empty() const { return records_.empty(); }

    void clear() { records_.clear(); }

    /// Access by recency (0 = newest). Throws std::out_of_range.
    [[nodiscard]] const protocol::DisplayRecord &at(size_t i) const { return records_.at(i); }

    /// Most recent record. UB if empty.
    [[nodiscard]] const protocol::DisplayRecord &newest() const { return records_.front(); }

    [[nodiscard]] const_iterator begin() const { return records_.begin(); }
    [[nodiscard]] const_iterator end() const { return records_.end(); }

  private:
    size_t capacity_;
    std::deque<protocol::DisplayRecord> records_;
};

} // namespace sseview::data
