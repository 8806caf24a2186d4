#pragma once

#include <cstddef>
#include <deque>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "et/error.h"
#include "et/errors.h"

namespace et::audit {

  // Fixed-capacity, insertion-ordered store. When full, Push() evicts the
  // single oldest element before appending, so size() never exceeds
  // capacity(). Not synchronized; owners serialize access. // TSK208
  template <class T>
  class BoundedBuffer {
  public:
    explicit BoundedBuffer(std::size_t capacity) : capacity_(capacity) {
      if (capacity_ == 0) {
        throw Error{ErrorDomain::Validation, errors::validation::kZeroCapacity,
                    std::string(errors::msg::kBufferCapacityZero)};
      }
    }

    // Returns the evicted element, if any.
    std::optional<T> Push(T value) {
      std::optional<T> evicted;
      if (items_.size() >= capacity_) {
        evicted.emplace(std::move(items_.front()));
        items_.pop_front();
      }
      items_.push_back(std::move(value));
      return evicted;
    }

    // Oldest-first copy, independent of the buffer.
    std::vector<T> Snapshot() const { return std::vector<T>(items_.begin(), items_.end()); }

    template <class Predicate>
    std::vector<T> SnapshotIf(Predicate pred) const {
      std::vector<T> out;
      for (const auto& item : items_) {
        if (pred(item)) {
          out.push_back(item);
        }
      }
      return out;
    }

    void Clear() noexcept { items_.clear(); }

    std::size_t size() const noexcept { return items_.size(); }
    std::size_t capacity() const noexcept { return capacity_; }
    bool empty() const noexcept { return items_.empty(); }
    bool full() const noexcept { return items_.size() >= capacity_; }

  private:
    std::size_t capacity_;
    std::deque<T> items_;
  };

} // namespace et::audit
