#pragma once
#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>

namespace paddock {

// Single-writer, many-reader cell holding the latest immutable value.
// The writer builds a new value off to the side and swaps the pointer in;
// readers copy the pointer and keep a complete value alive for as long as
// they hold it. A published value is never mutated.
template <class T>
class SnapshotCell {
public:
  using Ptr = std::shared_ptr<const T>;

  void publish(Ptr v) {
    {
      std::lock_guard lock(mutex_);
      data_ = std::move(v);
    }
    seq_.fetch_add(1, std::memory_order_release);
  }

  Ptr load() const {
    std::lock_guard lock(mutex_);
    return data_;
  }

  // Try to consume if sequence advanced past cursor.
  bool try_consume_latest(std::uint64_t& cursor, Ptr& out) const {
    const auto s = seq_.load(std::memory_order_acquire);
    if (s != cursor) {
      out = load();
      cursor = s;
      return true;
    }
    return false;
  }

  std::uint64_t sequence() const { return seq_.load(std::memory_order_acquire); }

private:
  mutable std::mutex mutex_; // guards the pointer copy only
  Ptr data_;
  std::atomic<std::uint64_t> seq_{0};
};

} // namespace paddock
