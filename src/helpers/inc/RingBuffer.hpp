#ifndef KILN_HELPERS_RING_BUFFER_HPP
#define KILN_HELPERS_RING_BUFFER_HPP
/**
 * @file RingBuffer.hpp
 * @brief Bounded, mutex-guarded history buffer.
 *
 * Backs the snapshot history, the alert log, the job history and the past
 * monitoring sessions. On overflow the oldest entry is evicted. Each buffer
 * carries its own lock, independent of the coordinator lock.
 */

#include <cstddef>
#include <mutex>
#include <optional>
#include <utility>
#include <vector>

namespace kiln {
namespace helpers {

template <typename T> class RingBuffer {
public:
  /// @param capacity Maximum retained entries (0 is treated as 1).
  explicit RingBuffer(std::size_t capacity) : slots_(capacity == 0 ? 1 : capacity) {}

  RingBuffer(const RingBuffer&) = delete;
  RingBuffer& operator=(const RingBuffer&) = delete;

  /// Append, evicting the oldest entry when full.
  void push(T value) {
    std::lock_guard<std::mutex> lock(mtx_);
    slots_[head_] = std::move(value);
    head_ = (head_ + 1) % slots_.size();
    if (count_ < slots_.size()) {
      ++count_;
    }
  }

  /// Newest @p limit entries, newest first.
  [[nodiscard]] std::vector<T> latest(std::size_t limit) const {
    std::lock_guard<std::mutex> lock(mtx_);
    const std::size_t N = (limit < count_) ? limit : count_;
    std::vector<T> out;
    out.reserve(N);
    for (std::size_t i = 0; i < N; ++i) {
      out.push_back(slots_[indexFromNewest(i)]);
    }
    return out;
  }

  /// Newest entry, if any.
  [[nodiscard]] std::optional<T> newest() const {
    std::lock_guard<std::mutex> lock(mtx_);
    if (count_ == 0) {
      return std::nullopt;
    }
    return slots_[indexFromNewest(0)];
  }

  /// First entry (newest first) matching @p pred.
  template <typename Pred> [[nodiscard]] std::optional<T> findIf(Pred pred) const {
    std::lock_guard<std::mutex> lock(mtx_);
    for (std::size_t i = 0; i < count_; ++i) {
      const T& ENTRY = slots_[indexFromNewest(i)];
      if (pred(ENTRY)) {
        return ENTRY;
      }
    }
    return std::nullopt;
  }

  /**
   * @brief Mutate the newest entry matching @p pred in place.
   * @return true if an entry matched.
   */
  template <typename Pred, typename Fn> bool updateIf(Pred pred, Fn fn) {
    std::lock_guard<std::mutex> lock(mtx_);
    for (std::size_t i = 0; i < count_; ++i) {
      T& entry = slots_[indexFromNewest(i)];
      if (pred(entry)) {
        fn(entry);
        return true;
      }
    }
    return false;
  }

  [[nodiscard]] std::size_t size() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return count_;
  }

  [[nodiscard]] std::size_t capacity() const noexcept { return slots_.size(); }

  void clear() {
    std::lock_guard<std::mutex> lock(mtx_);
    head_ = 0;
    count_ = 0;
    for (T& slot : slots_) {
      slot = T{};
    }
  }

private:
  [[nodiscard]] std::size_t indexFromNewest(std::size_t i) const noexcept {
    return (head_ + slots_.size() - 1 - i) % slots_.size();
  }

  mutable std::mutex mtx_;
  std::vector<T> slots_;
  std::size_t head_{0};
  std::size_t count_{0};
};

} // namespace helpers
} // namespace kiln

#endif // KILN_HELPERS_RING_BUFFER_HPP
