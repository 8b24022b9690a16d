#ifndef KILN_HELPERS_CHANNEL_HPP
#define KILN_HELPERS_CHANNEL_HPP
/**
 * @file Channel.hpp
 * @brief Bounded FIFO between producer threads and a single consumer.
 *
 * Engine and monitor threads push; the coordinator dispatcher pops. FIFO
 * order is preserved per producer. push() blocks while the channel is full
 * so events are never dropped; close() wakes every waiter.
 */

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <utility>

namespace kiln {
namespace helpers {

template <typename T> class Channel {
public:
  explicit Channel(std::size_t capacity) : capacity_(capacity == 0 ? 1 : capacity) {}

  Channel(const Channel&) = delete;
  Channel& operator=(const Channel&) = delete;

  /**
   * @brief Enqueue, waiting for room.
   * @return false if the channel was closed.
   */
  bool push(T value) {
    std::unique_lock<std::mutex> lock(mtx_);
    notFull_.wait(lock, [this] { return closed_ || queue_.size() < capacity_; });
    if (closed_) {
      return false;
    }
    queue_.push_back(std::move(value));
    notEmpty_.notify_one();
    return true;
  }

  /**
   * @brief Dequeue, waiting at most @p timeout.
   * @return Next value, or std::nullopt on timeout / closed-and-drained.
   */
  [[nodiscard]] std::optional<T> popFor(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mtx_);
    if (!notEmpty_.wait_for(lock, timeout, [this] { return closed_ || !queue_.empty(); })) {
      return std::nullopt;
    }
    if (queue_.empty()) {
      return std::nullopt;
    }
    T value = std::move(queue_.front());
    queue_.pop_front();
    notFull_.notify_one();
    return value;
  }

  void close() {
    std::lock_guard<std::mutex> lock(mtx_);
    closed_ = true;
    notEmpty_.notify_all();
    notFull_.notify_all();
  }

  [[nodiscard]] bool closed() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return closed_;
  }

  [[nodiscard]] std::size_t size() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return queue_.size();
  }

private:
  const std::size_t capacity_;
  mutable std::mutex mtx_;
  std::condition_variable notEmpty_;
  std::condition_variable notFull_;
  std::deque<T> queue_;
  bool closed_{false};
};

} // namespace helpers
} // namespace kiln

#endif // KILN_HELPERS_CHANNEL_HPP
