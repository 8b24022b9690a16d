#ifndef KILN_HELPERS_TIMEOUT_HPP
#define KILN_HELPERS_TIMEOUT_HPP
/**
 * @file Timeout.hpp
 * @brief Run a blocking call with an upper bound on how long the caller waits.
 *
 * The call runs on a detached helper thread. When the deadline passes the
 * caller gets std::nullopt and moves on; the helper finishes (or hangs) on
 * its own and its result is discarded. Captured state must therefore be
 * owned by the callable (copies or shared_ptr), never borrowed from the
 * caller's stack.
 *
 * Callers that poll in a loop must not start a new call while an earlier
 * one is still running, or hung calls accumulate one thread each.
 */

#include <chrono>
#include <condition_variable>
#include <exception>
#include <memory>
#include <mutex>
#include <optional>
#include <system_error>
#include <thread>
#include <utility>

namespace kiln {
namespace helpers {
namespace timeout {

namespace detail {

template <typename T> struct Slot {
  std::mutex mtx;
  std::condition_variable cv;
  std::optional<T> value;
  bool done{false};
};

} // namespace detail

/**
 * @brief Invoke @p fn on a helper thread and wait at most @p limit for it.
 * @tparam T Result type of @p fn.
 * @return The result, or std::nullopt on timeout, if @p fn threw, or if no
 *         helper thread could be created.
 */
template <typename T, typename Fn>
[[nodiscard]] std::optional<T> runWithTimeout(Fn fn, std::chrono::milliseconds limit) {
  auto slot = std::make_shared<detail::Slot<T>>();

  try {
    std::thread worker([slot, call = std::move(fn)]() mutable {
      std::optional<T> out;
      try {
        out.emplace(call());
      } catch (const std::exception&) {
        out.reset();
      }
      std::lock_guard<std::mutex> lock(slot->mtx);
      slot->value = std::move(out);
      slot->done = true;
      slot->cv.notify_all();
    });
    worker.detach();
  } catch (const std::system_error&) {
    return std::nullopt;
  }

  std::unique_lock<std::mutex> lock(slot->mtx);
  if (!slot->cv.wait_for(lock, limit, [&slot] { return slot->done; })) {
    return std::nullopt;
  }
  return std::move(slot->value);
}

} // namespace timeout
} // namespace helpers
} // namespace kiln

#endif // KILN_HELPERS_TIMEOUT_HPP
