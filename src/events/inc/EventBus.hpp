#ifndef KILN_EVENTS_EVENT_BUS_HPP
#define KILN_EVENTS_EVENT_BUS_HPP
/**
 * @file EventBus.hpp
 * @brief Fan-out of job, progress and alert events to any number of subscribers.
 * @note Thread-safe. publish() never blocks on a slow subscriber.
 *
 * Two delivery styles:
 *  - Pull: subscribe(filter) returns a Subscription with its own bounded
 *    mailbox. When the mailbox is full the oldest event is dropped and
 *    counted. Destroying the Subscription ends it.
 *  - Push: subscribe(filter, handler) runs the handler on the publisher's
 *    thread until unsubscribe(id). Handlers must not publish.
 */

#include "src/events/inc/Events.hpp"

#include <chrono>     // std::chrono::milliseconds
#include <cstddef>    // std::size_t
#include <cstdint>    // std::uint64_t
#include <functional> // std::function
#include <memory>     // std::shared_ptr, std::weak_ptr
#include <mutex>      // std::mutex
#include <optional>   // std::optional
#include <vector>     // std::vector

namespace kiln {

namespace events {

class Mailbox;

/* ----------------------------- Subscription ----------------------------- */

/**
 * @brief Pull-side handle on one mailbox. Move-only.
 */
class Subscription {
public:
  explicit Subscription(std::shared_ptr<Mailbox> mailbox);
  ~Subscription();

  Subscription(Subscription&&) noexcept = default;
  Subscription& operator=(Subscription&&) noexcept = default;
  Subscription(const Subscription&) = delete;
  Subscription& operator=(const Subscription&) = delete;

  /// @brief Next event, waiting at most @p timeout.
  [[nodiscard]] std::optional<Event> next(std::chrono::milliseconds timeout);

  /// @brief Next event if one is queued.
  [[nodiscard]] std::optional<Event> tryNext();

  /// @brief Events discarded because the mailbox was full.
  [[nodiscard]] std::uint64_t dropped() const;

  /// @brief Events queued and not yet taken.
  [[nodiscard]] std::size_t pending() const;

private:
  std::shared_ptr<Mailbox> mailbox_;
};

/* ----------------------------- EventBus ----------------------------- */

class EventBus {
public:
  using Handler = std::function<void(const Event&)>;
  using HandlerId = std::uint64_t;

  /// @param mailboxCapacity Per-subscription queue bound (0 is treated as 1).
  explicit EventBus(std::size_t mailboxCapacity = 256);

  EventBus(const EventBus&) = delete;
  EventBus& operator=(const EventBus&) = delete;

  [[nodiscard]] Subscription subscribe(EventFilter filter = {});

  /// @return Id for unsubscribe(); never 0.
  HandlerId subscribe(EventFilter filter, Handler handler);

  /// @return false if @p id is not registered.
  bool unsubscribe(HandlerId id);

  /// @brief Deliver @p event to every matching subscriber.
  void publish(const Event& event);

  /// @brief Live pull subscriptions plus push handlers.
  [[nodiscard]] std::size_t subscriberCount() const;

private:
  struct HandlerEntry {
    HandlerId id{0};
    EventFilter filter{};
    std::shared_ptr<Handler> handler{};
  };

  const std::size_t mailboxCapacity_;
  mutable std::mutex mtx_;
  std::vector<std::weak_ptr<Mailbox>> mailboxes_;
  std::vector<HandlerEntry> handlers_;
  HandlerId nextHandlerId_{1};
};

} // namespace events

} // namespace kiln

#endif // KILN_EVENTS_EVENT_BUS_HPP
