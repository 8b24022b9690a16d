/**
 * @file EventBus.cpp
 * @brief Mailbox-per-subscriber fan-out.
 */

#include "src/events/inc/EventBus.hpp"

#include <algorithm>          // std::remove_if
#include <condition_variable> // std::condition_variable
#include <deque>              // std::deque
#include <exception>          // std::exception
#include <utility>            // std::move

#include <spdlog/spdlog.h>

namespace kiln {

namespace events {

/* ----------------------------- Mailbox ----------------------------- */

class Mailbox {
public:
  Mailbox(EventFilter filter, std::size_t capacity)
      : filter_(std::move(filter)), capacity_(capacity == 0 ? 1 : capacity) {}

  [[nodiscard]] const EventFilter& filter() const noexcept { return filter_; }

  /// Enqueue, evicting the oldest event when full.
  void offer(const Event& event) {
    std::lock_guard<std::mutex> lock(mtx_);
    if (queue_.size() >= capacity_) {
      queue_.pop_front();
      ++dropped_;
    }
    queue_.push_back(event);
    cv_.notify_one();
  }

  std::optional<Event> take(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mtx_);
    if (!cv_.wait_for(lock, timeout, [this] { return !queue_.empty(); })) {
      return std::nullopt;
    }
    return popLocked();
  }

  std::optional<Event> tryTake() {
    std::lock_guard<std::mutex> lock(mtx_);
    if (queue_.empty()) {
      return std::nullopt;
    }
    return popLocked();
  }

  [[nodiscard]] std::uint64_t dropped() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return dropped_;
  }

  [[nodiscard]] std::size_t pending() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return queue_.size();
  }

private:
  Event popLocked() {
    Event event = std::move(queue_.front());
    queue_.pop_front();
    return event;
  }

  const EventFilter filter_;
  const std::size_t capacity_;
  mutable std::mutex mtx_;
  std::condition_variable cv_;
  std::deque<Event> queue_;
  std::uint64_t dropped_{0};
};

/* ----------------------------- Subscription ----------------------------- */

Subscription::Subscription(std::shared_ptr<Mailbox> mailbox) : mailbox_(std::move(mailbox)) {}

Subscription::~Subscription() = default;

std::optional<Event> Subscription::next(std::chrono::milliseconds timeout) {
  if (!mailbox_) {
    return std::nullopt;
  }
  return mailbox_->take(timeout);
}

std::optional<Event> Subscription::tryNext() {
  if (!mailbox_) {
    return std::nullopt;
  }
  return mailbox_->tryTake();
}

std::uint64_t Subscription::dropped() const { return mailbox_ ? mailbox_->dropped() : 0; }

std::size_t Subscription::pending() const { return mailbox_ ? mailbox_->pending() : 0; }

/* ----------------------------- EventBus ----------------------------- */

EventBus::EventBus(std::size_t mailboxCapacity) : mailboxCapacity_(mailboxCapacity) {}

Subscription EventBus::subscribe(EventFilter filter) {
  auto mailbox = std::make_shared<Mailbox>(std::move(filter), mailboxCapacity_);
  std::lock_guard<std::mutex> lock(mtx_);
  mailboxes_.push_back(mailbox);
  return Subscription(std::move(mailbox));
}

EventBus::HandlerId EventBus::subscribe(EventFilter filter, Handler handler) {
  std::lock_guard<std::mutex> lock(mtx_);
  const HandlerId ID = nextHandlerId_++;
  handlers_.push_back(
      HandlerEntry{ID, std::move(filter), std::make_shared<Handler>(std::move(handler))});
  return ID;
}

bool EventBus::unsubscribe(HandlerId id) {
  std::lock_guard<std::mutex> lock(mtx_);
  const auto IT = std::remove_if(handlers_.begin(), handlers_.end(),
                                 [id](const HandlerEntry& entry) { return entry.id == id; });
  if (IT == handlers_.end()) {
    return false;
  }
  handlers_.erase(IT, handlers_.end());
  return true;
}

void EventBus::publish(const Event& event) {
  std::vector<std::shared_ptr<Mailbox>> boxes;
  std::vector<std::shared_ptr<Handler>> calls;

  {
    std::lock_guard<std::mutex> lock(mtx_);
    mailboxes_.erase(std::remove_if(mailboxes_.begin(), mailboxes_.end(),
                                    [](const std::weak_ptr<Mailbox>& weak) {
                                      return weak.expired();
                                    }),
                     mailboxes_.end());

    for (const std::weak_ptr<Mailbox>& weak : mailboxes_) {
      std::shared_ptr<Mailbox> box = weak.lock();
      if (box && box->filter().matches(event)) {
        boxes.push_back(std::move(box));
      }
    }
    for (const HandlerEntry& entry : handlers_) {
      if (entry.filter.matches(event)) {
        calls.push_back(entry.handler);
      }
    }
  }

  for (const std::shared_ptr<Mailbox>& box : boxes) {
    box->offer(event);
  }
  for (const std::shared_ptr<Handler>& call : calls) {
    try {
      (*call)(event);
    } catch (const std::exception& e) {
      spdlog::warn("[events] handler threw on '{}': {}", describe(event), e.what());
    }
  }
}

std::size_t EventBus::subscriberCount() const {
  std::lock_guard<std::mutex> lock(mtx_);
  std::size_t live = handlers_.size();
  for (const std::weak_ptr<Mailbox>& weak : mailboxes_) {
    if (!weak.expired()) {
      ++live;
    }
  }
  return live;
}

} // namespace events

} // namespace kiln
