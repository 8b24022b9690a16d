/**
 * @file EventBus_uTest.cpp
 * @brief Unit tests for kiln::events::EventBus.
 */

#include "src/events/inc/EventBus.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <stdexcept>
#include <thread>
#include <variant>
#include <vector>

using kiln::events::AlertRaised;
using kiln::events::Event;
using kiln::events::EventBus;
using kiln::events::EventFilter;
using kiln::events::JobStateChanged;
using kiln::events::ProgressUpdated;
using kiln::events::Subscription;
using kiln::job::JobState;

namespace {

constexpr std::chrono::milliseconds SHORT{50};

Event progressEvent(kiln::job::JobId id, double pct) {
  ProgressUpdated ev{};
  ev.jobId = id;
  ev.progress.percent = pct;
  return ev;
}

Event stateEvent(kiln::job::JobId id, JobState from, JobState to) {
  JobStateChanged ev{};
  ev.jobId = id;
  ev.from = from;
  ev.to = to;
  return ev;
}

} // namespace

/* ----------------------------- Pull Subscriptions ----------------------------- */

/** @test Publishing with zero subscribers is fine. */
TEST(EventBusTest, NoSubscribers) {
  EventBus bus{};
  bus.publish(progressEvent(1, 10.0));
  EXPECT_EQ(bus.subscriberCount(), 0U);
}

/** @test Events arrive in publish order. */
TEST(EventBusTest, OrderPreserved) {
  EventBus bus{};
  Subscription sub = bus.subscribe();
  for (int i = 1; i <= 5; ++i) {
    bus.publish(progressEvent(1, i * 10.0));
  }
  for (int i = 1; i <= 5; ++i) {
    const auto EV = sub.next(SHORT);
    ASSERT_TRUE(EV.has_value());
    ASSERT_TRUE(std::holds_alternative<ProgressUpdated>(*EV));
    EXPECT_DOUBLE_EQ(std::get<ProgressUpdated>(*EV).progress.percent, i * 10.0);
  }
  EXPECT_FALSE(sub.tryNext().has_value());
}

/** @test A full mailbox drops the oldest event and counts it. */
TEST(EventBusTest, FullMailboxDropsOldest) {
  EventBus bus{3};
  Subscription sub = bus.subscribe();
  for (int i = 1; i <= 5; ++i) {
    bus.publish(progressEvent(1, static_cast<double>(i)));
  }
  EXPECT_EQ(sub.dropped(), 2U);
  EXPECT_EQ(sub.pending(), 3U);
  const auto FIRST = sub.tryNext();
  ASSERT_TRUE(FIRST.has_value());
  EXPECT_DOUBLE_EQ(std::get<ProgressUpdated>(*FIRST).progress.percent, 3.0);
}

/** @test Filters select by event type and job. */
TEST(EventBusTest, Filters) {
  EventBus bus{};
  Subscription alerts = bus.subscribe(EventFilter::alertsOnly());
  Subscription job7 = bus.subscribe(EventFilter::forJob(7));

  bus.publish(progressEvent(7, 1.0));
  bus.publish(progressEvent(8, 1.0));
  bus.publish(stateEvent(7, JobState::Running, JobState::Paused));
  bus.publish(AlertRaised{});

  EXPECT_EQ(alerts.pending(), 1U);
  EXPECT_EQ(job7.pending(), 2U);
}

/** @test Destroying a subscription removes it from the bus. */
TEST(EventBusTest, SubscriptionEndsOnDestroy) {
  EventBus bus{};
  {
    Subscription sub = bus.subscribe();
    EXPECT_EQ(bus.subscriberCount(), 1U);
  }
  EXPECT_EQ(bus.subscriberCount(), 0U);
  bus.publish(progressEvent(1, 1.0));
}

/** @test next() wakes when another thread publishes. */
TEST(EventBusTest, NextWakesOnPublish) {
  EventBus bus{};
  Subscription sub = bus.subscribe();
  std::thread producer([&bus] {
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    bus.publish(progressEvent(2, 5.0));
  });
  const auto EV = sub.next(std::chrono::milliseconds(2000));
  producer.join();
  ASSERT_TRUE(EV.has_value());
  EXPECT_EQ(std::get<ProgressUpdated>(*EV).jobId, 2U);
}

/* ----------------------------- Push Handlers ----------------------------- */

/** @test Handlers run until unsubscribed. */
TEST(EventBusTest, HandlerLifecycle) {
  EventBus bus{};
  std::atomic<int> calls{0};
  const auto ID = bus.subscribe(EventFilter{}, [&calls](const Event&) { ++calls; });
  EXPECT_NE(ID, 0U);

  bus.publish(progressEvent(1, 1.0));
  EXPECT_TRUE(bus.unsubscribe(ID));
  EXPECT_FALSE(bus.unsubscribe(ID));
  bus.publish(progressEvent(1, 2.0));
  EXPECT_EQ(calls.load(), 1);
}

/** @test A throwing handler does not stop delivery to others. */
TEST(EventBusTest, ThrowingHandlerIsolated) {
  EventBus bus{};
  int seen = 0;
  (void)bus.subscribe(EventFilter{}, [](const Event&) { throw std::runtime_error("boom"); });
  (void)bus.subscribe(EventFilter{}, [&seen](const Event&) { ++seen; });
  bus.publish(progressEvent(1, 1.0));
  EXPECT_EQ(seen, 1);
}
