#ifndef DOCTEST_CONFIG_DISABLE

#include <doctest/doctest.h>

#include <memory>
#include <vector>

#include "event_queue.h"

using namespace splittab;

TEST_SUITE("EventQueue") {
  TEST_CASE("runs due continuations in deadline order") {
    ManualClock clock;
    EventQueue queue(clock);
    std::vector<int> order;

    queue.post_after(Duration{20}, [&] { order.push_back(2); });
    queue.post_after(Duration{10}, [&] { order.push_back(1); });
    queue.post_after(Duration{10}, [&] { order.push_back(3); });
    queue.post_after(Duration{50}, [&] { order.push_back(4); });

    CHECK(queue.run_due() == 0);
    clock.advance(Duration{20});
    CHECK(queue.run_due() == 3);
    CHECK(order == std::vector<int>{1, 3, 2});
    CHECK(queue.pending() == 1);
  }

  TEST_CASE("continuations posted while running wait for the next pump") {
    ManualClock clock;
    EventQueue queue(clock);
    int runs = 0;

    queue.post_after(Duration{0}, [&] {
      ++runs;
      queue.post_after(Duration{0}, [&] { ++runs; });
    });

    CHECK(queue.run_due() == 1);
    CHECK(runs == 1);
    CHECK(queue.run_due() == 1);
    CHECK(runs == 2);
  }

  TEST_CASE("a continuation may destroy the queue running it") {
    ManualClock clock;
    auto queue = std::make_shared<EventQueue>(clock);
    std::weak_ptr<EventQueue> observer = queue;
    int runs = 0;

    queue->post_after(Duration{0}, [&] {
      ++runs;
      queue.reset();
    });
    queue->post_after(Duration{0}, [&] { ++runs; });
    queue->post_after(Duration{100}, [&] { ++runs; });

    EventQueue* raw = queue.get();
    CHECK(raw->run_due() == 2);
    CHECK(runs == 2);
    CHECK(observer.expired());
  }

  TEST_CASE("empty callbacks are ignored") {
    ManualClock clock;
    EventQueue queue(clock);
    queue.post_after(Duration{0}, nullptr);
    CHECK(queue.pending() == 0);
  }
}

#endif // !DOCTEST_CONFIG_DISABLE
