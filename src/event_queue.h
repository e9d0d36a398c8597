#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <vector>

namespace splittab {

using Duration = std::chrono::milliseconds;
using TimePoint = std::chrono::steady_clock::time_point;

// Source of the current time for debouncing and deferred work
class Clock {
public:
  virtual ~Clock() = default;
  [[nodiscard]] virtual TimePoint now() const = 0;
};

class SteadyClock : public Clock {
public:
  [[nodiscard]] TimePoint now() const override;
};

// Clock that only moves when told to
class ManualClock : public Clock {
public:
  [[nodiscard]] TimePoint now() const override;
  void advance(Duration delta);

private:
  TimePoint current_{};
};

// Same-thread queue of continuations that become due after a delay. The host
// pumps it from its own loop with run_due().
class EventQueue {
public:
  using Callback = std::function<void()>;

  explicit EventQueue(const Clock& clock);

  EventQueue(const EventQueue&) = delete;
  EventQueue& operator=(const EventQueue&) = delete;

  // Execute call once delay has elapsed
  void post_after(Duration delay, Callback call);

  // Run every continuation whose deadline has passed, in deadline order (ties
  // in posting order). Continuations posted while running wait for the next
  // call. Returns the number executed.
  size_t run_due();

  [[nodiscard]] size_t pending() const {
    return entries_.size();
  }

  [[nodiscard]] const Clock& clock() const {
    return clock_;
  }

private:
  struct Entry {
    TimePoint deadline;
    std::uint64_t sequence;
    Callback call;
  };

  const Clock& clock_;
  std::vector<Entry> entries_;
  std::uint64_t next_sequence_ = 0;
};

} // namespace splittab
