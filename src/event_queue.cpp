#include "event_queue.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <iterator>

namespace splittab {

TimePoint SteadyClock::now() const {
  return std::chrono::steady_clock::now();
}

TimePoint ManualClock::now() const {
  return current_;
}

void ManualClock::advance(Duration delta) {
  current_ += delta;
}

EventQueue::EventQueue(const Clock& clock) : clock_(clock) {
}

void EventQueue::post_after(Duration delay, Callback call) {
  if (!call) {
    return;
  }
  entries_.push_back(Entry{clock_.now() + delay, next_sequence_++, std::move(call)});
}

size_t EventQueue::run_due() {
  TimePoint now = clock_.now();

  std::vector<Entry> due;
  auto split = std::stable_partition(entries_.begin(), entries_.end(),
                                     [now](const Entry& e) { return e.deadline > now; });
  std::move(split, entries_.end(), std::back_inserter(due));
  entries_.erase(split, entries_.end());

  std::sort(due.begin(), due.end(), [](const Entry& a, const Entry& b) {
    if (a.deadline != b.deadline) {
      return a.deadline < b.deadline;
    }
    return a.sequence < b.sequence;
  });

  if (!due.empty()) {
    spdlog::trace("event queue: running {} continuation(s), {} pending", due.size(),
                  entries_.size());
  }

  // A continuation may destroy this queue; only locals are touched from here on
  for (auto& entry : due) {
    entry.call();
  }
  return due.size();
}

} // namespace splittab
