#pragma once
#include <algorithm>
#include <chrono>
#include <cstdint>
#include <deque>
#include <vector>

#include "services/runtime/Executor.hpp"

namespace rsb::test {

// Runs tasks only when told to.
class ManualExecutor : public Executor {
public:
  void post(Task task) override { tasks_.push_back(std::move(task)); }

  size_t pending() const { return tasks_.size(); }

  // Runs queued tasks, including ones they post, until none are left.
  size_t runAll() {
    size_t n = 0;
    while (!tasks_.empty()) {
      Task t = std::move(tasks_.front());
      tasks_.pop_front();
      t();
      ++n;
    }
    return n;
  }

private:
  std::deque<Task> tasks_;
};

// A scheduler with a hand-cranked clock.
class ManualScheduler : public Scheduler {
public:
  void post(Task task) override { ready_.post(std::move(task)); }

  void postDelayed(std::chrono::milliseconds delay, Task task) override {
    timers_.push_back(Timer{now_ + delay, seq_++, std::move(task)});
    lastDelay_ = delay;
  }

  size_t runReady() { return ready_.runAll(); }
  size_t pending() const { return ready_.pending(); }
  size_t pendingTimers() const { return timers_.size(); }
  std::chrono::milliseconds lastDelay() const { return lastDelay_; }
  std::chrono::milliseconds now() const { return now_; }

  // Moves the clock forward and runs every timer that came due, in order.
  void advance(std::chrono::milliseconds by) {
    const auto target = now_ + by;
    for (;;) {
      runReady();
      auto next = std::min_element(timers_.begin(), timers_.end(), [](const Timer& a, const Timer& b) {
        return a.due != b.due ? a.due < b.due : a.seq < b.seq;
      });
      if (next == timers_.end() || next->due > target) break;
      now_ = next->due;
      Task t = std::move(next->task);
      timers_.erase(next);
      t();
    }
    now_ = target;
  }

private:
  struct Timer {
    std::chrono::milliseconds due;
    uint64_t seq;
    Task task;
  };

  ManualExecutor ready_;
  std::vector<Timer> timers_;
  std::chrono::milliseconds now_{0};
  std::chrono::milliseconds lastDelay_{0};
  uint64_t seq_ = 0;
};

// Alternates loop and worker queues until both are empty.
inline void drain(ManualScheduler& loop, ManualExecutor& workers) {
  while (loop.pending() > 0 || workers.pending() > 0) {
    loop.runReady();
    workers.runAll();
  }
}

} // namespace rsb::test
