#pragma once
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <thread>
#include <type_traits>
#include <vector>

#include "Executor.hpp"

namespace rsb {

// The orchestration thread. All coordinator state is touched only from
// tasks running here, one at a time.
class EventLoop : public Scheduler {
public:
  EventLoop() = default;
  ~EventLoop() override;

  EventLoop(const EventLoop&) = delete;
  EventLoop& operator=(const EventLoop&) = delete;

  void post(Task task) override;
  void postDelayed(std::chrono::milliseconds delay, Task task) override;

  // Runs on a dedicated thread until stop().
  void start();
  void stop();

  bool onLoopThread() const { return std::this_thread::get_id() == threadId_; }

  // Runs fn on the loop and returns its result to the calling thread.
  template <typename Fn>
  auto invoke(Fn&& fn) -> std::future<std::invoke_result_t<Fn>> {
    using R = std::invoke_result_t<Fn>;
    auto task = std::make_shared<std::packaged_task<R()>>(std::forward<Fn>(fn));
    auto fut = task->get_future();
    if (onLoopThread()) (*task)();
    else post([task] { (*task)(); });
    return fut;
  }

private:
  struct Timed {
    std::chrono::steady_clock::time_point due;
    uint64_t seq;
    Task task;
  };
  struct Later {
    bool operator()(const Timed& a, const Timed& b) const {
      return a.due != b.due ? a.due > b.due : a.seq > b.seq;
    }
  };

  void run();

  std::mutex mtx_;
  std::condition_variable cv_;
  std::deque<Task> ready_;
  std::priority_queue<Timed, std::vector<Timed>, Later> timers_;
  uint64_t seq_ = 0;
  bool stop_ = false;
  std::thread thread_;
  std::thread::id threadId_;
};

} // namespace rsb
