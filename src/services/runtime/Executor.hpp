#pragma once
#include <chrono>
#include <functional>

namespace rsb {

using Task = std::function<void()>;

class Executor {
public:
  virtual ~Executor() = default;
  virtual void post(Task task) = 0;
};

// An executor that can also run a task later. Delayed tasks never overlap
// with other tasks on the same scheduler.
class Scheduler : public Executor {
public:
  virtual void postDelayed(std::chrono::milliseconds delay, Task task) = 0;
};

} // namespace rsb
