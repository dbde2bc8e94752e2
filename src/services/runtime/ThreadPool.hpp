#pragma once
#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

#include "Executor.hpp"

namespace rsb {

// Worker threads for network and CPU-bound work.
class ThreadPool : public Executor {
public:
  explicit ThreadPool(unsigned threads);
  ~ThreadPool() override;

  ThreadPool(const ThreadPool&) = delete;
  ThreadPool& operator=(const ThreadPool&) = delete;

  void post(Task task) override;

  // Blocks until the queue is drained and no task is running.
  void waitIdle();

  // Drops queued tasks and joins the workers.
  void shutdown();

private:
  void workerLoop();

  std::vector<std::thread> workers_;
  std::queue<Task> tasks_;
  std::mutex mtx_;
  std::condition_variable cv_;
  std::condition_variable idleCv_;
  size_t running_ = 0;
  bool stop_ = false;
};

} // namespace rsb
