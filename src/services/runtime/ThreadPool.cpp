#include "ThreadPool.hpp"

#include <spdlog/spdlog.h>
#include <exception>

namespace rsb {

ThreadPool::ThreadPool(unsigned threads) {
  if (threads == 0) threads = 1;
  workers_.reserve(threads);
  for (unsigned i = 0; i < threads; ++i) {
    workers_.emplace_back([this] { workerLoop(); });
  }
}

ThreadPool::~ThreadPool() {
  shutdown();
}

void ThreadPool::post(Task task) {
  {
    std::lock_guard<std::mutex> lock(mtx_);
    if (stop_) {
      spdlog::warn("thread pool is stopped; task dropped");
      return;
    }
    tasks_.push(std::move(task));
  }
  cv_.notify_one();
}

void ThreadPool::waitIdle() {
  std::unique_lock<std::mutex> lock(mtx_);
  idleCv_.wait(lock, [this] { return tasks_.empty() && running_ == 0; });
}

void ThreadPool::shutdown() {
  {
    std::lock_guard<std::mutex> lock(mtx_);
    if (stop_ && workers_.empty()) return;
    stop_ = true;
    std::queue<Task>().swap(tasks_);
  }
  cv_.notify_all();
  for (auto& w : workers_) {
    if (w.joinable()) w.join();
  }
  workers_.clear();
  idleCv_.notify_all();
}

void ThreadPool::workerLoop() {
  for (;;) {
    Task task;
    {
      std::unique_lock<std::mutex> lock(mtx_);
      cv_.wait(lock, [this] { return stop_ || !tasks_.empty(); });
      if (stop_ && tasks_.empty()) return;
      task = std::move(tasks_.front());
      tasks_.pop();
      ++running_;
    }
    try {
      task();
    } catch (const std::exception& e) {
      spdlog::error("Unhandled exception in thread pool: {}", e.what());
    }
    {
      std::lock_guard<std::mutex> lock(mtx_);
      --running_;
    }
    idleCv_.notify_all();
  }
}

} // namespace rsb
