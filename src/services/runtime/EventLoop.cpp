#include "EventLoop.hpp"

#include <spdlog/spdlog.h>
#include <exception>

namespace rsb {

EventLoop::~EventLoop() {
  stop();
}

void EventLoop::post(Task task) {
  {
    std::lock_guard<std::mutex> lock(mtx_);
    ready_.push_back(std::move(task));
  }
  cv_.notify_one();
}

void EventLoop::postDelayed(std::chrono::milliseconds delay, Task task) {
  {
    std::lock_guard<std::mutex> lock(mtx_);
    timers_.push(Timed{std::chrono::steady_clock::now() + delay, seq_++, std::move(task)});
  }
  cv_.notify_one();
}

void EventLoop::start() {
  std::lock_guard<std::mutex> lock(mtx_);
  if (thread_.joinable()) return;
  stop_ = false;
  thread_ = std::thread([this] { run(); });
  threadId_ = thread_.get_id();
}

void EventLoop::stop() {
  {
    std::lock_guard<std::mutex> lock(mtx_);
    stop_ = true;
  }
  cv_.notify_all();
  if (thread_.joinable() && !onLoopThread()) thread_.join();
}

void EventLoop::run() {
  std::unique_lock<std::mutex> lock(mtx_);
  while (!stop_) {
    const auto now = std::chrono::steady_clock::now();
    while (!timers_.empty() && timers_.top().due <= now) {
      ready_.push_back(std::move(const_cast<Timed&>(timers_.top()).task));
      timers_.pop();
    }

    if (ready_.empty()) {
      if (timers_.empty()) cv_.wait(lock);
      else cv_.wait_until(lock, timers_.top().due);
      continue;
    }

    Task task = std::move(ready_.front());
    ready_.pop_front();
    lock.unlock();
    try {
      task();
    } catch (const std::exception& e) {
      spdlog::error("Unhandled exception on event loop: {}", e.what());
    }
    lock.lock();
  }
}

} // namespace rsb
