#pragma once
#include <future>
#include <memory>

#include "EventLoop.hpp"
#include "services/Failures.hpp"

namespace rsb {

// Starts an asynchronous call on the loop and blocks the calling thread
// until it reports back through its completion callback. `start` returns
// false when a single-flight gate refused the request.
template <typename T, typename Start>
Outcome<T> await_outcome(EventLoop& loop, Start start) {
  auto promise = std::make_shared<std::promise<Outcome<T>>>();
  auto fut = promise->get_future();
  loop.post([promise, start]() mutable {
    try {
      if (!start([promise](const Outcome<T>& r) { promise->set_value(r); })) {
        promise->set_value(Outcome<T>::failure({FailureKind::Busy, "Busy", "A refresh is already in progress."}));
      }
    } catch (...) {
      promise->set_value(Outcome<T>::failure(failure_from(std::current_exception())));
    }
  });
  return fut.get();
}

} // namespace rsb
