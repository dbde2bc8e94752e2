#pragma once
#include <exception>
#include <string>
#include <type_traits>
#include <utility>

#include "core/util/Outcome.hpp"

namespace rsb {

// Maps the typed exceptions of the core components onto Failure kinds.
Failure failure_from(std::exception_ptr ep);

// Operator-facing status line for a failed action, e.g.
// status_line(f, "listing objects", "list objects") ->
// "AWS error listing objects: AccessDenied — ..." or "Failed to list objects: ...".
std::string status_line(const Failure& f, const std::string& doing, const std::string& verb);

// Runs fn and packs its result or the exception it threw.
template <typename Fn>
auto capture(Fn&& fn) -> Outcome<std::invoke_result_t<Fn>> {
  using R = std::invoke_result_t<Fn>;
  try {
    return Outcome<R>::success(std::forward<Fn>(fn)());
  } catch (...) {
    return Outcome<R>::failure(failure_from(std::current_exception()));
  }
}

} // namespace rsb
