#pragma once
#include <string>
#include <utility>
#include <variant>

namespace rsb {

enum class FailureKind {
  Store,            // provider / transport failure, carries provider code
  TooLarge,         // archive or payload over the configured ceiling
  ReportNotFound,   // archive has no HTML report
  MalformedArchive, // bytes are not a readable ZIP
  InvalidRequest,
  Busy,             // single-flight gate refused the request
  Internal
};

const char* to_string(FailureKind kind);

struct Failure {
  FailureKind kind = FailureKind::Internal;
  std::string code;
  std::string message;

  // "<code> — <message>" for store failures, the bare message otherwise.
  std::string describe() const;
};

// Value-or-failure handed back from offloaded work to the caller layer.
template <typename T>
class Outcome {
public:
  static Outcome success(T value) { return Outcome(std::in_place_index<0>, std::move(value)); }
  static Outcome failure(Failure f) { return Outcome(std::in_place_index<1>, std::move(f)); }

  bool ok() const { return v_.index() == 0; }
  explicit operator bool() const { return ok(); }

  const T& value() const { return std::get<0>(v_); }
  T& value() { return std::get<0>(v_); }
  const Failure& error() const { return std::get<1>(v_); }

private:
  template <std::size_t I, typename U>
  Outcome(std::in_place_index_t<I> idx, U&& u) : v_(idx, std::forward<U>(u)) {}

  std::variant<T, Failure> v_;
};

} // namespace rsb
