#include "Outcome.hpp"

namespace rsb {

const char* to_string(FailureKind kind) {
  switch (kind) {
    case FailureKind::Store:            return "store";
    case FailureKind::TooLarge:         return "too_large";
    case FailureKind::ReportNotFound:   return "report_not_found";
    case FailureKind::MalformedArchive: return "malformed_archive";
    case FailureKind::InvalidRequest:   return "invalid_request";
    case FailureKind::Busy:             return "busy";
    case FailureKind::Internal:         return "internal";
  }
  return "internal";
}

std::string Failure::describe() const {
  if (kind == FailureKind::Store && !code.empty()) return code + " — " + message;
  return message;
}

} // namespace rsb
