#include "Failures.hpp"

#include "core/archive/ArchiveExtractor.hpp"
#include "core/store/ObjectStoreClient.hpp"
#include "core/util/Errors.hpp"

namespace rsb {

Failure failure_from(std::exception_ptr ep) {
  try {
    std::rethrow_exception(ep);
  } catch (const StoreError& e) {
    return {FailureKind::Store, e.code(), e.message()};
  } catch (const PayloadTooLarge& e) {
    return {FailureKind::TooLarge, "TooLarge", e.what()};
  } catch (const ExtractionError& e) {
    if (e.kind() == ExtractionErrorKind::TooLarge) return {FailureKind::TooLarge, "TooLarge", e.what()};
    return {FailureKind::ReportNotFound, "ReportNotFound", e.what()};
  } catch (const MalformedArchiveError& e) {
    return {FailureKind::MalformedArchive, "MalformedArchive", e.what()};
  } catch (const InvalidRequestError& e) {
    return {FailureKind::InvalidRequest, "InvalidRequest", e.what()};
  } catch (const std::exception& e) {
    return {FailureKind::Internal, "", e.what()};
  } catch (...) {
    return {FailureKind::Internal, "", "unknown error"};
  }
}

std::string status_line(const Failure& f, const std::string& doing, const std::string& verb) {
  if (f.kind == FailureKind::Store) return "AWS error " + doing + ": " + f.describe();
  return "Failed to " + verb + ": " + f.message;
}

} // namespace rsb
