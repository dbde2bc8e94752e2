#pragma once
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace rsb {

// Provider-reported failure (authorization, not-found, throttling, transport).
class StoreError : public std::runtime_error {
public:
  StoreError(std::string code, std::string message)
    : std::runtime_error(code + ": " + message),
      code_(std::move(code)), message_(std::move(message)) {}

  const std::string& code() const noexcept { return code_; }
  const std::string& message() const noexcept { return message_; }

private:
  std::string code_;
  std::string message_;
};

// A download crossed the caller's byte limit and was abandoned.
class PayloadTooLarge : public std::runtime_error {
public:
  PayloadTooLarge(std::string key, uint64_t limit)
    : std::runtime_error("object " + key + " exceeds " + std::to_string(limit) + " bytes"),
      key_(std::move(key)), limit_(limit) {}

  const std::string& key() const noexcept { return key_; }
  uint64_t limit() const noexcept { return limit_; }

private:
  std::string key_;
  uint64_t limit_;
};

// One <Contents> entry of a listing page, fields exactly as the provider sent them.
struct RawObject {
  std::string key;
  std::optional<int64_t> size;
  std::optional<int64_t> last_modified; // unix seconds, UTC
  std::optional<std::string> storage_class;
};

struct ListRequest {
  std::string bucket;
  std::string prefix;
  std::string delimiter;          // empty = recursive listing
  std::string continuation_token; // empty = first page
  int max_keys = 1000;
};

struct ListPage {
  std::vector<RawObject> objects;
  std::vector<std::string> common_prefixes;
  bool truncated = false;
  std::string next_token;
};

class ObjectStoreClient {
public:
  virtual ~ObjectStoreClient() = default;

  virtual ListPage listObjects(const ListRequest& req) = 0;

  // Whole object into memory. maxBytes == 0 means unlimited; otherwise
  // throws PayloadTooLarge as soon as the limit is known to be crossed.
  virtual std::string getObject(const std::string& bucket,
                                const std::string& key,
                                uint64_t maxBytes = 0) = 0;

  // Offline signature; throws StoreError when credentials are missing.
  virtual std::string presignGet(const std::string& bucket,
                                 const std::string& key,
                                 std::chrono::seconds ttl) = 0;

  virtual void downloadToFile(const std::string& bucket,
                              const std::string& key,
                              const std::filesystem::path& dest);
};

} // namespace rsb
