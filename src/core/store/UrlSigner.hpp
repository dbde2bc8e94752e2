#pragma once
#include <chrono>
#include <string>

namespace rsb {

class ObjectStoreClient;

// Issues time-limited GET URLs. Store failures surface as StoreError; no
// retries here, the client owns transport policy.
class UrlSigner {
public:
  UrlSigner(ObjectStoreClient& store, std::chrono::seconds defaultTtl)
    : store_(store), defaultTtl_(defaultTtl) {}

  std::string sign(const std::string& bucket, const std::string& key) const;
  std::string sign(const std::string& bucket, const std::string& key, std::chrono::seconds ttl) const;

  std::chrono::seconds defaultTtl() const { return defaultTtl_; }

private:
  ObjectStoreClient& store_;
  std::chrono::seconds defaultTtl_;
};

} // namespace rsb
