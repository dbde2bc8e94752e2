#include "UrlSigner.hpp"
#include "ObjectStoreClient.hpp"

namespace rsb {

std::string UrlSigner::sign(const std::string& bucket, const std::string& key) const {
  return sign(bucket, key, defaultTtl_);
}

std::string UrlSigner::sign(const std::string& bucket, const std::string& key,
                            std::chrono::seconds ttl) const {
  return store_.presignGet(bucket, key, ttl);
}

} // namespace rsb
