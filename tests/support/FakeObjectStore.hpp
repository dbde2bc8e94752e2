#pragma once
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "core/store/ObjectStoreClient.hpp"

namespace rsb::test {

// In-memory object store. Listing returns keys in byte order and pages by
// index, honouring max_keys; continuation tokens are the next index.
class FakeObjectStore : public ObjectStoreClient {
public:
  struct Object {
    std::string body;
    std::optional<int64_t> size;
    std::optional<int64_t> last_modified;
    std::optional<std::string> storage_class;
  };

  void put(const std::string& key, std::string body, std::optional<int64_t> lastModified = std::nullopt);
  void putListing(RawObject raw); // listed only, no body
  void failListing(std::string code, std::string message);
  void failGets(std::string code, std::string message);
  void clearFailures();

  ListPage listObjects(const ListRequest& req) override;
  std::string getObject(const std::string& bucket, const std::string& key, uint64_t maxBytes = 0) override;
  std::string presignGet(const std::string& bucket, const std::string& key, std::chrono::seconds ttl) override;

  int listCalls() const;
  int getCalls() const;
  int presignCalls() const;
  std::vector<ListRequest> listRequests() const;

private:
  mutable std::mutex mtx_;
  std::map<std::string, Object> objects_;
  std::optional<StoreError> listFailure_;
  std::optional<StoreError> getFailure_;
  std::vector<ListRequest> listRequests_;
  int getCalls_ = 0;
  int presignCalls_ = 0;
};

} // namespace rsb::test
