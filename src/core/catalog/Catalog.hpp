#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace rsb {

// One remote object. Absent fields stay absent; nothing is defaulted.
struct ObjectRecord {
  std::string key;
  std::optional<int64_t> size;
  std::optional<int64_t> last_modified; // unix seconds, UTC
  std::optional<std::string> storage_class;

  std::string displaySize() const;
  std::string displayModified() const;
};

// Display order: newest first, then key ascending. Absent timestamps last.
bool catalog_order(const ObjectRecord& a, const ObjectRecord& b);

// Snapshot of one (bucket, prefix) listing. Built once by CatalogFetcher,
// then shared read-only.
class Catalog {
public:
  Catalog() = default;
  Catalog(std::string bucket, std::string prefix, size_t cap, std::vector<ObjectRecord> records);

  const std::string& bucket() const { return bucket_; }
  const std::string& prefix() const { return prefix_; }
  size_t cap() const { return cap_; }

  const std::vector<ObjectRecord>& records() const { return records_; }
  size_t size() const { return records_.size(); }
  bool empty() const { return records_.empty(); }
  const ObjectRecord& at(size_t i) const { return records_.at(i); }

  // size == cap: the listing may have been cut short.
  bool possiblyTruncated() const { return cap_ > 0 && records_.size() >= cap_; }

  const ObjectRecord* find(const std::string& key) const;

private:
  std::string bucket_;
  std::string prefix_;
  size_t cap_ = 0;
  std::vector<ObjectRecord> records_;
};

} // namespace rsb
