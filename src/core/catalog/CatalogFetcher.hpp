#pragma once
#include <string>
#include <vector>

#include "Catalog.hpp"

namespace rsb {

class ObjectStoreClient;

// Trims whitespace and leading '/', guarantees a trailing '/' unless empty.
std::string normalize_prefix(const std::string& p);

// Prefix for (project, subfolder) under the base prefix.
std::string project_prefix(const std::string& basePrefix,
                           const std::string& project,
                           const std::string& subfolder);

class CatalogFetcher {
public:
  static constexpr size_t kDefaultCap = 5000;
  static constexpr int kPageSize = 1000;

  explicit CatalogFetcher(ObjectStoreClient& store) : store_(store) {}

  // Pages through the listing until the provider is done or `cap` records
  // are held; no page is requested past the cap. Throws StoreError and
  // returns nothing partial.
  Catalog fetch(const std::string& bucket, const std::string& prefix, size_t cap = kDefaultCap) const;

  // Names of the immediate sub-"directories" of basePrefix, ascending.
  std::vector<std::string> listProjects(const std::string& bucket, const std::string& basePrefix) const;

private:
  ObjectStoreClient& store_;
};

} // namespace rsb
