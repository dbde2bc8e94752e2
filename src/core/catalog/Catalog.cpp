#include "Catalog.hpp"
#include "core/util/TimeFormat.hpp"

#include <algorithm>

namespace rsb {

std::string ObjectRecord::displaySize() const {
  return size ? human_size(static_cast<uint64_t>(*size)) : std::string();
}

std::string ObjectRecord::displayModified() const {
  return last_modified ? format_utc(*last_modified) : std::string();
}

bool catalog_order(const ObjectRecord& a, const ObjectRecord& b) {
  if (a.last_modified != b.last_modified) {
    if (!a.last_modified) return false;
    if (!b.last_modified) return true;
    return *a.last_modified > *b.last_modified;
  }
  return a.key < b.key;
}

Catalog::Catalog(std::string bucket, std::string prefix, size_t cap, std::vector<ObjectRecord> records)
  : bucket_(std::move(bucket)), prefix_(std::move(prefix)), cap_(cap), records_(std::move(records)) {
  std::sort(records_.begin(), records_.end(), catalog_order);
}

const ObjectRecord* Catalog::find(const std::string& key) const {
  auto it = std::find_if(records_.begin(), records_.end(),
                         [&](const ObjectRecord& r) { return r.key == key; });
  return it == records_.end() ? nullptr : &*it;
}

} // namespace rsb
