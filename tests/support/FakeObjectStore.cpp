#include "FakeObjectStore.hpp"

#include <algorithm>

namespace rsb::test {

void FakeObjectStore::put(const std::string& key, std::string body, std::optional<int64_t> lastModified) {
  std::lock_guard<std::mutex> lock(mtx_);
  Object o;
  o.size = static_cast<int64_t>(body.size());
  o.body = std::move(body);
  o.last_modified = lastModified;
  o.storage_class = "STANDARD";
  objects_[key] = std::move(o);
}

void FakeObjectStore::putListing(RawObject raw) {
  std::lock_guard<std::mutex> lock(mtx_);
  objects_[raw.key] = Object{{}, raw.size, raw.last_modified, raw.storage_class};
}

void FakeObjectStore::failListing(std::string code, std::string message) {
  std::lock_guard<std::mutex> lock(mtx_);
  listFailure_.emplace(std::move(code), std::move(message));
}

void FakeObjectStore::failGets(std::string code, std::string message) {
  std::lock_guard<std::mutex> lock(mtx_);
  getFailure_.emplace(std::move(code), std::move(message));
}

void FakeObjectStore::clearFailures() {
  std::lock_guard<std::mutex> lock(mtx_);
  listFailure_.reset();
  getFailure_.reset();
}

ListPage FakeObjectStore::listObjects(const ListRequest& req) {
  std::lock_guard<std::mutex> lock(mtx_);
  listRequests_.push_back(req);
  if (listFailure_) throw *listFailure_;

  // Flatten to the entries this request can see: objects, or with a
  // delimiter, objects at this level plus one entry per common prefix.
  struct Item { std::string name; const Object* object; };
  std::vector<Item> items;
  for (const auto& [key, obj] : objects_) {
    if (key.compare(0, req.prefix.size(), req.prefix) != 0) continue;
    if (!req.delimiter.empty()) {
      const auto d = key.find(req.delimiter, req.prefix.size());
      if (d != std::string::npos) {
        const std::string cp = key.substr(0, d + req.delimiter.size());
        if (items.empty() || items.back().name != cp) items.push_back({cp, nullptr});
        continue;
      }
    }
    items.push_back({key, &obj});
  }

  const size_t start = req.continuation_token.empty() ? 0 : std::stoul(req.continuation_token);
  const size_t end = std::min(items.size(), start + static_cast<size_t>(std::max(req.max_keys, 1)));

  ListPage page;
  for (size_t i = start; i < end; ++i) {
    if (!items[i].object) {
      page.common_prefixes.push_back(items[i].name);
      continue;
    }
    const Object& o = *items[i].object;
    page.objects.push_back(RawObject{items[i].name, o.size, o.last_modified, o.storage_class});
  }
  page.truncated = end < items.size();
  if (page.truncated) page.next_token = std::to_string(end);
  return page;
}

std::string FakeObjectStore::getObject(const std::string&, const std::string& key, uint64_t maxBytes) {
  std::lock_guard<std::mutex> lock(mtx_);
  ++getCalls_;
  if (getFailure_) throw *getFailure_;
  auto it = objects_.find(key);
  if (it == objects_.end()) throw StoreError("NoSuchKey", "The specified key does not exist.");
  if (maxBytes != 0 && it->second.body.size() > maxBytes) throw PayloadTooLarge(key, maxBytes);
  return it->second.body;
}

std::string FakeObjectStore::presignGet(const std::string&, const std::string& key, std::chrono::seconds ttl) {
  std::lock_guard<std::mutex> lock(mtx_);
  ++presignCalls_;
  return "https://signed.test/" + key + "?ttl=" + std::to_string(ttl.count());
}

int FakeObjectStore::listCalls() const {
  std::lock_guard<std::mutex> lock(mtx_);
  return static_cast<int>(listRequests_.size());
}

int FakeObjectStore::getCalls() const {
  std::lock_guard<std::mutex> lock(mtx_);
  return getCalls_;
}

int FakeObjectStore::presignCalls() const {
  std::lock_guard<std::mutex> lock(mtx_);
  return presignCalls_;
}

std::vector<ListRequest> FakeObjectStore::listRequests() const {
  std::lock_guard<std::mutex> lock(mtx_);
  return listRequests_;
}

} // namespace rsb::test
