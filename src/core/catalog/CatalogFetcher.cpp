#include "CatalogFetcher.hpp"
#include "core/store/ObjectStoreClient.hpp"

#include <spdlog/spdlog.h>
#include <algorithm>
#include <unordered_set>

namespace rsb {

std::string normalize_prefix(const std::string& p) {
  const auto b = p.find_first_not_of(" \t\r\n");
  if (b == std::string::npos) return {};
  const auto e = p.find_last_not_of(" \t\r\n");
  std::string s = p.substr(b, e - b + 1);
  const auto lead = s.find_first_not_of('/');
  s = lead == std::string::npos ? std::string() : s.substr(lead);
  if (!s.empty() && s.back() != '/') s.push_back('/');
  return s;
}

std::string project_prefix(const std::string& basePrefix,
                           const std::string& project,
                           const std::string& subfolder) {
  return normalize_prefix(normalize_prefix(basePrefix) + project + "/" + subfolder);
}

Catalog CatalogFetcher::fetch(const std::string& bucket, const std::string& prefix, size_t cap) const {
  std::vector<ObjectRecord> rows;
  std::unordered_set<std::string> seen;

  ListRequest req;
  req.bucket = bucket;
  req.prefix = prefix;

  int pages = 0;
  while (cap == 0 || rows.size() < cap) {
    const size_t remaining = cap == 0 ? kPageSize : cap - rows.size();
    req.max_keys = static_cast<int>(std::min<size_t>(kPageSize, remaining));

    ListPage page = store_.listObjects(req);
    ++pages;
    for (auto& o : page.objects) {
      if (cap != 0 && rows.size() >= cap) break;
      if (!seen.insert(o.key).second) continue;
      rows.push_back(ObjectRecord{std::move(o.key), o.size, o.last_modified, std::move(o.storage_class)});
    }

    if (!page.truncated || page.next_token.empty()) break;
    req.continuation_token = page.next_token;
  }

  spdlog::info("listed s3://{}/{}: {} objects in {} page(s){}", bucket, prefix, rows.size(), pages,
               (cap != 0 && rows.size() >= cap) ? " (cap reached)" : "");
  return Catalog(bucket, prefix, cap, std::move(rows));
}

std::vector<std::string> CatalogFetcher::listProjects(const std::string& bucket,
                                                      const std::string& basePrefix) const {
  ListRequest req;
  req.bucket = bucket;
  req.prefix = normalize_prefix(basePrefix);
  req.delimiter = "/";

  std::vector<std::string> projects;
  for (;;) {
    ListPage page = store_.listObjects(req);
    for (const auto& cp : page.common_prefixes) {
      // "vendor-data/ProjA/" -> "ProjA"
      std::string s = cp;
      if (!s.empty() && s.back() == '/') s.pop_back();
      const auto slash = s.rfind('/');
      std::string name = slash == std::string::npos ? s : s.substr(slash + 1);
      if (!name.empty()) projects.push_back(std::move(name));
    }
    if (!page.truncated || page.next_token.empty()) break;
    req.continuation_token = page.next_token;
  }

  std::sort(projects.begin(), projects.end());
  projects.erase(std::unique(projects.begin(), projects.end()), projects.end());
  spdlog::info("listed {} project(s) under s3://{}/{}", projects.size(), bucket, req.prefix);
  return projects;
}

} // namespace rsb
