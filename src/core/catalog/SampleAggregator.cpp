#include "SampleAggregator.hpp"

#include <algorithm>
#include <map>

namespace rsb {

namespace {

std::vector<std::string> split_key(const std::string& key) {
  std::vector<std::string> out;
  size_t start = 0;
  while (start <= key.size()) {
    const size_t slash = key.find('/', start);
    const size_t end = slash == std::string::npos ? key.size() : slash;
    if (end > start) out.push_back(key.substr(start, end - start));
    if (slash == std::string::npos) break;
    start = slash + 1;
  }
  return out;
}

bool ends_with(const std::string& s, const std::string& suffix) {
  return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

std::string file_name(const std::string& key) {
  const auto slash = key.rfind('/');
  return slash == std::string::npos ? key : key.substr(slash + 1);
}

} // namespace

bool SampleRecord::operator==(const SampleRecord& o) const {
  return sample_id == o.sample_id && complete == o.complete && has_quant == o.has_quant &&
         has_gene_quant == o.has_gene_quant && has_log == o.has_log && has_meta == o.has_meta &&
         file_count == o.file_count && latest_modified == o.latest_modified;
}

std::optional<std::string> sample_id_for(const std::string& key, const SampleLayout& layout) {
  if (!key.empty() && key.back() == '/') return std::nullopt; // folder placeholder
  const auto parts = split_key(key);
  const auto marker = std::find(parts.begin(), parts.end(), layout.sample_dir);
  if (marker == parts.end()) return std::nullopt;

  const auto rest = static_cast<size_t>(parts.end() - marker - 1);
  if (rest >= 2) return *(marker + 1);
  if (rest == 1) {
    const std::string& leaf = *(marker + 1);
    if (ends_with(leaf, layout.done_suffix) && leaf.size() > layout.done_suffix.size()) {
      return leaf.substr(0, leaf.size() - layout.done_suffix.size());
    }
  }
  return std::nullopt;
}

std::vector<SampleRecord> aggregate_samples(const std::vector<ObjectRecord>& records,
                                            const SampleLayout& layout) {
  std::map<std::string, SampleRecord> groups;

  for (const auto& r : records) {
    auto id = sample_id_for(r.key, layout);
    if (!id) continue;

    SampleRecord& s = groups[*id];
    s.sample_id = *id;
    ++s.file_count;

    const std::string name = file_name(r.key);
    s.complete       |= ends_with(name, layout.done_suffix);
    s.has_quant      |= name == layout.quant_file;
    s.has_gene_quant |= name == layout.gene_quant_file;
    s.has_log        |= ends_with(name, layout.log_suffix);
    s.has_meta       |= name == layout.meta_file;

    if (r.last_modified && (!s.latest_modified || *r.last_modified > *s.latest_modified)) {
      s.latest_modified = r.last_modified;
    }
  }

  std::vector<SampleRecord> out;
  out.reserve(groups.size());
  for (auto& [id, s] : groups) {
    if (!(s.complete || s.has_quant || s.has_gene_quant || s.has_log || s.has_meta)) continue;
    out.push_back(std::move(s));
  }
  std::stable_sort(out.begin(), out.end(), [](const SampleRecord& a, const SampleRecord& b) {
    if (a.complete != b.complete) return a.complete;
    return a.sample_id < b.sample_id;
  });
  return out;
}

} // namespace rsb
