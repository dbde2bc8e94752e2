#include "ArchiveExtractor.hpp"
#include "core/storage/LocalFSBackend.hpp"
#include "core/store/ObjectStoreClient.hpp"

#include <archive.h>
#include <archive_entry.h>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>
#include <memory>
#include <vector>

namespace rsb {

namespace fs = std::filesystem;

static constexpr const char* kDoneMarker = ".rsb_extracted";

static std::string lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return s;
}

static std::string error_of(archive* a) {
  const char* msg = archive_error_string(a);
  return msg ? msg : "unreadable archive";
}

ArchiveExtractor::ArchiveExtractor(ObjectStoreClient& store, const LocalFSBackend& fs, ExtractorOptions opts)
  : store_(store), fs_(fs), opts_(std::move(opts)) {}

std::optional<std::string> ArchiveExtractor::sanitizeEntryPath(const std::string& name) {
  if (name.empty() || name.find('\0') != std::string::npos) return std::nullopt;

  std::string s = name;
  std::replace(s.begin(), s.end(), '\\', '/');
  if (s.front() == '/') return std::nullopt;
  if (s.size() >= 2 && std::isalpha(static_cast<unsigned char>(s[0])) && s[1] == ':') return std::nullopt;

  std::string out;
  size_t start = 0;
  while (start <= s.size()) {
    const size_t slash = s.find('/', start);
    const std::string seg = s.substr(start, slash == std::string::npos ? std::string::npos : slash - start);
    if (seg == "..") return std::nullopt;
    if (!seg.empty() && seg != ".") {
      if (!out.empty()) out.push_back('/');
      out += seg;
    }
    if (slash == std::string::npos) break;
    start = slash + 1;
  }
  if (out.empty()) return std::nullopt;
  return out;
}

std::optional<std::string> ArchiveExtractor::findReport(const fs::path& root, const std::string& reportName) {
  std::error_code ec;
  if (!fs::is_directory(root, ec)) return std::nullopt;

  std::vector<std::string> exact, html;
  const std::string wanted = lower(reportName);
  for (fs::recursive_directory_iterator it(root, ec), end; !ec && it != end; it.increment(ec)) {
    // a sibling temp file may be renamed away mid-scan
    std::error_code statEc;
    if (!it->is_regular_file(statEc)) continue;
    const std::string rel = it->path().lexically_relative(root).generic_string();
    const std::string fname = lower(it->path().filename().string());
    const std::string ext = lower(it->path().extension().string());
    if (fname == wanted) exact.push_back(rel);
    else if (ext == ".html" || ext == ".htm") html.push_back(rel);
  }
  if (ec) spdlog::warn("scan of {} stopped early: {}", root.string(), ec.message());

  auto shallowest = [](std::vector<std::string>& v) -> std::optional<std::string> {
    if (v.empty()) return std::nullopt;
    auto depth = [](const std::string& s) { return std::count(s.begin(), s.end(), '/'); };
    return *std::min_element(v.begin(), v.end(), [&](const std::string& a, const std::string& b) {
      if (depth(a) != depth(b)) return depth(a) < depth(b);
      return a < b;
    });
  };
  if (auto r = shallowest(exact)) return r;
  return shallowest(html);
}

ExtractionResult ArchiveExtractor::extract(const std::string& bucket, const std::string& archiveKey) const {
  const fs::path root = fs_.archiveRootFor(archiveKey);

  std::error_code ec;
  if (opts_.reuse_existing && fs::exists(root / kDoneMarker, ec)) {
    if (findReport(root, opts_.report_name)) {
      spdlog::info("reusing extraction of {} at {}", archiveKey, root.string());
      return finish(archiveKey, root, 0, 0, true);
    }
  }

  std::string bytes;
  try {
    bytes = store_.getObject(bucket, archiveKey, opts_.max_archive_bytes);
  } catch (const PayloadTooLarge&) {
    throw ExtractionError(ExtractionErrorKind::TooLarge,
                          "archive " + archiveKey + " is larger than " +
                              std::to_string(opts_.max_archive_bytes) + " bytes");
  }
  return extractBytes(archiveKey, bytes);
}

ExtractionResult ArchiveExtractor::extractBytes(const std::string& archiveKey, std::string_view bytes) const {
  if (bytes.size() > opts_.max_archive_bytes) {
    throw ExtractionError(ExtractionErrorKind::TooLarge,
                          "archive " + archiveKey + " is larger than " +
                              std::to_string(opts_.max_archive_bytes) + " bytes");
  }

  std::unique_ptr<archive, decltype(&archive_read_free)> a(archive_read_new(), &archive_read_free);
  if (!a) throw std::bad_alloc();
  archive_read_support_format_zip(a.get());
  if (archive_read_open_memory(a.get(), bytes.data(), bytes.size()) != ARCHIVE_OK) {
    throw MalformedArchiveError(archiveKey + ": " + error_of(a.get()));
  }

  const fs::path root = fs_.archiveRootFor(archiveKey);
  fs::create_directories(root);

  size_t written = 0, skipped = 0;
  uint64_t total = 0;
  std::vector<char> buf(64 * 1024);
  archive_entry* entry = nullptr;
  for (;;) {
    const int r = archive_read_next_header(a.get(), &entry);
    if (r == ARCHIVE_EOF) break;
    if (r == ARCHIVE_WARN) {
      spdlog::warn("{}: {}", archiveKey, error_of(a.get()));
    } else if (r != ARCHIVE_OK) {
      throw MalformedArchiveError(archiveKey + ": " + error_of(a.get()));
    }

    const char* name = archive_entry_pathname(entry);
    if (!name) {
      spdlog::warn("skipping unnamed archive entry in {}", archiveKey);
      ++skipped;
      continue;
    }
    const auto rel = sanitizeEntryPath(name);
    if (!rel) {
      spdlog::warn("skipping archive entry '{}' in {}: unsafe path", name, archiveKey);
      ++skipped;
      continue;
    }
    const fs::path dest = root / fs::path(*rel);
    if (!LocalFSBackend::isWithin(root, dest)) {
      spdlog::warn("skipping archive entry '{}' in {}: resolves outside {}", name, archiveKey, root.string());
      ++skipped;
      continue;
    }

    const auto type = archive_entry_filetype(entry);
    if (type == AE_IFDIR) {
      fs::create_directories(dest);
      continue;
    }
    if (type != AE_IFREG || archive_entry_is_encrypted(entry)) {
      spdlog::warn("skipping archive entry '{}' in {}: {}", name, archiveKey,
                   type == AE_IFLNK ? "symlink" : type == AE_IFREG ? "encrypted" : "not a regular file");
      ++skipped;
      continue;
    }

    std::string data;
    la_ssize_t n = 0;
    while ((n = archive_read_data(a.get(), buf.data(), buf.size())) > 0) {
      total += static_cast<uint64_t>(n);
      if (total > opts_.max_extracted_bytes) {
        throw ExtractionError(ExtractionErrorKind::TooLarge,
                              "archive " + archiveKey + " expands beyond " +
                                  std::to_string(opts_.max_extracted_bytes) + " bytes");
      }
      data.append(buf.data(), static_cast<size_t>(n));
    }
    // a bad CRC surfaces here as ARCHIVE_WARN
    if (n < 0) {
      throw MalformedArchiveError(archiveKey + ": entry '" + name + "': " + error_of(a.get()));
    }
    fs_.put(dest, data);
    ++written;
  }

  fs_.put(root / kDoneMarker, archiveKey);
  spdlog::info("extracted {} file(s) from {} into {} ({} skipped)", written, archiveKey, root.string(), skipped);
  return finish(archiveKey, root, written, skipped, false);
}

ExtractionResult ArchiveExtractor::finish(const std::string& archiveKey, const fs::path& root,
                                          size_t written, size_t skipped, bool reused) const {
  const auto report = findReport(root, opts_.report_name);
  if (!report) {
    throw ExtractionError(ExtractionErrorKind::ReportNotFound,
                          "no HTML report found in " + archiveKey);
  }

  ExtractionResult r;
  r.source_key = archiveKey;
  r.local_root = root;
  r.report_path = *report;
  r.web_path = fs_.webPathOf(root / fs::path(*report));
  r.files_written = written;
  r.entries_skipped = skipped;
  r.reused = reused;
  return r;
}

} // namespace rsb
