#pragma once
#include <cstdint>
#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

namespace rsb {

class ObjectStoreClient;
class LocalFSBackend;

// The byte stream is not a readable ZIP archive.
class MalformedArchiveError : public std::runtime_error {
public:
  explicit MalformedArchiveError(const std::string& what) : std::runtime_error(what) {}
};

enum class ExtractionErrorKind { TooLarge, ReportNotFound };

class ExtractionError : public std::runtime_error {
public:
  ExtractionError(ExtractionErrorKind kind, const std::string& what)
    : std::runtime_error(what), kind_(kind) {}

  ExtractionErrorKind kind() const noexcept { return kind_; }

private:
  ExtractionErrorKind kind_;
};

struct ExtractionResult {
  std::string source_key;
  std::filesystem::path local_root; // <web-root>/downloads/fastqc_zip_<digest>
  std::string report_path;          // relative to local_root, '/' separated
  std::string web_path;             // "/downloads/fastqc_zip_<digest>/<report_path>"
  size_t files_written = 0;
  size_t entries_skipped = 0;
  bool reused = false;              // served from an earlier extraction
};

struct ExtractorOptions {
  uint64_t max_archive_bytes = 256ull << 20;
  uint64_t max_extracted_bytes = 1ull << 30;
  bool reuse_existing = true;
  std::string report_name = "fastqc_report.html";
};

class ArchiveExtractor {
public:
  ArchiveExtractor(ObjectStoreClient& store, const LocalFSBackend& fs, ExtractorOptions opts = {});

  // Download + extract. Throws ExtractionError, MalformedArchiveError, StoreError.
  ExtractionResult extract(const std::string& bucket, const std::string& archiveKey) const;

  // Extract an archive already in memory under the root derived from archiveKey.
  // Safe to run concurrently for the same key; files are replaced atomically.
  ExtractionResult extractBytes(const std::string& archiveKey, std::string_view bytes) const;

  // Relative, '/'-separated form of an entry name; nullopt for absolute
  // paths, drive letters, ".." segments, NUL bytes or empty names.
  static std::optional<std::string> sanitizeEntryPath(const std::string& name);

  // Canonical report name first, then any *.html; shallowest path wins.
  static std::optional<std::string> findReport(const std::filesystem::path& root,
                                               const std::string& reportName);

  const ExtractorOptions& options() const { return opts_; }

private:
  ExtractionResult finish(const std::string& archiveKey, const std::filesystem::path& root,
                          size_t written, size_t skipped, bool reused) const;

  ObjectStoreClient& store_;
  const LocalFSBackend& fs_;
  ExtractorOptions opts_;
};

} // namespace rsb
