#pragma once
#include <filesystem>
#include <string>
#include <string_view>

namespace rsb {

// Local side of the browser: a web-servable root (previews, extracted
// reports) and a flat directory for plain downloads.
class LocalFSBackend {
public:
  LocalFSBackend(std::filesystem::path webRoot, std::filesystem::path downloadRoot);

  const std::filesystem::path& webRoot() const { return webRoot_; }
  const std::filesystem::path& downloadRoot() const { return downloadRoot_; }

  // <web-root>/downloads
  std::filesystem::path servedDownloads() const { return webRoot_ / "downloads"; }

  // <web-root>/downloads/fastqc_<digest>.html
  std::filesystem::path previewPathFor(const std::string& key) const;

  // <web-root>/downloads/fastqc_zip_<digest>
  std::filesystem::path archiveRootFor(const std::string& key) const;

  // <download-root>/<key with '/' replaced by "__">
  std::filesystem::path flatDownloadPathFor(const std::string& key) const;

  // Writes bytes via a temp file + rename; returns the canonical path.
  std::string put(const std::filesystem::path& file, std::string_view bytes) const;

  // "/downloads/..." URL path of a file under the web root.
  std::string webPathOf(const std::filesystem::path& file) const;

  // True when `candidate` resolves (symlinks included) inside `root`.
  static bool isWithin(const std::filesystem::path& root, const std::filesystem::path& candidate);

private:
  std::filesystem::path webRoot_;
  std::filesystem::path downloadRoot_;
};

} // namespace rsb
