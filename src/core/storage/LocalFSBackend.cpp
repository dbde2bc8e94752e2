#include "LocalFSBackend.hpp"
#include "core/util/Digest.hpp"
#include "core/util/Errors.hpp"
#include "core/util/TempPath.hpp"

#include <fstream>
#include <stdexcept>

namespace rsb {

namespace fs = std::filesystem;

LocalFSBackend::LocalFSBackend(fs::path webRoot, fs::path downloadRoot)
  : webRoot_(fs::absolute(std::move(webRoot)).lexically_normal()),
    downloadRoot_(fs::absolute(std::move(downloadRoot)).lexically_normal()) {
  fs::create_directories(servedDownloads());
  fs::create_directories(downloadRoot_);
}

fs::path LocalFSBackend::previewPathFor(const std::string& key) const {
  return servedDownloads() / ("fastqc_" + short_digest(key) + ".html");
}

fs::path LocalFSBackend::archiveRootFor(const std::string& key) const {
  return servedDownloads() / ("fastqc_zip_" + short_digest(key));
}

fs::path LocalFSBackend::flatDownloadPathFor(const std::string& key) const {
  std::string flat;
  flat.reserve(key.size() + 8);
  for (char c : key) {
    if (c == '/' || c == '\\') flat += "__";
    else if (c == '\0') throw InvalidRequestError("key contains a NUL byte");
    else flat.push_back(c);
  }
  if (flat.empty() || flat == "." || flat == "..") {
    throw InvalidRequestError("key '" + key + "' does not name a file");
  }
  return downloadRoot_ / flat;
}

std::string LocalFSBackend::put(const fs::path& file, std::string_view bytes) const {
  if (file.has_parent_path()) fs::create_directories(file.parent_path());
  const fs::path tmp = sibling_temp_path(file);
  {
    std::ofstream os(tmp, std::ios::binary | std::ios::trunc);
    if (!os) throw std::runtime_error("cannot open " + tmp.string() + " for writing");
    os.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
    os.flush();
    if (!os) {
      os.close();
      std::error_code ec;
      fs::remove(tmp, ec);
      throw std::runtime_error("short write to " + tmp.string());
    }
  }
  fs::rename(tmp, file); // last writer wins
  return fs::weakly_canonical(file).string();
}

std::string LocalFSBackend::webPathOf(const fs::path& file) const {
  const fs::path rel = fs::absolute(file).lexically_normal().lexically_relative(webRoot_);
  if (rel.empty() || *rel.begin() == "..") {
    throw std::runtime_error(file.string() + " is not under the web root");
  }
  return "/" + rel.generic_string();
}

bool LocalFSBackend::isWithin(const fs::path& root, const fs::path& candidate) {
  std::error_code ec;
  const fs::path r = fs::weakly_canonical(root, ec);
  if (ec) return false;
  const fs::path c = fs::weakly_canonical(candidate, ec);
  if (ec) return false;

  const fs::path rel = c.lexically_relative(r);
  return !rel.empty() && *rel.begin() != "..";
}

} // namespace rsb
