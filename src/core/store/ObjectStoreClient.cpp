#include "ObjectStoreClient.hpp"
#include "core/util/TempPath.hpp"

#include <fstream>

namespace rsb {

void ObjectStoreClient::downloadToFile(const std::string& bucket,
                                       const std::string& key,
                                       const std::filesystem::path& dest) {
  namespace fs = std::filesystem;
  const std::string bytes = getObject(bucket, key);
  if (dest.has_parent_path()) fs::create_directories(dest.parent_path());

  const fs::path tmp = sibling_temp_path(dest, "part");
  {
    std::ofstream os(tmp, std::ios::binary | std::ios::trunc);
    if (!os) throw std::runtime_error("cannot open " + tmp.string() + " for writing");
    os.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
    if (!os) {
      os.close();
      std::error_code ec;
      fs::remove(tmp, ec);
      throw std::runtime_error("short write to " + tmp.string());
    }
  }
  fs::rename(tmp, dest); // last writer wins
}

} // namespace rsb
