#pragma once
#include <string>
#include <vector>

namespace rsb::test {

// Writes small ZIP archives for extraction tests through libarchive's
// writer. Entry names are taken verbatim, so hostile names ("../x",
// "/etc/x") can be produced.
class ZipBuilder {
public:
  ZipBuilder& add(const std::string& name, const std::string& content, bool deflate = false);
  ZipBuilder& addDirectory(const std::string& name);
  ZipBuilder& addSymlink(const std::string& name, const std::string& target);

  std::string build() const;

private:
  struct Entry {
    std::string name;
    std::string data;     // file content, or the symlink target
    unsigned type = 0;    // AE_IFREG, AE_IFDIR or AE_IFLNK
    bool deflate = false;
  };

  std::vector<Entry> entries_;
};

} // namespace rsb::test
