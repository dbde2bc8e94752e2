#include "TempPath.hpp"

#include <atomic>
#include <cstdint>
#include <random>
#include <string>

namespace rsb {

std::filesystem::path sibling_temp_path(const std::filesystem::path& file, const char* tag) {
  static std::atomic<uint64_t> counter{0};
  static thread_local std::mt19937_64 rng{std::random_device{}()};
  std::filesystem::path p = file;
  p += "." + std::string(tag) + std::to_string(rng() & 0xffffff) + "_" + std::to_string(counter++);
  return p;
}

} // namespace rsb
