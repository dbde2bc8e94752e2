#pragma once
#include <filesystem>

namespace rsb {

// "<file>.<tag><random>_<seq>" beside `file`. Distinct on every call, so
// concurrent writers of the same destination never share a staging file.
std::filesystem::path sibling_temp_path(const std::filesystem::path& file, const char* tag = "tmp");

} // namespace rsb
