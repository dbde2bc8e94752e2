#pragma once
#include <cstdint>
#include <string>

namespace rsb {

// unix seconds -> "2009-10-12 17:50:30 UTC"
std::string format_utc(int64_t unixSeconds);

// "2.00 KB" style sizes; bytes are printed as an integer.
std::string human_size(uint64_t n);

} // namespace rsb
