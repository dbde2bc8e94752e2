#pragma once
#include <string>
#include <string_view>

namespace rsb {

// Copies `in`, replacing every invalid UTF-8 sequence with U+FFFD.
std::string to_valid_utf8(std::string_view in);

} // namespace rsb
