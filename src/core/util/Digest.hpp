#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace rsb {

std::string to_hex(const uint8_t* data, size_t len);

// SHA-256 of bytes as 64 lowercase hex chars.
std::string sha256_hex(std::string_view bytes);

// First `width` hex chars of sha256(bytes); used for local file/dir names.
std::string short_digest(std::string_view bytes, size_t width = 12);

} // namespace rsb
