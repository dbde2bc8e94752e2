#pragma once
#include <stdexcept>
#include <string>

namespace rsb {

// Caller supplied something unusable (bad key, unknown subfolder, bad row).
class InvalidRequestError : public std::runtime_error {
public:
  explicit InvalidRequestError(const std::string& what) : std::runtime_error(what) {}
};

class ConfigError : public std::runtime_error {
public:
  explicit ConfigError(const std::string& what) : std::runtime_error(what) {}
};

} // namespace rsb
