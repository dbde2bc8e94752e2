#pragma once
#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>

#include "core/store/S3Client.hpp"

namespace rsb {

enum class TableView { Grid, Html };

struct AppConfig {
  std::string region = "us-east-1";
  std::string bucket = "rnaseqdatabase";
  std::string base_prefix = "vendor-data/";
  size_t max_objects = 5000;

  StaticCredentials credentials; // empty = SDK default provider chain
  std::string endpoint;

  std::string web_root = "www";
  std::string download_dir = "downloads";
  uint64_t max_archive_bytes = 256ull << 20;
  std::chrono::seconds presign_ttl{3600};
  std::chrono::seconds poll_interval{0}; // 0 = polling off
  int workers = 4;

  int s3_connect_timeout = 10;
  int s3_read_timeout = 60;
  int s3_max_retries = 3;

  int port = 8080;
  std::string api_key; // empty = auth disabled
  TableView table_view = TableView::Grid;
  std::string sample_dir = "Salmon_Quant";
  std::string log_level = "info";

  S3ClientOptions s3Options() const;
};

// Returns the variable's value or nullopt when unset.
using EnvLookup = std::function<std::optional<std::string>(const char*)>;

std::optional<std::string> process_env(const char* key);

std::string get_env_or(const EnvLookup& env, const char* key, const std::string& defval);

// Throws ConfigError on unparsable numbers, out-of-range values or unknown
// enum spellings.
AppConfig load_config(const EnvLookup& env = process_env);

} // namespace rsb
