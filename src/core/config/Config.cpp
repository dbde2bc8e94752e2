#include "Config.hpp"
#include "core/catalog/CatalogFetcher.hpp"
#include "core/util/Errors.hpp"

#include <spdlog/spdlog.h>
#include <cstdlib>

namespace rsb {

// ---------- helpers ----------

namespace {

long long parse_int(const EnvLookup& env, const char* key, long long defval, long long min, long long max) {
  const auto raw = env(key);
  if (!raw || raw->empty()) return defval;
  size_t used = 0;
  long long v = 0;
  try {
    v = std::stoll(*raw, &used);
  } catch (const std::exception&) {
    throw ConfigError(std::string(key) + ": not a number: '" + *raw + "'");
  }
  if (used != raw->size()) throw ConfigError(std::string(key) + ": not a number: '" + *raw + "'");
  if (v < min || v > max) {
    throw ConfigError(std::string(key) + ": " + std::to_string(v) + " outside [" + std::to_string(min) + ", " +
                      std::to_string(max) + "]");
  }
  return v;
}

} // namespace

std::optional<std::string> process_env(const char* key) {
#ifdef _WIN32
  size_t len = 0;
  char* buf = nullptr;
  if (_dupenv_s(&buf, &len, key) == 0 && buf) {
    std::string v(buf);
    free(buf);
    return v;
  }
  return std::nullopt;
#else
  if (const char* v = std::getenv(key)) return std::string(v);
  return std::nullopt;
#endif
}

std::string get_env_or(const EnvLookup& env, const char* key, const std::string& defval) {
  if (auto v = env(key)) return *v;
  return defval;
}

S3ClientOptions AppConfig::s3Options() const {
  S3ClientOptions o;
  o.region = region;
  o.endpoint = endpoint;
  o.credentials = credentials;
  o.connect_timeout_sec = s3_connect_timeout;
  o.read_timeout_sec = s3_read_timeout;
  o.max_retries = s3_max_retries;
  return o;
}

AppConfig load_config(const EnvLookup& env) {
  AppConfig c;
  c.region = get_env_or(env, "AWS_REGION", c.region);
  c.bucket = get_env_or(env, "RNASEQ_S3_BUCKET", c.bucket);
  c.base_prefix = normalize_prefix(get_env_or(env, "RNASEQ_BASE_PREFIX", c.base_prefix));
  c.max_objects = static_cast<size_t>(parse_int(env, "RNASEQ_MAX_OBJECTS", 5000, 1, 10'000'000));
  if (c.region.empty()) throw ConfigError("AWS_REGION: empty");
  if (c.bucket.empty()) throw ConfigError("RNASEQ_S3_BUCKET: empty");

  c.credentials.access_key = get_env_or(env, "AWS_ACCESS_KEY_ID", "");
  c.credentials.secret_key = get_env_or(env, "AWS_SECRET_ACCESS_KEY", "");
  c.credentials.session_token = get_env_or(env, "AWS_SESSION_TOKEN", "");
  c.endpoint = get_env_or(env, "AWS_ENDPOINT_URL", "");

  c.web_root = get_env_or(env, "RSB_WEB_ROOT", c.web_root);
  c.download_dir = get_env_or(env, "RSB_DOWNLOAD_DIR", c.download_dir);
  c.max_archive_bytes = static_cast<uint64_t>(parse_int(env, "RSB_MAX_ARCHIVE_MB", 256, 1, 1 << 20)) << 20;
  c.presign_ttl = std::chrono::seconds(parse_int(env, "RSB_PRESIGN_TTL", 3600, 1, 604800));
  c.poll_interval = std::chrono::seconds(parse_int(env, "RSB_POLL_SECONDS", 0, 0, 86400));
  c.workers = static_cast<int>(parse_int(env, "RSB_WORKERS", 4, 1, 256));

  c.s3_connect_timeout = static_cast<int>(parse_int(env, "RSB_S3_CONNECT_TIMEOUT", 10, 1, 3600));
  c.s3_read_timeout = static_cast<int>(parse_int(env, "RSB_S3_READ_TIMEOUT", 60, 1, 3600));
  c.s3_max_retries = static_cast<int>(parse_int(env, "RSB_S3_MAX_RETRIES", 3, 0, 20));

  c.port = static_cast<int>(parse_int(env, "RSB_PORT", 8080, 1, 65535));
  c.api_key = get_env_or(env, "RSB_API_KEY", "");

  const std::string view = get_env_or(env, "RSB_TABLE_VIEW", "grid");
  if (view == "grid") c.table_view = TableView::Grid;
  else if (view == "html") c.table_view = TableView::Html;
  else throw ConfigError("RSB_TABLE_VIEW: expected 'grid' or 'html', got '" + view + "'");

  c.sample_dir = get_env_or(env, "RSB_SAMPLE_DIR", c.sample_dir);
  if (c.sample_dir.empty() || c.sample_dir.find('/') != std::string::npos) {
    throw ConfigError("RSB_SAMPLE_DIR: must be a single path segment");
  }

  c.log_level = get_env_or(env, "RSB_LOG_LEVEL", c.log_level);
  if (c.log_level != "off" && spdlog::level::from_str(c.log_level) == spdlog::level::off) {
    throw ConfigError("RSB_LOG_LEVEL: unknown level '" + c.log_level + "'");
  }

  if (!c.credentials.access_key.empty() && c.credentials.secret_key.empty()) {
    throw ConfigError("AWS_ACCESS_KEY_ID set without AWS_SECRET_ACCESS_KEY");
  }
  return c;
}

} // namespace rsb
