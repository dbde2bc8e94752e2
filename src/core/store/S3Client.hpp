#pragma once
#include <chrono>
#include <memory>
#include <string>

#include "ObjectStoreClient.hpp"

namespace Aws { namespace S3 { class S3Client; } }

namespace rsb {

// Keeps the AWS SDK initialised while any holder is alive. Reference
// counted, so several clients (and the test runner) may each hold one.
class AwsSdkSession {
public:
  AwsSdkSession();
  ~AwsSdkSession();

  AwsSdkSession(const AwsSdkSession&) = delete;
  AwsSdkSession& operator=(const AwsSdkSession&) = delete;
};

// Explicit keys from the environment. When absent the SDK's default
// provider chain (shared config/profile, SSO, container or instance role)
// resolves credentials instead.
struct StaticCredentials {
  std::string access_key;
  std::string secret_key;
  std::string session_token; // empty unless temporary credentials

  bool valid() const { return !access_key.empty() && !secret_key.empty(); }
};

struct S3ClientOptions {
  std::string region = "us-east-1";
  std::string endpoint;          // e.g. "http://localhost:9000"; empty = AWS
  StaticCredentials credentials;
  int connect_timeout_sec = 10;
  int read_timeout_sec = 60;
  int max_retries = 3;
};

// ObjectStoreClient over aws-sdk-cpp. Timeouts and retries belong to the
// SDK's ClientConfiguration.
class S3Client : public ObjectStoreClient {
public:
  explicit S3Client(S3ClientOptions opts);
  ~S3Client() override;

  ListPage listObjects(const ListRequest& req) override;
  std::string getObject(const std::string& bucket,
                        const std::string& key,
                        uint64_t maxBytes = 0) override;
  std::string presignGet(const std::string& bucket,
                         const std::string& key,
                         std::chrono::seconds ttl) override;
  void downloadToFile(const std::string& bucket,
                      const std::string& key,
                      const std::filesystem::path& dest) override;

  const S3ClientOptions& options() const { return opts_; }

private:
  AwsSdkSession sdk_;
  S3ClientOptions opts_;
  std::unique_ptr<Aws::S3::S3Client> client_;
};

} // namespace rsb
