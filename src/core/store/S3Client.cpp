#include "S3Client.hpp"
#include "core/util/TempPath.hpp"

#include <aws/core/Aws.h>
#include <aws/core/auth/AWSAuthSigner.h>
#include <aws/core/auth/AWSCredentialsProvider.h>
#include <aws/core/auth/AWSCredentialsProviderChain.h>
#include <aws/core/client/ClientConfiguration.h>
#include <aws/core/client/DefaultRetryStrategy.h>
#include <aws/core/http/HttpTypes.h>
#include <aws/core/utils/memory/stl/AWSStreamFwd.h>
#include <aws/s3/S3Client.h>
#include <aws/s3/S3Errors.h>
#include <aws/s3/model/GetObjectRequest.h>
#include <aws/s3/model/HeadObjectRequest.h>
#include <aws/s3/model/ListObjectsV2Request.h>
#include <aws/s3/model/ObjectStorageClass.h>
#include <spdlog/spdlog.h>

#include <fstream>
#include <mutex>

namespace rsb {

namespace fs = std::filesystem;

static const char* kTag = "rsb-s3";

// ---------- sdk lifetime ----------

namespace {

std::mutex g_sdkMtx;
int g_sdkUsers = 0;

Aws::SDKOptions& sdk_options() {
  static Aws::SDKOptions options;
  return options;
}

} // namespace

AwsSdkSession::AwsSdkSession() {
  std::lock_guard<std::mutex> lock(g_sdkMtx);
  if (g_sdkUsers++ == 0) {
    sdk_options().loggingOptions.logLevel = Aws::Utils::Logging::LogLevel::Off;
    Aws::InitAPI(sdk_options());
  }
}

AwsSdkSession::~AwsSdkSession() {
  std::lock_guard<std::mutex> lock(g_sdkMtx);
  if (--g_sdkUsers == 0) Aws::ShutdownAPI(sdk_options());
}

// ---------- helpers ----------

namespace {

std::string str(const Aws::String& s) { return std::string(s.c_str(), s.size()); }

StoreError to_store_error(const Aws::S3::S3Error& e) {
  std::string code = str(e.GetExceptionName());
  const auto status = e.GetResponseCode();
  if (e.GetErrorType() == Aws::S3::S3Errors::NETWORK_CONNECTION ||
      status == Aws::Http::HttpResponseCode::REQUEST_NOT_MADE) {
    code = "NetworkError";
  } else if (code.empty()) {
    // HEAD responses carry no body to name the error
    if (status == Aws::Http::HttpResponseCode::NOT_FOUND) code = "NoSuchKey";
    else if (status == Aws::Http::HttpResponseCode::FORBIDDEN) code = "AccessDenied";
    else code = "HTTP" + std::to_string(static_cast<int>(status));
  }
  std::string message = str(e.GetMessage());
  if (message.empty()) message = "HTTP " + std::to_string(static_cast<int>(status));
  return StoreError(std::move(code), std::move(message));
}

std::string trim_trailing_slash(std::string s) {
  while (!s.empty() && s.back() == '/') s.pop_back();
  return s;
}

Aws::Client::ClientConfiguration client_config(const S3ClientOptions& o) {
  Aws::Client::ClientConfiguration cfg;
  cfg.region = o.region.c_str();
  cfg.connectTimeoutMs = static_cast<long>(o.connect_timeout_sec) * 1000;
  cfg.requestTimeoutMs = static_cast<long>(o.read_timeout_sec) * 1000;
  cfg.retryStrategy = Aws::MakeShared<Aws::Client::DefaultRetryStrategy>(kTag, o.max_retries);
  if (!o.endpoint.empty()) {
    cfg.endpointOverride = trim_trailing_slash(o.endpoint).c_str();
    if (o.endpoint.rfind("http://", 0) == 0) cfg.scheme = Aws::Http::Scheme::HTTP;
  }
  return cfg;
}

std::shared_ptr<Aws::Auth::AWSCredentialsProvider> credentials_provider(const StaticCredentials& c) {
  if (c.valid()) {
    return Aws::MakeShared<Aws::Auth::SimpleAWSCredentialsProvider>(
        kTag, c.access_key.c_str(), c.secret_key.c_str(), c.session_token.c_str());
  }
  return Aws::MakeShared<Aws::Auth::DefaultAWSCredentialsProviderChain>(kTag);
}

} // namespace

S3Client::S3Client(S3ClientOptions opts)
  : opts_(std::move(opts)),
    client_(std::make_unique<Aws::S3::S3Client>(
        credentials_provider(opts_.credentials), client_config(opts_),
        Aws::Client::AWSAuthV4Signer::PayloadSigningPolicy::Never,
        /*useVirtualAddressing=*/opts_.endpoint.empty())) {
  spdlog::debug("S3 client for {} ({})", opts_.region, opts_.endpoint.empty() ? "AWS" : opts_.endpoint);
}

S3Client::~S3Client() = default;

// ---------- listing ----------

ListPage S3Client::listObjects(const ListRequest& req) {
  Aws::S3::Model::ListObjectsV2Request request;
  request.SetBucket(req.bucket.c_str());
  if (!req.prefix.empty()) request.SetPrefix(req.prefix.c_str());
  if (!req.delimiter.empty()) request.SetDelimiter(req.delimiter.c_str());
  if (!req.continuation_token.empty()) request.SetContinuationToken(req.continuation_token.c_str());
  request.SetMaxKeys(req.max_keys);

  auto outcome = client_->ListObjectsV2(request);
  if (!outcome.IsSuccess()) throw to_store_error(outcome.GetError());
  const auto& result = outcome.GetResult();

  ListPage page;
  for (const auto& o : result.GetContents()) {
    RawObject raw;
    raw.key = str(o.GetKey());
    if (raw.key.empty()) continue;
    if (o.SizeHasBeenSet()) raw.size = static_cast<int64_t>(o.GetSize());
    if (o.LastModifiedHasBeenSet()) raw.last_modified = static_cast<int64_t>(o.GetLastModified().Seconds());
    if (o.StorageClassHasBeenSet()) {
      raw.storage_class =
          str(Aws::S3::Model::ObjectStorageClassMapper::GetNameForObjectStorageClass(o.GetStorageClass()));
    }
    page.objects.push_back(std::move(raw));
  }
  for (const auto& cp : result.GetCommonPrefixes()) page.common_prefixes.push_back(str(cp.GetPrefix()));
  page.truncated = result.GetIsTruncated();
  page.next_token = str(result.GetNextContinuationToken());
  return page;
}

// ---------- objects ----------

std::string S3Client::getObject(const std::string& bucket, const std::string& key, uint64_t maxBytes) {
  if (maxBytes > 0) {
    Aws::S3::Model::HeadObjectRequest head;
    head.SetBucket(bucket.c_str());
    head.SetKey(key.c_str());
    auto info = client_->HeadObject(head);
    if (!info.IsSuccess()) throw to_store_error(info.GetError());
    if (static_cast<uint64_t>(info.GetResult().GetContentLength()) > maxBytes) {
      throw PayloadTooLarge(key, maxBytes);
    }
  }

  Aws::S3::Model::GetObjectRequest request;
  request.SetBucket(bucket.c_str());
  request.SetKey(key.c_str());
  auto outcome = client_->GetObject(request);
  if (!outcome.IsSuccess()) throw to_store_error(outcome.GetError());

  auto& body = outcome.GetResult().GetBody();
  std::string bytes;
  char buf[64 * 1024];
  while (body.read(buf, sizeof(buf)) || body.gcount() > 0) {
    bytes.append(buf, static_cast<size_t>(body.gcount()));
    // the object may have grown since the HEAD
    if (maxBytes > 0 && bytes.size() > maxBytes) throw PayloadTooLarge(key, maxBytes);
  }
  return bytes;
}

void S3Client::downloadToFile(const std::string& bucket, const std::string& key, const fs::path& dest) {
  if (dest.has_parent_path()) fs::create_directories(dest.parent_path());
  const fs::path tmp = sibling_temp_path(dest, "part");
  const std::string tmpName = tmp.string();

  Aws::S3::Model::GetObjectRequest request;
  request.SetBucket(bucket.c_str());
  request.SetKey(key.c_str());
  // readable as well, so the SDK can parse an error body written into it
  request.SetResponseStreamFactory([tmpName] {
    return Aws::New<Aws::FStream>(kTag, tmpName.c_str(),
                                  std::ios_base::in | std::ios_base::out | std::ios_base::binary |
                                      std::ios_base::trunc);
  });

  bool ok = false;
  try {
    auto outcome = client_->GetObject(request);
    if (!outcome.IsSuccess()) throw to_store_error(outcome.GetError());
    // the result owns the file stream; it is flushed and closed when `result` goes
    Aws::S3::Model::GetObjectResult result = outcome.GetResultWithOwnership();
    ok = static_cast<bool>(result.GetBody().flush());
  } catch (...) {
    std::error_code ec;
    fs::remove(tmp, ec);
    throw;
  }
  if (!ok) {
    std::error_code ec;
    fs::remove(tmp, ec);
    throw std::runtime_error("short write to " + tmpName);
  }
  fs::rename(tmp, dest); // last writer wins
}

std::string S3Client::presignGet(const std::string& bucket, const std::string& key, std::chrono::seconds ttl) {
  const Aws::String url = client_->GeneratePresignedUrl(bucket.c_str(), key.c_str(), Aws::Http::HttpMethod::HTTP_GET,
                                                        static_cast<uint64_t>(ttl.count()));
  // the SDK hands back an unsigned URL when no credentials resolve
  if (url.empty() || url.find("X-Amz-Signature=") == Aws::String::npos) {
    throw StoreError("MissingCredentials", "no AWS credentials available to sign a URL for " + key);
  }
  return str(url);
}

} // namespace rsb
