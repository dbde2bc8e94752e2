#pragma once
#include <functional>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "core/archive/ArchiveExtractor.hpp"
#include "core/config/Config.hpp"
#include "core/markup/AssetRewriter.hpp"
#include "core/storage/LocalFSBackend.hpp"
#include "core/store/UrlSigner.hpp"
#include "core/util/Outcome.hpp"
#include "services/refresh/RefreshCoordinator.hpp"
#include "services/runtime/Executor.hpp"
#include "services/view/TableRenderer.hpp"

namespace rsb {

class ObjectStoreClient;

template <typename T>
using Done = std::function<void(const Outcome<T>&)>;

// The operations a front end drives. Lives on the orchestration thread
// together with the coordinator; downloads, extraction and markup work
// run on the worker executor and report back through `done` on the loop.
// An empty key means "the selected key".
class BrowserService {
public:
  BrowserService(const AppConfig& cfg, ObjectStoreClient& store, RefreshCoordinator& coordinator,
                 Scheduler& loop, Executor& workers);

  // (label, value) pairs, "(project root)" first.
  static const std::vector<std::pair<std::string, std::string>>& subfolderChoices();
  // Label or value -> value; throws InvalidRequestError for anything else.
  static std::string subfolderValue(const std::string& choice);

  bool refreshProjects(ProjectsDone done = {});
  bool listObjects(const std::string& project, const std::string& subfolder, CatalogDone done = {});
  std::vector<SampleRecord> aggregateSamples(const Catalog& catalog) const;

  void extractReport(const std::string& key, Done<ExtractionResult> done);
  void previewReport(const std::string& key, Done<std::string> done);
  void download(const std::string& key, Done<std::string> done);

  // Synchronous; signing is offline.
  Outcome<std::string> sign(const std::string& key);
  std::string rewriteMarkup(const std::string& key, const std::string& html) const;

  void selectKey(const std::string& key) { coordinator_.selectKey(key); }
  void selectRow(size_t row) { coordinator_.selectRow(row); }

  RefreshCoordinator& coordinator() { return coordinator_; }
  const TableRenderer& renderer() const { return *renderer_; }
  const LocalFSBackend& files() const { return fs_; }
  const std::string& bucket() const { return bucket_; }

private:
  // Explicit key, else the selection; throws InvalidRequestError.
  std::string resolveKey(const std::string& key, const char* nothingSelected) const;

  template <typename T, typename Work, typename Then>
  void offload(Work work, Then then);

  // Records `f` as the status and hands it to `done` without touching the workers.
  template <typename T>
  void failEarly(const Failure& f, const std::string& doing, const std::string& verb, const Done<T>& done);

  ObjectStoreClient& store_;
  RefreshCoordinator& coordinator_;
  Scheduler& loop_;
  Executor& workers_;
  std::string bucket_;

  LocalFSBackend fs_;
  UrlSigner signer_;
  AssetRewriter rewriter_;
  ArchiveExtractor extractor_;
  std::unique_ptr<TableRenderer> renderer_;
  uint64_t maxDownloadBytes_;
};

} // namespace rsb
