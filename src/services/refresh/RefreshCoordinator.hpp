#pragma once
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "core/catalog/Catalog.hpp"
#include "core/catalog/SampleAggregator.hpp"
#include "core/util/Outcome.hpp"
#include "services/runtime/Executor.hpp"

namespace rsb {

class CatalogFetcher;

enum class FetchPhase { Idle, Fetching, Errored };
const char* to_string(FetchPhase phase);

// One logical stream (project list or object list).
struct StreamState {
  FetchPhase phase = FetchPhase::Idle;
  std::optional<Failure> last_error;
  uint64_t generation = 0; // bumped on every successful swap
};

struct RefreshState {
  bool fetching = false;
  std::optional<Failure> last_error;
  std::optional<std::string> preferred_project;
};

struct CoordinatorSettings {
  std::string bucket;
  std::string base_prefix;
  size_t max_objects = 5000;
  SampleLayout layout;
  std::chrono::milliseconds min_poll_interval{5000};
};

using ProjectList = std::vector<std::string>;
using ProjectsDone = std::function<void(const Outcome<std::shared_ptr<const ProjectList>>&)>;
using CatalogDone = std::function<void(const Outcome<std::shared_ptr<const Catalog>>&)>;

// Owns the catalog, the project list, the sample view and the selection.
// Every method runs on the orchestration scheduler; listings run on the
// worker executor and come back as one event that swaps state. A request
// while the same stream is fetching is dropped, not queued.
class RefreshCoordinator {
public:
  RefreshCoordinator(const CatalogFetcher& fetcher, Scheduler& loop, Executor& workers,
                     CoordinatorSettings settings);

  // Return false when the stream is already fetching (or nothing to fetch).
  bool refreshProjects(ProjectsDone done = {});
  bool refreshObjects(CatalogDone done = {});

  // Change notifications; each funnels into one refreshObjects().
  bool selectProject(const std::string& project, CatalogDone done = {});
  bool selectSubfolder(const std::string& subfolder, CatalogDone done = {});
  bool listObjects(const std::string& project, const std::string& subfolder, CatalogDone done = {});

  void startPolling(std::chrono::milliseconds interval);
  void stopPolling();
  bool polling() const { return polling_; }
  std::chrono::milliseconds pollInterval() const { return pollInterval_; }

  // Single selected key; whichever path sets it last wins.
  void selectKey(const std::string& key);
  void selectRow(size_t row);
  void clearSelection() { selectedKey_.reset(); }
  const std::optional<std::string>& selectedKey() const { return selectedKey_; }

  std::shared_ptr<const ProjectList> projects() const { return projects_; }
  std::shared_ptr<const Catalog> catalog() const { return catalog_; }
  std::shared_ptr<const std::vector<SampleRecord>> samples();

  const StreamState& projectStream() const { return projectStream_; }
  const StreamState& objectStream() const { return objectStream_; }
  RefreshState refreshState() const;

  const std::optional<std::string>& preferredProject() const { return preferred_; }
  const std::string& subfolder() const { return subfolder_; }
  const CoordinatorSettings& settings() const { return settings_; }

  const std::string& status() const { return status_; }
  void setStatus(std::string message);

  // Keep `preferred` if still listed, else the first project, else none.
  static std::optional<std::string> retainPreferred(const std::optional<std::string>& preferred,
                                                    const ProjectList& projects);

private:
  void onProjectsFetched(const Outcome<std::shared_ptr<const ProjectList>>& result, const ProjectsDone& done);
  void onObjectsFetched(const Outcome<std::shared_ptr<const Catalog>>& result, const CatalogDone& done);
  void scheduleTick(uint64_t gen);
  void onTick(uint64_t gen);

  const CatalogFetcher& fetcher_;
  Scheduler& loop_;
  Executor& workers_;
  CoordinatorSettings settings_;

  std::shared_ptr<const ProjectList> projects_;
  std::shared_ptr<const Catalog> catalog_;
  std::shared_ptr<const std::vector<SampleRecord>> samples_;
  uint64_t samplesGeneration_ = 0;

  StreamState projectStream_;
  StreamState objectStream_;
  std::optional<std::string> preferred_;
  std::string subfolder_;
  std::optional<std::string> selectedKey_;
  std::string status_ = "Ready.";

  bool polling_ = false;
  uint64_t pollGeneration_ = 0;
  std::chrono::milliseconds pollInterval_{0};
};

} // namespace rsb
