#include "RefreshCoordinator.hpp"

#include "core/catalog/CatalogFetcher.hpp"
#include "core/util/Errors.hpp"
#include "services/Failures.hpp"

#include <spdlog/spdlog.h>
#include <algorithm>

namespace rsb {

const char* to_string(FetchPhase phase) {
  switch (phase) {
    case FetchPhase::Idle:     return "idle";
    case FetchPhase::Fetching: return "fetching";
    case FetchPhase::Errored:  return "errored";
  }
  return "idle";
}

RefreshCoordinator::RefreshCoordinator(const CatalogFetcher& fetcher, Scheduler& loop, Executor& workers,
                                       CoordinatorSettings settings)
  : fetcher_(fetcher), loop_(loop), workers_(workers), settings_(std::move(settings)) {}

std::optional<std::string> RefreshCoordinator::retainPreferred(const std::optional<std::string>& preferred,
                                                               const ProjectList& projects) {
  if (projects.empty()) return std::nullopt;
  if (preferred && std::find(projects.begin(), projects.end(), *preferred) != projects.end()) {
    return preferred;
  }
  return projects.front();
}

// ---------- project list ----------

bool RefreshCoordinator::refreshProjects(ProjectsDone done) {
  if (projectStream_.phase == FetchPhase::Fetching) {
    spdlog::debug("project refresh ignored, already fetching");
    return false;
  }
  projectStream_.phase = FetchPhase::Fetching;

  const std::string bucket = settings_.bucket;
  const std::string base = settings_.base_prefix;
  spdlog::info("refreshing projects under s3://{}/{}", bucket, base);

  workers_.post([this, bucket, base, done = std::move(done)] {
    auto result = capture([&] {
      return std::make_shared<const ProjectList>(fetcher_.listProjects(bucket, base));
    });
    loop_.post([this, result = std::move(result), done] { onProjectsFetched(result, done); });
  });
  return true;
}

void RefreshCoordinator::onProjectsFetched(const Outcome<std::shared_ptr<const ProjectList>>& result,
                                           const ProjectsDone& done) {
  if (result.ok()) {
    projects_ = result.value();
    projectStream_.phase = FetchPhase::Idle;
    projectStream_.last_error.reset();
    ++projectStream_.generation;
    preferred_ = retainPreferred(preferred_, *projects_);
    status_ = "Projects loaded.";
  } else {
    projectStream_.phase = FetchPhase::Errored;
    projectStream_.last_error = result.error();
    status_ = status_line(result.error(), "loading projects", "load projects");
    spdlog::error("project refresh failed: {}", result.error().describe());
  }
  if (done) done(result);
}

// ---------- object list ----------

bool RefreshCoordinator::refreshObjects(CatalogDone done) {
  if (objectStream_.phase == FetchPhase::Fetching) {
    spdlog::debug("object refresh ignored, already fetching");
    return false;
  }
  if (!preferred_) {
    spdlog::debug("object refresh ignored, no project selected");
    return false;
  }
  objectStream_.phase = FetchPhase::Fetching;

  const std::string bucket = settings_.bucket;
  const std::string prefix = project_prefix(settings_.base_prefix, *preferred_, subfolder_);
  const size_t cap = settings_.max_objects;
  spdlog::info("listing s3://{}/{} (cap {})", bucket, prefix, cap);

  workers_.post([this, bucket, prefix, cap, done = std::move(done)] {
    auto result = capture([&] {
      return std::make_shared<const Catalog>(fetcher_.fetch(bucket, prefix, cap));
    });
    loop_.post([this, result = std::move(result), done] { onObjectsFetched(result, done); });
  });
  return true;
}

void RefreshCoordinator::onObjectsFetched(const Outcome<std::shared_ptr<const Catalog>>& result,
                                          const CatalogDone& done) {
  if (result.ok()) {
    catalog_ = result.value();
    objectStream_.phase = FetchPhase::Idle;
    objectStream_.last_error.reset();
    ++objectStream_.generation;
    selectedKey_.reset();
    status_ = std::to_string(catalog_->size()) + " objects found.";
  } else {
    objectStream_.phase = FetchPhase::Errored;
    objectStream_.last_error = result.error();
    status_ = status_line(result.error(), "listing objects", "list objects");
    spdlog::error("object listing failed: {}", result.error().describe());
  }
  if (done) done(result);
}

bool RefreshCoordinator::selectProject(const std::string& project, CatalogDone done) {
  return listObjects(project, subfolder_, std::move(done));
}

bool RefreshCoordinator::selectSubfolder(const std::string& subfolder, CatalogDone done) {
  if (!preferred_) return false;
  return listObjects(*preferred_, subfolder, std::move(done));
}

bool RefreshCoordinator::listObjects(const std::string& project, const std::string& subfolder,
                                     CatalogDone done) {
  if (project.empty()) throw InvalidRequestError("Select a project first.");
  // A busy stream drops the request whole, selection included.
  if (objectStream_.phase == FetchPhase::Fetching) return false;
  preferred_ = project;
  subfolder_ = subfolder;
  return refreshObjects(std::move(done));
}

// ---------- polling ----------

void RefreshCoordinator::startPolling(std::chrono::milliseconds interval) {
  pollInterval_ = std::max(interval, settings_.min_poll_interval);
  polling_ = true;
  spdlog::info("polling every {} ms", pollInterval_.count());
  scheduleTick(++pollGeneration_);
}

void RefreshCoordinator::stopPolling() {
  polling_ = false;
  ++pollGeneration_;
}

void RefreshCoordinator::scheduleTick(uint64_t gen) {
  loop_.postDelayed(pollInterval_, [this, gen] { onTick(gen); });
}

void RefreshCoordinator::onTick(uint64_t gen) {
  if (!polling_ || gen != pollGeneration_) return;
  if (objectStream_.phase == FetchPhase::Fetching || !preferred_) {
    scheduleTick(gen);
    return;
  }
  refreshObjects([this, gen](const Outcome<std::shared_ptr<const Catalog>>&) {
    if (polling_ && gen == pollGeneration_) scheduleTick(gen);
  });
}

// ---------- derived views ----------

std::shared_ptr<const std::vector<SampleRecord>> RefreshCoordinator::samples() {
  if (!catalog_) {
    static const auto empty = std::make_shared<const std::vector<SampleRecord>>();
    return empty;
  }
  if (!samples_ || samplesGeneration_ != objectStream_.generation) {
    samples_ = std::make_shared<const std::vector<SampleRecord>>(aggregate_samples(*catalog_, settings_.layout));
    samplesGeneration_ = objectStream_.generation;
  }
  return samples_;
}

RefreshState RefreshCoordinator::refreshState() const {
  RefreshState s;
  s.fetching = projectStream_.phase == FetchPhase::Fetching || objectStream_.phase == FetchPhase::Fetching;
  s.last_error = objectStream_.last_error ? objectStream_.last_error : projectStream_.last_error;
  s.preferred_project = preferred_;
  return s;
}

// ---------- selection ----------

void RefreshCoordinator::selectKey(const std::string& key) {
  if (!catalog_ || !catalog_->find(key)) {
    status_ = "Unknown key: " + key;
    throw InvalidRequestError(status_);
  }
  selectedKey_ = key;
  status_ = "Selected " + key + ".";
}

void RefreshCoordinator::selectRow(size_t row) {
  if (!catalog_ || catalog_->empty()) {
    status_ = "No rows to pick. Click 'List objects' first.";
    throw InvalidRequestError(status_);
  }
  if (row >= catalog_->size()) {
    status_ = "Row out of range. Use 0 to " + std::to_string(catalog_->size() - 1) + ".";
    throw InvalidRequestError(status_);
  }
  selectedKey_ = catalog_->at(row).key;
  status_ = "Selected row " + std::to_string(row) + ".";
}

void RefreshCoordinator::setStatus(std::string message) {
  status_ = std::move(message);
}

} // namespace rsb
