#include "BrowserService.hpp"

#include "core/store/ObjectStoreClient.hpp"
#include "core/util/Errors.hpp"
#include "core/util/Utf8.hpp"
#include "services/Failures.hpp"

#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>

namespace rsb {

// ---------- helpers ----------

namespace {

bool ends_with_ci(const std::string& s, const std::string& suffix) {
  if (s.size() < suffix.size()) return false;
  return std::equal(suffix.rbegin(), suffix.rend(), s.rbegin(), [](char a, char b) {
    return std::tolower(static_cast<unsigned char>(a)) == std::tolower(static_cast<unsigned char>(b));
  });
}

ExtractorOptions extractor_options(const AppConfig& cfg) {
  ExtractorOptions o;
  o.max_archive_bytes = cfg.max_archive_bytes;
  return o;
}

} // namespace

template <typename T, typename Work, typename Then>
void BrowserService::offload(Work work, Then then) {
  workers_.post([this, work = std::move(work), then = std::move(then)]() mutable {
    Outcome<T> result = capture(work);
    loop_.post([result = std::move(result), then = std::move(then)]() mutable { then(result); });
  });
}

template <typename T>
void BrowserService::failEarly(const Failure& f, const std::string& doing, const std::string& verb,
                               const Done<T>& done) {
  coordinator_.setStatus(f.kind == FailureKind::InvalidRequest ? f.message : status_line(f, doing, verb));
  if (done) done(Outcome<T>::failure(f));
}

BrowserService::BrowserService(const AppConfig& cfg, ObjectStoreClient& store, RefreshCoordinator& coordinator,
                               Scheduler& loop, Executor& workers)
  : store_(store),
    coordinator_(coordinator),
    loop_(loop),
    workers_(workers),
    bucket_(cfg.bucket),
    fs_(cfg.web_root, cfg.download_dir),
    signer_(store, cfg.presign_ttl),
    rewriter_(signer_),
    extractor_(store, fs_, extractor_options(cfg)),
    renderer_(make_renderer(cfg.table_view)),
    maxDownloadBytes_(cfg.max_archive_bytes) {}

const std::vector<std::pair<std::string, std::string>>& BrowserService::subfolderChoices() {
  static const std::vector<std::pair<std::string, std::string>> kChoices = {
    {"(project root)", ""},
    {"Fastq/", "Fastq/"},
    {"FastQC/", "FastQC/"},
    {"QC/", "QC/"},
    {"Salmon_Quant/", "Salmon_Quant/"},
    {"DESeq2/", "DESeq2/"},
  };
  return kChoices;
}

std::string BrowserService::subfolderValue(const std::string& choice) {
  for (const auto& c : subfolderChoices()) {
    if (choice == c.first || choice == c.second) return c.second;
    if (!c.second.empty() && choice + "/" == c.second) return c.second;
  }
  throw InvalidRequestError("Unknown subfolder '" + choice + "'.");
}

std::string BrowserService::resolveKey(const std::string& key, const char* nothingSelected) const {
  if (!key.empty()) return key;
  if (const auto& sel = coordinator_.selectedKey()) return *sel;
  throw InvalidRequestError(nothingSelected);
}

// ---------- listing ----------

bool BrowserService::refreshProjects(ProjectsDone done) {
  return coordinator_.refreshProjects(std::move(done));
}

bool BrowserService::listObjects(const std::string& project, const std::string& subfolder, CatalogDone done) {
  return coordinator_.listObjects(project, subfolderValue(subfolder), std::move(done));
}

std::vector<SampleRecord> BrowserService::aggregateSamples(const Catalog& catalog) const {
  return aggregate_samples(catalog, coordinator_.settings().layout);
}

// ---------- reports ----------

void BrowserService::extractReport(const std::string& key, Done<ExtractionResult> done) {
  std::string archive;
  try {
    archive = resolveKey(key, "Select a FastQC .zip file first.");
    if (!ends_with_ci(archive, ".zip")) {
      throw InvalidRequestError("Extract only works for a .zip archive. Select a .zip row.");
    }
  } catch (const InvalidRequestError&) {
    failEarly(failure_from(std::current_exception()), "extracting report", "extract report", done);
    return;
  }

  spdlog::info("extracting s3://{}/{}", bucket_, archive);
  offload<ExtractionResult>(
    [this, archive] { return extractor_.extract(bucket_, archive); },
    [this, done](const Outcome<ExtractionResult>& r) {
      if (r.ok()) {
        const auto& v = r.value();
        coordinator_.setStatus(v.reused ? "Report already extracted: " + v.web_path
                                        : "Extracted " + std::to_string(v.files_written) + " file(s): " + v.web_path);
      } else {
        coordinator_.setStatus(status_line(r.error(), "extracting report", "extract report"));
        spdlog::error("extraction failed: {}", r.error().describe());
      }
      if (done) done(r);
    });
}

void BrowserService::previewReport(const std::string& key, Done<std::string> done) {
  std::string page;
  try {
    page = resolveKey(key, "Select a FastQC .html file first.");
    if (!ends_with_ci(page, ".html")) {
      throw InvalidRequestError("View FastQC only works for the .html report. Select a .html row.");
    }
  } catch (const InvalidRequestError&) {
    failEarly(failure_from(std::current_exception()), "opening FastQC", "open FastQC", done);
    return;
  }

  offload<std::string>(
    [this, page] {
      const std::string html = to_valid_utf8(store_.getObject(bucket_, page, maxDownloadBytes_));
      const std::string rewritten = rewriter_.rewrite(bucket_, page, html);
      const auto file = fs_.previewPathFor(page);
      fs_.put(file, rewritten);
      return fs_.webPathOf(file);
    },
    [this, done](const Outcome<std::string>& r) {
      if (r.ok()) {
        coordinator_.setStatus("Wrote preview: " + r.value());
      } else {
        coordinator_.setStatus(status_line(r.error(), "opening FastQC", "open FastQC"));
        spdlog::error("preview failed: {}", r.error().describe());
      }
      if (done) done(r);
    });
}

std::string BrowserService::rewriteMarkup(const std::string& key, const std::string& html) const {
  return rewriter_.rewrite(bucket_, key, html);
}

// ---------- signing and downloads ----------

Outcome<std::string> BrowserService::sign(const std::string& key) {
  auto r = capture([&] { return signer_.sign(bucket_, resolveKey(key, "Select a row first.")); });
  if (r.ok()) {
    coordinator_.setStatus("Signed URL ready.");
  } else {
    const Failure& f = r.error();
    coordinator_.setStatus(f.kind == FailureKind::InvalidRequest ? f.message : status_line(f, "signing URL", "sign URL"));
    spdlog::error("signing failed: {}", f.describe());
  }
  return r;
}

void BrowserService::download(const std::string& key, Done<std::string> done) {
  std::string object;
  std::filesystem::path dest;
  try {
    object = resolveKey(key, "Select a row first.");
    dest = fs_.flatDownloadPathFor(object);
  } catch (const InvalidRequestError&) {
    failEarly(failure_from(std::current_exception()), "downloading", "download", done);
    return;
  }

  offload<std::string>(
    [this, object, dest] {
      store_.downloadToFile(bucket_, object, dest);
      return dest.string();
    },
    [this, done](const Outcome<std::string>& r) {
      if (r.ok()) {
        coordinator_.setStatus("Downloaded to " + r.value());
      } else {
        coordinator_.setStatus(status_line(r.error(), "downloading", "download"));
        spdlog::error("download failed: {}", r.error().describe());
      }
      if (done) done(r);
    });
}

} // namespace rsb
