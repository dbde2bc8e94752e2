#include <catch2/catch.hpp>

#include <fstream>
#include <sstream>

#include "core/catalog/CatalogFetcher.hpp"
#include "core/util/Errors.hpp"
#include "services/browser/BrowserService.hpp"
#include "support/FakeObjectStore.hpp"
#include "support/ManualExecutor.hpp"
#include "support/TempDir.hpp"
#include "support/ZipBuilder.hpp"

using namespace rsb;
using rsb::test::FakeObjectStore;
using rsb::test::ManualExecutor;
using rsb::test::ManualScheduler;
using rsb::test::TempDir;
using rsb::test::ZipBuilder;
using rsb::test::drain;
using Catch::Matchers::Contains;
using Catch::Matchers::StartsWith;
namespace fs = std::filesystem;

namespace {

const std::string kHtml = "vendor-data/Alpha/FastQC/S1_fastqc.html";
const std::string kZip = "vendor-data/Alpha/FastQC/S1_fastqc.zip";
const std::string kFastq = "vendor-data/Alpha/Fastq/S1_R1.fq.gz";

std::string slurp(const fs::path& p) {
  std::ifstream in(p, std::ios::binary);
  std::ostringstream ss;
  ss << in.rdbuf();
  return ss.str();
}

AppConfig config_in(const TempDir& tmp) {
  AppConfig c;
  c.bucket = "rnaseqdatabase";
  c.web_root = (tmp / "www").string();
  c.download_dir = (tmp / "dl").string();
  c.max_archive_bytes = 1 << 20;
  return c;
}

CoordinatorSettings settings_of(const AppConfig& c) {
  CoordinatorSettings s;
  s.bucket = c.bucket;
  s.base_prefix = c.base_prefix;
  s.max_objects = c.max_objects;
  return s;
}

struct Fixture {
  Fixture() {
    store.put(kHtml, "<html><body><img src=\"Images/per_base_quality.png\">caf\xc3\xa9 \xff</body></html>", 300);
    store.put(kZip, ZipBuilder()
                      .add("S1_fastqc/fastqc_report.html", "<html>zipped</html>", true)
                      .add("S1_fastqc/Images/per_base_quality.png", "PNG")
                      .build(), 200);
    store.put(kFastq, "@r1\nACGT\n+\nFFFF\n", 100);
  }

  void listAlpha() {
    REQUIRE(browser.listObjects("Alpha", "(project root)"));
    drain(loop, workers);
    REQUIRE(coord.catalog());
  }

  TempDir tmp;
  AppConfig cfg = config_in(tmp);
  FakeObjectStore store;
  CatalogFetcher fetcher{store};
  ManualScheduler loop;
  ManualExecutor workers;
  RefreshCoordinator coord{fetcher, loop, workers, settings_of(cfg)};
  BrowserService browser{cfg, store, coord, loop, workers};
};

} // namespace

TEST_CASE("Subfolder choices", "[browser]") {
  const auto& choices = BrowserService::subfolderChoices();
  REQUIRE(choices.size() == 6);
  CHECK(choices.front().first == "(project root)");
  CHECK(choices.front().second.empty());

  CHECK(BrowserService::subfolderValue("(project root)").empty());
  CHECK(BrowserService::subfolderValue("").empty());
  CHECK(BrowserService::subfolderValue("FastQC/") == "FastQC/");
  CHECK(BrowserService::subfolderValue("Salmon_Quant") == "Salmon_Quant/");
  CHECK_THROWS_AS(BrowserService::subfolderValue("Nope/"), InvalidRequestError);
}

TEST_CASE("Listing through the browser", "[browser]") {
  Fixture f;
  f.listAlpha();
  CHECK(f.coord.catalog()->size() == 3);
  CHECK(f.coord.catalog()->at(0).key == kHtml); // newest first
  CHECK(f.coord.status() == "3 objects found.");

  CHECK_THROWS_AS(f.browser.listObjects("Alpha", "Bogus/"), InvalidRequestError);
}

TEST_CASE("Preview writes the rewritten report under the web root", "[browser]") {
  Fixture f;
  f.listAlpha();
  f.browser.selectKey(kHtml);

  std::optional<Outcome<std::string>> got;
  f.browser.previewReport("", [&](const Outcome<std::string>& r) { got = r; });
  CHECK_FALSE(got); // nothing runs until the workers do
  drain(f.loop, f.workers);

  REQUIRE(got);
  REQUIRE(got->ok());
  const fs::path file = f.browser.files().previewPathFor(kHtml);
  CHECK(got->value() == f.browser.files().webPathOf(file));
  CHECK(f.coord.status() == "Wrote preview: " + got->value());

  const std::string written = slurp(file);
  CHECK_THAT(written, Contains("https://signed.test/vendor-data/Alpha/FastQC/Images/per_base_quality.png?ttl=3600"));
  CHECK(written.find('\xff') == std::string::npos);
}

TEST_CASE("Preview refuses anything but an html key", "[browser]") {
  Fixture f;
  std::optional<Outcome<std::string>> got;
  auto keep = [&](const Outcome<std::string>& r) { got = r; };

  SECTION("nothing selected") {
    f.browser.previewReport("", keep);
    REQUIRE(got);
    CHECK(got->error().kind == FailureKind::InvalidRequest);
    CHECK(f.coord.status() == "Select a FastQC .html file first.");
  }

  SECTION("zip key") {
    f.browser.previewReport(kZip, keep);
    REQUIRE(got);
    CHECK(f.coord.status() == "View FastQC only works for the .html report. Select a .html row.");
  }

  CHECK(f.workers.pending() == 0);
  CHECK(f.store.getCalls() == 0);
}

TEST_CASE("Preview reports store failures", "[browser]") {
  Fixture f;
  f.store.failGets("AccessDenied", "Access Denied");
  std::optional<Outcome<std::string>> got;
  f.browser.previewReport(kHtml, [&](const Outcome<std::string>& r) { got = r; });
  drain(f.loop, f.workers);

  REQUIRE(got);
  REQUIRE_FALSE(got->ok());
  CHECK(got->error().kind == FailureKind::Store);
  CHECK(f.coord.status() == "AWS error opening FastQC: AccessDenied — Access Denied");
  CHECK_FALSE(fs::exists(f.browser.files().previewPathFor(kHtml)));
}

TEST_CASE("Extracting a report archive", "[browser]") {
  Fixture f;
  std::optional<Outcome<ExtractionResult>> got;
  auto keep = [&](const Outcome<ExtractionResult>& r) { got = r; };

  f.browser.extractReport(kZip, keep);
  drain(f.loop, f.workers);
  REQUIRE(got);
  REQUIRE(got->ok());
  CHECK(got->value().report_path == "S1_fastqc/fastqc_report.html");
  CHECK(f.coord.status() == "Extracted 2 file(s): " + got->value().web_path);

  got.reset();
  f.browser.extractReport(kZip, keep);
  drain(f.loop, f.workers);
  REQUIRE(got);
  CHECK(got->value().reused);
  CHECK(f.coord.status() == "Report already extracted: " + got->value().web_path);

  SECTION("html key is refused") {
    got.reset();
    f.browser.extractReport(kHtml, keep);
    REQUIRE(got);
    CHECK_FALSE(got->ok());
    CHECK(f.coord.status() == "Extract only works for a .zip archive. Select a .zip row.");
  }
}

TEST_CASE("Extraction of a corrupt archive fails cleanly", "[browser]") {
  Fixture f;
  f.store.put("vendor-data/Alpha/FastQC/bad.zip", "not a zip at all, just text padding to length");
  std::optional<Outcome<ExtractionResult>> got;
  f.browser.extractReport("vendor-data/Alpha/FastQC/bad.zip", [&](const Outcome<ExtractionResult>& r) { got = r; });
  drain(f.loop, f.workers);

  REQUIRE(got);
  REQUIRE_FALSE(got->ok());
  CHECK(got->error().kind == FailureKind::MalformedArchive);
  CHECK_THAT(f.coord.status(), StartsWith("Failed to extract report: "));
}

TEST_CASE("Downloading the selected object", "[browser]") {
  Fixture f;
  f.listAlpha();
  f.browser.selectRow(2); // oldest: the fastq

  std::optional<Outcome<std::string>> got;
  f.browser.download("", [&](const Outcome<std::string>& r) { got = r; });
  drain(f.loop, f.workers);

  REQUIRE(got);
  REQUIRE(got->ok());
  const fs::path dest = f.cfg.download_dir + "/vendor-data__Alpha__Fastq__S1_R1.fq.gz";
  CHECK(fs::path(got->value()).filename() == dest.filename());
  CHECK(slurp(dest) == "@r1\nACGT\n+\nFFFF\n");
  CHECK(f.coord.status() == "Downloaded to " + got->value());
}

TEST_CASE("Signing", "[browser]") {
  Fixture f;

  SECTION("nothing selected") {
    const auto r = f.browser.sign("");
    REQUIRE_FALSE(r.ok());
    CHECK(f.coord.status() == "Select a row first.");
  }

  SECTION("selected key") {
    f.listAlpha();
    f.browser.selectKey(kFastq);
    const auto r = f.browser.sign("");
    REQUIRE(r.ok());
    CHECK(r.value() == "https://signed.test/" + kFastq + "?ttl=3600");
    CHECK(f.coord.status() == "Signed URL ready.");
  }

  SECTION("explicit key wins over the selection") {
    f.listAlpha();
    f.browser.selectKey(kFastq);
    const auto r = f.browser.sign(kHtml);
    REQUIRE(r.ok());
    CHECK_THAT(r.value(), Contains("S1_fastqc.html"));
  }
}

TEST_CASE("Renderer follows the configured view", "[browser]") {
  Fixture f;
  CHECK(std::string(f.browser.renderer().contentType()) == "application/json");

  TempDir tmp;
  AppConfig html = config_in(tmp);
  html.table_view = TableView::Html;
  BrowserService b(html, f.store, f.coord, f.loop, f.workers);
  CHECK(std::string(b.renderer().contentType()) == "text/html; charset=utf-8");
}
