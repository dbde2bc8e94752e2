#include <catch2/catch.hpp>

#include <nlohmann/json.hpp>

#include "services/view/TableRenderer.hpp"

using namespace rsb;
using Catch::Matchers::Contains;

namespace {

std::vector<ObjectRecord> rows() {
  return {
    ObjectRecord{"p/<script>.html", 2048, 1709296245, std::string("STANDARD")},
    ObjectRecord{"p/bare", std::nullopt, std::nullopt, std::nullopt},
  };
}

} // namespace

TEST_CASE("Renderer chosen from configuration", "[view]") {
  CHECK(dynamic_cast<HtmlTableRenderer*>(make_renderer(TableView::Html).get()) != nullptr);
  CHECK(dynamic_cast<JsonGridRenderer*>(make_renderer(TableView::Grid).get()) != nullptr);
}

TEST_CASE("Html table", "[view]") {
  HtmlTableRenderer html;
  const std::string out = html.renderObjects(rows());
  CHECK_THAT(out, Contains("<th>0</th><td>p/&lt;script&gt;.html</td><td>2.00 KB</td>"
                           "<td>2024-03-01 12:30:45 UTC</td><td>STANDARD</td>"));
  CHECK_THAT(out, Contains("<th>1</th><td>p/bare</td><td></td><td></td><td></td>"));
  CHECK(html.renderObjects({}) == "<em>No objects</em>");
  CHECK(HtmlTableRenderer::escape("a&b\"c'") == "a&amp;b&quot;c&#39;");

  SampleRecord s;
  s.sample_id = "S1";
  s.complete = true;
  s.has_quant = true;
  s.file_count = 3;
  CHECK_THAT(html.renderSamples({s}), Contains("<td>S1</td><td>yes</td><td>yes</td><td></td>"));
}

TEST_CASE("Json grid", "[view]") {
  JsonGridRenderer grid;
  const auto j = nlohmann::json::parse(grid.renderObjects(rows()));
  REQUIRE(j["rows"].size() == 2);
  CHECK(j["rows"][0]["key"] == "p/<script>.html");
  CHECK(j["rows"][0]["size"] == "2.00 KB");
  CHECK(j["rows"][0]["size_bytes"] == 2048);
  CHECK(j["rows"][0]["last_modified"] == "2024-03-01 12:30:45 UTC");
  CHECK(j["rows"][1]["size"] == "");
  CHECK(j["rows"][1]["size_bytes"].is_null());
  CHECK(j["rows"][1]["storage_class"].is_null());

  SampleRecord s;
  s.sample_id = "S1";
  s.has_log = true;
  const auto js = nlohmann::json::parse(grid.renderSamples({s}));
  CHECK(js["rows"][0]["sample"] == "S1");
  CHECK(js["rows"][0]["log"] == true);
  CHECK(js["rows"][0]["complete"] == false);
  CHECK(js["rows"][0]["last_modified"].is_null());
}
