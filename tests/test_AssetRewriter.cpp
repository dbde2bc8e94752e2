#include <catch2/catch.hpp>

#include "core/markup/AssetRewriter.hpp"
#include "core/store/UrlSigner.hpp"
#include "support/FakeObjectStore.hpp"

using namespace rsb;
using rsb::test::FakeObjectStore;
using Catch::Matchers::Contains;

namespace {

struct Fixture {
  FakeObjectStore store;
  UrlSigner signer{store, std::chrono::seconds(3600)};
  AssetRewriter rewriter{signer};
};

const std::string kSource = "proj/FastQC/sample_fastqc.html";

} // namespace

TEST_CASE("Asset rewriter signs relative image references", "[markup]") {
  Fixture f;
  const std::string html =
      "<html><body><h1>Report</h1><img src=\"Images/duplication_levels.png\" alt=\"dup\"></body></html>";

  const std::string out = f.rewriter.rewrite("b", kSource, html);
  CHECK_THAT(out, Contains("src=\"https://signed.test/proj/FastQC/Images/duplication_levels.png?ttl=3600\""));
  CHECK_THAT(out, Contains("alt=\"dup\""));
  CHECK_THAT(out, Contains("<h1>Report</h1>"));
  CHECK(f.store.presignCalls() == 1);

  SECTION("running it again changes nothing and signs nothing") {
    const std::string again = f.rewriter.rewrite("b", kSource, out);
    CHECK(again == out);
    CHECK(f.store.presignCalls() == 1);
  }
}

TEST_CASE("Asset rewriter leaves other references alone", "[markup]") {
  Fixture f;
  const std::string html =
      "<html><body>"
      "<a href=\"#M0\">Basic Statistics</a>"
      "<img src=\"https://example.org/logo.png\">"
      "<img src=\"Other/x.png\">"
      "<img src=\"/Images/abs.png\">"
      "</body></html>";

  CHECK(f.rewriter.rewrite("b", kSource, html) == html);
  CHECK(f.store.presignCalls() == 0);
}

TEST_CASE("Asset rewriter covers anchors, links, scripts and inline css", "[markup]") {
  Fixture f;
  const std::string html =
      "<html><head>"
      "<link rel=\"stylesheet\" href=\"Icons/style.css\">"
      "<script src=\"Icons/app.js\"></script>"
      "<style>.tick { background: url('Icons/tick.png'); }</style>"
      "</head><body>"
      "<a href=\"Images/per_base_quality.png\">full size</a>"
      "<div style=\"background-image: url(Icons/warning.png)\">w</div>"
      "<img src=\"Icons/tick.png\">"
      "</body></html>";

  const std::string out = f.rewriter.rewrite("b", kSource, html);
  CHECK_THAT(out, Contains("href=\"https://signed.test/proj/FastQC/Icons/style.css?ttl=3600\""));
  CHECK_THAT(out, Contains("src=\"https://signed.test/proj/FastQC/Icons/app.js?ttl=3600\""));
  CHECK_THAT(out, Contains("url('https://signed.test/proj/FastQC/Icons/tick.png?ttl=3600')"));
  CHECK_THAT(out, Contains("href=\"https://signed.test/proj/FastQC/Images/per_base_quality.png?ttl=3600\""));
  CHECK_THAT(out, Contains("url(https://signed.test/proj/FastQC/Icons/warning.png?ttl=3600)"));

  // tick.png appears twice but is signed once.
  CHECK(f.store.presignCalls() == 5);
}

TEST_CASE("Css url rewriting", "[markup]") {
  auto upper = [](const std::string& s) { return "<" + s + ">"; };
  CHECK(AssetRewriter::rewriteCssUrls("a{b:url(x.png)}", upper) == "a{b:url(<x.png>)}");
  CHECK(AssetRewriter::rewriteCssUrls("url( \"y.png\" ) url('z')", upper) == "url(\"<y.png>\") url('<z>')");
  CHECK(AssetRewriter::rewriteCssUrls("no urls here", upper) == "no urls here");
}

TEST_CASE("Parent prefix of a key", "[markup]") {
  CHECK(AssetRewriter::parentPrefix("proj/FastQC/x.html") == "proj/FastQC/");
  CHECK(AssetRewriter::parentPrefix("x.html") == "");
}
