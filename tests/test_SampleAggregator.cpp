#include <catch2/catch.hpp>

#include <algorithm>
#include <random>

#include "core/catalog/SampleAggregator.hpp"

using namespace rsb;

static ObjectRecord rec(const std::string& key, std::optional<int64_t> modified = std::nullopt) {
  return ObjectRecord{key, 1, modified, std::nullopt};
}

TEST_CASE("Sample id extraction", "[samples]") {
  CHECK(sample_id_for("proj/Salmon_Quant/S1/quant.sf") == std::string("S1"));
  CHECK(sample_id_for("proj/Salmon_Quant/S1/logs/salmon_quant.log") == std::string("S1"));
  CHECK(sample_id_for("proj/Salmon_Quant/S1.done") == std::string("S1"));

  // Directory pattern wins: "S2.done" here is a directory name.
  CHECK(sample_id_for("proj/Salmon_Quant/S2.done/quant.sf") == std::string("S2.done"));

  CHECK_FALSE(sample_id_for("proj/FastQC/S1_fastqc.html"));
  CHECK_FALSE(sample_id_for("proj/Salmon_Quant/summary.txt"));
  CHECK_FALSE(sample_id_for("proj/Salmon_Quant/.done"));
  CHECK_FALSE(sample_id_for("proj/Salmon_Quant/S1/"));

  SampleLayout custom;
  custom.sample_dir = "quant";
  CHECK(sample_id_for("proj/quant/S9/quant.sf", custom) == std::string("S9"));
  CHECK_FALSE(sample_id_for("proj/Salmon_Quant/S9/quant.sf", custom));
}

TEST_CASE("Sample aggregation scenario", "[samples]") {
  const std::vector<ObjectRecord> rows = {
    rec("proj/Salmon_Quant/S1/quant.sf", 10),
    rec("proj/Salmon_Quant/S1/logs/salmon_quant.log", 30),
    rec("proj/Salmon_Quant/S1.done", 20),
  };

  const auto samples = aggregate_samples(rows);
  REQUIRE(samples.size() == 1);
  const SampleRecord& s = samples[0];
  CHECK(s.sample_id == "S1");
  CHECK(s.complete);
  CHECK(s.has_quant);
  CHECK(s.has_log);
  CHECK_FALSE(s.has_meta);
  CHECK_FALSE(s.has_gene_quant);
  CHECK(s.file_count == 3);
  CHECK(s.latest_modified == 30);
}

TEST_CASE("Sample aggregation flags, exclusion and order", "[samples]") {
  const std::vector<ObjectRecord> rows = {
    rec("proj/Salmon_Quant/B/quant.genes.sf"),
    rec("proj/Salmon_Quant/B/aux_info/meta_info.json"),
    rec("proj/Salmon_Quant/A/quant.sf"),
    rec("proj/Salmon_Quant/Z/quant.sf"),
    rec("proj/Salmon_Quant/Z.done"),
    rec("proj/Salmon_Quant/Empty/aux_info/fld.gz"),
    rec("proj/Salmon_Quant/Empty/cmd_info.json"),
    rec("proj/FastQC/A_fastqc.zip"),
  };

  const auto samples = aggregate_samples(rows);
  REQUIRE(samples.size() == 3);

  // Complete first, then by id.
  CHECK(samples[0].sample_id == "Z");
  CHECK(samples[0].complete);
  CHECK(samples[1].sample_id == "A");
  CHECK(samples[2].sample_id == "B");

  CHECK(samples[2].has_gene_quant);
  CHECK(samples[2].has_meta);
  CHECK_FALSE(samples[2].has_quant);
  CHECK_FALSE(samples[2].latest_modified.has_value());

  // "Empty" only has files no flag recognizes.
  for (const auto& s : samples) CHECK(s.sample_id != "Empty");
}

TEST_CASE("Sample aggregation ignores input order", "[samples]") {
  std::vector<ObjectRecord> rows;
  for (int i = 0; i < 40; ++i) {
    const std::string id = "S" + std::to_string(i);
    rows.push_back(rec("proj/Salmon_Quant/" + id + "/quant.sf", i));
    if (i % 2 == 0) rows.push_back(rec("proj/Salmon_Quant/" + id + ".done", 100 + i));
    if (i % 3 == 0) rows.push_back(rec("proj/Salmon_Quant/" + id + "/logs/salmon_quant.log", 50));
    if (i % 5 == 0) rows.push_back(rec("proj/Salmon_Quant/" + id + "/aux_info/meta_info.json"));
  }
  rows.push_back(rec("proj/Fastq/S1_R1.fastq.gz", 7));

  const auto expected = aggregate_samples(rows);
  REQUIRE(expected.size() == 40);

  std::mt19937 rng(1234);
  for (int round = 0; round < 10; ++round) {
    std::shuffle(rows.begin(), rows.end(), rng);
    CHECK(aggregate_samples(rows) == expected);
  }
}

TEST_CASE("Sample aggregation over an empty catalog", "[samples]") {
  CHECK(aggregate_samples(Catalog{}).empty());
}
