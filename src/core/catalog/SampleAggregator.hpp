#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "Catalog.hpp"

namespace rsb {

// Completeness view of one sample, derived from the catalog.
struct SampleRecord {
  std::string sample_id;
  bool complete = false;        // terminal "<sample>.done" marker seen
  bool has_quant = false;       // quant.sf
  bool has_gene_quant = false;  // quant.genes.sf
  bool has_log = false;         // *.log
  bool has_meta = false;        // meta_info.json
  size_t file_count = 0;
  std::optional<int64_t> latest_modified;

  bool operator==(const SampleRecord& o) const;
};

// File names the pipeline writes for each sample.
struct SampleLayout {
  std::string sample_dir = "Salmon_Quant";
  std::string done_suffix = ".done";
  std::string quant_file = "quant.sf";
  std::string gene_quant_file = "quant.genes.sf";
  std::string log_suffix = ".log";
  std::string meta_file = "meta_info.json";
};

// Sample id for a key, or nullopt when the key is outside the sample area.
// "<...>/Salmon_Quant/<id>/<...>" wins over "<...>/Salmon_Quant/<id>.done".
std::optional<std::string> sample_id_for(const std::string& key, const SampleLayout& layout = {});

// Pure; same output for any ordering of the input rows. Complete samples
// first, then by id. Samples without a single known artifact are dropped.
std::vector<SampleRecord> aggregate_samples(const std::vector<ObjectRecord>& records,
                                            const SampleLayout& layout = {});

inline std::vector<SampleRecord> aggregate_samples(const Catalog& catalog,
                                                   const SampleLayout& layout = {}) {
  return aggregate_samples(catalog.records(), layout);
}

} // namespace rsb
