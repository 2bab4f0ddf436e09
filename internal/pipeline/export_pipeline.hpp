#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "config/config.pb.h"
#include "internal/merge/duplicate_merger.hpp"
#include "internal/model/rank_summary.hpp"
#include "internal/model/sketch_record.hpp"
#include "internal/summary/rank_summarizer.hpp"

namespace hashtax::pipeline {

struct ExportRequest {
  std::vector<std::string> inputs;
  std::string              output;

  // empty: taxonomy.path from the config, or no taxonomy
  std::string taxonomy_path;
  // empty: no summary artifact
  std::string lca_info_path;

  bool names_only = false;
};

struct ExportResult {
  std::size_t input_rows  = 0;
  std::size_t output_rows = 0;

  merge::MergeStats                  merge_stats;
  std::vector<model::RankSummaryRow> summary;
};

/*
  ExportPipeline

  Composition root of the tool: reads the per-source sketch tables,
  annotates them with taxonomy, merges duplicate hashes per source and
  globally, and writes the merged table and the rank summary.
*/
class ExportPipeline {
 public:
  explicit ExportPipeline(hashtax::runtime::config::RuntimeConfig config);

  ExportResult Run(const ExportRequest& request) const;

  // Merge a single table, the same way Run merges each source.
  std::vector<model::SketchRecord> Merge(const std::string& input, const std::string& output) const;

  // Rank summary of already merged tables, one source per input file.
  std::vector<model::RankSummaryRow> Summarize(const std::vector<std::string>& inputs, const std::string& output) const;

  std::vector<model::KsizeRankRow> KsizeRanks(const std::vector<std::string>& inputs, const std::string& output) const;

 private:
  summary::SourceTables LoadSources(const std::vector<std::string>& inputs) const;

  hashtax::runtime::config::RuntimeConfig config_;
};

// Default output name for an export whose caller gave none.
std::string DefaultOutputPath(const std::string& first_input);

} // namespace hashtax::pipeline
