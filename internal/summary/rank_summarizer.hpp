#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <vector>

#include "internal/model/rank_summary.hpp"
#include "internal/model/sketch_record.hpp"

namespace hashtax::summary {

// source identifier -> merged rows of that source
using SourceTables = std::map<std::string, std::vector<model::SketchRecord>>;

/*
  Bucket a merged row lands in: a rank name, or one of
  unclassified (no taxonomy at all), no_consensus (taxonomy present but
  lineages disagree at the domain) and unranked (LCA found, rank unknown).
*/
std::string RankBucketFor(const model::SketchRecord& record);

// 100 * count / total rounded to two decimals; 0 when total is 0.
double Percent(std::uint64_t count, std::uint64_t total);

/*
  Count / percent by rank for every source and for all sources together
  ("combined"). Source rows are concatenated for the combined buckets, not
  merged again. Empty buckets are omitted.
*/
std::vector<model::RankSummaryRow> SummarizeRanks(const SourceTables& tables);

/*
  Per-ksize rank distribution. Rows without an LCA rank are left out and
  percentages are relative to each ksize's remaining rows.
*/
std::vector<model::KsizeRankRow> SummarizeRanksByKsize(const std::vector<model::SketchRecord>& records);

/*
  Human readable lines for one source, e.g. "species: 23901 (99.96%)",
  closed by a "Total hashes: N" line.
*/
std::vector<std::string> FormatRankSummary(const std::vector<model::RankSummaryRow>& rows, const std::string& source);

} // namespace hashtax::summary
