#include "internal/summary/rank_summarizer.hpp"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <unordered_map>
#include <utility>

#include "internal/taxonomy/lineage.hpp"

namespace hashtax::summary {

using model::KsizeRankRow;
using model::RankSummaryRow;
using model::SketchRecord;

namespace {

// Synthetic buckets sort after the real ranks.
std::size_t BucketOrder(const std::string& bucket) {
  const auto index = taxonomy::RankIndex(bucket);
  if (index < taxonomy::kRanks.size()) return index;
  if (bucket == model::kUnrankedBucket) return taxonomy::kRanks.size();
  if (bucket == model::kNoConsensusBucket) return taxonomy::kRanks.size() + 1;
  if (bucket == model::kUnclassifiedBucket) return taxonomy::kRanks.size() + 2;
  return taxonomy::kRanks.size() + 3;
}

struct BucketCounts {
  std::unordered_map<std::string, std::uint64_t> counts;
  std::uint64_t                                  total = 0;

  void Add(const std::string& bucket, std::uint64_t n = 1) {
    counts[bucket] += n;
    total += n;
  }

  std::vector<std::pair<std::string, std::uint64_t>> Ordered() const {
    std::vector<std::pair<std::string, std::uint64_t>> ordered(counts.begin(), counts.end());
    std::sort(ordered.begin(), ordered.end(), [](const auto& a, const auto& b) {
      const auto oa = BucketOrder(a.first);
      const auto ob = BucketOrder(b.first);
      return oa != ob ? oa < ob : a.first < b.first;
    });
    return ordered;
  }
};

void EmitRows(const std::string& source, const BucketCounts& buckets, std::vector<RankSummaryRow>* rows) {
  for (const auto& [rank, count] : buckets.Ordered()) {
    if (count == 0) continue;
    rows->push_back({source, rank, count, Percent(count, buckets.total)});
  }
}

bool HasTaxonomy(const SketchRecord& record) {
  return (record.taxonomy_list && !record.taxonomy_list->empty()) || record.lca_lineage.has_value();
}

} // namespace

std::string RankBucketFor(const SketchRecord& record) {
  if (!HasTaxonomy(record)) {
    return model::kUnclassifiedBucket;
  }

  if (record.lca_rank) {
    if (auto name = taxonomy::CanonicalRankName(*record.lca_rank)) {
      return std::string(*name);
    }
    return model::kUnrankedBucket;
  }

  if (record.lca_lineage) {
    return model::kUnrankedBucket;
  }
  return model::kNoConsensusBucket;
}

double Percent(std::uint64_t count, std::uint64_t total) {
  if (total == 0) return 0.0;
  const double raw = 100.0 * static_cast<double>(count) / static_cast<double>(total);
  return std::round(raw * 100.0) / 100.0;
}

// ------------------------------------------------------------
// SummarizeRanks
// ------------------------------------------------------------

std::vector<RankSummaryRow> SummarizeRanks(const SourceTables& tables) {
  std::vector<RankSummaryRow> rows;
  BucketCounts                combined;

  for (const auto& [source, records] : tables) {
    BucketCounts buckets;
    for (const auto& record : records) {
      buckets.Add(RankBucketFor(record));
    }

    EmitRows(source, buckets, &rows);

    for (const auto& [rank, count] : buckets.counts) {
      combined.Add(rank, count);
    }
  }

  EmitRows(model::kCombinedSource, combined, &rows);
  return rows;
}

// ------------------------------------------------------------
// SummarizeRanksByKsize
// ------------------------------------------------------------

std::vector<KsizeRankRow> SummarizeRanksByKsize(const std::vector<SketchRecord>& records) {
  std::map<std::uint32_t, BucketCounts> per_ksize;

  for (const auto& record : records) {
    if (!record.lca_rank) continue;
    auto name = taxonomy::CanonicalRankName(*record.lca_rank);
    per_ksize[record.ksize].Add(name ? std::string(*name) : *record.lca_rank);
  }

  std::vector<KsizeRankRow> rows;
  for (const auto& [ksize, buckets] : per_ksize) {
    for (const auto& [rank, count] : buckets.Ordered()) {
      rows.push_back({ksize, rank, count, Percent(count, buckets.total)});
    }
  }
  return rows;
}

// ------------------------------------------------------------
// FormatRankSummary
// ------------------------------------------------------------

std::vector<std::string> FormatRankSummary(const std::vector<RankSummaryRow>& rows, const std::string& source) {
  std::vector<std::string> lines;
  std::uint64_t            total = 0;

  for (const auto& row : rows) {
    if (row.source != source) continue;

    char percent[32];
    std::snprintf(percent, sizeof(percent), "%.2f", row.percent);
    lines.push_back(row.rank + ": " + std::to_string(row.count) + " (" + percent + "%)");
    total += row.count;
  }

  lines.push_back("Total hashes: " + std::to_string(total));
  return lines;
}

} // namespace hashtax::summary
