#include "internal/merge/duplicate_merger.hpp"

#include <unordered_map>
#include <utility>

#include "internal/taxonomy/lca_resolver.hpp"

namespace hashtax::merge {

using model::HashKey;
using model::HashKeyHasher;
using model::SketchRecord;

// ------------------------------------------------------------
// GroupAccumulator
// ------------------------------------------------------------

void GroupAccumulator::Add(const SketchRecord& record) {
  ++rows_;

  dataset_names_.insert(record.dataset_names.begin(), record.dataset_names.end());

  if (record.taxonomy_list) {
    taxonomies_.insert(taxonomies_.end(), record.taxonomy_list->begin(), record.taxonomy_list->end());
  }

  sources_.insert(record.source);
  scaled_values_.insert(record.scaled);
}

SketchRecord GroupAccumulator::Finish() const {
  SketchRecord merged;
  merged.hash  = key_.hash;
  merged.ksize = key_.ksize;

  // conflicting values leave scaled null
  if (scaled_values_.size() == 1) {
    merged.scaled = *scaled_values_.begin();
  }

  merged.dataset_names.assign(dataset_names_.begin(), dataset_names_.end());

  if (!taxonomies_.empty()) {
    merged.taxonomy_list = taxonomies_;

    auto lca           = taxonomy::ComputeLca(taxonomies_);
    merged.lca_lineage = std::move(lca.lineage);
    merged.lca_rank    = std::move(lca.rank_code);
  }

  for (const auto& source : sources_) {
    if (!merged.source.empty()) merged.source.push_back(';');
    merged.source += source;
  }

  return merged;
}

// ------------------------------------------------------------
// MergeDuplicates
// ------------------------------------------------------------

std::vector<SketchRecord> MergeDuplicates(const std::vector<SketchRecord>& records, MergeStats* stats) {
  std::unordered_map<HashKey, std::size_t, HashKeyHasher> occurrences;
  occurrences.reserve(records.size());
  for (const auto& record : records) {
    ++occurrences[model::KeyOf(record)];
  }

  std::vector<SketchRecord> output;
  output.reserve(occurrences.size());

  std::unordered_map<HashKey, std::size_t, HashKeyHasher> group_index;
  std::vector<GroupAccumulator>                           groups;
  std::size_t                                             duplicated_rows = 0;

  for (const auto& record : records) {
    const auto key = model::KeyOf(record);
    if (occurrences[key] == 1) {
      output.push_back(record);
      continue;
    }

    ++duplicated_rows;
    auto [it, inserted] = group_index.try_emplace(key, groups.size());
    if (inserted) {
      groups.emplace_back(key);
    }
    groups[it->second].Add(record);
  }

  const std::size_t unique_rows = output.size();
  for (const auto& group : groups) {
    output.push_back(group.Finish());
  }

  if (stats) {
    stats->duplicated_rows = duplicated_rows;
    stats->unique_rows     = unique_rows;
    stats->merged_groups   = groups.size();
  }

  return output;
}

} // namespace hashtax::merge
