#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "internal/model/sketch_record.hpp"

namespace hashtax::merge {

struct MergeStats {
  std::size_t duplicated_rows = 0;
  std::size_t unique_rows     = 0;
  std::size_t merged_groups   = 0;
};

/*
  Accumulates every row observed for one (hash, ksize) key.

  All updates are set unions, multiset appends or counts, so the order in
  which rows are added never changes the finished record.
*/
class GroupAccumulator {
 public:
  explicit GroupAccumulator(model::HashKey key) : key_(key) {
  }

  void Add(const model::SketchRecord& record);

  std::size_t Size() const {
    return rows_;
  }

  model::SketchRecord Finish() const;

 private:
  model::HashKey key_;
  std::size_t    rows_ = 0;

  std::set<std::string>                  dataset_names_;
  std::vector<std::string>               taxonomies_;
  std::set<std::string>                  sources_;
  std::set<std::optional<std::uint64_t>> scaled_values_;
};

/*
  Collapses rows sharing (hash, ksize) into a single row.

  Keys seen once pass through untouched and come first, in input order.
  Merged groups follow in order of first appearance.
*/
std::vector<model::SketchRecord> MergeDuplicates(const std::vector<model::SketchRecord>& records, MergeStats* stats = nullptr);

} // namespace hashtax::merge
