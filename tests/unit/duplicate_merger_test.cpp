#include "internal/merge/duplicate_merger.hpp"

#include <algorithm>
#include <cassert>
#include <iostream>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace {

using hashtax::merge::MergeDuplicates;
using hashtax::merge::MergeStats;
using hashtax::model::SketchRecord;

SketchRecord Row(std::uint64_t hash, std::uint32_t ksize, std::vector<std::string> names, std::string source,
                 std::optional<std::vector<std::string>> taxonomy = std::nullopt, std::optional<std::uint64_t> scaled = 1000) {
  SketchRecord record;
  record.hash          = hash;
  record.ksize         = ksize;
  record.scaled        = scaled;
  record.dataset_names = std::move(names);
  record.taxonomy_list = std::move(taxonomy);
  record.source        = std::move(source);
  return record;
}

const SketchRecord* FindKey(const std::vector<SketchRecord>& records, std::uint64_t hash, std::uint32_t ksize) {
  for (const auto& record : records) {
    if (record.hash == hash && record.ksize == ksize) return &record;
  }
  return nullptr;
}

void TestDuplicatesUnionNamesAndResolveLca() {
  const std::vector<std::string> firmicutes = {"d__Bacteria;p__Firmicutes"};

  MergeStats stats;
  auto       merged = MergeDuplicates({Row(1, 31, {"A"}, "db1", firmicutes), Row(1, 31, {"B"}, "db1", firmicutes)}, &stats);

  assert(merged.size() == 1);
  const auto& row = merged.front();
  assert((row.dataset_names == std::vector<std::string>{"A", "B"}));
  assert(row.taxonomy_list->size() == 2);
  assert(*row.lca_lineage == "d__Bacteria;p__Firmicutes");
  assert(*row.lca_rank == "p");
  assert(*row.scaled == 1000);
  assert(row.source == "db1");

  assert(stats.duplicated_rows == 2);
  assert(stats.unique_rows == 0);
  assert(stats.merged_groups == 1);
}

void TestSourcesAreSortedAndDeduplicated() {
  auto forward  = MergeDuplicates({Row(7, 21, {"A"}, "db1"), Row(7, 21, {"B"}, "db2"), Row(7, 21, {"C"}, "db1")});
  auto backward = MergeDuplicates({Row(7, 21, {"C"}, "db2"), Row(7, 21, {"B"}, "db1")});

  assert(forward.front().source == "db1;db2");
  assert(backward.front().source == "db1;db2");
}

void TestConflictingScaledBecomesNull() {
  auto merged = MergeDuplicates({Row(3, 31, {"A"}, "db1", std::nullopt, 1000), Row(3, 31, {"B"}, "db1", std::nullopt, 2000)});
  assert(!merged.front().scaled.has_value());

  auto agreeing = MergeDuplicates({Row(3, 31, {"A"}, "db1", std::nullopt, 1000), Row(3, 31, {"B"}, "db1", std::nullopt, 1000)});
  assert(*agreeing.front().scaled == 1000);
}

void TestGroupWithoutTaxonomyHasNoLca() {
  auto merged = MergeDuplicates({Row(5, 31, {"A"}, "db1"), Row(5, 31, {"A", "B"}, "db1")});
  const auto& row = merged.front();

  assert((row.dataset_names == std::vector<std::string>{"A", "B"}));
  assert(!row.taxonomy_list.has_value());
  assert(!row.lca_lineage.has_value());
  assert(!row.lca_rank.has_value());
}

void TestKsizeIsPartOfTheKey() {
  MergeStats stats;
  auto       merged = MergeDuplicates({Row(9, 21, {"A"}, "db1"), Row(9, 31, {"B"}, "db1")}, &stats);
  assert(merged.size() == 2);
  assert(stats.merged_groups == 0);
  assert(stats.unique_rows == 2);
}

void TestUniqueRowsComeFirstAndPassThrough() {
  auto unique        = Row(2, 31, {"Z"}, "db1", std::vector<std::string>{"d__Archaea"});
  unique.lca_rank    = "d";
  unique.lca_lineage = "d__Archaea";

  auto merged = MergeDuplicates({Row(1, 31, {"A"}, "db1"), unique, Row(1, 31, {"B"}, "db1"), Row(4, 31, {"Y"}, "db1")});
  assert(merged.size() == 3);
  assert(merged[0].hash == 2);
  assert(merged[1].hash == 4);
  assert(merged[2].hash == 1);

  assert(*merged[0].lca_lineage == "d__Archaea");
  assert(*merged[0].taxonomy_list == std::vector<std::string>{"d__Archaea"});
}

void TestMergeIsIdempotent() {
  const std::vector<std::string> gamma = {"d__Bacteria;p__Proteobacteria;c__Gammaproteobacteria"};
  const std::vector<std::string> alpha = {"d__Bacteria;p__Proteobacteria;c__Alphaproteobacteria"};

  auto once  = MergeDuplicates({Row(1, 31, {"A"}, "db1", gamma), Row(1, 31, {"B"}, "db2", alpha), Row(2, 31, {"C"}, "db1", gamma)});
  auto twice = MergeDuplicates(once);

  assert(once.size() == twice.size());
  for (const auto& row : once) {
    const auto* again = FindKey(twice, row.hash, row.ksize);
    assert(again);
    assert(again->dataset_names == row.dataset_names);
    assert(again->lca_lineage == row.lca_lineage);
    assert(again->lca_rank == row.lca_rank);
    assert(again->source == row.source);
  }

  const auto* merged = FindKey(once, 1, 31);
  assert(*merged->lca_lineage == "d__Bacteria;p__Proteobacteria");
  assert(*merged->lca_rank == "p");
}

void TestMergedLineageIsPrefixOfEveryContributor() {
  const std::vector<std::string> lineages = {
      "d__Bacteria;p__Firmicutes;c__Bacilli;o__Lactobacillales",
      "d__Bacteria;p__Firmicutes;c__Bacilli;o__Bacillales",
      "d__Bacteria;p__Firmicutes;c__Bacilli",
  };

  std::vector<SketchRecord> rows;
  for (std::size_t i = 0; i < lineages.size(); ++i) {
    rows.push_back(Row(11, 51, {"G" + std::to_string(i)}, "db1", std::vector<std::string>{lineages[i]}));
  }

  const auto merged = MergeDuplicates(rows).front();
  for (const auto& lineage : lineages) {
    assert(lineage.rfind(*merged.lca_lineage, 0) == 0);
  }

  std::set<std::string> names(merged.dataset_names.begin(), merged.dataset_names.end());
  for (const auto& row : rows) {
    assert(names.count(row.dataset_names.front()) == 1);
  }
}

} // namespace

int main() {
  TestDuplicatesUnionNamesAndResolveLca();
  TestSourcesAreSortedAndDeduplicated();
  TestConflictingScaledBecomesNull();
  TestGroupWithoutTaxonomyHasNoLca();
  TestKsizeIsPartOfTheKey();
  TestUniqueRowsComeFirstAndPassThrough();
  TestMergeIsIdempotent();
  TestMergedLineageIsPrefixOfEveryContributor();

  std::cout << "hashtax_unit_duplicate_merger: pass\n";
  return 0;
}
