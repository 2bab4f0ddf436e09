#include "internal/summary/rank_summarizer.hpp"

#include <cassert>
#include <iostream>
#include <string>
#include <vector>

namespace {

using hashtax::model::KsizeRankRow;
using hashtax::model::RankSummaryRow;
using hashtax::model::SketchRecord;
using namespace hashtax::summary;

SketchRecord Classified(std::string lineage, std::optional<std::string> rank, std::uint32_t ksize = 31) {
  SketchRecord record;
  record.ksize         = ksize;
  record.taxonomy_list = std::vector<std::string>{lineage};
  record.lca_lineage   = std::move(lineage);
  record.lca_rank      = std::move(rank);
  return record;
}

SketchRecord Unclassified() {
  return SketchRecord{};
}

SketchRecord NoConsensus() {
  SketchRecord record;
  record.taxonomy_list = std::vector<std::string>{"d__Bacteria", "d__Archaea"};
  return record;
}

SourceTables SampleSources() {
  SourceTables tables;
  tables["db_b"] = {
      Classified("d__Bacteria;p__Firmicutes;c__Bacilli;o__Bacillales;f__Bacillaceae;g__Bacillus;s__Bacillus subtilis", "s"),
      Classified("d__Bacteria;p__Firmicutes;c__Bacilli;o__Bacillales;f__Bacillaceae;g__Bacillus;s__Bacillus cereus", "s"),
      Classified("d__Bacteria;p__Firmicutes;c__Bacilli;o__Bacillales;f__Bacillaceae;g__Bacillus;s__Bacillus subtilis", "s"),
      NoConsensus(),
      Unclassified(),
  };
  tables["db_a"] = {
      Classified("d__Archaea;p__Halobacteriota;c__Halobacteria;o__Halobacteriales;f__Haloferacaceae;g__Haloferax;s__Haloferax volcanii",
                 std::string("species")),
      Classified("Bacteria", std::nullopt),
  };
  return tables;
}

void TestBuckets() {
  assert(RankBucketFor(Unclassified()) == "unclassified");
  assert(RankBucketFor(NoConsensus()) == "no_consensus");
  assert(RankBucketFor(Classified("Bacteria", std::nullopt)) == "unranked");
  assert(RankBucketFor(Classified("x__Bacteria", std::string("x"))) == "unranked");
  assert(RankBucketFor(Classified("d__Bacteria;p__Firmicutes", std::string("p"))) == "phylum");
  assert(RankBucketFor(Classified("d__Bacteria", std::string("superkingdom"))) == "domain");

  auto empty_taxonomy          = Unclassified();
  empty_taxonomy.taxonomy_list = std::vector<std::string>{};
  assert(RankBucketFor(empty_taxonomy) == "unclassified");
}

void TestPercentRounding() {
  assert(Percent(0, 0) == 0.0);
  assert(Percent(1, 4) == 25.0);
  assert(Percent(4, 7) == 57.14);
  assert(Percent(1, 7) == 14.29);
  assert(Percent(23901, 23911) == 99.96);
}

void TestPerSourceAndCombinedRows() {
  const auto rows = SummarizeRanks(SampleSources());

  const std::vector<RankSummaryRow> expected = {
      {"db_a", "species", 1, 50.0},
      {"db_a", "unranked", 1, 50.0},
      {"db_b", "species", 3, 60.0},
      {"db_b", "no_consensus", 1, 20.0},
      {"db_b", "unclassified", 1, 20.0},
      {"combined", "species", 4, 57.14},
      {"combined", "unranked", 1, 14.29},
      {"combined", "no_consensus", 1, 14.29},
      {"combined", "unclassified", 1, 14.29},
  };

  assert(rows.size() == expected.size());
  for (std::size_t i = 0; i < rows.size(); ++i) {
    assert(rows[i].source == expected[i].source);
    assert(rows[i].rank == expected[i].rank);
    assert(rows[i].count == expected[i].count);
    assert(rows[i].percent == expected[i].percent);
  }
}

void TestCountsSumToSourceSize() {
  const auto tables = SampleSources();
  const auto rows   = SummarizeRanks(tables);

  std::uint64_t combined = 0;
  for (const auto& [source, records] : tables) {
    std::uint64_t total = 0;
    for (const auto& row : rows) {
      if (row.source == source) total += row.count;
    }
    assert(total == records.size());
    combined += total;
  }

  std::uint64_t combined_rows = 0;
  for (const auto& row : rows) {
    if (row.source == "combined") combined_rows += row.count;
  }
  assert(combined_rows == combined);
}

void TestNoSourcesNoRows() {
  assert(SummarizeRanks({}).empty());
}

void TestKsizeDistribution() {
  const std::vector<SketchRecord> records = {
      Classified("d__Bacteria;p__Firmicutes;c__Bacilli;o__Bacillales;f__Bacillaceae;g__Bacillus;s__Bacillus subtilis", "s", 21),
      Classified("d__Bacteria;p__Firmicutes;c__Bacilli;o__Bacillales;f__Bacillaceae;g__Bacillus", "g", 21),
      Classified("d__Bacteria;p__Firmicutes;c__Bacilli;o__Bacillales;f__Bacillaceae;g__Bacillus;s__Bacillus cereus", "species", 31),
      Classified("Bacteria", std::nullopt, 31),
  };

  const auto rows = SummarizeRanksByKsize(records);

  const std::vector<KsizeRankRow> expected = {
      {21, "genus", 1, 50.0},
      {21, "species", 1, 50.0},
      {31, "species", 1, 100.0},
  };

  assert(rows.size() == expected.size());
  for (std::size_t i = 0; i < rows.size(); ++i) {
    assert(rows[i].ksize == expected[i].ksize);
    assert(rows[i].rank == expected[i].rank);
    assert(rows[i].count == expected[i].count);
    assert(rows[i].percent == expected[i].percent);
  }
}

void TestFormattedSummary() {
  const auto lines = FormatRankSummary(SummarizeRanks(SampleSources()), "combined");

  assert(lines.size() == 5);
  assert(lines.front() == "species: 4 (57.14%)");
  assert(lines[3] == "unclassified: 1 (14.29%)");
  assert(lines.back() == "Total hashes: 7");
}

} // namespace

int main() {
  TestBuckets();
  TestPercentRounding();
  TestPerSourceAndCombinedRows();
  TestCountsSumToSourceSize();
  TestNoSourcesNoRows();
  TestKsizeDistribution();
  TestFormattedSummary();

  std::cout << "hashtax_unit_rank_summarizer: pass\n";
  return 0;
}
