#include <cstdint>
#include <iostream>
#include <string>
#include <vector>

#include "hashtax/v1.hpp"

namespace {

hashtax::v1::SketchRecord Observation(std::uint64_t hash, const std::string& dataset, const std::string& lineage, const std::string& source) {
  hashtax::v1::SketchRecord record;
  record.hash          = hash;
  record.ksize         = 31;
  record.scaled        = 1000;
  record.dataset_names = {dataset};
  record.taxonomy_list = std::vector<std::string>{lineage};
  record.source        = source;
  return record;
}

} // namespace

int main(int argc, char** argv) {
  // Two databases that both saw hash 1 in related genomes.
  const std::vector<hashtax::v1::SketchRecord> observations = {
      Observation(1, "GCA_1 Escherichia coli", "d__Bacteria;p__Proteobacteria;c__Gammaproteobacteria;o__Enterobacterales", "gtdb"),
      Observation(1, "GCA_2 Shewanella baltica", "d__Bacteria;p__Proteobacteria;c__Gammaproteobacteria;o__Alteromonadales", "refseq"),
      Observation(2, "GCA_3 Haloferax volcanii", "d__Archaea;p__Halobacteriota", "gtdb"),
  };

  hashtax::v1::MergeStats stats;
  auto                    merged = hashtax::v1::MergeDuplicates(observations, &stats);

  for (const auto& record : merged) {
    std::cout << record.hash << " [" << record.source << "] ";
    if (record.lca_lineage) {
      std::cout << *record.lca_lineage << " (" << record.lca_rank.value_or("?") << ")";
    } else {
      std::cout << "no lca";
    }
    std::cout << "\n";
  }
  std::cout << "merged groups: " << stats.merged_groups << "\n";

  hashtax::v1::SourceTables tables;
  tables["example"] = merged;
  for (const auto& line : hashtax::v1::FormatRankSummary(hashtax::v1::SummarizeRanks(tables), "combined")) {
    std::cout << line << "\n";
  }

  // Optionally persist the merged rows.
  if (argc > 1) {
    hashtax::table::WriteSketchTable(argv[1], merged, hashtax::table::TableLayout::kFull, hashtax::runtime::config::COMPRESSION_AUTO);
    std::cout << "wrote " << argv[1] << "\n";
  }
  return 0;
}
