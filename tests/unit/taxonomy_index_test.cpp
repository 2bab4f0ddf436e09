#include "internal/taxonomy/taxonomy_index.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>

#include "internal/merge/duplicate_merger.hpp"
#include "internal/summary/rank_summarizer.hpp"
#include "internal/util/errors.hpp"

namespace {

using hashtax::model::SketchRecord;
using hashtax::taxonomy::AccessionOf;
using hashtax::taxonomy::Annotate;
using hashtax::taxonomy::ResolveMissingLca;
using hashtax::taxonomy::TaxonomyIndex;

std::filesystem::path WriteCsv(const std::string& test_name, const std::string& content) {
  const auto base_dir = std::filesystem::temp_directory_path() / "hashtax_taxonomy_index_tests";
  std::filesystem::create_directories(base_dir);

  const auto    file_path = base_dir / (test_name + ".csv");
  std::ofstream out(file_path);
  out << content;
  out.close();

  return file_path;
}

void TestLoadJoinsRankColumns() {
  const auto path = WriteCsv("ranks", "ident,domain,phylum,class,order,family,genus,species\n"
                                      "GCF_000021665.1,d__Bacteria,p__Proteobacteria,c__Gammaproteobacteria,o__Enterobacterales,"
                                      "f__Shewanellaceae,g__Shewanella,s__Shewanella baltica\n"
                                      "GCF_000005845.2,d__Bacteria,p__Proteobacteria,c__Gammaproteobacteria,o__Enterobacterales,"
                                      "f__Enterobacteriaceae,g__Escherichia,\n");

  auto index = TaxonomyIndex::Load(path.string());
  assert(index.Size() == 2);
  assert(*index.Find("GCF_000021665.1") ==
         "d__Bacteria;p__Proteobacteria;c__Gammaproteobacteria;o__Enterobacterales;f__Shewanellaceae;g__Shewanella;s__Shewanella baltica");
  assert(*index.Find("GCF_000005845.2") ==
         "d__Bacteria;p__Proteobacteria;c__Gammaproteobacteria;o__Enterobacterales;f__Enterobacteriaceae;g__Escherichia");
  assert(!index.Find("GCF_999999999.1").has_value());
}

void TestSuperkingdomIsAcceptedForDomain() {
  const auto path  = WriteCsv("superkingdom", "ident,superkingdom,phylum\nGCA_1,d__Archaea,p__Euryarchaeota\n");
  auto       index = TaxonomyIndex::Load(path.string());
  assert(*index.Find("GCA_1") == "d__Archaea;p__Euryarchaeota");
}

void TestLastDuplicateIdentWins() {
  const auto path  = WriteCsv("duplicate", "ident,domain\nGCA_1,d__Bacteria\nGCA_1,d__Archaea\n");
  auto       index = TaxonomyIndex::Load(path.string());
  assert(index.Size() == 1);
  assert(*index.Find("GCA_1") == "d__Archaea");
}

void TestMissingIdentColumnIsRejected() {
  const auto path  = WriteCsv("no_ident", "accession,domain\nGCA_1,d__Bacteria\n");
  bool       threw = false;
  try {
    (void)TaxonomyIndex::Load(path.string());
  } catch (const hashtax::util::MissingColumn& e) {
    threw = std::string(e.what()).find("ident") != std::string::npos;
  }
  assert(threw && "TaxonomyIndex must require the ident column.");
}

void TestEmptyFileIsRejected() {
  const auto path  = WriteCsv("empty", "");
  bool       threw = false;
  try {
    (void)TaxonomyIndex::Load(path.string());
  } catch (const hashtax::util::EmptyInput& e) {
    threw = std::string(e.what()).find("is empty or failed to parse") != std::string::npos;
  }
  assert(threw && "TaxonomyIndex must reject an empty file.");
}

void TestMissingFileIsRejected() {
  bool threw = false;
  try {
    (void)TaxonomyIndex::Load((std::filesystem::temp_directory_path() / "hashtax_missing_taxonomy.csv").string());
  } catch (const hashtax::util::FileNotFound&) {
    threw = true;
  }
  assert(threw);
}

void TestAccessionIsFirstToken() {
  assert(AccessionOf("GCF_000021665.1 Shewanella baltica OS223") == "GCF_000021665.1");
  assert(AccessionOf("GCA_1") == "GCA_1");
  assert(AccessionOf("  GCA_2\tname") == "GCA_2");
  assert(AccessionOf("").empty());
}

void TestAnnotateSetsTaxonomyAndLca() {
  TaxonomyIndex index;
  index.Insert("GCA_1", "d__Bacteria;p__Firmicutes;c__Bacilli");
  index.Insert("GCA_2", "d__Bacteria;p__Firmicutes;c__Clostridia");

  SketchRecord shared;
  shared.dataset_names = {"GCA_1 Bacillus subtilis", "GCA_2 Clostridium", "GCA_3 unknown"};

  SketchRecord unknown;
  unknown.dataset_names = {"GCA_9 unknown"};

  std::vector<SketchRecord> records = {shared, unknown};
  Annotate(records, index);

  assert(records[0].taxonomy_list->size() == 2);
  assert((*records[0].taxonomy_list)[0] == "d__Bacteria;p__Firmicutes;c__Bacilli");
  assert(*records[0].lca_lineage == "d__Bacteria;p__Firmicutes");
  assert(*records[0].lca_rank == "p");

  assert(records[1].taxonomy_list.has_value());
  assert(records[1].taxonomy_list->empty());
  assert(!records[1].lca_lineage.has_value());
  assert(!records[1].lca_rank.has_value());
}

void TestUnannotatedRowsGetTheirLca() {
  SketchRecord single;
  single.hash          = 1;
  single.ksize         = 31;
  single.dataset_names = {"GCA_1"};
  single.taxonomy_list = std::vector<std::string>{"d__Bacteria;p__Firmicutes"};

  SketchRecord split  = single;
  split.hash          = 2;
  split.taxonomy_list = std::vector<std::string>{"d__Bacteria;p__Firmicutes", "d__Archaea"};

  SketchRecord annotated = single;
  annotated.hash         = 3;
  annotated.lca_lineage  = "d__Bacteria";
  annotated.lca_rank     = "d";

  SketchRecord bare;
  bare.hash          = 4;
  bare.ksize         = 31;
  bare.dataset_names = {"GCA_4"};

  std::vector<SketchRecord> records = {single, split, annotated, bare};
  ResolveMissingLca(records);
  auto merged = hashtax::merge::MergeDuplicates(records);

  assert(merged.size() == 4);
  assert(*merged[0].lca_lineage == "d__Bacteria;p__Firmicutes");
  assert(*merged[0].lca_rank == "p");
  assert(hashtax::summary::RankBucketFor(merged[0]) == "phylum");

  assert(!merged[1].lca_lineage.has_value());
  assert(hashtax::summary::RankBucketFor(merged[1]) == "no_consensus");

  assert(*merged[2].lca_lineage == "d__Bacteria");
  assert(hashtax::summary::RankBucketFor(merged[2]) == "domain");

  assert(!merged[3].taxonomy_list.has_value());
  assert(hashtax::summary::RankBucketFor(merged[3]) == "unclassified");
}

} // namespace

int main() {
  TestLoadJoinsRankColumns();
  TestSuperkingdomIsAcceptedForDomain();
  TestLastDuplicateIdentWins();
  TestMissingIdentColumnIsRejected();
  TestEmptyFileIsRejected();
  TestMissingFileIsRejected();
  TestAccessionIsFirstToken();
  TestAnnotateSetsTaxonomyAndLca();
  TestUnannotatedRowsGetTheirLca();

  std::cout << "hashtax_unit_taxonomy_index: pass\n";
  return 0;
}
