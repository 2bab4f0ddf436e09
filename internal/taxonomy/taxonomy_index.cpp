#include "internal/taxonomy/taxonomy_index.hpp"

#include <arrow/csv/api.h>
#include <arrow/io/file.h>
#include <arrow/table.h>
#include <arrow/type.h>

#include <array>
#include <cctype>
#include <filesystem>

#include "internal/observability/logging.hpp"
#include "internal/table/arrow_utils.hpp"
#include "internal/taxonomy/lca_resolver.hpp"
#include "internal/taxonomy/lineage.hpp"
#include "internal/util/errors.hpp"

namespace hashtax::taxonomy {

using hashtax::observability::IntField;
using hashtax::observability::StringField;

namespace {

constexpr const char* kIdentColumn = "ident";

// Column names in rank order; "domain" may also be spelled "superkingdom".
constexpr std::array<const char*, 8> kLineageColumns = {"superkingdom", "domain", "phylum", "class", "order", "family", "genus", "species"};

arrow::Result<std::shared_ptr<arrow::Table>> ReadTaxonomyCsv(const std::string& path) {
  ARROW_ASSIGN_OR_RAISE(auto input, arrow::io::ReadableFile::Open(path));

  auto convert_options = arrow::csv::ConvertOptions::Defaults();
  convert_options.column_types[kIdentColumn] = arrow::utf8();
  for (const auto* column : kLineageColumns) {
    convert_options.column_types[column] = arrow::utf8();
  }

  ARROW_ASSIGN_OR_RAISE(auto reader, arrow::csv::TableReader::Make(arrow::io::default_io_context(), input, arrow::csv::ReadOptions::Defaults(),
                                                                   arrow::csv::ParseOptions::Defaults(), convert_options));
  return reader->Read();
}

std::string EmptyMessage(const std::string& path) {
  return "Provided taxonomy file '" + path + "' is empty or failed to parse.";
}

} // namespace

// ------------------------------------------------------------
// TaxonomyIndex
// ------------------------------------------------------------

TaxonomyIndex TaxonomyIndex::Load(const std::string& path) {
  std::error_code ec;
  if (!std::filesystem::is_regular_file(path, ec)) {
    throw util::FileNotFound("No such file or directory: '" + path + "'");
  }

  auto result = ReadTaxonomyCsv(path);
  if (!result.ok()) {
    throw util::EmptyInput(EmptyMessage(path) + " " + result.status().message());
  }
  auto table = std::move(result).ValueUnsafe();

  if (!table->schema()->GetFieldByName(kIdentColumn)) {
    throw util::MissingColumn("CSV deserialize error: missing field `ident` in '" + path + "'");
  }

  auto combined = table::Unwrap(table->CombineChunks(arrow::default_memory_pool()), "Failed to combine taxonomy chunks");

  std::vector<std::shared_ptr<arrow::Array>> rank_columns;
  const bool has_domain = combined->schema()->GetFieldByName("domain") != nullptr;
  for (const auto* name : kLineageColumns) {
    if (has_domain && std::string_view(name) == "superkingdom") continue;
    auto column = combined->GetColumnByName(name);
    if (column && column->num_chunks() > 0) rank_columns.push_back(column->chunk(0));
  }

  TaxonomyIndex index;
  auto          idents = combined->GetColumnByName(kIdentColumn);

  for (int64_t row = 0; idents->num_chunks() > 0 && row < combined->num_rows(); ++row) {
    auto ident = table::StringAt(*idents->chunk(0), row);
    if (!ident || ident->empty()) continue;

    std::vector<std::string> tokens;
    for (const auto& column : rank_columns) {
      auto value = table::StringAt(*column, row);
      if (value && !value->empty()) tokens.push_back(std::move(*value));
    }
    if (tokens.empty()) continue;

    index.Insert(std::move(*ident), JoinLineage(tokens));
  }

  if (index.Size() == 0) {
    throw util::EmptyInput(EmptyMessage(path));
  }

  HASHTAX_LOG_INFO("Loaded taxonomy", {StringField("path", path), IntField("lineages", static_cast<std::int64_t>(index.Size()))});
  return index;
}

void TaxonomyIndex::Insert(std::string ident, std::string lineage) {
  lineages_[std::move(ident)] = std::move(lineage);
}

std::optional<std::string_view> TaxonomyIndex::Find(std::string_view ident) const {
  auto it = lineages_.find(std::string(ident));
  if (it == lineages_.end()) return std::nullopt;
  return std::string_view(it->second);
}

// ------------------------------------------------------------
// Annotation
// ------------------------------------------------------------

std::string_view AccessionOf(std::string_view dataset_name) {
  std::size_t begin = 0;
  while (begin < dataset_name.size() && std::isspace(static_cast<unsigned char>(dataset_name[begin]))) ++begin;

  std::size_t end = begin;
  while (end < dataset_name.size() && !std::isspace(static_cast<unsigned char>(dataset_name[end]))) ++end;

  return dataset_name.substr(begin, end - begin);
}

void Annotate(std::vector<model::SketchRecord>& records, const TaxonomyIndex& index) {
  for (auto& record : records) {
    std::vector<std::string> lineages;
    for (const auto& name : record.dataset_names) {
      auto accession = AccessionOf(name);
      if (accession.empty()) continue;
      if (auto lineage = index.Find(accession)) lineages.emplace_back(*lineage);
    }

    auto lca             = ComputeLca(lineages);
    record.lca_lineage   = std::move(lca.lineage);
    record.lca_rank      = std::move(lca.rank_code);
    record.taxonomy_list = std::move(lineages);
  }
}

void ResolveMissingLca(std::vector<model::SketchRecord>& records) {
  for (auto& record : records) {
    if (record.lca_lineage || !record.taxonomy_list || record.taxonomy_list->empty()) continue;

    auto lca           = ComputeLca(*record.taxonomy_list);
    record.lca_lineage = std::move(lca.lineage);
    record.lca_rank    = std::move(lca.rank_code);
  }
}

} // namespace hashtax::taxonomy
