#pragma once

#include <arrow/table.h>

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "config/config.pb.h"
#include "internal/model/rank_summary.hpp"
#include "internal/model/sketch_record.hpp"
#include "internal/table/table_format.hpp"

namespace hashtax::table {

enum class TableLayout {
  // hash, ksize, scaled, dataset_names, taxonomy_list, lca_lineage, lca_rank, source
  kFull,
  // hash, dataset_names
  kNamesOnly,
};

// Values used for columns an input table does not carry.
struct TableDefaults {
  std::uint32_t ksize  = 0;  // 0: column required
  std::uint64_t scaled = 0;  // 0: null
  std::string   source;
};

std::shared_ptr<arrow::Table> ToArrowTable(const std::vector<model::SketchRecord>& records, TableLayout layout);

/*
  Converts a sketch table into records. Throws MissingColumn when hash or
  dataset_names (or ksize without a default) is absent or has an unusable
  type. Empty lca_lineage / lca_rank cells become null.
*/
std::vector<model::SketchRecord> FromArrowTable(const arrow::Table& table, const TableDefaults& defaults);

std::shared_ptr<arrow::Table> RankSummaryToArrowTable(const std::vector<model::RankSummaryRow>& rows);
std::shared_ptr<arrow::Table> KsizeRankSummaryToArrowTable(const std::vector<model::KsizeRankRow>& rows);

std::shared_ptr<arrow::Table> ReadTable(const std::string& path);

// Format follows the extension; CSV is rejected for tables with list columns.
void WriteTable(const std::string& path, const arrow::Table& table, hashtax::runtime::config::Compression compression);

// Rows without a source take source_name, or the file name when it is empty.
std::vector<model::SketchRecord> ReadSketchTable(const std::string& path, const hashtax::runtime::config::InputConfig& input,
                                                 const std::string& source_name = "");

void WriteSketchTable(const std::string& path, const std::vector<model::SketchRecord>& records, TableLayout layout,
                      hashtax::runtime::config::Compression compression);

void WriteRankSummary(const std::string& path, const std::vector<model::RankSummaryRow>& rows,
                      hashtax::runtime::config::Compression compression);

void WriteKsizeRankSummary(const std::string& path, const std::vector<model::KsizeRankRow>& rows,
                           hashtax::runtime::config::Compression compression);

} // namespace hashtax::table
