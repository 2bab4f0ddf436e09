#include "internal/table/sketch_table.hpp"

#include <arrow/array/builder_binary.h>
#include <arrow/array/builder_nested.h>
#include <arrow/array/builder_primitive.h>
#include <arrow/csv/api.h>
#include <arrow/io/file.h>
#include <arrow/ipc/reader.h>
#include <arrow/ipc/writer.h>
#include <arrow/memory_pool.h>
#include <arrow/type.h>
#include <parquet/arrow/reader.h>
#include <parquet/arrow/writer.h>
#include <parquet/properties.h>

#include <filesystem>

#include "internal/observability/logging.hpp"
#include "internal/table/arrow_utils.hpp"
#include "internal/util/errors.hpp"

namespace hashtax::table {

using hashtax::observability::IntField;
using hashtax::observability::StringField;
using hashtax::runtime::config::Compression;
using model::KsizeRankRow;
using model::RankSummaryRow;
using model::SketchRecord;

namespace {

constexpr int64_t kParquetChunkSize = 64 * 1024;

// ------------------------------------------------------------
// Building
// ------------------------------------------------------------

arrow::Status AppendStrings(arrow::ListBuilder* builder, const std::vector<std::string>& values) {
  ARROW_RETURN_NOT_OK(builder->Append());
  auto* value_builder = static_cast<arrow::StringBuilder*>(builder->value_builder());
  for (const auto& value : values) {
    ARROW_RETURN_NOT_OK(value_builder->Append(value));
  }
  return arrow::Status::OK();
}

arrow::Status AppendOptional(arrow::StringBuilder* builder, const std::optional<std::string>& value) {
  return value ? builder->Append(*value) : builder->AppendNull();
}

arrow::Result<std::shared_ptr<arrow::Table>> BuildSketchTable(const std::vector<SketchRecord>& records, TableLayout layout) {
  auto* pool = arrow::default_memory_pool();

  arrow::UInt64Builder hash_builder(pool);
  arrow::UInt32Builder ksize_builder(pool);
  arrow::UInt64Builder scaled_builder(pool);
  arrow::ListBuilder   names_builder(pool, std::make_shared<arrow::StringBuilder>(pool));
  arrow::ListBuilder   taxonomy_builder(pool, std::make_shared<arrow::StringBuilder>(pool));
  arrow::StringBuilder lineage_builder(pool);
  arrow::StringBuilder rank_builder(pool);
  arrow::StringBuilder source_builder(pool);

  const bool full = layout == TableLayout::kFull;

  for (const auto& record : records) {
    ARROW_RETURN_NOT_OK(hash_builder.Append(record.hash));
    ARROW_RETURN_NOT_OK(AppendStrings(&names_builder, record.dataset_names));

    if (!full) continue;

    ARROW_RETURN_NOT_OK(ksize_builder.Append(record.ksize));
    ARROW_RETURN_NOT_OK(record.scaled ? scaled_builder.Append(*record.scaled) : scaled_builder.AppendNull());
    ARROW_RETURN_NOT_OK(record.taxonomy_list ? AppendStrings(&taxonomy_builder, *record.taxonomy_list) : taxonomy_builder.AppendNull());
    ARROW_RETURN_NOT_OK(AppendOptional(&lineage_builder, record.lca_lineage));
    ARROW_RETURN_NOT_OK(AppendOptional(&rank_builder, record.lca_rank));
    ARROW_RETURN_NOT_OK(source_builder.Append(record.source));
  }

  ARROW_ASSIGN_OR_RAISE(auto hash_array, hash_builder.Finish());
  ARROW_ASSIGN_OR_RAISE(auto names_array, names_builder.Finish());

  if (!full) {
    auto schema = arrow::schema({
        arrow::field("hash", arrow::uint64(), false),
        arrow::field("dataset_names", arrow::list(arrow::utf8())),
    });
    return arrow::Table::Make(schema, {hash_array, names_array});
  }

  ARROW_ASSIGN_OR_RAISE(auto ksize_array, ksize_builder.Finish());
  ARROW_ASSIGN_OR_RAISE(auto scaled_array, scaled_builder.Finish());
  ARROW_ASSIGN_OR_RAISE(auto taxonomy_array, taxonomy_builder.Finish());
  ARROW_ASSIGN_OR_RAISE(auto lineage_array, lineage_builder.Finish());
  ARROW_ASSIGN_OR_RAISE(auto rank_array, rank_builder.Finish());
  ARROW_ASSIGN_OR_RAISE(auto source_array, source_builder.Finish());

  auto schema = arrow::schema({
      arrow::field("hash", arrow::uint64(), false),
      arrow::field("ksize", arrow::uint32(), false),
      arrow::field("scaled", arrow::uint64()),
      arrow::field("dataset_names", arrow::list(arrow::utf8())),
      arrow::field("taxonomy_list", arrow::list(arrow::utf8())),
      arrow::field("lca_lineage", arrow::utf8()),
      arrow::field("lca_rank", arrow::utf8()),
      arrow::field("source", arrow::utf8(), false),
  });
  return arrow::Table::Make(schema, {hash_array, ksize_array, scaled_array, names_array, taxonomy_array, lineage_array, rank_array, source_array});
}

template <typename Row, typename KeyBuilder, typename KeyOf>
arrow::Result<std::shared_ptr<arrow::Table>> BuildSummaryTable(const std::vector<Row>& rows, std::shared_ptr<arrow::Field> key_field, KeyOf key_of) {
  auto* pool = arrow::default_memory_pool();

  KeyBuilder           key_builder(pool);
  arrow::StringBuilder rank_builder(pool);
  arrow::UInt64Builder count_builder(pool);
  arrow::DoubleBuilder percent_builder(pool);

  for (const auto& row : rows) {
    ARROW_RETURN_NOT_OK(key_builder.Append(key_of(row)));
    ARROW_RETURN_NOT_OK(rank_builder.Append(row.rank));
    ARROW_RETURN_NOT_OK(count_builder.Append(row.count));
    ARROW_RETURN_NOT_OK(percent_builder.Append(row.percent));
  }

  ARROW_ASSIGN_OR_RAISE(auto key_array, key_builder.Finish());
  ARROW_ASSIGN_OR_RAISE(auto rank_array, rank_builder.Finish());
  ARROW_ASSIGN_OR_RAISE(auto count_array, count_builder.Finish());
  ARROW_ASSIGN_OR_RAISE(auto percent_array, percent_builder.Finish());

  auto schema = arrow::schema({
      std::move(key_field),
      arrow::field("rank", arrow::utf8(), false),
      arrow::field("count", arrow::uint64(), false),
      arrow::field("percent", arrow::float64(), false),
  });
  return arrow::Table::Make(schema, {key_array, rank_array, count_array, percent_array});
}

// ------------------------------------------------------------
// Reading
// ------------------------------------------------------------

std::shared_ptr<arrow::Array> ColumnOrNull(const arrow::Table& table, const std::string& name) {
  auto column = table.GetColumnByName(name);
  if (!column || column->num_chunks() == 0) return nullptr;
  return column->chunk(0);
}

void CheckColumnType(const arrow::Schema& schema, const std::string& name, bool required, bool (*accepts)(const arrow::DataType&),
                     const char* expected) {
  auto field = schema.GetFieldByName(name);
  if (!field) {
    if (required) throw util::MissingColumn("Required column '" + name + "' missing");
    return;
  }
  if (!accepts(*field->type())) {
    throw util::MissingColumn("Column '" + name + "' has type " + field->type()->ToString() + ", expected " + expected);
  }
}

arrow::Result<std::shared_ptr<arrow::Table>> ReadParquet(const std::string& path) {
  ARROW_ASSIGN_OR_RAISE(auto input, arrow::io::ReadableFile::Open(path));

  parquet::arrow::FileReaderBuilder builder;
  ARROW_RETURN_NOT_OK(builder.Open(input));

  std::unique_ptr<parquet::arrow::FileReader> reader;
  ARROW_RETURN_NOT_OK(builder.Build(&reader));

  std::shared_ptr<arrow::Table> table;
  ARROW_RETURN_NOT_OK(reader->ReadTable(&table));
  return table;
}

arrow::Result<std::shared_ptr<arrow::Table>> ReadArrowIpc(const std::string& path) {
  ARROW_ASSIGN_OR_RAISE(auto input, arrow::io::ReadableFile::Open(path));
  ARROW_ASSIGN_OR_RAISE(auto reader, arrow::ipc::RecordBatchFileReader::Open(input));

  std::vector<std::shared_ptr<arrow::RecordBatch>> batches;
  batches.reserve(static_cast<std::size_t>(reader->num_record_batches()));
  for (int i = 0; i < reader->num_record_batches(); ++i) {
    ARROW_ASSIGN_OR_RAISE(auto batch, reader->ReadRecordBatch(i));
    batches.push_back(std::move(batch));
  }
  return arrow::Table::FromRecordBatches(reader->schema(), batches);
}

arrow::Result<std::shared_ptr<arrow::Table>> ReadCsv(const std::string& path) {
  ARROW_ASSIGN_OR_RAISE(auto input, arrow::io::ReadableFile::Open(path));

  auto convert_options                          = arrow::csv::ConvertOptions::Defaults();
  convert_options.column_types["hash"]          = arrow::uint64();
  convert_options.column_types["ksize"]         = arrow::uint32();
  convert_options.column_types["scaled"]        = arrow::uint64();
  convert_options.column_types["dataset_names"] = arrow::utf8();
  convert_options.column_types["lca_lineage"]   = arrow::utf8();
  convert_options.column_types["lca_rank"]      = arrow::utf8();
  convert_options.column_types["source"]        = arrow::utf8();

  ARROW_ASSIGN_OR_RAISE(auto reader, arrow::csv::TableReader::Make(arrow::io::default_io_context(), input, arrow::csv::ReadOptions::Defaults(),
                                                                   arrow::csv::ParseOptions::Defaults(), convert_options));
  return reader->Read();
}

// ------------------------------------------------------------
// Writing
// ------------------------------------------------------------

arrow::Status WriteParquet(const std::string& path, const arrow::Table& table, Compression compression) {
  ARROW_ASSIGN_OR_RAISE(auto codec, ResolveCompression(compression));
  auto properties = parquet::WriterProperties::Builder().compression(codec)->build();

  ARROW_ASSIGN_OR_RAISE(auto output, arrow::io::FileOutputStream::Open(path));
  ARROW_RETURN_NOT_OK(parquet::arrow::WriteTable(table, arrow::default_memory_pool(), output, kParquetChunkSize, properties));
  return output->Close();
}

arrow::Status WriteArrowIpc(const std::string& path, const arrow::Table& table) {
  ARROW_ASSIGN_OR_RAISE(auto output, arrow::io::FileOutputStream::Open(path));
  ARROW_ASSIGN_OR_RAISE(auto writer, arrow::ipc::MakeFileWriter(output, table.schema()));
  ARROW_RETURN_NOT_OK(writer->WriteTable(table));
  ARROW_RETURN_NOT_OK(writer->Close());
  return output->Close();
}

arrow::Status WriteCsv(const std::string& path, const arrow::Table& table) {
  ARROW_ASSIGN_OR_RAISE(auto output, arrow::io::FileOutputStream::Open(path));
  ARROW_RETURN_NOT_OK(arrow::csv::WriteCSV(table, arrow::csv::WriteOptions::Defaults(), output.get()));
  return output->Close();
}

bool HasNestedColumn(const arrow::Schema& schema) {
  for (const auto& field : schema.fields()) {
    switch (field->type()->id()) {
      case arrow::Type::LIST:
      case arrow::Type::LARGE_LIST:
      case arrow::Type::FIXED_SIZE_LIST:
      case arrow::Type::STRUCT:
      case arrow::Type::MAP:
        return true;
      default:
        break;
    }
  }
  return false;
}

} // namespace

// ------------------------------------------------------------
// Conversion
// ------------------------------------------------------------

std::shared_ptr<arrow::Table> ToArrowTable(const std::vector<SketchRecord>& records, TableLayout layout) {
  return Unwrap(BuildSketchTable(records, layout), "Failed to build sketch table");
}

std::vector<SketchRecord> FromArrowTable(const arrow::Table& table, const TableDefaults& defaults) {
  const auto& schema = *table.schema();

  CheckColumnType(schema, "hash", true, IsIntegerColumn, "an integer column");
  CheckColumnType(schema, "dataset_names", true, IsStringListColumn, "a list of strings");
  CheckColumnType(schema, "ksize", defaults.ksize == 0, IsIntegerColumn, "an integer column");
  CheckColumnType(schema, "scaled", false, IsIntegerColumn, "an integer column");
  CheckColumnType(schema, "taxonomy_list", false, IsStringListColumn, "a list of strings");
  CheckColumnType(schema, "lca_lineage", false, IsStringColumn, "a string column");
  CheckColumnType(schema, "lca_rank", false, IsStringColumn, "a string column");
  CheckColumnType(schema, "source", false, IsStringColumn, "a string column");

  std::vector<SketchRecord> records;
  if (table.num_rows() == 0) {
    return records;
  }

  auto combined = Unwrap(table.CombineChunks(arrow::default_memory_pool()), "Failed to combine table chunks");

  const auto hash     = ColumnOrNull(*combined, "hash");
  const auto ksize    = ColumnOrNull(*combined, "ksize");
  const auto scaled   = ColumnOrNull(*combined, "scaled");
  const auto names    = ColumnOrNull(*combined, "dataset_names");
  const auto taxonomy = ColumnOrNull(*combined, "taxonomy_list");
  const auto lineage  = ColumnOrNull(*combined, "lca_lineage");
  const auto rank     = ColumnOrNull(*combined, "lca_rank");
  const auto source   = ColumnOrNull(*combined, "source");

  const bool scaled_column = schema.GetFieldByName("scaled") != nullptr;

  records.reserve(static_cast<std::size_t>(combined->num_rows()));
  int64_t skipped = 0;

  for (int64_t row = 0; row < combined->num_rows(); ++row) {
    auto hash_value = IntegerAt(*hash, row);
    auto ksize_value = ksize ? IntegerAt(*ksize, row) : std::nullopt;
    if (!ksize_value && defaults.ksize != 0) ksize_value = defaults.ksize;
    if (!hash_value || !ksize_value) {
      ++skipped;
      continue;
    }

    SketchRecord record;
    record.hash  = *hash_value;
    record.ksize = static_cast<std::uint32_t>(*ksize_value);

    if (scaled_column) {
      record.scaled = scaled ? IntegerAt(*scaled, row) : std::nullopt;
    } else if (defaults.scaled != 0) {
      record.scaled = defaults.scaled;
    }

    if (auto values = StringListAt(*names, row)) record.dataset_names = std::move(*values);
    if (taxonomy) record.taxonomy_list = StringListAt(*taxonomy, row);

    if (lineage) record.lca_lineage = StringAt(*lineage, row);
    if (rank) record.lca_rank = StringAt(*rank, row);
    if (record.lca_lineage && record.lca_lineage->empty()) record.lca_lineage.reset();
    if (record.lca_rank && record.lca_rank->empty()) record.lca_rank.reset();

    auto source_value = source ? StringAt(*source, row) : std::nullopt;
    record.source     = source_value && !source_value->empty() ? std::move(*source_value) : defaults.source;

    records.push_back(std::move(record));
  }

  if (skipped > 0) {
    HASHTAX_LOG_WARN("Skipped rows without hash or ksize", {StringField("source", defaults.source), IntField("rows", skipped)});
  }
  return records;
}

std::shared_ptr<arrow::Table> RankSummaryToArrowTable(const std::vector<RankSummaryRow>& rows) {
  return Unwrap(BuildSummaryTable<RankSummaryRow, arrow::StringBuilder>(rows, arrow::field("source", arrow::utf8(), false),
                                                                       [](const RankSummaryRow& row) { return row.source; }),
                "Failed to build rank summary table");
}

std::shared_ptr<arrow::Table> KsizeRankSummaryToArrowTable(const std::vector<KsizeRankRow>& rows) {
  return Unwrap(BuildSummaryTable<KsizeRankRow, arrow::UInt32Builder>(rows, arrow::field("ksize", arrow::uint32(), false),
                                                                     [](const KsizeRankRow& row) { return row.ksize; }),
                "Failed to build ksize rank table");
}

// ------------------------------------------------------------
// Files
// ------------------------------------------------------------

std::shared_ptr<arrow::Table> ReadTable(const std::string& path) {
  std::error_code ec;
  if (!std::filesystem::is_regular_file(path, ec)) {
    throw util::FileNotFound("No such file: '" + path + "'");
  }

  auto format = FormatFromPath(path);
  if (!format) {
    throw util::UnsupportedInputFormat("Unsupported input file extension: '" + path + "'. Use .parquet, .arrow or .csv");
  }
  if (std::filesystem::file_size(path, ec) == 0) {
    throw util::EmptyInput("Input file '" + path + "' is empty");
  }

  switch (*format) {
    case TableFormat::kParquet:
      return Unwrap(ReadParquet(path), "Failed to read parquet file '" + path + "'");
    case TableFormat::kArrowIpc:
      return Unwrap(ReadArrowIpc(path), "Failed to read arrow file '" + path + "'");
    case TableFormat::kCsv:
      return Unwrap(ReadCsv(path), "Failed to read csv file '" + path + "'");
  }
  throw util::UnsupportedInputFormat("Unsupported input file: '" + path + "'");
}

void WriteTable(const std::string& path, const arrow::Table& table, Compression compression) {
  auto format = FormatFromPath(path);
  if (!format) {
    throw util::UnsupportedOutputFormat("Unsupported output file extension: '" + path + "'. Use .parquet, .arrow or .csv");
  }

  switch (*format) {
    case TableFormat::kParquet:
      Unwrap(WriteParquet(path, table, compression), "Failed to write parquet file '" + path + "'");
      break;
    case TableFormat::kArrowIpc:
      Unwrap(WriteArrowIpc(path, table), "Failed to write arrow file '" + path + "'");
      break;
    case TableFormat::kCsv:
      if (HasNestedColumn(*table.schema())) {
        throw util::UnsupportedOutputFormat("CSV cannot hold list columns: '" + path + "'. Use .parquet or .arrow");
      }
      Unwrap(WriteCsv(path, table), "Failed to write csv file '" + path + "'");
      break;
  }

  HASHTAX_LOG_DEBUG("Wrote table", {StringField("path", path), IntField("rows", table.num_rows())});
}

std::vector<SketchRecord> ReadSketchTable(const std::string& path, const hashtax::runtime::config::InputConfig& input,
                                          const std::string& source_name) {
  TableDefaults defaults;
  defaults.ksize  = input.default_ksize();
  defaults.scaled = input.default_scaled();
  defaults.source = source_name.empty() ? SourceNameOf(path) : source_name;

  auto table = ReadTable(path);
  return FromArrowTable(*table, defaults);
}

void WriteSketchTable(const std::string& path, const std::vector<SketchRecord>& records, TableLayout layout, Compression compression) {
  WriteTable(path, *ToArrowTable(records, layout), compression);
}

void WriteRankSummary(const std::string& path, const std::vector<RankSummaryRow>& rows, Compression compression) {
  WriteTable(path, *RankSummaryToArrowTable(rows), compression);
}

void WriteKsizeRankSummary(const std::string& path, const std::vector<KsizeRankRow>& rows, Compression compression) {
  WriteTable(path, *KsizeRankSummaryToArrowTable(rows), compression);
}

} // namespace hashtax::table
