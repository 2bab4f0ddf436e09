#include "internal/pipeline/export_pipeline.hpp"

#include <filesystem>
#include <iterator>
#include <optional>
#include <utility>

#include "internal/observability/logging.hpp"
#include "internal/table/sketch_table.hpp"
#include "internal/table/table_format.hpp"
#include "internal/taxonomy/taxonomy_index.hpp"

namespace hashtax::pipeline {

using hashtax::observability::IntField;
using hashtax::observability::StringField;
using model::SketchRecord;

namespace {

void LogMergeStats(const std::string& source, const merge::MergeStats& stats) {
  HASHTAX_LOG_INFO("Merged duplicated hashes", {StringField("source", source), IntField("duplicated_rows", static_cast<std::int64_t>(stats.duplicated_rows)),
                                                IntField("unique_rows", static_cast<std::int64_t>(stats.unique_rows)),
                                                IntField("merged_rows", static_cast<std::int64_t>(stats.merged_groups))});
}

void LogRankSummary(const std::vector<model::RankSummaryRow>& rows) {
  HASHTAX_LOG_INFO("--- LCA Summary ---");
  for (const auto& line : summary::FormatRankSummary(rows, model::kCombinedSource)) {
    HASHTAX_LOG_INFO(line);
  }
  HASHTAX_LOG_INFO("-------------------");
}

bool CarriesTaxonomy(const std::vector<SketchRecord>& records) {
  for (const auto& record : records) {
    if (record.taxonomy_list || record.lca_lineage) return true;
  }
  return false;
}

} // namespace

ExportPipeline::ExportPipeline(hashtax::runtime::config::RuntimeConfig config) : config_(std::move(config)) {
}

// ------------------------------------------------------------
// Export
// ------------------------------------------------------------

ExportResult ExportPipeline::Run(const ExportRequest& request) const {
  const auto resolved = table::ResolveInputs(request.inputs);

  std::optional<taxonomy::TaxonomyIndex> taxonomy_index;
  const auto& taxonomy_path = request.taxonomy_path.empty() ? config_.taxonomy().path() : request.taxonomy_path;
  if (!taxonomy_path.empty()) {
    taxonomy_index = taxonomy::TaxonomyIndex::Load(taxonomy_path);
  }

  ExportResult          result;
  summary::SourceTables sources;
  bool                  has_taxonomy = taxonomy_index.has_value();

  // merged once per source, so a file listed twice still yields one row per key
  const auto            source_names = table::SourceNamesOf(resolved.paths);
  summary::SourceTables raw_sources;

  for (std::size_t i = 0; i < resolved.paths.size(); ++i) {
    auto records = table::ReadSketchTable(resolved.paths[i], config_.input(), source_names[i]);
    result.input_rows += records.size();

    if (taxonomy_index) {
      taxonomy::Annotate(records, *taxonomy_index);
    } else {
      has_taxonomy = has_taxonomy || CarriesTaxonomy(records);
      taxonomy::ResolveMissingLca(records);
    }

    auto& source_rows = raw_sources[source_names[i]];
    source_rows.insert(source_rows.end(), std::make_move_iterator(records.begin()), std::make_move_iterator(records.end()));
  }

  for (const auto& [source, records] : raw_sources) {
    merge::MergeStats stats;
    sources[source] = merge::MergeDuplicates(records, &stats);
    LogMergeStats(source, stats);
  }

  result.summary = summary::SummarizeRanks(sources);

  std::vector<SketchRecord> all;
  for (auto& [source, records] : sources) {
    all.insert(all.end(), records.begin(), records.end());
  }

  auto merged        = merge::MergeDuplicates(all, &result.merge_stats);
  result.output_rows = merged.size();
  LogMergeStats(model::kCombinedSource, result.merge_stats);

  const auto layout = request.names_only || config_.output().names_only() ? table::TableLayout::kNamesOnly : table::TableLayout::kFull;
  table::WriteSketchTable(request.output, merged, layout, config_.output().compression());
  HASHTAX_LOG_INFO("Exported merged table", {StringField("path", request.output), IntField("rows", static_cast<std::int64_t>(merged.size()))});

  if (!request.lca_info_path.empty()) {
    table::WriteRankSummary(request.lca_info_path, result.summary, config_.output().compression());
    HASHTAX_LOG_INFO("Wrote rank summary", {StringField("path", request.lca_info_path)});
  }

  if (has_taxonomy) {
    LogRankSummary(result.summary);
  }
  return result;
}

// ------------------------------------------------------------
// Single commands
// ------------------------------------------------------------

std::vector<SketchRecord> ExportPipeline::Merge(const std::string& input, const std::string& output) const {
  const auto resolved = table::ResolveInputs({input});
  auto       records  = table::ReadSketchTable(resolved.paths.front(), config_.input());
  taxonomy::ResolveMissingLca(records);

  merge::MergeStats stats;
  auto              merged = merge::MergeDuplicates(records, &stats);
  LogMergeStats(table::SourceNameOf(input), stats);

  const auto layout = config_.output().names_only() ? table::TableLayout::kNamesOnly : table::TableLayout::kFull;
  table::WriteSketchTable(output, merged, layout, config_.output().compression());
  HASHTAX_LOG_INFO("Wrote merged results", {StringField("path", output)});
  return merged;
}

std::vector<model::RankSummaryRow> ExportPipeline::Summarize(const std::vector<std::string>& inputs, const std::string& output) const {
  auto rows = summary::SummarizeRanks(LoadSources(inputs));
  table::WriteRankSummary(output, rows, config_.output().compression());
  LogRankSummary(rows);
  return rows;
}

std::vector<model::KsizeRankRow> ExportPipeline::KsizeRanks(const std::vector<std::string>& inputs, const std::string& output) const {
  std::vector<SketchRecord> all;
  for (auto& [source, records] : LoadSources(inputs)) {
    all.insert(all.end(), std::make_move_iterator(records.begin()), std::make_move_iterator(records.end()));
  }

  auto rows = summary::SummarizeRanksByKsize(all);
  table::WriteKsizeRankSummary(output, rows, config_.output().compression());
  HASHTAX_LOG_INFO("Wrote ksize rank distribution", {StringField("path", output), IntField("rows", static_cast<std::int64_t>(rows.size()))});
  return rows;
}

summary::SourceTables ExportPipeline::LoadSources(const std::vector<std::string>& inputs) const {
  const auto resolved     = table::ResolveInputs(inputs);
  const auto source_names = table::SourceNamesOf(resolved.paths);

  summary::SourceTables sources;
  for (std::size_t i = 0; i < resolved.paths.size(); ++i) {
    auto records = table::ReadSketchTable(resolved.paths[i], config_.input(), source_names[i]);
    taxonomy::ResolveMissingLca(records);

    auto& source_rows = sources[source_names[i]];
    source_rows.insert(source_rows.end(), std::make_move_iterator(records.begin()), std::make_move_iterator(records.end()));
  }

  // merging is a no-op on tables that are already merged
  for (auto& [source, records] : sources) {
    records = merge::MergeDuplicates(records);
  }
  return sources;
}

std::string DefaultOutputPath(const std::string& first_input) {
  return std::filesystem::path(first_input).stem().string() + ".merged.parquet";
}

} // namespace hashtax::pipeline
