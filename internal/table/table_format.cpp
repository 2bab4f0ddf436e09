#include "internal/table/table_format.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <map>
#include <set>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace hashtax::table {

using hashtax::observability::StringField;

const char* FormatName(TableFormat format) {
  switch (format) {
    case TableFormat::kParquet:
      return "parquet";
    case TableFormat::kArrowIpc:
      return "arrow";
    case TableFormat::kCsv:
      return "csv";
  }
  return "unknown";
}

std::optional<TableFormat> FormatFromPath(const std::string& path) {
  auto extension = std::filesystem::path(path).extension().string();
  std::transform(extension.begin(), extension.end(), extension.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

  if (extension == ".parquet" || extension == ".pq") {
    return TableFormat::kParquet;
  }
  if (extension == ".arrow" || extension == ".feather" || extension == ".ipc") {
    return TableFormat::kArrowIpc;
  }
  if (extension == ".csv") {
    return TableFormat::kCsv;
  }
  return std::nullopt;
}

ResolvedInputs ResolveInputs(const std::vector<std::string>& paths) {
  ResolvedInputs            resolved;
  std::optional<TableFormat> shared_format;

  for (const auto& path : paths) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
      HASHTAX_LOG_WARN("Skipping missing input", {StringField("path", path)});
      continue;
    }

    auto format = FormatFromPath(path);
    if (!format) {
      throw util::UnsupportedInputFormat("Unsupported input file extension: '" + path + "'. Use .parquet, .arrow or .csv");
    }

    if (shared_format && *shared_format != *format) {
      throw util::MixedInputFormats("Input files mix " + std::string(FormatName(*shared_format)) + " and " + FormatName(*format) +
                                    " tables; convert them to one format first");
    }
    shared_format = format;
    resolved.paths.push_back(path);
  }

  if (resolved.paths.empty()) {
    throw util::NoValidInputFiles("None of the " + std::to_string(paths.size()) + " input path(s) is a readable file");
  }

  resolved.format = *shared_format;
  return resolved;
}

std::string SourceNameOf(const std::string& path) {
  auto name = std::filesystem::path(path).filename().string();
  return name.empty() ? path : name;
}

std::vector<std::string> SourceNamesOf(const std::vector<std::string>& paths) {
  std::map<std::string, std::set<std::string>> paths_by_name;
  for (const auto& path : paths) {
    paths_by_name[SourceNameOf(path)].insert(path);
  }

  std::vector<std::string> names;
  names.reserve(paths.size());
  for (const auto& path : paths) {
    auto name = SourceNameOf(path);
    names.push_back(paths_by_name[name].size() > 1 ? path : name);
  }
  return names;
}

} // namespace hashtax::table
