#pragma once

#include <optional>
#include <string>
#include <vector>

namespace hashtax::table {

enum class TableFormat {
  kParquet,
  kArrowIpc,
  kCsv,
};

const char* FormatName(TableFormat format);

// Detected from the file extension (case-insensitive).
std::optional<TableFormat> FormatFromPath(const std::string& path);

struct ResolvedInputs {
  std::vector<std::string> paths;
  TableFormat              format = TableFormat::kParquet;
};

/*
  Drops inputs that do not exist (with a warning) and checks that the rest
  share one format. Throws NoValidInputFiles when nothing is left,
  UnsupportedInputFormat for unknown extensions and MixedInputFormats when
  formats differ.
*/
ResolvedInputs ResolveInputs(const std::vector<std::string>& paths);

// File name without directories, used as the default source identifier.
std::string SourceNameOf(const std::string& path);

/*
  Source identifier per path, aligned with paths: the file name, or the path
  as given when another input shares that file name.
*/
std::vector<std::string> SourceNamesOf(const std::vector<std::string>& paths);

} // namespace hashtax::table
