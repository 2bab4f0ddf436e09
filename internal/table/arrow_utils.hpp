#pragma once

#include <arrow/array.h>
#include <arrow/result.h>
#include <arrow/status.h>
#include <arrow/util/compression.h>

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "config/config.pb.h"

namespace hashtax::table {

/*
  Helper: unwrap Arrow Result<T> or throw std::runtime_error
*/
template <typename T>
T Unwrap(arrow::Result<T> result, const std::string& context) {
  if (!result.ok()) throw std::runtime_error(context + ": " + result.status().ToString());
  return std::move(result).ValueUnsafe();
}

inline void Unwrap(const arrow::Status& status, const std::string& context) {
  if (!status.ok()) throw std::runtime_error(context + ": " + status.ToString());
}

arrow::Result<arrow::Compression::type> ResolveCompression(hashtax::runtime::config::Compression compression);

/*
  Typed cell access that tolerates the physical variants different writers
  produce (any integer width, string / large_string, list / large_list).
*/
bool IsIntegerColumn(const arrow::DataType& type);
bool IsStringColumn(const arrow::DataType& type);
bool IsStringListColumn(const arrow::DataType& type);

std::optional<std::uint64_t> IntegerAt(const arrow::Array& array, int64_t row);
std::optional<std::string>   StringAt(const arrow::Array& array, int64_t row);

// A scalar string cell is read as a one element list.
std::optional<std::vector<std::string>> StringListAt(const arrow::Array& array, int64_t row);

} // namespace hashtax::table
