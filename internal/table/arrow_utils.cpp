#include "arrow_utils.hpp"

#include <arrow/array/array_nested.h>
#include <arrow/array/array_primitive.h>
#include <arrow/type.h>

namespace hashtax::table {

namespace {

template <typename ListArrayType>
std::vector<std::string> CollectStrings(const ListArrayType& list, int64_t row) {
  std::vector<std::string> out;

  const auto& values = *list.values();
  const auto  begin  = list.value_offset(row);
  const auto  end    = begin + list.value_length(row);
  out.reserve(static_cast<std::size_t>(end - begin));

  for (auto i = begin; i < end; ++i) {
    if (auto value = StringAt(values, i)) out.push_back(std::move(*value));
  }
  return out;
}

} // namespace

arrow::Result<arrow::Compression::type> ResolveCompression(hashtax::runtime::config::Compression compression) {
  using namespace hashtax::runtime::config;

  switch (compression) {
    case COMPRESSION_UNCOMPRESSED:
      return arrow::Compression::UNCOMPRESSED;
    case COMPRESSION_SNAPPY:
      return arrow::Compression::SNAPPY;
    case COMPRESSION_GZIP:
      return arrow::Compression::GZIP;
    case COMPRESSION_BROTLI:
      return arrow::Compression::BROTLI;
    case COMPRESSION_ZSTD:
      return arrow::Compression::ZSTD;
    case COMPRESSION_LZ4:
      return arrow::Compression::LZ4;
    case COMPRESSION_LZ4_FRAME:
      return arrow::Compression::LZ4_FRAME;
    case COMPRESSION_LZO:
      return arrow::Compression::LZO;
    case COMPRESSION_BZ2:
      return arrow::Compression::BZ2;
    case COMPRESSION_AUTO:
    default: {
      if (arrow::util::Codec::IsAvailable(arrow::Compression::SNAPPY)) {
        return arrow::Compression::SNAPPY;
      }
      return arrow::Compression::UNCOMPRESSED;
    }
  }
}

bool IsIntegerColumn(const arrow::DataType& type) {
  switch (type.id()) {
    case arrow::Type::UINT8:
    case arrow::Type::UINT16:
    case arrow::Type::UINT32:
    case arrow::Type::UINT64:
    case arrow::Type::INT8:
    case arrow::Type::INT16:
    case arrow::Type::INT32:
    case arrow::Type::INT64:
    case arrow::Type::NA:
      return true;
    default:
      return false;
  }
}

bool IsStringColumn(const arrow::DataType& type) {
  return type.id() == arrow::Type::STRING || type.id() == arrow::Type::LARGE_STRING || type.id() == arrow::Type::NA;
}

bool IsStringListColumn(const arrow::DataType& type) {
  if (type.id() == arrow::Type::LIST) {
    return IsStringColumn(*static_cast<const arrow::ListType&>(type).value_type());
  }
  if (type.id() == arrow::Type::LARGE_LIST) {
    return IsStringColumn(*static_cast<const arrow::LargeListType&>(type).value_type());
  }
  return IsStringColumn(type);
}

std::optional<std::uint64_t> IntegerAt(const arrow::Array& array, int64_t row) {
  if (array.IsNull(row)) return std::nullopt;

  switch (array.type_id()) {
    case arrow::Type::UINT8:
      return static_cast<const arrow::UInt8Array&>(array).Value(row);
    case arrow::Type::UINT16:
      return static_cast<const arrow::UInt16Array&>(array).Value(row);
    case arrow::Type::UINT32:
      return static_cast<const arrow::UInt32Array&>(array).Value(row);
    case arrow::Type::UINT64:
      return static_cast<const arrow::UInt64Array&>(array).Value(row);
    case arrow::Type::INT8:
      return static_cast<std::uint64_t>(static_cast<const arrow::Int8Array&>(array).Value(row));
    case arrow::Type::INT16:
      return static_cast<std::uint64_t>(static_cast<const arrow::Int16Array&>(array).Value(row));
    case arrow::Type::INT32:
      return static_cast<std::uint64_t>(static_cast<const arrow::Int32Array&>(array).Value(row));
    case arrow::Type::INT64:
      return static_cast<std::uint64_t>(static_cast<const arrow::Int64Array&>(array).Value(row));
    default:
      return std::nullopt;
  }
}

std::optional<std::string> StringAt(const arrow::Array& array, int64_t row) {
  if (array.IsNull(row)) return std::nullopt;

  switch (array.type_id()) {
    case arrow::Type::STRING:
      return static_cast<const arrow::StringArray&>(array).GetString(row);
    case arrow::Type::LARGE_STRING:
      return static_cast<const arrow::LargeStringArray&>(array).GetString(row);
    default:
      return std::nullopt;
  }
}

std::optional<std::vector<std::string>> StringListAt(const arrow::Array& array, int64_t row) {
  if (array.IsNull(row)) return std::nullopt;

  switch (array.type_id()) {
    case arrow::Type::LIST:
      return CollectStrings(static_cast<const arrow::ListArray&>(array), row);
    case arrow::Type::LARGE_LIST:
      return CollectStrings(static_cast<const arrow::LargeListArray&>(array), row);
    case arrow::Type::STRING:
    case arrow::Type::LARGE_STRING:
      return std::vector<std::string>{*StringAt(array, row)};
    default:
      return std::nullopt;
  }
}

} // namespace hashtax::table
