#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace hashtax::model {

/*
  One (hash, ksize) observation from one source database.

  dataset_names has set semantics; merged rows store it sorted.
  taxonomy_list is a multiset of lineage strings, absent when no taxonomy
  was supplied for the row.
*/
struct SketchRecord {
  std::uint64_t hash  = 0;
  std::uint32_t ksize = 0;

  // null when the contributing rows disagreed
  std::optional<std::uint64_t> scaled;

  std::vector<std::string>                dataset_names;
  std::optional<std::vector<std::string>> taxonomy_list;

  std::optional<std::string> lca_lineage;
  std::optional<std::string> lca_rank;

  std::string source;
};

struct HashKey {
  std::uint64_t hash  = 0;
  std::uint32_t ksize = 0;

  bool operator==(const HashKey& other) const {
    return hash == other.hash && ksize == other.ksize;
  }
};

inline HashKey KeyOf(const SketchRecord& record) {
  return {record.hash, record.ksize};
}

struct HashKeyHasher {
  std::size_t operator()(const HashKey& key) const {
    // hashes are already well mixed; fold ksize into the low bits
    return std::hash<std::uint64_t>{}(key.hash ^ (static_cast<std::uint64_t>(key.ksize) * 0x9E3779B97F4A7C15ULL));
  }
};

} // namespace hashtax::model
