#pragma once

#include <cstdint>
#include <string>

namespace hashtax::model {

inline constexpr const char* kCombinedSource = "combined";

inline constexpr const char* kUnclassifiedBucket = "unclassified";
inline constexpr const char* kNoConsensusBucket  = "no_consensus";
inline constexpr const char* kUnrankedBucket     = "unranked";

struct RankSummaryRow {
  std::string   source;
  std::string   rank;
  std::uint64_t count   = 0;
  double        percent = 0.0;
};

struct KsizeRankRow {
  std::uint32_t ksize = 0;
  std::string   rank;
  std::uint64_t count   = 0;
  double        percent = 0.0;
};

} // namespace hashtax::model
