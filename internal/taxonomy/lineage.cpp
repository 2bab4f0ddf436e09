#include "internal/taxonomy/lineage.hpp"

namespace hashtax::taxonomy {

std::vector<std::string> Tokens(std::string_view lineage) {
  std::vector<std::string> tokens;
  if (lineage.empty()) {
    return tokens;
  }

  std::size_t start = 0;
  while (true) {
    const auto pos = lineage.find(kRankSeparator, start);
    if (pos == std::string_view::npos) {
      tokens.emplace_back(lineage.substr(start));
      break;
    }
    tokens.emplace_back(lineage.substr(start, pos - start));
    start = pos + 1;
  }
  return tokens;
}

std::string JoinLineage(const std::vector<std::string>& tokens) {
  std::string joined;
  for (std::size_t i = 0; i < tokens.size(); ++i) {
    if (i > 0) joined.push_back(kRankSeparator);
    joined += tokens[i];
  }
  return joined;
}

std::optional<std::string> RankCodeOf(std::string_view token) {
  const auto pos = token.find(kCodeSeparator);
  if (pos == std::string_view::npos) {
    return std::nullopt;
  }
  return std::string(token.substr(0, pos));
}

std::optional<std::string_view> RankNameForCode(std::string_view code) {
  for (const auto& rank : kRanks) {
    if (rank.code == code) return rank.name;
  }
  return std::nullopt;
}

std::optional<std::string_view> CanonicalRankName(std::string_view value) {
  if (auto name = RankNameForCode(value)) {
    return name;
  }
  if (value == "superkingdom") {
    return kRanks.front().name;
  }
  for (const auto& rank : kRanks) {
    if (rank.name == value) return rank.name;
  }
  return std::nullopt;
}

std::size_t RankIndex(std::string_view rank_name) {
  for (std::size_t i = 0; i < kRanks.size(); ++i) {
    if (kRanks[i].name == rank_name) return i;
  }
  return kRanks.size();
}

// ------------------------------------------------------------
// Lineage
// ------------------------------------------------------------

Lineage Lineage::Parse(std::string_view lineage) {
  return Lineage(Tokens(lineage));
}

std::optional<std::string> Lineage::RankCodeAt(std::size_t index) const {
  if (index >= tokens_.size()) return std::nullopt;
  return RankCodeOf(tokens_[index]);
}

std::string Lineage::ToString() const {
  return JoinLineage(tokens_);
}

} // namespace hashtax::taxonomy
