#pragma once

#include <array>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace hashtax::taxonomy {

inline constexpr char kRankSeparator = ';';
inline constexpr std::string_view kCodeSeparator = "__";

struct RankInfo {
  std::string_view code;
  std::string_view name;
};

/*
  Fixed rank order, broad to specific.
*/
inline constexpr std::array<RankInfo, 7> kRanks = {{
    {"d", "domain"},
    {"p", "phylum"},
    {"c", "class"},
    {"o", "order"},
    {"f", "family"},
    {"g", "genus"},
    {"s", "species"},
}};

// Splits on ';'. Empty input yields no tokens.
std::vector<std::string> Tokens(std::string_view lineage);

std::string JoinLineage(const std::vector<std::string>& tokens);

// Text before the first "__", or nullopt when the token carries no rank code.
std::optional<std::string> RankCodeOf(std::string_view token);

std::optional<std::string_view> RankNameForCode(std::string_view code);

/*
  Accepts a rank code ("s"), a rank name ("species") or the input-side alias
  "superkingdom". Returns the rank name from kRanks.
*/
std::optional<std::string_view> CanonicalRankName(std::string_view value);

// Position of a rank name in kRanks, or kRanks.size() when unknown.
std::size_t RankIndex(std::string_view rank_name);

/*
  Tokenized lineage string.
*/
class Lineage {
 public:
  Lineage() = default;

  static Lineage Parse(std::string_view lineage);

  std::size_t Depth() const {
    return tokens_.size();
  }

  bool Empty() const {
    return tokens_.empty();
  }

  const std::string& TokenAt(std::size_t index) const {
    return tokens_.at(index);
  }

  std::optional<std::string> RankCodeAt(std::size_t index) const;

  const std::vector<std::string>& tokens() const {
    return tokens_;
  }

  std::string ToString() const;

 private:
  explicit Lineage(std::vector<std::string> tokens) : tokens_(std::move(tokens)) {
  }

  std::vector<std::string> tokens_;
};

} // namespace hashtax::taxonomy
