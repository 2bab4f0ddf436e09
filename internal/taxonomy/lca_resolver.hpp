#pragma once

#include <optional>
#include <string>
#include <vector>

namespace hashtax::taxonomy {

struct LcaResult {
  std::optional<std::string> lineage;
  std::optional<std::string> rank_code;

  bool Found() const {
    return lineage.has_value();
  }
};

/*
  Lowest common ancestor of a multiset of lineage strings.

  Walks rank positions up to the shallowest lineage and keeps every token on
  which all lineages agree verbatim. Empty entries are ignored. Returns two
  nulls when nothing is left to compare or the lineages already disagree at
  the first position. Input order does not affect the result.
*/
LcaResult ComputeLca(const std::vector<std::string>& lineages);

} // namespace hashtax::taxonomy
