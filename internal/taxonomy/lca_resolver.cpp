#include "internal/taxonomy/lca_resolver.hpp"

#include <algorithm>

#include "internal/taxonomy/lineage.hpp"

namespace hashtax::taxonomy {

LcaResult ComputeLca(const std::vector<std::string>& lineages) {
  std::vector<Lineage> parsed;
  parsed.reserve(lineages.size());
  for (const auto& lineage : lineages) {
    if (lineage.empty()) continue;
    auto tokens = Lineage::Parse(lineage);
    if (!tokens.Empty()) parsed.push_back(std::move(tokens));
  }

  if (parsed.empty()) {
    return {};
  }

  const auto shallowest = std::min_element(parsed.begin(), parsed.end(), [](const Lineage& a, const Lineage& b) { return a.Depth() < b.Depth(); });
  const std::size_t min_depth = shallowest->Depth();

  std::vector<std::string> common;
  for (std::size_t i = 0; i < min_depth; ++i) {
    const auto& token = parsed.front().TokenAt(i);
    const bool  agree = std::all_of(parsed.begin(), parsed.end(), [&](const Lineage& lineage) { return lineage.TokenAt(i) == token; });
    if (!agree) break;
    common.push_back(token);
  }

  if (common.empty()) {
    return {};
  }

  LcaResult result;
  result.rank_code = RankCodeOf(common.back());
  result.lineage   = JoinLineage(common);
  return result;
}

} // namespace hashtax::taxonomy
