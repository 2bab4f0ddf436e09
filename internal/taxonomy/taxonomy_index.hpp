#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "internal/model/sketch_record.hpp"

namespace hashtax::taxonomy {

/*
  ident -> lineage lookup built from a lineage CSV.

  Header: ident plus any of domain (or superkingdom), phylum, class, order,
  family, genus, species. The lineage of a row is its non-empty rank cells
  joined with ';' in rank order.
*/
class TaxonomyIndex {
 public:
  TaxonomyIndex() = default;

  // Throws FileNotFound, MissingColumn or EmptyInput.
  static TaxonomyIndex Load(const std::string& path);

  void Insert(std::string ident, std::string lineage);

  std::optional<std::string_view> Find(std::string_view ident) const;

  std::size_t Size() const {
    return lineages_.size();
  }

 private:
  std::unordered_map<std::string, std::string> lineages_;
};

// First whitespace-delimited token of a dataset name.
std::string_view AccessionOf(std::string_view dataset_name);

/*
  Sets taxonomy_list (one lineage per dataset name with a known accession,
  in dataset_names order) and the LCA fields of every record.
*/
void Annotate(std::vector<model::SketchRecord>& records, const TaxonomyIndex& index);

// Computes the LCA fields of records that carry a non-empty taxonomy_list
// but no lca_lineage yet (tables written before annotation).
void ResolveMissingLca(std::vector<model::SketchRecord>& records);

} // namespace hashtax::taxonomy
