#pragma once

#include <string>
#include <vector>

#include "catalog.hpp"
#include "engine_config.hpp"
#include "field_profiler.hpp"
#include "relation_inference.hpp"
#include "shape_classifier.hpp"

namespace inference_engine {

// Output of one recomputation over a table set. Always replaced as a whole.
struct CatalogAnalysis {
  std::vector<field_profiler::TableProfile> profiles;
  std::vector<relation_inference::RelationEdge> edges;
  // SHA-256 over profiles and edges, equal for equal outputs
  std::string fingerprint;

  field_profiler::TableProfile const *
  findProfile(std::string const &table_id) const;
};

class InferenceEngine {
public:
  explicit InferenceEngine(config::AllConfig const &config = {});

  // Run when the set of tables under consideration changes.
  CatalogAnalysis
  analyzeCatalog(std::vector<catalog::TableSnapshot> const &tables) const;

  // Run when the selected table changes. Throws catalog::CatalogError if
  // `selected_table_id` is not part of `tables`.
  shape_classifier::ShapeAnalysis
  analyzeSelection(std::vector<catalog::TableSnapshot> const &tables,
                   std::string const &selected_table_id) const;

  config::AllConfig const &configuration() const;

private:
  config::AllConfig config;
  field_profiler::FieldProfiler profiler;
  relation_inference::RelationInferencer relations;
  shape_classifier::ShapeClassifier shapes;
};

std::string
fingerprintOf(std::vector<field_profiler::TableProfile> const &profiles,
              std::vector<relation_inference::RelationEdge> const &edges);

} // namespace inference_engine
