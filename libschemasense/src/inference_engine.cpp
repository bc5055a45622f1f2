#include "inference_engine.hpp"

#include "fingerprint.hpp"

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <algorithm>

namespace inference_engine {

field_profiler::TableProfile const *
CatalogAnalysis::findProfile(std::string const &table_id) const {
  auto it = std::find_if(profiles.begin(), profiles.end(),
                         [&table_id](auto const &p) {
                           return p.table_id == table_id;
                         });
  return it == profiles.end() ? nullptr : &*it;
}

InferenceEngine::InferenceEngine(config::AllConfig const &config)
    : config(config), profiler(config.profiler), relations(config.relations),
      shapes(config.shape) {}

config::AllConfig const &InferenceEngine::configuration() const {
  return config;
}

CatalogAnalysis InferenceEngine::analyzeCatalog(
    std::vector<catalog::TableSnapshot> const &tables) const {
  CatalogAnalysis analysis;
  analysis.profiles.reserve(tables.size());

  for (auto const &table : tables) {
    analysis.profiles.push_back(profiler.profileTable(table));
  }

  analysis.edges = relations.inferRelations(analysis.profiles);
  analysis.fingerprint = fingerprintOf(analysis.profiles, analysis.edges);

  spdlog::info("Analyzed {} tables: {} relations, fingerprint {}",
               tables.size(), analysis.edges.size(),
               analysis.fingerprint.substr(0, 12));

  return analysis;
}

shape_classifier::ShapeAnalysis InferenceEngine::analyzeSelection(
    std::vector<catalog::TableSnapshot> const &tables,
    std::string const &selected_table_id) const {
  auto it = std::find_if(tables.begin(), tables.end(),
                         [&selected_table_id](auto const &t) {
                           return t.id == selected_table_id;
                         });
  if (it == tables.end()) {
    throw catalog::CatalogError(
        "unknown-table",
        fmt::format("Selected table {} is not part of the catalog",
                    selected_table_id));
  }

  auto profile = profiler.profileTable(*it);
  return shapes.classifyShape(*it, profile.columns);
}

std::string
fingerprintOf(std::vector<field_profiler::TableProfile> const &profiles,
              std::vector<relation_inference::RelationEdge> const &edges) {
  fingerprint::Fingerprint fp;

  for (auto const &table : profiles) {
    fp.add("table").add(table.table_id).add(table.primary_key.value_or(""));
    fp.endRecord();
    for (auto const &col : table.columns) {
      fp.add(col.name)
          .add(catalog::toString(col.declared_type))
          .add(std::to_string(col.row_count))
          .add(std::to_string(col.distinct_count))
          .add(std::to_string(col.missing_count))
          .add(fmt::format("{}{}{}{}", static_cast<int>(col.is_nullable),
                           static_cast<int>(col.is_strict_unique),
                           static_cast<int>(col.is_identity_like),
                           static_cast<int>(col.is_primary_key_candidate)));
      for (auto anomaly : col.anomalies) {
        fp.add(field_profiler::toString(anomaly));
      }
      fp.endRecord();
    }
  }

  for (auto const &edge : edges) {
    fp.add("edge")
        .add(edge.id)
        .add(relation_inference::toString(edge.cardinality))
        .add(edge.weak_evidence ? "weak" : "keyed");
    fp.endRecord();
  }

  return fp.hex();
}

} // namespace inference_engine
