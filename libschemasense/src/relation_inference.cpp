#include "relation_inference.hpp"

#include "fingerprint.hpp"

#include <fmt/format.h>
#include <rfl/json.hpp>
#include <spdlog/spdlog.h>

#include <stdexcept>
#include <utility>
#include <vector>

namespace relation_inference {

namespace {

RelationEdge makeEdge(field_profiler::TableProfile const &from,
                      field_profiler::ColumnProfile const &fromColumn,
                      field_profiler::TableProfile const &to,
                      field_profiler::ColumnProfile const &toColumn,
                      Cardinality cardinality) {
  RelationEdge edge;
  edge.from_table_id = from.table_id;
  edge.from_field = fromColumn.name;
  edge.to_table_id = to.table_id;
  edge.to_field = toColumn.name;
  edge.cardinality = cardinality;
  edge.id = relationId(edge.from_table_id, edge.from_field, edge.to_table_id,
                       edge.to_field);
  return edge;
}

} // namespace

RelationEdge RelationEdge::inverse() const {
  RelationEdge edge = *this;
  std::swap(edge.from_table_id, edge.to_table_id);
  std::swap(edge.from_field, edge.to_field);
  edge.cardinality = relation_inference::inverse(cardinality);
  edge.id = relationId(edge.from_table_id, edge.from_field, edge.to_table_id,
                       edge.to_field);
  return edge;
}

Cardinality inverse(Cardinality cardinality) {
  switch (cardinality) {
  case Cardinality::oneToOne:
    return Cardinality::oneToOne;
  case Cardinality::oneToMany:
    return Cardinality::manyToOne;
  case Cardinality::manyToOne:
    return Cardinality::oneToMany;
  }
  return cardinality;
}

std::string toString(Cardinality cardinality) {
  switch (cardinality) {
  case Cardinality::oneToOne:
    return "1:1";
  case Cardinality::oneToMany:
    return "1:m";
  case Cardinality::manyToOne:
    return "m:1";
  }
  return "m:1";
}

Cardinality parseCardinality(std::string const &str) {
  if (str == "1:1")
    return Cardinality::oneToOne;
  if (str == "1:m")
    return Cardinality::oneToMany;
  if (str == "m:1")
    return Cardinality::manyToOne;
  throw std::invalid_argument(fmt::format("Unknown cardinality '{}'", str));
}

std::string relationId(std::string const &from_table_id,
                       std::string const &from_field,
                       std::string const &to_table_id,
                       std::string const &to_field) {
  // field lists are JSON arrays so quotes and backslashes are escaped
  const auto fromFields = rfl::json::write(std::vector<std::string>{from_field});
  const auto toFields = rfl::json::write(std::vector<std::string>{to_field});
  return "rel-inf-" +
         fingerprint::sha1Hex(fmt::format("{}|{}|{}|{}", from_table_id,
                                          fromFields, to_table_id, toFields));
}

RelationInferencer::RelationInferencer(RelationConfig const &config)
    : config(config) {}

bool RelationInferencer::candidate(
    field_profiler::TableProfile const &table) const {
  return !(config.exclude_derived_tables &&
           table.source == catalog::TableSource::derived);
}

bool RelationInferencer::candidate(
    field_profiler::ColumnProfile const &column) const {
  if (config.skip_all_missing_columns &&
      (column.row_count == 0 || column.distinct_count == 0)) {
    return false;
  }
  return true;
}

std::vector<RelationEdge> RelationInferencer::inferRelations(
    std::vector<field_profiler::TableProfile> const &tables) const {
  std::vector<RelationEdge> edges;

  for (std::size_t i = 0; i < tables.size(); ++i) {
    auto const &tableA = tables[i];
    if (!candidate(tableA))
      continue;

    for (std::size_t j = i + 1; j < tables.size(); ++j) {
      auto const &tableB = tables[j];
      if (!candidate(tableB) || tableA.table_id == tableB.table_id)
        continue;

      for (auto const &columnA : tableA.columns) {
        for (auto const &columnB : tableB.columns) {
          if (columnA.name != columnB.name)
            continue;
          if (!candidate(columnA) || !candidate(columnB))
            continue;

          const bool uniqueA = columnA.isKey();
          const bool uniqueB = columnB.isKey();

          if (uniqueA && uniqueB) {
            edges.push_back(makeEdge(tableA, columnA, tableB, columnB,
                                     Cardinality::oneToOne));
          } else if (uniqueA) {
            // B references A: many rows of B per key of A
            edges.push_back(makeEdge(tableB, columnB, tableA, columnA,
                                     Cardinality::manyToOne));
          } else if (uniqueB) {
            edges.push_back(makeEdge(tableA, columnA, tableB, columnB,
                                     Cardinality::manyToOne));
          } else if (config.emit_weak_edges) {
            auto edge = makeEdge(tableA, columnA, tableB, columnB,
                                 Cardinality::manyToOne);
            edge.weak_evidence = true;
            edges.push_back(std::move(edge));
          }
        }
      }
    }
  }

  spdlog::debug("Inferred {} relations between {} tables", edges.size(),
                tables.size());

  return edges;
}

} // namespace relation_inference
