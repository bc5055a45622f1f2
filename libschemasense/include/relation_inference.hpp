#pragma once

#include <string>
#include <vector>

#include "field_profiler.hpp"

namespace relation_inference {

struct RelationConfig {
  // merge/reshape results repeat their sources' columns
  bool exclude_derived_tables = false;
  // skip a pair when either column holds no values at all
  bool skip_all_missing_columns = false;
  // emit name matches where neither side is unique
  bool emit_weak_edges = true;
};

enum class Cardinality { oneToOne, oneToMany, manyToOne };

struct RelationEdge {
  std::string id;

  // referencing side
  std::string from_table_id;
  std::string from_field;

  // referenced (key) side
  std::string to_table_id;
  std::string to_field;

  Cardinality cardinality = Cardinality::manyToOne;

  // no unique column on either side, the edge only reflects a shared name
  bool weak_evidence = false;

  // The same relation read from the other end, e.g. customers 1:m orders for
  // an orders m:1 customers edge.
  RelationEdge inverse() const;

  bool operator==(RelationEdge const &) const = default;
};

class RelationInferencer {
public:
  explicit RelationInferencer(RelationConfig const &config = {});

  // Pairwise name matching over every unordered pair of tables. The result is
  // replaced wholesale on every call and is ordered by table input order, then
  // by column order of the first and second table.
  std::vector<RelationEdge>
  inferRelations(std::vector<field_profiler::TableProfile> const &tables) const;

private:
  RelationConfig config;

  bool candidate(field_profiler::TableProfile const &table) const;
  bool candidate(field_profiler::ColumnProfile const &column) const;
};

Cardinality inverse(Cardinality cardinality);

std::string toString(Cardinality cardinality);

Cardinality parseCardinality(std::string const &str);

std::string relationId(std::string const &from_table_id,
                       std::string const &from_field,
                       std::string const &to_table_id,
                       std::string const &to_field);

} // namespace relation_inference
