#include "catalog_io.hpp"

#include "merge_planner.hpp"

#include <fmt/format.h>
#include <rfl.hpp>
#include <rfl/json.hpp>
#include <spdlog/spdlog.h>

#include <cstdint>
#include <fstream>
#include <sstream>

namespace catalog_io {

namespace {

struct ColumnDocument {
  std::optional<std::string> name;
  std::optional<std::string> type;
  std::optional<bool> nullable;
  std::optional<bool> foreign_key;
  std::optional<std::int64_t> rows;
  std::optional<std::int64_t> distinct;
  std::optional<std::int64_t> missing;
  std::optional<std::int64_t> min;
  std::optional<std::int64_t> max;
};

struct TableDocument {
  std::optional<std::string> id;
  std::optional<std::string> name;
  std::optional<std::string> source;
  std::optional<std::string> primary_key;
  std::vector<ColumnDocument> columns;
};

struct CatalogDocument {
  std::vector<TableDocument> tables;
};

struct ColumnProfileDocument {
  std::string name;
  std::string type;
  std::uint64_t rows;
  std::uint64_t distinct;
  std::uint64_t missing;
  double missing_rate;
  bool nullable;
  bool unique;
  bool identity;
  bool primary_key;
  std::vector<std::string> anomalies;
};

struct TableProfileDocument {
  std::string id;
  std::string name;
  std::string source;
  std::optional<std::string> primary_key;
  std::vector<ColumnProfileDocument> columns;
};

struct RelationDocument {
  std::string id;
  std::string from_table;
  std::string from_field;
  std::string to_table;
  std::string to_field;
  std::string cardinality;
  bool weak_evidence;
};

struct MergeDocument {
  std::string relation_id;
  std::string left_table;
  std::string right_table;
  std::vector<std::string> left_keys;
  std::vector<std::string> right_keys;
  std::string join_type;
  std::string how;
  bool low_confidence;
};

struct ShapeDocument {
  std::string table_id;
  std::string shape;
  std::string recommended_direction;
  std::string rule;
  std::string pattern;
  std::optional<std::string> affix;
  std::string reason;
  std::vector<std::string> id_vars;
  std::vector<std::string> value_vars;
  std::vector<std::string> unassigned;
};

struct ReshapeDocument {
  std::string direction;
  std::vector<std::string> id_vars;
  std::vector<std::string> value_vars;
  std::string variable_name;
  std::string value_name;
  bool ready;
  std::vector<std::string> errors;
  std::vector<std::string> warnings;
};

struct ReportDocument {
  std::string fingerprint;
  std::vector<TableProfileDocument> tables;
  std::vector<RelationDocument> relations;
  std::vector<MergeDocument> merges;
  std::optional<ShapeDocument> shape;
  std::optional<ReshapeDocument> reshape;
};

catalog::Column convertColumn(ColumnDocument const &doc,
                              std::string const &table_id) {
  if (!doc.name || doc.name->empty()) {
    throw catalog::CatalogError(
        "missing-column-name",
        fmt::format("Table {} contains a column without a name", table_id));
  }
  if (!doc.type) {
    throw catalog::CatalogError(
        "missing-column-type",
        fmt::format("Column {}.{} has no type", table_id, *doc.name));
  }

  catalog::Column column;
  column.name = *doc.name;
  column.declared_type = catalog::parseColumnType(*doc.type);
  column.nullable_hint = doc.nullable;
  column.foreign_key_hint = doc.foreign_key.value_or(false);
  column.row_count = doc.rows.value_or(0);
  column.distinct_count = doc.distinct.value_or(0);
  column.missing_count = doc.missing.value_or(0);
  column.min_value = doc.min;
  column.max_value = doc.max;
  return column;
}

catalog::TableSnapshot convertTable(TableDocument const &doc) {
  if (!doc.id || doc.id->empty()) {
    throw catalog::CatalogError(
        "missing-table-id",
        fmt::format("Table '{}' has no id", doc.name.value_or("")));
  }

  catalog::TableSnapshot table;
  table.id = *doc.id;
  table.name = doc.name.value_or(*doc.id);
  table.source = catalog::parseTableSource(doc.source.value_or("imported"));
  table.declared_primary_key = doc.primary_key;

  for (auto const &col : doc.columns) {
    table.columns.push_back(convertColumn(col, table.id));
  }

  catalog::validate(table);
  return table;
}

ColumnProfileDocument
convertProfile(field_profiler::ColumnProfile const &profile) {
  ColumnProfileDocument doc;
  doc.name = profile.name;
  doc.type = catalog::toString(profile.declared_type);
  doc.rows = profile.row_count;
  doc.distinct = profile.distinct_count;
  doc.missing = profile.missing_count;
  doc.missing_rate = profile.missing_rate;
  doc.nullable = profile.is_nullable;
  doc.unique = profile.is_strict_unique;
  doc.identity = profile.is_identity_like;
  doc.primary_key = profile.is_primary_key_candidate;
  for (auto anomaly : profile.anomalies) {
    doc.anomalies.push_back(field_profiler::toString(anomaly));
  }
  return doc;
}

ShapeDocument convertShape(shape_classifier::ShapeAnalysis const &shape) {
  ShapeDocument doc;
  doc.table_id = shape.table_id;
  doc.shape = shape_classifier::toString(shape.shape);
  doc.recommended_direction =
      shape_classifier::toString(shape.recommended_direction);
  doc.rule = shape_classifier::toString(shape.rule);
  doc.pattern = shape_classifier::toString(shape.naming.pattern);
  if (!shape.naming.affix.empty()) {
    doc.affix = shape.naming.affix;
  }
  doc.reason = shape.reason;
  doc.id_vars = shape.suggested_id_vars;
  doc.value_vars = shape.suggested_value_vars;
  doc.unassigned = shape.unassigned;
  return doc;
}

} // namespace

std::vector<catalog::TableSnapshot> parseCatalog(std::string const &json) {
  CatalogDocument doc;
  try {
    doc = rfl::json::read<CatalogDocument>(json).value();
  } catch (const std::exception &e) {
    throw catalog::CatalogError(
        "catalog-read-failed",
        fmt::format("Invalid catalog document: {}", e.what()));
  }

  std::vector<catalog::TableSnapshot> tables;
  tables.reserve(doc.tables.size());
  for (auto const &table : doc.tables) {
    tables.push_back(convertTable(table));
  }

  spdlog::debug("Parsed catalog with {} tables", tables.size());
  return tables;
}

std::vector<catalog::TableSnapshot>
readCatalog(std::filesystem::path const &file) {
  std::ifstream in(file);
  if (!in.is_open()) {
    throw catalog::CatalogError(
        "catalog-read-failed",
        fmt::format("Failed to open catalog file: {}", file.string()));
  }

  std::stringstream buffer;
  buffer << in.rdbuf();
  return parseCatalog(buffer.str());
}

std::string renderReport(inference_engine::CatalogAnalysis const &analysis,
                         std::optional<SelectionReport> const &selection) {
  ReportDocument report;
  report.fingerprint = analysis.fingerprint;

  for (auto const &table : analysis.profiles) {
    TableProfileDocument doc;
    doc.id = table.table_id;
    doc.name = table.table_name;
    doc.source = catalog::toString(table.source);
    doc.primary_key = table.primary_key;
    for (auto const &col : table.columns) {
      doc.columns.push_back(convertProfile(col));
    }
    report.tables.push_back(std::move(doc));
  }

  for (auto const &edge : analysis.edges) {
    report.relations.push_back(RelationDocument{
        edge.id, edge.from_table_id, edge.from_field, edge.to_table_id,
        edge.to_field, relation_inference::toString(edge.cardinality),
        edge.weak_evidence});
  }

  for (auto const &edge : analysis.edges) {
    auto const draft = merge_planner::draftMerge(edge);
    report.merges.push_back(MergeDocument{
        draft.relation_id, draft.left_table_id, draft.right_table_id,
        draft.left_keys, draft.right_keys,
        relation_inference::toString(draft.join_type),
        merge_planner::toString(draft.how), draft.low_confidence});
  }

  if (selection) {
    report.shape = convertShape(selection->shape);

    auto const &draft = selection->draft;
    report.reshape = ReshapeDocument{
        shape_classifier::toString(draft.direction),
        draft.id_vars,
        draft.value_vars,
        draft.variable_name,
        draft.value_name,
        selection->validation.ok(),
        selection->validation.errors,
        selection->validation.warnings};
  }

  return rfl::json::write(report);
}

} // namespace catalog_io
