#include "catalog.hpp"

#include <boost/algorithm/string/case_conv.hpp>
#include <boost/algorithm/string/trim.hpp>
#include <fmt/format.h>
#include <rfl.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <set>

namespace catalog {

CatalogError::CatalogError(std::string const &name, std::string const &message)
    : std::runtime_error(message), errorName(name) {}

std::string const &CatalogError::name() const noexcept { return errorName; }

Column const *TableSnapshot::findColumn(std::string const &columnName) const {
  auto it = std::find_if(
      columns.begin(), columns.end(),
      [&columnName](Column const &col) { return col.name == columnName; });
  return it == columns.end() ? nullptr : &*it;
}

bool isNumeric(ColumnType type) {
  return type == ColumnType::INTEGER || type == ColumnType::FLOAT;
}

ColumnType parseColumnType(std::string const &type_name) {
  std::string name = boost::algorithm::to_lower_copy(
      boost::algorithm::trim_copy(type_name));

  // varchar(20), decimal(10,2), ...
  const auto paren = name.find('(');
  if (paren != std::string::npos) {
    name = boost::algorithm::trim_copy(name.substr(0, paren));
  }

  if (name.empty()) {
    throw CatalogError("missing-column-type", "Column type cannot be empty");
  }

  static const std::set<std::string> integers = {
      "int",     "int2",     "int4",      "int8",   "integer",
      "bigint",  "smallint", "tinyint",   "serial", "bigserial",
      "hugeint", "ubigint",  "uinteger"};
  static const std::set<std::string> floats = {
      "float",  "float4",  "float8",  "real",  "double",
      "double precision", "decimal", "numeric", "number"};
  static const std::set<std::string> texts = {"varchar", "bpchar", "char",
                                              "text",    "string", "character varying"};
  static const std::set<std::string> bools = {"bool", "boolean"};
  static const std::set<std::string> temporals = {
      "date",     "time",        "timestamp", "timestamptz",
      "datetime", "timestamp with time zone", "interval"};
  static const std::set<std::string> structured = {"json",  "jsonb", "struct",
                                                   "list",  "map",   "array"};
  static const std::set<std::string> identifiers = {"uuid"};

  if (integers.contains(name))
    return ColumnType::INTEGER;
  if (floats.contains(name))
    return ColumnType::FLOAT;
  if (texts.contains(name))
    return ColumnType::TEXT;
  if (bools.contains(name))
    return ColumnType::BOOL;
  if (temporals.contains(name))
    return ColumnType::TEMPORAL;
  if (structured.contains(name) || name.ends_with("[]"))
    return ColumnType::STRUCTURED;
  if (identifiers.contains(name))
    return ColumnType::IDENTIFIER;

  spdlog::debug("Unknown column type '{}', treating it as TEXT", type_name);
  return ColumnType::TEXT;
}

std::string toString(ColumnType type) { return rfl::enum_to_string(type); }

std::string toString(TableSource source) {
  return rfl::enum_to_string(source);
}

TableSource parseTableSource(std::string const &source) {
  if (source == "derived")
    return TableSource::derived;
  return TableSource::imported;
}

void validate(TableSnapshot const &table) {
  if (table.id.empty()) {
    throw CatalogError("missing-table-id",
                       fmt::format("Table '{}' has no id", table.name));
  }

  std::set<std::string> seen;
  for (auto const &col : table.columns) {
    if (col.name.empty()) {
      throw CatalogError(
          "missing-column-name",
          fmt::format("Table {} contains a column without a name", table.id));
    }
    if (!seen.insert(col.name).second) {
      throw CatalogError("duplicate-column",
                         fmt::format("Table {} contains column {} twice",
                                     table.id, col.name));
    }
  }
}

} // namespace catalog
