#pragma once

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace catalog {

enum class ColumnType {
  INTEGER,
  FLOAT,
  TEXT,
  BOOL,
  TEMPORAL,
  STRUCTURED,
  IDENTIFIER
};

enum class TableSource { imported, derived };

class CatalogError : public std::runtime_error {
public:
  CatalogError(std::string const &name, std::string const &message);

  std::string const &name() const noexcept;

private:
  std::string errorName;
};

struct Column {
  std::string name;
  ColumnType declared_type = ColumnType::TEXT;
  std::optional<bool> nullable_hint;
  bool foreign_key_hint = false;

  // population statistics, as observed by the storage layer
  std::int64_t row_count = 0;
  std::int64_t distinct_count = 0;
  std::int64_t missing_count = 0;

  // only meaningful for integer columns
  std::optional<std::int64_t> min_value;
  std::optional<std::int64_t> max_value;
};

struct TableSnapshot {
  std::string id;
  std::string name;
  TableSource source = TableSource::imported;
  std::optional<std::string> declared_primary_key;
  std::vector<Column> columns;

  Column const *findColumn(std::string const &columnName) const;
};

bool isNumeric(ColumnType type);

// Maps a storage type name (int4, varchar(20), timestamptz, ...) to the closed
// set of semantic categories. Unknown names map to TEXT, an empty name throws.
ColumnType parseColumnType(std::string const &type_name);

std::string toString(ColumnType type);
std::string toString(TableSource source);

TableSource parseTableSource(std::string const &source);

// Throws CatalogError on a broken caller contract: missing table id, missing
// column name or duplicate column names.
void validate(TableSnapshot const &table);

} // namespace catalog
