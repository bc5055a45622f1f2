#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "catalog.hpp"

namespace field_profiler {

struct ProfilerConfig {
  // rank `id` and `<table>_id` above other unique columns
  bool key_name_heuristic = true;
};

enum class DataAnomaly {
  negativeCount,
  distinctExceedsRows,
  distinctExceedsPresent,
  missingExceedsRows,
  nullableHintContradicted,
  declaredKeyNotUnique
};

struct ColumnProfile {
  std::string name;
  catalog::ColumnType declared_type = catalog::ColumnType::TEXT;

  // normalized statistics the flags were derived from
  std::uint64_t row_count = 0;
  std::uint64_t distinct_count = 0;
  std::uint64_t missing_count = 0;
  double missing_rate = 0.0;

  bool is_nullable = false;
  bool is_strict_unique = false;
  bool is_identity_like = false;
  bool is_primary_key_candidate = false;

  std::vector<DataAnomaly> anomalies;

  bool isKey() const;
  bool operator==(ColumnProfile const &) const = default;
};

struct TableProfile {
  std::string table_id;
  std::string table_name;
  catalog::TableSource source = catalog::TableSource::imported;
  std::vector<ColumnProfile> columns;
  std::optional<std::string> primary_key;

  ColumnProfile const *findColumn(std::string const &name) const;
  std::size_t anomalyCount() const;
  bool operator==(TableProfile const &) const = default;
};

class FieldProfiler {
public:
  explicit FieldProfiler(ProfilerConfig const &config = {});

  // One profile per input column, in input order. Never throws on data
  // problems; those are recorded as anomalies.
  std::vector<ColumnProfile> profile(catalog::TableSnapshot const &table) const;

  // Validates the snapshot (throws catalog::CatalogError) and profiles it.
  TableProfile profileTable(catalog::TableSnapshot const &table) const;

private:
  ProfilerConfig config;

  ColumnProfile profileColumn(std::string const &table_id,
                              catalog::Column const &column) const;

  void electPrimaryKey(catalog::TableSnapshot const &table,
                       std::vector<ColumnProfile> &profiles) const;
};

int keyNameRank(std::string const &table_name, std::string const &column_name);

std::string toString(DataAnomaly anomaly);

} // namespace field_profiler
