#include "field_profiler.hpp"

#include <boost/algorithm/string/case_conv.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <tuple>

namespace field_profiler {

namespace {

void addAnomaly(ColumnProfile &profile, DataAnomaly anomaly) {
  if (std::find(profile.anomalies.begin(), profile.anomalies.end(), anomaly) ==
      profile.anomalies.end()) {
    profile.anomalies.push_back(anomaly);
  }
}

std::uint64_t normalizeCount(std::int64_t value, ColumnProfile &profile) {
  if (value < 0) {
    addAnomaly(profile, DataAnomaly::negativeCount);
    return 0;
  }
  return static_cast<std::uint64_t>(value);
}

std::string singular(std::string const &name) {
  if (name.ends_with("ies") && name.size() > 3) {
    return name.substr(0, name.size() - 3) + "y";
  }
  if (name.ends_with("s") && !name.ends_with("ss") && name.size() > 1) {
    return name.substr(0, name.size() - 1);
  }
  return name;
}

} // namespace

bool ColumnProfile::isKey() const {
  return is_strict_unique || is_primary_key_candidate || is_identity_like;
}

ColumnProfile const *TableProfile::findColumn(std::string const &name) const {
  auto it = std::find_if(
      columns.begin(), columns.end(),
      [&name](ColumnProfile const &col) { return col.name == name; });
  return it == columns.end() ? nullptr : &*it;
}

std::size_t TableProfile::anomalyCount() const {
  std::size_t total = 0;
  for (auto const &col : columns) {
    total += col.anomalies.size();
  }
  return total;
}

int keyNameRank(std::string const &table_name,
                std::string const &column_name) {
  const std::string col = boost::algorithm::to_lower_copy(column_name);
  const std::string table = boost::algorithm::to_lower_copy(table_name);

  if (col == "id")
    return 0;
  if (!table.empty() &&
      (col == table + "_id" || col == singular(table) + "_id"))
    return 1;
  if (col.ends_with("_id"))
    return 2;
  return 3;
}

std::string toString(DataAnomaly anomaly) {
  switch (anomaly) {
  case DataAnomaly::negativeCount:
    return "negative-count";
  case DataAnomaly::distinctExceedsRows:
    return "distinct-exceeds-rows";
  case DataAnomaly::distinctExceedsPresent:
    return "distinct-exceeds-present";
  case DataAnomaly::missingExceedsRows:
    return "missing-exceeds-rows";
  case DataAnomaly::nullableHintContradicted:
    return "nullable-hint-contradicted";
  case DataAnomaly::declaredKeyNotUnique:
    return "declared-key-not-unique";
  }
  return "unknown";
}

FieldProfiler::FieldProfiler(ProfilerConfig const &config) : config(config) {}

std::vector<ColumnProfile>
FieldProfiler::profile(catalog::TableSnapshot const &table) const {
  std::vector<ColumnProfile> profiles;
  profiles.reserve(table.columns.size());

  for (auto const &column : table.columns) {
    profiles.push_back(profileColumn(table.id, column));
  }

  electPrimaryKey(table, profiles);

  return profiles;
}

TableProfile
FieldProfiler::profileTable(catalog::TableSnapshot const &table) const {
  catalog::validate(table);

  TableProfile result;
  result.table_id = table.id;
  result.table_name = table.name;
  result.source = table.source;
  result.columns = profile(table);

  for (auto const &col : result.columns) {
    if (col.is_primary_key_candidate) {
      result.primary_key = col.name;
    }
  }

  spdlog::debug("Profiled {} columns for table {} (primary key: {}, {} "
                "anomalies)",
                result.columns.size(), table.id,
                result.primary_key.value_or("none"), result.anomalyCount());

  return result;
}

ColumnProfile FieldProfiler::profileColumn(std::string const &table_id,
                                           catalog::Column const &column) const {
  ColumnProfile profile;
  profile.name = column.name;
  profile.declared_type = column.declared_type;

  const auto rows = normalizeCount(column.row_count, profile);
  auto distinct = normalizeCount(column.distinct_count, profile);
  auto missing = normalizeCount(column.missing_count, profile);

  if (missing > rows) {
    addAnomaly(profile, DataAnomaly::missingExceedsRows);
    missing = rows;
  }
  if (distinct > rows) {
    addAnomaly(profile, DataAnomaly::distinctExceedsRows);
    distinct = rows;
  }
  // missing values cannot be distinct non-missing values
  if (distinct > rows - missing) {
    addAnomaly(profile, DataAnomaly::distinctExceedsPresent);
    distinct = rows - missing;
  }

  profile.row_count = rows;
  profile.distinct_count = distinct;
  profile.missing_count = missing;
  profile.missing_rate =
      rows == 0 ? 0.0 : static_cast<double>(missing) / static_cast<double>(rows);

  profile.is_nullable = missing > 0;
  profile.is_strict_unique = rows > 0 && missing == 0 && distinct == rows;

  if (profile.is_strict_unique &&
      column.declared_type == catalog::ColumnType::INTEGER &&
      column.min_value && column.max_value) {
    const auto min = *column.min_value;
    const auto max = *column.max_value;
    // dense sequence starting at 0 or 1
    profile.is_identity_like =
        (min == 0 || min == 1) && max >= min &&
        static_cast<std::uint64_t>(max - min) == rows - 1;
  }

  if (column.nullable_hint.has_value() && !*column.nullable_hint &&
      profile.is_nullable) {
    addAnomaly(profile, DataAnomaly::nullableHintContradicted);
  }

  for (auto anomaly : profile.anomalies) {
    spdlog::warn("Data quality anomaly in column {}.{}: {} (rows={}, "
                 "distinct={}, missing={})",
                 table_id, column.name, toString(anomaly), column.row_count,
                 column.distinct_count, column.missing_count);
  }

  return profile;
}

void FieldProfiler::electPrimaryKey(catalog::TableSnapshot const &table,
                                    std::vector<ColumnProfile> &profiles) const {
  if (table.declared_primary_key) {
    auto const &declared = *table.declared_primary_key;
    auto it = std::find_if(
        profiles.begin(), profiles.end(),
        [&declared](ColumnProfile const &p) { return p.name == declared; });

    if (it == profiles.end()) {
      spdlog::warn("Declared primary key column {} not found in table {}",
                   declared, table.id);
    } else if (it->is_strict_unique) {
      it->is_primary_key_candidate = true;
      return;
    } else {
      addAnomaly(*it, DataAnomaly::declaredKeyNotUnique);
      spdlog::warn("Declared primary key {}.{} is not unique, inferring a "
                   "replacement",
                   table.id, declared);
    }
  }

  ColumnProfile *best = nullptr;
  std::tuple<int, std::string> bestRank;

  for (auto &candidate : profiles) {
    if (!candidate.is_strict_unique) {
      continue;
    }

    std::tuple<int, std::string> rank{
        config.key_name_heuristic ? keyNameRank(table.name, candidate.name)
                                  : 3,
        boost::algorithm::to_lower_copy(candidate.name)};

    // strict less-than keeps the first column on full ties
    if (best == nullptr || rank < bestRank) {
      best = &candidate;
      bestRank = std::move(rank);
    }
  }

  if (best != nullptr) {
    best->is_primary_key_candidate = true;
  }
}

} // namespace field_profiler
