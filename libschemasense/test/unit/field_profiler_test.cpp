#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include "field_profiler.hpp"
#include "test_tables.hpp"

#include <algorithm>

using namespace field_profiler;
using catalog::ColumnType;

namespace {
bool hasAnomaly(ColumnProfile const &p, DataAnomaly a) {
  return std::find(p.anomalies.begin(), p.anomalies.end(), a) !=
         p.anomalies.end();
}
} // namespace

TEST_CASE("Profiles follow the input column order", "[profiler]") {
  FieldProfiler profiler;
  auto profiles = profiler.profile(ordersTable());

  REQUIRE(profiles.size() == 3);
  REQUIRE(profiles[0].name == "order_id");
  REQUIRE(profiles[1].name == "customer_id");
  REQUIRE(profiles[2].name == "amount");
}

TEST_CASE("Constraint flags", "[profiler]") {
  FieldProfiler profiler;

  SECTION("Dense 1-based integer sequence is an identity") {
    auto p = profiler.profile(makeTable("t", {makeSequence("id", 50)}))[0];
    REQUIRE_FALSE(p.is_nullable);
    REQUIRE(p.is_strict_unique);
    REQUIRE(p.is_identity_like);
    REQUIRE(p.is_primary_key_candidate);
  }

  SECTION("0-based sequences are identities too") {
    auto p = profiler.profile(makeTable("t", {makeSequence("id", 50, 0)}))[0];
    REQUIRE(p.is_identity_like);
  }

  SECTION("Sequences with gaps are unique but not identities") {
    auto col = makeSequence("id", 50);
    col.max_value = 60;
    auto p = profiler.profile(makeTable("t", {col}))[0];
    REQUIRE(p.is_strict_unique);
    REQUIRE_FALSE(p.is_identity_like);
  }

  SECTION("Sequences starting above 1 are not identities") {
    auto p = profiler.profile(makeTable("t", {makeSequence("id", 50, 7)}))[0];
    REQUIRE(p.is_strict_unique);
    REQUIRE_FALSE(p.is_identity_like);
  }

  SECTION("Float sequences are never identities") {
    auto col = makeSequence("id", 10);
    col.declared_type = ColumnType::FLOAT;
    auto p = profiler.profile(makeTable("t", {col}))[0];
    REQUIRE(p.is_strict_unique);
    REQUIRE_FALSE(p.is_identity_like);
  }

  SECTION("Integer columns without min/max are not identities") {
    auto p = profiler.profile(makeTable(
        "t", {makeColumn("id", ColumnType::INTEGER, 10, 10)}))[0];
    REQUIRE(p.is_strict_unique);
    REQUIRE_FALSE(p.is_identity_like);
  }

  SECTION("Missing values make a column nullable and non-unique") {
    auto p = profiler.profile(makeTable(
        "t", {makeColumn("code", ColumnType::TEXT, 10, 9, 1)}))[0];
    REQUIRE(p.is_nullable);
    REQUIRE_FALSE(p.is_strict_unique);
    REQUIRE_THAT(p.missing_rate, Catch::Matchers::WithinAbs(0.1, 1e-9));
  }

  SECTION("Repeated values are not unique") {
    auto p = profiler.profile(makeTable(
        "t", {makeColumn("city", ColumnType::TEXT, 10, 3)}))[0];
    REQUIRE_FALSE(p.is_nullable);
    REQUIRE_FALSE(p.is_strict_unique);
    REQUIRE_FALSE(p.is_primary_key_candidate);
  }
}

TEST_CASE("Empty tables resolve every flag to false", "[profiler]") {
  FieldProfiler profiler;
  auto profiles = profiler.profile(
      makeTable("empty", {makeColumn("id", ColumnType::INTEGER, 0, 0),
                          makeColumn("name", ColumnType::TEXT, 0, 0)}));

  REQUIRE(profiles.size() == 2);
  for (auto const &p : profiles) {
    REQUIRE_FALSE(p.is_nullable);
    REQUIRE_FALSE(p.is_strict_unique);
    REQUIRE_FALSE(p.is_identity_like);
    REQUIRE_FALSE(p.is_primary_key_candidate);
    REQUIRE(p.missing_rate == 0.0);
    REQUIRE(p.anomalies.empty());
  }

  REQUIRE(profiler.profile(makeTable("none", {})).empty());
}

TEST_CASE("Inconsistent statistics are normalized and flagged",
          "[profiler][anomaly]") {
  FieldProfiler profiler;

  SECTION("distinct above rows is clamped") {
    auto p = profiler.profile(makeTable(
        "t", {makeColumn("code", ColumnType::TEXT, 10, 12)}))[0];
    REQUIRE(p.distinct_count == 10);
    REQUIRE(hasAnomaly(p, DataAnomaly::distinctExceedsRows));
    REQUIRE(p.is_strict_unique);
  }

  SECTION("negative counts are treated as zero") {
    auto p = profiler.profile(makeTable(
        "t", {makeColumn("code", ColumnType::TEXT, 10, 10, -3)}))[0];
    REQUIRE(p.missing_count == 0);
    REQUIRE(hasAnomaly(p, DataAnomaly::negativeCount));
    REQUIRE(p.anomalies.size() == 1);
  }

  SECTION("missing above rows is clamped") {
    auto p = profiler.profile(makeTable(
        "t", {makeColumn("code", ColumnType::TEXT, 5, 0, 9)}))[0];
    REQUIRE(p.missing_count == 5);
    REQUIRE(p.is_nullable);
    REQUIRE(hasAnomaly(p, DataAnomaly::missingExceedsRows));
  }

  SECTION("distinct above the non-missing rows is clamped") {
    auto p = profiler.profile(makeTable(
        "t", {makeColumn("code", ColumnType::TEXT, 10, 9, 6)}))[0];
    REQUIRE(p.distinct_count == 4);
    REQUIRE(p.missing_count == 6);
    REQUIRE(p.anomalies == std::vector<DataAnomaly>{
                               DataAnomaly::distinctExceedsPresent});
    REQUIRE(toString(p.anomalies[0]) == "distinct-exceeds-present");
  }

  SECTION("missing and distinct above rows are both reported") {
    auto p = profiler.profile(makeTable(
        "t", {makeColumn("code", ColumnType::TEXT, 10, 12, 4)}))[0];
    REQUIRE(p.distinct_count == 6);
    REQUIRE(hasAnomaly(p, DataAnomaly::distinctExceedsRows));
    REQUIRE(hasAnomaly(p, DataAnomaly::distinctExceedsPresent));
  }

  SECTION("a not-null hint contradicted by missing values") {
    auto col = makeColumn("code", ColumnType::TEXT, 5, 4, 1);
    col.nullable_hint = false;
    auto p = profiler.profile(makeTable("t", {col}))[0];
    REQUIRE(p.is_nullable);
    REQUIRE(hasAnomaly(p, DataAnomaly::nullableHintContradicted));
  }
}

TEST_CASE("Profile invariants hold for arbitrary statistics",
          "[profiler][invariant]") {
  FieldProfiler profiler;
  std::vector<catalog::Column> columns;
  const std::int64_t values[] = {-1, 0, 1, 5, 10};
  const ColumnType types[] = {ColumnType::INTEGER, ColumnType::FLOAT,
                              ColumnType::TEXT};

  int idx = 0;
  for (auto rows : values)
    for (auto distinct : values)
      for (auto missing : values)
        for (auto type : types) {
          auto col = makeColumn("c" + std::to_string(idx++), type, rows,
                                distinct, missing);
          col.min_value = 1;
          col.max_value = rows;
          columns.push_back(col);
        }

  auto profiles = profiler.profile(makeTable("grid", columns));
  REQUIRE(profiles.size() == columns.size());

  std::size_t candidates = 0;
  for (auto const &p : profiles) {
    if (p.is_strict_unique) {
      REQUIRE(p.missing_count == 0);
      REQUIRE(p.row_count > 0);
    }
    if (p.is_identity_like) {
      REQUIRE(p.is_strict_unique);
      REQUIRE(p.declared_type == ColumnType::INTEGER);
    }
    if (p.is_primary_key_candidate) {
      REQUIRE(p.is_strict_unique);
      ++candidates;
    }
    REQUIRE(p.distinct_count <= p.row_count);
    REQUIRE(p.missing_count <= p.row_count);
    REQUIRE(p.distinct_count + p.missing_count <= p.row_count);
  }
  REQUIRE(candidates <= 1);
}

TEST_CASE("Primary key candidate election", "[profiler][primary_key]") {
  FieldProfiler profiler;

  SECTION("A column named id wins") {
    auto table = makeTable("accounts",
                           {makeColumn("email", ColumnType::TEXT, 10, 10),
                            makeColumn("account_id", ColumnType::INTEGER, 10, 10),
                            makeColumn("id", ColumnType::INTEGER, 10, 10)});
    auto profile = profiler.profileTable(table);
    REQUIRE(profile.primary_key == "id");
    REQUIRE(profile.columns[2].is_primary_key_candidate);
    REQUIRE_FALSE(profile.columns[0].is_primary_key_candidate);
    REQUIRE_FALSE(profile.columns[1].is_primary_key_candidate);
  }

  SECTION("<table>_id outranks other *_id columns") {
    auto table = makeTable("customers",
                           {makeColumn("external_id", ColumnType::TEXT, 10, 10),
                            makeColumn("customer_id", ColumnType::INTEGER, 10, 10)});
    REQUIRE(profiler.profileTable(table).primary_key == "customer_id");
  }

  SECTION("*_id outranks plain names") {
    auto table = makeTable("t", {makeColumn("email", ColumnType::TEXT, 10, 10),
                                 makeColumn("ref_id", ColumnType::TEXT, 10, 10)});
    REQUIRE(profiler.profileTable(table).primary_key == "ref_id");
  }

  SECTION("Ties break by name") {
    auto table = makeTable("t", {makeColumn("zeta", ColumnType::TEXT, 10, 10),
                                 makeColumn("alpha", ColumnType::TEXT, 10, 10)});
    REQUIRE(profiler.profileTable(table).primary_key == "alpha");
  }

  SECTION("Without the name heuristic only the name ordering is used") {
    FieldProfiler plain(ProfilerConfig{false});
    auto table = makeTable("t", {makeColumn("id", ColumnType::TEXT, 10, 10),
                                 makeColumn("alpha", ColumnType::TEXT, 10, 10)});
    REQUIRE(plain.profileTable(table).primary_key == "alpha");
  }

  SECTION("No strict-unique column means no candidate") {
    auto table = makeTable("t", {makeColumn("id", ColumnType::INTEGER, 10, 9),
                                 makeColumn("x", ColumnType::TEXT, 10, 10, 1)});
    auto profile = profiler.profileTable(table);
    REQUIRE_FALSE(profile.primary_key.has_value());
    for (auto const &col : profile.columns) {
      REQUIRE_FALSE(col.is_primary_key_candidate);
    }
  }

  SECTION("A unique declared primary key wins over the heuristic") {
    auto table = makeTable("t", {makeColumn("id", ColumnType::INTEGER, 10, 10),
                                 makeColumn("code", ColumnType::TEXT, 10, 10)});
    table.declared_primary_key = "code";
    REQUIRE(profiler.profileTable(table).primary_key == "code");
  }

  SECTION("A non-unique declared primary key is flagged and replaced") {
    auto table = makeTable("t", {makeColumn("id", ColumnType::INTEGER, 10, 10),
                                 makeColumn("code", ColumnType::TEXT, 10, 4)});
    table.declared_primary_key = "code";
    auto profile = profiler.profileTable(table);
    REQUIRE(profile.primary_key == "id");
    REQUIRE(hasAnomaly(profile.columns[1], DataAnomaly::declaredKeyNotUnique));
    REQUIRE(profile.anomalyCount() == 1);
  }

  SECTION("An unknown declared primary key is ignored") {
    auto table = makeTable("t", {makeColumn("id", ColumnType::INTEGER, 10, 10)});
    table.declared_primary_key = "missing";
    REQUIRE(profiler.profileTable(table).primary_key == "id");
  }
}

TEST_CASE("Key name ranking", "[profiler][primary_key]") {
  REQUIRE(keyNameRank("orders", "ID") == 0);
  REQUIRE(keyNameRank("orders", "order_id") == 1);
  REQUIRE(keyNameRank("orders", "orders_id") == 1);
  REQUIRE(keyNameRank("categories", "category_id") == 1);
  REQUIRE(keyNameRank("orders", "customer_id") == 2);
  REQUIRE(keyNameRank("orders", "amount") == 3);
}

TEST_CASE("Profiling is idempotent", "[profiler]") {
  FieldProfiler profiler;
  auto table = ordersTable();
  table.columns.push_back(makeColumn("broken", ColumnType::TEXT, 3, 7));

  REQUIRE(profiler.profileTable(table) == profiler.profileTable(table));
}

TEST_CASE("profileTable rejects broken contracts", "[profiler]") {
  FieldProfiler profiler;
  auto table = ordersTable();
  table.columns[0].name.clear();

  REQUIRE_THROWS_AS(profiler.profileTable(table), catalog::CatalogError);
}
