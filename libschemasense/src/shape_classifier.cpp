#include "shape_classifier.hpp"

#include <boost/algorithm/string/join.hpp>
#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <cmath>
#include <set>
#include <stdexcept>

namespace shape_classifier {

namespace {

std::size_t commonPrefixLength(std::vector<std::string> const &names,
                               std::size_t shortest) {
  std::size_t len = 0;
  for (; len < shortest; ++len) {
    const char c = names.front()[len];
    if (!std::all_of(names.begin(), names.end(),
                     [&](std::string const &n) { return n[len] == c; }))
      break;
  }
  return len;
}

std::size_t commonSuffixLength(std::vector<std::string> const &names,
                               std::size_t shortest) {
  std::size_t len = 0;
  for (; len < shortest; ++len) {
    auto const &first = names.front();
    const char c = first[first.size() - 1 - len];
    if (!std::all_of(names.begin(), names.end(), [&](std::string const &n) {
          return n[n.size() - 1 - len] == c;
        }))
      break;
  }
  return len;
}

std::string previewNames(std::vector<std::string> const &names) {
  if (names.size() <= 3) {
    return boost::algorithm::join(names, ", ");
  }
  std::vector<std::string> head(names.begin(), names.begin() + 3);
  return boost::algorithm::join(head, ", ") + ", ...";
}

} // namespace

ShapeClassifier::ShapeClassifier(ShapeConfig const &config) : config(config) {}

PatternMatch ShapeClassifier::detectNamingPattern(
    std::vector<std::string> const &names) const {
  if (names.size() < config.min_pattern_measures || names.empty()) {
    return {};
  }

  const bool trailingNumbers =
      std::all_of(names.begin(), names.end(), [](std::string const &n) {
        return !n.empty() &&
               std::isdigit(static_cast<unsigned char>(n.back())) != 0;
      });
  if (trailingNumbers) {
    return {NamingPattern::trailingNumber, ""};
  }

  const std::size_t shortest =
      std::min_element(names.begin(), names.end(),
                       [](std::string const &a, std::string const &b) {
                         return a.size() < b.size();
                       })
          ->size();

  auto longEnough = [&](std::size_t len) {
    return len >= config.affix_min_length &&
           static_cast<double>(len) >=
               static_cast<double>(shortest) * config.affix_min_ratio;
  };

  const auto prefix = commonPrefixLength(names, shortest);
  if (longEnough(prefix)) {
    return {NamingPattern::sharedPrefix, names.front().substr(0, prefix)};
  }

  const auto suffix = commonSuffixLength(names, shortest);
  if (longEnough(suffix)) {
    return {NamingPattern::sharedSuffix,
            names.front().substr(names.front().size() - suffix)};
  }

  return {};
}

ShapeAnalysis ShapeClassifier::classifyShape(
    catalog::TableSnapshot const &table,
    std::vector<field_profiler::ColumnProfile> const &profiles) const {
  if (profiles.size() != table.columns.size()) {
    throw catalog::CatalogError(
        "profile-mismatch",
        fmt::format("Table {} has {} columns but {} profiles", table.id,
                    table.columns.size(), profiles.size()));
  }

  ShapeAnalysis analysis;
  analysis.table_id = table.id;

  std::vector<std::string> measures;
  std::set<catalog::ColumnType> types;

  for (std::size_t i = 0; i < table.columns.size(); ++i) {
    auto const &column = table.columns[i];
    auto const &profile = profiles[i];
    types.insert(column.declared_type);

    const bool keyLike = profile.is_primary_key_candidate ||
                         column.foreign_key_hint || profile.is_identity_like;
    if (keyLike || !catalog::isNumeric(column.declared_type)) {
      analysis.suggested_id_vars.push_back(column.name);
    } else {
      measures.push_back(column.name);
    }
  }

  const std::size_t columnCount = table.columns.size();
  const std::size_t idCount = analysis.suggested_id_vars.size();

  auto wide = [&](Rule rule, std::string reason) {
    analysis.shape = Shape::wide;
    analysis.recommended_direction = Direction::wideToLong;
    analysis.rule = rule;
    analysis.reason = std::move(reason);
    analysis.suggested_value_vars = measures;
  };

  if (columnCount < config.min_columns) {
    analysis.reason = fmt::format(
        "Only {} columns, too few to recognise a table shape; choose the "
        "direction manually",
        columnCount);
  } else if (measures.size() >= config.min_pattern_measures &&
             (analysis.naming = detectNamingPattern(measures)).pattern !=
                 NamingPattern::none) {
    wide(Rule::namingPattern,
         fmt::format("{} numeric columns ({}) follow a {} naming pattern, the "
                     "table looks wide",
                     measures.size(), previewNames(measures),
                     toString(analysis.naming.pattern)));
  } else if (measures.size() >= config.min_ratio_measures &&
             static_cast<double>(measures.size()) >
                 config.measure_dominance_factor *
                     static_cast<double>(idCount)) {
    wide(Rule::measureDominance,
         fmt::format("Numeric columns ({}) far outnumber identifier columns "
                     "({}), the table is probably wide",
                     measures.size(), idCount));
  } else if (static_cast<double>(types.size()) >=
                 std::ceil(config.type_diversity_ratio *
                           static_cast<double>(columnCount)) &&
             columnCount <= config.max_long_columns) {
    analysis.shape = Shape::long_;
    analysis.recommended_direction = Direction::longToWide;
    analysis.rule = Rule::typeDiversity;
    analysis.reason = fmt::format(
        "Column types are diverse ({} types / {} columns), the table is in "
        "long format",
        types.size(), columnCount);
  } else {
    analysis.reason = "Table shape is undecided, choose the reshape "
                      "direction according to the meaning of the data";
  }

  for (auto const &column : table.columns) {
    auto const &ids = analysis.suggested_id_vars;
    auto const &values = analysis.suggested_value_vars;
    if (std::find(ids.begin(), ids.end(), column.name) == ids.end() &&
        std::find(values.begin(), values.end(), column.name) == values.end()) {
      analysis.unassigned.push_back(column.name);
    }
  }

  spdlog::debug("Table {} classified as {} by rule {}: {}", table.id,
                toString(analysis.shape), toString(analysis.rule),
                analysis.reason);

  return analysis;
}

std::string toString(Shape shape) {
  switch (shape) {
  case Shape::wide:
    return "wide";
  case Shape::long_:
    return "long";
  case Shape::ambiguous:
    return "ambiguous";
  }
  return "ambiguous";
}

std::string toString(Direction direction) {
  switch (direction) {
  case Direction::wideToLong:
    return "wide-to-long";
  case Direction::longToWide:
    return "long-to-wide";
  }
  return "wide-to-long";
}

std::string toString(Rule rule) {
  switch (rule) {
  case Rule::namingPattern:
    return "naming-pattern";
  case Rule::measureDominance:
    return "measure-dominance";
  case Rule::typeDiversity:
    return "type-diversity";
  case Rule::undecided:
    return "undecided";
  }
  return "undecided";
}

std::string toString(NamingPattern pattern) {
  switch (pattern) {
  case NamingPattern::none:
    return "none";
  case NamingPattern::trailingNumber:
    return "trailing-number";
  case NamingPattern::sharedPrefix:
    return "shared-prefix";
  case NamingPattern::sharedSuffix:
    return "shared-suffix";
  }
  return "none";
}

Direction parseDirection(std::string const &str) {
  if (str == "wide-to-long")
    return Direction::wideToLong;
  if (str == "long-to-wide")
    return Direction::longToWide;
  throw std::invalid_argument(fmt::format("Unknown reshape direction '{}'", str));
}

} // namespace shape_classifier
