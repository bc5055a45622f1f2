#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "catalog.hpp"
#include "field_profiler.hpp"

namespace shape_classifier {

// Thresholds of the shape heuristics. None of them has a statistical
// derivation; they are tuned on typical spreadsheet exports.
struct ShapeConfig {
  // rule 1: measures sharing a naming pattern
  std::size_t min_pattern_measures = 3;
  double affix_min_ratio = 0.4;
  std::size_t affix_min_length = 2;

  // rule 2: measures dominating identifiers
  std::size_t min_ratio_measures = 4;
  double measure_dominance_factor = 2.0;

  // rule 3: diverse declared types in a narrow table
  double type_diversity_ratio = 0.5;
  std::size_t max_long_columns = 10;

  // below this no rule is evaluated
  std::size_t min_columns = 3;
};

enum class Shape { wide, long_, ambiguous };

enum class Direction { wideToLong, longToWide };

enum class Rule { namingPattern, measureDominance, typeDiversity, undecided };

enum class NamingPattern { none, trailingNumber, sharedPrefix, sharedSuffix };

struct PatternMatch {
  NamingPattern pattern = NamingPattern::none;
  std::string affix;

  bool operator==(PatternMatch const &) const = default;
};

struct ShapeAnalysis {
  std::string table_id;
  Shape shape = Shape::ambiguous;
  Direction recommended_direction = Direction::wideToLong;
  Rule rule = Rule::undecided;
  PatternMatch naming;
  std::string reason;
  std::vector<std::string> suggested_id_vars;
  std::vector<std::string> suggested_value_vars;
  // columns in neither set, the caller has to assign them before reshaping
  std::vector<std::string> unassigned;

  bool operator==(ShapeAnalysis const &) const = default;
};

class ShapeClassifier {
public:
  explicit ShapeClassifier(ShapeConfig const &config = {});

  // `profiles` has to be the FieldProfiler output for `table`, in column
  // order.
  ShapeAnalysis
  classifyShape(catalog::TableSnapshot const &table,
                std::vector<field_profiler::ColumnProfile> const &profiles) const;

  // Detects a structural naming pattern shared by all names.
  PatternMatch detectNamingPattern(std::vector<std::string> const &names) const;

private:
  ShapeConfig config;
};

std::string toString(Shape shape);
std::string toString(Direction direction);
std::string toString(Rule rule);
std::string toString(NamingPattern pattern);

Direction parseDirection(std::string const &str);

} // namespace shape_classifier
