#pragma once

#include <optional>
#include <string>
#include <vector>

#include "catalog.hpp"
#include "relation_inference.hpp"

namespace merge_planner {

// Which rows survive the join.
enum class JoinHow { full, left, right, inner };

// Parameters of a key join between two tables. The left side is the key side,
// the right side references it. Executing the merge is up to the caller.
struct MergeRequest {
  std::string relation_id;
  std::string left_table_id;
  std::string right_table_id;
  std::vector<std::string> left_keys;
  std::vector<std::string> right_keys;
  // read from the left table
  relation_inference::Cardinality join_type =
      relation_inference::Cardinality::oneToOne;
  JoinHow how = JoinHow::full;
  std::optional<std::string> result_name;

  // drafted from a weak edge, neither side was a key
  bool low_confidence = false;
};

struct MergeValidation {
  std::vector<std::string> errors;
  std::vector<std::string> warnings;

  bool ok() const;
};

MergeRequest draftMerge(relation_inference::RelationEdge const &edge);

MergeValidation validateMerge(std::vector<catalog::TableSnapshot> const &tables,
                              MergeRequest const &request);

std::string toString(JoinHow how);
JoinHow parseJoinHow(std::string const &str);

} // namespace merge_planner
