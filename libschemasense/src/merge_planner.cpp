#include "merge_planner.hpp"

#include <boost/algorithm/string/join.hpp>
#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <stdexcept>

namespace merge_planner {

namespace {

catalog::TableSnapshot const *
findTable(std::vector<catalog::TableSnapshot> const &tables,
          std::string const &id) {
  auto it = std::find_if(tables.begin(), tables.end(),
                         [&id](auto const &t) { return t.id == id; });
  return it == tables.end() ? nullptr : &*it;
}

void checkSide(std::vector<catalog::TableSnapshot> const &tables,
               std::string const &table_id,
               std::vector<std::string> const &keys, char const *side,
               MergeValidation &result) {
  if (table_id.empty()) {
    result.errors.push_back(fmt::format("A {} table is required", side));
    return;
  }

  auto const *table = findTable(tables, table_id);
  if (table == nullptr) {
    result.errors.push_back(
        fmt::format("Unknown {} table: {}", side, table_id));
    return;
  }

  if (keys.empty()) {
    result.errors.push_back(
        fmt::format("At least one {} key is required", side));
  }
  for (auto const &key : keys) {
    if (table->findColumn(key) == nullptr) {
      result.errors.push_back(fmt::format("Unknown {} key: {}", side, key));
    }
  }
}

} // namespace

bool MergeValidation::ok() const { return errors.empty(); }

MergeRequest draftMerge(relation_inference::RelationEdge const &edge) {
  MergeRequest request;
  request.relation_id = edge.id;
  // edges point from the referencing side to the key side
  request.left_table_id = edge.to_table_id;
  request.right_table_id = edge.from_table_id;
  request.left_keys = {edge.to_field};
  request.right_keys = {edge.from_field};
  request.join_type = relation_inference::inverse(edge.cardinality);
  request.low_confidence = edge.weak_evidence;
  return request;
}

MergeValidation validateMerge(std::vector<catalog::TableSnapshot> const &tables,
                              MergeRequest const &request) {
  MergeValidation result;

  checkSide(tables, request.left_table_id, request.left_keys, "left", result);
  checkSide(tables, request.right_table_id, request.right_keys, "right",
            result);

  if (!request.left_table_id.empty() &&
      request.left_table_id == request.right_table_id) {
    result.errors.push_back(fmt::format("Table {} cannot be merged with itself",
                                        request.left_table_id));
  }
  if (request.left_keys.size() != request.right_keys.size()) {
    result.errors.emplace_back(
        "Left and right keys must have the same length");
  }
  if (request.result_name && request.result_name->empty()) {
    result.errors.emplace_back("Result table name cannot be empty");
  }

  if (request.low_confidence) {
    result.warnings.push_back(fmt::format(
        "Neither {} nor {} is a key, the join may multiply rows",
        boost::algorithm::join(request.left_keys, ", "),
        boost::algorithm::join(request.right_keys, ", ")));
  }

  if (!result.ok()) {
    spdlog::debug("Merge request {} <- {} rejected: {}",
                  request.left_table_id, request.right_table_id,
                  boost::algorithm::join(result.errors, "; "));
  }

  return result;
}

std::string toString(JoinHow how) {
  switch (how) {
  case JoinHow::full:
    return "full";
  case JoinHow::left:
    return "left";
  case JoinHow::right:
    return "right";
  case JoinHow::inner:
    return "inner";
  }
  return "full";
}

JoinHow parseJoinHow(std::string const &str) {
  if (str == "full")
    return JoinHow::full;
  if (str == "left")
    return JoinHow::left;
  if (str == "right")
    return JoinHow::right;
  if (str == "inner")
    return JoinHow::inner;
  throw std::invalid_argument(fmt::format("Unknown join mode '{}'", str));
}

} // namespace merge_planner
