#include "reshape_planner.hpp"

#include <boost/algorithm/string/join.hpp>
#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <set>

using shape_classifier::Direction;

namespace reshape_planner {

namespace {

bool contains(std::vector<std::string> const &names, std::string const &name) {
  return std::find(names.begin(), names.end(), name) != names.end();
}

void checkKnown(catalog::TableSnapshot const &table,
                std::vector<std::string> const &names, char const *role,
                ReshapeValidation &result) {
  for (auto const &name : names) {
    if (table.findColumn(name) == nullptr) {
      result.errors.push_back(fmt::format(
          "{} column '{}' does not exist in table {}", role, name, table.id));
    }
  }
}

void checkMelt(catalog::TableSnapshot const &table,
               ReshapeRequest const &request, ReshapeValidation &result) {
  if (request.value_vars.empty()) {
    result.errors.emplace_back("wide-to-long requires at least one value column");
  }
  if (request.variable_name.empty()) {
    result.errors.emplace_back("Variable column name cannot be empty");
  }
  if (request.value_name.empty()) {
    result.errors.emplace_back("Value column name cannot be empty");
  }
  if (!request.variable_name.empty() &&
      request.variable_name == request.value_name) {
    result.errors.push_back(
        fmt::format("Variable and value columns are both named '{}'",
                    request.value_name));
  }
  for (auto const &name : {request.variable_name, request.value_name}) {
    if (!name.empty() && contains(request.id_vars, name)) {
      result.errors.push_back(
          fmt::format("Output column '{}' collides with an identifier", name));
    }
  }

  std::set<std::string> types;
  for (auto const &name : request.value_vars) {
    if (auto const *col = table.findColumn(name)) {
      types.insert(catalog::toString(col->declared_type));
    }
  }
  if (types.size() > 1) {
    std::vector<std::string> typeList(types.begin(), types.end());
    result.warnings.push_back(fmt::format(
        "Selected value columns have different types ({}), the melted value "
        "column will be converted to text",
        boost::algorithm::join(typeList, ", ")));
  }
}

void checkPivot(catalog::TableSnapshot const &table,
                ReshapeRequest const &request, ReshapeValidation &result) {
  if (!request.pivot_columns || request.pivot_columns->empty() ||
      !request.pivot_values || request.pivot_values->empty()) {
    result.errors.emplace_back(
        "long-to-wide requires pivot columns and pivot values");
    return;
  }

  checkKnown(table, {*request.pivot_columns, *request.pivot_values}, "Pivot",
             result);

  if (*request.pivot_columns == *request.pivot_values) {
    result.errors.push_back(
        fmt::format("Pivot columns and pivot values both use '{}'",
                    *request.pivot_columns));
  }
  for (auto const &name : {*request.pivot_columns, *request.pivot_values}) {
    if (contains(request.id_vars, name)) {
      result.errors.push_back(fmt::format(
          "Pivot column '{}' cannot also be an identifier", name));
    }
  }
}

} // namespace

bool ReshapeValidation::ok() const { return errors.empty(); }

ReshapeRequest draftRequest(catalog::TableSnapshot const &table,
                            shape_classifier::ShapeAnalysis const &analysis) {
  ReshapeRequest request;
  request.table_id = table.id;
  request.direction = analysis.recommended_direction;
  request.id_vars = analysis.suggested_id_vars;
  request.value_vars = analysis.suggested_value_vars;
  return request;
}

ReshapeValidation validateRequest(catalog::TableSnapshot const &table,
                                  ReshapeRequest const &request) {
  ReshapeValidation result;

  if (request.table_id != table.id) {
    result.errors.push_back(fmt::format("Request targets table {}, not {}",
                                        request.table_id, table.id));
  }
  if (request.id_vars.empty()) {
    result.errors.emplace_back("At least one identifier column is required");
  }

  checkKnown(table, request.id_vars, "Identifier", result);
  checkKnown(table, request.value_vars, "Value", result);

  for (auto const &name : request.value_vars) {
    if (contains(request.id_vars, name)) {
      result.errors.push_back(fmt::format(
          "Column '{}' is both an identifier and a value column", name));
    }
  }

  if (request.direction == Direction::wideToLong) {
    checkMelt(table, request, result);
  } else {
    checkPivot(table, request, result);
  }

  if (!result.ok()) {
    spdlog::debug("Reshape request for table {} rejected: {}", table.id,
                  boost::algorithm::join(result.errors, "; "));
  }

  return result;
}

} // namespace reshape_planner
