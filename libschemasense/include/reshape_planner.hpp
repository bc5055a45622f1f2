#pragma once

#include <optional>
#include <string>
#include <vector>

#include "catalog.hpp"
#include "shape_classifier.hpp"

namespace reshape_planner {

// Parameters of a melt (wide-to-long) or pivot (long-to-wide). The engine only
// prepares and checks them; executing the reshape is up to the caller.
struct ReshapeRequest {
  std::string table_id;
  shape_classifier::Direction direction =
      shape_classifier::Direction::wideToLong;
  std::vector<std::string> id_vars;
  std::vector<std::string> value_vars;

  // wide-to-long
  std::string variable_name = "variable";
  std::string value_name = "value";

  // long-to-wide
  std::optional<std::string> pivot_columns;
  std::optional<std::string> pivot_values;
};

struct ReshapeValidation {
  std::vector<std::string> errors;
  std::vector<std::string> warnings;

  bool ok() const;
};

// Pre-populates a request from the analysis of the selected table.
ReshapeRequest draftRequest(catalog::TableSnapshot const &table,
                            shape_classifier::ShapeAnalysis const &analysis);

ReshapeValidation validateRequest(catalog::TableSnapshot const &table,
                                  ReshapeRequest const &request);

} // namespace reshape_planner
