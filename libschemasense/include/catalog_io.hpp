#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "catalog.hpp"
#include "inference_engine.hpp"
#include "reshape_planner.hpp"
#include "shape_classifier.hpp"

namespace catalog_io {

struct SelectionReport {
  shape_classifier::ShapeAnalysis shape;
  reshape_planner::ReshapeRequest draft;
  reshape_planner::ReshapeValidation validation;
};

// Reads a JSON table catalog:
//   {"tables": [{"id", "name", "source", "primary_key",
//                "columns": [{"name", "type", "nullable", "foreign_key",
//                             "rows", "distinct", "missing", "min", "max"}]}]}
// Storage type names are mapped with catalog::parseColumnType. Throws
// catalog::CatalogError on unreadable documents or broken table contracts.
std::vector<catalog::TableSnapshot> parseCatalog(std::string const &json);

std::vector<catalog::TableSnapshot>
readCatalog(std::filesystem::path const &file);

// Profiles, relations with a merge drafted from each, and the selected
// table's shape and reshape draft when given.
std::string
renderReport(inference_engine::CatalogAnalysis const &analysis,
             std::optional<SelectionReport> const &selection = std::nullopt);

} // namespace catalog_io
