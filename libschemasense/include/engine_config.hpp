#pragma once

#include <filesystem>
#include <string>

#include "field_profiler.hpp"
#include "relation_inference.hpp"
#include "shape_classifier.hpp"

namespace config {

struct AllConfig {
  field_profiler::ProfilerConfig profiler;
  relation_inference::RelationConfig relations;
  shape_classifier::ShapeConfig shape;
};

// Fields missing from the document keep their defaults.
AllConfig parseConfig(std::string const &json);

AllConfig loadConfig(std::filesystem::path const &file);

std::string dumpConfig(AllConfig const &config);

} // namespace config
