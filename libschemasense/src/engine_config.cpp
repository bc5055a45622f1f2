#include "engine_config.hpp"

#include <fmt/format.h>
#include <rfl.hpp>
#include <rfl/json.hpp>
#include <spdlog/spdlog.h>

#include <fstream>
#include <sstream>

namespace config {

AllConfig parseConfig(std::string const &json) {
  try {
    return rfl::json::read<AllConfig, rfl::DefaultIfMissing>(json).value();
  } catch (const std::exception &e) {
    throw catalog::CatalogError(
        "config-read-failed",
        fmt::format("Invalid engine configuration: {}", e.what()));
  }
}

AllConfig loadConfig(std::filesystem::path const &file) {
  std::ifstream in(file);
  if (!in.is_open()) {
    throw catalog::CatalogError(
        "config-read-failed",
        fmt::format("Failed to open configuration file: {}", file.string()));
  }

  std::stringstream buffer;
  buffer << in.rdbuf();

  auto config = parseConfig(buffer.str());
  spdlog::info("Loaded engine configuration from {}", file.string());
  return config;
}

std::string dumpConfig(AllConfig const &config) {
  return rfl::json::write(config);
}

} // namespace config
