#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <exception>
#include <iostream>
#include <optional>

#include "catalog_io.hpp"
#include "engine_config.hpp"
#include "inference_engine.hpp"
#include "reshape_planner.hpp"

int main(int argc, char **argv) {

  // stdout carries the report
  auto err_logger = spdlog::stderr_color_mt("stderr");
  spdlog::set_default_logger(err_logger);
  spdlog::set_level(spdlog::level::info);

  if (argc < 2) {
    spdlog::error("Not enough arguments! Usage: schemasense <catalog.json> "
                  "[selected_table_id] [config.json]");
    return 1;
  }

  try {
    config::AllConfig engineConfig;
    if (argc > 3) {
      engineConfig = config::loadConfig(argv[3]);
    }

    const auto tables = catalog_io::readCatalog(argv[1]);

    spdlog::info("Loaded {} tables from {}", tables.size(), argv[1]);

    inference_engine::InferenceEngine engine(engineConfig);

    const auto analysis = engine.analyzeCatalog(tables);

    std::optional<catalog_io::SelectionReport> selection;

    if (argc > 2) {
      const std::string selected = argv[2];
      auto shape = engine.analyzeSelection(tables, selected);
      auto const &table = *std::find_if(
          tables.begin(), tables.end(),
          [&selected](auto const &t) { return t.id == selected; });

      auto draft = reshape_planner::draftRequest(table, shape);
      auto validation = reshape_planner::validateRequest(table, draft);

      spdlog::info("Table {} looks {}: {}", selected,
                   shape_classifier::toString(shape.shape), shape.reason);

      selection = catalog_io::SelectionReport{std::move(shape),
                                              std::move(draft),
                                              std::move(validation)};
    }

    std::cout << catalog_io::renderReport(analysis, selection) << std::endl;

  } catch (catalog::CatalogError const &e) {
    spdlog::error("Catalog error ({}): {}", e.name(), e.what());
    return 2;
  } catch (std::exception const &e) {
    spdlog::error("Analysis failed: {}", e.what());
    return 2;
  }

  return 0;
}
