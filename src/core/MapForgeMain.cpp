/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "core/Logger.hpp"
#include "core/MapError.hpp"
#include "managers/SettingsManager.hpp"
#include "map/Map.hpp"
#include "map/MapLayout.hpp"
#include "utils/ImageDecoder.hpp"
#include <SDL3/SDL.h>
#include <cstdlib>
#include <exception>
#include <filesystem>
#include <format>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>

namespace {

const std::string CONFIG_FILE_NAME{"mapforge.cfg"};

struct Arguments {
  std::filesystem::path root;
  std::optional<std::filesystem::path> config;
};

void printUsage(const char *program) {
  std::cerr << std::format("Usage: {} <map-root> [--config <file>]\n", program);
}

std::optional<Arguments> parseArguments(int argc, char *argv[]) {
  Arguments arguments;
  for (int i = 1; i < argc; ++i) {
    std::string_view argument = argv[i];
    if (argument == "--config") {
      if (i + 1 >= argc) {
        return std::nullopt;
      }
      arguments.config = argv[++i];
    } else if (arguments.root.empty()) {
      arguments.root = argument;
    } else {
      return std::nullopt;
    }
  }
  if (arguments.root.empty()) {
    return std::nullopt;
  }
  return arguments;
}

std::string describe(const MapForge::RgbImage &image) {
  return std::format("{}x{}", image.width, image.height);
}

void printSummary(const MapForge::Map &map) {
  std::cout << std::format("Map root: {}\n", map.root.string());
  std::cout << std::format("  definitions:        {}\n", map.definitions.size());
  std::cout << std::format("  terrain types:      {}\n", map.terrainTypes.size());
  std::cout << std::format("  continents:         {}\n", map.continents.size());
  std::cout << std::format("  adjacencies:        {}\n", map.adjacencies.size());
  std::cout << std::format("  adjacency rules:    {}\n", map.adjacencyRules.size());
  std::cout << std::format("  strategic regions:  {}\n", map.strategicRegions.size());
  std::cout << std::format("  states:             {}\n", map.states.size());
  std::cout << std::format("  supply nodes:       {}\n", map.supplyNodes.size());
  std::cout << std::format("  railways:           {}\n", map.railways.size());
  std::cout << std::format("  airports:           {}\n", map.airports.size());
  std::cout << std::format("  rocket sites:       {}\n", map.rocketSites.size());
  std::cout << std::format("  buildings:          {} ({} types, {} rows skipped, {} dropped)\n",
                           map.buildings.size(), map.buildings.types().size(),
                           map.buildings.skippedRows(), map.buildings.droppedCount());
  std::cout << std::format("  city groups:        {}\n", map.cities.groups.size());
  std::cout << std::format("  colors:             {}\n", map.colors.size());
  std::cout << std::format("  unit stacks:        {} ({} rows skipped)\n",
                           map.unitStacks.size(), map.unitStacks.skippedRows());
  std::cout << std::format("  weather positions:  {} ({} rows skipped)\n",
                           map.weatherPositions.size(),
                           map.weatherPositions.skippedRows());
  std::cout << std::format("  provinces.bmp {} | terrain {} | rivers {} | heightmap {}\n",
                           describe(map.provincesImage), describe(map.terrainImage),
                           describe(map.riversImage), describe(map.heightmapImage));
  std::cout << std::format("  trees {} | normal map {} | cities {}\n",
                           describe(map.treesImage), describe(map.normalMapImage),
                           describe(map.citiesImage));
}

} // anonymous namespace

int main(int argc, char *argv[]) {
  auto arguments = parseArguments(argc, argv);
  if (!arguments) {
    printUsage(argc > 0 ? argv[0] : "mapforge");
    return EXIT_FAILURE;
  }

  if (!SDL_Init(0)) {
    CLI_CRITICAL(std::format("SDL_Init failed: {}", SDL_GetError()));
    return EXIT_FAILURE;
  }

  auto &settings = MapForge::SettingsManager::Instance();
  std::filesystem::path configPath =
      arguments->config.value_or(arguments->root / CONFIG_FILE_NAME);
  std::error_code ec;
  if (std::filesystem::exists(configPath, ec)) {
    if (!settings.loadFromFile(configPath)) {
      CLI_CRITICAL("Could not read settings from " + configPath.string());
      SDL_Quit();
      return EXIT_FAILURE;
    }
  } else if (arguments->config) {
    CLI_CRITICAL("Settings file not found: " + configPath.string());
    SDL_Quit();
    return EXIT_FAILURE;
  }

  int status = EXIT_SUCCESS;
  try {
    MapForge::SdlImageDecoder decoder;
    MapForge::Map map = MapForge::Map::load(
        arguments->root, MapForge::MapLayout::fromSettings(settings), decoder);
    printSummary(map);
  } catch (const MapForge::MapError &e) {
    CLI_CRITICAL(std::format("[{}] {}", MapForge::toString(e.code()), e.what()));
    std::cerr << std::format("error ({}): {}\n", MapForge::toString(e.code()), e.what());
    status = EXIT_FAILURE;
  } catch (const std::exception &e) {
    CLI_CRITICAL(std::format("Unexpected failure: {}", e.what()));
    std::cerr << std::format("error: {}\n", e.what());
    status = EXIT_FAILURE;
  }

  SDL_Quit();
  return status;
}
