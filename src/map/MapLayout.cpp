/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "map/MapLayout.hpp"
#include "core/Logger.hpp"
#include "managers/SettingsManager.hpp"
#include <array>
#include <format>
#include <utility>

namespace MapForge {

MapLayout MapLayout::fromSettings(const SettingsManager &settings) {
  MapLayout layout;
  const std::array<std::pair<const char *, std::filesystem::path *>, 15> keys{{
      {"manifest", &layout.manifest},
      {"strategic_regions", &layout.strategicRegions},
      {"states", &layout.states},
      {"supply_nodes", &layout.supplyNodes},
      {"railways", &layout.railways},
      {"airports", &layout.airports},
      {"rocket_sites", &layout.rocketSites},
      {"buildings", &layout.buildings},
      {"building_types", &layout.buildingTypes},
      {"terrain_types", &layout.terrainTypes},
      {"cities", &layout.cities},
      {"colors", &layout.colors},
      {"unit_stacks", &layout.unitStacks},
      {"weather_positions", &layout.weatherPositions},
      {"normal_map", &layout.normalMap},
  }};

  for (const auto &[key, target] : keys) {
    std::string value =
        settings.get<std::string>(SETTINGS_CATEGORY, key, target->string());
    if (value != target->string()) {
      SETTINGS_INFO(std::format("layout.{} = {}", key, value));
      *target = value;
    }
  }
  return layout;
}

} // namespace MapForge
