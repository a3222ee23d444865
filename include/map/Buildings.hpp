/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef BUILDINGS_HPP
#define BUILDINGS_HPP

#include "map/Wrappers.hpp"
#include <filesystem>
#include <ostream>
#include <unordered_set>
#include <vector>

namespace MapForge {

class DelimitedRow;

/**
 * @brief One placed building from map/buildings.txt
 *
 * Columns: state;building;x;y;z;rotation;adjacent sea province. A missing or
 * empty last column reads as province 0.
 */
struct StateBuilding {
  StateId state;
  BuildingId building;
  float x{0.0f};
  float y{0.0f};
  float z{0.0f};
  float rotation{0.0f};
  ProvinceId adjacentSeaProvince;

  static StateBuilding fromRow(const DelimitedRow &row);

  bool operator==(const StateBuilding &) const = default;
};

std::ostream &operator<<(std::ostream &os, const StateBuilding &building);

class Buildings {
public:
  // Accepted even when the types file does not declare it
  static constexpr const char *IMPLICIT_TYPE = "floating_harbor";

  /**
   * @brief Building ids declared by the first block of the types file, plus
   *        IMPLICIT_TYPE
   * @throws MapError InvalidBuildingsFile when there is no top-level block,
   *         DuplicateBuildingType when a type is declared twice
   */
  static std::unordered_set<BuildingId>
  loadTypes(const std::filesystem::path &typesPath);

  /**
   * @brief Loads the types file, then the placements
   *
   * Malformed placement rows are skipped. Placements of undeclared types are
   * dropped with a warning; the rest are kept.
   */
  static Buildings fromFiles(const std::filesystem::path &typesPath,
                             const std::filesystem::path &buildingsPath);

  bool isDeclared(const BuildingId &id) const { return m_types.contains(id); }
  const std::unordered_set<BuildingId> &types() const { return m_types; }
  const std::vector<StateBuilding> &buildings() const { return m_buildings; }
  size_t size() const { return m_buildings.size(); }

  size_t skippedRows() const { return m_skippedRows; }
  size_t droppedCount() const { return m_dropped; }

private:
  std::unordered_set<BuildingId> m_types;
  std::vector<StateBuilding> m_buildings;
  size_t m_skippedRows{0};
  size_t m_dropped{0};
};

} // namespace MapForge

#endif // BUILDINGS_HPP
