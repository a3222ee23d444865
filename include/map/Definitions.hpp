/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef DEFINITIONS_HPP
#define DEFINITIONS_HPP

#include "map/Wrappers.hpp"
#include <cstdint>
#include <filesystem>
#include <ostream>
#include <string_view>
#include <unordered_set>
#include <vector>

namespace MapForge {

class DelimitedRow;

enum class ProvinceType : uint8_t { Land, Sea, Lake };

ProvinceType parseProvinceType(std::string_view text);
const char *toString(ProvinceType type);
std::ostream &operator<<(std::ostream &os, ProvinceType type);

/**
 * @brief One row of definition.csv: a province and its color key
 *
 * Continent is a 1-based index into Continents; sea provinces use 0.
 */
struct Definition {
  ProvinceId id;
  Red r;
  Green g;
  Blue b;
  ProvinceType type{ProvinceType::Land};
  Coastal coastal;
  Terrain terrain;
  ContinentIndex continent;

  static Definition fromRow(const DelimitedRow &row);

  bool operator==(const Definition &) const = default;
};

/**
 * @brief Terrain type names declared in common/terrain/00_terrain.txt
 */
class TerrainCatalog {
public:
  /**
   * @throws MapError InvalidTerrainFile when the file has no top-level block,
   *         DuplicateTerrainType when a name is declared twice
   */
  static TerrainCatalog fromFile(const std::filesystem::path &path);

  bool contains(const Terrain &terrain) const {
    return m_types.find(terrain) != m_types.end();
  }
  size_t size() const { return m_types.size(); }
  const std::unordered_set<Terrain> &types() const { return m_types; }

private:
  std::unordered_set<Terrain> m_types;
};

/**
 * @brief Every province definition, in file order
 */
class Definitions {
public:
  /**
   * @brief Loads definition.csv (no header, strict rows)
   *
   * Terrain names missing from the catalog and repeated ids or colors are
   * reported as warnings.
   */
  static Definitions fromFile(const std::filesystem::path &path,
                              const TerrainCatalog &terrains);

  // Loads without a terrain catalog; no terrain check is made
  static Definitions fromFile(const std::filesystem::path &path);

  const std::vector<Definition> &definitions() const { return m_definitions; }
  size_t size() const { return m_definitions.size(); }

  const Definition *find(ProvinceId id) const;

private:
  static std::vector<Definition> readRows(const std::filesystem::path &path);
  void warnOnDuplicates() const;

  std::vector<Definition> m_definitions;
};

} // namespace MapForge

#endif // DEFINITIONS_HPP
