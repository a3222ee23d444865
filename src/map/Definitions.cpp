/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "map/Definitions.hpp"
#include "core/Logger.hpp"
#include "core/MapError.hpp"
#include "utils/ClauseDecoder.hpp"
#include "utils/DelimitedReader.hpp"
#include <algorithm>
#include <format>
#include <unordered_map>

namespace MapForge {

ProvinceType parseProvinceType(std::string_view text) {
  if (text == "land")
    return ProvinceType::Land;
  if (text == "sea")
    return ProvinceType::Sea;
  if (text == "lake")
    return ProvinceType::Lake;
  throw MapError(MapErrorCode::InvalidScalar,
                 std::format("invalid province type '{}'", text));
}

const char *toString(ProvinceType type) {
  switch (type) {
  case ProvinceType::Land:
    return "land";
  case ProvinceType::Sea:
    return "sea";
  case ProvinceType::Lake:
    return "lake";
  }
  return "unknown";
}

std::ostream &operator<<(std::ostream &os, ProvinceType type) {
  return os << toString(type);
}

Definition Definition::fromRow(const DelimitedRow &row) {
  Definition definition;
  definition.id = row.get<ProvinceId>(0);
  definition.r = row.get<Red>(1);
  definition.g = row.get<Green>(2);
  definition.b = row.get<Blue>(3);
  try {
    definition.type = parseProvinceType(row.text(4));
  } catch (const MapError &e) {
    row.fail(4, e.what());
  }
  definition.coastal = row.get<Coastal>(5);
  definition.terrain = row.get<Terrain>(6);
  definition.continent = row.get<ContinentIndex>(7);
  return definition;
}

TerrainCatalog TerrainCatalog::fromFile(const std::filesystem::path &path) {
  auto keys = firstBlockKeys(loadClauseFile(path));
  if (!keys) {
    throw MapError(MapErrorCode::InvalidTerrainFile,
                   std::format("{}: no terrain category block", path.string()),
                   path);
  }

  TerrainCatalog catalog;
  for (auto &key : *keys) {
    Terrain terrain(std::move(key));
    if (!catalog.m_types.insert(terrain).second) {
      throw MapError(MapErrorCode::DuplicateTerrainType,
                     std::format("{}: terrain type '{}' declared twice",
                                 path.string(), terrain.get()),
                     path);
    }
  }
  return catalog;
}

std::vector<Definition> Definitions::readRows(const std::filesystem::path &path) {
  DelimitedReader reader(path, {';', false, RowPolicy::Strict});
  return reader.readAll<Definition>(&Definition::fromRow);
}

Definitions Definitions::fromFile(const std::filesystem::path &path) {
  Definitions result;
  result.m_definitions = readRows(path);
  result.warnOnDuplicates();
  return result;
}

Definitions Definitions::fromFile(const std::filesystem::path &path,
                                  const TerrainCatalog &terrains) {
  Definitions result = fromFile(path);

  size_t unknown = 0;
  for (const auto &definition : result.m_definitions) {
    if (!terrains.contains(definition.terrain)) {
      ++unknown;
      DEFINITIONS_WARN(std::format("province {} uses undeclared terrain '{}'",
                                   definition.id.get(),
                                   definition.terrain.get()));
    }
  }
  DEFINITIONS_INFO(std::format("loaded {} definitions ({} with unknown terrain)",
                               result.size(), unknown));
  return result;
}

const Definition *Definitions::find(ProvinceId id) const {
  auto it = std::find_if(m_definitions.begin(), m_definitions.end(),
                         [id](const Definition &d) { return d.id == id; });
  return it != m_definitions.end() ? &*it : nullptr;
}

void Definitions::warnOnDuplicates() const {
  std::unordered_map<ProvinceId, size_t> seenIds;
  std::unordered_map<uint32_t, ProvinceId> seenColors;
  seenIds.reserve(m_definitions.size());
  seenColors.reserve(m_definitions.size());

  for (size_t i = 0; i < m_definitions.size(); ++i) {
    const Definition &d = m_definitions[i];
    if (!seenIds.emplace(d.id, i).second) {
      DEFINITIONS_WARN(std::format("province id {} defined more than once",
                                   d.id.get()));
    }
    uint32_t color = (static_cast<uint32_t>(d.r.get()) << 16) |
                     (static_cast<uint32_t>(d.g.get()) << 8) | d.b.get();
    auto [it, inserted] = seenColors.emplace(color, d.id);
    if (!inserted) {
      DEFINITIONS_WARN(std::format("provinces {} and {} share color ({}, {}, {})",
                                   it->second.get(), d.id.get(), d.r.get(),
                                   d.g.get(), d.b.get()));
    }
  }
}

} // namespace MapForge
