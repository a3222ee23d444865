/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "map/SupplyNodes.hpp"
#include "core/Logger.hpp"
#include "core/MapError.hpp"
#include "utils/LineGrammar.hpp"
#include <format>

namespace MapForge {

namespace {
constexpr std::string_view NODE_MARKER = "1";
}

ProvinceId SupplyNodes::parseLine(std::string_view line) {
  std::optional<ProvinceId> id;
  try {
    id = parseSentinelPairLine<ProvinceId>(line, NODE_MARKER);
  } catch (const MapError &e) {
    throw MapError(MapErrorCode::InvalidSupplyNode,
                   std::format("invalid supply node '{}': {}", line, e.what()));
  }
  if (!id) {
    throw MapError(MapErrorCode::InvalidSupplyNode,
                   std::format("invalid supply node '{}': expected '1 <province>'",
                               line));
  }
  return *id;
}

SupplyNodes SupplyNodes::fromFile(const std::filesystem::path &path) {
  SupplyNodes result;
  forEachContentLine(path, [&](std::string_view line, size_t lineNumber) {
    try {
      result.m_nodes.insert(parseLine(line));
    } catch (const MapError &e) {
      throw MapError(e.code(),
                     std::format("{}:{}: {}", path.string(), lineNumber, e.what()),
                     path);
    }
  });
  MAPLOADER_INFO(std::format("loaded {} supply nodes", result.size()));
  return result;
}

} // namespace MapForge
