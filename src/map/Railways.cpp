/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "map/Railways.hpp"
#include "core/Logger.hpp"
#include "core/MapError.hpp"
#include "utils/LineGrammar.hpp"
#include <format>

namespace MapForge {

Railway Railway::parse(std::string_view line) {
  CountedList<RailLevel, RailLength, ProvinceId> parsed;
  try {
    parsed = parseCountedListLine<RailLevel, RailLength, ProvinceId>(line);
  } catch (const MapError &e) {
    throw MapError(MapErrorCode::InvalidRailway,
                   std::format("invalid railway '{}': {}", line, e.what()));
  }

  if (parsed.count.get() < 0 ||
      static_cast<size_t>(parsed.count.get()) != parsed.items.size()) {
    throw MapError(MapErrorCode::InvalidRailway,
                   std::format("invalid railway '{}': declares {} provinces, found {}",
                               line, parsed.count.get(), parsed.items.size()));
  }
  return Railway{parsed.head, parsed.count, std::move(parsed.items)};
}

std::ostream &operator<<(std::ostream &os, const Railway &railway) {
  os << "Railway(level " << railway.level.get() << ":";
  for (const auto &province : railway.provinces) {
    os << ' ' << province.get();
  }
  return os << ')';
}

Railways Railways::fromFile(const std::filesystem::path &path) {
  Railways result;
  forEachContentLine(path, [&](std::string_view line, size_t lineNumber) {
    try {
      result.m_railways.push_back(Railway::parse(line));
    } catch (const MapError &e) {
      throw MapError(e.code(),
                     std::format("{}:{}: {}", path.string(), lineNumber, e.what()),
                     path);
    }
  });
  MAPLOADER_INFO(std::format("loaded {} railways", result.size()));
  return result;
}

} // namespace MapForge
