/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "core/MapError.hpp"

namespace MapForge {

MapErrorCategory categoryOf(MapErrorCode code) noexcept {
  switch (code) {
  case MapErrorCode::FileNotFound:
  case MapErrorCode::Io:
  case MapErrorCode::ImageLoad:
    return MapErrorCategory::Io;
  case MapErrorCode::InvalidScalar:
  case MapErrorCode::ClauseSyntax:
  case MapErrorCode::CsvRow:
    return MapErrorCategory::Format;
  case MapErrorCode::Decode:
    return MapErrorCategory::Decode;
  default:
    return MapErrorCategory::Validation;
  }
}

const char *toString(MapErrorCode code) noexcept {
  switch (code) {
  case MapErrorCode::FileNotFound:
    return "FileNotFound";
  case MapErrorCode::Io:
    return "Io";
  case MapErrorCode::ImageLoad:
    return "ImageLoad";
  case MapErrorCode::InvalidScalar:
    return "InvalidScalar";
  case MapErrorCode::ClauseSyntax:
    return "ClauseSyntax";
  case MapErrorCode::CsvRow:
    return "CsvRow";
  case MapErrorCode::Decode:
    return "Decode";
  case MapErrorCode::InvalidStrategicRegion:
    return "InvalidStrategicRegion";
  case MapErrorCode::InvalidStrategicRegionName:
    return "InvalidStrategicRegionName";
  case MapErrorCode::InvalidStrategicRegionFileName:
    return "InvalidStrategicRegionFileName";
  case MapErrorCode::InvalidSupplyNode:
    return "InvalidSupplyNode";
  case MapErrorCode::InvalidRailway:
    return "InvalidRailway";
  case MapErrorCode::InvalidBuildingsFile:
    return "InvalidBuildingsFile";
  case MapErrorCode::DuplicateBuildingType:
    return "DuplicateBuildingType";
  case MapErrorCode::InvalidTerrainFile:
    return "InvalidTerrainFile";
  case MapErrorCode::DuplicateTerrainType:
    return "DuplicateTerrainType";
  }
  return "Unknown";
}

const char *toString(MapErrorCategory category) noexcept {
  switch (category) {
  case MapErrorCategory::Io:
    return "Io";
  case MapErrorCategory::Format:
    return "Format";
  case MapErrorCategory::Decode:
    return "Decode";
  case MapErrorCategory::Validation:
    return "Validation";
  }
  return "Unknown";
}

MapError::MapError(MapErrorCode code, const std::string &message,
                   std::filesystem::path path)
    : std::runtime_error(message), m_code(code), m_path(std::move(path)) {}

MapError MapError::wrap(const std::string &context) const {
  return MapError(m_code, context + ": " + what(), m_path);
}

} // namespace MapForge
