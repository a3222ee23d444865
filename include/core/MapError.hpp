/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef MAP_ERROR_HPP
#define MAP_ERROR_HPP

#include <cstdint>
#include <filesystem>
#include <ostream>
#include <stdexcept>
#include <string>

namespace MapForge {

/**
 * @brief Broad class of a load failure
 */
enum class MapErrorCategory : uint8_t {
  Io,        // File missing or unreadable, raster could not be decoded
  Format,    // Malformed scalar, clause or CSV token
  Decode,    // Well-formed tokens with the wrong shape
  Validation // Domain rule violated
};

/**
 * @brief Specific load failure
 */
enum class MapErrorCode : uint8_t {
  FileNotFound,
  Io,
  ImageLoad,
  InvalidScalar,
  ClauseSyntax,
  CsvRow,
  Decode,
  InvalidStrategicRegion,
  InvalidStrategicRegionName,
  InvalidStrategicRegionFileName,
  InvalidSupplyNode,
  InvalidRailway,
  InvalidBuildingsFile,
  DuplicateBuildingType,
  InvalidTerrainFile,
  DuplicateTerrainType
};

MapErrorCategory categoryOf(MapErrorCode code) noexcept;
const char *toString(MapErrorCode code) noexcept;
const char *toString(MapErrorCategory category) noexcept;

/**
 * @brief Exception thrown by every loader
 *
 * A loader either returns a complete value or throws the first MapError it
 * encountered. The path is empty when the failure is not tied to one file.
 */
class MapError : public std::runtime_error {
public:
  MapError(MapErrorCode code, const std::string &message,
           std::filesystem::path path = {});

  MapErrorCode code() const noexcept { return m_code; }
  MapErrorCategory category() const noexcept { return categoryOf(m_code); }
  const std::filesystem::path &path() const noexcept { return m_path; }

  /**
   * @brief Returns a copy with "<context>: " prepended to the message
   */
  MapError wrap(const std::string &context) const;

private:
  MapErrorCode m_code;
  std::filesystem::path m_path;
};

// Stream operators (for Boost.Test)
inline std::ostream &operator<<(std::ostream &os, MapErrorCode code) {
  return os << toString(code);
}

inline std::ostream &operator<<(std::ostream &os, MapErrorCategory category) {
  return os << toString(category);
}

} // namespace MapForge

#endif // MAP_ERROR_HPP
