/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef LOGGER_HPP
#define LOGGER_HPP

// Required includes for logging system:
// - string: Used in macro expansions for std::string() conversions
// - cstdio: Required for printf() and fflush() functions
// - cstdint: Required for uint8_t type
// - mutex: Required for thread-safe logging
// - atomic: Required for std::atomic<bool> quiet mode flag
#include <atomic> // IWYU pragma: keep - Required for std::atomic<bool> quiet mode flag
#include <cstdint> // IWYU pragma: keep - Required for uint8_t type
#include <cstdio> // IWYU pragma: keep - Required for printf() and fflush() functions
#include <mutex> // IWYU pragma: keep - Required for thread-safe logging
#include <string> // IWYU pragma: keep - Required for std::string() conversions in macros

namespace MapForge {
enum class LogLevel : uint8_t {
  CRITICAL = 0,     // Always logs
  ERROR_LEVEL = 1,  // Always logs (renamed to avoid macro conflicts)
  WARNING = 2,      // Always logs, skipped records must stay visible
  INFO = 3,         // Debug only
  DEBUG_LEVEL = 4   // Debug only (renamed to avoid macro conflicts)
};

#ifdef DEBUG
// Full console logging in debug builds
class Logger {
private:
  static std::atomic<bool> s_quietMode;
  static std::mutex s_logMutex;

public:
  static void SetQuietMode(bool enabled) {
    s_quietMode.store(enabled, std::memory_order_relaxed);
  }

  static bool IsQuietMode() {
    return s_quietMode.load(std::memory_order_relaxed);
  }

  static void Log(LogLevel level, const char *system,
                  const std::string &message) {
    Log(level, system, message.c_str());
  }

  static void Log(LogLevel level, const char *system, const char *message) {
    if (s_quietMode.load(std::memory_order_relaxed)) {
      return;
    }

    std::lock_guard<std::mutex> lock(s_logMutex);
    printf("MapForge - [%s] %s: %s\n", system, getLevelString(level),
           message);
    fflush(stdout);
  }

private:
  static const char *getLevelString(LogLevel level) {
    switch (level) {
    case LogLevel::CRITICAL:
      return "CRITICAL";
    case LogLevel::ERROR_LEVEL:
      return "ERROR";
    case LogLevel::WARNING:
      return "WARNING";
    case LogLevel::INFO:
      return "INFO";
    case LogLevel::DEBUG_LEVEL:
      return "DEBUG";
    default:
      return "UNKNOWN";
    }
  }
};

#define MAPFORGE_CRITICAL(system, msg)                                         \
  MapForge::Logger::Log(MapForge::LogLevel::CRITICAL, system, msg)
#define MAPFORGE_ERROR(system, msg)                                            \
  MapForge::Logger::Log(MapForge::LogLevel::ERROR_LEVEL, system, msg)
#define MAPFORGE_WARN(system, msg)                                             \
  MapForge::Logger::Log(MapForge::LogLevel::WARNING, system, msg)
#define MAPFORGE_INFO(system, msg)                                             \
  MapForge::Logger::Log(MapForge::LogLevel::INFO, system, msg)
#define MAPFORGE_DEBUG(system, msg)                                            \
  MapForge::Logger::Log(MapForge::LogLevel::DEBUG_LEVEL, system, msg)

#else
// Release builds write to a log file (see src/core/Logger.cpp)
class Logger {
private:
  static std::atomic<bool> s_quietMode;

public:
  static std::mutex s_logMutex; // Public for macro access

  static void SetQuietMode(bool enabled) {
    s_quietMode.store(enabled, std::memory_order_relaxed);
  }

  static bool IsQuietMode() {
    return s_quietMode.load(std::memory_order_relaxed);
  }

  static void Log(const char *level, const char *system,
                  const std::string &message);
  static void Log(const char *level, const char *system, const char *message);
};

#define MAPFORGE_CRITICAL(system, msg)                                         \
  MapForge::Logger::Log("CRITICAL", system, msg)
#define MAPFORGE_ERROR(system, msg) MapForge::Logger::Log("ERROR", system, msg)
#define MAPFORGE_WARN(system, msg) MapForge::Logger::Log("WARNING", system, msg)
#define MAPFORGE_INFO(system, msg) ((void)0)  // Zero overhead
#define MAPFORGE_DEBUG(system, msg) ((void)0) // Zero overhead
#endif

// Static member definitions - shared by both DEBUG and RELEASE builds
inline std::atomic<bool> Logger::s_quietMode{false};
inline std::mutex Logger::s_logMutex{};

// Convenience macros for each loader and tool

// Text readers
#define CLAUSE_ERROR(msg) MAPFORGE_ERROR("ClauseReader", msg)
#define CLAUSE_WARN(msg) MAPFORGE_WARN("ClauseReader", msg)
#define CLAUSE_DEBUG(msg) MAPFORGE_DEBUG("ClauseReader", msg)

#define CSV_ERROR(msg) MAPFORGE_ERROR("DelimitedReader", msg)
#define CSV_WARN(msg) MAPFORGE_WARN("DelimitedReader", msg)
#define CSV_INFO(msg) MAPFORGE_INFO("DelimitedReader", msg)
#define CSV_DEBUG(msg) MAPFORGE_DEBUG("DelimitedReader", msg)

// Map catalogs
#define MAPLOADER_CRITICAL(msg) MAPFORGE_CRITICAL("MapLoader", msg)
#define MAPLOADER_ERROR(msg) MAPFORGE_ERROR("MapLoader", msg)
#define MAPLOADER_WARN(msg) MAPFORGE_WARN("MapLoader", msg)
#define MAPLOADER_INFO(msg) MAPFORGE_INFO("MapLoader", msg)
#define MAPLOADER_DEBUG(msg) MAPFORGE_DEBUG("MapLoader", msg)

#define REGION_ERROR(msg) MAPFORGE_ERROR("StrategicRegions", msg)
#define REGION_WARN(msg) MAPFORGE_WARN("StrategicRegions", msg)
#define REGION_INFO(msg) MAPFORGE_INFO("StrategicRegions", msg)

#define BUILDINGS_WARN(msg) MAPFORGE_WARN("Buildings", msg)
#define BUILDINGS_INFO(msg) MAPFORGE_INFO("Buildings", msg)

#define DEFINITIONS_WARN(msg) MAPFORGE_WARN("Definitions", msg)
#define DEFINITIONS_INFO(msg) MAPFORGE_INFO("Definitions", msg)

#define ADJACENCY_WARN(msg) MAPFORGE_WARN("Adjacencies", msg)
#define ADJACENCY_INFO(msg) MAPFORGE_INFO("Adjacencies", msg)

#define IMAGE_ERROR(msg) MAPFORGE_ERROR("ImageDecoder", msg)
#define IMAGE_DEBUG(msg) MAPFORGE_DEBUG("ImageDecoder", msg)

// Configuration and tools
#define SETTINGS_ERROR(msg) MAPFORGE_ERROR("SettingsManager", msg)
#define SETTINGS_WARNING(msg) MAPFORGE_WARN("SettingsManager", msg)
#define SETTINGS_INFO(msg) MAPFORGE_INFO("SettingsManager", msg)

#define CLI_CRITICAL(msg) MAPFORGE_CRITICAL("Inspector", msg)
#define CLI_INFO(msg) MAPFORGE_INFO("Inspector", msg)

// Quiet mode convenience macros
#define MAPFORGE_ENABLE_QUIET_MODE() MapForge::Logger::SetQuietMode(true)
#define MAPFORGE_DISABLE_QUIET_MODE() MapForge::Logger::SetQuietMode(false)

} // namespace MapForge

#endif // LOGGER_HPP
