/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef ADJACENCIES_HPP
#define ADJACENCIES_HPP

#include "map/Wrappers.hpp"
#include "utils/ClauseReader.hpp"
#include <array>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace MapForge {

class DelimitedRow;

enum class AdjacencyType : uint8_t { Impassable, Sea, River, LargeRiver };

// Empty text means "no type"
std::optional<AdjacencyType> parseAdjacencyType(std::string_view text);
const char *toString(AdjacencyType type);
std::ostream &operator<<(std::ostream &os, AdjacencyType type);

/**
 * @brief One row of adjacencies.csv
 *
 * The file writes -1 for "unset"; those columns arrive here as nullopt.
 */
struct Adjacency {
  ProvinceId from;
  ProvinceId to;
  std::optional<AdjacencyType> type;
  std::optional<ProvinceId> through;
  std::optional<XCoord> startX;
  std::optional<XCoord> stopX;
  std::optional<YCoord> startY;
  std::optional<YCoord> stopY;
  std::optional<AdjacencyRuleName> rule;
  std::optional<std::string> comment;

  static Adjacency fromRow(const DelimitedRow &row);

  bool operator==(const Adjacency &) const = default;
};

class Adjacencies {
public:
  /**
   * @brief Loads adjacencies.csv (header row, strict)
   *
   * The closing row with a negative From id marks the end of data and is not
   * kept. Sea crossings without a through province are logged.
   */
  static Adjacencies fromFile(const std::filesystem::path &path);

  const std::vector<Adjacency> &adjacencies() const { return m_adjacencies; }
  size_t size() const { return m_adjacencies.size(); }

private:
  std::vector<Adjacency> m_adjacencies;
};

/**
 * @brief Which unit kinds may pass an adjacency for one relation
 */
struct AdjacencyLogic {
  bool army{false};
  bool navy{false};
  bool submarine{false};
  bool trade{false};

  static AdjacencyLogic fromClause(const ClauseValue &value);
  ClauseValue toClause() const;

  bool operator==(const AdjacencyLogic &) const = default;
};

struct AdjacencyRule {
  AdjacencyRuleName name;
  AdjacencyLogic contested;
  AdjacencyLogic enemy;
  AdjacencyLogic friendly;
  AdjacencyLogic neutral;
  std::vector<ProvinceId> requiredProvinces;
  ProvinceId icon;
  std::array<int32_t, 3> offset{0, 0, 0};
  std::optional<TooltipKey> disabledTooltip;

  static AdjacencyRule fromClause(const ClauseValue &value);
  ClauseValue toClause() const;

  bool operator==(const AdjacencyRule &) const = default;
};

std::ostream &operator<<(std::ostream &os, const AdjacencyRule &rule);

/**
 * @brief Every adjacency_rule block of adjacency_rules.txt, by name
 *
 * A later rule with an already used name replaces the earlier one.
 */
class AdjacencyRules {
public:
  static AdjacencyRules fromFile(const std::filesystem::path &path);
  static AdjacencyRules fromClause(const ClauseValue &document);

  const AdjacencyRule *find(const AdjacencyRuleName &name) const;
  size_t size() const { return m_rules.size(); }
  const std::unordered_map<AdjacencyRuleName, AdjacencyRule> &rules() const {
    return m_rules;
  }

private:
  std::unordered_map<AdjacencyRuleName, AdjacencyRule> m_rules;
};

} // namespace MapForge

#endif // ADJACENCIES_HPP
