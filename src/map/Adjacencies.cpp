/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "map/Adjacencies.hpp"
#include "core/Logger.hpp"
#include "core/MapError.hpp"
#include "utils/ClauseDecoder.hpp"
#include "utils/DelimitedReader.hpp"
#include <algorithm>
#include <format>

namespace MapForge {
namespace {

constexpr int32_t UNSET = -1;

// -1 in a numeric column means the value is not set
template <typename T>
std::optional<T> unlessUnset(const DelimitedRow &row, std::string_view column) {
  auto value = row.getOptional<T>(column);
  if (value && value->get() == UNSET) {
    return std::nullopt;
  }
  return value;
}

std::optional<std::string> nonEmptyText(const DelimitedRow &row,
                                        std::string_view column) {
  std::string_view text = row.text(column);
  if (text.empty()) {
    return std::nullopt;
  }
  return std::string(text);
}

// A negative From ends the data; the rest of that row may be empty
bool isTerminatorRow(const DelimitedRow &row) {
  return row.get<int32_t>("From") < 0;
}

} // anonymous namespace

std::optional<AdjacencyType> parseAdjacencyType(std::string_view text) {
  if (text.empty())
    return std::nullopt;
  if (text == "impassable")
    return AdjacencyType::Impassable;
  if (text == "sea")
    return AdjacencyType::Sea;
  if (text == "river")
    return AdjacencyType::River;
  if (text == "large_river")
    return AdjacencyType::LargeRiver;
  throw MapError(MapErrorCode::InvalidScalar,
                 std::format("invalid adjacency type '{}'", text));
}

const char *toString(AdjacencyType type) {
  switch (type) {
  case AdjacencyType::Impassable:
    return "impassable";
  case AdjacencyType::Sea:
    return "sea";
  case AdjacencyType::River:
    return "river";
  case AdjacencyType::LargeRiver:
    return "large_river";
  }
  return "unknown";
}

std::ostream &operator<<(std::ostream &os, AdjacencyType type) {
  return os << toString(type);
}

Adjacency Adjacency::fromRow(const DelimitedRow &row) {
  Adjacency adjacency;
  adjacency.from = row.get<ProvinceId>("From");
  adjacency.to = row.get<ProvinceId>("To");
  try {
    adjacency.type = parseAdjacencyType(row.text("Type"));
  } catch (const MapError &e) {
    row.fail(2, e.what());
  }
  adjacency.through = unlessUnset<ProvinceId>(row, "Through");
  adjacency.startX = unlessUnset<XCoord>(row, "start_x");
  adjacency.stopX = unlessUnset<XCoord>(row, "stop_x");
  adjacency.startY = unlessUnset<YCoord>(row, "start_y");
  adjacency.stopY = unlessUnset<YCoord>(row, "stop_y");
  if (auto rule = nonEmptyText(row, "adjacency_rule_name")) {
    adjacency.rule = AdjacencyRuleName(std::move(*rule));
  }
  adjacency.comment = nonEmptyText(row, "Comment");
  return adjacency;
}

Adjacencies Adjacencies::fromFile(const std::filesystem::path &path) {
  DelimitedReader reader(path, {';', true, RowPolicy::Strict});
  auto rows = reader.readUntil<Adjacency>(&isTerminatorRow, &Adjacency::fromRow);

  Adjacencies result;
  result.m_adjacencies.reserve(rows.size());
  for (auto &adjacency : rows) {
    if (adjacency.type == AdjacencyType::Sea && !adjacency.through) {
      ADJACENCY_WARN(std::format("sea adjacency {} -> {} has no through province",
                                 adjacency.from.get(), adjacency.to.get()));
    }
    result.m_adjacencies.push_back(std::move(adjacency));
  }
  ADJACENCY_INFO(std::format("loaded {} adjacencies", result.size()));
  return result;
}

AdjacencyLogic AdjacencyLogic::fromClause(const ClauseValue &value) {
  requireObject(value, "adjacency logic");
  AdjacencyLogic logic;
  logic.army = requiredField<bool>(value, "army");
  logic.navy = requiredField<bool>(value, "navy");
  logic.submarine = requiredField<bool>(value, "submarine");
  logic.trade = requiredField<bool>(value, "trade");
  return logic;
}

ClauseValue AdjacencyLogic::toClause() const {
  ClauseValue block = ClauseValue::block();
  putField(block, "army", army);
  putField(block, "navy", navy);
  putField(block, "submarine", submarine);
  putField(block, "trade", trade);
  return block;
}

AdjacencyRule AdjacencyRule::fromClause(const ClauseValue &value) {
  requireObject(value, "adjacency_rule");
  AdjacencyRule rule;
  rule.name = requiredField<AdjacencyRuleName>(value, "name");
  rule.contested = requiredField<AdjacencyLogic>(value, "contested");
  rule.enemy = requiredField<AdjacencyLogic>(value, "enemy");
  rule.friendly = requiredField<AdjacencyLogic>(value, "friend");
  rule.neutral = requiredField<AdjacencyLogic>(value, "neutral");
  rule.requiredProvinces =
      requiredField<std::vector<ProvinceId>>(value, "required_provinces");
  rule.icon = requiredField<ProvinceId>(value, "icon");

  auto offset = collectField(value, "offset", OnRepeat::Replace);
  if (offset.empty()) {
    throw MapError(MapErrorCode::Decode, "missing required key 'offset'");
  }
  const auto &components = requireArray(*offset.front(), "offset", 3);
  for (size_t i = 0; i < 3; ++i) {
    rule.offset[i] = decodeClause<int32_t>(components[i].value);
  }

  if (const ClauseValue *disabled = value.findLast("is_disabled")) {
    try {
      rule.disabledTooltip = requiredField<TooltipKey>(*disabled, "tooltip");
    } catch (const MapError &e) {
      throw e.wrap("is_disabled");
    }
  }
  return rule;
}

ClauseValue AdjacencyRule::toClause() const {
  ClauseValue block = ClauseValue::block();
  putField(block, "name", name);
  putField(block, "contested", contested);
  putField(block, "enemy", enemy);
  putField(block, "friend", friendly);
  putField(block, "neutral", neutral);
  putField(block, "required_provinces", requiredProvinces);
  putField(block, "icon", icon);
  putField(block, "offset", std::vector<int32_t>(offset.begin(), offset.end()));
  if (disabledTooltip) {
    ClauseValue disabled = ClauseValue::block();
    putField(disabled, "tooltip", *disabledTooltip);
    block.add("is_disabled", std::move(disabled));
  }
  return block;
}

std::ostream &operator<<(std::ostream &os, const AdjacencyRule &rule) {
  return os << "AdjacencyRule(" << rule.name.get() << ")";
}

AdjacencyRules AdjacencyRules::fromFile(const std::filesystem::path &path) {
  try {
    return fromClause(loadClauseFile(path));
  } catch (const MapError &e) {
    if (e.path().empty()) {
      throw MapError(e.code(), std::format("{}: {}", path.string(), e.what()), path);
    }
    throw;
  }
}

AdjacencyRules AdjacencyRules::fromClause(const ClauseValue &document) {
  AdjacencyRules result;
  for (auto &rule : repeatedField<AdjacencyRule>(document, "adjacency_rule")) {
    AdjacencyRuleName name = rule.name;
    if (result.m_rules.contains(name)) {
      ADJACENCY_WARN(std::format("adjacency rule '{}' redefined, keeping the last",
                                 name.get()));
    }
    result.m_rules.insert_or_assign(std::move(name), std::move(rule));
  }
  return result;
}

const AdjacencyRule *AdjacencyRules::find(const AdjacencyRuleName &name) const {
  auto it = m_rules.find(name);
  return it != m_rules.end() ? &it->second : nullptr;
}

} // namespace MapForge
