/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef LINE_GRAMMAR_HPP
#define LINE_GRAMMAR_HPP

#include "core/MapError.hpp"
#include "utils/ClauseDecoder.hpp"
#include "utils/TextFile.hpp"
#include <filesystem>
#include <format>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace MapForge {

/**
 * @brief Calls visit(line, lineNumber) for every non-blank line of a file
 * @throws MapError FileNotFound/Io; anything visit throws passes through
 */
void forEachContentLine(
    const std::filesystem::path &path,
    const std::function<void(std::string_view line, size_t lineNumber)> &visit);

/**
 * @brief `<key> = { <item> <item> ... }` lines (airports, rocket sites)
 *
 * The line goes through the clause tokenizer, so every `key = { ... }` pair
 * it holds is returned in order.
 * @throws MapError ClauseSyntax, Decode or InvalidScalar
 */
template <typename Key, typename Item>
std::vector<std::pair<Key, std::vector<Item>>>
parseIdArrayLine(std::string_view line) {
  ClauseValue parsed = parseClauseText(std::string(line), "line");
  std::vector<std::pair<Key, std::vector<Item>>> result;
  for (const auto &entry : parsed.entries()) {
    if (!entry.key) {
      throw MapError(MapErrorCode::Decode,
                     std::format("expected '<id> = {{ ... }}', found '{}'", line));
    }
    result.emplace_back(Key::parse(*entry.key),
                        decodeClause<std::vector<Item>>(entry.value));
  }
  return result;
}

/**
 * @brief `<head> <count> <item> <item> ...` lines (railways)
 *
 * Item tokens that do not parse are dropped; the caller compares count with
 * the number of items that remain.
 */
template <typename Head, typename Count, typename Item> struct CountedList {
  Head head;
  Count count;
  std::vector<Item> items;
};

/**
 * @throws MapError(InvalidScalar) when head or count do not parse, or when
 *         fewer than two tokens are present
 */
template <typename Head, typename Count, typename Item>
CountedList<Head, Count, Item> parseCountedListLine(std::string_view line) {
  auto tokens = splitWhitespace(line);
  if (tokens.size() < 2) {
    throw MapError(MapErrorCode::InvalidScalar,
                   std::format("expected '<level> <count> <ids>', found '{}'", line));
  }

  CountedList<Head, Count, Item> result{Head::parse(tokens[0]),
                                        Count::parse(tokens[1]), {}};
  result.items.reserve(tokens.size() - 2);
  for (size_t i = 2; i < tokens.size(); ++i) {
    try {
      result.items.push_back(Item::parse(tokens[i]));
    } catch (const MapError &) {
      // Unparseable ids do not count towards the declared length
      continue;
    }
  }
  return result;
}

/**
 * @brief `<sentinel> <item>` lines (supply nodes)
 * @return nullopt when the line does not have exactly two tokens or the
 *         first token differs from sentinel
 * @throws MapError(InvalidScalar) when the item does not parse
 */
template <typename Item>
std::optional<Item> parseSentinelPairLine(std::string_view line,
                                          std::string_view sentinel) {
  auto tokens = splitWhitespace(trim(line));
  if (tokens.size() != 2 || tokens[0] != sentinel) {
    return std::nullopt;
  }
  return Item::parse(tokens[1]);
}

} // namespace MapForge

#endif // LINE_GRAMMAR_HPP
