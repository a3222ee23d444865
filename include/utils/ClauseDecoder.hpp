/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef CLAUSE_DECODER_HPP
#define CLAUSE_DECODER_HPP

#include "core/MapError.hpp"
#include "map/Wrappers.hpp"
#include "utils/ClauseReader.hpp"
#include <cstdint>
#include <filesystem>
#include <limits>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

namespace MapForge {

/**
 * @brief What a decoded field does when its key appears more than once
 *
 * Replace keeps the last occurrence. Append keeps every occurrence, in file
 * order. The policy belongs to the field being decoded, never to the key.
 */
enum class OnRepeat : uint8_t { Replace, Append };

/**
 * @brief Reads and parses a clause file
 * @throws MapError FileNotFound/Io from the read, ClauseSyntax on bad syntax
 */
ClauseValue loadClauseFile(const std::filesystem::path &path);

/**
 * @brief Parses clause text already in memory; origin names it in errors
 * @throws MapError(ClauseSyntax)
 */
ClauseValue parseClauseText(const std::string &text, std::string_view origin);

/**
 * @brief Values stored under key in an object block, filtered by policy
 * @throws MapError(Decode) when object is not a block
 */
std::vector<const ClauseValue *>
collectField(const ClauseValue &object, std::string_view key, OnRepeat policy);

// Shape checks used by hand-written decoders
const std::string &requireScalar(const ClauseValue &value, const char *what);
const ClauseEntries &requireArray(const ClauseValue &value, const char *what,
                                  size_t expectedSize =
                                      std::numeric_limits<size_t>::max());
void requireObject(const ClauseValue &value, const char *what);

namespace detail {
template <typename T> struct IsVector : std::false_type {};
template <typename U> struct IsVector<std::vector<U>> : std::true_type {};
} // namespace detail

/**
 * @brief Decodes one clause value into T
 *
 * Types with a static fromClause() decode themselves. Types with a static
 * parse(std::string_view) (wrappers, dates) decode from a scalar. Vectors
 * decode from array blocks element by element.
 */
template <typename T> T decodeClause(const ClauseValue &value) {
  if constexpr (requires { T::fromClause(value); }) {
    return T::fromClause(value);
  } else if constexpr (requires { T::parse(std::string_view{}); }) {
    return T::parse(requireScalar(value, "scalar"));
  } else if constexpr (std::is_same_v<T, std::filesystem::path>) {
    return std::filesystem::path(requireScalar(value, "path"));
  } else if constexpr (std::is_same_v<T, size_t>) {
    int32_t index = ScalarTraits<int32_t>::parse(requireScalar(value, "index"), "index");
    if (index < 0) {
      throw MapError(MapErrorCode::InvalidScalar,
                     "invalid index literal '" + value.asScalar() + "'");
    }
    return static_cast<size_t>(index);
  } else if constexpr (detail::IsVector<T>::value) {
    T result;
    const auto &entries = requireArray(value, "array");
    result.reserve(entries.size());
    for (const auto &entry : entries) {
      result.push_back(decodeClause<typename T::value_type>(entry.value));
    }
    return result;
  } else {
    return ScalarTraits<T>::parse(requireScalar(value, "scalar"), "scalar");
  }
}

/**
 * @brief Encodes T into a clause value that decodeClause<T> reads back
 */
template <typename T> ClauseValue encodeClause(const T &value) {
  if constexpr (requires { value.toClause(); }) {
    return value.toClause();
  } else if constexpr (requires { value.toString(); }) {
    return ClauseValue::scalar(value.toString());
  } else if constexpr (std::is_same_v<T, std::filesystem::path>) {
    return ClauseValue::scalar(value.generic_string(), true);
  } else if constexpr (std::is_same_v<T, size_t>) {
    return ClauseValue::scalar(std::to_string(value));
  } else if constexpr (detail::IsVector<T>::value) {
    ClauseValue block = ClauseValue::block();
    for (const auto &element : value) {
      block.push(encodeClause(element));
    }
    return block;
  } else {
    return ClauseValue::scalar(ScalarTraits<T>::format(value));
  }
}

/**
 * @brief Decodes a required single-valued field (OnRepeat::Replace)
 * @throws MapError(Decode) when the key is absent; nested failures are
 *         re-thrown with the key prepended
 */
template <typename T>
T requiredField(const ClauseValue &object, std::string_view key) {
  auto found = collectField(object, key, OnRepeat::Replace);
  if (found.empty()) {
    throw MapError(MapErrorCode::Decode,
                   "missing required key '" + std::string(key) + "'");
  }
  try {
    return decodeClause<T>(*found.front());
  } catch (const MapError &e) {
    throw e.wrap(std::string(key));
  }
}

/**
 * @brief Decodes an optional single-valued field (OnRepeat::Replace)
 */
template <typename T>
std::optional<T> optionalField(const ClauseValue &object, std::string_view key) {
  auto found = collectField(object, key, OnRepeat::Replace);
  if (found.empty()) {
    return std::nullopt;
  }
  try {
    return decodeClause<T>(*found.front());
  } catch (const MapError &e) {
    throw e.wrap(std::string(key));
  }
}

/**
 * @brief Decodes every occurrence of a duplicated field (OnRepeat::Append)
 *
 * Zero occurrences give an empty list.
 */
template <typename T>
std::vector<T> repeatedField(const ClauseValue &object, std::string_view key) {
  std::vector<T> result;
  for (const ClauseValue *value : collectField(object, key, OnRepeat::Append)) {
    try {
      result.push_back(decodeClause<T>(*value));
    } catch (const MapError &e) {
      throw e.wrap(std::string(key));
    }
  }
  return result;
}

// Encoding counterparts
template <typename T>
void putField(ClauseValue &object, std::string key, const T &value) {
  object.add(std::move(key), encodeClause(value));
}

template <typename T>
void putField(ClauseValue &object, std::string key,
              const std::optional<T> &value) {
  if (value) {
    object.add(std::move(key), encodeClause(*value));
  }
}

template <typename T>
void putRepeated(ClauseValue &object, const std::string &key,
                 const std::vector<T> &values) {
  for (const auto &value : values) {
    object.add(key, encodeClause(value));
  }
}

/**
 * @brief Keys of the first top-level block, in file order
 *
 * Used for type catalogs such as `buildings = { infrastructure = {...} ... }`.
 * Returns nullopt when the document has no top-level block.
 */
std::optional<std::vector<std::string>>
firstBlockKeys(const ClauseValue &document);

} // namespace MapForge

#endif // CLAUSE_DECODER_HPP
