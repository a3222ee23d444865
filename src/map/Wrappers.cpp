/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "map/Wrappers.hpp"
#include "core/MapError.hpp"
#include <charconv>
#include <cmath>
#include <format>
#include <limits>

namespace MapForge {
namespace {

[[noreturn]] void invalidLiteral(std::string_view text, const char *typeName) {
  throw MapError(MapErrorCode::InvalidScalar,
                 std::format("invalid {} literal '{}'", typeName, text));
}

std::string_view stripPlus(std::string_view text) {
  if (text.size() > 1 && text.front() == '+') {
    text.remove_prefix(1);
  }
  return text;
}

template <typename Integer>
Integer parseIntegral(std::string_view text, const char *typeName) {
  text = stripPlus(text);
  Integer value{};
  auto [end, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
  if (text.empty() || ec != std::errc() || end != text.data() + text.size()) {
    invalidLiteral(text, typeName);
  }
  return value;
}

} // anonymous namespace

int32_t ScalarTraits<int32_t>::parse(std::string_view text,
                                     const char *typeName) {
  return parseIntegral<int32_t>(text, typeName);
}

uint8_t ScalarTraits<uint8_t>::parse(std::string_view text,
                                     const char *typeName) {
  int32_t wide = parseIntegral<int32_t>(text, typeName);
  if (wide < 0 || wide > std::numeric_limits<uint8_t>::max()) {
    invalidLiteral(text, typeName);
  }
  return static_cast<uint8_t>(wide);
}

float ScalarTraits<float>::parse(std::string_view text, const char *typeName) {
  text = stripPlus(text);
  float value = 0.0f;
  auto [end, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
  if (text.empty() || ec != std::errc() || end != text.data() + text.size() ||
      !std::isfinite(value)) {
    invalidLiteral(text, typeName);
  }
  return value;
}

std::string ScalarTraits<float>::format(float value) {
  // Shortest representation that reads back to the same float
  return std::format("{}", value);
}

bool ScalarTraits<bool>::parse(std::string_view text, const char *typeName) {
  if (text == "yes" || text == "true") {
    return true;
  }
  if (text == "no" || text == "false") {
    return false;
  }
  invalidLiteral(text, typeName);
}

} // namespace MapForge
