/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "utils/ClauseDecoder.hpp"
#include "core/Logger.hpp"
#include "utils/TextFile.hpp"
#include <format>

namespace MapForge {

ClauseValue loadClauseFile(const std::filesystem::path &path) {
  std::string text = readLegacyTextFile(path);
  try {
    return parseClauseText(text, path.string());
  } catch (const MapError &e) {
    throw MapError(e.code(), e.what(), path);
  }
}

ClauseValue parseClauseText(const std::string &text, std::string_view origin) {
  ClauseReader reader;
  if (!reader.parse(text)) {
    CLAUSE_DEBUG(std::format("{}: {}", origin, reader.getLastError()));
    throw MapError(MapErrorCode::ClauseSyntax,
                   std::format("{}: {}", origin, reader.getLastError()));
  }
  return reader.getRoot();
}

std::vector<const ClauseValue *>
collectField(const ClauseValue &object, std::string_view key, OnRepeat policy) {
  if (!object.isBlock()) {
    throw MapError(MapErrorCode::Decode,
                   std::format("expected a block holding '{}', found scalar '{}'",
                               key, object.asScalar()));
  }

  if (policy == OnRepeat::Replace) {
    const ClauseValue *last = object.findLast(key);
    if (last == nullptr) {
      return {};
    }
    return {last};
  }
  return object.findAll(key);
}

const std::string &requireScalar(const ClauseValue &value, const char *what) {
  if (!value.isScalar()) {
    throw MapError(MapErrorCode::Decode,
                   std::format("expected {}, found a block", what));
  }
  return value.asScalar();
}

const ClauseEntries &requireArray(const ClauseValue &value, const char *what,
                                  size_t expectedSize) {
  if (!value.isArray()) {
    throw MapError(MapErrorCode::Decode,
                   value.isScalar()
                       ? std::format("expected {} block, found scalar '{}'",
                                     what, value.asScalar())
                       : std::format("expected {} block without keys", what));
  }
  if (expectedSize != std::numeric_limits<size_t>::max() &&
      value.size() != expectedSize) {
    throw MapError(MapErrorCode::Decode,
                   std::format("expected {} values in {}, found {}",
                               expectedSize, what, value.size()));
  }
  return value.entries();
}

void requireObject(const ClauseValue &value, const char *what) {
  if (!value.isBlock()) {
    throw MapError(MapErrorCode::Decode,
                   std::format("expected {} block, found scalar '{}'", what,
                               value.asScalar()));
  }
}

std::optional<std::vector<std::string>>
firstBlockKeys(const ClauseValue &document) {
  if (document.entries().empty()) {
    return std::nullopt;
  }
  const ClauseValue &first = document.entries().front().value;
  if (!first.isBlock()) {
    return std::nullopt;
  }

  std::vector<std::string> keys;
  keys.reserve(first.size());
  for (const auto &entry : first.entries()) {
    if (entry.key) {
      keys.push_back(*entry.key);
    }
  }
  return keys;
}

} // namespace MapForge
