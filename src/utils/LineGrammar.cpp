/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "utils/LineGrammar.hpp"

namespace MapForge {

void forEachContentLine(
    const std::filesystem::path &path,
    const std::function<void(std::string_view line, size_t lineNumber)> &visit) {
  std::string text = readLegacyTextFile(path);
  size_t lineNumber = 0;
  for (std::string_view line : splitLines(text)) {
    ++lineNumber;
    if (trim(line).empty()) {
      continue;
    }
    visit(line, lineNumber);
  }
}

} // namespace MapForge
