/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "utils/TextFile.hpp"
#include "core/MapError.hpp"
#include <algorithm>
#include <format>
#include <fstream>
#include <sstream>

namespace MapForge {

std::string decodeLegacyText(std::string_view bytes) {
  if (bytes.starts_with("\xEF\xBB\xBF")) {
    bytes.remove_prefix(3);
  }

  std::string result;
  result.reserve(bytes.size() + bytes.size() / 8);
  for (char c : bytes) {
    auto byte = static_cast<unsigned char>(c);
    if (byte < 0x80) {
      result.push_back(c);
    } else {
      result.push_back(static_cast<char>(0xC0 | (byte >> 6)));
      result.push_back(static_cast<char>(0x80 | (byte & 0x3F)));
    }
  }
  return result;
}

std::string readLegacyTextFile(const std::filesystem::path &path) {
  std::error_code ec;
  if (!std::filesystem::is_regular_file(path, ec)) {
    throw MapError(MapErrorCode::FileNotFound,
                   std::format("file not found: {}", path.string()), path);
  }

  std::ifstream file(path, std::ios::binary);
  if (!file.is_open()) {
    throw MapError(MapErrorCode::Io,
                   std::format("could not open file: {}", path.string()), path);
  }

  std::stringstream buffer;
  buffer << file.rdbuf();
  if (file.bad()) {
    throw MapError(MapErrorCode::Io,
                   std::format("could not read file: {}", path.string()), path);
  }
  return decodeLegacyText(buffer.str());
}

std::vector<std::filesystem::path>
listRegularFiles(const std::filesystem::path &directory, std::string_view what) {
  namespace fs = std::filesystem;

  std::error_code ec;
  if (!fs::is_directory(directory, ec)) {
    throw MapError(MapErrorCode::FileNotFound,
                   std::format("{} directory not found: {}", what,
                               directory.string()),
                   directory);
  }

  auto listingFailed = [&directory](const std::error_code &error) {
    return MapError(MapErrorCode::Io,
                    std::format("could not list {}: {}", directory.string(),
                                error.message()),
                    directory);
  };

  std::vector<fs::path> files;
  fs::directory_iterator it(directory, ec);
  if (ec) {
    throw listingFailed(ec);
  }
  // increment(ec) leaves the iterator at end on failure
  for (; it != fs::directory_iterator(); it.increment(ec)) {
    bool regular = it->is_regular_file(ec);
    if (ec) {
      throw listingFailed(ec);
    }
    if (regular) {
      files.push_back(it->path());
    }
  }
  if (ec) {
    throw listingFailed(ec);
  }
  std::sort(files.begin(), files.end());
  return files;
}

std::vector<std::string_view> splitLines(std::string_view text) {
  std::vector<std::string_view> lines;
  size_t start = 0;
  while (start < text.size()) {
    size_t end = text.find('\n', start);
    if (end == std::string_view::npos) {
      end = text.size();
    }
    std::string_view line = text.substr(start, end - start);
    if (line.ends_with('\r')) {
      line.remove_suffix(1);
    }
    lines.push_back(line);
    start = end + 1;
  }
  return lines;
}

std::vector<std::string_view> splitWhitespace(std::string_view line) {
  std::vector<std::string_view> tokens;
  size_t pos = 0;
  while (pos < line.size()) {
    size_t begin = line.find_first_not_of(" \t", pos);
    if (begin == std::string_view::npos) {
      break;
    }
    size_t end = line.find_first_of(" \t", begin);
    if (end == std::string_view::npos) {
      end = line.size();
    }
    tokens.push_back(line.substr(begin, end - begin));
    pos = end;
  }
  return tokens;
}

std::string_view trim(std::string_view text) {
  size_t begin = text.find_first_not_of(" \t\r\n");
  if (begin == std::string_view::npos) {
    return {};
  }
  size_t end = text.find_last_not_of(" \t\r\n");
  return text.substr(begin, end - begin + 1);
}

} // namespace MapForge
