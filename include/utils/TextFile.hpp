/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef TEXT_FILE_HPP
#define TEXT_FILE_HPP

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace MapForge {

/**
 * @brief Converts single-byte legacy text to UTF-8
 *
 * Every byte maps to the code point of the same value, so bytes above 0x7F
 * become two-byte UTF-8 sequences. A leading UTF-8 byte order mark is dropped.
 */
std::string decodeLegacyText(std::string_view bytes);

/**
 * @brief Reads a whole map text file and decodes it with decodeLegacyText
 * @throws MapError FileNotFound when the file does not exist, Io when unreadable
 */
std::string readLegacyTextFile(const std::filesystem::path &path);

/**
 * @brief Regular files directly inside directory, sorted by path
 * @param what Names the directory in the FileNotFound message
 * @throws MapError FileNotFound when directory is missing, Io when listing
 *         or inspecting an entry fails
 */
std::vector<std::filesystem::path>
listRegularFiles(const std::filesystem::path &directory, std::string_view what);

/**
 * @brief Splits text into lines, stripping a trailing '\r' from each
 */
std::vector<std::string_view> splitLines(std::string_view text);

/**
 * @brief Splits on runs of spaces and tabs, dropping empty tokens
 */
std::vector<std::string_view> splitWhitespace(std::string_view line);

std::string_view trim(std::string_view text);

} // namespace MapForge

#endif // TEXT_FILE_HPP
