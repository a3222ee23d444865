/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef CLAUSE_READER_HPP
#define CLAUSE_READER_HPP

#include <cstdint>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace MapForge {

class ClauseValue;
struct ClauseEntry;

using ClauseEntries = std::vector<ClauseEntry>;

enum class ClauseKind : uint8_t { Scalar, Block };

enum class ClauseOperator : uint8_t {
  None, // Bare value inside an array block
  Equal,
  Less,
  LessEqual,
  Greater,
  GreaterEqual,
  NotEqual,
  Exists,     // ?=
  EqualEqual  // ==
};

// Stream operators (for Boost.Test)
std::ostream &operator<<(std::ostream &os, ClauseKind kind);
std::ostream &operator<<(std::ostream &os, ClauseOperator op);

/**
 * @brief One node of a clause document: a scalar token or a { } block
 *
 * A block keeps its entries in file order, so repeated keys are all still
 * present. Whether a repeat appends or replaces is decided when decoding.
 */
class ClauseValue {
public:
  ClauseValue();

  static ClauseValue scalar(std::string text, bool quoted = false);
  static ClauseValue block(ClauseEntries entries = {});

  ClauseKind getKind() const { return m_kind; }
  bool isScalar() const { return m_kind == ClauseKind::Scalar; }
  bool isBlock() const { return m_kind == ClauseKind::Block; }

  // A block whose entries are all keyless (empty blocks count as both)
  bool isArray() const;
  // A block whose entries all carry a key
  bool isObject() const;

  const std::string &asScalar() const { return m_text; }
  bool isQuoted() const { return m_quoted; }
  const ClauseEntries &entries() const { return m_entries; }
  size_t size() const { return m_entries.size(); }

  // Block building
  ClauseValue &add(std::string key, ClauseValue value);
  ClauseValue &push(ClauseValue value);

  // Object member access: every value stored under key, in file order
  std::vector<const ClauseValue *> findAll(std::string_view key) const;
  const ClauseValue *findLast(std::string_view key) const;
  bool hasKey(std::string_view key) const;

  // Writes clause text that ClauseReader parses back to an equal value
  std::string toString() const;
  // Writes a block's entries without the enclosing braces, as a file would hold them
  std::string toDocument() const;

  // Compares structure and text; whether a scalar was quoted is ignored
  bool operator==(const ClauseValue &other) const;

private:
  void writeToStream(std::ostream &stream, size_t depth) const;
  void writeScalar(std::ostream &stream) const;

  ClauseKind m_kind;
  bool m_quoted{false};
  std::string m_text;
  ClauseEntries m_entries;
};

struct ClauseEntry {
  std::optional<std::string> key;
  ClauseOperator op{ClauseOperator::None};
  ClauseValue value;

  bool operator==(const ClauseEntry &other) const = default;
};

enum class ClauseTokenType {
  EndOfFile,
  LeftBrace,  // {
  RightBrace, // }
  Operator,   // = < > <= >= != ?= ==
  Scalar,     // unquoted run
  Quoted      // "..."
};

struct ClauseToken {
  ClauseTokenType type;
  std::string value;
  size_t line;
  size_t column;

  explicit ClauseToken(ClauseTokenType t, std::string v = "", size_t l = 1,
                       size_t c = 1)
      : type(t), value(std::move(v)), line(l), column(c) {}
};

/**
 * @brief Reader for the key = value block format used by the map files
 *
 * Input is expected already decoded to UTF-8 (see decodeLegacyText). The
 * document root is an object block holding every top-level entry.
 *
 * Usage:
 *   ClauseReader reader;
 *   if (!reader.parse(text)) { log reader.getLastError(); }
 *   const ClauseValue &root = reader.getRoot();
 */
class ClauseReader {
private:
  std::string m_input;
  size_t m_position;
  size_t m_line;
  size_t m_column;
  std::string m_lastError;
  ClauseValue m_root;

  // Tokenizer
  std::vector<ClauseToken> tokenize();
  char peek(size_t offset = 0) const;
  char advance();
  void skipWhitespaceAndComments();
  std::string readQuoted();
  std::string readScalar();
  bool isScalarChar(char c) const;

  // Parser
  class Parser {
  private:
    const std::vector<ClauseToken> &m_tokens;
    size_t m_current;
    std::string &m_error;

  public:
    Parser(const std::vector<ClauseToken> &tokens, std::string &error)
        : m_tokens(tokens), m_current(0), m_error(error) {}

    ClauseValue parse();

  private:
    bool parseEntries(ClauseEntries &entries, bool nested);
    bool parseValue(ClauseValue &out);
    bool parseBlock(ClauseValue &out);
    static ClauseOperator toOperator(const std::string &text);
    bool check(ClauseTokenType type) const;
    bool match(ClauseTokenType type);
    const ClauseToken &advance();
    const ClauseToken &peek(size_t offset = 0) const;
    bool isAtEnd() const;
    void setError(const std::string &message);
  };

public:
  ClauseReader();

  /**
   * @brief Reads a legacy single-byte file and parses it
   * @return false with getLastError() set on I/O or syntax failure
   */
  bool loadFromFile(const std::filesystem::path &path);
  bool parse(const std::string &text);
  const ClauseValue &getRoot() const { return m_root; }
  const std::string &getLastError() const { return m_lastError; }
  void clearError() { m_lastError.clear(); }

private:
  void setError(const std::string &message);
};

} // namespace MapForge

#endif // CLAUSE_READER_HPP
