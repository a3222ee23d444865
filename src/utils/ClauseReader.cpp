/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "utils/ClauseReader.hpp"
#include "core/MapError.hpp"
#include "utils/TextFile.hpp"
#include <algorithm>
#include <format>
#include <sstream>

namespace MapForge {

std::ostream &operator<<(std::ostream &os, ClauseKind kind) {
  switch (kind) {
  case ClauseKind::Scalar:
    return os << "Scalar";
  case ClauseKind::Block:
    return os << "Block";
  }
  return os << "Unknown";
}

namespace {

const char *operatorText(ClauseOperator op) {
  switch (op) {
  case ClauseOperator::None:
    return "";
  case ClauseOperator::Equal:
    return "=";
  case ClauseOperator::Less:
    return "<";
  case ClauseOperator::LessEqual:
    return "<=";
  case ClauseOperator::Greater:
    return ">";
  case ClauseOperator::GreaterEqual:
    return ">=";
  case ClauseOperator::NotEqual:
    return "!=";
  case ClauseOperator::Exists:
    return "?=";
  case ClauseOperator::EqualEqual:
    return "==";
  }
  return "=";
}

bool needsQuotes(const std::string &text) {
  if (text.empty()) {
    return true;
  }
  return std::any_of(text.begin(), text.end(), [](char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '{' ||
           c == '}' || c == '=' || c == '<' || c == '>' || c == '"' ||
           c == '#' || c == '!' || c == '?';
  });
}

// Tags allowed directly in front of a block, as in color = rgb { 1 2 3 }
bool isBlockTag(const std::string &text) {
  return text == "rgb" || text == "hsv" || text == "hsv360";
}

} // anonymous namespace

std::ostream &operator<<(std::ostream &os, ClauseOperator op) {
  return os << (op == ClauseOperator::None ? "(none)" : operatorText(op));
}

// ClauseValue implementation
ClauseValue::ClauseValue() : m_kind(ClauseKind::Block) {}

ClauseValue ClauseValue::scalar(std::string text, bool quoted) {
  ClauseValue value;
  value.m_kind = ClauseKind::Scalar;
  value.m_text = std::move(text);
  value.m_quoted = quoted;
  return value;
}

ClauseValue ClauseValue::block(ClauseEntries entries) {
  ClauseValue value;
  value.m_entries = std::move(entries);
  return value;
}

bool ClauseValue::isArray() const {
  return isBlock() &&
         std::all_of(m_entries.begin(), m_entries.end(),
                     [](const ClauseEntry &entry) { return !entry.key; });
}

bool ClauseValue::isObject() const {
  return isBlock() &&
         std::all_of(m_entries.begin(), m_entries.end(),
                     [](const ClauseEntry &entry) { return entry.key.has_value(); });
}

ClauseValue &ClauseValue::add(std::string key, ClauseValue value) {
  m_kind = ClauseKind::Block;
  m_entries.push_back(
      ClauseEntry{std::move(key), ClauseOperator::Equal, std::move(value)});
  return *this;
}

ClauseValue &ClauseValue::push(ClauseValue value) {
  m_kind = ClauseKind::Block;
  m_entries.push_back(
      ClauseEntry{std::nullopt, ClauseOperator::None, std::move(value)});
  return *this;
}

std::vector<const ClauseValue *>
ClauseValue::findAll(std::string_view key) const {
  std::vector<const ClauseValue *> found;
  for (const auto &entry : m_entries) {
    if (entry.key && *entry.key == key) {
      found.push_back(&entry.value);
    }
  }
  return found;
}

const ClauseValue *ClauseValue::findLast(std::string_view key) const {
  for (auto it = m_entries.rbegin(); it != m_entries.rend(); ++it) {
    if (it->key && *it->key == key) {
      return &it->value;
    }
  }
  return nullptr;
}

bool ClauseValue::hasKey(std::string_view key) const {
  return findLast(key) != nullptr;
}

bool ClauseValue::operator==(const ClauseValue &other) const {
  return m_kind == other.m_kind && m_text == other.m_text &&
         m_entries == other.m_entries;
}

std::string ClauseValue::toString() const {
  std::ostringstream stream;
  writeToStream(stream, 0);
  return stream.str();
}

std::string ClauseValue::toDocument() const {
  std::ostringstream stream;
  for (const auto &entry : m_entries) {
    if (entry.key) {
      ClauseValue::scalar(*entry.key).writeScalar(stream);
      stream << ' ' << operatorText(entry.op) << ' ';
    }
    entry.value.writeToStream(stream, 0);
    stream << '\n';
  }
  return stream.str();
}

void ClauseValue::writeScalar(std::ostream &stream) const {
  if (!m_quoted && !needsQuotes(m_text)) {
    stream << m_text;
    return;
  }
  stream << '"';
  for (char c : m_text) {
    if (c == '"' || c == '\\') {
      stream << '\\';
    }
    stream << c;
  }
  stream << '"';
}

void ClauseValue::writeToStream(std::ostream &stream, size_t depth) const {
  if (isScalar()) {
    writeScalar(stream);
    return;
  }

  bool flat = std::all_of(m_entries.begin(), m_entries.end(),
                          [](const ClauseEntry &entry) {
                            return !entry.key && entry.value.isScalar();
                          });
  if (flat) {
    stream << '{';
    for (const auto &entry : m_entries) {
      stream << ' ';
      entry.value.writeScalar(stream);
    }
    stream << " }";
    return;
  }

  std::string indent(depth + 1, '\t');
  stream << "{\n";
  for (const auto &entry : m_entries) {
    stream << indent;
    if (entry.key) {
      ClauseValue::scalar(*entry.key).writeScalar(stream);
      stream << ' ' << operatorText(entry.op) << ' ';
    }
    entry.value.writeToStream(stream, depth + 1);
    stream << '\n';
  }
  stream << std::string(depth, '\t') << '}';
}

// ClauseReader implementation
ClauseReader::ClauseReader() : m_position(0), m_line(1), m_column(1) {}

bool ClauseReader::loadFromFile(const std::filesystem::path &path) {
  std::string text;
  try {
    text = readLegacyTextFile(path);
  } catch (const MapError &e) {
    m_lastError = e.what();
    return false;
  }
  if (!parse(text)) {
    m_lastError = std::format("{}: {}", path.string(), m_lastError);
    return false;
  }
  return true;
}

bool ClauseReader::parse(const std::string &text) {
  clearError();
  m_input = text;
  m_position = 0;
  m_line = 1;
  m_column = 1;
  m_root = ClauseValue::block();

  auto tokens = tokenize();
  if (!m_lastError.empty()) {
    return false;
  }

  Parser parser(tokens, m_lastError);
  ClauseValue root = parser.parse();
  if (!m_lastError.empty()) {
    return false;
  }
  m_root = std::move(root);
  return true;
}

void ClauseReader::setError(const std::string &message) {
  m_lastError = std::format("Line {}, Column {}: {}", m_line, m_column, message);
}

// Tokenizer implementation
std::vector<ClauseToken> ClauseReader::tokenize() {
  std::vector<ClauseToken> tokens;
  tokens.reserve(m_input.size() / 4);

  while (true) {
    skipWhitespaceAndComments();
    if (m_position >= m_input.length()) {
      break;
    }

    char c = peek();
    size_t tokenLine = m_line;
    size_t tokenColumn = m_column;

    switch (c) {
    case '{':
      advance();
      tokens.emplace_back(ClauseTokenType::LeftBrace, "{", tokenLine, tokenColumn);
      break;
    case '}':
      advance();
      tokens.emplace_back(ClauseTokenType::RightBrace, "}", tokenLine, tokenColumn);
      break;
    case '=':
    case '<':
    case '>': {
      std::string op(1, advance());
      if (peek() == '=') {
        op.push_back(advance());
      }
      tokens.emplace_back(ClauseTokenType::Operator, std::move(op), tokenLine,
                          tokenColumn);
      break;
    }
    case '"': {
      std::string text = readQuoted();
      if (!m_lastError.empty()) {
        return tokens;
      }
      tokens.emplace_back(ClauseTokenType::Quoted, std::move(text), tokenLine,
                          tokenColumn);
      break;
    }
    default:
      if ((c == '!' || c == '?') && peek(1) == '=') {
        std::string op{advance(), advance()};
        tokens.emplace_back(ClauseTokenType::Operator, std::move(op), tokenLine,
                            tokenColumn);
      } else {
        tokens.emplace_back(ClauseTokenType::Scalar, readScalar(), tokenLine,
                            tokenColumn);
      }
      break;
    }
  }

  tokens.emplace_back(ClauseTokenType::EndOfFile, "", m_line, m_column);
  return tokens;
}

char ClauseReader::peek(size_t offset) const {
  size_t pos = m_position + offset;
  return (pos < m_input.length()) ? m_input[pos] : '\0';
}

char ClauseReader::advance() {
  if (m_position >= m_input.length()) {
    return '\0';
  }

  char c = m_input[m_position++];
  if (c == '\n') {
    m_line++;
    m_column = 1;
  } else {
    m_column++;
  }
  return c;
}

void ClauseReader::skipWhitespaceAndComments() {
  while (m_position < m_input.length()) {
    char c = peek();
    if (c == ' ' || c == '\t' || c == '\r' || c == '\n') {
      advance();
    } else if (c == '#') {
      while (m_position < m_input.length() && peek() != '\n') {
        advance();
      }
    } else {
      break;
    }
  }
}

std::string ClauseReader::readQuoted() {
  advance(); // Skip opening quote

  std::string result;
  while (m_position < m_input.length()) {
    char c = advance();
    if (c == '"') {
      return result;
    }
    if (c == '\\' && (peek() == '"' || peek() == '\\')) {
      c = advance();
    }
    result.push_back(c);
  }

  setError("Unterminated quoted string");
  return result;
}

std::string ClauseReader::readScalar() {
  std::string result;
  while (m_position < m_input.length() && isScalarChar(peek())) {
    char c = peek();
    if ((c == '!' || c == '?') && peek(1) == '=') {
      break;
    }
    result.push_back(advance());
  }
  return result;
}

bool ClauseReader::isScalarChar(char c) const {
  switch (c) {
  case ' ':
  case '\t':
  case '\r':
  case '\n':
  case '{':
  case '}':
  case '=':
  case '<':
  case '>':
  case '"':
  case '#':
    return false;
  default:
    return true;
  }
}

// Parser implementation
ClauseValue ClauseReader::Parser::parse() {
  ClauseEntries entries;
  if (!parseEntries(entries, false)) {
    return ClauseValue::block();
  }
  return ClauseValue::block(std::move(entries));
}

bool ClauseReader::Parser::parseEntries(ClauseEntries &entries, bool nested) {
  while (true) {
    if (isAtEnd()) {
      if (nested) {
        setError("Unterminated block, expected '}'");
        return false;
      }
      return true;
    }

    const ClauseToken &token = peek();
    switch (token.type) {
    case ClauseTokenType::RightBrace:
      if (nested) {
        return true;
      }
      setError("Unexpected '}' at top level");
      return false;

    case ClauseTokenType::LeftBrace: {
      ClauseValue value;
      if (!parseBlock(value)) {
        return false;
      }
      entries.push_back(
          ClauseEntry{std::nullopt, ClauseOperator::None, std::move(value)});
      break;
    }

    case ClauseTokenType::Scalar:
    case ClauseTokenType::Quoted: {
      bool quoted = token.type == ClauseTokenType::Quoted;
      if (peek(1).type == ClauseTokenType::Operator) {
        std::string key = advance().value;
        ClauseOperator op = toOperator(advance().value);
        ClauseValue value;
        if (!parseValue(value)) {
          return false;
        }
        entries.push_back(ClauseEntry{std::move(key), op, std::move(value)});
      } else {
        entries.push_back(ClauseEntry{std::nullopt, ClauseOperator::None,
                                      ClauseValue::scalar(advance().value, quoted)});
      }
      break;
    }

    case ClauseTokenType::Operator:
      setError("Expected key before '" + token.value + "'");
      return false;

    case ClauseTokenType::EndOfFile:
      return !nested;
    }
  }
}

bool ClauseReader::Parser::parseValue(ClauseValue &out) {
  const ClauseToken &token = peek();

  switch (token.type) {
  case ClauseTokenType::LeftBrace:
    return parseBlock(out);
  case ClauseTokenType::Scalar:
    if (isBlockTag(token.value) && peek(1).type == ClauseTokenType::LeftBrace) {
      advance();
      return parseBlock(out);
    }
    out = ClauseValue::scalar(advance().value, false);
    return true;
  case ClauseTokenType::Quoted:
    out = ClauseValue::scalar(advance().value, true);
    return true;
  default:
    setError("Expected value, got '" + token.value + "'");
    return false;
  }
}

bool ClauseReader::Parser::parseBlock(ClauseValue &out) {
  if (!match(ClauseTokenType::LeftBrace)) {
    setError("Expected '{'");
    return false;
  }

  ClauseEntries entries;
  if (!parseEntries(entries, true)) {
    return false;
  }

  if (!match(ClauseTokenType::RightBrace)) {
    setError("Expected '}'");
    return false;
  }

  out = ClauseValue::block(std::move(entries));
  return true;
}

ClauseOperator ClauseReader::Parser::toOperator(const std::string &text) {
  if (text == "<")
    return ClauseOperator::Less;
  if (text == "<=")
    return ClauseOperator::LessEqual;
  if (text == ">")
    return ClauseOperator::Greater;
  if (text == ">=")
    return ClauseOperator::GreaterEqual;
  if (text == "!=")
    return ClauseOperator::NotEqual;
  if (text == "?=")
    return ClauseOperator::Exists;
  if (text == "==")
    return ClauseOperator::EqualEqual;
  return ClauseOperator::Equal;
}

bool ClauseReader::Parser::match(ClauseTokenType type) {
  if (check(type)) {
    advance();
    return true;
  }
  return false;
}

bool ClauseReader::Parser::check(ClauseTokenType type) const {
  return peek().type == type;
}

const ClauseToken &ClauseReader::Parser::advance() {
  const ClauseToken &token = m_tokens[m_current];
  if (!isAtEnd()) {
    m_current++;
  }
  return token;
}

const ClauseToken &ClauseReader::Parser::peek(size_t offset) const {
  size_t index = std::min(m_current + offset, m_tokens.size() - 1);
  return m_tokens[index];
}

bool ClauseReader::Parser::isAtEnd() const {
  return m_tokens[m_current].type == ClauseTokenType::EndOfFile;
}

void ClauseReader::Parser::setError(const std::string &message) {
  const ClauseToken &token = peek();
  m_error =
      std::format("Line {}, Column {}: {}", token.line, token.column, message);
}

} // namespace MapForge
