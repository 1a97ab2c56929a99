/* Copyright (c) 2025 Stormfire Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "utils/JsonReader.hpp"
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <format>
#include <fstream>
#include <sstream>

namespace Stormfire {

namespace {
constexpr int MAX_NESTING = 64;

const JsonValue &nullValue() {
  static const JsonValue value;
  return value;
}
} // namespace

std::optional<double> JsonValue::tryAsNumber() const {
  if (isNumber())
    return asNumber();
  return std::nullopt;
}

std::optional<std::string> JsonValue::tryAsString() const {
  if (isString())
    return asString();
  return std::nullopt;
}

bool JsonValue::hasKey(const std::string &key) const {
  return isObject() && asObject().count(key) > 0;
}

const JsonValue &JsonValue::operator[](const std::string &key) const {
  if (!isObject())
    return nullValue();
  auto it = asObject().find(key);
  return it != asObject().end() ? it->second : nullValue();
}

const JsonValue &JsonValue::operator[](size_t index) const {
  if (!isArray() || index >= asArray().size())
    return nullValue();
  return asArray()[index];
}

size_t JsonValue::size() const {
  if (isArray())
    return asArray().size();
  if (isObject())
    return asObject().size();
  return 0;
}

bool JsonReader::loadFromFile(const std::string &path) {
  std::ifstream file(path);
  if (!file.is_open()) {
    m_root = JsonValue();
    m_lastError = "Could not open file: " + path;
    return false;
  }
  std::stringstream buffer;
  buffer << file.rdbuf();
  return parse(buffer.str());
}

bool JsonReader::parse(const std::string &jsonString) {
  m_input = jsonString;
  m_pos = 0;
  m_line = 1;
  m_column = 1;
  m_lastError.clear();
  m_root = JsonValue();

  JsonValue root;
  skipWhitespace();
  if (!parseValue(root, 0)) {
    return false;
  }
  skipWhitespace();
  if (!atEnd()) {
    return fail("Unexpected trailing content");
  }
  m_root = std::move(root);
  return true;
}

bool JsonReader::parseValue(JsonValue &out, int depth) {
  if (depth > MAX_NESTING) {
    return fail("Nesting too deep");
  }
  switch (peek()) {
  case '{':
    return parseObject(out, depth);
  case '[':
    return parseArray(out, depth);
  case '"': {
    std::string text;
    if (!parseString(text))
      return false;
    out = JsonValue(std::move(text));
    return true;
  }
  case 't':
    return parseLiteral("true", JsonValue(true), out);
  case 'f':
    return parseLiteral("false", JsonValue(false), out);
  case 'n':
    return parseLiteral("null", JsonValue(), out);
  case '\0':
    return fail("Unexpected end of input");
  default:
    if (peek() == '-' || (peek() >= '0' && peek() <= '9')) {
      return parseNumber(out);
    }
    return fail(std::format("Unexpected character '{}'", peek()));
  }
}

bool JsonReader::parseObject(JsonValue &out, int depth) {
  advance(); // '{'
  JsonObject members;
  skipWhitespace();
  if (consume('}')) {
    out = JsonValue(std::move(members));
    return true;
  }
  while (true) {
    skipWhitespace();
    if (peek() != '"') {
      return fail("Expected string key");
    }
    std::string key;
    if (!parseString(key))
      return false;
    skipWhitespace();
    if (!consume(':')) {
      return fail("Expected ':' after key '" + key + "'");
    }
    skipWhitespace();
    JsonValue member;
    if (!parseValue(member, depth + 1))
      return false;
    members[key] = std::move(member);
    skipWhitespace();
    if (consume('}'))
      break;
    if (!consume(',')) {
      return fail("Expected ',' or '}' in object");
    }
  }
  out = JsonValue(std::move(members));
  return true;
}

bool JsonReader::parseArray(JsonValue &out, int depth) {
  advance(); // '['
  JsonArray items;
  skipWhitespace();
  if (consume(']')) {
    out = JsonValue(std::move(items));
    return true;
  }
  while (true) {
    skipWhitespace();
    JsonValue item;
    if (!parseValue(item, depth + 1))
      return false;
    items.push_back(std::move(item));
    skipWhitespace();
    if (consume(']'))
      break;
    if (!consume(',')) {
      return fail("Expected ',' or ']' in array");
    }
  }
  out = JsonValue(std::move(items));
  return true;
}

bool JsonReader::parseString(std::string &out) {
  advance(); // opening quote
  while (!atEnd()) {
    char c = advance();
    if (c == '"') {
      return true;
    }
    if (static_cast<unsigned char>(c) < 0x20) {
      return fail("Control character in string");
    }
    if (c != '\\') {
      out.push_back(c);
      continue;
    }
    char esc = advance();
    switch (esc) {
    case '"':
    case '\\':
    case '/':
      out.push_back(esc);
      break;
    case 'b':
      out.push_back('\b');
      break;
    case 'f':
      out.push_back('\f');
      break;
    case 'n':
      out.push_back('\n');
      break;
    case 'r':
      out.push_back('\r');
      break;
    case 't':
      out.push_back('\t');
      break;
    case 'u':
      if (!appendUnicodeEscape(out))
        return false;
      break;
    default:
      return fail(std::format("Invalid escape '\\{}'", esc));
    }
  }
  return fail("Unterminated string");
}

bool JsonReader::appendUnicodeEscape(std::string &out) {
  uint32_t code = 0;
  for (int i = 0; i < 4; ++i) {
    char h = advance();
    code <<= 4;
    if (h >= '0' && h <= '9')
      code |= static_cast<uint32_t>(h - '0');
    else if (h >= 'a' && h <= 'f')
      code |= static_cast<uint32_t>(h - 'a' + 10);
    else if (h >= 'A' && h <= 'F')
      code |= static_cast<uint32_t>(h - 'A' + 10);
    else
      return fail("Invalid \\u escape");
  }
  // UTF-8 encode the basic multilingual plane; surrogates are kept as-is
  if (code < 0x80) {
    out.push_back(static_cast<char>(code));
  } else if (code < 0x800) {
    out.push_back(static_cast<char>(0xC0 | (code >> 6)));
    out.push_back(static_cast<char>(0x80 | (code & 0x3F)));
  } else {
    out.push_back(static_cast<char>(0xE0 | (code >> 12)));
    out.push_back(static_cast<char>(0x80 | ((code >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (code & 0x3F)));
  }
  return true;
}

bool JsonReader::parseNumber(JsonValue &out) {
  size_t start = m_pos;
  if (peek() == '-')
    advance();
  if (!(peek() >= '0' && peek() <= '9')) {
    return fail("Expected digit");
  }
  auto digits = [this] {
    while (peek() >= '0' && peek() <= '9')
      advance();
  };
  digits();
  if (peek() == '.') {
    advance();
    if (!(peek() >= '0' && peek() <= '9'))
      return fail("Expected digit after '.'");
    digits();
  }
  if (peek() == 'e' || peek() == 'E') {
    advance();
    if (peek() == '+' || peek() == '-')
      advance();
    if (!(peek() >= '0' && peek() <= '9'))
      return fail("Expected exponent digits");
    digits();
  }

  std::string text = m_input.substr(start, m_pos - start);
  errno = 0;
  char *end = nullptr;
  double value = std::strtod(text.c_str(), &end);
  if (errno == ERANGE || end != text.c_str() + text.size()) {
    return fail("Number out of range: " + text);
  }
  out = JsonValue(value);
  return true;
}

bool JsonReader::parseLiteral(const char *word, JsonValue value,
                              JsonValue &out) {
  size_t len = std::strlen(word);
  if (m_input.compare(m_pos, len, word) != 0) {
    return fail(std::format("Expected '{}'", word));
  }
  for (size_t i = 0; i < len; ++i)
    advance();
  out = std::move(value);
  return true;
}

void JsonReader::skipWhitespace() {
  while (!atEnd()) {
    char c = peek();
    if (c != ' ' && c != '\t' && c != '\n' && c != '\r')
      break;
    advance();
  }
}

char JsonReader::advance() {
  if (atEnd())
    return '\0';
  char c = m_input[m_pos++];
  if (c == '\n') {
    ++m_line;
    m_column = 1;
  } else {
    ++m_column;
  }
  return c;
}

bool JsonReader::consume(char expected) {
  if (peek() != expected)
    return false;
  advance();
  return true;
}

bool JsonReader::fail(const std::string &message) {
  if (m_lastError.empty()) {
    m_lastError =
        std::format("{} at line {}, column {}", message, m_line, m_column);
  }
  return false;
}

} // namespace Stormfire
