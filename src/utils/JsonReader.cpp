/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "utils/JsonReader.hpp"
#include <charconv>
#include <cmath>
#include <format>
#include <fstream>
#include <limits>
#include <sstream>
#include <system_error>

namespace Lookout {

namespace {

bool isDigit(char c) { return c >= '0' && c <= '9'; }

int hexValue(char c) {
  if (c >= '0' && c <= '9')
    return c - '0';
  if (c >= 'a' && c <= 'f')
    return c - 'a' + 10;
  if (c >= 'A' && c <= 'F')
    return c - 'A' + 10;
  return -1;
}

void appendUtf8(std::string &out, unsigned codepoint) {
  if (codepoint <= 0x7F) {
    out += static_cast<char>(codepoint);
  } else if (codepoint <= 0x7FF) {
    out += static_cast<char>(0xC0 | (codepoint >> 6));
    out += static_cast<char>(0x80 | (codepoint & 0x3F));
  } else if (codepoint <= 0xFFFF) {
    out += static_cast<char>(0xE0 | (codepoint >> 12));
    out += static_cast<char>(0x80 | ((codepoint >> 6) & 0x3F));
    out += static_cast<char>(0x80 | (codepoint & 0x3F));
  } else {
    out += static_cast<char>(0xF0 | (codepoint >> 18));
    out += static_cast<char>(0x80 | ((codepoint >> 12) & 0x3F));
    out += static_cast<char>(0x80 | ((codepoint >> 6) & 0x3F));
    out += static_cast<char>(0x80 | (codepoint & 0x3F));
  }
}

} // anonymous namespace

// ============================================================================
// JsonValue
// ============================================================================

std::optional<double> JsonValue::tryAsNumber() const {
  if (const double *number = std::get_if<double>(&m_value))
    return *number;
  return std::nullopt;
}

std::optional<int> JsonValue::tryAsInt() const {
  const double *number = std::get_if<double>(&m_value);
  if (!number || std::trunc(*number) != *number)
    return std::nullopt;
  if (*number < static_cast<double>(std::numeric_limits<int>::min()) ||
      *number > static_cast<double>(std::numeric_limits<int>::max()))
    return std::nullopt;
  return static_cast<int>(*number);
}

std::optional<bool> JsonValue::tryAsBool() const {
  if (const bool *flag = std::get_if<bool>(&m_value))
    return *flag;
  return std::nullopt;
}

const std::string *JsonValue::tryAsString() const {
  return std::get_if<std::string>(&m_value);
}

const JsonObject *JsonValue::tryAsObject() const {
  return std::get_if<JsonObject>(&m_value);
}

bool JsonValue::hasKey(const std::string &key) const {
  const JsonObject *obj = tryAsObject();
  return obj && obj->find(key) != obj->end();
}

const JsonValue &JsonValue::operator[](const std::string &key) const {
  static const JsonValue nullValue;
  const JsonObject *obj = tryAsObject();
  if (!obj)
    return nullValue;
  auto it = obj->find(key);
  return it != obj->end() ? it->second : nullValue;
}

size_t JsonValue::size() const {
  if (const JsonArray *arr = std::get_if<JsonArray>(&m_value))
    return arr->size();
  if (const JsonObject *obj = tryAsObject())
    return obj->size();
  return 0;
}

// ============================================================================
// JsonReader
// ============================================================================

bool JsonReader::loadFromFile(const std::string &path) {
  std::ifstream file(path, std::ios::binary);
  if (!file.is_open()) {
    m_lastError = "Could not open file: " + path;
    m_root = JsonValue();
    return false;
  }

  std::ostringstream buffer;
  buffer << file.rdbuf();
  const std::string contents = buffer.str();
  return parse(contents);
}

bool JsonReader::parse(std::string_view json) {
  m_input = json;
  m_position = 0;
  m_line = 1;
  m_column = 1;
  m_depth = 0;
  m_lastError.clear();

  skipWhitespace();
  JsonValue root = readValue();
  if (!failed()) {
    skipWhitespace();
    if (!atEnd()) {
      fail("Unexpected data after JSON value");
    }
  }

  // The view only lives for the duration of this call
  m_input = {};
  m_root = failed() ? JsonValue() : std::move(root);
  return !failed();
}

void JsonReader::fail(const std::string &message) {
  // Keep the first error; later ones are knock-on effects
  if (!failed()) {
    m_lastError = std::format("Line {}, Column {}: {}", m_line, m_column, message);
  }
}

char JsonReader::advance() {
  if (atEnd())
    return '\0';
  const char c = m_input[m_position++];
  if (c == '\n') {
    ++m_line;
    m_column = 1;
  } else {
    ++m_column;
  }
  return c;
}

void JsonReader::skipWhitespace() {
  while (!atEnd()) {
    const char c = peek();
    if (c != ' ' && c != '\t' && c != '\r' && c != '\n')
      break;
    advance();
  }
}

bool JsonReader::consume(char expected) {
  skipWhitespace();
  if (peek() != expected)
    return false;
  advance();
  return true;
}

bool JsonReader::consumeLiteral(std::string_view literal) {
  if (m_input.substr(m_position, literal.size()) != literal)
    return false;
  for (size_t i = 0; i < literal.size(); ++i)
    advance();
  return true;
}

JsonValue JsonReader::readValue() {
  skipWhitespace();
  if (atEnd()) {
    fail("Unexpected end of input");
    return JsonValue();
  }

  const char c = peek();
  switch (c) {
  case '{':
    return readObject();
  case '[':
    return readArray();
  case '"':
    return JsonValue(readString());
  case 't':
    if (consumeLiteral("true"))
      return JsonValue(true);
    break;
  case 'f':
    if (consumeLiteral("false"))
      return JsonValue(false);
    break;
  case 'n':
    if (consumeLiteral("null"))
      return JsonValue();
    break;
  default:
    if (c == '-' || isDigit(c))
      return readNumber();
    break;
  }

  fail(std::format("Unexpected character '{}'", c));
  return JsonValue();
}

JsonValue JsonReader::readObject() {
  if (++m_depth > MAX_DEPTH) {
    fail(std::format("Nesting deeper than {} levels", MAX_DEPTH));
    return JsonValue();
  }
  advance(); // '{'

  JsonObject members;
  if (consume('}')) {
    --m_depth;
    return JsonValue(std::move(members));
  }

  do {
    skipWhitespace();
    if (peek() != '"') {
      fail("Expected string key in object");
      return JsonValue();
    }
    std::string key = readString();
    if (failed())
      return JsonValue();

    if (!consume(':')) {
      fail(std::format("Expected ':' after key \"{}\"", key));
      return JsonValue();
    }

    JsonValue value = readValue();
    if (failed())
      return JsonValue();

    if (!members.emplace(key, std::move(value)).second) {
      fail(std::format("Duplicate key \"{}\"", key));
      return JsonValue();
    }
  } while (consume(','));

  if (!consume('}')) {
    fail("Expected ',' or '}' in object");
    return JsonValue();
  }
  --m_depth;
  return JsonValue(std::move(members));
}

JsonValue JsonReader::readArray() {
  if (++m_depth > MAX_DEPTH) {
    fail(std::format("Nesting deeper than {} levels", MAX_DEPTH));
    return JsonValue();
  }
  advance(); // '['

  JsonArray elements;
  if (consume(']')) {
    --m_depth;
    return JsonValue(std::move(elements));
  }

  do {
    JsonValue value = readValue();
    if (failed())
      return JsonValue();
    elements.push_back(std::move(value));
  } while (consume(','));

  if (!consume(']')) {
    fail("Expected ',' or ']' in array");
    return JsonValue();
  }
  --m_depth;
  return JsonValue(std::move(elements));
}

JsonValue JsonReader::readNumber() {
  const size_t start = m_position;

  if (peek() == '-')
    advance();

  // No leading zeros: "0" alone or a non-zero digit run
  if (peek() == '0') {
    advance();
  } else if (isDigit(peek())) {
    while (isDigit(peek()))
      advance();
  } else {
    fail("Expected digit in number");
    return JsonValue();
  }

  if (peek() == '.') {
    advance();
    if (!isDigit(peek())) {
      fail("Expected digit after decimal point");
      return JsonValue();
    }
    while (isDigit(peek()))
      advance();
  }

  if (peek() == 'e' || peek() == 'E') {
    advance();
    if (peek() == '+' || peek() == '-')
      advance();
    if (!isDigit(peek())) {
      fail("Expected digit in exponent");
      return JsonValue();
    }
    while (isDigit(peek()))
      advance();
  }

  const std::string_view text = m_input.substr(start, m_position - start);
  double number = 0.0;
  const auto [end, ec] = std::from_chars(text.data(), text.data() + text.size(), number);
  if (ec != std::errc() || end != text.data() + text.size()) {
    fail(std::format("Number out of range: {}", text));
    return JsonValue();
  }
  return JsonValue(number);
}

std::string JsonReader::readString() {
  advance(); // opening quote

  std::string result;
  while (!atEnd()) {
    const char c = advance();

    if (c == '"')
      return result;

    if (static_cast<unsigned char>(c) < 0x20) {
      fail("Unescaped control character in string");
      return {};
    }

    if (c != '\\') {
      result += c;
      continue;
    }

    if (atEnd())
      break;

    const char escaped = advance();
    switch (escaped) {
    case '"':
    case '\\':
    case '/':
      result += escaped;
      break;
    case 'b': result += '\b'; break;
    case 'f': result += '\f'; break;
    case 'n': result += '\n'; break;
    case 'r': result += '\r'; break;
    case 't': result += '\t'; break;
    case 'u': {
      unsigned codepoint = 0;
      if (!readHexQuad(codepoint))
        return {};

      // High surrogate must be followed by an escaped low surrogate
      if (codepoint >= 0xD800 && codepoint <= 0xDBFF) {
        unsigned low = 0;
        if (!consumeLiteral("\\u") || !readHexQuad(low) || low < 0xDC00 || low > 0xDFFF) {
          fail("Unpaired UTF-16 surrogate in \\u escape");
          return {};
        }
        codepoint = 0x10000 + ((codepoint - 0xD800) << 10) + (low - 0xDC00);
      } else if (codepoint >= 0xDC00 && codepoint <= 0xDFFF) {
        fail("Unpaired UTF-16 surrogate in \\u escape");
        return {};
      }
      appendUtf8(result, codepoint);
      break;
    }
    default:
      fail(std::format("Invalid escape sequence \\{}", escaped));
      return {};
    }
  }

  fail("Unterminated string");
  return {};
}

bool JsonReader::readHexQuad(unsigned &codepoint) {
  codepoint = 0;
  for (int i = 0; i < 4; ++i) {
    const int digit = hexValue(peek());
    if (digit < 0) {
      fail("Invalid \\u escape, expected four hex digits");
      return false;
    }
    advance();
    codepoint = (codepoint << 4) | static_cast<unsigned>(digit);
  }
  return true;
}

} // namespace Lookout
