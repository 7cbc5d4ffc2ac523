/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef JSONREADER_HPP
#define JSONREADER_HPP

#include <cstddef>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <unordered_map>
#include <variant>
#include <vector>

namespace Lookout {

class JsonValue;

using JsonObject = std::unordered_map<std::string, JsonValue>;
using JsonArray = std::vector<JsonValue>;

enum class JsonType { Null, Boolean, Number, String, Array, Object };

// Stream operator for JsonType (Boost.Test output and config error messages)
inline std::ostream &operator<<(std::ostream &os, JsonType type) {
  switch (type) {
  case JsonType::Null:    return os << "Null";
  case JsonType::Boolean: return os << "Boolean";
  case JsonType::Number:  return os << "Number";
  case JsonType::String:  return os << "String";
  case JsonType::Array:   return os << "Array";
  case JsonType::Object:  return os << "Object";
  }
  return os << "Unknown";
}

/**
 * @brief Immutable JSON document node
 *
 * Typed accessors (asNumber(), asObject(), ...) throw std::bad_variant_access
 * on a type mismatch; the tryAs*() forms return empty instead and are what
 * the config loader uses to produce readable errors.
 */
class JsonValue {
public:
  using Storage = std::variant<std::nullptr_t, bool, double, std::string,
                               JsonArray, JsonObject>;

  JsonValue() : m_value(nullptr) {}
  explicit JsonValue(bool value) : m_value(value) {}
  explicit JsonValue(double value) : m_value(value) {}
  explicit JsonValue(std::string &&value) : m_value(std::move(value)) {}
  explicit JsonValue(JsonArray &&value) : m_value(std::move(value)) {}
  explicit JsonValue(JsonObject &&value) : m_value(std::move(value)) {}

  JsonType getType() const { return static_cast<JsonType>(m_value.index()); }

  bool isNull() const { return getType() == JsonType::Null; }
  bool isBool() const { return getType() == JsonType::Boolean; }
  bool isNumber() const { return getType() == JsonType::Number; }
  bool isString() const { return getType() == JsonType::String; }
  bool isArray() const { return getType() == JsonType::Array; }
  bool isObject() const { return getType() == JsonType::Object; }

  bool asBool() const { return std::get<bool>(m_value); }
  double asNumber() const { return std::get<double>(m_value); }
  int asInt() const { return static_cast<int>(std::get<double>(m_value)); }
  const std::string &asString() const { return std::get<std::string>(m_value); }
  const JsonArray &asArray() const { return std::get<JsonArray>(m_value); }
  const JsonObject &asObject() const { return std::get<JsonObject>(m_value); }

  std::optional<double> tryAsNumber() const;
  // Only numbers with no fractional part that fit an int
  std::optional<int> tryAsInt() const;
  std::optional<bool> tryAsBool() const;
  const std::string *tryAsString() const;
  const JsonObject *tryAsObject() const;

  // Object member access; missing keys and non-objects yield a shared null
  bool hasKey(const std::string &key) const;
  const JsonValue &operator[](const std::string &key) const;

  // Element count of an array or object, 0 otherwise
  size_t size() const;

private:
  Storage m_value;
};

/**
 * @brief Strict recursive-descent JSON reader for the lookout configuration
 *
 * Single pass over the input with line/column tracking. Beyond RFC 8259 it
 * rejects duplicate object keys (a silently shadowed setting is always a
 * config mistake) and nesting deeper than MAX_DEPTH.
 *
 * parse() and loadFromFile() never throw; failures are described by
 * getLastError() as "Line L, Column C: message".
 */
class JsonReader {
public:
  static constexpr size_t MAX_DEPTH{64};

  bool loadFromFile(const std::string &path);
  bool parse(std::string_view json);

  const JsonValue &getRoot() const { return m_root; }
  const std::string &getLastError() const { return m_lastError; }
  void clearError() { m_lastError.clear(); }

private:
  std::string_view m_input{};
  size_t m_position{0};
  size_t m_line{1};
  size_t m_column{1};
  size_t m_depth{0};
  std::string m_lastError{};
  JsonValue m_root{};

  bool failed() const { return !m_lastError.empty(); }
  void fail(const std::string &message);

  bool atEnd() const { return m_position >= m_input.size(); }
  char peek() const { return atEnd() ? '\0' : m_input[m_position]; }
  char advance();
  void skipWhitespace();
  bool consume(char expected);
  bool consumeLiteral(std::string_view literal);

  JsonValue readValue();
  JsonValue readObject();
  JsonValue readArray();
  JsonValue readNumber();
  std::string readString();
  bool readHexQuad(unsigned &codepoint);
};

} // namespace Lookout

#endif // JSONREADER_HPP
