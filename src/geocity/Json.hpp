#pragma once

#include <cstdint>
#include <iosfwd>
#include <string>
#include <utility>
#include <vector>

namespace geocity {

// Small JSON document model used for configs, geology snapshots and CLI summaries.
//
//  - Strict JSON: no comments, no trailing commas.
//  - Numbers are held as double.
//  - Objects keep their members in insertion order.
struct JsonValue {
  enum class Type : std::uint8_t {
    Null,
    Bool,
    Number,
    String,
    Array,
    Object,
  };

  Type type = Type::Null;

  bool boolValue = false;
  double numberValue = 0.0;
  std::string stringValue;
  std::vector<JsonValue> arrayValue;
  std::vector<std::pair<std::string, JsonValue>> objectValue;

  static JsonValue MakeNull();
  static JsonValue MakeBool(bool b);
  static JsonValue MakeNumber(double n);
  static JsonValue MakeString(std::string s);
  static JsonValue MakeArray();
  static JsonValue MakeObject();

  bool isNull() const { return type == Type::Null; }
  bool isBool() const { return type == Type::Bool; }
  bool isNumber() const { return type == Type::Number; }
  bool isString() const { return type == Type::String; }
  bool isArray() const { return type == Type::Array; }
  bool isObject() const { return type == Type::Object; }

  // Appends (or replaces) an object member. No-op on non-objects.
  void set(const std::string& key, JsonValue v);
  void push(JsonValue v) { arrayValue.push_back(std::move(v)); }
};

const char* JsonTypeName(JsonValue::Type t);

const JsonValue* FindJsonMember(const JsonValue& obj, const std::string& key);
JsonValue* FindJsonMember(JsonValue& obj, const std::string& key);

bool ParseJson(const std::string& text, JsonValue& outValue, std::string& outError);
bool ReadJsonFile(const std::string& path, JsonValue& outValue, std::string& outError);

// Escape a string for use inside a JSON string literal (no surrounding quotes).
std::string JsonEscape(const std::string& s);

struct JsonWriteOptions {
  bool pretty = true;
  int indent = 2;
};

// Integral values within +/-2^53 are written without a fraction; everything
// else with 9 significant digits, enough to round-trip any float exactly.
//
// Returns false on non-finite numbers or stream failures.
bool WriteJson(std::ostream& os, const JsonValue& value, std::string& outError, const JsonWriteOptions& opt = {});

std::string JsonStringify(const JsonValue& value, const JsonWriteOptions& opt = {});

bool WriteJsonFile(const std::string& path, const JsonValue& value, std::string& outError,
                   const JsonWriteOptions& opt = {});

} // namespace geocity
