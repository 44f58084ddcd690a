// Repository: Schedcast-air
// Component: Minimal JSON Reader/Writer
// Purpose: Parses schedule and time-service payloads; writes schedule exports.
// Copyright (c) 2025 Schedcast

#ifndef SCHEDCAST_UTIL_JSON_HPP_
#define SCHEDCAST_UTIL_JSON_HPP_

#include <cstddef>
#include <string>
#include <utility>
#include <vector>

namespace schedcast::util {

// JsonValue is a small ordered document tree. Object members keep their
// source order so exports are stable and diffable.
class JsonValue {
 public:
  enum class Type { kNull, kBool, kNumber, kString, kArray, kObject };

  using Member = std::pair<std::string, JsonValue>;

  JsonValue() = default;

  static JsonValue Null() { return JsonValue(); }
  static JsonValue Bool(bool b);
  static JsonValue Number(double n);
  static JsonValue String(std::string s);
  static JsonValue Array();
  static JsonValue Object();

  Type type() const { return type_; }
  bool IsNull() const { return type_ == Type::kNull; }
  bool IsBool() const { return type_ == Type::kBool; }
  bool IsNumber() const { return type_ == Type::kNumber; }
  bool IsString() const { return type_ == Type::kString; }
  bool IsArray() const { return type_ == Type::kArray; }
  bool IsObject() const { return type_ == Type::kObject; }

  bool AsBool() const { return bool_; }
  double AsNumber() const { return number_; }
  const std::string& AsString() const { return string_; }
  const std::vector<JsonValue>& Items() const { return items_; }
  const std::vector<Member>& Members() const { return members_; }

  // Object lookup. Returns nullptr when absent or when this is not an object.
  const JsonValue* Find(const std::string& key) const;

  // Builders. Push on a non-array / Set on a non-object are ignored.
  void Push(JsonValue v);
  void Set(const std::string& key, JsonValue v);

 private:
  Type type_ = Type::kNull;
  bool bool_ = false;
  double number_ = 0.0;
  std::string string_;
  std::vector<JsonValue> items_;
  std::vector<Member> members_;
};

struct JsonParseResult {
  bool ok;
  JsonValue value;
  std::string error;
  size_t offset;  // Byte offset of the failure (0 on success)

  static JsonParseResult Success(JsonValue v) {
    return {true, std::move(v), "", 0};
  }

  static JsonParseResult Failure(const std::string& error, size_t offset) {
    return {false, JsonValue(), error, offset};
  }
};

// Strict RFC 8259 parse of a complete document (trailing whitespace allowed).
JsonParseResult ParseJson(const std::string& text);

// Serializes with two-space indentation when pretty is true.
std::string WriteJson(const JsonValue& value, bool pretty = true);

// Escapes a string for embedding between JSON double quotes.
std::string JsonEscape(const std::string& s);

}  // namespace schedcast::util

#endif  // SCHEDCAST_UTIL_JSON_HPP_
