// Repository: Schedcast-air
// Component: Minimal JSON Reader/Writer
// Purpose: Parses schedule and time-service payloads; writes schedule exports.
// Copyright (c) 2025 Schedcast

#include "schedcast/util/Json.hpp"

#include <cmath>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <iomanip>
#include <sstream>

namespace schedcast::util {

// =============================================================================
// JsonValue
// =============================================================================

JsonValue JsonValue::Bool(bool b) {
  JsonValue v;
  v.type_ = Type::kBool;
  v.bool_ = b;
  return v;
}

JsonValue JsonValue::Number(double n) {
  JsonValue v;
  v.type_ = Type::kNumber;
  v.number_ = n;
  return v;
}

JsonValue JsonValue::String(std::string s) {
  JsonValue v;
  v.type_ = Type::kString;
  v.string_ = std::move(s);
  return v;
}

JsonValue JsonValue::Array() {
  JsonValue v;
  v.type_ = Type::kArray;
  return v;
}

JsonValue JsonValue::Object() {
  JsonValue v;
  v.type_ = Type::kObject;
  return v;
}

const JsonValue* JsonValue::Find(const std::string& key) const {
  if (type_ != Type::kObject) return nullptr;
  // Last duplicate wins, matching common parser behavior.
  const JsonValue* found = nullptr;
  for (const auto& m : members_) {
    if (m.first == key) found = &m.second;
  }
  return found;
}

void JsonValue::Push(JsonValue v) {
  if (type_ != Type::kArray) return;
  items_.push_back(std::move(v));
}

void JsonValue::Set(const std::string& key, JsonValue v) {
  if (type_ != Type::kObject) return;
  for (auto& m : members_) {
    if (m.first == key) {
      m.second = std::move(v);
      return;
    }
  }
  members_.emplace_back(key, std::move(v));
}

// =============================================================================
// Parser
// =============================================================================

namespace {

constexpr int kMaxDepth = 64;

class Parser {
 public:
  explicit Parser(const std::string& text) : text_(text) {}

  JsonParseResult Run() {
    JsonValue root;
    SkipWs();
    if (!ParseValue(root, 0)) {
      return JsonParseResult::Failure(error_, pos_);
    }
    SkipWs();
    if (pos_ != text_.size()) {
      return JsonParseResult::Failure("trailing characters after document", pos_);
    }
    return JsonParseResult::Success(std::move(root));
  }

 private:
  const std::string& text_;
  size_t pos_ = 0;
  std::string error_;

  bool Fail(const std::string& msg) {
    if (error_.empty()) error_ = msg;
    return false;
  }

  void SkipWs() {
    while (pos_ < text_.size()) {
      char c = text_[pos_];
      if (c == ' ' || c == '\t' || c == '\n' || c == '\r') {
        ++pos_;
      } else {
        break;
      }
    }
  }

  bool Consume(const char* literal) {
    size_t i = 0;
    while (literal[i] != '\0') {
      if (pos_ + i >= text_.size() || text_[pos_ + i] != literal[i]) {
        return false;
      }
      ++i;
    }
    pos_ += i;
    return true;
  }

  bool ParseValue(JsonValue& out, int depth) {
    if (depth > kMaxDepth) return Fail("nesting too deep");
    if (pos_ >= text_.size()) return Fail("unexpected end of input");

    char c = text_[pos_];
    switch (c) {
      case '{':
        return ParseObject(out, depth);
      case '[':
        return ParseArray(out, depth);
      case '"': {
        std::string s;
        if (!ParseString(s)) return false;
        out = JsonValue::String(std::move(s));
        return true;
      }
      case 't':
        if (!Consume("true")) return Fail("invalid literal");
        out = JsonValue::Bool(true);
        return true;
      case 'f':
        if (!Consume("false")) return Fail("invalid literal");
        out = JsonValue::Bool(false);
        return true;
      case 'n':
        if (!Consume("null")) return Fail("invalid literal");
        out = JsonValue::Null();
        return true;
      default:
        if (c == '-' || (c >= '0' && c <= '9')) return ParseNumber(out);
        return Fail(std::string("unexpected character '") + c + "'");
    }
  }

  bool ParseObject(JsonValue& out, int depth) {
    ++pos_;  // '{'
    out = JsonValue::Object();
    SkipWs();
    if (pos_ < text_.size() && text_[pos_] == '}') {
      ++pos_;
      return true;
    }
    while (true) {
      SkipWs();
      if (pos_ >= text_.size() || text_[pos_] != '"') {
        return Fail("expected object key");
      }
      std::string key;
      if (!ParseString(key)) return false;
      SkipWs();
      if (pos_ >= text_.size() || text_[pos_] != ':') {
        return Fail("expected ':' after object key");
      }
      ++pos_;
      SkipWs();
      JsonValue member;
      if (!ParseValue(member, depth + 1)) return false;
      out.Set(key, std::move(member));
      SkipWs();
      if (pos_ >= text_.size()) return Fail("unterminated object");
      if (text_[pos_] == ',') {
        ++pos_;
        continue;
      }
      if (text_[pos_] == '}') {
        ++pos_;
        return true;
      }
      return Fail("expected ',' or '}' in object");
    }
  }

  bool ParseArray(JsonValue& out, int depth) {
    ++pos_;  // '['
    out = JsonValue::Array();
    SkipWs();
    if (pos_ < text_.size() && text_[pos_] == ']') {
      ++pos_;
      return true;
    }
    while (true) {
      SkipWs();
      JsonValue item;
      if (!ParseValue(item, depth + 1)) return false;
      out.Push(std::move(item));
      SkipWs();
      if (pos_ >= text_.size()) return Fail("unterminated array");
      if (text_[pos_] == ',') {
        ++pos_;
        continue;
      }
      if (text_[pos_] == ']') {
        ++pos_;
        return true;
      }
      return Fail("expected ',' or ']' in array");
    }
  }

  static void AppendUtf8(std::string& out, uint32_t cp) {
    if (cp < 0x80) {
      out += static_cast<char>(cp);
    } else if (cp < 0x800) {
      out += static_cast<char>(0xC0 | (cp >> 6));
      out += static_cast<char>(0x80 | (cp & 0x3F));
    } else if (cp < 0x10000) {
      out += static_cast<char>(0xE0 | (cp >> 12));
      out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
      out += static_cast<char>(0x80 | (cp & 0x3F));
    } else {
      out += static_cast<char>(0xF0 | (cp >> 18));
      out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
      out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
      out += static_cast<char>(0x80 | (cp & 0x3F));
    }
  }

  bool ParseHex4(uint32_t& out) {
    if (pos_ + 4 > text_.size()) return Fail("truncated \\u escape");
    out = 0;
    for (int i = 0; i < 4; ++i) {
      char h = text_[pos_++];
      out <<= 4;
      if (h >= '0' && h <= '9') {
        out |= static_cast<uint32_t>(h - '0');
      } else if (h >= 'a' && h <= 'f') {
        out |= static_cast<uint32_t>(h - 'a' + 10);
      } else if (h >= 'A' && h <= 'F') {
        out |= static_cast<uint32_t>(h - 'A' + 10);
      } else {
        return Fail("invalid hex digit in \\u escape");
      }
    }
    return true;
  }

  bool ParseString(std::string& out) {
    ++pos_;  // opening quote
    while (pos_ < text_.size()) {
      char c = text_[pos_++];
      if (c == '"') return true;
      if (static_cast<unsigned char>(c) < 0x20) {
        return Fail("control character in string");
      }
      if (c != '\\') {
        out += c;
        continue;
      }
      if (pos_ >= text_.size()) break;
      char e = text_[pos_++];
      switch (e) {
        case '"': out += '"'; break;
        case '\\': out += '\\'; break;
        case '/': out += '/'; break;
        case 'b': out += '\b'; break;
        case 'f': out += '\f'; break;
        case 'n': out += '\n'; break;
        case 'r': out += '\r'; break;
        case 't': out += '\t'; break;
        case 'u': {
          uint32_t cp = 0;
          if (!ParseHex4(cp)) return false;
          if (cp >= 0xD800 && cp <= 0xDBFF) {
            uint32_t low = 0;
            if (!Consume("\\u") || !ParseHex4(low) || low < 0xDC00 || low > 0xDFFF) {
              return Fail("unpaired surrogate in \\u escape");
            }
            cp = 0x10000 + ((cp - 0xD800) << 10) + (low - 0xDC00);
          }
          AppendUtf8(out, cp);
          break;
        }
        default:
          return Fail("invalid escape sequence");
      }
    }
    return Fail("unterminated string");
  }

  bool ParseNumber(JsonValue& out) {
    size_t start = pos_;
    if (text_[pos_] == '-') ++pos_;
    auto digits = [&]() {
      size_t s = pos_;
      while (pos_ < text_.size() && text_[pos_] >= '0' && text_[pos_] <= '9') ++pos_;
      return pos_ - s;
    };
    if (digits() == 0) return Fail("invalid number");
    if (pos_ < text_.size() && text_[pos_] == '.') {
      ++pos_;
      if (digits() == 0) return Fail("invalid fraction");
    }
    if (pos_ < text_.size() && (text_[pos_] == 'e' || text_[pos_] == 'E')) {
      ++pos_;
      if (pos_ < text_.size() && (text_[pos_] == '+' || text_[pos_] == '-')) ++pos_;
      if (digits() == 0) return Fail("invalid exponent");
    }
    std::string token = text_.substr(start, pos_ - start);
    out = JsonValue::Number(std::strtod(token.c_str(), nullptr));
    return true;
  }
};

std::string FormatNumber(double n) {
  if (!std::isfinite(n)) return "null";
  double integral = 0.0;
  if (std::modf(n, &integral) == 0.0 && std::fabs(n) < 9.0e15) {
    return std::to_string(static_cast<int64_t>(n));
  }
  std::ostringstream oss;
  oss << std::setprecision(15) << n;
  if (std::strtod(oss.str().c_str(), nullptr) != n) {
    oss.str("");
    oss << std::setprecision(17) << n;
  }
  return oss.str();
}

void WriteValue(std::ostringstream& out, const JsonValue& v, bool pretty, int indent) {
  auto newline = [&](int level) {
    if (!pretty) return;
    out << '\n';
    for (int i = 0; i < level; ++i) out << "  ";
  };

  switch (v.type()) {
    case JsonValue::Type::kNull:
      out << "null";
      break;
    case JsonValue::Type::kBool:
      out << (v.AsBool() ? "true" : "false");
      break;
    case JsonValue::Type::kNumber:
      out << FormatNumber(v.AsNumber());
      break;
    case JsonValue::Type::kString:
      out << '"' << JsonEscape(v.AsString()) << '"';
      break;
    case JsonValue::Type::kArray: {
      if (v.Items().empty()) {
        out << "[]";
        break;
      }
      out << '[';
      bool first = true;
      for (const auto& item : v.Items()) {
        if (!first) out << ',';
        first = false;
        newline(indent + 1);
        WriteValue(out, item, pretty, indent + 1);
      }
      newline(indent);
      out << ']';
      break;
    }
    case JsonValue::Type::kObject: {
      if (v.Members().empty()) {
        out << "{}";
        break;
      }
      out << '{';
      bool first = true;
      for (const auto& m : v.Members()) {
        if (!first) out << ',';
        first = false;
        newline(indent + 1);
        out << '"' << JsonEscape(m.first) << "\":" << (pretty ? " " : "");
        WriteValue(out, m.second, pretty, indent + 1);
      }
      newline(indent);
      out << '}';
      break;
    }
  }
}

}  // namespace

JsonParseResult ParseJson(const std::string& text) {
  Parser parser(text);
  return parser.Run();
}

std::string WriteJson(const JsonValue& value, bool pretty) {
  std::ostringstream out;
  WriteValue(out, value, pretty, 0);
  return out.str();
}

std::string JsonEscape(const std::string& s) {
  std::string out;
  out.reserve(s.size() + 8);
  for (char c : s) {
    switch (c) {
      case '"': out += "\\\""; break;
      case '\\': out += "\\\\"; break;
      case '\n': out += "\\n"; break;
      case '\r': out += "\\r"; break;
      case '\t': out += "\\t"; break;
      case '\b': out += "\\b"; break;
      case '\f': out += "\\f"; break;
      default:
        if (static_cast<unsigned char>(c) < 0x20) {
          char buf[8];
          std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(c));
          out += buf;
        } else {
          out += c;
        }
    }
  }
  return out;
}

}  // namespace schedcast::util
