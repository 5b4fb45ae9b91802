/**
 * @file json_helpers.h
 * @brief JSON writing and parsing utilities for the canonical interchange format.
 */

#pragma once

#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <map>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

namespace midinorm {
namespace json {

/**
 * @brief Escape a string for use inside JSON quotes.
 *
 * Quote, backslash, newline, carriage return and tab use their short forms;
 * any other control character becomes `\u00XX`. Bytes >= 0x20 pass through,
 * so UTF-8 text is kept as is.
 */
inline std::string escape(const std::string& s) {
  static const char kHex[] = "0123456789abcdef";
  std::string out;
  out.reserve(s.size() + 2);
  for (char c : s) {
    auto byte = static_cast<unsigned char>(c);
    if (c == '"' || c == '\\') {
      out += '\\';
      out += c;
    } else if (c == '\n') {
      out += "\\n";
    } else if (c == '\r') {
      out += "\\r";
    } else if (c == '\t') {
      out += "\\t";
    } else if (byte < 0x20) {
      out += "\\u00";
      out += kHex[byte >> 4];
      out += kHex[byte & 0x0F];
    } else {
      out += c;
    }
  }
  return out;
}

/**
 * @brief Streaming JSON writer with optional pretty printing.
 *
 * Keys are emitted in call order; callers that need canonical output write
 * them sorted. Integer fields narrower than int must be cast, since uint8_t
 * would otherwise be streamed as a character.
 *
 * @example
 * ```cpp
 * std::ostringstream oss;
 * json::Writer w(oss);
 * w.beginObject().write("ticks_per_beat", 480);
 * w.beginArray("items").value(1).value(2).endArray();
 * w.endObject();
 * // {"ticks_per_beat":480,"items":[1,2]}
 * ```
 */
class Writer {
 public:
  explicit Writer(std::ostream& os, bool pretty = false, int indent_size = 2)
      : os_(os), pretty_(pretty), indent_size_(indent_size) {}

  /// @brief Open an object, keyed when inside another object.
  Writer& beginObject(const char* key = nullptr) { return open(key, '{'); }
  Writer& endObject() { return close('}'); }

  /// @brief Open an array, keyed when inside an object.
  Writer& beginArray(const char* key = nullptr) { return open(key, '['); }
  Writer& endArray() { return close(']'); }

  /// @brief Write a "key": value member of the current object.
  template <typename T>
  Writer& write(const char* key, const T& v) {
    prefix(key);
    scalar(v);
    return *this;
  }

  /// @brief Append a value to the current array.
  template <typename T>
  Writer& value(const T& v) {
    prefix(nullptr);
    scalar(v);
    return *this;
  }

 private:
  void scalar(bool v) { os_ << (v ? "true" : "false"); }
  void scalar(const std::string& v) { os_ << '"' << escape(v) << '"'; }
  void scalar(const char* v) { os_ << '"' << escape(v) << '"'; }
  template <typename T>
  void scalar(const T& v) {
    os_ << v;
  }

  // Separator, line break and key ahead of a new element.
  void prefix(const char* key) {
    if (!first_) os_ << ',';
    first_ = false;
    if (key || depth_ > 0) newline();
    if (key) {
      os_ << '"' << escape(key) << "\":";
      if (pretty_) os_ << ' ';
    }
  }

  Writer& open(const char* key, char bracket) {
    prefix(key);
    os_ << bracket;
    ++depth_;
    first_ = true;
    return *this;
  }

  Writer& close(char bracket) {
    --depth_;
    first_ = false;
    newline();
    os_ << bracket;
    return *this;
  }

  void newline() {
    if (!pretty_) return;
    os_ << '\n' << std::string(static_cast<size_t>(depth_ * indent_size_), ' ');
  }

  std::ostream& os_;
  bool pretty_;
  int indent_size_;
  int depth_ = 0;
  bool first_ = true;
};

/// @brief Kind of a parsed member value.
enum class ValueKind : uint8_t { Missing, String, Number, Bool, Null, Object, Array };

/**
 * @brief Parser for one JSON object.
 *
 * Members are stored flat (key -> text) in declaration order. The whole text,
 * nested values included, must be well-formed JSON or ok() is false. Nested
 * objects and arrays keep their raw text and are parsed lazily through
 * getObject() and getRawArray(), one level at a time.
 *
 * @example
 * ```cpp
 * json::Parser p(R"({"ticks_per_beat":480,"note_msgs":[{"tick":0}]})");
 * int64_t tpb = 0;
 * p.tryGetInt("ticks_per_beat", tpb);    // tpb == 480
 * std::vector<std::string> notes;
 * p.getRawArray("note_msgs", notes);     // notes == {R"({"tick":0})"}
 * ```
 */
class Parser {
 public:
  /**
   * @brief Constructs a parser with JSON string.
   * @param json The JSON string to parse (must be an object).
   */
  explicit Parser(const std::string& json) : json_(json) { ok_ = parse(); }

  /// @brief True if the text was a well-formed JSON object.
  bool ok() const { return ok_; }

  /// @brief Position of the first syntax error (valid when !ok()).
  size_t errorOffset() const { return error_offset_; }

  /**
   * @brief Check if a key exists.
   * @param key The key to check.
   * @return True if key exists.
   */
  bool has(const std::string& key) const { return values_.find(key) != values_.end(); }

  /// @brief Member keys in declaration order (duplicates collapsed, last wins).
  const std::vector<std::string>& keys() const { return keys_; }

  /// @brief Kind of the value stored under @p key.
  ValueKind kind(const std::string& key) const {
    auto it = values_.find(key);
    if (it == values_.end()) return ValueKind::Missing;
    return it->second.kind;
  }

  /**
   * @brief Strictly read an integer value.
   * @param key The key to look up.
   * @param out Receives the value on success.
   * @return False if missing, not a number, or not integral.
   */
  bool tryGetInt(const std::string& key, int64_t& out) const {
    auto it = values_.find(key);
    if (it == values_.end() || it->second.kind != ValueKind::Number) return false;
    const std::string& text = it->second.text;
    char* end = nullptr;
    long long parsed = std::strtoll(text.c_str(), &end, 10);
    if (end == text.c_str() || *end != '\0') return false;
    out = static_cast<int64_t>(parsed);
    return true;
  }

  /**
   * @brief Strictly read a floating-point value.
   * @param key The key to look up.
   * @param out Receives the value on success.
   * @return False if missing, not a number, or not finite.
   */
  bool tryGetDouble(const std::string& key, double& out) const {
    auto it = values_.find(key);
    if (it == values_.end() || it->second.kind != ValueKind::Number) return false;
    const std::string& text = it->second.text;
    char* end = nullptr;
    double parsed = std::strtod(text.c_str(), &end);
    if (end == text.c_str() || *end != '\0' || !std::isfinite(parsed)) return false;
    out = parsed;
    return true;
  }

  /**
   * @brief Get a boolean value.
   * @param key The key to look up.
   * @param default_val Default value if key not found.
   * @return The boolean value.
   */
  bool getBool(const std::string& key, bool default_val = false) const {
    auto it = values_.find(key);
    if (it == values_.end() || it->second.kind != ValueKind::Bool) return default_val;
    return it->second.text == "true";
  }

  /**
   * @brief Get a string value.
   * @param key The key to look up.
   * @param default_val Default value if key not found.
   * @return The (unescaped) string value.
   */
  std::string getString(const std::string& key, const std::string& default_val = "") const {
    auto it = values_.find(key);
    if (it == values_.end() || it->second.kind != ValueKind::String) return default_val;
    return it->second.text;
  }

  /**
   * @brief Stored text of a member regardless of its kind.
   *
   * Strings come back unescaped, literals and nested values verbatim.
   */
  std::string getText(const std::string& key) const {
    auto it = values_.find(key);
    if (it == values_.end()) return "";
    return it->second.text;
  }

  /**
   * @brief Get a nested object as a new Parser.
   * @param key The key of the nested object.
   * @return A Parser for the nested object (empty if not found).
   */
  Parser getObject(const std::string& key) const {
    auto it = values_.find(key);
    if (it == values_.end() || it->second.kind != ValueKind::Object) {
      return Parser("{}");
    }
    return Parser(it->second.text);
  }

  /**
   * @brief Raw JSON texts of the elements of an array member.
   * @param key The key of the array.
   * @param out Receives the element texts in order.
   * @return False if the member is missing or not an array.
   */
  bool getRawArray(const std::string& key, std::vector<std::string>& out) const {
    out.clear();
    auto it = values_.find(key);
    if (it == values_.end() || it->second.kind != ValueKind::Array) return false;
    return splitArray(it->second.text, out);
  }

  /**
   * @brief Split a raw JSON array into the raw texts of its elements.
   * @param json Array text including the brackets.
   * @param out Receives the whitespace-trimmed element texts.
   * @return False on malformed input; an empty array yields true and no elements.
   */
  static bool splitArray(const std::string& json, std::vector<std::string>& out) {
    out.clear();
    size_t pos = 0;
    skipWhitespace(json, pos);
    if (pos >= json.size() || json[pos] != '[') return false;
    ++pos;
    skipWhitespace(json, pos);
    if (pos < json.size() && json[pos] == ']') {
      ++pos;
      skipWhitespace(json, pos);
      return pos == json.size();
    }

    while (pos < json.size()) {
      size_t start = pos;
      if (!scanValue(json, pos, 1)) return false;
      out.push_back(json.substr(start, pos - start));
      skipWhitespace(json, pos);
      if (pos >= json.size()) return false;
      if (json[pos] == ']') {
        ++pos;
        skipWhitespace(json, pos);
        return pos == json.size();
      }
      if (json[pos] != ',') return false;
      ++pos;
      skipWhitespace(json, pos);
    }
    return false;
  }

 private:
  struct Member {
    ValueKind kind = ValueKind::Missing;
    std::string text;  ///< Unescaped string, literal text, or raw nested JSON
  };

  bool fail(size_t pos) {
    error_offset_ = pos;
    return false;
  }

  bool parse() {
    size_t pos = 0;
    skipWhitespace(json_, pos);
    if (pos >= json_.size() || json_[pos] != '{') return fail(pos);
    ++pos;
    skipWhitespace(json_, pos);
    if (pos < json_.size() && json_[pos] == '}') {
      ++pos;
      skipWhitespace(json_, pos);
      return pos == json_.size() ? true : fail(pos);
    }

    while (pos < json_.size()) {
      skipWhitespace(json_, pos);

      // Parse key
      std::string key;
      if (pos >= json_.size() || json_[pos] != '"' || !parseString(json_, pos, key)) {
        return fail(pos);
      }

      skipWhitespace(json_, pos);
      if (pos >= json_.size() || json_[pos] != ':') return fail(pos);
      ++pos;
      skipWhitespace(json_, pos);

      // Parse value
      Member member;
      if (!parseValue(pos, member)) return fail(pos);
      if (values_.find(key) == values_.end()) keys_.push_back(key);
      values_[key] = std::move(member);

      skipWhitespace(json_, pos);
      if (pos >= json_.size()) return fail(pos);
      if (json_[pos] == ',') {
        ++pos;
        continue;
      }
      if (json_[pos] == '}') {
        ++pos;
        skipWhitespace(json_, pos);
        return pos == json_.size() ? true : fail(pos);
      }
      return fail(pos);
    }
    return fail(pos);
  }

  bool parseValue(size_t& pos, Member& member) const {
    if (pos >= json_.size()) return false;
    size_t start = pos;
    char c = json_[pos];

    if (c == '"') {
      member.kind = ValueKind::String;
      return parseString(json_, pos, member.text);
    }
    if (!scanValue(json_, pos)) return false;
    member.text = json_.substr(start, pos - start);
    if (c == '{') {
      member.kind = ValueKind::Object;
    } else if (c == '[') {
      member.kind = ValueKind::Array;
    } else if (c == 't' || c == 'f') {
      member.kind = ValueKind::Bool;
    } else if (c == 'n') {
      member.kind = ValueKind::Null;
    } else {
      member.kind = ValueKind::Number;
    }
    return true;
  }

  static void skipWhitespace(const std::string& json, size_t& pos) {
    while (pos < json.size() &&
           (json[pos] == ' ' || json[pos] == '\t' || json[pos] == '\n' || json[pos] == '\r')) {
      ++pos;
    }
  }

  static void appendUtf8(std::string& out, uint32_t cp) {
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

  static bool parseHex4(const std::string& json, size_t pos, uint32_t& out) {
    if (pos + 4 > json.size()) return false;
    out = 0;
    for (size_t i = pos; i < pos + 4; ++i) {
      char h = json[i];
      out <<= 4;
      if (h >= '0' && h <= '9') {
        out |= static_cast<uint32_t>(h - '0');
      } else if (h >= 'a' && h <= 'f') {
        out |= static_cast<uint32_t>(h - 'a' + 10);
      } else if (h >= 'A' && h <= 'F') {
        out |= static_cast<uint32_t>(h - 'A' + 10);
      } else {
        return false;
      }
    }
    return true;
  }

  // pos must point at the opening quote; on success it is past the closing quote.
  static bool parseString(const std::string& json, size_t& pos, std::string& result) {
    ++pos;
    result.clear();
    while (pos < json.size() && json[pos] != '"') {
      if (json[pos] == '\\') {
        if (pos + 1 >= json.size()) return false;
        ++pos;
        switch (json[pos]) {
          case 'n':
            result += '\n';
            break;
          case 'r':
            result += '\r';
            break;
          case 't':
            result += '\t';
            break;
          case 'b':
            result += '\b';
            break;
          case 'f':
            result += '\f';
            break;
          case 'u': {
            uint32_t cp = 0;
            if (!parseHex4(json, pos + 1, cp)) return false;
            pos += 4;
            // Surrogate pair
            if (cp >= 0xD800 && cp <= 0xDBFF && pos + 6 < json.size() && json[pos + 1] == '\\' &&
                json[pos + 2] == 'u') {
              uint32_t low = 0;
              if (parseHex4(json, pos + 3, low) && low >= 0xDC00 && low <= 0xDFFF) {
                cp = 0x10000 + ((cp - 0xD800) << 10) + (low - 0xDC00);
                pos += 6;
              }
            }
            appendUtf8(result, cp);
            break;
          }
          default:
            result += json[pos];
            break;
        }
      } else {
        result += json[pos];
      }
      ++pos;
    }
    if (pos >= json.size()) return false;
    ++pos;  // Skip closing quote
    return true;
  }

  static constexpr int kMaxNesting = 256;

  // Advances pos past one complete, well-formed value of any kind.
  static bool scanValue(const std::string& json, size_t& pos, int depth = 0) {
    if (pos >= json.size() || depth > kMaxNesting) return false;
    char c = json[pos];
    if (c == '"') {
      std::string ignored;
      return parseString(json, pos, ignored);
    }
    if (c == '{') return scanObject(json, pos, depth + 1);
    if (c == '[') return scanArray(json, pos, depth + 1);
    if (c == 't') return scanWord(json, pos, "true");
    if (c == 'f') return scanWord(json, pos, "false");
    if (c == 'n') return scanWord(json, pos, "null");
    return scanNumber(json, pos);
  }

  static bool scanObject(const std::string& json, size_t& pos, int depth) {
    ++pos;
    skipWhitespace(json, pos);
    if (pos < json.size() && json[pos] == '}') {
      ++pos;
      return true;
    }
    while (pos < json.size()) {
      std::string key;
      if (json[pos] != '"' || !parseString(json, pos, key)) return false;
      skipWhitespace(json, pos);
      if (pos >= json.size() || json[pos] != ':') return false;
      ++pos;
      skipWhitespace(json, pos);
      if (!scanValue(json, pos, depth)) return false;
      skipWhitespace(json, pos);
      if (pos >= json.size()) return false;
      if (json[pos] == '}') {
        ++pos;
        return true;
      }
      if (json[pos] != ',') return false;
      ++pos;
      skipWhitespace(json, pos);
    }
    return false;
  }

  static bool scanArray(const std::string& json, size_t& pos, int depth) {
    ++pos;
    skipWhitespace(json, pos);
    if (pos < json.size() && json[pos] == ']') {
      ++pos;
      return true;
    }
    while (pos < json.size()) {
      if (!scanValue(json, pos, depth)) return false;
      skipWhitespace(json, pos);
      if (pos >= json.size()) return false;
      if (json[pos] == ']') {
        ++pos;
        return true;
      }
      if (json[pos] != ',') return false;
      ++pos;
      skipWhitespace(json, pos);
    }
    return false;
  }

  static bool scanWord(const std::string& json, size_t& pos, const char* word) {
    size_t len = std::strlen(word);
    if (json.compare(pos, len, word) != 0) return false;
    pos += len;
    return true;
  }

  // -?(0|[1-9][0-9]*)(\.[0-9]+)?([eE][+-]?[0-9]+)?
  static bool scanNumber(const std::string& json, size_t& pos) {
    auto digit = [&](size_t at) { return at < json.size() && json[at] >= '0' && json[at] <= '9'; };
    if (pos < json.size() && json[pos] == '-') ++pos;
    if (!digit(pos)) return false;
    if (json[pos] == '0') {
      ++pos;
    } else {
      while (digit(pos)) ++pos;
    }
    if (pos < json.size() && json[pos] == '.') {
      ++pos;
      if (!digit(pos)) return false;
      while (digit(pos)) ++pos;
    }
    if (pos < json.size() && (json[pos] == 'e' || json[pos] == 'E')) {
      ++pos;
      if (pos < json.size() && (json[pos] == '+' || json[pos] == '-')) ++pos;
      if (!digit(pos)) return false;
      while (digit(pos)) ++pos;
    }
    return true;
  }

  std::string json_;
  std::map<std::string, Member> values_;
  std::vector<std::string> keys_;
  bool ok_ = false;
  size_t error_offset_ = 0;
};

}  // namespace json
}  // namespace midinorm
