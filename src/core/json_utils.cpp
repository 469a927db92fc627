#include "core/json_utils.h"

#include <cctype>
#include <cmath>
#include <cstdlib>
#include <sstream>

namespace adaptive_engine {

namespace {

class JsonParser {
 public:
  explicit JsonParser(const std::string& text) : text_(text) {}

  bool Parse(JsonValue* out_value, std::string* out_error) {
    if (out_value == nullptr) {
      return Fail("out_value 为空", out_error);
    }
    SkipWhitespace();
    if (!ParseValue(out_value, out_error)) {
      return false;
    }
    SkipWhitespace();
    if (cursor_ != text_.size()) {
      return Fail("JSON 尾部存在多余字符", out_error);
    }
    return true;
  }

 private:
  bool ParseValue(JsonValue* out, std::string* out_error) {
    if (cursor_ >= text_.size()) {
      return Fail("JSON 意外结束", out_error);
    }
    switch (text_[cursor_]) {
      case '{':
        return ParseObject(out, out_error);
      case '[':
        return ParseArray(out, out_error);
      case '"':
        out->type = JsonType::kString;
        return ParseString(&out->string_value, out_error);
      case 't':
        out->type = JsonType::kBool;
        out->bool_value = true;
        return ConsumeLiteral("true", out_error);
      case 'f':
        out->type = JsonType::kBool;
        out->bool_value = false;
        return ConsumeLiteral("false", out_error);
      case 'n':
        out->type = JsonType::kNull;
        return ConsumeLiteral("null", out_error);
      default:
        break;
    }
    const char ch = text_[cursor_];
    if (ch == '-' || std::isdigit(static_cast<unsigned char>(ch)) != 0) {
      out->type = JsonType::kNumber;
      return ParseNumber(&out->number_value, out_error);
    }
    return Fail("JSON 非法值起始字符", out_error);
  }

  bool ParseObject(JsonValue* out, std::string* out_error) {
    ++cursor_;  // '{'
    out->type = JsonType::kObject;
    out->object_value.clear();
    SkipWhitespace();
    if (ConsumeIf('}')) {
      return true;
    }
    while (cursor_ < text_.size()) {
      std::string key;
      if (!ParseString(&key, out_error)) {
        return false;
      }
      SkipWhitespace();
      if (!ConsumeIf(':')) {
        return Fail("JSON 对象缺少 ':'", out_error);
      }
      SkipWhitespace();
      JsonValue item;
      if (!ParseValue(&item, out_error)) {
        return false;
      }
      out->object_value[key] = std::move(item);
      SkipWhitespace();
      if (ConsumeIf('}')) {
        return true;
      }
      if (!ConsumeIf(',')) {
        return Fail("JSON 对象缺少 ','", out_error);
      }
      SkipWhitespace();
    }
    return Fail("JSON 对象缺少结束符", out_error);
  }

  bool ParseArray(JsonValue* out, std::string* out_error) {
    ++cursor_;  // '['
    out->type = JsonType::kArray;
    out->array_value.clear();
    SkipWhitespace();
    if (ConsumeIf(']')) {
      return true;
    }
    while (cursor_ < text_.size()) {
      JsonValue item;
      if (!ParseValue(&item, out_error)) {
        return false;
      }
      out->array_value.push_back(std::move(item));
      SkipWhitespace();
      if (ConsumeIf(']')) {
        return true;
      }
      if (!ConsumeIf(',')) {
        return Fail("JSON 数组缺少 ','", out_error);
      }
      SkipWhitespace();
    }
    return Fail("JSON 数组缺少结束符", out_error);
  }

  bool ParseString(std::string* out, std::string* out_error) {
    if (!ConsumeIf('"')) {
      return Fail("JSON 字符串缺少起始引号", out_error);
    }
    out->clear();
    while (cursor_ < text_.size()) {
      const char ch = text_[cursor_++];
      if (ch == '"') {
        return true;
      }
      if (ch != '\\') {
        out->push_back(ch);
        continue;
      }
      if (cursor_ >= text_.size()) {
        break;
      }
      const char escaped = text_[cursor_++];
      switch (escaped) {
        case '"':
        case '\\':
        case '/':
          out->push_back(escaped);
          break;
        case 'b':
          out->push_back('\b');
          break;
        case 'f':
          out->push_back('\f');
          break;
        case 'n':
          out->push_back('\n');
          break;
        case 'r':
          out->push_back('\r');
          break;
        case 't':
          out->push_back('\t');
          break;
        case 'u':
          // 价格接口不会返回非 ASCII 字段；\uXXXX 仅做跳过并保留占位符。
          if (cursor_ + 4 > text_.size()) {
            return Fail("JSON \\u 转义不完整", out_error);
          }
          cursor_ += 4;
          out->push_back('?');
          break;
        default:
          return Fail("JSON 非法转义字符", out_error);
      }
    }
    return Fail("JSON 字符串缺少结束引号", out_error);
  }

  bool ParseNumber(double* out, std::string* out_error) {
    const std::size_t begin = cursor_;
    while (cursor_ < text_.size()) {
      const char ch = text_[cursor_];
      if (std::isdigit(static_cast<unsigned char>(ch)) != 0 || ch == '-' ||
          ch == '+' || ch == '.' || ch == 'e' || ch == 'E') {
        ++cursor_;
        continue;
      }
      break;
    }
    const std::string token = text_.substr(begin, cursor_ - begin);
    char* end = nullptr;
    const double value = std::strtod(token.c_str(), &end);
    if (end == token.c_str() || *end != '\0' || !std::isfinite(value)) {
      return Fail("JSON 数值非法: " + token, out_error);
    }
    *out = value;
    return true;
  }

  bool ConsumeLiteral(const char* literal, std::string* out_error) {
    const std::string expected(literal);
    if (text_.compare(cursor_, expected.size(), expected) != 0) {
      return Fail("JSON 字面量非法", out_error);
    }
    cursor_ += expected.size();
    return true;
  }

  bool ConsumeIf(char expected) {
    if (cursor_ < text_.size() && text_[cursor_] == expected) {
      ++cursor_;
      return true;
    }
    return false;
  }

  void SkipWhitespace() {
    while (cursor_ < text_.size() &&
           std::isspace(static_cast<unsigned char>(text_[cursor_])) != 0) {
      ++cursor_;
    }
  }

  bool Fail(const std::string& message, std::string* out_error) const {
    if (out_error != nullptr) {
      *out_error = message + "（offset=" + std::to_string(cursor_) + "）";
    }
    return false;
  }

  const std::string& text_;
  std::size_t cursor_{0};
};

}  // namespace

bool ParseJson(const std::string& text,
               JsonValue* out_value,
               std::string* out_error) {
  JsonParser parser(text);
  return parser.Parse(out_value, out_error);
}

const JsonValue* JsonObjectField(const JsonValue* value, const std::string& key) {
  if (value == nullptr || value->type != JsonType::kObject) {
    return nullptr;
  }
  const auto it = value->object_value.find(key);
  if (it == value->object_value.end()) {
    return nullptr;
  }
  return &it->second;
}

const JsonValue* JsonFindDottedPath(const JsonValue* value,
                                    const std::string& dotted_path) {
  const JsonValue* cursor = value;
  std::istringstream iss(dotted_path);
  std::string segment;
  while (std::getline(iss, segment, '.')) {
    if (segment.empty()) {
      return nullptr;
    }
    cursor = JsonObjectField(cursor, segment);
    if (cursor == nullptr) {
      return nullptr;
    }
  }
  return cursor;
}

std::optional<double> JsonAsNumber(const JsonValue* value) {
  if (value == nullptr) {
    return std::nullopt;
  }
  if (value->type == JsonType::kNumber) {
    return value->number_value;
  }
  if (value->type == JsonType::kString && !value->string_value.empty()) {
    // 交易所行情接口常以字符串返回价格，如 {"price":"64000.12"}。
    char* end = nullptr;
    const double parsed = std::strtod(value->string_value.c_str(), &end);
    if (end != value->string_value.c_str() && *end == '\0' &&
        std::isfinite(parsed)) {
      return parsed;
    }
  }
  return std::nullopt;
}

}  // namespace adaptive_engine
