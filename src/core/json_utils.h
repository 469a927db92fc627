#pragma once

#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace adaptive_engine {

/// 轻量 JSON 节点类型（覆盖价格接口响应用到的子集）。
enum class JsonType {
  kNull,
  kBool,
  kNumber,
  kString,
  kArray,
  kObject,
};

/// 轻量 JSON 值（对象/数组为递归结构）。
struct JsonValue {
  JsonType type{JsonType::kNull};
  bool bool_value{false};
  double number_value{0.0};
  std::string string_value;
  std::vector<JsonValue> array_value;
  std::unordered_map<std::string, JsonValue> object_value;
};

/**
 * @brief JSON 解析入口
 *
 * @return false 解析失败，原因写入 `out_error`（可为空）
 */
bool ParseJson(const std::string& text,
               JsonValue* out_value,
               std::string* out_error);

/// 获取对象字段；类型不符或字段缺失返回 `nullptr`。
const JsonValue* JsonObjectField(const JsonValue* value, const std::string& key);

/// 按点分路径（如 `data.price`）逐级查找对象字段；任意一段缺失返回 `nullptr`。
const JsonValue* JsonFindDottedPath(const JsonValue* value,
                                    const std::string& dotted_path);

/// 将节点解释为数值：数字直接返回，数字字符串会被解析；失败返回 `std::nullopt`。
std::optional<double> JsonAsNumber(const JsonValue* value);

}  // namespace adaptive_engine
