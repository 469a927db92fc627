#pragma once

#include <string>
#include <vector>

#include "core/types.h"

namespace adaptive_engine {

/// 对任意字节串计算 SHA-256，返回小写十六进制。
bool Sha256Hex(const std::string& payload,
               std::string* out_hex,
               std::string* out_error);

/// 按制表符切分一行（保留空字段）。
std::vector<std::string> SplitTabFields(const std::string& line);

/// 统计 key 合法性：非空，且不含制表符/换行等控制字符。
bool IsValidStatKey(const std::string& key, std::string* out_error);

/// 将 key 编码为文件名：[A-Za-z0-9_-] 原样保留，其余字节编码为 %XX，保证映射单射。
std::string EncodeKeyForFilename(const std::string& key);
/// EncodeKeyForFilename 的逆变换；格式非法返回 false。
bool DecodeKeyFromFilename(const std::string& filename, std::string* out_key);

/**
 * @brief 策略记录编解码
 *
 * 行格式：`STRAT1\tname\talpha\tbeta\ttrades\tlast_trade_id\t<sha256>`，摘要覆盖摘要之前的全部字段。
 * 解析时校验摘要、Beta 不变量（alpha,beta>=1 且 alpha+beta-2==trades）与 key 一致性。
 */
bool SerializeStrategyRecord(const StrategyStat& stat,
                             std::string* out_line,
                             std::string* out_error);
bool ParseStrategyRecord(const std::string& line,
                         const std::string& expected_name,
                         StrategyStat* out_stat,
                         std::string* out_error);

/**
 * @brief 信号源记录编解码
 *
 * 行格式：`SRC1\tname\twins\tlosses\tgrade\tscore\tlast_trade_id\t<sha256>`。
 * last_trade_id 为空表示尚未计入任何交易。
 * 解析时额外校验 grade 与计数推导结果一致。
 */
bool SerializeSourceRecord(const SourceStat& stat,
                           std::string* out_line,
                           std::string* out_error);
bool ParseSourceRecord(const std::string& line,
                       const std::string& expected_name,
                       SourceStat* out_stat,
                       std::string* out_error);

}  // namespace adaptive_engine
