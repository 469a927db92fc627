#include "storage/record_codec.h"

#include <cmath>
#include <exception>
#include <iomanip>
#include <sstream>

#include <openssl/evp.h>

#include "bandit/reliability_math.h"

namespace adaptive_engine {

namespace {

constexpr const char* kStrategyTag = "STRAT1";
constexpr const char* kSourceTag = "SRC1";

std::string BytesToHex(const unsigned char* bytes, std::size_t size) {
  static constexpr char kHex[] = "0123456789abcdef";
  std::string out;
  out.resize(size * 2U);
  for (std::size_t i = 0; i < size; ++i) {
    const unsigned char v = bytes[i];
    out[i * 2U] = kHex[(v >> 4U) & 0x0FU];
    out[i * 2U + 1U] = kHex[v & 0x0FU];
  }
  return out;
}

int HexValue(char c) {
  if (c >= '0' && c <= '9') {
    return c - '0';
  }
  if (c >= 'A' && c <= 'F') {
    return c - 'A' + 10;
  }
  if (c >= 'a' && c <= 'f') {
    return c - 'a' + 10;
  }
  return -1;
}

bool ParseInt64Field(const std::string& text, std::int64_t* out_value) {
  if (text.empty()) {
    return false;
  }
  try {
    std::size_t consumed = 0;
    const long long value = std::stoll(text, &consumed);
    if (consumed != text.size()) {
      return false;
    }
    *out_value = static_cast<std::int64_t>(value);
  } catch (const std::exception&) {
    return false;
  }
  return true;
}

/// 将 body 与摘要比对；摘要不一致即视为损坏。
bool VerifyDigest(const std::string& body,
                  const std::string& digest,
                  const char* tag,
                  std::string* out_error) {
  std::string expected;
  if (!Sha256Hex(body, &expected, out_error)) {
    return false;
  }
  if (expected != digest) {
    if (out_error != nullptr) {
      *out_error = std::string(tag) + " 记录摘要校验失败";
    }
    return false;
  }
  return true;
}

}  // namespace

bool Sha256Hex(const std::string& payload,
               std::string* out_hex,
               std::string* out_error) {
  if (out_hex == nullptr) {
    if (out_error != nullptr) {
      *out_error = "out_hex 为空";
    }
    return false;
  }
  unsigned char digest[EVP_MAX_MD_SIZE];
  unsigned int digest_len = 0;
  if (EVP_Digest(payload.data(), payload.size(), digest, &digest_len,
                 EVP_sha256(), nullptr) != 1) {
    if (out_error != nullptr) {
      *out_error = "OpenSSL SHA-256 计算失败";
    }
    return false;
  }
  *out_hex = BytesToHex(digest, digest_len);
  return true;
}

std::vector<std::string> SplitTabFields(const std::string& line) {
  std::vector<std::string> parts;
  std::string current;
  for (const char c : line) {
    if (c == '\t') {
      parts.push_back(current);
      current.clear();
    } else {
      current.push_back(c);
    }
  }
  parts.push_back(current);
  return parts;
}

bool IsValidStatKey(const std::string& key, std::string* out_error) {
  if (key.empty()) {
    if (out_error != nullptr) {
      *out_error = "统计 key 不能为空";
    }
    return false;
  }
  for (const char c : key) {
    const unsigned char uc = static_cast<unsigned char>(c);
    if (uc < 0x20 || uc == 0x7F) {
      if (out_error != nullptr) {
        *out_error = "统计 key 含控制字符: " + key;
      }
      return false;
    }
  }
  return true;
}

std::string EncodeKeyForFilename(const std::string& key) {
  static constexpr char kHex[] = "0123456789ABCDEF";
  std::string out;
  out.reserve(key.size());
  for (const char c : key) {
    const unsigned char uc = static_cast<unsigned char>(c);
    const bool plain = (uc >= 'a' && uc <= 'z') || (uc >= 'A' && uc <= 'Z') ||
                       (uc >= '0' && uc <= '9') || uc == '_' || uc == '-';
    if (plain) {
      out.push_back(c);
    } else {
      out.push_back('%');
      out.push_back(kHex[(uc >> 4U) & 0x0FU]);
      out.push_back(kHex[uc & 0x0FU]);
    }
  }
  return out;
}

bool DecodeKeyFromFilename(const std::string& filename, std::string* out_key) {
  if (out_key == nullptr) {
    return false;
  }
  std::string key;
  for (std::size_t i = 0; i < filename.size(); ++i) {
    if (filename[i] != '%') {
      key.push_back(filename[i]);
      continue;
    }
    if (i + 2 >= filename.size()) {
      return false;
    }
    const int hi = HexValue(filename[i + 1]);
    const int lo = HexValue(filename[i + 2]);
    if (hi < 0 || lo < 0) {
      return false;
    }
    key.push_back(static_cast<char>((hi << 4) | lo));
    i += 2;
  }
  *out_key = key;
  return true;
}

bool SerializeStrategyRecord(const StrategyStat& stat,
                             std::string* out_line,
                             std::string* out_error) {
  if (out_line == nullptr) {
    if (out_error != nullptr) {
      *out_error = "out_line 为空";
    }
    return false;
  }
  std::ostringstream body;
  body << kStrategyTag << '\t' << stat.name << '\t' << stat.alpha << '\t'
       << stat.beta << '\t' << stat.trades << '\t' << stat.last_trade_id;
  std::string digest;
  if (!Sha256Hex(body.str(), &digest, out_error)) {
    return false;
  }
  *out_line = body.str() + '\t' + digest;
  return true;
}

bool ParseStrategyRecord(const std::string& line,
                         const std::string& expected_name,
                         StrategyStat* out_stat,
                         std::string* out_error) {
  if (out_stat == nullptr) {
    if (out_error != nullptr) {
      *out_error = "out_stat 为空";
    }
    return false;
  }
  const auto fields = SplitTabFields(line);
  if (fields.size() != 7 || fields[0] != kStrategyTag) {
    if (out_error != nullptr) {
      *out_error = "STRAT1 记录字段数异常";
    }
    return false;
  }
  const std::string body = line.substr(0, line.rfind('\t'));
  if (!VerifyDigest(body, fields[6], kStrategyTag, out_error)) {
    return false;
  }

  StrategyStat stat;
  stat.name = fields[1];
  stat.last_trade_id = fields[5];
  if (!ParseInt64Field(fields[2], &stat.alpha) ||
      !ParseInt64Field(fields[3], &stat.beta) ||
      !ParseInt64Field(fields[4], &stat.trades)) {
    if (out_error != nullptr) {
      *out_error = "STRAT1 记录计数字段解析失败";
    }
    return false;
  }
  if (stat.name != expected_name) {
    if (out_error != nullptr) {
      *out_error = "STRAT1 记录 key 不匹配: " + stat.name + " != " + expected_name;
    }
    return false;
  }
  if (stat.alpha < 1 || stat.beta < 1 ||
      stat.alpha + stat.beta - 2 != stat.trades) {
    if (out_error != nullptr) {
      *out_error = "STRAT1 记录违反 Beta 不变量: " + stat.name;
    }
    return false;
  }
  *out_stat = stat;
  return true;
}

bool SerializeSourceRecord(const SourceStat& stat,
                           std::string* out_line,
                           std::string* out_error) {
  if (out_line == nullptr) {
    if (out_error != nullptr) {
      *out_error = "out_line 为空";
    }
    return false;
  }
  std::ostringstream body;
  body << kSourceTag << '\t' << stat.name << '\t' << stat.wins << '\t'
       << stat.losses << '\t' << stat.grade << '\t'
       << std::setprecision(17) << stat.score << '\t' << stat.last_trade_id;
  std::string digest;
  if (!Sha256Hex(body.str(), &digest, out_error)) {
    return false;
  }
  *out_line = body.str() + '\t' + digest;
  return true;
}

bool ParseSourceRecord(const std::string& line,
                       const std::string& expected_name,
                       SourceStat* out_stat,
                       std::string* out_error) {
  if (out_stat == nullptr) {
    if (out_error != nullptr) {
      *out_error = "out_stat 为空";
    }
    return false;
  }
  const auto fields = SplitTabFields(line);
  if (fields.size() != 8 || fields[0] != kSourceTag) {
    if (out_error != nullptr) {
      *out_error = "SRC1 记录字段数异常";
    }
    return false;
  }
  const std::string body = line.substr(0, line.rfind('\t'));
  if (!VerifyDigest(body, fields[7], kSourceTag, out_error)) {
    return false;
  }

  SourceStat stat;
  stat.name = fields[1];
  stat.grade = fields[4];
  stat.last_trade_id = fields[6];
  if (!ParseInt64Field(fields[2], &stat.wins) ||
      !ParseInt64Field(fields[3], &stat.losses)) {
    if (out_error != nullptr) {
      *out_error = "SRC1 记录计数字段解析失败";
    }
    return false;
  }
  try {
    stat.score = std::stod(fields[5]);
  } catch (const std::exception&) {
    if (out_error != nullptr) {
      *out_error = "SRC1 记录 score 字段解析失败";
    }
    return false;
  }
  if (stat.name != expected_name) {
    if (out_error != nullptr) {
      *out_error = "SRC1 记录 key 不匹配: " + stat.name + " != " + expected_name;
    }
    return false;
  }
  if (stat.wins < 0 || stat.losses < 0 || !std::isfinite(stat.score)) {
    if (out_error != nullptr) {
      *out_error = "SRC1 记录计数非法: " + stat.name;
    }
    return false;
  }
  if (stat.grade != GradeForRecord(stat.wins, stat.losses)) {
    if (out_error != nullptr) {
      *out_error = "SRC1 记录评级与计数不一致: " + stat.name;
    }
    return false;
  }
  *out_stat = stat;
  return true;
}

}  // namespace adaptive_engine
