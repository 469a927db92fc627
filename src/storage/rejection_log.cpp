#include "storage/rejection_log.h"

#include <exception>
#include <filesystem>
#include <iomanip>
#include <sstream>
#include <unordered_set>

#include "core/log.h"
#include "storage/file_io.h"
#include "storage/record_codec.h"

namespace adaptive_engine {

namespace {

std::string SerializeRejection(const RejectionRecord& record) {
  std::ostringstream oss;
  oss << "REJECT"
      << '\t'
      << record.signal_id
      << '\t'
      << record.source
      << '\t'
      << record.strategy
      << '\t'
      << ToString(record.reason)
      << '\t'
      << record.symbol
      << '\t'
      << std::setprecision(17) << record.reference_price
      << '\t'
      << record.rejected_at_ms;
  return oss.str();
}

bool ParseRejection(const std::vector<std::string>& fields,
                    RejectionRecord* out_record,
                    std::string* out_error) {
  if (fields.size() != 8 || fields[0] != "REJECT") {
    if (out_error != nullptr) {
      *out_error = "REJECT 字段数异常";
    }
    return false;
  }
  RejectionRecord record;
  record.signal_id = fields[1];
  record.source = fields[2];
  record.strategy = fields[3];
  record.symbol = fields[5];
  if (!ParseRejectReason(fields[4], &record.reason)) {
    if (out_error != nullptr) {
      *out_error = "REJECT reason 字段非法: " + fields[4];
    }
    return false;
  }
  try {
    record.reference_price = std::stod(fields[6]);
    record.rejected_at_ms = std::stoll(fields[7]);
  } catch (const std::exception&) {
    if (out_error != nullptr) {
      *out_error = "REJECT 字段解析失败";
    }
    return false;
  }
  *out_record = record;
  return true;
}

}  // namespace

bool RejectionLog::Initialize(std::string* out_error) const {
  const auto parent = std::filesystem::path(file_path_).parent_path();
  if (parent.empty()) {
    return true;
  }
  return EnsureDirectory(parent.string(), out_error);
}

bool RejectionLog::Append(const RejectionRecord& record, std::string* out_error) const {
  return AppendLineDurably(file_path_, SerializeRejection(record), out_error);
}

bool RejectionLog::Load(std::vector<RejectionRecord>* out_records,
                        std::string* out_error) const {
  if (out_records == nullptr) {
    if (out_error != nullptr) {
      *out_error = "out_records 为空";
    }
    return false;
  }
  out_records->clear();

  std::string content;
  bool exists = false;
  if (!ReadWholeFile(file_path_, &content, &exists, out_error)) {
    return false;
  }
  if (!exists) {
    return true;
  }

  std::unordered_set<std::string> seen;
  std::istringstream iss(content);
  std::string line;
  int line_no = 0;
  while (std::getline(iss, line)) {
    ++line_no;
    if (line.empty()) {
      continue;
    }
    RejectionRecord record;
    std::string parse_error;
    if (!ParseRejection(SplitTabFields(line), &record, &parse_error)) {
      // 拒单日志只服务于离线评估，单行损坏不阻断整体。
      LogWarn("拒单日志行解析失败（line=" + std::to_string(line_no) + "）: " +
              parse_error);
      continue;
    }
    if (seen.insert(record.signal_id).second) {
      out_records->push_back(record);
    }
  }
  return true;
}

}  // namespace adaptive_engine
