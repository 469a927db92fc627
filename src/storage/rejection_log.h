#pragma once

#include <string>
#include <utility>
#include <vector>

#include "core/types.h"

namespace adaptive_engine {

/**
 * @brief 被拒信号的只追加日志
 *
 * 行格式：`REJECT\tsignal_id\tsource\tstrategy\treason\tsymbol\treference_price\trejected_at_ms`，
 * reason 以原因码文本（ToString）落盘。同一 signal_id 只保留首条。
 */
class RejectionLog {
 public:
  explicit RejectionLog(std::string file_path) : file_path_(std::move(file_path)) {}

  bool Initialize(std::string* out_error) const;
  bool Append(const RejectionRecord& record, std::string* out_error) const;
  bool Load(std::vector<RejectionRecord>* out_records, std::string* out_error) const;

  const std::string& file_path() const { return file_path_; }

 private:
  std::string file_path_;
};

}  // namespace adaptive_engine
