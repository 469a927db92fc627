#pragma once

#include <cstddef>
#include <string>
#include <utility>
#include <vector>

#include "core/types.h"

namespace adaptive_engine {

/**
 * @brief 胜/负交易模式日志
 *
 * `<dir>/wins.log` 与 `<dir>/losses.log` 各自只追加。供复盘与上游提示词检索最近样本，
 * 不参与任何统计计算。
 */
class PatternLog {
 public:
  explicit PatternLog(std::string dir) : dir_(std::move(dir)) {}

  bool Initialize(std::string* out_error) const;

  /// 按 outcome.is_win() 写入对应分区。
  bool Append(const TradeOutcome& outcome, std::string* out_error) const;

  /// 读取某一分区最近 `limit` 条（新在前，按 trade_id 去重）。
  bool LoadRecent(bool wins,
                  std::size_t limit,
                  std::vector<TradeOutcome>* out_outcomes,
                  std::string* out_error) const;

 private:
  std::string PartitionPath(bool wins) const;

  std::string dir_;
};

}  // namespace adaptive_engine
