#pragma once

#include <string>

#include "core/types.h"
#include "storage/outcome_journal.h"
#include "storage/pattern_log.h"
#include "storage/reliability_store.h"

namespace adaptive_engine {

/// 单次 Record 的处理结果。
enum class RecordResult {
  kApplied,    ///< 本次完成（含补做中断的步骤）。
  kDuplicate,  ///< trade_id 已 DONE，跳过。
  kInvalid,    ///< 交易结果字段非法，不会写入流水。
  kFailed,     ///< 重试耗尽，交易保持未完成，下次运行补做。
};

inline const char* ToString(RecordResult result) {
  switch (result) {
    case RecordResult::kApplied:
      return "applied";
    case RecordResult::kDuplicate:
      return "duplicate";
    case RecordResult::kInvalid:
      return "invalid";
    case RecordResult::kFailed:
      return "failed";
  }
  return "unknown";
}

/**
 * @brief 交易结果学习器
 *
 * 每笔已平仓交易恰好一次地更新策略与信号源统计：
 * BEGIN -> 策略更新 -> STEP -> 信号源更新 -> STEP -> 模式日志 -> STEP -> DONE。
 * 整个流程持有流水锁，并发提交同一 trade_id 只会有一次生效。
 * 存储更新随记录写入 trade_id，提交后、STEP 落盘前失败的步骤重放时不会重复计数。
 */
class OutcomeUpdater {
 public:
  OutcomeUpdater(const ReliabilityStore& store,
                 const OutcomeJournal& journal,
                 const PatternLog& patterns,
                 int lock_timeout_ms)
      : store_(store),
        journal_(journal),
        patterns_(patterns),
        lock_timeout_ms_(lock_timeout_ms) {}

  RecordResult Record(const TradeOutcome& outcome, std::string* out_error) const;

  /// 补做流水中所有未 DONE 的交易，返回成功补完的笔数；任一失败返回 false。
  bool ResumePending(int* out_resumed, std::string* out_error) const;

 private:
  /// 按流水进度执行缺失步骤（调用方须持有流水锁）。
  bool CompleteSteps(const TradeProgress& progress, std::string* out_error) const;

  const ReliabilityStore& store_;
  const OutcomeJournal& journal_;
  const PatternLog& patterns_;
  int lock_timeout_ms_{2000};
};

}  // namespace adaptive_engine
