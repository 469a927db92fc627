#include "learning/outcome_updater.h"

#include <cmath>
#include <unordered_map>

#include "core/log.h"
#include "storage/file_io.h"
#include "storage/record_codec.h"

namespace adaptive_engine {

namespace {

bool ValidateOutcome(const TradeOutcome& outcome, std::string* out_error) {
  if (outcome.trade_id.empty() || outcome.strategy.empty() || outcome.source.empty()) {
    if (out_error != nullptr) {
      *out_error = "交易结果缺少 trade_id/strategy/source";
    }
    return false;
  }
  if (!std::isfinite(outcome.pnl_percent)) {
    if (out_error != nullptr) {
      *out_error = "交易结果 pnl_percent 非有限值: " + outcome.trade_id;
    }
    return false;
  }
  std::string key_error;
  if (!IsValidStatKey(outcome.trade_id, &key_error) ||
      !IsValidStatKey(outcome.strategy, &key_error) ||
      !IsValidStatKey(outcome.source, &key_error)) {
    if (out_error != nullptr) {
      *out_error = "交易结果字段非法: " + key_error;
    }
    return false;
  }
  return true;
}

}  // namespace

bool OutcomeUpdater::CompleteSteps(const TradeProgress& progress,
                                   std::string* out_error) const {
  const TradeOutcome& outcome = progress.outcome;
  const bool win = outcome.is_win();

  if (!progress.strategy_applied) {
    StrategyStat after;
    if (!store_.ApplyStrategyOutcome(outcome.strategy, win, outcome.trade_id, &after,
                                     out_error) ||
        !journal_.AppendStep(outcome.trade_id, JournalStep::kStrategy, out_error)) {
      return false;
    }
    LogInfo("策略统计已更新: trade_id=" + outcome.trade_id +
            ", strategy=" + after.name + ", alpha=" + std::to_string(after.alpha) +
            ", beta=" + std::to_string(after.beta));
  }

  if (!progress.source_applied) {
    SourceStat after;
    if (!store_.ApplySourceOutcome(outcome.source, win, outcome.trade_id, &after,
                                   out_error) ||
        !journal_.AppendStep(outcome.trade_id, JournalStep::kSource, out_error)) {
      return false;
    }
    LogInfo("信号源统计已更新: trade_id=" + outcome.trade_id +
            ", source=" + after.name + ", grade=" + after.grade +
            ", score=" + std::to_string(after.score));
  }

  if (!progress.pattern_appended) {
    if (!patterns_.Append(outcome, out_error) ||
        !journal_.AppendStep(outcome.trade_id, JournalStep::kPattern, out_error)) {
      return false;
    }
  }

  return journal_.AppendDone(outcome.trade_id, out_error);
}

RecordResult OutcomeUpdater::Record(const TradeOutcome& outcome,
                                    std::string* out_error) const {
  if (!ValidateOutcome(outcome, out_error)) {
    return RecordResult::kInvalid;
  }

  ScopedFileLock lock;
  if (!lock.Acquire(journal_.lock_path(), lock_timeout_ms_, out_error)) {
    return RecordResult::kFailed;
  }

  std::unordered_map<std::string, TradeProgress> state;
  if (!journal_.LoadState(&state, out_error)) {
    return RecordResult::kFailed;
  }

  // 先补完其他未完成的交易：每个 key 至多一笔在途，记录里的 last_trade_id 足以判重。
  for (const auto& [pending_id, pending] : state) {
    if (pending.done || pending_id == outcome.trade_id) {
      continue;
    }
    LogWarn("补做未完成的交易结果: trade_id=" + pending_id);
    if (!CompleteSteps(pending, out_error)) {
      LogError("未完成交易补做失败，本次结果暂不处理: trade_id=" + outcome.trade_id +
               (out_error != nullptr ? ", error=" + *out_error : std::string()));
      return RecordResult::kFailed;
    }
  }

  TradeProgress progress;
  const auto it = state.find(outcome.trade_id);
  if (it != state.end()) {
    if (it->second.done) {
      LogInfo("duplicate 交易结果已处理，跳过: trade_id=" + outcome.trade_id);
      return RecordResult::kDuplicate;
    }
    // 中断过的交易：以流水中首次 BEGIN 的内容为准补做。
    progress = it->second;
    LogWarn("恢复未完成的交易结果: trade_id=" + outcome.trade_id);
  } else {
    if (!journal_.AppendBegin(outcome, out_error)) {
      return RecordResult::kFailed;
    }
    progress.outcome = outcome;
  }

  if (!CompleteSteps(progress, out_error)) {
    LogError("交易结果学习失败，等待下次运行补做: trade_id=" + outcome.trade_id +
             (out_error != nullptr ? ", error=" + *out_error : std::string()));
    return RecordResult::kFailed;
  }
  return RecordResult::kApplied;
}

bool OutcomeUpdater::ResumePending(int* out_resumed, std::string* out_error) const {
  if (out_resumed == nullptr) {
    if (out_error != nullptr) {
      *out_error = "out_resumed 为空";
    }
    return false;
  }
  *out_resumed = 0;

  ScopedFileLock lock;
  if (!lock.Acquire(journal_.lock_path(), lock_timeout_ms_, out_error)) {
    return false;
  }
  std::unordered_map<std::string, TradeProgress> state;
  if (!journal_.LoadState(&state, out_error)) {
    return false;
  }
  for (const auto& [trade_id, progress] : state) {
    if (progress.done) {
      continue;
    }
    LogWarn("补做未完成的交易结果: trade_id=" + trade_id);
    if (!CompleteSteps(progress, out_error)) {
      return false;
    }
    ++*out_resumed;
  }
  return true;
}

}  // namespace adaptive_engine
