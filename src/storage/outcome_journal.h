#pragma once

#include <string>
#include <unordered_map>
#include <utility>

#include "core/types.h"

namespace adaptive_engine {

/// 单笔交易在学习流水中的可恢复步骤。
enum class JournalStep {
  kStrategy,
  kSource,
  kPattern,
};

inline const char* ToString(JournalStep step) {
  switch (step) {
    case JournalStep::kStrategy:
      return "strategy";
    case JournalStep::kSource:
      return "source";
    case JournalStep::kPattern:
      return "pattern";
  }
  return "unknown";
}

/// 从流水恢复出的单笔交易进度。
struct TradeProgress {
  TradeOutcome outcome;
  bool strategy_applied{false};
  bool source_applied{false};
  bool pattern_appended{false};
  bool done{false};
};

/**
 * @brief 交易结果学习流水（Write-Ahead Journal）
 *
 * 语义：
 * 1. 每笔交易先写 BEGIN，再逐步写 STEP 标记，最后写 DONE；
 * 2. 重启后只补做缺少 STEP 标记的步骤，已完成步骤不重复计数；
 * 3. DONE 的 trade_id 视为已处理，重复提交直接跳过。
 *
 * 追加操作不自带互斥，调用方须持有 `lock_path()` 上的 ScopedFileLock。
 */
class OutcomeJournal {
 public:
  explicit OutcomeJournal(std::string file_path) : file_path_(std::move(file_path)) {}

  /// 确保父目录存在并创建流水文件（若不存在）。
  bool Initialize(std::string* out_error) const;

  bool AppendBegin(const TradeOutcome& outcome, std::string* out_error) const;
  bool AppendStep(const std::string& trade_id,
                  JournalStep step,
                  std::string* out_error) const;
  bool AppendDone(const std::string& trade_id, std::string* out_error) const;

  /// 回放整份流水；末尾不完整的残行会被忽略。
  bool LoadState(std::unordered_map<std::string, TradeProgress>* out_progress,
                 std::string* out_error) const;

  const std::string& file_path() const { return file_path_; }
  std::string lock_path() const { return file_path_ + ".lock"; }

 private:
  /// 追加一行；若文件末尾残留无换行的半行，先将其截断。
  bool AppendLine(const std::string& line, std::string* out_error) const;

  std::string file_path_;  ///< 流水文件路径。
};

}  // namespace adaptive_engine
