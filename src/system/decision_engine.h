#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "bandit/bandit_selector.h"
#include "core/config.h"
#include "core/types.h"
#include "gate/decision_gate.h"
#include "learning/outcome_updater.h"
#include "policy/threshold_policy.h"
#include "storage/outcome_journal.h"
#include "storage/pattern_log.h"
#include "storage/rejection_log.h"
#include "storage/reliability_store.h"

namespace adaptive_engine {

// 单次信号评估的分层产物，便于审计回放。
struct EngineDecision {
  std::optional<EffectiveThresholds> thresholds;  ///< 本次解析出的门槛；空表示配置错误。
  SourceScore source_score;                      ///< 信号源 UCB 打分。
  std::vector<RankedStrategy> ranked_strategies;  ///< 本次 Thompson 排名。
  Verdict verdict;                                ///< 决策门输出。
  bool storage_error{false};                      ///< 读取统计或写拒单日志失败（瞬时）。
};

/**
 * @brief 决策与学习编排器
 *
 * 责任边界：
 * 1. 每个信号重新解析阈值 -> 打分 -> 排名 -> 决策门；
 * 2. 拒单写入拒单日志，供反事实追踪；
 * 3. 交易结果经 OutcomeUpdater 恰好一次地写回统计。
 *
 * 配置/安全错误会把引擎标记为致命，调用方必须停止处理并以非零码退出。
 */
class DecisionEngine {
  /// 只有 Create 能构造该标签，外部无法绕过配置校验直接构造引擎。
  struct PrivateTag {
    explicit PrivateTag() = default;
  };

 public:
  /// 校验配置、初始化存储布局；任一步失败返回 `nullptr`。
  static std::unique_ptr<DecisionEngine> Create(const EngineConfig& config,
                                                std::string* out_error);

  DecisionEngine(PrivateTag, EngineConfig config, ThresholdPolicyResolver resolver);

  DecisionEngine(const DecisionEngine&) = delete;
  DecisionEngine& operator=(const DecisionEngine&) = delete;

  EngineDecision Evaluate(const CandidateSignal& signal,
                          const UpstreamVerdict& upstream,
                          std::int64_t now_ms);

  RecordResult RecordOutcome(const TradeOutcome& outcome, std::string* out_error) const {
    return updater_.Record(outcome, out_error);
  }

  bool fatal() const { return fatal_; }
  const std::string& fatal_error() const { return fatal_error_; }

  const EngineConfig& config() const { return config_; }
  const ReliabilityStore& store() const { return store_; }
  BanditSelector& bandit() { return bandit_; }
  const PatternLog& patterns() const { return patterns_; }
  const RejectionLog& rejections() const { return rejections_; }
  const OutcomeUpdater& updater() const { return updater_; }

  /// 存储根目录下各文件路径。
  static std::string JournalPath(const StoreConfig& store);
  static std::string PatternDir(const StoreConfig& store);
  static std::string RejectionLogPath(const StoreConfig& store);
  static std::string CounterfactualLogPath(const StoreConfig& store);

 private:
  void MarkFatal(const std::string& error);

  EngineConfig config_;
  ThresholdPolicyResolver resolver_;
  ReliabilityStore store_;
  BanditSelector bandit_;
  DecisionGate gate_;
  OutcomeJournal journal_;
  PatternLog patterns_;
  RejectionLog rejections_;
  OutcomeUpdater updater_;
  bool fatal_{false};
  std::string fatal_error_;
};

}  // namespace adaptive_engine
