#pragma once

#include <optional>
#include <utility>
#include <vector>

#include "bandit/bandit_selector.h"
#include "core/config.h"
#include "core/types.h"

namespace adaptive_engine {

/**
 * @brief 决策门：单一状态机，输出 APPROVE / REJECT 与仓位系数
 *
 * 评估顺序：
 * 1. 数据质量（分数非有限或越界、来源为空、阈值不可用）-> REJECT；
 * 2. trust / confidence / signal 三项阈值，任一不达标 -> REJECT，任何模式都不可覆盖；
 * 3. 上游 REJECT 或未知 -> REJECT；
 * 4. 上游置信度为 0：学习档位推断默认值并打标，否则 REJECT；
 * 5. 上游置信度下限；
 * 6. 上游 REVISE：学习档位折叠为小仓位 APPROVE 试探，否则 REJECT；
 * 7. 已评级信号源的 UCB 分数下限；
 * 8. APPROVE，策略取提示或 Thompson 排名首位。
 *
 * 任何内部异常路径都只会落到 REJECT。
 */
class DecisionGate {
 public:
  explicit DecisionGate(GateConfig config) : config_(std::move(config)) {}

  /// `thresholds` 为空表示阈值解析失败（配置错误）。
  Verdict Evaluate(const CandidateSignal& signal,
                   const std::optional<EffectiveThresholds>& thresholds,
                   const SourceScore& source_score,
                   const std::vector<RankedStrategy>& ranked_strategies,
                   const ModeState& mode,
                   const UpstreamVerdict& upstream) const;

  /// 学习档位：active_profile 为 learning_profile 且运行于 LEARNING。
  bool IsLearningProfile(const ModeState& mode) const;

  const GateConfig& config() const { return config_; }

 private:
  GateConfig config_;
};

}  // namespace adaptive_engine
