#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <vector>

#include "core/config.h"
#include "core/types.h"
#include "counterfactual/price_provider.h"
#include "storage/rejection_log.h"

namespace adaptive_engine {

/// 单个拒绝原因下的评估计数。
struct ReasonAccuracy {
  int evaluated{0};
  int missed_winners{0};

  /// 拒绝正确率：未错过赢单的比例；无样本返回 0。
  double accuracy() const {
    return evaluated == 0 ? 0.0
                          : static_cast<double>(evaluated - missed_winners) /
                                static_cast<double>(evaluated);
  }
};

/// 反事实评估汇总（全部历史结果）。
struct CounterfactualSummary {
  ReasonAccuracy overall;
  std::map<RejectReason, ReasonAccuracy> by_reason;
};

/// 单次运行统计。
struct CounterfactualRunStats {
  int evaluated{0};
  int missed_winners{0};
  int abandoned{0};        ///< 价格获取失败，留待下次。
  int not_due{0};          ///< 未到评估期。
  int not_priceable{0};    ///< 缺少 symbol 或参考价，永不评估。
  bool budget_exhausted{false};
};

/**
 * @brief 反事实追踪器
 *
 * 对到期（拒绝时间早于 horizon_hours）且尚未评估的拒单重新询价，
 * 涨幅达到 win_threshold_pct 记为“错过的赢单”，结果追加到结果日志。
 * 只读拒单日志，从不写可靠性存储。
 */
class CounterfactualTracker {
 public:
  CounterfactualTracker(const RejectionLog& rejections,
                        std::string results_path,
                        CounterfactualConfig config,
                        const PriceProvider& prices);

  /// 执行一轮评估；`now_ms` 为墙钟毫秒时间戳。
  bool RunOnce(std::int64_t now_ms,
               CounterfactualRunStats* out_stats,
               std::string* out_error) const;

  bool LoadResults(std::vector<CounterfactualResult>* out_results,
                   std::string* out_error) const;
  bool Summarize(CounterfactualSummary* out_summary, std::string* out_error) const;

 private:
  const RejectionLog& rejections_;
  std::string results_path_;
  CounterfactualConfig config_;
  const PriceProvider& prices_;
};

}  // namespace adaptive_engine
