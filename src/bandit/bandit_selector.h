#pragma once

#include <cstdint>
#include <mutex>
#include <random>
#include <string>
#include <vector>

#include "core/config.h"
#include "core/types.h"
#include "storage/reliability_store.h"

namespace adaptive_engine {

/// 策略排名条目：score 为 Thompson 抽样值或 Beta 均值。
struct RankedStrategy {
  std::string name;
  double score{0.0};
};

/// 信号源打分结果。
struct SourceScore {
  std::string name;
  double score{0.0};                ///< 0-100 的 UCB1 分数。
  std::int64_t observations{0};     ///< 该源的胜负样本数。
  std::int64_t total_observations{0};
  std::string grade{"C"};
  bool cold_start{true};            ///< 样本不足 kMinGradeSamples。
};

/**
 * @brief 多臂老虎机选择器
 *
 * 策略侧使用 Thompson Sampling：每次调用对每个策略重新抽一次 Beta 样本并降序排名；
 * 信号源侧使用 UCB1。随机数引擎只在构造时播种一次，抽样由互斥锁保护。
 */
class BanditSelector {
 public:
  BanditSelector(const ReliabilityStore& store, BanditConfig config);

  /// 从存储读取全部策略并做一次 Thompson 排名。
  bool RankStrategies(std::vector<RankedStrategy>* out_ranked, std::string* out_error);
  /// 对给定统计做一次 Thompson 排名（每次调用重新抽样）。
  std::vector<RankedStrategy> RankStats(const std::vector<StrategyStat>& stats);
  /// 按 Beta 均值确定性排名（只利用不探索）。
  bool RankStrategiesByExpectation(std::vector<RankedStrategy>* out_ranked,
                                   std::string* out_error) const;

  /**
   * @brief UCB1 打分；零样本信号源返回乐观默认分
   *
   * 1 到 kMinGradeSamples-1 个样本时返回原始 UCB1 并置 cold_start，
   * 而持久化的 SourceStat::score 在此区间保持中性冷启动分 50。
   */
  bool ScoreSource(const std::string& name,
                   SourceScore* out_score,
                   std::string* out_error) const;

  const BanditConfig& config() const { return config_; }

 private:
  const ReliabilityStore& store_;
  BanditConfig config_;
  std::mutex rng_mutex_;
  std::mt19937_64 rng_;
};

}  // namespace adaptive_engine
