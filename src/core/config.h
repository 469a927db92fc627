#pragma once

#include <map>
#include <string>

#include "core/types.h"

namespace adaptive_engine {

/// 决策门参数：档位角色、试探单仓位与置信度推断默认值。
struct GateConfig {
  // 保守基线档位名：该档位下任何放宽都不生效。
  std::string strict_profile{"strict"};
  // 学习档位名：仅在 operating_mode=LEARNING 时启用 REVISE 试探与置信度推断。
  std::string learning_profile{"learning"};
  double probe_size_multiplier{0.3};
  double inferred_approve_confidence{60.0};
  double inferred_revise_confidence{40.0};
  // 上游置信度下限（0=关闭）。
  double min_upstream_confidence{0.0};
  // 已评级信号源的 UCB 分数下限（0=关闭）。
  double min_source_score{0.0};
};

/// Bandit 参数。
struct BanditConfig {
  double ucb_exploration{2.0};     ///< UCB1 探索常数 c：bonus = sqrt(c * ln(N) / n)。
  double new_source_score{100.0};  ///< 零样本信号源的乐观默认分。
  int rng_seed{0};                 ///< 0 表示使用 random_device 播种。
};

/// 可靠性存储参数：根目录、锁等待与瞬时错误重试。
struct StoreConfig {
  std::string root{"data/state"};
  int lock_timeout_ms{2000};
  int max_attempts{3};
  int retry_backoff_ms{50};
};

/// 反事实追踪参数。
struct CounterfactualConfig {
  bool enabled{true};
  double horizon_hours{24.0};
  // 拒绝后涨幅 >= 该值（%）视为“错过的赢单”。
  double win_threshold_pct{5.0};
  // `{symbol}` 会被替换为信号 symbol。
  std::string price_url_template{
      "https://api.binance.com/api/v3/ticker/price?symbol={symbol}"};
  std::string price_json_field{"price"};
  int request_timeout_ms{5000};
  int run_budget_ms{60000};
  int max_evaluations_per_run{50};
};

/// 引擎主配置：模式、阈值档位、决策门、Bandit、存储与反事实追踪。
struct EngineConfig {
  ModeState mode{};
  std::map<std::string, ThresholdProfile> profiles;
  GateConfig gate{};
  BanditConfig bandit{};
  StoreConfig store{};
  CounterfactualConfig counterfactual{};
};

/// 解析模式文本：learning/paper -> LEARNING，production/live -> PRODUCTION。
bool ParseOperatingMode(const std::string& text, OperatingMode* out_mode);

/**
 * @brief 轻量 YAML 配置加载器
 *
 * 仅解析引擎所需字段；`thresholds` 段下每个二级键是一个档位名。
 * 解析或校验失败返回 `false` 并写入 `out_error`，调用方必须拒绝启动。
 */
bool LoadEngineConfigFromYaml(const std::string& file_path,
                              EngineConfig* out_config,
                              std::string* out_error);

/// 对已组装的配置做一致性校验（模式一致性、档位存在性、数值范围）。
bool ValidateEngineConfig(const EngineConfig& config, std::string* out_error);

}  // namespace adaptive_engine
