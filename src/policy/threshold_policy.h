#pragma once

#include <map>
#include <optional>
#include <string>
#include <utility>

#include "core/types.h"

namespace adaptive_engine {

/// 生产模式下无条件覆盖的严格阈值（trust, confidence, signal）。
inline constexpr EffectiveThresholds kProductionStrictThresholds{70.0, 60.0, 70.0};
/// 生产模式硬安全下限：覆盖完成后独立复核，低于下限即致命配置错误。
inline constexpr EffectiveThresholds kProductionSafetyFloor{70.0, 60.0, 70.0};

/// 模式一致性：portfolio_mode=PRODUCTION 时 operating_mode 必须也是 PRODUCTION。
bool CheckModeCoherence(const ModeState& mode, std::string* out_error);

/**
 * @brief 构造并校验 ModeState
 *
 * 模式不一致时返回 `std::nullopt`（快速失败），绝不产出可用的模式快照。
 */
std::optional<ModeState> MakeModeState(OperatingMode operating_mode,
                                       std::string active_profile,
                                       OperatingMode portfolio_mode,
                                       std::string* out_error);

/// 复核三项门槛均不低于生产安全下限。
bool ValidateSafetyFloor(const EffectiveThresholds& thresholds,
                         std::string* out_error);

/**
 * @brief 阈值策略解析器
 *
 * 语义：
 * 1. 按档位名取出三项门槛；
 * 2. PRODUCTION 模式在取值之后无条件覆盖为严格三元组，档位作者无法参与合并；
 * 3. 覆盖后再对照硬安全下限逐项复核，用于发现被绕过或损坏的覆盖逻辑；
 * 4. 纯函数，不缓存结果；调用方每个决策上下文调用一次。
 */
class ThresholdPolicyResolver {
 public:
  /// 模式不一致或活动档位不存在时返回 `std::nullopt`。
  static std::optional<ThresholdPolicyResolver> Create(
      ModeState mode,
      std::map<std::string, ThresholdProfile> profiles,
      std::string* out_error);

  /// 使用启动时的模式快照解析。
  bool Resolve(EffectiveThresholds* out_thresholds, std::string* out_error) const;

  /// 按给定模式与档位解析；每次都会重新校验模式一致性与安全下限。
  bool Resolve(const ModeState& mode,
               EffectiveThresholds* out_thresholds,
               std::string* out_error) const;

  const ModeState& mode() const { return mode_; }
  const std::map<std::string, ThresholdProfile>& profiles() const {
    return profiles_;
  }

 private:
  ThresholdPolicyResolver(ModeState mode,
                          std::map<std::string, ThresholdProfile> profiles)
      : mode_(std::move(mode)), profiles_(std::move(profiles)) {}

  ModeState mode_;  ///< 启动时模式快照（只读）。
  std::map<std::string, ThresholdProfile> profiles_;  ///< 已加载档位（只读）。
};

}  // namespace adaptive_engine
