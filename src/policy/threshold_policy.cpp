#include "policy/threshold_policy.h"

#include <cmath>
#include <sstream>
#include <utility>

namespace adaptive_engine {

namespace {

std::string FormatTriple(const EffectiveThresholds& thresholds) {
  std::ostringstream oss;
  oss << "(trust=" << thresholds.min_trust_score
      << ", confidence=" << thresholds.min_confidence_score
      << ", signal=" << thresholds.min_signal_score << ")";
  return oss.str();
}

}  // namespace

bool CheckModeCoherence(const ModeState& mode, std::string* out_error) {
  if (mode.portfolio_mode == OperatingMode::kProduction &&
      mode.operating_mode != OperatingMode::kProduction) {
    if (out_error != nullptr) {
      *out_error = std::string("模式不一致: portfolio_mode=PRODUCTION, operating_mode=") +
                   ToString(mode.operating_mode);
    }
    return false;
  }
  return true;
}

std::optional<ModeState> MakeModeState(OperatingMode operating_mode,
                                       std::string active_profile,
                                       OperatingMode portfolio_mode,
                                       std::string* out_error) {
  ModeState mode;
  mode.operating_mode = operating_mode;
  mode.active_profile = std::move(active_profile);
  mode.portfolio_mode = portfolio_mode;
  if (!CheckModeCoherence(mode, out_error)) {
    return std::nullopt;
  }
  if (mode.active_profile.empty()) {
    if (out_error != nullptr) {
      *out_error = "active_profile 不能为空";
    }
    return std::nullopt;
  }
  return mode;
}

bool ValidateSafetyFloor(const EffectiveThresholds& thresholds,
                         std::string* out_error) {
  // NaN 比较恒为 false，必须显式拒绝，否则会绕过下限检查。
  const bool finite = std::isfinite(thresholds.min_trust_score) &&
                      std::isfinite(thresholds.min_confidence_score) &&
                      std::isfinite(thresholds.min_signal_score);
  if (finite &&
      thresholds.min_trust_score >= kProductionSafetyFloor.min_trust_score &&
      thresholds.min_confidence_score >=
          kProductionSafetyFloor.min_confidence_score &&
      thresholds.min_signal_score >= kProductionSafetyFloor.min_signal_score) {
    return true;
  }
  if (out_error != nullptr) {
    *out_error = "生产阈值低于安全下限: " + FormatTriple(thresholds) +
                 " < " + FormatTriple(kProductionSafetyFloor);
  }
  return false;
}

std::optional<ThresholdPolicyResolver> ThresholdPolicyResolver::Create(
    ModeState mode,
    std::map<std::string, ThresholdProfile> profiles,
    std::string* out_error) {
  if (!CheckModeCoherence(mode, out_error)) {
    return std::nullopt;
  }
  if (profiles.find(mode.active_profile) == profiles.end()) {
    if (out_error != nullptr) {
      *out_error = "活动档位未定义: " + mode.active_profile;
    }
    return std::nullopt;
  }
  return ThresholdPolicyResolver(std::move(mode), std::move(profiles));
}

bool ThresholdPolicyResolver::Resolve(EffectiveThresholds* out_thresholds,
                                      std::string* out_error) const {
  return Resolve(mode_, out_thresholds, out_error);
}

bool ThresholdPolicyResolver::Resolve(const ModeState& mode,
                                      EffectiveThresholds* out_thresholds,
                                      std::string* out_error) const {
  if (out_thresholds == nullptr) {
    if (out_error != nullptr) {
      *out_error = "out_thresholds 为空";
    }
    return false;
  }
  if (!CheckModeCoherence(mode, out_error)) {
    return false;
  }

  const auto it = profiles_.find(mode.active_profile);
  if (it == profiles_.end()) {
    if (out_error != nullptr) {
      *out_error = "档位未定义: " + mode.active_profile;
    }
    return false;
  }

  EffectiveThresholds resolved;
  resolved.min_trust_score = it->second.min_trust_score;
  resolved.min_confidence_score = it->second.min_confidence_score;
  resolved.min_signal_score = it->second.min_signal_score;

  if (mode.operating_mode == OperatingMode::kProduction) {
    resolved = kProductionStrictThresholds;
    if (!ValidateSafetyFloor(resolved, out_error)) {
      return false;
    }
  }

  *out_thresholds = resolved;
  return true;
}

}  // namespace adaptive_engine
