#include "gate/decision_gate.h"

#include <cmath>

namespace adaptive_engine {

namespace {

bool IsScore(double value) {
  return std::isfinite(value) && value >= 0.0 && value <= 100.0;
}

Verdict MakeReject(RejectReason reason, const Verdict& partial) {
  Verdict verdict = partial;
  verdict.decision = Decision::kReject;
  verdict.size_multiplier = 0.0;
  verdict.reject_reason = reason;
  return verdict;
}

}  // namespace

bool DecisionGate::IsLearningProfile(const ModeState& mode) const {
  return mode.operating_mode == OperatingMode::kLearning &&
         mode.active_profile == config_.learning_profile &&
         mode.active_profile != config_.strict_profile;
}

Verdict DecisionGate::Evaluate(const CandidateSignal& signal,
                               const std::optional<EffectiveThresholds>& thresholds,
                               const SourceScore& source_score,
                               const std::vector<RankedStrategy>& ranked_strategies,
                               const ModeState& mode,
                               const UpstreamVerdict& upstream) const {
  Verdict verdict;
  verdict.source_score = source_score.score;
  verdict.upstream_confidence = upstream.confidence;

  // 1) 数据质量。
  if (!thresholds.has_value()) {
    return MakeReject(RejectReason::kConfigurationError, verdict);
  }
  if (signal.signal_id.empty() || signal.source.empty() ||
      !IsScore(signal.trust_score) || !IsScore(signal.confidence_score) ||
      !IsScore(signal.signal_score) || !IsScore(upstream.confidence)) {
    return MakeReject(RejectReason::kMalformedSignal, verdict);
  }

  // 2) 阈值：固定顺序，首个失败即拒绝。
  const EffectiveThresholds& limits = *thresholds;
  if (signal.trust_score < limits.min_trust_score) {
    return MakeReject(RejectReason::kBelowTrustThreshold, verdict);
  }
  if (signal.confidence_score < limits.min_confidence_score) {
    return MakeReject(RejectReason::kBelowConfidenceThreshold, verdict);
  }
  if (signal.signal_score < limits.min_signal_score) {
    return MakeReject(RejectReason::kBelowSignalThreshold, verdict);
  }

  // 3) 上游结论。
  if (upstream.decision == UpstreamDecision::kReject ||
      upstream.decision == UpstreamDecision::kUnknown) {
    return MakeReject(RejectReason::kUpstreamRejected, verdict);
  }

  const bool learning = IsLearningProfile(mode);

  // 4) 未测量的上游置信度。
  double confidence = upstream.confidence;
  if (confidence <= 0.0) {
    if (!learning) {
      return MakeReject(RejectReason::kUnknownConfidence, verdict);
    }
    confidence = upstream.decision == UpstreamDecision::kApprove
                     ? config_.inferred_approve_confidence
                     : config_.inferred_revise_confidence;
    verdict.upstream_confidence = confidence;
    verdict.tags.emplace_back(kTagConfidenceInferred);
  }

  // 5) 上游置信度下限。
  if (confidence < config_.min_upstream_confidence) {
    return MakeReject(RejectReason::kBelowUpstreamConfidence, verdict);
  }

  // 6) REVISE 只在学习档位折叠为试探单。
  double size_multiplier = 1.0;
  if (upstream.decision == UpstreamDecision::kRevise) {
    if (!learning) {
      return MakeReject(RejectReason::kReviseNotAllowed, verdict);
    }
    size_multiplier = config_.probe_size_multiplier;
    verdict.tags.emplace_back(kTagReviseProbe);
  }

  // 7) 信号源可靠性下限：冷启动源不受约束。
  if (config_.min_source_score > 0.0 && !source_score.cold_start &&
      source_score.score < config_.min_source_score) {
    return MakeReject(RejectReason::kSourceUnreliable, verdict);
  }

  // 8) 放行。
  verdict.decision = Decision::kApprove;
  verdict.size_multiplier = size_multiplier;
  verdict.reject_reason = RejectReason::kNone;
  if (!signal.strategy_hint.empty()) {
    verdict.strategy = signal.strategy_hint;
  } else if (!ranked_strategies.empty()) {
    verdict.strategy = ranked_strategies.front().name;
  }
  return verdict;
}

}  // namespace adaptive_engine
