#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace adaptive_engine {

/// 运行模式：学习（纸面/小仓位试探）与生产（真实资金）。
enum class OperatingMode {
  kLearning,
  kProduction,
};

/// 上游审议阶段给出的结论；kUnknown 表示缺失或无法识别。
enum class UpstreamDecision {
  kApprove,
  kRevise,
  kReject,
  kUnknown,
};

/// 决策门最终输出。REVISE 只作为上游输入出现，试探单会折叠为 APPROVE。
enum class Decision {
  kApprove,
  kRevise,
  kReject,
};

/// 拒绝原因码：供执行方与反事实追踪区分“哪一道门拦下了信号”。
enum class RejectReason {
  kNone,
  kMalformedSignal,
  kConfigurationError,
  kBelowTrustThreshold,
  kBelowConfidenceThreshold,
  kBelowSignalThreshold,
  kUpstreamRejected,
  kUnknownConfidence,
  kBelowUpstreamConfidence,
  kReviseNotAllowed,
  kSourceUnreliable,
  kInternalError,
};

/// 统计分区：策略（Beta 模型）与信号源（胜率/评级模型）。
enum class StatKind {
  kStrategy,
  kSource,
};

/// 单个策略的 Beta 分布统计。不变量：alpha + beta - 2 == trades。
struct StrategyStat {
  std::string name;
  std::int64_t alpha{1};
  std::int64_t beta{1};
  std::int64_t trades{0};
  std::string last_trade_id;  // 最近一次计入的 trade_id，用于步骤重放去重。
};

/// 单个信号源的胜负计数与派生评级。grade/score 只由计数推导，不可单独写入。
struct SourceStat {
  std::string name;
  std::int64_t wins{0};
  std::int64_t losses{0};
  std::string grade{"C"};
  double score{50.0};
  std::string last_trade_id;  // 同上。
};

/// 命名阈值档位（加载后只读）。
struct ThresholdProfile {
  std::string name;
  double min_trust_score{0.0};
  double min_confidence_score{0.0};
  double min_signal_score{0.0};
};

/// 单次决策实际生效的三项门槛（强类型，避免按字符串路径取值）。
struct EffectiveThresholds {
  double min_trust_score{0.0};
  double min_confidence_score{0.0};
  double min_signal_score{0.0};
};

/// 进程级模式快照：启动后只读，显式传入解析器与决策门。
struct ModeState {
  OperatingMode operating_mode{OperatingMode::kLearning};
  std::string active_profile;
  OperatingMode portfolio_mode{OperatingMode::kLearning};
};

/// 候选信号：由外部采集/校验组件产出。
struct CandidateSignal {
  std::string signal_id;
  std::string source;
  std::string strategy_hint;  // 为空时由 Thompson 排名选择策略。
  double trust_score{0.0};
  double confidence_score{0.0};
  double signal_score{0.0};
  std::string symbol;            // 可选：仅用于反事实追踪。
  double reference_price{0.0};   // 可选：<=0 表示未知。
};

/// 上游审议结论与置信度（0 表示“未测量”）。
struct UpstreamVerdict {
  UpstreamDecision decision{UpstreamDecision::kUnknown};
  double confidence{0.0};
};

/// 决策门输出记录。tags 标识本次放宽了哪些规则，便于事后区分“正常通过”与“覆盖通过”。
struct Verdict {
  Decision decision{Decision::kReject};
  double size_multiplier{0.0};
  RejectReason reject_reason{RejectReason::kNone};
  std::vector<std::string> tags;
  std::string strategy;
  double source_score{0.0};
  double upstream_confidence{0.0};
};

/// 已平仓交易结果：由外部执行/持仓组件每笔产出一次。
struct TradeOutcome {
  std::string trade_id;
  std::string strategy;
  std::string source;
  double pnl_percent{0.0};
  std::int64_t closed_at_ms{0};

  bool is_win() const { return pnl_percent > 0.0; }
};

/// 被拒信号留档，供反事实追踪评估“如果当时放行会怎样”。
struct RejectionRecord {
  std::string signal_id;
  std::string source;
  std::string strategy;
  RejectReason reason{RejectReason::kNone};
  std::string symbol;
  double reference_price{0.0};
  std::int64_t rejected_at_ms{0};
};

/// 单条反事实评估结果。
struct CounterfactualResult {
  std::string signal_id;
  RejectReason reason{RejectReason::kNone};
  double price_change_pct{0.0};
  bool missed_winner{false};
};

/// 出现在 Verdict::tags 中的放宽标记。
inline constexpr const char* kTagReviseProbe = "revise_probe";
inline constexpr const char* kTagConfidenceInferred = "confidence_inferred";

/// OperatingMode 文本化（用于日志与配置）。
inline const char* ToString(OperatingMode mode) {
  switch (mode) {
    case OperatingMode::kLearning:
      return "LEARNING";
    case OperatingMode::kProduction:
      return "PRODUCTION";
  }
  return "UNKNOWN";
}

/// UpstreamDecision 文本化。
inline const char* ToString(UpstreamDecision decision) {
  switch (decision) {
    case UpstreamDecision::kApprove:
      return "APPROVE";
    case UpstreamDecision::kRevise:
      return "REVISE";
    case UpstreamDecision::kReject:
      return "REJECT";
    case UpstreamDecision::kUnknown:
      return "UNKNOWN";
  }
  return "UNKNOWN";
}

/// Decision 文本化。
inline const char* ToString(Decision decision) {
  switch (decision) {
    case Decision::kApprove:
      return "APPROVE";
    case Decision::kRevise:
      return "REVISE";
    case Decision::kReject:
      return "REJECT";
  }
  return "REJECT";
}

/// RejectReason 文本化：即对外输出的原因码。
inline const char* ToString(RejectReason reason) {
  switch (reason) {
    case RejectReason::kNone:
      return "none";
    case RejectReason::kMalformedSignal:
      return "malformed signal";
    case RejectReason::kConfigurationError:
      return "configuration error";
    case RejectReason::kBelowTrustThreshold:
      return "below trust threshold";
    case RejectReason::kBelowConfidenceThreshold:
      return "below confidence threshold";
    case RejectReason::kBelowSignalThreshold:
      return "below signal threshold";
    case RejectReason::kUpstreamRejected:
      return "upstream rejected";
    case RejectReason::kUnknownConfidence:
      return "unknown confidence";
    case RejectReason::kBelowUpstreamConfidence:
      return "below upstream confidence";
    case RejectReason::kReviseNotAllowed:
      return "revise not allowed";
    case RejectReason::kSourceUnreliable:
      return "source unreliable";
    case RejectReason::kInternalError:
      return "internal error";
  }
  return "unknown";
}

/// ToString(RejectReason) 的逆变换：日志按原因码文本落盘，枚举调整顺序不影响历史记录。
inline bool ParseRejectReason(const std::string& text, RejectReason* out_reason) {
  static constexpr RejectReason kAllReasons[] = {
      RejectReason::kNone,
      RejectReason::kMalformedSignal,
      RejectReason::kConfigurationError,
      RejectReason::kBelowTrustThreshold,
      RejectReason::kBelowConfidenceThreshold,
      RejectReason::kBelowSignalThreshold,
      RejectReason::kUpstreamRejected,
      RejectReason::kUnknownConfidence,
      RejectReason::kBelowUpstreamConfidence,
      RejectReason::kReviseNotAllowed,
      RejectReason::kSourceUnreliable,
      RejectReason::kInternalError,
  };
  for (const RejectReason reason : kAllReasons) {
    if (text == ToString(reason)) {
      if (out_reason != nullptr) {
        *out_reason = reason;
      }
      return true;
    }
  }
  return false;
}

/// StatKind 文本化（同时作为存储分区目录名）。
inline const char* ToString(StatKind kind) {
  switch (kind) {
    case StatKind::kStrategy:
      return "strategies";
    case StatKind::kSource:
      return "sources";
  }
  return "unknown";
}

}  // namespace adaptive_engine
