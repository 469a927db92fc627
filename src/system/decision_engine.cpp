#include "system/decision_engine.h"

#include <filesystem>
#include <memory>
#include <utility>

#include "core/log.h"
#include "storage/record_codec.h"

namespace adaptive_engine {

namespace {

std::string JoinTags(const std::vector<std::string>& tags) {
  if (tags.empty()) {
    return "-";
  }
  std::string out;
  for (const auto& tag : tags) {
    if (!out.empty()) {
      out += ',';
    }
    out += tag;
  }
  return out;
}

}  // namespace

std::string DecisionEngine::JournalPath(const StoreConfig& store) {
  return (std::filesystem::path(store.root) / "outcomes.journal").string();
}

std::string DecisionEngine::PatternDir(const StoreConfig& store) {
  return (std::filesystem::path(store.root) / "patterns").string();
}

std::string DecisionEngine::RejectionLogPath(const StoreConfig& store) {
  return (std::filesystem::path(store.root) / "rejections.log").string();
}

std::string DecisionEngine::CounterfactualLogPath(const StoreConfig& store) {
  return (std::filesystem::path(store.root) / "counterfactual.log").string();
}

DecisionEngine::DecisionEngine(PrivateTag,
                               EngineConfig config,
                               ThresholdPolicyResolver resolver)
    : config_(std::move(config)),
      resolver_(std::move(resolver)),
      store_(config_.store, config_.bandit.ucb_exploration),
      bandit_(store_, config_.bandit),
      gate_(config_.gate),
      journal_(JournalPath(config_.store)),
      patterns_(PatternDir(config_.store)),
      rejections_(RejectionLogPath(config_.store)),
      updater_(store_, journal_, patterns_, config_.store.lock_timeout_ms) {}

std::unique_ptr<DecisionEngine> DecisionEngine::Create(const EngineConfig& config,
                                                       std::string* out_error) {
  if (!ValidateEngineConfig(config, out_error)) {
    return nullptr;
  }
  auto resolver = ThresholdPolicyResolver::Create(config.mode, config.profiles, out_error);
  if (!resolver.has_value()) {
    return nullptr;
  }
  // 启动时先解析一次，生产模式的安全下限问题在处理任何信号前暴露。
  EffectiveThresholds probe;
  if (!resolver->Resolve(&probe, out_error)) {
    return nullptr;
  }

  auto engine = std::make_unique<DecisionEngine>(PrivateTag{}, config, std::move(*resolver));
  if (!engine->store_.Initialize(out_error) ||
      !engine->journal_.Initialize(out_error) ||
      !engine->patterns_.Initialize(out_error) ||
      !engine->rejections_.Initialize(out_error)) {
    return nullptr;
  }
  LogInfo(std::string("决策引擎启动: operating_mode=") +
          ToString(config.mode.operating_mode) +
          ", portfolio_mode=" + ToString(config.mode.portfolio_mode) +
          ", profile=" + config.mode.active_profile + ", store=" + config.store.root);
  return engine;
}

void DecisionEngine::MarkFatal(const std::string& error) {
  if (!fatal_) {
    LogError("决策引擎进入致命状态: " + error);
  }
  fatal_ = true;
  fatal_error_ = error;
}

EngineDecision DecisionEngine::Evaluate(const CandidateSignal& signal,
                                        const UpstreamVerdict& upstream,
                                        std::int64_t now_ms) {
  EngineDecision decision;
  if (fatal_) {
    decision.verdict.reject_reason = RejectReason::kConfigurationError;
    return decision;
  }

  // 每个决策上下文重新解析一次，不缓存。
  EffectiveThresholds thresholds;
  std::string error;
  if (resolver_.Resolve(resolver_.mode(), &thresholds, &error)) {
    decision.thresholds = thresholds;
  } else {
    MarkFatal(error);
  }

  bool malformed_key = false;
  if (decision.thresholds.has_value() && !signal.source.empty()) {
    std::string key_error;
    if (!IsValidStatKey(signal.source, &key_error) ||
        (!signal.strategy_hint.empty() &&
         !IsValidStatKey(signal.strategy_hint, &key_error))) {
      malformed_key = true;
      decision.verdict.reject_reason = RejectReason::kMalformedSignal;
      LogWarn("信号 source/strategy_hint 非法: signal_id=" + signal.signal_id +
              ", error=" + key_error);
    } else {
      // 首次出现的信号源/策略在此建档，新策略随即参与 Thompson 排名。
      SourceStat source_stat;
      StrategyStat strategy_stat;
      std::string score_error;
      if (!store_.GetSource(signal.source, &source_stat, &score_error) ||
          (!signal.strategy_hint.empty() &&
           !store_.GetStrategy(signal.strategy_hint, &strategy_stat, &score_error)) ||
          !bandit_.ScoreSource(signal.source, &decision.source_score, &score_error) ||
          !bandit_.RankStrategies(&decision.ranked_strategies, &score_error)) {
        decision.storage_error = true;
        decision.verdict.reject_reason = RejectReason::kInternalError;
        LogError("读取可靠性统计失败，信号按拒绝处理: signal_id=" + signal.signal_id +
                 ", error=" + score_error);
      }
    }
  }

  if (!decision.storage_error && !malformed_key) {
    decision.verdict = gate_.Evaluate(signal, decision.thresholds, decision.source_score,
                                      decision.ranked_strategies, resolver_.mode(),
                                      upstream);
  }

  const Verdict& verdict = decision.verdict;
  LogInfo(std::string("信号决策: signal_id=") + signal.signal_id +
          ", decision=" + ToString(verdict.decision) +
          ", size=" + std::to_string(verdict.size_multiplier) +
          ", reason=" + ToString(verdict.reject_reason) +
          ", tags=" + JoinTags(verdict.tags) +
          ", strategy=" + (verdict.strategy.empty() ? "-" : verdict.strategy));

  std::string key_error;
  if (verdict.decision == Decision::kReject && malformed_key) {
    LogWarn("信号 source/strategy_hint 非法，拒单不留档: signal_id=" + signal.signal_id);
  } else if (verdict.decision == Decision::kReject &&
             !IsValidStatKey(signal.signal_id, &key_error)) {
    LogWarn("信号缺少合法 signal_id，拒单不留档: " + key_error);
  } else if (verdict.decision == Decision::kReject) {
    RejectionRecord record;
    record.signal_id = signal.signal_id;
    record.source = signal.source;
    record.strategy = signal.strategy_hint;
    record.reason = verdict.reject_reason;
    record.symbol = signal.symbol;
    record.reference_price = signal.reference_price;
    record.rejected_at_ms = now_ms;
    std::string append_error;
    if (!rejections_.Append(record, &append_error)) {
      decision.storage_error = true;
      LogWarn("拒单日志写入失败: signal_id=" + signal.signal_id +
              ", error=" + append_error);
    }
  }
  return decision;
}

}  // namespace adaptive_engine
