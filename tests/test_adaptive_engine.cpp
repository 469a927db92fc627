#include <atomic>
#include <cmath>
#include <csignal>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <limits>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <tuple>
#include <unordered_map>
#include <utility>
#include <vector>

#include <sys/resource.h>
#include <unistd.h>

#include "app/batch_inputs.h"
#include "bandit/bandit_selector.h"
#include "bandit/reliability_math.h"
#include "core/config.h"
#include "core/json_utils.h"
#include "counterfactual/counterfactual_tracker.h"
#include "counterfactual/price_provider.h"
#include "gate/decision_gate.h"
#include "learning/outcome_updater.h"
#include "policy/threshold_policy.h"
#include "storage/outcome_journal.h"
#include "storage/pattern_log.h"
#include "storage/record_codec.h"
#include "storage/rejection_log.h"
#include "storage/reliability_store.h"
#include "system/decision_engine.h"

namespace {

// 该测试文件覆盖决策与学习闭环关键链路：
// - 阈值解析、模式一致性与生产覆盖；
// - 可靠性存储的原子读改写、摘要校验与并发；
// - Bandit 排名/打分、决策门状态机；
// - 交易结果恰好一次学习、流水恢复与反事实追踪。
bool NearlyEqual(double lhs, double rhs, double eps = 1e-6) {
  return std::fabs(lhs - rhs) < eps;
}

bool HasTag(const adaptive_engine::Verdict& verdict, const std::string& tag) {
  for (const auto& item : verdict.tags) {
    if (item == tag) {
      return true;
    }
  }
  return false;
}

std::filesystem::path FreshTempDir(const std::string& name) {
  const std::filesystem::path dir =
      std::filesystem::temp_directory_path() /
      ("adaptive_engine_test_" + name + "_" + std::to_string(::getpid()));
  std::error_code ec;
  std::filesystem::remove_all(dir, ec);
  std::filesystem::create_directories(dir, ec);
  return dir;
}

std::string ReadAll(const std::filesystem::path& path) {
  std::ifstream in(path);
  return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

adaptive_engine::StoreConfig MakeStoreConfig(const std::filesystem::path& root) {
  adaptive_engine::StoreConfig config;
  config.root = root.string();
  config.lock_timeout_ms = 10000;
  config.max_attempts = 5;
  config.retry_backoff_ms = 5;
  return config;
}

adaptive_engine::EngineConfig MakeEngineConfig(
    const std::filesystem::path& root,
    adaptive_engine::OperatingMode operating_mode,
    adaptive_engine::OperatingMode portfolio_mode,
    const std::string& profile) {
  adaptive_engine::EngineConfig config;
  config.mode = adaptive_engine::ModeState{
      .operating_mode = operating_mode,
      .active_profile = profile,
      .portfolio_mode = portfolio_mode,
  };
  config.profiles["strict"] = adaptive_engine::ThresholdProfile{"strict", 70.0, 60.0, 70.0};
  config.profiles["learning"] =
      adaptive_engine::ThresholdProfile{"learning", 30.0, 40.0, 30.0};
  config.store = MakeStoreConfig(root);
  config.bandit.rng_seed = 42;
  return config;
}

const adaptive_engine::ModeState kLearningMode{
    .operating_mode = adaptive_engine::OperatingMode::kLearning,
    .active_profile = "learning",
    .portfolio_mode = adaptive_engine::OperatingMode::kLearning,
};
const adaptive_engine::ModeState kStrictLearningMode{
    .operating_mode = adaptive_engine::OperatingMode::kLearning,
    .active_profile = "strict",
    .portfolio_mode = adaptive_engine::OperatingMode::kLearning,
};
const adaptive_engine::ModeState kProductionMode{
    .operating_mode = adaptive_engine::OperatingMode::kProduction,
    .active_profile = "learning",
    .portfolio_mode = adaptive_engine::OperatingMode::kProduction,
};

adaptive_engine::CandidateSignal MakeSignal(double trust,
                                            double confidence,
                                            double signal_score) {
  adaptive_engine::CandidateSignal signal;
  signal.signal_id = "sig-1";
  signal.source = "src-a";
  signal.trust_score = trust;
  signal.confidence_score = confidence;
  signal.signal_score = signal_score;
  return signal;
}

adaptive_engine::SourceScore ColdSource() {
  adaptive_engine::SourceScore score;
  score.name = "src-a";
  score.score = 100.0;
  score.cold_start = true;
  return score;
}

class MockHttpTransport final : public adaptive_engine::HttpTransport {
 public:
  struct Route {
    std::string url_contains;
    adaptive_engine::HttpResponse response;
  };

  void AddRoute(const std::string& url_contains,
                adaptive_engine::HttpResponse response) {
    routes_.push_back(Route{url_contains, std::move(response)});
  }

  adaptive_engine::HttpResponse Get(const std::string& url,
                                    int timeout_ms) const override {
    (void)timeout_ms;
    ++calls_;
    last_url_ = url;
    for (const auto& route : routes_) {
      if (url.find(route.url_contains) != std::string::npos) {
        return route.response;
      }
    }
    adaptive_engine::HttpResponse out;
    out.error = "no mock route: " + url;
    return out;
  }

  int calls() const { return calls_; }
  const std::string& last_url() const { return last_url_; }

 private:
  std::vector<Route> routes_;
  mutable int calls_{0};
  mutable std::string last_url_;
};

}  // namespace

int main() {
  {
    // 评级只由胜负计数决定；样本不足时固定为 C。
    const std::vector<std::tuple<std::int64_t, std::int64_t, std::string>> cases = {
        {4, 0, "C"},  {0, 4, "C"}, {10, 0, "S"}, {9, 1, "A+"}, {8, 2, "A+"},
        {7, 3, "A"},  {6, 4, "B"}, {5, 5, "C"},  {4, 6, "D"},  {3, 7, "F"},
        {19, 1, "S"},
    };
    for (const auto& [wins, losses, expected] : cases) {
      const std::string grade = adaptive_engine::GradeForRecord(wins, losses);
      if (grade != expected) {
        std::cerr << "评级不符合预期: wins=" << wins << ", losses=" << losses
                  << ", grade=" << grade << ", expected=" << expected << "\n";
        return 1;
      }
    }
  }

  {
    const double score = adaptive_engine::Ucb1Score(50, 100, 100, 2.0);
    const double expected = 100.0 * (0.5 + std::sqrt(2.0 * std::log(100.0) / 100.0));
    if (!NearlyEqual(score, expected, 1e-9)) {
      std::cerr << "UCB1 分数计算错误: " << score << "\n";
      return 1;
    }
    if (!NearlyEqual(adaptive_engine::Ucb1Score(10, 10, 10, 2.0), 100.0)) {
      std::cerr << "UCB1 分数应截断到 100\n";
      return 1;
    }
    if (!NearlyEqual(adaptive_engine::StoredSourceScore(3, 1, 50, 2.0),
                     adaptive_engine::kColdStartSourceScore)) {
      std::cerr << "冷启动信号源存储分数应为中性值\n";
      return 1;
    }
    if (!NearlyEqual(adaptive_engine::BetaMean(3.0, 1.0), 0.75)) {
      std::cerr << "Beta 均值计算错误\n";
      return 1;
    }
  }

  {
    std::string error;
    const auto incoherent = adaptive_engine::MakeModeState(
        adaptive_engine::OperatingMode::kLearning, "learning",
        adaptive_engine::OperatingMode::kProduction, &error);
    if (incoherent.has_value() || error.find("模式不一致") == std::string::npos) {
      std::cerr << "portfolio=PRODUCTION 且 operating=LEARNING 应快速失败\n";
      return 1;
    }

    const adaptive_engine::ModeState bad_mode{
        .operating_mode = adaptive_engine::OperatingMode::kLearning,
        .active_profile = "learning",
        .portfolio_mode = adaptive_engine::OperatingMode::kProduction,
    };
    std::map<std::string, adaptive_engine::ThresholdProfile> profiles;
    profiles["learning"] = adaptive_engine::ThresholdProfile{"learning", 30.0, 40.0, 30.0};
    if (adaptive_engine::ThresholdPolicyResolver::Create(bad_mode, profiles, &error)
            .has_value()) {
      std::cerr << "模式不一致时不应产出可用的解析器\n";
      return 1;
    }

    const auto resolver =
        adaptive_engine::ThresholdPolicyResolver::Create(kLearningMode, profiles, &error);
    if (!resolver.has_value()) {
      std::cerr << "学习模式解析器创建失败: " << error << "\n";
      return 1;
    }
    adaptive_engine::EffectiveThresholds thresholds;
    if (!resolver->Resolve(&thresholds, &error) ||
        !NearlyEqual(thresholds.min_trust_score, 30.0) ||
        !NearlyEqual(thresholds.min_confidence_score, 40.0) ||
        !NearlyEqual(thresholds.min_signal_score, 30.0)) {
      std::cerr << "学习档位阈值解析不符合预期\n";
      return 1;
    }
    // 每次解析都重新校验模式一致性。
    if (resolver->Resolve(bad_mode, &thresholds, &error)) {
      std::cerr << "解析时应重新校验模式一致性\n";
      return 1;
    }
    const adaptive_engine::ModeState missing_profile{
        .operating_mode = adaptive_engine::OperatingMode::kLearning,
        .active_profile = "ghost",
        .portfolio_mode = adaptive_engine::OperatingMode::kLearning,
    };
    if (resolver->Resolve(missing_profile, &thresholds, &error) ||
        error.find("ghost") == std::string::npos) {
      std::cerr << "缺失档位应为配置错误\n";
      return 1;
    }
  }

  {
    // 生产模式：即便档位三项均为 0，也会被无条件覆盖为严格三元组。
    std::map<std::string, adaptive_engine::ThresholdProfile> profiles;
    profiles["zero"] = adaptive_engine::ThresholdProfile{"zero", 0.0, 0.0, 0.0};
    const adaptive_engine::ModeState production_zero{
        .operating_mode = adaptive_engine::OperatingMode::kProduction,
        .active_profile = "zero",
        .portfolio_mode = adaptive_engine::OperatingMode::kProduction,
    };
    std::string error;
    const auto resolver =
        adaptive_engine::ThresholdPolicyResolver::Create(production_zero, profiles, &error);
    adaptive_engine::EffectiveThresholds thresholds;
    if (!resolver.has_value() || !resolver->Resolve(&thresholds, &error)) {
      std::cerr << "生产模式解析失败: " << error << "\n";
      return 1;
    }
    if (!NearlyEqual(thresholds.min_trust_score, 70.0) ||
        !NearlyEqual(thresholds.min_confidence_score, 60.0) ||
        !NearlyEqual(thresholds.min_signal_score, 70.0)) {
      std::cerr << "生产模式未覆盖为严格阈值\n";
      return 1;
    }

    if (adaptive_engine::ValidateSafetyFloor(
            adaptive_engine::EffectiveThresholds{69.0, 60.0, 70.0}, &error)) {
      std::cerr << "低于安全下限的阈值应被拒绝\n";
      return 1;
    }
    const double nan = std::numeric_limits<double>::quiet_NaN();
    if (adaptive_engine::ValidateSafetyFloor(
            adaptive_engine::EffectiveThresholds{nan, 60.0, 70.0}, &error)) {
      std::cerr << "NaN 阈值应被安全下限拒绝\n";
      return 1;
    }
  }

  {
    // 端到端场景：学习档位 (30,40,30) 放行，生产模式按 trust 拒绝。
    const adaptive_engine::DecisionGate gate(adaptive_engine::GateConfig{});
    const auto signal = MakeSignal(50.0, 55.0, 45.0);
    const adaptive_engine::UpstreamVerdict upstream{
        adaptive_engine::UpstreamDecision::kApprove, 70.0};

    const auto learning = gate.Evaluate(
        signal, adaptive_engine::EffectiveThresholds{30.0, 40.0, 30.0}, ColdSource(),
        {}, kLearningMode, upstream);
    if (learning.decision != adaptive_engine::Decision::kApprove ||
        !NearlyEqual(learning.size_multiplier, 1.0) || !learning.tags.empty()) {
      std::cerr << "学习档位下信号应以 1.0 仓位放行\n";
      return 1;
    }

    const auto production = gate.Evaluate(
        signal, adaptive_engine::kProductionStrictThresholds, ColdSource(), {},
        kProductionMode, upstream);
    if (production.decision != adaptive_engine::Decision::kReject ||
        production.reject_reason != adaptive_engine::RejectReason::kBelowTrustThreshold ||
        std::string(adaptive_engine::ToString(production.reject_reason)) !=
            "below trust threshold") {
      std::cerr << "生产模式下应以 below trust threshold 拒绝\n";
      return 1;
    }

    const auto low_confidence = gate.Evaluate(
        MakeSignal(50.0, 35.0, 45.0), adaptive_engine::EffectiveThresholds{30.0, 40.0, 30.0},
        ColdSource(), {}, kLearningMode, upstream);
    if (low_confidence.reject_reason !=
        adaptive_engine::RejectReason::kBelowConfidenceThreshold) {
      std::cerr << "confidence 不达标应按固定顺序拒绝\n";
      return 1;
    }
    const auto low_signal = gate.Evaluate(
        MakeSignal(50.0, 55.0, 20.0), adaptive_engine::EffectiveThresholds{30.0, 40.0, 30.0},
        ColdSource(), {}, kLearningMode, upstream);
    if (low_signal.reject_reason != adaptive_engine::RejectReason::kBelowSignalThreshold) {
      std::cerr << "signal_score 不达标应被拒绝\n";
      return 1;
    }
  }

  {
    // REVISE：学习档位折叠为 0.3 仓位试探，严格档位与生产模式拒绝。
    const adaptive_engine::DecisionGate gate(adaptive_engine::GateConfig{});
    const adaptive_engine::UpstreamVerdict revise{
        adaptive_engine::UpstreamDecision::kRevise, 70.0};

    const auto probe = gate.Evaluate(
        MakeSignal(80.0, 80.0, 80.0), adaptive_engine::EffectiveThresholds{30.0, 40.0, 30.0},
        ColdSource(), {}, kLearningMode, revise);
    if (probe.decision != adaptive_engine::Decision::kApprove ||
        !NearlyEqual(probe.size_multiplier, 0.3) ||
        !HasTag(probe, adaptive_engine::kTagReviseProbe)) {
      std::cerr << "学习档位 REVISE 应折叠为带 revise_probe 标记的 0.3 仓位 APPROVE\n";
      return 1;
    }

    const auto strict = gate.Evaluate(
        MakeSignal(80.0, 80.0, 80.0), adaptive_engine::EffectiveThresholds{70.0, 60.0, 70.0},
        ColdSource(), {}, kStrictLearningMode, revise);
    if (strict.decision != adaptive_engine::Decision::kReject ||
        strict.reject_reason != adaptive_engine::RejectReason::kReviseNotAllowed) {
      std::cerr << "严格档位 REVISE 应被拒绝\n";
      return 1;
    }

    const auto production = gate.Evaluate(
        MakeSignal(80.0, 80.0, 80.0), adaptive_engine::kProductionStrictThresholds,
        ColdSource(), {}, kProductionMode, revise);
    if (production.decision != adaptive_engine::Decision::kReject ||
        production.reject_reason != adaptive_engine::RejectReason::kReviseNotAllowed) {
      std::cerr << "生产模式 REVISE 应被拒绝\n";
      return 1;
    }
  }

  {
    // 上游结论与置信度路径。
    const adaptive_engine::DecisionGate gate(adaptive_engine::GateConfig{});
    const auto signal = MakeSignal(80.0, 80.0, 80.0);
    const adaptive_engine::EffectiveThresholds learning_limits{30.0, 40.0, 30.0};

    const auto inferred = gate.Evaluate(
        signal, learning_limits, ColdSource(), {}, kLearningMode,
        adaptive_engine::UpstreamVerdict{adaptive_engine::UpstreamDecision::kApprove, 0.0});
    if (inferred.decision != adaptive_engine::Decision::kApprove ||
        !HasTag(inferred, adaptive_engine::kTagConfidenceInferred) ||
        !NearlyEqual(inferred.upstream_confidence, 60.0)) {
      std::cerr << "学习档位应推断缺失的上游置信度并打标\n";
      return 1;
    }

    const auto inferred_revise = gate.Evaluate(
        signal, learning_limits, ColdSource(), {}, kLearningMode,
        adaptive_engine::UpstreamVerdict{adaptive_engine::UpstreamDecision::kRevise, 0.0});
    if (inferred_revise.decision != adaptive_engine::Decision::kApprove ||
        !NearlyEqual(inferred_revise.upstream_confidence, 40.0) ||
        !HasTag(inferred_revise, adaptive_engine::kTagConfidenceInferred) ||
        !HasTag(inferred_revise, adaptive_engine::kTagReviseProbe)) {
      std::cerr << "REVISE 缺失置信度应推断为 40 并作为试探单放行\n";
      return 1;
    }

    const auto unknown_production = gate.Evaluate(
        signal, adaptive_engine::kProductionStrictThresholds, ColdSource(), {},
        kProductionMode,
        adaptive_engine::UpstreamVerdict{adaptive_engine::UpstreamDecision::kApprove, 0.0});
    if (unknown_production.reject_reason !=
        adaptive_engine::RejectReason::kUnknownConfidence) {
      std::cerr << "生产模式下缺失置信度应拒绝\n";
      return 1;
    }

    const auto rejected = gate.Evaluate(
        signal, learning_limits, ColdSource(), {}, kLearningMode,
        adaptive_engine::UpstreamVerdict{adaptive_engine::UpstreamDecision::kReject, 90.0});
    const auto unknown = gate.Evaluate(
        signal, learning_limits, ColdSource(), {}, kLearningMode,
        adaptive_engine::UpstreamVerdict{adaptive_engine::UpstreamDecision::kUnknown, 90.0});
    if (rejected.reject_reason != adaptive_engine::RejectReason::kUpstreamRejected ||
        unknown.reject_reason != adaptive_engine::RejectReason::kUpstreamRejected) {
      std::cerr << "上游 REJECT/UNKNOWN 应一律拒绝\n";
      return 1;
    }

    adaptive_engine::GateConfig floor_config;
    floor_config.min_upstream_confidence = 30.0;
    const adaptive_engine::DecisionGate floor_gate(floor_config);
    const auto weak = floor_gate.Evaluate(
        signal, learning_limits, ColdSource(), {}, kLearningMode,
        adaptive_engine::UpstreamVerdict{adaptive_engine::UpstreamDecision::kApprove, 20.0});
    if (weak.reject_reason != adaptive_engine::RejectReason::kBelowUpstreamConfidence) {
      std::cerr << "上游置信度低于下限应拒绝\n";
      return 1;
    }
  }

  {
    // 数据质量、配置错误、信号源下限与策略选择。
    adaptive_engine::GateConfig config;
    config.min_source_score = 50.0;
    const adaptive_engine::DecisionGate gate(config);
    const adaptive_engine::EffectiveThresholds limits{30.0, 40.0, 30.0};
    const adaptive_engine::UpstreamVerdict approve{
        adaptive_engine::UpstreamDecision::kApprove, 70.0};

    const auto no_thresholds = gate.Evaluate(MakeSignal(80.0, 80.0, 80.0), std::nullopt,
                                             ColdSource(), {}, kLearningMode, approve);
    if (no_thresholds.reject_reason !=
        adaptive_engine::RejectReason::kConfigurationError) {
      std::cerr << "阈值不可用时应按配置错误拒绝\n";
      return 1;
    }

    const double nan = std::numeric_limits<double>::quiet_NaN();
    const auto malformed = gate.Evaluate(MakeSignal(nan, 80.0, 80.0), limits, ColdSource(),
                                         {}, kLearningMode, approve);
    auto no_source = MakeSignal(80.0, 80.0, 80.0);
    no_source.source.clear();
    const auto missing_source =
        gate.Evaluate(no_source, limits, ColdSource(), {}, kLearningMode, approve);
    const auto out_of_range = gate.Evaluate(MakeSignal(80.0, 180.0, 80.0), limits,
                                            ColdSource(), {}, kLearningMode, approve);
    if (malformed.reject_reason != adaptive_engine::RejectReason::kMalformedSignal ||
        missing_source.reject_reason != adaptive_engine::RejectReason::kMalformedSignal ||
        out_of_range.reject_reason != adaptive_engine::RejectReason::kMalformedSignal) {
      std::cerr << "非法信号应按 malformed signal 拒绝\n";
      return 1;
    }

    adaptive_engine::SourceScore graded;
    graded.name = "src-a";
    graded.score = 40.0;
    graded.observations = 20;
    graded.cold_start = false;
    const auto unreliable = gate.Evaluate(MakeSignal(80.0, 80.0, 80.0), limits, graded, {},
                                          kLearningMode, approve);
    if (unreliable.reject_reason != adaptive_engine::RejectReason::kSourceUnreliable) {
      std::cerr << "已评级信号源低于分数下限应拒绝\n";
      return 1;
    }
    adaptive_engine::SourceScore cold = graded;
    cold.cold_start = true;
    const std::vector<adaptive_engine::RankedStrategy> ranked = {{"trend", 0.9},
                                                                 {"revert", 0.1}};
    const auto cold_ok = gate.Evaluate(MakeSignal(80.0, 80.0, 80.0), limits, cold, ranked,
                                       kLearningMode, approve);
    if (cold_ok.decision != adaptive_engine::Decision::kApprove ||
        cold_ok.strategy != "trend") {
      std::cerr << "冷启动信号源不受分数下限约束，且应选用排名首位策略\n";
      return 1;
    }
    auto hinted = MakeSignal(80.0, 80.0, 80.0);
    hinted.strategy_hint = "breakout";
    const auto hinted_verdict =
        gate.Evaluate(hinted, limits, cold, ranked, kLearningMode, approve);
    if (hinted_verdict.strategy != "breakout") {
      std::cerr << "有策略提示时应使用提示策略\n";
      return 1;
    }
  }

  {
    // 存储：默认创建、读改写、Beta 不变量与 key 编码。
    const auto root = FreshTempDir("store_basic");
    const adaptive_engine::ReliabilityStore store(MakeStoreConfig(root), 2.0);
    std::string error;
    if (!store.Initialize(&error)) {
      std::cerr << "存储初始化失败: " << error << "\n";
      return 1;
    }

    adaptive_engine::StrategyStat fresh;
    if (!store.GetStrategy("trend/v2", &fresh, &error) || fresh.alpha != 1 ||
        fresh.beta != 1 || fresh.trades != 0) {
      std::cerr << "首次引用策略应创建 Beta(1,1): " << error << "\n";
      return 1;
    }
    if (!std::filesystem::exists(root / "strategies" / "trend%2Fv2.rec")) {
      std::cerr << "策略默认记录应被持久化且文件名已编码\n";
      return 1;
    }

    const bool outcomes[] = {true, false, true, true, false, true, false};
    for (const bool win : outcomes) {
      if (!store.ApplyOutcome(adaptive_engine::StatKind::kStrategy, "trend/v2", win, "",
                              &error)) {
        std::cerr << "策略结果写入失败: " << error << "\n";
        return 1;
      }
    }
    adaptive_engine::StrategyStat after;
    if (!store.GetStrategy("trend/v2", &after, &error) || after.alpha != 5 ||
        after.beta != 4 || after.trades != 7 ||
        after.alpha + after.beta - 2 != after.trades) {
      std::cerr << "策略 Beta 计数或不变量不符合预期\n";
      return 1;
    }

    adaptive_engine::SourceStat source;
    if (!store.GetSource("src-x", &source, &error) || source.grade != "C" ||
        !NearlyEqual(source.score, adaptive_engine::kColdStartSourceScore)) {
      std::cerr << "首次引用信号源应为冷启动默认值\n";
      return 1;
    }
    for (int i = 0; i < 5; ++i) {
      if (!store.ApplySourceOutcome("src-x", true, "", &source, &error)) {
        std::cerr << "信号源结果写入失败: " << error << "\n";
        return 1;
      }
    }
    if (source.wins != 5 || source.losses != 0 || source.grade != "S" ||
        !NearlyEqual(source.score, 100.0)) {
      std::cerr << "信号源评级/分数不符合预期: grade=" << source.grade
                << ", score=" << source.score << "\n";
      return 1;
    }

    if (store.GetStrategy("bad\tkey", &fresh, &error)) {
      std::cerr << "含控制字符的 key 应被拒绝\n";
      return 1;
    }

    std::vector<adaptive_engine::StrategyStat> listed;
    if (!store.GetStrategy("alpha", &fresh, &error) ||
        !store.ListStrategies(&listed, &error) || listed.size() != 2 ||
        listed[0].name != "alpha" || listed[1].name != "trend/v2") {
      std::cerr << "策略枚举结果不符合预期\n";
      return 1;
    }
    std::filesystem::remove_all(root);
  }

  {
    // 记录损坏：摘要不符时报告错误，且不会被重置。
    const auto root = FreshTempDir("store_corrupt");
    const adaptive_engine::ReliabilityStore store(MakeStoreConfig(root), 2.0);
    std::string error;
    adaptive_engine::StrategyStat stat;
    if (!store.Initialize(&error) ||
        !store.ApplyStrategyOutcome("fragile", true, "", &stat, &error)) {
      std::cerr << "损坏测试准备失败: " << error << "\n";
      return 1;
    }
    const auto path = root / "strategies" / "fragile.rec";
    std::string content;
    {
      std::ifstream in(path);
      std::getline(in, content);
    }
    // 篡改 alpha 字段：STRAT1\tfragile\t2\t... -> 9
    const auto pos = content.find("\t2\t");
    if (pos == std::string::npos) {
      std::cerr << "策略记录格式不符合预期: " << content << "\n";
      return 1;
    }
    std::string tampered = content;
    tampered[pos + 1] = '9';
    {
      std::ofstream out(path, std::ios::trunc);
      out << tampered << "\n";
    }

    if (store.GetStrategy("fragile", &stat, &error) ||
        error.find("摘要") == std::string::npos) {
      std::cerr << "摘要不符的记录应报告损坏\n";
      return 1;
    }
    if (store.ApplyStrategyOutcome("fragile", true, "", &stat, &error)) {
      std::cerr << "损坏记录上不应继续写入\n";
      return 1;
    }
    std::string after;
    {
      std::ifstream in(path);
      std::getline(in, after);
    }
    if (after != tampered) {
      std::cerr << "损坏记录不应被静默重置\n";
      return 1;
    }
    std::filesystem::remove_all(root);
  }

  {
    // 并发：多线程对同一 key 做读改写，不丢更新。
    const auto root = FreshTempDir("store_concurrency");
    const adaptive_engine::ReliabilityStore store(MakeStoreConfig(root), 2.0);
    std::string error;
    if (!store.Initialize(&error)) {
      std::cerr << "并发测试初始化失败: " << error << "\n";
      return 1;
    }

    constexpr int kThreads = 4;
    constexpr int kUpdatesPerThread = 25;
    std::atomic<int> failures{0};
    std::atomic<int> wins{0};
    std::vector<std::thread> workers;
    for (int t = 0; t < kThreads; ++t) {
      workers.emplace_back([&store, &failures, &wins, t]() {
        for (int i = 0; i < kUpdatesPerThread; ++i) {
          const bool win = (t + i) % 3 == 0;
          std::string thread_error;
          if (!store.ApplyStrategyOutcome("hot", win, "", nullptr, &thread_error) ||
              !store.ApplySourceOutcome("hot-src", win, "", nullptr, &thread_error)) {
            failures.fetch_add(1);
            continue;
          }
          if (win) {
            wins.fetch_add(1);
          }
        }
      });
    }
    for (auto& worker : workers) {
      worker.join();
    }
    if (failures.load() != 0) {
      std::cerr << "并发更新出现失败: " << failures.load() << "\n";
      return 1;
    }

    constexpr int kTotal = kThreads * kUpdatesPerThread;
    adaptive_engine::StrategyStat stat;
    adaptive_engine::SourceStat source;
    if (!store.GetStrategy("hot", &stat, &error) ||
        !store.GetSource("hot-src", &source, &error)) {
      std::cerr << "并发测试读取失败: " << error << "\n";
      return 1;
    }
    if (stat.alpha != 1 + wins.load() || stat.beta != 1 + (kTotal - wins.load()) ||
        stat.trades != kTotal) {
      std::cerr << "并发更新丢失: alpha=" << stat.alpha << ", beta=" << stat.beta
                << ", trades=" << stat.trades << "\n";
      return 1;
    }
    if (source.wins != wins.load() || source.losses != kTotal - wins.load()) {
      std::cerr << "信号源并发更新丢失\n";
      return 1;
    }
    std::filesystem::remove_all(root);
  }

  {
    // Thompson：A(100,1) 压倒性领先 B(1,100)；同分布时每次重新抽样。
    const auto root = FreshTempDir("bandit");
    const adaptive_engine::ReliabilityStore store(MakeStoreConfig(root), 2.0);
    std::string error;
    if (!store.Initialize(&error)) {
      std::cerr << "Bandit 测试初始化失败: " << error << "\n";
      return 1;
    }
    adaptive_engine::BanditConfig config;
    config.rng_seed = 7;
    adaptive_engine::BanditSelector bandit(store, config);

    const std::vector<adaptive_engine::StrategyStat> lopsided = {
        {"A", 100, 1, 99},
        {"B", 1, 100, 99},
    };
    int a_first = 0;
    for (int i = 0; i < 1000; ++i) {
      const auto ranked = bandit.RankStats(lopsided);
      if (ranked.size() == 2 && ranked.front().name == "A") {
        ++a_first;
      }
    }
    if (a_first < 990) {
      std::cerr << "Thompson 排名应几乎总是选 A: " << a_first << "/1000\n";
      return 1;
    }

    const std::vector<adaptive_engine::StrategyStat> even = {
        {"X", 1, 1, 0},
        {"Y", 1, 1, 0},
    };
    int x_first = 0;
    for (int i = 0; i < 1000; ++i) {
      if (bandit.RankStats(even).front().name == "X") {
        ++x_first;
      }
    }
    if (x_first < 300 || x_first > 700) {
      std::cerr << "同分布策略排名应随每次抽样变化: " << x_first << "/1000\n";
      return 1;
    }

    adaptive_engine::SourceScore score;
    if (!bandit.ScoreSource("never-seen", &score, &error) ||
        !NearlyEqual(score.score, 100.0) || !score.cold_start) {
      std::cerr << "零样本信号源应获得乐观默认分\n";
      return 1;
    }

    for (int i = 0; i < 6; ++i) {
      if (!store.ApplySourceOutcome("seen", i % 2 == 0, "", nullptr, &error)) {
        std::cerr << "信号源写入失败: " << error << "\n";
        return 1;
      }
    }
    if (!store.ApplySourceOutcome("other", true, "", nullptr, &error) ||
        !bandit.ScoreSource("seen", &score, &error)) {
      std::cerr << "信号源打分失败: " << error << "\n";
      return 1;
    }
    const double expected = adaptive_engine::Ucb1Score(3, 6, 7, 2.0);
    if (score.cold_start || score.total_observations != 7 ||
        !NearlyEqual(score.score, expected)) {
      std::cerr << "UCB1 打分应基于全体信号源观测总数\n";
      return 1;
    }

    adaptive_engine::StrategyStat stat;
    if (!store.ApplyStrategyOutcome("good", true, "", &stat, &error) ||
        !store.ApplyStrategyOutcome("bad", false, "", &stat, &error)) {
      std::cerr << "策略写入失败: " << error << "\n";
      return 1;
    }
    std::vector<adaptive_engine::RankedStrategy> by_mean;
    if (!bandit.RankStrategiesByExpectation(&by_mean, &error) || by_mean.size() != 2 ||
        by_mean.front().name != "good" ||
        !NearlyEqual(by_mean.front().score, 2.0 / 3.0)) {
      std::cerr << "按 Beta 均值排名不符合预期\n";
      return 1;
    }
    std::filesystem::remove_all(root);
  }

  {
    // 幂等写回：同一 trade_id 在同一 key 上只计入一次，记录里保留最近的 trade_id。
    const auto root = FreshTempDir("store_idempotent");
    const adaptive_engine::ReliabilityStore store(MakeStoreConfig(root), 2.0);
    std::string error;
    if (!store.Initialize(&error)) {
      std::cerr << "幂等测试初始化失败: " << error << "\n";
      return 1;
    }
    adaptive_engine::StrategyStat stat;
    if (!store.ApplyStrategyOutcome("idem", true, "t-1", &stat, &error) ||
        !store.ApplyStrategyOutcome("idem", true, "t-1", &stat, &error) ||
        stat.alpha != 2 || stat.beta != 1 || stat.trades != 1 ||
        stat.last_trade_id != "t-1") {
      std::cerr << "同一 trade_id 重复写回应只计入一次: alpha=" << stat.alpha
                << ", trades=" << stat.trades << "\n";
      return 1;
    }
    if (!store.ApplyStrategyOutcome("idem", false, "t-2", &stat, &error) ||
        stat.beta != 2 || stat.trades != 2) {
      std::cerr << "新 trade_id 应正常计入\n";
      return 1;
    }
    adaptive_engine::StrategyStat reloaded;
    if (!store.GetStrategy("idem", &reloaded, &error) ||
        reloaded.last_trade_id != "t-2" || reloaded.trades != 2) {
      std::cerr << "last_trade_id 应随记录持久化: " << error << "\n";
      return 1;
    }

    adaptive_engine::SourceStat source;
    if (!store.ApplySourceOutcome("idem-src", true, "t-1", &source, &error) ||
        !store.ApplySourceOutcome("idem-src", true, "t-1", &source, &error) ||
        source.wins != 1 || source.losses != 0 || source.last_trade_id != "t-1") {
      std::cerr << "信号源同一 trade_id 应只计入一次\n";
      return 1;
    }
    std::filesystem::remove_all(root);
  }

  {
    // 单个信号源/策略记录损坏只阻塞它自己，其他 key 照常学习与打分。
    const auto root = FreshTempDir("store_corrupt_neighbour");
    const adaptive_engine::ReliabilityStore store(MakeStoreConfig(root), 2.0);
    std::string error;
    if (!store.Initialize(&error) ||
        !store.ApplySourceOutcome("good", true, "", nullptr, &error) ||
        !store.ApplySourceOutcome("bad", true, "", nullptr, &error) ||
        !store.ApplyStrategyOutcome("fine", true, "", nullptr, &error) ||
        !store.ApplyStrategyOutcome("broken", true, "", nullptr, &error)) {
      std::cerr << "损坏邻居测试准备失败: " << error << "\n";
      return 1;
    }
    {
      std::ofstream out(root / "sources" / "bad.rec", std::ios::trunc);
      out << "SRC1\tbad\tgarbage\n";
    }
    {
      std::ofstream out(root / "strategies" / "broken.rec", std::ios::trunc);
      out << "STRAT1\tbroken\n";
    }

    adaptive_engine::SourceStat source;
    if (!store.ApplySourceOutcome("good", true, "", &source, &error) || source.wins != 2) {
      std::cerr << "其他信号源记录损坏不应阻塞本源学习: " << error << "\n";
      return 1;
    }
    adaptive_engine::SourceStat bad;
    if (store.GetSource("bad", &bad, &error) ||
        store.ApplySourceOutcome("bad", true, "", nullptr, &error)) {
      std::cerr << "损坏记录自身仍应报告错误\n";
      return 1;
    }
    std::vector<adaptive_engine::SourceStat> strict;
    if (store.ListSources(&strict, &error)) {
      std::cerr << "严格枚举遇到损坏记录应失败\n";
      return 1;
    }

    adaptive_engine::BanditConfig config;
    config.rng_seed = 11;
    adaptive_engine::BanditSelector bandit(store, config);
    adaptive_engine::SourceScore score;
    if (!bandit.ScoreSource("good", &score, &error) || score.observations != 2 ||
        score.total_observations != 2) {
      std::cerr << "损坏邻居应被跳过，打分照常: " << error << "\n";
      return 1;
    }
    std::vector<adaptive_engine::RankedStrategy> ranked;
    if (!bandit.RankStrategies(&ranked, &error) || ranked.size() != 1 ||
        ranked.front().name != "fine") {
      std::cerr << "损坏策略应被排除在排名之外: " << error << "\n";
      return 1;
    }
    std::filesystem::remove_all(root);
  }

  {
    // 冷启动区间：样本 1-4 时打分取原始 UCB1 并标记冷启动，落盘分数保持中性 50。
    const auto root = FreshTempDir("source_cold_start");
    const adaptive_engine::ReliabilityStore store(MakeStoreConfig(root), 2.0);
    std::string error;
    if (!store.Initialize(&error)) {
      std::cerr << "冷启动测试初始化失败: " << error << "\n";
      return 1;
    }
    adaptive_engine::SourceStat stored;
    for (int i = 0; i < 3; ++i) {
      if (!store.ApplySourceOutcome("young", i != 1, "", &stored, &error)) {
        std::cerr << "信号源写入失败: " << error << "\n";
        return 1;
      }
    }
    if (stored.grade != "C" ||
        !NearlyEqual(stored.score, adaptive_engine::kColdStartSourceScore)) {
      std::cerr << "样本不足时落盘分数应为中性冷启动分\n";
      return 1;
    }
    adaptive_engine::BanditConfig config;
    adaptive_engine::BanditSelector bandit(store, config);
    adaptive_engine::SourceScore score;
    if (!bandit.ScoreSource("young", &score, &error) || !score.cold_start ||
        score.observations != 3 ||
        !NearlyEqual(score.score, adaptive_engine::Ucb1Score(2, 3, 3, 2.0))) {
      std::cerr << "样本不足时打分应为原始 UCB1 且标记冷启动\n";
      return 1;
    }
    std::filesystem::remove_all(root);
  }

  {
    // 交易结果恰好一次：重复提交不改变统计。
    const auto root = FreshTempDir("updater");
    const auto store_config = MakeStoreConfig(root);
    const adaptive_engine::ReliabilityStore store(store_config, 2.0);
    const adaptive_engine::OutcomeJournal journal(
        adaptive_engine::DecisionEngine::JournalPath(store_config));
    const adaptive_engine::PatternLog patterns(
        adaptive_engine::DecisionEngine::PatternDir(store_config));
    std::string error;
    if (!store.Initialize(&error) || !journal.Initialize(&error) ||
        !patterns.Initialize(&error)) {
      std::cerr << "学习器测试初始化失败: " << error << "\n";
      return 1;
    }
    const adaptive_engine::OutcomeUpdater updater(store, journal, patterns,
                                                  store_config.lock_timeout_ms);

    adaptive_engine::StrategyStat before;
    if (!store.GetStrategy("alpha-strat", &before, &error)) {
      std::cerr << "读取策略失败: " << error << "\n";
      return 1;
    }
    const adaptive_engine::TradeOutcome win{
        .trade_id = "trade-1",
        .strategy = "alpha-strat",
        .source = "src-a",
        .pnl_percent = 12.0,
        .closed_at_ms = 1700000000000,
    };
    if (updater.Record(win, &error) != adaptive_engine::RecordResult::kApplied) {
      std::cerr << "交易结果学习失败: " << error << "\n";
      return 1;
    }
    adaptive_engine::StrategyStat after;
    if (!store.GetStrategy("alpha-strat", &after, &error) ||
        after.alpha != before.alpha + 1 || after.beta != before.beta) {
      std::cerr << "盈利交易应使 alpha 加 1\n";
      return 1;
    }
    if (updater.Record(win, &error) != adaptive_engine::RecordResult::kDuplicate) {
      std::cerr << "重复提交应被识别为 duplicate\n";
      return 1;
    }
    adaptive_engine::StrategyStat again;
    if (!store.GetStrategy("alpha-strat", &again, &error) || again.alpha != after.alpha ||
        again.beta != after.beta || again.trades != after.trades) {
      std::cerr << "重复提交不应改变统计\n";
      return 1;
    }

    const adaptive_engine::TradeOutcome loss{
        .trade_id = "trade-2",
        .strategy = "alpha-strat",
        .source = "src-a",
        .pnl_percent = -3.0,
        .closed_at_ms = 1700000001000,
    };
    const adaptive_engine::TradeOutcome flat{
        .trade_id = "trade-3",
        .strategy = "alpha-strat",
        .source = "src-a",
        .pnl_percent = 0.0,
        .closed_at_ms = 1700000002000,
    };
    if (updater.Record(loss, &error) != adaptive_engine::RecordResult::kApplied ||
        updater.Record(flat, &error) != adaptive_engine::RecordResult::kApplied ||
        !store.GetStrategy("alpha-strat", &after, &error) ||
        after.beta != before.beta + 2) {
      std::cerr << "亏损与持平交易都应计入 beta\n";
      return 1;
    }

    adaptive_engine::TradeOutcome invalid = win;
    invalid.trade_id = "trade-bad";
    invalid.strategy.clear();
    adaptive_engine::TradeOutcome nan_pnl = win;
    nan_pnl.trade_id = "trade-nan";
    nan_pnl.pnl_percent = std::numeric_limits<double>::quiet_NaN();
    if (updater.Record(invalid, &error) != adaptive_engine::RecordResult::kInvalid ||
        updater.Record(nan_pnl, &error) != adaptive_engine::RecordResult::kInvalid) {
      std::cerr << "非法交易结果应被拒绝\n";
      return 1;
    }

    std::vector<adaptive_engine::TradeOutcome> recent_wins;
    std::vector<adaptive_engine::TradeOutcome> recent_losses;
    if (!patterns.LoadRecent(true, 10, &recent_wins, &error) ||
        !patterns.LoadRecent(false, 10, &recent_losses, &error) ||
        recent_wins.size() != 1 || recent_wins[0].trade_id != "trade-1" ||
        recent_losses.size() != 2 || recent_losses[0].trade_id != "trade-3") {
      std::cerr << "模式日志胜负分区不符合预期\n";
      return 1;
    }
    std::filesystem::remove_all(root);
  }

  {
    // 流水恢复：策略步骤已完成后中断，重跑只补做剩余步骤。
    const auto root = FreshTempDir("journal_resume");
    const auto store_config = MakeStoreConfig(root);
    const adaptive_engine::ReliabilityStore store(store_config, 2.0);
    const adaptive_engine::OutcomeJournal journal(
        adaptive_engine::DecisionEngine::JournalPath(store_config));
    const adaptive_engine::PatternLog patterns(
        adaptive_engine::DecisionEngine::PatternDir(store_config));
    std::string error;
    if (!store.Initialize(&error) || !journal.Initialize(&error) ||
        !patterns.Initialize(&error)) {
      std::cerr << "恢复测试初始化失败: " << error << "\n";
      return 1;
    }
    const adaptive_engine::OutcomeUpdater updater(store, journal, patterns,
                                                  store_config.lock_timeout_ms);

    const adaptive_engine::TradeOutcome outcome{
        .trade_id = "t-resume",
        .strategy = "resume-strat",
        .source = "resume-src",
        .pnl_percent = 3.5,
        .closed_at_ms = 1700000000000,
    };
    if (!journal.AppendBegin(outcome, &error) ||
        !store.ApplyStrategyOutcome(outcome.strategy, true, outcome.trade_id, nullptr,
                                    &error) ||
        !journal.AppendStep(outcome.trade_id, adaptive_engine::JournalStep::kStrategy,
                            &error)) {
      std::cerr << "模拟中断失败: " << error << "\n";
      return 1;
    }

    if (updater.Record(outcome, &error) != adaptive_engine::RecordResult::kApplied) {
      std::cerr << "中断交易补做失败: " << error << "\n";
      return 1;
    }
    adaptive_engine::StrategyStat stat;
    adaptive_engine::SourceStat source;
    if (!store.GetStrategy("resume-strat", &stat, &error) ||
        !store.GetSource("resume-src", &source, &error) || stat.alpha != 2 ||
        stat.trades != 1 || source.wins != 1) {
      std::cerr << "补做不应重复计数已完成步骤: alpha=" << stat.alpha
                << ", wins=" << source.wins << "\n";
      return 1;
    }

    const adaptive_engine::TradeOutcome pending{
        .trade_id = "t-pending",
        .strategy = "pending-strat",
        .source = "resume-src",
        .pnl_percent = -1.0,
        .closed_at_ms = 1700000005000,
    };
    int resumed = 0;
    if (!journal.AppendBegin(pending, &error) ||
        !updater.ResumePending(&resumed, &error) || resumed != 1) {
      std::cerr << "ResumePending 应补做 1 笔: " << error << "\n";
      return 1;
    }
    if (!store.GetStrategy("pending-strat", &stat, &error) || stat.beta != 2 ||
        stat.alpha != 1) {
      std::cerr << "补做的亏损交易应计入 beta\n";
      return 1;
    }
    if (!updater.ResumePending(&resumed, &error) || resumed != 0) {
      std::cerr << "已完成交易不应再次补做\n";
      return 1;
    }

    // 崩溃残行：末尾半行被忽略，后续追加前截断。
    {
      std::ofstream out(journal.file_path(), std::ios::app);
      out << "BEGIN\tt-torn\ttorn-str";
    }
    std::unordered_map<std::string, adaptive_engine::TradeProgress> state;
    if (!journal.LoadState(&state, &error) || state.count("t-torn") != 0) {
      std::cerr << "流水末尾残行应被忽略: " << error << "\n";
      return 1;
    }
    const adaptive_engine::TradeOutcome after_torn{
        .trade_id = "t-after",
        .strategy = "resume-strat",
        .source = "resume-src",
        .pnl_percent = 1.0,
        .closed_at_ms = 1700000009000,
    };
    if (updater.Record(after_torn, &error) != adaptive_engine::RecordResult::kApplied ||
        !journal.LoadState(&state, &error) || state.count("t-after") != 1 ||
        !state["t-after"].done || state.count("t-torn") != 0) {
      std::cerr << "残行截断后流水应保持可解析: " << error << "\n";
      return 1;
    }
    std::filesystem::remove_all(root);
  }

  {
    // 存储已提交、STEP 未落盘：重放时依据记录里的 trade_id 跳过，不重复计数。
    const auto root = FreshTempDir("journal_unmarked_step");
    const auto store_config = MakeStoreConfig(root);
    const adaptive_engine::ReliabilityStore store(store_config, 2.0);
    const adaptive_engine::OutcomeJournal journal(
        adaptive_engine::DecisionEngine::JournalPath(store_config));
    const adaptive_engine::PatternLog patterns(
        adaptive_engine::DecisionEngine::PatternDir(store_config));
    std::string error;
    if (!store.Initialize(&error) || !journal.Initialize(&error) ||
        !patterns.Initialize(&error)) {
      std::cerr << "未标记步骤测试初始化失败: " << error << "\n";
      return 1;
    }
    const adaptive_engine::OutcomeUpdater updater(store, journal, patterns,
                                                  store_config.lock_timeout_ms);

    const adaptive_engine::TradeOutcome committed{
        .trade_id = "t-commit",
        .strategy = "commit-strat",
        .source = "commit-src",
        .pnl_percent = 2.0,
        .closed_at_ms = 1700000000000,
    };
    if (!journal.AppendBegin(committed, &error) ||
        !store.ApplyStrategyOutcome(committed.strategy, true, committed.trade_id, nullptr,
                                    &error) ||
        !store.ApplySourceOutcome(committed.source, true, committed.trade_id, nullptr,
                                  &error)) {
      std::cerr << "模拟提交后中断失败: " << error << "\n";
      return 1;
    }
    if (updater.Record(committed, &error) != adaptive_engine::RecordResult::kApplied) {
      std::cerr << "未标记步骤补做失败: " << error << "\n";
      return 1;
    }
    adaptive_engine::StrategyStat stat;
    adaptive_engine::SourceStat source;
    if (!store.GetStrategy("commit-strat", &stat, &error) ||
        !store.GetSource("commit-src", &source, &error) || stat.alpha != 2 ||
        stat.trades != 1 || source.wins != 1) {
      std::cerr << "已提交未标记的步骤不应重复计数: alpha=" << stat.alpha
                << ", wins=" << source.wins << "\n";
      return 1;
    }

    // 同一策略上还有一笔未完成交易：新交易先补完它，再计入自己。
    const adaptive_engine::TradeOutcome left{
        .trade_id = "t-left",
        .strategy = "commit-strat",
        .source = "commit-src",
        .pnl_percent = 1.0,
        .closed_at_ms = 1700000001000,
    };
    const adaptive_engine::TradeOutcome next{
        .trade_id = "t-next",
        .strategy = "commit-strat",
        .source = "commit-src",
        .pnl_percent = -2.0,
        .closed_at_ms = 1700000002000,
    };
    if (!journal.AppendBegin(left, &error) ||
        !store.ApplyStrategyOutcome(left.strategy, true, left.trade_id, nullptr, &error)) {
      std::cerr << "模拟未完成交易失败: " << error << "\n";
      return 1;
    }
    if (updater.Record(next, &error) != adaptive_engine::RecordResult::kApplied) {
      std::cerr << "新交易结果学习失败: " << error << "\n";
      return 1;
    }
    std::unordered_map<std::string, adaptive_engine::TradeProgress> state;
    if (!journal.LoadState(&state, &error) || !state["t-left"].done ||
        !state["t-next"].done) {
      std::cerr << "未完成交易应在新交易之前补完\n";
      return 1;
    }
    if (!store.GetStrategy("commit-strat", &stat, &error) ||
        !store.GetSource("commit-src", &source, &error) || stat.alpha != 3 ||
        stat.beta != 2 || stat.trades != 3 || source.wins != 2 || source.losses != 1) {
      std::cerr << "交错的未完成交易不应重复计数: alpha=" << stat.alpha
                << ", beta=" << stat.beta << ", trades=" << stat.trades << "\n";
      return 1;
    }
    std::filesystem::remove_all(root);
  }

  {
    // 流水追加在存储提交之后失败（文件大小上限，进程未崩溃）：重试只计入一次。
    const auto root = FreshTempDir("journal_append_failure");
    const auto store_config = MakeStoreConfig(root);
    const adaptive_engine::ReliabilityStore store(store_config, 2.0);
    const adaptive_engine::OutcomeJournal journal(
        adaptive_engine::DecisionEngine::JournalPath(store_config));
    const adaptive_engine::PatternLog patterns(
        adaptive_engine::DecisionEngine::PatternDir(store_config));
    std::string error;
    if (!store.Initialize(&error) || !journal.Initialize(&error) ||
        !patterns.Initialize(&error)) {
      std::cerr << "追加失败测试初始化失败: " << error << "\n";
      return 1;
    }
    const adaptive_engine::OutcomeUpdater updater(store, journal, patterns,
                                                  store_config.lock_timeout_ms);

    // 先积累几笔交易，使流水明显大于单条统计记录。
    for (int i = 0; i < 4; ++i) {
      const adaptive_engine::TradeOutcome warm{
          .trade_id = "warm-" + std::to_string(i),
          .strategy = "warm-strat",
          .source = "warm-src",
          .pnl_percent = 1.0,
          .closed_at_ms = 1700000000000 + i,
      };
      if (updater.Record(warm, &error) != adaptive_engine::RecordResult::kApplied) {
        std::cerr << "预热交易学习失败: " << error << "\n";
        return 1;
      }
    }
    const adaptive_engine::TradeOutcome outcome{
        .trade_id = "t-efbig",
        .strategy = "efbig-strat",
        .source = "efbig-src",
        .pnl_percent = 4.0,
        .closed_at_ms = 1700000010000,
    };
    if (!journal.AppendBegin(outcome, &error)) {
      std::cerr << "写入 BEGIN 失败: " << error << "\n";
      return 1;
    }

    std::signal(SIGXFSZ, SIG_IGN);
    struct rlimit original {};
    if (::getrlimit(RLIMIT_FSIZE, &original) != 0) {
      std::cerr << "读取文件大小上限失败\n";
      return 1;
    }
    struct rlimit capped = original;
    capped.rlim_cur = static_cast<rlim_t>(std::filesystem::file_size(journal.file_path()));
    if (::setrlimit(RLIMIT_FSIZE, &capped) != 0) {
      std::cerr << "设置文件大小上限失败\n";
      return 1;
    }
    const auto failed = updater.Record(outcome, &error);
    if (::setrlimit(RLIMIT_FSIZE, &original) != 0) {
      std::cerr << "恢复文件大小上限失败\n";
      return 1;
    }
    if (failed != adaptive_engine::RecordResult::kFailed) {
      std::cerr << "流水无法追加时应返回 failed\n";
      return 1;
    }
    adaptive_engine::StrategyStat stat;
    if (!store.GetStrategy("efbig-strat", &stat, &error) || stat.alpha != 2) {
      std::cerr << "策略更新应已在流水失败前提交\n";
      return 1;
    }

    if (updater.Record(outcome, &error) != adaptive_engine::RecordResult::kApplied) {
      std::cerr << "恢复后重试应完成: " << error << "\n";
      return 1;
    }
    adaptive_engine::SourceStat source;
    if (!store.GetStrategy("efbig-strat", &stat, &error) ||
        !store.GetSource("efbig-src", &source, &error) || stat.alpha != 2 ||
        stat.trades != 1 || source.wins != 1) {
      std::cerr << "流水追加失败后重试不应重复计数: alpha=" << stat.alpha
                << ", trades=" << stat.trades << "\n";
      return 1;
    }
    std::filesystem::remove_all(root);
  }

  {
    // 反事实追踪：错过的赢单、询价失败放弃、未到期与预算。
    const auto root = FreshTempDir("counterfactual");
    const adaptive_engine::RejectionLog rejections((root / "rejections.log").string());
    std::string error;
    if (!rejections.Initialize(&error)) {
      std::cerr << "拒单日志初始化失败: " << error << "\n";
      return 1;
    }
    constexpr std::int64_t kNowMs = 1700000000000;
    constexpr std::int64_t kHourMs = 3600LL * 1000LL;
    const std::vector<adaptive_engine::RejectionRecord> records = {
        {"r-win", "src-a", "trend", adaptive_engine::RejectReason::kBelowTrustThreshold,
         "WINUSDT", 100.0, kNowMs - 25 * kHourMs},
        {"r-lose", "src-b", "trend", adaptive_engine::RejectReason::kUpstreamRejected,
         "LOSEUSDT", 100.0, kNowMs - 30 * kHourMs},
        {"r-fail", "src-c", "trend", adaptive_engine::RejectReason::kUpstreamRejected,
         "FAILUSDT", 100.0, kNowMs - 30 * kHourMs},
        {"r-fresh", "src-a", "trend", adaptive_engine::RejectReason::kBelowTrustThreshold,
         "WINUSDT", 100.0, kNowMs - 1 * kHourMs},
        {"r-nosymbol", "src-a", "trend",
         adaptive_engine::RejectReason::kBelowTrustThreshold, "", 0.0,
         kNowMs - 30 * kHourMs},
    };
    for (const auto& record : records) {
      if (!rejections.Append(record, &error)) {
        std::cerr << "拒单日志写入失败: " << error << "\n";
        return 1;
      }
    }

    auto transport = std::make_unique<MockHttpTransport>();
    MockHttpTransport* transport_view = transport.get();
    transport->AddRoute("symbol=WINUSDT",
                        adaptive_engine::HttpResponse{200, R"({"data":{"price":"110.0"}})", ""});
    transport->AddRoute("symbol=LOSEUSDT",
                        adaptive_engine::HttpResponse{200, R"({"data":{"price":95}})", ""});
    transport->AddRoute("symbol=FAILUSDT",
                        adaptive_engine::HttpResponse{500, "internal", ""});
    const adaptive_engine::HttpPriceProvider prices(
        "https://prices.test/ticker?symbol={symbol}", "data.price", 1000,
        std::move(transport));

    adaptive_engine::CounterfactualConfig config;
    const adaptive_engine::CounterfactualTracker tracker(
        rejections, (root / "counterfactual.log").string(), config, prices);

    adaptive_engine::CounterfactualRunStats stats;
    if (!tracker.RunOnce(kNowMs, &stats, &error)) {
      std::cerr << "反事实追踪运行失败: " << error << "\n";
      return 1;
    }
    if (stats.evaluated != 2 || stats.missed_winners != 1 || stats.abandoned != 1 ||
        stats.not_due != 1 || stats.not_priceable != 1 || stats.budget_exhausted) {
      std::cerr << "反事实追踪统计不符合预期: evaluated=" << stats.evaluated
                << ", missed=" << stats.missed_winners
                << ", abandoned=" << stats.abandoned << "\n";
      return 1;
    }
    if (transport_view->last_url().find("https://prices.test/ticker?symbol=") != 0) {
      std::cerr << "价格 URL 模板替换不符合预期\n";
      return 1;
    }

    std::vector<adaptive_engine::CounterfactualResult> results;
    if (!tracker.LoadResults(&results, &error) || results.size() != 2 ||
        results[0].signal_id != "r-win" || !results[0].missed_winner ||
        !NearlyEqual(results[0].price_change_pct, 10.0) ||
        results[1].missed_winner || !NearlyEqual(results[1].price_change_pct, -5.0)) {
      std::cerr << "反事实结果不符合预期\n";
      return 1;
    }
    const std::string rejection_text = ReadAll(root / "rejections.log");
    const std::string result_text = ReadAll(root / "counterfactual.log");
    if (rejection_text.find("\tbelow trust threshold\t") == std::string::npos ||
        rejection_text.find("\tupstream rejected\t") == std::string::npos ||
        result_text.find("\tbelow trust threshold\t") == std::string::npos) {
      std::cerr << "拒绝原因应以原因码文本落盘\n";
      return 1;
    }

    // 已评估的不再询价，失败的下次重试。
    const int calls_before = transport_view->calls();
    if (!tracker.RunOnce(kNowMs, &stats, &error) || stats.evaluated != 0 ||
        stats.abandoned != 1 || transport_view->calls() != calls_before + 1) {
      std::cerr << "反事实追踪不应重复评估已完成的拒单\n";
      return 1;
    }

    adaptive_engine::CounterfactualSummary summary;
    if (!tracker.Summarize(&summary, &error) || summary.overall.evaluated != 2 ||
        summary.overall.missed_winners != 1 ||
        !NearlyEqual(summary.overall.accuracy(), 0.5) ||
        summary.by_reason[adaptive_engine::RejectReason::kBelowTrustThreshold]
                .missed_winners != 1 ||
        !NearlyEqual(
            summary.by_reason[adaptive_engine::RejectReason::kUpstreamRejected].accuracy(),
            1.0)) {
      std::cerr << "拒绝正确率汇总不符合预期\n";
      return 1;
    }

    adaptive_engine::CounterfactualConfig limited = config;
    limited.max_evaluations_per_run = 1;
    const adaptive_engine::CounterfactualTracker limited_tracker(
        rejections, (root / "counterfactual_limited.log").string(), limited, prices);
    if (!limited_tracker.RunOnce(kNowMs, &stats, &error) || stats.evaluated != 1 ||
        !stats.budget_exhausted) {
      std::cerr << "反事实追踪应遵守单轮评估上限\n";
      return 1;
    }
    std::filesystem::remove_all(root);
  }

  {
    // 配置加载：正常配置、模式不一致、未知档位与非法数值。
    const auto root = FreshTempDir("config");
    const auto write_config = [&root](const std::string& name, const std::string& body) {
      const auto path = root / name;
      std::ofstream out(path);
      out << body;
      return path;
    };
    const std::string thresholds =
        "thresholds:\n"
        "  strict:\n"
        "    min_trust_score: 70\n"
        "    min_confidence_score: 60\n"
        "    min_signal_score: 70\n"
        "  learning:\n"
        "    min_trust_score: 30\n"
        "    min_confidence_score: 40\n"
        "    min_signal_score: 30\n";

    const auto valid = write_config(
        "valid.yaml",
        "mode:\n"
        "  operating_mode: paper\n"
        "  portfolio_mode: learning\n"
        "  active_profile: learning\n" +
            thresholds +
            "gate:\n"
            "  probe_size_multiplier: 0.25\n"
            "  min_upstream_confidence: 30\n"
            "bandit:\n"
            "  rng_seed: 11\n"
            "store:\n"
            "  root: \"/tmp/engine # state\"\n"
            "counterfactual:\n"
            "  horizon_hours: 12  # 注释\n"
            "  price_url_template: \"https://x.test/p?s={symbol}\"\n");
    adaptive_engine::EngineConfig config;
    std::string error;
    if (!adaptive_engine::LoadEngineConfigFromYaml(valid.string(), &config, &error)) {
      std::cerr << "合法配置加载失败: " << error << "\n";
      return 1;
    }
    if (config.mode.operating_mode != adaptive_engine::OperatingMode::kLearning ||
        config.mode.active_profile != "learning" || config.profiles.size() != 2 ||
        !NearlyEqual(config.profiles["learning"].min_confidence_score, 40.0) ||
        !NearlyEqual(config.gate.probe_size_multiplier, 0.25) ||
        !NearlyEqual(config.gate.min_upstream_confidence, 30.0) ||
        config.bandit.rng_seed != 11 || config.store.root != "/tmp/engine # state" ||
        !NearlyEqual(config.counterfactual.horizon_hours, 12.0) ||
        config.counterfactual.price_url_template != "https://x.test/p?s={symbol}") {
      std::cerr << "配置字段解析不符合预期\n";
      return 1;
    }

    const auto incoherent = write_config(
        "incoherent.yaml",
        "mode:\n"
        "  operating_mode: learning\n"
        "  portfolio_mode: production\n"
        "  active_profile: learning\n" +
            thresholds);
    adaptive_engine::EngineConfig rejected;
    if (adaptive_engine::LoadEngineConfigFromYaml(incoherent.string(), &rejected, &error) ||
        error.find("模式不一致") == std::string::npos) {
      std::cerr << "模式不一致的配置应加载失败\n";
      return 1;
    }

    const auto unknown_profile = write_config(
        "unknown_profile.yaml",
        "mode:\n"
        "  operating_mode: learning\n"
        "  portfolio_mode: learning\n"
        "  active_profile: aggressive\n" +
            thresholds);
    if (adaptive_engine::LoadEngineConfigFromYaml(unknown_profile.string(), &rejected,
                                                  &error) ||
        error.find("aggressive") == std::string::npos) {
      std::cerr << "指向未定义档位的配置应加载失败\n";
      return 1;
    }

    const auto bad_number = write_config(
        "bad_number.yaml",
        "mode:\n"
        "  active_profile: learning\n" +
            thresholds + "bandit:\n  ucb_exploration: abc\n");
    if (adaptive_engine::LoadEngineConfigFromYaml(bad_number.string(), &rejected,
                                                  &error) ||
        error.find("bandit.ucb_exploration") == std::string::npos ||
        error.find("行号") == std::string::npos) {
      std::cerr << "非法数值应带行号报错: " << error << "\n";
      return 1;
    }

    const auto typo = write_config(
        "typo.yaml",
        "mode:\n"
        "  active_profile: learning\n" +
            thresholds + "  strict:\n    min_trust: 70\n");
    if (adaptive_engine::LoadEngineConfigFromYaml(typo.string(), &rejected, &error) ||
        error.find("未知阈值字段") == std::string::npos) {
      std::cerr << "阈值字段拼写错误应加载失败\n";
      return 1;
    }
    std::filesystem::remove_all(root);
  }

  {
    // 编排器端到端：学习模式放行，生产模式拒绝并留档，交易结果恰好一次。
    const auto root = FreshTempDir("engine");
    std::string error;
    auto learning_engine = adaptive_engine::DecisionEngine::Create(
        MakeEngineConfig(root, adaptive_engine::OperatingMode::kLearning,
                         adaptive_engine::OperatingMode::kLearning, "learning"),
        &error);
    if (learning_engine == nullptr) {
      std::cerr << "学习模式引擎创建失败: " << error << "\n";
      return 1;
    }
    auto signal = MakeSignal(50.0, 55.0, 45.0);
    signal.strategy_hint = "alpha-strat";
    const adaptive_engine::UpstreamVerdict upstream{
        adaptive_engine::UpstreamDecision::kApprove, 70.0};
    const auto approved = learning_engine->Evaluate(signal, upstream, 1700000000000);
    if (approved.verdict.decision != adaptive_engine::Decision::kApprove ||
        approved.verdict.strategy != "alpha-strat" || approved.storage_error ||
        learning_engine->fatal()) {
      std::cerr << "学习模式下端到端信号应放行\n";
      return 1;
    }
    // 首个信号即为新信号源和提示策略建档，策略随即参与排名。
    auto fresh_signal = MakeSignal(50.0, 55.0, 45.0);
    fresh_signal.signal_id = "sig-fresh";
    fresh_signal.source = "brand-new-src";
    fresh_signal.strategy_hint = "new-strat";
    const auto fresh = learning_engine->Evaluate(fresh_signal, upstream, 1700000000000);
    bool ranked_new = false;
    for (const auto& item : fresh.ranked_strategies) {
      ranked_new = ranked_new || item.name == "new-strat";
    }
    std::vector<adaptive_engine::SourceStat> known_sources;
    std::vector<adaptive_engine::StrategyStat> known_strategies;
    if (fresh.storage_error || !ranked_new ||
        !learning_engine->store().ListSources(&known_sources, &error) ||
        !learning_engine->store().ListStrategies(&known_strategies, &error) ||
        known_sources.size() != 2 || known_sources[0].name != "brand-new-src" ||
        known_strategies.size() != 2 || known_strategies[1].name != "new-strat") {
      std::cerr << "首个信号应为新信号源与新策略建档: " << error << "\n";
      return 1;
    }
    auto bad_key_signal = fresh_signal;
    bad_key_signal.signal_id = "sig-badkey";
    bad_key_signal.strategy_hint = "bad\nhint";
    const auto bad_key = learning_engine->Evaluate(bad_key_signal, upstream, 1700000000000);
    if (bad_key.verdict.decision != adaptive_engine::Decision::kReject ||
        bad_key.verdict.reject_reason != adaptive_engine::RejectReason::kMalformedSignal ||
        bad_key.storage_error) {
      std::cerr << "含控制字符的策略提示应按数据质量拒绝\n";
      return 1;
    }

    auto production_engine = adaptive_engine::DecisionEngine::Create(
        MakeEngineConfig(root, adaptive_engine::OperatingMode::kProduction,
                         adaptive_engine::OperatingMode::kProduction, "learning"),
        &error);
    if (production_engine == nullptr) {
      std::cerr << "生产模式引擎创建失败: " << error << "\n";
      return 1;
    }
    signal.signal_id = "sig-prod";
    signal.symbol = "BTCUSDT";
    signal.reference_price = 64000.0;
    const auto rejected = production_engine->Evaluate(signal, upstream, 1700000000000);
    if (rejected.verdict.decision != adaptive_engine::Decision::kReject ||
        rejected.verdict.reject_reason !=
            adaptive_engine::RejectReason::kBelowTrustThreshold ||
        !rejected.thresholds.has_value() ||
        !NearlyEqual(rejected.thresholds->min_trust_score, 70.0)) {
      std::cerr << "生产模式下端到端信号应按 trust 拒绝\n";
      return 1;
    }
    std::vector<adaptive_engine::RejectionRecord> logged;
    if (!production_engine->rejections().Load(&logged, &error) || logged.size() != 1 ||
        logged[0].signal_id != "sig-prod" || logged[0].symbol != "BTCUSDT" ||
        logged[0].reason != adaptive_engine::RejectReason::kBelowTrustThreshold) {
      std::cerr << "拒单应写入拒单日志\n";
      return 1;
    }

    const adaptive_engine::TradeOutcome outcome{
        .trade_id = "e2e-1",
        .strategy = "alpha-strat",
        .source = "src-a",
        .pnl_percent = 12.0,
        .closed_at_ms = 1700000100000,
    };
    if (learning_engine->RecordOutcome(outcome, &error) !=
            adaptive_engine::RecordResult::kApplied ||
        production_engine->RecordOutcome(outcome, &error) !=
            adaptive_engine::RecordResult::kDuplicate) {
      std::cerr << "同一交易跨进程实例只能学习一次\n";
      return 1;
    }
    adaptive_engine::StrategyStat stat;
    if (!learning_engine->store().GetStrategy("alpha-strat", &stat, &error) ||
        stat.alpha != 2 || stat.beta != 1) {
      std::cerr << "端到端学习后 alpha-strat 应为 Beta(2,1)\n";
      return 1;
    }

    if (adaptive_engine::DecisionEngine::Create(
            MakeEngineConfig(root, adaptive_engine::OperatingMode::kLearning,
                             adaptive_engine::OperatingMode::kProduction, "learning"),
            &error) != nullptr) {
      std::cerr << "模式不一致时引擎应拒绝启动\n";
      return 1;
    }
    std::filesystem::remove_all(root);
  }

  {
    // 批量输入解析与输出格式。
    adaptive_engine::SignalRequest request;
    std::string error;
    if (!adaptive_engine::ParseSignalLine(
            "SIGNAL\tsig-9\tsrc-a\t-\t50\t55\t45\trevise\t0\tETHUSDT\t3000.5", &request,
            &error)) {
      std::cerr << "SIGNAL 行解析失败: " << error << "\n";
      return 1;
    }
    if (request.signal.signal_id != "sig-9" || !request.signal.strategy_hint.empty() ||
        request.upstream.decision != adaptive_engine::UpstreamDecision::kRevise ||
        !NearlyEqual(request.upstream.confidence, 0.0) ||
        request.signal.symbol != "ETHUSDT" ||
        !NearlyEqual(request.signal.reference_price, 3000.5)) {
      std::cerr << "SIGNAL 字段解析不符合预期\n";
      return 1;
    }
    if (adaptive_engine::ParseSignalLine("SIGNAL\tsig-9\tsrc-a\t-\tfifty\t55\t45\tapprove\t70",
                                         &request, &error)) {
      std::cerr << "SIGNAL 非数值字段应解析失败\n";
      return 1;
    }
    if (adaptive_engine::ParseUpstreamDecision("maybe") !=
        adaptive_engine::UpstreamDecision::kUnknown) {
      std::cerr << "未知上游结论应解析为 UNKNOWN\n";
      return 1;
    }

    adaptive_engine::TradeOutcome outcome;
    if (!adaptive_engine::ParseTradeLine("TRADE\tt-1\ttrend\tsrc-a\t-2.5\t1700000000000",
                                         &outcome, &error) ||
        outcome.trade_id != "t-1" || outcome.is_win() ||
        outcome.closed_at_ms != 1700000000000) {
      std::cerr << "TRADE 行解析不符合预期\n";
      return 1;
    }

    adaptive_engine::Verdict verdict;
    verdict.decision = adaptive_engine::Decision::kApprove;
    verdict.size_multiplier = 0.3;
    verdict.tags = {adaptive_engine::kTagConfidenceInferred,
                    adaptive_engine::kTagReviseProbe};
    verdict.strategy = "trend";
    if (adaptive_engine::FormatVerdictLine("sig-9", verdict) !=
        "VERDICT\tsig-9\tAPPROVE\t0.3\tnone\tconfidence_inferred,revise_probe\ttrend") {
      std::cerr << "VERDICT 输出格式不符合预期: "
                << adaptive_engine::FormatVerdictLine("sig-9", verdict) << "\n";
      return 1;
    }
  }

  {
    adaptive_engine::JsonValue root;
    std::string error;
    if (!adaptive_engine::ParseJson(R"({"data":{"price":"101.5","list":[1,2]},"ok":true})",
                                    &root, &error)) {
      std::cerr << "JSON 解析失败: " << error << "\n";
      return 1;
    }
    const auto price =
        adaptive_engine::JsonAsNumber(adaptive_engine::JsonFindDottedPath(&root, "data.price"));
    if (!price.has_value() || !NearlyEqual(*price, 101.5)) {
      std::cerr << "JSON 点分路径取价失败\n";
      return 1;
    }
    if (adaptive_engine::JsonAsNumber(
            adaptive_engine::JsonFindDottedPath(&root, "data.missing"))
            .has_value()) {
      std::cerr << "缺失字段应返回空值\n";
      return 1;
    }
    if (adaptive_engine::ParseJson("{\"price\":", &root, &error)) {
      std::cerr << "截断 JSON 应解析失败\n";
      return 1;
    }

    std::string digest;
    if (!adaptive_engine::Sha256Hex("abc", &digest, &error) ||
        digest != "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad") {
      std::cerr << "SHA-256 摘要不符合预期\n";
      return 1;
    }
    std::string decoded;
    if (!adaptive_engine::DecodeKeyFromFilename(
            adaptive_engine::EncodeKeyForFilename("a/b c%"), &decoded) ||
        decoded != "a/b c%") {
      std::cerr << "key 文件名编码应可逆\n";
      return 1;
    }
  }

  return 0;
}
