#include <chrono>
#include <cstdint>
#include <iomanip>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

#include "app/batch_inputs.h"
#include "core/config.h"
#include "core/log.h"
#include "counterfactual/counterfactual_tracker.h"
#include "counterfactual/price_provider.h"
#include "system/decision_engine.h"

namespace {

constexpr int kExitOk = 0;
constexpr int kExitTransient = 1;
constexpr int kExitFatal = 2;

/// 每个分区在 status 中展示的最近模式样本数。
constexpr std::size_t kStatusRecentPatterns = 5;

enum class Command {
  kUnknown,
  kRoute,
  kAnalyze,
  kCounterfactual,
  kStatus,
};

struct RuntimeOptions {
  Command command{Command::kUnknown};
  std::string config_path{"config/default.yaml"};
  std::string signals_path;
  std::string outcomes_path;
  std::string store_root_override;
  std::string profile_override;
};

Command ParseCommand(const std::string& text) {
  if (text == "route") {
    return Command::kRoute;
  }
  if (text == "analyze") {
    return Command::kAnalyze;
  }
  if (text == "counterfactual") {
    return Command::kCounterfactual;
  }
  if (text == "status") {
    return Command::kStatus;
  }
  return Command::kUnknown;
}

std::int64_t CurrentTimestampMs() {
  const auto now = std::chrono::time_point_cast<std::chrono::milliseconds>(
      std::chrono::system_clock::now());
  return now.time_since_epoch().count();
}

RuntimeOptions ParseOptions(int argc, char** argv) {
  RuntimeOptions options;
  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg.rfind("--config=", 0) == 0) {
      options.config_path = arg.substr(std::string("--config=").size());
      continue;
    }
    if (arg.rfind("--signals=", 0) == 0) {
      options.signals_path = arg.substr(std::string("--signals=").size());
      continue;
    }
    if (arg.rfind("--outcomes=", 0) == 0) {
      options.outcomes_path = arg.substr(std::string("--outcomes=").size());
      continue;
    }
    if (arg.rfind("--store_root=", 0) == 0) {
      options.store_root_override = arg.substr(std::string("--store_root=").size());
      continue;
    }
    if (arg.rfind("--profile=", 0) == 0) {
      options.profile_override = arg.substr(std::string("--profile=").size());
      continue;
    }
    if (options.command == Command::kUnknown && arg.rfind("--", 0) != 0) {
      options.command = ParseCommand(arg);
      continue;
    }
    adaptive_engine::LogWarn("未知参数，已忽略: " + arg);
  }
  return options;
}

void PrintUsage() {
  std::cerr << "用法: adaptive_engine <route|analyze|counterfactual|status>"
            << " [--config=PATH] [--signals=PATH] [--outcomes=PATH]"
            << " [--store_root=DIR] [--profile=NAME]\n";
}

int RunRoute(adaptive_engine::DecisionEngine* engine, const RuntimeOptions& options) {
  if (options.signals_path.empty()) {
    adaptive_engine::LogError("route 需要 --signals=PATH");
    return kExitFatal;
  }
  std::vector<std::pair<int, std::string>> lines;
  std::string error;
  if (!adaptive_engine::ReadBatchLines(options.signals_path, &lines, &error)) {
    adaptive_engine::LogError(error);
    return kExitTransient;
  }

  int approved = 0;
  int rejected = 0;
  bool storage_error = false;
  for (const auto& [line_no, line] : lines) {
    adaptive_engine::SignalRequest request;
    std::string parse_error;
    if (!adaptive_engine::ParseSignalLine(line, &request, &parse_error)) {
      // 无法解析的行按数据质量错误单条拒绝。
      adaptive_engine::LogWarn("信号行解析失败（line=" + std::to_string(line_no) +
                               "）: " + parse_error);
      adaptive_engine::Verdict malformed;
      malformed.reject_reason = adaptive_engine::RejectReason::kMalformedSignal;
      std::cout << adaptive_engine::FormatVerdictLine(
                       "line-" + std::to_string(line_no), malformed)
                << '\n';
      ++rejected;
      continue;
    }

    const auto decision =
        engine->Evaluate(request.signal, request.upstream, CurrentTimestampMs());
    if (engine->fatal()) {
      adaptive_engine::LogError("配置/安全错误，停止处理剩余信号: " +
                                engine->fatal_error());
      return kExitFatal;
    }
    storage_error = storage_error || decision.storage_error;
    std::cout << adaptive_engine::FormatVerdictLine(request.signal.signal_id,
                                                    decision.verdict)
              << '\n';
    if (decision.verdict.decision == adaptive_engine::Decision::kApprove) {
      ++approved;
    } else {
      ++rejected;
    }
  }
  std::cout.flush();
  adaptive_engine::LogInfo("route 完成: approved=" + std::to_string(approved) +
                           ", rejected=" + std::to_string(rejected));
  return storage_error ? kExitTransient : kExitOk;
}

int RunAnalyze(adaptive_engine::DecisionEngine* engine, const RuntimeOptions& options) {
  std::string error;
  int resumed = 0;
  if (!engine->updater().ResumePending(&resumed, &error)) {
    adaptive_engine::LogError("补做未完成交易失败: " + error);
    return kExitTransient;
  }
  if (resumed > 0) {
    adaptive_engine::LogInfo("已补做未完成交易: " + std::to_string(resumed));
  }
  if (options.outcomes_path.empty()) {
    return kExitOk;
  }

  std::vector<std::pair<int, std::string>> lines;
  if (!adaptive_engine::ReadBatchLines(options.outcomes_path, &lines, &error)) {
    adaptive_engine::LogError(error);
    return kExitTransient;
  }

  int applied = 0;
  int duplicates = 0;
  int invalid = 0;
  int failed = 0;
  for (const auto& [line_no, line] : lines) {
    adaptive_engine::TradeOutcome outcome;
    std::string parse_error;
    if (!adaptive_engine::ParseTradeLine(line, &outcome, &parse_error)) {
      adaptive_engine::LogWarn("交易行解析失败（line=" + std::to_string(line_no) +
                               "）: " + parse_error);
      ++invalid;
      continue;
    }
    std::string record_error;
    switch (engine->RecordOutcome(outcome, &record_error)) {
      case adaptive_engine::RecordResult::kApplied:
        ++applied;
        break;
      case adaptive_engine::RecordResult::kDuplicate:
        ++duplicates;
        break;
      case adaptive_engine::RecordResult::kInvalid:
        adaptive_engine::LogWarn("交易结果非法，已跳过: " + record_error);
        ++invalid;
        break;
      case adaptive_engine::RecordResult::kFailed:
        ++failed;
        break;
    }
  }
  adaptive_engine::LogInfo("analyze 完成: applied=" + std::to_string(applied) +
                           ", duplicate=" + std::to_string(duplicates) +
                           ", invalid=" + std::to_string(invalid) +
                           ", failed=" + std::to_string(failed));
  return failed > 0 ? kExitTransient : kExitOk;
}

int RunCounterfactual(adaptive_engine::DecisionEngine* engine) {
  const auto& cf = engine->config().counterfactual;
  const adaptive_engine::HttpPriceProvider prices(cf.price_url_template,
                                                  cf.price_json_field,
                                                  cf.request_timeout_ms);
  const adaptive_engine::CounterfactualTracker tracker(
      engine->rejections(),
      adaptive_engine::DecisionEngine::CounterfactualLogPath(engine->config().store),
      cf,
      prices);

  adaptive_engine::CounterfactualRunStats stats;
  std::string error;
  if (!tracker.RunOnce(CurrentTimestampMs(), &stats, &error)) {
    adaptive_engine::LogError("反事实追踪失败: " + error);
    return kExitTransient;
  }
  adaptive_engine::LogInfo("counterfactual 完成: evaluated=" +
                           std::to_string(stats.evaluated) +
                           ", missed_winners=" + std::to_string(stats.missed_winners) +
                           ", abandoned=" + std::to_string(stats.abandoned) +
                           ", not_due=" + std::to_string(stats.not_due) +
                           ", budget_exhausted=" +
                           (stats.budget_exhausted ? "true" : "false"));
  return kExitOk;
}

int RunStatus(adaptive_engine::DecisionEngine* engine) {
  std::string error;
  std::vector<adaptive_engine::StrategyStat> strategies;
  std::vector<adaptive_engine::SourceStat> sources;
  std::vector<adaptive_engine::RankedStrategy> ranked;
  if (!engine->store().ListStrategies(&strategies, &error) ||
      !engine->store().ListSources(&sources, &error) ||
      !engine->bandit().RankStrategiesByExpectation(&ranked, &error)) {
    adaptive_engine::LogError("读取可靠性统计失败: " + error);
    return kExitTransient;
  }

  std::ostringstream oss;
  oss << std::fixed << std::setprecision(3);
  oss << "== strategies (by expected win rate) ==\n";
  for (const auto& entry : ranked) {
    for (const auto& stat : strategies) {
      if (stat.name == entry.name) {
        oss << entry.name << "\talpha=" << stat.alpha << "\tbeta=" << stat.beta
            << "\ttrades=" << stat.trades << "\tmean=" << entry.score << '\n';
      }
    }
  }
  oss << "== sources ==\n";
  for (const auto& source : sources) {
    oss << source.name << "\twins=" << source.wins << "\tlosses=" << source.losses
        << "\tgrade=" << source.grade << "\tscore=" << source.score << '\n';
  }

  for (const bool wins : {true, false}) {
    std::vector<adaptive_engine::TradeOutcome> recent;
    if (!engine->patterns().LoadRecent(wins, kStatusRecentPatterns, &recent, &error)) {
      adaptive_engine::LogError("读取模式日志失败: " + error);
      return kExitTransient;
    }
    oss << "== recent " << (wins ? "wins" : "losses") << " ==\n";
    for (const auto& outcome : recent) {
      oss << outcome.trade_id << '\t' << outcome.strategy << '\t' << outcome.source
          << '\t' << outcome.pnl_percent << '\n';
    }
  }

  const auto& cf = engine->config().counterfactual;
  const adaptive_engine::HttpPriceProvider prices(cf.price_url_template,
                                                  cf.price_json_field,
                                                  cf.request_timeout_ms);
  const adaptive_engine::CounterfactualTracker tracker(
      engine->rejections(),
      adaptive_engine::DecisionEngine::CounterfactualLogPath(engine->config().store),
      cf,
      prices);
  adaptive_engine::CounterfactualSummary summary;
  if (!tracker.Summarize(&summary, &error)) {
    adaptive_engine::LogError("读取反事实结果失败: " + error);
    return kExitTransient;
  }
  oss << "== rejection accuracy ==\n";
  oss << "overall\tevaluated=" << summary.overall.evaluated
      << "\tmissed=" << summary.overall.missed_winners
      << "\taccuracy=" << summary.overall.accuracy() << '\n';
  for (const auto& [reason, accuracy] : summary.by_reason) {
    oss << adaptive_engine::ToString(reason) << "\tevaluated=" << accuracy.evaluated
        << "\tmissed=" << accuracy.missed_winners
        << "\taccuracy=" << accuracy.accuracy() << '\n';
  }
  std::cout << oss.str();
  std::cout.flush();
  return kExitOk;
}

}  // namespace

int main(int argc, char** argv) {
  const RuntimeOptions options = ParseOptions(argc, argv);
  if (options.command == Command::kUnknown) {
    PrintUsage();
    return kExitFatal;
  }

  adaptive_engine::EngineConfig config;
  std::string config_error;
  if (!adaptive_engine::LoadEngineConfigFromYaml(options.config_path, &config,
                                                 &config_error)) {
    adaptive_engine::LogError("配置加载失败: " + config_error);
    return kExitFatal;
  }
  if (!options.store_root_override.empty()) {
    config.store.root = options.store_root_override;
  }
  if (!options.profile_override.empty()) {
    config.mode.active_profile = options.profile_override;
  }

  auto engine = adaptive_engine::DecisionEngine::Create(config, &config_error);
  if (engine == nullptr) {
    adaptive_engine::LogError("决策引擎初始化失败: " + config_error);
    return kExitFatal;
  }

  switch (options.command) {
    case Command::kRoute:
      return RunRoute(engine.get(), options);
    case Command::kAnalyze:
      return RunAnalyze(engine.get(), options);
    case Command::kCounterfactual:
      return RunCounterfactual(engine.get());
    case Command::kStatus:
      return RunStatus(engine.get());
    case Command::kUnknown:
      break;
  }
  PrintUsage();
  return kExitFatal;
}
