#include "counterfactual/counterfactual_tracker.h"

#include <chrono>
#include <exception>
#include <iomanip>
#include <sstream>
#include <unordered_set>
#include <utility>

#include "core/log.h"
#include "storage/file_io.h"
#include "storage/record_codec.h"

namespace adaptive_engine {

namespace {

std::string SerializeResult(const CounterfactualResult& result,
                            std::int64_t evaluated_at_ms) {
  std::ostringstream oss;
  oss << "CF" << '\t' << result.signal_id << '\t' << ToString(result.reason)
      << '\t' << std::setprecision(17) << result.price_change_pct << '\t'
      << (result.missed_winner ? 1 : 0) << '\t' << evaluated_at_ms;
  return oss.str();
}

bool ParseResult(const std::string& line, CounterfactualResult* out_result) {
  const auto fields = SplitTabFields(line);
  if (fields.size() != 6 || fields[0] != "CF") {
    return false;
  }
  CounterfactualResult result;
  result.signal_id = fields[1];
  if (!ParseRejectReason(fields[2], &result.reason)) {
    return false;
  }
  try {
    result.price_change_pct = std::stod(fields[3]);
    result.missed_winner = std::stoi(fields[4]) != 0;
  } catch (const std::exception&) {
    return false;
  }
  *out_result = result;
  return true;
}

}  // namespace

CounterfactualTracker::CounterfactualTracker(const RejectionLog& rejections,
                                             std::string results_path,
                                             CounterfactualConfig config,
                                             const PriceProvider& prices)
    : rejections_(rejections),
      results_path_(std::move(results_path)),
      config_(std::move(config)),
      prices_(prices) {}

bool CounterfactualTracker::LoadResults(std::vector<CounterfactualResult>* out_results,
                                        std::string* out_error) const {
  if (out_results == nullptr) {
    if (out_error != nullptr) {
      *out_error = "out_results 为空";
    }
    return false;
  }
  out_results->clear();
  std::string content;
  bool exists = false;
  if (!ReadWholeFile(results_path_, &content, &exists, out_error)) {
    return false;
  }
  if (!exists) {
    return true;
  }
  std::unordered_set<std::string> seen;
  std::istringstream iss(content);
  std::string line;
  int line_no = 0;
  while (std::getline(iss, line)) {
    ++line_no;
    if (line.empty()) {
      continue;
    }
    CounterfactualResult result;
    if (!ParseResult(line, &result)) {
      LogWarn("反事实结果行解析失败（line=" + std::to_string(line_no) + ")");
      continue;
    }
    if (seen.insert(result.signal_id).second) {
      out_results->push_back(result);
    }
  }
  return true;
}

bool CounterfactualTracker::RunOnce(std::int64_t now_ms,
                                    CounterfactualRunStats* out_stats,
                                    std::string* out_error) const {
  if (out_stats == nullptr) {
    if (out_error != nullptr) {
      *out_error = "out_stats 为空";
    }
    return false;
  }
  *out_stats = CounterfactualRunStats{};
  if (!config_.enabled) {
    LogInfo("反事实追踪已关闭，跳过");
    return true;
  }

  std::vector<RejectionRecord> records;
  if (!rejections_.Load(&records, out_error)) {
    return false;
  }
  std::vector<CounterfactualResult> done;
  if (!LoadResults(&done, out_error)) {
    return false;
  }
  std::unordered_set<std::string> evaluated_ids;
  for (const auto& result : done) {
    evaluated_ids.insert(result.signal_id);
  }

  const auto horizon_ms = static_cast<std::int64_t>(config_.horizon_hours * 3600.0 * 1000.0);
  const auto started = std::chrono::steady_clock::now();
  const auto budget = std::chrono::milliseconds(config_.run_budget_ms);

  for (const auto& record : records) {
    if (evaluated_ids.count(record.signal_id) > 0) {
      continue;
    }
    if (record.symbol.empty() || !(record.reference_price > 0.0)) {
      ++out_stats->not_priceable;
      continue;
    }
    if (now_ms - record.rejected_at_ms < horizon_ms) {
      ++out_stats->not_due;
      continue;
    }
    if (out_stats->evaluated + out_stats->abandoned >= config_.max_evaluations_per_run ||
        std::chrono::steady_clock::now() - started >= budget) {
      out_stats->budget_exhausted = true;
      LogInfo("反事实追踪本轮预算耗尽，剩余待下次运行");
      break;
    }

    double price = 0.0;
    std::string fetch_error;
    if (!prices_.FetchPrice(record.symbol, &price, &fetch_error)) {
      ++out_stats->abandoned;
      LogWarn("反事实询价失败，放弃本条: signal_id=" + record.signal_id +
              ", symbol=" + record.symbol + ", error=" + fetch_error);
      continue;
    }

    CounterfactualResult result;
    result.signal_id = record.signal_id;
    result.reason = record.reason;
    result.price_change_pct =
        (price - record.reference_price) / record.reference_price * 100.0;
    result.missed_winner = result.price_change_pct >= config_.win_threshold_pct;
    if (!AppendLineDurably(results_path_, SerializeResult(result, now_ms), out_error)) {
      return false;
    }
    ++out_stats->evaluated;
    if (result.missed_winner) {
      ++out_stats->missed_winners;
      LogInfo("错过的赢单: signal_id=" + record.signal_id +
              ", reason=" + ToString(record.reason) +
              ", change_pct=" + std::to_string(result.price_change_pct));
    }
  }
  return true;
}

bool CounterfactualTracker::Summarize(CounterfactualSummary* out_summary,
                                      std::string* out_error) const {
  if (out_summary == nullptr) {
    if (out_error != nullptr) {
      *out_error = "out_summary 为空";
    }
    return false;
  }
  std::vector<CounterfactualResult> results;
  if (!LoadResults(&results, out_error)) {
    return false;
  }
  *out_summary = CounterfactualSummary{};
  for (const auto& result : results) {
    auto& per_reason = out_summary->by_reason[result.reason];
    ++per_reason.evaluated;
    ++out_summary->overall.evaluated;
    if (result.missed_winner) {
      ++per_reason.missed_winners;
      ++out_summary->overall.missed_winners;
    }
  }
  return true;
}

}  // namespace adaptive_engine
