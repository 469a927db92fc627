#include "storage/pattern_log.h"

#include <exception>
#include <filesystem>
#include <iomanip>
#include <sstream>
#include <unordered_set>

#include "storage/file_io.h"
#include "storage/record_codec.h"

namespace adaptive_engine {

namespace {

std::string SerializePattern(const TradeOutcome& outcome) {
  std::ostringstream oss;
  oss << "PATTERN" << '\t' << outcome.trade_id << '\t' << outcome.strategy
      << '\t' << outcome.source << '\t' << std::setprecision(17)
      << outcome.pnl_percent << '\t' << outcome.closed_at_ms;
  return oss.str();
}

bool ParsePattern(const std::string& line, TradeOutcome* out_outcome) {
  const auto fields = SplitTabFields(line);
  if (fields.size() != 6 || fields[0] != "PATTERN") {
    return false;
  }
  TradeOutcome outcome;
  outcome.trade_id = fields[1];
  outcome.strategy = fields[2];
  outcome.source = fields[3];
  try {
    outcome.pnl_percent = std::stod(fields[4]);
    outcome.closed_at_ms = std::stoll(fields[5]);
  } catch (const std::exception&) {
    return false;
  }
  *out_outcome = outcome;
  return true;
}

}  // namespace

bool PatternLog::Initialize(std::string* out_error) const {
  return EnsureDirectory(dir_, out_error);
}

std::string PatternLog::PartitionPath(bool wins) const {
  return (std::filesystem::path(dir_) / (wins ? "wins.log" : "losses.log")).string();
}

bool PatternLog::Append(const TradeOutcome& outcome, std::string* out_error) const {
  return AppendLineDurably(PartitionPath(outcome.is_win()), SerializePattern(outcome),
                           out_error);
}

bool PatternLog::LoadRecent(bool wins,
                            std::size_t limit,
                            std::vector<TradeOutcome>* out_outcomes,
                            std::string* out_error) const {
  if (out_outcomes == nullptr) {
    if (out_error != nullptr) {
      *out_error = "out_outcomes 为空";
    }
    return false;
  }
  out_outcomes->clear();

  std::string content;
  bool exists = false;
  if (!ReadWholeFile(PartitionPath(wins), &content, &exists, out_error)) {
    return false;
  }
  if (!exists) {
    return true;
  }

  std::vector<TradeOutcome> all;
  std::istringstream iss(content);
  std::string line;
  while (std::getline(iss, line)) {
    TradeOutcome outcome;
    // 残行/非法行只影响检索，不影响统计，直接跳过。
    if (!line.empty() && ParsePattern(line, &outcome)) {
      all.push_back(outcome);
    }
  }

  std::unordered_set<std::string> seen;
  for (auto it = all.rbegin(); it != all.rend() && out_outcomes->size() < limit; ++it) {
    if (seen.insert(it->trade_id).second) {
      out_outcomes->push_back(*it);
    }
  }
  return true;
}

}  // namespace adaptive_engine
