#include "app/batch_inputs.h"

#include <algorithm>
#include <cctype>
#include <exception>
#include <fstream>
#include <sstream>
#include <stdexcept>

#include "storage/record_codec.h"

namespace adaptive_engine {

namespace {

std::string Trim(const std::string& value) {
  const auto begin = value.find_first_not_of(" \r");
  if (begin == std::string::npos) {
    return "";
  }
  const auto end = value.find_last_not_of(" \r");
  return value.substr(begin, end - begin + 1);
}

std::string OptionalField(const std::string& value) {
  return value == "-" ? std::string() : value;
}

/// 严格数值解析：整段必须被消费。
bool ParseDoubleField(const std::string& text, double* out_value) {
  if (text.empty()) {
    return false;
  }
  try {
    std::size_t consumed = 0;
    const double value = std::stod(text, &consumed);
    if (consumed != text.size()) {
      return false;
    }
    *out_value = value;
  } catch (const std::exception&) {
    return false;
  }
  return true;
}

}  // namespace

UpstreamDecision ParseUpstreamDecision(const std::string& text) {
  std::string upper = text;
  std::transform(upper.begin(), upper.end(), upper.begin(),
                 [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
  if (upper == "APPROVE") {
    return UpstreamDecision::kApprove;
  }
  if (upper == "REVISE") {
    return UpstreamDecision::kRevise;
  }
  if (upper == "REJECT") {
    return UpstreamDecision::kReject;
  }
  return UpstreamDecision::kUnknown;
}

bool ParseSignalLine(const std::string& line,
                     SignalRequest* out_request,
                     std::string* out_error) {
  if (out_request == nullptr) {
    if (out_error != nullptr) {
      *out_error = "out_request 为空";
    }
    return false;
  }
  auto fields = SplitTabFields(line);
  for (auto& field : fields) {
    field = Trim(field);
  }
  if (fields.empty() || fields[0] != "SIGNAL" ||
      (fields.size() != 9 && fields.size() != 11)) {
    if (out_error != nullptr) {
      *out_error = "SIGNAL 字段数异常";
    }
    return false;
  }

  SignalRequest request;
  request.signal.signal_id = fields[1];
  request.signal.source = fields[2];
  request.signal.strategy_hint = OptionalField(fields[3]);
  request.upstream.decision = ParseUpstreamDecision(fields[7]);
  if (!ParseDoubleField(fields[4], &request.signal.trust_score) ||
      !ParseDoubleField(fields[5], &request.signal.confidence_score) ||
      !ParseDoubleField(fields[6], &request.signal.signal_score) ||
      !ParseDoubleField(fields[8], &request.upstream.confidence)) {
    if (out_error != nullptr) {
      *out_error = "SIGNAL 数值字段解析失败: " + fields[1];
    }
    return false;
  }
  if (fields.size() == 11) {
    request.signal.symbol = OptionalField(fields[9]);
    if (!ParseDoubleField(fields[10], &request.signal.reference_price)) {
      if (out_error != nullptr) {
        *out_error = "SIGNAL reference_price 解析失败: " + fields[1];
      }
      return false;
    }
  }
  *out_request = request;
  return true;
}

bool ParseTradeLine(const std::string& line,
                    TradeOutcome* out_outcome,
                    std::string* out_error) {
  if (out_outcome == nullptr) {
    if (out_error != nullptr) {
      *out_error = "out_outcome 为空";
    }
    return false;
  }
  auto fields = SplitTabFields(line);
  for (auto& field : fields) {
    field = Trim(field);
  }
  if (fields.size() != 6 || fields[0] != "TRADE") {
    if (out_error != nullptr) {
      *out_error = "TRADE 字段数异常";
    }
    return false;
  }
  TradeOutcome outcome;
  outcome.trade_id = fields[1];
  outcome.strategy = fields[2];
  outcome.source = fields[3];
  if (!ParseDoubleField(fields[4], &outcome.pnl_percent)) {
    if (out_error != nullptr) {
      *out_error = "TRADE pnl_percent 解析失败: " + fields[1];
    }
    return false;
  }
  try {
    std::size_t consumed = 0;
    outcome.closed_at_ms = std::stoll(fields[5], &consumed);
    if (consumed != fields[5].size()) {
      throw std::invalid_argument("trailing");
    }
  } catch (const std::exception&) {
    if (out_error != nullptr) {
      *out_error = "TRADE closed_at_ms 解析失败: " + fields[1];
    }
    return false;
  }
  *out_outcome = outcome;
  return true;
}

std::string FormatVerdictLine(const std::string& signal_id, const Verdict& verdict) {
  std::string tags;
  for (const auto& tag : verdict.tags) {
    if (!tags.empty()) {
      tags += ',';
    }
    tags += tag;
  }
  std::ostringstream oss;
  oss << "VERDICT" << '\t' << signal_id << '\t' << ToString(verdict.decision) << '\t'
      << verdict.size_multiplier << '\t' << ToString(verdict.reject_reason) << '\t'
      << (tags.empty() ? "-" : tags) << '\t'
      << (verdict.strategy.empty() ? "-" : verdict.strategy);
  return oss.str();
}

bool ReadBatchLines(const std::string& path,
                    std::vector<std::pair<int, std::string>>* out_lines,
                    std::string* out_error) {
  if (out_lines == nullptr) {
    if (out_error != nullptr) {
      *out_error = "out_lines 为空";
    }
    return false;
  }
  out_lines->clear();
  std::ifstream in(path);
  if (!in.is_open()) {
    if (out_error != nullptr) {
      *out_error = "无法打开输入文件: " + path;
    }
    return false;
  }
  std::string line;
  int line_no = 0;
  while (std::getline(in, line)) {
    ++line_no;
    const std::string trimmed = Trim(line);
    if (trimmed.empty() || trimmed[0] == '#') {
      continue;
    }
    out_lines->emplace_back(line_no, line);
  }
  return true;
}

}  // namespace adaptive_engine
