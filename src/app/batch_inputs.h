#pragma once

#include <string>
#include <utility>
#include <vector>

#include "core/types.h"

namespace adaptive_engine {

/// 一条待路由的信号及其上游审议结论。
struct SignalRequest {
  CandidateSignal signal;
  UpstreamVerdict upstream;
};

/// 解析上游结论文本（APPROVE/REVISE/REJECT，大小写不敏感）；其他一律为 kUnknown。
UpstreamDecision ParseUpstreamDecision(const std::string& text);

/**
 * @brief 解析一行 SIGNAL
 *
 * `SIGNAL id source strategy_hint trust confidence signal_score verdict verdict_confidence [symbol reference_price]`
 * 字段以制表符分隔，strategy_hint/symbol 可用 `-` 表示缺省。
 */
bool ParseSignalLine(const std::string& line,
                     SignalRequest* out_request,
                     std::string* out_error);

/// 解析一行 `TRADE trade_id strategy source pnl_percent closed_at_ms`。
bool ParseTradeLine(const std::string& line,
                    TradeOutcome* out_outcome,
                    std::string* out_error);

/// 输出 `VERDICT id decision size_multiplier reason tags strategy`。
std::string FormatVerdictLine(const std::string& signal_id, const Verdict& verdict);

/// 逐行读取批量输入文件；空行与 `#` 注释行被跳过，返回 (行号, 内容)。
bool ReadBatchLines(const std::string& path,
                    std::vector<std::pair<int, std::string>>* out_lines,
                    std::string* out_error);

}  // namespace adaptive_engine
