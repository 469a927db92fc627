#include "storage/outcome_journal.h"

#include <algorithm>
#include <exception>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <vector>

#include "core/log.h"
#include "storage/file_io.h"
#include "storage/record_codec.h"

namespace adaptive_engine {

namespace {

std::string SerializeBegin(const TradeOutcome& outcome) {
  std::ostringstream oss;
  oss << "BEGIN"
      << '\t'
      << outcome.trade_id
      << '\t'
      << outcome.strategy
      << '\t'
      << outcome.source
      << '\t'
      << std::setprecision(17) << outcome.pnl_percent
      << '\t'
      << outcome.closed_at_ms;
  return oss.str();
}

bool ParseBegin(const std::vector<std::string>& fields,
                TradeOutcome* out_outcome,
                std::string* out_error) {
  if (fields.size() != 6) {
    if (out_error != nullptr) {
      *out_error = "BEGIN 字段数异常";
    }
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
    if (out_error != nullptr) {
      *out_error = "BEGIN 字段解析失败";
    }
    return false;
  }
  *out_outcome = outcome;
  return true;
}

bool ParseStepName(const std::string& text, JournalStep* out_step) {
  if (text == "strategy") {
    *out_step = JournalStep::kStrategy;
    return true;
  }
  if (text == "source") {
    *out_step = JournalStep::kSource;
    return true;
  }
  if (text == "pattern") {
    *out_step = JournalStep::kPattern;
    return true;
  }
  return false;
}

/// 截掉末尾无换行的残行（崩溃时写了一半的行）。
bool TrimTornTail(const std::string& path, std::string* out_error) {
  std::string content;
  bool exists = false;
  if (!ReadWholeFile(path, &content, &exists, out_error)) {
    return false;
  }
  if (!exists || content.empty() || content.back() == '\n') {
    return true;
  }
  const auto last_newline = content.rfind('\n');
  const std::uintmax_t keep =
      last_newline == std::string::npos ? 0 : static_cast<std::uintmax_t>(last_newline + 1);
  LogWarn("学习流水末尾存在残行，追加前截断: " + path);
  std::error_code ec;
  std::filesystem::resize_file(path, keep, ec);
  if (ec) {
    if (out_error != nullptr) {
      *out_error = "截断学习流水残行失败: " + ec.message();
    }
    return false;
  }
  return true;
}

}  // namespace

bool OutcomeJournal::Initialize(std::string* out_error) const {
  const auto parent = std::filesystem::path(file_path_).parent_path();
  if (!parent.empty() && !EnsureDirectory(parent.string(), out_error)) {
    return false;
  }
  std::ofstream out(file_path_, std::ios::app);
  if (!out.is_open()) {
    if (out_error != nullptr) {
      *out_error = "创建/打开学习流水失败: " + file_path_;
    }
    return false;
  }
  return true;
}

bool OutcomeJournal::AppendLine(const std::string& line, std::string* out_error) const {
  if (!TrimTornTail(file_path_, out_error)) {
    return false;
  }
  return AppendLineDurably(file_path_, line, out_error);
}

bool OutcomeJournal::AppendBegin(const TradeOutcome& outcome,
                                 std::string* out_error) const {
  return AppendLine(SerializeBegin(outcome), out_error);
}

bool OutcomeJournal::AppendStep(const std::string& trade_id,
                                JournalStep step,
                                std::string* out_error) const {
  return AppendLine(std::string("STEP\t") + trade_id + '\t' + ToString(step),
                    out_error);
}

bool OutcomeJournal::AppendDone(const std::string& trade_id,
                                std::string* out_error) const {
  return AppendLine("DONE\t" + trade_id, out_error);
}

bool OutcomeJournal::LoadState(
    std::unordered_map<std::string, TradeProgress>* out_progress,
    std::string* out_error) const {
  if (out_progress == nullptr) {
    if (out_error != nullptr) {
      *out_error = "LoadState 输出参数为空";
    }
    return false;
  }
  out_progress->clear();

  std::string content;
  bool exists = false;
  if (!ReadWholeFile(file_path_, &content, &exists, out_error)) {
    return false;
  }
  if (!exists) {
    // 无历史，由 Initialize 负责创建。
    return true;
  }

  std::istringstream iss(content);
  const bool torn_tail = !content.empty() && content.back() != '\n';
  std::string line;
  int line_no = 0;
  int line_count = static_cast<int>(std::count(content.begin(), content.end(), '\n')) +
                   (torn_tail ? 1 : 0);
  while (std::getline(iss, line)) {
    ++line_no;
    if (line.empty()) {
      continue;
    }
    if (torn_tail && line_no == line_count) {
      LogWarn("学习流水末行不完整，已忽略（line=" + std::to_string(line_no) + "）");
      break;
    }

    const auto fields = SplitTabFields(line);
    const std::string& type = fields[0];
    std::string parse_error;
    if (type == "BEGIN") {
      TradeOutcome outcome;
      if (!ParseBegin(fields, &outcome, &parse_error)) {
        if (out_error != nullptr) {
          *out_error = "学习流水行解析失败（line=" + std::to_string(line_no) +
                       "）: " + parse_error;
        }
        return false;
      }
      // 同一 trade_id 重复 BEGIN（例如中断后重试）保留首次内容。
      auto [it, inserted] = out_progress->try_emplace(outcome.trade_id);
      if (inserted) {
        it->second.outcome = outcome;
      }
      continue;
    }
    if (type == "STEP") {
      JournalStep step = JournalStep::kStrategy;
      if (fields.size() != 3 || !ParseStepName(fields[2], &step)) {
        if (out_error != nullptr) {
          *out_error = "STEP 行非法（line=" + std::to_string(line_no) + "）";
        }
        return false;
      }
      auto it = out_progress->find(fields[1]);
      if (it == out_progress->end()) {
        if (out_error != nullptr) {
          *out_error = "STEP 缺少对应 BEGIN（line=" + std::to_string(line_no) + "）";
        }
        return false;
      }
      switch (step) {
        case JournalStep::kStrategy:
          it->second.strategy_applied = true;
          break;
        case JournalStep::kSource:
          it->second.source_applied = true;
          break;
        case JournalStep::kPattern:
          it->second.pattern_appended = true;
          break;
      }
      continue;
    }
    if (type == "DONE") {
      if (fields.size() != 2) {
        if (out_error != nullptr) {
          *out_error = "DONE 行非法（line=" + std::to_string(line_no) + "）";
        }
        return false;
      }
      auto it = out_progress->find(fields[1]);
      if (it == out_progress->end()) {
        if (out_error != nullptr) {
          *out_error = "DONE 缺少对应 BEGIN（line=" + std::to_string(line_no) + "）";
        }
        return false;
      }
      it->second.done = true;
      continue;
    }

    if (out_error != nullptr) {
      *out_error = "未知学习流水事件类型（line=" + std::to_string(line_no) + "）";
    }
    return false;
  }
  return true;
}

}  // namespace adaptive_engine
