#include "core/config.h"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <fstream>
#include <sstream>

namespace adaptive_engine {

namespace {

// 轻量 YAML 解析工具：按缩进识别 section/subsection，只覆盖引擎用到的字段。
std::string Trim(const std::string& text) {
  std::size_t begin = 0;
  while (begin < text.size() &&
         std::isspace(static_cast<unsigned char>(text[begin])) != 0) {
    ++begin;
  }

  std::size_t end = text.size();
  while (end > begin &&
         std::isspace(static_cast<unsigned char>(text[end - 1])) != 0) {
    --end;
  }
  return text.substr(begin, end - begin);
}

std::string StripInlineComment(const std::string& line) {
  // 仅剔除非引号上下文中的 `#` 注释（URL 模板等字符串可能含 `#`）。
  bool in_single_quotes = false;
  bool in_double_quotes = false;
  for (std::size_t i = 0; i < line.size(); ++i) {
    const char ch = line[i];
    if (ch == '\'' && !in_double_quotes) {
      in_single_quotes = !in_single_quotes;
      continue;
    }
    if (ch == '"' && !in_single_quotes) {
      in_double_quotes = !in_double_quotes;
      continue;
    }
    if (ch == '#' && !in_single_quotes && !in_double_quotes) {
      return line.substr(0, i);
    }
  }
  return line;
}

std::string Unquote(const std::string& text) {
  if (text.size() < 2) {
    return text;
  }
  const bool single_quoted = text.front() == '\'' && text.back() == '\'';
  const bool double_quoted = text.front() == '"' && text.back() == '"';
  if (single_quoted || double_quoted) {
    return text.substr(1, text.size() - 2);
  }
  return text;
}

std::string ToLowerCopy(const std::string& text) {
  std::string lowered = text;
  std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return lowered;
}

bool ParseDouble(const std::string& text, double* out_value) {
  std::istringstream iss(text);
  double value = 0.0;
  iss >> value;
  if (!iss.fail() && iss.eof() && std::isfinite(value)) {
    *out_value = value;
    return true;
  }
  return false;
}

bool ParseInt(const std::string& text, int* out_value) {
  std::istringstream iss(text);
  int value = 0;
  iss >> value;
  if (!iss.fail() && iss.eof()) {
    *out_value = value;
    return true;
  }
  return false;
}

bool ParseBool(const std::string& text, bool* out_value) {
  const std::string lowered = ToLowerCopy(text);
  if (lowered == "true" || lowered == "1" || lowered == "yes") {
    *out_value = true;
    return true;
  }
  if (lowered == "false" || lowered == "0" || lowered == "no") {
    *out_value = false;
    return true;
  }
  return false;
}

std::string FieldError(const std::string& path, int line_no) {
  return path + " 解析失败，行号: " + std::to_string(line_no);
}

/// 解析 `thresholds.<profile>.<key>`；未知键视为配置错误（避免拼写错误静默落到默认值）。
bool ApplyProfileField(const std::string& profile_name,
                       const std::string& key,
                       const std::string& value,
                       int line_no,
                       EngineConfig* config,
                       std::string* out_error) {
  ThresholdProfile& profile = config->profiles[profile_name];
  profile.name = profile_name;
  double* target = nullptr;
  if (key == "min_trust_score") {
    target = &profile.min_trust_score;
  } else if (key == "min_confidence_score") {
    target = &profile.min_confidence_score;
  } else if (key == "min_signal_score") {
    target = &profile.min_signal_score;
  }
  const std::string path = "thresholds." + profile_name + "." + key;
  if (target == nullptr) {
    if (out_error != nullptr) {
      *out_error = "未知阈值字段: " + path + "，行号: " + std::to_string(line_no);
    }
    return false;
  }
  if (!ParseDouble(value, target)) {
    if (out_error != nullptr) {
      *out_error = FieldError(path, line_no);
    }
    return false;
  }
  return true;
}

}  // namespace

bool ParseOperatingMode(const std::string& text, OperatingMode* out_mode) {
  if (out_mode == nullptr) {
    return false;
  }
  const std::string lowered = ToLowerCopy(Trim(text));
  if (lowered == "learning" || lowered == "paper") {
    *out_mode = OperatingMode::kLearning;
    return true;
  }
  if (lowered == "production" || lowered == "live") {
    *out_mode = OperatingMode::kProduction;
    return true;
  }
  return false;
}

bool LoadEngineConfigFromYaml(const std::string& file_path,
                              EngineConfig* out_config,
                              std::string* out_error) {
  if (out_config == nullptr) {
    if (out_error != nullptr) {
      *out_error = "out_config 为空";
    }
    return false;
  }

  std::ifstream input(file_path);
  if (!input.is_open()) {
    if (out_error != nullptr) {
      *out_error = "无法打开配置文件: " + file_path;
    }
    return false;
  }

  EngineConfig config = *out_config;
  std::string current_section;
  std::string current_subsection;
  std::string line;
  int line_no = 0;
  while (std::getline(input, line)) {
    ++line_no;
    const std::string no_comment = Trim(StripInlineComment(line));
    if (no_comment.empty()) {
      continue;
    }

    const std::size_t indent = line.find_first_not_of(' ');
    if (indent == std::string::npos) {
      continue;
    }

    if (indent == 0 && no_comment.back() == ':') {
      current_section = Trim(no_comment.substr(0, no_comment.size() - 1));
      current_subsection.clear();
      continue;
    }
    if (indent < 2) {
      continue;
    }
    if (indent == 2 && no_comment.back() == ':') {
      current_subsection = Trim(no_comment.substr(0, no_comment.size() - 1));
      continue;
    }

    const std::size_t colon_pos = no_comment.find(':');
    if (colon_pos == std::string::npos) {
      continue;
    }
    const std::string key = Trim(no_comment.substr(0, colon_pos));
    const std::string raw_value = Trim(no_comment.substr(colon_pos + 1));
    if (raw_value.empty()) {
      continue;
    }
    const std::string value = Unquote(raw_value);
    if (indent <= 2) {
      current_subsection.clear();
    }

    if (current_section == "mode") {
      if (key == "operating_mode" || key == "portfolio_mode") {
        OperatingMode parsed = OperatingMode::kLearning;
        if (!ParseOperatingMode(value, &parsed)) {
          if (out_error != nullptr) {
            *out_error = "mode." + key + " 非法取值: " + value + "，行号: " +
                         std::to_string(line_no);
          }
          return false;
        }
        if (key == "operating_mode") {
          config.mode.operating_mode = parsed;
        } else {
          config.mode.portfolio_mode = parsed;
        }
        continue;
      }
      if (key == "active_profile") {
        config.mode.active_profile = value;
        continue;
      }
      continue;
    }

    if (current_section == "thresholds" && !current_subsection.empty()) {
      if (!ApplyProfileField(current_subsection, key, value, line_no, &config,
                             out_error)) {
        return false;
      }
      continue;
    }

    if (current_section == "gate") {
      if (key == "strict_profile") {
        config.gate.strict_profile = value;
        continue;
      }
      if (key == "learning_profile") {
        config.gate.learning_profile = value;
        continue;
      }
      double* target = nullptr;
      if (key == "probe_size_multiplier") {
        target = &config.gate.probe_size_multiplier;
      } else if (key == "inferred_approve_confidence") {
        target = &config.gate.inferred_approve_confidence;
      } else if (key == "inferred_revise_confidence") {
        target = &config.gate.inferred_revise_confidence;
      } else if (key == "min_upstream_confidence") {
        target = &config.gate.min_upstream_confidence;
      } else if (key == "min_source_score") {
        target = &config.gate.min_source_score;
      }
      if (target != nullptr && !ParseDouble(value, target)) {
        if (out_error != nullptr) {
          *out_error = FieldError("gate." + key, line_no);
        }
        return false;
      }
      continue;
    }

    if (current_section == "bandit") {
      bool ok = true;
      if (key == "ucb_exploration") {
        ok = ParseDouble(value, &config.bandit.ucb_exploration);
      } else if (key == "new_source_score") {
        ok = ParseDouble(value, &config.bandit.new_source_score);
      } else if (key == "rng_seed") {
        ok = ParseInt(value, &config.bandit.rng_seed);
      }
      if (!ok) {
        if (out_error != nullptr) {
          *out_error = FieldError("bandit." + key, line_no);
        }
        return false;
      }
      continue;
    }

    if (current_section == "store") {
      bool ok = true;
      if (key == "root") {
        config.store.root = value;
      } else if (key == "lock_timeout_ms") {
        ok = ParseInt(value, &config.store.lock_timeout_ms);
      } else if (key == "max_attempts") {
        ok = ParseInt(value, &config.store.max_attempts);
      } else if (key == "retry_backoff_ms") {
        ok = ParseInt(value, &config.store.retry_backoff_ms);
      }
      if (!ok) {
        if (out_error != nullptr) {
          *out_error = FieldError("store." + key, line_no);
        }
        return false;
      }
      continue;
    }

    if (current_section == "counterfactual") {
      bool ok = true;
      if (key == "enabled") {
        ok = ParseBool(value, &config.counterfactual.enabled);
      } else if (key == "horizon_hours") {
        ok = ParseDouble(value, &config.counterfactual.horizon_hours);
      } else if (key == "win_threshold_pct") {
        ok = ParseDouble(value, &config.counterfactual.win_threshold_pct);
      } else if (key == "price_url_template") {
        config.counterfactual.price_url_template = value;
      } else if (key == "price_json_field") {
        config.counterfactual.price_json_field = value;
      } else if (key == "request_timeout_ms") {
        ok = ParseInt(value, &config.counterfactual.request_timeout_ms);
      } else if (key == "run_budget_ms") {
        ok = ParseInt(value, &config.counterfactual.run_budget_ms);
      } else if (key == "max_evaluations_per_run") {
        ok = ParseInt(value, &config.counterfactual.max_evaluations_per_run);
      }
      if (!ok) {
        if (out_error != nullptr) {
          *out_error = FieldError("counterfactual." + key, line_no);
        }
        return false;
      }
      continue;
    }
  }

  if (!ValidateEngineConfig(config, out_error)) {
    return false;
  }
  *out_config = config;
  return true;
}

bool ValidateEngineConfig(const EngineConfig& config, std::string* out_error) {
  auto fail = [out_error](const std::string& message) {
    if (out_error != nullptr) {
      *out_error = message;
    }
    return false;
  };

  if (config.mode.portfolio_mode == OperatingMode::kProduction &&
      config.mode.operating_mode != OperatingMode::kProduction) {
    return fail("模式不一致: portfolio_mode=PRODUCTION 但 operating_mode=" +
                std::string(ToString(config.mode.operating_mode)));
  }
  if (config.mode.active_profile.empty()) {
    return fail("mode.active_profile 不能为空");
  }
  if (config.profiles.find(config.mode.active_profile) == config.profiles.end()) {
    return fail("mode.active_profile 指向未定义档位: " +
                config.mode.active_profile);
  }
  for (const auto& [name, profile] : config.profiles) {
    const double values[] = {profile.min_trust_score,
                             profile.min_confidence_score,
                             profile.min_signal_score};
    for (const double value : values) {
      if (!std::isfinite(value) || value < 0.0 || value > 100.0) {
        return fail("thresholds." + name + " 取值必须在 [0,100] 范围内");
      }
    }
  }
  if (config.gate.strict_profile.empty() || config.gate.learning_profile.empty()) {
    return fail("gate.strict_profile / gate.learning_profile 不能为空");
  }
  if (config.gate.strict_profile == config.gate.learning_profile) {
    return fail("gate.strict_profile 与 gate.learning_profile 不能相同");
  }
  if (config.gate.probe_size_multiplier <= 0.0 ||
      config.gate.probe_size_multiplier >= 1.0) {
    return fail("gate.probe_size_multiplier 必须在 (0,1) 范围内");
  }
  if (config.gate.inferred_approve_confidence <= 0.0 ||
      config.gate.inferred_approve_confidence > 100.0 ||
      config.gate.inferred_revise_confidence <= 0.0 ||
      config.gate.inferred_revise_confidence > 100.0) {
    return fail("gate 推断置信度必须在 (0,100] 范围内");
  }
  if (config.gate.inferred_revise_confidence >
      config.gate.inferred_approve_confidence) {
    return fail("gate.inferred_revise_confidence 不能高于 inferred_approve_confidence");
  }
  if (config.gate.min_upstream_confidence < 0.0 ||
      config.gate.min_source_score < 0.0) {
    return fail("gate 下限参数不能为负数");
  }
  if (config.bandit.ucb_exploration <= 0.0) {
    return fail("bandit.ucb_exploration 必须大于 0");
  }
  if (config.bandit.new_source_score < 0.0 ||
      config.bandit.new_source_score > 100.0) {
    return fail("bandit.new_source_score 必须在 [0,100] 范围内");
  }
  if (config.store.root.empty()) {
    return fail("store.root 不能为空");
  }
  if (config.store.lock_timeout_ms <= 0) {
    return fail("store.lock_timeout_ms 必须大于 0");
  }
  if (config.store.max_attempts <= 0) {
    return fail("store.max_attempts 必须大于 0");
  }
  if (config.store.retry_backoff_ms < 0) {
    return fail("store.retry_backoff_ms 不能为负数");
  }
  if (config.counterfactual.horizon_hours < 0.0) {
    return fail("counterfactual.horizon_hours 不能为负数");
  }
  if (config.counterfactual.request_timeout_ms <= 0 ||
      config.counterfactual.run_budget_ms <= 0 ||
      config.counterfactual.max_evaluations_per_run <= 0) {
    return fail("counterfactual 超时/预算参数必须大于 0");
  }
  if (config.counterfactual.enabled &&
      config.counterfactual.price_url_template.find("{symbol}") ==
          std::string::npos) {
    return fail("counterfactual.price_url_template 必须包含 {symbol}");
  }
  return true;
}

}  // namespace adaptive_engine
