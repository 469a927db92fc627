#include "storage/reliability_store.h"

#include <algorithm>
#include <chrono>
#include <filesystem>
#include <thread>

#include "bandit/reliability_math.h"
#include "core/log.h"
#include "storage/file_io.h"
#include "storage/record_codec.h"

namespace adaptive_engine {

namespace {

constexpr const char* kRecordExtension = ".rec";
constexpr const char* kLockSuffix = ".lock";

std::string FirstLine(const std::string& content) {
  const auto pos = content.find('\n');
  return pos == std::string::npos ? content : content.substr(0, pos);
}

SourceStat DefaultSource(const std::string& name) {
  SourceStat stat;
  stat.name = name;
  stat.grade = GradeForRecord(0, 0);
  stat.score = kColdStartSourceScore;
  return stat;
}

StrategyStat DefaultStrategy(const std::string& name) {
  StrategyStat stat;
  stat.name = name;
  return stat;
}

}  // namespace

template <typename Fn>
bool ReliabilityStore::RunWithRetry(const char* op_name,
                                    Fn&& attempt,
                                    std::string* out_error) const {
  std::string last_error;
  for (int i = 1; i <= config_.max_attempts; ++i) {
    last_error.clear();
    const AttemptResult result = attempt(&last_error);
    if (result == AttemptResult::kOk) {
      return true;
    }
    if (result == AttemptResult::kFatal) {
      if (out_error != nullptr) {
        *out_error = last_error;
      }
      return false;
    }
    LogWarn(std::string("存储操作瞬时失败: op=") + op_name +
            ", attempt=" + std::to_string(i) + "/" +
            std::to_string(config_.max_attempts) + ", error=" + last_error);
    if (i < config_.max_attempts && config_.retry_backoff_ms > 0) {
      std::this_thread::sleep_for(
          std::chrono::milliseconds(config_.retry_backoff_ms * i));
    }
  }
  if (out_error != nullptr) {
    *out_error = std::string(op_name) + " 重试耗尽: " + last_error;
  }
  return false;
}

bool ReliabilityStore::Initialize(std::string* out_error) const {
  if (config_.root.empty()) {
    if (out_error != nullptr) {
      *out_error = "store.root 不能为空";
    }
    return false;
  }
  return EnsureDirectory(PartitionDir(StatKind::kStrategy), out_error) &&
         EnsureDirectory(PartitionDir(StatKind::kSource), out_error);
}

std::string ReliabilityStore::PartitionDir(StatKind kind) const {
  return (std::filesystem::path(config_.root) / ToString(kind)).string();
}

std::string ReliabilityStore::RecordPath(StatKind kind, const std::string& key) const {
  return (std::filesystem::path(PartitionDir(kind)) /
          (EncodeKeyForFilename(key) + kRecordExtension))
      .string();
}

ReliabilityStore::AttemptResult ReliabilityStore::ReadStrategy(
    const std::string& name,
    StrategyStat* out_stat,
    bool* out_exists,
    std::string* out_error) const {
  std::string content;
  if (!ReadWholeFile(RecordPath(StatKind::kStrategy, name), &content,
                     out_exists, out_error)) {
    return AttemptResult::kTransient;
  }
  if (!*out_exists) {
    return AttemptResult::kOk;
  }
  if (!ParseStrategyRecord(FirstLine(content), name, out_stat, out_error)) {
    return AttemptResult::kFatal;
  }
  return AttemptResult::kOk;
}

ReliabilityStore::AttemptResult ReliabilityStore::ReadSource(
    const std::string& name,
    SourceStat* out_stat,
    bool* out_exists,
    std::string* out_error) const {
  std::string content;
  if (!ReadWholeFile(RecordPath(StatKind::kSource, name), &content,
                     out_exists, out_error)) {
    return AttemptResult::kTransient;
  }
  if (!*out_exists) {
    return AttemptResult::kOk;
  }
  if (!ParseSourceRecord(FirstLine(content), name, out_stat, out_error)) {
    return AttemptResult::kFatal;
  }
  return AttemptResult::kOk;
}

ReliabilityStore::AttemptResult ReliabilityStore::TryGetStrategy(
    const std::string& name,
    StrategyStat* out_stat,
    std::string* out_error) const {
  bool exists = false;
  AttemptResult result = ReadStrategy(name, out_stat, &exists, out_error);
  if (result != AttemptResult::kOk || exists) {
    return result;
  }

  // 首次引用：加锁后复查，避免并发创建覆盖已写入的更新。
  const std::string path = RecordPath(StatKind::kStrategy, name);
  ScopedFileLock lock;
  if (!lock.Acquire(path + kLockSuffix, config_.lock_timeout_ms, out_error)) {
    return AttemptResult::kTransient;
  }
  result = ReadStrategy(name, out_stat, &exists, out_error);
  if (result != AttemptResult::kOk || exists) {
    return result;
  }
  const StrategyStat stat = DefaultStrategy(name);
  std::string line;
  if (!SerializeStrategyRecord(stat, &line, out_error)) {
    return AttemptResult::kFatal;
  }
  if (!WriteFileAtomically(path, line + '\n', out_error)) {
    return AttemptResult::kTransient;
  }
  *out_stat = stat;
  return AttemptResult::kOk;
}

ReliabilityStore::AttemptResult ReliabilityStore::TryGetSource(
    const std::string& name,
    SourceStat* out_stat,
    std::string* out_error) const {
  bool exists = false;
  AttemptResult result = ReadSource(name, out_stat, &exists, out_error);
  if (result != AttemptResult::kOk || exists) {
    return result;
  }

  const std::string path = RecordPath(StatKind::kSource, name);
  ScopedFileLock lock;
  if (!lock.Acquire(path + kLockSuffix, config_.lock_timeout_ms, out_error)) {
    return AttemptResult::kTransient;
  }
  result = ReadSource(name, out_stat, &exists, out_error);
  if (result != AttemptResult::kOk || exists) {
    return result;
  }
  const SourceStat stat = DefaultSource(name);
  std::string line;
  if (!SerializeSourceRecord(stat, &line, out_error)) {
    return AttemptResult::kFatal;
  }
  if (!WriteFileAtomically(path, line + '\n', out_error)) {
    return AttemptResult::kTransient;
  }
  *out_stat = stat;
  return AttemptResult::kOk;
}

ReliabilityStore::AttemptResult ReliabilityStore::TryApplyStrategy(
    const std::string& name,
    bool is_win,
    const std::string& trade_id,
    StrategyStat* out_after,
    std::string* out_error) const {
  const std::string path = RecordPath(StatKind::kStrategy, name);
  ScopedFileLock lock;
  if (!lock.Acquire(path + kLockSuffix, config_.lock_timeout_ms, out_error)) {
    return AttemptResult::kTransient;
  }

  StrategyStat stat;
  bool exists = false;
  const AttemptResult read = ReadStrategy(name, &stat, &exists, out_error);
  if (read != AttemptResult::kOk) {
    return read;
  }
  if (!exists) {
    stat = DefaultStrategy(name);
  }
  if (!trade_id.empty() && stat.last_trade_id == trade_id) {
    LogInfo("策略结果已计入，跳过: strategy=" + name + ", trade_id=" + trade_id);
    if (out_after != nullptr) {
      *out_after = stat;
    }
    return AttemptResult::kOk;
  }

  if (is_win) {
    ++stat.alpha;
  } else {
    ++stat.beta;
  }
  ++stat.trades;
  stat.last_trade_id = trade_id;

  std::string line;
  if (!SerializeStrategyRecord(stat, &line, out_error)) {
    return AttemptResult::kFatal;
  }
  if (!WriteFileAtomically(path, line + '\n', out_error)) {
    return AttemptResult::kTransient;
  }
  if (out_after != nullptr) {
    *out_after = stat;
  }
  return AttemptResult::kOk;
}

ReliabilityStore::AttemptResult ReliabilityStore::CountOtherSourceObservations(
    const std::string& exclude,
    std::int64_t* out_total,
    std::string* out_error) const {
  std::vector<SourceStat> sources;
  const AttemptResult scanned = ScanSources(true, &sources, out_error);
  if (scanned != AttemptResult::kOk) {
    return scanned;
  }
  std::int64_t total = 0;
  for (const auto& source : sources) {
    if (source.name != exclude) {
      total += source.wins + source.losses;
    }
  }
  *out_total = total;
  return AttemptResult::kOk;
}

ReliabilityStore::AttemptResult ReliabilityStore::TryApplySource(
    const std::string& name,
    bool is_win,
    const std::string& trade_id,
    SourceStat* out_after,
    std::string* out_error) const {
  const std::string path = RecordPath(StatKind::kSource, name);
  ScopedFileLock lock;
  if (!lock.Acquire(path + kLockSuffix, config_.lock_timeout_ms, out_error)) {
    return AttemptResult::kTransient;
  }

  SourceStat stat;
  bool exists = false;
  const AttemptResult read = ReadSource(name, &stat, &exists, out_error);
  if (read != AttemptResult::kOk) {
    return read;
  }
  if (!exists) {
    stat = DefaultSource(name);
  }
  if (!trade_id.empty() && stat.last_trade_id == trade_id) {
    LogInfo("信号源结果已计入，跳过: source=" + name + ", trade_id=" + trade_id);
    if (out_after != nullptr) {
      *out_after = stat;
    }
    return AttemptResult::kOk;
  }

  if (is_win) {
    ++stat.wins;
  } else {
    ++stat.losses;
  }
  stat.last_trade_id = trade_id;

  // 其他 key 的记录只读不锁：读到的是某个已提交版本，分数近似即可。
  std::int64_t others = 0;
  const AttemptResult counted = CountOtherSourceObservations(name, &others, out_error);
  if (counted != AttemptResult::kOk) {
    return counted;
  }
  const std::int64_t own = stat.wins + stat.losses;
  stat.grade = GradeForRecord(stat.wins, stat.losses);
  stat.score = StoredSourceScore(stat.wins, stat.losses, others + own, ucb_exploration_);

  std::string line;
  if (!SerializeSourceRecord(stat, &line, out_error)) {
    return AttemptResult::kFatal;
  }
  if (!WriteFileAtomically(path, line + '\n', out_error)) {
    return AttemptResult::kTransient;
  }
  if (out_after != nullptr) {
    *out_after = stat;
  }
  return AttemptResult::kOk;
}

bool ReliabilityStore::GetStrategy(const std::string& name,
                                   StrategyStat* out_stat,
                                   std::string* out_error) const {
  if (out_stat == nullptr) {
    if (out_error != nullptr) {
      *out_error = "out_stat 为空";
    }
    return false;
  }
  if (!IsValidStatKey(name, out_error)) {
    return false;
  }
  return RunWithRetry(
      "get_strategy",
      [&](std::string* err) { return TryGetStrategy(name, out_stat, err); },
      out_error);
}

bool ReliabilityStore::GetSource(const std::string& name,
                                 SourceStat* out_stat,
                                 std::string* out_error) const {
  if (out_stat == nullptr) {
    if (out_error != nullptr) {
      *out_error = "out_stat 为空";
    }
    return false;
  }
  if (!IsValidStatKey(name, out_error)) {
    return false;
  }
  return RunWithRetry(
      "get_source",
      [&](std::string* err) { return TryGetSource(name, out_stat, err); },
      out_error);
}

bool ReliabilityStore::ApplyStrategyOutcome(const std::string& name,
                                            bool is_win,
                                            const std::string& trade_id,
                                            StrategyStat* out_after,
                                            std::string* out_error) const {
  if (!IsValidStatKey(name, out_error) ||
      (!trade_id.empty() && !IsValidStatKey(trade_id, out_error))) {
    return false;
  }
  return RunWithRetry(
      "apply_strategy",
      [&](std::string* err) { return TryApplyStrategy(name, is_win, trade_id, out_after, err); },
      out_error);
}

bool ReliabilityStore::ApplySourceOutcome(const std::string& name,
                                          bool is_win,
                                          const std::string& trade_id,
                                          SourceStat* out_after,
                                          std::string* out_error) const {
  if (!IsValidStatKey(name, out_error) ||
      (!trade_id.empty() && !IsValidStatKey(trade_id, out_error))) {
    return false;
  }
  return RunWithRetry(
      "apply_source",
      [&](std::string* err) { return TryApplySource(name, is_win, trade_id, out_after, err); },
      out_error);
}

bool ReliabilityStore::ApplyOutcome(StatKind kind,
                                    const std::string& key,
                                    bool is_win,
                                    const std::string& trade_id,
                                    std::string* out_error) const {
  switch (kind) {
    case StatKind::kStrategy:
      return ApplyStrategyOutcome(key, is_win, trade_id, nullptr, out_error);
    case StatKind::kSource:
      return ApplySourceOutcome(key, is_win, trade_id, nullptr, out_error);
  }
  if (out_error != nullptr) {
    *out_error = "未知统计分区";
  }
  return false;
}

ReliabilityStore::AttemptResult ReliabilityStore::ScanStrategies(
    bool skip_corrupt,
    std::vector<StrategyStat>* out_stats,
    std::string* out_error) const {
  out_stats->clear();
  const std::filesystem::path dir(PartitionDir(StatKind::kStrategy));
  std::error_code ec;
  if (!std::filesystem::exists(dir, ec)) {
    return AttemptResult::kOk;
  }
  for (const auto& entry : std::filesystem::directory_iterator(dir, ec)) {
    std::error_code entry_ec;
    if (!entry.is_regular_file(entry_ec) || entry.path().extension() != kRecordExtension) {
      continue;
    }
    std::string key;
    if (!DecodeKeyFromFilename(entry.path().stem().string(), &key)) {
      if (skip_corrupt) {
        LogWarn("跳过文件名非法的策略记录: " + entry.path().string());
        continue;
      }
      if (out_error != nullptr) {
        *out_error = "策略记录文件名非法: " + entry.path().string();
      }
      return AttemptResult::kFatal;
    }
    StrategyStat stat;
    bool exists = false;
    std::string read_error;
    const AttemptResult read = ReadStrategy(key, &stat, &exists, &read_error);
    if (read == AttemptResult::kFatal && skip_corrupt) {
      LogWarn("跳过损坏的策略记录: strategy=" + key + ", error=" + read_error);
      continue;
    }
    if (read != AttemptResult::kOk) {
      if (out_error != nullptr) {
        *out_error = read_error;
      }
      return read;
    }
    if (exists) {
      out_stats->push_back(stat);
    }
  }
  if (ec) {
    if (out_error != nullptr) {
      *out_error = "遍历策略目录失败: " + ec.message();
    }
    return AttemptResult::kTransient;
  }
  std::sort(out_stats->begin(), out_stats->end(),
            [](const StrategyStat& lhs, const StrategyStat& rhs) {
              return lhs.name < rhs.name;
            });
  return AttemptResult::kOk;
}

ReliabilityStore::AttemptResult ReliabilityStore::ScanSources(
    bool skip_corrupt,
    std::vector<SourceStat>* out_sources,
    std::string* out_error) const {
  out_sources->clear();
  const std::filesystem::path dir(PartitionDir(StatKind::kSource));
  std::error_code ec;
  if (!std::filesystem::exists(dir, ec)) {
    return AttemptResult::kOk;
  }
  for (const auto& entry : std::filesystem::directory_iterator(dir, ec)) {
    std::error_code entry_ec;
    if (!entry.is_regular_file(entry_ec) || entry.path().extension() != kRecordExtension) {
      continue;
    }
    std::string key;
    if (!DecodeKeyFromFilename(entry.path().stem().string(), &key)) {
      if (skip_corrupt) {
        LogWarn("跳过文件名非法的信号源记录: " + entry.path().string());
        continue;
      }
      if (out_error != nullptr) {
        *out_error = "信号源记录文件名非法: " + entry.path().string();
      }
      return AttemptResult::kFatal;
    }
    SourceStat stat;
    bool exists = false;
    std::string read_error;
    const AttemptResult read = ReadSource(key, &stat, &exists, &read_error);
    if (read == AttemptResult::kFatal && skip_corrupt) {
      LogWarn("跳过损坏的信号源记录: source=" + key + ", error=" + read_error);
      continue;
    }
    if (read != AttemptResult::kOk) {
      if (out_error != nullptr) {
        *out_error = read_error;
      }
      return read;
    }
    if (exists) {
      out_sources->push_back(stat);
    }
  }
  if (ec) {
    if (out_error != nullptr) {
      *out_error = "遍历信号源目录失败: " + ec.message();
    }
    return AttemptResult::kTransient;
  }
  std::sort(out_sources->begin(), out_sources->end(),
            [](const SourceStat& lhs, const SourceStat& rhs) {
              return lhs.name < rhs.name;
            });
  return AttemptResult::kOk;
}

bool ReliabilityStore::ListStrategies(std::vector<StrategyStat>* out_stats,
                                      std::string* out_error) const {
  if (out_stats == nullptr) {
    if (out_error != nullptr) {
      *out_error = "out_stats 为空";
    }
    return false;
  }
  return ScanStrategies(false, out_stats, out_error) == AttemptResult::kOk;
}

bool ReliabilityStore::ListSources(std::vector<SourceStat>* out_sources,
                                   std::string* out_error) const {
  if (out_sources == nullptr) {
    if (out_error != nullptr) {
      *out_error = "out_sources 为空";
    }
    return false;
  }
  return ScanSources(false, out_sources, out_error) == AttemptResult::kOk;
}

bool ReliabilityStore::ListReadableStrategies(std::vector<StrategyStat>* out_stats,
                                              std::string* out_error) const {
  if (out_stats == nullptr) {
    if (out_error != nullptr) {
      *out_error = "out_stats 为空";
    }
    return false;
  }
  return RunWithRetry(
      "list_strategies",
      [&](std::string* err) { return ScanStrategies(true, out_stats, err); },
      out_error);
}

bool ReliabilityStore::ListReadableSources(std::vector<SourceStat>* out_sources,
                                           std::string* out_error) const {
  if (out_sources == nullptr) {
    if (out_error != nullptr) {
      *out_error = "out_sources 为空";
    }
    return false;
  }
  return RunWithRetry(
      "list_sources",
      [&](std::string* err) { return ScanSources(true, out_sources, err); },
      out_error);
}

}  // namespace adaptive_engine
