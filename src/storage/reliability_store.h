#pragma once

#include <string>
#include <utility>
#include <vector>

#include "core/config.h"
#include "core/types.h"

namespace adaptive_engine {

/**
 * @brief 策略/信号源可靠性统计的持久化存储
 *
 * 布局：`<root>/strategies/<key>.rec` 与 `<root>/sources/<key>.rec`，每个文件一行记录。
 *
 * 语义：
 * 1. 单 key 读-改-写在 `<key>.rec.lock` 的 flock 下完成，跨线程/跨进程不丢更新；
 * 2. 写入走 临时文件 + fsync + rename，读者无需加锁，只会看到旧记录或新记录；
 * 3. 记录带 SHA-256 摘要，校验失败报告为损坏，绝不静默重置；
 * 4. 锁超时与 I/O 失败视为瞬时错误，按配置退避重试。
 */
class ReliabilityStore {
 public:
  ReliabilityStore(StoreConfig config, double ucb_exploration)
      : config_(std::move(config)), ucb_exploration_(ucb_exploration) {}

  /// 创建根目录与两个分区目录。
  bool Initialize(std::string* out_error) const;

  /// 读取策略记录；不存在时持久化默认值 Beta(1,1) 后返回。
  bool GetStrategy(const std::string& name,
                   StrategyStat* out_stat,
                   std::string* out_error) const;
  /// 读取信号源记录；不存在时持久化冷启动默认值后返回。
  bool GetSource(const std::string& name,
                 SourceStat* out_stat,
                 std::string* out_error) const;

  /**
   * @brief 按分区应用一次胜负结果（原子读-改-写）
   *
   * `trade_id` 非空时随记录一起落盘；若记录的 last_trade_id 已等于它，
   * 说明该结果已提交过（崩溃发生在提交之后、日志标记之前），本次不再累加。
   */
  bool ApplyOutcome(StatKind kind,
                    const std::string& key,
                    bool is_win,
                    const std::string& trade_id,
                    std::string* out_error) const;
  bool ApplyStrategyOutcome(const std::string& name,
                            bool is_win,
                            const std::string& trade_id,
                            StrategyStat* out_after,
                            std::string* out_error) const;
  bool ApplySourceOutcome(const std::string& name,
                          bool is_win,
                          const std::string& trade_id,
                          SourceStat* out_after,
                          std::string* out_error) const;

  /// 枚举分区内全部记录（按 key 排序）；任一记录损坏即返回错误。
  bool ListStrategies(std::vector<StrategyStat>* out_stats,
                      std::string* out_error) const;
  bool ListSources(std::vector<SourceStat>* out_sources,
                   std::string* out_error) const;

  /// 枚举分区内可读的记录：损坏记录告警后跳过，只影响它自己的 key。
  bool ListReadableStrategies(std::vector<StrategyStat>* out_stats,
                              std::string* out_error) const;
  bool ListReadableSources(std::vector<SourceStat>* out_sources,
                           std::string* out_error) const;

  const StoreConfig& config() const { return config_; }

 private:
  /// 单次尝试结果：瞬时错误可重试，损坏/参数错误不可重试。
  enum class AttemptResult {
    kOk,
    kTransient,
    kFatal,
  };

  std::string PartitionDir(StatKind kind) const;
  std::string RecordPath(StatKind kind, const std::string& key) const;

  AttemptResult ReadStrategy(const std::string& name,
                             StrategyStat* out_stat,
                             bool* out_exists,
                             std::string* out_error) const;
  AttemptResult ReadSource(const std::string& name,
                           SourceStat* out_stat,
                           bool* out_exists,
                           std::string* out_error) const;

  AttemptResult TryGetStrategy(const std::string& name,
                               StrategyStat* out_stat,
                               std::string* out_error) const;
  AttemptResult TryGetSource(const std::string& name,
                             SourceStat* out_stat,
                             std::string* out_error) const;
  AttemptResult TryApplyStrategy(const std::string& name,
                                 bool is_win,
                                 const std::string& trade_id,
                                 StrategyStat* out_after,
                                 std::string* out_error) const;
  AttemptResult TryApplySource(const std::string& name,
                               bool is_win,
                               const std::string& trade_id,
                               SourceStat* out_after,
                               std::string* out_error) const;

  /// 扫描分区；`skip_corrupt` 为真时跳过损坏记录，否则损坏即失败。
  AttemptResult ScanStrategies(bool skip_corrupt,
                               std::vector<StrategyStat>* out_stats,
                               std::string* out_error) const;
  AttemptResult ScanSources(bool skip_corrupt,
                            std::vector<SourceStat>* out_sources,
                            std::string* out_error) const;

  /// 统计除 `exclude` 之外所有可读信号源的观测总数。
  AttemptResult CountOtherSourceObservations(const std::string& exclude,
                                             std::int64_t* out_total,
                                             std::string* out_error) const;

  /// 按 max_attempts/retry_backoff_ms 重试 `attempt`。
  template <typename Fn>
  bool RunWithRetry(const char* op_name, Fn&& attempt, std::string* out_error) const;

  StoreConfig config_;
  double ucb_exploration_{2.0};
};

}  // namespace adaptive_engine
