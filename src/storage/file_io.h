#pragma once

#include <string>

namespace adaptive_engine {

/**
 * @brief 基于 `flock` 的进程间独占锁（RAII）
 *
 * 同一进程内多次 open 同一锁文件得到的是独立的打开文件描述，
 * 因此该锁同时互斥线程与进程。析构时自动释放。
 */
class ScopedFileLock {
 public:
  ScopedFileLock() = default;
  ~ScopedFileLock();

  ScopedFileLock(const ScopedFileLock&) = delete;
  ScopedFileLock& operator=(const ScopedFileLock&) = delete;

  /// 在 `timeout_ms` 内轮询获取锁；超时视为瞬时争用错误。
  bool Acquire(const std::string& lock_path, int timeout_ms, std::string* out_error);
  bool held() const { return fd_ >= 0; }

 private:
  void Release();

  int fd_{-1};  ///< 锁文件描述符；-1 表示未持有。
};

/**
 * @brief 原子替换文件内容
 *
 * 写入同目录唯一临时文件 -> fsync -> rename 覆盖 -> fsync 目录。
 * 任意一步失败都会清理临时文件，原文件保持可读。
 */
bool WriteFileAtomically(const std::string& path,
                         const std::string& content,
                         std::string* out_error);

/// 以 O_APPEND 单次 write 追加一行并 fsync；行内不得包含换行。
bool AppendLineDurably(const std::string& path,
                       const std::string& line,
                       std::string* out_error);

/// 读取整个文件；文件不存在时返回 true 且 `*out_exists=false`。
bool ReadWholeFile(const std::string& path,
                   std::string* out_content,
                   bool* out_exists,
                   std::string* out_error);

/// 确保目录存在（递归创建）。
bool EnsureDirectory(const std::string& path, std::string* out_error);

}  // namespace adaptive_engine
