#include "storage/file_io.h"

#include <atomic>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <thread>

#include <fcntl.h>
#include <sys/file.h>
#include <sys/stat.h>
#include <unistd.h>

namespace adaptive_engine {

namespace {

std::atomic<std::uint64_t> g_temp_counter{0};

std::string ErrnoText() {
  return std::string(std::strerror(errno));
}

bool WriteAll(int fd, const std::string& content) {
  std::size_t written = 0;
  while (written < content.size()) {
    const ssize_t n = ::write(fd, content.data() + written, content.size() - written);
    if (n < 0) {
      if (errno == EINTR) {
        continue;
      }
      return false;
    }
    written += static_cast<std::size_t>(n);
  }
  return true;
}

void FsyncParentDirectory(const std::string& path) {
  const auto parent = std::filesystem::path(path).parent_path();
  const std::string dir = parent.empty() ? "." : parent.string();
  const int dir_fd = ::open(dir.c_str(), O_RDONLY | O_CLOEXEC);
  if (dir_fd < 0) {
    return;
  }
  ::fsync(dir_fd);
  ::close(dir_fd);
}

}  // namespace

ScopedFileLock::~ScopedFileLock() {
  Release();
}

void ScopedFileLock::Release() {
  if (fd_ >= 0) {
    ::flock(fd_, LOCK_UN);
    ::close(fd_);
    fd_ = -1;
  }
}

bool ScopedFileLock::Acquire(const std::string& lock_path,
                             int timeout_ms,
                             std::string* out_error) {
  Release();
  const int fd = ::open(lock_path.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
  if (fd < 0) {
    if (out_error != nullptr) {
      *out_error = "打开锁文件失败: " + lock_path + " (" + ErrnoText() + ")";
    }
    return false;
  }

  const auto deadline =
      std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
  while (true) {
    if (::flock(fd, LOCK_EX | LOCK_NB) == 0) {
      fd_ = fd;
      return true;
    }
    if (errno != EWOULDBLOCK && errno != EINTR) {
      if (out_error != nullptr) {
        *out_error = "flock 失败: " + lock_path + " (" + ErrnoText() + ")";
      }
      ::close(fd);
      return false;
    }
    if (std::chrono::steady_clock::now() >= deadline) {
      if (out_error != nullptr) {
        *out_error = "等待锁超时: " + lock_path;
      }
      ::close(fd);
      return false;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(2));
  }
}

bool WriteFileAtomically(const std::string& path,
                         const std::string& content,
                         std::string* out_error) {
  std::ostringstream tmp_name;
  tmp_name << path << ".tmp." << ::getpid() << '.'
           << g_temp_counter.fetch_add(1, std::memory_order_relaxed);
  const std::string tmp_path = tmp_name.str();

  const int fd = ::open(tmp_path.c_str(),
                        O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
  if (fd < 0) {
    if (out_error != nullptr) {
      *out_error = "创建临时文件失败: " + tmp_path + " (" + ErrnoText() + ")";
    }
    return false;
  }

  const bool written = WriteAll(fd, content) && ::fsync(fd) == 0;
  const std::string write_errno = written ? std::string() : ErrnoText();
  ::close(fd);
  if (!written) {
    ::unlink(tmp_path.c_str());
    if (out_error != nullptr) {
      *out_error = "写入临时文件失败: " + tmp_path + " (" + write_errno + ")";
    }
    return false;
  }

  if (::rename(tmp_path.c_str(), path.c_str()) != 0) {
    const std::string rename_errno = ErrnoText();
    ::unlink(tmp_path.c_str());
    if (out_error != nullptr) {
      *out_error = "rename 提交失败: " + path + " (" + rename_errno + ")";
    }
    return false;
  }
  FsyncParentDirectory(path);
  return true;
}

bool AppendLineDurably(const std::string& path,
                       const std::string& line,
                       std::string* out_error) {
  if (line.find('\n') != std::string::npos) {
    if (out_error != nullptr) {
      *out_error = "追加内容包含换行: " + path;
    }
    return false;
  }
  const int fd = ::open(path.c_str(),
                        O_WRONLY | O_CREAT | O_APPEND | O_CLOEXEC, 0644);
  if (fd < 0) {
    if (out_error != nullptr) {
      *out_error = "打开追加文件失败: " + path + " (" + ErrnoText() + ")";
    }
    return false;
  }
  // 单次 write 整行，O_APPEND 保证并发追加的行不会交叉。
  const bool ok = WriteAll(fd, line + '\n') && ::fsync(fd) == 0;
  const std::string append_errno = ok ? std::string() : ErrnoText();
  ::close(fd);
  if (!ok) {
    if (out_error != nullptr) {
      *out_error = "追加写入失败: " + path + " (" + append_errno + ")";
    }
    return false;
  }
  return true;
}

bool ReadWholeFile(const std::string& path,
                   std::string* out_content,
                   bool* out_exists,
                   std::string* out_error) {
  if (out_content == nullptr || out_exists == nullptr) {
    if (out_error != nullptr) {
      *out_error = "ReadWholeFile 输出参数为空";
    }
    return false;
  }
  out_content->clear();
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) {
    *out_exists = false;
    return true;
  }
  std::ifstream in(path, std::ios::binary);
  if (!in.is_open()) {
    if (out_error != nullptr) {
      *out_error = "打开文件失败: " + path;
    }
    return false;
  }
  std::ostringstream oss;
  oss << in.rdbuf();
  if (in.bad()) {
    if (out_error != nullptr) {
      *out_error = "读取文件失败: " + path;
    }
    return false;
  }
  *out_content = oss.str();
  *out_exists = true;
  return true;
}

bool EnsureDirectory(const std::string& path, std::string* out_error) {
  std::error_code ec;
  std::filesystem::create_directories(path, ec);
  if (ec) {
    if (out_error != nullptr) {
      *out_error = "创建目录失败: " + path + " (" + ec.message() + ")";
    }
    return false;
  }
  return true;
}

}  // namespace adaptive_engine
