#include "core/log.h"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <ostream>

namespace adaptive_engine {

namespace {

std::mutex g_log_mutex;

void WriteLine(std::ostream& out, std::string_view level, std::string_view message) {
  // 所有级别共享同一把锁，多个线程/组件的日志按时序整行输出。
  std::lock_guard<std::mutex> lock(g_log_mutex);
  const auto now = std::chrono::system_clock::now();
  const std::time_t t = std::chrono::system_clock::to_time_t(now);
  std::tm tm{};
#if defined(_WIN32)
  localtime_s(&tm, &t);
#else
  localtime_r(&t, &tm);
#endif
  out << std::put_time(&tm, "%F %T") << " [" << level << "] " << message << '\n';
  out.flush();
}

}  // namespace

void LogInfo(std::string_view message) {
  WriteLine(std::cout, "INFO", message);
}

void LogWarn(std::string_view message) {
  WriteLine(std::cout, "WARN", message);
}

void LogError(std::string_view message) {
  WriteLine(std::cerr, "ERROR", message);
}

}  // namespace adaptive_engine
