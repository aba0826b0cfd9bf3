#pragma once

#include "common/Config.hpp"

#include <string>

namespace LX {
class Logger {
public:
  // level is one of "debug", "info", "warn", "error", anything else is info
  static void Init(const std::string &log_file = default_log_file,
                   const std::string &level = "info");
  static void Shutdown();

  static void Info(const char *file, int line, const std::string &msg);
  static void Warn(const char *file, int line, const std::string &msg);
  static void Error(const char *file, int line, const std::string &msg);
  static void Debug(const char *file, int line, const std::string &msg);
};
} // namespace LX

#include "fmt/format.h"

#define LOG_INFO(...)                                                          \
  LX::Logger::Info(__FILE__, __LINE__, fmt::format(__VA_ARGS__))
#define LOG_WARN(...)                                                          \
  LX::Logger::Warn(__FILE__, __LINE__, fmt::format(__VA_ARGS__))
#define LOG_ERROR(...)                                                         \
  LX::Logger::Error(__FILE__, __LINE__, fmt::format(__VA_ARGS__))
#define LOG_DEBUG(...)                                                         \
  LX::Logger::Debug(__FILE__, __LINE__, fmt::format(__VA_ARGS__))
