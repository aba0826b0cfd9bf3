#include "common/Logger.hpp"

#include "spdlog/sinks/basic_file_sink.h"
#include "spdlog/spdlog.h"

#include <filesystem>
#include <memory>

namespace LX {

static std::shared_ptr<spdlog::logger> g_logger;

static spdlog::level::level_enum ParseLevel(const std::string &level) {
  if (level == "debug") {
    return spdlog::level::debug;
  }
  if (level == "warn") {
    return spdlog::level::warn;
  }
  if (level == "error") {
    return spdlog::level::err;
  }
  return spdlog::level::info;
}

void Logger::Init(const std::string &log_file, const std::string &level) {
  std::filesystem::path log_path(log_file);
  if (log_path.has_parent_path()) {
    std::filesystem::create_directories(log_path.parent_path());
  }
  if (g_logger) {
    Shutdown();
  }
  auto file_sink =
      std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_file, false);
  g_logger = std::make_shared<spdlog::logger>("lexis", file_sink);
  // [2026-10-19 13:00:00.000] [info] [Trie.cpp:42] message
  g_logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
  g_logger->set_level(ParseLevel(level));
  // lower levels are flushed by Shutdown
  g_logger->flush_on(spdlog::level::warn);
  spdlog::set_default_logger(g_logger);
}

void Logger::Shutdown() {
  if (g_logger) {
    g_logger->flush();
    g_logger.reset();
  }
  spdlog::shutdown();
}

static void Write(spdlog::level::level_enum level, const char *file, int line,
                  const std::string &msg) {
  if (g_logger) {
    g_logger->log(level, "[{}:{}] {}",
                  std::filesystem::path(file).filename().string(), line, msg);
  }
}

void Logger::Info(const char *file, int line, const std::string &msg) {
  Write(spdlog::level::info, file, line, msg);
}

void Logger::Warn(const char *file, int line, const std::string &msg) {
  Write(spdlog::level::warn, file, line, msg);
}

void Logger::Error(const char *file, int line, const std::string &msg) {
  Write(spdlog::level::err, file, line, msg);
}

void Logger::Debug(const char *file, int line, const std::string &msg) {
  Write(spdlog::level::debug, file, line, msg);
}

} // namespace LX
