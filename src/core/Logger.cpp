#include "Logger.h"

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <filesystem>
#include <spdlog/sinks/rotating_file_sink.h>
#include <vector>

std::shared_ptr<spdlog::logger> Log::s_Logger;

void Log::init(const std::string &logDir) {
  std::vector<spdlog::sink_ptr> sinks;

  sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());

  if (!logDir.empty()) {
    std::error_code ec;
    std::filesystem::create_directories(logDir, ec);
    std::filesystem::path logFile =
        std::filesystem::path(logDir) / "auroracast.log";
    try {
      // 5MB per file, 3 rotated files max (15MB total)
      auto fileSink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
          logFile.string(), 5 * 1024 * 1024, 3);
      sinks.push_back(fileSink);
    } catch (const spdlog::spdlog_ex &ex) {
      std::fprintf(stderr, "Log initialization failed: %s\n", ex.what());
    }
  }

  s_Logger = std::make_shared<spdlog::logger>("AURORACAST", sinks.begin(),
                                              sinks.end());
  s_Logger->set_pattern("%^[%Y-%m-%d %H:%M:%S.%e] [%l] %v%$");
  // Default to WARN level - use --log-level to change
  s_Logger->set_level(spdlog::level::warn);
  s_Logger->flush_on(spdlog::level::warn);

  LOG_INFO("Logger initialized with {} sinks", sinks.size());
}

spdlog::level::level_enum Log::parseLevel(const std::string &name) {
  std::string lower = name;
  std::transform(lower.begin(), lower.end(), lower.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  if (lower == "trace")
    return spdlog::level::trace;
  if (lower == "debug")
    return spdlog::level::debug;
  if (lower == "info")
    return spdlog::level::info;
  if (lower == "error")
    return spdlog::level::err;
  return spdlog::level::warn;
}
