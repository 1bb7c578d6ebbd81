#pragma once
#include <spdlog/common.h>
#include <spdlog/logger.h>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

struct LoggingConfig {
  std::string level{"info"};
  std::string file{};
};

// Owns the log sinks and hands out one named logger per module tag. Loggers
// created before configure() pick up the file sink and level when it runs.
class AppContext {
 public:
  AppContext();
  explicit AppContext(std::vector<spdlog::sink_ptr> sinks);

  // False when the log file could not be opened; console logging continues.
  bool configure(const LoggingConfig& logging);
  std::shared_ptr<spdlog::logger> logger(const std::string& tag);
  spdlog::level::level_enum level() const { return level_; }
  const std::string& file_error() const { return file_error_; }

 private:
  std::mutex mutex_;
  std::vector<spdlog::sink_ptr> sinks_;
  spdlog::level::level_enum level_{spdlog::level::info};
  std::map<std::string, std::shared_ptr<spdlog::logger>> loggers_;
  std::string file_error_{};
};

spdlog::level::level_enum log_level_from_string(const std::string& name);
