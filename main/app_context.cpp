#include "app_context.hpp"
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <utility>

static constexpr size_t LOG_FILE_MAX_BYTES = 1024 * 1024;
static constexpr size_t LOG_FILE_COUNT = 3;
static constexpr const char* LOG_PATTERN = "%Y-%m-%d %H:%M:%S.%e [%^%l%$] [%n] %v";

spdlog::level::level_enum log_level_from_string(const std::string& name) {
  if (name == "trace") return spdlog::level::trace;
  if (name == "debug") return spdlog::level::debug;
  if (name == "warn" || name == "warning") return spdlog::level::warn;
  if (name == "error") return spdlog::level::err;
  if (name == "critical") return spdlog::level::critical;
  if (name == "off") return spdlog::level::off;
  return spdlog::level::info;
}

AppContext::AppContext() {
  auto console = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
  console->set_pattern(LOG_PATTERN);
  sinks_.push_back(std::move(console));
}

AppContext::AppContext(std::vector<spdlog::sink_ptr> sinks) : sinks_(std::move(sinks)) {}

bool AppContext::configure(const LoggingConfig& logging) {
  std::lock_guard<std::mutex> lock(mutex_);
  level_ = log_level_from_string(logging.level);

  spdlog::sink_ptr file_sink;
  if (!logging.file.empty()) {
    try {
      file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(logging.file, LOG_FILE_MAX_BYTES,
                                                                         LOG_FILE_COUNT);
      file_sink->set_pattern(LOG_PATTERN);
      sinks_.push_back(file_sink);
    } catch (const spdlog::spdlog_ex& ex) {
      file_error_ = ex.what();
      file_sink.reset();
    }
  }

  for (auto& entry : loggers_) {
    if (file_sink) {
      entry.second->sinks().push_back(file_sink);
    }
    entry.second->set_level(level_);
  }
  return logging.file.empty() || file_sink != nullptr;
}

std::shared_ptr<spdlog::logger> AppContext::logger(const std::string& tag) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = loggers_.find(tag);
  if (it != loggers_.end()) {
    return it->second;
  }
  auto log = std::make_shared<spdlog::logger>(tag, sinks_.begin(), sinks_.end());
  log->set_level(level_);
  loggers_.emplace(tag, log);
  return log;
}
