#pragma once
#include "app_context.hpp"
#include <spdlog/logger.h>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

struct DiscoveryConfig {
  bool on_start{true};
  uint32_t timeout_s{10};
  uint32_t mdns_window_ms{2000};
  uint32_t probe_timeout_ms{1500};
  uint32_t workers{50};
  uint32_t retry_workers{10};
  // Empty means detect from the default route.
  std::string local_ip{};
};

struct PollConfig {
  uint32_t short_s{5};
  uint32_t long_s{60};
};

struct WledDeviceConfig {
  std::string name{};
  std::string address{};
  uint16_t port{80};
};

struct AppConfig {
  LoggingConfig logging{};
  DiscoveryConfig discovery{};
  PollConfig poll{};
  uint32_t request_timeout_ms{5000};
  std::vector<WledDeviceConfig> devices{};
  uint32_t schema_version{1};
};

// A missing file yields defaults and true. Unreadable or malformed files
// also leave defaults in place but return false.
bool config_load(const std::string& path, AppConfig& cfg, spdlog::logger& log);
bool config_save(const std::string& path, const AppConfig& cfg, spdlog::logger& log);
void config_reset_defaults(AppConfig& cfg);
bool config_apply_json(AppConfig& cfg, const char* data, size_t len, spdlog::logger& log);
std::string config_to_json(const AppConfig& cfg);

// "name1:ip1,name2:ip2,ip3". Entries without a name use the address with
// dots replaced by underscores.
std::vector<WledDeviceConfig> config_parse_device_list(const std::string& text);
