#include "config.hpp"
#include <cjson/cJSON.h>
#include <algorithm>
#include <cctype>
#include <fstream>
#include <limits>
#include <sstream>
#include <string>
#include <utility>

static constexpr uint32_t CURRENT_SCHEMA = 1;

namespace {

std::string trim_copy(const std::string& text) {
  size_t begin = 0;
  size_t end = text.size();
  while (begin < end && std::isspace(static_cast<unsigned char>(text[begin]))) ++begin;
  while (end > begin && std::isspace(static_cast<unsigned char>(text[end - 1]))) --end;
  return text.substr(begin, end - begin);
}

std::string name_from_address(const std::string& address) {
  std::string name = address;
  std::replace(name.begin(), name.end(), '.', '_');
  return name;
}

uint32_t read_u32(cJSON* obj, const char* key, uint32_t fallback) {
  cJSON* item = cJSON_GetObjectItem(obj, key);
  if (!cJSON_IsNumber(item) || !(item->valuedouble >= 0)) {
    return fallback;
  }
  if (item->valuedouble >= static_cast<double>(std::numeric_limits<uint32_t>::max())) {
    return std::numeric_limits<uint32_t>::max();
  }
  return static_cast<uint32_t>(item->valuedouble);
}

void dedupe_devices(AppConfig& cfg) {
  if (cfg.devices.empty()) {
    return;
  }
  std::vector<WledDeviceConfig> deduped;
  std::vector<std::string> keys;
  for (auto& dev : cfg.devices) {
    if (dev.address.empty()) {
      continue;
    }
    if (dev.port == 0) {
      dev.port = 80;
    }
    const std::string key = dev.address + ":" + std::to_string(dev.port);
    if (std::find(keys.begin(), keys.end(), key) != keys.end()) {
      continue;
    }
    keys.push_back(key);
    if (dev.name.empty()) {
      dev.name = name_from_address(dev.address);
    }
    deduped.push_back(std::move(dev));
  }
  cfg.devices.swap(deduped);
}

void decode_devices(AppConfig& cfg, cJSON* root) {
  cJSON* devices = cJSON_GetObjectItem(root, "devices");
  if (!devices) {
    return;
  }
  cfg.devices.clear();
  if (cJSON_IsString(devices)) {
    cfg.devices = config_parse_device_list(devices->valuestring);
    return;
  }
  if (!cJSON_IsArray(devices)) {
    return;
  }
  cJSON* entry = nullptr;
  cJSON_ArrayForEach(entry, devices) {
    if (cJSON_IsString(entry)) {
      auto parsed = config_parse_device_list(entry->valuestring);
      cfg.devices.insert(cfg.devices.end(), parsed.begin(), parsed.end());
      continue;
    }
    if (!cJSON_IsObject(entry)) {
      continue;
    }
    WledDeviceConfig dev{};
    if (cJSON* name = cJSON_GetObjectItem(entry, "name"); cJSON_IsString(name)) dev.name = name->valuestring;
    if (cJSON* addr = cJSON_GetObjectItem(entry, "address"); cJSON_IsString(addr)) dev.address = addr->valuestring;
    if (cJSON* port = cJSON_GetObjectItem(entry, "port"); cJSON_IsNumber(port)) {
      const double value = port->valuedouble;
      dev.port = static_cast<uint16_t>(value >= 1 && value <= 65535 ? value : 80);
    }
    if (dev.address.empty()) {
      continue;
    }
    cfg.devices.push_back(std::move(dev));
  }
}

void encode_devices(const AppConfig& cfg, cJSON* root) {
  cJSON* arr = cJSON_AddArrayToObject(root, "devices");
  if (!arr) {
    return;
  }
  for (const auto& dev : cfg.devices) {
    cJSON* obj = cJSON_CreateObject();
    if (!obj) {
      continue;
    }
    cJSON_AddStringToObject(obj, "name", dev.name.c_str());
    cJSON_AddStringToObject(obj, "address", dev.address.c_str());
    cJSON_AddNumberToObject(obj, "port", dev.port);
    cJSON_AddItemToArray(arr, obj);
  }
}

bool decode_json(AppConfig& cfg, const char* json, size_t len, spdlog::logger& log) {
  cJSON* root = cJSON_ParseWithLength(json, len);
  if (!root) {
    log.warn("Failed to parse config JSON");
    return false;
  }
  if (!cJSON_IsObject(root)) {
    log.warn("Config JSON is not an object");
    cJSON_Delete(root);
    return false;
  }

  if (cJSON* lg = cJSON_GetObjectItem(root, "logging"); cJSON_IsObject(lg)) {
    if (cJSON* level = cJSON_GetObjectItem(lg, "level"); cJSON_IsString(level)) cfg.logging.level = level->valuestring;
    if (cJSON* file = cJSON_GetObjectItem(lg, "file"); cJSON_IsString(file)) cfg.logging.file = file->valuestring;
  }

  if (cJSON* disc = cJSON_GetObjectItem(root, "discovery"); cJSON_IsObject(disc)) {
    if (cJSON* on_start = cJSON_GetObjectItem(disc, "on_start"); cJSON_IsBool(on_start)) {
      cfg.discovery.on_start = cJSON_IsTrue(on_start);
    }
    cfg.discovery.timeout_s = read_u32(disc, "timeout_s", cfg.discovery.timeout_s);
    cfg.discovery.mdns_window_ms = read_u32(disc, "mdns_window_ms", cfg.discovery.mdns_window_ms);
    cfg.discovery.probe_timeout_ms = read_u32(disc, "probe_timeout_ms", cfg.discovery.probe_timeout_ms);
    cfg.discovery.workers = std::max<uint32_t>(1, read_u32(disc, "workers", cfg.discovery.workers));
    cfg.discovery.retry_workers = std::max<uint32_t>(1, read_u32(disc, "retry_workers", cfg.discovery.retry_workers));
    if (cJSON* ip = cJSON_GetObjectItem(disc, "local_ip"); cJSON_IsString(ip)) cfg.discovery.local_ip = ip->valuestring;
  }

  if (cJSON* poll = cJSON_GetObjectItem(root, "poll"); cJSON_IsObject(poll)) {
    cfg.poll.short_s = std::max<uint32_t>(1, read_u32(poll, "short_s", cfg.poll.short_s));
    cfg.poll.long_s = std::max<uint32_t>(1, read_u32(poll, "long_s", cfg.poll.long_s));
  }

  cfg.request_timeout_ms = std::max<uint32_t>(100, read_u32(root, "request_timeout_ms", cfg.request_timeout_ms));
  decode_devices(cfg, root);

  cfg.schema_version = read_u32(root, "schema_version", cfg.schema_version);

  dedupe_devices(cfg);

  cJSON_Delete(root);
  return true;
}

std::string encode_json(const AppConfig& cfg) {
  cJSON* root = cJSON_CreateObject();
  if (!root) {
    return "{}";
  }
  cJSON_AddNumberToObject(root, "schema_version", CURRENT_SCHEMA);

  cJSON* lg = cJSON_AddObjectToObject(root, "logging");
  cJSON_AddStringToObject(lg, "level", cfg.logging.level.c_str());
  cJSON_AddStringToObject(lg, "file", cfg.logging.file.c_str());

  cJSON* disc = cJSON_AddObjectToObject(root, "discovery");
  cJSON_AddBoolToObject(disc, "on_start", cfg.discovery.on_start);
  cJSON_AddNumberToObject(disc, "timeout_s", cfg.discovery.timeout_s);
  cJSON_AddNumberToObject(disc, "mdns_window_ms", cfg.discovery.mdns_window_ms);
  cJSON_AddNumberToObject(disc, "probe_timeout_ms", cfg.discovery.probe_timeout_ms);
  cJSON_AddNumberToObject(disc, "workers", cfg.discovery.workers);
  cJSON_AddNumberToObject(disc, "retry_workers", cfg.discovery.retry_workers);
  cJSON_AddStringToObject(disc, "local_ip", cfg.discovery.local_ip.c_str());

  cJSON* poll = cJSON_AddObjectToObject(root, "poll");
  cJSON_AddNumberToObject(poll, "short_s", cfg.poll.short_s);
  cJSON_AddNumberToObject(poll, "long_s", cfg.poll.long_s);

  cJSON_AddNumberToObject(root, "request_timeout_ms", cfg.request_timeout_ms);
  encode_devices(cfg, root);

  char* txt = cJSON_Print(root);
  std::string out = txt ? txt : "{}";
  if (txt) {
    cJSON_free(txt);
  }
  cJSON_Delete(root);
  return out;
}

}  // namespace

std::vector<WledDeviceConfig> config_parse_device_list(const std::string& text) {
  std::vector<WledDeviceConfig> out;
  std::stringstream stream(text);
  std::string entry;
  while (std::getline(stream, entry, ',')) {
    entry = trim_copy(entry);
    if (entry.empty()) {
      continue;
    }
    WledDeviceConfig dev{};
    const size_t colon = entry.find(':');
    if (colon != std::string::npos) {
      dev.name = trim_copy(entry.substr(0, colon));
      dev.address = trim_copy(entry.substr(colon + 1));
      if (dev.name.empty() || dev.address.empty()) {
        continue;
      }
    } else {
      dev.address = entry;
      dev.name = name_from_address(entry);
    }
    out.push_back(std::move(dev));
  }
  return out;
}

void config_reset_defaults(AppConfig& cfg) {
  cfg = AppConfig{};
  cfg.schema_version = CURRENT_SCHEMA;
}

bool config_load(const std::string& path, AppConfig& cfg, spdlog::logger& log) {
  config_reset_defaults(cfg);

  std::ifstream in(path, std::ios::binary);
  if (!in.is_open()) {
    log.info("Config {} not found, using defaults", path);
    return true;
  }
  std::ostringstream blob;
  blob << in.rdbuf();
  if (in.bad()) {
    log.error("Failed to read config {}, using defaults", path);
    return false;
  }
  const std::string text = blob.str();
  if (text.empty()) {
    log.warn("Config {} is empty, using defaults", path);
    return true;
  }

  AppConfig loaded{};
  loaded.schema_version = 0;
  if (!decode_json(loaded, text.data(), text.size(), log)) {
    log.error("Config {} is malformed, using defaults", path);
    return false;
  }
  cfg = std::move(loaded);

  if (cfg.schema_version < CURRENT_SCHEMA) {
    log.info("Schema upgrade {} -> {}", cfg.schema_version, CURRENT_SCHEMA);
    cfg.schema_version = CURRENT_SCHEMA;
    if (!config_save(path, cfg, log)) {
      log.warn("Could not rewrite upgraded config {}", path);
    }
  } else if (cfg.schema_version > CURRENT_SCHEMA) {
    log.warn("Config schema {} is newer than supported {}, using defaults", cfg.schema_version,
             CURRENT_SCHEMA);
    config_reset_defaults(cfg);
    return false;
  }
  return true;
}

bool config_save(const std::string& path, const AppConfig& cfg, spdlog::logger& log) {
  const std::string blob = encode_json(cfg);
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  if (!out.is_open()) {
    log.error("Cannot open {} for writing", path);
    return false;
  }
  out << blob << '\n';
  out.flush();
  if (!out) {
    log.error("Failed to write config {}", path);
    return false;
  }
  return true;
}

bool config_apply_json(AppConfig& cfg, const char* data, size_t len, spdlog::logger& log) {
  if (!data || len == 0) {
    return false;
  }
  return decode_json(cfg, data, len, log);
}

std::string config_to_json(const AppConfig& cfg) {
  return encode_json(cfg);
}
