#pragma once

#include "app_context.hpp"
#include "config.hpp"
#include "wled_client.hpp"
#include "wled_client/device_controller.hpp"
#include "wled_discovery.hpp"
#include <spdlog/logger.h>
#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

// Receives the merged preset id -> name map after each preset rebuild.
using NameListSink = std::function<void(const WledPresetMap&)>;

struct WledDeviceSnapshot {
  std::string name{};
  WledEndpoint endpoint{};
  bool online{false};
  std::optional<WledState> state{};
  std::optional<WledInfo> info{};
  WledError error{};
};

class WledBridge {
 public:
  WledBridge(const AppConfig& cfg, AppContext& ctx, std::shared_ptr<HttpTransport> transport,
             std::shared_ptr<WledDiscovery> discovery);
  ~WledBridge();

  WledBridge(const WledBridge&) = delete;
  WledBridge& operator=(const WledBridge&) = delete;

  // Adds configured devices, optionally discovers, rebuilds presets and
  // starts the poll thread.
  void start();
  void stop();

  // False when host:port is already registered or host is empty.
  bool add_device(const std::string& name, const std::string& host, uint16_t port = 80);
  bool remove_device(const std::string& host, uint16_t port = 80);

  WledDiscoveryReport discover();
  void poll(bool full_sync);
  WledPresetMap rebuild_presets();

  bool dispatch(const std::string& host, uint16_t port, WledCommand command, const WledCommandArgs& args = {});
  bool dispatch_segment(const std::string& host, uint16_t port, int segment_id, WledCommand command,
                        const WledCommandArgs& args = {});

  void set_name_list_sink(NameListSink sink);

  size_t device_count() const;
  std::vector<WledDeviceSnapshot> snapshot() const;
  WledPresetMap presets() const;

 private:
  struct Device {
    std::string name;
    std::unique_ptr<WledClient> client;
    std::unique_ptr<WledDeviceController> controller;
    std::mutex mutex;
  };

  static std::string key_of(const std::string& host, uint16_t port);
  std::shared_ptr<Device> find_device(const std::string& host, uint16_t port) const;
  std::vector<std::shared_ptr<Device>> devices_copy() const;
  void poll_loop();

  AppConfig cfg_;
  std::shared_ptr<HttpTransport> transport_;
  std::shared_ptr<WledDiscovery> discovery_;
  std::shared_ptr<spdlog::logger> log_;
  std::shared_ptr<spdlog::logger> client_log_;

  mutable std::mutex mutex_;
  std::map<std::string, std::shared_ptr<Device>> devices_;
  WledPresetMap presets_;
  NameListSink sink_;

  std::mutex poll_mutex_;
  std::condition_variable poll_cv_;
  bool stop_requested_{false};
  std::thread poll_thread_;
  std::atomic<bool> running_{false};
};
