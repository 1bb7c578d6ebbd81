#include "wled_bridge.hpp"
#include <algorithm>
#include <chrono>
#include <utility>

WledBridge::WledBridge(const AppConfig& cfg, AppContext& ctx, std::shared_ptr<HttpTransport> transport,
                       std::shared_ptr<WledDiscovery> discovery)
    : cfg_(cfg),
      transport_(std::move(transport)),
      discovery_(std::move(discovery)),
      log_(ctx.logger("bridge")),
      client_log_(ctx.logger("wled_client")) {}

WledBridge::~WledBridge() {
  stop();
}

std::string WledBridge::key_of(const std::string& host, uint16_t port) {
  return host + ":" + std::to_string(port == 0 ? 80 : port);
}

std::shared_ptr<WledBridge::Device> WledBridge::find_device(const std::string& host, uint16_t port) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = devices_.find(key_of(host, port));
  return it == devices_.end() ? nullptr : it->second;
}

std::vector<std::shared_ptr<WledBridge::Device>> WledBridge::devices_copy() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<std::shared_ptr<Device>> out;
  out.reserve(devices_.size());
  for (const auto& entry : devices_) {
    out.push_back(entry.second);
  }
  return out;
}

void WledBridge::start() {
  if (running_) {
    return;
  }
  log_->info("Starting WLED bridge");
  for (const auto& dev : cfg_.devices) {
    add_device(dev.name, dev.address, dev.port);
  }
  if (cfg_.discovery.on_start) {
    discover();
  }
  if (device_count() > 0) {
    rebuild_presets();
  } else {
    log_->info("No devices configured or discovered");
  }

  {
    std::lock_guard<std::mutex> lock(poll_mutex_);
    stop_requested_ = false;
  }
  running_ = true;
  poll_thread_ = std::thread(&WledBridge::poll_loop, this);
}

void WledBridge::stop() {
  {
    std::lock_guard<std::mutex> lock(poll_mutex_);
    stop_requested_ = true;
  }
  poll_cv_.notify_all();
  if (poll_thread_.joinable()) {
    poll_thread_.join();
    log_->info("WLED bridge stopped");
  }
  running_ = false;
}

void WledBridge::poll_loop() {
  using clock = std::chrono::steady_clock;
  const auto short_interval = std::chrono::seconds(std::max<uint32_t>(1, cfg_.poll.short_s));
  const auto long_interval = std::chrono::seconds(std::max<uint32_t>(1, cfg_.poll.long_s));
  auto last_long = clock::now();

  std::unique_lock<std::mutex> lock(poll_mutex_);
  while (!stop_requested_) {
    if (poll_cv_.wait_for(lock, short_interval, [this] { return stop_requested_; })) {
      break;
    }
    lock.unlock();
    const bool full_sync = clock::now() - last_long >= long_interval;
    if (full_sync) {
      last_long = clock::now();
    }
    poll(full_sync);
    lock.lock();
  }
}

bool WledBridge::add_device(const std::string& name, const std::string& host, uint16_t port) {
  if (host.empty()) {
    return false;
  }
  if (port == 0) {
    port = 80;
  }
  const std::string key = key_of(host, port);

  auto device = std::make_shared<Device>();
  device->name = name.empty() ? host : name;
  WledEndpoint endpoint{};
  endpoint.host = host;
  endpoint.port = port;
  endpoint.timeout_ms = cfg_.request_timeout_ms;
  device->client = std::make_unique<WledClient>(endpoint, transport_, client_log_);
  device->controller = std::make_unique<WledDeviceController>(*device->client, client_log_);

  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (devices_.count(key) > 0) {
      log_->debug("Device {} already registered", key);
      return false;
    }
    devices_.emplace(key, device);
  }

  log_->info("Added WLED device {} at {}", device->name, key);
  std::lock_guard<std::mutex> lock(device->mutex);
  if (device->client->fetch_all()) {
    device->client->fetch_presets();
  } else {
    log_->warn("{} is offline: {}", device->name, device->client->last_error().describe());
  }
  return true;
}

bool WledBridge::remove_device(const std::string& host, uint16_t port) {
  std::shared_ptr<Device> removed;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = devices_.find(key_of(host, port));
    if (it == devices_.end()) {
      return false;
    }
    removed = std::move(it->second);
    devices_.erase(it);
  }
  // Wait for any in-flight command on this device.
  std::lock_guard<std::mutex> lock(removed->mutex);
  log_->info("Removed WLED device {}", removed->name);
  return true;
}

WledDiscoveryReport WledBridge::discover() {
  if (!discovery_) {
    return {};
  }
  WledDiscoveryOptions options{};
  options.timeout = std::chrono::seconds(cfg_.discovery.timeout_s);
  options.mdns_window = std::chrono::milliseconds(cfg_.discovery.mdns_window_ms);
  options.local_ip = cfg_.discovery.local_ip;

  WledDiscoveryReport report = discovery_->discover(options);
  if (!report.mdns_available && !report.local_address_found) {
    log_->error("Discovery unavailable: no mDNS socket and no local IPv4 address");
  }
  for (const auto& device : report.devices) {
    std::string name = device.name;
    if (name.empty() || name == device.address) {
      name = device.address;
      std::replace(name.begin(), name.end(), '.', '_');
    }
    add_device(name, device.address, device.port);
  }
  return report;
}

void WledBridge::poll(bool full_sync) {
  log_->debug("{} poll of {} device(s)", full_sync ? "Long" : "Short", device_count());
  for (const auto& device : devices_copy()) {
    std::lock_guard<std::mutex> lock(device->mutex);
    if (!device->controller->refresh(full_sync)) {
      log_->debug("{} poll failed: {}", device->name, device->client->last_error().describe());
    }
  }
}

WledPresetMap WledBridge::rebuild_presets() {
  log_->info("Rebuilding presets from all WLED devices");
  WledPresetMap merged;
  for (const auto& device : devices_copy()) {
    WledPresetMap presets;
    {
      std::lock_guard<std::mutex> lock(device->mutex);
      presets = device->client->fetch_presets();
    }
    for (const auto& entry : presets) {
      merged.emplace(entry.first, entry.second);
    }
  }

  NameListSink sink;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    presets_ = merged;
    sink = sink_;
  }
  if (merged.empty()) {
    log_->warn("No presets found on any device");
    return merged;
  }
  log_->info("Total unique presets: {}", merged.size());
  if (sink) {
    sink(merged);
  }
  return merged;
}

bool WledBridge::dispatch(const std::string& host, uint16_t port, WledCommand command,
                          const WledCommandArgs& args) {
  auto device = find_device(host, port);
  if (!device) {
    log_->warn("Command {} for unknown device {}", wled_command_name(command), key_of(host, port));
    return false;
  }
  std::lock_guard<std::mutex> lock(device->mutex);
  return device->controller->execute(command, args);
}

bool WledBridge::dispatch_segment(const std::string& host, uint16_t port, int segment_id,
                                  WledCommand command, const WledCommandArgs& args) {
  auto device = find_device(host, port);
  if (!device) {
    log_->warn("Segment command {} for unknown device {}", wled_command_name(command), key_of(host, port));
    return false;
  }
  std::lock_guard<std::mutex> lock(device->mutex);
  WledSegmentController segment(*device->client, segment_id, client_log_);
  return segment.execute(command, args);
}

void WledBridge::set_name_list_sink(NameListSink sink) {
  std::lock_guard<std::mutex> lock(mutex_);
  sink_ = std::move(sink);
}

size_t WledBridge::device_count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return devices_.size();
}

std::vector<WledDeviceSnapshot> WledBridge::snapshot() const {
  std::vector<WledDeviceSnapshot> out;
  for (const auto& device : devices_copy()) {
    std::lock_guard<std::mutex> lock(device->mutex);
    WledDeviceSnapshot snap{};
    snap.name = device->name;
    snap.endpoint = device->client->endpoint();
    snap.online = device->client->online();
    snap.state = device->client->last_state();
    snap.info = device->client->last_info();
    snap.error = device->client->last_error();
    out.push_back(std::move(snap));
  }
  return out;
}

WledPresetMap WledBridge::presets() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return presets_;
}
