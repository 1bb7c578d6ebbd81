#include "wled_discovery.hpp"
#include "net_util.hpp"
#include <algorithm>
#include <set>
#include <utility>

namespace {

// Address-keyed merge that keeps first-seen order. Returns true when added.
bool merge_device(std::vector<DiscoveredDevice>& devices, DiscoveredDevice device) {
  if (device.address.empty()) {
    return false;
  }
  auto same_address = [&](const DiscoveredDevice& d) { return d.address == device.address; };
  auto it = std::find_if(devices.begin(), devices.end(), same_address);
  if (it != devices.end()) {
    if (it->hardware_id.empty() && !device.hardware_id.empty()) {
      it->hardware_id = device.hardware_id;
    }
    return false;
  }
  if (device.port == 0) {
    device.port = 80;
  }
  devices.push_back(std::move(device));
  return true;
}

}  // namespace

WledDiscovery::WledDiscovery(std::shared_ptr<ServiceBrowser> browser, std::shared_ptr<SubnetProber> prober,
                             std::shared_ptr<spdlog::logger> log, LocalAddressSource local_address)
    : browser_(std::move(browser)),
      prober_(std::move(prober)),
      log_(std::move(log)),
      local_address_(local_address ? std::move(local_address) : LocalAddressSource(net_local_ipv4)) {}

WledDiscoveryReport WledDiscovery::discover(const WledDiscoveryOptions& options) {
  using clock = std::chrono::steady_clock;
  const auto start = clock::now();
  WledDiscoveryReport report{};

  log_->info("WLED discovery started (budget {} ms)", options.timeout.count());

  if (browser_) {
    MdnsBrowseResult mdns = browser_->browse(options.mdns_window);
    report.mdns_available = mdns.available;
    if (!mdns.available) {
      log_->warn("mDNS unavailable, relying on subnet probe");
    }
    for (auto& device : mdns.devices) {
      log_->info("mDNS: {} at {}:{}", device.name, device.address, device.port);
      if (merge_device(report.devices, std::move(device))) {
        ++report.mdns_found;
      }
    }
  }

  std::string local_ip = options.local_ip;
  if (local_ip.empty()) {
    local_ip = local_address_().value_or(std::string{});
  }
  report.local_address_found = net_is_ipv4(local_ip);

  if (!report.local_address_found) {
    log_->warn("Could not determine local IPv4 address, skipping subnet probe");
  } else if (prober_) {
    const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(clock::now() - start);
    const auto remaining = std::max(options.timeout - elapsed, options.min_probe_budget);

    std::set<std::string> excluded;
    for (const auto& device : report.devices) {
      excluded.insert(device.address);
    }
    for (auto& device : prober_->scan_subnet(local_ip, excluded, remaining)) {
      const std::string address = device.address;
      if (merge_device(report.devices, std::move(device))) {
        ++report.probe_found;
        log_->info("Probe: new device at {}", address);
      }
    }
  }

  report.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(clock::now() - start);
  if (report.devices.empty()) {
    log_->info("No WLED devices found ({} ms)", report.elapsed.count());
  } else {
    log_->info("Discovered {} WLED device(s): {} via mDNS, {} via probe ({} ms)", report.devices.size(),
               report.mdns_found, report.probe_found, report.elapsed.count());
  }
  return report;
}
