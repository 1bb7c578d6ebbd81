#pragma once

#include "mdns_browse.hpp"
#include "subnet_probe.hpp"
#include <spdlog/logger.h>
#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

struct WledDiscoveryOptions {
  std::chrono::milliseconds timeout{10000};
  std::chrono::milliseconds mdns_window{2000};
  // Floor for the probe phase budget once the mDNS window has been spent.
  std::chrono::milliseconds min_probe_budget{1000};
  // Overrides local address detection when set.
  std::string local_ip{};
};

struct WledDiscoveryReport {
  std::vector<DiscoveredDevice> devices{};
  bool mdns_available{false};
  bool local_address_found{false};
  size_t mdns_found{0};
  size_t probe_found{0};
  std::chrono::milliseconds elapsed{0};
};

using LocalAddressSource = std::function<std::optional<std::string>()>;

// mDNS window first, then a subnet sweep over the remaining budget that skips
// addresses mDNS already reported. Never fails; an empty report is a result.
class WledDiscovery {
 public:
  WledDiscovery(std::shared_ptr<ServiceBrowser> browser, std::shared_ptr<SubnetProber> prober,
                std::shared_ptr<spdlog::logger> log, LocalAddressSource local_address = {});

  WledDiscoveryReport discover(const WledDiscoveryOptions& options);

 private:
  std::shared_ptr<ServiceBrowser> browser_;
  std::shared_ptr<SubnetProber> prober_;
  std::shared_ptr<spdlog::logger> log_;
  LocalAddressSource local_address_;
};
