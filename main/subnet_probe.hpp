#pragma once
#include "wled_client/http_transport.hpp"
#include <spdlog/logger.h>
#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>

struct DiscoveredDevice {
  std::string address{};
  uint16_t port{80};
  std::string name{};
  std::string hardware_id{};
};

struct SubnetProbeOptions {
  uint32_t probe_timeout_ms{1500};
  uint32_t workers{50};
  uint32_t retry_workers{10};
  // Share of the overall budget given to the first pass, in percent.
  uint32_t first_pass_percent{70};
  // The retry pass only runs when more than this is left.
  uint32_t min_retry_budget_ms{1000};
};

// GET /json/info on one address. A device counts only when the body carries
// both "ver" and "name"; anything else is a silent negative.
std::optional<DiscoveredDevice> probe_wled_address(HttpTransport& transport, const std::string& address,
                                                   uint32_t timeout_ms);

// Two-pass, bounded-parallel identification sweep. Probes still running when
// a pass deadline expires are abandoned and their results dropped. The second
// pass takes addresses the first pass never reached, then its negatives.
// Abandoned first-pass probes may still be connecting while the second pass
// runs, so outbound connections peak at workers + retry_workers.
class SubnetProber {
 public:
  SubnetProber(std::shared_ptr<HttpTransport> transport, SubnetProbeOptions options,
               std::shared_ptr<spdlog::logger> log);

  std::vector<DiscoveredDevice> probe(const std::vector<std::string>& candidates,
                                      std::chrono::milliseconds budget);

  // Sweeps the /24 around local_ip.
  std::vector<DiscoveredDevice> scan_subnet(const std::string& local_ip,
                                            const std::set<std::string>& excluded,
                                            std::chrono::milliseconds budget);

  const SubnetProbeOptions& options() const { return options_; }

 private:
  struct PassResult {
    std::vector<DiscoveredDevice> found;
    // Completed negatives plus probes cut off at the deadline.
    std::vector<std::string> negatives;
    std::vector<std::string> unattempted;
    size_t completed{0};
  };

  PassResult run_pass(const std::vector<std::string>& addresses, uint32_t workers,
                      std::chrono::steady_clock::time_point deadline);

  std::shared_ptr<HttpTransport> transport_;
  SubnetProbeOptions options_;
  std::shared_ptr<spdlog::logger> log_;
};
