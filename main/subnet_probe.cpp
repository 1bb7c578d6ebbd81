#include "subnet_probe.hpp"
#include "net_util.hpp"
#include "wled_client/codec.hpp"
#include <cjson/cJSON.h>
#include <algorithm>
#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <thread>
#include <utility>

namespace {

// Shared between the caller and its detached workers; whoever finishes last
// releases it.
struct PassState {
  std::mutex mutex;
  std::condition_variable done;
  std::vector<std::string> addresses;
  std::vector<bool> settled;
  size_t next{0};
  size_t completed{0};
  bool abandoned{false};
  std::vector<DiscoveredDevice> found;
  std::vector<std::string> negatives;
};

void pass_worker(std::shared_ptr<PassState> state, std::shared_ptr<HttpTransport> transport,
                 uint32_t timeout_ms) {
  while (true) {
    std::string address;
    size_t index = 0;
    {
      std::lock_guard<std::mutex> lock(state->mutex);
      if (state->abandoned || state->next >= state->addresses.size()) {
        return;
      }
      index = state->next++;
      address = state->addresses[index];
    }

    std::optional<DiscoveredDevice> device = probe_wled_address(*transport, address, timeout_ms);

    std::lock_guard<std::mutex> lock(state->mutex);
    if (state->abandoned) {
      return;
    }
    if (device) {
      const bool seen = std::any_of(state->found.begin(), state->found.end(),
                                    [&](const DiscoveredDevice& d) { return d.address == device->address; });
      if (!seen) {
        state->found.push_back(std::move(*device));
      }
    } else {
      state->negatives.push_back(address);
    }
    state->settled[index] = true;
    ++state->completed;
    if (state->completed == state->addresses.size()) {
      state->done.notify_all();
    }
  }
}

}  // namespace

std::optional<DiscoveredDevice> probe_wled_address(HttpTransport& transport, const std::string& address,
                                                   uint32_t timeout_ms) {
  HttpRequest req{};
  req.method = HttpMethod::Get;
  req.host = address;
  req.port = 80;
  req.path = "/json/info";
  req.timeout_ms = timeout_ms;

  const HttpResponse resp = transport.perform(req);
  if (resp.outcome != HttpOutcome::Completed || resp.status != 200 || resp.body.empty()) {
    return std::nullopt;
  }
  cJSON* root = cJSON_ParseWithLength(resp.body.c_str(), resp.body.size());
  if (!root) {
    return std::nullopt;
  }
  std::optional<DiscoveredDevice> result;
  if (wled_info_identifies_device(root)) {
    DiscoveredDevice device{};
    device.address = address;
    device.port = 80;
    if (cJSON* name = cJSON_GetObjectItem(root, "name"); cJSON_IsString(name) && name->valuestring[0] != '\0') {
      device.name = name->valuestring;
    } else {
      device.name = address;
    }
    if (cJSON* mac = cJSON_GetObjectItem(root, "mac"); cJSON_IsString(mac)) {
      device.hardware_id = mac->valuestring;
    }
    result = std::move(device);
  }
  cJSON_Delete(root);
  return result;
}

SubnetProber::SubnetProber(std::shared_ptr<HttpTransport> transport, SubnetProbeOptions options,
                           std::shared_ptr<spdlog::logger> log)
    : transport_(std::move(transport)), options_(options), log_(std::move(log)) {
  options_.workers = std::max<uint32_t>(1, options_.workers);
  options_.retry_workers = std::max<uint32_t>(1, options_.retry_workers);
  options_.first_pass_percent = std::min<uint32_t>(100, std::max<uint32_t>(1, options_.first_pass_percent));
}

SubnetProber::PassResult SubnetProber::run_pass(const std::vector<std::string>& addresses, uint32_t workers,
                                                std::chrono::steady_clock::time_point deadline) {
  PassResult result{};
  if (addresses.empty()) {
    return result;
  }
  auto state = std::make_shared<PassState>();
  state->addresses = addresses;
  state->settled.assign(addresses.size(), false);

  const size_t width = std::min<size_t>(workers, addresses.size());
  for (size_t i = 0; i < width; ++i) {
    std::thread(pass_worker, state, transport_, options_.probe_timeout_ms).detach();
  }

  std::unique_lock<std::mutex> lock(state->mutex);
  const bool drained = state->done.wait_until(lock, deadline, [&] {
    return state->completed == state->addresses.size();
  });
  state->abandoned = true;
  if (!drained) {
    log_->debug("Probe pass deadline hit with {}/{} addresses answered", state->completed,
                state->addresses.size());
  }
  result.found = state->found;
  result.negatives = state->negatives;
  // In-flight probes cut off by the deadline count as negatives.
  for (size_t i = 0; i < state->next; ++i) {
    if (!state->settled[i]) {
      result.negatives.push_back(state->addresses[i]);
    }
  }
  result.unattempted.assign(state->addresses.begin() + static_cast<std::ptrdiff_t>(state->next),
                            state->addresses.end());
  result.completed = state->completed;
  return result;
}

std::vector<DiscoveredDevice> SubnetProber::probe(const std::vector<std::string>& candidates,
                                                  std::chrono::milliseconds budget) {
  using clock = std::chrono::steady_clock;
  const auto start = clock::now();
  const auto hard_deadline = start + budget;
  const auto first_deadline = start + budget * options_.first_pass_percent / 100;

  log_->info("Probing {} addresses ({} workers, budget {} ms)", candidates.size(), options_.workers,
             budget.count());
  PassResult first = run_pass(candidates, options_.workers, first_deadline);
  std::vector<DiscoveredDevice> found = std::move(first.found);

  const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(hard_deadline - clock::now());
  const bool pending = !first.unattempted.empty() || !first.negatives.empty();
  if (pending && remaining > std::chrono::milliseconds(options_.min_retry_budget_ms)) {
    // Addresses the first pass never reached go ahead of the ones it already tried.
    std::vector<std::string> retry;
    for (const auto* list : {&first.unattempted, &first.negatives}) {
      for (const auto& address : *list) {
        const bool confirmed = std::any_of(found.begin(), found.end(),
                                           [&](const DiscoveredDevice& d) { return d.address == address; });
        if (!confirmed && std::find(retry.begin(), retry.end(), address) == retry.end()) {
          retry.push_back(address);
        }
      }
    }
    log_->debug("Retrying {} addresses ({} never reached) with {} ms left", retry.size(),
                first.unattempted.size(), remaining.count());
    PassResult second = run_pass(retry, options_.retry_workers, hard_deadline);
    for (auto& device : second.found) {
      const bool seen = std::any_of(found.begin(), found.end(),
                                    [&](const DiscoveredDevice& d) { return d.address == device.address; });
      if (!seen) {
        found.push_back(std::move(device));
      }
    }
  }

  log_->info("Subnet probe found {} device(s)", found.size());
  return found;
}

std::vector<DiscoveredDevice> SubnetProber::scan_subnet(const std::string& local_ip,
                                                        const std::set<std::string>& excluded,
                                                        std::chrono::milliseconds budget) {
  const std::vector<std::string> candidates = net_subnet_candidates(local_ip, excluded);
  if (candidates.empty()) {
    log_->warn("No probe candidates around {}", local_ip);
    return {};
  }
  return probe(candidates, budget);
}
