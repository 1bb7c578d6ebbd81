#pragma once
#include "subnet_probe.hpp"
#include <spdlog/logger.h>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <vector>

static constexpr const char* WLED_MDNS_SERVICE = "_wled._tcp.local";
static constexpr uint16_t MDNS_PORT = 5353;

struct MdnsSrv {
  uint16_t port{0};
  std::string target{};
};

// Records gathered from responses, keyed by lowercased names without the
// trailing dot. Instance order follows first appearance.
struct MdnsRecordCache {
  std::map<std::string, std::vector<std::string>> ptr;
  std::map<std::string, std::string> instance_display;
  std::map<std::string, MdnsSrv> srv;
  std::map<std::string, std::vector<std::string>> txt;
  std::map<std::string, std::vector<std::string>> ipv4;
};

struct MdnsBrowseResult {
  // False when the multicast socket could not be opened or bound.
  bool available{false};
  std::vector<DiscoveredDevice> devices{};
};

std::string mdns_canonical_name(const std::string& name);
std::vector<uint8_t> mdns_encode_name(const std::string& fqdn);
std::vector<uint8_t> mdns_build_query(const std::string& fqdn, uint16_t qtype);

// Merges every answer, authority and additional record of one packet into
// the cache. Returns false for truncated or malformed packets; records read
// before the fault are kept.
bool mdns_parse_packet(const uint8_t* data, size_t len, MdnsRecordCache& cache);

// Instance name without the service suffix: "Kitchen._wled._tcp.local" -> "Kitchen".
std::string mdns_display_name(const std::string& instance, const std::string& service);

// Joins PTR -> SRV -> A for the service. Instances without an IPv4 address
// are dropped; duplicates by address are collapsed.
std::vector<DiscoveredDevice> mdns_resolve(const MdnsRecordCache& cache, const std::string& service);

class ServiceBrowser {
 public:
  virtual ~ServiceBrowser() = default;
  virtual MdnsBrowseResult browse(std::chrono::milliseconds window) = 0;
};

// Passive-window mDNS browse for _wled._tcp over IPv4. Runs on the caller's
// thread and never contacts the discovered devices. Queries always go to the
// group on 5353; listen_port only picks the local socket.
class MdnsBrowser : public ServiceBrowser {
 public:
  explicit MdnsBrowser(std::shared_ptr<spdlog::logger> log, std::string service = WLED_MDNS_SERVICE,
                       uint16_t listen_port = MDNS_PORT);
  MdnsBrowseResult browse(std::chrono::milliseconds window) override;

 private:
  int open_socket();

  std::shared_ptr<spdlog::logger> log_;
  std::string service_;
  uint16_t listen_port_;
};
