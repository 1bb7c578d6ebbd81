#include "mdns_browse.hpp"
#include <arpa/inet.h>
#include <fcntl.h>
#include <ifaddrs.h>
#include <net/if.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstring>
#include <set>
#include <utility>

static constexpr const char* MDNS_GROUP = "224.0.0.251";
static constexpr int REQUERY_INTERVAL_MS = 500;
static constexpr size_t MAX_PACKET = 9000;

namespace {

enum : uint16_t {
  T_A = 1,
  T_PTR = 12,
  T_TXT = 16,
  T_SRV = 33,
};

uint16_t rd16(const uint8_t* p) {
  return static_cast<uint16_t>((p[0] << 8) | p[1]);
}

// Follows compression pointers; empty on any malformed label.
std::string read_name(const uint8_t* buf, size_t len, size_t& off, int depth = 0) {
  if (depth > 16) {
    return {};
  }
  size_t pos = off;
  std::string out;
  while (pos < len) {
    const uint8_t lab = buf[pos++];
    if (lab == 0) {
      off = pos;
      return out.empty() ? "." : out;
    }
    if ((lab & 0xC0) == 0xC0) {
      if (pos >= len) {
        return {};
      }
      size_t target = (static_cast<size_t>(lab & 0x3F) << 8) | buf[pos++];
      if (target >= len) {
        return {};
      }
      std::string rest = read_name(buf, len, target, depth + 1);
      if (rest.empty()) {
        return {};
      }
      off = pos;
      if (!out.empty()) {
        out.push_back('.');
      }
      out += rest;
      return out;
    }
    if ((lab & 0xC0) != 0 || pos + lab > len) {
      return {};
    }
    if (!out.empty()) {
      out.push_back('.');
    }
    out.append(reinterpret_cast<const char*>(buf + pos), lab);
    pos += lab;
  }
  return {};
}

// Returns the offset after the record, or 0 when it does not fit.
size_t parse_record(const uint8_t* buf, size_t len, size_t off, MdnsRecordCache& cache) {
  size_t pos = off;
  const std::string name_raw = read_name(buf, len, pos);
  if (name_raw.empty() || pos + 10 > len) {
    return 0;
  }
  const uint16_t type = rd16(buf + pos);
  const uint16_t klass = rd16(buf + pos + 2);
  const uint16_t rdlen = rd16(buf + pos + 8);
  const size_t rdoff = pos + 10;
  const size_t next = rdoff + rdlen;
  if (next > len) {
    return 0;
  }
  if ((klass & 0x7FFF) != 1) {
    return next;
  }
  const std::string key = mdns_canonical_name(name_raw);

  if (type == T_PTR) {
    size_t t = rdoff;
    const std::string instance_raw = read_name(buf, len, t);
    if (!instance_raw.empty()) {
      const std::string instance = mdns_canonical_name(instance_raw);
      auto& list = cache.ptr[key];
      if (std::find(list.begin(), list.end(), instance) == list.end()) {
        list.push_back(instance);
      }
      std::string display = instance_raw;
      while (!display.empty() && display.back() == '.') display.pop_back();
      cache.instance_display.emplace(instance, display);
    }
  } else if (type == T_SRV && rdlen >= 6) {
    size_t t = rdoff + 6;
    const std::string target = read_name(buf, len, t);
    if (!target.empty()) {
      cache.srv[key] = MdnsSrv{rd16(buf + rdoff + 4), mdns_canonical_name(target)};
    }
  } else if (type == T_TXT) {
    std::vector<std::string> entries;
    size_t p = rdoff;
    while (p < next) {
      const uint8_t l = buf[p++];
      if (p + l > next) {
        break;
      }
      if (l > 0) {
        entries.emplace_back(reinterpret_cast<const char*>(buf + p), l);
      }
      p += l;
    }
    cache.txt[key] = std::move(entries);
  } else if (type == T_A && rdlen == 4) {
    char ip[INET_ADDRSTRLEN] = {0};
    if (inet_ntop(AF_INET, buf + rdoff, ip, sizeof(ip))) {
      auto& list = cache.ipv4[key];
      if (std::find(list.begin(), list.end(), ip) == list.end()) {
        list.emplace_back(ip);
      }
    }
  }
  return next;
}

std::string txt_value(const std::vector<std::string>& entries, const char* wanted) {
  for (const auto& entry : entries) {
    const size_t eq = entry.find('=');
    const std::string entry_key = mdns_canonical_name(entry.substr(0, eq));
    if (entry_key == wanted) {
      return eq == std::string::npos ? std::string{} : entry.substr(eq + 1);
    }
  }
  return {};
}

void join_group(int s, spdlog::logger& log) {
  in_addr group{};
  inet_pton(AF_INET, MDNS_GROUP, &group);
  int joined = 0;
  ifaddrs* ifas = nullptr;
  if (getifaddrs(&ifas) == 0) {
    for (ifaddrs* it = ifas; it; it = it->ifa_next) {
      if (!it->ifa_addr || it->ifa_addr->sa_family != AF_INET) continue;
      if (!(it->ifa_flags & IFF_UP) || (it->ifa_flags & IFF_LOOPBACK)) continue;
      if (!(it->ifa_flags & IFF_MULTICAST)) continue;
      ip_mreq mreq{};
      mreq.imr_multiaddr = group;
      mreq.imr_interface = reinterpret_cast<sockaddr_in*>(it->ifa_addr)->sin_addr;
      if (setsockopt(s, IPPROTO_IP, IP_ADD_MEMBERSHIP, &mreq, sizeof(mreq)) == 0) {
        ++joined;
      }
    }
    freeifaddrs(ifas);
  }
  if (joined == 0) {
    ip_mreq mreq{};
    mreq.imr_multiaddr = group;
    mreq.imr_interface.s_addr = htonl(INADDR_ANY);
    if (setsockopt(s, IPPROTO_IP, IP_ADD_MEMBERSHIP, &mreq, sizeof(mreq)) == 0) {
      ++joined;
    }
  }
  log.debug("Joined {} on {} interface(s)", MDNS_GROUP, joined);
}

void send_query(int s, const std::vector<uint8_t>& packet, spdlog::logger& log) {
  if (packet.empty()) {
    return;
  }
  sockaddr_in dst{};
  dst.sin_family = AF_INET;
  dst.sin_port = htons(MDNS_PORT);
  inet_pton(AF_INET, MDNS_GROUP, &dst.sin_addr);
  if (sendto(s, packet.data(), packet.size(), 0, reinterpret_cast<sockaddr*>(&dst), sizeof(dst)) < 0) {
    log.debug("mDNS send failed: {}", strerror(errno));
  }
}

}  // namespace

std::string mdns_canonical_name(const std::string& name) {
  size_t n = name.size();
  while (n > 0 && name[n - 1] == '.') --n;
  std::string out;
  out.reserve(n);
  for (size_t i = 0; i < n; ++i) {
    out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(name[i]))));
  }
  return out;
}

std::vector<uint8_t> mdns_encode_name(const std::string& fqdn) {
  std::vector<uint8_t> out;
  size_t start = 0;
  for (size_t i = 0; i <= fqdn.size(); ++i) {
    if (i == fqdn.size() || fqdn[i] == '.') {
      const size_t n = i - start;
      if (n > 63) {
        return {};
      }
      if (n > 0) {
        out.push_back(static_cast<uint8_t>(n));
        out.insert(out.end(), fqdn.begin() + static_cast<long>(start), fqdn.begin() + static_cast<long>(i));
      }
      start = i + 1;
    }
  }
  out.push_back(0);
  return out;
}

std::vector<uint8_t> mdns_build_query(const std::string& fqdn, uint16_t qtype) {
  const std::vector<uint8_t> qname = mdns_encode_name(fqdn);
  if (qname.size() <= 1) {
    return {};
  }
  // id 0, flags 0, one question
  std::vector<uint8_t> packet = {0, 0, 0, 0, 0, 1, 0, 0, 0, 0, 0, 0};
  packet.insert(packet.end(), qname.begin(), qname.end());
  packet.push_back(static_cast<uint8_t>(qtype >> 8));
  packet.push_back(static_cast<uint8_t>(qtype & 0xFF));
  packet.push_back(0);
  packet.push_back(1);
  return packet;
}

bool mdns_parse_packet(const uint8_t* data, size_t len, MdnsRecordCache& cache) {
  if (!data || len < 12) {
    return false;
  }
  const uint16_t qd = rd16(data + 4);
  const uint32_t records = static_cast<uint32_t>(rd16(data + 6)) + rd16(data + 8) + rd16(data + 10);
  size_t off = 12;
  for (uint16_t i = 0; i < qd; ++i) {
    if (read_name(data, len, off).empty() || off + 4 > len) {
      return false;
    }
    off += 4;
  }
  for (uint32_t i = 0; i < records; ++i) {
    const size_t next = parse_record(data, len, off, cache);
    if (next == 0) {
      return false;
    }
    off = next;
  }
  return true;
}

std::string mdns_display_name(const std::string& instance, const std::string& service) {
  std::string name = instance;
  while (!name.empty() && name.back() == '.') name.pop_back();
  const std::string suffix = "." + mdns_canonical_name(service);
  if (name.size() > suffix.size() &&
      mdns_canonical_name(name.substr(name.size() - suffix.size())) == suffix) {
    name.erase(name.size() - suffix.size());
  }
  return name;
}

std::vector<DiscoveredDevice> mdns_resolve(const MdnsRecordCache& cache, const std::string& service) {
  std::vector<DiscoveredDevice> out;
  const auto ptr = cache.ptr.find(mdns_canonical_name(service));
  if (ptr == cache.ptr.end()) {
    return out;
  }
  for (const auto& instance : ptr->second) {
    const auto srv = cache.srv.find(instance);
    if (srv == cache.srv.end()) {
      continue;
    }
    const auto addrs = cache.ipv4.find(srv->second.target);
    if (addrs == cache.ipv4.end() || addrs->second.empty()) {
      continue;
    }
    DiscoveredDevice device{};
    device.address = addrs->second.front();
    device.port = srv->second.port == 0 ? 80 : srv->second.port;
    const auto display = cache.instance_display.find(instance);
    device.name = mdns_display_name(display != cache.instance_display.end() ? display->second : instance, service);
    if (device.name.empty()) {
      device.name = device.address;
    }
    if (const auto txt = cache.txt.find(instance); txt != cache.txt.end()) {
      device.hardware_id = txt_value(txt->second, "mac");
    }
    const bool seen = std::any_of(out.begin(), out.end(),
                                  [&](const DiscoveredDevice& d) { return d.address == device.address; });
    if (!seen) {
      out.push_back(std::move(device));
    }
  }
  return out;
}

MdnsBrowser::MdnsBrowser(std::shared_ptr<spdlog::logger> log, std::string service, uint16_t listen_port)
    : log_(std::move(log)), service_(std::move(service)), listen_port_(listen_port) {}

int MdnsBrowser::open_socket() {
  const int s = socket(AF_INET, SOCK_DGRAM, 0);
  if (s < 0) {
    log_->warn("mDNS socket creation failed: {}", strerror(errno));
    return -1;
  }
  int yes = 1;
  setsockopt(s, SOL_SOCKET, SO_REUSEADDR, &yes, sizeof(yes));
#ifdef SO_REUSEPORT
  setsockopt(s, SOL_SOCKET, SO_REUSEPORT, &yes, sizeof(yes));
#endif
  sockaddr_in addr{};
  addr.sin_family = AF_INET;
  addr.sin_port = htons(listen_port_);
  addr.sin_addr.s_addr = htonl(INADDR_ANY);
  if (bind(s, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
    log_->warn("mDNS port {} unavailable: {}", listen_port_, strerror(errno));
    close(s);
    return -1;
  }
  join_group(s, *log_);
  uint8_t ttl = 255;
  setsockopt(s, IPPROTO_IP, IP_MULTICAST_TTL, &ttl, sizeof(ttl));
  const int flags = fcntl(s, F_GETFL, 0);
  if (flags != -1) {
    fcntl(s, F_SETFL, flags | O_NONBLOCK);
  }
  return s;
}

MdnsBrowseResult MdnsBrowser::browse(std::chrono::milliseconds window) {
  using clock = std::chrono::steady_clock;
  MdnsBrowseResult result{};
  const int s = open_socket();
  if (s < 0) {
    return result;
  }
  result.available = true;

  MdnsRecordCache cache;
  std::set<std::string> addr_queried;
  const std::vector<uint8_t> ptr_query = mdns_build_query(service_, T_PTR);
  const auto deadline = clock::now() + window;
  auto next_query = clock::now();
  std::vector<uint8_t> buf(MAX_PACKET);

  log_->debug("Browsing {} for {} ms", service_, window.count());
  while (true) {
    const auto now = clock::now();
    if (now >= deadline) {
      break;
    }
    if (now >= next_query) {
      send_query(s, ptr_query, *log_);
      next_query = now + std::chrono::milliseconds(REQUERY_INTERVAL_MS);
    }
    const auto wait = std::min(deadline, next_query) - now;
    pollfd pfd{s, POLLIN, 0};
    const int ready = poll(&pfd, 1, static_cast<int>(std::chrono::duration_cast<std::chrono::milliseconds>(wait).count()) + 1);
    if (ready < 0 && errno != EINTR) {
      log_->warn("mDNS poll failed: {}", strerror(errno));
      break;
    }
    if (ready <= 0) {
      continue;
    }
    while (true) {
      const ssize_t n = recvfrom(s, buf.data(), buf.size(), 0, nullptr, nullptr);
      if (n <= 0) {
        break;
      }
      if (!mdns_parse_packet(buf.data(), static_cast<size_t>(n), cache)) {
        log_->trace("Ignoring malformed mDNS packet ({} bytes)", n);
      }
    }
    // Ask for addresses of SRV targets that have not announced one yet.
    for (const auto& entry : cache.srv) {
      const std::string& target = entry.second.target;
      if (cache.ipv4.count(target) == 0 && addr_queried.insert(target).second) {
        send_query(s, mdns_build_query(target, T_A), *log_);
      }
    }
  }
  close(s);

  result.devices = mdns_resolve(cache, service_);
  log_->info("mDNS found {} device(s)", result.devices.size());
  return result;
}
