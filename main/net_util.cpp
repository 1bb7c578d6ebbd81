#include "net_util.hpp"
#include <arpa/inet.h>
#include <ifaddrs.h>
#include <net/if.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>
#include <cstring>

namespace {

// Connecting a UDP socket sends nothing but makes the kernel pick the source
// address of the default route.
std::optional<std::string> route_source_ipv4() {
  const int s = socket(AF_INET, SOCK_DGRAM, 0);
  if (s < 0) {
    return std::nullopt;
  }
  sockaddr_in remote{};
  remote.sin_family = AF_INET;
  remote.sin_port = htons(53);
  inet_pton(AF_INET, "8.8.8.8", &remote.sin_addr);
  std::optional<std::string> result;
  if (connect(s, reinterpret_cast<sockaddr*>(&remote), sizeof(remote)) == 0) {
    sockaddr_in local{};
    socklen_t len = sizeof(local);
    if (getsockname(s, reinterpret_cast<sockaddr*>(&local), &len) == 0 && local.sin_addr.s_addr != 0) {
      char buf[INET_ADDRSTRLEN] = {0};
      if (inet_ntop(AF_INET, &local.sin_addr, buf, sizeof(buf))) {
        result = buf;
      }
    }
  }
  close(s);
  return result;
}

std::optional<std::string> interface_ipv4() {
  ifaddrs* ifas = nullptr;
  if (getifaddrs(&ifas) != 0) {
    return std::nullopt;
  }
  std::optional<std::string> result;
  for (ifaddrs* it = ifas; it; it = it->ifa_next) {
    if (!it->ifa_addr || it->ifa_addr->sa_family != AF_INET) {
      continue;
    }
    if (!(it->ifa_flags & IFF_UP) || (it->ifa_flags & IFF_LOOPBACK)) {
      continue;
    }
    const in_addr addr = reinterpret_cast<sockaddr_in*>(it->ifa_addr)->sin_addr;
    char buf[INET_ADDRSTRLEN] = {0};
    if (inet_ntop(AF_INET, &addr, buf, sizeof(buf))) {
      result = buf;
      break;
    }
  }
  freeifaddrs(ifas);
  return result;
}

}  // namespace

std::optional<std::string> net_local_ipv4() {
  if (auto ip = route_source_ipv4()) {
    return ip;
  }
  return interface_ipv4();
}

bool net_is_ipv4(const std::string& text) {
  in_addr addr{};
  return inet_pton(AF_INET, text.c_str(), &addr) == 1;
}

std::vector<std::string> net_subnet_candidates(const std::string& local_ip,
                                               const std::set<std::string>& excluded) {
  std::vector<std::string> out;
  in_addr addr{};
  if (inet_pton(AF_INET, local_ip.c_str(), &addr) != 1) {
    return out;
  }
  const uint32_t host = ntohl(addr.s_addr);
  const uint32_t base = host & 0xFFFFFF00u;
  out.reserve(254);
  for (uint32_t i = 1; i <= 254; ++i) {
    in_addr candidate{};
    candidate.s_addr = htonl(base | i);
    char buf[INET_ADDRSTRLEN] = {0};
    if (!inet_ntop(AF_INET, &candidate, buf, sizeof(buf))) {
      continue;
    }
    std::string ip(buf);
    if (ip == local_ip || excluded.count(ip) > 0) {
      continue;
    }
    out.push_back(std::move(ip));
  }
  return out;
}
