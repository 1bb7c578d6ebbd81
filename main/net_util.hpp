#pragma once
#include <cstdint>
#include <optional>
#include <set>
#include <string>
#include <vector>

// IPv4 of the interface holding the default route, or of the first non-loopback
// interface that is up. Empty when the host has no usable IPv4 address.
std::optional<std::string> net_local_ipv4();

bool net_is_ipv4(const std::string& text);

// Hosts .1 to .254 of the /24 containing local_ip, minus excluded addresses
// and local_ip itself. Empty when local_ip is not an IPv4 address.
std::vector<std::string> net_subnet_candidates(const std::string& local_ip,
                                               const std::set<std::string>& excluded);
