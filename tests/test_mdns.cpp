#include <gtest/gtest.h>
#include "fake_wled.hpp"
#include "mdns_browse.hpp"
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>
#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace {

constexpr uint16_t TYPE_A = 1;
constexpr uint16_t TYPE_PTR = 12;
constexpr uint16_t TYPE_TXT = 16;
constexpr uint16_t TYPE_SRV = 33;

// Assembles an mDNS response one record at a time.
class PacketBuilder {
 public:
  PacketBuilder() : bytes_(12, 0) {
    bytes_[2] = 0x84;  // response, authoritative
  }

  size_t size() const { return bytes_.size(); }

  void ptr(const std::string& service, const std::string& instance) {
    begin_record(mdns_encode_name(service), TYPE_PTR, 1);
    instance_offset_ = bytes_.size() + 2;
    rdata(mdns_encode_name(instance));
  }

  // Names the owner by a compression pointer to the last PTR target.
  void srv_compressed(uint16_t port, const std::string& target) {
    const std::vector<uint8_t> pointer = {static_cast<uint8_t>(0xC0 | (instance_offset_ >> 8)),
                                          static_cast<uint8_t>(instance_offset_ & 0xFF)};
    begin_record(pointer, TYPE_SRV, 0x8001);
    std::vector<uint8_t> data = {0, 0, 0, 0, static_cast<uint8_t>(port >> 8), static_cast<uint8_t>(port & 0xFF)};
    const auto name = mdns_encode_name(target);
    data.insert(data.end(), name.begin(), name.end());
    rdata(data);
  }

  void srv(const std::string& instance, uint16_t port, const std::string& target) {
    begin_record(mdns_encode_name(instance), TYPE_SRV, 0x8001);
    std::vector<uint8_t> data = {0, 0, 0, 0, static_cast<uint8_t>(port >> 8), static_cast<uint8_t>(port & 0xFF)};
    const auto name = mdns_encode_name(target);
    data.insert(data.end(), name.begin(), name.end());
    rdata(data);
  }

  void txt(const std::string& instance, const std::vector<std::string>& entries) {
    begin_record(mdns_encode_name(instance), TYPE_TXT, 0x8001);
    std::vector<uint8_t> data;
    for (const auto& entry : entries) {
      data.push_back(static_cast<uint8_t>(entry.size()));
      data.insert(data.end(), entry.begin(), entry.end());
    }
    rdata(data);
  }

  void a(const std::string& host, uint8_t b0, uint8_t b1, uint8_t b2, uint8_t b3) {
    begin_record(mdns_encode_name(host), TYPE_A, 0x8001);
    rdata({b0, b1, b2, b3});
  }

  std::vector<uint8_t> finish() {
    bytes_[6] = static_cast<uint8_t>(answers_ >> 8);
    bytes_[7] = static_cast<uint8_t>(answers_ & 0xFF);
    return bytes_;
  }

 private:
  void begin_record(const std::vector<uint8_t>& name, uint16_t type, uint16_t klass) {
    bytes_.insert(bytes_.end(), name.begin(), name.end());
    const uint8_t fixed[8] = {static_cast<uint8_t>(type >> 8), static_cast<uint8_t>(type & 0xFF),
                              static_cast<uint8_t>(klass >> 8), static_cast<uint8_t>(klass & 0xFF),
                              0, 0, 0, 120};
    bytes_.insert(bytes_.end(), fixed, fixed + 8);
    ++answers_;
  }

  void rdata(const std::vector<uint8_t>& data) {
    bytes_.push_back(static_cast<uint8_t>(data.size() >> 8));
    bytes_.push_back(static_cast<uint8_t>(data.size() & 0xFF));
    bytes_.insert(bytes_.end(), data.begin(), data.end());
  }

  std::vector<uint8_t> bytes_;
  uint16_t answers_{0};
  size_t instance_offset_{0};
};

// A UDP socket bound to an ephemeral port without address or port sharing.
class ExclusivePort {
 public:
  ExclusivePort() : fd_(socket(AF_INET, SOCK_DGRAM, 0)) {
    if (fd_ < 0) {
      return;
    }
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_ANY);
    socklen_t len = sizeof(addr);
    if (bind(fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) == 0 &&
        getsockname(fd_, reinterpret_cast<sockaddr*>(&addr), &len) == 0) {
      port_ = ntohs(addr.sin_port);
    }
  }
  ~ExclusivePort() { release(); }
  ExclusivePort(const ExclusivePort&) = delete;
  ExclusivePort& operator=(const ExclusivePort&) = delete;

  uint16_t port() const { return port_; }
  void release() {
    if (fd_ >= 0) {
      close(fd_);
      fd_ = -1;
    }
  }

 private:
  int fd_{-1};
  uint16_t port_{0};
};

constexpr const char* UNUSED_SERVICE = "_wled-bridge-test._tcp.local";

}  // namespace

// =============================================================================
// Names and queries
// =============================================================================

TEST(Mdns, DisplayNameStripsServiceSuffix) {
  EXPECT_EQ(mdns_display_name("Kitchen._wled._tcp.local", WLED_MDNS_SERVICE), "Kitchen");
  EXPECT_EQ(mdns_display_name("Kitchen._WLED._tcp.local.", WLED_MDNS_SERVICE), "Kitchen");
  EXPECT_EQ(mdns_display_name("Kitchen", WLED_MDNS_SERVICE), "Kitchen");
  EXPECT_EQ(mdns_canonical_name("WLED-Desk.Local."), "wled-desk.local");
}

TEST(Mdns, QueryHasOneQuestionForService) {
  const auto packet = mdns_build_query(WLED_MDNS_SERVICE, TYPE_PTR);
  const auto qname = mdns_encode_name(WLED_MDNS_SERVICE);
  ASSERT_EQ(packet.size(), 12u + qname.size() + 4u);
  EXPECT_EQ(packet[5], 1);
  EXPECT_EQ(packet[12], 5);  // "_wled"
  EXPECT_EQ(packet[packet.size() - 3], TYPE_PTR);
  EXPECT_EQ(packet.back(), 1);
  EXPECT_TRUE(mdns_build_query("", TYPE_PTR).empty());
}

// =============================================================================
// Response parsing and resolution
// =============================================================================

TEST(Mdns, ResolvesPtrSrvTxtAndAddress) {
  PacketBuilder builder;
  builder.ptr("_wled._tcp.local", "Kitchen Strip._wled._tcp.local");
  builder.srv("Kitchen Strip._wled._tcp.local", 80, "wled-kitchen.local");
  builder.txt("Kitchen Strip._wled._tcp.local", {"mac=a1b2c3d4e5f6", "other"});
  builder.a("wled-kitchen.local", 192, 168, 1, 60);
  const auto packet = builder.finish();

  MdnsRecordCache cache;
  ASSERT_TRUE(mdns_parse_packet(packet.data(), packet.size(), cache));
  const auto devices = mdns_resolve(cache, WLED_MDNS_SERVICE);
  ASSERT_EQ(devices.size(), 1u);
  EXPECT_EQ(devices[0].name, "Kitchen Strip");
  EXPECT_EQ(devices[0].address, "192.168.1.60");
  EXPECT_EQ(devices[0].port, 80);
  EXPECT_EQ(devices[0].hardware_id, "a1b2c3d4e5f6");
}

TEST(Mdns, FollowsCompressionPointers) {
  PacketBuilder builder;
  builder.ptr("_wled._tcp.local", "Desk._wled._tcp.local");
  builder.srv_compressed(8080, "desk.local");
  builder.a("desk.local", 10, 0, 0, 7);
  const auto packet = builder.finish();

  MdnsRecordCache cache;
  ASSERT_TRUE(mdns_parse_packet(packet.data(), packet.size(), cache));
  const auto devices = mdns_resolve(cache, WLED_MDNS_SERVICE);
  ASSERT_EQ(devices.size(), 1u);
  EXPECT_EQ(devices[0].name, "Desk");
  EXPECT_EQ(devices[0].port, 8080);
  EXPECT_EQ(devices[0].address, "10.0.0.7");
}

// Answers spread across packets accumulate in one cache.
TEST(Mdns, RecordsMergeAcrossPackets) {
  PacketBuilder first;
  first.ptr("_wled._tcp.local", "Shelf._wled._tcp.local");
  first.srv("Shelf._wled._tcp.local", 0, "shelf.local");
  const auto p1 = first.finish();

  MdnsRecordCache cache;
  ASSERT_TRUE(mdns_parse_packet(p1.data(), p1.size(), cache));
  EXPECT_TRUE(mdns_resolve(cache, WLED_MDNS_SERVICE).empty());

  PacketBuilder second;
  second.a("shelf.local", 10, 0, 0, 9);
  const auto p2 = second.finish();
  ASSERT_TRUE(mdns_parse_packet(p2.data(), p2.size(), cache));

  const auto devices = mdns_resolve(cache, WLED_MDNS_SERVICE);
  ASSERT_EQ(devices.size(), 1u);
  EXPECT_EQ(devices[0].port, 80);
  EXPECT_TRUE(devices[0].hardware_id.empty());
}

TEST(Mdns, TwoInstancesOnOneAddressCollapse) {
  PacketBuilder builder;
  builder.ptr("_wled._tcp.local", "A._wled._tcp.local");
  builder.ptr("_wled._tcp.local", "B._wled._tcp.local");
  builder.srv("A._wled._tcp.local", 80, "same.local");
  builder.srv("B._wled._tcp.local", 80, "same.local");
  builder.a("same.local", 10, 0, 0, 3);
  const auto packet = builder.finish();

  MdnsRecordCache cache;
  ASSERT_TRUE(mdns_parse_packet(packet.data(), packet.size(), cache));
  const auto devices = mdns_resolve(cache, WLED_MDNS_SERVICE);
  ASSERT_EQ(devices.size(), 1u);
  EXPECT_EQ(devices[0].name, "A");
}

TEST(Mdns, TruncatedPacketKeepsEarlierRecords) {
  PacketBuilder builder;
  builder.ptr("_wled._tcp.local", "Cut._wled._tcp.local");
  const size_t complete = builder.size();
  builder.a("cut.local", 10, 0, 0, 4);
  auto packet = builder.finish();
  packet.resize(complete + 5);

  MdnsRecordCache cache;
  EXPECT_FALSE(mdns_parse_packet(packet.data(), packet.size(), cache));
  ASSERT_EQ(cache.ptr.count("_wled._tcp.local"), 1u);
  EXPECT_EQ(cache.ptr.at("_wled._tcp.local").front(), "cut._wled._tcp.local");

  EXPECT_FALSE(mdns_parse_packet(packet.data(), 4, cache));
}

// =============================================================================
// Browse window
// =============================================================================

// A listen port held by another process degrades to an empty, unavailable result.
TEST(MdnsBrowser, PortInUseReportsUnavailable) {
  ExclusivePort held;
  ASSERT_NE(held.port(), 0);
  MdnsBrowser browser(test_logger("mdns"), UNUSED_SERVICE, held.port());

  const MdnsBrowseResult result = browser.browse(std::chrono::milliseconds(50));
  EXPECT_FALSE(result.available);
  EXPECT_TRUE(result.devices.empty());
}

TEST(MdnsBrowser, QuietWindowOnFreePortIsAvailableAndEmpty) {
  ExclusivePort scratch;
  const uint16_t port = scratch.port();
  ASSERT_NE(port, 0);
  scratch.release();
  MdnsBrowser browser(test_logger("mdns"), UNUSED_SERVICE, port);

  const auto start = std::chrono::steady_clock::now();
  const MdnsBrowseResult result = browser.browse(std::chrono::milliseconds(100));
  const auto elapsed = std::chrono::steady_clock::now() - start;

  EXPECT_TRUE(result.available);
  EXPECT_TRUE(result.devices.empty());
  EXPECT_GE(elapsed, std::chrono::milliseconds(100));
  EXPECT_LT(elapsed, std::chrono::milliseconds(1000));
}
