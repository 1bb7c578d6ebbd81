#include <gtest/gtest.h>
#include "fake_wled.hpp"
#include "wled_bridge.hpp"
#include <spdlog/sinks/null_sink.h>
#include <memory>
#include <utility>

namespace {

class FixedBrowser : public ServiceBrowser {
 public:
  explicit FixedBrowser(std::vector<DiscoveredDevice> devices) : devices_(std::move(devices)) {}

  MdnsBrowseResult browse(std::chrono::milliseconds) override {
    MdnsBrowseResult result{};
    result.available = true;
    result.devices = devices_;
    return result;
  }

 private:
  std::vector<DiscoveredDevice> devices_;
};

}  // namespace

class WledBridgeTest : public ::testing::Test {
protected:
  void SetUp() override {
    desk_.set_presets(R"({"1":{"n":"Evening"},"2":{"n":"Party"}})");
    strip_.set_presets(R"({"2":{"n":"Other"},"3":{"n":"Night"}})");
    transport_ = std::make_shared<FakeTransport>();
    transport_->set_handler([this](const HttpRequest& req) -> std::optional<HttpResponse> {
      if (req.host == "192.168.1.50") return desk_.handle(req);
      if (req.host == "192.168.1.51") return strip_.handle(req);
      return http_failure(HttpOutcome::ConnectFailed);
    });
    cfg_.discovery.on_start = false;
    cfg_.poll.short_s = 1;
  }

  std::unique_ptr<WledBridge> make_bridge(std::shared_ptr<WledDiscovery> discovery = nullptr) {
    return std::make_unique<WledBridge>(cfg_, ctx_, transport_, std::move(discovery));
  }

  FakeWledDevice desk_{"Desk", "aa0000000001"};
  FakeWledDevice strip_{"Strip", "aa0000000002"};
  std::shared_ptr<FakeTransport> transport_;
  AppConfig cfg_{};
  AppContext ctx_{std::vector<spdlog::sink_ptr>{std::make_shared<spdlog::sinks::null_sink_mt>()}};
};

// =============================================================================
// Device registry
// =============================================================================

TEST_F(WledBridgeTest, AddDeviceSyncsAndDedupes) {
  auto bridge = make_bridge();
  EXPECT_TRUE(bridge->add_device("Desk", "192.168.1.50"));
  EXPECT_FALSE(bridge->add_device("Desk twice", "192.168.1.50", 80));
  EXPECT_FALSE(bridge->add_device("Nobody", ""));
  EXPECT_EQ(bridge->device_count(), 1u);

  const auto snaps = bridge->snapshot();
  ASSERT_EQ(snaps.size(), 1u);
  EXPECT_EQ(snaps[0].name, "Desk");
  EXPECT_TRUE(snaps[0].online);
  ASSERT_TRUE(snaps[0].info);
  EXPECT_EQ(snaps[0].info->led_count, 90);
  ASSERT_TRUE(snaps[0].state);
  EXPECT_EQ(snaps[0].state->brightness, 128);
}

TEST_F(WledBridgeTest, UnreachableDeviceIsKeptOffline) {
  auto bridge = make_bridge();
  EXPECT_TRUE(bridge->add_device("Ghost", "192.168.1.99"));
  const auto snaps = bridge->snapshot();
  ASSERT_EQ(snaps.size(), 1u);
  EXPECT_FALSE(snaps[0].online);
  EXPECT_FALSE(snaps[0].state.has_value());
  EXPECT_EQ(snaps[0].error.kind, WledErrorKind::Unreachable);
}

TEST_F(WledBridgeTest, RemoveDevice) {
  auto bridge = make_bridge();
  ASSERT_TRUE(bridge->add_device("Desk", "192.168.1.50"));
  EXPECT_TRUE(bridge->remove_device("192.168.1.50"));
  EXPECT_FALSE(bridge->remove_device("192.168.1.50"));
  EXPECT_EQ(bridge->device_count(), 0u);
}

// =============================================================================
// Presets
// =============================================================================

// The first device to report a preset id names it.
TEST_F(WledBridgeTest, PresetsMergeFirstWinsAndNotifySink) {
  auto bridge = make_bridge();
  ASSERT_TRUE(bridge->add_device("Desk", "192.168.1.50"));
  ASSERT_TRUE(bridge->add_device("Strip", "192.168.1.51"));

  WledPresetMap notified;
  int calls = 0;
  bridge->set_name_list_sink([&](const WledPresetMap& presets) {
    notified = presets;
    ++calls;
  });

  const WledPresetMap merged = bridge->rebuild_presets();
  ASSERT_EQ(merged.size(), 3u);
  EXPECT_EQ(merged.at(1), "Evening");
  EXPECT_EQ(merged.at(2), "Party");
  EXPECT_EQ(merged.at(3), "Night");
  EXPECT_EQ(calls, 1);
  EXPECT_EQ(notified, merged);
  EXPECT_EQ(bridge->presets(), merged);
}

TEST_F(WledBridgeTest, EmptyPresetsDoNotNotify) {
  auto bridge = make_bridge();
  ASSERT_TRUE(bridge->add_device("Ghost", "192.168.1.99"));
  int calls = 0;
  bridge->set_name_list_sink([&](const WledPresetMap&) { ++calls; });
  EXPECT_TRUE(bridge->rebuild_presets().empty());
  EXPECT_EQ(calls, 0);
}

// =============================================================================
// Commands and polling
// =============================================================================

TEST_F(WledBridgeTest, DispatchRoutesToDevice) {
  auto bridge = make_bridge();
  ASSERT_TRUE(bridge->add_device("Desk", "192.168.1.50"));

  WledCommandArgs args{};
  args.value = 100;
  EXPECT_TRUE(bridge->dispatch("192.168.1.50", 80, WledCommand::SetBrightness, args));
  EXPECT_FALSE(bridge->dispatch("192.168.1.77", 80, WledCommand::On));
  EXPECT_EQ(bridge->snapshot()[0].state->brightness, 255);

  WledCommandArgs color{};
  color.r = 10;
  color.g = 20;
  color.b = 30;
  EXPECT_TRUE(bridge->dispatch_segment("192.168.1.50", 80, 2, WledCommand::SetColor, color));
  EXPECT_EQ(bridge->snapshot()[0].state->segments[2].colors[0], wled_make_color(10, 20, 30));
  EXPECT_FALSE(bridge->dispatch_segment("192.168.1.50", 80, 2, WledCommand::SetPreset, args));
}

TEST_F(WledBridgeTest, PollRecoversOfflineDevice) {
  auto bridge = make_bridge();
  ASSERT_TRUE(bridge->add_device("Desk", "192.168.1.50"));
  transport_->fail_with(HttpOutcome::Timeout);
  bridge->poll(false);
  EXPECT_FALSE(bridge->snapshot()[0].online);
  EXPECT_TRUE(bridge->snapshot()[0].state.has_value());

  transport_->clear_failure();
  bridge->poll(true);
  EXPECT_TRUE(bridge->snapshot()[0].online);
  EXPECT_EQ(transport_->requests().back().path, "/json");
}

// =============================================================================
// Lifecycle and discovery
// =============================================================================

TEST_F(WledBridgeTest, StartAddsConfiguredDevicesAndStopIsIdempotent) {
  cfg_.devices.push_back(WledDeviceConfig{"Desk", "192.168.1.50", 80});
  cfg_.devices.push_back(WledDeviceConfig{"Strip", "192.168.1.51", 80});
  auto bridge = make_bridge();
  WledPresetMap notified;
  bridge->set_name_list_sink([&](const WledPresetMap& presets) { notified = presets; });

  bridge->start();
  EXPECT_EQ(bridge->device_count(), 2u);
  EXPECT_EQ(notified.size(), 3u);
  bridge->stop();
  bridge->stop();
}

TEST_F(WledBridgeTest, DiscoverAddsDevicesWithAddressNames) {
  DiscoveredDevice found{};
  found.address = "192.168.1.51";
  found.name = "192.168.1.51";
  auto browser = std::make_shared<FixedBrowser>(std::vector<DiscoveredDevice>{found});
  auto discovery = std::make_shared<WledDiscovery>(browser, nullptr, test_logger(),
                                                   [] { return std::optional<std::string>{}; });
  cfg_.discovery.mdns_window_ms = 1;
  auto bridge = make_bridge(discovery);

  const WledDiscoveryReport report = bridge->discover();
  EXPECT_EQ(report.devices.size(), 1u);
  ASSERT_EQ(bridge->device_count(), 1u);
  EXPECT_EQ(bridge->snapshot()[0].name, "192_168_1_51");
  EXPECT_TRUE(bridge->snapshot()[0].online);

  // A second run finds the same endpoint and adds nothing.
  bridge->discover();
  EXPECT_EQ(bridge->device_count(), 1u);
}
