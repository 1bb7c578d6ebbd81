#pragma once
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

struct WledEndpoint {
  std::string host{};
  uint16_t port{80};
  uint32_t timeout_ms{5000};
};

struct WledColor {
  uint8_t r{255};
  uint8_t g{255};
  uint8_t b{255};
  std::optional<uint8_t> w{};

  bool operator==(const WledColor& other) const {
    return r == other.r && g == other.g && b == other.b && w == other.w;
  }
  bool operator!=(const WledColor& other) const { return !(*this == other); }
};

struct WledSegment {
  int id{0};
  int start{0};
  int stop{0};
  int length{0};
  bool on{true};
  uint8_t brightness{255};
  int effect{0};
  uint8_t speed{128};
  uint8_t intensity{128};
  int palette{0};
  std::vector<WledColor> colors{WledColor{}};
};

struct WledNightlight {
  bool on{false};
  int duration{60};
  int mode{0};
  uint8_t target_brightness{0};
};

struct WledState {
  bool on{false};
  uint8_t brightness{0};
  int transition{7};
  int preset{-1};
  int playlist{-1};
  WledNightlight nightlight{};
  bool live{false};
  bool sync_send{false};
  bool sync_receive{true};
  int main_segment{0};
  std::vector<WledSegment> segments{};

  // nullptr when there are no segments or mainseg points past the list
  const WledSegment* main_segment_state() const {
    if (main_segment < 0 || static_cast<size_t>(main_segment) >= segments.size()) {
      return nullptr;
    }
    return &segments[static_cast<size_t>(main_segment)];
  }
  WledColor primary_color() const {
    const WledSegment* seg = main_segment_state();
    if (seg && !seg->colors.empty()) {
      return seg->colors.front();
    }
    return WledColor{};
  }
  int effect() const {
    const WledSegment* seg = main_segment_state();
    return seg ? seg->effect : 0;
  }
  int palette() const {
    const WledSegment* seg = main_segment_state();
    return seg ? seg->palette : 0;
  }
};

struct WledInfo {
  std::string version{};
  int version_id{0};
  int led_count{0};
  int max_segments{0};
  std::string name{};
  uint16_t udp_port{21324};
  bool live_support{false};
  std::string live_source{};
  std::string product{"WLED"};
  std::string brand{"wled"};
  std::string mac{};
  std::string ip{};
};

struct WledEffectMeta {
  std::string name{};
  bool is_2d{false};
  bool uses_palette{false};
  bool volume_reactive{false};
  bool frequency_reactive{false};
};

using WledPresetMap = std::map<int, std::string>;
using WledEffectMetaMap = std::map<int, WledEffectMeta>;

// Partial segment update. Unset fields are not sent.
struct WledSegmentUpdate {
  std::optional<int> id{};
  std::optional<bool> on{};
  std::optional<int> brightness{};
  std::optional<int> effect{};
  std::optional<int> speed{};
  std::optional<int> intensity{};
  std::optional<int> palette{};
  std::vector<WledColor> colors{};
};

struct WledNightlightUpdate {
  std::optional<bool> on{};
  std::optional<int> duration{};
  std::optional<int> mode{};
  std::optional<int> target_brightness{};
};

// Partial state update. Unset fields are not sent.
struct WledStateUpdate {
  std::optional<bool> on{};
  std::optional<int> brightness{};
  std::optional<int> transition{};
  std::optional<int> preset{};
  std::optional<int> save_preset{};
  std::optional<int> playlist{};
  std::optional<int> live_override{};
  std::optional<WledNightlightUpdate> nightlight{};
  std::optional<bool> sync_send{};
  std::optional<bool> sync_receive{};
  std::vector<WledSegmentUpdate> segments{};
};

enum class WledErrorKind {
  None,
  Timeout,
  Unreachable,
  HttpStatus,
  Protocol,
  Unknown,
};

struct WledError {
  WledErrorKind kind{WledErrorKind::None};
  long http_status{0};
  std::string message{};

  bool ok() const { return kind == WledErrorKind::None; }
  std::string describe() const;
};

const char* wled_error_kind_name(WledErrorKind kind);
