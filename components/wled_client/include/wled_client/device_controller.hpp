#pragma once
#include "wled_client.hpp"
#include <spdlog/logger.h>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>

enum class WledCommand {
  On,
  Off,
  FastOn,
  FastOff,
  Brighten,
  Dim,
  SetBrightness,
  SetEffect,
  SetPalette,
  SetPreset,
  SavePreset,
  SetColor,
  SetSpeed,
  SetIntensity,
  SetTransition,
  SetLive,
  NightlightOn,
  NightlightOff,
  SyncSend,
  SyncReceive,
  PlaylistOn,
  PlaylistOff,
  Query,
};

const char* wled_command_name(WledCommand command);
std::optional<WledCommand> wled_command_from_name(const char* name);

// Brightness, speed and intensity arrive as percentages; colors as 0-255.
struct WledCommandArgs {
  std::optional<int> value{};
  int r{255};
  int g{255};
  int b{255};
};

int wled_percent_to_byte(int percent);

class DeviceController {
 public:
  virtual ~DeviceController() = default;
  virtual bool supports(WledCommand command) const = 0;
  // Returns false for unsupported commands and failed device requests.
  virtual bool execute(WledCommand command, const WledCommandArgs& args) = 0;
};

// Whole-device command table. The client must outlive the controller.
class WledDeviceController : public DeviceController {
 public:
  WledDeviceController(WledClient& client, std::shared_ptr<spdlog::logger> log,
                       uint32_t preset_settle_ms = 300);

  bool supports(WledCommand command) const override;
  bool execute(WledCommand command, const WledCommandArgs& args) override;

  // Short poll reads /json/state, full sync reads /json.
  bool refresh(bool full_sync);

 private:
  using Handler = bool (WledDeviceController::*)(const WledCommandArgs&);
  static const std::map<WledCommand, Handler>& table();

  bool cmd_on(const WledCommandArgs& args);
  bool cmd_off(const WledCommandArgs& args);
  bool cmd_fast_on(const WledCommandArgs& args);
  bool cmd_fast_off(const WledCommandArgs& args);
  bool cmd_brighten(const WledCommandArgs& args);
  bool cmd_dim(const WledCommandArgs& args);
  bool cmd_set_brightness(const WledCommandArgs& args);
  bool cmd_set_effect(const WledCommandArgs& args);
  bool cmd_set_palette(const WledCommandArgs& args);
  bool cmd_set_preset(const WledCommandArgs& args);
  bool cmd_save_preset(const WledCommandArgs& args);
  bool cmd_set_color(const WledCommandArgs& args);
  bool cmd_set_speed(const WledCommandArgs& args);
  bool cmd_set_intensity(const WledCommandArgs& args);
  bool cmd_set_transition(const WledCommandArgs& args);
  bool cmd_set_live(const WledCommandArgs& args);
  bool cmd_nightlight_on(const WledCommandArgs& args);
  bool cmd_nightlight_off(const WledCommandArgs& args);
  bool cmd_sync_send(const WledCommandArgs& args);
  bool cmd_sync_receive(const WledCommandArgs& args);
  bool cmd_playlist_on(const WledCommandArgs& args);
  bool cmd_playlist_off(const WledCommandArgs& args);
  bool cmd_query(const WledCommandArgs& args);

  WledClient& client_;
  std::shared_ptr<spdlog::logger> log_;
  uint32_t preset_settle_ms_{300};
};

// Commands scoped to one segment of a device.
class WledSegmentController : public DeviceController {
 public:
  WledSegmentController(WledClient& client, int segment_id, std::shared_ptr<spdlog::logger> log);

  bool supports(WledCommand command) const override;
  bool execute(WledCommand command, const WledCommandArgs& args) override;

  int segment_id() const { return segment_id_; }
  // Cached view of this segment from the client's last state, if present.
  const WledSegment* segment_state() const;

 private:
  using Handler = bool (WledSegmentController::*)(const WledCommandArgs&);
  static const std::map<WledCommand, Handler>& table();

  bool cmd_on(const WledCommandArgs& args);
  bool cmd_off(const WledCommandArgs& args);
  bool cmd_set_brightness(const WledCommandArgs& args);
  bool cmd_set_effect(const WledCommandArgs& args);
  bool cmd_set_palette(const WledCommandArgs& args);
  bool cmd_set_color(const WledCommandArgs& args);
  bool cmd_query(const WledCommandArgs& args);

  WledClient& client_;
  int segment_id_{0};
  std::shared_ptr<spdlog::logger> log_;
};
