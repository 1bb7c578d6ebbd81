#include "wled_client/device_controller.hpp"
#include <algorithm>
#include <chrono>
#include <cstring>
#include <thread>
#include <utility>

// Speed and intensity without a value saturate to full scale.
static constexpr int SPEED_INTENSITY_DEFAULT = 128;

namespace {

struct CommandName {
  WledCommand command;
  const char* name;
};

constexpr CommandName kCommandNames[] = {
    {WledCommand::On, "on"},
    {WledCommand::Off, "off"},
    {WledCommand::FastOn, "fast_on"},
    {WledCommand::FastOff, "fast_off"},
    {WledCommand::Brighten, "brighten"},
    {WledCommand::Dim, "dim"},
    {WledCommand::SetBrightness, "set_brightness"},
    {WledCommand::SetEffect, "set_effect"},
    {WledCommand::SetPalette, "set_palette"},
    {WledCommand::SetPreset, "set_preset"},
    {WledCommand::SavePreset, "save_preset"},
    {WledCommand::SetColor, "set_color"},
    {WledCommand::SetSpeed, "set_speed"},
    {WledCommand::SetIntensity, "set_intensity"},
    {WledCommand::SetTransition, "set_transition"},
    {WledCommand::SetLive, "set_live"},
    {WledCommand::NightlightOn, "nightlight_on"},
    {WledCommand::NightlightOff, "nightlight_off"},
    {WledCommand::SyncSend, "sync_send"},
    {WledCommand::SyncReceive, "sync_receive"},
    {WledCommand::PlaylistOn, "playlist_on"},
    {WledCommand::PlaylistOff, "playlist_off"},
    {WledCommand::Query, "query"},
};

constexpr int kStepBrightness = 25;

}  // namespace

const char* wled_command_name(WledCommand command) {
  for (const auto& entry : kCommandNames) {
    if (entry.command == command) {
      return entry.name;
    }
  }
  return "unknown";
}

std::optional<WledCommand> wled_command_from_name(const char* name) {
  if (!name) {
    return std::nullopt;
  }
  for (const auto& entry : kCommandNames) {
    if (strcmp(entry.name, name) == 0) {
      return entry.command;
    }
  }
  return std::nullopt;
}

int wled_percent_to_byte(int percent) {
  return std::clamp(percent, 0, 100) * 255 / 100;
}

// ---------------------------------------------------------------------------
// WledDeviceController

WledDeviceController::WledDeviceController(WledClient& client, std::shared_ptr<spdlog::logger> log,
                                           uint32_t preset_settle_ms)
    : client_(client), log_(std::move(log)), preset_settle_ms_(preset_settle_ms) {}

const std::map<WledCommand, WledDeviceController::Handler>& WledDeviceController::table() {
  static const std::map<WledCommand, Handler> handlers = {
      {WledCommand::On, &WledDeviceController::cmd_on},
      {WledCommand::Off, &WledDeviceController::cmd_off},
      {WledCommand::FastOn, &WledDeviceController::cmd_fast_on},
      {WledCommand::FastOff, &WledDeviceController::cmd_fast_off},
      {WledCommand::Brighten, &WledDeviceController::cmd_brighten},
      {WledCommand::Dim, &WledDeviceController::cmd_dim},
      {WledCommand::SetBrightness, &WledDeviceController::cmd_set_brightness},
      {WledCommand::SetEffect, &WledDeviceController::cmd_set_effect},
      {WledCommand::SetPalette, &WledDeviceController::cmd_set_palette},
      {WledCommand::SetPreset, &WledDeviceController::cmd_set_preset},
      {WledCommand::SavePreset, &WledDeviceController::cmd_save_preset},
      {WledCommand::SetColor, &WledDeviceController::cmd_set_color},
      {WledCommand::SetSpeed, &WledDeviceController::cmd_set_speed},
      {WledCommand::SetIntensity, &WledDeviceController::cmd_set_intensity},
      {WledCommand::SetTransition, &WledDeviceController::cmd_set_transition},
      {WledCommand::SetLive, &WledDeviceController::cmd_set_live},
      {WledCommand::NightlightOn, &WledDeviceController::cmd_nightlight_on},
      {WledCommand::NightlightOff, &WledDeviceController::cmd_nightlight_off},
      {WledCommand::SyncSend, &WledDeviceController::cmd_sync_send},
      {WledCommand::SyncReceive, &WledDeviceController::cmd_sync_receive},
      {WledCommand::PlaylistOn, &WledDeviceController::cmd_playlist_on},
      {WledCommand::PlaylistOff, &WledDeviceController::cmd_playlist_off},
      {WledCommand::Query, &WledDeviceController::cmd_query},
  };
  return handlers;
}

bool WledDeviceController::supports(WledCommand command) const {
  return table().count(command) > 0;
}

bool WledDeviceController::execute(WledCommand command, const WledCommandArgs& args) {
  const auto it = table().find(command);
  if (it == table().end()) {
    log_->warn("{}: command {} not supported", client_.endpoint().host, wled_command_name(command));
    return false;
  }
  log_->debug("{}: {}", client_.endpoint().host, wled_command_name(command));
  return (this->*(it->second))(args);
}

bool WledDeviceController::refresh(bool full_sync) {
  return full_sync ? client_.fetch_all() : client_.fetch_state();
}

bool WledDeviceController::cmd_on(const WledCommandArgs& args) {
  if (!client_.set_power(true)) {
    return false;
  }
  if (args.value) {
    return client_.set_brightness(wled_percent_to_byte(*args.value));
  }
  return true;
}

bool WledDeviceController::cmd_off(const WledCommandArgs&) {
  return client_.set_power(false);
}

bool WledDeviceController::cmd_fast_on(const WledCommandArgs&) {
  return client_.fast_power(true);
}

bool WledDeviceController::cmd_fast_off(const WledCommandArgs&) {
  return client_.fast_power(false);
}

bool WledDeviceController::cmd_brighten(const WledCommandArgs&) {
  const auto& state = client_.last_state();
  if (!state) {
    log_->warn("{}: brighten needs a cached state", client_.endpoint().host);
    return false;
  }
  return client_.set_brightness(std::min(255, state->brightness + kStepBrightness));
}

bool WledDeviceController::cmd_dim(const WledCommandArgs&) {
  const auto& state = client_.last_state();
  if (!state) {
    log_->warn("{}: dim needs a cached state", client_.endpoint().host);
    return false;
  }
  return client_.set_brightness(std::max(0, state->brightness - kStepBrightness));
}

bool WledDeviceController::cmd_set_brightness(const WledCommandArgs& args) {
  return client_.set_brightness(wled_percent_to_byte(args.value.value_or(100)));
}

bool WledDeviceController::cmd_set_effect(const WledCommandArgs& args) {
  return client_.set_effect(args.value.value_or(0));
}

bool WledDeviceController::cmd_set_palette(const WledCommandArgs& args) {
  return client_.set_palette(args.value.value_or(0));
}

bool WledDeviceController::cmd_set_preset(const WledCommandArgs& args) {
  if (!client_.set_preset(args.value.value_or(1))) {
    return false;
  }
  // The device applies presets asynchronously; read back once it settles.
  if (preset_settle_ms_ > 0) {
    std::this_thread::sleep_for(std::chrono::milliseconds(preset_settle_ms_));
  }
  return client_.fetch_all();
}

bool WledDeviceController::cmd_save_preset(const WledCommandArgs& args) {
  return client_.save_preset(args.value.value_or(1));
}

bool WledDeviceController::cmd_set_color(const WledCommandArgs& args) {
  return client_.set_color(args.r, args.g, args.b);
}

bool WledDeviceController::cmd_set_speed(const WledCommandArgs& args) {
  const auto& state = client_.last_state();
  if (!state) {
    log_->warn("{}: speed needs a cached state", client_.endpoint().host);
    return false;
  }
  return client_.set_effect(state->effect(), wled_percent_to_byte(args.value.value_or(SPEED_INTENSITY_DEFAULT)));
}

bool WledDeviceController::cmd_set_intensity(const WledCommandArgs& args) {
  const auto& state = client_.last_state();
  if (!state) {
    log_->warn("{}: intensity needs a cached state", client_.endpoint().host);
    return false;
  }
  return client_.set_effect(state->effect(), std::nullopt,
                            wled_percent_to_byte(args.value.value_or(SPEED_INTENSITY_DEFAULT)));
}

bool WledDeviceController::cmd_set_transition(const WledCommandArgs& args) {
  return client_.set_transition(args.value.value_or(7));
}

bool WledDeviceController::cmd_set_live(const WledCommandArgs& args) {
  return client_.set_live_override(args.value.value_or(0) > 0);
}

bool WledDeviceController::cmd_nightlight_on(const WledCommandArgs& args) {
  return client_.set_nightlight(args.value.value_or(60));
}

bool WledDeviceController::cmd_nightlight_off(const WledCommandArgs&) {
  return client_.nightlight_off();
}

bool WledDeviceController::cmd_sync_send(const WledCommandArgs& args) {
  return client_.set_sync_send(args.value.value_or(0) > 0);
}

bool WledDeviceController::cmd_sync_receive(const WledCommandArgs& args) {
  return client_.set_sync_receive(args.value.value_or(0) > 0);
}

bool WledDeviceController::cmd_playlist_on(const WledCommandArgs& args) {
  return client_.start_playlist(args.value.value_or(0));
}

bool WledDeviceController::cmd_playlist_off(const WledCommandArgs&) {
  return client_.stop_playlist();
}

bool WledDeviceController::cmd_query(const WledCommandArgs&) {
  return refresh(true);
}

// ---------------------------------------------------------------------------
// WledSegmentController

WledSegmentController::WledSegmentController(WledClient& client, int segment_id,
                                             std::shared_ptr<spdlog::logger> log)
    : client_(client), segment_id_(segment_id), log_(std::move(log)) {}

const std::map<WledCommand, WledSegmentController::Handler>& WledSegmentController::table() {
  static const std::map<WledCommand, Handler> handlers = {
      {WledCommand::On, &WledSegmentController::cmd_on},
      {WledCommand::Off, &WledSegmentController::cmd_off},
      {WledCommand::SetBrightness, &WledSegmentController::cmd_set_brightness},
      {WledCommand::SetEffect, &WledSegmentController::cmd_set_effect},
      {WledCommand::SetPalette, &WledSegmentController::cmd_set_palette},
      {WledCommand::SetColor, &WledSegmentController::cmd_set_color},
      {WledCommand::Query, &WledSegmentController::cmd_query},
  };
  return handlers;
}

bool WledSegmentController::supports(WledCommand command) const {
  return table().count(command) > 0;
}

bool WledSegmentController::execute(WledCommand command, const WledCommandArgs& args) {
  const auto it = table().find(command);
  if (it == table().end()) {
    log_->warn("{} seg {}: command {} not supported", client_.endpoint().host, segment_id_,
               wled_command_name(command));
    return false;
  }
  log_->debug("{} seg {}: {}", client_.endpoint().host, segment_id_, wled_command_name(command));
  return (this->*(it->second))(args);
}

const WledSegment* WledSegmentController::segment_state() const {
  const auto& state = client_.last_state();
  if (!state) {
    return nullptr;
  }
  for (const auto& seg : state->segments) {
    if (seg.id == segment_id_) {
      return &seg;
    }
  }
  return nullptr;
}

bool WledSegmentController::cmd_on(const WledCommandArgs& args) {
  std::optional<int> brightness;
  if (args.value) {
    brightness = wled_percent_to_byte(*args.value);
  }
  return client_.set_segment_power(segment_id_, true, brightness);
}

bool WledSegmentController::cmd_off(const WledCommandArgs&) {
  return client_.set_segment_power(segment_id_, false);
}

bool WledSegmentController::cmd_set_brightness(const WledCommandArgs& args) {
  return client_.set_segment_brightness(segment_id_, wled_percent_to_byte(args.value.value_or(100)));
}

bool WledSegmentController::cmd_set_effect(const WledCommandArgs& args) {
  return client_.set_segment_effect(segment_id_, args.value.value_or(0));
}

bool WledSegmentController::cmd_set_palette(const WledCommandArgs& args) {
  return client_.set_segment_palette(segment_id_, args.value.value_or(0));
}

bool WledSegmentController::cmd_set_color(const WledCommandArgs& args) {
  return client_.set_segment_color(segment_id_, args.r, args.g, args.b);
}

bool WledSegmentController::cmd_query(const WledCommandArgs&) {
  return client_.fetch_state();
}
