#pragma once
#include "wled_client/http_transport.hpp"
#include "wled_client/types.hpp"
#include <spdlog/logger.h>
#include <memory>
#include <optional>
#include <string>
#include <vector>

struct cJSON;

// Client for one WLED device. Every request either replaces the matching
// cached entity wholesale or leaves the cache untouched and marks the device
// offline. Not internally synchronized: callers serialize access.
class WledClient {
public:
  WledClient(WledEndpoint endpoint, std::shared_ptr<HttpTransport> transport,
             std::shared_ptr<spdlog::logger> log);

  bool fetch_all();
  bool fetch_state();
  bool fetch_info();
  WledPresetMap fetch_presets();
  WledEffectMetaMap fetch_effect_metadata();

  bool set_state(const WledStateUpdate& update);
  bool set_segment(int segment_id, WledSegmentUpdate update);

  bool set_power(bool on);
  bool fast_power(bool on);
  bool set_brightness(int brightness);
  bool set_effect(int effect_id, std::optional<int> speed = std::nullopt,
                  std::optional<int> intensity = std::nullopt);
  bool set_palette(int palette_id);
  bool set_color(int r, int g, int b, std::optional<int> w = std::nullopt);
  bool set_preset(int preset_id);
  bool save_preset(int preset_id);
  bool set_transition(int transition);
  bool set_live_override(bool live);
  bool set_nightlight(int duration_min);
  bool nightlight_off();
  bool set_sync_send(bool send);
  bool set_sync_receive(bool receive);
  bool start_playlist(int playlist_id);
  bool stop_playlist();

  bool set_segment_power(int segment_id, bool on, std::optional<int> brightness = std::nullopt);
  bool set_segment_brightness(int segment_id, int brightness);
  bool set_segment_effect(int segment_id, int effect_id, std::optional<int> speed = std::nullopt,
                          std::optional<int> intensity = std::nullopt);
  bool set_segment_palette(int segment_id, int palette_id);
  bool set_segment_color(int segment_id, int r, int g, int b, std::optional<int> w = std::nullopt);

  const WledEndpoint& endpoint() const { return endpoint_; }
  bool online() const { return online_; }
  const std::optional<WledState>& last_state() const { return state_; }
  const std::optional<WledInfo>& last_info() const { return info_; }
  const WledError& last_error() const { return error_; }
  const std::vector<std::string>& effects() const { return effects_; }
  const std::vector<std::string>& palettes() const { return palettes_; }
  const WledPresetMap& presets() const { return presets_; }
  const WledEffectMetaMap& effect_metadata() const { return effect_meta_; }

private:
  // Performs the exchange, updates connectivity and returns the parsed body
  // (caller owns it) or nullptr on any failure.
  cJSON* request(HttpMethod method, const char* path, const std::string& body = {});
  void mark_failed(WledError error, const char* path);

  WledEndpoint endpoint_;
  std::shared_ptr<HttpTransport> transport_;
  std::shared_ptr<spdlog::logger> log_;

  bool online_{false};
  WledError error_{};
  std::optional<WledState> state_{};
  std::optional<WledInfo> info_{};
  std::vector<std::string> effects_{};
  std::vector<std::string> palettes_{};
  WledPresetMap presets_{};
  WledEffectMetaMap effect_meta_{};
};
