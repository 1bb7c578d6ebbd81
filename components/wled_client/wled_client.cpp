#include "wled_client.hpp"
#include "wled_client/codec.hpp"
#include <cjson/cJSON.h>
#include <algorithm>
#include <utility>

const char* wled_error_kind_name(WledErrorKind kind) {
  switch (kind) {
    case WledErrorKind::None:
      return "none";
    case WledErrorKind::Timeout:
      return "timeout";
    case WledErrorKind::Unreachable:
      return "connection-refused-or-unreachable";
    case WledErrorKind::HttpStatus:
      return "unexpected-http-status";
    case WledErrorKind::Protocol:
      return "protocol-error";
    case WledErrorKind::Unknown:
      return "unknown";
  }
  return "unknown";
}

std::string WledError::describe() const {
  std::string out = wled_error_kind_name(kind);
  if (kind == WledErrorKind::HttpStatus) {
    out += "(" + std::to_string(http_status) + ")";
  }
  if (!message.empty()) {
    out += ": " + message;
  }
  return out;
}

WledClient::WledClient(WledEndpoint endpoint, std::shared_ptr<HttpTransport> transport,
                       std::shared_ptr<spdlog::logger> log)
    : endpoint_(std::move(endpoint)), transport_(std::move(transport)), log_(std::move(log)) {
  if (endpoint_.port == 0) {
    endpoint_.port = 80;
  }
}

void WledClient::mark_failed(WledError error, const char* path) {
  online_ = false;
  error_ = std::move(error);
  log_->warn("WLED {}: {} on {}", endpoint_.host, error_.describe(), path);
}

cJSON* WledClient::request(HttpMethod method, const char* path, const std::string& body) {
  HttpRequest req{};
  req.method = method;
  req.host = endpoint_.host;
  req.port = endpoint_.port;
  req.path = path;
  req.body = body;
  req.timeout_ms = endpoint_.timeout_ms;

  const HttpResponse resp = transport_->perform(req);
  switch (resp.outcome) {
    case HttpOutcome::Completed:
      break;
    case HttpOutcome::Timeout:
      mark_failed(WledError{WledErrorKind::Timeout, 0, resp.error}, path);
      return nullptr;
    case HttpOutcome::ConnectFailed:
      mark_failed(WledError{WledErrorKind::Unreachable, 0, resp.error}, path);
      return nullptr;
    case HttpOutcome::Failed:
      mark_failed(WledError{WledErrorKind::Unknown, 0, resp.error}, path);
      return nullptr;
  }

  if (resp.status != 200) {
    mark_failed(WledError{WledErrorKind::HttpStatus, resp.status, {}}, path);
    return nullptr;
  }

  cJSON* root = cJSON_ParseWithLength(resp.body.c_str(), resp.body.size());
  if (!root) {
    mark_failed(WledError{WledErrorKind::Protocol, 0, "malformed JSON body"}, path);
    return nullptr;
  }

  online_ = true;
  error_ = WledError{};
  return root;
}

bool WledClient::fetch_all() {
  cJSON* root = request(HttpMethod::Get, "/json");
  if (!root) {
    return false;
  }
  const cJSON* state = cJSON_GetObjectItem(root, "state");
  const cJSON* info = cJSON_GetObjectItem(root, "info");
  if (!cJSON_IsObject(state) || !cJSON_IsObject(info)) {
    cJSON_Delete(root);
    mark_failed(WledError{WledErrorKind::Protocol, 0, "missing state or info"}, "/json");
    return false;
  }
  state_ = wled_decode_state(state);
  info_ = wled_decode_info(info);
  effects_ = wled_decode_name_list(cJSON_GetObjectItem(root, "effects"));
  palettes_ = wled_decode_name_list(cJSON_GetObjectItem(root, "palettes"));
  cJSON_Delete(root);
  log_->debug("WLED {}: full sync ok ({} effects, {} palettes)", endpoint_.host, effects_.size(),
              palettes_.size());
  return true;
}

bool WledClient::fetch_state() {
  cJSON* root = request(HttpMethod::Get, "/json/state");
  if (!root) {
    return false;
  }
  if (!cJSON_IsObject(root)) {
    cJSON_Delete(root);
    mark_failed(WledError{WledErrorKind::Protocol, 0, "state is not an object"}, "/json/state");
    return false;
  }
  state_ = wled_decode_state(root);
  cJSON_Delete(root);
  return true;
}

bool WledClient::fetch_info() {
  cJSON* root = request(HttpMethod::Get, "/json/info");
  if (!root) {
    return false;
  }
  if (!cJSON_IsObject(root)) {
    cJSON_Delete(root);
    mark_failed(WledError{WledErrorKind::Protocol, 0, "info is not an object"}, "/json/info");
    return false;
  }
  info_ = wled_decode_info(root);
  cJSON_Delete(root);
  return true;
}

WledPresetMap WledClient::fetch_presets() {
  cJSON* root = request(HttpMethod::Get, "/presets.json");
  if (!root) {
    return {};
  }
  WledPresetMap presets = wled_decode_presets(root);
  cJSON_Delete(root);
  presets_ = presets;
  log_->info("WLED {}: found {} presets", endpoint_.host, presets.size());
  return presets;
}

WledEffectMetaMap WledClient::fetch_effect_metadata() {
  cJSON* names = request(HttpMethod::Get, "/json/effects");
  if (!names) {
    return {};
  }
  cJSON* fxdata = request(HttpMethod::Get, "/json/fxdata");
  if (!fxdata) {
    cJSON_Delete(names);
    return {};
  }
  WledEffectMetaMap meta = wled_decode_effect_meta(names, fxdata);
  cJSON_Delete(fxdata);
  cJSON_Delete(names);
  effect_meta_ = meta;
  return meta;
}

bool WledClient::set_state(const WledStateUpdate& update) {
  const std::string body = wled_encode_state_update(update, true);
  if (body.empty()) {
    log_->error("WLED {}: failed to encode state update", endpoint_.host);
    return false;
  }
  cJSON* root = request(HttpMethod::Post, "/json/state", body);
  if (!root) {
    return false;
  }
  const cJSON* state = cJSON_GetObjectItem(root, "state");
  if (!cJSON_IsObject(state)) {
    state = root;
  }
  if (cJSON_HasObjectItem(state, "on") || cJSON_HasObjectItem(state, "seg")) {
    state_ = wled_decode_state(state);
  } else {
    // Bare {"success":true} acknowledgement; nothing authoritative to cache.
    log_->debug("WLED {}: state update acknowledged without state body", endpoint_.host);
  }
  cJSON_Delete(root);
  return true;
}

bool WledClient::set_segment(int segment_id, WledSegmentUpdate update) {
  update.id = segment_id;
  WledStateUpdate state{};
  state.segments.push_back(std::move(update));
  return set_state(state);
}

bool WledClient::set_power(bool on) {
  log_->info("WLED {}: setting power to {}", endpoint_.host, on);
  WledStateUpdate update{};
  update.on = on;
  return set_state(update);
}

bool WledClient::fast_power(bool on) {
  WledStateUpdate update{};
  update.on = on;
  update.transition = 0;
  return set_state(update);
}

bool WledClient::set_brightness(int brightness) {
  brightness = wled_clamp_byte(brightness);
  log_->info("WLED {}: setting brightness to {}", endpoint_.host, brightness);
  WledStateUpdate update{};
  update.brightness = brightness;
  return set_state(update);
}

bool WledClient::set_effect(int effect_id, std::optional<int> speed, std::optional<int> intensity) {
  log_->info("WLED {}: setting effect to {}", endpoint_.host, effect_id);
  WledSegmentUpdate seg{};
  seg.effect = effect_id;
  if (speed) seg.speed = wled_clamp_byte(*speed);
  if (intensity) seg.intensity = wled_clamp_byte(*intensity);
  WledStateUpdate update{};
  update.segments.push_back(seg);
  return set_state(update);
}

bool WledClient::set_palette(int palette_id) {
  log_->info("WLED {}: setting palette to {}", endpoint_.host, palette_id);
  WledSegmentUpdate seg{};
  seg.palette = palette_id;
  WledStateUpdate update{};
  update.segments.push_back(seg);
  return set_state(update);
}

bool WledClient::set_color(int r, int g, int b, std::optional<int> w) {
  const WledColor color = w ? wled_make_color(r, g, b, *w) : wled_make_color(r, g, b);
  log_->info("WLED {}: setting color to RGB({},{},{})", endpoint_.host, color.r, color.g, color.b);
  WledSegmentUpdate seg{};
  seg.colors.push_back(color);
  WledStateUpdate update{};
  update.segments.push_back(seg);
  return set_state(update);
}

bool WledClient::set_preset(int preset_id) {
  log_->info("WLED {}: loading preset {}", endpoint_.host, preset_id);
  WledStateUpdate update{};
  update.preset = preset_id;
  return set_state(update);
}

bool WledClient::save_preset(int preset_id) {
  log_->info("WLED {}: saving preset slot {}", endpoint_.host, preset_id);
  WledStateUpdate update{};
  update.save_preset = preset_id;
  return set_state(update);
}

bool WledClient::set_transition(int transition) {
  WledStateUpdate update{};
  update.transition = std::max(0, transition);
  return set_state(update);
}

bool WledClient::set_live_override(bool live) {
  WledStateUpdate update{};
  update.live_override = live ? 1 : 0;
  return set_state(update);
}

bool WledClient::set_nightlight(int duration_min) {
  WledStateUpdate update{};
  WledNightlightUpdate nl{};
  if (duration_min <= 0) {
    nl.on = false;
  } else {
    update.on = true;
    nl.on = true;
    nl.duration = duration_min;
    nl.mode = 1;
    nl.target_brightness = 0;
  }
  update.nightlight = nl;
  return set_state(update);
}

bool WledClient::nightlight_off() {
  return set_nightlight(0);
}

bool WledClient::set_sync_send(bool send) {
  WledStateUpdate update{};
  update.sync_send = send;
  return set_state(update);
}

bool WledClient::set_sync_receive(bool receive) {
  WledStateUpdate update{};
  update.sync_receive = receive;
  return set_state(update);
}

bool WledClient::start_playlist(int playlist_id) {
  WledStateUpdate update{};
  update.playlist = playlist_id;
  return set_state(update);
}

bool WledClient::stop_playlist() {
  return start_playlist(-1);
}

bool WledClient::set_segment_power(int segment_id, bool on, std::optional<int> brightness) {
  WledSegmentUpdate seg{};
  seg.on = on;
  if (brightness) seg.brightness = wled_clamp_byte(*brightness);
  return set_segment(segment_id, seg);
}

bool WledClient::set_segment_brightness(int segment_id, int brightness) {
  WledSegmentUpdate seg{};
  seg.brightness = wled_clamp_byte(brightness);
  return set_segment(segment_id, seg);
}

bool WledClient::set_segment_effect(int segment_id, int effect_id, std::optional<int> speed,
                                    std::optional<int> intensity) {
  WledSegmentUpdate seg{};
  seg.effect = effect_id;
  if (speed) seg.speed = wled_clamp_byte(*speed);
  if (intensity) seg.intensity = wled_clamp_byte(*intensity);
  return set_segment(segment_id, seg);
}

bool WledClient::set_segment_palette(int segment_id, int palette_id) {
  WledSegmentUpdate seg{};
  seg.palette = palette_id;
  return set_segment(segment_id, seg);
}

bool WledClient::set_segment_color(int segment_id, int r, int g, int b, std::optional<int> w) {
  WledSegmentUpdate seg{};
  seg.colors.push_back(w ? wled_make_color(r, g, b, *w) : wled_make_color(r, g, b));
  return set_segment(segment_id, seg);
}
