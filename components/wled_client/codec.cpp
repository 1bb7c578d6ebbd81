#include "wled_client/codec.hpp"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <limits>
#include <string>
#include <utility>

namespace {

// Saturates instead of overflowing on values like 1e300.
int number_to_int(double value) {
  if (!(value == value)) {
    return 0;
  }
  if (value <= static_cast<double>(std::numeric_limits<int>::min())) {
    return std::numeric_limits<int>::min();
  }
  if (value >= static_cast<double>(std::numeric_limits<int>::max())) {
    return std::numeric_limits<int>::max();
  }
  return static_cast<int>(value);
}

int json_int(const cJSON* obj, const char* key, int fallback) {
  const cJSON* item = cJSON_GetObjectItem(obj, key);
  if (cJSON_IsNumber(item)) {
    return number_to_int(item->valuedouble);
  }
  return fallback;
}

uint8_t json_byte(const cJSON* obj, const char* key, uint8_t fallback) {
  const cJSON* item = cJSON_GetObjectItem(obj, key);
  if (cJSON_IsNumber(item)) {
    return static_cast<uint8_t>(wled_clamp_byte(number_to_int(item->valuedouble)));
  }
  return fallback;
}

bool json_bool(const cJSON* obj, const char* key, bool fallback) {
  const cJSON* item = cJSON_GetObjectItem(obj, key);
  if (cJSON_IsBool(item)) {
    return cJSON_IsTrue(item);
  }
  if (cJSON_IsNumber(item)) {
    return item->valuedouble != 0.0;
  }
  return fallback;
}

std::string json_string(const cJSON* obj, const char* key, const std::string& fallback) {
  const cJSON* item = cJSON_GetObjectItem(obj, key);
  if (cJSON_IsString(item) && item->valuestring) {
    return item->valuestring;
  }
  return fallback;
}

int from_hex(char ch) {
  if (ch >= '0' && ch <= '9') return ch - '0';
  if (ch >= 'a' && ch <= 'f') return 10 + (ch - 'a');
  if (ch >= 'A' && ch <= 'F') return 10 + (ch - 'A');
  return -1;
}

// Segments in hex mode report colors as "RRGGBB" or "RRGGBBWW".
bool parse_hex_color(const std::string& text, WledColor& out) {
  size_t start = (!text.empty() && text[0] == '#') ? 1 : 0;
  const size_t digits = text.size() - start;
  if (digits != 6 && digits != 8) {
    return false;
  }
  uint8_t bytes[4] = {0, 0, 0, 0};
  for (size_t i = 0; i < digits / 2; ++i) {
    const int hi = from_hex(text[start + i * 2]);
    const int lo = from_hex(text[start + i * 2 + 1]);
    if (hi < 0 || lo < 0) {
      return false;
    }
    bytes[i] = static_cast<uint8_t>((hi << 4) + lo);
  }
  out = WledColor{bytes[0], bytes[1], bytes[2], std::nullopt};
  if (digits == 8) {
    out.w = bytes[3];
  }
  return true;
}

bool decode_color(const cJSON* item, WledColor& out) {
  if (cJSON_IsString(item) && item->valuestring) {
    return parse_hex_color(item->valuestring, out);
  }
  if (!cJSON_IsArray(item)) {
    return false;
  }
  const int size = cJSON_GetArraySize(item);
  if (size < 3) {
    return false;
  }
  int channels[4] = {0, 0, 0, 0};
  for (int i = 0; i < std::min(size, 4); ++i) {
    const cJSON* ch = cJSON_GetArrayItem(item, i);
    channels[i] = cJSON_IsNumber(ch) ? number_to_int(ch->valuedouble) : 0;
  }
  out = size >= 4 ? wled_make_color(channels[0], channels[1], channels[2], channels[3])
                  : wled_make_color(channels[0], channels[1], channels[2]);
  return true;
}

cJSON* encode_color(const WledColor& color) {
  cJSON* arr = cJSON_CreateArray();
  if (!arr) {
    return nullptr;
  }
  cJSON_AddItemToArray(arr, cJSON_CreateNumber(color.r));
  cJSON_AddItemToArray(arr, cJSON_CreateNumber(color.g));
  cJSON_AddItemToArray(arr, cJSON_CreateNumber(color.b));
  if (color.w) {
    cJSON_AddItemToArray(arr, cJSON_CreateNumber(*color.w));
  }
  return arr;
}

cJSON* encode_segment_update(const WledSegmentUpdate& seg) {
  cJSON* obj = cJSON_CreateObject();
  if (!obj) {
    return nullptr;
  }
  if (seg.id) cJSON_AddNumberToObject(obj, "id", *seg.id);
  if (seg.on) cJSON_AddBoolToObject(obj, "on", *seg.on);
  if (seg.brightness) cJSON_AddNumberToObject(obj, "bri", wled_clamp_byte(*seg.brightness));
  if (seg.effect) cJSON_AddNumberToObject(obj, "fx", *seg.effect);
  if (seg.speed) cJSON_AddNumberToObject(obj, "sx", wled_clamp_byte(*seg.speed));
  if (seg.intensity) cJSON_AddNumberToObject(obj, "ix", wled_clamp_byte(*seg.intensity));
  if (seg.palette) cJSON_AddNumberToObject(obj, "pal", *seg.palette);
  if (!seg.colors.empty()) {
    cJSON* col = cJSON_AddArrayToObject(obj, "col");
    if (col) {
      for (const auto& color : seg.colors) {
        if (cJSON* entry = encode_color(color)) {
          cJSON_AddItemToArray(col, entry);
        }
      }
    }
  }
  return obj;
}

std::vector<std::string> split(const std::string& text, char sep) {
  std::vector<std::string> out;
  size_t start = 0;
  while (true) {
    const size_t pos = text.find(sep, start);
    if (pos == std::string::npos) {
      out.push_back(text.substr(start));
      break;
    }
    out.push_back(text.substr(start, pos - start));
    start = pos + 1;
  }
  return out;
}

bool is_placeholder_name(const char* name) {
  return !name || name[0] == '\0' || std::string(name) == "-";
}

}  // namespace

int wled_clamp_byte(int value) {
  return std::clamp(value, 0, 255);
}

WledColor wled_make_color(int r, int g, int b) {
  return WledColor{static_cast<uint8_t>(wled_clamp_byte(r)), static_cast<uint8_t>(wled_clamp_byte(g)),
                   static_cast<uint8_t>(wled_clamp_byte(b)), std::nullopt};
}

WledColor wled_make_color(int r, int g, int b, int w) {
  WledColor color = wled_make_color(r, g, b);
  color.w = static_cast<uint8_t>(wled_clamp_byte(w));
  return color;
}

WledSegment wled_decode_segment(const cJSON* obj, int index) {
  WledSegment seg{};
  seg.id = index;
  if (!cJSON_IsObject(obj)) {
    return seg;
  }
  seg.id = json_int(obj, "id", index);
  seg.start = json_int(obj, "start", 0);
  seg.stop = json_int(obj, "stop", 0);
  const long long span = static_cast<long long>(seg.stop) - seg.start;
  seg.length = json_int(obj, "len", static_cast<int>(std::clamp<long long>(span, std::numeric_limits<int>::min(),
                                                                             std::numeric_limits<int>::max())));
  seg.on = json_bool(obj, "on", true);
  seg.brightness = json_byte(obj, "bri", 255);
  seg.effect = json_int(obj, "fx", 0);
  seg.speed = json_byte(obj, "sx", 128);
  seg.intensity = json_byte(obj, "ix", 128);
  seg.palette = json_int(obj, "pal", 0);
  if (const cJSON* col = cJSON_GetObjectItem(obj, "col"); cJSON_IsArray(col)) {
    seg.colors.clear();
    const cJSON* entry = nullptr;
    cJSON_ArrayForEach(entry, col) {
      WledColor color{};
      if (decode_color(entry, color)) {
        seg.colors.push_back(color);
      }
    }
  }
  return seg;
}

WledState wled_decode_state(const cJSON* obj) {
  WledState state{};
  if (!cJSON_IsObject(obj)) {
    return state;
  }
  state.on = json_bool(obj, "on", false);
  state.brightness = json_byte(obj, "bri", 0);
  state.transition = json_int(obj, "transition", 7);
  state.preset = json_int(obj, "ps", -1);
  state.playlist = json_int(obj, "pl", -1);
  state.live = json_int(obj, "lor", 0) > 0;
  state.main_segment = json_int(obj, "mainseg", 0);

  if (const cJSON* nl = cJSON_GetObjectItem(obj, "nl"); cJSON_IsObject(nl)) {
    state.nightlight.on = json_bool(nl, "on", false);
    state.nightlight.duration = json_int(nl, "dur", 60);
    state.nightlight.mode = json_int(nl, "mode", 0);
    state.nightlight.target_brightness = json_byte(nl, "tbri", 0);
  }
  if (const cJSON* udpn = cJSON_GetObjectItem(obj, "udpn"); cJSON_IsObject(udpn)) {
    state.sync_send = json_bool(udpn, "send", false);
    state.sync_receive = json_bool(udpn, "recv", true);
  }
  if (const cJSON* segs = cJSON_GetObjectItem(obj, "seg"); cJSON_IsArray(segs)) {
    int index = 0;
    const cJSON* entry = nullptr;
    cJSON_ArrayForEach(entry, segs) {
      state.segments.push_back(wled_decode_segment(entry, index));
      ++index;
    }
  }
  return state;
}

WledInfo wled_decode_info(const cJSON* obj) {
  WledInfo info{};
  if (!cJSON_IsObject(obj)) {
    return info;
  }
  info.version = json_string(obj, "ver", "");
  info.version_id = json_int(obj, "vid", 0);
  info.name = json_string(obj, "name", "");
  info.udp_port = static_cast<uint16_t>(std::clamp(json_int(obj, "udpport", 21324), 0, 65535));
  info.product = json_string(obj, "product", "WLED");
  info.brand = json_string(obj, "brand", "wled");
  info.mac = json_string(obj, "mac", "");
  info.ip = json_string(obj, "ip", "");
  info.live_source = json_string(obj, "lip", "");
  if (const cJSON* lm = cJSON_GetObjectItem(obj, "lm"); cJSON_IsString(lm) && lm->valuestring) {
    info.live_support = lm->valuestring[0] != '\0';
  } else {
    info.live_support = json_bool(obj, "lm", false);
  }
  if (const cJSON* leds = cJSON_GetObjectItem(obj, "leds"); cJSON_IsObject(leds)) {
    info.led_count = std::max(0, json_int(leds, "count", 0));
    info.max_segments = std::max(0, json_int(leds, "maxseg", 0));
  }
  return info;
}

std::vector<std::string> wled_decode_name_list(const cJSON* arr) {
  std::vector<std::string> names;
  if (!cJSON_IsArray(arr)) {
    return names;
  }
  const cJSON* entry = nullptr;
  cJSON_ArrayForEach(entry, arr) {
    if (cJSON_IsString(entry) && !is_placeholder_name(entry->valuestring)) {
      names.emplace_back(entry->valuestring);
    }
  }
  return names;
}

WledEffectMeta wled_parse_effect_meta(const std::string& name, const std::string& fxdata) {
  WledEffectMeta meta{};
  meta.name = name;
  const auto sections = split(fxdata, ';');
  if (sections.size() < 3) {
    return meta;
  }
  // An empty first slot in the palette section disables the palette
  // selector; "!" keeps the default palette.
  const std::string& palette = sections[2];
  meta.uses_palette = !palette.empty() && palette.front() != ',';

  if (sections.size() >= 4) {
    std::string flags = sections[3];
    if (const size_t comma = flags.find(','); comma != std::string::npos) {
      flags.resize(comma);
    }
    for (char ch : flags) {
      const char lower = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
      if (ch == '2') meta.is_2d = true;
      if (lower == 'v') meta.volume_reactive = true;
      if (lower == 'f') meta.frequency_reactive = true;
    }
  }
  return meta;
}

WledEffectMetaMap wled_decode_effect_meta(const cJSON* names, const cJSON* fxdata) {
  WledEffectMetaMap out;
  if (!cJSON_IsArray(names)) {
    return out;
  }
  const int count = cJSON_GetArraySize(names);
  for (int id = 0; id < count; ++id) {
    const cJSON* name = cJSON_GetArrayItem(names, id);
    if (!cJSON_IsString(name) || is_placeholder_name(name->valuestring)) {
      continue;
    }
    std::string data;
    if (const cJSON* fx = cJSON_IsArray(fxdata) ? cJSON_GetArrayItem(fxdata, id) : nullptr;
        cJSON_IsString(fx) && fx->valuestring) {
      data = fx->valuestring;
    }
    out.emplace(id, wled_parse_effect_meta(name->valuestring, data));
  }
  return out;
}

WledPresetMap wled_decode_presets(const cJSON* obj) {
  WledPresetMap presets;
  if (!cJSON_IsObject(obj)) {
    return presets;
  }
  const cJSON* entry = nullptr;
  cJSON_ArrayForEach(entry, obj) {
    if (!entry->string || !cJSON_IsObject(entry)) {
      continue;
    }
    const cJSON* name = cJSON_GetObjectItem(entry, "n");
    if (!cJSON_IsString(name) || !name->valuestring) {
      continue;
    }
    char* end = nullptr;
    const long id = std::strtol(entry->string, &end, 10);
    if (end == entry->string || *end != '\0' || id < 0 || id > std::numeric_limits<int>::max()) {
      continue;
    }
    presets[static_cast<int>(id)] = name->valuestring;
  }
  return presets;
}

bool wled_info_identifies_device(const cJSON* obj) {
  return cJSON_IsObject(obj) && cJSON_HasObjectItem(obj, "ver") && cJSON_HasObjectItem(obj, "name");
}

std::string wled_encode_state_update(const WledStateUpdate& update, bool request_state) {
  cJSON* root = cJSON_CreateObject();
  if (!root) {
    return {};
  }
  if (update.on) cJSON_AddBoolToObject(root, "on", *update.on);
  if (update.brightness) cJSON_AddNumberToObject(root, "bri", wled_clamp_byte(*update.brightness));
  if (update.transition) cJSON_AddNumberToObject(root, "transition", std::max(0, *update.transition));
  if (update.preset) cJSON_AddNumberToObject(root, "ps", *update.preset);
  if (update.save_preset) cJSON_AddNumberToObject(root, "psave", *update.save_preset);
  if (update.playlist) cJSON_AddNumberToObject(root, "pl", *update.playlist);
  if (update.live_override) cJSON_AddNumberToObject(root, "lor", *update.live_override);

  if (update.nightlight) {
    const WledNightlightUpdate& nl = *update.nightlight;
    cJSON* obj = cJSON_AddObjectToObject(root, "nl");
    if (obj) {
      if (nl.on) cJSON_AddBoolToObject(obj, "on", *nl.on);
      if (nl.duration) cJSON_AddNumberToObject(obj, "dur", std::clamp(*nl.duration, 1, 255));
      if (nl.mode) cJSON_AddNumberToObject(obj, "mode", *nl.mode);
      if (nl.target_brightness) cJSON_AddNumberToObject(obj, "tbri", wled_clamp_byte(*nl.target_brightness));
    }
  }
  if (update.sync_send || update.sync_receive) {
    cJSON* obj = cJSON_AddObjectToObject(root, "udpn");
    if (obj) {
      if (update.sync_send) cJSON_AddBoolToObject(obj, "send", *update.sync_send);
      if (update.sync_receive) cJSON_AddBoolToObject(obj, "recv", *update.sync_receive);
    }
  }
  if (!update.segments.empty()) {
    cJSON* arr = cJSON_AddArrayToObject(root, "seg");
    if (arr) {
      for (const auto& seg : update.segments) {
        if (cJSON* obj = encode_segment_update(seg)) {
          cJSON_AddItemToArray(arr, obj);
        }
      }
    }
  }

  if (request_state) {
    cJSON_AddBoolToObject(root, "v", true);
  }

  char* txt = cJSON_PrintUnformatted(root);
  std::string out = txt ? txt : "";
  if (txt) {
    cJSON_free(txt);
  }
  cJSON_Delete(root);
  return out;
}
