#pragma once
#include "wled_client/types.hpp"
#include <cjson/cJSON.h>
#include <string>
#include <vector>

// Decoding of WLED JSON API documents. Decoders never fail on missing or
// mistyped fields; they fall back to the defaults declared in types.hpp.

WledSegment wled_decode_segment(const cJSON* obj, int index);
WledState wled_decode_state(const cJSON* obj);
WledInfo wled_decode_info(const cJSON* obj);

// Effect and palette name lists; "" and "-" placeholders are dropped.
std::vector<std::string> wled_decode_name_list(const cJSON* arr);

// Parses one /json/fxdata entry ("params;colors;palette;flags").
WledEffectMeta wled_parse_effect_meta(const std::string& name, const std::string& fxdata);

// Zips /json/effects and /json/fxdata by index.
WledEffectMetaMap wled_decode_effect_meta(const cJSON* names, const cJSON* fxdata);

// /presets.json: {"1":{"n":"Evening"}, ...}. Non-integer ids are skipped.
WledPresetMap wled_decode_presets(const cJSON* obj);

// True when an /json/info body identifies a WLED device ("ver" and "name").
bool wled_info_identifies_device(const cJSON* obj);

// Builds the POST /json/state body. Only fields set in the update are emitted,
// plus "v":true when the device should answer with its full state.
std::string wled_encode_state_update(const WledStateUpdate& update, bool request_state = false);

int wled_clamp_byte(int value);
WledColor wled_make_color(int r, int g, int b);
WledColor wled_make_color(int r, int g, int b, int w);
