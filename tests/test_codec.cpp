#include <gtest/gtest.h>
#include "wled_client/codec.hpp"
#include <cjson/cJSON.h>
#include <limits>
#include <memory>
#include <string>

namespace {

struct JsonDeleter {
  void operator()(cJSON* item) const { cJSON_Delete(item); }
};
using JsonPtr = std::unique_ptr<cJSON, JsonDeleter>;

JsonPtr parse(const char* text) {
  return JsonPtr(cJSON_Parse(text));
}

}  // namespace

// =============================================================================
// State / segment decoding
// =============================================================================

// A state document carrying only "on" keeps every other default.
TEST(WledCodec, MinimalStateUsesDefaults) {
  auto doc = parse(R"({"on":true})");
  ASSERT_TRUE(doc);
  const WledState state = wled_decode_state(doc.get());

  EXPECT_TRUE(state.on);
  EXPECT_EQ(state.brightness, 0);
  EXPECT_EQ(state.preset, -1);
  EXPECT_EQ(state.playlist, -1);
  EXPECT_TRUE(state.segments.empty());
  EXPECT_EQ(state.main_segment_state(), nullptr);
  EXPECT_EQ(state.primary_color(), wled_make_color(255, 255, 255));
  EXPECT_EQ(state.effect(), 0);
  EXPECT_EQ(state.palette(), 0);
}

// Missing "len" is derived from stop - start.
TEST(WledCodec, SegmentLengthDerivedFromBounds) {
  auto doc = parse(R"({"start":0,"stop":10})");
  const WledSegment seg = wled_decode_segment(doc.get(), 3);
  EXPECT_EQ(seg.id, 3);
  EXPECT_EQ(seg.length, 10);
  EXPECT_TRUE(seg.on);
  EXPECT_EQ(seg.brightness, 255);
  ASSERT_EQ(seg.colors.size(), 1u);
}

TEST(WledCodec, SegmentColorsDecodeArraysAndHex) {
  auto doc = parse(R"({"id":1,"col":[[10,20,30],[1,2,3,4],"FF8000",[5]]})");
  const WledSegment seg = wled_decode_segment(doc.get(), 0);
  ASSERT_EQ(seg.colors.size(), 3u);
  EXPECT_EQ(seg.colors[0], wled_make_color(10, 20, 30));
  EXPECT_EQ(seg.colors[1], wled_make_color(1, 2, 3, 4));
  EXPECT_EQ(seg.colors[2], wled_make_color(255, 128, 0));
}

// Numbers far outside any field's range saturate instead of wrapping.
TEST(WledCodec, HugeNumbersSaturate) {
  auto doc = parse(R"({"bri":1e10,"transition":1e300,"ps":-1e300,"mainseg":-1e10,
      "nl":{"dur":1e300,"tbri":-1e300},
      "seg":[{"start":-1e300,"stop":1e300,"bri":-1e10,"sx":1e300,"col":[[1e300,-1e300,5]]}]})");
  ASSERT_TRUE(doc);
  const WledState state = wled_decode_state(doc.get());

  EXPECT_EQ(state.brightness, 255);
  EXPECT_EQ(state.transition, std::numeric_limits<int>::max());
  EXPECT_EQ(state.preset, std::numeric_limits<int>::min());
  EXPECT_EQ(state.nightlight.duration, std::numeric_limits<int>::max());
  EXPECT_EQ(state.nightlight.target_brightness, 0);
  ASSERT_EQ(state.segments.size(), 1u);
  const WledSegment& seg = state.segments[0];
  EXPECT_EQ(seg.start, std::numeric_limits<int>::min());
  EXPECT_EQ(seg.stop, std::numeric_limits<int>::max());
  EXPECT_EQ(seg.length, std::numeric_limits<int>::max());
  EXPECT_EQ(seg.brightness, 0);
  EXPECT_EQ(seg.speed, 255);
  EXPECT_EQ(seg.colors[0], wled_make_color(255, 0, 5));

  auto presets = parse(R"({"99999999999":{"n":"Huge"},"-3":{"n":"Negative"},"4":{"n":"Ok"}})");
  const WledPresetMap decoded = wled_decode_presets(presets.get());
  ASSERT_EQ(decoded.size(), 1u);
  EXPECT_EQ(decoded.at(4), "Ok");
}

TEST(WledCodec, StateMainSegmentSelectsPrimaryColor) {
  auto doc = parse(R"({"on":false,"bri":300,"mainseg":1,"nl":{"on":true,"dur":15},
                       "udpn":{"send":true},
                       "seg":[{"id":0,"col":[[1,1,1]],"fx":4},{"id":1,"col":[[9,8,7]],"fx":12,"pal":6}]})");
  const WledState state = wled_decode_state(doc.get());
  EXPECT_FALSE(state.on);
  EXPECT_EQ(state.brightness, 255);
  EXPECT_TRUE(state.nightlight.on);
  EXPECT_EQ(state.nightlight.duration, 15);
  EXPECT_TRUE(state.sync_send);
  EXPECT_TRUE(state.sync_receive);
  ASSERT_EQ(state.segments.size(), 2u);
  EXPECT_EQ(state.primary_color(), wled_make_color(9, 8, 7));
  EXPECT_EQ(state.effect(), 12);
  EXPECT_EQ(state.palette(), 6);
}

TEST(WledCodec, InfoDecodesLedCountAndIdentity) {
  auto doc = parse(R"({"ver":"0.14.0","vid":2310130,"name":"Desk","leds":{"count":90,"maxseg":32},
                       "mac":"aabbccddeeff","lm":"","udpport":21324})");
  const WledInfo info = wled_decode_info(doc.get());
  EXPECT_EQ(info.version, "0.14.0");
  EXPECT_EQ(info.led_count, 90);
  EXPECT_EQ(info.max_segments, 32);
  EXPECT_EQ(info.mac, "aabbccddeeff");
  EXPECT_FALSE(info.live_support);
  EXPECT_TRUE(wled_info_identifies_device(doc.get()));

  auto other = parse(R"({"ver":"1.0"})");
  EXPECT_FALSE(wled_info_identifies_device(other.get()));
}

// =============================================================================
// Name lists, effect metadata, presets
// =============================================================================

TEST(WledCodec, NameListDropsPlaceholders) {
  auto doc = parse(R"(["Solid","","-","Rainbow",7])");
  const auto names = wled_decode_name_list(doc.get());
  ASSERT_EQ(names.size(), 2u);
  EXPECT_EQ(names[0], "Solid");
  EXPECT_EQ(names[1], "Rainbow");
}

// An empty first palette slot disables the palette selector.
TEST(WledCodec, EffectMetaPaletteDisabledAndVolumeFlag) {
  const WledEffectMeta meta = wled_parse_effect_meta("Ripple", "12;!;,sx,ix;1v");
  EXPECT_EQ(meta.name, "Ripple");
  EXPECT_FALSE(meta.uses_palette);
  EXPECT_FALSE(meta.is_2d);
  EXPECT_TRUE(meta.volume_reactive);
  EXPECT_FALSE(meta.frequency_reactive);
}

TEST(WledCodec, EffectMetaDefaultPaletteAnd2dFrequency) {
  const WledEffectMeta meta = wled_parse_effect_meta("Matrix", "!,Size;;!;2f");
  EXPECT_TRUE(meta.uses_palette);
  EXPECT_TRUE(meta.is_2d);
  EXPECT_TRUE(meta.frequency_reactive);
  EXPECT_FALSE(meta.volume_reactive);

  const WledEffectMeta bare = wled_parse_effect_meta("Solid", "");
  EXPECT_FALSE(bare.uses_palette);
  EXPECT_FALSE(bare.is_2d);
}

TEST(WledCodec, EffectMetaZipsByIndex) {
  auto names = parse(R"(["Solid","Blink","-","Matrix"])");
  auto fxdata = parse(R"(["",";!;!;1","",";;!;2"])");
  const WledEffectMetaMap meta = wled_decode_effect_meta(names.get(), fxdata.get());
  ASSERT_EQ(meta.size(), 3u);
  EXPECT_EQ(meta.count(2), 0u);
  EXPECT_TRUE(meta.at(1).uses_palette);
  EXPECT_TRUE(meta.at(3).is_2d);
}

TEST(WledCodec, PresetsSkipUnnamedAndNonNumericIds) {
  auto doc = parse(R"({"0":{},"1":{"n":"Evening"},"abc":{"n":"x"},"12":{"n":"Party"}})");
  const WledPresetMap presets = wled_decode_presets(doc.get());
  ASSERT_EQ(presets.size(), 2u);
  EXPECT_EQ(presets.at(1), "Evening");
  EXPECT_EQ(presets.at(12), "Party");
}

// =============================================================================
// Update encoding
// =============================================================================

TEST(WledCodec, EncodeEmitsOnlySetFields) {
  WledStateUpdate update{};
  update.on = true;
  EXPECT_EQ(wled_encode_state_update(update), R"({"on":true})");
  EXPECT_EQ(wled_encode_state_update(update, true), R"({"on":true,"v":true})");
}

TEST(WledCodec, EncodeClampsBrightnessAndColors) {
  WledStateUpdate low{};
  low.brightness = -5;
  EXPECT_EQ(wled_encode_state_update(low), R"({"bri":0})");

  WledStateUpdate high{};
  high.brightness = 999;
  EXPECT_EQ(wled_encode_state_update(high), R"({"bri":255})");

  EXPECT_EQ(wled_make_color(-1, 300, 20), wled_make_color(0, 255, 20));
}

TEST(WledCodec, EncodeSegmentColorUpdate) {
  WledSegmentUpdate seg{};
  seg.id = 2;
  seg.colors.push_back(wled_make_color(10, 20, 30));
  WledStateUpdate update{};
  update.segments.push_back(seg);
  EXPECT_EQ(wled_encode_state_update(update), R"({"seg":[{"id":2,"col":[[10,20,30]]}]})");
}

TEST(WledCodec, EncodeNightlightAndSync) {
  WledStateUpdate update{};
  WledNightlightUpdate nl{};
  nl.on = true;
  nl.duration = 500;
  update.nightlight = nl;
  update.sync_send = true;
  EXPECT_EQ(wled_encode_state_update(update), R"({"nl":{"on":true,"dur":255},"udpn":{"send":true}})");
}
