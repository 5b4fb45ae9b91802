/**
 * @file raw_event_json_test.cpp
 * @brief Tests for the raw event JSON codec.
 */

#include "midi/raw_event_json.h"

#include <gtest/gtest.h>

namespace midinorm {
namespace {

TEST(RawEventJsonTest, TypeNames) {
  EXPECT_STREQ(rawEventTypeName(RawEventType::ControlChange), "control_change");
  EXPECT_STREQ(rawEventTypeName(RawEventType::EndOfTrack), "end_of_track");
  EXPECT_EQ(rawEventTypeFromName("set_tempo").value(), RawEventType::SetTempo);
  EXPECT_FALSE(rawEventTypeFromName("sysex").has_value());
}

TEST(RawEventJsonTest, WritesEventFields) {
  RawMidi midi;
  midi.ticks_per_beat = 96;
  midi.format = 0;
  midi.tracks = {{makeNoteOn(0, 1, 60, 90), makeControlChange(5, 1, 64, 127),
                  makeSetTempo(5, 400000), makeTextEvent(6, RawEventType::Text, "hi"),
                  makeEndOfTrack(0)}};
  std::string json = writeRawEventJson(midi);

  EXPECT_EQ(json.find("{\"ticks_per_beat\":96,\"format\":0,\"delta\":false,\"tracks\":[["), 0u);
  EXPECT_NE(json.find("{\"type\":\"note_on\",\"tick\":0,\"channel\":1,\"note\":60,\"velocity\":90}"),
            std::string::npos);
  EXPECT_NE(json.find("{\"type\":\"control_change\",\"tick\":5,\"channel\":1,\"control\":64,"
                      "\"value\":127}"),
            std::string::npos);
  EXPECT_NE(json.find("{\"type\":\"set_tempo\",\"tick\":5,\"tempo\":400000}"), std::string::npos);
  EXPECT_NE(json.find("{\"type\":\"text\",\"tick\":6,\"text\":\"hi\"}"), std::string::npos);
  EXPECT_NE(json.find("{\"type\":\"end_of_track\",\"tick\":0}"), std::string::npos);
}

TEST(RawEventJsonTest, ReadsWhatItWrites) {
  RawMidi midi;
  midi.ticks_per_beat = 240;
  midi.tracks = {{makeNoteOn(0, 0, 60, 90), makeNoteOff(10, 0, 60, 64),
                  makeProgramChange(0, 3, 41), makeTextEvent(0, RawEventType::Copyright, "c")},
                 {}};
  RawEventReader reader;
  ASSERT_TRUE(reader.parse(writeRawEventJson(midi, true))) << reader.getError();

  const RawMidi& parsed = reader.getMidi();
  EXPECT_EQ(parsed.ticks_per_beat, 240);
  ASSERT_EQ(parsed.tracks.size(), 2u);
  EXPECT_TRUE(parsed.tracks[1].empty());
  const RawTrack& track = parsed.tracks[0];
  ASSERT_EQ(track.size(), 4u);
  EXPECT_EQ(track[1].type, RawEventType::NoteOff);
  EXPECT_EQ(track[1].tick, 10u);
  EXPECT_EQ(track[1].data2, 64);
  EXPECT_EQ(track[2].type, RawEventType::ProgramChange);
  EXPECT_EQ(track[2].channel, 3);
  EXPECT_EQ(track[2].data1, 41);
  EXPECT_EQ(track[3].text, "c");
}

TEST(RawEventJsonTest, DeltaInputBecomesAbsolute) {
  RawEventReader reader;
  ASSERT_TRUE(reader.parse(
      "{\"ticks_per_beat\":480,\"delta\":true,\"tracks\":[["
      "{\"type\":\"note_on\",\"tick\":10,\"channel\":0,\"note\":60,\"velocity\":80},"
      "{\"type\":\"note_off\",\"tick\":20,\"channel\":0,\"note\":60,\"velocity\":0}]]}"))
      << reader.getError();
  const RawMidi& midi = reader.getMidi();
  EXPECT_FALSE(midi.delta_ticks);
  ASSERT_EQ(midi.tracks[0].size(), 2u);
  EXPECT_EQ(midi.tracks[0][0].tick, 10u);
  EXPECT_EQ(midi.tracks[0][1].tick, 30u);
}

TEST(RawEventJsonTest, RejectsBadInput) {
  RawEventReader reader;
  EXPECT_FALSE(reader.parse("{\"tracks\":[]}"));
  EXPECT_FALSE(reader.parse("{\"ticks_per_beat\":0,\"tracks\":[]}"));
  EXPECT_FALSE(reader.parse("{\"ticks_per_beat\":480}"));
  EXPECT_FALSE(reader.parse("{\"ticks_per_beat\":480,\"tracks\":[{}]}"));
  EXPECT_FALSE(reader.parse(
      "{\"ticks_per_beat\":480,\"tracks\":[[{\"type\":\"sysex\",\"tick\":0}]]}"));
  EXPECT_FALSE(reader.parse("{\"ticks_per_beat\":480,\"tracks\":[[{\"type\":\"note_on\","
                            "\"tick\":0,\"channel\":16,\"note\":60,\"velocity\":1}]]}"));
  EXPECT_FALSE(reader.parse("{\"ticks_per_beat\":480,\"tracks\":[[{\"type\":\"set_tempo\","
                            "\"tick\":0,\"tempo\":0}]]}"));
  EXPECT_FALSE(reader.parse("{\"ticks_per_beat\":480,\"delta\":1,\"tracks\":[]}"));
  EXPECT_FALSE(reader.getError().empty());
  EXPECT_TRUE(reader.getMidi().tracks.empty());
}

TEST(RawEventJsonTest, RejectsMalformedTrack) {
  RawEventReader reader;
  EXPECT_FALSE(reader.parse("{\"ticks_per_beat\":480,\"tracks\":[[{\"type\":\"end_of_track\","
                            "\"tick\":0} x]]}"));
  EXPECT_FALSE(reader.getError().empty());
  EXPECT_TRUE(reader.getMidi().tracks.empty());
  EXPECT_FALSE(reader.parse("{\"ticks_per_beat\":480,\"tracks\":[[],]}"));
}

TEST(RawEventJsonTest, ErrorNamesTrackAndEvent) {
  RawEventReader reader;
  EXPECT_FALSE(reader.parse("{\"ticks_per_beat\":480,\"tracks\":[[],[{\"type\":\"text\","
                            "\"tick\":0}]]}"));
  EXPECT_NE(reader.getError().find("track 1, event 0"), std::string::npos);
}

}  // namespace
}  // namespace midinorm
