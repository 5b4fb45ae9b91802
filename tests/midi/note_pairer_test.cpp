/**
 * @file note_pairer_test.cpp
 * @brief Tests for note-on/note-off pairing.
 */

#include "midi/note_pairer.h"

#include <gtest/gtest.h>

namespace midinorm {
namespace {

TEST(NotePairerTest, PairsNoteOnWithNoteOff) {
  RawTrack track = {makeNoteOn(0, 0, 60, 90), makeNoteOff(480, 0, 60)};
  PairedTrack paired = pairTrack(track);
  ASSERT_EQ(paired.note_msgs.size(), 1u);
  EXPECT_EQ(paired.note_msgs[0], makeNote(0, 60, 0, 480, 90));
}

TEST(NotePairerTest, VelocityZeroNoteOnReleases) {
  RawTrack track = {makeNoteOn(10, 3, 64, 70), makeNoteOn(20, 3, 64, 0)};
  PairedTrack paired = pairTrack(track);
  ASSERT_EQ(paired.note_msgs.size(), 1u);
  EXPECT_EQ(paired.note_msgs[0], makeNote(3, 64, 10, 20, 70));
}

TEST(NotePairerTest, ReleaseClosesEveryOpenEntry) {
  RawTrack track = {makeNoteOn(0, 0, 60, 80), makeNoteOn(5, 0, 60, 90), makeNoteOff(10, 0, 60),
                    makeNoteOff(20, 0, 60)};
  PairedTrack paired = pairTrack(track);
  ASSERT_EQ(paired.note_msgs.size(), 2u);
  EXPECT_EQ(paired.note_msgs[0], makeNote(0, 60, 0, 10, 80));
  EXPECT_EQ(paired.note_msgs[1], makeNote(0, 60, 5, 10, 90));
}

TEST(NotePairerTest, SameTickEntryStaysOpen) {
  RawTrack track = {makeNoteOn(0, 0, 60, 80), makeNoteOn(10, 0, 60, 90), makeNoteOff(10, 0, 60),
                    makeNoteOff(30, 0, 60)};
  PairedTrack paired = pairTrack(track);
  ASSERT_EQ(paired.note_msgs.size(), 2u);
  EXPECT_EQ(paired.note_msgs[0], makeNote(0, 60, 0, 10, 80));
  EXPECT_EQ(paired.note_msgs[1], makeNote(0, 60, 10, 30, 90));
}

TEST(NotePairerTest, ZeroLengthReleaseKeepsNoteOpen) {
  RawTrack track = {makeNoteOn(10, 0, 60, 80), makeNoteOff(10, 0, 60), makeNoteOff(40, 0, 60)};
  PairedTrack paired = pairTrack(track);
  ASSERT_EQ(paired.note_msgs.size(), 1u);
  EXPECT_EQ(paired.note_msgs[0], makeNote(0, 60, 10, 40, 80));
}

TEST(NotePairerTest, DanglingReleaseDropped) {
  RawTrack track = {makeNoteOff(5, 0, 60), makeNoteOn(10, 0, 60, 80), makeNoteOff(20, 0, 60),
                    makeNoteOff(30, 0, 60)};
  PairedTrack paired = pairTrack(track);
  ASSERT_EQ(paired.note_msgs.size(), 1u);
  EXPECT_EQ(paired.note_msgs[0], makeNote(0, 60, 10, 20, 80));
}

TEST(NotePairerTest, UnreleasedNoteDropped) {
  RawTrack track = {makeNoteOn(0, 0, 60, 80), makeNoteOn(0, 0, 62, 80), makeNoteOff(10, 0, 62)};
  PairedTrack paired = pairTrack(track);
  ASSERT_EQ(paired.note_msgs.size(), 1u);
  EXPECT_EQ(paired.note_msgs[0].pitch, 62);
}

TEST(NotePairerTest, KeysSeparateChannelsAndPitches) {
  RawTrack track = {makeNoteOn(0, 0, 60, 80), makeNoteOn(0, 1, 60, 81), makeNoteOn(0, 0, 61, 82),
                    makeNoteOff(10, 1, 60), makeNoteOff(20, 0, 60), makeNoteOff(30, 0, 61)};
  PairedTrack paired = pairTrack(track);
  ASSERT_EQ(paired.note_msgs.size(), 3u);
  EXPECT_EQ(paired.note_msgs[0], makeNote(1, 60, 0, 10, 81));
  EXPECT_EQ(paired.note_msgs[1], makeNote(0, 60, 0, 20, 80));
  EXPECT_EQ(paired.note_msgs[2], makeNote(0, 61, 0, 30, 82));
}

TEST(NotePairerTest, ClassifiesOtherEvents) {
  RawTrack track = {makeTextEvent(0, RawEventType::Text, "title"),
                    makeTextEvent(0, RawEventType::Copyright, "(c)"),
                    makeSetTempo(0, 400000),
                    makeProgramChange(0, 2, 40),
                    makeControlChange(10, 2, 64, 64),
                    makeControlChange(20, 2, 64, 63),
                    makeControlChange(30, 2, 7, 100),
                    makeEndOfTrack(40)};
  PairedTrack paired = pairTrack(track);

  ASSERT_EQ(paired.meta_msgs.size(), 2u);
  EXPECT_EQ(paired.meta_msgs[0].kind, MetaKind::Text);
  EXPECT_EQ(paired.meta_msgs[0].text, "title");
  EXPECT_EQ(paired.meta_msgs[1].kind, MetaKind::Copyright);
  ASSERT_EQ(paired.tempo_msgs.size(), 1u);
  EXPECT_EQ(paired.tempo_msgs[0].microseconds_per_quarter, 400000u);
  ASSERT_EQ(paired.instrument_msgs.size(), 1u);
  EXPECT_EQ(paired.instrument_msgs[0].program, 40);
  EXPECT_EQ(paired.instrument_msgs[0].channel, 2);
  // Only control 64 becomes a pedal; 64 is the on threshold
  ASSERT_EQ(paired.pedal_msgs.size(), 2u);
  EXPECT_EQ(paired.pedal_msgs[0].state, PedalState::On);
  EXPECT_EQ(paired.pedal_msgs[1].state, PedalState::Off);
}

TEST(NotePairerTest, NotesSortedByStart) {
  RawTrack track = {makeNoteOn(0, 0, 60, 80), makeNoteOn(5, 0, 62, 80), makeNoteOff(8, 0, 62),
                    makeNoteOff(20, 0, 60)};
  PairedTrack paired = pairTrack(track);
  ASSERT_EQ(paired.note_msgs.size(), 2u);
  EXPECT_EQ(paired.note_msgs[0].pitch, 60);
  EXPECT_EQ(paired.note_msgs[1].pitch, 62);
}

TEST(NotePairerTest, TracksPairedIndependently) {
  RawMidi midi;
  midi.ticks_per_beat = 96;
  // A note-on in track 0 is not released by a note-off in track 1
  midi.tracks = {{makeSetTempo(0, 600000), makeNoteOn(0, 0, 60, 80)},
                 {makeNoteOff(10, 0, 60), makeNoteOn(5, 0, 64, 70), makeNoteOff(15, 0, 64)}};
  Document doc = pairTracks(midi);

  EXPECT_EQ(doc.ticksPerBeat(), 96);
  ASSERT_EQ(doc.noteMsgs().size(), 1u);
  EXPECT_EQ(doc.noteMsgs()[0], makeNote(0, 64, 5, 15, 70));
  ASSERT_EQ(doc.tempoMsgs().size(), 1u);
  EXPECT_EQ(doc.tempoMsgs()[0].microseconds_per_quarter, 600000u);
  // Default instrument added
  EXPECT_EQ(doc.instrumentMsgs().size(), 1u);
}

TEST(NotePairerTest, MergedSequencesSortedAcrossTracks) {
  RawMidi midi;
  midi.tracks = {{makeNoteOn(100, 0, 60, 80), makeNoteOff(200, 0, 60)},
                 {makeNoteOn(0, 1, 50, 80), makeNoteOff(50, 1, 50), makeSetTempo(300, 400000)},
                 {makeSetTempo(0, 500000)}};
  Document doc = pairTracks(midi);
  ASSERT_EQ(doc.noteMsgs().size(), 2u);
  EXPECT_EQ(doc.noteMsgs()[0].start, 0u);
  EXPECT_EQ(doc.noteMsgs()[1].start, 100u);
  ASSERT_EQ(doc.tempoMsgs().size(), 2u);
  EXPECT_EQ(doc.tempoMsgs()[0].tick, 0u);
  EXPECT_EQ(doc.tempoMsgs()[1].tick, 300u);
}

TEST(NotePairerTest, DeltaTicksConverted) {
  RawMidi midi;
  midi.delta_ticks = true;
  midi.tracks = {{makeNoteOn(10, 0, 60, 80), makeNoteOff(30, 0, 60)}};
  Document doc = pairTracks(midi);
  ASSERT_EQ(doc.noteMsgs().size(), 1u);
  EXPECT_EQ(doc.noteMsgs()[0], makeNote(0, 60, 10, 40, 80));
}

}  // namespace
}  // namespace midinorm
