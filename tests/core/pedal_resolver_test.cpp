/**
 * @file pedal_resolver_test.cpp
 * @brief Tests for sustain intervals and pedal note extension.
 */

#include "core/pedal_resolver.h"

#include <gtest/gtest.h>

#include "core/pedal_intervals.h"
#include "test_support/test_helpers.h"

namespace midinorm {
namespace {

using test::makeDocument;
using test::pedalOff;
using test::pedalOn;

// ============================================================================
// buildPedalIntervals
// ============================================================================

TEST(PedalIntervalsTest, PairsOnAndOff) {
  Document doc = makeDocument({makeNote(0, 60, 0, 10, 80)},
                              {pedalOn(10), pedalOff(20), pedalOn(30), pedalOff(40)});
  auto table = buildPedalIntervals(doc);
  ASSERT_EQ(table[0].size(), 2u);
  EXPECT_EQ(table[0][0].start, 10u);
  EXPECT_EQ(table[0][0].end, 20u);
  EXPECT_EQ(table[0][1].start, 30u);
  EXPECT_EQ(table[0][1].end, 40u);
}

TEST(PedalIntervalsTest, RepeatsAreNoOps) {
  Document doc = makeDocument({makeNote(0, 60, 0, 10, 80)},
                              {pedalOff(5), pedalOn(10), pedalOn(15), pedalOff(20), pedalOff(25)});
  auto table = buildPedalIntervals(doc);
  ASSERT_EQ(table[0].size(), 1u);
  EXPECT_EQ(table[0][0].start, 10u);
  EXPECT_EQ(table[0][0].end, 20u);
}

TEST(PedalIntervalsTest, ChannelsIndependent) {
  Document doc = makeDocument({makeNote(0, 60, 0, 10, 80)},
                              {pedalOn(10, 0), pedalOn(12, 1), pedalOff(20, 1), pedalOff(30, 0)});
  auto table = buildPedalIntervals(doc);
  ASSERT_EQ(table[0].size(), 1u);
  ASSERT_EQ(table[1].size(), 1u);
  EXPECT_EQ(table[0][0].start, 10u);
  EXPECT_EQ(table[0][0].end, 30u);
  EXPECT_EQ(table[1][0].start, 12u);
  EXPECT_EQ(table[1][0].end, 20u);
}

TEST(PedalIntervalsTest, UnsortedInputWalkedInTickOrder) {
  Document doc = makeDocument({makeNote(0, 60, 0, 10, 80)}, {pedalOff(20), pedalOn(10)});
  auto table = buildPedalIntervals(doc);
  ASSERT_EQ(table[0].size(), 1u);
  EXPECT_EQ(table[0][0].start, 10u);
  EXPECT_EQ(table[0][0].end, 20u);
}

TEST(PedalIntervalsTest, OpenPedalClosesAtLastNoteEnd) {
  // Notes on another channel still count toward the final tick
  Document doc = makeDocument({makeNote(0, 60, 0, 100, 80), makeNote(3, 40, 0, 900, 80)},
                              {pedalOn(50)});
  auto table = buildPedalIntervals(doc);
  ASSERT_EQ(table[0].size(), 1u);
  EXPECT_EQ(table[0][0].start, 50u);
  EXPECT_EQ(table[0][0].end, 900u);
}

TEST(PedalIntervalsTest, OpenPedalWithoutNotesIsEmpty) {
  Document doc = makeDocument({}, {pedalOn(50)});
  auto table = buildPedalIntervals(doc);
  ASSERT_EQ(table[0].size(), 1u);
  EXPECT_EQ(table[0][0].start, 50u);
  EXPECT_EQ(table[0][0].end, 50u);
}

// ============================================================================
// resolvePedal
// ============================================================================

TEST(PedalResolverTest, ExtendsNoteEndingInsideInterval) {
  Document doc = makeDocument({makeNote(0, 60, 0, 100, 80)}, {pedalOn(50), pedalOff(200)});
  resolvePedal(doc);
  EXPECT_EQ(doc.noteMsgs()[0].end, 200u);
  EXPECT_EQ(doc.noteMsgs()[0].start, 0u);
  EXPECT_TRUE(doc.pedalResolved());
}

TEST(PedalResolverTest, BoundariesAreExclusive) {
  Document doc = makeDocument({makeNote(0, 60, 0, 50, 80), makeNote(0, 62, 0, 200, 80)},
                              {pedalOn(50), pedalOff(200)});
  resolvePedal(doc);
  EXPECT_EQ(doc.noteMsgs()[0].end, 50u);
  EXPECT_EQ(doc.noteMsgs()[1].end, 200u);
}

TEST(PedalResolverTest, OnlyOwnChannelPedalApplies) {
  Document doc = makeDocument({makeNote(1, 60, 0, 100, 80)}, {pedalOn(50, 0), pedalOff(200, 0)});
  resolvePedal(doc);
  EXPECT_EQ(doc.noteMsgs()[0].end, 100u);
}

TEST(PedalResolverTest, FirstMatchingIntervalWins) {
  Document doc = makeDocument({makeNote(0, 60, 0, 100, 80)},
                              {pedalOn(50), pedalOff(150), pedalOn(160), pedalOff(300)});
  resolvePedal(doc);
  EXPECT_EQ(doc.noteMsgs()[0].end, 150u);
}

TEST(PedalResolverTest, ExtendedNotesAreFlattened) {
  Document doc = makeDocument({makeNote(0, 60, 0, 100, 80), makeNote(0, 60, 150, 250, 80)},
                              {pedalOn(50), pedalOff(400)});
  resolvePedal(doc);
  EXPECT_EQ(doc.noteMsgs()[0].end, 150u);
  EXPECT_EQ(doc.noteMsgs()[1].end, 400u);
  EXPECT_TRUE(test::hasNoSamePitchOverlap(doc.noteMsgs()));
}

TEST(PedalResolverTest, EndsNeverShrinkForOverlapFreeInput) {
  std::vector<NoteMessage> notes = {makeNote(0, 60, 0, 100, 80),  makeNote(0, 64, 10, 120, 80),
                                    makeNote(0, 60, 130, 180, 80), makeNote(0, 67, 200, 260, 80),
                                    makeNote(1, 36, 0, 500, 80),  makeNote(0, 64, 300, 310, 80)};
  Document doc = makeDocument(notes, {pedalOn(90), pedalOff(140), pedalOn(250), pedalOff(700),
                                      pedalOn(40, 1), pedalOff(80, 1)});
  std::vector<NoteMessage> before = doc.noteMsgs();

  resolvePedal(doc);

  ASSERT_EQ(doc.noteMsgs().size(), before.size());
  for (size_t i = 0; i < before.size(); ++i) {
    EXPECT_GE(doc.noteMsgs()[i].end, before[i].end) << "note " << i;
    EXPECT_EQ(doc.noteMsgs()[i].start, before[i].start);
  }
  EXPECT_TRUE(test::hasNoSamePitchOverlap(doc.noteMsgs()));
}

TEST(PedalResolverTest, SecondCallExtendsAgain) {
  Document doc = makeDocument({makeNote(0, 60, 0, 100, 80), makeNote(0, 62, 0, 40, 80)},
                              {pedalOn(10), pedalOff(60), pedalOn(90), pedalOff(300)});
  resolvePedal(doc);
  EXPECT_EQ(doc.noteMsgs()[0].end, 300u);
  EXPECT_EQ(doc.noteMsgs()[1].end, 60u);

  // Warns and runs again; 60 is not strictly inside any interval, so
  // nothing further moves here.
  resolvePedal(doc);
  EXPECT_TRUE(doc.pedalResolved());
  EXPECT_EQ(doc.noteMsgs()[0].end, 300u);
  EXPECT_EQ(doc.noteMsgs()[1].end, 60u);
}

TEST(PedalResolverTest, SecondCallIsNotIdempotent) {
  // The unreleased pedal on channel 0 closes at the latest note end, which
  // the first pass moves from 100 to 500.
  Document doc = makeDocument({makeNote(0, 60, 0, 30, 80), makeNote(1, 48, 0, 100, 80)},
                              {pedalOn(10, 0), pedalOn(50, 1), pedalOff(500, 1)});
  resolvePedal(doc);
  EXPECT_EQ(doc.noteMsgs()[0].end, 100u);
  EXPECT_EQ(doc.noteMsgs()[1].end, 500u);

  resolvePedal(doc);
  EXPECT_EQ(doc.noteMsgs()[0].end, 500u);
  EXPECT_EQ(doc.noteMsgs()[1].end, 500u);
}

TEST(PedalResolverTest, StrictModeRefusesSecondCall) {
  Document doc = makeDocument({makeNote(0, 60, 0, 100, 80)}, {pedalOn(50), pedalOff(200)});
  std::string error;
  ASSERT_TRUE(resolvePedalStrict(doc, error));
  EXPECT_EQ(doc.noteMsgs()[0].end, 200u);

  std::vector<NoteMessage> snapshot = doc.noteMsgs();
  EXPECT_FALSE(resolvePedalStrict(doc, error));
  EXPECT_FALSE(error.empty());
  EXPECT_EQ(doc.noteMsgs()[0], snapshot[0]);
}

}  // namespace
}  // namespace midinorm
