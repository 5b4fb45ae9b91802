/**
 * @file document_test.cpp
 * @brief Tests for Document construction and chained transformations.
 */

#include "core/document.h"

#include <gtest/gtest.h>

#include "test_support/test_helpers.h"

namespace midinorm {
namespace {

TEST(DocumentTest, DefaultHasTempoAndInstrument) {
  Document doc;
  ASSERT_EQ(doc.tempoMsgs().size(), 1u);
  EXPECT_EQ(doc.tempoMsgs()[0].tick, 0u);
  EXPECT_EQ(doc.tempoMsgs()[0].microseconds_per_quarter, 500000u);
  ASSERT_EQ(doc.instrumentMsgs().size(), 1u);
  EXPECT_EQ(doc.instrumentMsgs()[0].channel, 0);
  EXPECT_EQ(doc.instrumentMsgs()[0].program, 0);
  EXPECT_EQ(doc.ticksPerBeat(), kDefaultTicksPerBeat);
  EXPECT_FALSE(doc.pedalResolved());
}

TEST(DocumentTest, ExistingTempoNotReplaced) {
  Document doc({}, {{0, 400000}}, {}, {{0, 1, 40}}, {}, 96);
  ASSERT_EQ(doc.tempoMsgs().size(), 1u);
  EXPECT_EQ(doc.tempoMsgs()[0].microseconds_per_quarter, 400000u);
  ASSERT_EQ(doc.instrumentMsgs().size(), 1u);
  EXPECT_EQ(doc.instrumentMsgs()[0].program, 40);
}

TEST(DocumentTest, NotesStableSortedByTick) {
  std::vector<NoteMessage> notes = {makeNote(0, 64, 100, 200, 80), makeNote(0, 60, 0, 50, 70),
                                    makeNote(0, 67, 100, 150, 90), makeNote(0, 62, 0, 10, 60)};
  Document doc = test::makeDocument(notes);
  const auto& sorted = doc.noteMsgs();
  ASSERT_EQ(sorted.size(), 4u);
  EXPECT_EQ(sorted[0].pitch, 60);
  EXPECT_EQ(sorted[1].pitch, 62);
  EXPECT_EQ(sorted[2].pitch, 64);
  EXPECT_EQ(sorted[3].pitch, 67);
}

TEST(DocumentTest, TickToMs) {
  Document doc({}, {{0, 500000}, {480, 250000}}, {}, {}, {}, 480);
  EXPECT_EQ(doc.tickToMs(0), 0);
  EXPECT_EQ(doc.tickToMs(480), 500);
  EXPECT_EQ(doc.tickToMs(960), 750);
}

TEST(DocumentTest, TransformationsChain) {
  Document doc = test::makeDocument(
      {makeNote(0, 60, 0, 100, 80), makeNote(0, 60, 150, 250, 80)},
      {test::pedalOn(50), test::pedalOff(400), test::pedalOn(500), test::pedalOff(600)});

  doc.resolvePedal().removeRedundantPedals();

  ASSERT_EQ(doc.noteMsgs().size(), 2u);
  EXPECT_EQ(doc.noteMsgs()[0].end, 150u);
  EXPECT_EQ(doc.noteMsgs()[1].end, 400u);
  // [500, 600] holds no note end
  ASSERT_EQ(doc.pedalMsgs().size(), 2u);
  EXPECT_EQ(doc.pedalMsgs()[0].tick, 50u);
  EXPECT_EQ(doc.pedalMsgs()[1].tick, 400u);
  EXPECT_TRUE(doc.pedalResolved());
}

}  // namespace
}  // namespace midinorm
