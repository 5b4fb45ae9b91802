/**
 * @file test_helpers.h
 * @brief Shared helper functions for tests.
 *
 * Builders for small Documents and raw tracks used across test files.
 */

#ifndef MIDINORM_TEST_TEST_HELPERS_H
#define MIDINORM_TEST_TEST_HELPERS_H

#include <algorithm>
#include <cstdint>
#include <map>
#include <utility>
#include <vector>

#include "core/document.h"
#include "core/types.h"

namespace midinorm {
namespace test {

/// @brief Document with default tempo/instrument and the given notes.
inline Document makeDocument(std::vector<NoteMessage> notes,
                             std::vector<PedalMessage> pedals = {},
                             uint16_t ticks_per_beat = kDefaultTicksPerBeat) {
  return Document({}, {}, std::move(pedals), {}, std::move(notes), ticks_per_beat);
}

inline PedalMessage pedalOn(Tick tick, uint8_t channel = 0) {
  return PedalMessage{tick, channel, PedalState::On};
}

inline PedalMessage pedalOff(Tick tick, uint8_t channel = 0) {
  return PedalMessage{tick, channel, PedalState::Off};
}

/// @brief True if, within each (channel, pitch) group ordered by (start, end),
/// every note ends at or before the next one starts.
inline bool hasNoSamePitchOverlap(const std::vector<NoteMessage>& notes) {
  std::map<std::pair<uint8_t, uint8_t>, std::vector<NoteMessage>> groups;
  for (const auto& note : notes) groups[{note.channel, note.pitch}].push_back(note);
  for (auto& [key, group] : groups) {
    std::stable_sort(group.begin(), group.end(), [](const NoteMessage& a, const NoteMessage& b) {
      if (a.start != b.start) return a.start < b.start;
      return a.end < b.end;
    });
    for (size_t i = 1; i < group.size(); ++i) {
      if (group[i - 1].end > group[i].start) return false;
    }
  }
  return true;
}

}  // namespace test
}  // namespace midinorm

#endif  // MIDINORM_TEST_TEST_HELPERS_H
