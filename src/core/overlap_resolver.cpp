/**
 * @file overlap_resolver.cpp
 * @brief Implementation of same-pitch overlap trimming.
 */

#include "core/overlap_resolver.h"

#include <algorithm>
#include <cstdint>
#include <map>
#include <utility>

namespace midinorm {

void resolveOverlaps(std::vector<NoteMessage>& notes) {
  // key = (channel, pitch), value = indices into notes
  std::map<std::pair<uint8_t, uint8_t>, std::vector<size_t>> groups;
  for (size_t i = 0; i < notes.size(); ++i) {
    groups[{notes[i].channel, notes[i].pitch}].push_back(i);
  }

  for (auto& [key, indices] : groups) {
    std::stable_sort(indices.begin(), indices.end(), [&](size_t a, size_t b) {
      if (notes[a].start != notes[b].start) return notes[a].start < notes[b].start;
      return notes[a].end < notes[b].end;
    });

    for (size_t k = 1; k < indices.size(); ++k) {
      NoteMessage& prev = notes[indices[k - 1]];
      const NoteMessage& curr = notes[indices[k]];
      if (prev.end > curr.start) {
        prev.end = curr.start;
      }
    }
  }
}

}  // namespace midinorm
