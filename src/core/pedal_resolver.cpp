/**
 * @file pedal_resolver.cpp
 * @brief Implementation of sustain pedal note extension.
 */

#include "core/pedal_resolver.h"

#include <iostream>

#include "core/document.h"
#include "core/overlap_resolver.h"
#include "core/pedal_intervals.h"

namespace midinorm {

namespace {

void extendNotes(Document& doc) {
  PedalIntervalTable intervals = buildPedalIntervals(doc);

  auto& notes = doc.noteMsgs();
  for (size_t i = 0; i < notes.size(); ++i) {
    auto it = intervals.find(notes[i].channel);
    if (it == intervals.end()) continue;

    for (const auto& interval : it->second) {
      if (interval.start < notes[i].end && notes[i].end < interval.end) {
        notes[i].end = interval.end;
        break;
      }
    }
  }

  resolveOverlaps(notes);
  doc.setPedalResolved(true);
}

}  // namespace

void resolvePedal(Document& doc) {
  if (doc.pedalResolved()) {
    std::cerr << "midinorm: warning: pedal has already been resolved\n";
  }
  extendNotes(doc);
}

bool resolvePedalStrict(Document& doc, std::string& error) {
  if (doc.pedalResolved()) {
    error = "Pedal has already been resolved";
    return false;
  }
  extendNotes(doc);
  return true;
}

}  // namespace midinorm
