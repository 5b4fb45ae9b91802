/**
 * @file pedal_intervals.cpp
 * @brief Implementation of sustain interval construction.
 */

#include "core/pedal_intervals.h"

#include <algorithm>
#include <numeric>

#include "core/document.h"

namespace midinorm {

PedalIntervalTable buildPedalIntervals(const Document& doc) {
  const auto& pedals = doc.pedalMsgs();

  std::vector<size_t> order(pedals.size());
  std::iota(order.begin(), order.end(), 0);
  std::stable_sort(order.begin(), order.end(),
                   [&](size_t a, size_t b) { return pedals[a].tick < pedals[b].tick; });

  PedalIntervalTable table;
  std::map<uint8_t, Tick> down_since;

  for (size_t idx : order) {
    const PedalMessage& msg = pedals[idx];
    auto it = down_since.find(msg.channel);
    if (msg.state == PedalState::On && it == down_since.end()) {
      down_since[msg.channel] = msg.tick;
    } else if (msg.state == PedalState::Off && it != down_since.end()) {
      table[msg.channel].push_back({it->second, msg.tick});
      down_since.erase(it);
    }
  }

  if (down_since.empty()) return table;

  // Close pedals never released at the end of the last sounding note
  bool has_notes = !doc.noteMsgs().empty();
  Tick final_tick = 0;
  for (const auto& note : doc.noteMsgs()) {
    final_tick = std::max(final_tick, note.end);
  }
  for (const auto& [channel, start] : down_since) {
    Tick end = has_notes ? std::max(start, final_tick) : start;
    table[channel].push_back({start, end});
  }

  return table;
}

}  // namespace midinorm
