/**
 * @file tempo_map.cpp
 * @brief Implementation of tempo-aware duration queries.
 */

#include "core/tempo_map.h"

#include <cmath>

namespace midinorm {

size_t activeTempoIndex(const std::vector<TempoMessage>& tempos, Tick tick) {
  size_t idx = 0;
  for (size_t i = 0; i < tempos.size(); ++i) {
    if (tempos[i].tick > tick) break;
    idx = i;
  }
  return idx;
}

int64_t durationMs(Tick start_tick, Tick end_tick, const std::vector<TempoMessage>& tempos,
                   uint16_t ticks_per_beat) {
  if (end_tick <= start_tick || ticks_per_beat == 0) return 0;

  if (tempos.empty()) {
    double seconds =
        ticksToSeconds(end_tick - start_tick, kDefaultMicrosecondsPerQuarter, ticks_per_beat);
    return static_cast<int64_t>(std::nearbyint(seconds * 1e3));
  }

  double seconds = 0.0;
  Tick curr_tick = start_tick;
  bool reached_end = false;

  // Full and partial segments up to the last tempo change
  for (size_t i = activeTempoIndex(tempos, start_tick); i + 1 < tempos.size(); ++i) {
    Tick next_tick = tempos[i + 1].tick;
    uint32_t tempo = tempos[i].microseconds_per_quarter;
    if (end_tick < next_tick) {
      seconds += ticksToSeconds(end_tick - curr_tick, tempo, ticks_per_beat);
      reached_end = true;
      break;
    }
    if (next_tick > curr_tick) {
      seconds += ticksToSeconds(next_tick - curr_tick, tempo, ticks_per_beat);
      curr_tick = next_tick;
    }
  }

  // Tail past the last tempo change
  if (!reached_end && end_tick > curr_tick) {
    seconds +=
        ticksToSeconds(end_tick - curr_tick, tempos.back().microseconds_per_quarter, ticks_per_beat);
  }

  return static_cast<int64_t>(std::nearbyint(seconds * 1e3));
}

}  // namespace midinorm
