/**
 * @file tempo_map.h
 * @brief Tempo-aware tick to wall-clock conversion.
 */

#ifndef MIDINORM_CORE_TEMPO_MAP_H
#define MIDINORM_CORE_TEMPO_MAP_H

#include <cstddef>
#include <cstdint>
#include <vector>

#include "core/types.h"

namespace midinorm {

/**
 * @brief Convert MIDI ticks to seconds at a fixed tempo.
 * @param ticks Number of MIDI ticks
 * @param microseconds_per_quarter Tempo in microseconds per quarter note
 * @param ticks_per_beat Pulses per quarter note
 * @return Duration in seconds
 */
inline double ticksToSeconds(Tick ticks, uint32_t microseconds_per_quarter,
                             uint16_t ticks_per_beat) {
  double scale = microseconds_per_quarter * 1e-6 / ticks_per_beat;
  return ticks * scale;
}

/**
 * @brief Index of the tempo segment in effect at a tick.
 *
 * Greatest index whose tick is <= @p tick, or 0 when @p tick precedes the
 * first entry.
 *
 * @param tempos Tempo map sorted by tick (must be non-empty)
 * @param tick Query position
 */
size_t activeTempoIndex(const std::vector<TempoMessage>& tempos, Tick tick);

/**
 * @brief Elapsed milliseconds between two ticks across tempo changes.
 *
 * Segment contributions are summed in seconds as doubles and rounded to the
 * nearest millisecond once, at the end (ties to even). Past the last tempo
 * change the last tempo applies.
 *
 * @param start_tick Start of the span
 * @param end_tick End of the span (>= start_tick, otherwise 0 is returned)
 * @param tempos Tempo map sorted by tick; empty means the 120 BPM default
 * @param ticks_per_beat Pulses per quarter note (0 yields 0)
 * @return Duration in milliseconds
 */
int64_t durationMs(Tick start_tick, Tick end_tick, const std::vector<TempoMessage>& tempos,
                   uint16_t ticks_per_beat);

}  // namespace midinorm

#endif  // MIDINORM_CORE_TEMPO_MAP_H
