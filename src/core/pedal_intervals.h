/**
 * @file pedal_intervals.h
 * @brief Per-channel sustain intervals derived from pedal messages.
 */

#ifndef MIDINORM_CORE_PEDAL_INTERVALS_H
#define MIDINORM_CORE_PEDAL_INTERVALS_H

#include <cstdint>
#include <map>
#include <vector>

#include "core/types.h"

namespace midinorm {

class Document;

/// @brief Half-open tick range [start, end) during which the pedal is down.
struct PedalInterval {
  Tick start = 0;
  Tick end = 0;
};

/// Channel -> intervals in tick order, non-overlapping.
using PedalIntervalTable = std::map<uint8_t, std::vector<PedalInterval>>;

/**
 * @brief Build the sustain intervals of every channel.
 *
 * Pedal messages are walked in stable tick order. Repeated presses and
 * releases are ignored. An interval still open after the last message is
 * closed at the greatest note end of the whole document.
 */
PedalIntervalTable buildPedalIntervals(const Document& doc);

}  // namespace midinorm

#endif  // MIDINORM_CORE_PEDAL_INTERVALS_H
