/**
 * @file overlap_resolver.h
 * @brief Removes overlaps between notes sharing a channel and pitch.
 */

#ifndef MIDINORM_CORE_OVERLAP_RESOLVER_H
#define MIDINORM_CORE_OVERLAP_RESOLVER_H

#include <vector>

#include "core/types.h"

namespace midinorm {

/**
 * @brief Trim same-channel, same-pitch overlaps in place.
 *
 * Within each (channel, pitch) group, ordered by (start, end), a note that
 * ends after its successor starts is cut back to the successor's start:
 *
 *   [a, b+x], [b-y, c]  ->  [a, b-y], [b-y, c]
 *
 * Start ticks, velocities and sequence order are never changed. Running it
 * twice gives the same result as running it once.
 *
 * @param notes Note sequence, edited by index
 */
void resolveOverlaps(std::vector<NoteMessage>& notes);

}  // namespace midinorm

#endif  // MIDINORM_CORE_OVERLAP_RESOLVER_H
