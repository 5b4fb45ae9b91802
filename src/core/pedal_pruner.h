/**
 * @file pedal_pruner.h
 * @brief Removes sustain pedal messages that have no audible effect.
 */

#ifndef MIDINORM_CORE_PEDAL_PRUNER_H
#define MIDINORM_CORE_PEDAL_PRUNER_H

#include <vector>

#include "core/types.h"

namespace midinorm {

class Document;

/**
 * @brief True if some note ends inside the closed range [start, end].
 * @param start Pedal press tick
 * @param end Pedal release tick
 * @param notes Notes of one channel sorted by start; scanning stops at the
 *        first note starting after @p end
 */
bool isPedalUseful(Tick start, Tick end, const std::vector<const NoteMessage*>& notes);

/**
 * @brief Delete redundant pedal messages, channel by channel.
 *
 * - Channels without notes lose all their pedal messages.
 * - A release while the pedal is up and a press while it is down are removed.
 * - A press/release pair during which no note of the channel ends is removed.
 * - A press that is never released is removed.
 *
 * Only the pedal sequence is modified; survivors keep their relative order.
 */
void removeRedundantPedals(Document& doc);

}  // namespace midinorm

#endif  // MIDINORM_CORE_PEDAL_PRUNER_H
