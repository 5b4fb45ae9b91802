/**
 * @file instrument_filter.h
 * @brief Removes channels that play unwanted instrument groups.
 */

#ifndef MIDINORM_CORE_INSTRUMENT_FILTER_H
#define MIDINORM_CORE_INSTRUMENT_FILTER_H

#include <array>
#include <cstdint>
#include <set>

#include "core/document.h"

namespace midinorm {

/// @brief Programs (0-127) whose group is flagged true in @p config.
///
/// Groups absent from the config are kept.
std::array<bool, kNumPrograms> programsToRemove(const InstrumentRemovalConfig& config);

/// @brief Channels whose program change selects a flagged program.
///
/// The percussion channel is never returned.
std::set<uint8_t> channelsToRemove(const Document& doc, const InstrumentRemovalConfig& config);

/**
 * @brief Delete every channel-bearing message on the channels to remove.
 *
 * Pedal, instrument and note messages are filtered; meta and tempo messages
 * have no channel and are kept.
 */
void removeInstruments(Document& doc, const InstrumentRemovalConfig& config);

}  // namespace midinorm

#endif  // MIDINORM_CORE_INSTRUMENT_FILTER_H
