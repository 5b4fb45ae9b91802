/**
 * @file note_pairer.h
 * @brief Pairs note-on/note-off events into notes and sorts the other
 *        events into their Document sequences.
 */

#ifndef MIDINORM_MIDI_NOTE_PAIRER_H
#define MIDINORM_MIDI_NOTE_PAIRER_H

#include <vector>

#include "core/document.h"
#include "midi/raw_event.h"

namespace midinorm {

/// @brief Sequences recovered from one track, each stable-sorted by tick.
struct PairedTrack {
  std::vector<MetaMessage> meta_msgs;
  std::vector<TempoMessage> tempo_msgs;
  std::vector<PedalMessage> pedal_msgs;
  std::vector<InstrumentMessage> instrument_msgs;
  std::vector<NoteMessage> note_msgs;
};

/**
 * @brief Pair one absolute-tick track.
 *
 * Open notes are tracked per (channel, pitch) in arrival order. A release at
 * tick T closes every open entry that started before or after T, in order;
 * entries that started exactly at T stay open. Releases with nothing open
 * are dropped, as are notes still open when the track ends.
 */
PairedTrack pairTrack(const RawTrack& track);

/**
 * @brief Pair every track and build a Document.
 *
 * Tracks are paired independently and concatenated in track order, then the
 * tempo, pedal, instrument and note sequences are stable-sorted by tick.
 * Delta-tick input is converted to absolute ticks first.
 */
Document pairTracks(const RawMidi& midi);

}  // namespace midinorm

#endif  // MIDINORM_MIDI_NOTE_PAIRER_H
