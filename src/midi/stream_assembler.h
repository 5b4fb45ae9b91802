/**
 * @file stream_assembler.h
 * @brief Re-linearizes a Document into one ordered MIDI event track.
 */

#ifndef MIDINORM_MIDI_STREAM_ASSEMBLER_H
#define MIDINORM_MIDI_STREAM_ASSEMBLER_H

#include "core/document.h"
#include "midi/raw_event.h"

namespace midinorm {

/**
 * @brief Build the absolute-tick event list for a Document.
 *
 * Emits set-tempo, sustain (on -> 127, off -> 0), program-change, a note-on
 * per note, and a velocity-0 note-on release per note unless a later note of
 * the same channel and pitch starts inside it and ends after it. Events are
 * stable-sorted by (tick, velocity), non-note events sorting as velocity 1000.
 * Meta text is not emitted. No end-of-track is appended.
 */
RawTrack assembleEvents(const Document& doc);

/**
 * @brief Build a format-0 stream: assembleEvents() in delta ticks followed
 *        by end-of-track, with the Document's ticks_per_beat.
 */
RawMidi assembleStream(const Document& doc);

}  // namespace midinorm

#endif  // MIDINORM_MIDI_STREAM_ASSEMBLER_H
