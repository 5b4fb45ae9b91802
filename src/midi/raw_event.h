/**
 * @file raw_event.h
 * @brief Flat, typed MIDI events as exchanged with an SMF codec.
 */

#ifndef MIDINORM_MIDI_RAW_EVENT_H
#define MIDINORM_MIDI_RAW_EVENT_H

#include <cstdint>
#include <string>
#include <vector>

#include "core/types.h"

namespace midinorm {

/// @brief Event kinds the normalizer understands.
enum class RawEventType : uint8_t {
  NoteOn,
  NoteOff,
  ControlChange,
  ProgramChange,
  SetTempo,
  Text,
  Copyright,
  EndOfTrack
};

/// @brief One MIDI event.
///
/// `tick` is absolute or delta depending on the owning RawMidi.
/// data1/data2 hold (note, velocity), (control, value) or (program, -).
struct RawEvent {
  Tick tick = 0;
  RawEventType type = RawEventType::EndOfTrack;
  uint8_t channel = 0;
  uint8_t data1 = 0;
  uint8_t data2 = 0;
  uint32_t tempo = 0;  ///< Microseconds per quarter (SetTempo)
  std::string text;    ///< Text and Copyright
};

using RawTrack = std::vector<RawEvent>;

/// @brief A multi-track event stream plus its resolution.
struct RawMidi {
  uint16_t ticks_per_beat = kDefaultTicksPerBeat;
  uint8_t format = 1;
  bool delta_ticks = false;  ///< true if event ticks are deltas
  std::vector<RawTrack> tracks;
};

/// @name Event factories
/// @{
inline RawEvent makeNoteOn(Tick tick, uint8_t channel, uint8_t note, uint8_t velocity) {
  RawEvent e;
  e.tick = tick;
  e.type = RawEventType::NoteOn;
  e.channel = channel;
  e.data1 = note;
  e.data2 = velocity;
  return e;
}

inline RawEvent makeNoteOff(Tick tick, uint8_t channel, uint8_t note, uint8_t velocity = 0) {
  RawEvent e = makeNoteOn(tick, channel, note, velocity);
  e.type = RawEventType::NoteOff;
  return e;
}

inline RawEvent makeControlChange(Tick tick, uint8_t channel, uint8_t control, uint8_t value) {
  RawEvent e;
  e.tick = tick;
  e.type = RawEventType::ControlChange;
  e.channel = channel;
  e.data1 = control;
  e.data2 = value;
  return e;
}

inline RawEvent makeProgramChange(Tick tick, uint8_t channel, uint8_t program) {
  RawEvent e;
  e.tick = tick;
  e.type = RawEventType::ProgramChange;
  e.channel = channel;
  e.data1 = program;
  return e;
}

inline RawEvent makeSetTempo(Tick tick, uint32_t microseconds_per_quarter) {
  RawEvent e;
  e.tick = tick;
  e.type = RawEventType::SetTempo;
  e.tempo = microseconds_per_quarter;
  return e;
}

inline RawEvent makeTextEvent(Tick tick, RawEventType type, std::string text) {
  RawEvent e;
  e.tick = tick;
  e.type = type;
  e.text = std::move(text);
  return e;
}

inline RawEvent makeEndOfTrack(Tick tick) {
  RawEvent e;
  e.tick = tick;
  e.type = RawEventType::EndOfTrack;
  return e;
}
/// @}

/// @brief Rewrite delta ticks as absolute ticks.
inline void toAbsolute(RawTrack& track) {
  Tick current = 0;
  for (auto& event : track) {
    current += event.tick;
    event.tick = current;
  }
}

/// @brief Rewrite absolute ticks as deltas. The track must be tick-ordered.
inline void toDelta(RawTrack& track) {
  Tick prev = 0;
  for (auto& event : track) {
    Tick abs = event.tick;
    event.tick = abs - prev;
    prev = abs;
  }
}

}  // namespace midinorm

#endif  // MIDINORM_MIDI_RAW_EVENT_H
