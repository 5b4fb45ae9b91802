/**
 * @file types.h
 * @brief Fundamental types: Tick and the canonical message records.
 */

#ifndef MIDINORM_CORE_TYPES_H
#define MIDINORM_CORE_TYPES_H

#include <cstdint>
#include <string>
#include <vector>

namespace midinorm {

/// Time unit in ticks.
using Tick = uint32_t;

/// Ticks per quarter note used when a Document is built without a source.
constexpr uint16_t kDefaultTicksPerBeat = 480;

/// 120 BPM, the SMF default when a file carries no set-tempo event.
constexpr uint32_t kDefaultMicrosecondsPerQuarter = 500000;

/// Control number of the sustain (damper) pedal.
constexpr uint8_t kSustainPedalControl = 64;

/// Control values at or above this threshold mean "pedal down".
constexpr uint8_t kPedalOnThreshold = 64;

/// Channel reserved for percussion in General MIDI.
constexpr uint8_t kPercussionChannel = 9;

constexpr uint8_t kNumChannels = 16;
constexpr uint8_t kNumPrograms = 128;

/// @brief Kind of a text-bearing meta message.
enum class MetaKind : uint8_t { Text, Copyright };

/// @brief Text or copyright meta message (carries no tick).
struct MetaMessage {
  MetaKind kind = MetaKind::Text;
  std::string text;
};

/// @brief Set-tempo message.
struct TempoMessage {
  Tick tick = 0;
  uint32_t microseconds_per_quarter = kDefaultMicrosecondsPerQuarter;
};

/// @brief Sustain pedal state.
enum class PedalState : uint8_t { Off = 0, On = 1 };

/// @brief Sustain pedal message (control change #64).
struct PedalMessage {
  Tick tick = 0;
  uint8_t channel = 0;
  PedalState state = PedalState::Off;
};

/// @brief Program change message.
struct InstrumentMessage {
  Tick tick = 0;
  uint8_t channel = 0;
  uint8_t program = 0;
};

/// @brief Note built from a paired note-on/note-off.
///
/// `tick` always equals `start`; `start <= end`.
struct NoteMessage {
  Tick tick = 0;
  uint8_t channel = 0;
  uint8_t pitch = 0;
  Tick start = 0;
  Tick end = 0;
  uint8_t velocity = 0;
};

/// @brief Convenience factory keeping tick and start in sync.
inline NoteMessage makeNote(uint8_t channel, uint8_t pitch, Tick start, Tick end,
                            uint8_t velocity) {
  return NoteMessage{start, channel, pitch, start, end, velocity};
}

inline const char* metaKindToString(MetaKind kind) {
  switch (kind) {
    case MetaKind::Text: return "text";
    case MetaKind::Copyright: return "copyright";
  }
  return "text";
}

inline bool operator==(const NoteMessage& a, const NoteMessage& b) {
  return a.tick == b.tick && a.channel == b.channel && a.pitch == b.pitch &&
         a.start == b.start && a.end == b.end && a.velocity == b.velocity;
}

inline bool operator==(const PedalMessage& a, const PedalMessage& b) {
  return a.tick == b.tick && a.channel == b.channel && a.state == b.state;
}

inline bool operator==(const InstrumentMessage& a, const InstrumentMessage& b) {
  return a.tick == b.tick && a.channel == b.channel && a.program == b.program;
}

inline bool operator==(const TempoMessage& a, const TempoMessage& b) {
  return a.tick == b.tick && a.microseconds_per_quarter == b.microseconds_per_quarter;
}

inline bool operator==(const MetaMessage& a, const MetaMessage& b) {
  return a.kind == b.kind && a.text == b.text;
}

}  // namespace midinorm

#endif  // MIDINORM_CORE_TYPES_H
