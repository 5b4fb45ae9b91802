/**
 * @file raw_event_json.h
 * @brief JSON form of RawMidi, used at the SMF codec boundary.
 *
 * @code
 * {"ticks_per_beat": 480, "delta": false,
 *  "tracks": [[{"type": "note_on", "tick": 0, "channel": 0, "note": 60,
 *               "velocity": 90}, ...]]}
 * @endcode
 */

#ifndef MIDINORM_MIDI_RAW_EVENT_JSON_H
#define MIDINORM_MIDI_RAW_EVENT_JSON_H

#include <optional>
#include <string>

#include "core/json_helpers.h"
#include "midi/raw_event.h"

namespace midinorm {

/// @brief JSON name of an event type ("note_on", ...).
const char* rawEventTypeName(RawEventType type);

/// @brief Event type for a JSON name; nullopt if unknown.
std::optional<RawEventType> rawEventTypeFromName(const std::string& name);

/// @brief Serialize events. "delta" mirrors RawMidi::delta_ticks.
std::string writeRawEventJson(const RawMidi& midi, bool pretty = false);

/**
 * @brief Reader for raw event JSON.
 *
 * Delta-tick input ("delta": true) is converted to absolute ticks, so
 * getMidi().delta_ticks is always false after a successful read.
 */
class RawEventReader {
 public:
  bool read(const std::string& path);
  bool parse(const std::string& json);

  const RawMidi& getMidi() const { return midi_; }
  const std::string& getError() const { return error_; }

 private:
  bool parseEvent(const json::Parser& p, RawEvent& out);
  bool readByte(const json::Parser& p, const char* key, uint8_t max, uint8_t& out);

  RawMidi midi_;
  std::string error_;
};

}  // namespace midinorm

#endif  // MIDINORM_MIDI_RAW_EVENT_JSON_H
