/**
 * @file raw_event_json.cpp
 * @brief Implementation of the raw event JSON codec.
 */

#include "midi/raw_event_json.h"

#include <fstream>
#include <limits>
#include <sstream>

namespace midinorm {

namespace {

const char* const kTypeNames[] = {"note_on", "note_off",  "control_change", "program_change",
                                  "set_tempo", "text", "copyright", "end_of_track"};

constexpr size_t kTypeCount = sizeof(kTypeNames) / sizeof(kTypeNames[0]);

}  // namespace

const char* rawEventTypeName(RawEventType type) {
  auto idx = static_cast<size_t>(type);
  if (idx >= kTypeCount) return "unknown";
  return kTypeNames[idx];
}

std::optional<RawEventType> rawEventTypeFromName(const std::string& name) {
  for (size_t i = 0; i < kTypeCount; ++i) {
    if (name == kTypeNames[i]) return static_cast<RawEventType>(i);
  }
  return std::nullopt;
}

std::string writeRawEventJson(const RawMidi& midi, bool pretty) {
  std::ostringstream oss;
  json::Writer w(oss, pretty);
  w.beginObject()
      .write("ticks_per_beat", static_cast<int>(midi.ticks_per_beat))
      .write("format", static_cast<int>(midi.format))
      .write("delta", midi.delta_ticks);

  w.beginArray("tracks");
  for (const auto& track : midi.tracks) {
    w.beginArray();
    for (const auto& e : track) {
      w.beginObject().write("type", rawEventTypeName(e.type)).write("tick", e.tick);
      switch (e.type) {
        case RawEventType::NoteOn:
        case RawEventType::NoteOff:
          w.write("channel", static_cast<int>(e.channel))
              .write("note", static_cast<int>(e.data1))
              .write("velocity", static_cast<int>(e.data2));
          break;
        case RawEventType::ControlChange:
          w.write("channel", static_cast<int>(e.channel))
              .write("control", static_cast<int>(e.data1))
              .write("value", static_cast<int>(e.data2));
          break;
        case RawEventType::ProgramChange:
          w.write("channel", static_cast<int>(e.channel))
              .write("program", static_cast<int>(e.data1));
          break;
        case RawEventType::SetTempo:
          w.write("tempo", e.tempo);
          break;
        case RawEventType::Text:
        case RawEventType::Copyright:
          w.write("text", e.text);
          break;
        case RawEventType::EndOfTrack:
          break;
      }
      w.endObject();
    }
    w.endArray();
  }
  w.endArray();

  w.endObject();
  return oss.str();
}

bool RawEventReader::read(const std::string& path) {
  std::ifstream file(path, std::ios::binary);
  if (!file) {
    midi_ = RawMidi{};
    error_ = "Failed to open file: " + path;
    return false;
  }
  std::ostringstream oss;
  oss << file.rdbuf();
  return parse(oss.str());
}

bool RawEventReader::parse(const std::string& json) {
  midi_ = RawMidi{};
  error_.clear();

  json::Parser root(json);
  if (!root.ok()) {
    error_ = "Malformed JSON at offset " + std::to_string(root.errorOffset());
    return false;
  }

  int64_t tpb = 0;
  if (!root.tryGetInt("ticks_per_beat", tpb) || tpb < 1 ||
      tpb > std::numeric_limits<uint16_t>::max()) {
    error_ = "Invalid ticks_per_beat";
    return false;
  }
  midi_.ticks_per_beat = static_cast<uint16_t>(tpb);

  int64_t format = 1;
  if (root.has("format") && (!root.tryGetInt("format", format) || format < 0 || format > 2)) {
    error_ = "Invalid format";
    return false;
  }
  midi_.format = static_cast<uint8_t>(format);

  if (root.has("delta") && root.kind("delta") != json::ValueKind::Bool) {
    error_ = "\"delta\" must be true or false";
    return false;
  }
  bool delta = root.getBool("delta");

  std::vector<std::string> tracks;
  if (!root.getRawArray("tracks", tracks)) {
    error_ = "Missing \"tracks\" array";
    midi_ = RawMidi{};
    return false;
  }

  size_t track_index = 0;
  for (const auto& track_json : tracks) {
    std::vector<std::string> events;
    if (track_json.empty() || track_json[0] != '[' ||
        !json::Parser::splitArray(track_json, events)) {
      error_ = "Track " + std::to_string(track_index) + " is not an array of events";
      midi_ = RawMidi{};
      return false;
    }
    RawTrack track;
    size_t event_index = 0;
    for (const auto& event_json : events) {
      json::Parser p(event_json);
      RawEvent event;
      if (!parseEvent(p, event)) {
        error_ += " (track " + std::to_string(track_index) + ", event " +
                  std::to_string(event_index) + ")";
        midi_ = RawMidi{};
        return false;
      }
      track.push_back(std::move(event));
      ++event_index;
    }
    if (delta) toAbsolute(track);
    midi_.tracks.push_back(std::move(track));
    ++track_index;
  }
  return true;
}

bool RawEventReader::readByte(const json::Parser& p, const char* key, uint8_t max,
                              uint8_t& out) {
  int64_t value = 0;
  if (!p.tryGetInt(key, value) || value < 0 || value > max) {
    error_ = std::string("Invalid \"") + key + "\"";
    return false;
  }
  out = static_cast<uint8_t>(value);
  return true;
}

bool RawEventReader::parseEvent(const json::Parser& p, RawEvent& out) {
  if (!p.ok()) {
    error_ = "Event is not an object";
    return false;
  }
  auto type = rawEventTypeFromName(p.getString("type"));
  if (!type) {
    error_ = "Unknown event type \"" + p.getString("type") + "\"";
    return false;
  }
  out.type = *type;

  int64_t tick = 0;
  if (!p.tryGetInt("tick", tick) || tick < 0 || tick > std::numeric_limits<Tick>::max()) {
    error_ = "Invalid \"tick\"";
    return false;
  }
  out.tick = static_cast<Tick>(tick);

  switch (out.type) {
    case RawEventType::NoteOn:
    case RawEventType::NoteOff:
      return readByte(p, "channel", kNumChannels - 1, out.channel) &&
             readByte(p, "note", 127, out.data1) && readByte(p, "velocity", 127, out.data2);
    case RawEventType::ControlChange:
      return readByte(p, "channel", kNumChannels - 1, out.channel) &&
             readByte(p, "control", 127, out.data1) && readByte(p, "value", 127, out.data2);
    case RawEventType::ProgramChange:
      return readByte(p, "channel", kNumChannels - 1, out.channel) &&
             readByte(p, "program", 127, out.data1);
    case RawEventType::SetTempo: {
      int64_t tempo = 0;
      if (!p.tryGetInt("tempo", tempo) || tempo < 1 || tempo > 0xFFFFFF) {
        error_ = "Invalid \"tempo\"";
        return false;
      }
      out.tempo = static_cast<uint32_t>(tempo);
      return true;
    }
    case RawEventType::Text:
    case RawEventType::Copyright:
      if (p.kind("text") != json::ValueKind::String) {
        error_ = "Missing \"text\"";
        return false;
      }
      out.text = p.getString("text");
      return true;
    case RawEventType::EndOfTrack:
      return true;
  }
  return true;
}

}  // namespace midinorm
