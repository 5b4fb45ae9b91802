/**
 * @file stream_assembler.cpp
 * @brief Implementation of Document to event stream assembly.
 */

#include "midi/stream_assembler.h"

#include <algorithm>
#include <utility>
#include <vector>

namespace midinorm {

namespace {

constexpr int kNonNoteSortKey = 1000;
constexpr uint8_t kPedalDownValue = 127;

int sortKey(const RawEvent& e) {
  if (e.type == RawEventType::NoteOn || e.type == RawEventType::NoteOff) return e.data2;
  return kNonNoteSortKey;
}

// Note interval of one (channel, pitch) group, in emission order.
struct Span {
  Tick start;
  Tick end;
};

// A release is dropped when another note of the group starts strictly inside
// it and ends strictly after it.
bool releaseSuppressed(const Span& span, const std::vector<Span>& group) {
  for (const auto& other : group) {
    if (span.start < other.start && other.start < span.end && span.end < other.end) return true;
  }
  return false;
}

}  // namespace

RawTrack assembleEvents(const Document& doc) {
  RawTrack events;

  for (const auto& msg : doc.tempoMsgs()) {
    events.push_back(makeSetTempo(msg.tick, msg.microseconds_per_quarter));
  }
  for (const auto& msg : doc.pedalMsgs()) {
    uint8_t value = msg.state == PedalState::On ? kPedalDownValue : 0;
    events.push_back(makeControlChange(msg.tick, msg.channel, kSustainPedalControl, value));
  }
  for (const auto& msg : doc.instrumentMsgs()) {
    events.push_back(makeProgramChange(msg.tick, msg.channel, msg.program));
  }

  // Groups keep first-seen order so release emission is deterministic
  std::vector<uint16_t> group_order;
  std::vector<std::vector<Span>> groups;
  std::vector<int> group_index(kNumChannels * 128, -1);

  for (const auto& note : doc.noteMsgs()) {
    events.push_back(makeNoteOn(note.start, note.channel, note.pitch, note.velocity));

    uint16_t key = static_cast<uint16_t>((note.channel & 0x0F) * 128 + (note.pitch & 0x7F));
    if (group_index[key] < 0) {
      group_index[key] = static_cast<int>(groups.size());
      group_order.push_back(key);
      groups.emplace_back();
    }
    groups[group_index[key]].push_back({note.start, note.end});
  }

  for (size_t g = 0; g < groups.size(); ++g) {
    auto channel = static_cast<uint8_t>(group_order[g] / 128);
    auto pitch = static_cast<uint8_t>(group_order[g] % 128);
    for (const auto& span : groups[g]) {
      if (releaseSuppressed(span, groups[g])) continue;
      events.push_back(makeNoteOn(span.end, channel, pitch, 0));
    }
  }

  std::stable_sort(events.begin(), events.end(), [](const RawEvent& a, const RawEvent& b) {
    if (a.tick != b.tick) return a.tick < b.tick;
    return sortKey(a) < sortKey(b);
  });
  return events;
}

RawMidi assembleStream(const Document& doc) {
  RawTrack track = assembleEvents(doc);
  toDelta(track);
  track.push_back(makeEndOfTrack(0));

  RawMidi midi;
  midi.ticks_per_beat = doc.ticksPerBeat();
  midi.format = 0;
  midi.delta_ticks = true;
  midi.tracks.push_back(std::move(track));
  return midi;
}

}  // namespace midinorm
