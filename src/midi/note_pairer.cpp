/**
 * @file note_pairer.cpp
 * @brief Implementation of note pairing.
 */

#include "midi/note_pairer.h"

#include <algorithm>
#include <iostream>
#include <map>
#include <utility>

// Debug flag for pairing trace (set to 1 to enable)
#ifndef MIDINORM_DEBUG_LOG
#define MIDINORM_DEBUG_LOG 0
#endif

namespace midinorm {

namespace {

template <typename Msg>
void stableSortByTick(std::vector<Msg>& msgs) {
  std::stable_sort(msgs.begin(), msgs.end(),
                   [](const Msg& a, const Msg& b) { return a.tick < b.tick; });
}

template <typename Msg>
void append(std::vector<Msg>& dst, std::vector<Msg>& src) {
  dst.insert(dst.end(), std::make_move_iterator(src.begin()), std::make_move_iterator(src.end()));
}

}  // namespace

PairedTrack pairTrack(const RawTrack& track) {
  PairedTrack out;

  // key = (channel << 8) | pitch, value = open (start_tick, velocity) in arrival order
  std::map<uint16_t, std::vector<std::pair<Tick, uint8_t>>> active_notes;

  for (const auto& event : track) {
    switch (event.type) {
      case RawEventType::NoteOn:
      case RawEventType::NoteOff: {
        uint8_t pitch = event.data1;
        uint16_t key = (static_cast<uint16_t>(event.channel) << 8) | pitch;

        if (event.type == RawEventType::NoteOn && event.data2 > 0) {
          active_notes[key].emplace_back(event.tick, event.data2);
          break;
        }

        auto it = active_notes.find(key);
        if (it == active_notes.end()) {
#if MIDINORM_DEBUG_LOG
          std::cerr << "  [pair] dropped release ch=" << static_cast<int>(event.channel)
                    << " pitch=" << static_cast<int>(pitch) << " tick=" << event.tick << "\n";
#endif
          break;
        }

        std::vector<std::pair<Tick, uint8_t>> retained;
        for (const auto& [start, velocity] : it->second) {
          if (start == event.tick) {
            retained.emplace_back(start, velocity);
            continue;
          }
          NoteMessage note = makeNote(event.channel, pitch, start, event.tick, velocity);
          out.note_msgs.push_back(note);
        }
        if (retained.empty()) {
          active_notes.erase(it);
        } else {
          it->second = std::move(retained);
        }
        break;
      }

      case RawEventType::ControlChange:
        if (event.data1 == kSustainPedalControl) {
          PedalState state = event.data2 >= kPedalOnThreshold ? PedalState::On : PedalState::Off;
          out.pedal_msgs.push_back({event.tick, event.channel, state});
        }
        break;

      case RawEventType::ProgramChange:
        out.instrument_msgs.push_back({event.tick, event.channel, event.data1});
        break;

      case RawEventType::SetTempo:
        out.tempo_msgs.push_back({event.tick, event.tempo});
        break;

      case RawEventType::Text:
        out.meta_msgs.push_back({MetaKind::Text, event.text});
        break;

      case RawEventType::Copyright:
        out.meta_msgs.push_back({MetaKind::Copyright, event.text});
        break;

      case RawEventType::EndOfTrack:
        break;
    }
  }

#if MIDINORM_DEBUG_LOG
  for (const auto& [key, open] : active_notes) {
    std::cerr << "  [pair] dropped " << open.size() << " unreleased note(s) ch=" << (key >> 8)
              << " pitch=" << (key & 0xFF) << "\n";
  }
#endif

  stableSortByTick(out.tempo_msgs);
  stableSortByTick(out.pedal_msgs);
  stableSortByTick(out.instrument_msgs);
  stableSortByTick(out.note_msgs);
  return out;
}

Document pairTracks(const RawMidi& midi) {
  PairedTrack all;
  for (const auto& source : midi.tracks) {
    PairedTrack paired;
    if (midi.delta_ticks) {
      RawTrack absolute = source;
      toAbsolute(absolute);
      paired = pairTrack(absolute);
    } else {
      paired = pairTrack(source);
    }
    append(all.meta_msgs, paired.meta_msgs);
    append(all.tempo_msgs, paired.tempo_msgs);
    append(all.pedal_msgs, paired.pedal_msgs);
    append(all.instrument_msgs, paired.instrument_msgs);
    append(all.note_msgs, paired.note_msgs);
  }

  stableSortByTick(all.tempo_msgs);
  stableSortByTick(all.pedal_msgs);
  stableSortByTick(all.instrument_msgs);
  stableSortByTick(all.note_msgs);

  return Document(std::move(all.meta_msgs), std::move(all.tempo_msgs), std::move(all.pedal_msgs),
                  std::move(all.instrument_msgs), std::move(all.note_msgs), midi.ticks_per_beat);
}

}  // namespace midinorm
