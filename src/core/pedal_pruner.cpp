/**
 * @file pedal_pruner.cpp
 * @brief Implementation of redundant pedal removal.
 */

#include "core/pedal_pruner.h"

#include <algorithm>
#include <numeric>
#include <optional>
#include <set>
#include <utility>

#include "core/document.h"

namespace midinorm {

bool isPedalUseful(Tick start, Tick end, const std::vector<const NoteMessage*>& notes) {
  for (const NoteMessage* note : notes) {
    if (note->start > end) break;
    if (start <= note->end && note->end <= end) {
      return true;
    }
  }
  return false;
}

namespace {

void markChannel(const Document& doc, uint8_t channel, const std::vector<size_t>& pedal_order,
                 std::vector<bool>& remove) {
  const auto& pedals = doc.pedalMsgs();

  std::vector<const NoteMessage*> notes;
  for (const auto& note : doc.noteMsgs()) {
    if (note.channel == channel) notes.push_back(&note);
  }
  std::stable_sort(notes.begin(), notes.end(), [](const NoteMessage* a, const NoteMessage* b) {
    return a->start < b->start;
  });

  if (notes.empty()) {
    for (size_t idx : pedal_order) {
      if (pedals[idx].channel == channel) remove[idx] = true;
    }
    return;
  }

  std::optional<Tick> pedal_down_tick;
  size_t pedal_down_idx = 0;

  for (size_t idx : pedal_order) {
    const PedalMessage& msg = pedals[idx];
    if (msg.channel != channel) continue;

    if (!pedal_down_tick) {
      if (msg.state == PedalState::On) {
        pedal_down_tick = msg.tick;
        pedal_down_idx = idx;
      } else {
        remove[idx] = true;  // release while up
      }
      continue;
    }

    if (msg.state == PedalState::On) {
      remove[idx] = true;  // press while down
      continue;
    }

    if (!isPedalUseful(*pedal_down_tick, msg.tick, notes)) {
      remove[pedal_down_idx] = true;
      remove[idx] = true;
    }
    pedal_down_tick.reset();
  }

  // Never released
  if (pedal_down_tick) {
    remove[pedal_down_idx] = true;
  }
}

}  // namespace

void removeRedundantPedals(Document& doc) {
  auto& pedals = doc.pedalMsgs();
  if (pedals.empty()) return;

  std::vector<size_t> order(pedals.size());
  std::iota(order.begin(), order.end(), 0);
  std::stable_sort(order.begin(), order.end(),
                   [&](size_t a, size_t b) { return pedals[a].tick < pedals[b].tick; });

  std::set<uint8_t> channels;
  for (const auto& msg : pedals) channels.insert(msg.channel);

  std::vector<bool> remove(pedals.size(), false);
  for (uint8_t channel : channels) {
    markChannel(doc, channel, order, remove);
  }

  std::vector<PedalMessage> kept;
  kept.reserve(pedals.size());
  for (size_t i = 0; i < pedals.size(); ++i) {
    if (!remove[i]) kept.push_back(pedals[i]);
  }
  pedals = std::move(kept);
}

}  // namespace midinorm
