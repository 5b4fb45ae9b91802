/**
 * @file document.cpp
 * @brief Implementation of Document construction and chaining wrappers.
 */

#include "core/document.h"

#include <algorithm>
#include <utility>

#include "core/content_hash.h"
#include "core/document_json.h"
#include "core/instrument_filter.h"
#include "core/overlap_resolver.h"
#include "core/pedal_pruner.h"
#include "core/pedal_resolver.h"
#include "core/tempo_map.h"

namespace midinorm {

Document::Document() { normalize(); }

Document::Document(std::vector<MetaMessage> meta_msgs, std::vector<TempoMessage> tempo_msgs,
                   std::vector<PedalMessage> pedal_msgs,
                   std::vector<InstrumentMessage> instrument_msgs,
                   std::vector<NoteMessage> note_msgs, uint16_t ticks_per_beat, Metadata metadata)
    : meta_msgs_(std::move(meta_msgs)),
      tempo_msgs_(std::move(tempo_msgs)),
      pedal_msgs_(std::move(pedal_msgs)),
      instrument_msgs_(std::move(instrument_msgs)),
      note_msgs_(std::move(note_msgs)),
      ticks_per_beat_(ticks_per_beat),
      metadata_(std::move(metadata)) {
  normalize();
}

void Document::normalize() {
  std::stable_sort(note_msgs_.begin(), note_msgs_.end(),
                   [](const NoteMessage& a, const NoteMessage& b) { return a.tick < b.tick; });

  if (tempo_msgs_.empty()) {
    tempo_msgs_.push_back(TempoMessage{0, kDefaultMicrosecondsPerQuarter});
  }
  if (instrument_msgs_.empty()) {
    instrument_msgs_.push_back(InstrumentMessage{0, 0, 0});
  }
}

int64_t Document::tickToMs(Tick tick) const {
  return durationMs(0, tick, tempo_msgs_, ticks_per_beat_);
}

Document& Document::resolveOverlaps() {
  midinorm::resolveOverlaps(note_msgs_);
  return *this;
}

Document& Document::resolvePedal() {
  midinorm::resolvePedal(*this);
  return *this;
}

Document& Document::removeRedundantPedals() {
  midinorm::removeRedundantPedals(*this);
  return *this;
}

Document& Document::removeInstruments(const InstrumentRemovalConfig& config) {
  midinorm::removeInstruments(*this, config);
  return *this;
}

std::string Document::toJson(bool pretty) const { return writeDocumentJson(*this, pretty); }

std::string Document::calculateHash() const { return contentHash(*this); }

}  // namespace midinorm
