/**
 * @file document.h
 * @brief Canonical Document: paired, per-kind message sequences of one MIDI file.
 */

#ifndef MIDINORM_CORE_DOCUMENT_H
#define MIDINORM_CORE_DOCUMENT_H

#include <cstdint>
#include <map>
#include <string>
#include <vector>

#include "core/types.h"

namespace midinorm {

/// String-keyed metadata collected by metadata plugins.
using Metadata = std::map<std::string, std::string>;

/// Group name -> "remove this group" flag.
using InstrumentRemovalConfig = std::map<std::string, bool>;

/// @brief Structured representation of one MIDI file.
///
/// Owns every message sequence. Transformations edit the sequences in place
/// and return *this so that they can be chained:
/// @code
///   doc.resolvePedal().removeRedundantPedals();
/// @endcode
class Document {
 public:
  /// @brief Empty document with the default tempo and instrument.
  Document();

  /// @brief Build from already-paired sequences.
  ///
  /// Normalizes on construction: notes are stable-sorted by tick, and an
  /// empty tempo (instrument) sequence receives one default entry at tick 0.
  Document(std::vector<MetaMessage> meta_msgs, std::vector<TempoMessage> tempo_msgs,
           std::vector<PedalMessage> pedal_msgs, std::vector<InstrumentMessage> instrument_msgs,
           std::vector<NoteMessage> note_msgs, uint16_t ticks_per_beat, Metadata metadata = {});

  /// @name Sequences
  /// @{
  const std::vector<MetaMessage>& metaMsgs() const { return meta_msgs_; }
  std::vector<MetaMessage>& metaMsgs() { return meta_msgs_; }
  const std::vector<TempoMessage>& tempoMsgs() const { return tempo_msgs_; }
  std::vector<TempoMessage>& tempoMsgs() { return tempo_msgs_; }
  const std::vector<PedalMessage>& pedalMsgs() const { return pedal_msgs_; }
  std::vector<PedalMessage>& pedalMsgs() { return pedal_msgs_; }
  const std::vector<InstrumentMessage>& instrumentMsgs() const { return instrument_msgs_; }
  std::vector<InstrumentMessage>& instrumentMsgs() { return instrument_msgs_; }
  const std::vector<NoteMessage>& noteMsgs() const { return note_msgs_; }
  std::vector<NoteMessage>& noteMsgs() { return note_msgs_; }
  /// @}

  uint16_t ticksPerBeat() const { return ticks_per_beat_; }
  const Metadata& metadata() const { return metadata_; }
  Metadata& metadata() { return metadata_; }

  /// @brief True once resolvePedal() has run. Advisory only.
  bool pedalResolved() const { return pedal_resolved_; }
  void setPedalResolved(bool resolved) { pedal_resolved_ = resolved; }

  /// @brief Wall-clock position of a tick, in milliseconds from tick 0.
  int64_t tickToMs(Tick tick) const;

  /// @name Transformations
  /// @{

  /// @brief Trim overlapping notes of the same channel and pitch.
  Document& resolveOverlaps();

  /// @brief Extend notes through sustain intervals, then resolve overlaps.
  ///
  /// Not idempotent: a second call logs a warning and extends again.
  Document& resolvePedal();

  /// @brief Delete pedal messages that extend no note.
  Document& removeRedundantPedals();

  /// @brief Delete every message on channels playing a flagged instrument group.
  Document& removeInstruments(const InstrumentRemovalConfig& config);
  /// @}

  /// @name Interchange
  /// @{

  /// @brief Canonical JSON (see DocumentReader for the inverse).
  std::string toJson(bool pretty = false) const;

  /// @brief Stable content hash ignoring meta text, resolution and metadata.
  std::string calculateHash() const;
  /// @}

 private:
  void normalize();

  std::vector<MetaMessage> meta_msgs_;
  std::vector<TempoMessage> tempo_msgs_;
  std::vector<PedalMessage> pedal_msgs_;
  std::vector<InstrumentMessage> instrument_msgs_;
  std::vector<NoteMessage> note_msgs_;
  uint16_t ticks_per_beat_ = kDefaultTicksPerBeat;
  Metadata metadata_;
  bool pedal_resolved_ = false;
};

}  // namespace midinorm

#endif  // MIDINORM_CORE_DOCUMENT_H
