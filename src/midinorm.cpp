/**
 * @file midinorm.cpp
 * @brief Implementation of MidiNorm API.
 */

#include "midinorm.h"

#include <algorithm>

#include "core/document_json.h"
#include "core/pedal_resolver.h"
#include "midi/note_pairer.h"
#include "midi/raw_event_json.h"
#include "midi/stream_assembler.h"

namespace midinorm {

MidiNorm::MidiNorm() = default;

bool MidiNorm::loadDocument(const std::string& path) {
  DocumentReader reader;
  if (!reader.read(path)) {
    error_ = reader.getError();
    return false;
  }
  document_ = *reader.takeDocument();
  return true;
}

bool MidiNorm::loadDocumentJson(const std::string& json) {
  DocumentReader reader;
  if (!reader.parse(json)) {
    error_ = reader.getError();
    return false;
  }
  document_ = *reader.takeDocument();
  return true;
}

bool MidiNorm::loadRawEvents(const std::string& path) {
  RawEventReader reader;
  if (!reader.read(path)) {
    error_ = reader.getError();
    return false;
  }
  loadRawMidi(reader.getMidi());
  return true;
}

void MidiNorm::loadRawMidi(const RawMidi& midi) {
  document_ = pairTracks(midi);
}

bool MidiNorm::loadConfig(const std::string& path) {
  ConfigReader reader;
  if (!reader.read(path)) {
    error_ = reader.getError();
    return false;
  }
  config_ = reader.getConfig();
  return true;
}

void MidiNorm::resolveOverlaps() {
  document_.resolveOverlaps();
}

void MidiNorm::resolvePedal() {
  document_.resolvePedal();
}

bool MidiNorm::resolvePedalStrict() {
  return midinorm::resolvePedalStrict(document_, error_);
}

void MidiNorm::removeRedundantPedals() {
  document_.removeRedundantPedals();
}

void MidiNorm::removeInstruments() {
  document_.removeInstruments(config_.remove_instruments);
}

bool MidiNorm::collectMetadata(const SourceHandle& source) {
  return runMetadataPlugins(source, document_, config_.metadata_functions, plugins_, error_);
}

bool MidiNorm::runFilters(FilterReport& report) {
  return runFilterTests(document_, config_.tests, report, error_);
}

int64_t MidiNorm::durationMs() const {
  Tick last_end = 0;
  for (const auto& note : document_.noteMsgs()) {
    last_end = std::max(last_end, note.end);
  }
  return document_.tickToMs(last_end);
}

std::string MidiNorm::getDocumentJson(bool pretty) const {
  return writeDocumentJson(document_, pretty);
}

std::string MidiNorm::getEventsJson(bool pretty) const {
  return writeRawEventJson(assembleStream(document_), pretty);
}

std::string MidiNorm::getHash() const {
  return document_.calculateHash();
}

const char* MidiNorm::version() {
  return "1.0.0";
}

}  // namespace midinorm
