/**
 * @file document_json.cpp
 * @brief Implementation of the canonical Document JSON codec.
 */

#include "core/document_json.h"

#include <algorithm>
#include <fstream>
#include <limits>
#include <sstream>

namespace midinorm {

const std::array<const char*, 7> kDocumentKeys = {"instrument_msgs", "meta_msgs",  "metadata",
                                                  "note_msgs",       "pedal_msgs", "tempo_msgs",
                                                  "ticks_per_beat"};

// ============================================================================
// Writing
// ============================================================================

void writeMetaMsgs(json::Writer& w, const std::vector<MetaMessage>& msgs) {
  w.beginArray("meta_msgs");
  for (const auto& msg : msgs) {
    w.beginObject()
        .write("data", msg.text)
        .write("type", metaKindToString(msg.kind))
        .endObject();
  }
  w.endArray();
}

void writeTempoMsgs(json::Writer& w, const std::vector<TempoMessage>& msgs) {
  w.beginArray("tempo_msgs");
  for (const auto& msg : msgs) {
    w.beginObject()
        .write("data", msg.microseconds_per_quarter)
        .write("tick", msg.tick)
        .write("type", "tempo")
        .endObject();
  }
  w.endArray();
}

void writePedalMsgs(json::Writer& w, const std::vector<PedalMessage>& msgs) {
  w.beginArray("pedal_msgs");
  for (const auto& msg : msgs) {
    w.beginObject()
        .write("channel", static_cast<int>(msg.channel))
        .write("data", static_cast<int>(msg.state))
        .write("tick", msg.tick)
        .write("type", "pedal")
        .endObject();
  }
  w.endArray();
}

void writeInstrumentMsgs(json::Writer& w, const std::vector<InstrumentMessage>& msgs) {
  w.beginArray("instrument_msgs");
  for (const auto& msg : msgs) {
    w.beginObject()
        .write("channel", static_cast<int>(msg.channel))
        .write("data", static_cast<int>(msg.program))
        .write("tick", msg.tick)
        .write("type", "instrument")
        .endObject();
  }
  w.endArray();
}

void writeNoteMsgs(json::Writer& w, const std::vector<NoteMessage>& msgs) {
  w.beginArray("note_msgs");
  for (const auto& msg : msgs) {
    w.beginObject().write("channel", static_cast<int>(msg.channel));
    w.beginObject("data")
        .write("end", msg.end)
        .write("pitch", static_cast<int>(msg.pitch))
        .write("start", msg.start)
        .write("velocity", static_cast<int>(msg.velocity))
        .endObject();
    w.write("tick", msg.tick).write("type", "note").endObject();
  }
  w.endArray();
}

std::string writeDocumentJson(const Document& doc, bool pretty) {
  std::ostringstream oss;
  json::Writer w(oss, pretty);
  w.beginObject();

  writeInstrumentMsgs(w, doc.instrumentMsgs());
  writeMetaMsgs(w, doc.metaMsgs());

  w.beginObject("metadata");
  for (const auto& [key, value] : doc.metadata()) {
    w.write(key.c_str(), value);
  }
  w.endObject();

  writeNoteMsgs(w, doc.noteMsgs());
  writePedalMsgs(w, doc.pedalMsgs());
  writeTempoMsgs(w, doc.tempoMsgs());
  w.write("ticks_per_beat", static_cast<int>(doc.ticksPerBeat()));

  w.endObject();
  return oss.str();
}

// ============================================================================
// Reading
// ============================================================================

namespace {

bool readRange(const json::Parser& p, const char* key, int64_t lo, int64_t hi, int64_t& out) {
  return p.tryGetInt(key, out) && out >= lo && out <= hi;
}

}  // namespace

bool DocumentReader::read(const std::string& path) {
  std::ifstream file(path, std::ios::binary);
  if (!file) {
    document_.reset();
    error_ = "Failed to open file: " + path;
    return false;
  }
  std::ostringstream oss;
  oss << file.rdbuf();
  return parse(oss.str());
}

bool DocumentReader::parse(const std::string& json) {
  document_.reset();
  error_.clear();

  json::Parser root(json);
  if (!root.ok()) {
    error_ = "Malformed JSON at offset " + std::to_string(root.errorOffset());
    return false;
  }

  // Key set must match exactly
  for (const char* key : kDocumentKeys) {
    if (!root.has(key)) {
      error_ = std::string("Missing key: ") + key;
      return false;
    }
  }
  for (const auto& key : root.keys()) {
    bool known = std::any_of(kDocumentKeys.begin(), kDocumentKeys.end(),
                             [&](const char* k) { return key == k; });
    if (!known) {
      error_ = "Unexpected key: " + key;
      return false;
    }
  }

  int64_t tpb = 0;
  if (!readRange(root, "ticks_per_beat", 1, std::numeric_limits<uint16_t>::max(), tpb)) {
    error_ = "Invalid ticks_per_beat";
    return false;
  }

  for (const char* key : {"meta_msgs", "tempo_msgs", "pedal_msgs", "instrument_msgs", "note_msgs"}) {
    if (root.kind(key) != json::ValueKind::Array) {
      error_ = std::string(key) + " is not an array";
      return false;
    }
  }
  if (root.kind("metadata") != json::ValueKind::Object) {
    error_ = "metadata is not an object";
    return false;
  }

  std::vector<MetaMessage> meta_msgs;
  std::vector<TempoMessage> tempo_msgs;
  std::vector<PedalMessage> pedal_msgs;
  std::vector<InstrumentMessage> instrument_msgs;
  std::vector<NoteMessage> note_msgs;

  std::vector<std::string> elements;
  if (!readElements(root, "meta_msgs", elements)) return false;
  for (index_ = 0; index_ < elements.size(); ++index_) {
    MetaMessage msg;
    if (!parseMeta(json::Parser(elements[index_]), msg)) return false;
    meta_msgs.push_back(std::move(msg));
  }
  if (!readElements(root, "tempo_msgs", elements)) return false;
  for (index_ = 0; index_ < elements.size(); ++index_) {
    TempoMessage msg;
    if (!parseTempo(json::Parser(elements[index_]), msg)) return false;
    tempo_msgs.push_back(msg);
  }
  if (!readElements(root, "pedal_msgs", elements)) return false;
  for (index_ = 0; index_ < elements.size(); ++index_) {
    PedalMessage msg;
    if (!parsePedal(json::Parser(elements[index_]), msg)) return false;
    pedal_msgs.push_back(msg);
  }
  if (!readElements(root, "instrument_msgs", elements)) return false;
  for (index_ = 0; index_ < elements.size(); ++index_) {
    InstrumentMessage msg;
    if (!parseInstrument(json::Parser(elements[index_]), msg)) return false;
    instrument_msgs.push_back(msg);
  }
  if (!readElements(root, "note_msgs", elements)) return false;
  for (index_ = 0; index_ < elements.size(); ++index_) {
    NoteMessage msg;
    if (!parseNote(json::Parser(elements[index_]), msg)) return false;
    note_msgs.push_back(msg);
  }

  // Non-string metadata values are kept as their JSON text
  Metadata metadata;
  json::Parser meta_obj = root.getObject("metadata");
  if (!meta_obj.ok()) {
    error_ = "metadata is malformed";
    return false;
  }
  for (const auto& key : meta_obj.keys()) {
    metadata[key] = meta_obj.getText(key);
  }

  document_.emplace(std::move(meta_msgs), std::move(tempo_msgs), std::move(pedal_msgs),
                    std::move(instrument_msgs), std::move(note_msgs),
                    static_cast<uint16_t>(tpb), std::move(metadata));
  return true;
}

bool DocumentReader::readElements(const json::Parser& root, const char* key,
                                  std::vector<std::string>& out) {
  if (!root.getRawArray(key, out)) {
    error_ = std::string(key) + " is malformed";
    return false;
  }
  return true;
}

bool DocumentReader::checkType(const json::Parser& p, const char* expected) {
  if (!p.ok()) {
    error_ = std::string(expected) + " message " + std::to_string(index_) + " is not an object";
    return false;
  }
  if (p.getString("type") != expected) {
    error_ = std::string("Expected type \"") + expected + "\" at index " + std::to_string(index_);
    return false;
  }
  return true;
}

bool DocumentReader::readTick(const json::Parser& p, const char* what, Tick& out) {
  int64_t value = 0;
  if (!readRange(p, "tick", 0, std::numeric_limits<Tick>::max(), value)) {
    error_ = std::string("Invalid tick in ") + what + " message " + std::to_string(index_);
    return false;
  }
  out = static_cast<Tick>(value);
  return true;
}

bool DocumentReader::readChannel(const json::Parser& p, const char* what, uint8_t& out) {
  int64_t value = 0;
  if (!readRange(p, "channel", 0, kNumChannels - 1, value)) {
    error_ = std::string("Invalid channel in ") + what + " message " + std::to_string(index_);
    return false;
  }
  out = static_cast<uint8_t>(value);
  return true;
}

bool DocumentReader::parseMeta(const json::Parser& p, MetaMessage& out) {
  if (!p.ok()) {
    error_ = "meta message " + std::to_string(index_) + " is not an object";
    return false;
  }
  std::string type = p.getString("type");
  if (type == "text") {
    out.kind = MetaKind::Text;
  } else if (type == "copyright") {
    out.kind = MetaKind::Copyright;
  } else {
    error_ = "Unknown meta type \"" + type + "\" at index " + std::to_string(index_);
    return false;
  }
  if (p.kind("data") != json::ValueKind::String) {
    error_ = "meta message " + std::to_string(index_) + " has no text";
    return false;
  }
  out.text = p.getString("data");
  return true;
}

bool DocumentReader::parseTempo(const json::Parser& p, TempoMessage& out) {
  if (!checkType(p, "tempo") || !readTick(p, "tempo", out.tick)) return false;
  int64_t us = 0;
  if (!readRange(p, "data", 1, std::numeric_limits<uint32_t>::max(), us)) {
    error_ = "Invalid tempo value at index " + std::to_string(index_);
    return false;
  }
  out.microseconds_per_quarter = static_cast<uint32_t>(us);
  return true;
}

bool DocumentReader::parsePedal(const json::Parser& p, PedalMessage& out) {
  if (!checkType(p, "pedal") || !readTick(p, "pedal", out.tick) ||
      !readChannel(p, "pedal", out.channel)) {
    return false;
  }
  int64_t state = 0;
  if (!readRange(p, "data", 0, 1, state)) {
    error_ = "Pedal state must be 0 or 1 at index " + std::to_string(index_);
    return false;
  }
  out.state = state ? PedalState::On : PedalState::Off;
  return true;
}

bool DocumentReader::parseInstrument(const json::Parser& p, InstrumentMessage& out) {
  if (!checkType(p, "instrument") || !readTick(p, "instrument", out.tick) ||
      !readChannel(p, "instrument", out.channel)) {
    return false;
  }
  int64_t program = 0;
  if (!readRange(p, "data", 0, kNumPrograms - 1, program)) {
    error_ = "Invalid program at index " + std::to_string(index_);
    return false;
  }
  out.program = static_cast<uint8_t>(program);
  return true;
}

bool DocumentReader::parseNote(const json::Parser& p, NoteMessage& out) {
  if (!checkType(p, "note") || !readTick(p, "note", out.tick) ||
      !readChannel(p, "note", out.channel)) {
    return false;
  }
  if (p.kind("data") != json::ValueKind::Object) {
    error_ = "note message " + std::to_string(index_) + " has no data object";
    return false;
  }
  json::Parser data = p.getObject("data");
  if (!data.ok()) {
    error_ = "note message " + std::to_string(index_) + " has malformed data";
    return false;
  }
  int64_t pitch = 0, start = 0, end = 0, velocity = 0;
  constexpr int64_t kMaxTick = std::numeric_limits<Tick>::max();
  if (!readRange(data, "pitch", 0, 127, pitch) || !readRange(data, "start", 0, kMaxTick, start) ||
      !readRange(data, "end", 0, kMaxTick, end) || !readRange(data, "velocity", 1, 127, velocity)) {
    error_ = "Invalid note data at index " + std::to_string(index_);
    return false;
  }
  if (end < start) {
    error_ = "Note ends before it starts at index " + std::to_string(index_);
    return false;
  }
  if (start != out.tick) {
    error_ = "Note tick differs from start at index " + std::to_string(index_);
    return false;
  }
  out.pitch = static_cast<uint8_t>(pitch);
  out.start = static_cast<Tick>(start);
  out.end = static_cast<Tick>(end);
  out.velocity = static_cast<uint8_t>(velocity);
  return true;
}

}  // namespace midinorm
