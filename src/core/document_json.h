/**
 * @file document_json.h
 * @brief Canonical JSON interchange format for Document.
 *
 * Top-level keys are exactly: meta_msgs, tempo_msgs, pedal_msgs,
 * instrument_msgs, note_msgs, ticks_per_beat, metadata. Messages are written
 * as {"type", "data", "tick", "channel"} objects with keys sorted.
 */

#ifndef MIDINORM_CORE_DOCUMENT_JSON_H
#define MIDINORM_CORE_DOCUMENT_JSON_H

#include <array>
#include <optional>
#include <string>
#include <vector>

#include "core/document.h"
#include "core/json_helpers.h"

namespace midinorm {

/// Canonical top-level keys, sorted.
extern const std::array<const char*, 7> kDocumentKeys;

/// @brief Serialize a Document to canonical JSON (keys sorted).
std::string writeDocumentJson(const Document& doc, bool pretty = false);

/// @name Message sequence writers
/// Each writes one keyed array into the currently open object.
/// @{
void writeMetaMsgs(json::Writer& w, const std::vector<MetaMessage>& msgs);
void writeTempoMsgs(json::Writer& w, const std::vector<TempoMessage>& msgs);
void writePedalMsgs(json::Writer& w, const std::vector<PedalMessage>& msgs);
void writeInstrumentMsgs(json::Writer& w, const std::vector<InstrumentMessage>& msgs);
void writeNoteMsgs(json::Writer& w, const std::vector<NoteMessage>& msgs);
/// @}

/**
 * @brief Reader for canonical Document JSON.
 *
 * A structure whose key set differs from the canonical one, or that holds a
 * malformed message, is rejected: read() returns false and no Document is
 * produced.
 */
class DocumentReader {
 public:
  /**
   * @brief Read a Document JSON file from disk.
   * @param path Path to the file
   * @return true on success, false on error
   */
  bool read(const std::string& path);

  /**
   * @brief Parse Document JSON text.
   * @param json JSON text
   * @return true on success, false on error
   */
  bool parse(const std::string& json);

  /// @brief Parsed document (engaged only after a successful read).
  const std::optional<Document>& getDocument() const { return document_; }

  /// @brief Move the parsed document out of the reader.
  std::optional<Document> takeDocument() { return std::move(document_); }

  /// @brief Error message if read() or parse() failed.
  const std::string& getError() const { return error_; }

 private:
  bool parseMeta(const json::Parser& p, MetaMessage& out);
  bool parseTempo(const json::Parser& p, TempoMessage& out);
  bool parsePedal(const json::Parser& p, PedalMessage& out);
  bool parseInstrument(const json::Parser& p, InstrumentMessage& out);
  bool parseNote(const json::Parser& p, NoteMessage& out);

  bool readElements(const json::Parser& root, const char* key, std::vector<std::string>& out);
  bool readTick(const json::Parser& p, const char* what, Tick& out);
  bool readChannel(const json::Parser& p, const char* what, uint8_t& out);
  bool checkType(const json::Parser& p, const char* expected);

  std::optional<Document> document_;
  std::string error_;
  size_t index_ = 0;  ///< Index of the message being parsed, for error messages
};

}  // namespace midinorm

#endif  // MIDINORM_CORE_DOCUMENT_JSON_H
