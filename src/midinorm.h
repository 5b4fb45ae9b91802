/**
 * @file midinorm.h
 * @brief High-level API for MIDI normalization.
 */

#ifndef MIDINORM_H
#define MIDINORM_H

#include <string>
#include <utility>

#include "config/normalizer_config.h"
#include "core/document.h"
#include "midi/raw_event.h"
#include "plugins/filter_tests.h"
#include "plugins/metadata_plugins.h"

namespace midinorm {

/// @brief High-level API wrapping Document loading, transformation and export.
class MidiNorm {
 public:
  MidiNorm();

  /// @name Loading
  /// Each returns false and sets getError() on failure; the current
  /// Document is left untouched in that case.
  /// @{

  /// @brief Load a canonical Document JSON file.
  bool loadDocument(const std::string& path);

  /// @brief Load canonical Document JSON text.
  bool loadDocumentJson(const std::string& json);

  /// @brief Load a raw event JSON file and pair it into a Document.
  bool loadRawEvents(const std::string& path);

  /// @brief Pair raw events into a Document.
  void loadRawMidi(const RawMidi& midi);

  /// @brief Load a normalizer config file.
  bool loadConfig(const std::string& path);

  void setConfig(NormalizerConfig config) { config_ = std::move(config); }
  /// @}

  /// @name Transformations
  /// @{
  void resolveOverlaps();
  void resolvePedal();

  /// @brief Pedal resolution that refuses an already-resolved Document.
  bool resolvePedalStrict();

  void removeRedundantPedals();

  /// @brief Remove channels flagged by the config's remove_instruments.
  void removeInstruments();
  /// @}

  /**
   * @brief Run the config's enabled metadata plugins.
   * @param source File the Document was built from
   */
  bool collectMetadata(const SourceHandle& source);

  /**
   * @brief Run the config's enabled filter tests.
   * @param report Receives each test's verdict
   */
  bool runFilters(FilterReport& report);

  /// @brief Milliseconds from tick 0 to the latest note end (0 without notes).
  int64_t durationMs() const;

  /// @name Output
  /// @{
  std::string getDocumentJson(bool pretty = false) const;

  /// @brief Assembled format-0 event stream as raw event JSON.
  std::string getEventsJson(bool pretty = false) const;

  std::string getHash() const;
  /// @}

  const Document& getDocument() const { return document_; }
  Document& document() { return document_; }
  const NormalizerConfig& getConfig() const { return config_; }
  MetadataPluginTable& plugins() { return plugins_; }
  const std::string& getError() const { return error_; }

  /**
   * @brief Get library version string.
   * @return Version string (e.g., "1.0.0")
   */
  static const char* version();

 private:
  Document document_;
  NormalizerConfig config_;
  MetadataPluginTable plugins_;
  std::string error_;
};

}  // namespace midinorm

#endif  // MIDINORM_H
