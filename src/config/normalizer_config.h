/**
 * @file normalizer_config.h
 * @brief Normalizer configuration loaded from JSON.
 *
 * Layout:
 * @code
 * {"data": {
 *   "tests": {"max_programs": {"run": true, "args": {"max": 4}}},
 *   "preprocessing": {"remove_instruments": {"percussive": false, "sfx": true}},
 *   "metadata": {"functions": {"abs_path": {"run": true, "args": {}}}}}}
 * @endcode
 * Tests and metadata functions keep their declaration order.
 */

#ifndef MIDINORM_CONFIG_NORMALIZER_CONFIG_H
#define MIDINORM_CONFIG_NORMALIZER_CONFIG_H

#include <string>
#include <vector>

#include "core/document.h"
#include "plugins/filter_tests.h"
#include "plugins/metadata_plugins.h"

namespace midinorm {

/// @brief Everything the normalizer reads from its config file.
struct NormalizerConfig {
  std::vector<FilterTestConfig> tests;
  InstrumentRemovalConfig remove_instruments;
  std::vector<MetadataFunctionConfig> metadata_functions;
};

/**
 * @brief Reader for NormalizerConfig JSON.
 *
 * Unknown test, plugin or instrument group names fail the load.
 */
class ConfigReader {
 public:
  /**
   * @brief Read a config file from disk.
   * @param path Path to the file
   * @return true on success, false on error
   */
  bool read(const std::string& path);

  /**
   * @brief Parse config JSON text.
   * @param json JSON text
   * @return true on success, false on error
   */
  bool parse(const std::string& json);

  const NormalizerConfig& getConfig() const { return config_; }
  const std::string& getError() const { return error_; }

 private:
  bool parseTests(const json::Parser& tests);
  bool parseRemoveInstruments(const json::Parser& groups);
  bool parseMetadataFunctions(const json::Parser& functions);

  // Reads {"run": bool, "args": {...}}
  bool parseEntry(const json::Parser& parent, const std::string& name, bool& run,
                  std::string& args);

  NormalizerConfig config_;
  std::string error_;
};

}  // namespace midinorm

#endif  // MIDINORM_CONFIG_NORMALIZER_CONFIG_H
