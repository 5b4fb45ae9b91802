/**
 * @file metadata_plugins.h
 * @brief Metadata plugin contract: named functions whose results merge into
 *        Document::metadata().
 *
 * The set of plugin names is closed. Implementations are supplied by the
 * caller and bound into a MetadataPluginTable slot per name.
 */

#ifndef MIDINORM_PLUGINS_METADATA_PLUGINS_H
#define MIDINORM_PLUGINS_METADATA_PLUGINS_H

#include <array>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "core/document.h"
#include "core/json_helpers.h"

namespace midinorm {

/// @brief Closed set of metadata plugins.
enum class MetadataFunction : uint8_t {
  ComposerFilename,
  ComposerMetaMsg,
  FormFilename,
  MaestroJson,
  AbsPath
};

constexpr size_t kMetadataFunctionCount = 5;

/// @brief Config name of a plugin ("composer_filename", ...).
const char* metadataFunctionName(MetadataFunction fn);

/// @brief Look up a plugin by config name; nullopt if unknown.
std::optional<MetadataFunction> metadataFunctionFromName(const std::string& name);

/// @brief Identifies the file a Document was built from.
struct SourceHandle {
  std::string path;
};

/// Plugin signature: (source, document, args) -> collected key/value pairs.
using MetadataFn =
    std::function<Metadata(const SourceHandle&, const Document&, const json::Parser&)>;

/// @brief Fixed table of plugin implementations, one slot per name.
class MetadataPluginTable {
 public:
  void bind(MetadataFunction fn, MetadataFn impl) { slots_[index(fn)] = std::move(impl); }
  bool isBound(MetadataFunction fn) const { return static_cast<bool>(slots_[index(fn)]); }
  const MetadataFn& get(MetadataFunction fn) const { return slots_[index(fn)]; }

 private:
  static size_t index(MetadataFunction fn) { return static_cast<size_t>(fn); }

  std::array<MetadataFn, kMetadataFunctionCount> slots_;
};

/// @brief One configured plugin.
struct MetadataFunctionConfig {
  MetadataFunction function = MetadataFunction::AbsPath;
  bool run = false;
  std::string args = "{}";
};

/**
 * @brief Run every enabled plugin in config order and merge the results.
 *
 * Later plugins overwrite keys written by earlier ones.
 *
 * @return false if an enabled plugin has no bound implementation or its
 *         arguments are not a JSON object; metadata merged so far is kept
 */
bool runMetadataPlugins(const SourceHandle& source, Document& doc,
                        const std::vector<MetadataFunctionConfig>& functions,
                        const MetadataPluginTable& table, std::string& error);

}  // namespace midinorm

#endif  // MIDINORM_PLUGINS_METADATA_PLUGINS_H
