/**
 * @file metadata_plugins.cpp
 * @brief Metadata plugin lookup and dispatch.
 */

#include "plugins/metadata_plugins.h"

namespace midinorm {

namespace {

const char* const kFunctionNames[kMetadataFunctionCount] = {
    "composer_filename", "composer_metamsg", "form_filename", "maestro_json", "abs_path"};

}  // namespace

const char* metadataFunctionName(MetadataFunction fn) {
  auto idx = static_cast<size_t>(fn);
  if (idx >= kMetadataFunctionCount) return "unknown";
  return kFunctionNames[idx];
}

std::optional<MetadataFunction> metadataFunctionFromName(const std::string& name) {
  for (size_t i = 0; i < kMetadataFunctionCount; ++i) {
    if (name == kFunctionNames[i]) return static_cast<MetadataFunction>(i);
  }
  return std::nullopt;
}

bool runMetadataPlugins(const SourceHandle& source, Document& doc,
                        const std::vector<MetadataFunctionConfig>& functions,
                        const MetadataPluginTable& table, std::string& error) {
  for (const auto& cfg : functions) {
    if (!cfg.run) continue;

    if (!table.isBound(cfg.function)) {
      error = std::string("No implementation bound for metadata function ") +
              metadataFunctionName(cfg.function);
      return false;
    }
    json::Parser args(cfg.args);
    if (!args.ok()) {
      error = std::string("Malformed arguments for metadata function ") +
              metadataFunctionName(cfg.function);
      return false;
    }

    Metadata collected = table.get(cfg.function)(source, doc, args);
    for (auto& [key, value] : collected) {
      doc.metadata()[key] = std::move(value);
    }
  }
  return true;
}

}  // namespace midinorm
