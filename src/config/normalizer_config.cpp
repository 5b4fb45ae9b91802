/**
 * @file normalizer_config.cpp
 * @brief Implementation of ConfigReader.
 */

#include "config/normalizer_config.h"

#include <fstream>
#include <sstream>

#include "core/instrument_groups.h"

namespace midinorm {

namespace {

// Optional object member: absent is fine, any other kind is an error.
bool optionalObject(const json::Parser& parent, const char* key, std::string& error) {
  json::ValueKind kind = parent.kind(key);
  if (kind == json::ValueKind::Missing || kind == json::ValueKind::Object) return true;
  error = std::string("\"") + key + "\" must be an object";
  return false;
}

// Nested object, failing on malformed content; absent members read as {}.
bool nestedObject(const json::Parser& parent, const char* key, json::Parser& out,
                  std::string& error) {
  out = parent.getObject(key);
  if (out.ok()) return true;
  error = std::string("\"") + key + "\" is malformed";
  return false;
}

}  // namespace

bool ConfigReader::read(const std::string& path) {
  std::ifstream file(path, std::ios::binary);
  if (!file) {
    config_ = NormalizerConfig{};
    error_ = "Failed to open file: " + path;
    return false;
  }
  std::ostringstream oss;
  oss << file.rdbuf();
  return parse(oss.str());
}

bool ConfigReader::parse(const std::string& json) {
  config_ = NormalizerConfig{};
  error_.clear();

  json::Parser root(json);
  if (!root.ok()) {
    error_ = "Malformed JSON at offset " + std::to_string(root.errorOffset());
    return false;
  }
  if (root.kind("data") != json::ValueKind::Object) {
    error_ = "Missing \"data\" object";
    return false;
  }
  json::Parser data("{}");
  if (!nestedObject(root, "data", data, error_)) return false;

  if (!optionalObject(data, "tests", error_) || !optionalObject(data, "preprocessing", error_) ||
      !optionalObject(data, "metadata", error_)) {
    return false;
  }

  json::Parser tests("{}");
  json::Parser preprocessing("{}");
  json::Parser metadata("{}");
  if (!nestedObject(data, "tests", tests, error_) ||
      !nestedObject(data, "preprocessing", preprocessing, error_) ||
      !nestedObject(data, "metadata", metadata, error_)) {
    return false;
  }
  if (!optionalObject(preprocessing, "remove_instruments", error_) ||
      !optionalObject(metadata, "functions", error_)) {
    return false;
  }

  json::Parser groups("{}");
  json::Parser functions("{}");
  if (!nestedObject(preprocessing, "remove_instruments", groups, error_) ||
      !nestedObject(metadata, "functions", functions, error_)) {
    return false;
  }

  return parseTests(tests) && parseRemoveInstruments(groups) && parseMetadataFunctions(functions);
}

bool ConfigReader::parseEntry(const json::Parser& parent, const std::string& name, bool& run,
                              std::string& args) {
  if (parent.kind(name) != json::ValueKind::Object) {
    error_ = "Entry \"" + name + "\" must be an object";
    return false;
  }
  json::Parser entry = parent.getObject(name);
  if (!entry.ok()) {
    error_ = "Entry \"" + name + "\" is malformed";
    return false;
  }
  if (entry.kind("run") != json::ValueKind::Bool) {
    error_ = "Entry \"" + name + "\" needs a boolean \"run\"";
    return false;
  }
  run = entry.getBool("run");

  json::ValueKind args_kind = entry.kind("args");
  if (args_kind == json::ValueKind::Missing) {
    args = "{}";
  } else if (args_kind == json::ValueKind::Object) {
    args = entry.getText("args");
  } else {
    error_ = "Entry \"" + name + "\" has non-object \"args\"";
    return false;
  }
  return true;
}

bool ConfigReader::parseTests(const json::Parser& tests) {
  for (const auto& name : tests.keys()) {
    auto test = filterTestFromName(name);
    if (!test) {
      error_ = "Unknown test: " + name;
      return false;
    }
    FilterTestConfig cfg;
    cfg.test = *test;
    if (!parseEntry(tests, name, cfg.run, cfg.args)) return false;
    config_.tests.push_back(std::move(cfg));
  }
  return true;
}

bool ConfigReader::parseRemoveInstruments(const json::Parser& groups) {
  for (const auto& name : groups.keys()) {
    if (!instrumentGroupFromName(name)) {
      error_ = "Unknown instrument group: " + name;
      return false;
    }
    if (groups.kind(name) != json::ValueKind::Bool) {
      error_ = "Instrument group \"" + name + "\" must be true or false";
      return false;
    }
    config_.remove_instruments[name] = groups.getBool(name);
  }
  return true;
}

bool ConfigReader::parseMetadataFunctions(const json::Parser& functions) {
  for (const auto& name : functions.keys()) {
    auto fn = metadataFunctionFromName(name);
    if (!fn) {
      error_ = "Unknown metadata function: " + name;
      return false;
    }
    MetadataFunctionConfig cfg;
    cfg.function = *fn;
    if (!parseEntry(functions, name, cfg.run, cfg.args)) return false;
    config_.metadata_functions.push_back(std::move(cfg));
  }
  return true;
}

}  // namespace midinorm
