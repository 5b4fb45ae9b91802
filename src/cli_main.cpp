/**
 * @file cli_main.cpp
 * @brief Command-line interface for MIDI normalization.
 */

#include "midinorm.h"
#include <cstring>
#include <fstream>
#include <iostream>

namespace {

void printUsage(const char* program) {
  std::cout << "Usage: " << program << " (--input FILE | --raw FILE) [options]\n\n";
  std::cout << "Input:\n";
  std::cout << "  --input FILE      Load canonical Document JSON\n";
  std::cout << "  --raw FILE        Load raw event JSON and pair notes\n";
  std::cout << "  --config FILE     Load normalizer config (tests, instrument removal)\n\n";
  std::cout << "Transformations (applied in this order):\n";
  std::cout << "  --remove-instruments       Drop channels of groups flagged in the config\n";
  std::cout << "  --resolve-pedal            Extend notes through sustain pedal\n";
  std::cout << "  --strict-pedal             With --resolve-pedal, fail if already resolved\n";
  std::cout << "  --resolve-overlaps         Trim overlapping notes of the same pitch\n";
  std::cout << "  --remove-redundant-pedals  Drop pedal events that extend no note\n\n";
  std::cout << "Output:\n";
  std::cout << "  --filter          Run config tests; exit 2 if any fails\n";
  std::cout << "  --hash            Print the content hash\n";
  std::cout << "  --duration        Print duration in milliseconds\n";
  std::cout << "  --events FILE     Write the assembled event stream as JSON\n";
  std::cout << "  --output FILE     Write the Document JSON (default: stdout)\n";
  std::cout << "  --pretty          Indent JSON output\n";
  std::cout << "  --verbose         Log each step to stderr\n";
  std::cout << "  --help            Show this help message\n";
}

bool writeFile(const std::string& path, const std::string& content) {
  std::ofstream file(path, std::ios::binary);
  if (!file) return false;
  file << content << "\n";
  return static_cast<bool>(file);
}

}  // namespace

int main(int argc, char* argv[]) {
  std::string input_file;
  std::string raw_file;
  std::string config_file;
  std::string events_file;
  std::string output_file;
  bool resolve_pedal = false;
  bool strict_pedal = false;
  bool resolve_overlaps = false;
  bool remove_redundant_pedals = false;
  bool remove_instruments = false;
  bool filter = false;
  bool print_hash = false;
  bool print_duration = false;
  bool pretty = false;
  bool verbose = false;

  for (int i = 1; i < argc; ++i) {
    if (std::strcmp(argv[i], "--input") == 0 && i + 1 < argc) {
      input_file = argv[++i];
    } else if (std::strcmp(argv[i], "--raw") == 0 && i + 1 < argc) {
      raw_file = argv[++i];
    } else if (std::strcmp(argv[i], "--config") == 0 && i + 1 < argc) {
      config_file = argv[++i];
    } else if (std::strcmp(argv[i], "--resolve-pedal") == 0) {
      resolve_pedal = true;
    } else if (std::strcmp(argv[i], "--strict-pedal") == 0) {
      strict_pedal = true;
    } else if (std::strcmp(argv[i], "--resolve-overlaps") == 0) {
      resolve_overlaps = true;
    } else if (std::strcmp(argv[i], "--remove-redundant-pedals") == 0) {
      remove_redundant_pedals = true;
    } else if (std::strcmp(argv[i], "--remove-instruments") == 0) {
      remove_instruments = true;
    } else if (std::strcmp(argv[i], "--filter") == 0) {
      filter = true;
    } else if (std::strcmp(argv[i], "--hash") == 0) {
      print_hash = true;
    } else if (std::strcmp(argv[i], "--duration") == 0) {
      print_duration = true;
    } else if (std::strcmp(argv[i], "--events") == 0 && i + 1 < argc) {
      events_file = argv[++i];
    } else if (std::strcmp(argv[i], "--output") == 0 && i + 1 < argc) {
      output_file = argv[++i];
    } else if (std::strcmp(argv[i], "--pretty") == 0) {
      pretty = true;
    } else if (std::strcmp(argv[i], "--verbose") == 0) {
      verbose = true;
    } else if (std::strcmp(argv[i], "--help") == 0) {
      printUsage(argv[0]);
      return 0;
    } else {
      std::cerr << "Unknown option: " << argv[i] << "\n";
      printUsage(argv[0]);
      return 1;
    }
  }

  if (input_file.empty() == raw_file.empty()) {
    std::cerr << "Exactly one of --input or --raw is required\n";
    printUsage(argv[0]);
    return 1;
  }

  midinorm::MidiNorm norm;

  if (!config_file.empty()) {
    if (!norm.loadConfig(config_file)) {
      std::cerr << "Error: " << config_file << ": " << norm.getError() << "\n";
      return 1;
    }
    if (verbose) std::cerr << "Loaded config " << config_file << "\n";
  } else if (filter || remove_instruments) {
    std::cerr << "Error: --filter and --remove-instruments need --config\n";
    return 1;
  }

  const std::string& source = input_file.empty() ? raw_file : input_file;
  bool loaded = input_file.empty() ? norm.loadRawEvents(raw_file) : norm.loadDocument(input_file);
  if (!loaded) {
    std::cerr << "Error: " << source << ": " << norm.getError() << "\n";
    return 1;
  }
  if (verbose) {
    const auto& doc = norm.getDocument();
    std::cerr << "Loaded " << source << ": " << doc.noteMsgs().size() << " notes, "
              << doc.pedalMsgs().size() << " pedal events, " << doc.ticksPerBeat() << " ppq\n";
  }

  if (remove_instruments) {
    size_t before = norm.getDocument().noteMsgs().size();
    norm.removeInstruments();
    if (verbose) {
      std::cerr << "Removed instruments: " << before - norm.getDocument().noteMsgs().size()
                << " notes dropped\n";
    }
  }

  if (resolve_pedal) {
    if (strict_pedal) {
      if (!norm.resolvePedalStrict()) {
        std::cerr << "Error: " << norm.getError() << "\n";
        return 1;
      }
    } else {
      norm.resolvePedal();
    }
    if (verbose) std::cerr << "Resolved pedal\n";
  }

  if (resolve_overlaps) {
    norm.resolveOverlaps();
    if (verbose) std::cerr << "Resolved overlaps\n";
  }

  if (remove_redundant_pedals) {
    size_t before = norm.getDocument().pedalMsgs().size();
    norm.removeRedundantPedals();
    if (verbose) {
      std::cerr << "Removed " << before - norm.getDocument().pedalMsgs().size()
                << " redundant pedal events\n";
    }
  }

  if (filter) {
    midinorm::FilterReport report;
    if (!norm.runFilters(report)) {
      std::cerr << "Error: " << norm.getError() << "\n";
      return 1;
    }
    std::cout << report.toJson() << "\n";
    if (!report.passed()) {
      if (verbose) std::cerr << "Rejected by filter\n";
      return 2;
    }
  }

  if (print_hash) std::cout << norm.getHash() << "\n";
  if (print_duration) std::cout << norm.durationMs() << "\n";

  if (!events_file.empty()) {
    if (!writeFile(events_file, norm.getEventsJson(pretty))) {
      std::cerr << "Error: failed to write " << events_file << "\n";
      return 1;
    }
    if (verbose) std::cerr << "Wrote " << events_file << "\n";
  }

  if (!output_file.empty()) {
    if (!writeFile(output_file, norm.getDocumentJson(pretty))) {
      std::cerr << "Error: failed to write " << output_file << "\n";
      return 1;
    }
    if (verbose) std::cerr << "Wrote " << output_file << "\n";
  } else if (!filter && !print_hash && !print_duration && events_file.empty()) {
    std::cout << norm.getDocumentJson(pretty) << "\n";
  }

  return 0;
}
