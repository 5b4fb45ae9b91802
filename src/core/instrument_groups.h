/**
 * @file instrument_groups.h
 * @brief General MIDI program to instrument group mapping.
 */

#ifndef MIDINORM_CORE_INSTRUMENT_GROUPS_H
#define MIDINORM_CORE_INSTRUMENT_GROUPS_H

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace midinorm {

/// @brief The 16 General MIDI instrument families, 8 programs each.
enum class InstrumentGroup : uint8_t {
  Piano = 0,
  Chromatic,
  Organ,
  Guitar,
  Bass,
  Strings,
  Ensemble,
  Brass,
  Reed,
  Pipe,
  SynthLead,
  SynthPad,
  SynthEffect,
  Ethnic,
  Percussive,
  Sfx
};

inline constexpr size_t kInstrumentGroupCount = 16;

/// @brief Group of a program (0-127). Programs above 127 are masked to 7 bits.
InstrumentGroup instrumentGroupForProgram(uint8_t program);

/// @brief Config name of a group ("piano", "synth_lead", ...).
const char* instrumentGroupName(InstrumentGroup group);

/// @brief Inverse of instrumentGroupName().
std::optional<InstrumentGroup> instrumentGroupFromName(const std::string& name);

/// @brief All groups in program order.
const std::array<InstrumentGroup, kInstrumentGroupCount>& allInstrumentGroups();

}  // namespace midinorm

#endif  // MIDINORM_CORE_INSTRUMENT_GROUPS_H
