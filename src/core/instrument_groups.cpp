/**
 * @file instrument_groups.cpp
 * @brief Implementation of program to instrument group mapping.
 */

#include "core/instrument_groups.h"

namespace midinorm {

namespace {

constexpr uint8_t kProgramsPerGroup = 8;

const char* const kGroupNames[kInstrumentGroupCount] = {
    "piano", "chromatic", "organ", "guitar",
    "bass", "strings", "ensemble", "brass",
    "reed", "pipe", "synth_lead", "synth_pad",
    "synth_effect", "ethnic", "percussive", "sfx"};

}  // namespace

InstrumentGroup instrumentGroupForProgram(uint8_t program) {
  return static_cast<InstrumentGroup>((program & 0x7F) / kProgramsPerGroup);
}

const char* instrumentGroupName(InstrumentGroup group) {
  auto idx = static_cast<size_t>(group);
  if (idx >= kInstrumentGroupCount) return "unknown";
  return kGroupNames[idx];
}

std::optional<InstrumentGroup> instrumentGroupFromName(const std::string& name) {
  for (size_t i = 0; i < kInstrumentGroupCount; ++i) {
    if (name == kGroupNames[i]) return static_cast<InstrumentGroup>(i);
  }
  return std::nullopt;
}

const std::array<InstrumentGroup, kInstrumentGroupCount>& allInstrumentGroups() {
  static const std::array<InstrumentGroup, kInstrumentGroupCount> groups = {
      InstrumentGroup::Piano,      InstrumentGroup::Chromatic,   InstrumentGroup::Organ,
      InstrumentGroup::Guitar,     InstrumentGroup::Bass,        InstrumentGroup::Strings,
      InstrumentGroup::Ensemble,   InstrumentGroup::Brass,       InstrumentGroup::Reed,
      InstrumentGroup::Pipe,       InstrumentGroup::SynthLead,   InstrumentGroup::SynthPad,
      InstrumentGroup::SynthEffect, InstrumentGroup::Ethnic,     InstrumentGroup::Percussive,
      InstrumentGroup::Sfx};
  return groups;
}

}  // namespace midinorm
