/**
 * @file instrument_filter.cpp
 * @brief Implementation of instrument-group channel removal.
 */

#include "core/instrument_filter.h"

#include <algorithm>

#include "core/instrument_groups.h"

namespace midinorm {

namespace {

template <typename Msg>
void eraseChannels(std::vector<Msg>& msgs, const std::set<uint8_t>& channels) {
  msgs.erase(std::remove_if(msgs.begin(), msgs.end(),
                            [&](const Msg& msg) { return channels.count(msg.channel) > 0; }),
             msgs.end());
}

}  // namespace

std::array<bool, kNumPrograms> programsToRemove(const InstrumentRemovalConfig& config) {
  std::array<bool, kNumPrograms> remove{};
  for (int program = 0; program < kNumPrograms; ++program) {
    const char* group = instrumentGroupName(instrumentGroupForProgram(static_cast<uint8_t>(program)));
    auto it = config.find(group);
    remove[program] = (it != config.end() && it->second);
  }
  return remove;
}

std::set<uint8_t> channelsToRemove(const Document& doc, const InstrumentRemovalConfig& config) {
  auto programs = programsToRemove(config);
  std::set<uint8_t> channels;
  for (const auto& msg : doc.instrumentMsgs()) {
    if (msg.channel == kPercussionChannel) continue;
    if (programs[msg.program & 0x7F]) channels.insert(msg.channel);
  }
  return channels;
}

void removeInstruments(Document& doc, const InstrumentRemovalConfig& config) {
  std::set<uint8_t> channels = channelsToRemove(doc, config);
  if (channels.empty()) return;

  eraseChannels(doc.pedalMsgs(), channels);
  eraseChannels(doc.instrumentMsgs(), channels);
  eraseChannels(doc.noteMsgs(), channels);
}

}  // namespace midinorm
