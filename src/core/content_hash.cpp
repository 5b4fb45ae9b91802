/**
 * @file content_hash.cpp
 * @brief Implementation of the Document content hash.
 */

#include "core/content_hash.h"

#include <cstdio>
#include <sstream>

#include "core/document_json.h"

namespace midinorm {

namespace {

constexpr uint64_t kFnvOffsetBasis = 14695981039346656037ULL;
constexpr uint64_t kFnvPrime = 1099511628211ULL;

}  // namespace

uint64_t fnv1a64(const std::string& bytes) {
  uint64_t hash = kFnvOffsetBasis;
  for (unsigned char c : bytes) {
    hash ^= c;
    hash *= kFnvPrime;
  }
  return hash;
}

std::string contentHash(const Document& doc) {
  std::ostringstream oss;
  json::Writer w(oss);
  w.beginObject();
  writeInstrumentMsgs(w, doc.instrumentMsgs());
  writeNoteMsgs(w, doc.noteMsgs());
  writePedalMsgs(w, doc.pedalMsgs());
  writeTempoMsgs(w, doc.tempoMsgs());
  w.endObject();

  char buf[17];
  std::snprintf(buf, sizeof(buf), "%016llx",
                static_cast<unsigned long long>(fnv1a64(oss.str())));
  return buf;
}

}  // namespace midinorm
