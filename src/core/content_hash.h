/**
 * @file content_hash.h
 * @brief Stable content hash of a Document.
 */

#ifndef MIDINORM_CORE_CONTENT_HASH_H
#define MIDINORM_CORE_CONTENT_HASH_H

#include <cstdint>
#include <string>

#include "core/document.h"

namespace midinorm {

/// @brief 64-bit FNV-1a over a byte string.
uint64_t fnv1a64(const std::string& bytes);

/**
 * @brief Hash of the musical content of a Document.
 *
 * Covers instrument, note, pedal and tempo messages, serialized as compact
 * key-sorted JSON. Meta text, ticks_per_beat and metadata are excluded, so
 * two documents differing only there hash equal.
 *
 * @return 16 lowercase hex digits
 */
std::string contentHash(const Document& doc);

}  // namespace midinorm

#endif  // MIDINORM_CORE_CONTENT_HASH_H
