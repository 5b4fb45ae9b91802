/**
 * @file pedal_resolver.h
 * @brief Extends note ends to the release of the sustain pedal.
 */

#ifndef MIDINORM_CORE_PEDAL_RESOLVER_H
#define MIDINORM_CORE_PEDAL_RESOLVER_H

#include <string>

namespace midinorm {

class Document;

/**
 * @brief Extend every note ending inside a sustain interval to the interval end.
 *
 * A note is extended when `interval.start < note.end < interval.end` for an
 * interval of its channel. Overlaps are resolved afterwards and the document
 * is marked as pedal-resolved.
 *
 * Calling this on an already-resolved document prints a warning and extends
 * again; notes that were extended before can be extended further.
 *
 * @param doc Document edited in place
 */
void resolvePedal(Document& doc);

/**
 * @brief Like resolvePedal(), but refuses an already-resolved document.
 * @param doc Document edited in place (left untouched on refusal)
 * @param error Receives the reason on refusal
 * @return false if the document was already pedal-resolved
 */
bool resolvePedalStrict(Document& doc, std::string& error);

}  // namespace midinorm

#endif  // MIDINORM_CORE_PEDAL_RESOLVER_H
