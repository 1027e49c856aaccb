#pragma once

#include "PIITypes.hpp"

#include <string_view>
#include <vector>

namespace redaction
{

/**
 * @brief Locates prepared PII candidates in free-form text.
 *
 * Candidates are tried in the order given (longest first after
 * preparePIIEntries()). A canonical occurrence is rejected when any of its
 * canonical indices is already claimed by an earlier match. Accepted
 * occurrences are widened over adjacent characters that are neither word
 * boundaries nor part of the canonical text (zero-width and similar), then
 * must start and end on a word boundary.
 *
 * @return Non-overlapping matches sorted by original start offset
 */
[[nodiscard]] std::vector<PIIMatch> findPIIMatches(std::string_view text,
                                                   const std::vector<CanonicalPIIEntry>& entries);

} // namespace redaction
