#pragma once

#include "PIITypes.hpp"

#include <cstddef>
#include <string_view>
#include <vector>

namespace redaction
{

// Candidates shorter than this (in canonical code points) would match almost anywhere
inline constexpr std::size_t kMinCanonicalLength = 2;

/// True when the leading domain label is a public mail provider (gmail, yahoo, ...).
[[nodiscard]] bool isCommonEmailProvider(std::string_view domain);

/**
 * @brief Expands raw vault entries into canonical match candidates.
 *
 * Besides the literal value:
 * - multi-word names contribute each word of two or more characters as a name candidate
 * - emails contribute the local part as a name candidate and the domain as a
 *   custom candidate unless it belongs to a common public provider
 *
 * The result is de-duplicated by canonical form (first occurrence wins) and
 * sorted by canonical length, longest first. Equal lengths keep input order,
 * with expansion candidates directly after the entry they came from.
 */
[[nodiscard]] std::vector<CanonicalPIIEntry> preparePIIEntries(const std::vector<PIIEntry>& entries);

} // namespace redaction
