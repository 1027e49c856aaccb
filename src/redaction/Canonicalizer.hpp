#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace redaction
{

/**
 * @brief Comparison-only form of a text plus the map back to the original.
 *
 * `canonical` holds one element per canonical code point. For every canonical
 * index i, [position_map[i], position_end[i]) is the byte span of the grapheme
 * cluster in the original (un-normalized) UTF-8 text that produced it. Several
 * canonical code points may share one span (e.g. a ligature expanded by NFKC).
 */
struct CanonicalText
{
    std::u32string canonical;
    std::vector<std::size_t> position_map;
    std::vector<std::size_t> position_end;

    /// True when the original byte at `offset` belongs to a cluster that produced canonical output.
    [[nodiscard]] bool coversOffset(std::size_t offset) const;
};

/**
 * @brief Canonicalizes text for matching.
 *
 * Per grapheme cluster: NFKC, drop zero-width characters, map confusables to
 * ASCII, drop whitespace and punctuation, lowercase.
 */
[[nodiscard]] CanonicalText canonicalize(std::string_view text);

/// Canonical form only, for candidates that never need the position map.
[[nodiscard]] std::u32string canonicalForm(std::string_view text);

/// True at string edges (index < 0 or past the end) or when the code point at
/// byte `index` is whitespace or punctuation.
[[nodiscard]] bool isWordBoundary(std::string_view text, std::ptrdiff_t index);

} // namespace redaction
