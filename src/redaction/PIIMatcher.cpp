#include "PIIMatcher.hpp"
#include "Canonicalizer.hpp"
#include "Diagnostics.hpp"
#include "TextUtils.hpp"

#include <plog/Log.h>
#include <algorithm>
#include <optional>

namespace redaction
{

namespace
{

struct Span
{
    std::size_t begin;
    std::size_t end;
};

bool boundaryBefore(std::string_view text, std::size_t offset)
{
    if (offset == 0)
        return true;
    return isWordBoundary(text, static_cast<std::ptrdiff_t>(previousOffset(text, offset)));
}

bool boundaryAt(std::string_view text, std::size_t offset)
{
    return isWordBoundary(text, static_cast<std::ptrdiff_t>(offset));
}

std::optional<Span> expandToWordBoundaries(std::string_view text, const CanonicalText& canon, Span span)
{
    while (span.begin > 0)
    {
        std::size_t prev = previousOffset(text, span.begin);
        if (isWordBoundary(text, static_cast<std::ptrdiff_t>(prev)) || canon.coversOffset(prev))
            break;
        span.begin = prev;
    }

    while (span.end < text.size())
    {
        if (isWordBoundary(text, static_cast<std::ptrdiff_t>(span.end)) || canon.coversOffset(span.end))
            break;
        std::size_t width = 0;
        decodeAt(text, span.end, &width);
        span.end += width;
    }

    if (!boundaryBefore(text, span.begin) || !boundaryAt(text, span.end))
        return std::nullopt;
    return span;
}

} // namespace

std::vector<PIIMatch> findPIIMatches(std::string_view text, const std::vector<CanonicalPIIEntry>& entries)
{
    std::vector<PIIMatch> matches;
    if (text.empty() || entries.empty())
        return matches;

    const CanonicalText canon = canonicalize(text);
    const std::u32string& haystack = canon.canonical;
    std::vector<bool> claimed(haystack.size(), false);

    std::size_t rejected_overlap = 0;
    std::size_t rejected_boundary = 0;

    for (const auto& entry : entries)
    {
        const std::u32string& needle = entry.canonical();
        if (needle.empty() || needle.size() > haystack.size())
            continue;

        std::size_t cursor = 0;
        while (true)
        {
            std::size_t index = haystack.find(needle, cursor);
            if (index == std::u32string::npos)
                break;
            cursor = index + 1;

            const std::size_t last = index + needle.size();
            if (std::any_of(claimed.begin() + static_cast<std::ptrdiff_t>(index),
                            claimed.begin() + static_cast<std::ptrdiff_t>(last), [](bool c) { return c; }))
            {
                ++rejected_overlap;
                continue;
            }

            auto span = expandToWordBoundaries(text, canon, Span{ canon.position_map[index], canon.position_end[last - 1] });
            if (!span)
            {
                ++rejected_boundary;
                continue;
            }

            matches.push_back(PIIMatch{ entry, span->begin, span->end,
                                        std::string(text.substr(span->begin, span->end - span->begin)) });
            std::fill(claimed.begin() + static_cast<std::ptrdiff_t>(index),
                      claimed.begin() + static_cast<std::ptrdiff_t>(last), true);
        }
    }

    std::stable_sort(matches.begin(), matches.end(),
                     [](const PIIMatch& a, const PIIMatch& b) { return a.original_start < b.original_start; });

    if (Diagnostics::IsVerbose())
    {
        PLOG_DEBUG_(Diagnostics::kLogInstance) << "[PIIMatcher] " << matches.size() << " matches, "
                                               << rejected_overlap << " overlapping, " << rejected_boundary
                                               << " off word boundary";
    }

    return matches;
}

} // namespace redaction
