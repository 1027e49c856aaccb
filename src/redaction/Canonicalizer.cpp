#include "Canonicalizer.hpp"
#include "Confusables.hpp"
#include "Diagnostics.hpp"
#include "TextUtils.hpp"

#include <utf8proc.h>
#include <plog/Log.h>
#include <algorithm>
#include <cstdlib>
#include <iterator>

namespace redaction
{

namespace
{

std::string normalizeNFKC(std::string_view cluster)
{
    utf8proc_uint8_t* normalized = nullptr;
    utf8proc_ssize_t length = utf8proc_map(reinterpret_cast<const utf8proc_uint8_t*>(cluster.data()),
                                           static_cast<utf8proc_ssize_t>(cluster.size()), &normalized,
                                           static_cast<utf8proc_option_t>(UTF8PROC_STABLE | UTF8PROC_COMPOSE |
                                                                          UTF8PROC_COMPAT));

    if (length < 0 || !normalized)
    {
        PLOG_DEBUG_(Diagnostics::kLogInstance)
            << "NFKC normalization failed (" << utf8proc_errmsg(length) << "), using cluster as-is";
        std::free(normalized);
        return std::string(cluster);
    }

    std::string result(reinterpret_cast<char*>(normalized), static_cast<std::size_t>(length));
    std::free(normalized);
    return result;
}

void appendCluster(CanonicalText& out, std::string_view text, std::size_t begin, std::size_t end)
{
    if (begin >= end)
        return;

    std::string_view cluster = text.substr(begin, end - begin);

    std::u32string normalized;
    if (cluster.size() == 1 && static_cast<unsigned char>(cluster[0]) < 0x80)
    {
        normalized.push_back(static_cast<char32_t>(cluster[0]));
    }
    else
    {
        normalized = utf8ToUtf32(normalizeNFKC(cluster));
    }

    for (char32_t cp : normalized)
    {
        if (isZeroWidth(cp))
            continue;

        char32_t mapped = mapConfusable(cp).value_or(cp);
        if (isWhitespace(mapped) || isPunctuation(mapped))
            continue;

        out.canonical.push_back(static_cast<char32_t>(utf8proc_tolower(static_cast<utf8proc_int32_t>(mapped))));
        out.position_map.push_back(begin);
        out.position_end.push_back(end);
    }
}

} // namespace

bool CanonicalText::coversOffset(std::size_t offset) const
{
    auto it = std::upper_bound(position_map.begin(), position_map.end(), offset);
    if (it == position_map.begin())
        return false;

    auto index = static_cast<std::size_t>(std::distance(position_map.begin(), it)) - 1;
    return offset < position_end[index];
}

CanonicalText canonicalize(std::string_view text)
{
    CanonicalText result;
    if (text.empty())
        return result;

    result.canonical.reserve(text.size());
    result.position_map.reserve(text.size());
    result.position_end.reserve(text.size());

    utf8proc_int32_t state = 0;
    std::size_t cluster_begin = 0;
    std::size_t pos = 0;
    char32_t prev = 0;

    while (pos < text.size())
    {
        std::size_t bytes = 0;
        char32_t cp = decodeAt(text, pos, &bytes);

        if (pos > 0 && utf8proc_grapheme_break_stateful(static_cast<utf8proc_int32_t>(prev),
                                                        static_cast<utf8proc_int32_t>(cp), &state))
        {
            appendCluster(result, text, cluster_begin, pos);
            cluster_begin = pos;
        }

        prev = cp;
        pos += bytes;
    }
    appendCluster(result, text, cluster_begin, text.size());

    return result;
}

std::u32string canonicalForm(std::string_view text) { return canonicalize(text).canonical; }

bool isWordBoundary(std::string_view text, std::ptrdiff_t index)
{
    if (index < 0 || static_cast<std::size_t>(index) >= text.size())
        return true;

    char32_t cp = decodeAt(text, static_cast<std::size_t>(index));
    return isWhitespace(cp) || isPunctuation(cp);
}

} // namespace redaction
