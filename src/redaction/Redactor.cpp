#include "Redactor.hpp"
#include "Diagnostics.hpp"
#include "NonceGenerator.hpp"
#include "PIIMatcher.hpp"
#include "RedactionSession.hpp"
#include "TextUtils.hpp"

#include <plog/Log.h>
#include <algorithm>
#include <stdexcept>
#include <utility>

namespace redaction
{

namespace
{

std::string nonceForMatch(const PIIMatch& match, RedactionSession& session)
{
    if (auto existing = session.nonceFor(match.pii.canonical()))
        return *existing;

    std::string nonce = generateNonce(match.pii.category(), session);
    if (!session.record(match.pii.canonical(), nonce, match.pii.value()))
        throw std::logic_error("nonce mapping conflict for category " +
                               std::string(categoryToString(match.pii.category())));
    return nonce;
}

} // namespace

std::string redact(std::string_view text, const std::vector<CanonicalPIIEntry>& entries, RedactionSession& session)
{
    const auto matches = findPIIMatches(text, entries);

    std::string result;
    result.reserve(text.size());

    std::size_t cursor = 0;
    for (const auto& match : matches)
    {
        if (match.original_end <= cursor)
            continue;

        // Matches sharing a grapheme cluster overlap in the original text; the
        // later one still gets its nonce and nothing past the cursor is copied
        if (match.original_start < cursor)
        {
            PLOG_DEBUG_(Diagnostics::kLogInstance) << "[Redactor] Match at byte " << match.original_start
                                                   << " overlaps the previous replacement";
        }
        else
        {
            result.append(text.substr(cursor, match.original_start - cursor));
        }

        result.append(nonceForMatch(match, session));
        cursor = match.original_end;
    }
    if (cursor < text.size())
        result.append(text.substr(cursor));

    return result;
}

std::string restore(std::string_view text, const RedactionSession& session)
{
    std::vector<std::pair<std::string, std::string>> pairs(session.nonceToPII().begin(), session.nonceToPII().end());
    std::sort(pairs.begin(), pairs.end(), [](const auto& a, const auto& b) {
        if (a.first.size() != b.first.size())
            return a.first.size() > b.first.size();
        return a.first < b.first;
    });

    std::string result(text);
    for (const auto& [nonce, original] : pairs)
    {
        replaceAll(result, nonce, original);
    }
    return result;
}

} // namespace redaction
