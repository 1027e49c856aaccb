#include "EntryPreparer.hpp"
#include "Canonicalizer.hpp"
#include "TextUtils.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <unordered_set>

namespace redaction
{

namespace
{

constexpr std::array<std::string_view, 10> kCommonEmailProviders = {
    "gmail", "hotmail", "yahoo", "outlook", "icloud", "aol", "protonmail", "mail", "live", "msn"
};

std::string asciiLower(std::string_view text)
{
    std::string out(text);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

class CandidateList
{
public:
    void add(PIICategory category, std::string value)
    {
        std::u32string canonical = canonicalForm(value);
        if (canonical.size() < kMinCanonicalLength)
            return;
        if (!seen_.insert(canonical).second)
            return;
        candidates_.emplace_back(category, std::move(value), std::move(canonical));
    }

    std::vector<CanonicalPIIEntry> release() { return std::move(candidates_); }

private:
    std::vector<CanonicalPIIEntry> candidates_;
    std::unordered_set<std::u32string> seen_;
};

void addNameComponents(CandidateList& list, const std::string& name)
{
    auto parts = splitWhitespace(name);
    if (parts.size() < 2)
        return;

    for (auto& part : parts)
    {
        if (codepointCount(part) >= 2)
            list.add(PIICategory::Name, std::move(part));
    }
}

void addEmailComponents(CandidateList& list, const std::string& email)
{
    std::size_t at = email.rfind('@');
    if (at == std::string::npos || at == 0)
        return;

    std::string local_part = email.substr(0, at);
    if (codepointCount(local_part) >= 2)
        list.add(PIICategory::Name, std::move(local_part));

    std::string domain = asciiLower(email.substr(at + 1));
    if (!domain.empty() && !isCommonEmailProvider(domain))
        list.add(PIICategory::Custom, std::move(domain));
}

} // namespace

bool isCommonEmailProvider(std::string_view domain)
{
    std::string label = asciiLower(domain.substr(0, domain.find('.')));
    return std::find(kCommonEmailProviders.begin(), kCommonEmailProviders.end(), label) !=
           kCommonEmailProviders.end();
}

std::vector<CanonicalPIIEntry> preparePIIEntries(const std::vector<PIIEntry>& entries)
{
    CandidateList list;

    for (const auto& entry : entries)
    {
        std::string value = trim(entry.value);
        if (value.empty())
            continue;

        list.add(entry.category, value);

        if (entry.category == PIICategory::Name)
            addNameComponents(list, value);
        else if (entry.category == PIICategory::Email)
            addEmailComponents(list, value);
    }

    auto candidates = list.release();
    std::stable_sort(candidates.begin(), candidates.end(), [](const CanonicalPIIEntry& a, const CanonicalPIIEntry& b) {
        return a.canonical().size() > b.canonical().size();
    });
    return candidates;
}

} // namespace redaction
