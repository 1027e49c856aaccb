#include "RedactionSession.hpp"

namespace redaction
{

namespace
{

std::size_t categoryIndex(PIICategory category) { return static_cast<std::size_t>(category); }

} // namespace

RedactionSession::RedactionSession()
    : rng_(std::random_device{}())
{
}

RedactionSession::RedactionSession(std::uint32_t seed)
    : rng_(seed)
{
}

std::optional<std::string> RedactionSession::nonceFor(const std::u32string& canonical) const
{
    auto it = pii_to_nonce_.find(canonical);
    if (it == pii_to_nonce_.end())
        return std::nullopt;
    return it->second;
}

bool RedactionSession::record(const std::u32string& canonical, const std::string& nonce, const std::string& original)
{
    if (pii_to_nonce_.count(canonical) > 0 || nonce_to_pii_.count(nonce) > 0)
        return false;

    pii_to_nonce_.emplace(canonical, nonce);
    nonce_to_pii_.emplace(nonce, original);
    used_nonces_.insert(nonce);
    return true;
}

bool RedactionSession::isNonceUsed(const std::string& nonce) const { return used_nonces_.count(nonce) > 0; }

void RedactionSession::markNonceUsed(const std::string& nonce) { used_nonces_.insert(nonce); }

std::size_t RedactionSession::nextCounter(PIICategory category)
{
    return nonce_counters_[categoryIndex(category)]++;
}

std::size_t RedactionSession::counter(PIICategory category) const
{
    return nonce_counters_[categoryIndex(category)];
}

std::string RedactionSession::randomSuffix(std::size_t length)
{
    static constexpr char kAlphabet[] = "0123456789abcdefghijklmnopqrstuvwxyz";
    std::uniform_int_distribution<std::size_t> pick(0, sizeof(kAlphabet) - 2);

    std::string suffix;
    suffix.reserve(length);
    for (std::size_t i = 0; i < length; ++i)
        suffix.push_back(kAlphabet[pick(rng_)]);
    return suffix;
}

RedactionSession createSession() { return RedactionSession{}; }

} // namespace redaction
