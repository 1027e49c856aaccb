#pragma once

#include "PIITypes.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <random>
#include <string>
#include <unordered_map>
#include <unordered_set>

namespace redaction
{

/**
 * @brief Bidirectional PII <-> nonce mapping for one redact/restore round trip.
 *
 * Owned by the caller. Redaction mutates it while assigning nonces; restoring
 * only reads it. The forward map is keyed by canonical PII so every spelling
 * of the same value receives the same nonce. Both directions are written
 * together, so they stay exact inverses.
 */
class RedactionSession
{
public:
    RedactionSession();
    explicit RedactionSession(std::uint32_t seed);

    [[nodiscard]] std::optional<std::string> nonceFor(const std::u32string& canonical) const;

    // Fails when either the canonical PII or the nonce is already mapped
    bool record(const std::u32string& canonical, const std::string& nonce, const std::string& original);

    [[nodiscard]] bool isNonceUsed(const std::string& nonce) const;
    void markNonceUsed(const std::string& nonce);

    /// Returns the current counter for `category` and advances it.
    std::size_t nextCounter(PIICategory category);
    [[nodiscard]] std::size_t counter(PIICategory category) const;

    /// Random base-36 string used to break nonce collisions.
    std::string randomSuffix(std::size_t length);

    [[nodiscard]] const std::unordered_map<std::string, std::string>& nonceToPII() const noexcept { return nonce_to_pii_; }
    [[nodiscard]] const std::unordered_set<std::string>& usedNonces() const noexcept { return used_nonces_; }
    [[nodiscard]] std::size_t size() const noexcept { return nonce_to_pii_.size(); }
    [[nodiscard]] bool empty() const noexcept { return nonce_to_pii_.empty(); }

private:
    std::unordered_map<std::u32string, std::string> pii_to_nonce_;
    std::unordered_map<std::string, std::string> nonce_to_pii_;
    std::unordered_set<std::string> used_nonces_;
    std::array<std::size_t, kPIICategoryCount> nonce_counters_{};
    std::mt19937 rng_;
};

/// Empty session: no mappings, all counters at zero.
[[nodiscard]] RedactionSession createSession();

} // namespace redaction
