#pragma once

#include "PIITypes.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace redaction
{

class RedactionSession;

/**
 * @brief Replaces every PII match with its session nonce.
 *
 * Text between matches is copied verbatim. A canonical PII value seen for
 * the first time gets a fresh nonce recorded in both session directions;
 * later occurrences (in this text or in later calls sharing the session)
 * reuse it.
 */
[[nodiscard]] std::string redact(std::string_view text, const std::vector<CanonicalPIIEntry>& entries,
                                 RedactionSession& session);

/**
 * @brief Swaps nonces back for the values they replaced.
 *
 * Nonces are replaced longest first so that a nonce which is a prefix of
 * another cannot cut it in half. Does not re-run matching and does not
 * modify the session.
 */
[[nodiscard]] std::string restore(std::string_view text, const RedactionSession& session);

} // namespace redaction
