#pragma once

#include "PIITypes.hpp"

#include <string>

namespace redaction
{

class RedactionSession;

/**
 * @brief Produces a realistic, category-appropriate fake value.
 *
 * Driven by the session's per-category counter, so output is deterministic
 * for a given session history. Phone numbers stay in the fictional 555-01XX
 * block and SSNs in the never-issued 900 area. A value already handed out in
 * this session gets "_" plus a random base-36 suffix until it is unique; the
 * final value is recorded as used.
 */
[[nodiscard]] std::string generateNonce(PIICategory category, RedactionSession& session);

} // namespace redaction
