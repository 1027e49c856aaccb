#pragma once

#include "PIITypes.hpp"
#include "RedactionTypes.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace redaction
{

class RedactionSession;

/**
 * @brief Fail-closed boundary around the redaction engine.
 *
 * Holds the caller's PII entries and the session of the latest redaction.
 * Every redactInput() call starts a fresh session, so nonces from an earlier
 * input stop being restorable once the input changes. Callers that send the
 * redacted text out must restore the reply before redacting new input.
 *
 * Output is never the unredacted input: with no entries, or when a stage
 * fails, the text is a literal warning and the outcome carries the error.
 */
class RedactionPipeline
{
public:
    RedactionPipeline();
    explicit RedactionPipeline(std::vector<PIIEntry> entries);
    ~RedactionPipeline();

    RedactionPipeline(const RedactionPipeline&) = delete;
    RedactionPipeline& operator=(const RedactionPipeline&) = delete;

    /// Replaces the entry list and drops the active session.
    void setEntries(std::vector<PIIEntry> entries);
    [[nodiscard]] const std::vector<PIIEntry>& entries() const noexcept;
    [[nodiscard]] const std::vector<CanonicalPIIEntry>& preparedEntries() const noexcept;

    /// Fixes the seed of the collision-suffix generator for sessions created from now on.
    void setSessionSeed(std::optional<std::uint32_t> seed);

    [[nodiscard]] RedactionOutcome redactInput(const std::string& input);
    [[nodiscard]] RedactionOutcome restoreResponse(const std::string& response) const;

    [[nodiscard]] bool hasActiveSession() const noexcept;
    [[nodiscard]] const RedactionSession* session() const noexcept;
    void resetSession();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace redaction
