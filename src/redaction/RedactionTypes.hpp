#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace redaction
{

// Literal strings returned in place of text whenever output cannot be proven safe
inline constexpr std::string_view kNoEntriesWarning = "⚠️ ERROR: No PII entries. Add entries before redacting.";
inline constexpr std::string_view kNoSessionWarning = "⚠️ ERROR: No active session. Enter input text first.";
inline constexpr std::string_view kRedactionFailedWarning = "⚠️ ERROR: Redaction failed. Output withheld.";
inline constexpr std::string_view kRestoreFailedWarning = "⚠️ ERROR: Restore failed. Output withheld.";

enum class RedactionError
{
    Unconfigured,    // redact requested with no PII entries
    NoActiveSession, // restore requested before any successful redact
    StageFailed      // an engine stage threw; nothing is emitted
};

[[nodiscard]] std::string_view errorToString(RedactionError error) noexcept;

// Public-boundary result: `text` is either safe output or a literal warning
struct RedactionOutcome
{
    std::string text;
    std::optional<RedactionError> error;

    [[nodiscard]] bool ok() const noexcept { return !error.has_value(); }

    static RedactionOutcome success(std::string text) { return RedactionOutcome{ std::move(text), std::nullopt }; }

    static RedactionOutcome failure(RedactionError err, std::string_view warning)
    {
        return RedactionOutcome{ std::string(warning), err };
    }
};

// What run_stage hands back: the stage value, or the exception message when it threw
template<typename T>
struct StageResult {
    T result{};
    bool succeeded = false;
    std::optional<std::string> error;
    std::chrono::microseconds duration{};
    std::string stage_name;

    static StageResult success(T value, std::chrono::microseconds took, std::string name) {
        return StageResult{ std::move(value), true, std::nullopt, took, std::move(name) };
    }

    static StageResult failure(std::string message, std::chrono::microseconds took, std::string name) {
        return StageResult{ T{}, false, std::move(message), took, std::move(name) };
    }
};

} // namespace redaction
