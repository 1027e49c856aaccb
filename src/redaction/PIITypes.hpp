#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace redaction
{

enum class PIICategory
{
    Name,
    Email,
    Phone,
    Ssn,
    Address,
    Custom
};

inline constexpr std::size_t kPIICategoryCount = 6;

[[nodiscard]] std::string_view categoryToString(PIICategory category) noexcept;

/// Parses the lowercase category names used in vault files ("name", "email", ...).
[[nodiscard]] std::optional<PIICategory> parseCategory(std::string_view text);

// Raw vault entry as supplied by the caller
struct PIIEntry
{
    PIICategory category = PIICategory::Custom;
    std::string value;
};

/**
 * @brief A match candidate produced by preparePIIEntries().
 *
 * Holds the entry value together with its canonical form. Only the preparer
 * constructs these; the accessors are read-only.
 */
class CanonicalPIIEntry
{
public:
    CanonicalPIIEntry(PIICategory category, std::string value, std::u32string canonical)
        : category_(category)
        , value_(std::move(value))
        , canonical_(std::move(canonical))
    {
    }

    [[nodiscard]] PIICategory category() const noexcept { return category_; }
    [[nodiscard]] const std::string& value() const noexcept { return value_; }
    [[nodiscard]] const std::u32string& canonical() const noexcept { return canonical_; }

private:
    PIICategory category_;
    std::string value_;
    std::u32string canonical_;
};

// One located occurrence. Offsets are byte offsets into the original UTF-8 text.
struct PIIMatch
{
    CanonicalPIIEntry pii;
    std::size_t original_start = 0;
    std::size_t original_end = 0;
    std::string original_text;
};

} // namespace redaction
