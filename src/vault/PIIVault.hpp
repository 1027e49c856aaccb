#pragma once

#include "../redaction/PIITypes.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace vault
{

/**
 * @brief Ordered store of the caller's known PII values.
 *
 * Values are trimmed on insert and empty values are refused. Order is kept
 * because it decides ties between equally long match candidates.
 */
class PIIVault
{
public:
    bool add(redaction::PIICategory category, const std::string& value);
    bool remove(std::size_t index);
    void clear() noexcept { entries_.clear(); }

    [[nodiscard]] const std::vector<redaction::PIIEntry>& entries() const noexcept { return entries_; }
    [[nodiscard]] std::size_t size() const noexcept { return entries_.size(); }
    [[nodiscard]] bool empty() const noexcept { return entries_.empty(); }
    [[nodiscard]] std::size_t countByCategory(redaction::PIICategory category) const;

    /**
     * @brief Appends entries from a JSON file.
     *
     * Expected format: [ { "category": "name", "value": "Jane Doe" }, ... ]
     * Malformed items and unknown categories are skipped with a warning.
     *
     * @return false if the file is missing or is not a JSON array
     */
    bool loadFromFile(const std::string& file_path);
    bool loadFromString(std::string_view json_text, const std::string& source = "<string>");

    /// Parses a "category:value" command-line spec.
    [[nodiscard]] static std::optional<redaction::PIIEntry> parseEntrySpec(std::string_view spec);

private:
    std::vector<redaction::PIIEntry> entries_;
};

} // namespace vault
