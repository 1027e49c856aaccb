#include "PIIVault.hpp"
#include "../redaction/Diagnostics.hpp"
#include "../redaction/TextUtils.hpp"
#include "../utils/ErrorReporter.hpp"

#include <plog/Log.h>
#include <nlohmann/json.hpp>
#include <algorithm>
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;
using json = nlohmann::json;

using redaction::Diagnostics;

namespace vault
{

namespace
{

// Returns the number of entries appended, or nullopt when the document is not an array
std::optional<std::size_t> appendEntries(PIIVault& vault, const json& doc, const std::string& source)
{
    if (!doc.is_array())
    {
        PLOG_ERROR_(Diagnostics::kLogInstance) << "[PIIVault] Invalid JSON format (expected array): " << source;
        return std::nullopt;
    }

    std::size_t added = 0;
    std::size_t index = 0;
    for (const auto& item : doc)
    {
        ++index;
        if (!item.is_object() || !item.contains("category") || !item.contains("value") ||
            !item["category"].is_string() || !item["value"].is_string())
        {
            PLOG_WARNING_(Diagnostics::kLogInstance) << "[PIIVault] Skipping malformed entry #" << index << " in "
                                                     << source;
            continue;
        }

        const auto category_name = item["category"].get<std::string>();
        auto category = redaction::parseCategory(category_name);
        if (!category)
        {
            PLOG_WARNING_(Diagnostics::kLogInstance) << "[PIIVault] Skipping entry #" << index
                                                     << " with unknown category '" << category_name << "'";
            continue;
        }

        if (vault.add(*category, item["value"].get<std::string>()))
            ++added;
        else
            PLOG_WARNING_(Diagnostics::kLogInstance) << "[PIIVault] Skipping empty " << category_name << " entry #"
                                                     << index;
    }
    return added;
}

} // namespace

bool PIIVault::add(redaction::PIICategory category, const std::string& value)
{
    std::string trimmed = redaction::trim(value);
    if (trimmed.empty())
        return false;

    entries_.push_back(redaction::PIIEntry{ category, std::move(trimmed) });
    return true;
}

bool PIIVault::remove(std::size_t index)
{
    if (index >= entries_.size())
        return false;
    entries_.erase(entries_.begin() + static_cast<std::ptrdiff_t>(index));
    return true;
}

std::size_t PIIVault::countByCategory(redaction::PIICategory category) const
{
    return static_cast<std::size_t>(std::count_if(entries_.begin(), entries_.end(),
                                                  [category](const auto& e) { return e.category == category; }));
}

bool PIIVault::loadFromFile(const std::string& file_path)
{
    std::error_code ec;
    if (!fs::exists(file_path, ec))
    {
        utils::ErrorReporter::ReportError(utils::ErrorCategory::Vault, "PII vault file not found",
                                          ec ? file_path + ": " + ec.message() : file_path);
        return false;
    }

    std::ifstream file(file_path);
    if (!file.is_open())
    {
        utils::ErrorReporter::ReportError(utils::ErrorCategory::Vault, "Failed to open PII vault file", file_path);
        return false;
    }

    try
    {
        json j;
        file >> j;

        auto added = appendEntries(*this, j, file_path);
        if (!added)
        {
            utils::ErrorReporter::ReportError(utils::ErrorCategory::Vault, "PII vault file has the wrong format",
                                              file_path + ": expected a JSON array of {category, value}");
            return false;
        }

        PLOG_INFO_(Diagnostics::kLogInstance) << "[PIIVault] Loaded " << *added << " entries from " << file_path;
        return true;
    }
    catch (const json::exception& e)
    {
        utils::ErrorReporter::ReportError(utils::ErrorCategory::Vault, "PII vault file is not valid JSON",
                                          file_path + ": " + e.what());
        return false;
    }
}

bool PIIVault::loadFromString(std::string_view json_text, const std::string& source)
{
    try
    {
        auto j = json::parse(json_text);

        auto added = appendEntries(*this, j, source);
        if (!added)
        {
            utils::ErrorReporter::ReportError(utils::ErrorCategory::Vault, "PII vault data has the wrong format",
                                              source + ": expected a JSON array of {category, value}");
            return false;
        }
        return true;
    }
    catch (const json::exception& e)
    {
        utils::ErrorReporter::ReportError(utils::ErrorCategory::Vault, "PII vault data is not valid JSON",
                                          source + ": " + e.what());
        return false;
    }
}

std::optional<redaction::PIIEntry> PIIVault::parseEntrySpec(std::string_view spec)
{
    std::size_t colon = spec.find(':');
    if (colon == std::string_view::npos)
        return std::nullopt;

    auto category = redaction::parseCategory(spec.substr(0, colon));
    if (!category)
        return std::nullopt;

    std::string value = redaction::trim(spec.substr(colon + 1));
    if (value.empty())
        return std::nullopt;

    return redaction::PIIEntry{ *category, std::move(value) };
}

} // namespace vault
