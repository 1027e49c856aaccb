#include "PIITypes.hpp"

namespace redaction
{

std::string_view categoryToString(PIICategory category) noexcept
{
    switch (category)
    {
    case PIICategory::Name:
        return "name";
    case PIICategory::Email:
        return "email";
    case PIICategory::Phone:
        return "phone";
    case PIICategory::Ssn:
        return "ssn";
    case PIICategory::Address:
        return "address";
    case PIICategory::Custom:
        return "custom";
    default:
        return "custom";
    }
}

std::optional<PIICategory> parseCategory(std::string_view text)
{
    if (text == "name")
        return PIICategory::Name;
    if (text == "email")
        return PIICategory::Email;
    if (text == "phone")
        return PIICategory::Phone;
    if (text == "ssn")
        return PIICategory::Ssn;
    if (text == "address")
        return PIICategory::Address;
    if (text == "custom")
        return PIICategory::Custom;
    return std::nullopt;
}

} // namespace redaction
