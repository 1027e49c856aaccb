#include "RedactionTypes.hpp"

namespace redaction
{

std::string_view errorToString(RedactionError error) noexcept
{
    switch (error)
    {
    case RedactionError::Unconfigured:
        return "Unconfigured";
    case RedactionError::NoActiveSession:
        return "NoActiveSession";
    case RedactionError::StageFailed:
        return "StageFailed";
    default:
        return "Unknown";
    }
}

} // namespace redaction
