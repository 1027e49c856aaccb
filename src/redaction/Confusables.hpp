#pragma once

#include <optional>

namespace redaction
{

/// Maps a look-alike code point (Cyrillic, Greek, fullwidth Latin/digits) to its ASCII equivalent.
[[nodiscard]] std::optional<char32_t> mapConfusable(char32_t cp) noexcept;

} // namespace redaction
