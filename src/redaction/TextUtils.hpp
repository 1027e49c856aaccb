#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace redaction
{

/// UTF-8 to UTF-32 conversion. Invalid sequences decode to U+FFFD.
std::u32string utf8ToUtf32(std::string_view utf8_str);

/// UTF-32 to UTF-8 conversion
std::string utf32ToUtf8(const std::u32string& utf32_str);

/// Decodes the code point starting at byte `offset`; `length` receives its byte width.
/// Invalid bytes decode to U+FFFD with a width of one byte.
char32_t decodeAt(std::string_view text, std::size_t offset, std::size_t* length = nullptr);

/// Byte offset of the code point that ends right before `offset` (0 if none).
std::size_t previousOffset(std::string_view text, std::size_t offset);

/// Number of code points in a UTF-8 string
std::size_t codepointCount(std::string_view text);

/// Unicode Z* categories plus the C0/C1 whitespace controls
bool isWhitespace(char32_t cp);

/// Unicode P* categories
bool isPunctuation(char32_t cp);

/// Invisible characters that are stripped before matching
bool isZeroWidth(char32_t cp);

/// Unicode-aware whitespace trim
std::string trim(std::string_view text);

/// Splits on runs of Unicode whitespace, dropping empty pieces
std::vector<std::string> splitWhitespace(std::string_view text);

/// Global literal replace, scanning left to right without re-examining inserted text
std::size_t replaceAll(std::string& text, std::string_view from, std::string_view to);

} // namespace redaction
