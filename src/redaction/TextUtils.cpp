#include "TextUtils.hpp"
#include <utf8proc.h>
#include <utility>

namespace redaction
{

namespace
{

constexpr char32_t kReplacementChar = U'\uFFFD';

bool isContinuationByte(unsigned char c) { return (c & 0xC0) == 0x80; }

} // namespace

std::u32string utf8ToUtf32(std::string_view utf8_str)
{
    std::u32string result;
    if (utf8_str.empty())
        return result;

    result.reserve(utf8_str.size());
    std::size_t pos = 0;
    while (pos < utf8_str.size())
    {
        std::size_t bytes = 0;
        result.push_back(decodeAt(utf8_str, pos, &bytes));
        pos += bytes;
    }
    return result;
}

std::string utf32ToUtf8(const std::u32string& utf32_str)
{
    std::string result;
    result.reserve(utf32_str.size());
    for (char32_t cp : utf32_str)
    {
        utf8proc_uint8_t buffer[4];
        utf8proc_ssize_t bytes = utf8proc_encode_char(static_cast<utf8proc_int32_t>(cp), buffer);
        if (bytes > 0)
        {
            result.append(reinterpret_cast<const char*>(buffer), static_cast<size_t>(bytes));
        }
    }
    return result;
}

char32_t decodeAt(std::string_view text, std::size_t offset, std::size_t* length)
{
    if (offset >= text.size())
    {
        if (length)
            *length = 0;
        return 0;
    }

    const auto* str = reinterpret_cast<const utf8proc_uint8_t*>(text.data()) + offset;
    utf8proc_int32_t codepoint = 0;
    utf8proc_ssize_t bytes = utf8proc_iterate(str, static_cast<utf8proc_ssize_t>(text.size() - offset), &codepoint);
    if (bytes <= 0 || codepoint < 0)
    {
        if (length)
            *length = 1;
        return kReplacementChar;
    }

    if (length)
        *length = static_cast<std::size_t>(bytes);
    return static_cast<char32_t>(codepoint);
}

std::size_t previousOffset(std::string_view text, std::size_t offset)
{
    if (offset == 0 || text.empty())
        return 0;
    if (offset > text.size())
        offset = text.size();

    std::size_t pos = offset - 1;
    // A UTF-8 sequence has at most three continuation bytes
    std::size_t steps = 0;
    while (pos > 0 && steps < 3 && isContinuationByte(static_cast<unsigned char>(text[pos])))
    {
        --pos;
        ++steps;
    }

    std::size_t width = 0;
    decodeAt(text, pos, &width);
    if (pos + width != offset)
    {
        // Not a well-formed sequence ending at offset; step a single byte
        return offset - 1;
    }
    return pos;
}

std::size_t codepointCount(std::string_view text)
{
    std::size_t count = 0;
    std::size_t pos = 0;
    while (pos < text.size())
    {
        std::size_t bytes = 0;
        decodeAt(text, pos, &bytes);
        pos += bytes;
        ++count;
    }
    return count;
}

bool isWhitespace(char32_t cp)
{
    switch (cp)
    {
    case U'\t':
    case U'\n':
    case U'\v':
    case U'\f':
    case U'\r':
    case 0x85:
        return true;
    default:
        break;
    }

    switch (utf8proc_category(static_cast<utf8proc_int32_t>(cp)))
    {
    case UTF8PROC_CATEGORY_ZS:
    case UTF8PROC_CATEGORY_ZL:
    case UTF8PROC_CATEGORY_ZP:
        return true;
    default:
        return false;
    }
}

bool isPunctuation(char32_t cp)
{
    switch (utf8proc_category(static_cast<utf8proc_int32_t>(cp)))
    {
    case UTF8PROC_CATEGORY_PC:
    case UTF8PROC_CATEGORY_PD:
    case UTF8PROC_CATEGORY_PS:
    case UTF8PROC_CATEGORY_PE:
    case UTF8PROC_CATEGORY_PI:
    case UTF8PROC_CATEGORY_PF:
    case UTF8PROC_CATEGORY_PO:
        return true;
    default:
        return false;
    }
}

bool isZeroWidth(char32_t cp)
{
    switch (cp)
    {
    case U'\u200B': // zero-width space
    case U'\u200C': // zero-width non-joiner
    case U'\u200D': // zero-width joiner
    case U'\uFEFF': // BOM / zero-width no-break space
    case U'\u00AD': // soft hyphen
        return true;
    default:
        return false;
    }
}

std::string trim(std::string_view text)
{
    std::size_t begin = 0;
    while (begin < text.size())
    {
        std::size_t bytes = 0;
        if (!isWhitespace(decodeAt(text, begin, &bytes)))
            break;
        begin += bytes;
    }

    std::size_t end = text.size();
    while (end > begin)
    {
        std::size_t prev = previousOffset(text, end);
        if (!isWhitespace(decodeAt(text, prev)))
            break;
        end = prev;
    }

    return std::string(text.substr(begin, end - begin));
}

std::vector<std::string> splitWhitespace(std::string_view text)
{
    std::vector<std::string> parts;
    std::size_t pos = 0;
    std::size_t token_start = std::string_view::npos;

    while (pos < text.size())
    {
        std::size_t bytes = 0;
        char32_t cp = decodeAt(text, pos, &bytes);
        if (isWhitespace(cp))
        {
            if (token_start != std::string_view::npos)
            {
                parts.emplace_back(text.substr(token_start, pos - token_start));
                token_start = std::string_view::npos;
            }
        }
        else if (token_start == std::string_view::npos)
        {
            token_start = pos;
        }
        pos += bytes;
    }

    if (token_start != std::string_view::npos)
        parts.emplace_back(text.substr(token_start));

    return parts;
}

std::size_t replaceAll(std::string& text, std::string_view from, std::string_view to)
{
    if (from.empty() || text.empty())
        return 0;

    std::size_t count = 0;
    std::string result;
    result.reserve(text.size());

    std::size_t pos = 0;
    while (true)
    {
        std::size_t found = text.find(from, pos);
        if (found == std::string::npos)
        {
            result.append(text, pos, std::string::npos);
            break;
        }
        result.append(text, pos, found - pos);
        result.append(to);
        pos = found + from.size();
        ++count;
    }

    if (count > 0)
        text = std::move(result);
    return count;
}

} // namespace redaction
