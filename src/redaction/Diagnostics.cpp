#include "Diagnostics.hpp"
#include "TextUtils.hpp"

#include <algorithm>

namespace redaction
{

std::atomic<bool> Diagnostics::verbose_{ false };
std::atomic<std::size_t> Diagnostics::max_preview_{ 160 };

void Diagnostics::SetVerbose(bool enabled) noexcept { verbose_.store(enabled, std::memory_order_relaxed); }

bool Diagnostics::IsVerbose() noexcept { return verbose_.load(std::memory_order_relaxed); }

void Diagnostics::SetMaxPreview(std::size_t bytes) noexcept
{
    max_preview_.store(bytes == 0 ? 1 : bytes, std::memory_order_relaxed);
}

std::size_t Diagnostics::MaxPreview() noexcept { return max_preview_.load(std::memory_order_relaxed); }

std::string Diagnostics::Preview(std::string_view text)
{
    const std::size_t limit = MaxPreview();

    std::string out;
    out.reserve(std::min(text.size(), limit) + 24);

    // Whole code points only; the budget counts source bytes
    std::size_t pos = 0;
    while (pos < text.size())
    {
        std::size_t width = 0;
        decodeAt(text, pos, &width);
        if (pos + width > limit)
            break;

        appendEscaped(out, text.substr(pos, width));
        pos += width;
    }

    if (pos < text.size())
    {
        out += "... (";
        out += std::to_string(text.size());
        out += " bytes)";
    }
    return out;
}

void Diagnostics::appendEscaped(std::string& out, std::string_view code_point)
{
    if (code_point.size() != 1)
    {
        out.append(code_point);
        return;
    }

    const auto c = static_cast<unsigned char>(code_point[0]);
    switch (c)
    {
    case '\n':
        out += "\\n";
        break;
    case '\r':
        out += "\\r";
        break;
    case '\t':
        out += "\\t";
        break;
    default:
        // Remaining control bytes and lone high bytes
        out.push_back(c < 0x20 || c == 0x7F || c >= 0x80 ? '?' : static_cast<char>(c));
        break;
    }
}

} // namespace redaction
