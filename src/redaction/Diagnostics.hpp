#pragma once

#include <atomic>
#include <cstddef>
#include <string>
#include <string_view>

namespace redaction
{

class Diagnostics
{
public:
    static constexpr int kLogInstance = 1;

    static void SetVerbose(bool enabled) noexcept;
    [[nodiscard]] static bool IsVerbose() noexcept;

    static void SetMaxPreview(std::size_t bytes) noexcept;
    [[nodiscard]] static std::size_t MaxPreview() noexcept;

    // Only ever pass redacted text here; raw input may contain PII.
    [[nodiscard]] static std::string Preview(std::string_view text);

private:
    static void appendEscaped(std::string& out, std::string_view code_point);
    static std::atomic<bool> verbose_;
    static std::atomic<std::size_t> max_preview_;
};

} // namespace redaction
