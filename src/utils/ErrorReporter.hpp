#pragma once

#include <cstddef>
#include <deque>
#include <mutex>
#include <string>
#include <vector>

namespace utils {

enum class ErrorCategory
{
    Initialization,   // logging, command line
    Configuration,    // TOML parsing, invalid config
    Vault,            // PII vault file loading
    Redaction,        // engine stage failures
    Unknown
};

enum class ErrorSeverity
{
    Info,
    Warning, // defaults or a skipped item were used instead
    Error,   // the requested operation did not happen
    Fatal
};

struct ErrorReport
{
    ErrorCategory category = ErrorCategory::Unknown;
    ErrorSeverity severity = ErrorSeverity::Info;
    std::string user_message;
    std::string technical_details; // file paths, parser messages; never redaction input
    std::string timestamp;
    bool is_fatal = false;

    ErrorReport() = default;
    ErrorReport(ErrorCategory cat, ErrorSeverity sev, std::string user_msg, std::string tech_details);
};

// Process-wide sink for problems the user should hear about. Every report is
// logged through plog right away and kept (up to MAX_QUEUE_SIZE, oldest dropped)
// until the front end drains the queue with GetPendingErrors().
class ErrorReporter
{
public:
    static void ReportError(ErrorCategory category, ErrorSeverity severity, const std::string& user_message,
                            const std::string& technical_details = "");
    static void ReportError(ErrorCategory category, const std::string& user_message,
                            const std::string& technical_details = "");
    static void ReportWarning(ErrorCategory category, const std::string& user_message,
                              const std::string& technical_details = "");
    static void ReportFatal(ErrorCategory category, const std::string& user_message,
                            const std::string& technical_details = "");

    static bool HasPendingErrors();
    /// Number of queued reports at or above `min_severity`.
    static std::size_t CountPending(ErrorSeverity min_severity);
    /// Drains the queue, oldest first.
    static std::vector<ErrorReport> GetPendingErrors();
    static ErrorReport GetLastError();
    static void ClearErrors();

    static std::string CategoryToString(ErrorCategory category);
    static std::string SeverityToString(ErrorSeverity severity);
    static std::string GetTimestamp();

    /// "[Severity] Category: message (details)", as printed on stderr.
    static std::string Format(const ErrorReport& report);

private:
    static std::mutex s_mutex;
    static std::deque<ErrorReport> s_error_queue;
    static constexpr std::size_t MAX_QUEUE_SIZE = 100;
};

} // namespace utils
