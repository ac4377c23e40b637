#pragma once

#include <cstddef>
#include <deque>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

namespace utils {

enum class ErrorCategory
{
    Initialization,   // logging, command line
    Configuration,    // TOML parsing, invalid config
    Extraction,       // malformed extraction JSON, failed record validation
    Normalization,    // date left unparsed, pipeline stage failures
    Conversion,       // script conversion tables
    Unknown
};

enum class ErrorSeverity
{
    Info,
    Warning, // degraded result, the page is still emitted
    Error,   // the page or the run failed
    Fatal
};

struct ErrorReport
{
    ErrorCategory category = ErrorCategory::Unknown;
    ErrorSeverity severity = ErrorSeverity::Info;
    std::string summary;   // one line for the operator
    std::string details;   // offending value, parser message, file name
    std::string timestamp;

    bool isFatal() const { return severity == ErrorSeverity::Fatal; }
};

/**
 * @brief Process-wide queue of problems met while normalizing pages
 *
 * Every report is logged through plog when it is raised. The queue keeps the
 * newest kMaxPending reports so the command line front end can print a
 * summary on stderr after the page has been written.
 *
 *   ErrorReporter::ReportWarning(ErrorCategory::Normalization,
 *                                "Published date left unparsed", raw_value);
 */
class ErrorReporter
{
public:
    static constexpr std::size_t kMaxPending = 100;

    static void Report(ErrorCategory category, ErrorSeverity severity, std::string summary,
                       std::string details = {});

    static void ReportWarning(ErrorCategory category, std::string summary, std::string details = {});
    static void ReportError(ErrorCategory category, std::string summary, std::string details = {});
    static void ReportFatal(ErrorCategory category, std::string summary, std::string details = {});

    static bool HasPending();
    static std::size_t PendingCount();

    // Oldest first; empties the queue
    static std::vector<ErrorReport> Drain();

    // Newest report, or a default-constructed one when the queue is empty
    static ErrorReport LastReport();

    static void Clear();

    // "[Warning] [Normalization] Published date left unparsed: 上週三"
    static std::string Format(const ErrorReport& report);

    static std::string_view CategoryName(ErrorCategory category);
    static std::string_view SeverityName(ErrorSeverity severity);

private:
    static std::string Timestamp();

    static std::mutex s_mutex;
    static std::deque<ErrorReport> s_pending;
};

} // namespace utils
