#include "ErrorReporter.hpp"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

#include <plog/Log.h>

namespace utils
{

std::mutex ErrorReporter::s_mutex;
std::deque<ErrorReport> ErrorReporter::s_pending;

void ErrorReporter::Report(ErrorCategory category, ErrorSeverity severity, std::string summary, std::string details)
{
    ErrorReport report{ category, severity, std::move(summary), std::move(details), Timestamp() };

    const plog::Severity level = severity == ErrorSeverity::Fatal     ? plog::fatal
                                 : severity == ErrorSeverity::Error   ? plog::error
                                 : severity == ErrorSeverity::Warning ? plog::warning
                                                                      : plog::info;
    PLOG(level) << "[" << std::string(CategoryName(category)) << "] " << report.summary
                << (report.details.empty() ? "" : " | ") << report.details;

    std::lock_guard<std::mutex> lock(s_mutex);
    s_pending.push_back(std::move(report));
    while (s_pending.size() > kMaxPending)
        s_pending.pop_front();
}

void ErrorReporter::ReportWarning(ErrorCategory category, std::string summary, std::string details)
{
    Report(category, ErrorSeverity::Warning, std::move(summary), std::move(details));
}

void ErrorReporter::ReportError(ErrorCategory category, std::string summary, std::string details)
{
    Report(category, ErrorSeverity::Error, std::move(summary), std::move(details));
}

void ErrorReporter::ReportFatal(ErrorCategory category, std::string summary, std::string details)
{
    Report(category, ErrorSeverity::Fatal, std::move(summary), std::move(details));
}

bool ErrorReporter::HasPending()
{
    std::lock_guard<std::mutex> lock(s_mutex);
    return !s_pending.empty();
}

std::size_t ErrorReporter::PendingCount()
{
    std::lock_guard<std::mutex> lock(s_mutex);
    return s_pending.size();
}

std::vector<ErrorReport> ErrorReporter::Drain()
{
    std::lock_guard<std::mutex> lock(s_mutex);
    std::vector<ErrorReport> out(std::make_move_iterator(s_pending.begin()), std::make_move_iterator(s_pending.end()));
    s_pending.clear();
    return out;
}

ErrorReport ErrorReporter::LastReport()
{
    std::lock_guard<std::mutex> lock(s_mutex);
    return s_pending.empty() ? ErrorReport{} : s_pending.back();
}

void ErrorReporter::Clear()
{
    std::lock_guard<std::mutex> lock(s_mutex);
    s_pending.clear();
}

std::string ErrorReporter::Format(const ErrorReport& report)
{
    std::string out;
    out.append("[").append(SeverityName(report.severity)).append("] [");
    out.append(CategoryName(report.category)).append("] ").append(report.summary);
    if (!report.details.empty())
        out.append(": ").append(report.details);
    return out;
}

std::string_view ErrorReporter::CategoryName(ErrorCategory category)
{
    switch (category)
    {
    case ErrorCategory::Initialization:
        return "Initialization";
    case ErrorCategory::Configuration:
        return "Configuration";
    case ErrorCategory::Extraction:
        return "Extraction";
    case ErrorCategory::Normalization:
        return "Normalization";
    case ErrorCategory::Conversion:
        return "Conversion";
    case ErrorCategory::Unknown:
        break;
    }
    return "Unknown";
}

std::string_view ErrorReporter::SeverityName(ErrorSeverity severity)
{
    switch (severity)
    {
    case ErrorSeverity::Info:
        return "Info";
    case ErrorSeverity::Warning:
        return "Warning";
    case ErrorSeverity::Error:
        return "Error";
    case ErrorSeverity::Fatal:
        return "Fatal";
    }
    return "Unknown";
}

std::string ErrorReporter::Timestamp()
{
    const std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());

    std::tm tm_buf{};
#ifdef _WIN32
    localtime_s(&tm_buf, &now);
#else
    localtime_r(&now, &tm_buf);
#endif
    std::ostringstream ss;
    ss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S");
    return ss.str();
}

} // namespace utils
