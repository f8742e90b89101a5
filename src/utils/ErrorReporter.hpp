#pragma once

#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace utils {

enum class ErrorCategory
{
    Initialization, // logging setup
    Configuration,  // TOML file, removal patterns
    Pipeline,       // cleanup stage failures
    Io,             // reading or writing documents
    Unknown
};

enum class ErrorSeverity
{
    Info,
    Warning, // run continues with defaults
    Error,   // one document failed, the others are still processed
    Fatal    // nothing can be processed
};

struct ErrorReport
{
    ErrorCategory category = ErrorCategory::Unknown;
    ErrorSeverity severity = ErrorSeverity::Info;
    std::string user_message;
    std::string technical_details; // path, parser message, ...
    std::string timestamp;
    bool is_fatal = false;

    ErrorReport() = default;
    ErrorReport(ErrorCategory cat, ErrorSeverity sev, std::string user_msg, std::string tech_details);
};

/**
 * @brief Process-wide queue of problems met while running the tool
 *
 * Every report is written to the default plog instance when it is raised and
 * kept until the application drains the queue to pick its exit status.
 * Reports raised before the loggers exist can be replayed with LogReport().
 *
 *   ErrorReporter::ReportError(ErrorCategory::Io, "Cannot open input file", path);
 *   ...
 *   for (const auto& report : ErrorReporter::GetPendingErrors()) ...
 */
class ErrorReporter
{
public:
    static void ReportError(ErrorCategory category, ErrorSeverity severity,
                           const std::string& user_message,
                           const std::string& technical_details = "");

    static void ReportFatal(ErrorCategory category,
                           const std::string& user_message,
                           const std::string& technical_details = "");

    /// Error severity
    static void ReportError(ErrorCategory category,
                           const std::string& user_message,
                           const std::string& technical_details = "");

    static void ReportWarning(ErrorCategory category,
                             const std::string& user_message,
                             const std::string& technical_details = "");

    static bool HasPendingErrors();

    /// Highest severity currently queued, nullopt when the queue is empty
    static std::optional<ErrorSeverity> WorstPendingSeverity();

    /// Moves the queue out; the reporter is empty afterwards
    static std::vector<ErrorReport> GetPendingErrors();

    static void ClearErrors();

    /// "[Category] message | Details: ..." as written to the log
    static std::string Format(const ErrorReport& report);
    static void LogReport(const ErrorReport& report);

    static std::string CategoryToString(ErrorCategory category);
    static std::string SeverityToString(ErrorSeverity severity);

    static std::string GetTimestamp();

private:
    static std::mutex s_mutex;
    static std::vector<ErrorReport> s_error_queue;
    static constexpr size_t MAX_QUEUE_SIZE = 100;
};

} // namespace utils
