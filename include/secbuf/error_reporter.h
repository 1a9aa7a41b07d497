#ifndef SECBUF_ERROR_REPORTER_H
#define SECBUF_ERROR_REPORTER_H

#include <secbuf/config.h>
#include <secbuf/error.h>
#include <secbuf/result.h>
#include <string>
#include <vector>
#include <memory>
#include <chrono>
#include <functional>
#include <atomic>
#include <mutex>
#include <cstdint>

namespace secbuf {

/**
 * ErrorReporter provides diagnostic reporting for pools and connection
 * buffer sets.
 *
 * 1. Never reports buffer contents, only sizes, counts and error codes
 * 2. Disabled unless a component has been handed a reporter
 * 3. Rate limited per second and per minute to survive report storms
 * 4. Custom callbacks let a monitoring collaborator capture reports
 */
class SECBUF_API ErrorReporter {
public:
    enum class LogLevel {
        DEBUG,      // Detailed diagnostic information
        INFO,       // General operational information
        WARNING,    // Warning conditions, non-fatal errors
        ERROR,      // Error conditions, recoverable
        CRITICAL,   // Critical errors
        SECURITY    // Security-relevant events, always reported
    };

    enum class OutputFormat {
        HUMAN_READABLE,
        JSON
    };

    struct ReportingConfig {
        LogLevel minimum_level = LogLevel::WARNING;
        OutputFormat format = OutputFormat::HUMAN_READABLE;

        uint32_t max_reports_per_second = 100;
        uint32_t max_reports_per_minute = 1000;
        size_t max_message_size = 1024;

        // Callbacks still run when stderr output is off
        bool write_to_stderr = true;
    };

    struct ErrorReport {
        LogLevel level;
        SecbufError error_code;
        std::string category;      // reporting component, e.g. "pool"
        std::string message;
        std::chrono::system_clock::time_point timestamp;

        ErrorReport(LogLevel lvl, SecbufError error, const std::string& msg)
            : level(lvl)
            , error_code(error)
            , message(msg)
            , timestamp(std::chrono::system_clock::now()) {}
    };

    using ReporterCallback = std::function<void(const ErrorReport&)>;

    ErrorReporter();
    explicit ErrorReporter(const ReportingConfig& config);
    ~ErrorReporter();

    ErrorReporter(const ErrorReporter&) = delete;
    ErrorReporter& operator=(const ErrorReporter&) = delete;

    /**
     * Report an event.
     * @param level Log level for the report
     * @param error Error code associated with the event
     * @param category Reporting component
     * @param message Descriptive message (never buffer contents)
     * @return RATE_LIMITED when the report was dropped
     */
    Result<void> report_error(LogLevel level,
                              SecbufError error,
                              const std::string& category,
                              const std::string& message);

    /**
     * Report a security-relevant event. Bypasses the level filter and the
     * rate limiter.
     */
    Result<void> report_security_event(SecbufError error,
                                       const std::string& category,
                                       const std::string& message);

    Result<void> update_configuration(const ReportingConfig& config);
    ReportingConfig get_configuration() const;

    void add_reporter_callback(ReporterCallback callback);
    void clear_reporter_callbacks();

    struct ReportingStatistics {
        uint64_t total_reports{0};
        uint64_t reports_by_level[6]{0, 0, 0, 0, 0, 0};
        uint64_t security_events{0};
        uint64_t rate_limited_reports{0};
        uint64_t filtered_reports{0};
        uint64_t failed_reports{0};    // stderr write failures and throwing callbacks
        uint64_t bytes_logged{0};
    };

    ReportingStatistics get_statistics() const;
    void reset_statistics();

    static std::string log_level_to_string(LogLevel level);

    std::string format_report(const ErrorReport& report) const;

private:
    ReportingConfig config_;
    mutable std::mutex config_mutex_;

    std::vector<ReporterCallback> custom_reporters_;
    mutable std::mutex reporters_mutex_;

    mutable std::mutex output_mutex_;

    struct Counters {
        std::atomic<uint64_t> total_reports{0};
        std::atomic<uint64_t> reports_by_level[6]{};
        std::atomic<uint64_t> security_events{0};
        std::atomic<uint64_t> rate_limited_reports{0};
        std::atomic<uint64_t> filtered_reports{0};
        std::atomic<uint64_t> failed_reports{0};
        std::atomic<uint64_t> bytes_logged{0};
    };
    Counters stats_;

    struct RateLimitState {
        uint32_t reports_this_second{0};
        uint32_t reports_this_minute{0};
        std::chrono::steady_clock::time_point second_start;
        std::chrono::steady_clock::time_point minute_start;
        std::mutex reset_mutex;
    };
    RateLimitState rate_limit_;

    bool try_consume_rate_budget(uint32_t max_per_second, uint32_t max_per_minute);
    Result<void> write_report(const ErrorReport& report, const ReportingConfig& config);
};

// Convenience macros; the reporter argument is a (smart) pointer and may be null
#define SECBUF_REPORT_ERROR(reporter, level, error, category, message) \
    do { \
        if (reporter) { \
            (void)(reporter)->report_error((level), (error), (category), (message)); \
        } \
    } while (0)

#define SECBUF_REPORT_DEBUG(reporter, error, category, message) \
    SECBUF_REPORT_ERROR(reporter, ::secbuf::ErrorReporter::LogLevel::DEBUG, error, category, message)

#define SECBUF_REPORT_INFO(reporter, error, category, message) \
    SECBUF_REPORT_ERROR(reporter, ::secbuf::ErrorReporter::LogLevel::INFO, error, category, message)

#define SECBUF_REPORT_WARNING(reporter, error, category, message) \
    SECBUF_REPORT_ERROR(reporter, ::secbuf::ErrorReporter::LogLevel::WARNING, error, category, message)

} // namespace secbuf

#endif // SECBUF_ERROR_REPORTER_H
