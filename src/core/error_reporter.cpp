#include <secbuf/error_reporter.h>
#include <iostream>
#include <sstream>

namespace secbuf {

ErrorReporter::ErrorReporter() : ErrorReporter(ReportingConfig{}) {}

ErrorReporter::ErrorReporter(const ReportingConfig& config) : config_(config) {
    rate_limit_.second_start = std::chrono::steady_clock::now();
    rate_limit_.minute_start = rate_limit_.second_start;
}

ErrorReporter::~ErrorReporter() = default;

Result<void> ErrorReporter::report_error(LogLevel level,
                                         SecbufError error,
                                         const std::string& category,
                                         const std::string& message) {
    ReportingConfig config = get_configuration();

    if (level < config.minimum_level) {
        stats_.filtered_reports++;
        return make_result();
    }

    if (!try_consume_rate_budget(config.max_reports_per_second,
                                 config.max_reports_per_minute)) {
        stats_.rate_limited_reports++;
        return make_error<void>(SecbufError::RATE_LIMITED);
    }

    ErrorReport report(level, error, message.substr(0, config.max_message_size));
    report.category = category;

    stats_.reports_by_level[static_cast<size_t>(level)]++;

    auto result = write_report(report, config);
    if (!result.is_success()) {
        stats_.failed_reports++;
        return result;
    }

    stats_.total_reports++;
    return make_result();
}

Result<void> ErrorReporter::report_security_event(SecbufError error,
                                                  const std::string& category,
                                                  const std::string& message) {
    ReportingConfig config = get_configuration();

    ErrorReport report(LogLevel::SECURITY, error, message.substr(0, config.max_message_size));
    report.category = category;

    stats_.reports_by_level[static_cast<size_t>(LogLevel::SECURITY)]++;
    stats_.security_events++;

    auto result = write_report(report, config);
    if (!result.is_success()) {
        stats_.failed_reports++;
        return result;
    }

    stats_.total_reports++;
    return make_result();
}

Result<void> ErrorReporter::update_configuration(const ReportingConfig& config) {
    if (config.max_reports_per_second == 0 || config.max_reports_per_minute == 0) {
        return make_error<void>(SecbufError::INVALID_CONFIGURATION);
    }

    std::lock_guard<std::mutex> lock(config_mutex_);
    config_ = config;
    return make_result();
}

ErrorReporter::ReportingConfig ErrorReporter::get_configuration() const {
    std::lock_guard<std::mutex> lock(config_mutex_);
    return config_;
}

void ErrorReporter::add_reporter_callback(ReporterCallback callback) {
    if (!callback) {
        return;
    }
    std::lock_guard<std::mutex> lock(reporters_mutex_);
    custom_reporters_.push_back(std::move(callback));
}

void ErrorReporter::clear_reporter_callbacks() {
    std::lock_guard<std::mutex> lock(reporters_mutex_);
    custom_reporters_.clear();
}

ErrorReporter::ReportingStatistics ErrorReporter::get_statistics() const {
    ReportingStatistics snapshot;
    snapshot.total_reports = stats_.total_reports.load();
    for (size_t i = 0; i < 6; ++i) {
        snapshot.reports_by_level[i] = stats_.reports_by_level[i].load();
    }
    snapshot.security_events = stats_.security_events.load();
    snapshot.rate_limited_reports = stats_.rate_limited_reports.load();
    snapshot.filtered_reports = stats_.filtered_reports.load();
    snapshot.failed_reports = stats_.failed_reports.load();
    snapshot.bytes_logged = stats_.bytes_logged.load();
    return snapshot;
}

void ErrorReporter::reset_statistics() {
    stats_.total_reports = 0;
    for (auto& counter : stats_.reports_by_level) {
        counter = 0;
    }
    stats_.security_events = 0;
    stats_.rate_limited_reports = 0;
    stats_.filtered_reports = 0;
    stats_.failed_reports = 0;
    stats_.bytes_logged = 0;
}

std::string ErrorReporter::log_level_to_string(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO: return "INFO";
        case LogLevel::WARNING: return "WARNING";
        case LogLevel::ERROR: return "ERROR";
        case LogLevel::CRITICAL: return "CRITICAL";
        case LogLevel::SECURITY: return "SECURITY";
        default: return "UNKNOWN";
    }
}

// Private method implementations

bool ErrorReporter::try_consume_rate_budget(uint32_t max_per_second, uint32_t max_per_minute) {
    std::lock_guard<std::mutex> lock(rate_limit_.reset_mutex);

    auto now = std::chrono::steady_clock::now();

    if (now - rate_limit_.second_start >= std::chrono::seconds(1)) {
        rate_limit_.reports_this_second = 0;
        rate_limit_.second_start = now;
    }

    if (now - rate_limit_.minute_start >= std::chrono::minutes(1)) {
        rate_limit_.reports_this_minute = 0;
        rate_limit_.minute_start = now;
    }

    // Check limits before incrementing
    if (rate_limit_.reports_this_second >= max_per_second ||
        rate_limit_.reports_this_minute >= max_per_minute) {
        return false;
    }

    rate_limit_.reports_this_second++;
    rate_limit_.reports_this_minute++;
    return true;
}

Result<void> ErrorReporter::write_report(const ErrorReport& report, const ReportingConfig& config) {
    std::vector<ReporterCallback> callbacks;
    {
        std::lock_guard<std::mutex> lock(reporters_mutex_);
        callbacks = custom_reporters_;
    }
    // Reports are raised from release paths that must not throw
    for (const auto& callback : callbacks) {
        try {
            callback(report);
        } catch (...) {
            stats_.failed_reports++;
        }
    }

    if (!config.write_to_stderr) {
        return make_result();
    }

    std::string formatted = format_report(report);
    {
        std::lock_guard<std::mutex> lock(output_mutex_);
        std::cerr << formatted << std::endl;
        if (!std::cerr) {
            std::cerr.clear();
            return make_error<void>(SecbufError::INTERNAL_ERROR);
        }
    }

    stats_.bytes_logged += formatted.length();
    return make_result();
}

std::string ErrorReporter::format_report(const ErrorReport& report) const {
    OutputFormat format;
    {
        std::lock_guard<std::mutex> lock(config_mutex_);
        format = config_.format;
    }

    std::ostringstream oss;

    if (format == OutputFormat::JSON) {
        oss << "{\"level\":\"" << log_level_to_string(report.level) << "\""
            << ",\"error\":" << static_cast<int>(report.error_code)
            << ",\"category\":\"" << report.category << "\""
            << ",\"message\":\"" << report.message << "\"}";
    } else {
        oss << "[" << log_level_to_string(report.level) << "] [" << report.category << "] ";
        if (report.error_code != SecbufError::SUCCESS) {
            oss << "Error " << static_cast<int>(report.error_code) << ": ";
        }
        oss << report.message;
    }

    return oss.str();
}

} // namespace secbuf
