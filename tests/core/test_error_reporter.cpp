#include <gtest/gtest.h>
#include <secbuf/error_reporter.h>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

using namespace secbuf;

class ErrorReporterTest : public ::testing::Test {
protected:
    void SetUp() override {
        config_.minimum_level = ErrorReporter::LogLevel::DEBUG;
        config_.write_to_stderr = false;
        reporter_ = std::make_unique<ErrorReporter>(config_);
        reporter_->add_reporter_callback([this](const ErrorReporter::ErrorReport& report) {
            captured_.push_back(report);
        });
    }

    ErrorReporter::ReportingConfig config_;
    std::unique_ptr<ErrorReporter> reporter_;
    std::vector<ErrorReporter::ErrorReport> captured_;
};

TEST_F(ErrorReporterTest, ReportReachesCallbacks) {
    auto result = reporter_->report_error(ErrorReporter::LogLevel::WARNING,
                                          SecbufError::QUEUE_FULL,
                                          "connection_buffers",
                                          "Packet rejected");
    ASSERT_TRUE(result);
    ASSERT_EQ(captured_.size(), 1u);
    EXPECT_EQ(captured_[0].level, ErrorReporter::LogLevel::WARNING);
    EXPECT_EQ(captured_[0].error_code, SecbufError::QUEUE_FULL);
    EXPECT_EQ(captured_[0].category, "connection_buffers");
    EXPECT_EQ(captured_[0].message, "Packet rejected");

    auto stats = reporter_->get_statistics();
    EXPECT_EQ(stats.total_reports, 1u);
    EXPECT_EQ(stats.reports_by_level[static_cast<size_t>(ErrorReporter::LogLevel::WARNING)], 1u);
}

TEST_F(ErrorReporterTest, ReportsBelowMinimumLevelAreFiltered) {
    auto config = reporter_->get_configuration();
    config.minimum_level = ErrorReporter::LogLevel::ERROR;
    ASSERT_TRUE(reporter_->update_configuration(config));

    auto result = reporter_->report_error(ErrorReporter::LogLevel::INFO,
                                          SecbufError::SUCCESS, "pool", "Shrink");
    EXPECT_TRUE(result);
    EXPECT_TRUE(captured_.empty());
    EXPECT_EQ(reporter_->get_statistics().filtered_reports, 1u);
}

TEST_F(ErrorReporterTest, RateLimitRejectsReportsPastBound) {
    auto config = reporter_->get_configuration();
    config.max_reports_per_second = 3;
    ASSERT_TRUE(reporter_->update_configuration(config));

    for (int i = 0; i < 3; ++i) {
        EXPECT_TRUE(reporter_->report_error(ErrorReporter::LogLevel::WARNING,
                                            SecbufError::BUFFER_FULL, "ring", "full"));
    }

    auto limited = reporter_->report_error(ErrorReporter::LogLevel::WARNING,
                                           SecbufError::BUFFER_FULL, "ring", "full");
    EXPECT_EQ(limited.error(), SecbufError::RATE_LIMITED);
    EXPECT_EQ(captured_.size(), 3u);
    EXPECT_EQ(reporter_->get_statistics().rate_limited_reports, 1u);
}

TEST_F(ErrorReporterTest, SecurityEventsBypassFilterAndRateLimit) {
    auto config = reporter_->get_configuration();
    config.minimum_level = ErrorReporter::LogLevel::CRITICAL;
    config.max_reports_per_second = 1;
    ASSERT_TRUE(reporter_->update_configuration(config));

    EXPECT_TRUE(reporter_->report_security_event(SecbufError::MALFORMED_LENGTH, "codec", "first"));
    EXPECT_TRUE(reporter_->report_security_event(SecbufError::MALFORMED_LENGTH, "codec", "second"));

    EXPECT_EQ(captured_.size(), 2u);
    EXPECT_EQ(reporter_->get_statistics().security_events, 2u);
}

TEST_F(ErrorReporterTest, MessagesAreTruncated) {
    auto config = reporter_->get_configuration();
    config.max_message_size = 8;
    ASSERT_TRUE(reporter_->update_configuration(config));

    ASSERT_TRUE(reporter_->report_error(ErrorReporter::LogLevel::ERROR, SecbufError::INTERNAL_ERROR,
                                        "pool", "a message well past eight bytes"));
    ASSERT_EQ(captured_.size(), 1u);
    EXPECT_EQ(captured_[0].message.size(), 8u);
}

TEST_F(ErrorReporterTest, InvalidConfigurationRejected) {
    auto config = reporter_->get_configuration();
    config.max_reports_per_second = 0;
    EXPECT_EQ(reporter_->update_configuration(config).error(), SecbufError::INVALID_CONFIGURATION);
}

TEST_F(ErrorReporterTest, FormatReport) {
    ErrorReporter::ErrorReport report(ErrorReporter::LogLevel::ERROR, SecbufError::QUEUE_FULL, "queue full");
    report.category = "connection_buffers";

    std::string human = reporter_->format_report(report);
    EXPECT_NE(human.find("[ERROR]"), std::string::npos);
    EXPECT_NE(human.find("[connection_buffers]"), std::string::npos);
    EXPECT_NE(human.find("Error 41"), std::string::npos);

    auto config = reporter_->get_configuration();
    config.format = ErrorReporter::OutputFormat::JSON;
    ASSERT_TRUE(reporter_->update_configuration(config));

    std::string json = reporter_->format_report(report);
    EXPECT_EQ(json.front(), '{');
    EXPECT_NE(json.find("\"error\":41"), std::string::npos);
    EXPECT_NE(json.find("\"level\":\"ERROR\""), std::string::npos);
}

TEST_F(ErrorReporterTest, ReportMacroToleratesNullReporter) {
    std::shared_ptr<ErrorReporter> none;
    SECBUF_REPORT_WARNING(none, SecbufError::QUEUE_FULL, "test", "ignored");

    std::shared_ptr<ErrorReporter> shared = std::make_shared<ErrorReporter>(config_);
    std::vector<std::string> messages;
    shared->add_reporter_callback([&messages](const ErrorReporter::ErrorReport& report) {
        messages.push_back(report.message);
    });
    SECBUF_REPORT_WARNING(shared, SecbufError::QUEUE_FULL, "test", "delivered");
    ASSERT_EQ(messages.size(), 1u);
    EXPECT_EQ(messages[0], "delivered");
}

TEST_F(ErrorReporterTest, ResetStatistics) {
    ASSERT_TRUE(reporter_->report_error(ErrorReporter::LogLevel::ERROR,
                                        SecbufError::INTERNAL_ERROR, "pool", "x"));
    reporter_->reset_statistics();

    auto stats = reporter_->get_statistics();
    EXPECT_EQ(stats.total_reports, 0u);
    EXPECT_EQ(stats.reports_by_level[static_cast<size_t>(ErrorReporter::LogLevel::ERROR)], 0u);
}

TEST_F(ErrorReporterTest, ThrowingCallbackIsCountedAndContained) {
    reporter_->add_reporter_callback([](const ErrorReporter::ErrorReport&) {
        throw std::runtime_error("collector unavailable");
    });
    std::vector<std::string> after;
    reporter_->add_reporter_callback([&after](const ErrorReporter::ErrorReport& report) {
        after.push_back(report.message);
    });

    auto result = reporter_->report_error(ErrorReporter::LogLevel::WARNING,
                                          SecbufError::QUEUE_FULL, "pool", "rejected");
    EXPECT_TRUE(result);
    EXPECT_EQ(captured_.size(), 1u);
    ASSERT_EQ(after.size(), 1u);

    auto stats = reporter_->get_statistics();
    EXPECT_EQ(stats.failed_reports, 1u);
    EXPECT_EQ(stats.total_reports, 1u);

    reporter_->reset_statistics();
    EXPECT_EQ(reporter_->get_statistics().failed_reports, 0u);
}
